#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace registry::core {

// Field bounds. Lengths are byte counts; upper bounds are inclusive except
// size_bytes, which must stay strictly below kSizeBytesLimit.
inline constexpr std::size_t kMaxNameBytes        = 64;
inline constexpr std::size_t kMaxDescriptionBytes = 128;
inline constexpr std::size_t kMaxTags             = 10;
inline constexpr std::size_t kMaxTagBytes         = 32;
inline constexpr uint64_t    kSizeBytesLimit      = 1'000'000'000;

// Content fields shared by create and update.
struct AssetFields {
  std::string              name;
  uint64_t                 size_bytes = 0;
  std::string              description;
  std::vector<std::string> tags;
};

/*
  Checks fields in order name, size_bytes, description, tags and throws on
  the first violation:
    name / description -> InvalidParameters
    size_bytes         -> CapacityExceeded
    tags               -> FormatValidation
*/
void ValidateAssetFields(const AssetFields& fields);

// Throws InvalidParameters for an empty principal.
void ValidatePrincipal(std::string_view principal, std::string_view role);

} // namespace registry::core
