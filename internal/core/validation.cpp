#include "validation.hpp"

#include "internal/util/errors.hpp"

namespace registry::core {

namespace {

void ValidateText(std::string_view field, const std::string& value, std::size_t max_bytes) {
  if (value.empty() || value.size() > max_bytes) {
    throw util::InvalidParameters(std::string(field) + " must be 1-" + std::to_string(max_bytes) + " bytes, got " +
                                  std::to_string(value.size()));
  }
}

void ValidateTags(const std::vector<std::string>& tags) {
  if (tags.empty() || tags.size() > kMaxTags) {
    throw util::FormatValidation("tags must hold 1-" + std::to_string(kMaxTags) + " entries, got " + std::to_string(tags.size()));
  }
  for (std::size_t i = 0; i < tags.size(); ++i) {
    if (tags[i].empty() || tags[i].size() > kMaxTagBytes) {
      throw util::FormatValidation("tag " + std::to_string(i) + " must be 1-" + std::to_string(kMaxTagBytes) + " bytes, got " +
                                   std::to_string(tags[i].size()));
    }
  }
}

} // namespace

void ValidateAssetFields(const AssetFields& fields) {
  ValidateText("name", fields.name, kMaxNameBytes);

  if (fields.size_bytes == 0 || fields.size_bytes >= kSizeBytesLimit) {
    throw util::CapacityExceeded("size_bytes must be in [1, " + std::to_string(kSizeBytesLimit) + "), got " +
                                 std::to_string(fields.size_bytes));
  }

  ValidateText("description", fields.description, kMaxDescriptionBytes);
  ValidateTags(fields.tags);
}

void ValidatePrincipal(std::string_view principal, std::string_view role) {
  if (principal.empty()) {
    throw util::InvalidParameters(std::string(role) + " principal must not be empty");
  }
}

} // namespace registry::core
