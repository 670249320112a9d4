#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace registry::util {

/*
  Central error taxonomy.

  Every public registry operation either returns its value or throws one of
  these. The numeric values are stable: registryctl maps them to exit codes.
*/

enum class ErrorKind : std::uint32_t {
  InsufficientPrivileges = 100,
  AssetNotFound          = 101,
  DuplicateEntry         = 102,
  InvalidParameters      = 103,
  CapacityExceeded       = 104,
  AccessDenied           = 105,
  PermissionDenied       = 106,
  ContentRestricted      = 107,
  FormatValidation       = 108,
};

std::string_view ErrorKindName(ErrorKind kind);

class RegistryError : public std::runtime_error {
 public:
  RegistryError(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  ErrorKind Kind() const {
    return kind_;
  }

  std::uint32_t Code() const {
    return static_cast<std::uint32_t>(kind_);
  }

 private:
  ErrorKind kind_;
};

// Reserved for administrator-gated operations; nothing raises it today.
class InsufficientPrivileges : public RegistryError {
 public:
  explicit InsufficientPrivileges(const std::string& msg) : RegistryError(ErrorKind::InsufficientPrivileges, msg) {
  }
};

class AssetNotFound : public RegistryError {
 public:
  explicit AssetNotFound(const std::string& msg) : RegistryError(ErrorKind::AssetNotFound, msg) {
  }
};

class DuplicateEntry : public RegistryError {
 public:
  explicit DuplicateEntry(const std::string& msg) : RegistryError(ErrorKind::DuplicateEntry, msg) {
  }
};

class InvalidParameters : public RegistryError {
 public:
  explicit InvalidParameters(const std::string& msg) : RegistryError(ErrorKind::InvalidParameters, msg) {
  }
};

class CapacityExceeded : public RegistryError {
 public:
  explicit CapacityExceeded(const std::string& msg) : RegistryError(ErrorKind::CapacityExceeded, msg) {
  }
};

// Reserved; nothing raises it today.
class AccessDenied : public RegistryError {
 public:
  explicit AccessDenied(const std::string& msg) : RegistryError(ErrorKind::AccessDenied, msg) {
  }
};

class PermissionDenied : public RegistryError {
 public:
  explicit PermissionDenied(const std::string& msg) : RegistryError(ErrorKind::PermissionDenied, msg) {
  }
};

class ContentRestricted : public RegistryError {
 public:
  explicit ContentRestricted(const std::string& msg) : RegistryError(ErrorKind::ContentRestricted, msg) {
  }
};

class FormatValidation : public RegistryError {
 public:
  explicit FormatValidation(const std::string& msg) : RegistryError(ErrorKind::FormatValidation, msg) {
  }
};

} // namespace registry::util
