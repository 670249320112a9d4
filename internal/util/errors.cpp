#include "errors.hpp"

namespace registry::util {

std::string_view ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InsufficientPrivileges:
      return "InsufficientPrivileges";
    case ErrorKind::AssetNotFound:
      return "AssetNotFound";
    case ErrorKind::DuplicateEntry:
      return "DuplicateEntry";
    case ErrorKind::InvalidParameters:
      return "InvalidParameters";
    case ErrorKind::CapacityExceeded:
      return "CapacityExceeded";
    case ErrorKind::AccessDenied:
      return "AccessDenied";
    case ErrorKind::PermissionDenied:
      return "PermissionDenied";
    case ErrorKind::ContentRestricted:
      return "ContentRestricted";
    case ErrorKind::FormatValidation:
      return "FormatValidation";
  }
  return "Unknown";
}

} // namespace registry::util
