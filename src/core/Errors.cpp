#include "Errors.hpp"

namespace zipcat {

const char* to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::CorruptArchive:        return "CorruptArchive";
    case ErrorCode::UnsupportedArchive:    return "UnsupportedArchive";
    case ErrorCode::IOFailure:             return "IOFailure";
    case ErrorCode::PermissionDenied:      return "PermissionDenied";
    case ErrorCode::MergeConflict:         return "MergeConflict";
    case ErrorCode::ConfirmationRequired:  return "ConfirmationRequired";
    case ErrorCode::AmbiguousSelection:    return "AmbiguousSelection";
    case ErrorCode::DestinationUnwritable: return "DestinationUnwritable";
    case ErrorCode::NotFound:              return "NotFound";
    case ErrorCode::InvalidQuery:          return "InvalidQuery";
    case ErrorCode::StoreFailure:          return "StoreFailure";
  }
  return "Unknown";
}

} // namespace zipcat
