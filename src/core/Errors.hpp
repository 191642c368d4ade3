#pragma once
#include <stdexcept>
#include <string>

namespace zipcat {

enum class ErrorCode {
  CorruptArchive,
  UnsupportedArchive,
  IOFailure,            // transient, retryable
  PermissionDenied,
  MergeConflict,
  ConfirmationRequired,
  AmbiguousSelection,
  DestinationUnwritable,
  NotFound,
  InvalidQuery,
  StoreFailure
};

const char* to_string(ErrorCode code);

class CatalogError : public std::runtime_error {
public:
  CatalogError(ErrorCode code, const std::string& what)
    : std::runtime_error(what), code_(code) {}

  ErrorCode code() const { return code_; }
  bool retryable() const { return code_ == ErrorCode::IOFailure; }

private:
  ErrorCode code_;
};

} // namespace zipcat
