#ifndef MEMBLOB_STORE_ERROR_HPP
#define MEMBLOB_STORE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace memblob::store {

enum class ErrorCode {
  CONTAINER_NOT_FOUND,
  PRECONDITION_FAILED,
  NOT_MODIFIED,
  INVALID_ARGUMENT,
  INTERNAL_INVARIANT,
  CONTENT_ERROR
};

inline const char* error_code_to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::CONTAINER_NOT_FOUND: return "Container not found";
    case ErrorCode::PRECONDITION_FAILED: return "Precondition failed";
    case ErrorCode::NOT_MODIFIED: return "Not modified";
    case ErrorCode::INVALID_ARGUMENT: return "Invalid argument";
    case ErrorCode::INTERNAL_INVARIANT: return "Internal invariant violation";
    case ErrorCode::CONTENT_ERROR: return "Content error";
    default: return "Undefined error";
  }
}

// HTTP-like status for callers that report codes rather than exceptions
inline int error_code_to_status(ErrorCode code) {
  switch (code) {
    case ErrorCode::CONTAINER_NOT_FOUND: return 404;
    case ErrorCode::PRECONDITION_FAILED: return 412;
    case ErrorCode::NOT_MODIFIED: return 304;
    case ErrorCode::INVALID_ARGUMENT: return 400;
    default: return 500;
  }
}

class StoreError : public std::runtime_error {
public:
  StoreError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

  ErrorCode code() const { return code_; }

private:
  ErrorCode code_;
};

class ContainerNotFoundError : public StoreError {
public:
  ContainerNotFoundError(const std::string& container, const std::string& message)
    : StoreError(ErrorCode::CONTAINER_NOT_FOUND, message), container_(container) {}

  const std::string& container() const { return container_; }

private:
  std::string container_;
};

class PreconditionFailedError : public StoreError {
public:
  explicit PreconditionFailedError(const std::string& message)
    : StoreError(ErrorCode::PRECONDITION_FAILED, "Precondition failed: " + message) {}
};

class NotModifiedError : public StoreError {
public:
  explicit NotModifiedError(const std::string& message)
    : StoreError(ErrorCode::NOT_MODIFIED, "Not modified: " + message) {}
};

class InvalidArgumentError : public StoreError {
public:
  explicit InvalidArgumentError(const std::string& message)
    : StoreError(ErrorCode::INVALID_ARGUMENT, "Invalid argument: " + message) {}
};

// An entry the engine itself inserted has gone missing; indicates a defect
class InternalInvariantError : public StoreError {
public:
  explicit InternalInvariantError(const std::string& message)
    : StoreError(ErrorCode::INTERNAL_INVARIANT, "Internal invariant violation: " + message) {}
};

class ContentError : public StoreError {
public:
  explicit ContentError(const std::string& message)
    : StoreError(ErrorCode::CONTENT_ERROR, "Content error: " + message) {}
};

} // namespace memblob::store

#endif // MEMBLOB_STORE_ERROR_HPP
