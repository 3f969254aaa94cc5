#ifndef DISTD_ERRORS_HPP
#define DISTD_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace distd {

/// Failure categories shared by every component of the engine.
enum class ErrorKind {
  NotFound,            ///< unknown hash, path or version
  InvalidInput,        ///< bad argument or corrupt payload
  IoFailure,           ///< storage or source read/write error, retryable
  ConcurrencyConflict, ///< refcount underflow or race, store corruption risk
  InvariantViolation   ///< e.g. recomputed root differs from stored root
};

std::string errorKindToString(ErrorKind kind);

/// Only I/O failures are worth retrying at a higher layer.
bool isRetryable(ErrorKind kind);

class DistdError : public std::runtime_error {
public:
  DistdError(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

class NotFoundError : public DistdError {
public:
  explicit NotFoundError(const std::string &message)
      : DistdError(ErrorKind::NotFound, message) {}
};

class InvalidInputError : public DistdError {
public:
  explicit InvalidInputError(const std::string &message)
      : DistdError(ErrorKind::InvalidInput, message) {}
};

class IoError : public DistdError {
public:
  explicit IoError(const std::string &message)
      : DistdError(ErrorKind::IoFailure, message) {}
};

class ConcurrencyConflictError : public DistdError {
public:
  explicit ConcurrencyConflictError(const std::string &message)
      : DistdError(ErrorKind::ConcurrencyConflict, message) {}
};

class InvariantViolationError : public DistdError {
public:
  explicit InvariantViolationError(const std::string &message)
      : DistdError(ErrorKind::InvariantViolation, message) {}
};

/**
 * @brief Log @p message and throw the exception matching @p kind.
 *
 * Conflicts and invariant violations are logged at ERROR, I/O failures at
 * WARN and the caller-facing kinds at DEBUG.
 */
[[noreturn]] void throwError(ErrorKind kind, const std::string &message);

[[noreturn]] inline void throwNotFound(const std::string &message) {
  throwError(ErrorKind::NotFound, message);
}
[[noreturn]] inline void throwInvalidInput(const std::string &message) {
  throwError(ErrorKind::InvalidInput, message);
}
[[noreturn]] inline void throwIoFailure(const std::string &message) {
  throwError(ErrorKind::IoFailure, message);
}

} // namespace distd

#endif // DISTD_ERRORS_HPP
