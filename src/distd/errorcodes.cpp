#include "distd/errors.hpp"
#include "distd/logger.h"

namespace distd {

std::string errorKindToString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::NotFound:
    return "NotFound";
  case ErrorKind::InvalidInput:
    return "InvalidInput";
  case ErrorKind::IoFailure:
    return "IOFailure";
  case ErrorKind::ConcurrencyConflict:
    return "ConcurrencyConflict";
  case ErrorKind::InvariantViolation:
    return "InvariantViolation";
  }
  return "Unknown";
}

bool isRetryable(ErrorKind kind) { return kind == ErrorKind::IoFailure; }

static LogLevel levelFor(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::ConcurrencyConflict:
  case ErrorKind::InvariantViolation:
    return LogLevel::ERROR;
  case ErrorKind::IoFailure:
    return LogLevel::WARN;
  default:
    return LogLevel::DEBUG;
  }
}

void throwError(ErrorKind kind, const std::string &message) {
  Logger::getInstance().log(levelFor(kind),
                            errorKindToString(kind) + ": " + message);
  switch (kind) {
  case ErrorKind::NotFound:
    throw NotFoundError(message);
  case ErrorKind::InvalidInput:
    throw InvalidInputError(message);
  case ErrorKind::IoFailure:
    throw IoError(message);
  case ErrorKind::ConcurrencyConflict:
    throw ConcurrencyConflictError(message);
  case ErrorKind::InvariantViolation:
    throw InvariantViolationError(message);
  }
  throw DistdError(kind, message);
}

} // namespace distd
