#include "trigraph/error.hpp"

namespace trigraph {

const char *to_string(ErrorCode code) noexcept {
  switch (code) {
  case ErrorCode::Format:
    return "FormatError";
  case ErrorCode::Storage:
    return "StorageError";
  case ErrorCode::ReadOnly:
    return "ReadOnlyError";
  case ErrorCode::NotFound:
    return "NotFoundError";
  case ErrorCode::InvalidArgument:
    return "InvalidArgumentError";
  case ErrorCode::UnregisteredOperation:
    return "UnregisteredOperationError";
  case ErrorCode::ClosedTransaction:
    return "ClosedTransactionError";
  case ErrorCode::InconsistentState:
    return "InconsistentStateError";
  case ErrorCode::NoPath:
    return "NoPath";
  case ErrorCode::OperationFailed:
    return "OperationFailed";
  }
  return "UnknownError";
}

std::string Error::describe() const {
  return std::string(to_string(code)) + ": " + message;
}

} // namespace trigraph
