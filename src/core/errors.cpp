#include "core/errors.hpp"

#include <utility>

namespace mode_server::core {

RpcError validation_error(std::string reason) {
  return RpcError{.kind = ErrorKind::validation,
                  .code = ErrorCode::validation_error,
                  .message = "Validation error",
                  .data = std::move(reason)};
}

RpcError protocol_error(const ErrorCode code, std::string message, nlohmann::json data) {
  return RpcError{.kind = ErrorKind::protocol, .code = code, .message = std::move(message), .data = std::move(data)};
}

RpcError internal_error(std::string detail) {
  return RpcError{.kind = ErrorKind::internal,
                  .code = ErrorCode::internal_error,
                  .message = "Internal server error",
                  .data = std::move(detail)};
}

const char* error_code_name(const ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::parse_error:
      return "PARSE_ERROR";
    case ErrorCode::invalid_request:
      return "INVALID_REQUEST";
    case ErrorCode::method_not_found:
      return "METHOD_NOT_FOUND";
    case ErrorCode::invalid_params:
      return "INVALID_PARAMS";
    case ErrorCode::internal_error:
      return "INTERNAL_ERROR";
    case ErrorCode::mode_not_found:
      return "MODE_NOT_FOUND";
    case ErrorCode::task_not_found:
      return "TASK_NOT_FOUND";
    case ErrorCode::session_expired:
      return "SESSION_EXPIRED";
    case ErrorCode::validation_error:
      return "VALIDATION_ERROR";
    case ErrorCode::tool_restriction_error:
      return "TOOL_RESTRICTION_ERROR";
    case ErrorCode::file_restriction_error:
      return "FILE_RESTRICTION_ERROR";
  }
  return "UNKNOWN_ERROR";
}

}  // namespace mode_server::core
