#pragma once

#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace mode_server::core {

enum class ErrorCode : int {
  parse_error = -32700,
  invalid_request = -32600,
  method_not_found = -32601,
  invalid_params = -32602,
  internal_error = -32603,
  mode_not_found = -32001,
  task_not_found = -32002,
  session_expired = -32003,
  validation_error = -32004,
  tool_restriction_error = -32005,
  file_restriction_error = -32006,
};

// How the router turns an error into a wire frame.
enum class ErrorKind {
  validation,
  protocol,
  internal,
};

struct RpcError {
  ErrorKind kind{ErrorKind::internal};
  ErrorCode code{ErrorCode::internal_error};
  std::string message;
  nlohmann::json data{};
};

template <typename T>
using Expected = std::variant<T, RpcError>;

RpcError validation_error(std::string reason);
RpcError protocol_error(ErrorCode code, std::string message, nlohmann::json data = nullptr);
RpcError internal_error(std::string detail);

[[nodiscard]] const char* error_code_name(ErrorCode code) noexcept;
[[nodiscard]] constexpr int to_int(ErrorCode code) noexcept { return static_cast<int>(code); }

template <typename T>
[[nodiscard]] bool is_error(const Expected<T>& value) noexcept {
  return std::holds_alternative<RpcError>(value);
}

}  // namespace mode_server::core
