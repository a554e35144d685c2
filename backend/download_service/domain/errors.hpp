#pragma once
#include <string>
#include <expected>

namespace download_service {

enum class ErrorCode {
  InputError,      // malformed resource reference or request parameter
  ConflictError,   // id already owned by an active session
  NotFoundError,   // unknown download id
  InvalidState,    // operation not valid in the current session state
  UpstreamError,   // media provider or network failure
  ProcessError,    // engine spawn failure or non-zero exit
  StorageError,    // record or artifact I/O
  DisconnectError  // client went away mid-stream
};

struct Error {
  ErrorCode code;
  std::string message;
};

inline const char* toString(ErrorCode code) {
  switch (code) {
    case ErrorCode::InputError: return "input_error";
    case ErrorCode::ConflictError: return "conflict";
    case ErrorCode::NotFoundError: return "not_found";
    case ErrorCode::InvalidState: return "invalid_state";
    case ErrorCode::UpstreamError: return "upstream_error";
    case ErrorCode::ProcessError: return "process_error";
    case ErrorCode::StorageError: return "storage_error";
    case ErrorCode::DisconnectError: return "disconnected";
  }
  return "unknown";
}

inline std::unexpected<Error> makeError(ErrorCode code, std::string message) {
  return std::unexpected(Error{code, std::move(message)});
}

template <typename T>
using Result = std::expected<T, Error>;

} // namespace download_service
