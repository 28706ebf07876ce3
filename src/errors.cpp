#include "errors.hpp"

namespace bridge {

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone:
      return "none";
    case ErrorKind::kValidation:
      return "validation_error";
    case ErrorKind::kToolConversion:
      return "tool_conversion_error";
    case ErrorKind::kSessionEstablishment:
      return "session_establishment_error";
    case ErrorKind::kProcessExecution:
      return "process_execution_error";
    case ErrorKind::kTimeout:
      return "timeout";
    case ErrorKind::kCancelled:
      return "cancelled";
    case ErrorKind::kStreamParse:
      return "stream_parse_error";
  }
  return "unknown";
}

const char* OpenAiErrorType(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kValidation:
    case ErrorKind::kToolConversion:
      return "invalid_request_error";
    case ErrorKind::kTimeout:
      return "timeout_error";
    default:
      return "api_error";
  }
}

int HttpStatusForError(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone:
      return 200;
    case ErrorKind::kValidation:
    case ErrorKind::kToolConversion:
      return 400;
    case ErrorKind::kTimeout:
      return 504;
    case ErrorKind::kCancelled:
      return 499;
    default:
      return 502;
  }
}

nlohmann::json MakeErrorBody(const std::string& message, const std::string& type, const nlohmann::json& code) {
  nlohmann::json j;
  j["error"] = {{"message", message}, {"type", type}, {"param", nullptr}, {"code", code}};
  return j;
}

nlohmann::json MakeErrorBody(const EngineError& err) {
  return MakeErrorBody(err.message.empty() ? std::string(ErrorKindName(err.kind)) : err.message,
                       OpenAiErrorType(err.kind), ErrorKindName(err.kind));
}

std::string DumpJson(const nlohmann::json& j) {
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace bridge
