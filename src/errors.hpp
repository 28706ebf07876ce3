#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace bridge {

enum class ErrorKind {
  kNone,
  kValidation,
  kToolConversion,
  kSessionEstablishment,
  kProcessExecution,
  kTimeout,
  kCancelled,
  kStreamParse,
};

struct EngineError {
  ErrorKind kind = ErrorKind::kNone;
  std::string message;

  explicit operator bool() const { return kind != ErrorKind::kNone; }
};

inline void SetError(EngineError* err, ErrorKind kind, std::string message) {
  if (!err) return;
  err->kind = kind;
  err->message = std::move(message);
}

const char* ErrorKindName(ErrorKind kind);

// OpenAI "type" field for an error of this kind.
const char* OpenAiErrorType(ErrorKind kind);

int HttpStatusForError(ErrorKind kind);

nlohmann::json MakeErrorBody(const std::string& message, const std::string& type, const nlohmann::json& code = nullptr);
nlohmann::json MakeErrorBody(const EngineError& err);

// Compact dump for response bodies and SSE frames. Invalid UTF-8 (CLI stderr) becomes U+FFFD instead of throwing.
std::string DumpJson(const nlohmann::json& j);

}  // namespace bridge
