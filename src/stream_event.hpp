#pragma once

#include "conversation.hpp"
#include "errors.hpp"

#include <string>

namespace bridge {

enum class StreamEventType {
  kTextDelta,
  kToolUseStart,
  kToolUseDelta,
  kToolUseEnd,
  kSessionEstablished,
  kCompleted,
  kFailed,
};

const char* StreamEventTypeName(StreamEventType type);

// Single contract between OutputParser and ResponseAssembler. Which fields are set depends on type:
//   kTextDelta            text
//   kToolUseStart         tool_id (already "call_"-prefixed), tool_name
//   kToolUseDelta         tool_id, text (a fragment of the JSON arguments)
//   kToolUseEnd           tool_id
//   kSessionEstablished   session_id
//   kCompleted            finish_reason ("stop" | "length" | "tool_calls"), usage
//   kFailed               error
struct StreamEvent {
  StreamEventType type = StreamEventType::kTextDelta;
  std::string text;
  std::string tool_id;
  std::string tool_name;
  std::string session_id;
  std::string finish_reason;
  Usage usage;
  EngineError error;

  static StreamEvent TextDelta(std::string text);
  static StreamEvent ToolUseStart(std::string id, std::string name);
  static StreamEvent ToolUseDelta(std::string id, std::string fragment);
  static StreamEvent ToolUseEnd(std::string id);
  static StreamEvent SessionEstablished(std::string session_id);
  static StreamEvent Completed(std::string finish_reason, Usage usage);
  static StreamEvent Failed(EngineError error);

  bool IsTerminal() const { return type == StreamEventType::kCompleted || type == StreamEventType::kFailed; }
};

// Pull-based source of StreamEvents. Yields exactly one terminal event, then returns false.
class IEventSource {
 public:
  virtual ~IEventSource() = default;
  virtual bool Next(StreamEvent* ev) = 0;
  virtual void Cancel() = 0;
};

}  // namespace bridge
