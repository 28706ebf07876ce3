#include "stream_event.hpp"

#include <utility>

namespace bridge {

const char* StreamEventTypeName(StreamEventType type) {
  switch (type) {
    case StreamEventType::kTextDelta:
      return "text_delta";
    case StreamEventType::kToolUseStart:
      return "tool_use_start";
    case StreamEventType::kToolUseDelta:
      return "tool_use_delta";
    case StreamEventType::kToolUseEnd:
      return "tool_use_end";
    case StreamEventType::kSessionEstablished:
      return "session_established";
    case StreamEventType::kCompleted:
      return "completed";
    case StreamEventType::kFailed:
      return "failed";
  }
  return "unknown";
}

StreamEvent StreamEvent::TextDelta(std::string text) {
  StreamEvent ev;
  ev.type = StreamEventType::kTextDelta;
  ev.text = std::move(text);
  return ev;
}

StreamEvent StreamEvent::ToolUseStart(std::string id, std::string name) {
  StreamEvent ev;
  ev.type = StreamEventType::kToolUseStart;
  ev.tool_id = std::move(id);
  ev.tool_name = std::move(name);
  return ev;
}

StreamEvent StreamEvent::ToolUseDelta(std::string id, std::string fragment) {
  StreamEvent ev;
  ev.type = StreamEventType::kToolUseDelta;
  ev.tool_id = std::move(id);
  ev.text = std::move(fragment);
  return ev;
}

StreamEvent StreamEvent::ToolUseEnd(std::string id) {
  StreamEvent ev;
  ev.type = StreamEventType::kToolUseEnd;
  ev.tool_id = std::move(id);
  return ev;
}

StreamEvent StreamEvent::SessionEstablished(std::string session_id) {
  StreamEvent ev;
  ev.type = StreamEventType::kSessionEstablished;
  ev.session_id = std::move(session_id);
  return ev;
}

StreamEvent StreamEvent::Completed(std::string finish_reason, Usage usage) {
  StreamEvent ev;
  ev.type = StreamEventType::kCompleted;
  ev.finish_reason = std::move(finish_reason);
  ev.usage = usage;
  return ev;
}

StreamEvent StreamEvent::Failed(EngineError error) {
  StreamEvent ev;
  ev.type = StreamEventType::kFailed;
  ev.error = std::move(error);
  return ev;
}

}  // namespace bridge
