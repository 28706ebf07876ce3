#include "output_parser.hpp"

#include "tool_converter.hpp"

#include <iostream>
#include <utility>

namespace bridge {
namespace {

constexpr size_t kLogPreviewChars = 200;

static std::string Preview(const std::string& s) {
  if (s.size() <= kLogPreviewChars) return s;
  return s.substr(0, kLogPreviewChars) + "...(truncated)";
}

static std::string StrField(const nlohmann::json& j, const char* key) {
  if (!j.is_object() || !j.contains(key) || !j[key].is_string()) return {};
  return j[key].get<std::string>();
}

static int64_t IntField(const nlohmann::json& j, const char* key) {
  if (!j.is_object() || !j.contains(key) || !j[key].is_number_integer()) return 0;
  return j[key].get<int64_t>();
}

static bool IsBlank(const std::string& s) {
  for (char c : s) {
    if (c != ' ' && c != '\t' && c != '\r' && c != '\n') return false;
  }
  return true;
}

// Batch output reports text once: adjacent text deltas are merged.
static void CoalesceText(std::vector<StreamEvent>* events, size_t from) {
  std::vector<StreamEvent> merged;
  for (size_t i = from; i < events->size(); i++) {
    auto& ev = (*events)[i];
    if (ev.type == StreamEventType::kTextDelta && !merged.empty() &&
        merged.back().type == StreamEventType::kTextDelta) {
      merged.back().text += ev.text;
      continue;
    }
    merged.push_back(std::move(ev));
  }
  events->resize(from);
  for (auto& ev : merged) events->push_back(std::move(ev));
}

}  // namespace

const char* ParserStateName(ParserState s) {
  switch (s) {
    case ParserState::kStart:
      return "start";
    case ParserState::kInSystemInit:
      return "in_system_init";
    case ParserState::kInAssistantContent:
      return "in_assistant_content";
    case ParserState::kInToolUse:
      return "in_tool_use";
    case ParserState::kDone:
      return "done";
    case ParserState::kFailed:
      return "failed";
  }
  return "unknown";
}

std::string MapStopReason(const std::string& stop_reason, bool saw_tool_use) {
  if (saw_tool_use || stop_reason == "tool_use") return "tool_calls";
  if (stop_reason == "max_tokens") return "length";
  return "stop";
}

OutputParser::OutputParser(bool streaming) : streaming_(streaming) {}

void OutputParser::Skip(const std::string& raw, const char* reason) {
  skipped_lines_++;
  std::cout << "[output-parser] skip reason=" << reason << " line=" << Preview(raw) << "\n";
}

void OutputParser::Feed(const std::string& chunk, std::vector<StreamEvent>* out) {
  if (state_ == ParserState::kDone || state_ == ParserState::kFailed) return;
  if (streaming_) {
    FeedLine(chunk, out);
    return;
  }

  const size_t first = out->size();
  auto doc = nlohmann::json::parse(chunk, nullptr, false);
  if (!doc.is_discarded()) {
    if (doc.is_array()) {
      for (const auto& item : doc) HandleDocument(item, out);
    } else {
      HandleDocument(doc, out);
    }
  } else {
    // Not one document: treat the batch as newline-delimited events.
    size_t start = 0;
    while (start <= chunk.size()) {
      auto nl = chunk.find('\n', start);
      if (nl == std::string::npos) nl = chunk.size();
      FeedLine(chunk.substr(start, nl - start), out);
      start = nl + 1;
    }
  }
  CoalesceText(out, first);
}

void OutputParser::FeedLine(const std::string& line, std::vector<StreamEvent>* out) {
  if (IsBlank(line)) return;
  auto doc = nlohmann::json::parse(line, nullptr, false);
  if (doc.is_discarded()) {
    Skip(line, "invalid_json");
    return;
  }
  if (!doc.is_object()) {
    Skip(line, "not_an_object");
    return;
  }
  HandleDocument(doc, out);
}

void OutputParser::HandleDocument(const nlohmann::json& doc, std::vector<StreamEvent>* out) {
  if (!doc.is_object()) return;
  const auto type = StrField(doc, "type");
  if (type == "system") {
    HandleSystem(doc, out);
  } else if (type == "stream_event") {
    if (doc.contains("event") && doc["event"].is_object()) HandlePartial(doc["event"], out);
  } else if (type == "assistant") {
    HandleAssistant(doc, out);
  } else if (type == "result") {
    HandleResult(doc, out);
  }
  // "user" documents carry results of the CLI's own tool runs; nothing to surface.
}

void OutputParser::NoteSession(const nlohmann::json& doc, std::vector<StreamEvent>* out) {
  const auto sid = StrField(doc, "session_id");
  if (sid.empty() || !session_id_.empty()) return;
  session_id_ = sid;
  out->push_back(StreamEvent::SessionEstablished(sid));
}

void OutputParser::HandleSystem(const nlohmann::json& doc, std::vector<StreamEvent>* out) {
  if (StrField(doc, "subtype") != "init") return;
  NoteSession(doc, out);
  if (state_ == ParserState::kStart) state_ = ParserState::kInSystemInit;
}

void OutputParser::EmitText(const std::string& text, std::vector<StreamEvent>* out) {
  if (text.empty()) return;
  saw_content_ = true;
  if (state_ != ParserState::kInToolUse) state_ = ParserState::kInAssistantContent;
  out->push_back(StreamEvent::TextDelta(text));
}

void OutputParser::NoteStopReason(const std::string& stop_reason) {
  if (!stop_reason.empty()) stop_reason_ = stop_reason;
}

void OutputParser::NoteUsage(const nlohmann::json& usage) {
  if (!usage.is_object()) return;
  const auto input = IntField(usage, "input_tokens") + IntField(usage, "cache_creation_input_tokens") +
                     IntField(usage, "cache_read_input_tokens");
  const auto output = IntField(usage, "output_tokens");
  if (input > 0) usage_.prompt_tokens = input;
  if (output > 0) usage_.completion_tokens = output;
}

void OutputParser::HandlePartial(const nlohmann::json& ev, std::vector<StreamEvent>* out) {
  const auto type = StrField(ev, "type");
  const int64_t index = IntField(ev, "index");

  if (type == "content_block_start") {
    if (!ev.contains("content_block")) return;
    const auto& block = ev["content_block"];
    const auto block_type = StrField(block, "type");
    if (block_type == "text") {
      partial_delivered_ = true;
      EmitText(StrField(block, "text"), out);
    } else if (block_type == "tool_use") {
      auto use = ParseNativeToolUse(block);
      if (!use) {
        Skip(block.dump(), "tool_use_without_id");
        return;
      }
      // Arguments arrive as input_json_delta fragments; the start block's input is a placeholder.
      use->input = nlohmann::json::object();
      const auto calls = FromNative({*use}, &tool_ids_);
      open_tools_[index] = OpenTool{calls[0].id, false};
      partial_delivered_ = true;
      saw_content_ = true;
      saw_tool_use_ = true;
      state_ = ParserState::kInToolUse;
      out->push_back(StreamEvent::ToolUseStart(calls[0].id, calls[0].name));
    }
    return;
  }

  if (type == "content_block_delta") {
    if (!ev.contains("delta")) return;
    const auto& delta = ev["delta"];
    const auto delta_type = StrField(delta, "type");
    if (delta_type == "text_delta") {
      partial_delivered_ = true;
      EmitText(StrField(delta, "text"), out);
    } else if (delta_type == "input_json_delta") {
      auto it = open_tools_.find(index);
      if (it == open_tools_.end() || it->second.closed) return;
      const auto fragment = StrField(delta, "partial_json");
      if (!fragment.empty()) out->push_back(StreamEvent::ToolUseDelta(it->second.id, fragment));
    }
    return;
  }

  if (type == "content_block_stop") {
    auto it = open_tools_.find(index);
    if (it != open_tools_.end() && !it->second.closed) {
      it->second.closed = true;
      out->push_back(StreamEvent::ToolUseEnd(it->second.id));
      state_ = ParserState::kInAssistantContent;
    }
    return;
  }

  if (type == "message_start") {
    open_tools_.clear();
    if (ev.contains("message") && ev["message"].is_object() && ev["message"].contains("usage")) {
      NoteUsage(ev["message"]["usage"]);
    }
    return;
  }

  if (type == "message_delta") {
    if (ev.contains("delta")) NoteStopReason(StrField(ev["delta"], "stop_reason"));
    if (ev.contains("usage")) NoteUsage(ev["usage"]);
  }
}

void OutputParser::HandleAssistant(const nlohmann::json& doc, std::vector<StreamEvent>* out) {
  if (!doc.contains("message") || !doc["message"].is_object()) return;
  const auto& msg = doc["message"];
  NoteStopReason(StrField(msg, "stop_reason"));
  if (msg.contains("usage")) NoteUsage(msg["usage"]);

  if (partial_delivered_) {
    partial_delivered_ = false;
    return;
  }
  if (!msg.contains("content")) return;
  const auto& content = msg["content"];
  if (content.is_string()) {
    EmitText(content.get<std::string>(), out);
    return;
  }
  if (!content.is_array()) return;

  for (const auto& block : content) {
    const auto block_type = StrField(block, "type");
    if (block_type == "text") {
      EmitText(StrField(block, "text"), out);
    } else if (block_type == "tool_use") {
      auto use = ParseNativeToolUse(block);
      if (!use) {
        Skip(block.dump(), "tool_use_without_id");
        continue;
      }
      const auto calls = FromNative({*use}, &tool_ids_);
      saw_content_ = true;
      saw_tool_use_ = true;
      out->push_back(StreamEvent::ToolUseStart(calls[0].id, calls[0].name));
      out->push_back(StreamEvent::ToolUseDelta(calls[0].id, calls[0].arguments_json));
      out->push_back(StreamEvent::ToolUseEnd(calls[0].id));
      state_ = ParserState::kInAssistantContent;
    }
  }
}

void OutputParser::HandleResult(const nlohmann::json& doc, std::vector<StreamEvent>* out) {
  NoteSession(doc, out);
  NoteStopReason(StrField(doc, "stop_reason"));
  if (doc.contains("usage")) NoteUsage(doc["usage"]);

  const auto subtype = StrField(doc, "subtype");
  const bool is_error = doc.contains("is_error") && doc["is_error"].is_boolean() && doc["is_error"].get<bool>();
  const auto result_text = StrField(doc, "result");
  have_result_ = true;
  result_max_turns_ = subtype == "error_max_turns";

  if (is_error && !result_max_turns_) {
    std::string msg = result_text.empty() ? "cli reported an error" : result_text;
    if (!subtype.empty()) msg = subtype + ": " + msg;
    SetError(&result_error_, ErrorKind::kProcessExecution, msg);
    return;
  }
  // A bare batch result is the only place the reply text appears.
  if (!saw_content_) EmitText(result_text, out);
}

void OutputParser::CloseOpenTools(std::vector<StreamEvent>* out) {
  for (auto& kv : open_tools_) {
    if (kv.second.closed) continue;
    kv.second.closed = true;
    out->push_back(StreamEvent::ToolUseEnd(kv.second.id));
  }
}

void OutputParser::Finish(const EngineError& process_error, std::vector<StreamEvent>* out) {
  if (state_ == ParserState::kDone || state_ == ParserState::kFailed) return;
  CloseOpenTools(out);

  EngineError failure;
  if (have_result_ && result_error_) {
    failure = result_error_;
  } else if (process_error) {
    failure = process_error;
  } else if (!have_result_) {
    std::string msg = "cli output ended without a result event";
    if (skipped_lines_ > 0) msg += " (" + std::to_string(skipped_lines_) + " malformed lines skipped)";
    SetError(&failure, ErrorKind::kStreamParse, msg);
  }

  if (failure) {
    std::cout << "[output-parser] failed kind=" << ErrorKindName(failure.kind) << " state=" << ParserStateName(state_)
              << " message=" << failure.message << " skipped=" << skipped_lines_ << "\n";
    state_ = ParserState::kFailed;
    out->push_back(StreamEvent::Failed(failure));
    return;
  }

  std::string finish = MapStopReason(stop_reason_, saw_tool_use_);
  if (result_max_turns_ && finish == "stop") finish = "length";
  state_ = ParserState::kDone;
  out->push_back(StreamEvent::Completed(finish, usage_));
}

ParsedEventStream::ParsedEventStream(std::unique_ptr<IProcessOutput> output, bool streaming)
    : output_(std::move(output)), parser_(streaming) {}

bool ParsedEventStream::Next(StreamEvent* ev) {
  while (pos_ >= pending_.size()) {
    if (finished_) return false;
    pending_.clear();
    pos_ = 0;
    std::string chunk;
    if (output_->Next(&chunk)) {
      parser_.Feed(chunk, &pending_);
      continue;
    }
    parser_.Finish(output_->error(), &pending_);
    finished_ = true;
  }
  *ev = std::move(pending_[pos_++]);
  return true;
}

void ParsedEventStream::Cancel() {
  output_->Cancel();
}

}  // namespace bridge
