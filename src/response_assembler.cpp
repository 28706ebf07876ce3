#include "response_assembler.hpp"

#include "tool_converter.hpp"

#include <chrono>
#include <random>
#include <sstream>
#include <utility>

namespace bridge {
namespace {

static std::string Hex(uint64_t v) {
  std::ostringstream oss;
  oss << std::hex << v;
  return oss.str();
}

static uint64_t Rand64() {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  return rng();
}

static nlohmann::json UsageJson(const Usage& u) {
  return {{"prompt_tokens", u.prompt_tokens},
          {"completion_tokens", u.completion_tokens},
          {"total_tokens", u.prompt_tokens + u.completion_tokens}};
}

}  // namespace

int64_t NowSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string NewId(const std::string& prefix) {
  auto now = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
          .count());
  return prefix + "-" + Hex(now) + Hex(Rand64());
}

std::string SseData(const nlohmann::json& j) {
  return std::string("data: ") + DumpJson(j) + "\n\n";
}

std::string SseDone() {
  return "data: [DONE]\n\n";
}

CompletionMeta NewCompletionMeta(const std::string& model) {
  CompletionMeta meta;
  meta.id = NewId("chatcmpl");
  meta.model = model;
  meta.created = NowSeconds();
  return meta;
}

void CompletionAccumulator::Add(const StreamEvent& ev) {
  if (terminal_) return;
  switch (ev.type) {
    case StreamEventType::kTextDelta:
      text_ += ev.text;
      break;
    case StreamEventType::kToolUseStart:
      if (call_index_.count(ev.tool_id)) break;
      call_index_[ev.tool_id] = calls_.size();
      calls_.push_back(ToolCall{ev.tool_id, ev.tool_name, ""});
      break;
    case StreamEventType::kToolUseDelta: {
      auto it = call_index_.find(ev.tool_id);
      if (it != call_index_.end()) calls_[it->second].arguments_json += ev.text;
      break;
    }
    case StreamEventType::kToolUseEnd: {
      auto it = call_index_.find(ev.tool_id);
      if (it != call_index_.end() && calls_[it->second].arguments_json.empty()) {
        calls_[it->second].arguments_json = "{}";
      }
      break;
    }
    case StreamEventType::kSessionEstablished:
      break;
    case StreamEventType::kCompleted:
      terminal_ = true;
      finish_reason_ = ev.finish_reason.empty() ? "stop" : ev.finish_reason;
      usage_ = ev.usage;
      break;
    case StreamEventType::kFailed:
      terminal_ = true;
      error_ = ev.error;
      if (!error_) SetError(&error_, ErrorKind::kProcessExecution, "cli invocation failed");
      break;
  }
}

nlohmann::json BuildCompletionBody(const CompletionMeta& meta, const CompletionAccumulator& acc) {
  nlohmann::json out;
  out["id"] = meta.id;
  out["object"] = "chat.completion";
  out["created"] = meta.created;
  out["model"] = meta.model;
  out["choices"] = nlohmann::json::array();

  nlohmann::json message;
  message["role"] = "assistant";
  if (acc.text().empty() && !acc.tool_calls().empty()) {
    message["content"] = nullptr;
  } else {
    message["content"] = acc.text();
  }
  if (!acc.tool_calls().empty()) message["tool_calls"] = BuildOpenAiToolCalls(acc.tool_calls());

  nlohmann::json choice;
  choice["index"] = 0;
  choice["message"] = std::move(message);
  choice["finish_reason"] = acc.finish_reason();
  out["choices"].push_back(std::move(choice));
  out["usage"] = UsageJson(acc.usage());
  return out;
}

std::optional<nlohmann::json> AssembleCompletion(IEventSource* events, const CompletionMeta& meta, EngineError* err) {
  CompletionAccumulator acc;
  StreamEvent ev;
  while (!acc.terminal() && events->Next(&ev)) acc.Add(ev);
  if (!acc.terminal()) {
    SetError(err, ErrorKind::kStreamParse, "event stream ended without a terminal event");
    return std::nullopt;
  }
  if (acc.error()) {
    if (err) *err = acc.error();
    return std::nullopt;
  }
  return BuildCompletionBody(meta, acc);
}

ChunkStream::ChunkStream(std::unique_ptr<IEventSource> events, CompletionMeta meta)
    : events_(std::move(events)), meta_(std::move(meta)) {}

nlohmann::json ChunkStream::Chunk(const nlohmann::json& delta, const nlohmann::json& finish_reason) const {
  nlohmann::json chunk;
  chunk["id"] = meta_.id;
  chunk["object"] = "chat.completion.chunk";
  chunk["created"] = meta_.created;
  chunk["model"] = meta_.model;
  nlohmann::json choice;
  choice["index"] = 0;
  choice["delta"] = delta;
  choice["finish_reason"] = finish_reason;
  chunk["choices"] = nlohmann::json::array({choice});
  return chunk;
}

std::optional<std::string> ChunkStream::FrameFor(const StreamEvent& ev) {
  switch (ev.type) {
    case StreamEventType::kTextDelta: {
      if (ev.text.empty()) return std::nullopt;
      return SseData(Chunk({{"content", ev.text}}, nullptr));
    }
    case StreamEventType::kToolUseStart: {
      if (tool_index_.count(ev.tool_id)) return std::nullopt;
      const int index = static_cast<int>(tool_index_.size());
      tool_index_[ev.tool_id] = index;
      nlohmann::json tc;
      tc["index"] = index;
      tc["id"] = ev.tool_id;
      tc["type"] = "function";
      tc["function"] = {{"name", ev.tool_name}, {"arguments", ""}};
      return SseData(Chunk({{"tool_calls", nlohmann::json::array({tc})}}, nullptr));
    }
    case StreamEventType::kToolUseDelta: {
      auto it = tool_index_.find(ev.tool_id);
      if (it == tool_index_.end() || ev.text.empty()) return std::nullopt;
      tool_args_sent_.insert(ev.tool_id);
      nlohmann::json tc;
      tc["index"] = it->second;
      tc["function"] = {{"arguments", ev.text}};
      return SseData(Chunk({{"tool_calls", nlohmann::json::array({tc})}}, nullptr));
    }
    case StreamEventType::kCompleted:
      return SseData(Chunk(nlohmann::json::object(), acc_.finish_reason()));
    case StreamEventType::kFailed:
      return SseData(MakeErrorBody(acc_.error()));
    case StreamEventType::kToolUseEnd: {
      // Argument-less calls read "{}" in both response shapes.
      auto it = tool_index_.find(ev.tool_id);
      if (it == tool_index_.end() || !tool_args_sent_.insert(ev.tool_id).second) return std::nullopt;
      nlohmann::json tc;
      tc["index"] = it->second;
      tc["function"] = {{"arguments", "{}"}};
      return SseData(Chunk({{"tool_calls", nlohmann::json::array({tc})}}, nullptr));
    }
    case StreamEventType::kSessionEstablished:
      return std::nullopt;
  }
  return std::nullopt;
}

bool ChunkStream::NextFrame(std::string* frame) {
  if (done_sent_) return false;
  if (!role_sent_) {
    role_sent_ = true;
    *frame = SseData(Chunk({{"role", "assistant"}}, nullptr));
    return true;
  }
  while (!terminal_sent_) {
    StreamEvent ev;
    if (!events_->Next(&ev)) {
      StreamEvent failed = StreamEvent::Failed(EngineError{ErrorKind::kStreamParse, "event stream ended without a terminal event"});
      acc_.Add(failed);
      terminal_sent_ = true;
      *frame = SseData(MakeErrorBody(acc_.error()));
      return true;
    }
    acc_.Add(ev);
    if (ev.IsTerminal()) terminal_sent_ = true;
    if (auto f = FrameFor(ev)) {
      *frame = std::move(*f);
      return true;
    }
  }
  done_sent_ = true;
  *frame = SseDone();
  return true;
}

void ChunkStream::Cancel() {
  if (events_) events_->Cancel();
}

}  // namespace bridge
