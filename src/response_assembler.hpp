#pragma once

#include "errors.hpp"
#include "stream_event.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace bridge {

int64_t NowSeconds();
std::string NewId(const std::string& prefix);

std::string SseData(const nlohmann::json& j);
std::string SseDone();

struct CompletionMeta {
  std::string id;
  std::string model;
  int64_t created = 0;
};

CompletionMeta NewCompletionMeta(const std::string& model);

// Collects text and tool calls in arrival order.
class CompletionAccumulator {
 public:
  void Add(const StreamEvent& ev);

  const std::string& text() const { return text_; }
  const std::vector<ToolCall>& tool_calls() const { return calls_; }
  bool terminal() const { return terminal_; }
  const std::string& finish_reason() const { return finish_reason_; }
  const Usage& usage() const { return usage_; }
  const EngineError& error() const { return error_; }

 private:
  std::string text_;
  std::vector<ToolCall> calls_;
  std::unordered_map<std::string, size_t> call_index_;
  bool terminal_ = false;
  std::string finish_reason_ = "stop";
  Usage usage_;
  EngineError error_;
};

nlohmann::json BuildCompletionBody(const CompletionMeta& meta, const CompletionAccumulator& acc);

// Drains the event source into one chat.completion object. A Failed event, or a source that ends
// without a terminal event, returns nullopt with err set.
std::optional<nlohmann::json> AssembleCompletion(IEventSource* events, const CompletionMeta& meta, EngineError* err);

// Streaming assembly: a role chunk, one chunk per text or tool fragment, a finish chunk, then
// [DONE]. A failure becomes an error frame followed by [DONE].
class ChunkStream {
 public:
  ChunkStream(std::unique_ptr<IEventSource> events, CompletionMeta meta);

  // Next SSE frame. Returns false once [DONE] has been produced.
  bool NextFrame(std::string* frame);
  void Cancel();

  const CompletionMeta& meta() const { return meta_; }
  const CompletionAccumulator& accumulated() const { return acc_; }
  // Error carried by the stream's Failed event, if any.
  const EngineError& error() const { return acc_.error(); }

 private:
  nlohmann::json Chunk(const nlohmann::json& delta, const nlohmann::json& finish_reason) const;
  std::optional<std::string> FrameFor(const StreamEvent& ev);

  std::unique_ptr<IEventSource> events_;
  CompletionMeta meta_;
  CompletionAccumulator acc_;
  std::unordered_map<std::string, int> tool_index_;
  // Tool calls that streamed at least one arguments fragment.
  std::unordered_set<std::string> tool_args_sent_;
  bool role_sent_ = false;
  bool terminal_sent_ = false;
  bool done_sent_ = false;
};

}  // namespace bridge
