#pragma once

#include "process/process_runner.hpp"
#include "stream_event.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace bridge {

enum class ParserState {
  kStart,
  kInSystemInit,
  kInAssistantContent,
  kInToolUse,
  kDone,
  kFailed,
};

const char* ParserStateName(ParserState s);

// Turns CLI stdout (one JSON document, a JSON array of events, or NDJSON lines) into StreamEvents.
// The terminal event is held back until Finish() so the exit status can still turn a result into
// a failure.
class OutputParser {
 public:
  explicit OutputParser(bool streaming);

  void Feed(const std::string& chunk, std::vector<StreamEvent>* out);
  void Finish(const EngineError& process_error, std::vector<StreamEvent>* out);

  ParserState state() const { return state_; }
  size_t skipped_lines() const { return skipped_lines_; }
  bool saw_content() const { return saw_content_; }
  const std::string& session_id() const { return session_id_; }

 private:
  struct OpenTool {
    std::string id;
    bool closed = false;
  };

  void FeedLine(const std::string& line, std::vector<StreamEvent>* out);
  void HandleDocument(const nlohmann::json& doc, std::vector<StreamEvent>* out);
  void HandleSystem(const nlohmann::json& doc, std::vector<StreamEvent>* out);
  void HandlePartial(const nlohmann::json& ev, std::vector<StreamEvent>* out);
  void HandleAssistant(const nlohmann::json& doc, std::vector<StreamEvent>* out);
  void HandleResult(const nlohmann::json& doc, std::vector<StreamEvent>* out);
  void NoteSession(const nlohmann::json& doc, std::vector<StreamEvent>* out);
  void EmitText(const std::string& text, std::vector<StreamEvent>* out);
  void CloseOpenTools(std::vector<StreamEvent>* out);
  void NoteStopReason(const std::string& stop_reason);
  void NoteUsage(const nlohmann::json& usage);
  void Skip(const std::string& raw, const char* reason);

  bool streaming_;
  ParserState state_ = ParserState::kStart;
  std::string session_id_;
  bool saw_content_ = false;
  bool saw_tool_use_ = false;
  // Partial stream events already delivered the content of the assistant message that follows.
  bool partial_delivered_ = false;
  std::unordered_map<int64_t, OpenTool> open_tools_;
  std::unordered_set<std::string> tool_ids_;
  std::string stop_reason_;
  Usage usage_;
  bool have_result_ = false;
  EngineError result_error_;
  bool result_max_turns_ = false;
  size_t skipped_lines_ = 0;
};

// finish_reason for a native stop reason; tool use wins over whatever the CLI reported.
std::string MapStopReason(const std::string& stop_reason, bool saw_tool_use);

// IEventSource over a running invocation: pulls raw chunks from the process and parses them.
class ParsedEventStream : public IEventSource {
 public:
  ParsedEventStream(std::unique_ptr<IProcessOutput> output, bool streaming);

  bool Next(StreamEvent* ev) override;
  void Cancel() override;

  const IProcessOutput* output() const { return output_.get(); }

 private:
  std::unique_ptr<IProcessOutput> output_;
  OutputParser parser_;
  std::vector<StreamEvent> pending_;
  size_t pos_ = 0;
  bool finished_ = false;
};

}  // namespace bridge
