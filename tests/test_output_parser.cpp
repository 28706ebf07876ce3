#include <gtest/gtest.h>

#include "output_parser.hpp"

#include "helpers/scripted_runner.hpp"

#include <nlohmann/json.hpp>

using bridge::EngineError;
using bridge::ErrorKind;
using bridge::OutputParser;
using bridge::ParserState;
using bridge::StreamEvent;
using bridge::StreamEventType;

namespace {

std::vector<StreamEvent> ParseLines(const std::vector<std::string>& lines, OutputParser* parser,
                                    const EngineError& exit_error = EngineError{}) {
  std::vector<StreamEvent> out;
  for (const auto& l : lines) parser->Feed(l, &out);
  parser->Finish(exit_error, &out);
  return out;
}

std::string TextOf(const std::vector<StreamEvent>& events) {
  std::string s;
  for (const auto& ev : events) {
    if (ev.type == StreamEventType::kTextDelta) s += ev.text;
  }
  return s;
}

size_t CountType(const std::vector<StreamEvent>& events, StreamEventType type) {
  size_t n = 0;
  for (const auto& ev : events) {
    if (ev.type == type) n++;
  }
  return n;
}

}  // namespace

TEST(OutputParserTest, StreamingTextDeltasInOrder) {
  OutputParser parser(true);
  auto events = ParseLines(test_helpers::StreamTextReply("sess-1", {"Hel", "lo", "!"}), &parser);

  ASSERT_FALSE(events.empty());
  EXPECT_EQ(events.front().type, StreamEventType::kSessionEstablished);
  EXPECT_EQ(events.front().session_id, "sess-1");
  EXPECT_EQ(CountType(events, StreamEventType::kTextDelta), 3u);
  EXPECT_EQ(TextOf(events), "Hello!");
  EXPECT_EQ(events.back().type, StreamEventType::kCompleted);
  EXPECT_EQ(events.back().finish_reason, "stop");
  EXPECT_EQ(events.back().usage.prompt_tokens, 12);
  EXPECT_EQ(events.back().usage.completion_tokens, 3);
  EXPECT_EQ(parser.state(), ParserState::kDone);
}

TEST(OutputParserTest, BatchResultDocument) {
  OutputParser parser(false);
  auto events = ParseLines({test_helpers::BatchResult("sess-9", "4")}, &parser);
  ASSERT_EQ(events.size(), 3u);
  EXPECT_EQ(events[0].type, StreamEventType::kSessionEstablished);
  EXPECT_EQ(events[0].session_id, "sess-9");
  EXPECT_EQ(events[1].type, StreamEventType::kTextDelta);
  EXPECT_EQ(events[1].text, "4");
  EXPECT_EQ(events[2].type, StreamEventType::kCompleted);
  EXPECT_EQ(events[2].usage.prompt_tokens, 20);
}

TEST(OutputParserTest, BatchArrayOfEvents) {
  nlohmann::json arr = nlohmann::json::array();
  arr.push_back({{"type", "system"}, {"subtype", "init"}, {"session_id", "s"}});
  arr.push_back(nlohmann::json::parse(
      R"({"type":"assistant","message":{"content":[{"type":"text","text":"a"},{"type":"text","text":"b"}]}})"));
  arr.push_back(nlohmann::json::parse(R"({"type":"result","subtype":"success","is_error":false,"result":"ab"})"));
  OutputParser parser(false);
  auto events = ParseLines({arr.dump()}, &parser);
  EXPECT_EQ(CountType(events, StreamEventType::kTextDelta), 1u);
  EXPECT_EQ(TextOf(events), "ab");
  EXPECT_EQ(events.back().type, StreamEventType::kCompleted);
}

TEST(OutputParserTest, MalformedLinesAreSkipped) {
  auto lines = test_helpers::StreamTextReply("sess-1", {"ok"});
  lines.insert(lines.begin() + 1, "this is not json");
  lines.insert(lines.begin() + 2, "[1,2,3]");
  lines.insert(lines.begin() + 3, "");
  OutputParser parser(true);
  auto events = ParseLines(lines, &parser);
  EXPECT_EQ(parser.skipped_lines(), 2u);
  EXPECT_EQ(TextOf(events), "ok");
  EXPECT_EQ(events.back().type, StreamEventType::kCompleted);
}

TEST(OutputParserTest, OutputWithoutResultFails) {
  auto lines = test_helpers::StreamTextReply("sess-1", {"partial"});
  lines.pop_back();
  OutputParser parser(true);
  auto events = ParseLines(lines, &parser);
  EXPECT_EQ(events.back().type, StreamEventType::kFailed);
  EXPECT_EQ(events.back().error.kind, ErrorKind::kStreamParse);
  EXPECT_EQ(CountType(events, StreamEventType::kCompleted), 0u);
  EXPECT_EQ(parser.state(), ParserState::kFailed);
}

TEST(OutputParserTest, ErrorResultFails) {
  OutputParser parser(false);
  auto events = ParseLines({test_helpers::BatchResult("sess-1", "No conversation found", true)}, &parser);
  EXPECT_EQ(events.back().type, StreamEventType::kFailed);
  EXPECT_NE(events.back().error.message.find("No conversation found"), std::string::npos);
}

TEST(OutputParserTest, NonZeroExitOverridesSuccessfulResult) {
  OutputParser parser(false);
  EngineError exit_error{ErrorKind::kProcessExecution, "cli exited with status 1"};
  auto events = ParseLines({test_helpers::BatchResult("sess-1", "4")}, &parser, exit_error);
  EXPECT_EQ(events.back().type, StreamEventType::kFailed);
  EXPECT_EQ(events.back().error.message, "cli exited with status 1");
  EXPECT_EQ(CountType(events, StreamEventType::kCompleted), 0u);
}

TEST(OutputParserTest, StreamingToolUse) {
  std::vector<std::string> lines = {
      R"({"type":"system","subtype":"init","session_id":"s"})",
      R"({"type":"stream_event","event":{"type":"content_block_start","index":0,"content_block":{"type":"tool_use","id":"toolu_1","name":"get_weather","input":{}}}})",
      R"({"type":"stream_event","event":{"type":"content_block_delta","index":0,"delta":{"type":"input_json_delta","partial_json":"{\"city\":"}}})",
      R"({"type":"stream_event","event":{"type":"content_block_delta","index":0,"delta":{"type":"input_json_delta","partial_json":"\"Paris\"}"}}})",
      R"({"type":"stream_event","event":{"type":"content_block_stop","index":0}})",
      R"({"type":"stream_event","event":{"type":"message_delta","delta":{"stop_reason":"tool_use"}}})",
      R"({"type":"assistant","message":{"content":[{"type":"tool_use","id":"toolu_1","name":"get_weather","input":{"city":"Paris"}}],"stop_reason":"tool_use"}})",
      R"({"type":"result","subtype":"success","is_error":false,"result":"","session_id":"s"})",
  };
  OutputParser parser(true);
  auto events = ParseLines(lines, &parser);

  ASSERT_EQ(CountType(events, StreamEventType::kToolUseStart), 1u);
  std::string args;
  for (const auto& ev : events) {
    if (ev.type == StreamEventType::kToolUseStart) {
      EXPECT_EQ(ev.tool_id, "call_toolu_1");
      EXPECT_EQ(ev.tool_name, "get_weather");
    }
    if (ev.type == StreamEventType::kToolUseDelta) args += ev.text;
  }
  EXPECT_EQ(nlohmann::json::parse(args), nlohmann::json::parse(R"({"city":"Paris"})"));
  EXPECT_EQ(CountType(events, StreamEventType::kToolUseEnd), 1u);
  EXPECT_EQ(events.back().finish_reason, "tool_calls");
}

TEST(OutputParserTest, BatchToolUseFromAssistantMessage) {
  nlohmann::json arr = nlohmann::json::array();
  arr.push_back(nlohmann::json::parse(
      R"({"type":"assistant","message":{"content":[{"type":"text","text":"Checking."},{"type":"tool_use","id":"t1","name":"lookup","input":{"q":"x"}}]}})"));
  arr.push_back(nlohmann::json::parse(R"({"type":"result","subtype":"success","is_error":false,"result":"Checking."})"));
  OutputParser parser(false);
  auto events = ParseLines({arr.dump()}, &parser);
  EXPECT_EQ(TextOf(events), "Checking.");
  EXPECT_EQ(CountType(events, StreamEventType::kToolUseStart), 1u);
  EXPECT_EQ(events.back().finish_reason, "tool_calls");
}

TEST(OutputParserTest, MaxTurnsMapsToLength) {
  OutputParser parser(false);
  auto events = ParseLines(
      {R"({"type":"result","subtype":"error_max_turns","is_error":true,"result":"partial answer","session_id":"s"})"},
      &parser);
  EXPECT_EQ(events.back().type, StreamEventType::kCompleted);
  EXPECT_EQ(events.back().finish_reason, "length");
  EXPECT_EQ(TextOf(events), "partial answer");
}

TEST(OutputParserTest, StopReasonMapping) {
  EXPECT_EQ(bridge::MapStopReason("end_turn", false), "stop");
  EXPECT_EQ(bridge::MapStopReason("stop_sequence", false), "stop");
  EXPECT_EQ(bridge::MapStopReason("max_tokens", false), "length");
  EXPECT_EQ(bridge::MapStopReason("tool_use", false), "tool_calls");
  EXPECT_EQ(bridge::MapStopReason("end_turn", true), "tool_calls");
  EXPECT_EQ(bridge::MapStopReason("", false), "stop");
}

TEST(ParsedEventStreamTest, PullsFromProcessOutput) {
  test_helpers::Script script;
  script.lines = test_helpers::StreamTextReply("sess-1", {"a", "b"});
  auto output = std::make_unique<test_helpers::ScriptedOutput>(script, true);
  bridge::ParsedEventStream stream(std::move(output), true);
  std::vector<StreamEvent> events;
  StreamEvent ev;
  while (stream.Next(&ev)) events.push_back(ev);
  EXPECT_EQ(TextOf(events), "ab");
  EXPECT_EQ(CountType(events, StreamEventType::kCompleted), 1u);
  EXPECT_TRUE(events.back().IsTerminal());
}

TEST(ParsedEventStreamTest, ProcessFailureBecomesFailedEvent) {
  test_helpers::Script script;
  script.lines = {R"({"type":"system","subtype":"init","session_id":"s"})"};
  script.exit_error = EngineError{ErrorKind::kTimeout, "cli invocation timed out after 100 ms"};
  bridge::ParsedEventStream stream(std::make_unique<test_helpers::ScriptedOutput>(script, true), true);
  StreamEvent ev, last;
  while (stream.Next(&ev)) last = ev;
  EXPECT_EQ(last.type, StreamEventType::kFailed);
  EXPECT_EQ(last.error.kind, ErrorKind::kTimeout);
}
