#include <gtest/gtest.h>

#include "prompt_splitter.hpp"
#include "translation_engine.hpp"

#include "helpers/scripted_runner.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>

using bridge::ChatMessage;
using bridge::ChatRequest;
using bridge::EngineError;
using bridge::ErrorKind;
using bridge::InvocationMode;
using bridge::InvocationPlan;
using bridge::TranslationEngine;
using test_helpers::BatchResult;
using test_helpers::Script;
using test_helpers::ScriptedRunner;

namespace {

constexpr const char* kTutor = "You are a math tutor.";

ChatMessage Msg(const std::string& role, const std::string& content) {
  ChatMessage m;
  m.role = role;
  m.content = content;
  return m;
}

std::string FlagValue(const InvocationPlan& plan, const std::string& flag) {
  auto it = std::find(plan.argv.begin(), plan.argv.end(), flag);
  if (it == plan.argv.end() || it + 1 == plan.argv.end()) return {};
  return *(it + 1);
}

Script Batch(const std::string& session_id, const std::string& text) {
  Script s;
  s.lines = {BatchResult(session_id, text)};
  return s;
}

// Mirrors the CLI: batch json output lists assistant messages only under --verbose.
Script ToolUseReply(const InvocationPlan& plan) {
  Script s;
  if (plan.streaming) {
    s.lines = {
        R"({"type":"system","subtype":"init","session_id":"s"})",
        R"({"type":"stream_event","event":{"type":"content_block_start","index":0,"content_block":{"type":"tool_use","id":"toolu_1","name":"get_weather","input":{}}}})",
        R"({"type":"stream_event","event":{"type":"content_block_delta","index":0,"delta":{"type":"input_json_delta","partial_json":"{\"city\":\"Paris\"}"}}})",
        R"({"type":"stream_event","event":{"type":"content_block_stop","index":0}})",
        R"({"type":"result","subtype":"success","is_error":false,"result":"","session_id":"s"})",
    };
    return s;
  }
  const std::string result = R"({"type":"result","subtype":"success","is_error":false,"result":"","session_id":"s"})";
  if (std::find(plan.argv.begin(), plan.argv.end(), "--verbose") == plan.argv.end()) {
    s.lines = {result};
    return s;
  }
  nlohmann::json arr = nlohmann::json::array();
  arr.push_back(nlohmann::json::parse(
      R"({"type":"assistant","message":{"content":[{"type":"tool_use","id":"toolu_1","name":"get_weather","input":{"city":"Paris"}}],"stop_reason":"tool_use"}})"));
  arr.push_back(nlohmann::json::parse(result));
  s.lines = {arr.dump()};
  return s;
}

std::vector<bridge::ToolSchema> WeatherTools() {
  return {{"get_weather", "Current weather", nlohmann::json::parse(R"({"type":"object","properties":{"city":{"type":"string"}}})")}};
}

class TranslationEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    cli_.executable = "claude";
    cli_.timeout_ms = 10000;
    cli_.establish_timeout_ms = 5000;
    cache_ = std::make_unique<bridge::InMemorySessionCache>(std::chrono::seconds(3600), 16);
  }

  // Default CLI: establishing answers "OK" with a fresh session, resumes and single shots echo `reply`.
  void UseDefaultCli(const std::string& reply = "4") {
    runner_ = std::make_unique<ScriptedRunner>([this, reply](const InvocationPlan& plan) {
      if (plan.mode == InvocationMode::kNewSession) {
        established_++;
        return Batch("sess-" + std::to_string(established_), "OK");
      }
      if (plan.streaming) {
        Script s;
        s.lines = test_helpers::StreamTextReply("sess-x", {reply});
        return s;
      }
      return Batch(plan.mode == InvocationMode::kResumeSession ? FlagValue(plan, "--resume") : "sess-oneshot", reply);
    });
  }

  void UseCli(ScriptedRunner::Handler handler) { runner_ = std::make_unique<ScriptedRunner>(std::move(handler)); }

  TranslationEngine Engine() { return TranslationEngine(bridge::CommandBuilder(cli_), runner_.get(), cache_.get(), session_); }

  static ChatRequest TutorRequest(const std::string& question) {
    ChatRequest req;
    req.model = "claude-sonnet-4-20250514";
    req.messages = {Msg("system", kTutor), Msg("user", question)};
    return req;
  }

  static std::string Content(const bridge::EngineResponse& resp) {
    const auto& c = (*resp.completion)["choices"][0]["message"]["content"];
    return c.is_null() ? std::string() : c.get<std::string>();
  }

  bridge::CliConfig cli_;
  bridge::SessionConfig session_;
  std::unique_ptr<bridge::InMemorySessionCache> cache_;
  std::unique_ptr<ScriptedRunner> runner_;
  int established_ = 0;
};

}  // namespace

TEST_F(TranslationEngineTest, MathTutorEstablishesThenResumes) {
  UseDefaultCli("4");
  auto engine = Engine();
  auto resp = engine.Handle(TutorRequest("What is 2+2?"), nullptr);

  ASSERT_FALSE(resp.error) << resp.error.message;
  ASSERT_TRUE(resp.completion.has_value());
  EXPECT_EQ(Content(resp), "4");
  EXPECT_EQ((*resp.completion)["choices"][0]["finish_reason"], "stop");
  EXPECT_EQ(resp.mode, InvocationMode::kResumeSession);

  const auto plans = runner_->plans();
  ASSERT_EQ(plans.size(), 2u);
  EXPECT_EQ(plans[0].mode, InvocationMode::kNewSession);
  EXPECT_EQ(FlagValue(plans[0], "--system-prompt"), kTutor);
  EXPECT_EQ(plans[1].mode, InvocationMode::kResumeSession);
  EXPECT_EQ(FlagValue(plans[1], "--resume"), "sess-1");
  EXPECT_EQ(FlagValue(plans[1], "--system-prompt"), "");
  EXPECT_EQ(plans[1].argv.back(), "What is 2+2?");
}

TEST_F(TranslationEngineTest, SameSystemPromptReusesSession) {
  UseDefaultCli("ok");
  auto engine = Engine();
  ASSERT_FALSE(engine.Handle(TutorRequest("What is 2+2?"), nullptr).error);
  ASSERT_FALSE(engine.Handle(TutorRequest("What is 3+3?"), nullptr).error);

  EXPECT_EQ(runner_->CountMode(InvocationMode::kNewSession), 1u);
  EXPECT_EQ(runner_->CountMode(InvocationMode::kResumeSession), 2u);
  EXPECT_EQ(cache_->Stats().hits, 1u);
}

TEST_F(TranslationEngineTest, DifferentSystemPromptsGetDifferentSessions) {
  UseDefaultCli();
  auto engine = Engine();
  auto a = TutorRequest("q");
  auto b = TutorRequest("q");
  b.messages[0].content = "You are a history tutor.";
  ASSERT_FALSE(engine.Handle(a, nullptr).error);
  ASSERT_FALSE(engine.Handle(b, nullptr).error);
  EXPECT_EQ(runner_->CountMode(InvocationMode::kNewSession), 2u);
}

TEST_F(TranslationEngineTest, NoSystemPromptRunsSingleShot) {
  UseDefaultCli("hello");
  auto engine = Engine();
  ChatRequest req;
  req.messages = {Msg("user", "hi")};
  auto resp = engine.Handle(req, nullptr);
  ASSERT_FALSE(resp.error);
  EXPECT_EQ(resp.mode, InvocationMode::kSingleShot);
  EXPECT_EQ(Content(resp), "hello");
  EXPECT_EQ(runner_->CountMode(InvocationMode::kNewSession), 0u);
  EXPECT_EQ(cache_->Stats().size, 0u);
}

TEST_F(TranslationEngineTest, ReuseDisabledRunsSingleShotWithSystemPrompt) {
  session_.reuse_enabled = false;
  UseDefaultCli();
  auto engine = Engine();
  auto resp = engine.Handle(TutorRequest("What is 2+2?"), nullptr);
  ASSERT_FALSE(resp.error);
  EXPECT_EQ(resp.mode, InvocationMode::kSingleShot);
  const auto plans = runner_->plans();
  ASSERT_EQ(plans.size(), 1u);
  EXPECT_EQ(FlagValue(plans[0], "--system-prompt"), kTutor);
}

TEST_F(TranslationEngineTest, ShortSystemPromptBelowThresholdRunsSingleShot) {
  session_.min_system_bytes = 1000;
  UseDefaultCli();
  auto engine = Engine();
  auto resp = engine.Handle(TutorRequest("What is 2+2?"), nullptr);
  ASSERT_FALSE(resp.error);
  EXPECT_EQ(resp.mode, InvocationMode::kSingleShot);
  EXPECT_EQ(runner_->CountMode(InvocationMode::kNewSession), 0u);
}

TEST_F(TranslationEngineTest, ToolChoiceNoneYieldsNoToolCalls) {
  UseCli([](const InvocationPlan& plan) { return ToolUseReply(plan); });
  auto engine = Engine();
  ChatRequest req;
  req.messages = {Msg("user", "Weather in Paris?")};
  req.tools = WeatherTools();
  req.tool_choice = "none";
  auto resp = engine.Handle(req, nullptr);
  ASSERT_FALSE(resp.error) << resp.error.message;
  const auto& choice = (*resp.completion)["choices"][0];
  EXPECT_FALSE(choice["message"].contains("tool_calls"));
  EXPECT_EQ(choice["finish_reason"], "stop");

  const auto plans = runner_->plans();
  ASSERT_EQ(plans.size(), 1u);
  EXPECT_EQ(plans[0].argv.back(), "Weather in Paris?");
}

TEST_F(TranslationEngineTest, ToolCallsAreReturnedWhenToolsAreActive) {
  UseCli([](const InvocationPlan& plan) { return ToolUseReply(plan); });
  auto engine = Engine();
  ChatRequest req;
  req.messages = {Msg("user", "Weather in Paris?")};
  req.tools = WeatherTools();
  auto resp = engine.Handle(req, nullptr);
  ASSERT_FALSE(resp.error) << resp.error.message;
  const auto& choice = (*resp.completion)["choices"][0];
  ASSERT_TRUE(choice["message"].contains("tool_calls"));
  EXPECT_EQ(choice["message"]["tool_calls"][0]["id"], "call_toolu_1");
  EXPECT_EQ(choice["message"]["tool_calls"][0]["function"]["name"], "get_weather");
  EXPECT_EQ(nlohmann::json::parse(choice["message"]["tool_calls"][0]["function"]["arguments"].get<std::string>()),
            nlohmann::json::parse(R"({"city":"Paris"})"));
  EXPECT_EQ(choice["finish_reason"], "tool_calls");
  EXPECT_TRUE(choice["message"]["content"].is_null());

  const auto plans = runner_->plans();
  ASSERT_EQ(plans.size(), 1u);
  EXPECT_NE(plans[0].argv.back().find("get_weather"), std::string::npos);
}

TEST_F(TranslationEngineTest, StreamingToolCallsCarryIndexAndId) {
  UseCli([](const InvocationPlan& plan) { return ToolUseReply(plan); });
  auto engine = Engine();
  ChatRequest req;
  req.stream = true;
  req.messages = {Msg("user", "Weather in Paris?")};
  req.tools = WeatherTools();
  auto resp = engine.Handle(req, nullptr);
  ASSERT_FALSE(resp.error);
  ASSERT_NE(resp.stream, nullptr);
  std::vector<nlohmann::json> chunks;
  std::string frame;
  while (resp.stream->NextFrame(&frame)) {
    if (frame == bridge::SseDone()) continue;
    chunks.push_back(nlohmann::json::parse(frame.substr(6)));
  }
  ASSERT_GE(chunks.size(), 3u);
  const auto& start = chunks[1]["choices"][0]["delta"]["tool_calls"][0];
  EXPECT_EQ(start["index"], 0);
  EXPECT_EQ(start["id"], "call_toolu_1");
  EXPECT_EQ(start["function"]["name"], "get_weather");
  EXPECT_EQ(chunks.back()["choices"][0]["finish_reason"], "tool_calls");
}

TEST_F(TranslationEngineTest, StreamingThreeTokens) {
  UseCli([](const InvocationPlan&) {
    Script s;
    s.lines = test_helpers::StreamTextReply("sess-s", {"one", " two", " three"});
    return s;
  });
  auto engine = Engine();
  ChatRequest req;
  req.stream = true;
  req.messages = {Msg("user", "Count to three")};
  auto resp = engine.Handle(req, nullptr);
  ASSERT_FALSE(resp.error);
  ASSERT_NE(resp.stream, nullptr);
  EXPECT_FALSE(resp.completion.has_value());

  std::vector<std::string> frames;
  std::string frame;
  while (resp.stream->NextFrame(&frame)) frames.push_back(frame);

  size_t role = 0, content = 0, finish = 0, done = 0;
  std::string text;
  for (const auto& f : frames) {
    if (f == bridge::SseDone()) {
      done++;
      continue;
    }
    auto chunk = nlohmann::json::parse(f.substr(6));
    EXPECT_EQ(chunk["id"].get<std::string>(), resp.meta.id);
    const auto& choice = chunk["choices"][0];
    if (choice["delta"].contains("role")) role++;
    if (choice["delta"].contains("content")) {
      content++;
      text += choice["delta"]["content"].get<std::string>();
    }
    if (!choice["finish_reason"].is_null()) finish++;
  }
  EXPECT_EQ(role, 1u);
  EXPECT_EQ(content, 3u);
  EXPECT_EQ(finish, 1u);
  EXPECT_EQ(done, 1u);
  EXPECT_EQ(frames.back(), bridge::SseDone());
  EXPECT_EQ(text, "one two three");
  ASSERT_TRUE(runner_->plans()[0].streaming);
}

TEST_F(TranslationEngineTest, EstablishFailureDegradesToSingleShot) {
  UseCli([](const InvocationPlan& plan) {
    if (plan.mode == InvocationMode::kNewSession) {
      Script s;
      s.lines = {BatchResult("", "auth failed", true)};
      s.exit_error = EngineError{ErrorKind::kProcessExecution, "cli exited with status 1"};
      return s;
    }
    return Batch("sess-oneshot", "4");
  });
  auto engine = Engine();
  auto resp = engine.Handle(TutorRequest("What is 2+2?"), nullptr);
  ASSERT_FALSE(resp.error) << resp.error.message;
  EXPECT_EQ(Content(resp), "4");
  EXPECT_EQ(resp.mode, InvocationMode::kSingleShot);
  const auto plans = runner_->plans();
  ASSERT_EQ(plans.size(), 2u);
  EXPECT_EQ(plans[1].mode, InvocationMode::kSingleShot);
  EXPECT_EQ(FlagValue(plans[1], "--system-prompt"), kTutor);
  EXPECT_EQ(cache_->Stats().size, 0u);
  EXPECT_EQ(cache_->Stats().establish_failures, 1u);
}

TEST_F(TranslationEngineTest, FailedResumeInvalidatesAndRetriesSingleShot) {
  bool session_lost = false;
  UseCli([this, &session_lost](const InvocationPlan& plan) {
    if (plan.mode == InvocationMode::kNewSession) {
      established_++;
      return Batch("sess-" + std::to_string(established_), "OK");
    }
    if (plan.mode == InvocationMode::kResumeSession && session_lost) {
      Script s;
      s.lines = {BatchResult("", "No conversation found with session ID", true)};
      s.exit_error = EngineError{ErrorKind::kProcessExecution, "cli exited with status 1"};
      return s;
    }
    return Batch("sess-any", "4");
  });
  auto engine = Engine();
  ASSERT_FALSE(engine.Handle(TutorRequest("What is 2+2?"), nullptr).error);

  session_lost = true;
  auto resp = engine.Handle(TutorRequest("What is 2+2?"), nullptr);
  ASSERT_FALSE(resp.error) << resp.error.message;
  EXPECT_TRUE(resp.retried_single_shot);
  EXPECT_EQ(resp.mode, InvocationMode::kSingleShot);
  EXPECT_EQ(Content(resp), "4");
  EXPECT_FALSE(cache_->Lookup(bridge::SystemPromptKey(kTutor)).has_value());

  session_lost = false;
  ASSERT_FALSE(engine.Handle(TutorRequest("again"), nullptr).error);
  EXPECT_EQ(runner_->CountMode(InvocationMode::kNewSession), 2u);
}

TEST_F(TranslationEngineTest, CliFailureIsReported) {
  UseCli([](const InvocationPlan&) {
    Script s;
    s.lines = {BatchResult("s", "overloaded", true)};
    return s;
  });
  auto engine = Engine();
  ChatRequest req;
  req.messages = {Msg("user", "hi")};
  auto resp = engine.Handle(req, nullptr);
  EXPECT_TRUE(static_cast<bool>(resp.error));
  EXPECT_EQ(resp.error.kind, ErrorKind::kProcessExecution);
  EXPECT_EQ(bridge::HttpStatusForError(resp.error.kind), 502);
  EXPECT_FALSE(resp.completion.has_value());
}

TEST_F(TranslationEngineTest, TimeoutIsNotRetried) {
  int resumes = 0;
  UseCli([&resumes](const InvocationPlan& plan) {
    if (plan.mode == InvocationMode::kNewSession) return Batch("sess-1", "OK");
    Script s;
    if (plan.mode == InvocationMode::kResumeSession) resumes++;
    s.exit_error = EngineError{ErrorKind::kTimeout, "cli invocation timed out after 10000 ms"};
    return s;
  });
  auto engine = Engine();
  auto resp = engine.Handle(TutorRequest("slow question"), nullptr);
  EXPECT_EQ(resp.error.kind, ErrorKind::kTimeout);
  EXPECT_EQ(resumes, 1);
  EXPECT_EQ(runner_->CountMode(InvocationMode::kSingleShot), 0u);
  EXPECT_TRUE(cache_->Lookup(bridge::SystemPromptKey(kTutor)).has_value());
}

TEST_F(TranslationEngineTest, SpawnFailureIsProcessExecutionError) {
  UseCli([](const InvocationPlan&) {
    Script s;
    s.spawn_fails = true;
    return s;
  });
  auto engine = Engine();
  ChatRequest req;
  req.messages = {Msg("user", "hi")};
  auto resp = engine.Handle(req, nullptr);
  EXPECT_EQ(resp.error.kind, ErrorKind::kProcessExecution);
}

TEST_F(TranslationEngineTest, RejectsUnknownRole) {
  UseDefaultCli();
  auto engine = Engine();
  ChatRequest req;
  req.messages = {Msg("narrator", "Once upon a time")};
  auto resp = engine.Handle(req, nullptr);
  EXPECT_EQ(resp.error.kind, ErrorKind::kValidation);
  EXPECT_TRUE(runner_->plans().empty());
}

TEST_F(TranslationEngineTest, RejectsSystemOnlyConversation) {
  UseDefaultCli();
  auto engine = Engine();
  ChatRequest req;
  req.messages = {Msg("system", kTutor)};
  auto resp = engine.Handle(req, nullptr);
  EXPECT_EQ(resp.error.kind, ErrorKind::kValidation);
  EXPECT_TRUE(runner_->plans().empty());
}

TEST_F(TranslationEngineTest, InvalidToolChoiceIsRejectedBeforeInvoking) {
  UseDefaultCli();
  auto engine = Engine();
  ChatRequest req;
  req.messages = {Msg("user", "hi")};
  req.tools = WeatherTools();
  req.tool_choice = nlohmann::json::parse(R"({"type":"function","function":{"name":"missing"}})");
  auto resp = engine.Handle(req, nullptr);
  EXPECT_EQ(resp.error.kind, ErrorKind::kValidation);
  EXPECT_TRUE(runner_->plans().empty());
}
