#pragma once

#include "command_builder.hpp"
#include "config.hpp"
#include "conversation.hpp"
#include "errors.hpp"
#include "process/process_runner.hpp"
#include "response_assembler.hpp"
#include "session_cache.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>

namespace bridge {

enum class EngineState {
  kIdle,
  kSplitting,
  kResolvingSession,
  kInvoking,
  kParsing,
  kAssembling,
  kDone,
  kFailed,
};

const char* EngineStateName(EngineState s);

struct EngineResponse {
  CompletionMeta meta;
  EngineError error;
  // Set for non-streaming requests that succeeded.
  std::optional<nlohmann::json> completion;
  // Set for streaming requests that got as far as a running invocation.
  std::unique_ptr<ChunkStream> stream;
  InvocationMode mode = InvocationMode::kSingleShot;
  bool retried_single_shot = false;
};

class TranslationEngine {
 public:
  TranslationEngine(CommandBuilder builder, IProcessRunner* runner, ISessionCache* sessions, SessionConfig session_cfg);

  // The only entry point the HTTP layer uses. `cancel` may be null.
  EngineResponse Handle(const ChatRequest& req, std::shared_ptr<CancelToken> cancel);

 private:
  std::optional<std::string> Establish(const std::string& system_content,
                                       const std::string& model,
                                       const std::shared_ptr<CancelToken>& cancel,
                                       EngineError* err);
  std::unique_ptr<IEventSource> Invoke(const InvocationPlan& plan,
                                       const std::shared_ptr<CancelToken>& cancel,
                                       EngineError* err);

  CommandBuilder builder_;
  IProcessRunner* runner_;
  ISessionCache* sessions_;
  SessionConfig session_cfg_;
};

}  // namespace bridge
