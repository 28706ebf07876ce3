#pragma once

#include "config.hpp"
#include "conversation.hpp"
#include "tool_converter.hpp"

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace bridge {

enum class InvocationMode {
  kNewSession,
  kResumeSession,
  kSingleShot,
};

const char* InvocationModeName(InvocationMode mode);

enum class InputKind {
  kNone,
  // input_payload is written to the child's stdin through a pipe.
  kStdin,
  // input_payload is written to a 0600 temp file in temp_dir, which becomes the child's stdin.
  kTempFile,
};

struct InvocationPlan {
  InvocationMode mode = InvocationMode::kSingleShot;
  std::vector<std::string> argv;
  // Added to (or overriding) the inherited environment.
  std::vector<std::pair<std::string, std::string>> env;
  InputKind input = InputKind::kNone;
  std::string input_payload;
  std::string temp_dir;
  bool streaming = false;
  std::chrono::milliseconds timeout{0};
  std::chrono::milliseconds kill_grace{0};
};

struct SessionDecision {
  InvocationMode mode = InvocationMode::kSingleShot;
  std::string native_session_id;
};

// Prompt sent with the system content when establishing a native session.
inline constexpr const char* kEstablishPrompt = "Reply with the single word OK.";

class CommandBuilder {
 public:
  explicit CommandBuilder(CliConfig cfg);

  // Plan for one request turn. kNewSession decisions are routed to BuildEstablish.
  InvocationPlan Build(const std::vector<ChatMessage>& remaining,
                       const std::string& system_content,
                       const SessionDecision& decision,
                       const NativeToolset& tools,
                       const std::string& model,
                       bool streaming) const;

  // Sends only the system content, in batch mode, so the native session id can be read back.
  InvocationPlan BuildEstablish(const std::string& system_content, const std::string& model) const;

  const CliConfig& config() const { return cfg_; }

 private:
  InvocationPlan BasePlan(InvocationMode mode, const std::string& model, bool streaming) const;
  void AttachPrompt(std::string prompt, InvocationPlan* plan) const;

  CliConfig cfg_;
};

// Renders the non-system part of a conversation as role-tagged text blocks.
std::string RenderConversation(const std::vector<ChatMessage>& messages);

// Describes the native tool definitions and the tool choice; empty when no tools are active.
std::string RenderToolPreamble(const NativeToolset& tools);

}  // namespace bridge
