#include "command_builder.hpp"

#include <nlohmann/json.hpp>

#include <utility>

namespace bridge {
namespace {

static std::string JoinCsv(const std::vector<std::string>& items) {
  std::string out;
  for (const auto& s : items) {
    if (s.empty()) continue;
    if (!out.empty()) out += ",";
    out += s;
  }
  return out;
}

static std::string RenderToolCalls(const std::vector<ToolCall>& calls) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& c : calls) {
    auto args = nlohmann::json::parse(c.arguments_json, nullptr, false);
    if (args.is_discarded()) args = c.arguments_json;
    arr.push_back({{"id", c.id}, {"name", c.name}, {"input", args}});
  }
  return arr.dump();
}

// A lone user message goes to the CLI as-is.
static bool IsSingleUserTurn(const std::vector<ChatMessage>& messages) {
  return messages.size() == 1 && messages[0].role == "user" && messages[0].tool_calls.empty();
}

static std::string RenderBlocks(const std::vector<ChatMessage>& messages) {
  std::string out;
  for (const auto& m : messages) {
    if (m.role == "system") continue;
    if (!out.empty()) out += "\n\n";
    if (m.role == "tool") {
      out += "[tool result";
      if (!m.tool_call_id.empty()) out += " " + m.tool_call_id;
      out += "]\n" + m.content;
      continue;
    }
    out += "[" + m.role + "]\n";
    out += m.content;
    if (!m.tool_calls.empty()) {
      if (!m.content.empty()) out += "\n";
      out += "[tool calls] " + RenderToolCalls(m.tool_calls);
    }
  }
  return out;
}

}  // namespace

const char* InvocationModeName(InvocationMode mode) {
  switch (mode) {
    case InvocationMode::kNewSession:
      return "new_session";
    case InvocationMode::kResumeSession:
      return "resume_session";
    case InvocationMode::kSingleShot:
      return "single_shot";
  }
  return "unknown";
}

std::string RenderConversation(const std::vector<ChatMessage>& messages) {
  if (IsSingleUserTurn(messages)) return messages[0].content;
  return RenderBlocks(messages);
}

std::string RenderToolPreamble(const NativeToolset& tools) {
  if (!tools.Active()) return {};

  std::string prompt;
  prompt += "The caller provides the following tools. Tool results come back as [tool result <id>] blocks.\n";
  switch (tools.choice.mode) {
    case NativeToolChoiceMode::kRequired:
      prompt += "You MUST call at least one tool.\n";
      break;
    case NativeToolChoiceMode::kNamed:
      prompt += "You MUST call the tool: " + tools.choice.name + "\n";
      break;
    default:
      prompt += "Call a tool only when it is needed to answer.\n";
      break;
  }
  prompt += "tool_choice: " + NativeToolChoiceToJson(tools.choice).dump() + "\n";
  prompt += "tools: " + NativeToolsToJson(tools.tools).dump();
  return prompt;
}

CommandBuilder::CommandBuilder(CliConfig cfg) : cfg_(std::move(cfg)) {}

InvocationPlan CommandBuilder::BasePlan(InvocationMode mode, const std::string& model, bool streaming) const {
  InvocationPlan plan;
  plan.mode = mode;
  plan.streaming = streaming;
  plan.temp_dir = cfg_.temp_dir;
  plan.kill_grace = std::chrono::milliseconds(cfg_.kill_grace_ms);
  plan.timeout = std::chrono::milliseconds(mode == InvocationMode::kNewSession ? cfg_.establish_timeout_ms
                                                                              : cfg_.timeout_ms);
  plan.env.push_back({"CLAUDE_CODE_ENTRYPOINT", "cli-bridge"});

  plan.argv.push_back(cfg_.executable);
  plan.argv.push_back("--print");
  plan.argv.push_back("--output-format");
  plan.argv.push_back(streaming ? "stream-json" : "json");
  // Without --verbose, json output carries only the result object and drops assistant tool_use blocks.
  plan.argv.push_back("--verbose");
  if (streaming) plan.argv.push_back("--include-partial-messages");
  if (!model.empty()) {
    plan.argv.push_back("--model");
    plan.argv.push_back(model);
  }
  if (cfg_.max_turns > 0) {
    plan.argv.push_back("--max-turns");
    plan.argv.push_back(std::to_string(cfg_.max_turns));
  }
  const auto disallowed = JoinCsv(cfg_.disallowed_tools);
  if (!disallowed.empty()) {
    plan.argv.push_back("--disallowedTools");
    plan.argv.push_back(disallowed);
  }
  return plan;
}

void CommandBuilder::AttachPrompt(std::string prompt, InvocationPlan* plan) const {
  // A leading '-' would be read as a flag.
  if (prompt.size() > cfg_.inline_prompt_max_bytes || (!prompt.empty() && prompt[0] == '-')) {
    plan->input = InputKind::kTempFile;
    plan->input_payload = std::move(prompt);
    return;
  }
  plan->input = InputKind::kNone;
  plan->argv.push_back(std::move(prompt));
}

InvocationPlan CommandBuilder::BuildEstablish(const std::string& system_content, const std::string& model) const {
  auto plan = BasePlan(InvocationMode::kNewSession, model, false);
  if (system_content.size() > cfg_.inline_prompt_max_bytes) {
    AttachPrompt("[system]\n" + system_content + "\n\n[user]\n" + kEstablishPrompt, &plan);
    return plan;
  }
  plan.argv.push_back("--system-prompt");
  plan.argv.push_back(system_content);
  AttachPrompt(kEstablishPrompt, &plan);
  return plan;
}

InvocationPlan CommandBuilder::Build(const std::vector<ChatMessage>& remaining,
                                     const std::string& system_content,
                                     const SessionDecision& decision,
                                     const NativeToolset& tools,
                                     const std::string& model,
                                     bool streaming) const {
  if (decision.mode == InvocationMode::kNewSession) return BuildEstablish(system_content, model);

  const auto preamble = RenderToolPreamble(tools);
  std::string prompt = preamble.empty() ? std::string() : preamble + "\n\n";
  prompt += preamble.empty() ? RenderConversation(remaining) : RenderBlocks(remaining);

  if (decision.mode == InvocationMode::kResumeSession && !decision.native_session_id.empty()) {
    auto plan = BasePlan(InvocationMode::kResumeSession, model, streaming);
    plan.argv.push_back("--resume");
    plan.argv.push_back(decision.native_session_id);
    // The cached session must keep only the system prompt; each turn continues in a fork.
    plan.argv.push_back("--fork-session");
    AttachPrompt(std::move(prompt), &plan);
    return plan;
  }

  auto plan = BasePlan(InvocationMode::kSingleShot, model, streaming);
  if (system_content.empty()) {
    AttachPrompt(std::move(prompt), &plan);
    return plan;
  }
  // Oversized system content travels with the prompt instead of as one argv entry.
  if (system_content.size() + prompt.size() > cfg_.inline_prompt_max_bytes) {
    std::string combined = "[system]\n" + system_content + "\n\n";
    if (!preamble.empty()) combined += preamble + "\n\n";
    combined += RenderBlocks(remaining);
    AttachPrompt(std::move(combined), &plan);
    return plan;
  }
  plan.argv.push_back("--system-prompt");
  plan.argv.push_back(system_content);
  AttachPrompt(std::move(prompt), &plan);
  return plan;
}

}  // namespace bridge
