#pragma once

#include "conversation.hpp"
#include "errors.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace bridge {

struct NativeTool {
  std::string name;
  std::string description;
  nlohmann::json input_schema;
};

enum class NativeToolChoiceMode {
  kAllowed,
  kDisabled,
  kRequired,
  kNamed,
};

struct NativeToolChoice {
  NativeToolChoiceMode mode = NativeToolChoiceMode::kAllowed;
  std::string name;
};

struct NativeToolset {
  std::vector<NativeTool> tools;
  NativeToolChoice choice;

  // True when tool definitions should reach the CLI at all.
  bool Active() const { return !tools.empty() && choice.mode != NativeToolChoiceMode::kDisabled; }
};

// One tool_use content block as the CLI reports it.
struct NativeToolUse {
  std::string id;
  std::string name;
  nlohmann::json input;
};

inline constexpr const char* kToolCallIdPrefix = "call_";

// Reads the OpenAI "tools" array. Entries must be {"type":"function","function":{...}} or the bare
// function object; a missing name or a non-object "parameters" is a tool conversion error.
std::optional<std::vector<ToolSchema>> ParseOpenAiTools(const nlohmann::json& tools, EngineError* err);

bool ToNative(const std::vector<ToolSchema>& tools,
              const nlohmann::json& tool_choice,
              NativeToolset* out,
              EngineError* err);

// Ids already handed out within the same response may be passed in `used`; clashes get a _2, _3, ...
// suffix so every tool call id in one response is unique.
std::vector<ToolCall> FromNative(const std::vector<NativeToolUse>& blocks,
                                 std::unordered_set<std::string>* used = nullptr);

std::vector<ToolSchema> FromNativeTools(const std::vector<NativeTool>& tools);

std::optional<NativeToolUse> ParseNativeToolUse(const nlohmann::json& block);

std::string ToOpenAiToolCallId(const std::string& native_id);

nlohmann::json NativeToolsToJson(const std::vector<NativeTool>& tools);
nlohmann::json NativeToolChoiceToJson(const NativeToolChoice& choice);

nlohmann::json BuildOpenAiToolCalls(const std::vector<ToolCall>& calls);

}  // namespace bridge
