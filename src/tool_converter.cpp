#include "tool_converter.hpp"

#include <string>
#include <unordered_set>
#include <utility>

namespace bridge {
namespace {

static bool ParseOneTool(const nlohmann::json& t, size_t index, ToolSchema* out, EngineError* err) {
  const auto where = "tools[" + std::to_string(index) + "]";
  if (!t.is_object()) {
    SetError(err, ErrorKind::kToolConversion, where + " must be an object");
    return false;
  }
  if (t.contains("type") && t["type"].is_string() && t["type"].get<std::string>() != "function") {
    SetError(err, ErrorKind::kToolConversion, where + ": unsupported tool type " + t["type"].get<std::string>());
    return false;
  }
  const nlohmann::json* fn = &t;
  if (t.contains("function")) {
    if (!t["function"].is_object()) {
      SetError(err, ErrorKind::kToolConversion, where + ".function must be an object");
      return false;
    }
    fn = &t["function"];
  }
  if (!fn->contains("name") || !(*fn)["name"].is_string() || (*fn)["name"].get<std::string>().empty()) {
    SetError(err, ErrorKind::kToolConversion, where + ": missing function name");
    return false;
  }
  out->name = (*fn)["name"].get<std::string>();
  if (fn->contains("description")) {
    if (!(*fn)["description"].is_string()) {
      SetError(err, ErrorKind::kToolConversion, where + ": description must be a string");
      return false;
    }
    out->description = (*fn)["description"].get<std::string>();
  }
  if (fn->contains("parameters") && !(*fn)["parameters"].is_null()) {
    if (!(*fn)["parameters"].is_object()) {
      SetError(err, ErrorKind::kToolConversion, where + ": parameters must be a JSON schema object");
      return false;
    }
    out->parameters = (*fn)["parameters"];
  } else {
    out->parameters = nlohmann::json::object();
  }
  return true;
}

}  // namespace

std::optional<std::vector<ToolSchema>> ParseOpenAiTools(const nlohmann::json& tools, EngineError* err) {
  std::vector<ToolSchema> out;
  if (tools.is_null()) return out;
  if (!tools.is_array()) {
    SetError(err, ErrorKind::kToolConversion, "tools must be an array");
    return std::nullopt;
  }
  std::unordered_set<std::string> seen;
  for (size_t i = 0; i < tools.size(); i++) {
    ToolSchema s;
    if (!ParseOneTool(tools[i], i, &s, err)) return std::nullopt;
    if (!seen.insert(s.name).second) {
      SetError(err, ErrorKind::kToolConversion, "duplicate tool name: " + s.name);
      return std::nullopt;
    }
    out.push_back(std::move(s));
  }
  return out;
}

bool ToNative(const std::vector<ToolSchema>& tools,
              const nlohmann::json& tool_choice,
              NativeToolset* out,
              EngineError* err) {
  if (!out) return false;
  out->tools.clear();
  out->tools.reserve(tools.size());
  for (const auto& t : tools) {
    if (t.name.empty()) {
      SetError(err, ErrorKind::kToolConversion, "tool without a name");
      return false;
    }
    if (!t.parameters.is_null() && !t.parameters.is_object()) {
      SetError(err, ErrorKind::kToolConversion, "tool " + t.name + ": parameters must be a JSON schema object");
      return false;
    }
    NativeTool nt;
    nt.name = t.name;
    nt.description = t.description;
    nt.input_schema = t.parameters.is_null() ? nlohmann::json::object() : t.parameters;
    out->tools.push_back(std::move(nt));
  }

  NativeToolChoice choice;
  if (tool_choice.is_null()) {
    choice.mode = NativeToolChoiceMode::kAllowed;
  } else if (tool_choice.is_string()) {
    const auto v = tool_choice.get<std::string>();
    if (v == "auto") {
      choice.mode = NativeToolChoiceMode::kAllowed;
    } else if (v == "none") {
      choice.mode = NativeToolChoiceMode::kDisabled;
    } else if (v == "required") {
      choice.mode = NativeToolChoiceMode::kRequired;
    } else {
      SetError(err, ErrorKind::kValidation, "unsupported tool_choice: " + v);
      return false;
    }
  } else if (tool_choice.is_object()) {
    if (tool_choice.contains("type") && tool_choice["type"].is_string() &&
        tool_choice["type"].get<std::string>() != "function") {
      SetError(err, ErrorKind::kValidation, "unsupported tool_choice type: " + tool_choice["type"].get<std::string>());
      return false;
    }
    if (!tool_choice.contains("function") || !tool_choice["function"].is_object() ||
        !tool_choice["function"].contains("name") || !tool_choice["function"]["name"].is_string()) {
      SetError(err, ErrorKind::kValidation, "tool_choice object requires function.name");
      return false;
    }
    choice.mode = NativeToolChoiceMode::kNamed;
    choice.name = tool_choice["function"]["name"].get<std::string>();
    bool declared = false;
    for (const auto& t : out->tools) {
      if (t.name == choice.name) {
        declared = true;
        break;
      }
    }
    if (!declared) {
      SetError(err, ErrorKind::kValidation, "tool_choice names undeclared tool: " + choice.name);
      return false;
    }
  } else {
    SetError(err, ErrorKind::kValidation, "tool_choice must be a string or an object");
    return false;
  }

  if ((choice.mode == NativeToolChoiceMode::kRequired) && out->tools.empty()) {
    SetError(err, ErrorKind::kValidation, "tool_choice \"required\" without tools");
    return false;
  }
  out->choice = std::move(choice);
  return true;
}

std::string ToOpenAiToolCallId(const std::string& native_id) {
  return std::string(kToolCallIdPrefix) + native_id;
}

std::vector<ToolCall> FromNative(const std::vector<NativeToolUse>& blocks, std::unordered_set<std::string>* used) {
  std::vector<ToolCall> out;
  out.reserve(blocks.size());
  std::unordered_set<std::string> local;
  auto& ids = used ? *used : local;
  for (const auto& b : blocks) {
    ToolCall c;
    c.id = ToOpenAiToolCallId(b.id);
    for (int n = 2; !ids.insert(c.id).second; n++) {
      c.id = ToOpenAiToolCallId(b.id) + "_" + std::to_string(n);
    }
    c.name = b.name;
    c.arguments_json = b.input.is_null() ? "{}" : b.input.dump();
    out.push_back(std::move(c));
  }
  return out;
}

std::vector<ToolSchema> FromNativeTools(const std::vector<NativeTool>& tools) {
  std::vector<ToolSchema> out;
  out.reserve(tools.size());
  for (const auto& t : tools) out.push_back({t.name, t.description, t.input_schema});
  return out;
}

std::optional<NativeToolUse> ParseNativeToolUse(const nlohmann::json& block) {
  if (!block.is_object()) return std::nullopt;
  if (!block.contains("type") || !block["type"].is_string() || block["type"].get<std::string>() != "tool_use") {
    return std::nullopt;
  }
  NativeToolUse u;
  if (block.contains("id") && block["id"].is_string()) u.id = block["id"].get<std::string>();
  if (block.contains("name") && block["name"].is_string()) u.name = block["name"].get<std::string>();
  if (block.contains("input")) u.input = block["input"];
  if (u.input.is_null()) u.input = nlohmann::json::object();
  if (u.id.empty() || u.name.empty()) return std::nullopt;
  return u;
}

nlohmann::json NativeToolsToJson(const std::vector<NativeTool>& tools) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& t : tools) {
    out.push_back({{"name", t.name}, {"description", t.description}, {"input_schema", t.input_schema}});
  }
  return out;
}

nlohmann::json NativeToolChoiceToJson(const NativeToolChoice& choice) {
  switch (choice.mode) {
    case NativeToolChoiceMode::kAllowed:
      return {{"type", "auto"}};
    case NativeToolChoiceMode::kDisabled:
      return {{"type", "none"}};
    case NativeToolChoiceMode::kRequired:
      return {{"type", "any"}};
    case NativeToolChoiceMode::kNamed:
      return {{"type", "tool"}, {"name", choice.name}};
  }
  return {{"type", "auto"}};
}

nlohmann::json BuildOpenAiToolCalls(const std::vector<ToolCall>& calls) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& c : calls) {
    out.push_back({{"id", c.id}, {"type", "function"}, {"function", {{"name", c.name}, {"arguments", c.arguments_json}}}});
  }
  return out;
}

}  // namespace bridge
