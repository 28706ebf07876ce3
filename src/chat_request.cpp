#include "chat_request.hpp"

#include "tool_converter.hpp"

#include <utility>

namespace bridge {
namespace {

static bool IsTextPart(const nlohmann::json& part) {
  if (!part.contains("type") || !part["type"].is_string()) return true;
  const auto type = part["type"].get<std::string>();
  return type == "text" || type == "input_text";
}

static std::string PartText(const nlohmann::json& part) {
  if (part.contains("text") && part["text"].is_string()) return part["text"].get<std::string>();
  if (part.contains("content") && part["content"].is_string()) return part["content"].get<std::string>();
  return {};
}

static bool ParseToolCalls(const nlohmann::json& arr, size_t msg_index, std::vector<ToolCall>* out, EngineError* err) {
  const auto where = "messages[" + std::to_string(msg_index) + "].tool_calls";
  if (!arr.is_array()) {
    SetError(err, ErrorKind::kValidation, where + " must be an array");
    return false;
  }
  for (const auto& tc : arr) {
    if (!tc.is_object() || !tc.contains("function") || !tc["function"].is_object()) {
      SetError(err, ErrorKind::kValidation, where + ": each entry needs a function object");
      return false;
    }
    const auto& fn = tc["function"];
    ToolCall c;
    if (tc.contains("id") && tc["id"].is_string()) c.id = tc["id"].get<std::string>();
    if (fn.contains("name") && fn["name"].is_string()) c.name = fn["name"].get<std::string>();
    if (fn.contains("arguments")) {
      if (fn["arguments"].is_string()) {
        c.arguments_json = fn["arguments"].get<std::string>();
      } else if (!fn["arguments"].is_null()) {
        c.arguments_json = fn["arguments"].dump();
      }
    }
    if (c.name.empty()) {
      SetError(err, ErrorKind::kValidation, where + ": function.name is required");
      return false;
    }
    if (c.arguments_json.empty()) c.arguments_json = "{}";
    out->push_back(std::move(c));
  }
  return true;
}

}  // namespace

std::string ExtractMessageContent(const nlohmann::json& content) {
  if (content.is_string()) return content.get<std::string>();
  if (content.is_object()) {
    if (content.contains("parts")) return ExtractMessageContent(content["parts"]);
    return IsTextPart(content) ? PartText(content) : std::string();
  }
  if (!content.is_array()) return {};
  std::string out;
  for (const auto& part : content) {
    if (part.is_string()) {
      out += part.get<std::string>();
      continue;
    }
    if (!part.is_object() || !IsTextPart(part)) continue;
    out += PartText(part);
  }
  return out;
}

std::optional<ChatRequest> ParseChatRequest(const nlohmann::json& body, EngineError* err) {
  if (!body.is_object()) {
    SetError(err, ErrorKind::kValidation, "invalid json body");
    return std::nullopt;
  }
  ChatRequest req;
  if (body.contains("model")) {
    if (!body["model"].is_string()) {
      SetError(err, ErrorKind::kValidation, "model must be a string");
      return std::nullopt;
    }
    req.model = body["model"].get<std::string>();
  }
  if (!body.contains("messages") || !body["messages"].is_array() || body["messages"].empty()) {
    SetError(err, ErrorKind::kValidation, "missing field: messages");
    return std::nullopt;
  }

  const auto& messages = body["messages"];
  for (size_t i = 0; i < messages.size(); i++) {
    const auto& m = messages[i];
    if (!m.is_object() || !m.contains("role") || !m["role"].is_string()) {
      SetError(err, ErrorKind::kValidation, "messages[" + std::to_string(i) + "]: role is required");
      return std::nullopt;
    }
    ChatMessage cm;
    cm.role = m["role"].get<std::string>();
    if (cm.role == "developer") cm.role = "system";
    if (m.contains("content")) cm.content = ExtractMessageContent(m["content"]);
    if (m.contains("tool_calls") && !m["tool_calls"].is_null()) {
      if (!ParseToolCalls(m["tool_calls"], i, &cm.tool_calls, err)) return std::nullopt;
    }
    if (m.contains("tool_call_id") && m["tool_call_id"].is_string()) {
      cm.tool_call_id = m["tool_call_id"].get<std::string>();
    }
    req.messages.push_back(std::move(cm));
  }

  if (body.contains("tools")) {
    auto tools = ParseOpenAiTools(body["tools"], err);
    if (!tools) return std::nullopt;
    req.tools = std::move(*tools);
  }
  if (body.contains("tool_choice")) req.tool_choice = body["tool_choice"];
  if (body.contains("stream")) {
    if (!body["stream"].is_boolean() && !body["stream"].is_null()) {
      SetError(err, ErrorKind::kValidation, "stream must be a boolean");
      return std::nullopt;
    }
    req.stream = body["stream"].is_boolean() && body["stream"].get<bool>();
  }
  return req;
}

}  // namespace bridge
