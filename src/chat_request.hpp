#pragma once

#include "conversation.hpp"
#include "errors.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace bridge {

// Flattens OpenAI message content (string, content-part array, or part object) to plain text.
// Non-text parts are dropped.
std::string ExtractMessageContent(const nlohmann::json& content);

// Reads a /v1/chat/completions body. "developer" messages are treated as system messages.
std::optional<ChatRequest> ParseChatRequest(const nlohmann::json& body, EngineError* err);

}  // namespace bridge
