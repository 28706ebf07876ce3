#pragma once

#include "conversation.hpp"

#include <string>
#include <vector>

namespace bridge {

// Empty key: the conversation carries no system content and cannot be tied to a native session.
inline const std::string kNoSessionKey;

inline constexpr const char* kSystemContentSeparator = "\n\n";

struct SplitPrompt {
  std::string system_content;
  std::vector<ChatMessage> remaining;
  std::string key;
};

// System-role messages are joined in order with kSystemContentSeparator, byte for byte, and the
// key is the lowercase hex SHA-256 of that text. No whitespace or case normalization is applied.
SplitPrompt SplitSystemPrompt(const std::vector<ChatMessage>& messages);

std::string SystemPromptKey(const std::string& system_content);

}  // namespace bridge
