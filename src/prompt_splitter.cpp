#include "prompt_splitter.hpp"

#include <openssl/sha.h>

#include <iomanip>
#include <sstream>

namespace bridge {

std::string SystemPromptKey(const std::string& system_content) {
  unsigned char hash_bytes[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(system_content.data()), system_content.size(), hash_bytes);
  std::ostringstream oss;
  for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash_bytes[i]);
  }
  return oss.str();
}

SplitPrompt SplitSystemPrompt(const std::vector<ChatMessage>& messages) {
  SplitPrompt out;
  bool has_system = false;
  for (const auto& m : messages) {
    if (m.role != "system") continue;
    if (has_system) out.system_content += kSystemContentSeparator;
    out.system_content += m.content;
    has_system = true;
  }

  if (!has_system || out.system_content.empty()) {
    out.system_content.clear();
    out.remaining = messages;
    out.key = kNoSessionKey;
    return out;
  }

  out.remaining.reserve(messages.size());
  for (const auto& m : messages) {
    if (m.role != "system") out.remaining.push_back(m);
  }
  out.key = SystemPromptKey(out.system_content);
  return out;
}

}  // namespace bridge
