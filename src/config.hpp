#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace bridge {

struct HttpListenConfig {
  std::string host = "0.0.0.0";
  int port = 8000;
};

struct CliConfig {
  std::string executable = "claude";
  int max_turns = 1;
  std::vector<std::string> disallowed_tools;
  int64_t timeout_ms = 600000;
  int64_t establish_timeout_ms = 120000;
  int64_t kill_grace_ms = 2000;
  size_t inline_prompt_max_bytes = 64 * 1024;
  std::string temp_dir;
};

struct SessionConfig {
  bool reuse_enabled = true;
  size_t min_system_bytes = 0;
  int64_t ttl_seconds = 3600;
  size_t capacity = 256;
  int64_t sweep_interval_seconds = 60;
};

struct BridgeConfig {
  HttpListenConfig listen;
  std::string api_prefix_mode = "auto";
  std::string default_model = "claude-sonnet-4-20250514";
  bool strict_models = true;
  bool log_bodies = false;
  CliConfig cli;
  SessionConfig session;
};

// Tools the CLI would otherwise run on its own; disabled so the CLI behaves as a plain chat model.
std::vector<std::string> DefaultDisallowedCliTools();

BridgeConfig LoadConfigFromEnv();

std::vector<std::string> SplitCsv(const std::string& s);
bool TryParseBool(const std::string& s, bool* out);

}  // namespace bridge
