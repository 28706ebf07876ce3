#include "config.hpp"

#include <cstdlib>
#include <string>
#include <vector>

namespace bridge {
namespace {

static std::string GetEnvStr(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

static std::string ToLower(std::string s) {
  for (auto& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

static bool TryParseInt64(const std::string& s, int64_t* out) {
  if (s.empty() || !out) return false;
  char* end = nullptr;
  long long n = std::strtoll(s.c_str(), &end, 10);
  if (end == s.c_str() || *end != '\0') return false;
  *out = static_cast<int64_t>(n);
  return true;
}

static void ReadPositiveInt64(const char* name, int64_t* out) {
  int64_t v = 0;
  if (TryParseInt64(GetEnvStr(name), &v) && v > 0) *out = v;
}

static void ReadPositiveSize(const char* name, size_t* out) {
  int64_t v = 0;
  if (TryParseInt64(GetEnvStr(name), &v) && v > 0) *out = static_cast<size_t>(v);
}

static void ReadBool(const char* name, bool* out) {
  bool b = false;
  if (TryParseBool(GetEnvStr(name), &b)) *out = b;
}

}  // namespace

std::vector<std::string> SplitCsv(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == ',') {
      if (!cur.empty()) out.push_back(cur);
      cur.clear();
      continue;
    }
    cur.push_back(c);
  }
  if (!cur.empty()) out.push_back(cur);
  for (auto& v : out) {
    while (!v.empty() && (v.front() == ' ' || v.front() == '\t')) v.erase(v.begin());
    while (!v.empty() && (v.back() == ' ' || v.back() == '\t')) v.pop_back();
  }
  std::vector<std::string> filtered;
  for (auto& v : out) {
    if (!v.empty()) filtered.push_back(std::move(v));
  }
  return filtered;
}

bool TryParseBool(const std::string& s, bool* out) {
  if (!out) return false;
  const std::string v = ToLower(s);
  if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") {
    *out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") {
    *out = false;
    return true;
  }
  return false;
}

std::vector<std::string> DefaultDisallowedCliTools() {
  return {"Task",         "Bash",        "Glob",     "Grep",     "LS",        "ExitPlanMode",
          "Read",         "Edit",        "MultiEdit", "Write",   "NotebookRead", "NotebookEdit",
          "WebFetch",     "TodoRead",    "TodoWrite", "WebSearch"};
}

BridgeConfig LoadConfigFromEnv() {
  BridgeConfig cfg;
  cfg.cli.disallowed_tools = DefaultDisallowedCliTools();

  if (auto host = GetEnvStr("BRIDGE_LISTEN_HOST"); !host.empty()) cfg.listen.host = host;
  if (auto port = GetEnvStr("BRIDGE_LISTEN_PORT"); !port.empty()) {
    int64_t p = 0;
    if (TryParseInt64(port, &p) && p > 0 && p < 65536) cfg.listen.port = static_cast<int>(p);
  }
  if (auto mode = GetEnvStr("BRIDGE_API_PREFIX_MODE"); !mode.empty()) cfg.api_prefix_mode = ToLower(mode);
  if (auto model = GetEnvStr("BRIDGE_DEFAULT_MODEL"); !model.empty()) cfg.default_model = model;
  ReadBool("BRIDGE_STRICT_MODELS", &cfg.strict_models);
  ReadBool("BRIDGE_LOG_BODIES", &cfg.log_bodies);

  if (auto cli = GetEnvStr("BRIDGE_CLI_PATH"); !cli.empty()) cfg.cli.executable = cli;
  ReadPositiveInt64("BRIDGE_CLI_TIMEOUT_MS", &cfg.cli.timeout_ms);
  ReadPositiveInt64("BRIDGE_ESTABLISH_TIMEOUT_MS", &cfg.cli.establish_timeout_ms);
  ReadPositiveInt64("BRIDGE_KILL_GRACE_MS", &cfg.cli.kill_grace_ms);
  {
    int64_t turns = 0;
    if (TryParseInt64(GetEnvStr("BRIDGE_MAX_TURNS"), &turns) && turns > 0) cfg.cli.max_turns = static_cast<int>(turns);
  }
  ReadPositiveSize("BRIDGE_INLINE_PROMPT_MAX_BYTES", &cfg.cli.inline_prompt_max_bytes);
  if (auto dir = GetEnvStr("BRIDGE_TEMP_DIR"); !dir.empty()) cfg.cli.temp_dir = dir;
  if (const char* v = std::getenv("BRIDGE_DISALLOWED_TOOLS")) cfg.cli.disallowed_tools = SplitCsv(v);

  ReadBool("BRIDGE_SESSION_REUSE", &cfg.session.reuse_enabled);
  {
    int64_t v = 0;
    if (TryParseInt64(GetEnvStr("BRIDGE_SESSION_MIN_SYSTEM_BYTES"), &v) && v >= 0) {
      cfg.session.min_system_bytes = static_cast<size_t>(v);
    }
  }
  ReadPositiveInt64("BRIDGE_SESSION_TTL_S", &cfg.session.ttl_seconds);
  ReadPositiveSize("BRIDGE_SESSION_CAPACITY", &cfg.session.capacity);
  ReadPositiveInt64("BRIDGE_SESSION_SWEEP_S", &cfg.session.sweep_interval_seconds);

  return cfg;
}

}  // namespace bridge
