#include "model_registry.hpp"

#include <algorithm>
#include <utility>

namespace bridge {
namespace {

constexpr size_t kMaxSuggestions = 3;
constexpr const char* kFallbackSuggestion = "claude-3-5-sonnet-20241022";

static std::string ToLower(std::string s) {
  for (auto& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

static std::vector<ModelInfo> BuiltinModels() {
  return {
      {"claude-sonnet-4-20250514", "anthropic", 1715702400, 200000,
       "Claude Sonnet 4 - Powerful reasoning and analysis capabilities", {"claude-sonnet-4", "sonnet-4"}},
      {"claude-opus-4-20250514", "anthropic", 1715702400, 200000,
       "Claude Opus 4 - Most capable model for complex reasoning", {"claude-opus-4", "opus-4"}},
      {"claude-3-7-sonnet-20250219", "anthropic", 1708905600, 200000,
       "Claude 3.7 Sonnet - Advanced reasoning with improved capabilities", {"claude-3-7-sonnet", "sonnet-3-7"}},
      {"claude-3-5-sonnet-20241022", "anthropic", 1729641600, 200000,
       "Claude 3.5 Sonnet - Balanced performance and capabilities", {"claude-3-5-sonnet", "sonnet-3-5"}},
      {"claude-3-5-haiku-20241022", "anthropic", 1729641600, 200000,
       "Claude 3.5 Haiku - Fast and efficient for common tasks", {"claude-3-5-haiku", "haiku-3-5"}},
  };
}

}  // namespace

size_t LevenshteinDistance(const std::string& a, const std::string& b) {
  std::vector<size_t> prev(b.size() + 1), cur(b.size() + 1);
  for (size_t j = 0; j <= b.size(); j++) prev[j] = j;
  for (size_t i = 1; i <= a.size(); i++) {
    cur[0] = i;
    for (size_t j = 1; j <= b.size(); j++) {
      const size_t subst = prev[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
      cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, subst});
    }
    std::swap(prev, cur);
  }
  return prev[b.size()];
}

ModelRegistry::ModelRegistry() : models_(BuiltinModels()) {}

ModelRegistry::ModelRegistry(std::vector<ModelInfo> models) : models_(std::move(models)) {}

const ModelInfo* ModelRegistry::Find(const std::string& id_or_alias) const {
  const auto want = ToLower(id_or_alias);
  for (const auto& m : models_) {
    if (ToLower(m.id) == want) return &m;
    for (const auto& a : m.aliases) {
      if (ToLower(a) == want) return &m;
    }
  }
  return nullptr;
}

std::vector<ModelSuggestion> ModelRegistry::Suggest(const std::string& requested) const {
  const auto lower = ToLower(requested);
  std::vector<ModelSuggestion> out;
  for (const auto& m : models_) {
    const size_t distance = LevenshteinDistance(lower, m.id);
    const size_t max_distance = std::max<size_t>(3, m.id.size() * 3 / 10);
    if (distance > max_distance) continue;
    ModelSuggestion s;
    s.model = m.id;
    s.reason = "similar to \"" + requested + "\" (" + std::to_string(distance) + " character differences)";
    s.confidence = std::max(0.1, 1.0 - static_cast<double>(distance) / static_cast<double>(m.id.size()));
    out.push_back(std::move(s));
  }
  auto add_fallback = [&out](const char* reason, double confidence) {
    for (auto& s : out) {
      if (s.model != kFallbackSuggestion) continue;
      s.confidence = std::max(s.confidence, confidence);
      return;
    }
    out.push_back({kFallbackSuggestion, reason, confidence});
  };
  if (lower.find("gpt") != std::string::npos || lower.find("openai") != std::string::npos) {
    add_fallback("OpenAI models are not served here; Claude 3.5 Sonnet is the closest fit", 0.8);
  }
  if (lower.find("claude-2") != std::string::npos || lower.find("claude-1") != std::string::npos) {
    add_fallback("older Claude models are not supported", 0.9);
  }
  std::stable_sort(out.begin(), out.end(),
                   [](const ModelSuggestion& a, const ModelSuggestion& b) { return a.confidence > b.confidence; });
  if (out.size() > kMaxSuggestions) out.resize(kMaxSuggestions);
  return out;
}

std::optional<std::string> ModelRegistry::Resolve(const std::string& requested,
                                                  const std::string& default_model,
                                                  bool strict,
                                                  EngineError* err) const {
  if (requested.empty()) return default_model;
  if (const auto* m = Find(requested)) return m->id;
  if (!strict) return requested;

  std::string msg = "model '" + requested + "' is not supported";
  const auto suggestions = Suggest(requested);
  if (!suggestions.empty()) {
    msg += "; did you mean: ";
    for (size_t i = 0; i < suggestions.size(); i++) {
      if (i) msg += ", ";
      msg += suggestions[i].model;
    }
  }
  SetError(err, ErrorKind::kValidation, msg);
  return std::nullopt;
}

nlohmann::json ModelToJson(const ModelInfo& m) {
  return {{"id", m.id}, {"object", "model"}, {"created", m.created}, {"owned_by", m.owned_by}};
}

nlohmann::json ModelListToJson(const std::vector<ModelInfo>& models) {
  nlohmann::json data = nlohmann::json::array();
  for (const auto& m : models) data.push_back(ModelToJson(m));
  return {{"object", "list"}, {"data", data}};
}

}  // namespace bridge
