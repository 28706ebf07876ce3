#pragma once

#include "errors.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bridge {

struct ModelInfo {
  std::string id;
  std::string owned_by = "anthropic";
  int64_t created = 0;
  int64_t context_window = 0;
  std::string description;
  std::vector<std::string> aliases;
};

struct ModelSuggestion {
  std::string model;
  std::string reason;
  double confidence = 0.0;
};

class ModelRegistry {
 public:
  ModelRegistry();
  explicit ModelRegistry(std::vector<ModelInfo> models);

  const std::vector<ModelInfo>& Models() const { return models_; }

  // Canonical id for an id or alias (case-insensitive); nullptr when unknown.
  const ModelInfo* Find(const std::string& id_or_alias) const;

  // At most three close matches, best first.
  std::vector<ModelSuggestion> Suggest(const std::string& requested) const;

  // Empty requests get default_model. Unknown models are a validation error in strict mode and are
  // passed through unchanged otherwise.
  std::optional<std::string> Resolve(const std::string& requested,
                                     const std::string& default_model,
                                     bool strict,
                                     EngineError* err) const;

 private:
  std::vector<ModelInfo> models_;
};

size_t LevenshteinDistance(const std::string& a, const std::string& b);

nlohmann::json ModelToJson(const ModelInfo& m);
nlohmann::json ModelListToJson(const std::vector<ModelInfo>& models);

}  // namespace bridge
