#pragma once

#include "config.hpp"
#include "model_registry.hpp"
#include "translation_engine.hpp"

#include <httplib.h>

#include <string>
#include <vector>

namespace bridge {

class OpenAiRouter {
 public:
  OpenAiRouter(TranslationEngine* engine, const ModelRegistry* models, BridgeConfig cfg);
  void Register(httplib::Server* server);

 private:
  void HandleChatCompletions(const httplib::Request& req, httplib::Response& res);
  void HandleListModels(const httplib::Request& req, httplib::Response& res);
  void HandleGetModel(const httplib::Request& req, httplib::Response& res);

  TranslationEngine* engine_;
  const ModelRegistry* models_;
  BridgeConfig cfg_;
};

std::string NormalizePrefix(std::string p);

// "auto" (default) serves both /v1 and /api/v1; "v1", "none" or "off" only /v1; "api" only /api/v1.
std::vector<std::string> GetApiPrefixes(const std::string& mode);

}  // namespace bridge
