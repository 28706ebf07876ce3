#include "command_builder.hpp"
#include "config.hpp"
#include "model_registry.hpp"
#include "openai_router.hpp"
#include "posix_process_runner.hpp"
#include "session_cache.hpp"
#include "translation_engine.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

namespace {

static nlohmann::json SessionStatsToJson(const bridge::SessionCacheStats& s) {
  return {{"size", s.size},
          {"capacity", s.capacity},
          {"in_flight", s.in_flight},
          {"hits", s.hits},
          {"misses", s.misses},
          {"establishments", s.establishments},
          {"establish_failures", s.establish_failures},
          {"evictions", s.evictions}};
}

static void LogConfig(const bridge::BridgeConfig& cfg) {
  std::cout << "[config] cli=" << cfg.cli.executable << " default_model=" << cfg.default_model
            << " strict_models=" << (cfg.strict_models ? 1 : 0) << " api_prefix_mode=" << cfg.api_prefix_mode
            << " timeout_ms=" << cfg.cli.timeout_ms << " establish_timeout_ms=" << cfg.cli.establish_timeout_ms
            << "\n";
  std::cout << "[config] session_reuse=" << (cfg.session.reuse_enabled ? 1 : 0)
            << " min_system_bytes=" << cfg.session.min_system_bytes << " ttl_s=" << cfg.session.ttl_seconds
            << " capacity=" << cfg.session.capacity << " disallowed_tools=" << cfg.cli.disallowed_tools.size()
            << "\n";
}

}  // namespace

int main() {
  std::cout.setf(std::ios::unitbuf);
  auto cfg = bridge::LoadConfigFromEnv();
  LogConfig(cfg);

  auto sessions = bridge::MakeSessionCache(cfg.session);
  bridge::SessionSweeper sweeper(sessions.get(), std::chrono::seconds(cfg.session.sweep_interval_seconds));
  bridge::PosixProcessRunner runner;
  bridge::TranslationEngine engine(bridge::CommandBuilder(cfg.cli), &runner, sessions.get(), cfg.session);
  bridge::ModelRegistry models;
  bridge::OpenAiRouter router(&engine, &models, cfg);

  httplib::Server server;
  router.Register(&server);

  server.set_exception_handler([](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
    std::string message = "unknown exception";
    if (ep) {
      try {
        std::rethrow_exception(ep);
      } catch (const std::exception& e) {
        message = e.what();
      } catch (...) {
        message = "non-standard exception";
      }
    }
    std::cout << "[http] handler exception: " << message << "\n";
    res.status = 500;
    res.set_content(bridge::DumpJson(bridge::MakeErrorBody(message, "server_error")), "application/json");
  });

  server.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (!res.body.empty()) return;
    std::string message;
    std::string type = "invalid_request_error";
    if (res.status == 404) {
      message = "not found";
    } else if (res.status >= 500) {
      message = "internal error";
      type = "api_error";
    } else {
      message = "bad request";
    }
    res.set_content(bridge::DumpJson(bridge::MakeErrorBody(message, type)), "application/json");
  });

  server.set_keep_alive_timeout(5);
  server.set_read_timeout(60);
  server.set_write_timeout(60);

  server.Get("/health", [&](const httplib::Request&, httplib::Response& res) {
    nlohmann::json j;
    j["ok"] = true;
    j["unix_seconds"] =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    j["session_cache"] = SessionStatsToJson(sessions->Stats());
    res.status = 200;
    res.set_content(bridge::DumpJson(j), "application/json");
  });

  std::cout << "[http] listen host=" << cfg.listen.host << " port=" << cfg.listen.port << "\n";
  const bool ok = server.listen(cfg.listen.host, cfg.listen.port);
  std::cout << "[http] listen returned ok=" << (ok ? 1 : 0) << "\n";
  return ok ? 0 : 1;
}
