#include "openai_router.hpp"

#include "chat_request.hpp"

#include <nlohmann/json.hpp>

#include <cstring>
#include <exception>
#include <functional>
#include <iostream>
#include <memory>
#include <utility>

namespace bridge {
namespace {

constexpr size_t kLogBodyMaxChars = 4000;

static std::string ToLowerAscii(std::string s) {
  for (auto& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

static void SendJson(httplib::Response* res, int status, const nlohmann::json& body) {
  res->status = status;
  res->set_header("Content-Type", "application/json");
  res->set_content(DumpJson(body), "application/json");
}

static nlohmann::json ParseJsonBody(const httplib::Request& req) {
  return nlohmann::json::parse(req.body, nullptr, false);
}

static std::string RedactHeaderValue(const std::string& key, const std::string& value) {
  const auto k = ToLowerAscii(key);
  if (k == "authorization" || k == "proxy-authorization" || k == "api-key" || k == "api_key" || k == "x-api-key") {
    return "<redacted>";
  }
  return value;
}

static std::string SanitizeBodyForLog(const std::string& body) {
  if (body.empty()) return {};
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded()) return body;
  if (j.is_object()) {
    for (const auto& key : {"api_key", "api-key", "authorization", "apiKey"}) {
      if (j.contains(key)) j.erase(key);
    }
  }
  return DumpJson(j);
}

static std::string TruncateForLog(std::string s, size_t max_chars) {
  if (max_chars == 0) return {};
  if (s.size() <= max_chars) return s;
  constexpr const char* kSuffix = "...(truncated)";
  if (max_chars <= std::strlen(kSuffix)) return std::string(kSuffix).substr(0, max_chars);
  s.resize(max_chars - std::strlen(kSuffix));
  s += kSuffix;
  return s;
}

static void LogRequestRaw(const httplib::Request& req, bool log_body) {
  std::cout << "[request] " << req.method << " " << req.path << "\n";
  for (const auto& it : req.headers) {
    std::cout << "  " << it.first << ": " << RedactHeaderValue(it.first, it.second) << "\n";
  }
  if (log_body && !req.body.empty()) {
    std::cout << "  body: " << TruncateForLog(SanitizeBodyForLog(req.body), kLogBodyMaxChars) << "\n";
  }
}

// Installs a connection liveness check on the token for one scope; the check captures
// request-local state, so it must not outlive the handler or provider call.
class ScopedLivenessCheck {
 public:
  ScopedLivenessCheck(CancelToken* token, std::function<bool()> alive) : token_(token) {
    token_->SetLivenessCheck(std::move(alive));
  }
  ~ScopedLivenessCheck() { token_->SetLivenessCheck(nullptr); }

  ScopedLivenessCheck(const ScopedLivenessCheck&) = delete;
  ScopedLivenessCheck& operator=(const ScopedLivenessCheck&) = delete;

 private:
  CancelToken* token_;
};

static void SetStreamHeaders(httplib::Response* res) {
  res->status = 200;
  res->set_header("Content-Type", "text/event-stream");
  res->set_header("Cache-Control", "no-cache");
  res->set_header("Connection", "close");
  res->set_header("X-Accel-Buffering", "no");
}

}  // namespace

std::string NormalizePrefix(std::string p) {
  if (p.empty()) return {};
  if (p == "/") return {};
  if (p.back() == '/') p.pop_back();
  if (p.empty()) return {};
  if (p.front() != '/') p.insert(p.begin(), '/');
  return p;
}

std::vector<std::string> GetApiPrefixes(const std::string& raw_mode) {
  std::string mode = ToLowerAscii(raw_mode);
  if (mode.empty()) mode = "auto";

  if (mode == "v1" || mode == "none" || mode == "off") {
    return {""};
  }
  if (mode == "api") {
    return {"/api"};
  }
  return {"", "/api"};
}

OpenAiRouter::OpenAiRouter(TranslationEngine* engine, const ModelRegistry* models, BridgeConfig cfg)
    : engine_(engine), models_(models), cfg_(std::move(cfg)) {}

void OpenAiRouter::HandleChatCompletions(const httplib::Request& req, httplib::Response& res) {
  LogRequestRaw(req, cfg_.log_bodies);
  const auto body = ParseJsonBody(req);
  if (body.is_discarded()) {
    SendJson(&res, 400, MakeErrorBody("invalid json body", "invalid_request_error"));
    return;
  }

  EngineError err;
  auto parsed = ParseChatRequest(body, &err);
  if (!parsed) {
    SendJson(&res, HttpStatusForError(err.kind), MakeErrorBody(err));
    return;
  }
  auto model = models_->Resolve(parsed->model, cfg_.default_model, cfg_.strict_models, &err);
  if (!model) {
    SendJson(&res, 400, MakeErrorBody(err.message, "invalid_request_error", "model_not_found"));
    return;
  }
  parsed->model = *model;

  auto cancel = std::make_shared<CancelToken>();
  EngineResponse out;
  {
    ScopedLivenessCheck alive(cancel.get(), [&req] { return !req.is_connection_closed(); });
    out = engine_->Handle(*parsed, cancel);
  }
  res.set_header("x-request-id", out.meta.id);

  if (out.error) {
    std::cout << "[chat] request_id=" << out.meta.id << " status=" << HttpStatusForError(out.error.kind)
              << " error=" << ErrorKindName(out.error.kind) << "\n";
    SendJson(&res, HttpStatusForError(out.error.kind), MakeErrorBody(out.error));
    return;
  }

  if (!parsed->stream) {
    const auto& completion = *out.completion;
    std::cout << "[chat] request_id=" << out.meta.id << " stream=0 model=" << out.meta.model
              << " mode=" << InvocationModeName(out.mode)
              << " finish_reason=" << completion["choices"][0]["finish_reason"].dump() << "\n";
    SendJson(&res, 200, completion);
    return;
  }

  std::shared_ptr<ChunkStream> stream = std::move(out.stream);
  const std::string request_id = out.meta.id;
  std::cout << "[chat] request_id=" << request_id << " stream=1 model=" << out.meta.model
            << " mode=" << InvocationModeName(out.mode) << "\n";
  SetStreamHeaders(&res);
  res.set_chunked_content_provider(
      "text/event-stream",
      [stream, cancel, request_id](size_t, httplib::DataSink& sink) {
        ScopedLivenessCheck alive(cancel.get(), [&sink] { return sink.is_writable(); });
        auto write_bytes = [&](const std::string& s) -> bool {
          if (!sink.is_writable()) return false;
          return sink.write(s.data(), s.size());
        };
        try {
          std::string frame;
          size_t frames = 0;
          while (stream->NextFrame(&frame)) {
            if (!write_bytes(frame)) {
              std::cout << "[chat] request_id=" << request_id << " client disconnected after frames=" << frames
                        << "\n";
              cancel->Cancel();
              stream->Cancel();
              sink.done();
              return false;
            }
            frames++;
          }
          std::cout << "[chat] request_id=" << request_id << " stream done frames=" << frames
                    << " finish_reason=" << stream->accumulated().finish_reason() << "\n";
        } catch (const std::exception& e) {
          std::cout << "[chat] request_id=" << request_id << " stream aborted: " << e.what() << "\n";
          cancel->Cancel();
          stream->Cancel();
          if (write_bytes(SseData(MakeErrorBody(e.what(), "server_error")))) write_bytes(SseDone());
        }
        sink.done();
        return false;
      },
      [cancel](bool success) {
        if (!success) cancel->Cancel();
      });
}

void OpenAiRouter::HandleListModels(const httplib::Request& req, httplib::Response& res) {
  LogRequestRaw(req, false);
  SendJson(&res, 200, ModelListToJson(models_->Models()));
}

void OpenAiRouter::HandleGetModel(const httplib::Request& req, httplib::Response& res) {
  LogRequestRaw(req, false);
  const std::string id = req.matches.size() > 1 ? req.matches[1].str() : std::string();
  const auto* m = models_->Find(id);
  if (!m) {
    SendJson(&res, 404, MakeErrorBody("model '" + id + "' not found", "invalid_request_error", "model_not_found"));
    return;
  }
  SendJson(&res, 200, ModelToJson(*m));
}

void OpenAiRouter::Register(httplib::Server* server) {
  auto chat_completions_handler = [this](const httplib::Request& req, httplib::Response& res) {
    HandleChatCompletions(req, res);
  };
  auto models_handler = [this](const httplib::Request& req, httplib::Response& res) { HandleListModels(req, res); };
  auto model_handler = [this](const httplib::Request& req, httplib::Response& res) { HandleGetModel(req, res); };

  for (const auto& raw_prefix : GetApiPrefixes(cfg_.api_prefix_mode)) {
    const auto prefix = NormalizePrefix(raw_prefix);
    server->Get(prefix + "/v1/models", models_handler);
    server->Get(prefix + R"(/v1/models/([^/]+))", model_handler);
    server->Post(prefix + "/v1/chat/completions", chat_completions_handler);
    std::cout << "[http] routes registered prefix=" << (prefix.empty() ? "/" : prefix) << "\n";
  }
}

}  // namespace bridge
