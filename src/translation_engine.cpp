#include "translation_engine.hpp"

#include "output_parser.hpp"
#include "prompt_splitter.hpp"
#include "tool_converter.hpp"

#include <iostream>
#include <utility>
#include <vector>

namespace bridge {
namespace {

// Replays events read ahead while checking a resumed session, then continues with the source.
class ReplayEventSource : public IEventSource {
 public:
  ReplayEventSource(std::vector<StreamEvent> head, std::unique_ptr<IEventSource> rest)
      : head_(std::move(head)), rest_(std::move(rest)) {}

  bool Next(StreamEvent* ev) override {
    if (pos_ < head_.size()) {
      *ev = std::move(head_[pos_++]);
      return true;
    }
    return rest_->Next(ev);
  }

  void Cancel() override { rest_->Cancel(); }

 private:
  std::vector<StreamEvent> head_;
  size_t pos_ = 0;
  std::unique_ptr<IEventSource> rest_;
};

// The request accepts no tool calls: tool-use events are dropped and the finish reason follows.
class ToolFilteringSource : public IEventSource {
 public:
  explicit ToolFilteringSource(std::unique_ptr<IEventSource> inner) : inner_(std::move(inner)) {}

  bool Next(StreamEvent* ev) override {
    while (inner_->Next(ev)) {
      switch (ev->type) {
        case StreamEventType::kToolUseStart:
          std::cout << "[engine] dropped " << StreamEventTypeName(ev->type) << " name=" << ev->tool_name
                    << " (tools not enabled for request)\n";
          continue;
        case StreamEventType::kToolUseDelta:
        case StreamEventType::kToolUseEnd:
          continue;
        case StreamEventType::kCompleted:
          if (ev->finish_reason == "tool_calls") ev->finish_reason = "stop";
          return true;
        default:
          return true;
      }
    }
    return false;
  }

  void Cancel() override { inner_->Cancel(); }

 private:
  std::unique_ptr<IEventSource> inner_;
};

class StateLog {
 public:
  explicit StateLog(std::string request_id) : request_id_(std::move(request_id)) {}

  void To(EngineState s) {
    std::cout << "[engine] request_id=" << request_id_ << " state=" << EngineStateName(s) << "\n";
  }

 private:
  std::string request_id_;
};

static bool IsContentEvent(const StreamEvent& ev) {
  return ev.type == StreamEventType::kTextDelta || ev.type == StreamEventType::kToolUseStart ||
         ev.type == StreamEventType::kToolUseDelta;
}

static bool IsKnownRole(const std::string& role) {
  return role == "system" || role == "user" || role == "assistant" || role == "tool";
}

static std::string ShortKey(const std::string& key) {
  return key.empty() ? std::string("-") : key.substr(0, 12);
}

}  // namespace

const char* EngineStateName(EngineState s) {
  switch (s) {
    case EngineState::kIdle:
      return "idle";
    case EngineState::kSplitting:
      return "splitting";
    case EngineState::kResolvingSession:
      return "resolving_session";
    case EngineState::kInvoking:
      return "invoking";
    case EngineState::kParsing:
      return "parsing";
    case EngineState::kAssembling:
      return "assembling";
    case EngineState::kDone:
      return "done";
    case EngineState::kFailed:
      return "failed";
  }
  return "unknown";
}

TranslationEngine::TranslationEngine(CommandBuilder builder,
                                     IProcessRunner* runner,
                                     ISessionCache* sessions,
                                     SessionConfig session_cfg)
    : builder_(std::move(builder)), runner_(runner), sessions_(sessions), session_cfg_(std::move(session_cfg)) {}

std::unique_ptr<IEventSource> TranslationEngine::Invoke(const InvocationPlan& plan,
                                                        const std::shared_ptr<CancelToken>& cancel,
                                                        EngineError* err) {
  auto output = runner_->Run(plan, cancel, err);
  if (!output) return nullptr;
  return std::make_unique<ParsedEventStream>(std::move(output), plan.streaming);
}

std::optional<std::string> TranslationEngine::Establish(const std::string& system_content,
                                                        const std::string& model,
                                                        const std::shared_ptr<CancelToken>& cancel,
                                                        EngineError* err) {
  const auto plan = builder_.BuildEstablish(system_content, model);
  EngineError run_err;
  auto events = Invoke(plan, cancel, &run_err);
  if (!events) {
    SetError(err, ErrorKind::kSessionEstablishment, "establish: " + run_err.message);
    return std::nullopt;
  }

  std::string native_id;
  EngineError failure;
  StreamEvent ev;
  while (events->Next(&ev)) {
    if (ev.type == StreamEventType::kSessionEstablished && native_id.empty()) native_id = ev.session_id;
    if (ev.type == StreamEventType::kFailed) failure = ev.error;
  }
  if (failure) {
    SetError(err, ErrorKind::kSessionEstablishment, "establish: " + failure.message);
    return std::nullopt;
  }
  if (native_id.empty()) {
    SetError(err, ErrorKind::kSessionEstablishment, "establish: cli reported no session id");
    return std::nullopt;
  }
  std::cout << "[engine] session established native_session_id=" << native_id
            << " system_bytes=" << system_content.size() << "\n";
  return native_id;
}

EngineResponse TranslationEngine::Handle(const ChatRequest& req, std::shared_ptr<CancelToken> cancel) {
  EngineResponse resp;
  resp.meta = NewCompletionMeta(req.model);
  StateLog st(resp.meta.id);

  auto fail = [&](const EngineError& err) {
    resp.error = err;
    st.To(EngineState::kFailed);
    std::cout << "[engine] request_id=" << resp.meta.id << " error kind=" << ErrorKindName(err.kind)
              << " message=" << err.message << "\n";
  };

  st.To(EngineState::kSplitting);
  bool has_turn = false;
  for (const auto& m : req.messages) {
    if (!IsKnownRole(m.role)) {
      fail(EngineError{ErrorKind::kValidation, "unsupported message role: " + m.role});
      return resp;
    }
    if (m.role != "system") has_turn = true;
  }
  if (!has_turn) {
    fail(EngineError{ErrorKind::kValidation, "messages must include at least one non-system message"});
    return resp;
  }

  EngineError err;
  NativeToolset toolset;
  if (!ToNative(req.tools, req.tool_choice, &toolset, &err)) {
    fail(err);
    return resp;
  }
  const auto split = SplitSystemPrompt(req.messages);

  st.To(EngineState::kResolvingSession);
  SessionDecision decision;
  const char* reason = "session";
  if (split.key.empty()) {
    reason = "no_system_content";
  } else if (!session_cfg_.reuse_enabled) {
    reason = "reuse_disabled";
  } else if (split.system_content.size() < session_cfg_.min_system_bytes) {
    reason = "below_threshold";
  } else {
    EngineError est_err;
    auto native_id = sessions_->EstablishOrReuse(
        split.key,
        [&](EngineError* e) { return Establish(split.system_content, req.model, cancel, e); },
        &est_err);
    if (native_id) {
      decision.mode = InvocationMode::kResumeSession;
      decision.native_session_id = *native_id;
    } else {
      reason = "establish_failed";
      std::cout << "[engine] request_id=" << resp.meta.id << " degrade=single_shot key=" << ShortKey(split.key)
                << " cause=" << est_err.message << "\n";
      if (cancel && cancel->IsCancelled()) {
        fail(EngineError{ErrorKind::kCancelled, "request cancelled"});
        return resp;
      }
    }
  }
  resp.mode = decision.mode;
  std::cout << "[engine] request_id=" << resp.meta.id << " mode=" << InvocationModeName(decision.mode)
            << " reason=" << reason << " key=" << ShortKey(split.key) << " tools=" << toolset.tools.size()
            << " stream=" << (req.stream ? "true" : "false") << "\n";

  st.To(EngineState::kInvoking);
  auto plan = builder_.Build(split.remaining, split.system_content, decision, toolset, req.model, req.stream);
  auto events = Invoke(plan, cancel, &err);
  if (!events) {
    fail(err);
    return resp;
  }

  if (decision.mode == InvocationMode::kResumeSession) {
    // Read up to the first content or terminal event to find out whether the session still resumes.
    std::vector<StreamEvent> head;
    StreamEvent ev;
    while (events->Next(&ev)) {
      const bool stop = IsContentEvent(ev) || ev.IsTerminal();
      head.push_back(std::move(ev));
      if (stop) break;
    }
    const bool resume_failed = !head.empty() && head.back().type == StreamEventType::kFailed &&
                               head.back().error.kind != ErrorKind::kTimeout &&
                               head.back().error.kind != ErrorKind::kCancelled;
    if (resume_failed) {
      std::cout << "[engine] request_id=" << resp.meta.id << " resume failed native_session_id="
                << decision.native_session_id << " cause=" << head.back().error.message << "; retrying single_shot\n";
      sessions_->Invalidate(split.key);
      events.reset();
      plan = builder_.Build(split.remaining, split.system_content, SessionDecision{}, toolset, req.model, req.stream);
      events = Invoke(plan, cancel, &err);
      if (!events) {
        fail(err);
        return resp;
      }
      resp.mode = InvocationMode::kSingleShot;
      resp.retried_single_shot = true;
    } else {
      events = std::make_unique<ReplayEventSource>(std::move(head), std::move(events));
    }
  }

  if (!toolset.Active()) events = std::make_unique<ToolFilteringSource>(std::move(events));

  st.To(EngineState::kParsing);
  if (req.stream) {
    st.To(EngineState::kAssembling);
    resp.stream = std::make_unique<ChunkStream>(std::move(events), resp.meta);
    st.To(EngineState::kDone);
    return resp;
  }

  st.To(EngineState::kAssembling);
  auto body = AssembleCompletion(events.get(), resp.meta, &err);
  if (!body) {
    fail(err);
    return resp;
  }
  resp.completion = std::move(body);
  st.To(EngineState::kDone);
  return resp;
}

}  // namespace bridge
