#pragma once

#include "command_builder.hpp"
#include "errors.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace bridge {

// Shared between the HTTP layer and a running invocation; set when the client goes away.
// A liveness check, when installed, is consulted on every IsCancelled() so a silent subprocess
// still notices a dropped connection. The check runs on the caller's thread.
class CancelToken {
 public:
  void Cancel() { cancelled_.store(true); }

  bool IsCancelled() const {
    if (cancelled_.load()) return true;
    std::lock_guard<std::mutex> lock(mu_);
    if (alive_ && !alive_()) {
      cancelled_.store(true);
      return true;
    }
    return false;
  }

  void SetLivenessCheck(std::function<bool()> alive) {
    std::lock_guard<std::mutex> lock(mu_);
    alive_ = std::move(alive);
  }

 private:
  mutable std::atomic<bool> cancelled_{false};
  mutable std::mutex mu_;
  std::function<bool()> alive_;
};

// Pull iterator over one invocation's stdout.
class IProcessOutput {
 public:
  virtual ~IProcessOutput() = default;

  // Batch plans yield the whole stdout once; streaming plans yield one line at a time without the
  // trailing newline. Returns false once output has ended; error() then says whether it ended badly.
  virtual bool Next(std::string* chunk) = 0;

  virtual void Cancel() = 0;

  virtual const EngineError& error() const = 0;
  // -1 while running or when the process was killed by a signal.
  virtual int exit_code() const = 0;
  virtual std::string stderr_tail() const = 0;
};

class IProcessRunner {
 public:
  virtual ~IProcessRunner() = default;

  // Returns nullptr with err set when the process cannot be started.
  virtual std::unique_ptr<IProcessOutput> Run(const InvocationPlan& plan,
                                              std::shared_ptr<CancelToken> cancel,
                                              EngineError* err) = 0;
};

}  // namespace bridge
