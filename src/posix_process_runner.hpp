#pragma once

#include "process/process_runner.hpp"

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace bridge {

inline constexpr size_t kStderrTailBytes = 64 * 1024;

class PosixProcessOutput : public IProcessOutput {
 public:
  struct Params {
    pid_t pid = -1;
    int stdout_fd = -1;
    int stderr_fd = -1;
    int stdin_fd = -1;
    std::string stdin_payload;
    std::string temp_path;
    bool line_mode = false;
    std::chrono::steady_clock::time_point started_at;
    std::chrono::steady_clock::time_point deadline;
    bool has_deadline = false;
    std::chrono::milliseconds kill_grace{0};
    std::shared_ptr<CancelToken> cancel;
  };

  explicit PosixProcessOutput(Params p);
  ~PosixProcessOutput() override;
  PosixProcessOutput(const PosixProcessOutput&) = delete;
  PosixProcessOutput& operator=(const PosixProcessOutput&) = delete;

  bool Next(std::string* chunk) override;
  void Cancel() override;

  const EngineError& error() const override { return error_; }
  int exit_code() const override { return exit_code_; }
  std::string stderr_tail() const override { return stderr_; }

 private:
  bool CancelRequested() const;
  bool DeadlinePassed() const;
  // One poll round over the open descriptors, waiting at most timeout_ms.
  void PollOnce(int timeout_ms);
  void ReadInto(int* fd, std::string* buf, bool bounded);
  void WritePendingStdin();
  void Terminate(ErrorKind reason);
  void WaitForExit();
  void RecordExitStatus(int status);
  void RemoveTempFile();
  void CloseFd(int* fd);
  int PollTimeoutMs() const;

  Params p_;
  std::string out_buf_;
  std::string stderr_;
  size_t stdin_written_ = 0;
  bool stdout_eof_ = false;
  bool batch_delivered_ = false;
  bool reaped_ = false;
  bool finished_ = false;
  int exit_code_ = -1;
  EngineError error_;
  std::atomic<bool> cancelled_{false};
};

// fork/exec runner: stdout and stderr on separate pipes, stdin from a pipe, a 0600 temp file, or
// /dev/null. The child gets its own process group so the whole tree is signalled on kill.
class PosixProcessRunner : public IProcessRunner {
 public:
  PosixProcessRunner();

  std::unique_ptr<IProcessOutput> Run(const InvocationPlan& plan,
                                      std::shared_ptr<CancelToken> cancel,
                                      EngineError* err) override;
};

}  // namespace bridge
