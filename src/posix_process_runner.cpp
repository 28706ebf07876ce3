#include "posix_process_runner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <thread>
#include <utility>
#include <vector>

extern char** environ;

namespace bridge {
namespace {

constexpr int kPollSliceMs = 50;
constexpr size_t kReadChunkBytes = 64 * 1024;
constexpr size_t kStderrInErrorBytes = 512;

static int64_t ElapsedMs(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - since).count();
}

static std::string TempDirFor(const InvocationPlan& plan) {
  if (!plan.temp_dir.empty()) return plan.temp_dir;
  const char* v = std::getenv("TMPDIR");
  if (v && *v) return v;
  return "/tmp";
}

static void CloseIfOpen(int* fd) {
  if (*fd >= 0) {
    close(*fd);
    *fd = -1;
  }
}

static void SetNonBlocking(int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

static bool WriteAll(int fd, const std::string& data) {
  size_t off = 0;
  while (off < data.size()) {
    const ssize_t n = write(fd, data.data() + off, data.size() - off);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    off += static_cast<size_t>(n);
  }
  return true;
}

// Owner-only file holding the prompt, rewound so the child reads it as stdin.
static int CreateInputFile(const std::string& dir, const std::string& payload, std::string* path, std::string* err) {
  std::string tmpl = dir;
  if (!tmpl.empty() && tmpl.back() != '/') tmpl += "/";
  tmpl += "cli-bridge-input-XXXXXX";
  std::vector<char> name(tmpl.begin(), tmpl.end());
  name.push_back('\0');

  const int fd = mkostemp(name.data(), O_CLOEXEC);
  if (fd < 0) {
    *err = "cannot create temp input file in " + dir + ": " + std::strerror(errno);
    return -1;
  }
  path->assign(name.data());
  if (fchmod(fd, S_IRUSR | S_IWUSR) != 0 || !WriteAll(fd, payload) || lseek(fd, 0, SEEK_SET) < 0) {
    *err = "cannot write temp input file " + *path + ": " + std::strerror(errno);
    close(fd);
    unlink(path->c_str());
    path->clear();
    return -1;
  }
  return fd;
}

// Inherited environment with the plan's overrides applied.
static std::vector<std::string> BuildEnvironment(const InvocationPlan& plan) {
  std::vector<std::string> out;
  for (char** e = environ; e && *e; e++) {
    const std::string entry(*e);
    const auto eq = entry.find('=');
    const auto key = entry.substr(0, eq);
    bool overridden = false;
    for (const auto& kv : plan.env) {
      if (kv.first == key) {
        overridden = true;
        break;
      }
    }
    if (!overridden) out.push_back(entry);
  }
  for (const auto& kv : plan.env) out.push_back(kv.first + "=" + kv.second);
  return out;
}

static void SignalGroup(pid_t pid, int sig) {
  if (kill(-pid, sig) != 0) kill(pid, sig);
}

static std::string TailForError(const std::string& s) {
  std::string t = s;
  while (!t.empty() && (t.back() == '\n' || t.back() == '\r' || t.back() == ' ')) t.pop_back();
  if (t.size() > kStderrInErrorBytes) t = "..." + t.substr(t.size() - kStderrInErrorBytes);
  return t;
}

}  // namespace

PosixProcessOutput::PosixProcessOutput(Params p) : p_(std::move(p)) {
  if (p_.stdin_fd >= 0 && p_.stdin_payload.empty()) CloseFd(&p_.stdin_fd);
}

PosixProcessOutput::~PosixProcessOutput() {
  if (!reaped_) Terminate(ErrorKind::kCancelled);
  CloseFd(&p_.stdout_fd);
  CloseFd(&p_.stderr_fd);
  CloseFd(&p_.stdin_fd);
  RemoveTempFile();
}

void PosixProcessOutput::Cancel() {
  cancelled_.store(true);
}

bool PosixProcessOutput::CancelRequested() const {
  return cancelled_.load() || (p_.cancel && p_.cancel->IsCancelled());
}

bool PosixProcessOutput::DeadlinePassed() const {
  return p_.has_deadline && std::chrono::steady_clock::now() >= p_.deadline;
}

int PosixProcessOutput::PollTimeoutMs() const {
  if (!p_.has_deadline) return kPollSliceMs;
  const auto left =
      std::chrono::duration_cast<std::chrono::milliseconds>(p_.deadline - std::chrono::steady_clock::now()).count();
  if (left <= 0) return 0;
  return static_cast<int>(std::min<int64_t>(left, kPollSliceMs));
}

void PosixProcessOutput::CloseFd(int* fd) {
  CloseIfOpen(fd);
}

void PosixProcessOutput::RemoveTempFile() {
  if (p_.temp_path.empty()) return;
  if (unlink(p_.temp_path.c_str()) != 0 && errno != ENOENT) {
    std::cout << "[process] temp file remove failed path=" << p_.temp_path << " err=" << std::strerror(errno) << "\n";
  }
  p_.temp_path.clear();
}

void PosixProcessOutput::ReadInto(int* fd, std::string* buf, bool bounded) {
  char tmp[kReadChunkBytes];
  const ssize_t n = read(*fd, tmp, sizeof(tmp));
  if (n > 0) {
    buf->append(tmp, static_cast<size_t>(n));
    if (bounded && buf->size() > kStderrTailBytes) buf->erase(0, buf->size() - kStderrTailBytes);
    return;
  }
  if (n == 0 || (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)) CloseFd(fd);
}

void PosixProcessOutput::WritePendingStdin() {
  while (stdin_written_ < p_.stdin_payload.size()) {
    const ssize_t n =
        write(p_.stdin_fd, p_.stdin_payload.data() + stdin_written_, p_.stdin_payload.size() - stdin_written_);
    if (n < 0) {
      if (errno == EINTR) continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK) return;
      // Child closed its stdin; whatever it already read is all it gets.
      break;
    }
    stdin_written_ += static_cast<size_t>(n);
  }
  CloseFd(&p_.stdin_fd);
  p_.stdin_payload.clear();
}

void PosixProcessOutput::PollOnce(int timeout_ms) {
  pollfd fds[3];
  int n = 0;
  int out_i = -1, err_i = -1, in_i = -1;
  if (p_.stdout_fd >= 0) {
    out_i = n;
    fds[n++] = {p_.stdout_fd, POLLIN, 0};
  }
  if (p_.stderr_fd >= 0) {
    err_i = n;
    fds[n++] = {p_.stderr_fd, POLLIN, 0};
  }
  if (p_.stdin_fd >= 0) {
    in_i = n;
    fds[n++] = {p_.stdin_fd, POLLOUT, 0};
  }
  if (n == 0) {
    poll(nullptr, 0, timeout_ms);
    return;
  }
  const int r = poll(fds, static_cast<nfds_t>(n), timeout_ms);
  if (r <= 0) return;

  if (out_i >= 0 && (fds[out_i].revents & (POLLIN | POLLHUP | POLLERR))) ReadInto(&p_.stdout_fd, &out_buf_, false);
  if (err_i >= 0 && (fds[err_i].revents & (POLLIN | POLLHUP | POLLERR))) ReadInto(&p_.stderr_fd, &stderr_, true);
  if (in_i >= 0 && (fds[in_i].revents & (POLLOUT | POLLHUP | POLLERR))) WritePendingStdin();
  if (p_.stdout_fd < 0) stdout_eof_ = true;
}

void PosixProcessOutput::RecordExitStatus(int status) {
  if (WIFEXITED(status)) {
    exit_code_ = WEXITSTATUS(status);
    if (exit_code_ != 0 && !error_) {
      std::string msg = "cli exited with status " + std::to_string(exit_code_);
      const auto tail = TailForError(stderr_);
      if (!tail.empty()) msg += ": " + tail;
      SetError(&error_, ErrorKind::kProcessExecution, msg);
    }
    return;
  }
  exit_code_ = -1;
  if (WIFSIGNALED(status) && !error_) {
    SetError(&error_, ErrorKind::kProcessExecution, "cli killed by signal " + std::to_string(WTERMSIG(status)));
  }
}

void PosixProcessOutput::WaitForExit() {
  int status = 0;
  bool have_status = false;
  while (!reaped_) {
    const pid_t r = waitpid(p_.pid, &status, WNOHANG);
    if (r == p_.pid) {
      reaped_ = true;
      have_status = true;
      break;
    }
    if (r < 0 && errno != EINTR) {
      reaped_ = true;
      SetError(&error_, ErrorKind::kProcessExecution, std::string("waitpid failed: ") + std::strerror(errno));
      break;
    }
    if (CancelRequested()) {
      Terminate(ErrorKind::kCancelled);
      return;
    }
    if (DeadlinePassed()) {
      Terminate(ErrorKind::kTimeout);
      return;
    }
    PollOnce(PollTimeoutMs());
  }

  // The process is gone; take whatever stderr is already buffered in the pipe.
  if (p_.stderr_fd >= 0) {
    SetNonBlocking(p_.stderr_fd);
    for (int i = 0; i < 64 && p_.stderr_fd >= 0; i++) {
      const size_t before = stderr_.size();
      ReadInto(&p_.stderr_fd, &stderr_, true);
      if (p_.stderr_fd >= 0 && stderr_.size() == before) break;
    }
  }
  CloseFd(&p_.stderr_fd);
  CloseFd(&p_.stdin_fd);
  if (have_status) RecordExitStatus(status);
  RemoveTempFile();

  std::cout << "[process] exit pid=" << p_.pid << " code=" << exit_code_ << " elapsed_ms=" << ElapsedMs(p_.started_at)
            << " stderr_bytes=" << stderr_.size() << "\n";
  if (error_) std::cout << "[process] error kind=" << ErrorKindName(error_.kind) << " message=" << error_.message << "\n";
}

void PosixProcessOutput::Terminate(ErrorKind reason) {
  if (reaped_) return;
  std::cout << "[process] kill pid=" << p_.pid << " reason=" << ErrorKindName(reason)
            << " elapsed_ms=" << ElapsedMs(p_.started_at) << "\n";

  int status = 0;
  SignalGroup(p_.pid, SIGTERM);
  const auto grace_end = std::chrono::steady_clock::now() + p_.kill_grace;
  while (!reaped_) {
    const pid_t r = waitpid(p_.pid, &status, WNOHANG);
    if (r == p_.pid || (r < 0 && errno != EINTR)) {
      reaped_ = true;
      break;
    }
    if (std::chrono::steady_clock::now() >= grace_end) break;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  if (!reaped_) {
    std::cout << "[process] sigkill pid=" << p_.pid << "\n";
    SignalGroup(p_.pid, SIGKILL);
    while (waitpid(p_.pid, &status, 0) < 0 && errno == EINTR) {
    }
    reaped_ = true;
  }
  exit_code_ = WIFEXITED(status) ? WEXITSTATUS(status) : -1;

  CloseFd(&p_.stdout_fd);
  CloseFd(&p_.stderr_fd);
  CloseFd(&p_.stdin_fd);
  stdout_eof_ = true;
  out_buf_.clear();
  RemoveTempFile();

  if (reason == ErrorKind::kTimeout) {
    const auto limit = std::chrono::duration_cast<std::chrono::milliseconds>(p_.deadline - p_.started_at).count();
    SetError(&error_, ErrorKind::kTimeout, "cli invocation timed out after " + std::to_string(limit) + " ms");
  } else {
    SetError(&error_, ErrorKind::kCancelled, "cli invocation cancelled");
  }
}

bool PosixProcessOutput::Next(std::string* chunk) {
  if (finished_) return false;
  for (;;) {
    if (p_.line_mode) {
      const auto nl = out_buf_.find('\n');
      if (nl != std::string::npos) {
        chunk->assign(out_buf_, 0, nl);
        if (!chunk->empty() && chunk->back() == '\r') chunk->pop_back();
        out_buf_.erase(0, nl + 1);
        return true;
      }
      if (stdout_eof_ && !out_buf_.empty()) {
        *chunk = std::move(out_buf_);
        out_buf_.clear();
        return true;
      }
    } else if (stdout_eof_ && !batch_delivered_) {
      batch_delivered_ = true;
      WaitForExit();
      if (!out_buf_.empty()) {
        *chunk = std::move(out_buf_);
        out_buf_.clear();
        return true;
      }
      finished_ = true;
      return false;
    }

    if (stdout_eof_) {
      WaitForExit();
      finished_ = true;
      return false;
    }
    if (CancelRequested()) {
      Terminate(ErrorKind::kCancelled);
      finished_ = true;
      return false;
    }
    if (DeadlinePassed()) {
      Terminate(ErrorKind::kTimeout);
      finished_ = true;
      return false;
    }
    PollOnce(PollTimeoutMs());
  }
}

PosixProcessRunner::PosixProcessRunner() {
  // Writes to a child that already exited must fail with EPIPE instead of killing the server.
  signal(SIGPIPE, SIG_IGN);
}

std::unique_ptr<IProcessOutput> PosixProcessRunner::Run(const InvocationPlan& plan,
                                                        std::shared_ptr<CancelToken> cancel,
                                                        EngineError* err) {
  if (plan.argv.empty() || plan.argv[0].empty()) {
    SetError(err, ErrorKind::kProcessExecution, "empty command line");
    return nullptr;
  }
  if (cancel && cancel->IsCancelled()) {
    SetError(err, ErrorKind::kCancelled, "cancelled before spawn");
    return nullptr;
  }

  std::string temp_path;
  int input_fd = -1;
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int in_pipe[2] = {-1, -1};
  int exec_pipe[2] = {-1, -1};
  auto cleanup = [&]() {
    for (int* fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1], &in_pipe[0], &in_pipe[1], &exec_pipe[0],
                    &exec_pipe[1], &input_fd}) {
      CloseIfOpen(fd);
    }
    if (!temp_path.empty()) unlink(temp_path.c_str());
  };

  if (plan.input == InputKind::kTempFile) {
    std::string msg;
    input_fd = CreateInputFile(TempDirFor(plan), plan.input_payload, &temp_path, &msg);
    if (input_fd < 0) {
      SetError(err, ErrorKind::kProcessExecution, msg);
      return nullptr;
    }
  } else if (plan.input == InputKind::kNone) {
    input_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
  }

  if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0 || pipe2(exec_pipe, O_CLOEXEC) != 0 ||
      (plan.input == InputKind::kStdin && pipe2(in_pipe, O_CLOEXEC) != 0)) {
    const std::string msg = std::string("pipe failed: ") + std::strerror(errno);
    cleanup();
    SetError(err, ErrorKind::kProcessExecution, msg);
    return nullptr;
  }

  std::vector<char*> argv;
  argv.reserve(plan.argv.size() + 1);
  for (const auto& a : plan.argv) argv.push_back(const_cast<char*>(a.c_str()));
  argv.push_back(nullptr);
  const auto env_strings = BuildEnvironment(plan);
  std::vector<char*> envp;
  envp.reserve(env_strings.size() + 1);
  for (const auto& e : env_strings) envp.push_back(const_cast<char*>(e.c_str()));
  envp.push_back(nullptr);

  const auto started_at = std::chrono::steady_clock::now();
  const pid_t pid = fork();
  if (pid < 0) {
    const std::string msg = std::string("fork failed: ") + std::strerror(errno);
    cleanup();
    SetError(err, ErrorKind::kProcessExecution, msg);
    return nullptr;
  }

  if (pid == 0) {
    setpgid(0, 0);
    signal(SIGPIPE, SIG_DFL);
    const int stdin_src = plan.input == InputKind::kStdin ? in_pipe[0] : input_fd;
    if (stdin_src >= 0) dup2(stdin_src, STDIN_FILENO);
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    execvpe(argv[0], argv.data(), envp.data());
    const int e = errno;
    ssize_t ignored = write(exec_pipe[1], &e, sizeof(e));
    (void)ignored;
    _exit(127);
  }

  setpgid(pid, pid);
  CloseIfOpen(&out_pipe[1]);
  CloseIfOpen(&err_pipe[1]);
  CloseIfOpen(&in_pipe[0]);
  CloseIfOpen(&exec_pipe[1]);
  CloseIfOpen(&input_fd);

  // exec_pipe closes on a successful exec; otherwise the child reports errno through it.
  int exec_errno = 0;
  ssize_t n = 0;
  do {
    n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);
  CloseIfOpen(&exec_pipe[0]);
  if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    cleanup();
    SetError(err, ErrorKind::kProcessExecution,
             "failed to execute " + plan.argv[0] + ": " + std::strerror(exec_errno));
    std::cout << "[process] spawn failed argv0=" << plan.argv[0] << " err=" << std::strerror(exec_errno) << "\n";
    return nullptr;
  }

  SetNonBlocking(out_pipe[0]);
  SetNonBlocking(err_pipe[0]);
  if (in_pipe[1] >= 0) SetNonBlocking(in_pipe[1]);

  std::cout << "[process] spawn pid=" << pid << " mode=" << InvocationModeName(plan.mode)
            << " streaming=" << (plan.streaming ? "true" : "false") << " argv0=" << plan.argv[0]
            << " args=" << plan.argv.size() << " input="
            << (plan.input == InputKind::kTempFile ? "tempfile" : plan.input == InputKind::kStdin ? "stdin" : "none")
            << " input_bytes=" << plan.input_payload.size() << "\n";

  PosixProcessOutput::Params p;
  p.pid = pid;
  p.stdout_fd = out_pipe[0];
  p.stderr_fd = err_pipe[0];
  p.stdin_fd = in_pipe[1];
  if (plan.input == InputKind::kStdin) p.stdin_payload = plan.input_payload;
  p.temp_path = temp_path;
  p.line_mode = plan.streaming;
  p.started_at = started_at;
  p.has_deadline = plan.timeout.count() > 0;
  p.deadline = started_at + plan.timeout;
  p.kill_grace = plan.kill_grace;
  p.cancel = std::move(cancel);
  return std::make_unique<PosixProcessOutput>(std::move(p));
}

}  // namespace bridge
