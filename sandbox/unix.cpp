#include "sandbox/unix.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <climits>
#include <csignal>
#include <cstdlib>
#include <cstring>

#ifdef __linux__
#include <sched.h>
#include <sys/prctl.h>
#include <sys/syscall.h>
#endif

#include <kj/debug.h>

#ifndef CLOSE_RANGE_CLOEXEC
#define CLOSE_RANGE_CLOEXEC (1U << 2)
#endif

namespace {
const char* ErrnoText(int err, char* buf, size_t size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, size);
#else
  return strerror_r(err, buf, size) == 0 ? buf : "unknown error";
#endif
}

std::string ErrnoMessage(const char* prefix, int err) {
  char buf[256] = {};
  return std::string(prefix) + ": " + ErrnoText(err, buf, sizeof(buf));
}

int MakePipe(int fds[2]) {
#ifdef __linux__
  return pipe2(fds, O_CLOEXEC);  // NOLINT
#else
  if (pipe(fds) == -1) return -1;  // NOLINT
  if (fcntl(fds[0], F_SETFD, FD_CLOEXEC) == -1 ||
      fcntl(fds[1], F_SETFD, FD_CLOEXEC) == -1) {
    return -1;
  }
  return 0;
#endif
}

// Writes the whole buffer, returns false on error. Safe to use after fork.
bool WriteAll(int fd, const void* data, size_t len) {
  const char* buf = static_cast<const char*>(data);
  while (len > 0) {
    ssize_t written = write(fd, buf, len);
    if (written == -1 && errno == EINTR) continue;
    if (written <= 0) return false;
    buf += written;
    len -= written;
  }
  return true;
}

// Marks every descriptor from 3 on as close-on-exec. Safe to use after fork.
void CloseOnExecFrom3() {
#if defined(__linux__) && defined(SYS_close_range)
  if (syscall(SYS_close_range, 3U, ~0U, CLOSE_RANGE_CLOEXEC) == 0) return;
#endif
  struct rlimit rlim {};
  int max_fd = 65536;
  if (getrlimit(RLIMIT_NOFILE, &rlim) == 0 && rlim.rlim_cur != RLIM_INFINITY &&
      rlim.rlim_cur < static_cast<rlim_t>(max_fd)) {
    max_fd = static_cast<int>(rlim.rlim_cur);
  }
  for (int fd = 3; fd < max_fd; fd++) fcntl(fd, F_SETFD, FD_CLOEXEC);
}

std::vector<char> ToCharVector(const std::string& s) {
  return std::vector<char>(s.c_str(), s.c_str() + s.size() + 1);
}

// Reads at most this many chunks from a stream before checking the child and
// the deadline again, so that a program that writes continuously cannot starve
// the supervision loop.
const constexpr size_t kMaxChunksPerDrain = 16;
const constexpr size_t kReadChunkSize = 64 * 1024;

// Time given to the output pipes to reach EOF once the process group is gone.
const constexpr int64_t kDrainGraceMillis = 200;

struct OutputStream {
  int* fd;
  std::string* data;
  bool* truncated;
};

// Moves the available output of a stream to its buffer, discarding what does
// not fit. Closes the stream on EOF or error.
void Drain(const OutputStream& stream, size_t max_bytes, char* buf) {
  for (size_t i = 0; i < kMaxChunksPerDrain && *stream.fd != -1; i++) {
    ssize_t amount = read(*stream.fd, buf, kReadChunkSize);
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
    if (amount <= 0) {
      close(*stream.fd);
      *stream.fd = -1;
      return;
    }
    size_t room = static_cast<size_t>(amount);
    if (max_bytes != 0) {
      room = stream.data->size() < max_bytes ? max_bytes - stream.data->size()
                                             : 0;
    }
    if (room < static_cast<size_t>(amount)) *stream.truncated = true;
    stream.data->append(buf, std::min(room, static_cast<size_t>(amount)));
  }
}

// Waits for output on the open streams for at most timeout_millis, then
// drains them.
void PollOutput(OutputStream* streams, size_t num_streams, size_t max_bytes,
                int64_t timeout_millis, char* buf) {
  struct pollfd fds[2] = {};
  OutputStream* polled[2] = {};
  nfds_t nfds = 0;
  for (size_t i = 0; i < num_streams; i++) {
    if (*streams[i].fd == -1) continue;
    fds[nfds].fd = *streams[i].fd;
    fds[nfds].events = POLLIN;
    polled[nfds] = &streams[i];
    nfds++;
  }
  if (nfds == 0) {
    if (timeout_millis > 0) {
      struct timespec ts {};
      ts.tv_sec = timeout_millis / 1000;
      ts.tv_nsec = (timeout_millis % 1000) * 1000000;
      nanosleep(&ts, nullptr);
    }
    return;
  }
  int ret = poll(fds, nfds, static_cast<int>(timeout_millis));
  if (ret <= 0) return;
  for (nfds_t i = 0; i < nfds; i++) {
    if (fds[i].revents != 0) Drain(*polled[i], max_bytes, buf);
  }
}
// Failure reports of the child before exec, sent over the error pipe as a
// length followed by "what: detail". Only async-signal-safe calls.
[[noreturn]] void ReportAndExit(int fd, const char* what, const char* detail) {
  char message[PIPE_BUF] = {};
  size_t len = 0;
  for (const char* part : {what, ": ", detail}) {
    while (*part != 0 && len + 1 < sizeof(message)) message[len++] = *part++;
  }
  ssize_t size = static_cast<ssize_t>(len);
  if (WriteAll(fd, &size, sizeof(size))) WriteAll(fd, message, len);
  _Exit(1);
}

[[noreturn]] void ReportErrnoAndExit(int fd, const char* what, int err) {
  char buf[256] = {};
  ReportAndExit(fd, what, ErrnoText(err, buf, sizeof(buf)));
}

struct Limit {
  int resource;
  const char* name;
  rlim_t value;
};
}  // namespace

namespace sandbox {

bool Unix::ExecuteInternal(const ExecutionOptions& options, ExecutionInfo* info,
                           std::string* error_msg) {
  options_ = &options;
  *info = ExecutionInfo();
  KJ_DEFER(CloseAll());
  return Setup(error_msg) && Spawn(error_msg) && Wait(info, error_msg);
}

void Unix::CloseAll() {
  for (int* fd : {&pipe_fds_[0], &pipe_fds_[1], &stdout_fds_[0],
                  &stdout_fds_[1], &stderr_fds_[0], &stderr_fds_[1]}) {
    if (*fd != -1) close(*fd);
    *fd = -1;
  }
}

bool Unix::Setup(std::string* error_msg) {
  args_.clear();
  args_.push_back(ToCharVector(options_->executable));
  for (const std::string& arg : options_->args) {
    args_.push_back(ToCharVector(arg));
  }
  argsp_.clear();
  for (auto& arg : args_) argsp_.push_back(arg.data());
  argsp_.push_back(nullptr);

  env_.clear();
  for (const std::string& var : options_->env) {
    env_.push_back(ToCharVector(var));
  }
  envp_.clear();
  for (auto& var : env_) envp_.push_back(var.data());
  envp_.push_back(nullptr);

  if (MakePipe(pipe_fds_) == -1 || MakePipe(stdout_fds_) == -1 ||
      MakePipe(stderr_fds_) == -1) {
    *error_msg = ErrnoMessage("pipe", errno);
    return false;
  }
  return true;
}

bool Unix::Spawn(std::string* error_msg) {
  parent_pid_ = getpid();
  pid_t pid = fork();
  if (pid == -1) {
    *error_msg = ErrnoMessage("fork", errno);
    return false;
  }
  if (pid == 0) Child();
  child_pid_ = pid;
  return true;
}

void Unix::Child() {
  close(pipe_fds_[0]);
  close(stdout_fds_[0]);
  close(stderr_fds_[0]);
  const int report_fd = pipe_fds_[1];
  auto fail = [report_fd](const char* what) {
    ReportErrnoAndExit(report_fd, what, errno);
  };

  // Signal masks and ignored signals survive exec: give the program the
  // default ones.
  sigset_t empty_set;
  sigemptyset(&empty_set);
  if (sigprocmask(SIG_SETMASK, &empty_set, nullptr) == -1) fail("sigprocmask");
  signal(SIGPIPE, SIG_DFL);

  // New session and process group, so that the whole tree can be killed at
  // once and no terminal signal reaches it.
  if (setsid() == -1) fail("setsid");

#ifdef __linux__
  // Do not outlive the supervising thread.
  if (prctl(PR_SET_PDEATHSIG, SIGKILL) == -1) fail("prctl");
  if (getppid() != parent_pid_) _Exit(1);
#endif

  int null_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
  if (null_fd == -1) fail("open /dev/null");
  if (dup2(null_fd, STDIN_FILENO) == -1) fail("dup2 stdin");
  if (dup2(stdout_fds_[1], STDOUT_FILENO) == -1) fail("dup2 stdout");
  if (dup2(stderr_fds_[1], STDERR_FILENO) == -1) fail("dup2 stderr");

  if (chdir(options_->root.c_str()) == -1) fail("chdir");

  if (options_->disable_network) {
#ifdef __linux__
    if (unshare(CLONE_NEWUSER | CLONE_NEWNET) == -1 &&
        options_->require_isolation) {
      fail("unshare");
    }
#else
    if (options_->require_isolation) {
      ReportAndExit(report_fd, "unshare",
                    "network isolation is not supported on this platform");
    }
#endif
  }

  CloseOnExecFrom3();

  // A zero limit means "not set", except for core dumps which are always off.
  const Limit limits[] = {
      {RLIMIT_AS, "setrlimit AS",
       static_cast<rlim_t>(options_->memory_limit_kb) * 1024},
      {RLIMIT_CPU, "setrlimit CPU",
       static_cast<rlim_t>((options_->cpu_limit_millis + 999) / 1000)},
      {RLIMIT_FSIZE, "setrlimit FSIZE",
       static_cast<rlim_t>(options_->max_file_size_kb) * 1024},
      {RLIMIT_NOFILE, "setrlimit NOFILE",
       static_cast<rlim_t>(options_->max_files)},
      {RLIMIT_NPROC, "setrlimit NPROC",
       static_cast<rlim_t>(options_->max_procs)},
      {RLIMIT_STACK, "setrlimit STACK",
       static_cast<rlim_t>(options_->max_stack_kb) * 1024},
  };
  for (const Limit& limit : limits) {
    if (limit.value == 0) continue;
    struct rlimit rlim {};
    rlim.rlim_cur = rlim.rlim_max = limit.value;
    if (setrlimit(limit.resource, &rlim) == -1) fail(limit.name);
  }
  struct rlimit no_core {};
  if (setrlimit(RLIMIT_CORE, &no_core) == -1) fail("setrlimit CORE");

#ifdef __linux__
  if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) == -1) fail("prctl");
#endif

  execve(options_->executable.c_str(), argsp_.data(), envp_.data());
  fail("exec");
  _Exit(1);
}

bool Unix::Wait(ExecutionInfo* info, std::string* error_msg) {
  for (int* fd : {&pipe_fds_[1], &stdout_fds_[1], &stderr_fds_[1]}) {
    close(*fd);
    *fd = -1;
  }

  // The error pipe is closed on exec: anything read from it is the reason why
  // the program could not be started.
  ssize_t error_len = 0;
  ssize_t num_read = 0;
  while ((num_read = read(pipe_fds_[0], &error_len, sizeof(error_len))) ==
             -1 &&
         errno == EINTR) {
  }
  if (num_read == sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    error_len = std::min<ssize_t>(error_len, PIPE_BUF - 1);
    ssize_t got = 0;
    while (got < error_len) {
      ssize_t cur = read(pipe_fds_[0], error + got, error_len - got);
      if (cur == -1 && errno == EINTR) continue;
      if (cur <= 0) break;
      got += cur;
    }
    *error_msg = error;
    while (waitpid(child_pid_, nullptr, 0) == -1 && errno == EINTR) {
    }
    return false;
  }

  for (int fd : {stdout_fds_[0], stderr_fds_[0]}) {
    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
  OutputStream streams[2] = {
      {&stdout_fds_[0], &info->stdout_data, &info->stdout_truncated},
      {&stderr_fds_[0], &info->stderr_data, &info->stderr_truncated}};
  std::vector<char> read_buf(kReadChunkSize);

  auto program_start = std::chrono::steady_clock::now();
  auto elapsed_millis = [&program_start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - program_start)
        .count();
  };

  int child_status = 0;
  bool has_exited = false;
  struct rusage rusage {};
  while (!options_->wall_limit_millis ||
         elapsed_millis() < options_->wall_limit_millis) {
    int64_t timeout = 10;
    if (options_->wall_limit_millis) {
      timeout = std::min<int64_t>(
          timeout, options_->wall_limit_millis - elapsed_millis());
    }
    PollOutput(streams, 2, options_->max_output_bytes,
               std::max<int64_t>(timeout, 0), read_buf.data());
    int ret = wait4(child_pid_, &child_status, WNOHANG, &rusage);
    if (ret == -1 && errno == EINTR) continue;
    if (ret == -1) {
      *error_msg = ErrnoMessage("wait4", errno);
      kill(-child_pid_, SIGKILL);
      while (waitpid(child_pid_, nullptr, 0) == -1 && errno == EINTR) {
      }
      return false;
    }
    if (ret == child_pid_) {
      has_exited = true;
      break;
    }
  }
  if (!has_exited) {
    // The child may have exited after the wait4 of the last iteration.
    int ret = 0;
    while ((ret = wait4(child_pid_, &child_status, WNOHANG, &rusage)) == -1 &&
           errno == EINTR) {
    }
    has_exited = ret == child_pid_;
  }
  if (!has_exited) {
    info->timed_out = true;
    if (kill(-child_pid_, SIGKILL) == -1 && errno != ESRCH) {
      KJ_LOG(ERROR, "kill", strerror(errno));
    }
    int ret = 0;
    while ((ret = wait4(child_pid_, &child_status, 0, &rusage)) == -1 &&
           errno == EINTR) {
    }
    if (ret != child_pid_) {
      *error_msg = ErrnoMessage("wait4", errno);
      return false;
    }
    // Exited on its own between the last wait4 and the kill.
    info->timed_out =
        WIFSIGNALED(child_status) && WTERMSIG(child_status) == SIGKILL;
  }
  info->wall_time_millis = elapsed_millis();

  // Descendants left in the process group must not survive the execution,
  // nor keep the output pipes open.
  kill(-child_pid_, SIGKILL);
  auto drain_start = std::chrono::steady_clock::now();
  while (stdout_fds_[0] != -1 || stderr_fds_[0] != -1) {
    int64_t drained_for =
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - drain_start)
            .count();
    if (drained_for >= kDrainGraceMillis) break;
    PollOutput(streams, 2, options_->max_output_bytes,
               kDrainGraceMillis - drained_for, read_buf.data());
  }

  info->memory_usage_kb = rusage.ru_maxrss;
  info->status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  // If the child received a KILL or XCPU signal, assume it was killed because
  // of the time or memory limits.
  info->killed =
      info->timed_out || info->signal == SIGKILL || info->signal == SIGXCPU;
  info->cpu_time_millis =
      rusage.ru_utime.tv_sec * 1000LL + rusage.ru_utime.tv_usec / 1000;
  info->sys_time_millis =
      rusage.ru_stime.tv_sec * 1000LL + rusage.ru_stime.tv_usec / 1000;
  if (info->timed_out) {
    info->message = "Wall time limit exceeded";
  } else if (info->signal != 0) {
    info->message = strsignal(info->signal);
  } else if (info->status_code != 0) {
    info->message = "Non-zero return code";
  }
  return true;
}

namespace {
Sandbox::Register<Unix> unix_registration("unix");  // NOLINT
}  // namespace

}  // namespace sandbox
