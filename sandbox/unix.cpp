#include "sandbox/unix.hpp"

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>

#include "glog/logging.h"

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

// What the child writes on the pipe if something fails before exec.
struct ChildError {
  char prefix[32];
  int err;
};

// Largest file descriptor that is marked close-on-exec in the child.
static const constexpr long kMaxInheritedFd = 64 * 1024;
}  // namespace

namespace sandbox {

static const constexpr size_t kStrErrorBufSize = 2048;

Unix::~Unix() {
  if (pipe_fds_[0] != -1) close(pipe_fds_[0]);
  if (pipe_fds_[1] != -1) close(pipe_fds_[1]);
  if (child_pid_ == 0 || reaped_) return;
  SignalGroup(SIGKILL);
  while (waitpid(child_pid_, nullptr, 0) == -1 && errno == EINTR) {
  }
}

bool Unix::Spawn(const ExecutionOptions& options, std::string* error_msg) {
  if (child_pid_ != 0) {
    *error_msg = "spawn: a program was already started";
    return false;
  }
  options_ = &options;
  PrepareArgs();
  return DoFork(error_msg);
}

void Unix::PrepareArgs() {
  storage_.clear();
  argv_.clear();
  envp_.clear();
  auto add = [this](const std::string& s) {
    storage_.emplace_back(s.begin(), s.end());
    storage_.back().push_back(0);
  };
  add(options_->executable);
  for (const std::string& arg : options_->args) add(arg);
  for (const std::string& var : options_->env) add(var);
  size_t nargs = options_->args.size() + 1;
  for (size_t i = 0; i < nargs; i++) argv_.push_back(storage_[i].data());
  argv_.push_back(nullptr);
  for (size_t i = nargs; i < storage_.size(); i++) {
    envp_.push_back(storage_[i].data());
  }
  envp_.push_back(nullptr);
}

bool Unix::DoFork(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  // Runs in other threads may fork at any time: the pipe must never exist
  // without the close-on-exec flag.
#ifdef __linux__
  if (pipe2(pipe_fds_, O_CLOEXEC) == -1) {
    *error_msg = "pipe: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
#else
  if (pipe(pipe_fds_) == -1) {
    *error_msg = "pipe: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  if (fcntl(pipe_fds_[0], F_SETFD, FD_CLOEXEC) == -1 ||
      fcntl(pipe_fds_[1], F_SETFD, FD_CLOEXEC) == -1) {
    *error_msg = "fcntl: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
#endif
  int fork_result = fork();
  if (fork_result == -1) {
    *error_msg = "fork: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  if (fork_result == 0) Child();
  child_pid_ = fork_result;
  return WaitForExec(error_msg);
}

void Unix::Child() {
  close(pipe_fds_[0]);
  auto die = [this](const char* prefix, int err) {
    ChildError error = {};
    strncpy(error.prefix, prefix, sizeof(error.prefix) - 1);
    error.err = err;
    ssize_t written = write(pipe_fds_[1], &error, sizeof(error));
    (void)written;
    _exit(1);
  };

  // New session and process group, so that the whole tree can be signalled
  // and we do not receive Ctrl-Cs in the terminal.
  if (setsid() == -1) die("setsid", errno);

  int stdin_fd = open("/dev/null", O_RDONLY);
  if (stdin_fd == -1) die("open stdin", errno);
  int stdout_fd = -1;
  int stderr_fd = -1;
  if (!options_->stdout_file.empty()) {
    stdout_fd = open(options_->stdout_file.c_str(),
                     O_WRONLY | O_CREAT | O_TRUNC, S_IRUSR | S_IWUSR);
    if (stdout_fd == -1) die("open stdout", errno);
  }
  if (!options_->stderr_file.empty()) {
    stderr_fd = open(options_->stderr_file.c_str(),
                     O_WRONLY | O_CREAT | O_TRUNC, S_IRUSR | S_IWUSR);
    if (stderr_fd == -1) die("open stderr", errno);
  }

  if (chdir(options_->root.c_str()) == -1) {
    die("chdir", errno);
  }

  // Handle I/O redirection.
#define DUP(field, fd)                          \
  if (field##_fd != -1) {                       \
    int ret = dup2(field##_fd, fd);             \
    if (ret == -1) die("redir " #field, errno); \
  }
  DUP(stdin, STDIN_FILENO);
  DUP(stdout, STDOUT_FILENO);
  DUP(stderr, STDERR_FILENO);
#undef DUP

  // Do not leak descriptors opened by other threads of the parent.
  long max_fd = std::min(sysconf(_SC_OPEN_MAX), kMaxInheritedFd);
  for (int fd = STDERR_FILENO + 1; fd < max_fd; fd++) {
    fcntl(fd, F_SETFD, FD_CLOEXEC);
  }

  // Set resource limits.
  struct rlimit rlim;
#define SET_RLIM(res, value)                    \
  {                                             \
    rlim_t lim = value;                         \
    if (lim) {                                  \
      rlim.rlim_cur = lim;                      \
      rlim.rlim_max = lim;                      \
      if (setrlimit(RLIMIT_##res, &rlim) < 0) { \
        die("setrlim " #res, errno);            \
      }                                         \
    }                                           \
  }

  SET_RLIM(AS, options_->memory_limit_bytes);
  SET_RLIM(CPU, options_->cpu_limit_seconds);
  SET_RLIM(FSIZE, options_->max_file_size_kb * 1024);
#undef SET_RLIM

  // The descriptor limit is only lowered, and failing to do so is not fatal.
  if (options_->max_files && getrlimit(RLIMIT_NOFILE, &rlim) == 0) {
    rlim_t desired = options_->max_files;
    if (rlim.rlim_max != RLIM_INFINITY) {
      desired = std::min(desired, rlim.rlim_max);
    }
    if (desired <= rlim.rlim_cur) {
      rlim.rlim_cur = desired;
      setrlimit(RLIMIT_NOFILE, &rlim);
    }
  }

  int count = 0;
  do {
    execve(options_->executable.c_str(), argv_.data(), envp_.data());
    usleep(100);
    // We try at most 16 times to avoid livelocks (which should not be possible,
    // but better safe than sorry).
  } while (errno == ETXTBSY && count++ < 16);
  die("exec", errno);
  // [[noreturn]] does not work on lambdas...
  _exit(1);
}

bool Unix::WaitForExec(std::string* error_msg) {
  close(pipe_fds_[1]);
  pipe_fds_[1] = -1;
  ChildError error = {};
  ssize_t num_read = 0;
  do {
    num_read = read(pipe_fds_[0], &error, sizeof(error));
  } while (num_read == -1 && errno == EINTR);
  close(pipe_fds_[0]);
  pipe_fds_[0] = -1;
  if (num_read <= 0) return true;

  // The child did not reach exec and is exiting.
  while (waitpid(child_pid_, nullptr, 0) == -1 && errno == EINTR) {
  }
  reaped_ = true;
  exited_ = true;
  char buf[kStrErrorBufSize] = {};
  error.prefix[sizeof(error.prefix) - 1] = 0;
  *error_msg = error.prefix;
  *error_msg += ": ";
  *error_msg += num_read == sizeof(error)
                    ? mystrerror(error.err, buf, kStrErrorBufSize)
                    : "unknown error";
  return false;
}

bool Unix::IsAlive() {
  if (child_pid_ == 0 || exited_) return false;
  siginfo_t info;
  memset(&info, 0, sizeof(info));
  if (waitid(P_PID, child_pid_, &info, WEXITED | WNOHANG | WNOWAIT) == -1) {
    if (errno == EINTR) return true;
    PLOG(ERROR) << "waitid";
    exited_ = true;
    return false;
  }
  if (info.si_pid == 0) return true;
  exited_ = true;
  return false;
}

void Unix::SignalGroup(int signal) {
  if (child_pid_ == 0 || reaped_) return;
  if (kill(-child_pid_, signal) == -1 && errno == ESRCH) {
    kill(child_pid_, signal);
  }
}

void Unix::TerminateGracefully() { SignalGroup(SIGTERM); }

void Unix::TerminateForcefully() { SignalGroup(SIGKILL); }

bool Unix::Reap(ExecutionInfo* info, std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  if (child_pid_ == 0 || reaped_) {
    *error_msg = "wait: no child to wait for";
    return false;
  }
  // Wait without reaping, so that the process group id cannot be reused
  // while the rest of the group is killed.
  siginfo_t siginfo;
  while (waitid(P_PID, child_pid_, &siginfo, WEXITED | WNOWAIT) == -1) {
    if (errno == EINTR) continue;
    *error_msg = "waitid: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  exited_ = true;
  SignalGroup(SIGKILL);

  int child_status = 0;
  struct rusage rusage;
  memset(&rusage, 0, sizeof(rusage));
  pid_t ret = 0;
  do {
    ret = wait4(child_pid_, &child_status, 0, &rusage);
  } while (ret == -1 && errno == EINTR);
  if (ret != child_pid_) {
    *error_msg = "wait4: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  reaped_ = true;

  info->status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  info->cpu_time_millis =
      (int64_t)rusage.ru_utime.tv_sec * 1000 + rusage.ru_utime.tv_usec / 1000;
  info->sys_time_millis =
      (int64_t)rusage.ru_stime.tv_sec * 1000 + rusage.ru_stime.tv_usec / 1000;
#ifdef __APPLE__
  info->memory_usage_kb = rusage.ru_maxrss / 1024;
#else
  info->memory_usage_kb = rusage.ru_maxrss;
#endif
  return true;
}

namespace {
Sandbox::Register<Unix> r;
}  // namespace

}  // namespace sandbox
