#include "sandbox/unix.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <poll.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

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

static const constexpr size_t kStrErrorBufSize = 2048;
static const constexpr size_t kReadBufSize = 64 * 1024;
static const constexpr int kPollIntervalMillis = 10;
// Once the child is gone, output still buffered in the pipes is collected
// until nothing arrives for this long (a grandchild may keep them open), and
// for no more than kMaxDrainMillis overall.
static const constexpr int kDrainTimeoutMillis = 100;
static const constexpr int64_t kMaxDrainMillis = 1000;

void SetError(std::string* error_msg, const char* prefix, int err) {
  char buf[kStrErrorBufSize] = {};
  *error_msg = prefix;
  *error_msg += ": ";
  *error_msg += mystrerror(err, buf, kStrErrorBufSize);
}

bool MakePipe(int fds[2], bool nonblocking_read, std::string* error_msg) {
  if (pipe(fds) == -1) {
    SetError(error_msg, "pipe", errno);
    return false;
  }
  if (fcntl(fds[0], F_SETFD, FD_CLOEXEC) == -1 ||
      fcntl(fds[1], F_SETFD, FD_CLOEXEC) == -1) {
    SetError(error_msg, "fcntl", errno);
    return false;
  }
  if (nonblocking_read && fcntl(fds[0], F_SETFL, O_NONBLOCK) == -1) {
    SetError(error_msg, "fcntl", errno);
    return false;
  }
  return true;
}

void CloseFd(int* fd) {
  if (*fd != -1) close(*fd);
  *fd = -1;
}

// Reads everything currently available on fd. Returns false once the other
// end has been closed.
bool ReadAvailable(int fd, std::string* out, int64_t limit) {
  char buf[kReadBufSize];
  while (true) {
    ssize_t amount = read(fd, buf, kReadBufSize);
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) return errno == EAGAIN || errno == EWOULDBLOCK;
    if (amount == 0) return false;
    int64_t room = limit - static_cast<int64_t>(out->size());
    if (room > 0) out->append(buf, std::min<int64_t>(room, amount));
  }
}

// Waits up to timeout_millis for output on the given descriptors and stores
// it. Descriptors that reach end of file are closed and set to -1. Returns
// false if nothing happened before the timeout.
bool PollOutput(int* fds[2], std::string* outs[2], int64_t limit,
                int timeout_millis) {
  struct pollfd pfds[2] = {};
  int nfds = 0;
  int index[2] = {};
  for (int i = 0; i < 2; i++) {
    if (*fds[i] == -1) continue;
    pfds[nfds].fd = *fds[i];
    pfds[nfds].events = POLLIN;
    index[nfds++] = i;
  }
  if (nfds == 0) {
    if (timeout_millis > 0)
      std::this_thread::sleep_for(std::chrono::milliseconds(timeout_millis));
    return false;
  }
  int ret = poll(pfds, nfds, timeout_millis);
  if (ret <= 0) return false;
  for (int j = 0; j < nfds; j++) {
    if (!pfds[j].revents) continue;
    int i = index[j];
    if (!ReadAvailable(*fds[i], outs[i], limit)) CloseFd(fds[i]);
  }
  return true;
}
}  // namespace

namespace sandbox {

bool Unix::ExecuteInternal(const ExecutionOptions& options,
                           ExecutionInfo* info, std::string* error_msg) {
  options_ = &options;
  arg_storage_.clear();
  argv_.clear();
  auto add_arg = [this](const std::string& arg) {
    arg_storage_.emplace_back(arg.begin(), arg.end());
    arg_storage_.back().push_back(0);
  };
  add_arg(options.executable);
  for (const std::string& arg : options.args) add_arg(arg);
  for (std::vector<char>& arg : arg_storage_) argv_.push_back(arg.data());
  argv_.push_back(nullptr);

  bool ok = Setup(error_msg) && DoFork(error_msg) && Wait(info, error_msg);
  CloseAll();
  return ok;
}

bool Unix::Setup(std::string* error_msg) {
  return MakePipe(pipe_fds_, false, error_msg) &&
         MakePipe(stdout_fds_, true, error_msg) &&
         MakePipe(stderr_fds_, true, error_msg);
}

bool Unix::DoFork(std::string* error_msg) {
  int fork_result = fork();
  if (fork_result == -1) {
    SetError(error_msg, "fork", errno);
    return false;
  }
  if (fork_result) {
    child_pid_ = fork_result;
    return true;
  }
  Child();
}

void Unix::Child() {
  close(pipe_fds_[0]);
  close(stdout_fds_[0]);
  close(stderr_fds_[0]);
  auto die2 = [this](const char* prefix, const char* err) {
    char buf[kStrErrorBufSize + 64 + 2] = {};
    strncat(buf, prefix, 64);
    strncat(buf, ": ", 2);
    strncat(buf, err, kStrErrorBufSize);
    int len = strlen(buf);
    if (write(pipe_fds_[1], &len, sizeof(len)) == sizeof(len)) {
      if (write(pipe_fds_[1], buf, len) != len) _Exit(1);
    }
    close(pipe_fds_[1]);
    _Exit(1);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, mystrerror(err, buf, kStrErrorBufSize));
  };

  // New session: the whole tree can be killed at once, and it does not
  // receive the Ctrl-Cs of the terminal.
  if (setsid() == -1) die("setsid", errno);

  int stdin_fd = -1;
  if (!options_->stdin_file.empty()) {
    stdin_fd = open(options_->stdin_file.c_str(), O_RDONLY);
  } else {
    stdin_fd = open("/dev/null", O_RDONLY);
  }
  if (stdin_fd == -1) die("open", errno);

  // Handle I/O redirection.
  if (dup2(stdin_fd, STDIN_FILENO) == -1) die("redir stdin", errno);
  if (dup2(stdout_fds_[1], STDOUT_FILENO) == -1) die("redir stdout", errno);
  if (dup2(stderr_fds_[1], STDERR_FILENO) == -1) die("redir stderr", errno);

  if (chdir(options_->root.c_str()) == -1) {
    die("chdir", errno);
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

  SET_RLIM(AS, options_->memory_limit_kb * 1024);
  SET_RLIM(CPU, (options_->cpu_limit_millis + 999) / 1000);
  SET_RLIM(FSIZE, options_->max_file_size_kb * 1024);
  SET_RLIM(NPROC, options_->max_procs);
#undef SET_RLIM

  int count = 0;
  do {
    execv(argv_[0], argv_.data());
    usleep(100);
    // An executable that was just written may still be busy for a moment.
  } while (errno == ETXTBSY && count++ < 16);
  die("exec", errno);
  // [[noreturn]] does not work on lambdas...
  _Exit(1);
}

bool Unix::Wait(ExecutionInfo* info, std::string* error_msg) {
  CloseFd(&pipe_fds_[1]);
  CloseFd(&stdout_fds_[1]);
  CloseFd(&stderr_fds_[1]);
  int error_len = 0;
  if (read(pipe_fds_[0], &error_len, sizeof(error_len)) == sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    error_len = std::min<int>(error_len, PIPE_BUF - 1);
    if (read(pipe_fds_[0], error, error_len) == -1) {
      SetError(error_msg, "read", errno);
    } else {
      *error_msg = error;
    }
    int child_status = 0;
    waitpid(child_pid_, &child_status, 0);
    return false;
  }
  CloseFd(&pipe_fds_[0]);

  auto program_start = std::chrono::steady_clock::now();
  auto elapsed_millis = [&program_start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - program_start)
        .count();
  };

  int* fds[2] = {&stdout_fds_[0], &stderr_fds_[0]};
  std::string* outs[2] = {&info->stdout_content, &info->stderr_content};
  const int64_t limit = options_->max_output_bytes;

  int child_status = 0;
  bool has_exited = false;
  struct rusage rusage {};
  while (true) {
    int timeout = kPollIntervalMillis;
    if (options_->wall_limit_millis) {
      int64_t remaining = options_->wall_limit_millis - elapsed_millis();
      if (remaining <= 0) break;
      timeout = static_cast<int>(
          std::min<int64_t>(remaining, kPollIntervalMillis));
    }
    PollOutput(fds, outs, limit, timeout);
    int ret = wait4(child_pid_, &child_status, WNOHANG, &rusage);
    if (ret == -1 && errno == EINTR) continue;
    if (ret == -1) {
      SetError(error_msg, "wait4", errno);
      return false;
    }
    if (ret == child_pid_) {
      has_exited = true;
      break;
    }
  }
  if (!has_exited) {
    info->killed = true;
    LOG(INFO) << "Killing " << options_->executable << " after "
              << elapsed_millis() << "ms";
    if (kill(-child_pid_, SIGKILL) == -1 && kill(child_pid_, SIGKILL) == -1 &&
        errno != ESRCH) {
      // A setuid enforcer cannot be killed by us, it will stop on its own.
      char buf[kStrErrorBufSize] = {};
      LOG(WARNING) << "kill: " << mystrerror(errno, buf, kStrErrorBufSize);
    }
    int ret = 0;
    while ((ret = wait4(child_pid_, &child_status, 0, &rusage)) == -1 &&
           errno == EINTR) {
    }
    if (ret != child_pid_) {
      SetError(error_msg, "wait4", errno);
      return false;
    }
  }
  const int64_t drain_start = elapsed_millis();
  while ((*fds[0] != -1 || *fds[1] != -1) &&
         PollOutput(fds, outs, limit, kDrainTimeoutMillis) &&
         elapsed_millis() - drain_start < kMaxDrainMillis) {
  }

  info->status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  info->wall_time_millis = elapsed_millis();
  info->cpu_time_millis =
      (int64_t)rusage.ru_utime.tv_sec * 1000 + rusage.ru_utime.tv_usec / 1000;
  info->sys_time_millis =
      (int64_t)rusage.ru_stime.tv_sec * 1000 + rusage.ru_stime.tv_usec / 1000;
  return true;
}

void Unix::CloseAll() {
  for (int* fd : {&pipe_fds_[0], &pipe_fds_[1], &stdout_fds_[0],
                  &stdout_fds_[1], &stderr_fds_[0], &stderr_fds_[1]}) {
    CloseFd(fd);
  }
}

namespace {
Sandbox::Register<Unix> r;
}  // namespace

}  // namespace sandbox
