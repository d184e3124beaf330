#include "sandbox/unix.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}
}  // namespace

namespace sandbox {

static const constexpr size_t kStrErrorBufSize = 2048;

bool Unix::Execute(const ExecutionOptions& options, ExecutionInfo* info,
                   std::string* error_msg) {
  options_ = &options;
  if (!Setup(error_msg)) return false;
  if (!DoFork(error_msg)) return false;
  if (!Wait(info, error_msg)) return false;
  return true;
}

bool Unix::Setup(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  // The pipe must be close-on-exec from the start: a concurrent fork in
  // another thread would otherwise keep the write end open.
  if (pipe2(pipe_fds_, O_CLOEXEC) == -1) {
    *error_msg = "pipe2: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  // argv is built here, as the child of a multi-threaded parent must not
  // allocate.
  arg_storage_.clear();
  auto add_arg = [this](const std::string& arg) {
    arg_storage_.emplace_back(arg.begin(), arg.end());
    arg_storage_.back().push_back(0);
  };
  add_arg(options_->executable);
  for (const std::string& arg : options_->args) add_arg(arg);
  argv_.clear();
  for (std::vector<char>& arg : arg_storage_) argv_.push_back(arg.data());
  argv_.push_back(nullptr);
  return true;
}

bool Unix::DoFork(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  int fork_result = fork();
  if (fork_result == -1) {
    *error_msg = "fork: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    close(pipe_fds_[0]);
    close(pipe_fds_[1]);
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
  auto die2 = [this](const char* prefix, const char* err) {
    char buf[kStrErrorBufSize + 64 + 2] = {};
    strncat(buf, prefix, 64);
    strncat(buf, ": ", 2);
    strncat(buf, err, kStrErrorBufSize);
    int len = strlen(buf);
    if (write(pipe_fds_[1], &len, sizeof(len)) == sizeof(len)) {
      if (write(pipe_fds_[1], buf, len) == -1) _Exit(1);
    }
    close(pipe_fds_[1]);
    _Exit(1);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, mystrerror(err, buf, kStrErrorBufSize));
  };

  // New session and process group, so that we do not receive Ctrl-Cs in the
  // terminal and the whole group can be killed at once.
  if (setsid() == -1) die("setsid", errno);

  int stdin_fd = -1;
  int stdout_fd = -1;
  int stderr_fd = -1;
  if (!options_->stdin_file.empty()) {
    stdin_fd = open(options_->stdin_file.c_str(), O_RDONLY | O_CLOEXEC);
  } else {
    stdin_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
  }
  if (stdin_fd == -1) die("open", errno);
  if (!options_->stdout_file.empty()) {
    stdout_fd =
        open(options_->stdout_file.c_str(),
             O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (stdout_fd == -1) die("open", errno);
  }
  if (!options_->stderr_file.empty()) {
    stderr_fd =
        open(options_->stderr_file.c_str(),
             O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (stderr_fd == -1) die("open", errno);
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

  // Set resource limits.
  struct rlimit rlim {};
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
  SET_RLIM(NOFILE, options_->max_files);
  SET_RLIM(NPROC, options_->max_procs);
#undef SET_RLIM
  rlim.rlim_cur = rlim.rlim_max = 0;
  if (setrlimit(RLIMIT_CORE, &rlim) < 0) die("setrlim CORE", errno);

  int count = 0;
  do {
    execv(options_->executable.c_str(), argv_.data());
    usleep(100);
    // We try at most 16 times to avoid livelocks (which should not be possible,
    // but better safe than sorry).
  } while (errno == ETXTBSY && count++ < 16);
  die("exec", errno);
  // [[noreturn]] does not work on lambdas...
  _Exit(1);
}

bool Unix::Wait(ExecutionInfo* info, std::string* error_msg) {
  char errbuf[kStrErrorBufSize] = {};
  close(pipe_fds_[1]);
  int error_len = 0;
  if (read(pipe_fds_[0], &error_len, sizeof(error_len)) == sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    if (error_len < 0 || error_len >= PIPE_BUF) error_len = PIPE_BUF - 1;
    if (read(pipe_fds_[0], error, error_len) == -1) {
      *error_msg = "read: ";
      *error_msg += mystrerror(errno, errbuf, kStrErrorBufSize);
    } else {
      *error_msg = error;
    }
    close(pipe_fds_[0]);
    // Reap the child, which already called _Exit.
    waitpid(child_pid_, nullptr, 0);
    return false;
  }
  close(pipe_fds_[0]);

  auto program_start = std::chrono::steady_clock::now();
  auto elapsed_millis = [&program_start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - program_start)
        .count();
  };

  // A dedicated thread blocks in wait4, so that the deadline below is a plain
  // timed wait on a condition variable.
  std::mutex mutex;
  std::condition_variable exited_cv;
  bool exited = false;
  int child_status = 0;
  int wait_errno = 0;
  struct rusage rusage {};
  std::thread waiter([&]() {
    int status = 0;
    struct rusage usage {};
    pid_t ret;
    do {
      ret = wait4(child_pid_, &status, 0, &usage);
    } while (ret == -1 && errno == EINTR);
    int err = ret == -1 ? errno : 0;
    std::lock_guard<std::mutex> lck(mutex);
    child_status = status;
    rusage = usage;
    wait_errno = err;
    exited = true;
    exited_cv.notify_all();
  });

  {
    std::unique_lock<std::mutex> lck(mutex);
    if (options_->wall_limit_millis) {
      if (!exited_cv.wait_for(
              lck, std::chrono::milliseconds(options_->wall_limit_millis),
              [&exited]() { return exited; })) {
        info->killed = true;
        if (kill(-child_pid_, SIGKILL) == -1 && errno != ESRCH) {
          kill(child_pid_, SIGKILL);
        }
      }
    } else {
      exited_cv.wait(lck, [&exited]() { return exited; });
    }
  }
  waiter.join();

  if (wait_errno != 0) {
    *error_msg = "wait4: ";
    *error_msg += mystrerror(wait_errno, errbuf, kStrErrorBufSize);
    return false;
  }
  info->status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  info->wall_time_millis = elapsed_millis();
  info->cpu_time_millis =
      (int64_t)rusage.ru_utime.tv_sec * 1000 + rusage.ru_utime.tv_usec / 1000;
  info->sys_time_millis =
      (int64_t)rusage.ru_stime.tv_sec * 1000 + rusage.ru_stime.tv_usec / 1000;
  if (info->killed) {
    info->message = "Wall limit exceeded";
  } else if (info->signal != 0) {
    info->message = strsignal(info->signal);
  } else if (info->status_code != 0) {
    info->message = "Non-zero return code";
  }
  return true;
}

namespace {
Sandbox::Register<Unix> r;
}  // namespace

}  // namespace sandbox
