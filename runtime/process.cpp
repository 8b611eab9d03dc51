#include "runtime/process.hpp"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>

#include "absl/strings/str_join.h"
#include "glog/logging.h"

namespace {

static const constexpr size_t kStrErrorBufSize = 2048;
static const constexpr size_t kReadSize = 32 * 1024;

char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

std::string ErrnoMessage(const std::string& prefix, int err) {
  char buf[kStrErrorBufSize] = {};
  return prefix + ": " + mystrerror(err, buf, kStrErrorBufSize);
}

bool MakePipe(int fds[2]) {
  if (pipe(fds) == -1) return false;
  if (fcntl(fds[0], F_SETFD, FD_CLOEXEC) == -1 ||
      fcntl(fds[1], F_SETFD, FD_CLOEXEC) == -1) {
    close(fds[0]);
    close(fds[1]);
    return false;
  }
  return true;
}

int64_t MillisSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - start)
      .count();
}

}  // namespace

namespace runtime {

Subprocess::Subprocess(std::vector<std::string> args)
    : args_(std::move(args)) {}

Subprocess::~Subprocess() {
  if (child_pid_ != 0 && !reaped_) {
    Kill();
    try {
      Wait();
    } catch (const std::exception& exc) {
      LOG(WARNING) << "Could not reap " << args_[0] << ": " << exc.what();
    }
  }
  CloseFds();
}

void Subprocess::CloseFds() {
  if (stdout_fd_ != -1) close(stdout_fd_);
  if (stderr_fd_ != -1) close(stderr_fd_);
  stdout_fd_ = stderr_fd_ = -1;
}

void Subprocess::Start() {
  if (args_.empty()) throw runtime_failure("Subprocess: no program given");
  int out_pipe[2], err_pipe[2], error_pipe[2];
  if (!MakePipe(out_pipe)) throw runtime_failure(ErrnoMessage("pipe", errno));
  if (!MakePipe(err_pipe)) {
    int err = errno;
    close(out_pipe[0]);
    close(out_pipe[1]);
    throw runtime_failure(ErrnoMessage("pipe", err));
  }
  if (!MakePipe(error_pipe)) {
    int err = errno;
    close(out_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[0]);
    close(err_pipe[1]);
    throw runtime_failure(ErrnoMessage("pipe", err));
  }

  // Prepare args before forking, the child must not allocate memory.
  std::vector<std::vector<char>> vec_args;
  for (const std::string& arg : args_) {
    vec_args.emplace_back(arg.begin(), arg.end());
    vec_args.back().push_back(0);
  }
  std::vector<char*> argv;
  for (std::vector<char>& arg : vec_args) argv.push_back(arg.data());
  argv.push_back(nullptr);

  int fork_result = fork();
  if (fork_result == -1) {
    int err = errno;
    for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1],
                   error_pipe[0], error_pipe[1]}) {
      close(fd);
    }
    throw runtime_failure(ErrnoMessage("fork", err));
  }
  if (fork_result == 0) {
    close(out_pipe[0]);
    close(err_pipe[0]);
    close(error_pipe[0]);
    Child(argv.data(), out_pipe[1], err_pipe[1], error_pipe[1]);
  }

  child_pid_ = fork_result;
  close(out_pipe[1]);
  close(err_pipe[1]);
  close(error_pipe[1]);
  stdout_fd_ = out_pipe[0];
  stderr_fd_ = err_pipe[0];

  // The error pipe is closed on a successful exec, otherwise the child writes
  // the reason of the failure.
  int error_len = 0;
  ssize_t got;
  do {
    got = read(error_pipe[0], &error_len, sizeof(error_len));
  } while (got == -1 && errno == EINTR);
  if (got == sizeof(error_len)) {
    char error[kStrErrorBufSize + 64] = {};
    size_t len = std::min<size_t>(error_len, sizeof(error) - 1);
    ssize_t msg_len = read(error_pipe[0], error, len);
    close(error_pipe[0]);
    Wait();
    CloseFds();
    throw runtime_failure(args_[0] + ": " +
                          std::string(error, msg_len > 0 ? msg_len : 0));
  }
  close(error_pipe[0]);
  VLOG(2) << "Started " << absl::StrJoin(args_, " ") << " as " << child_pid_;
}

void Subprocess::Child(char* const* argv, int stdout_fd, int stderr_fd,
                       int error_fd) {
  auto die = [error_fd](const char* prefix, int err) {
    char buf[kStrErrorBufSize + 64 + 2] = {};
    char err_buf[kStrErrorBufSize] = {};
    strncat(buf, prefix, 64);
    strncat(buf, ": ", 3);
    strncat(buf, mystrerror(err, err_buf, kStrErrorBufSize),
            kStrErrorBufSize - 1);
    int len = strlen(buf);
    if (write(error_fd, &len, sizeof(len)) == sizeof(len)) {
      ssize_t written = write(error_fd, buf, len);
      (void)written;
    }
    _Exit(127);
  };

  // Change process group, so that we do not receive Ctrl-Cs in the terminal.
  if (setsid() == -1) die("setsid", errno);

  int null_fd = open("/dev/null", O_RDONLY);
  if (null_fd == -1) die("open", errno);
  if (dup2(null_fd, STDIN_FILENO) == -1) die("redir stdin", errno);
  if (dup2(stdout_fd, STDOUT_FILENO) == -1) die("redir stdout", errno);
  if (dup2(stderr_fd, STDERR_FILENO) == -1) die("redir stderr", errno);

  execvp(argv[0], argv);
  die("exec", errno);
  _Exit(127);
}

bool Subprocess::Read(Chunk* chunk, int64_t timeout_millis) {
  *chunk = Chunk();
  auto start = std::chrono::steady_clock::now();
  char buf[kReadSize];
  while (stdout_fd_ != -1 || stderr_fd_ != -1) {
    struct pollfd fds[2];
    int nfds = 0;
    if (stdout_fd_ != -1) fds[nfds++] = {stdout_fd_, POLLIN, 0};
    if (stderr_fd_ != -1) fds[nfds++] = {stderr_fd_, POLLIN, 0};

    int wait_millis = -1;
    if (timeout_millis > 0) {
      int64_t remaining = timeout_millis - MillisSince(start);
      if (remaining <= 0) remaining = 0;
      wait_millis = static_cast<int>(remaining);
    }
    int ret = poll(fds, nfds, wait_millis);
    if (ret == -1 && errno == EINTR) continue;
    if (ret == -1) throw runtime_failure(ErrnoMessage("poll", errno));
    if (ret == 0) {
      Kill();
      throw execution_timeout("No output from " + args_[0] + " for " +
                              std::to_string(timeout_millis) + "ms");
    }

    bool got_data = false;
    for (int i = 0; i < nfds; i++) {
      if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
      ssize_t amount;
      do {
        amount = read(fds[i].fd, buf, kReadSize);
      } while (amount == -1 && errno == EINTR);
      bool is_stdout = fds[i].fd == stdout_fd_;
      if (amount <= 0) {
        close(fds[i].fd);
        (is_stdout ? stdout_fd_ : stderr_fd_) = -1;
        continue;
      }
      (is_stdout ? chunk->stdout_data : chunk->stderr_data) =
          std::string(buf, amount);
      got_data = true;
    }
    if (got_data) return true;
  }
  return false;
}

int Subprocess::Wait() {
  if (reaped_) return exit_code_;
  if (child_pid_ == 0) throw std::logic_error("Subprocess was not started");
  int child_status = 0;
  int ret;
  do {
    ret = waitpid(child_pid_, &child_status, 0);
  } while (ret == -1 && errno == EINTR);
  if (ret == -1) throw runtime_failure(ErrnoMessage("waitpid", errno));
  reaped_ = true;
  if (WIFEXITED(child_status)) {
    exit_code_ = WEXITSTATUS(child_status);
  } else if (WIFSIGNALED(child_status)) {
    exit_code_ = 128 + WTERMSIG(child_status);
  }
  return exit_code_;
}

void Subprocess::Kill() {
  if (child_pid_ == 0 || reaped_) return;
  // The child leads its own process group, which is killed as a whole.
  if (kill(-child_pid_, SIGKILL) == -1 && errno != ESRCH) {
    LOG(WARNING) << ErrnoMessage("kill", errno);
  }
}

ExecResult RunProcess(const std::vector<std::string>& args,
                      int64_t timeout_millis) {
  Subprocess process(args);
  process.Start();
  auto start = std::chrono::steady_clock::now();
  ExecResult result;
  Chunk chunk;
  while (true) {
    int64_t remaining = 0;
    if (timeout_millis > 0) {
      remaining = timeout_millis - MillisSince(start);
      if (remaining <= 0) {
        process.Kill();
        throw execution_timeout(args[0] + " did not complete in " +
                                std::to_string(timeout_millis) + "ms");
      }
    }
    if (!process.Read(&chunk, remaining)) break;
    if (chunk.stdout_data) result.stdout_data += *chunk.stdout_data;
    if (chunk.stderr_data) result.stderr_data += *chunk.stderr_data;
  }
  result.exit_code = process.Wait();
  return result;
}

}  // namespace runtime
