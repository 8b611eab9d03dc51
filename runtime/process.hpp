#ifndef RUNTIME_PROCESS_HPP
#define RUNTIME_PROCESS_HPP

#include <sys/types.h>

#include <string>
#include <vector>

#include "runtime/runtime.hpp"

namespace runtime {

// A child process whose standard output and standard error are read through
// pipes. Standard input is /dev/null.
class Subprocess {
 public:
  explicit Subprocess(std::vector<std::string> args);
  ~Subprocess();

  // Creates the child process. Throws runtime_failure if the program could not
  // be started.
  void Start();

  // Reads the next available output of the child. Returns false once both
  // pipes are closed. If nothing is received for timeout_millis (when
  // positive), the child is killed and execution_timeout is thrown.
  bool Read(Chunk* chunk, int64_t timeout_millis);

  // Waits for the child to terminate and returns its exit code. A child killed
  // by a signal gets 128 + the signal number, like in a shell.
  int Wait();

  void Kill();

  Subprocess(const Subprocess&) = delete;
  Subprocess& operator=(const Subprocess&) = delete;
  Subprocess(Subprocess&&) = delete;
  Subprocess& operator=(Subprocess&&) = delete;

 private:
  [[noreturn]] void Child(char* const* argv, int stdout_fd, int stderr_fd,
                          int error_fd);
  void CloseFds();

  std::vector<std::string> args_;
  pid_t child_pid_ = 0;
  int stdout_fd_ = -1;
  int stderr_fd_ = -1;
  bool reaped_ = false;
  int exit_code_ = 0;
};

// Runs args to completion, collecting all of its output. Throws
// execution_timeout if the whole execution takes more than timeout_millis
// (when positive).
ExecResult RunProcess(const std::vector<std::string>& args,
                      int64_t timeout_millis = 0);

}  // namespace runtime

#endif
