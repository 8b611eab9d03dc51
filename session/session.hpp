#ifndef SESSION_SESSION_HPP
#define SESSION_SESSION_HPP

#include <string>
#include <vector>

#include "core/console_output.hpp"

namespace session {

// Interface used to run code and commands in a sandbox. Callbacks receive the
// output as it is produced; they are only used for the duration of the call.
class Session {
 public:
  // Runs code, after installing libraries if any are given.
  core::ConsoleOutput Run(const std::string& code,
                          const std::vector<std::string>& libraries = {},
                          int64_t timeout_millis = 0,
                          const core::StreamCallback& on_stdout = {},
                          const core::StreamCallback& on_stderr = {}) {
    return RunInternal(code, libraries, timeout_millis, on_stdout, on_stderr);
  }

  core::ConsoleOutput ExecuteCommand(const std::string& command,
                                     const std::string& workdir = "",
                                     const core::StreamCallback& on_stdout = {},
                                     const core::StreamCallback& on_stderr = {},
                                     int64_t timeout_millis = 0) {
    return ExecuteCommandInternal(command, workdir, on_stdout, on_stderr,
                                  timeout_millis);
  }

  // Runs commands in order, stopping at the first one that fails. Returns the
  // output of the last command that was run. Commands without a workdir use
  // the given one.
  core::ConsoleOutput ExecuteCommands(
      const std::vector<core::Command>& commands,
      const std::string& workdir = "",
      const core::StreamCallback& on_stdout = {},
      const core::StreamCallback& on_stderr = {}, int64_t timeout_millis = 0) {
    return ExecuteCommandsInternal(commands, workdir, on_stdout, on_stderr,
                                   timeout_millis);
  }

  Session() = default;
  virtual ~Session() = default;
  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

 protected:
  virtual core::ConsoleOutput RunInternal(
      const std::string& code, const std::vector<std::string>& libraries,
      int64_t timeout_millis, const core::StreamCallback& on_stdout,
      const core::StreamCallback& on_stderr) = 0;

  virtual core::ConsoleOutput ExecuteCommandInternal(
      const std::string& command, const std::string& workdir,
      const core::StreamCallback& on_stdout,
      const core::StreamCallback& on_stderr, int64_t timeout_millis) = 0;

  virtual core::ConsoleOutput ExecuteCommandsInternal(
      const std::vector<core::Command>& commands, const std::string& workdir,
      const core::StreamCallback& on_stdout,
      const core::StreamCallback& on_stderr, int64_t timeout_millis) = 0;
};

}  // namespace session

#endif
