#ifndef SESSION_BACKEND_SESSION_HPP
#define SESSION_BACKEND_SESSION_HPP

#include <atomic>
#include <stdexcept>
#include <string>

#include "core/console_output.hpp"
#include "runtime/runtime.hpp"
#include "session/stream_multiplexer.hpp"

namespace session {

// A session was used in a state that does not allow the operation: not open,
// already open, or busy with another command.
class invalid_state : public std::logic_error {
 public:
  explicit invalid_state(const std::string& msg) : std::logic_error(msg) {}
};

struct BackendOptions {
  runtime::ContainerOptions container;
  // Default working directory of the commands.
  std::string workdir = "/sandbox";
  // Stream the output of commands even if no callback is given.
  bool stream = true;
  int64_t execution_timeout_millis = 60 * 1000;
};

// Owns one container of a runtime, from Open to Close, and runs commands in
// it one at a time.
class BackendSession {
 public:
  BackendSession(runtime::Runtime* runtime, BackendOptions options);
  ~BackendSession();

  // Creates and starts the container.
  void Open();

  // Stops and removes the container. Does nothing if the session is not open.
  // If the removal fails the session stays open, so Close can be retried.
  void Close();

  bool IsOpen() const { return open_; }

  // Whether a command timed out or the runtime failed while executing.
  bool IsTainted() const { return tainted_; }

  // Open, not tainted, and with a running container.
  bool IsHealthy();

  // Runs a command and waits for it to complete. The output is streamed, and
  // passed to the callbacks, if any callback is given or if streaming is the
  // default for this session. An empty workdir means the session workdir.
  // timeout_millis is the maximum time without output when streaming and the
  // maximum duration otherwise; 0 means the session default and a negative
  // value means no limit.
  core::ConsoleOutput ExecuteCommand(const std::string& command,
                                     const std::string& workdir,
                                     const core::StreamCallback& on_stdout,
                                     const core::StreamCallback& on_stderr,
                                     int64_t timeout_millis);

  void CopyToRuntime(const std::string& host_path,
                     const std::string& container_path);

  const BackendOptions& Options() const { return options_; }
  const std::string& Handle() const { return handle_; }

  BackendSession(const BackendSession&) = delete;
  BackendSession& operator=(const BackendSession&) = delete;
  BackendSession(BackendSession&&) = delete;
  BackendSession& operator=(BackendSession&&) = delete;

 private:
  // Marks the session as busy for its lifetime. Throws invalid_state if the
  // session was already busy.
  class BusyGuard {
   public:
    BusyGuard(std::atomic<bool>* busy, const char* operation);
    ~BusyGuard() { *busy_ = false; }
    BusyGuard(const BusyGuard&) = delete;
    BusyGuard& operator=(const BusyGuard&) = delete;

   private:
    std::atomic<bool>* busy_;
  };

  void CheckOpen(const char* operation) const;

  core::ConsoleOutput ExecuteStreamed(const std::string& command,
                                      const std::string& workdir,
                                      const core::StreamCallback& on_stdout,
                                      const core::StreamCallback& on_stderr,
                                      int64_t timeout_millis);
  core::ConsoleOutput ExecuteBuffered(const std::string& command,
                                      const std::string& workdir,
                                      int64_t timeout_millis);

  runtime::Runtime* runtime_;
  BackendOptions options_;
  std::string handle_;
  std::atomic<bool> open_{false};
  std::atomic<bool> tainted_{false};
  std::atomic<bool> busy_{false};
  StreamMultiplexer multiplexer_;
};

}  // namespace session

#endif
