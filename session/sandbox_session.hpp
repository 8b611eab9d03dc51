#ifndef SESSION_SANDBOX_SESSION_HPP
#define SESSION_SANDBOX_SESSION_HPP

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "language/language_handler.hpp"
#include "runtime/runtime.hpp"
#include "session/backend_session.hpp"
#include "session/session.hpp"

namespace session {

struct SessionOptions {
  language::Language language = language::Language::PYTHON;
  // Container image, the default image of the language if empty.
  std::string image;
  std::string memory_limit;
  std::string cpu_limit;
  std::string network;
  std::vector<std::pair<std::string, std::string>> env;
  std::string workdir = "/sandbox";
  bool stream = true;
  int64_t execution_timeout_millis = 60 * 1000;
  // Do not run the setup commands of the language when opening.
  bool skip_environment_setup = false;
  // Host directory used to stage the code.
  std::string temp_directory = "/tmp/codebox";

  static SessionOptions FromFlags(language::Language language);

  // Sessions opened with options that have the same key are interchangeable.
  std::string Key() const;
};

// Runs code of one language inside one container.
class SandboxSession : public Session {
 public:
  SandboxSession(runtime::Runtime* runtime, SessionOptions options);

  // Opens the container and prepares the environment. Throws
  // runtime::runtime_failure, after closing the session, if the preparation
  // fails.
  void Open();
  void Close() { backend_.Close(); }

  bool IsOpen() const { return backend_.IsOpen(); }
  bool IsTainted() const { return backend_.IsTainted(); }
  bool IsHealthy() { return backend_.IsHealthy(); }

  // Installs libraries without running any code.
  core::ConsoleOutput Install(const std::vector<std::string>& libraries,
                              const core::StreamCallback& on_stdout = {},
                              const core::StreamCallback& on_stderr = {},
                              int64_t timeout_millis = 0);

  const language::LanguageHandler& Handler() const { return *handler_; }
  const SessionOptions& Options() const { return options_; }
  BackendSession* Backend() { return &backend_; }

 protected:
  core::ConsoleOutput RunInternal(
      const std::string& code, const std::vector<std::string>& libraries,
      int64_t timeout_millis, const core::StreamCallback& on_stdout,
      const core::StreamCallback& on_stderr) override;

  core::ConsoleOutput ExecuteCommandInternal(
      const std::string& command, const std::string& workdir,
      const core::StreamCallback& on_stdout,
      const core::StreamCallback& on_stderr, int64_t timeout_millis) override;

  core::ConsoleOutput ExecuteCommandsInternal(
      const std::vector<core::Command>& commands, const std::string& workdir,
      const core::StreamCallback& on_stdout,
      const core::StreamCallback& on_stderr, int64_t timeout_millis) override;

 private:
  void SetupEnvironment();

  SessionOptions options_;
  std::unique_ptr<language::LanguageHandler> handler_;
  BackendSession backend_;
};

}  // namespace session

#endif
