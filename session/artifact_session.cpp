#include "session/artifact_session.hpp"

#include <stdexcept>

#include "glog/logging.h"
#include "util/shell.hpp"

namespace session {

const constexpr char* ArtifactSession::kArtifactDir;

ArtifactSession::ArtifactSession(SandboxSession* session,
                                 bool enable_artifacts)
    : session_(session), enable_artifacts_(enable_artifacts) {
  CHECK(session_) << "No session given";
  if (enable_artifacts_ && !session_->Handler().SupportsArtifactDetection()) {
    throw std::invalid_argument("Artifact detection is not supported for " +
                                session_->Handler().Name());
  }
}

void ArtifactSession::ClearArtifactDir() {
  std::string dir = util::ShellQuote(kArtifactDir);
  core::ConsoleOutput output =
      session_->ExecuteCommand("rm -rf " + dir + " && mkdir -p " + dir, "/");
  if (!output.Success()) {
    throw runtime::runtime_failure("Could not clear the artifact directory: " +
                                   output.stderr_text);
  }
}

core::ConsoleOutput ArtifactSession::RunInternal(
    const std::string& code, const std::vector<std::string>& libraries,
    int64_t timeout_millis, const core::StreamCallback& on_stdout,
    const core::StreamCallback& on_stderr) {
  if (!enable_artifacts_) {
    return session_->Run(code, libraries, timeout_millis, on_stdout,
                         on_stderr);
  }
  const language::LanguageHandler& handler = session_->Handler();
  ClearArtifactDir();
  core::ConsoleOutput output =
      session_->Run(handler.InjectArtifactCapture(code, kArtifactDir),
                    libraries, timeout_millis, on_stdout, on_stderr);
  language::CommandRunner runner = [this](const core::Command& command) {
    return session_->ExecuteCommand(command.text, command.workdir);
  };
  output.artifacts =
      handler.ExtractArtifacts(runner, kArtifactDir, output.stdout_text);
  VLOG(1) << "Extracted " << output.artifacts.size() << " artifacts";
  return output;
}

core::ConsoleOutput ArtifactSession::ExecuteCommandInternal(
    const std::string& command, const std::string& workdir,
    const core::StreamCallback& on_stdout,
    const core::StreamCallback& on_stderr, int64_t timeout_millis) {
  return session_->ExecuteCommand(command, workdir, on_stdout, on_stderr,
                                  timeout_millis);
}

core::ConsoleOutput ArtifactSession::ExecuteCommandsInternal(
    const std::vector<core::Command>& commands, const std::string& workdir,
    const core::StreamCallback& on_stdout,
    const core::StreamCallback& on_stderr, int64_t timeout_millis) {
  return session_->ExecuteCommands(commands, workdir, on_stdout, on_stderr,
                                   timeout_millis);
}

}  // namespace session
