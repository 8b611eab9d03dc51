#ifndef SESSION_ARTIFACT_SESSION_HPP
#define SESSION_ARTIFACT_SESSION_HPP

#include <string>
#include <vector>

#include "session/sandbox_session.hpp"
#include "session/session.hpp"

namespace session {

// Wraps a SandboxSession so that the artifacts created by Run (plots for
// instance) are returned in the output. Commands are forwarded unchanged.
class ArtifactSession : public Session {
 public:
  // Directory of the container where the artifacts are saved.
  static const constexpr char* kArtifactDir = "/tmp/codebox_artifacts";

  // session is not owned. Throws std::invalid_argument if artifacts are
  // enabled and the language of session cannot detect them.
  ArtifactSession(SandboxSession* session, bool enable_artifacts);

  bool ArtifactsEnabled() const { return enable_artifacts_; }

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
  void ClearArtifactDir();

  SandboxSession* session_;
  bool enable_artifacts_;
};

}  // namespace session

#endif
