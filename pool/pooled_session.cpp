#include "pool/pooled_session.hpp"

#include <stdexcept>

#include "glog/logging.h"
#include "language/language_factory.hpp"
#include "session/artifact_session.hpp"

namespace pool {

PooledSession::PooledSession(SessionPool* pool,
                             session::SessionOptions options,
                             bool enable_artifacts)
    : pool_(pool),
      options_(std::move(options)),
      enable_artifacts_(enable_artifacts) {
  CHECK(pool_) << "No pool given";
  if (enable_artifacts_ &&
      !language::LanguageHandlerFactory::Create(options_.language)
           ->SupportsArtifactDetection()) {
    throw std::invalid_argument("Artifact detection is not supported for " +
                                language::LanguageName(options_.language));
  }
}

core::ConsoleOutput PooledSession::RunInternal(
    const std::string& code, const std::vector<std::string>& libraries,
    int64_t timeout_millis, const core::StreamCallback& on_stdout,
    const core::StreamCallback& on_stderr) {
  SessionPool::Lease lease = pool_->Acquire(options_);
  if (enable_artifacts_) {
    session::ArtifactSession artifacts(lease.get(), true);
    return artifacts.Run(code, libraries, timeout_millis, on_stdout,
                         on_stderr);
  }
  return lease->Run(code, libraries, timeout_millis, on_stdout, on_stderr);
}

core::ConsoleOutput PooledSession::ExecuteCommandInternal(
    const std::string& command, const std::string& workdir,
    const core::StreamCallback& on_stdout,
    const core::StreamCallback& on_stderr, int64_t timeout_millis) {
  SessionPool::Lease lease = pool_->Acquire(options_);
  return lease->ExecuteCommand(command, workdir, on_stdout, on_stderr,
                               timeout_millis);
}

core::ConsoleOutput PooledSession::ExecuteCommandsInternal(
    const std::vector<core::Command>& commands, const std::string& workdir,
    const core::StreamCallback& on_stdout,
    const core::StreamCallback& on_stderr, int64_t timeout_millis) {
  SessionPool::Lease lease = pool_->Acquire(options_);
  return lease->ExecuteCommands(commands, workdir, on_stdout, on_stderr,
                                timeout_millis);
}

}  // namespace pool
