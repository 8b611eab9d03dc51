#ifndef POOL_POOLED_SESSION_HPP
#define POOL_POOLED_SESSION_HPP

#include <string>
#include <vector>

#include "pool/session_pool.hpp"
#include "session/sandbox_session.hpp"
#include "session/session.hpp"

namespace pool {

// A Session that leases a session of the pool for every call.
class PooledSession : public session::Session {
 public:
  // pool is not owned. Throws std::invalid_argument if artifacts are enabled
  // for a language that cannot detect them.
  PooledSession(SessionPool* pool, session::SessionOptions options,
                bool enable_artifacts = false);

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
  SessionPool* pool_;
  session::SessionOptions options_;
  bool enable_artifacts_;
};

}  // namespace pool

#endif
