#include "session/backend_session.hpp"

#include "glog/logging.h"
#include "util/utf8.hpp"

namespace session {

namespace {

std::string Decode(const std::string& bytes) {
  util::Utf8Decoder decoder;
  return decoder.Decode(bytes) + decoder.Flush();
}

}  // namespace

BackendSession::BusyGuard::BusyGuard(std::atomic<bool>* busy,
                                     const char* operation)
    : busy_(busy) {
  if (busy_->exchange(true)) {
    throw invalid_state(std::string("Cannot ") + operation +
                        ": the session is executing another command");
  }
}

BackendSession::BackendSession(runtime::Runtime* runtime,
                               BackendOptions options)
    : runtime_(runtime), options_(std::move(options)) {
  CHECK(runtime_) << "No runtime given";
}

BackendSession::~BackendSession() {
  try {
    Close();
  } catch (const std::exception& exc) {
    LOG(WARNING) << "Failed to close container " << handle_ << ": "
                 << exc.what();
  }
}

void BackendSession::CheckOpen(const char* operation) const {
  if (!open_) {
    throw invalid_state(std::string("Cannot ") + operation +
                        ": the session is not open");
  }
}

void BackendSession::Open() {
  BusyGuard guard(&busy_, "open");
  if (open_) throw invalid_state("The session is already open");
  std::string handle = runtime_->CreateContainer(options_.container);
  try {
    runtime_->StartContainer(handle);
  } catch (const runtime::runtime_failure& exc) {
    LOG(ERROR) << "Failed to start container " << handle << ": " << exc.what();
    try {
      runtime_->RemoveContainer(handle);
    } catch (const std::exception& remove_exc) {
      LOG(WARNING) << "Failed to remove container " << handle << ": "
                   << remove_exc.what();
    }
    throw;
  }
  handle_ = handle;
  tainted_ = false;
  open_ = true;
  LOG(INFO) << "Started container " << handle_ << " (" << runtime_->Name()
            << ", " << options_.container.image << ")";
}

void BackendSession::Close() {
  BusyGuard guard(&busy_, "close");
  if (!open_) return;
  try {
    runtime_->StopContainer(handle_);
  } catch (const runtime::runtime_failure& exc) {
    // Removal is forced, so it can still succeed.
    LOG(WARNING) << "Failed to stop container " << handle_ << ": "
                 << exc.what();
  }
  runtime_->RemoveContainer(handle_);
  open_ = false;
  LOG(INFO) << "Removed container " << handle_;
}

bool BackendSession::IsHealthy() {
  if (!open_ || tainted_) return false;
  try {
    return runtime_->IsRunning(handle_);
  } catch (const runtime::runtime_failure& exc) {
    LOG(WARNING) << "Could not check container " << handle_ << ": "
                 << exc.what();
    return false;
  }
}

core::ConsoleOutput BackendSession::ExecuteCommand(
    const std::string& command, const std::string& workdir,
    const core::StreamCallback& on_stdout,
    const core::StreamCallback& on_stderr, int64_t timeout_millis) {
  BusyGuard guard(&busy_, "execute a command");
  CheckOpen("execute a command");
  if (timeout_millis == 0) timeout_millis = options_.execution_timeout_millis;
  if (timeout_millis < 0) timeout_millis = 0;
  const std::string& dir = workdir.empty() ? options_.workdir : workdir;
  bool stream = options_.stream || on_stdout || on_stderr;
  VLOG(1) << "Executing in " << handle_ << ":" << dir << ": " << command
          << (stream ? " (streamed)" : "");
  try {
    if (stream) {
      return ExecuteStreamed(command, dir, on_stdout, on_stderr,
                             timeout_millis);
    }
    return ExecuteBuffered(command, dir, timeout_millis);
  } catch (const runtime::execution_timeout& exc) {
    LOG(WARNING) << "Command timed out in " << handle_ << ": " << exc.what();
    tainted_ = true;
    throw;
  } catch (const runtime::runtime_failure& exc) {
    LOG(WARNING) << "Runtime failure in " << handle_ << ": " << exc.what();
    tainted_ = true;
    throw;
  }
}

core::ConsoleOutput BackendSession::ExecuteStreamed(
    const std::string& command, const std::string& workdir,
    const core::StreamCallback& on_stdout,
    const core::StreamCallback& on_stderr, int64_t timeout_millis) {
  std::unique_ptr<runtime::ChunkStream> stream =
      runtime_->ExecStream(handle_, command, workdir);
  std::pair<std::string, std::string> output =
      multiplexer_.Process(stream.get(), on_stdout, on_stderr, timeout_millis);
  return core::ConsoleOutput(stream->ExitCode(), std::move(output.first),
                             std::move(output.second));
}

core::ConsoleOutput BackendSession::ExecuteBuffered(const std::string& command,
                                                    const std::string& workdir,
                                                    int64_t timeout_millis) {
  runtime::ExecResult result =
      runtime_->Exec(handle_, command, workdir, timeout_millis);
  return core::ConsoleOutput(result.exit_code, Decode(result.stdout_data),
                             Decode(result.stderr_data));
}

void BackendSession::CopyToRuntime(const std::string& host_path,
                                   const std::string& container_path) {
  BusyGuard guard(&busy_, "copy a file");
  CheckOpen("copy a file");
  try {
    runtime_->CopyTo(handle_, host_path, container_path);
  } catch (const runtime::runtime_failure&) {
    tainted_ = true;
    throw;
  }
}

}  // namespace session
