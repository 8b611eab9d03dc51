#include "session/sandbox_session.hpp"

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "glog/logging.h"
#include "language/language_factory.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace session {

namespace {

BackendOptions MakeBackendOptions(const SessionOptions& options,
                                  const language::LanguageHandler& handler) {
  BackendOptions backend;
  backend.container.image =
      options.image.empty() ? handler.DefaultImage() : options.image;
  backend.container.memory_limit = options.memory_limit;
  backend.container.cpu_limit = options.cpu_limit;
  backend.container.network = options.network;
  backend.container.env = options.env;
  backend.workdir = options.workdir;
  backend.stream = options.stream;
  backend.execution_timeout_millis = options.execution_timeout_millis;
  return backend;
}

}  // namespace

SessionOptions SessionOptions::FromFlags(language::Language language) {
  SessionOptions options;
  options.language = language;
  options.memory_limit = FLAGS_memory_limit;
  options.cpu_limit = FLAGS_cpu_limit;
  options.network = FLAGS_network;
  options.workdir = FLAGS_workdir;
  options.stream = FLAGS_stream;
  options.execution_timeout_millis = FLAGS_execution_timeout_millis;
  options.temp_directory = FLAGS_temp_directory;
  return options;
}

std::string SessionOptions::Key() const {
  std::string env_key =
      absl::StrJoin(env, ",", absl::PairFormatter("="));
  return absl::StrJoin(
      {language::LanguageName(language), image, memory_limit, cpu_limit,
       network, env_key, workdir, std::string(stream ? "stream" : "buffer"),
       absl::StrCat(execution_timeout_millis),
       std::string(skip_environment_setup ? "bare" : "setup")},
      "|");
}

SandboxSession::SandboxSession(runtime::Runtime* runtime,
                               SessionOptions options)
    : options_(std::move(options)),
      handler_(language::LanguageHandlerFactory::Create(options_.language)),
      backend_(runtime, MakeBackendOptions(options_, *handler_)) {}

void SandboxSession::Open() {
  backend_.Open();
  if (options_.skip_environment_setup) return;
  try {
    SetupEnvironment();
  } catch (const std::exception& exc) {
    LOG(ERROR) << "Environment setup failed for " << handler_->Name() << ": "
               << exc.what();
    try {
      backend_.Close();
    } catch (const std::exception& close_exc) {
      LOG(WARNING) << "Failed to close the session: " << close_exc.what();
    }
    throw;
  }
}

void SandboxSession::SetupEnvironment() {
  for (const core::Command& command :
       handler_->BuildSetupCommands(options_.workdir)) {
    core::ConsoleOutput output =
        backend_.ExecuteCommand(command.text, command.workdir, {}, {}, 0);
    if (!output.Success()) {
      throw runtime::runtime_failure(
          absl::StrCat("Setup command '", command.text, "' failed (",
                       output.exit_code, "): ", output.stderr_text));
    }
  }
}

core::ConsoleOutput SandboxSession::Install(
    const std::vector<std::string>& libraries,
    const core::StreamCallback& on_stdout,
    const core::StreamCallback& on_stderr, int64_t timeout_millis) {
  absl::optional<core::Command> install =
      handler_->BuildInstallCommand(libraries, options_.workdir);
  if (!install) return core::ConsoleOutput(0);
  return ExecuteCommand(install->text, install->workdir, on_stdout, on_stderr,
                        timeout_millis);
}

core::ConsoleOutput SandboxSession::RunInternal(
    const std::string& code, const std::vector<std::string>& libraries,
    int64_t timeout_millis, const core::StreamCallback& on_stdout,
    const core::StreamCallback& on_stderr) {
  std::string code_path =
      util::File::JoinPath(options_.workdir, handler_->CodeFileName());
  {
    util::TempDir staging(options_.temp_directory);
    std::string host_path =
        util::File::JoinPath(staging.Path(), handler_->CodeFileName());
    util::File::Write(host_path, code);
    backend_.CopyToRuntime(host_path, code_path);
  }

  std::vector<core::Command> commands;
  absl::optional<core::Command> install =
      handler_->BuildInstallCommand(libraries, options_.workdir);
  if (install) commands.push_back(*install);
  for (core::Command& command :
       handler_->BuildRunCommands(code_path, options_.workdir)) {
    commands.push_back(std::move(command));
  }
  return ExecuteCommands(commands, options_.workdir, on_stdout, on_stderr,
                         timeout_millis);
}

core::ConsoleOutput SandboxSession::ExecuteCommandInternal(
    const std::string& command, const std::string& workdir,
    const core::StreamCallback& on_stdout,
    const core::StreamCallback& on_stderr, int64_t timeout_millis) {
  return backend_.ExecuteCommand(command, workdir, on_stdout, on_stderr,
                                 timeout_millis);
}

core::ConsoleOutput SandboxSession::ExecuteCommandsInternal(
    const std::vector<core::Command>& commands, const std::string& workdir,
    const core::StreamCallback& on_stdout,
    const core::StreamCallback& on_stderr, int64_t timeout_millis) {
  core::ConsoleOutput output(0);
  for (const core::Command& command : commands) {
    output = ExecuteCommand(command.text,
                            command.workdir.empty() ? workdir : command.workdir,
                            on_stdout, on_stderr, timeout_millis);
    if (!output.Success()) {
      VLOG(1) << "Stopping after '" << command.text << "' exited with "
              << output.exit_code;
      break;
    }
  }
  return output;
}

}  // namespace session
