#include "runtime/docker.hpp"

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "nlohmann/json.hpp"
#include "runtime/process.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/shell.hpp"
#include "util/which.hpp"

namespace runtime {

namespace {

// Management commands may need to pull an image, so they get a generous limit.
static const constexpr int64_t kManageTimeoutMillis = 10 * 60 * 1000;

class DockerChunkStream : public ChunkStream {
 public:
  explicit DockerChunkStream(std::vector<std::string> args)
      : process_(std::move(args)) {
    process_.Start();
  }

  bool Next(Chunk* chunk, int64_t timeout_millis) override {
    return process_.Read(chunk, timeout_millis);
  }

  int ExitCode() override { return process_.Wait(); }

 private:
  Subprocess process_;
};

}  // namespace

std::vector<std::string> DockerRuntime::CreateArgs(
    const std::string& binary, const ContainerOptions& options) {
  std::vector<std::string> args = {binary, "create", "--init"};
  if (!options.memory_limit.empty()) {
    args.push_back("--memory=" + options.memory_limit);
  }
  if (!options.cpu_limit.empty()) {
    args.push_back("--cpus=" + options.cpu_limit);
  }
  if (!options.network.empty()) {
    args.push_back("--network=" + options.network);
  }
  for (const auto& var : options.env) {
    args.push_back("--env=" + var.first + "=" + var.second);
  }
  for (const std::string& arg : options.extra_args) args.push_back(arg);
  args.push_back(options.image);
  // Keep the container alive, commands are run with exec.
  args.insert(args.end(), {"tail", "-f", "/dev/null"});
  return args;
}

std::vector<std::string> DockerRuntime::ExecArgs(const std::string& binary,
                                                 const std::string& handle,
                                                 const std::string& command,
                                                 const std::string& workdir) {
  std::vector<std::string> args = {binary, "exec"};
  if (!workdir.empty()) {
    args.push_back("--workdir=" + workdir);
  }
  args.insert(args.end(), {handle, "sh", "-c", command});
  return args;
}

std::string DockerRuntime::Manage(const std::vector<std::string>& args,
                                  const std::string& what) {
  ExecResult result = RunProcess(args, kManageTimeoutMillis);
  if (result.exit_code != 0) {
    throw runtime_failure(absl::StrCat(
        binary_, " ", what, " failed (", result.exit_code,
        "): ", absl::StripAsciiWhitespace(result.stderr_data)));
  }
  return result.stdout_data;
}

std::string DockerRuntime::CreateContainer(const ContainerOptions& options) {
  if (options.image.empty()) {
    throw runtime_failure("No image given for the container");
  }
  std::string handle(absl::StripAsciiWhitespace(
      Manage(CreateArgs(binary_, options), "create")));
  if (handle.empty()) {
    throw runtime_failure(binary_ + " create did not return a container id");
  }
  LOG(INFO) << "Created container " << handle.substr(0, 12) << " from "
            << options.image;
  return handle;
}

void DockerRuntime::StartContainer(const std::string& handle) {
  Manage({binary_, "start", handle}, "start");
}

void DockerRuntime::StopContainer(const std::string& handle) {
  Manage({binary_, "stop", "--time=1", handle}, "stop");
}

void DockerRuntime::RemoveContainer(const std::string& handle) {
  Manage({binary_, "rm", "--force", handle}, "rm");
  LOG(INFO) << "Removed container " << handle.substr(0, 12);
}

bool DockerRuntime::IsRunning(const std::string& handle) {
  ExecResult result = RunProcess(
      {binary_, "inspect", "--format={{json .State}}", handle},
      kManageTimeoutMillis);
  if (result.exit_code != 0) return false;
  try {
    auto state = nlohmann::json::parse(result.stdout_data);
    return state.value("Running", false);
  } catch (const nlohmann::json::exception& exc) {
    LOG(WARNING) << "Unexpected state for container " << handle << ": "
                 << exc.what();
    return false;
  }
}

void DockerRuntime::CopyTo(const std::string& handle,
                           const std::string& host_path,
                           const std::string& container_path) {
  std::string parent = util::File::BaseDir(container_path);
  ExecResult mkdir = Exec(handle, "mkdir -p " + util::ShellQuote(parent), "",
                          kManageTimeoutMillis);
  if (mkdir.exit_code != 0) {
    throw runtime_failure("Could not create the parent of " + container_path +
                          ": " + mkdir.stderr_data);
  }
  Manage({binary_, "cp", host_path, handle + ":" + container_path}, "cp");
}

ExecResult DockerRuntime::Exec(const std::string& handle,
                               const std::string& command,
                               const std::string& workdir,
                               int64_t timeout_millis) {
  return RunProcess(ExecArgs(binary_, handle, command, workdir),
                    timeout_millis);
}

std::unique_ptr<ChunkStream> DockerRuntime::ExecStream(
    const std::string& handle, const std::string& command,
    const std::string& workdir) {
  return std::unique_ptr<ChunkStream>(
      new DockerChunkStream(ExecArgs(binary_, handle, command, workdir)));
}

Runtime* DockerRuntime::Create() {
  return new DockerRuntime(util::which(FLAGS_docker_binary));
}

int DockerRuntime::Score() {
  if (!FLAGS_runtime.empty() && FLAGS_runtime != "docker") return -1;
  if (util::which(FLAGS_docker_binary).empty()) return -1;
  return 2;
}

Runtime* PodmanRuntime::Create() {
  return new PodmanRuntime(util::which(FLAGS_podman_binary));
}

int PodmanRuntime::Score() {
  if (!FLAGS_runtime.empty() && FLAGS_runtime != "podman") return -1;
  if (util::which(FLAGS_podman_binary).empty()) return -1;
  return 1;
}

namespace {
Runtime::Register<DockerRuntime> docker_registration;
Runtime::Register<PodmanRuntime> podman_registration;
}  // namespace

}  // namespace runtime
