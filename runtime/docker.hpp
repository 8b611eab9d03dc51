#ifndef RUNTIME_DOCKER_HPP
#define RUNTIME_DOCKER_HPP

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "runtime/runtime.hpp"

namespace runtime {

// Runtime that drives containers through the docker command line client.
class DockerRuntime : public Runtime {
 public:
  std::string Name() const override { return "docker"; }
  std::string CreateContainer(const ContainerOptions& options) override;
  void StartContainer(const std::string& handle) override;
  void StopContainer(const std::string& handle) override;
  void RemoveContainer(const std::string& handle) override;
  bool IsRunning(const std::string& handle) override;
  void CopyTo(const std::string& handle, const std::string& host_path,
              const std::string& container_path) override;
  ExecResult Exec(const std::string& handle, const std::string& command,
                  const std::string& workdir, int64_t timeout_millis) override;
  std::unique_ptr<ChunkStream> ExecStream(const std::string& handle,
                                          const std::string& command,
                                          const std::string& workdir) override;

  static Runtime* Create();
  static int Score();

  // Command lines used to talk to the client.
  static std::vector<std::string> CreateArgs(const std::string& binary,
                                             const ContainerOptions& options);
  static std::vector<std::string> ExecArgs(const std::string& binary,
                                           const std::string& handle,
                                           const std::string& command,
                                           const std::string& workdir);

  explicit DockerRuntime(std::string binary) : binary_(std::move(binary)) {}

 protected:
  // Runs a management command (create, start...) and returns its standard
  // output. Throws runtime_failure if the command fails.
  std::string Manage(const std::vector<std::string>& args,
                     const std::string& what);

  std::string binary_;
};

// Podman accepts the same command line as docker.
class PodmanRuntime : public DockerRuntime {
 public:
  std::string Name() const override { return "podman"; }
  static Runtime* Create();
  static int Score();

  explicit PodmanRuntime(std::string binary)
      : DockerRuntime(std::move(binary)) {}
};

}  // namespace runtime

#endif
