#ifndef RUNTIME_RUNTIME_HPP
#define RUNTIME_RUNTIME_HPP

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "absl/types/optional.h"

namespace runtime {

// The runtime could not perform an operation (missing binary, failed fork,
// container that could not be created, exec that could not be dispatched...).
class runtime_failure : public std::runtime_error {
 public:
  explicit runtime_failure(const std::string& msg) : std::runtime_error(msg) {}
};

// A command did not complete, or did not produce output, in time.
class execution_timeout : public std::runtime_error {
 public:
  explicit execution_timeout(const std::string& msg)
      : std::runtime_error(msg) {}
};

// Settings used to create a container. Limits are passed to the runtime as
// they are.
struct ContainerOptions {
  std::string image;
  std::string memory_limit;
  std::string cpu_limit;
  std::string network;
  std::vector<std::pair<std::string, std::string>> env;
  std::vector<std::string> extra_args;
};

// Output of a command executed without streaming.
struct ExecResult {
  int exit_code = 0;
  std::string stdout_data;
  std::string stderr_data;
};

// A piece of output. Either position may be missing.
struct Chunk {
  absl::optional<std::string> stdout_data;
  absl::optional<std::string> stderr_data;
};

// Output of a command executed with streaming.
class ChunkStream {
 public:
  // Waits for the next chunk of output. Returns false when the command has
  // terminated and all its output was returned. Throws execution_timeout if no
  // chunk arrives within timeout_millis (a non-positive value waits forever).
  virtual bool Next(Chunk* chunk, int64_t timeout_millis) = 0;

  // Exit code of the command. Only valid after Next returned false.
  virtual int ExitCode() = 0;

  ChunkStream() = default;
  virtual ~ChunkStream() = default;
  ChunkStream(const ChunkStream&) = delete;
  ChunkStream& operator=(const ChunkStream&) = delete;
};

// Container runtime interface. Implementations need to register themselves by
// creating a global object of type Runtime::Register<RuntimeImpl> and should
// define the Create and Score static functions. Create should return a pointer
// to a newly allocated instance of the given implementation, while Score
// should return a value that defines how "good" that runtime is: negative if
// the runtime should not/cannot be used in the current configuration, positive
// otherwise (a bigger value means a better runtime).
// Registering a runtime is not thread-safe and should be done before any
// threads are created.
class Runtime {
 public:
  using create_t = std::function<Runtime*()>;
  using score_t = std::function<int()>;
  static std::unique_ptr<Runtime> Create();

  // A string that identifies this runtime.
  virtual std::string Name() const = 0;

  // Creates a container and returns its handle.
  virtual std::string CreateContainer(const ContainerOptions& options) = 0;
  virtual void StartContainer(const std::string& handle) = 0;
  virtual void StopContainer(const std::string& handle) = 0;
  virtual void RemoveContainer(const std::string& handle) = 0;
  virtual bool IsRunning(const std::string& handle) = 0;

  // Copies a file from the host into the container.
  virtual void CopyTo(const std::string& handle, const std::string& host_path,
                      const std::string& container_path) = 0;

  // Runs command with sh -c inside the container and waits for it. An empty
  // workdir uses the default directory of the container. Throws
  // execution_timeout if the command takes more than timeout_millis.
  virtual ExecResult Exec(const std::string& handle, const std::string& command,
                          const std::string& workdir,
                          int64_t timeout_millis) = 0;

  // Like Exec, but returns the output as soon as it is produced.
  virtual std::unique_ptr<ChunkStream> ExecStream(
      const std::string& handle, const std::string& command,
      const std::string& workdir) = 0;

  Runtime() = default;
  virtual ~Runtime() = default;
  Runtime(const Runtime&) = delete;
  Runtime(Runtime&&) = delete;
  Runtime& operator=(const Runtime&) = delete;
  Runtime& operator=(Runtime&&) = delete;

  template <typename T>
  class Register {
   public:
    Register() { Runtime::Register_(&T::Create, &T::Score); }
  };

 private:
  using store_t = std::vector<std::pair<create_t, score_t>>;
  static store_t* Runtimes_();
  static void Register_(create_t, score_t);
  template <typename T>
  friend class Register;
};

}  // namespace runtime

#endif
