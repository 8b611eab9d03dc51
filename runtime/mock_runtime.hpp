#ifndef RUNTIME_MOCK_RUNTIME_HPP
#define RUNTIME_MOCK_RUNTIME_HPP

#include <deque>
#include <memory>
#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "runtime/runtime.hpp"

namespace runtime {

class MockRuntime : public Runtime {
 public:
  MOCK_CONST_METHOD0(Name, std::string());
  MOCK_METHOD1(CreateContainer, std::string(const ContainerOptions& options));
  MOCK_METHOD1(StartContainer, void(const std::string& handle));
  MOCK_METHOD1(StopContainer, void(const std::string& handle));
  MOCK_METHOD1(RemoveContainer, void(const std::string& handle));
  MOCK_METHOD1(IsRunning, bool(const std::string& handle));
  MOCK_METHOD3(CopyTo, void(const std::string& handle,
                            const std::string& host_path,
                            const std::string& container_path));
  MOCK_METHOD4(Exec, ExecResult(const std::string& handle,
                                const std::string& command,
                                const std::string& workdir,
                                int64_t timeout_millis));
  // gmock cannot return move-only types, so streams are returned as raw
  // pointers and owned by the caller.
  MOCK_METHOD3(ExecStreamProxy, ChunkStream*(const std::string& handle,
                                             const std::string& command,
                                             const std::string& workdir));

  std::unique_ptr<ChunkStream> ExecStream(const std::string& handle,
                                          const std::string& command,
                                          const std::string& workdir) override {
    return std::unique_ptr<ChunkStream>(
        ExecStreamProxy(handle, command, workdir));
  }
};

// Replays a fixed list of chunks. When timeout_after is non-negative, the
// stream throws execution_timeout once that many chunks have been returned.
class VectorChunkStream : public ChunkStream {
 public:
  explicit VectorChunkStream(std::vector<Chunk> chunks, int exit_code = 0,
                             int timeout_after = -1)
      : chunks_(chunks.begin(), chunks.end()),
        exit_code_(exit_code),
        timeout_after_(timeout_after) {}

  bool Next(Chunk* chunk, int64_t timeout_millis) override {
    if (timeout_after_ == returned_) {
      throw execution_timeout("No output for " +
                              std::to_string(timeout_millis) + "ms");
    }
    if (chunks_.empty()) return false;
    *chunk = chunks_.front();
    chunks_.pop_front();
    returned_++;
    return true;
  }

  int ExitCode() override { return exit_code_; }

 private:
  std::deque<Chunk> chunks_;
  int exit_code_;
  int timeout_after_;
  int returned_ = 0;
};

inline Chunk Out(const std::string& data) {
  Chunk chunk;
  chunk.stdout_data = data;
  return chunk;
}

inline Chunk Err(const std::string& data) {
  Chunk chunk;
  chunk.stderr_data = data;
  return chunk;
}

inline Chunk Both(const std::string& out, const std::string& err) {
  Chunk chunk;
  chunk.stdout_data = out;
  chunk.stderr_data = err;
  return chunk;
}

inline ExecResult Result(int exit_code, const std::string& out = "",
                         const std::string& err = "") {
  ExecResult result;
  result.exit_code = exit_code;
  result.stdout_data = out;
  result.stderr_data = err;
  return result;
}

}  // namespace runtime

#endif
