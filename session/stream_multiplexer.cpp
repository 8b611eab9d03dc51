#include "session/stream_multiplexer.hpp"

#include "glog/logging.h"
#include "util/utf8.hpp"

namespace session {

std::pair<std::string, std::string> StreamMultiplexer::Process(
    runtime::ChunkStream* stream, const core::StreamCallback& on_stdout,
    const core::StreamCallback& on_stderr, int64_t timeout_millis) {
  util::Utf8Decoder stdout_decoder;
  util::Utf8Decoder stderr_decoder;
  std::string stdout_text;
  std::string stderr_text;
  runtime::Chunk chunk;
  while (stream->Next(&chunk, timeout_millis)) {
    if (chunk.stdout_data) {
      std::string text = stdout_decoder.Decode(*chunk.stdout_data);
      stdout_text += text;
      Deliver(on_stdout, text, "stdout");
    }
    if (chunk.stderr_data) {
      std::string text = stderr_decoder.Decode(*chunk.stderr_data);
      stderr_text += text;
      Deliver(on_stderr, text, "stderr");
    }
  }
  if (stdout_decoder.HasPending()) {
    std::string text = stdout_decoder.Flush();
    stdout_text += text;
    Deliver(on_stdout, text, "stdout");
  }
  if (stderr_decoder.HasPending()) {
    std::string text = stderr_decoder.Flush();
    stderr_text += text;
    Deliver(on_stderr, text, "stderr");
  }
  return std::make_pair(std::move(stdout_text), std::move(stderr_text));
}

void StreamMultiplexer::Deliver(const core::StreamCallback& callback,
                                const std::string& text, const char* channel) {
  if (!callback) return;
  try {
    callback(text);
  } catch (const std::exception& exc) {
    callback_failures_++;
    LOG(WARNING) << "The " << channel << " callback failed: " << exc.what();
  } catch (...) {
    callback_failures_++;
    LOG(WARNING) << "The " << channel
                 << " callback failed with a non-standard exception";
  }
}

}  // namespace session
