#ifndef SESSION_STREAM_MULTIPLEXER_HPP
#define SESSION_STREAM_MULTIPLEXER_HPP

#include <string>
#include <utility>

#include "core/console_output.hpp"
#include "runtime/runtime.hpp"

namespace session {

// Consumes the chunks of a streamed command, accumulating the decoded text of
// each channel and delivering every chunk to the matching callback as soon as
// it arrives.
class StreamMultiplexer {
 public:
  // Returns the accumulated (stdout, stderr) text. Exceptions of any type
  // thrown by the callbacks are logged and counted but do not stop the
  // processing. An incomplete UTF-8 sequence left at the end of a channel is
  // delivered as U+FFFD, so the callbacks see the same text that is returned.
  // execution_timeout from the stream is propagated.
  std::pair<std::string, std::string> Process(
      runtime::ChunkStream* stream, const core::StreamCallback& on_stdout,
      const core::StreamCallback& on_stderr, int64_t timeout_millis);

  // Number of callback invocations that threw.
  int64_t callback_failures() const { return callback_failures_; }

 private:
  void Deliver(const core::StreamCallback& callback, const std::string& text,
               const char* channel);

  int64_t callback_failures_ = 0;
};

}  // namespace session

#endif
