#ifndef UTIL_UTF8_HPP
#define UTIL_UTF8_HPP

#include <string>

namespace util {

// Incremental UTF-8 sanitizer for byte streams that arrive in arbitrary
// chunks. Malformed sequences are replaced with U+FFFD. A multi-byte sequence
// that is cut at the end of a chunk is kept and completed by the next call.
class Utf8Decoder {
 public:
  // Returns the valid text obtained from the pending bytes plus the new ones.
  std::string Decode(const std::string& bytes);

  // Returns a replacement character if an incomplete sequence is pending,
  // an empty string otherwise, and resets the decoder.
  std::string Flush();

  bool HasPending() const { return !pending_.empty(); }

 private:
  std::string pending_;
};

}  // namespace util

#endif
