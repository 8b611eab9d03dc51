#include "util/utf8.hpp"

namespace {

const constexpr char* kReplacement = "\xEF\xBF\xBD";

// Length of the sequence started by lead, 0 if lead cannot start one.
size_t SequenceLength(unsigned char lead) {
  if (lead < 0x80) return 1;
  if (lead >= 0xC2 && lead <= 0xDF) return 2;
  if (lead >= 0xE0 && lead <= 0xEF) return 3;
  if (lead >= 0xF0 && lead <= 0xF4) return 4;
  return 0;
}

// Whether c is acceptable as the pos-th byte (pos >= 1) after lead. The first
// continuation byte is restricted to exclude overlong forms, surrogates and
// code points above U+10FFFF.
bool ValidContinuation(unsigned char lead, size_t pos, unsigned char c) {
  if (c < 0x80 || c > 0xBF) return false;
  if (pos != 1) return true;
  switch (lead) {
    case 0xE0:
      return c >= 0xA0;
    case 0xED:
      return c <= 0x9F;
    case 0xF0:
      return c >= 0x90;
    case 0xF4:
      return c <= 0x8F;
    default:
      return true;
  }
}

}  // namespace

namespace util {

std::string Utf8Decoder::Decode(const std::string& bytes) {
  std::string buf = std::move(pending_);
  pending_.clear();
  buf += bytes;

  std::string out;
  out.reserve(buf.size());
  size_t i = 0;
  while (i < buf.size()) {
    unsigned char lead = buf[i];
    size_t len = SequenceLength(lead);
    if (len == 1) {
      out += buf[i++];
      continue;
    }
    if (len == 0) {
      out += kReplacement;
      i++;
      continue;
    }
    size_t valid = 0;
    while (valid + 1 < len && i + valid + 1 < buf.size() &&
           ValidContinuation(lead, valid + 1, buf[i + valid + 1])) {
      valid++;
    }
    if (valid + 1 == len) {
      out.append(buf, i, len);
      i += len;
    } else if (i + valid + 1 == buf.size()) {
      // Truncated, but valid so far: wait for more bytes.
      pending_ = buf.substr(i);
      break;
    } else {
      out += kReplacement;
      i += valid + 1;
    }
  }
  return out;
}

std::string Utf8Decoder::Flush() {
  if (pending_.empty()) return "";
  pending_.clear();
  return kReplacement;
}

}  // namespace util
