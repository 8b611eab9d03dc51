#include "util/shell.hpp"

#include "absl/strings/str_join.h"
#include "absl/strings/str_replace.h"

namespace util {

std::string ShellQuote(const std::string& arg) {
  if (!arg.empty() &&
      arg.find_first_not_of("abcdefghijklmnopqrstuvwxyz"
                            "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
                            "0123456789@%+=:,./-_") == std::string::npos) {
    return arg;
  }
  return "'" + absl::StrReplaceAll(arg, {{"'", "'\"'\"'"}}) + "'";
}

std::string ShellJoin(const std::vector<std::string>& args) {
  return absl::StrJoin(args, " ", [](std::string* out, const std::string& arg) {
    out->append(ShellQuote(arg));
  });
}

}  // namespace util
