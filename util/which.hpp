#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which. Commands containing a slash
// are returned as they are if the file is executable. Uses caching to speed up
// lookups, unless explicitly disabled. Returns an empty string if the command
// cannot be found.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
