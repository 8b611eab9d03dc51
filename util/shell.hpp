#ifndef UTIL_SHELL_HPP
#define UTIL_SHELL_HPP

#include <string>
#include <vector>

namespace util {

// Quotes arg so that sh reads it as a single word.
std::string ShellQuote(const std::string& arg);

// Quotes every element of args and joins them with spaces.
std::string ShellJoin(const std::vector<std::string>& args);

}  // namespace util

#endif
