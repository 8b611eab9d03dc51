#ifndef CORE_CONSOLE_OUTPUT_HPP
#define CORE_CONSOLE_OUTPUT_HPP

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace core {

// Receives one decoded chunk of output. An empty function means that no
// callback was supplied, which is different from receiving an empty chunk.
using StreamCallback = std::function<void(const std::string& chunk)>;

// A command to run inside a sandbox. An empty workdir means "not set".
struct Command {
  std::string text;
  std::string workdir;

  Command() = default;
  Command(const char* text) : text(text) {}  // NOLINT
  Command(std::string text, std::string workdir = "")  // NOLINT
      : text(std::move(text)), workdir(std::move(workdir)) {}
};

// A file produced by the executed code, e.g. a plot.
struct Artifact {
  std::string name;
  std::string format;
  std::string content;  // Raw bytes.
};

// Result of a command or of a sequence of commands.
struct ConsoleOutput {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
  std::vector<Artifact> artifacts;

  bool Success() const { return exit_code == 0; }

  ConsoleOutput() = default;
  ConsoleOutput(int exit_code, std::string stdout_text = "",
                std::string stderr_text = "")
      : exit_code(exit_code),
        stdout_text(std::move(stdout_text)),
        stderr_text(std::move(stderr_text)) {}
};

}  // namespace core

#endif
