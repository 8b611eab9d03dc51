#include "language/cpp_handler.hpp"

#include "util/file.hpp"
#include "util/shell.hpp"

namespace language {

// Libraries are installed as Debian packages, e.g. libboost-all-dev.
absl::optional<core::Command> CppHandler::BuildInstallCommand(
    const std::vector<std::string>& libraries,
    const std::string& workdir) const {
  if (libraries.empty()) return absl::nullopt;
  return core::Command("apt-get install -y -q " + util::ShellJoin(libraries),
                       workdir);
}

std::vector<core::Command> CppHandler::BuildRunCommands(
    const std::string& code_path, const std::string& workdir) const {
  std::string binary = util::ShellQuote(
      util::File::JoinPath(util::File::BaseDir(code_path), "a.out"));
  return {core::Command("g++ -std=c++17 -O2 -o " + binary + " " +
                            util::ShellQuote(code_path),
                        workdir),
          core::Command(binary, workdir)};
}

}  // namespace language
