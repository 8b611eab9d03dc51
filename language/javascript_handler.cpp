#include "language/javascript_handler.hpp"

#include "util/shell.hpp"

namespace language {

absl::optional<core::Command> JavascriptHandler::BuildInstallCommand(
    const std::vector<std::string>& libraries,
    const std::string& workdir) const {
  if (libraries.empty()) return absl::nullopt;
  return core::Command("npm install --no-save --silent " +
                           util::ShellJoin(libraries),
                       workdir);
}

std::vector<core::Command> JavascriptHandler::BuildRunCommands(
    const std::string& code_path, const std::string& workdir) const {
  return {core::Command("node " + util::ShellQuote(code_path), workdir)};
}

}  // namespace language
