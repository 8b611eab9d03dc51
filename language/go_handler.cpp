#include "language/go_handler.hpp"

#include "util/shell.hpp"

namespace language {

std::vector<core::Command> GoHandler::BuildSetupCommands(
    const std::string& workdir) const {
  std::vector<core::Command> commands =
      LanguageHandler::BuildSetupCommands(workdir);
  commands.emplace_back("test -f go.mod || go mod init sandbox", workdir);
  return commands;
}

absl::optional<core::Command> GoHandler::BuildInstallCommand(
    const std::vector<std::string>& libraries,
    const std::string& workdir) const {
  if (libraries.empty()) return absl::nullopt;
  return core::Command("go get " + util::ShellJoin(libraries), workdir);
}

std::vector<core::Command> GoHandler::BuildRunCommands(
    const std::string& code_path, const std::string& workdir) const {
  return {core::Command("go run " + util::ShellQuote(code_path), workdir)};
}

}  // namespace language
