#include "language/ruby_handler.hpp"

#include "util/shell.hpp"

namespace language {

absl::optional<core::Command> RubyHandler::BuildInstallCommand(
    const std::vector<std::string>& libraries,
    const std::string& workdir) const {
  if (libraries.empty()) return absl::nullopt;
  return core::Command("gem install --no-document " +
                           util::ShellJoin(libraries),
                       workdir);
}

std::vector<core::Command> RubyHandler::BuildRunCommands(
    const std::string& code_path, const std::string& workdir) const {
  return {core::Command("ruby " + util::ShellQuote(code_path), workdir)};
}

}  // namespace language
