#include "language/java_handler.hpp"

#include "glog/logging.h"
#include "util/file.hpp"
#include "util/shell.hpp"

namespace language {

absl::optional<core::Command> JavaHandler::BuildInstallCommand(
    const std::vector<std::string>& libraries,
    const std::string& workdir) const {
  if (!libraries.empty()) {
    LOG(WARNING) << "Installing libraries is not supported for java, ignoring "
                 << libraries.size() << " libraries";
  }
  return absl::nullopt;
}

std::vector<core::Command> JavaHandler::BuildRunCommands(
    const std::string& code_path, const std::string& workdir) const {
  std::string classes = util::ShellQuote(util::File::BaseDir(code_path));
  return {
      core::Command("javac -d " + classes + " " + util::ShellQuote(code_path),
                    workdir),
      core::Command("java -cp " + classes + " Main", workdir)};
}

}  // namespace language
