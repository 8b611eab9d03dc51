#ifndef LANGUAGE_GO_HANDLER_HPP
#define LANGUAGE_GO_HANDLER_HPP

#include "language/language_handler.hpp"

namespace language {

// Code is run inside a module created in the working directory.
class GoHandler : public LanguageHandler {
 public:
  Language GetLanguage() const override { return Language::GO; }
  std::string FileExtension() const override { return "go"; }
  std::string DefaultImage() const override {
    return "ghcr.io/vndee/sandbox-go-123-bullseye";
  }
  std::vector<core::Command> BuildSetupCommands(
      const std::string& workdir) const override;
  absl::optional<core::Command> BuildInstallCommand(
      const std::vector<std::string>& libraries,
      const std::string& workdir) const override;
  std::vector<core::Command> BuildRunCommands(
      const std::string& code_path, const std::string& workdir) const override;
};

}  // namespace language

#endif
