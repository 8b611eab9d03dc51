#ifndef LANGUAGE_JAVASCRIPT_HANDLER_HPP
#define LANGUAGE_JAVASCRIPT_HANDLER_HPP

#include "language/language_handler.hpp"

namespace language {

class JavascriptHandler : public LanguageHandler {
 public:
  Language GetLanguage() const override { return Language::JAVASCRIPT; }
  std::string FileExtension() const override { return "js"; }
  std::string DefaultImage() const override {
    return "ghcr.io/vndee/sandbox-node-22-bullseye";
  }
  absl::optional<core::Command> BuildInstallCommand(
      const std::vector<std::string>& libraries,
      const std::string& workdir) const override;
  std::vector<core::Command> BuildRunCommands(
      const std::string& code_path, const std::string& workdir) const override;
};

}  // namespace language

#endif
