#ifndef LANGUAGE_JAVA_HANDLER_HPP
#define LANGUAGE_JAVA_HANDLER_HPP

#include "language/language_handler.hpp"

namespace language {

// The code must define a public Main class.
class JavaHandler : public LanguageHandler {
 public:
  Language GetLanguage() const override { return Language::JAVA; }
  std::string FileExtension() const override { return "java"; }
  std::string CodeFileName() const override { return "Main.java"; }
  std::string DefaultImage() const override {
    return "ghcr.io/vndee/sandbox-java-11-bullseye";
  }
  absl::optional<core::Command> BuildInstallCommand(
      const std::vector<std::string>& libraries,
      const std::string& workdir) const override;
  std::vector<core::Command> BuildRunCommands(
      const std::string& code_path, const std::string& workdir) const override;
};

}  // namespace language

#endif
