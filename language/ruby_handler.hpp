#ifndef LANGUAGE_RUBY_HANDLER_HPP
#define LANGUAGE_RUBY_HANDLER_HPP

#include "language/language_handler.hpp"

namespace language {

class RubyHandler : public LanguageHandler {
 public:
  Language GetLanguage() const override { return Language::RUBY; }
  std::string FileExtension() const override { return "rb"; }
  std::string DefaultImage() const override {
    return "ghcr.io/vndee/sandbox-ruby-302-bullseye";
  }
  absl::optional<core::Command> BuildInstallCommand(
      const std::vector<std::string>& libraries,
      const std::string& workdir) const override;
  std::vector<core::Command> BuildRunCommands(
      const std::string& code_path, const std::string& workdir) const override;
};

}  // namespace language

#endif
