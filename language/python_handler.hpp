#ifndef LANGUAGE_PYTHON_HANDLER_HPP
#define LANGUAGE_PYTHON_HANDLER_HPP

#include "language/language_handler.hpp"

namespace language {

// Python 3. Figures drawn with matplotlib are captured as PNG artifacts.
class PythonHandler : public LanguageHandler {
 public:
  Language GetLanguage() const override { return Language::PYTHON; }
  std::string FileExtension() const override { return "py"; }
  std::string DefaultImage() const override {
    return "ghcr.io/vndee/sandbox-python-311-bullseye";
  }
  absl::optional<core::Command> BuildInstallCommand(
      const std::vector<std::string>& libraries,
      const std::string& workdir) const override;
  std::vector<core::Command> BuildRunCommands(
      const std::string& code_path, const std::string& workdir) const override;
  bool SupportsArtifactDetection() const override { return true; }
  std::string InjectArtifactCapture(
      const std::string& code, const std::string& output_dir) const override;
  std::vector<core::Artifact> ExtractArtifacts(
      const CommandRunner& runner, const std::string& output_dir,
      const std::string& stdout_text) const override;
};

}  // namespace language

#endif
