#ifndef LANGUAGE_LANGUAGE_HANDLER_HPP
#define LANGUAGE_LANGUAGE_HANDLER_HPP

#include <functional>
#include <string>
#include <vector>

#include "absl/types/optional.h"
#include "core/console_output.hpp"

namespace language {

enum class Language { PYTHON, JAVASCRIPT, JAVA, CPP, GO, RUBY };

// Maps a language tag ("python", "py", "js"...) to a Language. Case is
// ignored. Throws std::invalid_argument for unknown tags.
Language ParseLanguage(const std::string& tag);

std::string LanguageName(Language language);

// Runs a command inside the sandbox the artifacts come from.
using CommandRunner =
    std::function<core::ConsoleOutput(const core::Command& command)>;

// Knows how to install libraries for, and how to run, programs written in a
// language.
class LanguageHandler {
 public:
  virtual Language GetLanguage() const = 0;
  std::string Name() const { return LanguageName(GetLanguage()); }
  virtual std::string FileExtension() const = 0;
  virtual std::string CodeFileName() const { return "code." + FileExtension(); }
  virtual std::string DefaultImage() const = 0;

  // Commands that prepare a freshly started container.
  virtual std::vector<core::Command> BuildSetupCommands(
      const std::string& workdir) const;

  // Returns no command if libraries is empty.
  virtual absl::optional<core::Command> BuildInstallCommand(
      const std::vector<std::string>& libraries,
      const std::string& workdir) const = 0;

  virtual std::vector<core::Command> BuildRunCommands(
      const std::string& code_path, const std::string& workdir) const = 0;

  virtual bool SupportsArtifactDetection() const { return false; }

  // Returns code modified so that the artifacts it creates are saved in
  // output_dir. Only called if SupportsArtifactDetection.
  virtual std::string InjectArtifactCapture(const std::string& code,
                                            const std::string& output_dir) const;

  // Collects the artifacts left by a run in output_dir. stdout_text is the
  // output of that run.
  virtual std::vector<core::Artifact> ExtractArtifacts(
      const CommandRunner& runner, const std::string& output_dir,
      const std::string& stdout_text) const;

  LanguageHandler() = default;
  virtual ~LanguageHandler() = default;
  LanguageHandler(const LanguageHandler&) = delete;
  LanguageHandler& operator=(const LanguageHandler&) = delete;

 protected:
  // Reads back every regular file in dir, sorted by name.
  static std::vector<core::Artifact> CollectFiles(const CommandRunner& runner,
                                                  const std::string& dir);
};

}  // namespace language

#endif
