#include "language/language_handler.hpp"

#include <stdexcept>

#include "absl/strings/ascii.h"
#include "absl/strings/escaping.h"
#include "absl/strings/str_split.h"
#include "glog/logging.h"
#include "util/file.hpp"
#include "util/shell.hpp"

namespace language {

Language ParseLanguage(const std::string& tag) {
  std::string lower = absl::AsciiStrToLower(tag);
  if (lower == "python" || lower == "py") return Language::PYTHON;
  if (lower == "javascript" || lower == "js" || lower == "node") {
    return Language::JAVASCRIPT;
  }
  if (lower == "java") return Language::JAVA;
  if (lower == "cpp" || lower == "c++") return Language::CPP;
  if (lower == "go" || lower == "golang") return Language::GO;
  if (lower == "ruby" || lower == "rb") return Language::RUBY;
  throw std::invalid_argument("Unsupported language: " + tag);
}

std::string LanguageName(Language language) {
  switch (language) {
    case Language::PYTHON:
      return "python";
    case Language::JAVASCRIPT:
      return "javascript";
    case Language::JAVA:
      return "java";
    case Language::CPP:
      return "cpp";
    case Language::GO:
      return "go";
    case Language::RUBY:
      return "ruby";
  }
  LOG(FATAL) << "Invalid language " << static_cast<int>(language);
  return "";
}

std::vector<core::Command> LanguageHandler::BuildSetupCommands(
    const std::string& workdir) const {
  return {core::Command("mkdir -p " + util::ShellQuote(workdir), "/")};
}

std::string LanguageHandler::InjectArtifactCapture(
    const std::string& code, const std::string& output_dir) const {
  throw std::logic_error(Name() + " does not support artifact detection");
}

std::vector<core::Artifact> LanguageHandler::ExtractArtifacts(
    const CommandRunner& runner, const std::string& output_dir,
    const std::string& stdout_text) const {
  return {};
}

std::vector<core::Artifact> LanguageHandler::CollectFiles(
    const CommandRunner& runner, const std::string& dir) {
  std::vector<core::Artifact> artifacts;
  core::ConsoleOutput listing = runner(core::Command(
      "find " + util::ShellQuote(dir) +
      " -maxdepth 1 -type f -printf '%f\\n' | sort"));
  if (!listing.Success()) {
    VLOG(1) << "No artifacts in " << dir << ": " << listing.stderr_text;
    return artifacts;
  }
  for (absl::string_view name :
       absl::StrSplit(listing.stdout_text, '\n', absl::SkipWhitespace())) {
    std::string path = util::File::JoinPath(dir, std::string(name));
    core::ConsoleOutput encoded =
        runner(core::Command("base64 -w 0 " + util::ShellQuote(path)));
    core::Artifact artifact;
    if (!encoded.Success() ||
        !absl::Base64Unescape(absl::StripAsciiWhitespace(encoded.stdout_text),
                              &artifact.content)) {
      LOG(WARNING) << "Could not read artifact " << path << ": "
                   << encoded.stderr_text;
      continue;
    }
    artifact.name = std::string(name);
    size_t dot = artifact.name.rfind('.');
    if (dot != std::string::npos) {
      artifact.format = absl::AsciiStrToLower(artifact.name.substr(dot + 1));
    }
    artifacts.push_back(std::move(artifact));
  }
  return artifacts;
}

}  // namespace language
