#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "absl/strings/str_split.h"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "language/language_handler.hpp"
#include "pool/pooled_session.hpp"
#include "pool/session_pool.hpp"
#include "runtime/runtime.hpp"
#include "session/sandbox_session.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"

DEFINE_string(lang, "python", "Language of the code to run");
DEFINE_string(file, "", "File with the code to run");
DEFINE_string(libraries, "", "Comma separated libraries to install first");
DEFINE_string(image, "", "Container image, the language default if empty");
DEFINE_string(artifacts_dir, "",
              "If set, the artifacts of the run are saved in this directory");
DEFINE_int32(runs, 1, "How many times the code is run, reusing the sandbox");

int main(int argc, char** argv) {
  gflags::SetUsageMessage("Runs a program inside a container sandbox");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT
  google::InstallFailureSignalHandler();
  CHECK_NE(FLAGS_file, "") << "You need to specify a file to run";

  session::SessionOptions options =
      session::SessionOptions::FromFlags(language::ParseLanguage(FLAGS_lang));
  options.image = FLAGS_image;
  std::vector<std::string> libraries =
      absl::StrSplit(FLAGS_libraries, ',', absl::SkipWhitespace());
  std::string code = util::File::Read(FLAGS_file);

  std::unique_ptr<runtime::Runtime> runtime = runtime::Runtime::Create();
  pool::SessionPool pool(runtime.get(), pool::PoolOptions::FromFlags());
  pool::PooledSession session(&pool, options, !FLAGS_artifacts_dir.empty());

  core::StreamCallback on_stdout = [](const std::string& chunk) {
    std::cout << chunk << std::flush;
  };
  core::StreamCallback on_stderr = [](const std::string& chunk) {
    std::cerr << chunk << std::flush;
  };

  int exit_code = 0;
  for (int run = 0; run < FLAGS_runs; run++) {
    core::ConsoleOutput output =
        session.Run(code, libraries, 0, on_stdout, on_stderr);
    LOG(INFO) << "Run " << run + 1 << " exited with " << output.exit_code;
    for (const core::Artifact& artifact : output.artifacts) {
      std::string path =
          util::File::JoinPath(FLAGS_artifacts_dir, artifact.name);
      util::File::Write(path, artifact.content);
      LOG(INFO) << "Saved " << artifact.format << " artifact " << path;
    }
    exit_code = output.exit_code;
  }
  return exit_code;
}
