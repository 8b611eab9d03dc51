#include "language/python_handler.hpp"

#include "absl/strings/str_cat.h"
#include "absl/strings/str_replace.h"
#include "util/shell.hpp"

namespace language {

namespace {

// Runs before the user code. pyplot.show is replaced so that every open
// figure is saved to the output directory, and figures still open at exit are
// saved too.
const char* kCapturePrelude = R"(import atexit as _codebox_atexit
import os as _codebox_os
_codebox_os.makedirs('$DIR', exist_ok=True)
try:
    import matplotlib as _codebox_matplotlib
    _codebox_matplotlib.use('Agg')
    import matplotlib.pyplot as _codebox_plt
    _codebox_count = [0]

    def _codebox_show(*args, **kwargs):
        for _codebox_num in _codebox_plt.get_fignums():
            _codebox_count[0] += 1
            _codebox_plt.figure(_codebox_num).savefig(_codebox_os.path.join(
                '$DIR', 'plot_%04d.png' % _codebox_count[0]))
        _codebox_plt.close('all')

    _codebox_plt.show = _codebox_show
    _codebox_atexit.register(_codebox_show)
except ImportError:
    pass
)";

}  // namespace

absl::optional<core::Command> PythonHandler::BuildInstallCommand(
    const std::vector<std::string>& libraries,
    const std::string& workdir) const {
  if (libraries.empty()) return absl::nullopt;
  return core::Command(
      absl::StrCat("pip install --quiet --no-cache-dir ",
                   util::ShellJoin(libraries)),
      workdir);
}

std::vector<core::Command> PythonHandler::BuildRunCommands(
    const std::string& code_path, const std::string& workdir) const {
  // Unbuffered, so that output can be streamed as it is produced.
  return {core::Command("python3 -u " + util::ShellQuote(code_path), workdir)};
}

std::string PythonHandler::InjectArtifactCapture(
    const std::string& code, const std::string& output_dir) const {
  std::string dir = absl::StrReplaceAll(output_dir, {{"\\", "\\\\"},
                                                     {"'", "\\'"}});
  return absl::StrReplaceAll(kCapturePrelude, {{"$DIR", dir}}) + code;
}

std::vector<core::Artifact> PythonHandler::ExtractArtifacts(
    const CommandRunner& runner, const std::string& output_dir,
    const std::string& stdout_text) const {
  return CollectFiles(runner, output_dir);
}

}  // namespace language
