#include "task/matlab_task.hpp"

#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "util/file.hpp"

namespace task {

const constexpr char* MatlabTask::kBannerEnd;
const constexpr int32_t MatlabTask::kNumProcs;

CompilationResult MatlabTask::DoCompile() {
  std::string executable = source_file_ + ".m";
  try {
    util::File::Copy(InWorkingDir(source_file_), InWorkingDir(executable),
                     /*overwrite=*/true);
  } catch (const std::system_error& exc) {
    throw EnvironmentError(std::string("Couldn't copy Matlab source file: ") +
                           exc.what());
  }
  return NoCompilation(executable);
}

RunCommand MatlabTask::DoGetRunCommand(
    const CompilationResult& compilation) const {
  // TODO find out why Matlab does not start with a memory limit, and give it
  // one.
  RunCommand command = EnforcerCommand(/*memory_limit_kb=*/0, kNumProcs);
  const std::string script = util::File::BaseName(compilation.source_file);
  command.insert(command.end(), {toolchain_.matlab, "-nojvm", "-r", script});
  return command;
}

std::string MatlabTask::FilterOutput(const std::string& output) const {
  std::vector<absl::string_view> lines = absl::StrSplit(output, '\n');
  // Output without a banner has already been filtered, or does not come from
  // a regular Matlab startup: keep all of it.
  bool header_ended = !absl::StrContains(output, kBannerEnd);
  std::vector<absl::string_view> kept;
  for (absl::string_view line : lines) {
    line = absl::StripTrailingAsciiWhitespace(line);
    if (header_ended) {
      kept.push_back(line);
    } else if (absl::StrContains(line, kBannerEnd)) {
      header_ended = true;
    }
  }

  auto first = kept.begin();
  auto last = kept.end();
  while (first != last && first->empty()) ++first;
  while (last != first && (last - 1)->empty()) --last;
  return absl::StrJoin(first, last, "\n") + "\n";
}

}  // namespace task
