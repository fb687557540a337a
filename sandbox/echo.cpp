#include "sandbox/echo.hpp"

#include "absl/strings/str_cat.h"
#include "absl/strings/str_replace.h"
#include "glog/logging.h"

namespace sandbox {

namespace {
std::string Quote(const std::string& arg) {
  if (!arg.empty() &&
      arg.find_first_of(" \t\n'\"\\$`*?;&|<>()") == std::string::npos) {
    return arg;
  }
  return absl::StrCat("'", absl::StrReplaceAll(arg, {{"'", "'\\''"}}), "'");
}
}  // namespace

// static
std::string Echo::CommandLine(const ExecutionOptions& options) {
  std::string line = Quote(options.executable);
  for (const std::string& arg : options.args) {
    absl::StrAppend(&line, " ", Quote(arg));
  }
  if (!options.stdin_file.empty()) {
    absl::StrAppend(&line, " < ", Quote(options.stdin_file));
  }
  return line;
}

bool Echo::ExecuteInternal(const ExecutionOptions& options,
                           ExecutionInfo* info, std::string* /*error_msg*/) {
  std::string line = CommandLine(options);
  LOG(INFO) << "Not executing (in " << options.root << "): " << line;
  info->stdout_content = line + "\n";
  return true;
}

namespace {
Sandbox::Register<Echo> r;
}  // namespace

}  // namespace sandbox
