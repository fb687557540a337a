#include "runner/runner.hpp"

#include <sys/stat.h>

#include <system_error>
#include <utility>

#include "absl/memory/memory.h"
#include "glog/logging.h"
#include "task/language_task.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace runner {

// static
RunnerOptions RunnerOptions::FromFlags() {
  RunnerOptions options;
  options.toolchain = task::Toolchain::FromFlags();
  options.temp_directory = FLAGS_temp_directory;
  options.keep_sandbox = FLAGS_keep_sandbox;
  options.wall_grace_millis = FLAGS_wall_grace_millis;
  options.max_output_bytes = FLAGS_max_output_kb * 1024;
  return options;
}

Runner::Runner(RunnerOptions options, std::unique_ptr<sandbox::Sandbox> sandbox)
    : options_(std::move(options)), sandbox_(std::move(sandbox)) {
  CHECK(sandbox_ != nullptr) << "A runner needs a sandbox";
}

ExecutionResult Runner::Run(const proto::Submission& submission) {
  sandbox::ExecutionContext context = sandbox::ExecutionContext::FromProto(
      submission.run_as_user(), submission.limits());
  return Run(submission.language(), submission.source_code(),
             submission.stdin_text(), context);
}

void Runner::WriteInput(const std::string& path, const std::string& content) {
  try {
    util::File::Write(path, content);
    util::File::SetPermissions(path, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
  } catch (const std::system_error& exc) {
    throw task::EnvironmentError(exc.what());
  }
}

ExecutionResult Runner::Run(proto::Language language,
                            const std::string& source_code,
                            const std::string& stdin_content,
                            const sandbox::ExecutionContext& context) {
  const std::string source_file =
      task::LanguageTask::DefaultSourceFile(language);

  std::unique_ptr<util::TempDir> tmp;
  try {
    tmp = absl::make_unique<util::TempDir>(options_.temp_directory);
    // The submission runs as another user and writes its compiled files and
    // its own temporary files here.
    util::File::SetPermissions(tmp->Path(), S_IRWXU | S_IRWXG | S_IRWXO);
  } catch (const std::system_error& exc) {
    throw task::EnvironmentError(exc.what());
  }
  if (options_.keep_sandbox) {
    LOG(INFO) << "Keeping the working directory " << tmp->Path();
    tmp->Keep();
  }

  WriteInput(util::File::JoinPath(tmp->Path(), source_file), source_code);
  const std::string stdin_file = util::File::JoinPath(tmp->Path(), kStdinFile);
  WriteInput(stdin_file, stdin_content);

  std::unique_ptr<task::LanguageTask> task =
      task::LanguageTask::Create(language, &context, options_.toolchain,
                                 sandbox_.get(), tmp->Path(), source_file);

  ExecutionResult result;
  const task::CompilationResult& compilation = task->Compile();
  if (!compilation.Success()) {
    CHECK(!compilation.compile_info.empty());
    result.compile_info = compilation.compile_info;
    return result;
  }

  task::RunCommand command = task->GetRunCommand();
  sandbox::ExecutionOptions exec_options(tmp->Path(), command[0]);
  exec_options.args.assign(command.begin() + 1, command.end());
  exec_options.stdin_file = stdin_file;
  exec_options.wall_limit_millis =
      context.CpuTime() * 1000 + options_.wall_grace_millis;
  exec_options.max_output_bytes = options_.max_output_bytes;

  LOG(INFO) << "Running " << task->SourceFile() << " as "
            << context.RunAsUser() << " with a deadline of "
            << exec_options.wall_limit_millis << "ms";
  sandbox::ExecutionInfo info;
  std::string error_msg;
  if (!sandbox_->Execute(exec_options, &info, &error_msg)) {
    throw task::EnvironmentError("Cannot start " + command[0] + ": " +
                                 error_msg);
  }

  if (info.killed) {
    LOG(INFO) << task->SourceFile() << " timed out after "
              << info.wall_time_millis << "ms";
    result.timed_out = true;
    result.exit_status = ExecutionResult::kNotRun;
  } else if (info.signal != 0) {
    result.exit_status = 128 + info.signal;
  } else {
    result.exit_status = info.status_code;
  }
  result.stdout_content = task->FilterOutput(info.stdout_content);
  result.stderr_content = std::move(info.stderr_content);
  return result;
}

}  // namespace runner
