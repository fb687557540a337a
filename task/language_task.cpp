#include "task/language_task.hpp"

#include <utility>

#include "absl/memory/memory.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "glog/logging.h"
#include "task/c_task.hpp"
#include "task/java_task.hpp"
#include "task/matlab_task.hpp"
#include "task/python_task.hpp"
#include "util/file.hpp"

namespace task {

// static
std::unique_ptr<LanguageTask> LanguageTask::Create(
    proto::Language language, const sandbox::ExecutionContext* context,
    const Toolchain& toolchain, sandbox::Sandbox* sandbox,
    std::string working_dir, std::string source_file) {
  switch (language) {
    case proto::MATLAB:
      return absl::make_unique<MatlabTask>(context, toolchain, sandbox,
                                           std::move(working_dir),
                                           std::move(source_file));
    case proto::PYTHON2:
      return absl::make_unique<Python2Task>(context, toolchain, sandbox,
                                            std::move(working_dir),
                                            std::move(source_file));
    case proto::PYTHON3:
      return absl::make_unique<Python3Task>(context, toolchain, sandbox,
                                            std::move(working_dir),
                                            std::move(source_file));
    case proto::JAVA:
      return absl::make_unique<JavaTask>(context, toolchain, sandbox,
                                         std::move(working_dir),
                                         std::move(source_file));
    case proto::C:
      return absl::make_unique<CTask>(context, toolchain, sandbox,
                                      std::move(working_dir),
                                      std::move(source_file));
    case proto::CPP:
      return absl::make_unique<CppTask>(context, toolchain, sandbox,
                                        std::move(working_dir),
                                        std::move(source_file));
    default:
      throw std::domain_error("Unknown language " +
                              proto::Language_Name(language));
  }
}

// static
std::string LanguageTask::DefaultSourceFile(proto::Language language) {
  switch (language) {
    case proto::MATLAB:
      // Compile adds the .m extension.
      return "prog";
    case proto::PYTHON2:
    case proto::PYTHON3:
      return "prog.py";
    case proto::JAVA:
      return "prog.java";
    case proto::C:
      return "prog.c";
    case proto::CPP:
      return "prog.cpp";
    default:
      throw std::domain_error("Unknown language " +
                              proto::Language_Name(language));
  }
}

LanguageTask::LanguageTask(proto::Language language,
                           const sandbox::ExecutionContext* context,
                           Toolchain toolchain, sandbox::Sandbox* sandbox,
                           std::string working_dir, std::string source_file)
    : context_(context),
      toolchain_(std::move(toolchain)),
      sandbox_(sandbox),
      working_dir_(std::move(working_dir)),
      source_file_(std::move(source_file)),
      language_(language) {
  CHECK(context_ != nullptr) << "A task needs an execution context";
  CHECK(sandbox_ != nullptr) << "A task needs a sandbox for compilation";
}

const CompilationResult& LanguageTask::Compile() {
  if (compilation_) {
    throw std::logic_error("Compile called twice on " + source_file_);
  }
  LOG(INFO) << "Compiling " << source_file_ << " with " << Version();
  compilation_ = DoCompile();
  if (compilation_->Success()) {
    LOG(INFO) << "Compilation of " << source_file_ << " succeeded, executable "
              << *compilation_->executable_file;
  } else {
    LOG(INFO) << "Compilation of " << source_file_ << " failed";
  }
  return *compilation_;
}

RunCommand LanguageTask::GetRunCommand() const {
  if (!Compiled()) {
    throw std::logic_error("Cannot run " + source_file_ +
                           ": it has not been compiled successfully");
  }
  RunCommand command = DoGetRunCommand(*compilation_);
  for (const std::string& arg : command) {
    if (arg.empty()) {
      throw EnvironmentError("Cannot run " + source_file_ + ": the " +
                             proto::Language_Name(language_) +
                             " toolchain is not configured");
    }
  }
  VLOG(1) << "Run command: " << absl::StrJoin(command, " ");
  return command;
}

CompilationResult LanguageTask::NoCompilation(
    const std::string& executable_file) const {
  CompilationResult result;
  result.source_file = source_file_;
  result.executable_file = executable_file;
  return result;
}

CompilationResult LanguageTask::RunCompiler(
    const std::string& compiler, const std::vector<std::string>& args,
    const std::string& source_file, const std::string& executable_file) {
  if (compiler.empty()) {
    throw EnvironmentError("Cannot compile " + source_file +
                           ": no compiler for " +
                           proto::Language_Name(language_));
  }
  sandbox::ExecutionOptions options(working_dir_, compiler);
  options.args = args;
  options.wall_limit_millis = toolchain_.compile_time_limit_millis;
  VLOG(1) << "Compilation command: " << compiler << " "
          << absl::StrJoin(args, " ");

  sandbox::ExecutionInfo info;
  std::string error_msg;
  if (!sandbox_->Execute(options, &info, &error_msg)) {
    throw EnvironmentError("Cannot run " + compiler + ": " + error_msg);
  }

  CompilationResult result;
  result.source_file = source_file;
  if (info.killed) {
    result.compile_info = "Compilation timed out";
  } else if (info.status_code == 0 && info.signal == 0) {
    result.executable_file = executable_file;
  } else if (!info.stderr_content.empty()) {
    result.compile_info = info.stderr_content;
  } else if (!info.stdout_content.empty()) {
    result.compile_info = info.stdout_content;
  } else if (info.signal != 0) {
    result.compile_info =
        absl::StrCat("Compilation killed by signal ", info.signal);
  } else {
    result.compile_info =
        absl::StrCat("Compilation failed with exit status ", info.status_code);
  }
  return result;
}

RunCommand LanguageTask::EnforcerCommand() const {
  return EnforcerCommand(context_->Limits().MemoryLimitKb(),
                         context_->NumProcs());
}

RunCommand LanguageTask::EnforcerCommand(int64_t memory_limit_kb,
                                         int32_t num_procs) const {
  const int64_t file_size = context_->Limits().DiskLimitBytes();
  return {
      toolchain_.runguard,
      absl::StrCat("--user=", context_->RunAsUser()),
      absl::StrCat("--time=", context_->CpuTime()),
      absl::StrCat("--memsize=", memory_limit_kb),
      absl::StrCat("--filesize=", file_size),
      absl::StrCat("--nproc=", num_procs),
      "--no-core",
      absl::StrCat("--streamsize=", file_size),
  };
}

std::string LanguageTask::InWorkingDir(const std::string& path) const {
  return util::File::JoinPath(working_dir_, path);
}

}  // namespace task
