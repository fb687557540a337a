#ifndef TASK_LANGUAGE_TASK_HPP
#define TASK_LANGUAGE_TASK_HPP

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "absl/types/optional.h"
#include "proto/task.pb.h"
#include "sandbox/context.hpp"
#include "sandbox/sandbox.hpp"
#include "task/toolchain.hpp"

namespace task {

// The execution environment itself is broken (a file could not be copied, a
// compiler could not be started...). This is never the submission's fault
// and must not be reported to the user as a compilation error.
class EnvironmentError : public std::runtime_error {
 public:
  explicit EnvironmentError(const std::string& msg)
      : std::runtime_error(msg) {}
};

// Outcome of LanguageTask::Compile. The executable is set if and only if the
// compilation succeeded, in which case compile_info is empty.
struct CompilationResult {
  // Source file after compilation: some languages rename it.
  std::string source_file;
  absl::optional<std::string> executable_file;
  std::string compile_info;

  bool Success() const { return executable_file.has_value(); }
};

// Argument vector for the enforcer: its own path first, then its flags, then
// the program to run and the program's arguments.
using RunCommand = std::vector<std::string>;

// Knows how to compile and how to run a submission in one language. A task is
// used exactly once: Compile, then (only if the compilation succeeded)
// GetRunCommand, as many times as needed.
// All the paths are relative to the working directory, which is also the
// current directory of the compiler and of the enforcer.
class LanguageTask {
 public:
  // Creates the task for the given language. context and sandbox must outlive
  // the task; sandbox is used to run the compilers.
  static std::unique_ptr<LanguageTask> Create(
      proto::Language language, const sandbox::ExecutionContext* context,
      const Toolchain& toolchain, sandbox::Sandbox* sandbox,
      std::string working_dir, std::string source_file);

  // Name of the file the source code should be written to.
  static std::string DefaultSourceFile(proto::Language language);

  // Human readable name of the toolchain.
  virtual std::string Version() const = 0;

  // Compiles the source file. A submission that does not compile is reported
  // through the result; EnvironmentError is thrown when the compilation could
  // not be attempted at all.
  const CompilationResult& Compile();

  bool Compiled() const { return compilation_ && compilation_->Success(); }
  const absl::optional<CompilationResult>& Compilation() const {
    return compilation_;
  }

  // Throws std::logic_error if the task has not been compiled successfully,
  // EnvironmentError if an interpreter or the enforcer is not configured.
  RunCommand GetRunCommand() const;

  // Cleans up the standard output of the program. The default leaves it
  // untouched.
  virtual std::string FilterOutput(const std::string& output) const {
    return output;
  }

  proto::Language Language() const { return language_; }
  const std::string& WorkingDirectory() const { return working_dir_; }
  const std::string& SourceFile() const { return source_file_; }

  virtual ~LanguageTask() = default;
  LanguageTask(const LanguageTask&) = delete;
  LanguageTask(LanguageTask&&) = delete;
  LanguageTask& operator=(const LanguageTask&) = delete;
  LanguageTask& operator=(LanguageTask&&) = delete;

 protected:
  LanguageTask(proto::Language language,
               const sandbox::ExecutionContext* context, Toolchain toolchain,
               sandbox::Sandbox* sandbox, std::string working_dir,
               std::string source_file);

  virtual CompilationResult DoCompile() = 0;
  virtual RunCommand DoGetRunCommand(
      const CompilationResult& compilation) const = 0;

  // Result for languages that run the source file directly.
  CompilationResult NoCompilation(const std::string& executable_file) const;

  // Runs a compiler in the working directory. The compilation succeeds, and
  // produces executable_file, if the compiler exits with status 0; otherwise
  // its error stream becomes the compile_info.
  CompilationResult RunCompiler(const std::string& compiler,
                                const std::vector<std::string>& args,
                                const std::string& source_file,
                                const std::string& executable_file);

  // The enforcer and its flags, using the limits of the context.
  RunCommand EnforcerCommand() const;
  // Same, with explicit memory and process limits for toolchains that cannot
  // live with the configured ones.
  RunCommand EnforcerCommand(int64_t memory_limit_kb, int32_t num_procs) const;

  std::string InWorkingDir(const std::string& path) const;

  const sandbox::ExecutionContext* context_;
  const Toolchain toolchain_;
  sandbox::Sandbox* sandbox_;
  const std::string working_dir_;
  const std::string source_file_;

 private:
  const proto::Language language_;
  absl::optional<CompilationResult> compilation_;
};

}  // namespace task

#endif
