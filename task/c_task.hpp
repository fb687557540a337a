#ifndef TASK_C_TASK_HPP
#define TASK_C_TASK_HPP

#include <string>
#include <vector>

#include "task/language_task.hpp"

namespace task {

// Languages compiled to a native executable by a gcc-like driver. The
// executable is written next to the source, with an .exe suffix.
class NativeTask : public LanguageTask {
 protected:
  NativeTask(proto::Language language, const sandbox::ExecutionContext* context,
             const Toolchain& toolchain, sandbox::Sandbox* sandbox,
             std::string working_dir, std::string source_file)
      : LanguageTask(language, context, toolchain, sandbox,
                     std::move(working_dir), std::move(source_file)) {}

  virtual const std::string& Compiler() const = 0;
  // Flags given to the compiler before the output and source files.
  virtual std::vector<std::string> CompilerFlags() const = 0;

  CompilationResult DoCompile() override;
  RunCommand DoGetRunCommand(
      const CompilationResult& compilation) const override;
};

class CTask : public NativeTask {
 public:
  CTask(const sandbox::ExecutionContext* context, const Toolchain& toolchain,
        sandbox::Sandbox* sandbox, std::string working_dir,
        std::string source_file)
      : NativeTask(proto::C, context, toolchain, sandbox,
                   std::move(working_dir), std::move(source_file)) {}

  std::string Version() const override { return "gcc-4.6.3"; }

 protected:
  const std::string& Compiler() const override { return toolchain_.gcc; }
  std::vector<std::string> CompilerFlags() const override {
    return {"-Wall", "-Werror", "-std=c99", "-x", "c"};
  }
};

class CppTask : public NativeTask {
 public:
  CppTask(const sandbox::ExecutionContext* context, const Toolchain& toolchain,
          sandbox::Sandbox* sandbox, std::string working_dir,
          std::string source_file)
      : NativeTask(proto::CPP, context, toolchain, sandbox,
                   std::move(working_dir), std::move(source_file)) {}

  std::string Version() const override { return "g++-4.6.3"; }

 protected:
  const std::string& Compiler() const override { return toolchain_.gxx; }
  std::vector<std::string> CompilerFlags() const override {
    return {"-Wall", "-Werror", "-x", "c++"};
  }
};

}  // namespace task

#endif
