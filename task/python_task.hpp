#ifndef TASK_PYTHON_TASK_HPP
#define TASK_PYTHON_TASK_HPP

#include "task/language_task.hpp"

namespace task {

// Python 2 sources run as they are, there is no compilation step.
class Python2Task : public LanguageTask {
 public:
  Python2Task(const sandbox::ExecutionContext* context,
              const Toolchain& toolchain, sandbox::Sandbox* sandbox,
              std::string working_dir, std::string source_file)
      : LanguageTask(proto::PYTHON2, context, toolchain, sandbox,
                     std::move(working_dir), std::move(source_file)) {}

  std::string Version() const override { return "Python 2.7"; }

 protected:
  CompilationResult DoCompile() override;
  RunCommand DoGetRunCommand(
      const CompilationResult& compilation) const override;
};

// Python 3 sources are byte-compiled first, so that syntax errors are
// reported as compilation errors.
class Python3Task : public LanguageTask {
 public:
  Python3Task(const sandbox::ExecutionContext* context,
              const Toolchain& toolchain, sandbox::Sandbox* sandbox,
              std::string working_dir, std::string source_file)
      : LanguageTask(proto::PYTHON3, context, toolchain, sandbox,
                     std::move(working_dir), std::move(source_file)) {}

  std::string Version() const override { return "Python 3.2"; }

 protected:
  CompilationResult DoCompile() override;
  RunCommand DoGetRunCommand(
      const CompilationResult& compilation) const override;
};

}  // namespace task

#endif
