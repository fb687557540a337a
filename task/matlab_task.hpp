#ifndef TASK_MATLAB_TASK_HPP
#define TASK_MATLAB_TASK_HPP

#include "task/language_task.hpp"

namespace task {

class MatlabTask : public LanguageTask {
 public:
  // Last line of the banner printed by Matlab at startup.
  static const constexpr char* kBannerEnd =
      "For product information, visit www.mathworks.com.";
  // Several web threads may be running Matlab at once under the same account.
  static const constexpr int32_t kNumProcs = 200;

  MatlabTask(const sandbox::ExecutionContext* context,
             const Toolchain& toolchain, sandbox::Sandbox* sandbox,
             std::string working_dir, std::string source_file)
      : LanguageTask(proto::MATLAB, context, toolchain, sandbox,
                     std::move(working_dir), std::move(source_file)) {}

  std::string Version() const override { return "Matlab R2012"; }

  // Drops the startup banner (everything up to kBannerEnd), trailing spaces
  // and blank lines at both ends. The result ends with exactly one newline.
  std::string FilterOutput(const std::string& output) const override;

 protected:
  // Copies the source to a .m file, the only thing Matlab can run.
  CompilationResult DoCompile() override;
  RunCommand DoGetRunCommand(
      const CompilationResult& compilation) const override;
};

}  // namespace task

#endif
