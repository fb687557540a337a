#ifndef TASK_JAVA_TASK_HPP
#define TASK_JAVA_TASK_HPP

#include <string>

#include "absl/types/optional.h"
#include "task/language_task.hpp"

namespace task {

// Returns the name of the public class declaring the main method, or nothing
// if there is no such class or more than one. This is a textual scan, not a
// parse: a commented-out class would fool it.
absl::optional<std::string> FindMainClass(const std::string& program);

// javac wants the file name to match the public class, so the source file is
// renamed to <main class>.java before compiling.
class JavaTask : public LanguageTask {
 public:
  static const constexpr char* kNoMainClass =
      "Error: no main class found, or multiple main classes. [Did you write a "
      "public class when asked for a non-public one?]";

  JavaTask(const sandbox::ExecutionContext* context,
           const Toolchain& toolchain, sandbox::Sandbox* sandbox,
           std::string working_dir, std::string source_file)
      : LanguageTask(proto::JAVA, context, toolchain, sandbox,
                     std::move(working_dir), std::move(source_file)) {}

  std::string Version() const override { return "Java 1.6"; }

 protected:
  CompilationResult DoCompile() override;
  RunCommand DoGetRunCommand(
      const CompilationResult& compilation) const override;
};

}  // namespace task

#endif
