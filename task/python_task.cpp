#include "task/python_task.hpp"

namespace task {

CompilationResult Python2Task::DoCompile() {
  return NoCompilation(source_file_);
}

RunCommand Python2Task::DoGetRunCommand(
    const CompilationResult& compilation) const {
  RunCommand command = EnforcerCommand();
  // -B: no .pyc files, -E: ignore PYTHON* variables, -S: no site module,
  // -s: no user site directory.
  command.insert(command.end(),
                 {toolchain_.python2, "-BESs", *compilation.executable_file});
  return command;
}

CompilationResult Python3Task::DoCompile() {
  return RunCompiler(toolchain_.python3, {"-m", "py_compile", source_file_},
                     source_file_, source_file_);
}

RunCommand Python3Task::DoGetRunCommand(
    const CompilationResult& compilation) const {
  RunCommand command = EnforcerCommand();
  command.insert(command.end(),
                 {toolchain_.python3, "-BE", *compilation.executable_file});
  return command;
}

}  // namespace task
