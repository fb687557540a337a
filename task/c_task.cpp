#include "task/c_task.hpp"

#include "util/file.hpp"

namespace task {

CompilationResult NativeTask::DoCompile() {
  std::string source = util::File::BaseName(source_file_);
  std::string executable = source + ".exe";
  std::vector<std::string> args = CompilerFlags();
  args.insert(args.end(), {"-o", executable, source, "-lm"});
  return RunCompiler(Compiler(), args, source_file_, executable);
}

RunCommand NativeTask::DoGetRunCommand(
    const CompilationResult& compilation) const {
  RunCommand command = EnforcerCommand();
  command.push_back("./" + *compilation.executable_file);
  return command;
}

}  // namespace task
