#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP

#include <vector>

#include "sandbox/sandbox.hpp"

namespace sandbox {

// Runs programs with fork and exec on UNIX-like systems. The child gets its
// own session, so that the whole process group can be killed on timeout, and
// its standard output and error are captured through pipes.
class Unix : public Sandbox {
 public:
  static Sandbox* Create() { return new Unix(); }
  static int Score() { return 1; }
  static const char* Name() { return "unix"; }

 protected:
  Unix() = default;

  bool ExecuteInternal(const ExecutionOptions& options, ExecutionInfo* info,
                       std::string* error_msg) override;

  // Executed before creating the child process. Returns false and sets
  // error_msg if setup fails.
  bool Setup(std::string* error_msg);

  // Creates a child process and saves its PID in child_pid_. The child process
  // should execute Child and must not return.
  bool DoFork(std::string* error_msg);

  // Function that is executed in the child process.
  [[noreturn]] void Child();

  // Waits for the termination of the child, possibly killing it if it exceeds
  // the provided wall time limit, while collecting its output.
  bool Wait(ExecutionInfo* info, std::string* error_msg);

  // Closes every descriptor still owned by the parent.
  void CloseAll();

  // Status pipe: the child writes an error message there if exec fails.
  int pipe_fds_[2] = {-1, -1};
  int stdout_fds_[2] = {-1, -1};
  int stderr_fds_[2] = {-1, -1};
  int child_pid_ = 0;
  const ExecutionOptions* options_ = nullptr;

  // Prepared before forking, the child must not allocate memory.
  std::vector<std::vector<char>> arg_storage_;
  std::vector<char*> argv_;
};

}  // namespace sandbox
#endif
