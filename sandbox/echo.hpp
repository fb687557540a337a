#ifndef SANDBOX_ECHO_HPP
#define SANDBOX_ECHO_HPP

#include "sandbox/sandbox.hpp"

namespace sandbox {

// Runs nothing. Every execution succeeds with exit status 0, and its standard
// output is the command line that would have been run, so that a dry run
// shows what would happen.
class Echo : public Sandbox {
 public:
  static Sandbox* Create() { return new Echo(); }
  static int Score() { return 0; }
  static const char* Name() { return "echo"; }

  // Shell-like rendering of the command line in options.
  static std::string CommandLine(const ExecutionOptions& options);

 protected:
  bool ExecuteInternal(const ExecutionOptions& options, ExecutionInfo* info,
                       std::string* error_msg) override;

 private:
  Echo() = default;
};

}  // namespace sandbox

#endif
