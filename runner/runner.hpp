#ifndef RUNNER_RUNNER_HPP
#define RUNNER_RUNNER_HPP

#include <cstdint>
#include <memory>
#include <string>

#include "proto/task.pb.h"
#include "runner/execution_result.hpp"
#include "sandbox/context.hpp"
#include "sandbox/sandbox.hpp"
#include "task/toolchain.hpp"

namespace runner {

struct RunnerOptions {
  task::Toolchain toolchain;
  std::string temp_directory = "temp";
  bool keep_sandbox = false;
  // Added to the cpu time limit to obtain the wall clock deadline of the
  // enforcer.
  int64_t wall_grace_millis = 2000;
  int64_t max_output_bytes = 64 * 1024 * 1024;

  static RunnerOptions FromFlags();
};

// Compiles and runs submissions, each one in a fresh working directory.
// A Runner is not thread safe, as its sandbox is not: use one per thread.
class Runner {
 public:
  Runner(RunnerOptions options, std::unique_ptr<sandbox::Sandbox> sandbox);

  // Compiles source_code and, if that succeeds, runs it under the enforcer
  // with stdin_content as its standard input. Throws task::EnvironmentError
  // if the environment prevents the execution, std::domain_error for
  // unsupported languages.
  ExecutionResult Run(proto::Language language, const std::string& source_code,
                      const std::string& stdin_content,
                      const sandbox::ExecutionContext& context);

  ExecutionResult Run(const proto::Submission& submission);

  const RunnerOptions& Options() const { return options_; }

  Runner(const Runner&) = delete;
  Runner& operator=(const Runner&) = delete;
  Runner(Runner&&) = delete;
  Runner& operator=(Runner&&) = delete;
  ~Runner() = default;

 private:
  static const constexpr char* kStdinFile = "stdin.txt";

  // Writes a file the run account has to read.
  void WriteInput(const std::string& path, const std::string& content);

  RunnerOptions options_;
  std::unique_ptr<sandbox::Sandbox> sandbox_;
};

}  // namespace runner

#endif
