#ifndef RUNNER_EXECUTION_RESULT_HPP
#define RUNNER_EXECUTION_RESULT_HPP

#include <cstdint>
#include <string>

#include "proto/result.pb.h"

namespace runner {

// Outcome of a submission. A program that was not run (because it did not
// compile, or because it was killed at the deadline) has exit_status
// kNotRun; compile_info is empty if and only if the program compiled.
struct ExecutionResult {
  static const constexpr int32_t kNotRun = -1;

  std::string compile_info;
  std::string stdout_content;
  std::string stderr_content;
  int32_t exit_status = kNotRun;
  bool timed_out = false;

  bool Compiled() const { return compile_info.empty(); }
  proto::ExecutionResult ToProto() const;
};

}  // namespace runner

#endif
