#include "runner/execution_result.hpp"

namespace runner {

const constexpr int32_t ExecutionResult::kNotRun;

proto::ExecutionResult ExecutionResult::ToProto() const {
  proto::ExecutionResult result;
  result.set_compile_info(compile_info);
  result.set_program_stdout(stdout_content);
  result.set_program_stderr(stderr_content);
  result.set_exit_status(exit_status);
  result.set_timed_out(timed_out);
  return result;
}

}  // namespace runner
