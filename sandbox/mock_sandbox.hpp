#ifndef SANDBOX_MOCK_SANDBOX_HPP
#define SANDBOX_MOCK_SANDBOX_HPP

#include <cstdint>
#include <string>

#include "gmock/gmock.h"
#include "sandbox/sandbox.hpp"

namespace sandbox {

class MockSandbox : public Sandbox {
 public:
  MOCK_METHOD(bool, ExecuteInternal,
              (const ExecutionOptions& options, ExecutionInfo* info,
               std::string* error_msg),
              (override));
};

// Action that reports a completed execution with the given outcome.
inline auto Finished(int32_t status_code, std::string stdout_content = "",
                     std::string stderr_content = "") {
  return [=](const ExecutionOptions& /*options*/, ExecutionInfo* info,
             std::string* /*error_msg*/) {
    info->status_code = status_code;
    info->stdout_content = stdout_content;
    info->stderr_content = stderr_content;
    return true;
  };
}

}  // namespace sandbox

#endif
