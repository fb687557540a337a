#include "sandbox/context.hpp"

#include <cstdint>
#include <stdexcept>
#include <utility>

#include "absl/strings/str_cat.h"

namespace sandbox {

namespace {
// A day of cpu time and 2^30 MB of memory or disk. Within these bounds the
// enforcer units and the wall clock deadline fit in an int64_t.
const constexpr int64_t kMaxCpuTime = 24 * 60 * 60;
const constexpr int64_t kMaxMegabytes = int64_t{1} << 30;

void CheckRange(const char* name, int64_t value, int64_t min, int64_t max) {
  if (value < min || value > max) {
    throw std::invalid_argument(absl::StrCat("Invalid ", name, ": ", value,
                                             ", must be between ", min,
                                             " and ", max));
  }
}
}  // namespace

ExecutionContext::ExecutionContext(
    std::string run_as_user, std::shared_ptr<const ResourceLimits> limits)
    : run_as_user_(std::move(run_as_user)), limits_(std::move(limits)) {
  if (!limits_) throw std::invalid_argument("Missing resource limits");
  if (run_as_user_.empty()) throw std::invalid_argument("Missing user");
}

// static
ExecutionContext ExecutionContext::FromProto(
    const std::string& run_as_user, const proto::ResourceLimits& limits) {
  CheckRange("cpu_time", limits.cpu_time(), 1, kMaxCpuTime);
  CheckRange("memory_limit", limits.memory_limit(), 0, kMaxMegabytes);
  CheckRange("disk_limit", limits.disk_limit(), 0, kMaxMegabytes);
  CheckRange("num_procs", limits.num_procs(), 1, INT32_MAX);
  return ExecutionContext(
      run_as_user,
      std::make_shared<const ResourceLimits>(
          limits.cpu_time(), limits.memory_limit(), limits.disk_limit(),
          limits.num_procs()));
}

}  // namespace sandbox
