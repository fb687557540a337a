#ifndef SANDBOX_LIMITS_HPP
#define SANDBOX_LIMITS_HPP

#include <cstdint>

namespace sandbox {

// Resource ceilings for one submission. Memory and disk limits are given in
// megabytes, the enforcer wants kilobytes and bytes respectively.
// Values are not validated here: callers reject out-of-range values before
// building the object.
class ResourceLimits {
 public:
  ResourceLimits(int64_t cpu_time, int64_t memory_limit, int64_t disk_limit,
                 int32_t num_procs)
      : cpu_time_(cpu_time),
        memory_limit_(memory_limit),
        disk_limit_(disk_limit),
        num_procs_(num_procs) {}

  // Seconds.
  int64_t CpuTime() const { return cpu_time_; }
  int64_t MemoryLimit() const { return memory_limit_; }
  int64_t DiskLimit() const { return disk_limit_; }
  int32_t NumProcs() const { return num_procs_; }

  int64_t MemoryLimitKb() const { return memory_limit_ * 1000; }
  int64_t DiskLimitBytes() const { return disk_limit_ * 1000000; }

 private:
  int64_t cpu_time_;
  int64_t memory_limit_;
  int64_t disk_limit_;
  int32_t num_procs_;
};

}  // namespace sandbox

#endif
