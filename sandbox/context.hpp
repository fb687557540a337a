#ifndef SANDBOX_CONTEXT_HPP
#define SANDBOX_CONTEXT_HPP

#include <memory>
#include <string>

#include "proto/task.pb.h"
#include "sandbox/limits.hpp"

namespace sandbox {

// The account and the limits a submission is run with. Read-only for the
// whole lifetime of an execution; the limits may be shared between contexts.
class ExecutionContext {
 public:
  ExecutionContext(std::string run_as_user,
                   std::shared_ptr<const ResourceLimits> limits);

  // Throws std::invalid_argument if a limit is out of range: the cpu time and
  // the number of processes must be positive, memory and disk must not be
  // negative.
  static ExecutionContext FromProto(const std::string& run_as_user,
                                    const proto::ResourceLimits& limits);

  const std::string& RunAsUser() const { return run_as_user_; }
  const ResourceLimits& Limits() const { return *limits_; }

  int64_t CpuTime() const { return limits_->CpuTime(); }
  int64_t MemoryLimit() const { return limits_->MemoryLimit(); }
  int64_t DiskLimit() const { return limits_->DiskLimit(); }
  int32_t NumProcs() const { return limits_->NumProcs(); }

 private:
  std::string run_as_user_;
  std::shared_ptr<const ResourceLimits> limits_;
};

}  // namespace sandbox

#endif
