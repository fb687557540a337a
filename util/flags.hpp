#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

// Execution environment
DECLARE_string(temp_directory);
DECLARE_bool(keep_sandbox);
DECLARE_int32(wall_grace_millis);
DECLARE_int32(compile_time_limit);
DECLARE_int64(max_output_kb);

// Enforcer and toolchains
DECLARE_string(runguard);
DECLARE_string(run_as_user);
DECLARE_string(python2);
DECLARE_string(python3);
DECLARE_string(java);
DECLARE_string(javac);
DECLARE_string(gcc);
DECLARE_string(gxx);
DECLARE_string(matlab);

// Default resource limits
DECLARE_int64(cpu_time);
DECLARE_int64(memory_limit);
DECLARE_int64(disk_limit);
DECLARE_int32(num_procs);

#endif
