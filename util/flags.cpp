#include "util/flags.hpp"

#include <cstdint>
#include <cstdio>

namespace {
bool ValidatePositive(const char* flagname, int64_t value) {
  if (value > 0) return true;
  fprintf(stderr, "Invalid value for --%s: %ld, must be positive\n", flagname,
          static_cast<long>(value));
  return false;
}

bool ValidateNonNegative(const char* flagname, int64_t value) {
  if (value >= 0) return true;
  fprintf(stderr, "Invalid value for --%s: %ld, must not be negative\n",
          flagname, static_cast<long>(value));
  return false;
}

bool ValidatePositive32(const char* flagname, int32_t value) {
  return ValidatePositive(flagname, value);
}

bool ValidateNonNegative32(const char* flagname, int32_t value) {
  return ValidateNonNegative(flagname, value);
}
}  // namespace

DEFINE_string(temp_directory, "temp",
              "Where the working directories of the submissions are created");
DEFINE_bool(keep_sandbox, false,
            "Do not remove the working directory after the execution");
DEFINE_int32(wall_grace_millis, 2000,
             "Wall clock time allowed on top of the cpu time limit before the "
             "enforcer is killed");
DEFINE_validator(wall_grace_millis, &ValidateNonNegative32);
DEFINE_int32(compile_time_limit, 30,
             "Seconds of wall clock time allowed to the compilers");
DEFINE_validator(compile_time_limit, &ValidatePositive32);
DEFINE_int64(max_output_kb, 64 * 1024,
             "Maximum amount of stdout/stderr kept from a single execution");
DEFINE_validator(max_output_kb, &ValidatePositive);

DEFINE_string(runguard, "/usr/local/bin/runguard",
              "Path of the resource limit enforcer");
DEFINE_string(run_as_user, "coderunner",
              "Account under which the submissions are run");
DEFINE_string(python2, "/usr/bin/python2", "Python 2 interpreter");
DEFINE_string(python3, "/usr/bin/python3", "Python 3 interpreter");
DEFINE_string(java, "/usr/bin/java", "Java virtual machine");
DEFINE_string(javac, "/usr/bin/javac", "Java compiler");
DEFINE_string(gcc, "gcc", "C compiler");
DEFINE_string(gxx, "g++", "C++ compiler");
DEFINE_string(matlab, "/usr/local/bin/matlab_exec_cli",
              "Matlab command line executor");

DEFINE_int64(cpu_time, 5, "Seconds of cpu time allowed to the submission");
DEFINE_validator(cpu_time, &ValidatePositive);
DEFINE_int64(memory_limit, 100, "Memory allowed to the submission, in MB");
DEFINE_validator(memory_limit, &ValidateNonNegative);
DEFINE_int64(disk_limit, 10,
             "Maximum size of files and output streams, in MB");
DEFINE_validator(disk_limit, &ValidateNonNegative);
DEFINE_int32(num_procs, 10,
             "Maximum number of processes of the execution account");
DEFINE_validator(num_procs, &ValidatePositive32);
