#ifndef TASK_TOOLCHAIN_HPP
#define TASK_TOOLCHAIN_HPP

#include <cstdint>
#include <string>

namespace task {

// Where the enforcer and the language toolchains are installed, and how long
// a compiler may run. Tests substitute stub binaries here.
struct Toolchain {
  std::string runguard;
  std::string python2;
  std::string python3;
  std::string java;
  std::string javac;
  std::string gcc;
  std::string gxx;
  std::string matlab;
  int64_t compile_time_limit_millis = 30 * 1000;

  // Builds the toolchain from the command line flags. Commands given without
  // a directory are looked up in PATH; the ones that cannot be found are left
  // as they are, and only fail when a submission needs them.
  static Toolchain FromFlags();
};

}  // namespace task

#endif
