#include "task/toolchain.hpp"

#include "glog/logging.h"
#include "util/flags.hpp"
#include "util/which.hpp"

namespace task {

namespace {
std::string Resolve(const std::string& cmd) {
  std::string path = util::which(cmd);
  if (path.empty()) {
    LOG(WARNING) << cmd << " not found, submissions that need it will fail";
    return cmd;
  }
  return path;
}
}  // namespace

// static
Toolchain Toolchain::FromFlags() {
  Toolchain toolchain;
  toolchain.runguard = Resolve(FLAGS_runguard);
  toolchain.python2 = Resolve(FLAGS_python2);
  toolchain.python3 = Resolve(FLAGS_python3);
  toolchain.java = Resolve(FLAGS_java);
  toolchain.javac = Resolve(FLAGS_javac);
  toolchain.gcc = Resolve(FLAGS_gcc);
  toolchain.gxx = Resolve(FLAGS_gxx);
  toolchain.matlab = Resolve(FLAGS_matlab);
  toolchain.compile_time_limit_millis =
      static_cast<int64_t>(FLAGS_compile_time_limit) * 1000;
  return toolchain;
}

}  // namespace task
