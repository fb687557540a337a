#include "task/toolchain.hpp"

#include <sys/stat.h>

#include <cstdlib>
#include <fstream>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace {

const std::string test_tmpdir = "/tmp/coderunner_testdir";

void createExecutable(const std::string& path) {
  { std::ofstream os(path); }
  chmod(path.c_str(), 0755);
}

// NOLINTNEXTLINE
TEST(Toolchain, FromFlags) {
  util::TempDir bin(test_tmpdir + "/toolchain");
  createExecutable(bin.Path() + "/my-gcc");
  createExecutable(bin.Path() + "/runguard");
  setenv("PATH", bin.Path().c_str(), 1);

  gflags::FlagSaver saver;
  FLAGS_runguard = bin.Path() + "/runguard";
  FLAGS_gcc = "my-gcc";
  FLAGS_gxx = "no-such-compiler";
  FLAGS_python3 = "/no/such/python3";
  FLAGS_compile_time_limit = 7;

  task::Toolchain toolchain = task::Toolchain::FromFlags();
  EXPECT_EQ(toolchain.runguard, bin.Path() + "/runguard");
  EXPECT_EQ(toolchain.gcc, bin.Path() + "/my-gcc");
  // Tools that cannot be found are kept as configured.
  EXPECT_EQ(toolchain.gxx, "no-such-compiler");
  EXPECT_EQ(toolchain.python3, "/no/such/python3");
  EXPECT_EQ(toolchain.compile_time_limit_millis, 7000);
}

}  // namespace
