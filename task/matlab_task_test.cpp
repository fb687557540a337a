#include "task/matlab_task.hpp"

#include <memory>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/mock_sandbox.hpp"
#include "util/file.hpp"

namespace {

using ::testing::_;
using ::testing::NiceMock;

using task::MatlabTask;

const std::string test_tmpdir = "/tmp/coderunner_testdir";

const char* kStartup =
    "\n"
    "                            < M A T L A B (R) >\n"
    "                  Copyright 1984-2012 The MathWorks, Inc.\n"
    "                    R2012a (7.14.0.739) 32-bit (glnx86)\n"
    "                              February 9, 2012\n"
    "\n"
    " \n"
    "To get started, type one of these: helpwin, helpdesk, or demo.\n"
    "For product information, visit www.mathworks.com.\n"
    " \n";

class MatlabTaskTest : public ::testing::Test {
 protected:
  MatlabTaskTest()
      : tmp_(test_tmpdir + "/matlab"),
        context_("runner", std::make_shared<const sandbox::ResourceLimits>(
                               2, 100, 5, 10)),
        task_(&context_, toolchain_, &sandbox_, tmp_.Path(), "prog") {}

  std::string Path(const std::string& name) {
    return util::File::JoinPath(tmp_.Path(), name);
  }

  util::TempDir tmp_;
  sandbox::ExecutionContext context_;
  task::Toolchain toolchain_;
  NiceMock<sandbox::MockSandbox> sandbox_;
  MatlabTask task_;
};

TEST_F(MatlabTaskTest, StripsBanner) {
  std::string output = std::string(kStartup) + "ans =\n\n    42   \n\n\n";
  EXPECT_EQ(task_.FilterOutput(output), "ans =\n\n    42\n");
}

TEST_F(MatlabTaskTest, BannerOnly) {
  EXPECT_EQ(task_.FilterOutput(kStartup), "\n");
}

TEST_F(MatlabTaskTest, NoBannerKeepsEverything) {
  EXPECT_EQ(task_.FilterOutput("\n\nx = 1  \ny = 2\n\n"), "x = 1\ny = 2\n");
}

TEST_F(MatlabTaskTest, FilterIsIdempotent) {
  std::string once =
      task_.FilterOutput(std::string(kStartup) + "  a\n\n b  \n\n");
  EXPECT_EQ(once, "  a\n\n b\n");
  EXPECT_EQ(task_.FilterOutput(once), once);
}

TEST_F(MatlabTaskTest, CompileCopiesToMFile) {
  EXPECT_CALL(sandbox_, ExecuteInternal(_, _, _)).Times(0);
  util::File::Write(Path("prog"), "disp(42)\n");
  const task::CompilationResult& result = task_.Compile();
  ASSERT_TRUE(result.Success());
  EXPECT_EQ(*result.executable_file, "prog.m");
  EXPECT_EQ(util::File::Read(Path("prog.m")), "disp(42)\n");
  EXPECT_EQ(util::File::Read(Path("prog")), "disp(42)\n");
}

TEST_F(MatlabTaskTest, CompileOverwritesStaleMFile) {
  util::File::Write(Path("prog"), "disp(1)\n");
  util::File::Write(Path("prog.m"), "stale\n");
  ASSERT_TRUE(task_.Compile().Success());
  EXPECT_EQ(util::File::Read(Path("prog.m")), "disp(1)\n");
}

TEST_F(MatlabTaskTest, MissingSource) {
  EXPECT_THROW(task_.Compile(), task::EnvironmentError);
}

}  // namespace
