#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace sandbox {

// How to start one process. The processes started here are trusted to limit
// themselves (compilers, or the enforcer that limits the submission), so the
// limits below only protect the caller from a hung toolchain.
struct ExecutionOptions {
  // Directory the process starts in, and the program to start. A relative
  // executable is resolved from root.
  std::string root;
  std::string executable;
  std::vector<std::string> args;
  // Read as standard input; /dev/null if empty.
  std::string stdin_file;

  // Zero disables a limit.
  int64_t wall_limit_millis = 0;
  int64_t cpu_limit_millis = 0;
  int64_t memory_limit_kb = 0;
  int64_t max_file_size_kb = 0;
  int32_t max_procs = 0;
  // Bytes of each output stream that are kept, the rest is read and dropped.
  int64_t max_output_bytes = 64 * 1024 * 1024;

  ExecutionOptions(std::string root_, std::string executable_)
      : root(std::move(root_)), executable(std::move(executable_)) {}
};

// What happened to the process.
struct ExecutionInfo {
  int32_t status_code = 0;
  int32_t signal = 0;
  // Set when the wall limit elapsed and the process group was killed.
  bool killed = false;
  int64_t cpu_time_millis = 0;
  int64_t sys_time_millis = 0;
  int64_t wall_time_millis = 0;
  std::string stdout_content;
  std::string stderr_content;
};

// Starts processes and collects their outcome.
//
// Implementations register themselves with a global
// Sandbox::Register<Impl> object; Impl provides three static functions:
//   Sandbox* Create();    a new instance
//   int Score();          how suitable Impl is on this machine, higher is
//                         better, negative means unusable
//   const char* Name();   used to ask for Impl explicitly
// Registration happens during static initialization and is not thread safe.
class Sandbox {
 public:
  // The usable sandbox with the highest score, or nullptr.
  static std::unique_ptr<Sandbox> Create();
  // The sandbox registered under name, or nullptr.
  static std::unique_ptr<Sandbox> Create(const std::string& name);

  // Starts the process described by options and waits for it. Returns false,
  // with a description in error_msg, if the process could not be started;
  // otherwise fills info. An instance runs one process at a time.
  bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
               std::string* error_msg) {
    *info = ExecutionInfo();
    error_msg->clear();
    return ExecuteInternal(options, info, error_msg);
  }

  Sandbox() = default;
  virtual ~Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;

  template <typename T>
  class Register {
   public:
    Register() { Sandbox::Add({T::Name(), &T::Create, &T::Score}); }
  };

 protected:
  virtual bool ExecuteInternal(const ExecutionOptions& options,
                               ExecutionInfo* info, std::string* error_msg) = 0;

 private:
  struct Entry {
    std::string name;
    std::function<Sandbox*()> create;
    std::function<int()> score;
  };
  static std::vector<Entry>* Registry();
  static void Add(Entry entry);
};

}  // namespace sandbox

#endif
