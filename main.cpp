#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "absl/memory/memory.h"
#include "absl/strings/ascii.h"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "google/protobuf/text_format.h"
#include "google/protobuf/util/json_util.h"
#include "proto/result.pb.h"
#include "proto/task.pb.h"
#include "runner/runner.hpp"
#include "sandbox/echo.hpp"
#include "task/language_task.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"

DEFINE_string(language, "", "Language of the submission, e.g. python3");
DEFINE_string(source, "", "File containing the source code to run");
DEFINE_string(stdin_file, "", "File given as standard input to the program");
DEFINE_string(request, "",
              "JSON encoded Submission, replaces --language, --source and "
              "--stdin_file");
DEFINE_string(output_format, "json", "How to print the result: json or text");
DEFINE_bool(list_languages, false, "Print the supported languages and exit");
DEFINE_bool(dry_run, false,
            "Run nothing: the program output becomes the command line that "
            "would have been executed");

namespace {
bool ValidateOutputFormat(const char* flagname, const std::string& value) {
  if (value == "json" || value == "text") return true;
  std::cerr << "Invalid value for --" << flagname << ": " << value
            << ", must be json or text" << std::endl;
  return false;
}
}  // namespace
DEFINE_validator(output_format, &ValidateOutputFormat);

namespace {

proto::ResourceLimits LimitsFromFlags() {
  proto::ResourceLimits limits;
  limits.set_cpu_time(FLAGS_cpu_time);
  limits.set_memory_limit(FLAGS_memory_limit);
  limits.set_disk_limit(FLAGS_disk_limit);
  limits.set_num_procs(FLAGS_num_procs);
  return limits;
}

proto::Language ParseLanguage(const std::string& name) {
  proto::Language language = proto::INVALID_LANGUAGE;
  if (!proto::Language_Parse(absl::AsciiStrToUpper(name), &language) ||
      language == proto::INVALID_LANGUAGE) {
    throw std::invalid_argument("Unknown language: " + name);
  }
  return language;
}

proto::Submission SubmissionFromFlags() {
  proto::Submission submission;
  if (!FLAGS_request.empty()) {
    auto status = google::protobuf::util::JsonStringToMessage(
        util::File::Read(FLAGS_request), &submission);
    if (!status.ok()) {
      throw std::invalid_argument("Invalid request " + FLAGS_request + ": " +
                                  status.ToString());
    }
  } else {
    if (FLAGS_source.empty()) {
      throw std::invalid_argument("You need to specify --source or --request");
    }
    submission.set_language(ParseLanguage(FLAGS_language));
    submission.set_source_code(util::File::Read(FLAGS_source));
    if (!FLAGS_stdin_file.empty()) {
      submission.set_stdin_text(util::File::Read(FLAGS_stdin_file));
    }
  }
  if (submission.run_as_user().empty()) {
    submission.set_run_as_user(FLAGS_run_as_user);
  }
  if (!submission.has_limits()) {
    *submission.mutable_limits() = LimitsFromFlags();
  }
  return submission;
}

void ListLanguages() {
  const sandbox::ExecutionContext context =
      sandbox::ExecutionContext::FromProto(FLAGS_run_as_user,
                                           LimitsFromFlags());
  std::unique_ptr<sandbox::Sandbox> echo =
      sandbox::Sandbox::Create(sandbox::Echo::Name());
  CHECK(echo != nullptr);
  for (int i = proto::Language_MIN; i <= proto::Language_MAX; i++) {
    if (!proto::Language_IsValid(i) || i == proto::INVALID_LANGUAGE) continue;
    proto::Language language = static_cast<proto::Language>(i);
    auto task = task::LanguageTask::Create(
        language, &context, task::Toolchain(), echo.get(), ".",
        task::LanguageTask::DefaultSourceFile(language));
    std::cout << absl::AsciiStrToLower(proto::Language_Name(language)) << "\t"
              << task->Version() << std::endl;
  }
}

std::string FormatResult(const proto::ExecutionResult& result) {
  std::string out;
  if (FLAGS_output_format == "text") {
    if (!google::protobuf::TextFormat::PrintToString(result, &out)) {
      throw std::runtime_error("Cannot print the result");
    }
    return out;
  }
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names = true;
  auto status =
      google::protobuf::util::MessageToJsonString(result, &out, options);
  if (!status.ok()) {
    throw std::runtime_error("Cannot print the result: " + status.ToString());
  }
  return out;
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage(
      "Compiles and runs a program under the resource limit enforcer");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT
  google::InstallFailureSignalHandler();

  try {
    if (FLAGS_list_languages) {
      ListLanguages();
      return 0;
    }
    proto::Submission submission = SubmissionFromFlags();
    std::unique_ptr<sandbox::Sandbox> sandbox;
    if (FLAGS_dry_run) {
      sandbox = sandbox::Sandbox::Create(sandbox::Echo::Name());
    } else {
      sandbox = sandbox::Sandbox::Create();
    }
    if (!sandbox) {
      LOG(ERROR) << "No sandbox available";
      return 1;
    }
    runner::Runner runner(runner::RunnerOptions::FromFlags(),
                          std::move(sandbox));
    runner::ExecutionResult result = runner.Run(submission);
    std::cout << FormatResult(result.ToProto()) << std::endl;
  } catch (const task::EnvironmentError& exc) {
    LOG(ERROR) << "Broken execution environment: " << exc.what();
    return 1;
  } catch (const std::exception& exc) {
    LOG(ERROR) << exc.what();
    return 1;
  }
  return 0;
}
