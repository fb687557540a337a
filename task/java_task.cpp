#include "task/java_task.hpp"

#include <cstring>
#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/string_view.h"
#include "util/file.hpp"

namespace task {

namespace {
const constexpr char* kJavaSuffix = ".java";

bool IsWordChar(char c) { return absl::ascii_isalnum(c) || c == '_'; }

// The scanners below take the position to start from and return the position
// right after what they consumed, or npos if the text does not match.

size_t ConsumeSpaces(absl::string_view text, size_t pos, bool required) {
  size_t end = pos;
  while (end < text.size() && absl::ascii_isspace(text[end])) end++;
  if (required && end == pos) return absl::string_view::npos;
  return end;
}

size_t ConsumeLiteral(absl::string_view text, size_t pos,
                      absl::string_view literal) {
  if (!absl::StartsWith(text.substr(pos), literal)) {
    return absl::string_view::npos;
  }
  return pos + literal.size();
}

// Consumes keywords separated by at least one space each.
size_t ConsumeKeywords(absl::string_view text, size_t pos,
                       const std::vector<absl::string_view>& keywords) {
  for (size_t i = 0; i < keywords.size(); i++) {
    if (i > 0) pos = ConsumeSpaces(text, pos, true);
    if (pos == absl::string_view::npos) return pos;
    pos = ConsumeLiteral(text, pos, keywords[i]);
    if (pos == absl::string_view::npos) return pos;
  }
  return pos;
}

// "public class <name> {", with "public" not preceded by a word character.
size_t MatchClassHeader(absl::string_view text, size_t pos,
                        std::string* name) {
  if (pos > 0 && IsWordChar(text[pos - 1])) return absl::string_view::npos;
  pos = ConsumeKeywords(text, pos, {"public", "class"});
  if (pos == absl::string_view::npos) return pos;
  pos = ConsumeSpaces(text, pos, true);
  if (pos == absl::string_view::npos) return pos;
  const size_t name_start = pos;
  while (pos < text.size() && IsWordChar(text[pos])) pos++;
  if (pos == name_start) return absl::string_view::npos;
  const absl::string_view found = text.substr(name_start, pos - name_start);
  pos = ConsumeLiteral(text, ConsumeSpaces(text, pos, false), "{");
  if (pos == absl::string_view::npos) return pos;
  *name = std::string(found);
  return pos;
}

// "public static void main(String".
size_t MatchMainMethod(absl::string_view text, size_t pos) {
  pos = ConsumeKeywords(text, pos, {"public", "static", "void", "main"});
  if (pos == absl::string_view::npos) return pos;
  pos = ConsumeLiteral(text, ConsumeSpaces(text, pos, false), "(");
  if (pos == absl::string_view::npos) return pos;
  return ConsumeLiteral(text, ConsumeSpaces(text, pos, false), "String");
}

}  // namespace

const constexpr char* JavaTask::kNoMainClass;

absl::optional<std::string> FindMainClass(const std::string& program) {
  const absl::string_view text(program);
  // Each candidate spans from a class header to the first main method after
  // it, candidates do not overlap.
  std::vector<std::string> candidates;
  size_t pos = 0;
  while (true) {
    std::string name;
    size_t header_end = absl::string_view::npos;
    for (size_t at = text.find("public", pos); at != absl::string_view::npos;
         at = text.find("public", at + 1)) {
      header_end = MatchClassHeader(text, at, &name);
      if (header_end != absl::string_view::npos) break;
    }
    if (header_end == absl::string_view::npos) break;

    size_t main_end = absl::string_view::npos;
    for (size_t at = text.find("public", header_end);
         at != absl::string_view::npos; at = text.find("public", at + 1)) {
      main_end = MatchMainMethod(text, at);
      if (main_end != absl::string_view::npos) break;
    }
    if (main_end == absl::string_view::npos) break;
    candidates.push_back(name);
    pos = main_end;
  }
  if (candidates.size() != 1) return absl::nullopt;
  return candidates[0];
}

CompilationResult JavaTask::DoCompile() {
  std::string program;
  try {
    program = util::File::Read(InWorkingDir(source_file_));
  } catch (const std::system_error& exc) {
    throw EnvironmentError(std::string("Couldn't read Java source file: ") +
                           exc.what());
  }

  absl::optional<std::string> main_class = FindMainClass(program);
  if (!main_class) {
    CompilationResult result;
    result.source_file = source_file_;
    result.compile_info = kNoMainClass;
    return result;
  }

  std::string renamed = *main_class + kJavaSuffix;
  if (renamed != source_file_) {
    try {
      util::File::Move(InWorkingDir(source_file_), InWorkingDir(renamed));
    } catch (const std::system_error& exc) {
      throw EnvironmentError(std::string("Couldn't rename Java source file: ") +
                             exc.what());
    }
  }
  return RunCompiler(toolchain_.javac, {renamed}, renamed, renamed);
}

RunCommand JavaTask::DoGetRunCommand(
    const CompilationResult& compilation) const {
  std::string main_class = compilation.source_file;
  if (absl::EndsWith(main_class, kJavaSuffix)) {
    main_class.resize(main_class.size() - strlen(kJavaSuffix));
  }
  RunCommand command = EnforcerCommand();
  // -Xrs: the JVM would print debugging output when killed by the enforcer.
  command.insert(command.end(), {toolchain_.java, "-Xrs", "-Xss8m",
                                 "-Xmx200m", main_class});
  return command;
}

}  // namespace task
