#include <feedbacker/clang_diagnostics.h>

#include <feedbacker/default_analysis_runner.h>
#include <feedbacker/job_error.h>
#include <feedbacker/subprocess.h>

#include <clang-c/CXCompilationDatabase.h>
#include <clang-c/Index.h>
#include <algorithm>
#include <filesystem>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace feedbacker {
namespace {

struct TranslationUnitEntry {
  std::filesystem::path file;
  std::vector<std::string> args;
};

std::string ToString(CXString value) {
  std::string text;
  if (const auto *cstr = clang_getCString(value); cstr != nullptr) {
    text = cstr;
  }
  clang_disposeString(value);
  return text;
}

bool IsWithin(const std::filesystem::path &candidate,
              const std::filesystem::path &parent) {
  const auto relative = candidate.lexically_relative(parent);
  return !relative.empty() && *relative.begin() != "..";
}

bool IsSourceFile(const std::filesystem::path &path) {
  static const std::set<std::string> kExtensions = {".c", ".cc", ".cpp",
                                                    ".cxx"};
  return kExtensions.count(path.extension().string()) != 0;
}

std::vector<std::string> ExtractArgs(CXCompileCommand command,
                                     const std::string &file) {
  std::vector<std::string> args;
  const unsigned count = clang_CompileCommand_getNumArgs(command);
  for (unsigned index = 1; index < count; ++index) {
    auto arg = ToString(clang_CompileCommand_getArg(command, index));
    if (arg == "-c" || arg == file) {
      continue;
    }
    if (arg == "-o") {
      ++index;
      continue;
    }
    args.push_back(std::move(arg));
  }
  return args;
}

std::vector<TranslationUnitEntry>
LoadCompilationDatabase(const std::filesystem::path &root) {
  for (const auto &directory : {root, root / "build"}) {
    if (!std::filesystem::exists(directory / "compile_commands.json")) {
      continue;
    }
    CXCompilationDatabase_Error error = CXCompilationDatabase_NoError;
    CXCompilationDatabase database = clang_CompilationDatabase_fromDirectory(
        directory.string().c_str(), &error);
    if (error != CXCompilationDatabase_NoError || database == nullptr) {
      continue;
    }

    CXCompileCommands commands =
        clang_CompilationDatabase_getAllCompileCommands(database);
    const unsigned size = clang_CompileCommands_getSize(commands);
    std::set<std::string> seen;
    std::vector<TranslationUnitEntry> entries;
    for (unsigned index = 0; index < size; ++index) {
      CXCompileCommand command =
          clang_CompileCommands_getCommand(commands, index);
      const auto file = ToString(clang_CompileCommand_getFilename(command));
      std::filesystem::path path(file);
      if (path.is_relative()) {
        path = std::filesystem::path(ToString(
                   clang_CompileCommand_getDirectory(command))) /
               path;
      }
      path = path.lexically_normal();
      if (!IsWithin(path, root) || !seen.insert(path.string()).second) {
        continue;
      }
      entries.push_back({path, ExtractArgs(command, file)});
    }
    clang_CompileCommands_dispose(commands);
    clang_CompilationDatabase_dispose(database);
    if (!entries.empty()) {
      return entries;
    }
  }
  return {};
}

std::vector<TranslationUnitEntry>
DiscoverSources(const std::filesystem::path &root) {
  std::vector<TranslationUnitEntry> entries;
  std::error_code error;
  std::filesystem::recursive_directory_iterator iterator(
      root, std::filesystem::directory_options::skip_permission_denied, error);
  const std::filesystem::recursive_directory_iterator end;
  for (; !error && iterator != end; iterator.increment(error)) {
    if (iterator->is_directory() &&
        iterator->path().filename().string().rfind('.', 0) == 0) {
      iterator.disable_recursion_pending();
      continue;
    }
    if (!iterator->is_regular_file() || !IsSourceFile(iterator->path())) {
      continue;
    }
    const auto is_c = iterator->path().extension() == ".c";
    entries.push_back({iterator->path().lexically_normal(),
                       {is_c ? "-std=c11" : "-std=c++17"}});
  }
  if (error) {
    throw JobError(ErrorKind::kAnalysisFailed,
                   "Cannot list sources under " + root.string() + ": " +
                       error.message());
  }
  std::sort(entries.begin(), entries.end(),
            [](const TranslationUnitEntry &left,
               const TranslationUnitEntry &right) {
              return left.file < right.file;
            });
  return entries;
}

const char *SeverityName(CXDiagnosticSeverity severity) {
  switch (severity) {
  case CXDiagnostic_Error:
  case CXDiagnostic_Fatal:
    return "error";
  case CXDiagnostic_Warning:
    return "warning";
  default:
    return "info";
  }
}

std::string RuleFor(CXDiagnostic diagnostic) {
  auto option = ToString(clang_getDiagnosticOption(diagnostic, nullptr));
  while (!option.empty() && option.front() == '-') {
    option.erase(option.begin());
  }
  return option.empty() ? "clang" : option;
}

// One `path:line:column: severity: message [rule]` line per diagnostic.
std::string FormatDiagnostics(CXTranslationUnit translation_unit,
                              const std::filesystem::path &root) {
  constexpr std::size_t kMaxMessageLength = 1024;
  std::string lines;
  const unsigned count = clang_getNumDiagnostics(translation_unit);
  for (unsigned index = 0; index < count; ++index) {
    CXDiagnostic diagnostic = clang_getDiagnostic(translation_unit, index);
    const auto severity = clang_getDiagnosticSeverity(diagnostic);
    if (severity == CXDiagnostic_Ignored || severity == CXDiagnostic_Note) {
      clang_disposeDiagnostic(diagnostic);
      continue;
    }

    CXFile file{};
    unsigned line = 0;
    unsigned column = 0;
    clang_getSpellingLocation(clang_getDiagnosticLocation(diagnostic), &file,
                              &line, &column, nullptr);
    const std::filesystem::path path =
        file == nullptr
            ? std::filesystem::path{}
            : std::filesystem::path(ToString(clang_getFileName(file)))
                  .lexically_normal();
    if (!path.empty() && line > 0 && IsWithin(path, root)) {
      auto message = ToString(clang_getDiagnosticSpelling(diagnostic));
      std::replace(message.begin(), message.end(), '\n', ' ');
      if (message.size() > kMaxMessageLength) {
        message.resize(kMaxMessageLength);
      }
      lines += path.lexically_relative(root).generic_string() + ":" +
               std::to_string(line) + ":" + std::to_string(column) + ": " +
               SeverityName(severity) + ": " + message + " [" +
               RuleFor(diagnostic) + "]\n";
    }
    clang_disposeDiagnostic(diagnostic);
  }
  return lines;
}

// Body of the forked child: parses every translation unit and streams the
// diagnostics to `stdout_fd`.
int ReportDiagnostics(const std::filesystem::path &root,
                      const ClangDiagnosticsStep &step, int stdout_fd,
                      int stderr_fd) {
  auto entries = LoadCompilationDatabase(root);
  if (entries.empty()) {
    entries = DiscoverSources(root);
  }

  std::unique_ptr<void, decltype(&clang_disposeIndex)> index(
      clang_createIndex(0, 0), &clang_disposeIndex);
  for (const auto &entry : entries) {
    auto args = entry.args;
    args.insert(args.end(), step.extra_arguments.begin(),
                step.extra_arguments.end());
    std::vector<const char *> arg_pointers;
    arg_pointers.reserve(args.size());
    for (const auto &arg : args) {
      arg_pointers.push_back(arg.c_str());
    }

    CXTranslationUnit translation_unit = nullptr;
    const auto error = clang_parseTranslationUnit2(
        index.get(), entry.file.string().c_str(), arg_pointers.data(),
        static_cast<int>(arg_pointers.size()), nullptr, 0,
        CXTranslationUnit_None, &translation_unit);
    if (error != CXError_Success || translation_unit == nullptr) {
      WriteToDescriptor(stderr_fd, "cannot parse " + entry.file.string() +
                                       " (libclang error " +
                                       std::to_string(static_cast<int>(error)) +
                                       ")\n");
      continue;
    }
    WriteToDescriptor(stdout_fd, FormatDiagnostics(translation_unit, root));
    clang_disposeTranslationUnit(translation_unit);
  }
  return 0;
}

} // namespace

std::vector<Finding> CollectClangDiagnostics(const WorkingCopy &working_copy,
                                             const ClangDiagnosticsStep &step,
                                             Deadline deadline,
                                             const CancellationToken &cancellation,
                                             Logger &logger) {
  const auto root = working_copy.root().lexically_normal();
  const auto result = RunForked(
      [&root, &step](int stdout_fd, int stderr_fd) {
        return ReportDiagnostics(root, step, stdout_fd, stderr_fd);
      },
      deadline, &cancellation);

  switch (result.status) {
  case ProcessStatus::kTimedOut:
    throw JobError(ErrorKind::kTimeout,
                   "clang diagnostics exceeded the deadline");
  case ProcessStatus::kCancelled:
    throw JobError(ErrorKind::kCancelled, "clang diagnostics cancelled");
  case ProcessStatus::kLaunchFailed:
  case ProcessStatus::kSignaled:
    throw JobError(ErrorKind::kAnalysisFailed,
                   "clang diagnostics did not complete: " +
                       result.stderr_output);
  case ProcessStatus::kExited:
    break;
  }
  if (result.exit_code != 0) {
    throw JobError(ErrorKind::kAnalysisFailed, result.stderr_output);
  }

  std::istringstream problems(result.stderr_output);
  std::string problem;
  while (std::getline(problems, problem)) {
    logger.Log(LogLevel::kWarn, "clang.parse_failed", {{"detail", problem}});
  }
  return ParseDiagnostics(result.stdout_output, root, "clang");
}

} // namespace feedbacker
