#include <feedbacker/default_analysis_runner.h>

#include <feedbacker/clang_diagnostics.h>
#include <feedbacker/job_error.h>
#include <feedbacker/subprocess.h>

#include <algorithm>
#include <charconv>
#include <chrono>
#include <optional>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <tuple>
#include <type_traits>
#include <utility>

namespace feedbacker {
namespace {

// Private HOME/TMPDIR for the steps of one run.
class ScratchDirectory {
public:
  explicit ScratchDirectory(std::filesystem::path path)
      : path_(std::move(path)) {
    std::error_code error;
    std::filesystem::remove_all(path_, error);
    std::filesystem::create_directories(path_ / "tmp", error);
    if (error) {
      throw JobError(ErrorKind::kAnalysisFailed,
                     "Cannot create scratch directory " + path_.string() +
                         ": " + error.message());
    }
  }
  ~ScratchDirectory() {
    std::error_code error;
    std::filesystem::remove_all(path_, error);
  }
  ScratchDirectory(const ScratchDirectory &) = delete;
  ScratchDirectory &operator=(const ScratchDirectory &) = delete;

  const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

void ThrowIfInterrupted(Deadline deadline,
                        const CancellationToken &cancellation,
                        const std::string &step) {
  if (cancellation.IsCancelled()) {
    throw JobError(ErrorKind::kCancelled, "analysis cancelled before " + step);
  }
  if (std::chrono::steady_clock::now() >= deadline) {
    throw JobError(ErrorKind::kTimeout,
                   "analysis deadline exceeded before " + step);
  }
}

std::string NormalizePath(const std::string &raw,
                          const std::filesystem::path &root) {
  std::filesystem::path path(raw);
  if (path.is_absolute() && !root.empty()) {
    const auto relative = path.lexically_normal().lexically_relative(
        root.lexically_normal());
    if (!relative.empty() && *relative.begin() != "..") {
      return relative.generic_string();
    }
    return path.lexically_normal().generic_string();
  }
  return path.lexically_normal().generic_string();
}

// Longer lines are not diagnostics; std::regex recurses per character.
constexpr std::size_t kMaxDiagnosticLineLength = 4096;

std::optional<int> ParseNumber(const std::string &text) {
  int value = 0;
  const auto *end = text.data() + text.size();
  const auto [position, error] = std::from_chars(text.data(), end, value);
  if (error != std::errc() || position != end) {
    return std::nullopt;
  }
  return value;
}

} // namespace

std::vector<Finding> ParseDiagnostics(const std::string &output,
                                      const std::filesystem::path &root,
                                      const std::string &step_name) {
  static const std::regex kDiagnostic(
      R"(^(.+?):(\d+):(?:(\d+):)?\s*(fatal error|error|warning|note|remark|info):\s*(.*?)(?:\s+\[([^\]\s]+)\])?\s*$)");

  std::vector<Finding> findings;
  std::istringstream stream(output);
  std::string line;
  while (std::getline(stream, line)) {
    if (line.size() > kMaxDiagnosticLineLength) {
      continue;
    }
    std::smatch match;
    if (!std::regex_match(line, match, kDiagnostic)) {
      continue;
    }
    const auto line_number = ParseNumber(match[2].str());
    const auto column =
        match[3].matched ? ParseNumber(match[3].str()) : std::optional<int>(0);
    if (!line_number || !column) {
      continue;
    }
    Finding finding;
    finding.path = NormalizePath(match[1].str(), root);
    finding.line = *line_number;
    finding.column = *column;
    finding.severity = ParseSeverity(match[4].str()).value_or(Severity::kWarning);
    finding.message = match[5].str();
    finding.rule_id = match[6].matched ? match[6].str() : step_name;
    finding.step = step_name;
    findings.push_back(std::move(finding));
  }
  return findings;
}

void SortFindings(std::vector<Finding> &findings) {
  std::stable_sort(findings.begin(), findings.end(),
                   [](const Finding &left, const Finding &right) {
                     return std::tie(left.path, left.line, left.rule_id,
                                     left.column, left.message) <
                            std::tie(right.path, right.line, right.rule_id,
                                     right.column, right.message);
                   });
}

DefaultAnalysisRunner::DefaultAnalysisRunner(AnalysisCatalog catalog,
                                             AnalysisRunnerOptions options,
                                             std::shared_ptr<Logger> logger)
    : catalog_(std::move(catalog)), options_(std::move(options)),
      logger_(EnsureLogger(std::move(logger))) {}

bool DefaultAnalysisRunner::Supports(const std::string &step_name) const {
  return catalog_.Contains(step_name);
}

DefaultAnalysisRunner::StepOutput DefaultAnalysisRunner::RunCommand(
    const std::string &name, const CommandStep &step,
    const WorkingCopy &working_copy, const std::filesystem::path &scratch,
    Deadline deadline, const CancellationToken &cancellation) const {
  ProcessSpec spec;
  spec.argv = step.command;
  spec.working_directory = working_copy.root();
  spec.inherit_environment = false;
  spec.output_limit = options_.output_limit;
  spec.environment = {{"PATH", options_.path},
                      {"HOME", scratch.string()},
                      {"TMPDIR", (scratch / "tmp").string()},
                      {"LC_ALL", "C"},
                      {"FEEDBACKER_COMMIT", working_copy.commit()},
                      {"FEEDBACKER_REPOSITORY", working_copy.repository().url}};

  const auto result = RunProcess(spec, deadline, &cancellation);
  switch (result.status) {
  case ProcessStatus::kTimedOut:
    throw JobError(ErrorKind::kTimeout,
                   "analysis step '" + name + "' exceeded its deadline");
  case ProcessStatus::kCancelled:
    throw JobError(ErrorKind::kCancelled,
                   "analysis step '" + name + "' cancelled");
  case ProcessStatus::kLaunchFailed:
    throw JobError(ErrorKind::kAnalysisFailed, result.stderr_output);
  case ProcessStatus::kExited:
  case ProcessStatus::kSignaled:
    break;
  }

  StepOutput output;
  output.exit_code = result.exit_code;
  if (step.format == OutputFormat::kGcc) {
    output.findings = ParseDiagnostics(
        result.stdout_output + "\n" + result.stderr_output,
        working_copy.root(), name);
  }
  return output;
}

AnalysisResult
DefaultAnalysisRunner::Run(const WorkingCopy &working_copy,
                           const std::vector<std::string> &analysis_set,
                           Deadline deadline,
                           const CancellationToken &cancellation) {
  if (!working_copy.valid()) {
    throw JobError(ErrorKind::kAnalysisFailed, "No working copy to analyze");
  }
  ScratchDirectory scratch(working_copy.root().parent_path() /
                           ("." + working_copy.root().filename().string() +
                            ".scratch"));

  logger_->Log(LogLevel::kInfo, "analysis.start",
               {{"root", working_copy.root().string()},
                {"steps", std::to_string(analysis_set.size())}});

  AnalysisResult result;
  for (const auto &name : analysis_set) {
    ThrowIfInterrupted(deadline, cancellation, name);

    const StepDefinition *definition = nullptr;
    try {
      definition = &catalog_.Find(name);
    } catch (const std::invalid_argument &error) {
      throw JobError(ErrorKind::kAnalysisFailed, error.what());
    }

    const auto step_started = std::chrono::steady_clock::now();
    auto output = std::visit(
        [&](const auto &step) -> StepOutput {
          using Step = std::decay_t<decltype(step)>;
          if constexpr (std::is_same_v<Step, CommandStep>) {
            return RunCommand(name, step, working_copy, scratch.path(),
                              deadline, cancellation);
          } else {
#ifdef FEEDBACKER_HAS_LIBCLANG
            StepOutput clang_output;
            clang_output.findings = CollectClangDiagnostics(
                working_copy, step, deadline, cancellation, *logger_);
            return clang_output;
#else
            throw JobError(ErrorKind::kAnalysisFailed,
                           "analysis step '" + name +
                               "' needs libclang, which this build lacks");
#endif
          }
        },
        *definition);

    for (auto &finding : output.findings) {
      finding.step = name;
    }
    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - step_started);
    logger_->Log(LogLevel::kDebug, "analysis.step.complete",
                 {{"step", name},
                  {"exit_code", std::to_string(output.exit_code)},
                  {"findings", std::to_string(output.findings.size())},
                  {"duration_ms", std::to_string(duration.count())}});

    result.steps.push_back(StepOutcome{name, output.exit_code, duration});
    result.findings.insert(result.findings.end(),
                           std::make_move_iterator(output.findings.begin()),
                           std::make_move_iterator(output.findings.end()));
  }

  SortFindings(result.findings);
  const auto failed_step =
      std::any_of(result.steps.begin(), result.steps.end(),
                  [](const StepOutcome &step) { return step.exit_code != 0; });
  const auto has_error =
      std::any_of(result.findings.begin(), result.findings.end(),
                  [](const Finding &finding) {
                    return finding.severity == Severity::kError;
                  });
  result.passed = !failed_step && !has_error;

  logger_->Log(LogLevel::kInfo, "analysis.complete",
               {{"findings", std::to_string(result.findings.size())},
                {"passed", result.passed ? "true" : "false"}});
  return result;
}

} // namespace feedbacker
