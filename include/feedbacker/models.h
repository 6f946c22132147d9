#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace feedbacker {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Deadline = std::chrono::steady_clock::time_point;

enum class JobState {
  kPending,
  kFetching,
  kRunning,
  kStoring,
  kSucceeded,
  kFailed,
  kCancelled
};

enum class ErrorKind {
  kAuth,
  kNetwork,
  kRevisionNotFound,
  kTimeout,
  kPersistence,
  kOverloaded,
  kCancelled,
  kAnalysisFailed
};

enum class Severity { kInfo, kWarning, kError };

struct RepositoryRef {
  std::string url;
  std::string revision;
};

struct JobRequest {
  RepositoryRef repository;
  std::vector<std::string> analysis_set;
  std::string job_class;
};

struct JobErrorInfo {
  ErrorKind kind = ErrorKind::kNetwork;
  std::string message;
};

struct Job {
  std::string id;
  RepositoryRef repository;
  std::vector<std::string> analysis_set;
  std::string job_class;
  JobState state = JobState::kPending;
  int attempt = 0;
  int max_attempts = 1;
  TimePoint created_at{};
  std::optional<TimePoint> started_at;
  std::optional<TimePoint> finished_at;
  std::optional<TimePoint> next_attempt_at;
  std::optional<JobErrorInfo> last_error;
};

struct JobTransition {
  std::string job_id;
  int sequence = 0;
  int attempt = 0;
  std::optional<JobState> from;
  JobState to = JobState::kPending;
  TimePoint at{};
  std::optional<ErrorKind> error;
};

struct RetryPolicy {
  int max_attempts = 3;
  std::chrono::milliseconds initial_backoff{1000};
  double multiplier = 2.0;
  std::chrono::milliseconds max_backoff{60000};
  std::set<ErrorKind> retryable{ErrorKind::kNetwork};
};

struct Finding {
  Severity severity = Severity::kWarning;
  std::string rule_id;
  std::string message;
  std::string path;
  int line = 0;
  int column = 0;
  std::string step;
};

struct StepOutcome {
  std::string name;
  int exit_code = 0;
  std::chrono::milliseconds duration{0};
};

struct AnalysisResult {
  std::vector<Finding> findings;
  std::vector<StepOutcome> steps;
  bool passed = true;
};

struct PersistedResult {
  std::string job_id;
  int attempt = 0;
  AnalysisResult result;
  TimePoint stored_at{};
};

struct Ack {
  bool inserted = false;
};

bool IsTerminal(JobState state);
bool IsLegalTransition(JobState from, JobState to);
// An attempt cut short by a restart goes back to Pending. Only valid while
// recovering unfinished jobs from the store.
bool IsLegalRecoveryTransition(JobState from, JobState to);

std::string ToString(JobState state);
std::string ToString(ErrorKind kind);
std::string ToString(Severity severity);

std::optional<JobState> ParseJobState(const std::string &value);
std::optional<ErrorKind> ParseErrorKind(const std::string &value);
std::optional<Severity> ParseSeverity(const std::string &value);

std::int64_t ToEpochMillis(TimePoint time);
TimePoint FromEpochMillis(std::int64_t millis);

} // namespace feedbacker
