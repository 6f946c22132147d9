#include <feedbacker/models.h>

#include <array>
#include <utility>

namespace feedbacker {
namespace {

constexpr std::array<std::pair<JobState, const char *>, 7> kJobStateNames{{
    {JobState::kPending, "pending"},
    {JobState::kFetching, "fetching"},
    {JobState::kRunning, "running"},
    {JobState::kStoring, "storing"},
    {JobState::kSucceeded, "succeeded"},
    {JobState::kFailed, "failed"},
    {JobState::kCancelled, "cancelled"},
}};

constexpr std::array<std::pair<ErrorKind, const char *>, 8> kErrorKindNames{{
    {ErrorKind::kAuth, "auth_error"},
    {ErrorKind::kNetwork, "network_error"},
    {ErrorKind::kRevisionNotFound, "revision_not_found"},
    {ErrorKind::kTimeout, "timeout"},
    {ErrorKind::kPersistence, "persistence_error"},
    {ErrorKind::kOverloaded, "overloaded"},
    {ErrorKind::kCancelled, "cancelled"},
    {ErrorKind::kAnalysisFailed, "analysis_failed"},
}};

constexpr std::array<std::pair<Severity, const char *>, 3> kSeverityNames{{
    {Severity::kInfo, "info"},
    {Severity::kWarning, "warning"},
    {Severity::kError, "error"},
}};

template <typename Enum, std::size_t N>
std::string NameOf(const std::array<std::pair<Enum, const char *>, N> &names,
                   Enum value) {
  for (const auto &[candidate, name] : names) {
    if (candidate == value) {
      return name;
    }
  }
  return "unknown";
}

template <typename Enum, std::size_t N>
std::optional<Enum>
ValueOf(const std::array<std::pair<Enum, const char *>, N> &names,
        const std::string &value) {
  for (const auto &[candidate, name] : names) {
    if (value == name) {
      return candidate;
    }
  }
  return std::nullopt;
}

} // namespace

bool IsTerminal(JobState state) {
  return state == JobState::kSucceeded || state == JobState::kFailed ||
         state == JobState::kCancelled;
}

bool IsLegalTransition(JobState from, JobState to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (to == JobState::kCancelled || to == JobState::kFailed) {
    return true;
  }
  switch (from) {
  case JobState::kPending:
    return to == JobState::kFetching;
  case JobState::kFetching:
    // Back to pending when a transient fetch failure is retried.
    return to == JobState::kRunning || to == JobState::kPending;
  case JobState::kRunning:
    return to == JobState::kStoring;
  case JobState::kStoring:
    return to == JobState::kSucceeded;
  default:
    return false;
  }
}

bool IsLegalRecoveryTransition(JobState from, JobState to) {
  return to == JobState::kPending &&
         (from == JobState::kFetching || from == JobState::kRunning ||
          from == JobState::kStoring);
}

std::string ToString(JobState state) { return NameOf(kJobStateNames, state); }

std::string ToString(ErrorKind kind) { return NameOf(kErrorKindNames, kind); }

std::string ToString(Severity severity) {
  return NameOf(kSeverityNames, severity);
}

std::optional<JobState> ParseJobState(const std::string &value) {
  return ValueOf(kJobStateNames, value);
}

std::optional<ErrorKind> ParseErrorKind(const std::string &value) {
  return ValueOf(kErrorKindNames, value);
}

std::optional<Severity> ParseSeverity(const std::string &value) {
  if (value == "note" || value == "remark") {
    return Severity::kInfo;
  }
  if (value == "fatal error") {
    return Severity::kError;
  }
  return ValueOf(kSeverityNames, value);
}

std::int64_t ToEpochMillis(TimePoint time) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             time.time_since_epoch())
      .count();
}

TimePoint FromEpochMillis(std::int64_t millis) {
  return TimePoint(std::chrono::duration_cast<TimePoint::duration>(
      std::chrono::milliseconds(millis)));
}

} // namespace feedbacker
