#include <feedbacker/cli_exit_codes.h>

namespace feedbacker {

int JobExitCode(const Job &job, const std::optional<PersistedResult> &result) {
  switch (job.state) {
  case JobState::kSucceeded:
    return result.has_value() && !result->result.passed ? kExitFindings
                                                        : kExitOk;
  case JobState::kFailed:
    return kExitJobFailed;
  case JobState::kCancelled:
    return kExitCancelled;
  case JobState::kPending:
  case JobState::kFetching:
  case JobState::kRunning:
  case JobState::kStoring:
    return kExitNotFinished;
  }
  return kExitUsage;
}

} // namespace feedbacker
