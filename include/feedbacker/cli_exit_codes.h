#pragma once

#include <feedbacker/models.h>

#include <optional>

namespace feedbacker {

inline constexpr int kExitOk = 0;
inline constexpr int kExitUsage = 1;
inline constexpr int kExitFindings = 2;
inline constexpr int kExitJobFailed = 3;
inline constexpr int kExitCancelled = 4;
inline constexpr int kExitNotFinished = 5;
inline constexpr int kExitUnhealthy = 6;

// 0 when the job succeeded and its result passed, 2 when it succeeded with
// blocking findings.
int JobExitCode(const Job &job, const std::optional<PersistedResult> &result);

} // namespace feedbacker
