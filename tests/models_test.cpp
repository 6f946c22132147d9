#include <feedbacker/job_error.h>
#include <feedbacker/models.h>

#include <gtest/gtest.h>

#include <vector>

namespace feedbacker {
namespace {

const std::vector<JobState> kAllStates = {
    JobState::kPending,   JobState::kFetching, JobState::kRunning,
    JobState::kStoring,   JobState::kSucceeded, JobState::kFailed,
    JobState::kCancelled};

TEST(JobStateTest, TerminalStatesAreFinal) {
  for (const auto terminal :
       {JobState::kSucceeded, JobState::kFailed, JobState::kCancelled}) {
    EXPECT_TRUE(IsTerminal(terminal));
    for (const auto to : kAllStates) {
      EXPECT_FALSE(IsLegalTransition(terminal, to))
          << ToString(terminal) << " -> " << ToString(to);
    }
  }
}

TEST(JobStateTest, HappyPathIsLegal) {
  EXPECT_TRUE(IsLegalTransition(JobState::kPending, JobState::kFetching));
  EXPECT_TRUE(IsLegalTransition(JobState::kFetching, JobState::kRunning));
  EXPECT_TRUE(IsLegalTransition(JobState::kRunning, JobState::kStoring));
  EXPECT_TRUE(IsLegalTransition(JobState::kStoring, JobState::kSucceeded));
}

TEST(JobStateTest, SkippingAheadIsIllegal) {
  EXPECT_FALSE(IsLegalTransition(JobState::kPending, JobState::kRunning));
  EXPECT_FALSE(IsLegalTransition(JobState::kPending, JobState::kSucceeded));
  EXPECT_FALSE(IsLegalTransition(JobState::kFetching, JobState::kStoring));
  EXPECT_FALSE(IsLegalTransition(JobState::kRunning, JobState::kSucceeded));
  EXPECT_FALSE(IsLegalTransition(JobState::kRunning, JobState::kFetching));
}

TEST(JobStateTest, EveryActiveStateCanFailOrBeCancelled) {
  for (const auto from : kAllStates) {
    if (IsTerminal(from)) {
      continue;
    }
    EXPECT_TRUE(IsLegalTransition(from, JobState::kFailed));
    EXPECT_TRUE(IsLegalTransition(from, JobState::kCancelled));
  }
}

TEST(JobStateTest, RetryReturnsToPending) {
  EXPECT_TRUE(IsLegalTransition(JobState::kFetching, JobState::kPending));
  EXPECT_FALSE(IsLegalTransition(JobState::kPending, JobState::kPending));
}

TEST(JobStateTest, LaterStagesReturnToPendingOnlyDuringRecovery) {
  EXPECT_FALSE(IsLegalTransition(JobState::kRunning, JobState::kPending));
  EXPECT_FALSE(IsLegalTransition(JobState::kStoring, JobState::kPending));

  EXPECT_TRUE(IsLegalRecoveryTransition(JobState::kFetching, JobState::kPending));
  EXPECT_TRUE(IsLegalRecoveryTransition(JobState::kRunning, JobState::kPending));
  EXPECT_TRUE(IsLegalRecoveryTransition(JobState::kStoring, JobState::kPending));
  EXPECT_FALSE(IsLegalRecoveryTransition(JobState::kPending, JobState::kPending));
  EXPECT_FALSE(
      IsLegalRecoveryTransition(JobState::kSucceeded, JobState::kPending));
  EXPECT_FALSE(IsLegalRecoveryTransition(JobState::kRunning, JobState::kStoring));
}

TEST(JobStateTest, NamesRoundTrip) {
  for (const auto state : kAllStates) {
    EXPECT_EQ(state, ParseJobState(ToString(state)));
  }
  EXPECT_FALSE(ParseJobState("done").has_value());
}

TEST(ErrorKindTest, UsesStableWireNames) {
  EXPECT_EQ("auth_error", ToString(ErrorKind::kAuth));
  EXPECT_EQ("network_error", ToString(ErrorKind::kNetwork));
  EXPECT_EQ("revision_not_found", ToString(ErrorKind::kRevisionNotFound));
  EXPECT_EQ("persistence_error", ToString(ErrorKind::kPersistence));
  EXPECT_EQ(ErrorKind::kOverloaded, ParseErrorKind("overloaded"));
  EXPECT_FALSE(ParseErrorKind("network").has_value());
}

TEST(SeverityTest, MapsCompilerSeverities) {
  EXPECT_EQ(Severity::kError, ParseSeverity("fatal error"));
  EXPECT_EQ(Severity::kInfo, ParseSeverity("note"));
  EXPECT_EQ(Severity::kInfo, ParseSeverity("remark"));
  EXPECT_EQ(Severity::kWarning, ParseSeverity("warning"));
  EXPECT_FALSE(ParseSeverity("hint").has_value());
}

TEST(TimeConversionTest, EpochMillisRoundTrip) {
  const auto time = FromEpochMillis(1700000000123);
  EXPECT_EQ(1700000000123, ToEpochMillis(time));
}

TEST(JobErrorTest, CarriesKindAndMessage) {
  const JobError error(ErrorKind::kTimeout, "step exceeded its deadline");
  EXPECT_EQ(ErrorKind::kTimeout, error.kind());
  EXPECT_EQ(ErrorKind::kTimeout, error.info().kind);
  EXPECT_EQ("step exceeded its deadline", error.info().message);
}

} // namespace
} // namespace feedbacker
