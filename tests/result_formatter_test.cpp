#include <feedbacker/result_formatter.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace feedbacker {
namespace {

using ::testing::HasSubstr;

Job SampleJob() {
  Job job;
  job.id = "0b7c0d4e-1f2a-4b3c-8d9e-0123456789ab";
  job.repository = {"git@example.com:team/repo.git", "v1.2"};
  job.analysis_set = {"lint", "tests"};
  job.job_class = "default";
  job.state = JobState::kSucceeded;
  job.attempt = 1;
  job.max_attempts = 3;
  job.created_at = FromEpochMillis(1700000000000);
  job.started_at = FromEpochMillis(1700000001000);
  job.finished_at = FromEpochMillis(1700000002000);
  return job;
}

PersistedResult SampleResult() {
  PersistedResult persisted;
  persisted.job_id = SampleJob().id;
  persisted.attempt = 1;
  persisted.stored_at = FromEpochMillis(1700000002000);
  persisted.result.findings.push_back({Severity::kError, "-Wreturn-type",
                                       "control reaches end", "src/a.c", 7, 1,
                                       "build"});
  persisted.result.steps.push_back({"build", 1, std::chrono::milliseconds(42)});
  persisted.result.passed = false;
  return persisted;
}

TEST(ResultFormatterTest, JsonIncludesJobAndResult) {
  const auto json = FormatJobJson(SampleJob(), SampleResult());

  EXPECT_THAT(json, HasSubstr("\"id\":\"0b7c0d4e-1f2a-4b3c-8d9e-0123456789ab\""));
  EXPECT_THAT(json, HasSubstr("\"analysis_set\":[\"lint\",\"tests\"]"));
  EXPECT_THAT(json, HasSubstr("\"state\":\"succeeded\""));
  EXPECT_THAT(json, HasSubstr("\"created_at\":\"2023-11-14T22:13:20Z\""));
  EXPECT_THAT(json, HasSubstr("\"error\":null"));
  EXPECT_THAT(json, HasSubstr("\"passed\":false"));
  EXPECT_THAT(json, HasSubstr("\"steps\":[{\"name\":\"build\",\"exit_code\":1,"
                              "\"duration_ms\":42}]"));
  EXPECT_THAT(json, HasSubstr("\"rule_id\":\"-Wreturn-type\""));
}

TEST(ResultFormatterTest, JsonReportsErrorWithoutResult) {
  auto job = SampleJob();
  job.state = JobState::kFailed;
  job.started_at.reset();
  job.last_error = JobErrorInfo{ErrorKind::kNetwork, "host \"down\""};

  const auto json = FormatJobJson(job, std::nullopt);

  EXPECT_THAT(json, HasSubstr("\"started_at\":null"));
  EXPECT_THAT(json, HasSubstr("\"error\":{\"kind\":\"network_error\","
                              "\"message\":\"host \\\"down\\\"\"}"));
  EXPECT_THAT(json, HasSubstr("\"result\":null"));
}

TEST(ResultFormatterTest, TextListsFindingsThenSummary) {
  const auto text = FormatJobText(SampleJob(), SampleResult());

  EXPECT_EQ("src/a.c:7:1: error: control reaches end [-Wreturn-type]\n"
            "job 0b7c0d4e-1f2a-4b3c-8d9e-0123456789ab succeeded (attempt 1/3)"
            ", 1 findings, not passed\n",
            text);
}

TEST(ResultFormatterTest, TextIncludesFailureReason) {
  auto job = SampleJob();
  job.state = JobState::kFailed;
  job.attempt = 3;
  job.last_error = JobErrorInfo{ErrorKind::kTimeout, "step exceeded deadline"};

  EXPECT_EQ("job 0b7c0d4e-1f2a-4b3c-8d9e-0123456789ab failed (attempt 3/3): "
            "timeout: step exceeded deadline\n",
            FormatJobText(job, std::nullopt));
}

} // namespace
} // namespace feedbacker
