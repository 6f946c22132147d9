#include <feedbacker/default_analysis_runner.h>
#include <feedbacker/job_error.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <thread>

#include "test_support/temporary_project.h"

namespace feedbacker {
namespace {

using namespace std::chrono_literals;
using ::testing::HasSubstr;

Deadline In(std::chrono::milliseconds duration) {
  return std::chrono::steady_clock::now() + duration;
}

CommandStep Script(const std::string &script,
                   OutputFormat format = OutputFormat::kGcc) {
  return CommandStep{{"/bin/sh", "-c", script}, format};
}

class DefaultAnalysisRunnerTest : public ::testing::Test {
protected:
  DefaultAnalysisRunnerTest()
      : copy_(project_.root() / "checkout", {"file:///srv/repo", "main"},
              "0123456789abcdef0123456789abcdef01234567") {
    std::filesystem::create_directories(copy_.root());
  }

  ErrorKind RunAndExpectError(DefaultAnalysisRunner &runner,
                              const std::vector<std::string> &steps,
                              Deadline deadline) {
    try {
      runner.Run(copy_, steps, deadline, token_);
    } catch (const JobError &error) {
      return error.kind();
    }
    ADD_FAILURE() << "Run did not fail";
    return ErrorKind::kNetwork;
  }

  test::TemporaryProject project_;
  WorkingCopy copy_;
  CancellationToken token_;
};

TEST(ParseDiagnosticsTest, ParsesGccStyleLines) {
  const std::string output =
      "/work/repo/src/main.c:12:5: warning: unused variable 'x' "
      "[-Wunused-variable]\n"
      "In file included from src/a.h:1:\n"
      "src/b.c:3: error: expected ';'\n"
      "make: *** [all] Error 1\n";

  const auto findings = ParseDiagnostics(output, "/work/repo", "build");

  ASSERT_EQ(2u, findings.size());
  EXPECT_EQ("src/main.c", findings[0].path);
  EXPECT_EQ(12, findings[0].line);
  EXPECT_EQ(5, findings[0].column);
  EXPECT_EQ(Severity::kWarning, findings[0].severity);
  EXPECT_EQ("unused variable 'x'", findings[0].message);
  EXPECT_EQ("-Wunused-variable", findings[0].rule_id);
  EXPECT_EQ("build", findings[0].step);

  EXPECT_EQ("src/b.c", findings[1].path);
  EXPECT_EQ(0, findings[1].column);
  EXPECT_EQ(Severity::kError, findings[1].severity);
  EXPECT_EQ("build", findings[1].rule_id);
}

TEST(ParseDiagnosticsTest, KeepsPathsOutsideRootAbsolute) {
  const auto findings = ParseDiagnostics(
      "/usr/include/stdio.h:1:1: note: declared here", "/work/repo", "cc");

  ASSERT_EQ(1u, findings.size());
  EXPECT_EQ("/usr/include/stdio.h", findings[0].path);
  EXPECT_EQ(Severity::kInfo, findings[0].severity);
}

TEST(ParseDiagnosticsTest, SkipsOverlongLines) {
  const auto output = std::string(200000, 'a') + "\n" +
                      "src/a.c:1: error: boom\n" + "src/" +
                      std::string(8000, 'b') + ".c:2: error: long path\n";

  const auto findings = ParseDiagnostics(output, "/work/repo", "lint");

  ASSERT_EQ(1u, findings.size());
  EXPECT_EQ("src/a.c", findings[0].path);
  EXPECT_EQ("boom", findings[0].message);
}

TEST(ParseDiagnosticsTest, SkipsLocationsThatDoNotFitAnInt) {
  const auto findings = ParseDiagnostics(
      "src/a.c:99999999999: error: boom\n"
      "src/a.c:3:99999999999: warning: wide\n"
      "src/a.c:4:2: warning: kept\n",
      "/work/repo", "lint");

  ASSERT_EQ(1u, findings.size());
  EXPECT_EQ(4, findings[0].line);
  EXPECT_EQ(2, findings[0].column);
  EXPECT_EQ("kept", findings[0].message);
}

TEST(SortFindingsTest, OrdersByPathLineThenRule) {
  std::vector<Finding> findings(4);
  findings[0] = {Severity::kWarning, "r2", "m", "b.c", 1, 0, "s"};
  findings[1] = {Severity::kWarning, "r1", "m", "a.c", 9, 0, "s"};
  findings[2] = {Severity::kWarning, "r3", "m", "a.c", 2, 0, "s"};
  findings[3] = {Severity::kWarning, "r1", "m", "a.c", 2, 0, "s"};

  SortFindings(findings);

  EXPECT_EQ("a.c", findings[0].path);
  EXPECT_EQ("r1", findings[0].rule_id);
  EXPECT_EQ("r3", findings[1].rule_id);
  EXPECT_EQ(9, findings[2].line);
  EXPECT_EQ("b.c", findings[3].path);
}

TEST_F(DefaultAnalysisRunnerTest, CollectsFindingsFromEveryStep) {
  AnalysisCatalog catalog;
  catalog.Register("lint", Script("echo 'z.c:1:1: warning: late [style]'; "
                                  "echo 'a.c:4:2: warning: early [style]' >&2"));
  catalog.Register("tidy", Script("echo 'a.c:1:1: note: first [tidy]'"));
  DefaultAnalysisRunner runner(catalog);

  const auto result = runner.Run(copy_, {"lint", "tidy"}, In(10s), token_);

  ASSERT_EQ(3u, result.findings.size());
  EXPECT_EQ("a.c", result.findings[0].path);
  EXPECT_EQ(1, result.findings[0].line);
  EXPECT_EQ("tidy", result.findings[0].step);
  EXPECT_EQ("a.c", result.findings[1].path);
  EXPECT_EQ("z.c", result.findings[2].path);
  ASSERT_EQ(2u, result.steps.size());
  EXPECT_EQ("lint", result.steps[0].name);
  EXPECT_EQ(0, result.steps[0].exit_code);
  EXPECT_TRUE(result.passed);
}

TEST_F(DefaultAnalysisRunnerTest, RepeatedRunsAreIdentical) {
  AnalysisCatalog catalog;
  catalog.Register("lint", Script("printf 'b.c:2:1: warning: w [r]\\n"
                                  "a.c:2:1: warning: w [r]\\n"
                                  "a.c:1:1: warning: w [r]\\n'"));
  DefaultAnalysisRunner runner(catalog);

  const auto first = runner.Run(copy_, {"lint"}, In(10s), token_);
  const auto second = runner.Run(copy_, {"lint"}, In(10s), token_);

  ASSERT_EQ(first.findings.size(), second.findings.size());
  for (std::size_t i = 0; i < first.findings.size(); ++i) {
    EXPECT_EQ(first.findings[i].path, second.findings[i].path);
    EXPECT_EQ(first.findings[i].line, second.findings[i].line);
  }
}

TEST_F(DefaultAnalysisRunnerTest, NonZeroExitOrErrorFindingFailsTheResult) {
  AnalysisCatalog catalog;
  catalog.Register("tests", Script("exit 1", OutputFormat::kNone));
  catalog.Register("build", Script("echo 'a.c:1:1: error: broken'"));
  DefaultAnalysisRunner runner(catalog);

  const auto failing_exit = runner.Run(copy_, {"tests"}, In(10s), token_);
  EXPECT_FALSE(failing_exit.passed);
  EXPECT_EQ(1, failing_exit.steps[0].exit_code);
  EXPECT_TRUE(failing_exit.findings.empty());

  const auto error_finding = runner.Run(copy_, {"build"}, In(10s), token_);
  EXPECT_FALSE(error_finding.passed);
}

TEST_F(DefaultAnalysisRunnerTest, StepRunsInCheckoutWithPrivateEnvironment) {
  ::setenv("FEEDBACKER_PARENT_ONLY", "leaked", 1);
  AnalysisCatalog catalog;
  catalog.Register(
      "env", Script("echo \"$(pwd):1:1: note: [$FEEDBACKER_PARENT_ONLY]"
                    "[$FEEDBACKER_COMMIT][$HOME]\""));
  DefaultAnalysisRunner runner(catalog);

  const auto result = runner.Run(copy_, {"env"}, In(10s), token_);
  ::unsetenv("FEEDBACKER_PARENT_ONLY");

  ASSERT_EQ(1u, result.findings.size());
  EXPECT_EQ(".", result.findings[0].path);
  EXPECT_THAT(result.findings[0].message,
              HasSubstr("[][0123456789abcdef0123456789abcdef01234567]"));
  EXPECT_THAT(result.findings[0].message, HasSubstr(".checkout.scratch"));
  EXPECT_FALSE(
      std::filesystem::exists(project_.root() / ".checkout.scratch"));
}

TEST_F(DefaultAnalysisRunnerTest, DeadlineFailsWithTimeout) {
  AnalysisCatalog catalog;
  catalog.Register("slow", Script("sleep 30"));
  DefaultAnalysisRunner runner(catalog);
  const auto started = std::chrono::steady_clock::now();

  EXPECT_EQ(ErrorKind::kTimeout, RunAndExpectError(runner, {"slow"}, In(200ms)));
  EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}

TEST_F(DefaultAnalysisRunnerTest, ExpiredDeadlineSkipsRemainingSteps) {
  AnalysisCatalog catalog;
  catalog.Register("marker", Script("touch " +
                                    (project_.root() / "ran").string()));
  DefaultAnalysisRunner runner(catalog);

  EXPECT_EQ(ErrorKind::kTimeout,
            RunAndExpectError(runner, {"marker"},
                              std::chrono::steady_clock::now() - 1ms));
  EXPECT_FALSE(std::filesystem::exists(project_.root() / "ran"));
}

TEST_F(DefaultAnalysisRunnerTest, CancellationInterruptsStep) {
  AnalysisCatalog catalog;
  catalog.Register("slow", Script("sleep 30"));
  DefaultAnalysisRunner runner(catalog);
  std::thread canceller([this] {
    std::this_thread::sleep_for(100ms);
    token_.Cancel();
  });

  EXPECT_EQ(ErrorKind::kCancelled, RunAndExpectError(runner, {"slow"}, In(30s)));
  canceller.join();
}

TEST_F(DefaultAnalysisRunnerTest, UnknownStepAndMissingToolAreAnalysisFailures) {
  AnalysisCatalog catalog;
  catalog.Register("missing", CommandStep{{"/nonexistent/analyzer"}});
  DefaultAnalysisRunner runner(catalog);

  EXPECT_FALSE(runner.Supports("format"));
  EXPECT_TRUE(runner.Supports("missing"));
  EXPECT_EQ(ErrorKind::kAnalysisFailed,
            RunAndExpectError(runner, {"format"}, In(10s)));
  EXPECT_EQ(ErrorKind::kAnalysisFailed,
            RunAndExpectError(runner, {"missing"}, In(10s)));
}

TEST_F(DefaultAnalysisRunnerTest, ClangStepWithoutLibclangFails) {
  if (ClangDiagnosticsAvailable()) {
    GTEST_SKIP() << "libclang is available in this build";
  }
  AnalysisCatalog catalog;
  catalog.Register("clang", ClangDiagnosticsStep{});
  DefaultAnalysisRunner runner(catalog);

  EXPECT_EQ(ErrorKind::kAnalysisFailed,
            RunAndExpectError(runner, {"clang"}, In(10s)));
}

TEST_F(DefaultAnalysisRunnerTest, ClangStepReportsCompilerDiagnostics) {
  if (!ClangDiagnosticsAvailable()) {
    GTEST_SKIP() << "libclang is not available in this build";
  }
  project_.AddFile("checkout/broken.c",
                   "int main(void) { int unused; return missing; }\n");
  AnalysisCatalog catalog;
  catalog.Register("clang", ClangDiagnosticsStep{{"-Wall"}});
  DefaultAnalysisRunner runner(catalog);

  const auto result = runner.Run(copy_, {"clang"}, In(30s), token_);

  ASSERT_FALSE(result.findings.empty());
  EXPECT_EQ("broken.c", result.findings[0].path);
  EXPECT_FALSE(result.passed);
}

// Constant evaluation that keeps libclang busy inside one translation unit.
constexpr const char *kSlowTranslationUnit =
    "constexpr long Fib(int n) { return n < 2 ? n : Fib(n - 1) + Fib(n - 2); }\n"
    "static_assert(Fib(45) > 0, \"\");\n";

TEST_F(DefaultAnalysisRunnerTest, ClangStepStopsAtDeadlineMidParse) {
  if (!ClangDiagnosticsAvailable()) {
    GTEST_SKIP() << "libclang is not available in this build";
  }
  project_.AddFile("checkout/slow.cpp", kSlowTranslationUnit);
  AnalysisCatalog catalog;
  catalog.Register("clang",
                   ClangDiagnosticsStep{{"-fconstexpr-steps=2147483647"}});
  DefaultAnalysisRunner runner(catalog);
  const auto started = std::chrono::steady_clock::now();

  EXPECT_EQ(ErrorKind::kTimeout,
            RunAndExpectError(runner, {"clang"}, In(300ms)));
  EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}

TEST_F(DefaultAnalysisRunnerTest, ClangStepStopsOnCancelMidParse) {
  if (!ClangDiagnosticsAvailable()) {
    GTEST_SKIP() << "libclang is not available in this build";
  }
  project_.AddFile("checkout/slow.cpp", kSlowTranslationUnit);
  AnalysisCatalog catalog;
  catalog.Register("clang",
                   ClangDiagnosticsStep{{"-fconstexpr-steps=2147483647"}});
  DefaultAnalysisRunner runner(catalog);
  std::thread canceller([this] {
    std::this_thread::sleep_for(100ms);
    token_.Cancel();
  });
  const auto started = std::chrono::steady_clock::now();

  EXPECT_EQ(ErrorKind::kCancelled,
            RunAndExpectError(runner, {"clang"}, In(30s)));
  EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
  canceller.join();
}

} // namespace
} // namespace feedbacker
