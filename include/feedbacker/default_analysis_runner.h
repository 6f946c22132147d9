#pragma once

#include <feedbacker/analysis_catalog.h>
#include <feedbacker/interfaces.h>
#include <feedbacker/logging.h>

#include <memory>
#include <string>
#include <vector>

namespace feedbacker {

struct AnalysisRunnerOptions {
  std::string path = "/usr/local/bin:/usr/bin:/bin";
  std::size_t output_limit = 8 * 1024 * 1024;
};

class DefaultAnalysisRunner : public AnalysisRunner {
public:
  explicit DefaultAnalysisRunner(AnalysisCatalog catalog,
                                 AnalysisRunnerOptions options = {},
                                 std::shared_ptr<Logger> logger = nullptr);

  AnalysisResult Run(const WorkingCopy &working_copy,
                     const std::vector<std::string> &analysis_set,
                     Deadline deadline,
                     const CancellationToken &cancellation) override;
  bool Supports(const std::string &step_name) const override;

  const AnalysisCatalog &catalog() const { return catalog_; }

private:
  struct StepOutput {
    std::vector<Finding> findings;
    int exit_code = 0;
  };

  StepOutput RunCommand(const std::string &name, const CommandStep &step,
                        const WorkingCopy &working_copy,
                        const std::filesystem::path &scratch,
                        Deadline deadline,
                        const CancellationToken &cancellation) const;

  AnalysisCatalog catalog_;
  AnalysisRunnerOptions options_;
  std::shared_ptr<Logger> logger_;
};

// Parses gcc/clang style diagnostic lines. Paths under `root` are made
// relative to it; lines that are not diagnostics are skipped.
std::vector<Finding> ParseDiagnostics(const std::string &output,
                                      const std::filesystem::path &root,
                                      const std::string &step_name);

// Stable order by path, line, rule id, then column and message.
void SortFindings(std::vector<Finding> &findings);

} // namespace feedbacker
