#pragma once

#include <feedbacker/cancellation.h>
#include <feedbacker/models.h>
#include <feedbacker/working_copy.h>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace feedbacker {

// All operations report failures by throwing JobError.

class RepositoryFetcher {
public:
  virtual ~RepositoryFetcher() = default;
  virtual WorkingCopy Fetch(const RepositoryRef &repository,
                            const std::filesystem::path &destination,
                            Deadline deadline,
                            const CancellationToken &cancellation) = 0;
};

class AnalysisRunner {
public:
  virtual ~AnalysisRunner() = default;
  virtual AnalysisResult Run(const WorkingCopy &working_copy,
                             const std::vector<std::string> &analysis_set,
                             Deadline deadline,
                             const CancellationToken &cancellation) = 0;
  virtual bool Supports(const std::string &step_name) const = 0;
};

class ResultStore {
public:
  virtual ~ResultStore() = default;

  // Writes the result and moves the job to Succeeded in one transaction.
  // A second call for the same (job_id, attempt) is a successful no-op.
  virtual Ack Upsert(const std::string &job_id, int attempt,
                     const AnalysisResult &result) = 0;
  virtual std::optional<PersistedResult> Get(const std::string &job_id) = 0;

  virtual void SaveJob(const Job &job, const JobTransition &transition) = 0;
  virtual std::optional<Job> LoadJob(const std::string &job_id) = 0;
  virtual std::vector<JobTransition>
  Transitions(const std::string &job_id) = 0;
  virtual std::vector<Job> LoadUnfinishedJobs() = 0;
  virtual std::map<JobState, int> CountByState() = 0;
  virtual void Ping() = 0;
};

} // namespace feedbacker
