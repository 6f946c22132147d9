#pragma once

#include <feedbacker/cancellation.h>
#include <feedbacker/interfaces.h>
#include <feedbacker/job_error.h>
#include <feedbacker/logging.h>
#include <feedbacker/models.h>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace feedbacker {

inline constexpr const char kDefaultJobClass[] = "default";

struct SchedulerConfig {
  int worker_count = 4;
  std::size_t queue_capacity = 64;
  std::chrono::milliseconds fetch_timeout{120000};
  std::chrono::milliseconds analysis_timeout{600000};
  // Keyed by job class; must contain kDefaultJobClass.
  std::map<std::string, RetryPolicy> retry_policies{
      {kDefaultJobClass, RetryPolicy{}}};
  RetryPolicy store_retry{3,
                          std::chrono::milliseconds(200),
                          2.0,
                          std::chrono::milliseconds(2000),
                          {ErrorKind::kPersistence}};
  std::filesystem::path workspace_root = "/tmp/feedbacker/work";
  // Finished jobs kept in memory; older ones are answered from the store.
  std::size_t retained_finished_jobs = 1024;
};

struct SchedulerStats {
  // Jobs held in memory: active ones plus the recently finished.
  std::map<JobState, int> jobs_by_state;
  std::size_t ready = 0;
  std::size_t delayed = 0;
  int busy_workers = 0;
  int worker_count = 0;
  bool running = false;
  bool accepting_work = false;
};

void ValidateSchedulerConfig(const SchedulerConfig &config);

// min(initial * multiplier^(attempt - 1), max) for attempt >= 1.
std::chrono::milliseconds ComputeBackoff(const RetryPolicy &policy,
                                         int attempt);

// Drives each job through Fetch -> Run -> Store on a fixed worker pool.
// Every state change is written to the ResultStore before it becomes visible
// through Status, so a restarted scheduler resumes from the store.
class JobScheduler {
public:
  JobScheduler(SchedulerConfig config,
               std::shared_ptr<RepositoryFetcher> fetcher,
               std::shared_ptr<AnalysisRunner> runner,
               std::shared_ptr<ResultStore> store,
               std::shared_ptr<Logger> logger = nullptr);
  ~JobScheduler();

  JobScheduler(const JobScheduler &) = delete;
  JobScheduler &operator=(const JobScheduler &) = delete;

  // Recovers unfinished jobs from the store and starts the workers.
  void Start();
  // Stops intake and waits for in-flight attempts. Queued jobs stay Pending
  // in the store.
  void Stop();

  // Throws std::invalid_argument for a malformed request and
  // JobError(kOverloaded) when the scheduler is full or not running.
  std::string Submit(const JobRequest &request);
  // Throws std::invalid_argument for an unknown id.
  JobState Status(const std::string &job_id) const;
  std::optional<Job> Snapshot(const std::string &job_id) const;
  bool Cancel(const std::string &job_id);
  // Returns the state reached when the job became terminal or the timeout
  // expired.
  JobState WaitForTerminal(const std::string &job_id,
                           std::chrono::milliseconds timeout) const;

  SchedulerStats Stats() const;
  bool IsRunning() const;
  bool IsAcceptingWork() const;
  const SchedulerConfig &config() const { return config_; }

private:
  using SteadyTime = std::chrono::steady_clock::time_point;

  struct Entry {
    Job job;
    int next_sequence = 1;
    // Set while one thread has exclusive write access to the job.
    bool owned = false;
    std::shared_ptr<CancellationToken> cancellation =
        std::make_shared<CancellationToken>();
  };

  void WorkerLoop(int worker_index);
  void PromoteDueJobs(SteadyTime now);
  void Process(const std::string &job_id);
  void HandleFetchFailure(const std::string &job_id, const Job &job,
                          const JobError &error,
                          const CancellationToken &cancellation);
  void StoreResult(const std::string &job_id, int attempt,
                   const AnalysisResult &result,
                   const CancellationToken &cancellation);
  void Recover();

  // The caller must own the job. Persists first, then publishes.
  void Advance(const std::string &job_id, JobState to,
               std::optional<JobErrorInfo> error = std::nullopt,
               std::optional<TimePoint> next_attempt_at = std::nullopt,
               bool recovering = false);
  void Finish(const std::string &job_id, JobState terminal,
              std::optional<JobErrorInfo> error);
  void Publish(Entry &entry, const Job &job);
  void EvictFinishedLocked();
  void PersistWithRetry(const Job &job, const JobTransition &transition);
  bool Requeue(const std::string &job_id, SteadyTime ready_at);

  const RetryPolicy &PolicyFor(const std::string &job_class) const;
  void ValidateRequest(const JobRequest &request) const;
  bool HasCapacityLocked() const;

  SchedulerConfig config_;
  std::shared_ptr<RepositoryFetcher> fetcher_;
  std::shared_ptr<AnalysisRunner> runner_;
  std::shared_ptr<ResultStore> store_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex mutex_;
  std::condition_variable work_available_;
  mutable std::condition_variable state_changed_;
  std::map<std::string, Entry> jobs_;
  // Finished job ids, oldest first, evicted past retained_finished_jobs.
  std::deque<std::string> finished_;
  std::deque<std::string> ready_;
  std::multimap<SteadyTime, std::string> delayed_;
  std::vector<std::thread> workers_;
  std::size_t active_jobs_ = 0;
  int busy_workers_ = 0;
  bool running_ = false;
  bool stopping_ = false;
};

} // namespace feedbacker
