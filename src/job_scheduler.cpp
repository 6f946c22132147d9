#include <feedbacker/job_scheduler.h>

#include <feedbacker/git_repository_fetcher.h>
#include <feedbacker/job_error.h>
#include <feedbacker/working_copy.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace feedbacker {
namespace {

// Random (version 4) UUID.
std::string GenerateJobId() {
  static thread_local std::random_device device;
  static thread_local std::mt19937_64 generator(device());
  static thread_local std::uniform_int_distribution<std::uint64_t> distribution;

  auto high = distribution(generator);
  auto low = distribution(generator);
  high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  stream << std::setw(8) << (high >> 32) << '-';
  stream << std::setw(4) << ((high >> 16) & 0xFFFF) << '-';
  stream << std::setw(4) << (high & 0xFFFF) << '-';
  stream << std::setw(4) << (low >> 48) << '-';
  stream << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
  return stream.str();
}

std::string ResolveJobClass(const std::string &job_class) {
  return job_class.empty() ? std::string(kDefaultJobClass) : job_class;
}

void ValidateRetryPolicy(const std::string &name, const RetryPolicy &policy) {
  if (policy.max_attempts < 1) {
    throw std::invalid_argument("Retry policy '" + name +
                                "' needs max_attempts >= 1");
  }
  if (policy.initial_backoff.count() < 0 || policy.max_backoff.count() < 0) {
    throw std::invalid_argument("Retry policy '" + name +
                                "' has a negative backoff");
  }
  if (policy.multiplier < 1.0) {
    throw std::invalid_argument("Retry policy '" + name +
                                "' needs multiplier >= 1");
  }
  if (policy.max_backoff < policy.initial_backoff) {
    throw std::invalid_argument("Retry policy '" + name +
                                "' has max_backoff below initial_backoff");
  }
  for (const auto kind : policy.retryable) {
    if (kind == ErrorKind::kTimeout || kind == ErrorKind::kCancelled ||
        kind == ErrorKind::kOverloaded) {
      throw std::invalid_argument("Retry policy '" + name + "' cannot retry " +
                                  ToString(kind));
    }
  }
}

} // namespace

void ValidateSchedulerConfig(const SchedulerConfig &config) {
  if (config.worker_count < 1) {
    throw std::invalid_argument("workers must be at least 1");
  }
  if (config.fetch_timeout.count() <= 0) {
    throw std::invalid_argument("fetch_timeout_ms must be positive");
  }
  if (config.analysis_timeout.count() <= 0) {
    throw std::invalid_argument("analysis_timeout_ms must be positive");
  }
  if (config.workspace_root.empty()) {
    throw std::invalid_argument("workspace_root cannot be empty");
  }
  if (config.retry_policies.count(kDefaultJobClass) == 0) {
    throw std::invalid_argument("retry_policies must define '" +
                                std::string(kDefaultJobClass) + "'");
  }
  for (const auto &[name, policy] : config.retry_policies) {
    ValidateRetryPolicy(name, policy);
  }
  ValidateRetryPolicy("store_retry", config.store_retry);
}

std::chrono::milliseconds ComputeBackoff(const RetryPolicy &policy,
                                         int attempt) {
  const auto exponent = std::max(attempt, 1) - 1;
  const auto scaled = static_cast<double>(policy.initial_backoff.count()) *
                      std::pow(policy.multiplier, exponent);
  const auto capped =
      std::min(scaled, static_cast<double>(policy.max_backoff.count()));
  return std::chrono::milliseconds(static_cast<std::int64_t>(capped));
}

JobScheduler::JobScheduler(SchedulerConfig config,
                           std::shared_ptr<RepositoryFetcher> fetcher,
                           std::shared_ptr<AnalysisRunner> runner,
                           std::shared_ptr<ResultStore> store,
                           std::shared_ptr<Logger> logger)
    : config_(std::move(config)), fetcher_(std::move(fetcher)),
      runner_(std::move(runner)), store_(std::move(store)),
      logger_(EnsureLogger(std::move(logger))) {
  if (!fetcher_ || !runner_ || !store_) {
    throw std::invalid_argument(
        "JobScheduler needs a fetcher, a runner and a store");
  }
  ValidateSchedulerConfig(config_);
}

JobScheduler::~JobScheduler() { Stop(); }

void JobScheduler::Start() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
      return;
    }
    for (auto it = jobs_.begin(); it != jobs_.end();) {
      it = IsTerminal(it->second.job.state) ? std::next(it) : jobs_.erase(it);
    }
    ready_.clear();
    delayed_.clear();
    active_jobs_ = 0;
    stopping_ = false;
  }

  std::filesystem::create_directories(config_.workspace_root);
  Recover();

  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = true;
    workers_.reserve(static_cast<std::size_t>(config_.worker_count));
    for (int index = 0; index < config_.worker_count; ++index) {
      workers_.emplace_back(&JobScheduler::WorkerLoop, this, index);
    }
  }
  logger_->Log(LogLevel::kInfo, "scheduler.started",
               {{"workers", std::to_string(config_.worker_count)},
                {"queue_capacity", std::to_string(config_.queue_capacity)}});
}

void JobScheduler::Stop() {
  std::vector<std::thread> workers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_ && workers_.empty()) {
      return;
    }
    running_ = false;
    stopping_ = true;
    workers.swap(workers_);
  }
  work_available_.notify_all();
  for (auto &worker : workers) {
    if (worker.joinable()) {
      worker.join();
    }
  }

  std::size_t left_pending = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    left_pending = ready_.size() + delayed_.size();
    ready_.clear();
    delayed_.clear();
  }
  state_changed_.notify_all();
  logger_->Log(LogLevel::kInfo, "scheduler.stopped",
               {{"left_pending", std::to_string(left_pending)}});
}

void JobScheduler::Recover() {
  const auto unfinished = store_->LoadUnfinishedJobs();
  for (const auto &job : unfinished) {
    const auto transitions = store_->Transitions(job.id);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      Entry entry;
      entry.job = job;
      entry.owned = true;
      entry.next_sequence =
          transitions.empty() ? 1 : transitions.back().sequence + 1;
      jobs_[job.id] = std::move(entry);
      ++active_jobs_;
    }

    if (job.state != JobState::kPending) {
      if (job.attempt >= job.max_attempts) {
        Finish(job.id, JobState::kFailed,
               job.last_error.value_or(JobErrorInfo{
                   ErrorKind::kTimeout, "Attempt interrupted by a restart"}));
        continue;
      }
      Advance(job.id, JobState::kPending, std::nullopt, std::nullopt,
              /*recovering=*/true);
    }

    std::chrono::milliseconds delay{0};
    if (job.state == JobState::kPending && job.next_attempt_at.has_value()) {
      delay = std::max(std::chrono::milliseconds(0),
                       std::chrono::duration_cast<std::chrono::milliseconds>(
                           *job.next_attempt_at - Clock::now()));
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      jobs_.at(job.id).owned = false;
      if (delay.count() > 0) {
        delayed_.emplace(std::chrono::steady_clock::now() + delay, job.id);
      } else {
        ready_.push_back(job.id);
      }
    }
    logger_->Log(LogLevel::kInfo, "job.recovered",
                 {{"job_id", job.id},
                  {"state", ToString(job.state)},
                  {"attempt", std::to_string(job.attempt)}});
  }
}

std::string JobScheduler::Submit(const JobRequest &request) {
  ValidateRequest(request);

  Job job;
  job.id = GenerateJobId();
  job.repository = request.repository;
  job.analysis_set = request.analysis_set;
  job.job_class = ResolveJobClass(request.job_class);
  job.state = JobState::kPending;
  job.max_attempts = PolicyFor(job.job_class).max_attempts;
  job.created_at = Clock::now();

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_ || stopping_) {
      throw JobError(ErrorKind::kOverloaded, "Scheduler is not accepting work");
    }
    if (!HasCapacityLocked()) {
      logger_->Log(LogLevel::kWarn, "job.rejected",
                   {{"active", std::to_string(active_jobs_)}});
      throw JobError(ErrorKind::kOverloaded,
                     "Scheduler is at capacity (" +
                         std::to_string(active_jobs_) + " active jobs)");
    }
    Entry entry;
    entry.job = job;
    entry.owned = true;
    jobs_.emplace(job.id, std::move(entry));
    ++active_jobs_;
  }

  JobTransition transition;
  transition.job_id = job.id;
  transition.sequence = 1;
  transition.attempt = 0;
  transition.to = JobState::kPending;
  transition.at = job.created_at;
  try {
    PersistWithRetry(job, transition);
  } catch (const JobError &) {
    std::lock_guard<std::mutex> lock(mutex_);
    jobs_.erase(job.id);
    --active_jobs_;
    throw;
  }

  bool cancelled = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &entry = jobs_.at(job.id);
    ++entry.next_sequence;
    cancelled = entry.cancellation->IsCancelled();
    if (!cancelled) {
      entry.owned = false;
      ready_.push_back(job.id);
    }
  }
  logger_->Log(LogLevel::kInfo, "job.submitted",
               {{"job_id", job.id},
                {"repository", job.repository.url},
                {"revision", job.repository.revision},
                {"job_class", job.job_class}});
  if (cancelled) {
    Finish(job.id, JobState::kCancelled,
           JobErrorInfo{ErrorKind::kCancelled, "Cancelled by request"});
  } else {
    work_available_.notify_one();
  }
  return job.id;
}

JobState JobScheduler::Status(const std::string &job_id) const {
  if (const auto job = Snapshot(job_id); job.has_value()) {
    return job->state;
  }
  throw std::invalid_argument("Unknown job id: " + job_id);
}

std::optional<Job> JobScheduler::Snapshot(const std::string &job_id) const {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (const auto found = jobs_.find(job_id); found != jobs_.end()) {
      return found->second.job;
    }
  }
  return store_->LoadJob(job_id);
}

bool JobScheduler::Cancel(const std::string &job_id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto found = jobs_.find(job_id);
    if (found == jobs_.end() || IsTerminal(found->second.job.state)) {
      return false;
    }
    auto &entry = found->second;
    entry.cancellation->Cancel();
    logger_->Log(LogLevel::kInfo, "job.cancel_requested",
                 {{"job_id", job_id}, {"state", ToString(entry.job.state)}});
    if (entry.owned) {
      // The owning thread observes the token at its next boundary.
      return true;
    }
    entry.owned = true;
    ready_.erase(std::remove(ready_.begin(), ready_.end(), job_id),
                 ready_.end());
    for (auto it = delayed_.begin(); it != delayed_.end();) {
      it = it->second == job_id ? delayed_.erase(it) : std::next(it);
    }
  }
  Finish(job_id, JobState::kCancelled,
         JobErrorInfo{ErrorKind::kCancelled, "Cancelled by request"});
  return true;
}

JobState JobScheduler::WaitForTerminal(const std::string &job_id,
                                       std::chrono::milliseconds timeout) const {
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (jobs_.count(job_id) != 0) {
      // A finished entry may be evicted while we wait; the store has it then.
      state_changed_.wait_for(lock, timeout, [this, &job_id] {
        const auto found = jobs_.find(job_id);
        return found == jobs_.end() || IsTerminal(found->second.job.state);
      });
      if (const auto found = jobs_.find(job_id); found != jobs_.end()) {
        return found->second.job.state;
      }
    }
  }
  return Status(job_id);
}

SchedulerStats JobScheduler::Stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  SchedulerStats stats;
  for (const auto &entry : jobs_) {
    ++stats.jobs_by_state[entry.second.job.state];
  }
  stats.ready = ready_.size();
  stats.delayed = delayed_.size();
  stats.busy_workers = busy_workers_;
  stats.worker_count = config_.worker_count;
  stats.running = running_;
  stats.accepting_work = running_ && !stopping_ && HasCapacityLocked();
  return stats;
}

bool JobScheduler::IsRunning() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

bool JobScheduler::IsAcceptingWork() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_ && !stopping_ && HasCapacityLocked();
}

bool JobScheduler::HasCapacityLocked() const {
  return active_jobs_ <
         config_.queue_capacity +
             static_cast<std::size_t>(config_.worker_count);
}

void JobScheduler::WorkerLoop(int worker_index) {
  logger_->Log(LogLevel::kDebug, "worker.started",
               {{"worker", std::to_string(worker_index)}});
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stopping_) {
    PromoteDueJobs(std::chrono::steady_clock::now());
    if (!ready_.empty()) {
      const auto job_id = ready_.front();
      ready_.pop_front();
      const auto found = jobs_.find(job_id);
      if (found == jobs_.end() || found->second.owned ||
          IsTerminal(found->second.job.state)) {
        continue;
      }
      found->second.owned = true;
      ++busy_workers_;
      lock.unlock();
      try {
        Process(job_id);
      } catch (const std::exception &error) {
        logger_->Log(LogLevel::kError, "worker.error",
                     {{"worker", std::to_string(worker_index)},
                      {"job_id", job_id},
                      {"error", error.what()}});
      }
      lock.lock();
      --busy_workers_;
      continue;
    }
    if (delayed_.empty()) {
      work_available_.wait(lock);
    } else {
      work_available_.wait_until(lock, delayed_.begin()->first);
    }
  }
  logger_->Log(LogLevel::kDebug, "worker.stopped",
               {{"worker", std::to_string(worker_index)}});
}

void JobScheduler::PromoteDueJobs(SteadyTime now) {
  while (!delayed_.empty() && delayed_.begin()->first <= now) {
    ready_.push_back(delayed_.begin()->second);
    delayed_.erase(delayed_.begin());
  }
}

void JobScheduler::Process(const std::string &job_id) {
  Job job;
  std::shared_ptr<CancellationToken> cancellation;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto &entry = jobs_.at(job_id);
    job = entry.job;
    cancellation = entry.cancellation;
  }

  try {
    if (cancellation->IsCancelled()) {
      throw JobError(ErrorKind::kCancelled, "Cancelled before start");
    }
    Advance(job_id, JobState::kFetching);
    job.attempt += 1;

    const auto destination =
        config_.workspace_root /
        (job_id + "-" + std::to_string(job.attempt));
    WorkingCopy working_copy;
    try {
      working_copy = fetcher_->Fetch(
          job.repository, destination,
          std::chrono::steady_clock::now() + config_.fetch_timeout,
          *cancellation);
    } catch (const JobError &error) {
      HandleFetchFailure(job_id, job, error, *cancellation);
      return;
    }

    if (cancellation->IsCancelled()) {
      throw JobError(ErrorKind::kCancelled, "Cancelled after fetch");
    }
    Advance(job_id, JobState::kRunning);
    const auto result = runner_->Run(
        working_copy, job.analysis_set,
        std::chrono::steady_clock::now() + config_.analysis_timeout,
        *cancellation);
    working_copy.Release();

    if (cancellation->IsCancelled()) {
      throw JobError(ErrorKind::kCancelled, "Cancelled after analysis");
    }
    Advance(job_id, JobState::kStoring);
    StoreResult(job_id, job.attempt, result, *cancellation);
  } catch (const JobError &error) {
    Finish(job_id,
           error.kind() == ErrorKind::kCancelled ? JobState::kCancelled
                                                 : JobState::kFailed,
           error.info());
  } catch (const std::exception &error) {
    Finish(job_id, JobState::kFailed,
           JobErrorInfo{ErrorKind::kAnalysisFailed, error.what()});
  }
}

void JobScheduler::HandleFetchFailure(const std::string &job_id,
                                      const Job &job, const JobError &error,
                                      const CancellationToken &cancellation) {
  if (error.kind() == ErrorKind::kCancelled || cancellation.IsCancelled()) {
    Finish(job_id, JobState::kCancelled,
           JobErrorInfo{ErrorKind::kCancelled, error.what()});
    return;
  }

  const auto &policy = PolicyFor(job.job_class);
  if (policy.retryable.count(error.kind()) == 0 ||
      job.attempt >= job.max_attempts) {
    Finish(job_id, JobState::kFailed, error.info());
    return;
  }

  const auto backoff = ComputeBackoff(policy, job.attempt);
  Advance(job_id, JobState::kPending, error.info(), Clock::now() + backoff);
  logger_->Log(LogLevel::kInfo, "job.retry_scheduled",
               {{"job_id", job_id},
                {"attempt", std::to_string(job.attempt)},
                {"backoff_ms", std::to_string(backoff.count())},
                {"error", ToString(error.kind())}});
  if (!Requeue(job_id, std::chrono::steady_clock::now() + backoff)) {
    Finish(job_id, JobState::kCancelled,
           JobErrorInfo{ErrorKind::kCancelled, "Cancelled while waiting to retry"});
  }
}

void JobScheduler::StoreResult(const std::string &job_id, int attempt,
                               const AnalysisResult &result,
                               const CancellationToken &cancellation) {
  const auto &policy = config_.store_retry;
  std::string last_error;
  for (int store_attempt = 1; store_attempt <= policy.max_attempts;
       ++store_attempt) {
    if (cancellation.IsCancelled()) {
      throw JobError(ErrorKind::kCancelled,
                     "Cancelled before the result was stored");
    }
    try {
      const auto ack = store_->Upsert(job_id, attempt, result);
      {
        std::lock_guard<std::mutex> lock(mutex_);
        auto &entry = jobs_.at(job_id);
        auto updated = entry.job;
        updated.state = JobState::kSucceeded;
        updated.finished_at = Clock::now();
        updated.next_attempt_at.reset();
        updated.last_error.reset();
        ++entry.next_sequence;
        Publish(entry, updated);
      }
      logger_->Log(LogLevel::kInfo, "job.transition",
                   {{"job_id", job_id},
                    {"from", ToString(JobState::kStoring)},
                    {"to", ToString(JobState::kSucceeded)},
                    {"attempt", std::to_string(attempt)},
                    {"inserted", ack.inserted ? "true" : "false"}});
      return;
    } catch (const JobError &error) {
      if (policy.retryable.count(error.kind()) == 0) {
        throw;
      }
      last_error = error.what();
      logger_->Log(LogLevel::kWarn, "store.retry",
                   {{"job_id", job_id},
                    {"store_attempt", std::to_string(store_attempt)},
                    {"error", last_error}});
      if (store_attempt < policy.max_attempts &&
          cancellation.WaitFor(ComputeBackoff(policy, store_attempt))) {
        throw JobError(ErrorKind::kCancelled,
                       "Cancelled while retrying the result store");
      }
    }
  }
  throw JobError(ErrorKind::kPersistence,
                 "Result not stored after " +
                     std::to_string(policy.max_attempts) +
                     " attempts: " + last_error);
}

void JobScheduler::Advance(const std::string &job_id, JobState to,
                           std::optional<JobErrorInfo> error,
                           std::optional<TimePoint> next_attempt_at,
                           bool recovering) {
  Job updated;
  JobTransition transition;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto &entry = jobs_.at(job_id);
    const auto from = entry.job.state;
    if (!IsLegalTransition(from, to) &&
        !(recovering && IsLegalRecoveryTransition(from, to))) {
      throw std::logic_error("Illegal transition " + ToString(from) + " -> " +
                             ToString(to) + " for job " + job_id);
    }
    const auto now = Clock::now();
    updated = entry.job;
    updated.state = to;
    updated.next_attempt_at.reset();
    if (to == JobState::kFetching) {
      ++updated.attempt;
      if (!updated.started_at.has_value()) {
        updated.started_at = now;
      }
    }
    if (to == JobState::kPending) {
      updated.next_attempt_at = next_attempt_at;
    }
    if (IsTerminal(to)) {
      updated.finished_at = now;
    }
    if (error.has_value()) {
      updated.last_error = error;
    }

    transition.job_id = job_id;
    transition.sequence = entry.next_sequence;
    transition.attempt = updated.attempt;
    transition.from = from;
    transition.to = to;
    transition.at = now;
    if (error.has_value()) {
      transition.error = error->kind;
    }
  }

  PersistWithRetry(updated, transition);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &entry = jobs_.at(job_id);
    ++entry.next_sequence;
    Publish(entry, updated);
  }

  LogFields fields{{"job_id", job_id},
                   {"from", ToString(*transition.from)},
                   {"to", ToString(to)},
                   {"attempt", std::to_string(updated.attempt)}};
  if (error.has_value()) {
    fields.emplace_back("error", ToString(error->kind));
    fields.emplace_back("detail", error->message);
  }
  logger_->Log(to == JobState::kFailed ? LogLevel::kWarn : LogLevel::kInfo,
               "job.transition", std::move(fields));
}

void JobScheduler::Finish(const std::string &job_id, JobState terminal,
                          std::optional<JobErrorInfo> error) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (IsTerminal(jobs_.at(job_id).job.state)) {
      return;
    }
  }
  try {
    Advance(job_id, terminal, error);
  } catch (const JobError &persist_error) {
    logger_->Log(LogLevel::kError, "job.persist_failed",
                 {{"job_id", job_id},
                  {"state", ToString(terminal)},
                  {"error", persist_error.what()}});
    std::lock_guard<std::mutex> lock(mutex_);
    auto &entry = jobs_.at(job_id);
    auto updated = entry.job;
    updated.state = terminal;
    updated.finished_at = Clock::now();
    updated.next_attempt_at.reset();
    if (error.has_value()) {
      updated.last_error = error;
    }
    ++entry.next_sequence;
    Publish(entry, updated);
  }
}

void JobScheduler::Publish(Entry &entry, const Job &job) {
  const auto was_terminal = IsTerminal(entry.job.state);
  entry.job = job;
  if (!was_terminal && IsTerminal(job.state)) {
    --active_jobs_;
    finished_.push_back(job.id);
    EvictFinishedLocked();
  }
  state_changed_.notify_all();
}

// Callers must not touch the published entry after this runs.
void JobScheduler::EvictFinishedLocked() {
  while (finished_.size() > config_.retained_finished_jobs) {
    const auto found = jobs_.find(finished_.front());
    finished_.pop_front();
    // Recovery may have replaced the id with a live entry.
    if (found != jobs_.end() && IsTerminal(found->second.job.state)) {
      jobs_.erase(found);
    }
  }
}

void JobScheduler::PersistWithRetry(const Job &job,
                                    const JobTransition &transition) {
  const auto &policy = config_.store_retry;
  for (int attempt = 1;; ++attempt) {
    try {
      store_->SaveJob(job, transition);
      return;
    } catch (const JobError &error) {
      if (attempt >= policy.max_attempts ||
          policy.retryable.count(error.kind()) == 0) {
        throw;
      }
      logger_->Log(LogLevel::kWarn, "store.retry",
                   {{"job_id", job.id},
                    {"store_attempt", std::to_string(attempt)},
                    {"error", error.what()}});
      std::this_thread::sleep_for(ComputeBackoff(policy, attempt));
    }
  }
}

bool JobScheduler::Requeue(const std::string &job_id, SteadyTime ready_at) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &entry = jobs_.at(job_id);
    if (entry.cancellation->IsCancelled()) {
      return false;
    }
    entry.owned = false;
    if (stopping_) {
      return true;
    }
    delayed_.emplace(ready_at, job_id);
  }
  work_available_.notify_all();
  return true;
}

const RetryPolicy &JobScheduler::PolicyFor(const std::string &job_class) const {
  const auto found = config_.retry_policies.find(ResolveJobClass(job_class));
  if (found != config_.retry_policies.end()) {
    return found->second;
  }
  return config_.retry_policies.at(kDefaultJobClass);
}

void JobScheduler::ValidateRequest(const JobRequest &request) const {
  if (request.repository.url.empty()) {
    throw std::invalid_argument("Repository URL cannot be empty");
  }
  if (!IsSupportedRepositoryUrl(request.repository.url)) {
    throw std::invalid_argument("Unsupported repository URL: " +
                                request.repository.url);
  }
  if (request.repository.revision.empty()) {
    throw std::invalid_argument("Revision cannot be empty");
  }
  if (request.analysis_set.empty()) {
    throw std::invalid_argument("Analysis set cannot be empty");
  }
  for (const auto &step : request.analysis_set) {
    if (!runner_->Supports(step)) {
      throw std::invalid_argument("Unknown analysis step: " + step);
    }
  }
  if (config_.retry_policies.count(ResolveJobClass(request.job_class)) == 0) {
    throw std::invalid_argument("Unknown job class: " + request.job_class);
  }
}

} // namespace feedbacker
