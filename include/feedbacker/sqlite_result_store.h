#pragma once

#include <feedbacker/interfaces.h>
#include <feedbacker/logging.h>

#include <memory>
#include <mutex>
#include <string>

struct sqlite3;

namespace feedbacker {

// ResultStore over one SQLite connection. Calls are serialized; every
// mutating operation runs in its own transaction.
class SqliteResultStore : public ResultStore {
public:
  // `path` is a file path or ":memory:". Applies pending migrations.
  explicit SqliteResultStore(const std::string &path,
                             std::shared_ptr<Logger> logger = nullptr);
  ~SqliteResultStore() override;

  SqliteResultStore(const SqliteResultStore &) = delete;
  SqliteResultStore &operator=(const SqliteResultStore &) = delete;

  Ack Upsert(const std::string &job_id, int attempt,
             const AnalysisResult &result) override;
  std::optional<PersistedResult> Get(const std::string &job_id) override;

  void SaveJob(const Job &job, const JobTransition &transition) override;
  std::optional<Job> LoadJob(const std::string &job_id) override;
  std::vector<JobTransition> Transitions(const std::string &job_id) override;
  std::vector<Job> LoadUnfinishedJobs() override;
  std::map<JobState, int> CountByState() override;
  void Ping() override;

  int SchemaVersion();

private:
  void Migrate();
  std::optional<Job> LoadJobLocked(const std::string &job_id);

  sqlite3 *db_ = nullptr;
  std::mutex mutex_;
  std::shared_ptr<Logger> logger_;
};

// Accepts `sqlite://<path>`, `:memory:` or a bare path. Other schemes throw
// std::invalid_argument.
std::string SqlitePathFromUrl(const std::string &database_url);

std::unique_ptr<ResultStore> OpenResultStore(const std::string &database_url,
                                             std::shared_ptr<Logger> logger);

} // namespace feedbacker
