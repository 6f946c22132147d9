#include <feedbacker/sqlite_result_store.h>

#include <feedbacker/escaping.h>
#include <feedbacker/job_error.h>

#include <sqlite3.h>

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace feedbacker {
namespace {

struct Migration {
  int version;
  const char *name;
  const char *sql;
};

const Migration kMigrations[] = {
    {1, "create_jobs",
     "CREATE TABLE jobs ("
     "  id TEXT PRIMARY KEY,"
     "  repository_url TEXT NOT NULL,"
     "  revision TEXT NOT NULL,"
     "  analysis_set TEXT NOT NULL,"
     "  job_class TEXT NOT NULL,"
     "  state TEXT NOT NULL,"
     "  attempt INTEGER NOT NULL,"
     "  max_attempts INTEGER NOT NULL,"
     "  created_at INTEGER NOT NULL,"
     "  started_at INTEGER,"
     "  finished_at INTEGER,"
     "  next_attempt_at INTEGER,"
     "  last_error_kind TEXT,"
     "  last_error_message TEXT"
     ");"
     "CREATE INDEX jobs_state ON jobs(state);"
     "CREATE TABLE job_transitions ("
     "  job_id TEXT NOT NULL REFERENCES jobs(id),"
     "  sequence INTEGER NOT NULL,"
     "  attempt INTEGER NOT NULL,"
     "  from_state TEXT,"
     "  to_state TEXT NOT NULL,"
     "  at INTEGER NOT NULL,"
     "  error_kind TEXT,"
     "  PRIMARY KEY (job_id, sequence)"
     ");"},
    {2, "create_results",
     "CREATE TABLE results ("
     "  job_id TEXT NOT NULL,"
     "  attempt INTEGER NOT NULL,"
     "  passed INTEGER NOT NULL,"
     "  stored_at INTEGER NOT NULL,"
     "  PRIMARY KEY (job_id, attempt)"
     ");"
     "CREATE TABLE findings ("
     "  job_id TEXT NOT NULL,"
     "  attempt INTEGER NOT NULL,"
     "  ordinal INTEGER NOT NULL,"
     "  severity TEXT NOT NULL,"
     "  rule_id TEXT NOT NULL,"
     "  message TEXT NOT NULL,"
     "  path TEXT NOT NULL,"
     "  line INTEGER NOT NULL,"
     "  column_number INTEGER NOT NULL,"
     "  step TEXT NOT NULL,"
     "  PRIMARY KEY (job_id, attempt, ordinal),"
     "  FOREIGN KEY (job_id, attempt) REFERENCES results(job_id, attempt)"
     ");"
     "CREATE TABLE step_outcomes ("
     "  job_id TEXT NOT NULL,"
     "  attempt INTEGER NOT NULL,"
     "  ordinal INTEGER NOT NULL,"
     "  name TEXT NOT NULL,"
     "  exit_code INTEGER NOT NULL,"
     "  duration_ms INTEGER NOT NULL,"
     "  PRIMARY KEY (job_id, attempt, ordinal),"
     "  FOREIGN KEY (job_id, attempt) REFERENCES results(job_id, attempt)"
     ");"},
};

// FNV-1a, stable across builds.
std::string Checksum(const std::string &text) {
  std::uint64_t hash = 14695981039346656037ull;
  for (const unsigned char c : text) {
    hash ^= c;
    hash *= 1099511628211ull;
  }
  char buffer[17];
  std::snprintf(buffer, sizeof(buffer), "%016llx",
                static_cast<unsigned long long>(hash));
  return buffer;
}

[[noreturn]] void ThrowSqliteError(sqlite3 *db, const std::string &context) {
  throw JobError(ErrorKind::kPersistence,
                 context + ": " + sqlite3_errmsg(db));
}

void Execute(sqlite3 *db, const std::string &sql, const std::string &context) {
  char *message = nullptr;
  if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &message) != SQLITE_OK) {
    std::string text = message == nullptr ? "unknown error" : message;
    sqlite3_free(message);
    throw JobError(ErrorKind::kPersistence, context + ": " + text);
  }
}

class Statement {
public:
  Statement(sqlite3 *db, const char *sql) : db_(db) {
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
      ThrowSqliteError(db_, "Failed to prepare statement");
    }
  }
  ~Statement() { sqlite3_finalize(stmt_); }
  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  void BindText(int index, const std::string &value) {
    Check(sqlite3_bind_text(stmt_, index, value.c_str(),
                            static_cast<int>(value.size()), SQLITE_TRANSIENT));
  }
  void BindInt(int index, std::int64_t value) {
    Check(sqlite3_bind_int64(stmt_, index, value));
  }
  void BindNull(int index) { Check(sqlite3_bind_null(stmt_, index)); }
  void BindOptionalTime(int index, const std::optional<TimePoint> &value) {
    if (value.has_value()) {
      BindInt(index, ToEpochMillis(*value));
    } else {
      BindNull(index);
    }
  }

  // True while rows remain.
  bool Step() {
    const auto rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
      return true;
    }
    if (rc == SQLITE_DONE) {
      return false;
    }
    ThrowSqliteError(db_, "Statement failed");
  }
  void Run() {
    if (Step()) {
      throw JobError(ErrorKind::kPersistence,
                     "Statement unexpectedly returned rows");
    }
  }

  bool IsNull(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
  }
  std::string Text(int column) const {
    const auto *text =
        reinterpret_cast<const char *>(sqlite3_column_text(stmt_, column));
    return text == nullptr ? std::string{} : std::string(text);
  }
  std::int64_t Int(int column) const {
    return sqlite3_column_int64(stmt_, column);
  }
  std::optional<TimePoint> OptionalTime(int column) const {
    if (IsNull(column)) {
      return std::nullopt;
    }
    return FromEpochMillis(Int(column));
  }

private:
  void Check(int rc) {
    if (rc != SQLITE_OK) {
      ThrowSqliteError(db_, "Failed to bind parameter");
    }
  }

  sqlite3 *db_;
  sqlite3_stmt *stmt_ = nullptr;
};

class Transaction {
public:
  explicit Transaction(sqlite3 *db) : db_(db) {
    Execute(db_, "BEGIN IMMEDIATE", "Failed to begin transaction");
  }
  ~Transaction() {
    if (!committed_) {
      sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
    }
  }
  Transaction(const Transaction &) = delete;
  Transaction &operator=(const Transaction &) = delete;

  void Commit() {
    Execute(db_, "COMMIT", "Failed to commit transaction");
    committed_ = true;
  }

private:
  sqlite3 *db_;
  bool committed_ = false;
};

JobState StateColumn(const Statement &statement, int column) {
  const auto text = statement.Text(column);
  const auto state = ParseJobState(text);
  if (!state.has_value()) {
    throw JobError(ErrorKind::kPersistence, "Unknown job state '" + text + "'");
  }
  return *state;
}

ErrorKind ErrorKindColumn(const Statement &statement, int column) {
  const auto text = statement.Text(column);
  const auto kind = ParseErrorKind(text);
  if (!kind.has_value()) {
    throw JobError(ErrorKind::kPersistence, "Unknown error kind '" + text + "'");
  }
  return *kind;
}

constexpr const char kJobColumns[] =
    "id, repository_url, revision, analysis_set, job_class, state, attempt, "
    "max_attempts, created_at, started_at, finished_at, next_attempt_at, "
    "last_error_kind, last_error_message";

Job ReadJob(const Statement &statement) {
  Job job;
  job.id = statement.Text(0);
  job.repository.url = statement.Text(1);
  job.repository.revision = statement.Text(2);
  job.analysis_set = SplitEscaped(statement.Text(3));
  job.job_class = statement.Text(4);
  job.state = StateColumn(statement, 5);
  job.attempt = static_cast<int>(statement.Int(6));
  job.max_attempts = static_cast<int>(statement.Int(7));
  job.created_at = FromEpochMillis(statement.Int(8));
  job.started_at = statement.OptionalTime(9);
  job.finished_at = statement.OptionalTime(10);
  job.next_attempt_at = statement.OptionalTime(11);
  if (!statement.IsNull(12)) {
    job.last_error = JobErrorInfo{ErrorKindColumn(statement, 12),
                                  statement.Text(13)};
  }
  return job;
}

int NextSequence(sqlite3 *db, const std::string &job_id) {
  Statement statement(db, "SELECT COALESCE(MAX(sequence), 0) + 1 FROM "
                          "job_transitions WHERE job_id = ?");
  statement.BindText(1, job_id);
  statement.Step();
  return static_cast<int>(statement.Int(0));
}

void InsertTransition(sqlite3 *db, const JobTransition &transition) {
  Statement statement(db, "INSERT INTO job_transitions (job_id, sequence, "
                          "attempt, from_state, to_state, at, error_kind) "
                          "VALUES (?, ?, ?, ?, ?, ?, ?)");
  statement.BindText(1, transition.job_id);
  statement.BindInt(2, transition.sequence);
  statement.BindInt(3, transition.attempt);
  if (transition.from.has_value()) {
    statement.BindText(4, ToString(*transition.from));
  } else {
    statement.BindNull(4);
  }
  statement.BindText(5, ToString(transition.to));
  statement.BindInt(6, ToEpochMillis(transition.at));
  if (transition.error.has_value()) {
    statement.BindText(7, ToString(*transition.error));
  } else {
    statement.BindNull(7);
  }
  statement.Run();
}

} // namespace

SqliteResultStore::SqliteResultStore(const std::string &path,
                                     std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {
  if (path.empty()) {
    throw std::invalid_argument("SQLite database path cannot be empty");
  }
  if (path != ":memory:") {
    const auto parent = std::filesystem::path(path).parent_path();
    std::error_code error;
    if (!parent.empty()) {
      std::filesystem::create_directories(parent, error);
    }
    if (error) {
      throw JobError(ErrorKind::kPersistence,
                     "Cannot create directory " + parent.string() + ": " +
                         error.message());
    }
  }

  const int flags =
      SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    std::string message = db_ == nullptr ? "out of memory" : sqlite3_errmsg(db_);
    sqlite3_close(db_);
    db_ = nullptr;
    throw JobError(ErrorKind::kPersistence,
                   "Cannot open database " + path + ": " + message);
  }

  try {
    sqlite3_busy_timeout(db_, 5000);
    Execute(db_, "PRAGMA foreign_keys = ON", "Failed to enable foreign keys");
    if (path != ":memory:") {
      Execute(db_, "PRAGMA journal_mode = WAL", "Failed to enable WAL");
    }
    Migrate();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
  logger_->Log(LogLevel::kDebug, "store.open", {{"path", path}});
}

SqliteResultStore::~SqliteResultStore() { sqlite3_close(db_); }

void SqliteResultStore::Migrate() {
  Execute(db_,
          "CREATE TABLE IF NOT EXISTS schema_migrations ("
          "  version INTEGER PRIMARY KEY,"
          "  name TEXT NOT NULL,"
          "  checksum TEXT NOT NULL,"
          "  applied_at INTEGER NOT NULL"
          ")",
          "Failed to create schema_migrations");

  for (const auto &migration : kMigrations) {
    const auto checksum = Checksum(migration.sql);
    Transaction transaction(db_);

    Statement existing(db_,
                       "SELECT checksum FROM schema_migrations WHERE version = ?");
    existing.BindInt(1, migration.version);
    if (existing.Step()) {
      if (existing.Text(0) != checksum) {
        throw JobError(ErrorKind::kPersistence,
                       "Migration " + std::to_string(migration.version) +
                           " (" + migration.name +
                           ") differs from the applied version");
      }
      continue;
    }

    Execute(db_, migration.sql,
            std::string("Migration ") + migration.name + " failed");
    Statement record(db_, "INSERT INTO schema_migrations (version, name, "
                          "checksum, applied_at) VALUES (?, ?, ?, ?)");
    record.BindInt(1, migration.version);
    record.BindText(2, migration.name);
    record.BindText(3, checksum);
    record.BindInt(4, ToEpochMillis(Clock::now()));
    record.Run();
    transaction.Commit();
    logger_->Log(LogLevel::kInfo, "store.migration.applied",
                 {{"version", std::to_string(migration.version)},
                  {"name", migration.name}});
  }
}

int SqliteResultStore::SchemaVersion() {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement statement(db_,
                      "SELECT COALESCE(MAX(version), 0) FROM schema_migrations");
  statement.Step();
  return static_cast<int>(statement.Int(0));
}

Ack SqliteResultStore::Upsert(const std::string &job_id, int attempt,
                              const AnalysisResult &result) {
  std::lock_guard<std::mutex> lock(mutex_);
  Transaction transaction(db_);

  Statement exists(db_,
                   "SELECT 1 FROM results WHERE job_id = ? AND attempt = ?");
  exists.BindText(1, job_id);
  exists.BindInt(2, attempt);
  if (exists.Step()) {
    return Ack{false};
  }

  const auto now = Clock::now();
  Statement insert(db_, "INSERT INTO results (job_id, attempt, passed, "
                        "stored_at) VALUES (?, ?, ?, ?)");
  insert.BindText(1, job_id);
  insert.BindInt(2, attempt);
  insert.BindInt(3, result.passed ? 1 : 0);
  insert.BindInt(4, ToEpochMillis(now));
  insert.Run();

  for (std::size_t index = 0; index < result.findings.size(); ++index) {
    const auto &finding = result.findings[index];
    Statement row(db_, "INSERT INTO findings (job_id, attempt, ordinal, "
                       "severity, rule_id, message, path, line, "
                       "column_number, step) "
                       "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    row.BindText(1, job_id);
    row.BindInt(2, attempt);
    row.BindInt(3, static_cast<std::int64_t>(index));
    row.BindText(4, ToString(finding.severity));
    row.BindText(5, finding.rule_id);
    row.BindText(6, finding.message);
    row.BindText(7, finding.path);
    row.BindInt(8, finding.line);
    row.BindInt(9, finding.column);
    row.BindText(10, finding.step);
    row.Run();
  }

  for (std::size_t index = 0; index < result.steps.size(); ++index) {
    const auto &step = result.steps[index];
    Statement row(db_, "INSERT INTO step_outcomes (job_id, attempt, ordinal, "
                       "name, exit_code, duration_ms) VALUES (?, ?, ?, ?, ?, ?)");
    row.BindText(1, job_id);
    row.BindInt(2, attempt);
    row.BindInt(3, static_cast<std::int64_t>(index));
    row.BindText(4, step.name);
    row.BindInt(5, step.exit_code);
    row.BindInt(6, step.duration.count());
    row.Run();
  }

  if (auto job = LoadJobLocked(job_id); job.has_value()) {
    JobTransition transition;
    transition.job_id = job_id;
    transition.sequence = NextSequence(db_, job_id);
    transition.attempt = attempt;
    transition.from = job->state;
    transition.to = JobState::kSucceeded;
    transition.at = now;

    Statement update(db_, "UPDATE jobs SET state = ?, finished_at = ?, "
                          "next_attempt_at = NULL, last_error_kind = NULL, "
                          "last_error_message = NULL WHERE id = ?");
    update.BindText(1, ToString(JobState::kSucceeded));
    update.BindInt(2, ToEpochMillis(now));
    update.BindText(3, job_id);
    update.Run();
    InsertTransition(db_, transition);
  }

  transaction.Commit();
  logger_->Log(LogLevel::kDebug, "store.result.inserted",
               {{"job_id", job_id},
                {"attempt", std::to_string(attempt)},
                {"findings", std::to_string(result.findings.size())}});
  return Ack{true};
}

std::optional<PersistedResult>
SqliteResultStore::Get(const std::string &job_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement header(db_, "SELECT attempt, passed, stored_at FROM results "
                        "WHERE job_id = ? ORDER BY attempt DESC LIMIT 1");
  header.BindText(1, job_id);
  if (!header.Step()) {
    return std::nullopt;
  }

  PersistedResult persisted;
  persisted.job_id = job_id;
  persisted.attempt = static_cast<int>(header.Int(0));
  persisted.result.passed = header.Int(1) != 0;
  persisted.stored_at = FromEpochMillis(header.Int(2));

  Statement findings(db_, "SELECT severity, rule_id, message, path, line, "
                          "column_number, step FROM findings WHERE job_id = ? "
                          "AND attempt = ? ORDER BY ordinal");
  findings.BindText(1, job_id);
  findings.BindInt(2, persisted.attempt);
  while (findings.Step()) {
    Finding finding;
    const auto severity = ParseSeverity(findings.Text(0));
    if (!severity.has_value()) {
      throw JobError(ErrorKind::kPersistence,
                     "Unknown severity '" + findings.Text(0) + "'");
    }
    finding.severity = *severity;
    finding.rule_id = findings.Text(1);
    finding.message = findings.Text(2);
    finding.path = findings.Text(3);
    finding.line = static_cast<int>(findings.Int(4));
    finding.column = static_cast<int>(findings.Int(5));
    finding.step = findings.Text(6);
    persisted.result.findings.push_back(std::move(finding));
  }

  Statement steps(db_, "SELECT name, exit_code, duration_ms FROM "
                       "step_outcomes WHERE job_id = ? AND attempt = ? "
                       "ORDER BY ordinal");
  steps.BindText(1, job_id);
  steps.BindInt(2, persisted.attempt);
  while (steps.Step()) {
    persisted.result.steps.push_back(
        StepOutcome{steps.Text(0), static_cast<int>(steps.Int(1)),
                    std::chrono::milliseconds(steps.Int(2))});
  }
  return persisted;
}

void SqliteResultStore::SaveJob(const Job &job,
                                const JobTransition &transition) {
  std::lock_guard<std::mutex> lock(mutex_);
  Transaction transaction(db_);

  Statement statement(
      db_,
      "INSERT INTO jobs (id, repository_url, revision, analysis_set, "
      "job_class, state, attempt, max_attempts, created_at, started_at, "
      "finished_at, next_attempt_at, last_error_kind, last_error_message) "
      "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
      "ON CONFLICT(id) DO UPDATE SET state = excluded.state, "
      "attempt = excluded.attempt, started_at = excluded.started_at, "
      "finished_at = excluded.finished_at, "
      "next_attempt_at = excluded.next_attempt_at, "
      "last_error_kind = excluded.last_error_kind, "
      "last_error_message = excluded.last_error_message");
  statement.BindText(1, job.id);
  statement.BindText(2, job.repository.url);
  statement.BindText(3, job.repository.revision);
  statement.BindText(4, JoinEscaped(job.analysis_set));
  statement.BindText(5, job.job_class);
  statement.BindText(6, ToString(job.state));
  statement.BindInt(7, job.attempt);
  statement.BindInt(8, job.max_attempts);
  statement.BindInt(9, ToEpochMillis(job.created_at));
  statement.BindOptionalTime(10, job.started_at);
  statement.BindOptionalTime(11, job.finished_at);
  statement.BindOptionalTime(12, job.next_attempt_at);
  if (job.last_error.has_value()) {
    statement.BindText(13, ToString(job.last_error->kind));
    statement.BindText(14, job.last_error->message);
  } else {
    statement.BindNull(13);
    statement.BindNull(14);
  }
  statement.Run();

  InsertTransition(db_, transition);
  transaction.Commit();
}

std::optional<Job> SqliteResultStore::LoadJob(const std::string &job_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return LoadJobLocked(job_id);
}

std::optional<Job> SqliteResultStore::LoadJobLocked(const std::string &job_id) {
  const auto sql =
      std::string("SELECT ") + kJobColumns + " FROM jobs WHERE id = ?";
  Statement statement(db_, sql.c_str());
  statement.BindText(1, job_id);
  if (!statement.Step()) {
    return std::nullopt;
  }
  return ReadJob(statement);
}

std::vector<JobTransition>
SqliteResultStore::Transitions(const std::string &job_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement statement(db_, "SELECT sequence, attempt, from_state, to_state, "
                           "at, error_kind FROM job_transitions "
                           "WHERE job_id = ? ORDER BY sequence");
  statement.BindText(1, job_id);

  std::vector<JobTransition> transitions;
  while (statement.Step()) {
    JobTransition transition;
    transition.job_id = job_id;
    transition.sequence = static_cast<int>(statement.Int(0));
    transition.attempt = static_cast<int>(statement.Int(1));
    if (!statement.IsNull(2)) {
      transition.from = StateColumn(statement, 2);
    }
    transition.to = StateColumn(statement, 3);
    transition.at = FromEpochMillis(statement.Int(4));
    if (!statement.IsNull(5)) {
      transition.error = ErrorKindColumn(statement, 5);
    }
    transitions.push_back(std::move(transition));
  }
  return transitions;
}

std::vector<Job> SqliteResultStore::LoadUnfinishedJobs() {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto sql = std::string("SELECT ") + kJobColumns +
                   " FROM jobs WHERE state NOT IN ('succeeded', 'failed', "
                   "'cancelled') ORDER BY created_at, id";
  Statement statement(db_, sql.c_str());
  std::vector<Job> jobs;
  while (statement.Step()) {
    jobs.push_back(ReadJob(statement));
  }
  return jobs;
}

std::map<JobState, int> SqliteResultStore::CountByState() {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement statement(db_, "SELECT state, COUNT(*) FROM jobs GROUP BY state");
  std::map<JobState, int> counts;
  while (statement.Step()) {
    counts[StateColumn(statement, 0)] = static_cast<int>(statement.Int(1));
  }
  return counts;
}

void SqliteResultStore::Ping() {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement statement(db_, "SELECT 1");
  if (!statement.Step()) {
    throw JobError(ErrorKind::kPersistence, "Ping returned no row");
  }
}

std::string SqlitePathFromUrl(const std::string &database_url) {
  constexpr const char kScheme[] = "sqlite://";
  if (database_url.empty()) {
    throw std::invalid_argument("database_url cannot be empty");
  }
  if (database_url.rfind(kScheme, 0) == 0) {
    auto path = database_url.substr(sizeof(kScheme) - 1);
    if (path.empty()) {
      throw std::invalid_argument("database_url has no path: " + database_url);
    }
    return path;
  }
  if (database_url.find("://") != std::string::npos) {
    throw std::invalid_argument("Unsupported database_url scheme: " +
                                database_url);
  }
  return database_url;
}

std::unique_ptr<ResultStore> OpenResultStore(const std::string &database_url,
                                             std::shared_ptr<Logger> logger) {
  return std::make_unique<SqliteResultStore>(SqlitePathFromUrl(database_url),
                                             std::move(logger));
}

} // namespace feedbacker
