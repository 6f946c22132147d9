#pragma once

#include <feedbacker/default_analysis_runner.h>
#include <feedbacker/git_repository_fetcher.h>
#include <feedbacker/health_monitor.h>
#include <feedbacker/job_scheduler.h>
#include <feedbacker/service_config.h>

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace feedbacker {

struct CliOptions {
  std::optional<std::filesystem::path> config_file;
  std::optional<LogLevel> log_level;
  std::optional<std::string> repository;
  std::optional<std::string> revision;
  std::vector<std::string> steps;
  std::optional<std::string> job_class;
  std::optional<std::string> job_id;
  std::string format = "text";
  bool show_help = false;
};

// The wired components of one process.
struct Service {
  std::shared_ptr<Logger> logger;
  std::shared_ptr<ResultStore> store;
  std::shared_ptr<RepositoryFetcher> fetcher;
  std::shared_ptr<DefaultAnalysisRunner> runner;
  std::shared_ptr<JobScheduler> scheduler;
  std::shared_ptr<HealthMonitor> health;
};

CliOptions ParseCliArguments(const std::vector<std::string> &arguments);
ServiceConfig ResolveServiceConfig(const CliOptions &options,
                                   const Environment &environment);
Service BuildService(const ServiceConfig &config,
                     std::shared_ptr<Logger> logger);

// `<url> <revision> <step[,step...]> [job_class]`. Blank lines and lines
// starting with '#' yield nothing.
std::optional<JobRequest> ParseJobLine(const std::string &line);

int RunServe(const std::vector<std::string> &arguments, std::istream &input,
             std::ostream &output);
int RunJob(const std::vector<std::string> &arguments, std::ostream &output);
int RunStatus(const std::vector<std::string> &arguments, std::ostream &output);
int RunHealth(const std::vector<std::string> &arguments, std::ostream &output);

} // namespace feedbacker
