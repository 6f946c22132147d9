#pragma once

#include <feedbacker/analysis_catalog.h>
#include <feedbacker/job_scheduler.h>
#include <feedbacker/logging.h>

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace feedbacker {

using Environment = std::map<std::string, std::string>;

struct ServiceConfig {
  // Unset means info, or debug in the development environment.
  std::optional<LogLevel> log_level;
  std::string bind_address = "0.0.0.0:3000";
  std::string environment = "production";
  std::string database_url = "sqlite:///var/lib/feedbacker/feedbacker.db";
  std::optional<std::filesystem::path> ssh_key;
  std::optional<std::filesystem::path> known_hosts;
  std::string git_binary = "git";
  SchedulerConfig scheduler;
  std::map<std::string, StepDefinition> analysis_steps;
  std::optional<std::filesystem::path> config_file;
};

// Reads a .yml/.yaml file. Unknown keys and malformed values throw
// std::invalid_argument.
ServiceConfig ParseServiceConfigFile(const std::filesystem::path &path);

// FEEDBACKER_* variables win over DATABASE_URL, SERVER_ADDRESS and
// ENVIRONMENT, which win over the file.
void ApplyEnvironment(const Environment &environment, ServiceConfig &config);

void ValidateServiceConfig(const ServiceConfig &config);

// File (when given), then environment, then validation.
ServiceConfig
LoadServiceConfig(const std::optional<std::filesystem::path> &config_file,
                  const Environment &environment);

Environment CurrentEnvironment();

LoggingConfig BuildLoggingConfig(const ServiceConfig &config);

// Built-in steps plus the configured ones; a configured step may not reuse
// a built-in name.
AnalysisCatalog BuildAnalysisCatalog(const ServiceConfig &config);

} // namespace feedbacker
