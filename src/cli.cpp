#include <feedbacker/cli.h>

#include <feedbacker/cli_exit_codes.h>
#include <feedbacker/job_error.h>
#include <feedbacker/result_formatter.h>
#include <feedbacker/sqlite_result_store.h>
#include <feedbacker/subprocess.h>

#include <algorithm>
#include <chrono>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace feedbacker {
namespace {

void PrintUsage(std::ostream &output) {
  output << "Usage: feedbackerd <command> [options]\n\n"
         << "Commands:\n"
         << "  serve    Run the scheduler; read job lines from stdin\n"
         << "           (<url> <revision> <step[,step]> [job_class],\n"
         << "           'cancel <id>', 'status <id>' or 'health').\n"
         << "  run      Submit one job and wait for its outcome.\n"
         << "  status   Print a stored job and its result.\n"
         << "  health   Check the store, git and workspace.\n\n"
         << "Options:\n"
         << "  --config <file>      YAML config file\n"
         << "  --log-level <level>  error, warn, info or debug\n"
         << "  --repo <url>         Repository to analyze (run)\n"
         << "  --revision <rev>     Branch, tag or commit (run)\n"
         << "  --steps <list>       Comma-separated analysis steps (run)\n"
         << "  --class <name>       Job class selecting a retry policy (run)\n"
         << "  --format <fmt>       text or json (run, status)\n"
         << "  --help               Show this message\n";
}

std::string RequireValue(const std::vector<std::string> &arguments,
                         std::size_t &index, const std::string &flag) {
  if (index + 1 >= arguments.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  ++index;
  return arguments[index];
}

std::vector<std::string> SplitSteps(const std::string &raw) {
  std::vector<std::string> steps;
  std::string current;
  for (const auto character : raw) {
    if (character == ',') {
      if (!current.empty()) {
        steps.push_back(current);
        current.clear();
      }
    } else {
      current.push_back(character);
    }
  }
  if (!current.empty()) {
    steps.push_back(current);
  }
  return steps;
}

std::string Render(const CliOptions &options, const Job &job,
                   const std::optional<PersistedResult> &result) {
  if (options.format == "json") {
    return FormatJobJson(job, result) + "\n";
  }
  return FormatJobText(job, result);
}

JobState AwaitTerminal(const JobScheduler &scheduler,
                       const std::string &job_id) {
  auto state = scheduler.Status(job_id);
  while (!IsTerminal(state)) {
    state = scheduler.WaitForTerminal(job_id, std::chrono::seconds(1));
  }
  return state;
}

std::shared_ptr<Logger> MakeServiceLogger(const ServiceConfig &config) {
  return MakeLogger(BuildLoggingConfig(config), std::clog);
}

ComponentHealth CheckGit(const ServiceConfig &config) {
  ProcessSpec spec;
  spec.argv = {config.git_binary, "--version"};
  const auto result = RunProcess(
      spec, std::chrono::steady_clock::now() + std::chrono::seconds(10));
  if (result.status != ProcessStatus::kExited || result.exit_code != 0) {
    return {"git", false,
            "cannot run " + config.git_binary + ": " + result.stderr_output};
  }
  auto version = result.stdout_output;
  version.erase(std::remove(version.begin(), version.end(), '\n'),
                version.end());
  return {"git", true, version};
}

ComponentHealth CheckWorkspace(const ServiceConfig &config) {
  const auto &root = config.scheduler.workspace_root;
  std::error_code error;
  std::filesystem::create_directories(root, error);
  if (error) {
    return {"workspace", false, root.string() + ": " + error.message()};
  }
  const auto marker = root / ".feedbacker-marker";
  std::filesystem::create_directory(marker, error);
  if (error) {
    return {"workspace", false, root.string() + " is not writable"};
  }
  std::filesystem::remove(marker, error);
  return {"workspace", true, root.string()};
}

ComponentHealth CheckStore(const ServiceConfig &config,
                           const std::shared_ptr<Logger> &logger) {
  try {
    OpenResultStore(config.database_url, logger)->Ping();
    return {"store", true, "reachable"};
  } catch (const JobError &error) {
    return {"store", false, error.what()};
  }
}

} // namespace

CliOptions ParseCliArguments(const std::vector<std::string> &arguments) {
  CliOptions options;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    const auto &argument = arguments[i];
    if (argument == "--help" || argument == "-h") {
      options.show_help = true;
      return options;
    }
    if (argument == "--config") {
      options.config_file = RequireValue(arguments, i, argument);
    } else if (argument == "--log-level") {
      options.log_level = ParseLogLevel(RequireValue(arguments, i, argument));
    } else if (argument == "--repo") {
      options.repository = RequireValue(arguments, i, argument);
    } else if (argument == "--revision") {
      options.revision = RequireValue(arguments, i, argument);
    } else if (argument == "--steps") {
      options.steps = SplitSteps(RequireValue(arguments, i, argument));
    } else if (argument == "--class") {
      options.job_class = RequireValue(arguments, i, argument);
    } else if (argument == "--format") {
      options.format = RequireValue(arguments, i, argument);
      if (options.format != "text" && options.format != "json") {
        throw std::invalid_argument("Unsupported format: " + options.format);
      }
    } else if (argument.rfind('-', 0) != 0 && !options.job_id) {
      options.job_id = argument;
    } else {
      throw std::invalid_argument("Unknown argument: " + argument);
    }
  }
  return options;
}

ServiceConfig ResolveServiceConfig(const CliOptions &options,
                                   const Environment &environment) {
  auto config = LoadServiceConfig(options.config_file, environment);
  if (options.log_level) {
    config.log_level = options.log_level;
  }
  return config;
}

Service BuildService(const ServiceConfig &config,
                     std::shared_ptr<Logger> logger) {
  Service service;
  service.logger = EnsureLogger(std::move(logger));
  service.store = OpenResultStore(config.database_url, service.logger);

  GitFetcherOptions fetcher_options;
  fetcher_options.git_binary = config.git_binary;
  fetcher_options.ssh_key = config.ssh_key;
  fetcher_options.known_hosts = config.known_hosts;
  service.fetcher =
      std::make_shared<GitRepositoryFetcher>(fetcher_options, service.logger);

  service.runner = std::make_shared<DefaultAnalysisRunner>(
      BuildAnalysisCatalog(config), AnalysisRunnerOptions{}, service.logger);
  service.scheduler = std::make_shared<JobScheduler>(
      config.scheduler, service.fetcher, service.runner, service.store,
      service.logger);
  service.health = std::make_shared<HealthMonitor>(
      service.scheduler, service.store, service.logger);
  return service;
}

std::optional<JobRequest> ParseJobLine(const std::string &line) {
  std::istringstream stream(line);
  std::vector<std::string> tokens;
  std::string token;
  while (stream >> token) {
    tokens.push_back(token);
  }
  if (tokens.empty() || tokens.front().rfind('#', 0) == 0) {
    return std::nullopt;
  }
  if (tokens.size() < 3 || tokens.size() > 4) {
    throw std::invalid_argument(
        "Expected '<url> <revision> <step[,step...]> [job_class]', got '" +
        line + "'");
  }
  JobRequest request;
  request.repository.url = tokens[0];
  request.repository.revision = tokens[1];
  request.analysis_set = SplitSteps(tokens[2]);
  if (tokens.size() == 4) {
    request.job_class = tokens[3];
  }
  return request;
}

int RunServe(const std::vector<std::string> &arguments, std::istream &input,
             std::ostream &output) {
  const auto options = ParseCliArguments(arguments);
  if (options.show_help) {
    PrintUsage(output);
    return kExitOk;
  }
  const auto config = ResolveServiceConfig(options, CurrentEnvironment());
  auto service = BuildService(config, MakeServiceLogger(config));
  service.logger->Log(LogLevel::kInfo, "service.starting",
                      {{"bind_address", config.bind_address},
                       {"environment", config.environment},
                       {"database_url", config.database_url}});
  service.scheduler->Start();

  std::vector<std::string> submitted;
  std::string line;
  while (std::getline(input, line)) {
    std::istringstream stream(line);
    std::string command;
    std::string argument;
    stream >> command >> argument;
    try {
      if (command == "cancel") {
        output << (service.scheduler->Cancel(argument) ? "cancelled "
                                                       : "not-cancelled ")
               << argument << std::endl;
      } else if (command == "status") {
        const auto job = service.scheduler->Snapshot(argument);
        if (!job) {
          throw std::invalid_argument("Unknown job id: " + argument);
        }
        output << Render(options, *job, service.store->Get(argument))
               << std::flush;
      } else if (command == "health") {
        output << ToJson(service.health->Check()) << std::endl;
      } else if (const auto request = ParseJobLine(line)) {
        const auto job_id = service.scheduler->Submit(*request);
        submitted.push_back(job_id);
        output << job_id << std::endl;
      }
    } catch (const JobError &error) {
      output << "error: " << ToString(error.kind()) << ": " << error.what()
             << std::endl;
    } catch (const std::invalid_argument &error) {
      output << "error: " << error.what() << std::endl;
    }
  }

  for (const auto &job_id : submitted) {
    AwaitTerminal(*service.scheduler, job_id);
    const auto job = service.scheduler->Snapshot(job_id);
    if (job) {
      output << FormatJobText(*job, service.store->Get(job_id));
    }
  }
  service.scheduler->Stop();
  return kExitOk;
}

int RunJob(const std::vector<std::string> &arguments, std::ostream &output) {
  const auto options = ParseCliArguments(arguments);
  if (options.show_help) {
    PrintUsage(output);
    return kExitOk;
  }
  if (!options.repository || !options.revision || options.steps.empty()) {
    throw std::invalid_argument("run needs --repo, --revision and --steps");
  }

  const auto config = ResolveServiceConfig(options, CurrentEnvironment());
  auto service = BuildService(config, MakeServiceLogger(config));
  service.scheduler->Start();

  JobRequest request;
  request.repository = {*options.repository, *options.revision};
  request.analysis_set = options.steps;
  request.job_class = options.job_class.value_or("");
  const auto job_id = service.scheduler->Submit(request);
  AwaitTerminal(*service.scheduler, job_id);
  service.scheduler->Stop();

  const auto job = service.scheduler->Snapshot(job_id);
  if (!job) {
    throw std::runtime_error("Job " + job_id + " disappeared from the store");
  }
  const auto result = service.store->Get(job_id);
  output << Render(options, *job, result);
  return JobExitCode(*job, result);
}

int RunStatus(const std::vector<std::string> &arguments,
              std::ostream &output) {
  const auto options = ParseCliArguments(arguments);
  if (options.show_help) {
    PrintUsage(output);
    return kExitOk;
  }
  if (!options.job_id) {
    throw std::invalid_argument("status needs a job id");
  }
  const auto config = ResolveServiceConfig(options, CurrentEnvironment());
  const auto store =
      OpenResultStore(config.database_url, MakeServiceLogger(config));
  const auto job = store->LoadJob(*options.job_id);
  if (!job) {
    throw std::invalid_argument("Unknown job id: " + *options.job_id);
  }
  const auto result = store->Get(*options.job_id);
  output << Render(options, *job, result);
  return JobExitCode(*job, result);
}

int RunHealth(const std::vector<std::string> &arguments,
              std::ostream &output) {
  const auto options = ParseCliArguments(arguments);
  if (options.show_help) {
    PrintUsage(output);
    return kExitOk;
  }
  const auto config = ResolveServiceConfig(options, CurrentEnvironment());
  const auto logger = MakeServiceLogger(config);

  HealthReport report;
  report.components = {CheckStore(config, logger), CheckGit(config),
                       CheckWorkspace(config)};
  const auto all_ok =
      std::all_of(report.components.begin(), report.components.end(),
                  [](const ComponentHealth &component) { return component.ok; });
  report.status = all_ok ? HealthStatus::kHealthy : HealthStatus::kDegraded;
  report.accepting_work = all_ok;
  output << ToJson(report) << std::endl;
  return all_ok ? kExitOk : kExitUnhealthy;
}

} // namespace feedbacker
