#include <feedbacker/service_config.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <yaml-cpp/yaml.h>

extern char **environ;

namespace feedbacker {
namespace {

const std::vector<std::string> &SupportedConfigKeys() {
  static const std::vector<std::string> keys = {
      "log_level",      "bind_address",       "environment",
      "workers",        "queue_capacity",     "fetch_timeout_ms",
      "analysis_timeout_ms", "workspace_root", "database_url",
      "ssh_key",        "known_hosts",        "git_binary",
      "retry_policies", "store_retry",        "analysis_steps"};
  return keys;
}

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string NormalizeConfigKey(std::string key) {
  key = ToLower(Trim(key));
  std::replace(key.begin(), key.end(), '-', '_');
  static const std::unordered_map<std::string, std::string> aliases = {
      {"worker_count", "workers"},
      {"server_address", "bind_address"},
      {"database", "database_url"},
      {"workspace", "workspace_root"},
      {"steps", "analysis_steps"}};
  if (const auto alias = aliases.find(key); alias != aliases.end()) {
    return alias->second;
  }
  return key;
}

[[noreturn]] void ThrowUnknownKey(const std::string &key) {
  std::string message = "Unknown config key: " + key + ". Supported keys: ";
  const auto &supported = SupportedConfigKeys();
  for (std::size_t i = 0; i < supported.size(); ++i) {
    message += supported[i];
    if (i + 1 < supported.size()) {
      message += ", ";
    }
  }
  throw std::invalid_argument(message);
}

std::string ExtractStringScalar(const YAML::Node &node,
                                const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a string value");
  }
  return node.as<std::string>();
}

long long ParseInteger(const std::string &raw, const std::string &key_name) {
  const auto value = Trim(raw);
  std::size_t consumed = 0;
  long long parsed = 0;
  try {
    parsed = std::stoll(value, &consumed);
  } catch (const std::logic_error &) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be an integer, got '" + raw + "'");
  }
  if (consumed != value.size()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be an integer, got '" + raw + "'");
  }
  return parsed;
}

double ParseNumber(const std::string &raw, const std::string &key_name) {
  const auto value = Trim(raw);
  std::size_t consumed = 0;
  double parsed = 0;
  try {
    parsed = std::stod(value, &consumed);
  } catch (const std::logic_error &) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a number, got '" + raw + "'");
  }
  if (consumed != value.size()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a number, got '" + raw + "'");
  }
  return parsed;
}

long long ExtractInteger(const YAML::Node &node, const std::string &key_name) {
  return ParseInteger(ExtractStringScalar(node, key_name), key_name);
}

int ParsePositiveInt(const std::string &raw, const std::string &key_name) {
  const auto value = ParseInteger(raw, key_name);
  if (value < 1 || value > 1000000) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a positive integer");
  }
  return static_cast<int>(value);
}

std::chrono::milliseconds ParseMillis(const std::string &raw,
                                      const std::string &key_name) {
  const auto value = ParseInteger(raw, key_name);
  if (value < 0) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' cannot be negative");
  }
  return std::chrono::milliseconds(value);
}

std::vector<std::string> ExtractList(const YAML::Node &node,
                                     const std::string &key_name) {
  std::vector<std::string> values;
  if (node.IsSequence()) {
    for (const auto &child : node) {
      values.push_back(ExtractStringScalar(child, key_name));
    }
    return values;
  }
  if (node.IsScalar()) {
    std::istringstream stream(node.as<std::string>());
    std::string token;
    while (stream >> token) {
      values.push_back(token);
    }
    return values;
  }
  throw std::invalid_argument("Config key '" + key_name +
                              "' must be a string or list of strings");
}

ErrorKind ParseRetryableKind(const std::string &value,
                             const std::string &key_name) {
  auto normalized = ToLower(Trim(value));
  static const std::unordered_map<std::string, std::string> aliases = {
      {"network", "network_error"},
      {"auth", "auth_error"},
      {"persistence", "persistence_error"}};
  if (const auto alias = aliases.find(normalized); alias != aliases.end()) {
    normalized = alias->second;
  }
  const auto kind = ParseErrorKind(normalized);
  if (!kind.has_value()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' has unknown error kind '" + value + "'");
  }
  return *kind;
}

RetryPolicy ExtractRetryPolicy(const YAML::Node &node,
                               const std::string &key_name,
                               RetryPolicy policy) {
  if (!node.IsMap()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a mapping");
  }
  for (const auto &entry : node) {
    const auto field = NormalizeConfigKey(entry.first.as<std::string>());
    const auto qualified = key_name + "." + field;
    if (field == "max_attempts") {
      policy.max_attempts =
          ParsePositiveInt(ExtractStringScalar(entry.second, qualified),
                           qualified);
    } else if (field == "initial_backoff_ms") {
      policy.initial_backoff =
          ParseMillis(ExtractStringScalar(entry.second, qualified), qualified);
    } else if (field == "max_backoff_ms") {
      policy.max_backoff =
          ParseMillis(ExtractStringScalar(entry.second, qualified), qualified);
    } else if (field == "multiplier") {
      policy.multiplier =
          ParseNumber(ExtractStringScalar(entry.second, qualified), qualified);
    } else if (field == "retryable") {
      policy.retryable.clear();
      for (const auto &kind : ExtractList(entry.second, qualified)) {
        policy.retryable.insert(ParseRetryableKind(kind, qualified));
      }
    } else {
      throw std::invalid_argument("Unknown retry policy key: " + qualified);
    }
  }
  return policy;
}

StepDefinition ExtractStep(const YAML::Node &node, const std::string &name) {
  const auto key_name = "analysis_steps." + name;
  if (node.IsSequence() || node.IsScalar()) {
    return CommandStep{ExtractList(node, key_name), OutputFormat::kGcc};
  }
  if (!node.IsMap()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a command or a mapping");
  }

  std::string type = "command";
  if (node["type"]) {
    type = ToLower(ExtractStringScalar(node["type"], key_name + ".type"));
  }
  if (type == "clang" || type == "clang-diagnostics") {
    ClangDiagnosticsStep step;
    for (const auto &entry : node) {
      const auto field = NormalizeConfigKey(entry.first.as<std::string>());
      if (field == "type") {
        continue;
      }
      if (field != "extra_arguments") {
        throw std::invalid_argument("Unknown analysis step key: " + key_name +
                                    "." + field);
      }
      step.extra_arguments = ExtractList(entry.second, key_name + "." + field);
    }
    return step;
  }
  if (type != "command") {
    throw std::invalid_argument("Config key '" + key_name +
                                ".type' must be command or clang");
  }

  CommandStep step;
  for (const auto &entry : node) {
    const auto field = NormalizeConfigKey(entry.first.as<std::string>());
    if (field == "type") {
      continue;
    }
    if (field == "command") {
      step.command = ExtractList(entry.second, key_name + ".command");
    } else if (field == "format") {
      step.format = ParseOutputFormat(
          ToLower(ExtractStringScalar(entry.second, key_name + ".format")));
    } else {
      throw std::invalid_argument("Unknown analysis step key: " + key_name +
                                  "." + field);
    }
  }
  if (step.command.empty()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' needs a command");
  }
  return step;
}

void ApplyYamlKey(const std::string &key, const YAML::Node &node,
                  ServiceConfig &config) {
  if (key == "log_level") {
    config.log_level = ParseLogLevel(ExtractStringScalar(node, key));
  } else if (key == "bind_address") {
    config.bind_address = ExtractStringScalar(node, key);
  } else if (key == "environment") {
    config.environment = ToLower(Trim(ExtractStringScalar(node, key)));
  } else if (key == "workers") {
    config.scheduler.worker_count =
        ParsePositiveInt(ExtractStringScalar(node, key), key);
  } else if (key == "queue_capacity") {
    const auto capacity = ExtractInteger(node, key);
    if (capacity < 0) {
      throw std::invalid_argument("Config key 'queue_capacity' cannot be "
                                  "negative");
    }
    config.scheduler.queue_capacity = static_cast<std::size_t>(capacity);
  } else if (key == "fetch_timeout_ms") {
    config.scheduler.fetch_timeout =
        ParseMillis(ExtractStringScalar(node, key), key);
  } else if (key == "analysis_timeout_ms") {
    config.scheduler.analysis_timeout =
        ParseMillis(ExtractStringScalar(node, key), key);
  } else if (key == "workspace_root") {
    config.scheduler.workspace_root = ExtractStringScalar(node, key);
  } else if (key == "database_url") {
    config.database_url = ExtractStringScalar(node, key);
  } else if (key == "ssh_key") {
    config.ssh_key = std::filesystem::path(ExtractStringScalar(node, key));
  } else if (key == "known_hosts") {
    config.known_hosts = std::filesystem::path(ExtractStringScalar(node, key));
  } else if (key == "git_binary") {
    config.git_binary = ExtractStringScalar(node, key);
  } else if (key == "retry_policies") {
    if (!node.IsMap()) {
      throw std::invalid_argument("Config key 'retry_policies' must be a "
                                  "mapping of job class to policy");
    }
    for (const auto &entry : node) {
      const auto job_class = Trim(entry.first.as<std::string>());
      auto base = config.scheduler.retry_policies.count(job_class) != 0
                      ? config.scheduler.retry_policies.at(job_class)
                      : RetryPolicy{};
      config.scheduler.retry_policies[job_class] = ExtractRetryPolicy(
          entry.second, "retry_policies." + job_class, std::move(base));
    }
  } else if (key == "store_retry") {
    config.scheduler.store_retry =
        ExtractRetryPolicy(node, key, config.scheduler.store_retry);
  } else if (key == "analysis_steps") {
    if (!node.IsMap()) {
      throw std::invalid_argument("Config key 'analysis_steps' must be a "
                                  "mapping of step name to definition");
    }
    for (const auto &entry : node) {
      const auto name = Trim(entry.first.as<std::string>());
      config.analysis_steps[name] = ExtractStep(entry.second, name);
    }
  } else {
    ThrowUnknownKey(key);
  }
}

std::optional<std::string> Lookup(const Environment &environment,
                                  const std::string &name) {
  const auto found = environment.find(name);
  if (found == environment.end() || found->second.empty()) {
    return std::nullopt;
  }
  return found->second;
}

// First present variable wins.
std::optional<std::string> Lookup(const Environment &environment,
                                  const std::string &primary,
                                  const std::string &fallback) {
  if (auto value = Lookup(environment, primary)) {
    return value;
  }
  return Lookup(environment, fallback);
}

} // namespace

ServiceConfig ParseServiceConfigFile(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Config file not found: " + path.string());
  }
  const auto extension = ToLower(path.extension().string());
  if (extension != ".yml" && extension != ".yaml") {
    throw std::invalid_argument("Unsupported config format: " + extension);
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(path.string());
  } catch (const YAML::Exception &error) {
    throw std::invalid_argument("Cannot parse " + path.string() + ": " +
                                error.what());
  }

  ServiceConfig config;
  config.config_file = path;
  if (root.IsNull()) {
    return config;
  }
  if (!root.IsMap()) {
    throw std::invalid_argument(
        "Config file must contain a mapping at the root");
  }
  for (const auto &entry : root) {
    const auto key = NormalizeConfigKey(entry.first.as<std::string>());
    const auto &supported = SupportedConfigKeys();
    if (std::find(supported.begin(), supported.end(), key) ==
        supported.end()) {
      ThrowUnknownKey(entry.first.as<std::string>());
    }
    ApplyYamlKey(key, entry.second, config);
  }
  return config;
}

void ApplyEnvironment(const Environment &environment, ServiceConfig &config) {
  if (const auto value = Lookup(environment, "FEEDBACKER_LOG_LEVEL")) {
    config.log_level = ParseLogLevel(*value);
  }
  if (const auto value =
          Lookup(environment, "FEEDBACKER_BIND_ADDRESS", "SERVER_ADDRESS")) {
    config.bind_address = *value;
  }
  if (const auto value =
          Lookup(environment, "FEEDBACKER_ENVIRONMENT", "ENVIRONMENT")) {
    config.environment = ToLower(Trim(*value));
  }
  if (const auto value =
          Lookup(environment, "FEEDBACKER_DATABASE_URL", "DATABASE_URL")) {
    config.database_url = *value;
  }
  if (const auto value = Lookup(environment, "FEEDBACKER_WORKERS")) {
    config.scheduler.worker_count =
        ParsePositiveInt(*value, "FEEDBACKER_WORKERS");
  }
  if (const auto value = Lookup(environment, "FEEDBACKER_QUEUE_CAPACITY")) {
    const auto capacity = ParseInteger(*value, "FEEDBACKER_QUEUE_CAPACITY");
    if (capacity < 0) {
      throw std::invalid_argument("FEEDBACKER_QUEUE_CAPACITY cannot be "
                                  "negative");
    }
    config.scheduler.queue_capacity = static_cast<std::size_t>(capacity);
  }
  if (const auto value = Lookup(environment, "FEEDBACKER_FETCH_TIMEOUT_MS")) {
    config.scheduler.fetch_timeout =
        ParseMillis(*value, "FEEDBACKER_FETCH_TIMEOUT_MS");
  }
  if (const auto value =
          Lookup(environment, "FEEDBACKER_ANALYSIS_TIMEOUT_MS")) {
    config.scheduler.analysis_timeout =
        ParseMillis(*value, "FEEDBACKER_ANALYSIS_TIMEOUT_MS");
  }
  if (const auto value = Lookup(environment, "FEEDBACKER_WORKSPACE_ROOT")) {
    config.scheduler.workspace_root = *value;
  }
  if (const auto value = Lookup(environment, "FEEDBACKER_SSH_KEY")) {
    config.ssh_key = std::filesystem::path(*value);
  }
  if (const auto value = Lookup(environment, "FEEDBACKER_KNOWN_HOSTS")) {
    config.known_hosts = std::filesystem::path(*value);
  }
  if (const auto value = Lookup(environment, "FEEDBACKER_GIT_BINARY")) {
    config.git_binary = *value;
  }
  if (const auto value = Lookup(environment, "FEEDBACKER_MAX_ATTEMPTS")) {
    config.scheduler.retry_policies[kDefaultJobClass].max_attempts =
        ParsePositiveInt(*value, "FEEDBACKER_MAX_ATTEMPTS");
  }
}

void ValidateServiceConfig(const ServiceConfig &config) {
  if (config.bind_address.find(':') == std::string::npos) {
    throw std::invalid_argument("bind_address must be host:port, got '" +
                                config.bind_address + "'");
  }
  if (config.environment.empty()) {
    throw std::invalid_argument("environment cannot be empty");
  }
  if (config.database_url.empty()) {
    throw std::invalid_argument("database_url cannot be empty");
  }
  if (config.git_binary.empty()) {
    throw std::invalid_argument("git_binary cannot be empty");
  }
  ValidateSchedulerConfig(config.scheduler);
  // Catches duplicate names and empty commands.
  BuildAnalysisCatalog(config);
}

ServiceConfig
LoadServiceConfig(const std::optional<std::filesystem::path> &config_file,
                  const Environment &environment) {
  auto config = config_file ? ParseServiceConfigFile(*config_file)
                            : ServiceConfig{};
  ApplyEnvironment(environment, config);
  ValidateServiceConfig(config);
  return config;
}

Environment CurrentEnvironment() {
  Environment environment;
  for (char **entry = environ; entry != nullptr && *entry != nullptr;
       ++entry) {
    const std::string text(*entry);
    const auto separator = text.find('=');
    if (separator == std::string::npos) {
      continue;
    }
    environment.emplace(text.substr(0, separator), text.substr(separator + 1));
  }
  return environment;
}

LoggingConfig BuildLoggingConfig(const ServiceConfig &config) {
  LoggingConfig logging;
  if (config.log_level) {
    logging.level = *config.log_level;
  } else {
    logging.level = config.environment == "development" ? LogLevel::kDebug
                                                        : LogLevel::kInfo;
  }
  return logging;
}

AnalysisCatalog BuildAnalysisCatalog(const ServiceConfig &config) {
  auto catalog = MakeAnalysisCatalogWithDefaults();
  for (const auto &[name, definition] : config.analysis_steps) {
    catalog.Register(name, definition);
  }
  return catalog;
}

} // namespace feedbacker
