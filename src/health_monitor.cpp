#include <feedbacker/health_monitor.h>

#include <feedbacker/escaping.h>
#include <feedbacker/job_error.h>

#include <sstream>
#include <stdexcept>
#include <utility>

namespace feedbacker {

HealthMonitor::HealthMonitor(std::shared_ptr<const JobScheduler> scheduler,
                             std::shared_ptr<ResultStore> store,
                             std::shared_ptr<Logger> logger)
    : scheduler_(std::move(scheduler)), store_(std::move(store)),
      logger_(EnsureLogger(std::move(logger))) {
  if (!scheduler_ || !store_) {
    throw std::invalid_argument("HealthMonitor needs a scheduler and a store");
  }
}

HealthReport HealthMonitor::Check() const {
  HealthReport report;

  const auto stats = scheduler_->Stats();
  ComponentHealth scheduler{"scheduler", stats.running, ""};
  if (!stats.running) {
    scheduler.detail = "stopped";
  } else if (!stats.accepting_work) {
    scheduler.detail = "saturated";
  } else {
    scheduler.detail = std::to_string(stats.busy_workers) + "/" +
                       std::to_string(stats.worker_count) + " workers busy";
  }

  ComponentHealth store{"store", true, "reachable"};
  try {
    store_->Ping();
  } catch (const JobError &error) {
    store.ok = false;
    store.detail = error.what();
    logger_->Log(LogLevel::kWarn, "health.store_unreachable",
                 {{"error", error.what()}});
  }

  report.accepting_work = stats.accepting_work && store.ok;
  if (!stats.running) {
    report.status = HealthStatus::kUnavailable;
  } else if (report.accepting_work) {
    report.status = HealthStatus::kHealthy;
  } else {
    report.status = HealthStatus::kDegraded;
  }
  report.components.push_back(std::move(scheduler));
  report.components.push_back(std::move(store));
  return report;
}

std::string ToString(HealthStatus status) {
  switch (status) {
  case HealthStatus::kHealthy:
    return "healthy";
  case HealthStatus::kDegraded:
    return "degraded";
  case HealthStatus::kUnavailable:
    return "unavailable";
  }
  return "unavailable";
}

std::string ToJson(const HealthReport &report) {
  std::ostringstream json;
  json << "{\"status\":\"" << ToString(report.status) << "\","
       << "\"accepting_work\":" << (report.accepting_work ? "true" : "false")
       << ",\"components\":[";
  for (std::size_t i = 0; i < report.components.size(); ++i) {
    const auto &component = report.components[i];
    if (i > 0) {
      json << ",";
    }
    json << "{\"name\":\"" << EscapeJson(component.name) << "\","
         << "\"ok\":" << (component.ok ? "true" : "false") << ","
         << "\"detail\":\"" << EscapeJson(component.detail) << "\"}";
  }
  json << "]}";
  return json.str();
}

} // namespace feedbacker
