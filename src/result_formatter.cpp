#include <feedbacker/result_formatter.h>

#include <feedbacker/escaping.h>

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace feedbacker {
namespace {

std::string Quote(const std::string &value) {
  return "\"" + EscapeJson(value) + "\"";
}

template <typename Collection, typename Formatter>
std::string Join(const Collection &items, const std::string &delimiter,
                 Formatter formatter) {
  std::ostringstream output;
  bool first = true;
  std::for_each(items.begin(), items.end(), [&](const auto &item) {
    if (!first) {
      output << delimiter;
    }
    output << formatter(item);
    first = false;
  });
  return output.str();
}

std::string FormatTimestamp(TimePoint time) {
  const auto seconds = Clock::to_time_t(time);
  std::tm utc{};
  gmtime_r(&seconds, &utc);
  std::ostringstream stream;
  stream << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
  return stream.str();
}

std::string OptionalTimestamp(const std::optional<TimePoint> &time) {
  return time.has_value() ? Quote(FormatTimestamp(*time)) : "null";
}

std::string FindingJson(const Finding &finding) {
  std::ostringstream json;
  json << "{\"severity\":" << Quote(ToString(finding.severity))
       << ",\"rule_id\":" << Quote(finding.rule_id)
       << ",\"message\":" << Quote(finding.message)
       << ",\"path\":" << Quote(finding.path) << ",\"line\":" << finding.line
       << ",\"column\":" << finding.column
       << ",\"step\":" << Quote(finding.step) << "}";
  return json.str();
}

std::string StepJson(const StepOutcome &step) {
  std::ostringstream json;
  json << "{\"name\":" << Quote(step.name)
       << ",\"exit_code\":" << step.exit_code
       << ",\"duration_ms\":" << step.duration.count() << "}";
  return json.str();
}

} // namespace

std::string FormatJobJson(const Job &job,
                          const std::optional<PersistedResult> &result) {
  std::ostringstream json;
  json << "{\"id\":" << Quote(job.id)
       << ",\"repository\":" << Quote(job.repository.url)
       << ",\"revision\":" << Quote(job.repository.revision)
       << ",\"analysis_set\":["
       << Join(job.analysis_set, ",",
               [](const std::string &step) { return Quote(step); })
       << "],\"job_class\":" << Quote(job.job_class)
       << ",\"state\":" << Quote(ToString(job.state))
       << ",\"attempt\":" << job.attempt
       << ",\"max_attempts\":" << job.max_attempts
       << ",\"created_at\":" << Quote(FormatTimestamp(job.created_at))
       << ",\"started_at\":" << OptionalTimestamp(job.started_at)
       << ",\"finished_at\":" << OptionalTimestamp(job.finished_at);
  if (job.last_error.has_value()) {
    json << ",\"error\":{\"kind\":" << Quote(ToString(job.last_error->kind))
         << ",\"message\":" << Quote(job.last_error->message) << "}";
  } else {
    json << ",\"error\":null";
  }
  if (result.has_value()) {
    json << ",\"result\":{\"attempt\":" << result->attempt
         << ",\"passed\":" << (result->result.passed ? "true" : "false")
         << ",\"stored_at\":" << Quote(FormatTimestamp(result->stored_at))
         << ",\"steps\":[" << Join(result->result.steps, ",", StepJson)
         << "],\"findings\":[" << Join(result->result.findings, ",", FindingJson)
         << "]}";
  } else {
    json << ",\"result\":null";
  }
  json << "}";
  return json.str();
}

std::string FormatJobText(const Job &job,
                          const std::optional<PersistedResult> &result) {
  std::ostringstream text;
  if (result.has_value()) {
    for (const auto &finding : result->result.findings) {
      text << finding.path << ":" << finding.line << ":" << finding.column
           << ": " << ToString(finding.severity) << ": " << finding.message
           << " [" << finding.rule_id << "]\n";
    }
  }
  text << "job " << job.id << " " << ToString(job.state) << " (attempt "
       << job.attempt << "/" << job.max_attempts << ")";
  if (job.last_error.has_value()) {
    text << ": " << ToString(job.last_error->kind) << ": "
         << job.last_error->message;
  }
  if (result.has_value()) {
    text << ", " << result->result.findings.size() << " findings, "
         << (result->result.passed ? "passed" : "not passed");
  }
  text << "\n";
  return text.str();
}

} // namespace feedbacker
