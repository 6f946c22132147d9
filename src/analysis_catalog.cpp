#include <feedbacker/analysis_catalog.h>

#include <stdexcept>
#include <utility>

namespace {

constexpr const char kClangDiagnostics[] = "clang-diagnostics";

} // namespace

namespace feedbacker {

void AnalysisCatalog::Register(const std::string &name,
                               StepDefinition definition) {
  if (name.empty()) {
    throw std::invalid_argument("Analysis step name cannot be empty");
  }
  if (const auto *command = std::get_if<CommandStep>(&definition);
      command != nullptr && command->command.empty()) {
    throw std::invalid_argument("Analysis step '" + name +
                                "' needs a non-empty command");
  }
  if (steps_.count(name) != 0) {
    throw std::invalid_argument("Analysis step '" + name +
                                "' already registered");
  }
  steps_.emplace(name, std::move(definition));
}

const StepDefinition &AnalysisCatalog::Find(const std::string &name) const {
  const auto found = steps_.find(name);
  if (found == steps_.end()) {
    std::string registered;
    for (const auto &entry : steps_) {
      if (!registered.empty()) {
        registered += ", ";
      }
      registered += entry.first;
    }
    throw std::invalid_argument("Unknown analysis step '" + name +
                                "'. Registered: " + registered);
  }
  return found->second;
}

bool AnalysisCatalog::Contains(const std::string &name) const {
  return steps_.count(name) != 0;
}

std::vector<std::string> AnalysisCatalog::Names() const {
  std::vector<std::string> names;
  names.reserve(steps_.size());
  for (const auto &entry : steps_) {
    names.push_back(entry.first);
  }
  return names;
}

AnalysisCatalog MakeAnalysisCatalogWithDefaults() {
  AnalysisCatalog catalog;
  if (ClangDiagnosticsAvailable()) {
    catalog.Register(kClangDiagnostics, ClangDiagnosticsStep{});
  }
  return catalog;
}

bool ClangDiagnosticsAvailable() {
#ifdef FEEDBACKER_HAS_LIBCLANG
  return true;
#else
  return false;
#endif
}

OutputFormat ParseOutputFormat(const std::string &value) {
  if (value.empty() || value == "gcc") {
    return OutputFormat::kGcc;
  }
  if (value == "none") {
    return OutputFormat::kNone;
  }
  throw std::invalid_argument("Unsupported output format: " + value);
}

} // namespace feedbacker
