#pragma once

#include <map>
#include <string>
#include <variant>
#include <vector>

namespace feedbacker {

enum class OutputFormat { kGcc, kNone };

// Runs an external tool in the working copy. With kGcc, stdout and stderr
// lines shaped like `path:line[:col]: severity: message [rule]` become
// findings.
struct CommandStep {
  std::vector<std::string> command;
  OutputFormat format = OutputFormat::kGcc;
};

// Compiler diagnostics for the C and C++ sources of the working copy.
struct ClangDiagnosticsStep {
  std::vector<std::string> extra_arguments;
};

using StepDefinition = std::variant<CommandStep, ClangDiagnosticsStep>;

class AnalysisCatalog {
public:
  void Register(const std::string &name, StepDefinition definition);

  const StepDefinition &Find(const std::string &name) const;
  bool Contains(const std::string &name) const;
  std::vector<std::string> Names() const;
  bool empty() const { return steps_.empty(); }

private:
  std::map<std::string, StepDefinition> steps_;
};

// Steps available without configuration.
AnalysisCatalog MakeAnalysisCatalogWithDefaults();

bool ClangDiagnosticsAvailable();

OutputFormat ParseOutputFormat(const std::string &value);

} // namespace feedbacker
