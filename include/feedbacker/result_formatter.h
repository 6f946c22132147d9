#pragma once

#include <feedbacker/models.h>

#include <optional>
#include <string>

namespace feedbacker {

// Machine-readable job view: the job record and, when stored, its result.
std::string FormatJobJson(const Job &job,
                          const std::optional<PersistedResult> &result);

// One line per finding, `path:line:column: severity: message [rule]`,
// followed by a summary line.
std::string FormatJobText(const Job &job,
                          const std::optional<PersistedResult> &result);

} // namespace feedbacker
