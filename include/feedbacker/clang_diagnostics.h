#pragma once

#include <feedbacker/analysis_catalog.h>
#include <feedbacker/cancellation.h>
#include <feedbacker/logging.h>
#include <feedbacker/models.h>
#include <feedbacker/working_copy.h>

#include <vector>

namespace feedbacker {

// Parses every C/C++ translation unit of the working copy with libclang.
// Uses compile_commands.json from the root or build/ when present. The parse
// runs in a forked child that is killed when the deadline passes or the token
// is cancelled, so one slow translation unit cannot overrun the step.
std::vector<Finding> CollectClangDiagnostics(const WorkingCopy &working_copy,
                                             const ClangDiagnosticsStep &step,
                                             Deadline deadline,
                                             const CancellationToken &cancellation,
                                             Logger &logger);

} // namespace feedbacker
