#pragma once

#include <string>

#include "pipeload/core/entities.hpp"

namespace pipeload::core {

[[nodiscard]] const char* placement_outcome_label(PlacementOutcome outcome);
[[nodiscard]] const char* infeasible_reason_label(InfeasibleReason reason);
[[nodiscard]] const char* plan_warning_label(PlanWarningKind kind);

// Chain rendered outer to inner, e.g. "TPE800/PN6 > TPE710/PN6 > TPE630/PN6".
[[nodiscard]] std::string describe_chain(const Bundle& bundle);

// Plain-text plan summary. Same plan, same text.
[[nodiscard]] std::string format_plan_report(const LoadingPlan& plan, bool include_trace = false);

}  // namespace pipeload::core
