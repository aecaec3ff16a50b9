#include "pipeload/core/plan_report.hpp"

#include <cstdio>
#include <sstream>

namespace pipeload::core {

namespace {

std::string fixed(double value, int precision) {
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.*f", precision, value);
  return buffer;
}

}  // namespace

const char* placement_outcome_label(PlacementOutcome outcome) {
  switch (outcome) {
  case PlacementOutcome::kAccepted:
    return "accepted";
  case PlacementOutcome::kRejectedWeight:
    return "rejected:weight";
  case PlacementOutcome::kRejectedWidth:
    return "rejected:width";
  case PlacementOutcome::kRejectedHeight:
    return "rejected:height";
  case PlacementOutcome::kOpenedContainer:
    return "opened";
  case PlacementOutcome::kInfeasible:
    return "infeasible";
  }
  return "unknown";
}

const char* infeasible_reason_label(InfeasibleReason reason) {
  switch (reason) {
  case InfeasibleReason::kWeight:
    return "weight";
  case InfeasibleReason::kWidth:
    return "width";
  case InfeasibleReason::kHeight:
    return "height";
  }
  return "unknown";
}

const char* plan_warning_label(PlanWarningKind kind) {
  switch (kind) {
  case PlanWarningKind::kHeavyExtraction:
    return "heavy-extraction";
  case PlanWarningKind::kNestingAdvisory:
    return "nesting";
  case PlanWarningKind::kOrderOverSingleContainer:
    return "capacity";
  case PlanWarningKind::kNearPayloadLimit:
    return "payload-limit";
  case PlanWarningKind::kSpaceRemaining:
    return "space";
  case PlanWarningKind::kUnplaceableBundle:
    return "unplaceable";
  }
  return "unknown";
}

std::string describe_chain(const Bundle& bundle) {
  std::string text;
  for (const PipeType& pipe : bundle.chain) {
    if (!text.empty()) {
      text += " > ";
    }
    text += pipe.code;
  }
  return text;
}

std::string format_plan_report(const LoadingPlan& plan, bool include_trace) {
  const PlanStats& stats = plan.stats;
  std::ostringstream oss;
  oss << "Loading plan\n";
  oss << "  container template: " << plan.container_template.name << " ("
      << fixed(plan.container_template.max_payload_kg, 0) << " kg, "
      << fixed(plan.container_template.internal_width_mm, 0) << " x "
      << fixed(plan.container_template.internal_height_mm, 0) << " mm)\n";
  oss << "  pipe length: " << fixed(plan.pipe_length_m, 2) << " m, nesting "
      << (plan.nesting_enabled ? "enabled" : "disabled") << "\n";
  oss << "  containers: " << stats.container_count << ", bundles: " << stats.bundle_count
      << ", pipes: " << stats.total_pipes << " (" << stats.nested_pipes << " nested)\n";
  oss << "  total weight: " << fixed(stats.total_weight_kg, 1) << " kg, loaded: "
      << fixed(stats.loaded_weight_kg, 1) << " kg\n";
  oss << "  nesting efficiency: " << fixed(stats.nesting_efficiency * 100.0, 1) << "%, bundles with nesting: "
      << stats.bundles_with_nesting << ", max depth: " << stats.max_depth_used << "\n";
  oss << "  average utilisation: weight " << fixed(stats.average_weight_utilization_pct, 1) << "%, area "
      << fixed(stats.average_area_utilization_pct, 1) << "%\n";

  for (const ContainerLoad& load : plan.containers) {
    oss << "\n" << load.display_id << " (truck " << load.number << ")\n";
    oss << "  weight: " << fixed(load.current_weight_kg, 1) << " kg (" << fixed(load.weight_utilization_pct, 1)
        << "%), remaining " << fixed(load.remaining_capacity_kg, 1) << " kg\n";
    oss << "  area: " << fixed(load.area_utilization_pct, 1) << "%, stack height "
        << fixed(load.used_height_mm, 1) << " mm, pipes " << load.pipe_count << " (" << load.nested_pipe_count
        << " nested)\n";
    for (const PlacedBundle& placed : load.bundles) {
      const Bundle& bundle = placed.bundle;
      oss << "    " << bundle.display_id << " row " << placed.row << " @ (" << fixed(placed.center.x, 1) << ", "
          << fixed(placed.center.y, 1) << ") " << fixed(bundle.total_weight_kg, 1) << " kg  "
          << describe_chain(bundle) << "\n";
    }
  }

  if (!plan.unplaceable.empty()) {
    oss << "\nUnplaceable bundles\n";
    for (const UnplaceableBundle& item : plan.unplaceable) {
      oss << "  " << item.bundle.display_id << " [" << infeasible_reason_label(item.reason) << "] "
          << describe_chain(item.bundle) << ": " << item.message << "\n";
    }
  }

  if (!plan.warnings.empty()) {
    oss << "\nWarnings\n";
    for (const PlanWarning& warning : plan.warnings) {
      oss << "  [" << plan_warning_label(warning.kind) << "] " << warning.message << "\n";
    }
  }

  if (include_trace && !plan.placement_trace.empty()) {
    oss << "\nPlacement trace\n";
    for (const PlacementTraceRecord& record : plan.placement_trace) {
      oss << "  bundle " << record.bundle_id << " truck " << record.container_number << " "
          << placement_outcome_label(record.outcome);
      if (!record.detail.empty()) {
        oss << " (" << record.detail << ")";
      }
      oss << "\n";
    }
  }
  return oss.str();
}

}  // namespace pipeload::core
