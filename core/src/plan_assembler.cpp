#include <algorithm>
#include <cstdio>
#include <string>
#include <utility>

#include "pipeload/core/loading_engine.hpp"

namespace pipeload::core {

namespace {

template <typename... Args>
std::string format_text(const char* format, Args... args) {
  char buffer[256];
  std::snprintf(buffer, sizeof(buffer), format, args...);
  return buffer;
}

ContainerLoad finalize_container(ContainerState state, DisplayIdSequencer& display_ids) {
  ContainerLoad load{};
  load.number = state.number;
  load.display_id = display_ids.next("T", 3);
  load.container = state.container;
  load.current_weight_kg = state.current_weight_kg;
  load.remaining_capacity_kg = state.container.max_payload_kg - state.current_weight_kg;
  load.weight_utilization_pct = state.current_weight_kg / state.container.max_payload_kg * 100.0;
  const double section_area = state.container.internal_width_mm * state.container.internal_height_mm;
  load.area_utilization_pct = section_area > 0.0 ? state.cross_section.occupied_area_mm2 / section_area * 100.0 : 0.0;
  load.used_height_mm = state.cross_section.used_height_mm;
  for (const PlacedBundle& placed : state.bundles) {
    load.pipe_count += placed.bundle.depth();
    load.nested_pipe_count += placed.bundle.depth() - 1;
  }
  load.bundles = std::move(state.bundles);
  return load;
}

void count_bundle(const Bundle& bundle, PlanStats& stats) {
  ++stats.bundle_count;
  stats.total_pipes += bundle.depth();
  stats.nested_pipes += bundle.depth() - 1;
  stats.total_weight_kg += bundle.total_weight_kg;
  if (!bundle.is_singleton()) {
    ++stats.bundles_with_nesting;
  }
  stats.max_depth_used = std::max(stats.max_depth_used, bundle.depth());
}

}  // namespace

LoadingPlan assemble_plan(
    AssignmentResult assignment,
    const std::vector<std::string>& nesting_warnings,
    const OrderRequest& request,
    const PlanSettings& settings) {
  LoadingPlan plan{};
  plan.pipe_length_m = request.pipe_length_m;
  plan.nesting_enabled = request.enable_nesting;
  plan.container_template = request.container;
  plan.unplaceable = std::move(assignment.unplaceable);
  plan.placement_trace = std::move(assignment.trace);

  DisplayIdSequencer display_ids;
  for (ContainerState& state : assignment.containers) {
    plan.containers.push_back(finalize_container(std::move(state), display_ids));
  }

  PlanStats& stats = plan.stats;
  stats.container_count = plan.containers.size();
  for (const ContainerLoad& load : plan.containers) {
    stats.loaded_weight_kg += load.current_weight_kg;
    stats.average_weight_utilization_pct += load.weight_utilization_pct;
    stats.average_area_utilization_pct += load.area_utilization_pct;
    for (const PlacedBundle& placed : load.bundles) {
      count_bundle(placed.bundle, stats);
    }
  }
  for (const UnplaceableBundle& item : plan.unplaceable) {
    count_bundle(item.bundle, stats);
  }
  if (!plan.containers.empty()) {
    stats.average_weight_utilization_pct /= static_cast<double>(plan.containers.size());
    stats.average_area_utilization_pct /= static_cast<double>(plan.containers.size());
  }
  stats.nesting_efficiency =
      stats.total_pipes > 0 ? static_cast<double>(stats.nested_pipes) / static_cast<double>(stats.total_pipes) : 0.0;

  for (const UnplaceableBundle& item : plan.unplaceable) {
    plan.warnings.push_back({PlanWarningKind::kUnplaceableBundle,
                             "Bundle " + item.bundle.display_id + " (" + item.bundle.host().code +
                                 ") cannot be placed in any container: " + item.message,
                             item.bundle.id, 0});
    if (item.bundle.extraction_warning) {
      plan.warnings.push_back(
          {PlanWarningKind::kHeavyExtraction,
           format_text("Unplaceable bundle %s (%s) holds %.0f kg of nested pipe - requires heavy extraction equipment",
                       item.bundle.display_id.c_str(), item.bundle.host().code.c_str(), item.bundle.inner_weight_kg),
           item.bundle.id, 0});
    }
  }

  const double payload = request.container.max_payload_kg;
  if (stats.total_weight_kg > payload) {
    plan.warnings.push_back({PlanWarningKind::kOrderOverSingleContainer,
                             format_text("Order exceeds single truck capacity by %.0f kg",
                                         stats.total_weight_kg - payload),
                             kInvalidObjectId, 0});
  }

  for (const ContainerLoad& load : plan.containers) {
    for (const PlacedBundle& placed : load.bundles) {
      const Bundle& bundle = placed.bundle;
      if (!bundle.extraction_warning) {
        continue;
      }
      plan.warnings.push_back(
          {PlanWarningKind::kHeavyExtraction,
           format_text("Truck %d: bundle %s (%s) holds %.0f kg of nested pipe - requires heavy extraction equipment",
                       load.number, bundle.display_id.c_str(), bundle.host().code.c_str(), bundle.inner_weight_kg),
           bundle.id, load.number});
    }
    if (load.weight_utilization_pct >= 100.0 - settings.weight_safety_margin_pct) {
      plan.warnings.push_back(
          {PlanWarningKind::kNearPayloadLimit,
           format_text("Truck %d loaded to %.1f%% of payload (within %.1f%% safety margin)", load.number,
                       load.weight_utilization_pct, settings.weight_safety_margin_pct),
           kInvalidObjectId, load.number});
    } else if (load.weight_utilization_pct < settings.underutilization_threshold_pct) {
      plan.warnings.push_back(
          {PlanWarningKind::kSpaceRemaining,
           format_text("Truck %d has %.0f kg payload remaining (%.1f%% used) - space for additional pipes",
                       load.number, load.remaining_capacity_kg, load.weight_utilization_pct),
           kInvalidObjectId, load.number});
    }
  }

  for (const std::string& message : nesting_warnings) {
    plan.warnings.push_back({PlanWarningKind::kNestingAdvisory, message, kInvalidObjectId, 0});
  }
  return plan;
}

}  // namespace pipeload::core
