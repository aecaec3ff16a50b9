#include "pipeload/core/container_assigner.hpp"

#include <algorithm>
#include <cstdio>
#include <string>
#include <utility>

namespace pipeload::core {

namespace {

constexpr double kWeightEps = 1e-6;

std::string describe_weight(double current, double add, double limit) {
  char buffer[96];
  std::snprintf(buffer, sizeof(buffer), "%.1f + %.1f > %.1f kg", current, add, limit);
  return buffer;
}

std::string describe_rejection(PlacementRejection rejection, const CrossSectionState& state) {
  char buffer[96];
  if (rejection == PlacementRejection::kHeight) {
    std::snprintf(buffer, sizeof(buffer), "height exceeded at row %d", state.row_index + 1);
  } else {
    std::snprintf(buffer, sizeof(buffer), "width exceeded at row %d", state.row_index + 1);
  }
  return buffer;
}

PlacementOutcome outcome_for(PlacementRejection rejection) {
  return rejection == PlacementRejection::kHeight ? PlacementOutcome::kRejectedHeight
                                                  : PlacementOutcome::kRejectedWidth;
}

std::string infeasible_message(const Bundle& bundle, InfeasibleReason reason, const ContainerTemplate& container) {
  char buffer[192] = {};
  switch (reason) {
  case InfeasibleReason::kWeight:
    std::snprintf(buffer, sizeof(buffer), "bundle weighs %.1f kg, payload limit is %.1f kg", bundle.total_weight_kg,
                  container.max_payload_kg);
    break;
  case InfeasibleReason::kWidth:
    std::snprintf(buffer, sizeof(buffer), "footprint %.1f mm exceeds internal width %.1f mm",
                  bundle.footprint_diameter_mm(), container.internal_width_mm);
    break;
  case InfeasibleReason::kHeight:
    std::snprintf(buffer, sizeof(buffer), "footprint %.1f mm exceeds internal height %.1f mm",
                  bundle.footprint_diameter_mm(), container.internal_height_mm);
    break;
  }
  return buffer;
}

}  // namespace

std::optional<InfeasibleReason> check_feasibility(const Bundle& bundle, const ContainerTemplate& container) {
  if (bundle.total_weight_kg > container.max_payload_kg + kWeightEps) {
    return InfeasibleReason::kWeight;
  }
  const double d = bundle.footprint_diameter_mm();
  if (!fits_empty_envelope({container.internal_width_mm, container.internal_height_mm}, d)) {
    return d > container.internal_width_mm ? InfeasibleReason::kWidth : InfeasibleReason::kHeight;
  }
  return std::nullopt;
}

AssignmentResult assign(
    std::vector<Bundle> bundles,
    const ContainerTemplate& container,
    const PackingSettings& packing,
    bool record_trace) {
  AssignmentResult result{};
  auto trace = [&](const Bundle& bundle, int number, PlacementOutcome outcome, std::string detail) {
    if (record_trace) {
      result.trace.push_back({bundle.id, number, outcome, std::move(detail)});
    }
  };

  std::stable_sort(bundles.begin(), bundles.end(), [](const Bundle& a, const Bundle& b) {
    if (a.total_weight_kg != b.total_weight_kg) {
      return a.total_weight_kg > b.total_weight_kg;
    }
    return a.footprint_diameter_mm() > b.footprint_diameter_mm();
  });

  for (Bundle& bundle : bundles) {
    if (const auto reason = check_feasibility(bundle, container)) {
      std::string message = infeasible_message(bundle, *reason, container);
      trace(bundle, 0, PlacementOutcome::kInfeasible, message);
      result.unplaceable.push_back({std::move(bundle), *reason, std::move(message)});
      continue;
    }

    const double weight = bundle.total_weight_kg;
    const double diameter = bundle.footprint_diameter_mm();
    bool placed = false;
    for (ContainerState& state : result.containers) {
      if (state.current_weight_kg + weight > state.container.max_payload_kg + kWeightEps) {
        trace(bundle, state.number, PlacementOutcome::kRejectedWeight,
              describe_weight(state.current_weight_kg, weight, state.container.max_payload_kg));
        continue;
      }
      const PlacementResult placement = try_place(state.cross_section, state.envelope(), diameter, packing);
      if (!placement.accepted) {
        trace(bundle, state.number, outcome_for(placement.rejection),
              describe_rejection(placement.rejection, state.cross_section));
        continue;
      }
      state.current_weight_kg += weight;
      trace(bundle, state.number, PlacementOutcome::kAccepted, "row " + std::to_string(placement.row + 1));
      state.bundles.push_back({std::move(bundle), placement.center, placement.row});
      placed = true;
      break;
    }
    if (placed) {
      continue;
    }

    ContainerState fresh{};
    fresh.number = static_cast<int>(result.containers.size()) + 1;
    fresh.container = container;
    const PlacementResult placement = try_place(fresh.cross_section, fresh.envelope(), diameter, packing);
    if (!placement.accepted) {
      // Unreachable after check_feasibility; reported rather than retried so the loop always terminates.
      std::string message = describe_rejection(placement.rejection, fresh.cross_section);
      trace(bundle, 0, PlacementOutcome::kInfeasible, message);
      result.unplaceable.push_back({std::move(bundle),
                                    placement.rejection == PlacementRejection::kHeight ? InfeasibleReason::kHeight
                                                                                       : InfeasibleReason::kWidth,
                                    std::move(message)});
      continue;
    }
    fresh.current_weight_kg = weight;
    trace(bundle, fresh.number, PlacementOutcome::kOpenedContainer, "row 1");
    fresh.bundles.push_back({std::move(bundle), placement.center, placement.row});
    result.containers.push_back(std::move(fresh));
  }
  return result;
}

}  // namespace pipeload::core
