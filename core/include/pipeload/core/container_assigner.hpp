#pragma once

#include <optional>
#include <vector>

#include "pipeload/core/cross_section.hpp"
#include "pipeload/core/entities.hpp"

namespace pipeload::core {

// In-flight accumulator for one container. Owned by a single assign() call.
struct ContainerState {
  int number = 0;
  ContainerTemplate container{};
  double current_weight_kg = 0.0;
  CrossSectionState cross_section{};
  std::vector<PlacedBundle> bundles{};

  [[nodiscard]] Extent2d envelope() const { return {container.internal_width_mm, container.internal_height_mm}; }
};

struct AssignmentResult {
  std::vector<ContainerState> containers{};
  std::vector<UnplaceableBundle> unplaceable{};
  std::vector<PlacementTraceRecord> trace{};
};

// Reason a bundle can never be loaded into an empty container of this template.
[[nodiscard]] std::optional<InfeasibleReason> check_feasibility(const Bundle& bundle, const ContainerTemplate& container);

// First-Fit-Decreasing by total weight (host diameter breaks ties). Containers are
// scanned in opening order and never revisited once the run ends.
[[nodiscard]] AssignmentResult assign(
    std::vector<Bundle> bundles,
    const ContainerTemplate& container,
    const PackingSettings& packing = {},
    bool record_trace = false);

}  // namespace pipeload::core
