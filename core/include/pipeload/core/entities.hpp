#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "pipeload/core/id.hpp"
#include "pipeload/core/types.hpp"

namespace pipeload::core {

// Catalog record. Immutable once it is in a PipeCatalog.
struct PipeType {
  PipeTypeId id = kInvalidObjectId;
  std::string code{};
  double outer_diameter_mm = 0.0;
  double inner_diameter_mm = 0.0;
  double wall_mm = 0.0;
  std::string pressure_class{};
  int sdr = 0;
  double weight_per_meter_kg = 0.0;
};

struct OrderLine {
  PipeTypeId pipe_type_id = kInvalidObjectId;
  int quantity = 0;
};

struct ContainerTemplate {
  std::string name{};
  double max_payload_kg = 24000.0;
  double internal_length_mm = 13600.0;
  double internal_width_mm = 2480.0;
  double internal_height_mm = 2700.0;
};

// One host pipe and its nested chain, stored flat from outermost to innermost.
// chain.front() is the host; depth 1 means a singleton.
struct Bundle {
  BundleId id = kInvalidObjectId;
  std::string display_id{};
  std::vector<PipeType> chain{};
  double pipe_length_m = 0.0;
  double total_weight_kg = 0.0;
  double inner_weight_kg = 0.0;
  bool extraction_warning = false;

  [[nodiscard]] const PipeType& host() const { return chain.front(); }
  [[nodiscard]] std::size_t depth() const { return chain.size(); }
  [[nodiscard]] bool is_singleton() const { return chain.size() == 1; }
  [[nodiscard]] double footprint_diameter_mm() const { return chain.front().outer_diameter_mm; }
};

enum class InfeasibleReason : std::uint8_t {
  kWeight = 0,
  kWidth = 1,
  kHeight = 2,
};

struct PlacedBundle {
  Bundle bundle{};
  Vec2d center{};
  int row = 0;
};

struct ContainerLoad {
  int number = 0;
  std::string display_id{};
  ContainerTemplate container{};
  std::vector<PlacedBundle> bundles{};
  double current_weight_kg = 0.0;
  double remaining_capacity_kg = 0.0;
  double weight_utilization_pct = 0.0;
  double area_utilization_pct = 0.0;
  double used_height_mm = 0.0;
  std::size_t pipe_count = 0;
  std::size_t nested_pipe_count = 0;
};

struct UnplaceableBundle {
  Bundle bundle{};
  InfeasibleReason reason = InfeasibleReason::kWeight;
  std::string message{};
};

enum class PlanWarningKind : std::uint8_t {
  kHeavyExtraction = 0,
  kNestingAdvisory = 1,
  kOrderOverSingleContainer = 2,
  kNearPayloadLimit = 3,
  kSpaceRemaining = 4,
  kUnplaceableBundle = 5,
};

struct PlanWarning {
  PlanWarningKind kind = PlanWarningKind::kNestingAdvisory;
  std::string message{};
  BundleId bundle_id = kInvalidObjectId;
  int container_number = 0;
};

enum class PlacementOutcome : std::uint8_t {
  kAccepted = 0,
  kRejectedWeight = 1,
  kRejectedWidth = 2,
  kRejectedHeight = 3,
  kOpenedContainer = 4,
  kInfeasible = 5,
};

// Session diagnostics for one placement attempt; not part of the plan semantics.
struct PlacementTraceRecord {
  BundleId bundle_id = kInvalidObjectId;
  int container_number = 0;
  PlacementOutcome outcome = PlacementOutcome::kAccepted;
  std::string detail{};
};

struct PlanStats {
  double total_weight_kg = 0.0;
  double loaded_weight_kg = 0.0;
  std::size_t container_count = 0;
  std::size_t bundle_count = 0;
  std::size_t total_pipes = 0;
  std::size_t nested_pipes = 0;
  std::size_t bundles_with_nesting = 0;
  std::size_t max_depth_used = 0;
  double nesting_efficiency = 0.0;
  double average_weight_utilization_pct = 0.0;
  double average_area_utilization_pct = 0.0;
  // Reference densities for reporting only; placement uses the row packer.
  double hexagonal_reference_density = 0.907;
  double square_reference_density = 0.785;
};

struct LoadingPlan {
  double pipe_length_m = 0.0;
  bool nesting_enabled = true;
  ContainerTemplate container_template{};
  std::vector<ContainerLoad> containers{};
  std::vector<UnplaceableBundle> unplaceable{};
  std::vector<PlanWarning> warnings{};
  std::vector<PlacementTraceRecord> placement_trace{};
  PlanStats stats{};

  [[nodiscard]] std::vector<std::string> warning_messages() const;
};

}  // namespace pipeload::core
