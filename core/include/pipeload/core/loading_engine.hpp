#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "pipeload/core/bundle_builder.hpp"
#include "pipeload/core/catalog.hpp"
#include "pipeload/core/compatibility.hpp"
#include "pipeload/core/container_assigner.hpp"
#include "pipeload/core/cross_section.hpp"
#include "pipeload/core/entities.hpp"
#include "pipeload/core/result.hpp"

namespace pipeload::core {

constexpr int kMaxNestingLevels = 10;

struct PlanSettings {
  double min_pipe_length_m = 6.0;
  double max_pipe_length_m = 18.0;
  // Containers loaded above (100 - margin)% of payload get an advisory.
  double weight_safety_margin_pct = 2.0;
  // Containers below this weight utilisation get a "space remaining" advisory.
  double underutilization_threshold_pct = 50.0;
  std::size_t max_total_pipes = 10000;
  bool record_placement_trace = true;
};

struct EngineSettings {
  ClearanceParams clearance{};
  NestingSettings nesting{};
  PackingSettings packing{};
  PlanSettings plan{};
};

struct OrderRequest {
  std::vector<OrderLine> lines{};
  double pipe_length_m = 12.0;
  bool enable_nesting = true;
  int max_nesting_levels = 4;
  ContainerTemplate container{};
};

[[nodiscard]] ValidationResult validate_settings(const EngineSettings& settings);

// Turns the assigner output into the caller-facing plan: statistics and advisory warnings.
[[nodiscard]] LoadingPlan assemble_plan(
    AssignmentResult assignment,
    const std::vector<std::string>& nesting_warnings,
    const OrderRequest& request,
    const PlanSettings& settings);

// Runs one optimisation per Optimize() call. Optimize() is const and keeps all
// working state local, so independent calls may run concurrently.
class LoadingEngine {
 public:
  LoadingEngine();
  explicit LoadingEngine(PipeCatalog catalog, EngineSettings settings = {});

  [[nodiscard]] ValidationResult ValidateRequest(const OrderRequest& request) const;
  [[nodiscard]] EngineResult<LoadingPlan> Optimize(const OrderRequest& request) const;
  // Empty request whose nesting flag and depth come from settings().nesting.
  [[nodiscard]] OrderRequest MakeRequest() const;

  EngineResult<bool> UpdateSettings(const EngineSettings& settings);

  [[nodiscard]] const EngineSettings& settings() const { return settings_; }
  [[nodiscard]] const PipeCatalog& catalog() const { return catalog_; }
  [[nodiscard]] PipeCatalog& catalog() { return catalog_; }

 private:
  [[nodiscard]] std::vector<InventoryEntry> make_inventory(const OrderRequest& request) const;

  PipeCatalog catalog_{};
  EngineSettings settings_{};
};

}  // namespace pipeload::core
