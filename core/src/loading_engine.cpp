#include "pipeload/core/loading_engine.hpp"

#include <cstdio>
#include <string>
#include <utility>

namespace pipeload::core {

namespace {

std::string format_number(const char* format, double value) {
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), format, value);
  return buffer;
}

}  // namespace

ValidationResult validate_settings(const EngineSettings& settings) {
  ValidationResult validation;
  const ClearanceParams& clearance = settings.clearance;
  if (clearance.ovality_factor < 0.0 || clearance.ovality_factor >= 1.0 || clearance.diameter_factor < 0.0 ||
      clearance.base_clearance_mm < 0.0) {
    validation.add_error("settings.invalid_clearance",
                         "clearance factors must be non-negative and ovality below 1.0");
  }
  if (settings.nesting.max_levels < 1 || settings.nesting.max_levels > kMaxNestingLevels) {
    validation.add_error("settings.invalid_max_levels",
                         "max nesting levels must be between 1 and " + std::to_string(kMaxNestingLevels));
  }
  if (!(settings.nesting.heavy_extraction_threshold_kg > 0.0)) {
    validation.add_error("settings.invalid_extraction_threshold", "heavy extraction threshold must be positive");
  }
  if (settings.packing.gap_mm < 0.0) {
    validation.add_error("settings.invalid_gap", "packing gap must not be negative");
  }
  const PlanSettings& plan = settings.plan;
  if (!(plan.min_pipe_length_m > 0.0) || plan.max_pipe_length_m < plan.min_pipe_length_m) {
    validation.add_error("settings.invalid_pipe_length_range", "pipe length range is empty or non-positive");
  }
  if (plan.weight_safety_margin_pct < 0.0 || plan.weight_safety_margin_pct > 100.0 ||
      plan.underutilization_threshold_pct < 0.0 || plan.underutilization_threshold_pct > 100.0) {
    validation.add_error("settings.invalid_percentage", "plan percentages must lie within 0..100");
  }
  if (plan.max_total_pipes == 0) {
    validation.add_error("settings.invalid_max_total_pipes", "max total pipes must be at least 1");
  }
  return validation;
}

LoadingEngine::LoadingEngine() : catalog_(make_default_catalog()) {}

LoadingEngine::LoadingEngine(PipeCatalog catalog, EngineSettings settings)
    : catalog_(std::move(catalog)), settings_(std::move(settings)) {}

ValidationResult LoadingEngine::ValidateRequest(const OrderRequest& request) const {
  ValidationResult validation;
  if (request.lines.empty()) {
    validation.add_error("order.empty", "order has no lines");
  }

  std::size_t total_pipes = 0;
  for (std::size_t i = 0; i < request.lines.size(); ++i) {
    const OrderLine& line = request.lines[i];
    const std::string label = "line " + std::to_string(i + 1);
    if (catalog_.Find(line.pipe_type_id) == nullptr) {
      validation.add_error("order_line.unknown_pipe_type",
                           label + ": unknown pipe type id " + std::to_string(line.pipe_type_id), line.pipe_type_id);
    }
    if (line.quantity <= 0) {
      validation.add_error("order_line.non_positive_quantity",
                           label + ": quantity must be at least 1 (got " + std::to_string(line.quantity) + ")",
                           line.pipe_type_id);
    } else {
      total_pipes += static_cast<std::size_t>(line.quantity);
    }
  }
  if (total_pipes > settings_.plan.max_total_pipes) {
    validation.add_error("order.too_large", "order holds " + std::to_string(total_pipes) + " pipes, limit is " +
                                                std::to_string(settings_.plan.max_total_pipes));
  }

  if (!(request.pipe_length_m > 0.0)) {
    validation.add_error("pipe_length.non_positive", "pipe length must be positive");
  } else if (request.pipe_length_m < settings_.plan.min_pipe_length_m ||
             request.pipe_length_m > settings_.plan.max_pipe_length_m) {
    validation.add_error("pipe_length.out_of_range",
                         "pipe length " + format_number("%.2f", request.pipe_length_m) + " m outside " +
                             format_number("%.1f", settings_.plan.min_pipe_length_m) + ".." +
                             format_number("%.1f", settings_.plan.max_pipe_length_m) + " m");
  }

  if (request.enable_nesting &&
      (request.max_nesting_levels < 1 || request.max_nesting_levels > kMaxNestingLevels)) {
    validation.add_error("settings.invalid_max_levels",
                         "max nesting levels must be between 1 and " + std::to_string(kMaxNestingLevels));
  }

  const ContainerTemplate& container = request.container;
  if (!(container.max_payload_kg > 0.0)) {
    validation.add_error("container.invalid_payload", "container payload must be positive");
  }
  if (!(container.internal_width_mm > 0.0) || !(container.internal_height_mm > 0.0) ||
      !(container.internal_length_mm > 0.0)) {
    validation.add_error("container.invalid_dimensions", "container dimensions must be positive");
  }

  validation.append(validate_settings(settings_));
  return validation;
}

std::vector<InventoryEntry> LoadingEngine::make_inventory(const OrderRequest& request) const {
  std::vector<InventoryEntry> inventory;
  inventory.reserve(request.lines.size());
  for (const OrderLine& line : request.lines) {
    if (const PipeType* pipe_type = catalog_.Find(line.pipe_type_id)) {
      inventory.push_back({*pipe_type, line.quantity});
    }
  }
  return inventory;
}

OrderRequest LoadingEngine::MakeRequest() const {
  OrderRequest request{};
  request.enable_nesting = settings_.nesting.enabled;
  request.max_nesting_levels = settings_.nesting.max_levels;
  return request;
}

EngineResult<LoadingPlan> LoadingEngine::Optimize(const OrderRequest& request) const {
  EngineResult<LoadingPlan> result;
  result.validation = ValidateRequest(request);
  if (result.validation.has_errors()) {
    result.error = result.validation.summary();
    return result;
  }

  NestingSettings nesting = settings_.nesting;
  nesting.enabled = request.enable_nesting;
  if (request.enable_nesting) {
    nesting.max_levels = request.max_nesting_levels;
  }

  BundleBuildResult built =
      build_bundles(make_inventory(request), request.pipe_length_m, nesting, settings_.clearance);
  AssignmentResult assignment = assign(std::move(built.bundles), request.container, settings_.packing,
                                       settings_.plan.record_placement_trace);

  result.value = assemble_plan(std::move(assignment), built.warnings, request, settings_.plan);
  result.ok = true;
  return result;
}

EngineResult<bool> LoadingEngine::UpdateSettings(const EngineSettings& settings) {
  EngineResult<bool> result;
  result.validation = validate_settings(settings);
  if (result.validation.has_errors()) {
    result.error = result.validation.summary();
    return result;
  }
  settings_ = settings;
  result.ok = true;
  result.value = true;
  return result;
}

}  // namespace pipeload::core
