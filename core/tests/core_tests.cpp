#include <algorithm>
#include <cmath>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "pipeload/core/bundle_builder.hpp"
#include "pipeload/core/catalog.hpp"
#include "pipeload/core/compatibility.hpp"
#include "pipeload/core/container_assigner.hpp"
#include "pipeload/core/cross_section.hpp"
#include "pipeload/core/loading_engine.hpp"
#include "pipeload/core/order_import.hpp"
#include "pipeload/core/plan_report.hpp"
#include "pipeload/core/settings_file.hpp"

namespace {

using pipeload::core::Bundle;
using pipeload::core::ContainerLoad;
using pipeload::core::ContainerTemplate;
using pipeload::core::CrossSectionState;
using pipeload::core::Extent2d;
using pipeload::core::InventoryEntry;
using pipeload::core::LoadingEngine;
using pipeload::core::LoadingPlan;
using pipeload::core::OrderRequest;
using pipeload::core::PipeCatalog;
using pipeload::core::PipeType;
using pipeload::core::PipeTypeId;
using pipeload::core::PlacedBundle;
using pipeload::core::PlacementOutcome;
using pipeload::core::PlanWarningKind;

struct TestCase {
  const char* name;
  const char* intent;
  std::function<bool(void)> run;
};

bool almost_equal(double a, double b, double eps = 1e-9) {
  return std::abs(a - b) <= eps;
}

bool starts_with(const std::string& value, const std::string& prefix) {
  return value.rfind(prefix, 0) == 0;
}

bool contains_text(const std::string& value, const std::string& needle) {
  return value.find(needle) != std::string::npos;
}

bool has_issue_code(const pipeload::core::ValidationResult& validation, const std::string& code) {
  for (const auto& issue : validation.issues) {
    if (issue.code == code) {
      return true;
    }
  }
  return false;
}

bool has_warning_kind(const LoadingPlan& plan, PlanWarningKind kind) {
  for (const auto& warning : plan.warnings) {
    if (warning.kind == kind) {
      return true;
    }
  }
  return false;
}

PipeType make_pipe(
    PipeTypeId id,
    const char* code,
    double outer_mm,
    double inner_mm,
    double weight_per_meter_kg,
    int sdr = 26,
    const char* pressure_class = "PN6") {
  PipeType pipe{};
  pipe.id = id;
  pipe.code = code;
  pipe.outer_diameter_mm = outer_mm;
  pipe.inner_diameter_mm = inner_mm;
  pipe.wall_mm = (outer_mm - inner_mm) * 0.5;
  pipe.pressure_class = pressure_class;
  pipe.sdr = sdr;
  pipe.weight_per_meter_kg = weight_per_meter_kg;
  return pipe;
}

const PipeType& catalog_pipe(const PipeCatalog& catalog, const char* code) {
  static const PipeType kMissing{};
  const PipeType* pipe = catalog.FindByCode(code);
  return pipe != nullptr ? *pipe : kMissing;
}

ContainerTemplate standard_truck() {
  return pipeload::core::default_container_templates().front();
}

std::size_t plan_pipe_count(const LoadingPlan& plan) {
  std::size_t count = 0;
  for (const ContainerLoad& load : plan.containers) {
    for (const PlacedBundle& placed : load.bundles) {
      count += placed.bundle.depth();
    }
  }
  for (const auto& item : plan.unplaceable) {
    count += item.bundle.depth();
  }
  return count;
}

// Intent: a 315 mm guest clears a DN400 SDR26 host with the documented gap arithmetic.
bool test_clearance_accepts_documented_fit() {
  const PipeCatalog catalog = pipeload::core::make_default_catalog();
  const PipeType& host = catalog_pipe(catalog, "TPE400/PN6");
  const PipeType guest = make_pipe(900, "G315", 315.0, 290.8, 11.71);
  const auto report = pipeload::core::evaluate_clearance(host, guest);
  return report.compatible &&
         almost_equal(report.effective_inner_diameter_mm, 354.624, 1e-6) &&
         almost_equal(report.required_gap_mm, 21.0, 1e-9) &&
         almost_equal(report.available_gap_mm, 39.624, 1e-6) &&
         report.message == "Valid: 39.6mm gap >= 21.0mm required" &&
         pipeload::core::is_compatible(host, guest);
}

// Intent: a 355 mm guest is rejected by ovality even though the nominal bore is larger.
bool test_clearance_rejects_near_fit() {
  const PipeCatalog catalog = pipeload::core::make_default_catalog();
  const PipeType& host = catalog_pipe(catalog, "TPE400/PN6");
  const PipeType guest = make_pipe(901, "G355", 355.0, 327.8, 14.79);
  const auto report = pipeload::core::evaluate_clearance(host, guest);
  return host.inner_diameter_mm > guest.outer_diameter_mm &&
         !report.compatible &&
         !pipeload::core::is_compatible(host, guest) &&
         starts_with(report.message, "Invalid:") &&
         contains_text(report.message, "deficit");
}

// Intent: compatibility only ever admits strictly smaller guests and agrees with the report.
bool test_compatibility_is_antisymmetric_over_catalog() {
  const PipeCatalog catalog = pipeload::core::make_default_catalog();
  for (const PipeType& a : catalog.items()) {
    if (pipeload::core::is_compatible(a, a)) {
      return false;
    }
    for (const PipeType& b : catalog.items()) {
      const bool compatible = pipeload::core::is_compatible(a, b);
      if (compatible && !(b.outer_diameter_mm < a.outer_diameter_mm)) {
        return false;
      }
      if (compatible && pipeload::core::is_compatible(b, a)) {
        return false;
      }
      if (compatible != pipeload::core::evaluate_clearance(a, b).compatible) {
        return false;
      }
    }
  }
  return true;
}

// Intent: default catalog carries the full HDPE table and resolves codes and DN/PN pairs.
bool test_default_catalog_lookup() {
  const PipeCatalog catalog = pipeload::core::make_default_catalog();
  const PipeType* by_code = catalog.FindByCode("TPE400/PN6");
  const PipeType* by_dn = catalog.FindByDiameter(800.0, "PN16");
  if (catalog.size() != 104 || by_code == nullptr || by_dn == nullptr) {
    return false;
  }
  if (catalog.Find(by_code->id) != by_code || catalog.FindByCode("TPE999/PN6") != nullptr) {
    return false;
  }
  std::vector<PipeTypeId> ids;
  for (const PipeType& pipe : catalog.items()) {
    ids.push_back(pipe.id);
  }
  std::sort(ids.begin(), ids.end());
  return almost_equal(by_code->inner_diameter_mm, 369.4) && by_code->sdr == 26 &&
         almost_equal(by_dn->weight_per_meter_kg, 168.7) && by_dn->code == "TPE800/PN16" &&
         std::adjacent_find(ids.begin(), ids.end()) == ids.end();
}

// Intent: AddPipeType rejects duplicate codes and impossible geometry without changing the catalog.
bool test_catalog_rejects_invalid_records() {
  PipeCatalog catalog = pipeload::core::make_default_catalog();
  const auto duplicate = catalog.AddPipeType(make_pipe(0, "TPE400/PN6", 400.0, 369.4, 18.8));
  const auto inverted = catalog.AddPipeType(make_pipe(0, "BAD", 300.0, 320.0, 10.0));
  const auto weightless = catalog.AddPipeType(make_pipe(0, "AIR", 300.0, 280.0, 0.0));
  const auto added = catalog.AddPipeType(make_pipe(0, "TPE900/PN6", 900.0, 831.2, 95.2));
  return !duplicate.ok && has_issue_code(duplicate.validation, "pipe_type.duplicate_code") &&
         !inverted.ok && has_issue_code(inverted.validation, "pipe_type.invalid_diameters") &&
         !weightless.ok && has_issue_code(weightless.validation, "pipe_type.invalid_weight") &&
         added.ok && catalog.size() == 105 && catalog.Find(added.value) != nullptr &&
         catalog.Find(added.value)->code == "TPE900/PN6";
}

// Intent: bundle weights equal the per-node sum and inner weight excludes the host.
bool test_bundle_weights_sum_over_chain() {
  const PipeCatalog catalog = pipeload::core::make_default_catalog();
  std::vector<InventoryEntry> inventory;
  for (const char* code : {"TPE800/PN6", "TPE630/PN6", "TPE500/PN6", "TPE400/PN6", "TPE315/PN6", "TPE250/PN6"}) {
    inventory.push_back({catalog_pipe(catalog, code), 3});
  }
  const double length = 12.0;
  const auto built = pipeload::core::build_bundles(inventory, length);
  if (built.bundles.empty() || built.total_pipes != 18) {
    return false;
  }
  for (const Bundle& bundle : built.bundles) {
    double total = 0.0;
    for (const PipeType& pipe : bundle.chain) {
      total += pipe.weight_per_meter_kg * length;
    }
    if (!almost_equal(bundle.total_weight_kg, total, 1e-6) ||
        !almost_equal(bundle.inner_weight_kg, total - bundle.host().weight_per_meter_kg * length, 1e-6)) {
      return false;
    }
  }
  return true;
}

// Intent: nesting stops at max_levels even while compatible guests remain.
bool test_bundle_depth_capped_by_max_levels() {
  const PipeCatalog catalog = pipeload::core::make_default_catalog();
  std::vector<InventoryEntry> inventory;
  for (const char* code : {"TPE800/PN6", "TPE630/PN6", "TPE500/PN6", "TPE400/PN6", "TPE315/PN6", "TPE250/PN6"}) {
    inventory.push_back({catalog_pipe(catalog, code), 2});
  }
  pipeload::core::NestingSettings settings{};
  settings.max_levels = 3;
  const auto built = pipeload::core::build_bundles(inventory, 12.0, settings);
  if (built.bundles.size() != 4 || built.nested_pipes != 8) {
    return false;
  }
  for (const Bundle& bundle : built.bundles) {
    if (bundle.depth() != 3) {
      return false;
    }
  }
  const Bundle& first = built.bundles.front();
  const Bundle& last = built.bundles.back();
  return first.display_id == "B-0001" && first.chain[0].code == "TPE800/PN6" &&
         first.chain[1].code == "TPE630/PN6" && first.chain[2].code == "TPE500/PN6" &&
         last.chain[0].code == "TPE400/PN6" && last.chain[1].code == "TPE315/PN6" &&
         last.chain[2].code == "TPE250/PN6";
}

// Intent: equal-diameter guests go to the host's SDR when preferred, and input order otherwise.
bool test_guest_tie_break_prefers_host_sdr() {
  const PipeCatalog catalog = pipeload::core::make_default_catalog();
  const std::vector<InventoryEntry> inventory = {
      {catalog_pipe(catalog, "TPE800/PN6"), 1},
      {catalog_pipe(catalog, "TPE630/PN16"), 1},
      {catalog_pipe(catalog, "TPE630/PN6"), 1},
  };
  pipeload::core::NestingSettings preferred{};
  const auto with_preference = pipeload::core::build_bundles(inventory, 12.0, preferred);
  pipeload::core::NestingSettings indifferent{};
  indifferent.prefer_same_sdr = false;
  const auto without_preference = pipeload::core::build_bundles(inventory, 12.0, indifferent);
  return with_preference.bundles.size() == 2 && with_preference.bundles[0].depth() == 2 &&
         with_preference.bundles[0].chain[1].code == "TPE630/PN6" &&
         with_preference.bundles[1].chain[0].code == "TPE630/PN16" &&
         without_preference.bundles.size() == 2 &&
         without_preference.bundles[0].chain[1].code == "TPE630/PN16";
}

// Intent: allow_mixed_sdr=false keeps other SDR classes out of a host entirely.
bool test_mixed_sdr_can_be_disallowed() {
  const PipeCatalog catalog = pipeload::core::make_default_catalog();
  const std::vector<InventoryEntry> inventory = {
      {catalog_pipe(catalog, "TPE800/PN6"), 2},
      {catalog_pipe(catalog, "TPE630/PN16"), 2},
  };
  pipeload::core::NestingSettings strict{};
  strict.allow_mixed_sdr = false;
  const auto separated = pipeload::core::build_bundles(inventory, 12.0, strict);
  const auto mixed = pipeload::core::build_bundles(inventory, 12.0);
  if (separated.bundles.size() != 4 || separated.nested_pipes != 0 || !separated.warnings.empty()) {
    return false;
  }
  // Heavier SDR11 guest inside a thinner SDR26 host raises one deduplicated advisory.
  return mixed.bundles.size() == 2 && mixed.nested_pipes == 2 && mixed.warnings.size() == 1 &&
         mixed.warnings[0] ==
             "Caution: heavier pipe TPE630/PN16 (SDR11) inside lighter pipe TPE800/PN6 (SDR26) may deform the outer pipe";
}

// Intent: a disabled nesting flag turns every pipe into a singleton.
bool test_nesting_disabled_yields_singletons() {
  const PipeCatalog catalog = pipeload::core::make_default_catalog();
  const std::vector<InventoryEntry> inventory = {
      {catalog_pipe(catalog, "TPE800/PN6"), 2},
      {catalog_pipe(catalog, "TPE500/PN6"), 2},
      {catalog_pipe(catalog, "TPE250/PN6"), 2},
  };
  pipeload::core::NestingSettings settings{};
  settings.enabled = false;
  const auto built = pipeload::core::build_bundles(inventory, 12.0, settings);
  if (built.bundles.size() != 6 || built.nested_pipes != 0) {
    return false;
  }
  for (const Bundle& bundle : built.bundles) {
    if (!bundle.is_singleton() || !almost_equal(bundle.inner_weight_kg, 0.0)) {
      return false;
    }
  }
  return true;
}

class SmallestGuestSelector final : public pipeload::core::GuestSelector {
 public:
  [[nodiscard]] std::optional<std::size_t> Select(
      const PipeType&,
      const std::vector<pipeload::core::GuestCandidate>& candidates,
      const pipeload::core::NestingSettings&) const override {
    if (candidates.empty()) {
      return std::nullopt;
    }
    return candidates.size() - 1;
  }
};

class NoGuestSelector final : public pipeload::core::GuestSelector {
 public:
  [[nodiscard]] std::optional<std::size_t> Select(
      const PipeType&,
      const std::vector<pipeload::core::GuestCandidate>&,
      const pipeload::core::NestingSettings&) const override {
    return std::nullopt;
  }
};

// Intent: a substituted guest selector changes the choice without touching the rest of the build.
bool test_custom_guest_selector() {
  const PipeCatalog catalog = pipeload::core::make_default_catalog();
  const std::vector<InventoryEntry> inventory = {
      {catalog_pipe(catalog, "TPE800/PN6"), 1},
      {catalog_pipe(catalog, "TPE630/PN6"), 1},
      {catalog_pipe(catalog, "TPE400/PN6"), 1},
  };
  pipeload::core::NestingSettings settings{};
  settings.max_levels = 2;
  const SmallestGuestSelector smallest;
  const NoGuestSelector none;
  const auto picked = pipeload::core::build_bundles(inventory, 12.0, settings, {}, &smallest);
  const auto refused = pipeload::core::build_bundles(inventory, 12.0, settings, {}, &none);
  return picked.bundles.size() == 2 && picked.bundles[0].chain.size() == 2 &&
         picked.bundles[0].chain[1].code == "TPE400/PN6" && picked.bundles[1].is_singleton() &&
         picked.bundles[1].host().code == "TPE630/PN6" && refused.bundles.size() == 3 && refused.nested_pipes == 0;
}

// Intent: extraction warning trips strictly above 2000 kg of nested weight.
bool test_extraction_warning_threshold() {
  const PipeType host = make_pipe(1, "H800", 800.0, 738.8, 75.19);
  const PipeType heavy_guest = make_pipe(2, "G500H", 500.0, 461.8, 220.0);
  const PipeType light_guest = make_pipe(3, "G500L", 500.0, 461.8, 180.0);
  const PipeType edge_guest = make_pipe(4, "G500E", 500.0, 461.8, 200.0);
  const Bundle heavy = pipeload::core::make_bundle(1, {host, heavy_guest}, 10.0, 2000.0);
  const Bundle light = pipeload::core::make_bundle(2, {host, light_guest}, 10.0, 2000.0);
  const Bundle edge = pipeload::core::make_bundle(3, {host, edge_guest}, 10.0, 2000.0);
  return almost_equal(heavy.inner_weight_kg, 2200.0, 1e-6) && heavy.extraction_warning &&
         almost_equal(light.inner_weight_kg, 1800.0, 1e-6) && !light.extraction_warning &&
         !edge.extraction_warning;
}

// Intent: the assembled plan reports heavy extraction per truck alongside the weight-ratio advisory.
bool test_plan_reports_heavy_extraction() {
  PipeCatalog catalog;
  const PipeTypeId host = catalog.AddPipeType(make_pipe(0, "HOST800", 800.0, 738.8, 75.19)).value;
  const PipeTypeId guest = catalog.AddPipeType(make_pipe(0, "GUEST500", 500.0, 461.8, 220.0)).value;
  const LoadingEngine engine(std::move(catalog));
  OrderRequest request{};
  request.lines = {{host, 1}, {guest, 1}};
  request.pipe_length_m = 10.0;
  request.container = standard_truck();
  const auto result = engine.Optimize(request);
  if (!result.ok || result.value.containers.size() != 1) {
    return false;
  }
  const LoadingPlan& plan = result.value;
  const Bundle& bundle = plan.containers[0].bundles[0].bundle;
  bool extraction_found = false;
  bool ratio_found = false;
  for (const auto& warning : plan.warnings) {
    if (warning.kind == PlanWarningKind::kHeavyExtraction) {
      extraction_found = starts_with(warning.message, "Truck 1: bundle B-0001 (HOST800)") &&
                         warning.container_number == 1 && warning.bundle_id == bundle.id;
    }
    if (warning.kind == PlanWarningKind::kNestingAdvisory) {
      ratio_found = starts_with(warning.message, "Inner pipe GUEST500 (220.0 kg/m) is more than 2.0x heavier");
    }
  }
  return bundle.extraction_warning && bundle.depth() == 2 && extraction_found && ratio_found &&
         has_warning_kind(plan, PlanWarningKind::kSpaceRemaining);
}

// Intent: the third 900 mm bundle wraps into an offset hexagonal row instead of being rejected.
bool test_row_overflow_starts_offset_row() {
  CrossSectionState state{};
  const Extent2d envelope{2480.0, 2700.0};
  const auto first = pipeload::core::try_place(state, envelope, 900.0);
  const auto second = pipeload::core::try_place(state, envelope, 900.0);
  const auto third = pipeload::core::try_place(state, envelope, 900.0);
  const double row_pitch = 900.0 * std::sqrt(3.0) / 2.0;
  return first.accepted && second.accepted && third.accepted &&
         almost_equal(first.center.x, 450.0) && almost_equal(first.center.y, 450.0) &&
         almost_equal(second.center.x, 1370.0) && second.row == 0 &&
         third.row == 1 && almost_equal(third.center.x, 900.0) &&
         almost_equal(third.center.y, row_pitch + 450.0, 1e-6) &&
         state.offset_row && state.row_index == 1 && state.placed_count == 3 &&
         almost_equal(state.used_height_mm, row_pitch + 900.0, 1e-6);
}

// Intent: width and height rejections leave the packer state untouched.
bool test_packer_rejects_without_mutating_state() {
  CrossSectionState state{};
  const Extent2d low{2480.0, 1000.0};
  if (!pipeload::core::try_place(state, low, 900.0).accepted || !pipeload::core::try_place(state, low, 900.0).accepted) {
    return false;
  }
  const CrossSectionState before = state;
  const auto too_wide = pipeload::core::try_place(state, low, 2500.0);
  const auto too_high = pipeload::core::try_place(state, low, 900.0);
  const auto zero = pipeload::core::try_place(state, low, 0.0);
  CrossSectionState empty{};
  const auto wide_on_empty = pipeload::core::try_place(empty, low, 2500.0);
  return !too_wide.accepted && too_wide.rejection == pipeload::core::PlacementRejection::kWidth &&
         !too_high.accepted && too_high.rejection == pipeload::core::PlacementRejection::kHeight &&
         !zero.accepted && !wide_on_empty.accepted && empty.row_index == 0 && empty.placed_count == 0 &&
         almost_equal(state.cursor_z_mm, before.cursor_z_mm) && state.row_index == before.row_index &&
         state.offset_row == before.offset_row && state.placed_count == before.placed_count &&
         almost_equal(state.row_base_y_mm, before.row_base_y_mm);
}

// Intent: ten 2193.1 kg pipes fill one truck by weight and the eleventh opens a second one.
bool test_weight_split_across_containers() {
  PipeCatalog catalog;
  const PipeTypeId heavy = catalog.AddPipeType(make_pipe(0, "HEAVY400", 400.0, 300.0, 168.7, 11, "PN16")).value;
  const LoadingEngine engine(std::move(catalog));
  OrderRequest request{};
  request.lines = {{heavy, 11}};
  request.pipe_length_m = 13.0;
  request.container = standard_truck();
  const auto result = engine.Optimize(request);
  if (!result.ok || result.value.containers.size() != 2) {
    return false;
  }
  const LoadingPlan& plan = result.value;
  const ContainerLoad& first = plan.containers[0];
  const ContainerLoad& second = plan.containers[1];
  const auto& trace = plan.placement_trace;
  const double area_pct = 10.0 * pipeload::core::circle_area(400.0) / (2480.0 * 2700.0) * 100.0;
  return first.bundles.size() == 10 && almost_equal(first.current_weight_kg, 21931.0, 1e-6) &&
         second.bundles.size() == 1 && almost_equal(second.current_weight_kg, 2193.1, 1e-6) &&
         first.display_id == "T-001" && second.display_id == "T-002" &&
         almost_equal(first.area_utilization_pct, area_pct, 1e-9) &&
         almost_equal(first.remaining_capacity_kg, 2069.0, 1e-6) &&
         trace.size() == 12 && trace[10].outcome == PlacementOutcome::kRejectedWeight &&
         trace[10].container_number == 1 && trace[11].outcome == PlacementOutcome::kOpenedContainer &&
         trace[11].container_number == 2 &&
         almost_equal(plan.stats.total_weight_kg, 24124.1, 1e-6) &&
         has_warning_kind(plan, PlanWarningKind::kOrderOverSingleContainer) &&
         has_warning_kind(plan, PlanWarningKind::kSpaceRemaining);
}

// Intent: cross-section overflow alone opens a new container well under the payload.
bool test_footprint_overflow_opens_container() {
  const LoadingEngine engine;
  OrderRequest request{};
  request.lines = {{engine.catalog().FindByCode("TPE800/PN6")->id, 9}};
  request.container = standard_truck();
  const auto result = engine.Optimize(request);
  if (!result.ok || result.value.containers.size() != 2) {
    return false;
  }
  const LoadingPlan& plan = result.value;
  int max_row = 0;
  for (const PlacedBundle& placed : plan.containers[0].bundles) {
    max_row = std::max(max_row, placed.row);
  }
  bool height_rejection = false;
  for (const auto& record : plan.placement_trace) {
    height_rejection = height_rejection ||
                       (record.outcome == PlacementOutcome::kRejectedHeight && record.container_number == 1);
  }
  return plan.containers[0].bundles.size() == 8 && plan.containers[1].bundles.size() == 1 && max_row == 2 &&
         plan.containers[0].current_weight_kg < 24000.0 && height_rejection;
}

// Intent: a container loaded to its payload is flagged as being inside the safety margin.
bool test_near_payload_limit_warning() {
  PipeCatalog catalog;
  const PipeTypeId pipe = catalog.AddPipeType(make_pipe(0, "P400", 400.0, 300.0, 200.0)).value;
  const LoadingEngine engine(std::move(catalog));
  OrderRequest request{};
  request.lines = {{pipe, 10}};
  request.container = standard_truck();
  const auto result = engine.Optimize(request);
  return result.ok && result.value.containers.size() == 1 &&
         almost_equal(result.value.containers[0].weight_utilization_pct, 100.0, 1e-9) &&
         has_warning_kind(result.value, PlanWarningKind::kNearPayloadLimit) &&
         !has_warning_kind(result.value, PlanWarningKind::kOrderOverSingleContainer);
}

// Intent: bundles that can never fit are reported with their reason instead of looping.
bool test_infeasible_bundles_are_reported() {
  const PipeType wide = make_pipe(1, "W800", 800.0, 738.8, 75.19);
  const PipeType small = make_pipe(2, "S500", 500.0, 461.8, 29.34);
  ContainerTemplate narrow{};
  narrow.internal_width_mm = 700.0;
  auto by_width = pipeload::core::assign(
      {pipeload::core::make_bundle(1, {wide}, 12.0, 2000.0), pipeload::core::make_bundle(2, {small}, 12.0, 2000.0)},
      narrow);
  ContainerTemplate flat{};
  flat.internal_height_mm = 600.0;
  const auto by_height = pipeload::core::check_feasibility(pipeload::core::make_bundle(3, {wide}, 12.0, 2000.0), flat);

  PipeCatalog catalog;
  const PipeTypeId heavy = catalog.AddPipeType(make_pipe(0, "HEAVY400", 400.0, 300.0, 168.7)).value;
  const LoadingEngine engine(std::move(catalog));
  OrderRequest request{};
  request.lines = {{heavy, 2}};
  request.pipe_length_m = 18.0;
  request.container = standard_truck();
  request.container.max_payload_kg = 3000.0;
  const auto result = engine.Optimize(request);

  return by_width.unplaceable.size() == 1 &&
         by_width.unplaceable[0].reason == pipeload::core::InfeasibleReason::kWidth &&
         by_width.containers.size() == 1 && by_width.containers[0].bundles.size() == 1 &&
         by_height.has_value() && *by_height == pipeload::core::InfeasibleReason::kHeight &&
         result.ok && result.value.containers.empty() && result.value.unplaceable.size() == 2 &&
         result.value.unplaceable[0].reason == pipeload::core::InfeasibleReason::kWeight &&
         has_warning_kind(result.value, PlanWarningKind::kUnplaceableBundle) &&
         plan_pipe_count(result.value) == 2;
}

// Intent: equal-weight bundles are loaded larger host first, regardless of input order.
bool test_assigner_weight_tie_break() {
  const PipeType small = make_pipe(1, "A200", 200.0, 180.0, 10.0);
  const PipeType large = make_pipe(2, "B400", 400.0, 360.0, 10.0);
  const auto result = pipeload::core::assign(
      {pipeload::core::make_bundle(1, {small}, 12.0, 2000.0), pipeload::core::make_bundle(2, {large}, 12.0, 2000.0)},
      standard_truck());
  return result.containers.size() == 1 && result.containers[0].bundles.size() == 2 &&
         result.containers[0].bundles[0].bundle.id == 2 && result.containers[0].bundles[1].bundle.id == 1;
}

// Intent: a light bundle goes back to the first truck once a heavy one has opened a second.
bool test_assigner_first_fit_backfill() {
  const PipeType light = make_pipe(1, "L400", 400.0, 360.0, 100.0);
  const PipeType heavy = make_pipe(2, "H400", 400.0, 360.0, 2000.0);
  const auto result = pipeload::core::assign(
      {pipeload::core::make_bundle(1, {light}, 10.0, 2000.0), pipeload::core::make_bundle(2, {heavy}, 10.0, 2000.0),
       pipeload::core::make_bundle(3, {heavy}, 10.0, 2000.0)},
      standard_truck());
  if (result.containers.size() != 2) {
    return false;
  }
  const auto& first = result.containers[0];
  const auto& second = result.containers[1];
  return first.bundles.size() == 2 && first.bundles[0].bundle.id == 2 && first.bundles[1].bundle.id == 1 &&
         almost_equal(first.current_weight_kg, 21000.0, 1e-6) && second.bundles.size() == 1 &&
         second.bundles[0].bundle.id == 3 && result.unplaceable.empty();
}

// Intent: an unplaceable bundle that needs heavy extraction still gets the extraction advisory.
bool test_unplaceable_bundle_keeps_extraction_warning() {
  const PipeType host = make_pipe(1, "H2600", 2600.0, 2400.0, 10.0);
  const PipeType guest = make_pipe(2, "G2000", 2000.0, 1900.0, 200.0);
  const Bundle bundle = pipeload::core::make_bundle(7, {host, guest}, 12.0, 2000.0);
  OrderRequest request{};
  request.container = standard_truck();
  auto assignment = pipeload::core::assign({bundle}, request.container);
  const LoadingPlan plan = pipeload::core::assemble_plan(std::move(assignment), {}, request, {});
  bool extraction_for_bundle = false;
  for (const auto& warning : plan.warnings) {
    extraction_for_bundle = extraction_for_bundle ||
                            (warning.kind == PlanWarningKind::kHeavyExtraction && warning.bundle_id == 7 &&
                             warning.container_number == 0);
  }
  return bundle.extraction_warning && plan.containers.empty() && plan.unplaceable.size() == 1 &&
         plan.unplaceable[0].reason == pipeload::core::InfeasibleReason::kWidth &&
         has_warning_kind(plan, PlanWarningKind::kUnplaceableBundle) && extraction_for_bundle;
}

OrderRequest mixed_order(const LoadingEngine& engine) {
  OrderRequest request{};
  const std::vector<std::pair<const char*, int>> lines = {
      {"TPE800/PN16", 6}, {"TPE630/PN10", 10}, {"TPE400/PN6", 20},
      {"TPE315/PN8", 15}, {"TPE110/PN16", 30}, {"TPE063/PN6", 40},
  };
  for (const auto& [code, quantity] : lines) {
    request.lines.push_back({engine.catalog().FindByCode(code)->id, quantity});
  }
  request.pipe_length_m = 12.0;
  request.container = standard_truck();
  return request;
}

// Intent: every ordered pipe appears exactly once and no container breaks its limits.
bool test_plan_conserves_pipes_and_respects_limits() {
  const LoadingEngine engine;
  const OrderRequest request = mixed_order(engine);
  const auto result = engine.Optimize(request);
  if (!result.ok) {
    return false;
  }
  const LoadingPlan& plan = result.value;
  std::size_t ordered = 0;
  for (const auto& line : request.lines) {
    ordered += static_cast<std::size_t>(line.quantity);
  }
  if (plan_pipe_count(plan) != ordered || plan.stats.total_pipes != ordered || !plan.unplaceable.empty()) {
    return false;
  }
  for (const ContainerLoad& load : plan.containers) {
    if (load.current_weight_kg > load.container.max_payload_kg + 1e-6) {
      return false;
    }
    for (const PlacedBundle& placed : load.bundles) {
      const double r = placed.bundle.footprint_diameter_mm() * 0.5;
      if (placed.center.x - r < -1e-9 || placed.center.x + r > load.container.internal_width_mm + 1e-9 ||
          placed.center.y - r < -1e-9 || placed.center.y + r > load.container.internal_height_mm + 1e-9) {
        return false;
      }
      if (placed.bundle.depth() > static_cast<std::size_t>(request.max_nesting_levels)) {
        return false;
      }
    }
  }
  return plan.stats.nested_pipes > 0 &&
         almost_equal(plan.stats.nesting_efficiency,
                      static_cast<double>(plan.stats.nested_pipes) / static_cast<double>(plan.stats.total_pipes));
}

// Intent: the same order and settings always produce the same plan.
bool test_optimize_is_idempotent() {
  const LoadingEngine engine;
  const OrderRequest request = mixed_order(engine);
  const auto a = engine.Optimize(request);
  const auto b = engine.Optimize(request);
  if (!a.ok || !b.ok || a.value.containers.size() != b.value.containers.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.value.containers.size(); ++i) {
    const auto& lhs = a.value.containers[i].bundles;
    const auto& rhs = b.value.containers[i].bundles;
    if (lhs.size() != rhs.size()) {
      return false;
    }
    for (std::size_t j = 0; j < lhs.size(); ++j) {
      if (lhs[j].bundle.id != rhs[j].bundle.id || !almost_equal(lhs[j].center.x, rhs[j].center.x) ||
          !almost_equal(lhs[j].center.y, rhs[j].center.y)) {
        return false;
      }
    }
  }
  return pipeload::core::format_plan_report(a.value, true) == pipeload::core::format_plan_report(b.value, true);
}

// Intent: disabling nesting on the request produces singletons and zero nesting efficiency.
bool test_request_nesting_toggle() {
  const LoadingEngine engine;
  OrderRequest request{};
  request.lines = {{engine.catalog().FindByCode("TPE800/PN6")->id, 1},
                   {engine.catalog().FindByCode("TPE630/PN6")->id, 1}};
  request.container = standard_truck();
  const auto nested = engine.Optimize(request);
  request.enable_nesting = false;
  const auto flat = engine.Optimize(request);
  return nested.ok && flat.ok && nested.value.stats.bundle_count == 1 &&
         almost_equal(nested.value.stats.nesting_efficiency, 0.5) && nested.value.stats.max_depth_used == 2 &&
         flat.value.stats.bundle_count == 2 && flat.value.stats.nested_pipes == 0 &&
         almost_equal(flat.value.stats.nesting_efficiency, 0.0) && !flat.value.nesting_enabled;
}

// Intent: all input errors of one request come back together as one failure.
bool test_request_validation_is_aggregated() {
  const LoadingEngine engine;
  const PipeTypeId known = engine.catalog().FindByCode("TPE400/PN6")->id;
  OrderRequest bad{};
  bad.lines = {{99999, 0}, {known, -1}};
  bad.pipe_length_m = 0.0;
  bad.container.max_payload_kg = 0.0;
  const auto result = engine.Optimize(bad);

  OrderRequest long_pipes{};
  long_pipes.lines = {{known, 1}};
  long_pipes.pipe_length_m = 20.0;
  const auto long_validation = engine.ValidateRequest(long_pipes);

  pipeload::core::EngineSettings tight{};
  tight.plan.max_total_pipes = 5;
  const LoadingEngine guarded(pipeload::core::make_default_catalog(), tight);
  OrderRequest big{};
  big.lines = {{known, 6}};
  const auto big_validation = guarded.ValidateRequest(big);

  return !result.ok && result.value.containers.empty() &&
         has_issue_code(result.validation, "order_line.unknown_pipe_type") &&
         has_issue_code(result.validation, "order_line.non_positive_quantity") &&
         has_issue_code(result.validation, "pipe_length.non_positive") &&
         has_issue_code(result.validation, "container.invalid_payload") &&
         contains_text(result.error, "; ") &&
         has_issue_code(engine.ValidateRequest(OrderRequest{}), "order.empty") &&
         has_issue_code(long_validation, "pipe_length.out_of_range") &&
         has_issue_code(big_validation, "order.too_large");
}

// Intent: UpdateSettings refuses invalid settings and keeps the previous ones.
bool test_update_settings_validates() {
  LoadingEngine engine;
  pipeload::core::EngineSettings settings = engine.settings();
  settings.nesting.max_levels = 0;
  settings.packing.gap_mm = -5.0;
  const auto rejected = engine.UpdateSettings(settings);
  pipeload::core::EngineSettings valid = engine.settings();
  valid.packing.gap_mm = 30.0;
  const auto accepted = engine.UpdateSettings(valid);
  return !rejected.ok && has_issue_code(rejected.validation, "settings.invalid_max_levels") &&
         has_issue_code(rejected.validation, "settings.invalid_gap") && accepted.ok &&
         engine.settings().nesting.max_levels == 4 && almost_equal(engine.settings().packing.gap_mm, 30.0);
}

// Intent: CSV import handles aliases, DN/PN spellings, default PN and bad rows.
bool test_order_csv_parsing() {
  const std::string content =
      "DN;PN;Qty\n"
      "DN200;PN10;5\n"
      "315mm;SDR26;3\n"
      "110;;4\n"
      "abc;PN6;2\n"
      "\n";
  const auto parsed = pipeload::core::parse_order_csv(content);
  if (parsed.rows.size() != 3 || parsed.errors.size() != 1 || parsed.warnings.size() != 1) {
    return false;
  }
  return parsed.rows[0].dn_mm == 200 && parsed.rows[0].pressure_class == "PN10" && parsed.rows[0].quantity == 5 &&
         parsed.rows[0].code == "TPE200/PN10" && parsed.rows[0].row_number == 2 &&
         parsed.rows[1].code == "TPE315/PN6" && parsed.rows[2].code == "TPE110/PN6" &&
         parsed.warnings[0] == "Row 4: PN not specified, defaulting to PN6" &&
         parsed.errors[0] == "Row 5: Invalid DN value" &&
         pipeload::core::detect_delimiter("dn\tpn\tqty\n200\tPN6\t1\n") == '\t' &&
         pipeload::core::detect_delimiter("a,b;c;d") == ';';
}

// Intent: header problems are reported and unknown columns only warn.
bool test_order_csv_header_handling() {
  const auto missing = pipeload::core::parse_order_csv("Diameter,Pressure,Notes\n200,PN6,x\n");
  const auto extra = pipeload::core::parse_order_csv("Diameter,Pressure,Count,Notes\n200,PN16,2,urgent\n");
  const auto headerless = pipeload::core::parse_order_csv("400,6,3\n", ',', false);
  return !missing.ok() && missing.errors.size() == 1 && missing.errors[0] == "Missing required column: Quantity" &&
         extra.ok() && extra.rows.size() == 1 && extra.rows[0].code == "TPE200/PN16" &&
         extra.warnings.size() == 1 && extra.warnings[0] == "Unrecognized column: 'Notes'" &&
         headerless.rows.size() == 1 && headerless.rows[0].code == "TPE400/PN6" && headerless.rows[0].quantity == 3;
}

// Intent: parsed rows resolve to catalog ids and unknown pipes are reported.
bool test_order_rows_resolve_against_catalog() {
  const PipeCatalog catalog = pipeload::core::make_default_catalog();
  const auto parsed = pipeload::core::parse_order_csv("code,qty\nTPE400/PN6,4\n,2\n");
  const auto good = pipeload::core::resolve_order_lines(
      pipeload::core::parse_order_csv("dn,pn,qty\n400,PN6,4\n800,SDR11,1\n"), catalog);
  const auto unknown = pipeload::core::resolve_order_lines(
      pipeload::core::parse_order_csv("dn,pn,qty\n999,PN6,4\n"), catalog);
  return !parsed.ok() && good.ok && good.value.size() == 2 &&
         good.value[0].pipe_type_id == catalog.FindByCode("TPE400/PN6")->id && good.value[0].quantity == 4 &&
         good.value[1].pipe_type_id == catalog.FindByCode("TPE800/PN16")->id &&
         !unknown.ok && has_issue_code(unknown.validation, "order_line.unknown_pipe_type");
}

// Intent: settings files apply known keys and warn on unknown or malformed lines.
bool test_settings_file_parsing() {
  const auto loaded = pipeload::core::parse_engine_settings(
      "# engine settings\n"
      "clearance.ovality_factor=0.05\n"
      "nesting.max_levels = 3\n"
      "unknown.key=1\n"
      "nesting.enabled=maybe\n"
      "packing.gap_mm=abc\n"
      "plan.record_placement_trace=0\n");
  const pipeload::core::EngineSettings defaults{};
  const auto reparsed = pipeload::core::parse_engine_settings(pipeload::core::serialize_engine_settings(defaults));
  const auto missing = pipeload::core::load_engine_settings("definitely_missing_pipeload_settings.ini");
  return almost_equal(loaded.settings.clearance.ovality_factor, 0.05) && loaded.settings.nesting.max_levels == 3 &&
         loaded.settings.nesting.enabled && almost_equal(loaded.settings.packing.gap_mm, 20.0) &&
         !loaded.settings.plan.record_placement_trace && loaded.warnings.size() == 3 &&
         reparsed.warnings.empty() &&
         almost_equal(reparsed.settings.clearance.diameter_factor, defaults.clearance.diameter_factor) &&
         reparsed.settings.plan.max_total_pipes == defaults.plan.max_total_pipes &&
         !missing.file_found && missing.warnings.empty();
}

// Intent: nesting.enabled=0 from a settings file turns nesting off for requests built by the engine.
bool test_settings_file_disables_nesting() {
  const auto loaded = pipeload::core::parse_engine_settings("nesting.enabled=0\nnesting.max_levels=2\n");
  LoadingEngine engine;
  const auto applied = engine.UpdateSettings(loaded.settings);
  OrderRequest request = engine.MakeRequest();
  request.lines = {{engine.catalog().FindByCode("TPE800/PN6")->id, 1},
                   {engine.catalog().FindByCode("TPE630/PN6")->id, 1}};
  request.container = standard_truck();
  const auto result = engine.Optimize(request);
  return loaded.warnings.empty() && applied.ok && !request.enable_nesting && request.max_nesting_levels == 2 &&
         result.ok && !result.value.nesting_enabled && result.value.stats.bundle_count == 2 &&
         result.value.stats.nested_pipes == 0;
}

// Intent: serialized settings keep full double precision.
bool test_settings_serialization_keeps_precision() {
  pipeload::core::EngineSettings settings{};
  settings.nesting.heavy_extraction_threshold_kg = 1234567.5;
  settings.clearance.diameter_factor = 0.0123456789;
  const std::string text = pipeload::core::serialize_engine_settings(settings);
  const auto reparsed = pipeload::core::parse_engine_settings(text);
  return !contains_text(text, "e+06") && reparsed.warnings.empty() &&
         reparsed.settings.nesting.heavy_extraction_threshold_kg == 1234567.5 &&
         reparsed.settings.clearance.diameter_factor == 0.0123456789;
}

// Intent: the text report lists trucks, bundles with their chains and warnings.
bool test_plan_report_contents() {
  const LoadingEngine engine;
  OrderRequest request{};
  request.lines = {{engine.catalog().FindByCode("TPE800/PN6")->id, 1},
                   {engine.catalog().FindByCode("TPE630/PN6")->id, 1}};
  request.container = standard_truck();
  const auto result = engine.Optimize(request);
  if (!result.ok) {
    return false;
  }
  const std::string report = pipeload::core::format_plan_report(result.value, true);
  return contains_text(report, "T-001 (truck 1)") && contains_text(report, "B-0001") &&
         contains_text(report, "TPE800/PN6 > TPE630/PN6") && contains_text(report, "Warnings") &&
         contains_text(report, "Placement trace") && contains_text(report, "opened") &&
         !contains_text(pipeload::core::format_plan_report(result.value), "Placement trace");
}

// Intent: display ids advance independently per prefix.
bool test_display_id_is_per_prefix_sequence() {
  pipeload::core::DisplayIdSequencer sequencer;
  const std::string b1 = sequencer.next("B");
  const std::string t1 = sequencer.next("T", 3);
  const std::string b2 = sequencer.next("B");
  return b1 == "B-0001" && t1 == "T-001" && b2 == "B-0002";
}

}  // namespace

int main() {
  const std::vector<TestCase> tests = {
      {"Clearance_DocumentedFit", "315 mm guest clears DN400 SDR26 host", test_clearance_accepts_documented_fit},
      {"Clearance_RejectNearFit", "355 mm guest is rejected by ovality", test_clearance_rejects_near_fit},
      {"Clearance_Antisymmetric", "Only strictly smaller guests nest", test_compatibility_is_antisymmetric_over_catalog},
      {"Catalog_DefaultLookup", "Default catalog resolves codes and DN/PN", test_default_catalog_lookup},
      {"Catalog_RejectInvalid", "AddPipeType rejects duplicates and bad geometry", test_catalog_rejects_invalid_records},
      {"Builder_WeightSums", "Bundle weights sum over the chain", test_bundle_weights_sum_over_chain},
      {"Builder_MaxLevels", "Depth is capped by max_levels", test_bundle_depth_capped_by_max_levels},
      {"Builder_SdrTieBreak", "Equal diameters prefer host SDR", test_guest_tie_break_prefers_host_sdr},
      {"Builder_MixedSdrPolicy", "Mixed SDR can be disallowed", test_mixed_sdr_can_be_disallowed},
      {"Builder_NestingDisabled", "Disabled nesting yields singletons", test_nesting_disabled_yields_singletons},
      {"Builder_CustomSelector", "Guest selection is replaceable", test_custom_guest_selector},
      {"Builder_ExtractionThreshold", "Extraction flag above 2000 kg", test_extraction_warning_threshold},
      {"Plan_HeavyExtractionWarning", "Plan reports heavy extraction per truck", test_plan_reports_heavy_extraction},
      {"Packer_RowOverflow", "Third 900 mm bundle wraps to offset row", test_row_overflow_starts_offset_row},
      {"Packer_RejectKeepsState", "Rejected placements leave state untouched", test_packer_rejects_without_mutating_state},
      {"Assigner_WeightSplit", "Eleventh heavy pipe opens second truck", test_weight_split_across_containers},
      {"Assigner_FootprintOverflow", "Cross-section overflow opens new truck", test_footprint_overflow_opens_container},
      {"Plan_NearPayloadLimit", "Full truck is flagged near payload limit", test_near_payload_limit_warning},
      {"Assigner_Infeasible", "Never-fitting bundles are reported", test_infeasible_bundles_are_reported},
      {"Assigner_WeightTieBreak", "Equal weights load the larger host first", test_assigner_weight_tie_break},
      {"Assigner_FirstFitBackfill", "Light bundle returns to the first truck", test_assigner_first_fit_backfill},
      {"Plan_UnplaceableExtraction", "Unplaceable heavy bundle keeps extraction advisory",
       test_unplaceable_bundle_keeps_extraction_warning},
      {"Engine_Conservation", "Pipes conserved and limits respected", test_plan_conserves_pipes_and_respects_limits},
      {"Engine_Idempotent", "Same input yields the same plan", test_optimize_is_idempotent},
      {"Engine_NestingToggle", "Request nesting flag is honoured", test_request_nesting_toggle},
      {"Engine_AggregatedValidation", "Input errors are aggregated", test_request_validation_is_aggregated},
      {"Engine_UpdateSettings", "Invalid settings are refused", test_update_settings_validates},
      {"Import_CsvRows", "CSV rows parse with aliases and defaults", test_order_csv_parsing},
      {"Import_CsvHeader", "CSV header problems are reported", test_order_csv_header_handling},
      {"Import_Resolve", "Parsed rows resolve against catalog", test_order_rows_resolve_against_catalog},
      {"Settings_File", "Settings file parses with warnings", test_settings_file_parsing},
      {"Settings_NestingDisabled", "nesting.enabled=0 produces no nesting", test_settings_file_disables_nesting},
      {"Settings_Precision", "Serialized doubles keep full precision", test_settings_serialization_keeps_precision},
      {"Report_Contents", "Report lists trucks, chains and trace", test_plan_report_contents},
      {"DisplayId_PerPrefix", "Display IDs increment per prefix", test_display_id_is_per_prefix_sequence},
  };

  bool all_passed = true;
  for (const TestCase& test : tests) {
    const bool passed = test.run();
    std::cout << (passed ? "[PASS] " : "[FAIL] ") << test.name << " - " << test.intent << "\n";
    all_passed = all_passed && passed;
  }

  if (!all_passed) {
    std::cerr << "core tests failed\n";
    return 1;
  }

  std::cout << "core tests passed (" << tests.size() << " cases)\n";
  return 0;
}
