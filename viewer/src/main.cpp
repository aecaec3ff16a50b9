#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "imgui.h"
#include "raylib.h"
#include "rlImGui.h"
#include "pipeload/core/loading_engine.hpp"
#include "pipeload/core/order_import.hpp"
#include "pipeload/core/plan_report.hpp"
#include "pipeload/core/settings_file.hpp"

namespace {

using pipeload::core::BundleId;
using pipeload::core::LoadingEngine;
using pipeload::core::LoadingPlan;

enum class CameraDragMode {
  kNone = 0,
  kPan = 1,
};

struct ViewerUiState {
  int catalog_index = 0;
  int order_quantity = 1;
  std::vector<pipeload::core::OrderLine> order_lines{};
  double pipe_length_m = 12.0;
  bool enable_nesting = true;
  int max_nesting_levels = 4;
  int template_index = 0;
  std::array<char, 260> order_csv_path{};
  std::array<char, 260> settings_path{};
  std::array<char, 260> report_path{};

  bool settings_loaded = false;
  pipeload::core::EngineSettings edit_settings{};

  bool has_plan = false;
  LoadingPlan plan{};
  int selected_container_index = 0;
  BundleId selected_bundle_id = pipeload::core::kInvalidObjectId;
  bool include_trace_in_report = false;
  bool show_bundle_labels = true;
  bool show_row_guides = false;
  int selected_trace_index = 0;
  bool fit_camera_request = true;

  std::string last_error;
  std::vector<std::string> logs;
  CameraDragMode camera_drag_mode = CameraDragMode::kNone;
  bool ui_unified_workspace = true;
  bool ui_show_workspace = true;
  float ui_workspace_width = 0.0f;
};

struct ViewerPersistentSettings {
  int window_width = 1280;
  int window_height = 720;
  bool ui_unified_workspace = true;
  bool ui_show_workspace = true;
  float ui_workspace_width = 420.0f;
  int template_index = 0;
  double pipe_length_m = 12.0;
};

constexpr const char* kViewerSettingsFile = "viewer_state.ini";
constexpr float kTopbarHeight = 74.0f;

bool parse_bool(std::string_view value, bool fallback) {
  if (value == "1" || value == "true" || value == "True") {
    return true;
  }
  if (value == "0" || value == "false" || value == "False") {
    return false;
  }
  return fallback;
}

ViewerPersistentSettings LoadViewerPersistentSettings() {
  ViewerPersistentSettings settings{};
  std::ifstream ifs(kViewerSettingsFile);
  if (!ifs.is_open()) {
    return settings;
  }

  std::string line;
  while (std::getline(ifs, line)) {
    if (line.empty()) {
      continue;
    }
    const std::size_t eq = line.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 >= line.size()) {
      continue;
    }
    const std::string key = line.substr(0, eq);
    const std::string value = line.substr(eq + 1);
    try {
      if (key == "window_width") {
        settings.window_width = std::max(640, std::stoi(value));
      } else if (key == "window_height") {
        settings.window_height = std::max(480, std::stoi(value));
      } else if (key == "ui_unified_workspace") {
        settings.ui_unified_workspace = parse_bool(value, settings.ui_unified_workspace);
      } else if (key == "ui_show_workspace") {
        settings.ui_show_workspace = parse_bool(value, settings.ui_show_workspace);
      } else if (key == "ui_workspace_width") {
        settings.ui_workspace_width = std::clamp(std::stof(value), 300.0f, 900.0f);
      } else if (key == "template_index") {
        settings.template_index = std::max(0, std::stoi(value));
      } else if (key == "pipe_length_m") {
        settings.pipe_length_m = std::clamp(std::stod(value), 6.0, 18.0);
      }
    } catch (const std::invalid_argument&) {
      // Malformed line keeps the default.
    } catch (const std::out_of_range&) {
      // Out-of-range line keeps the default.
    }
  }
  return settings;
}

void SaveViewerPersistentSettings(const ViewerPersistentSettings& settings) {
  std::ofstream ofs(kViewerSettingsFile, std::ios::trunc);
  if (!ofs.is_open()) {
    return;
  }
  ofs << "window_width=" << settings.window_width << "\n";
  ofs << "window_height=" << settings.window_height << "\n";
  ofs << "ui_unified_workspace=" << (settings.ui_unified_workspace ? 1 : 0) << "\n";
  ofs << "ui_show_workspace=" << (settings.ui_show_workspace ? 1 : 0) << "\n";
  ofs << "ui_workspace_width=" << settings.ui_workspace_width << "\n";
  ofs << "template_index=" << settings.template_index << "\n";
  ofs << "pipe_length_m=" << settings.pipe_length_m << "\n";
}

void PushLog(ViewerUiState& ui_state, const std::string& line) {
  ui_state.logs.push_back(line);
  if (ui_state.logs.size() > 12) {
    ui_state.logs.erase(ui_state.logs.begin());
  }
}

void HandleResultError(ViewerUiState& ui_state, const std::string& error, const std::string& fallback_log) {
  if (!error.empty()) {
    ui_state.last_error = error;
  } else {
    ui_state.last_error = fallback_log;
  }
  PushLog(ui_state, fallback_log);
}

std::size_t ClampedIndex(int current, std::size_t count) {
  if (count == 0) {
    return 0;
  }
  return static_cast<std::size_t>(std::clamp(current, 0, static_cast<int>(count) - 1));
}

const pipeload::core::ContainerLoad* SelectedContainer(const ViewerUiState& ui_state) {
  if (!ui_state.has_plan || ui_state.plan.containers.empty()) {
    return nullptr;
  }
  return &ui_state.plan.containers[ClampedIndex(ui_state.selected_container_index, ui_state.plan.containers.size())];
}

const pipeload::core::Bundle* FindPlanBundle(const ViewerUiState& ui_state, BundleId id) {
  if (!ui_state.has_plan || id == pipeload::core::kInvalidObjectId) {
    return nullptr;
  }
  for (const auto& load : ui_state.plan.containers) {
    for (const auto& placed : load.bundles) {
      if (placed.bundle.id == id) {
        return &placed.bundle;
      }
    }
  }
  for (const auto& item : ui_state.plan.unplaceable) {
    if (item.bundle.id == id) {
      return &item.bundle;
    }
  }
  return nullptr;
}

// Cross-section coordinates are millimetres with y up; raylib 2D has y down.
Vector2 ToScreenWorld(const pipeload::core::Vec2d& p) {
  return {static_cast<float>(p.x), static_cast<float>(-p.y)};
}

void FitCameraToContainer(Camera2D* camera, const pipeload::core::ContainerTemplate& container,
                          const ViewerUiState& ui_state) {
  const float screen_w = static_cast<float>(GetScreenWidth());
  const float screen_h = static_cast<float>(GetScreenHeight());
  const float workspace_w = (ui_state.ui_unified_workspace && ui_state.ui_show_workspace) ? ui_state.ui_workspace_width : 0.0f;
  const float view_w = std::max(200.0f, screen_w - workspace_w - 24.0f);
  const float view_h = std::max(200.0f, screen_h - kTopbarHeight - 32.0f);
  const float width = static_cast<float>(container.internal_width_mm);
  const float height = static_cast<float>(container.internal_height_mm);
  camera->target = {width * 0.5f, -height * 0.5f};
  camera->offset = {8.0f + view_w * 0.5f, kTopbarHeight + 16.0f + view_h * 0.5f};
  camera->rotation = 0.0f;
  camera->zoom = std::min(view_w / (width * 1.1f), view_h / (height * 1.1f));
}

void UpdateCameraForViewport(Camera2D* camera, ViewerUiState& ui_state) {
  ImGuiIO& io = ImGui::GetIO();
  const bool ui_captures_mouse = io.WantCaptureMouse;

  if (!ui_captures_mouse && IsMouseButtonPressed(MOUSE_BUTTON_MIDDLE)) {
    ui_state.camera_drag_mode = CameraDragMode::kPan;
  }
  if (ui_state.camera_drag_mode == CameraDragMode::kPan) {
    const Vector2 delta = GetMouseDelta();
    camera->target.x -= delta.x / camera->zoom;
    camera->target.y -= delta.y / camera->zoom;
    if (IsMouseButtonReleased(MOUSE_BUTTON_MIDDLE)) {
      ui_state.camera_drag_mode = CameraDragMode::kNone;
    }
  }

  if (!ui_captures_mouse && ui_state.camera_drag_mode == CameraDragMode::kNone) {
    const float wheel = GetMouseWheelMove();
    if (std::fabs(wheel) > 0.0f) {
      const Vector2 mouse = GetMousePosition();
      const Vector2 before = GetScreenToWorld2D(mouse, *camera);
      camera->zoom = std::clamp(camera->zoom * (1.0f + wheel * 0.12f), 0.01f, 10.0f);
      const Vector2 after = GetScreenToWorld2D(mouse, *camera);
      camera->target.x += before.x - after.x;
      camera->target.y += before.y - after.y;
    }
  }
}

// Left click selects the bundle whose host footprint contains the cursor.
void UpdateBundlePicking(const Camera2D& camera, ViewerUiState& ui_state) {
  if (ImGui::GetIO().WantCaptureMouse || !IsMouseButtonPressed(MOUSE_BUTTON_LEFT)) {
    return;
  }
  const auto* load = SelectedContainer(ui_state);
  if (load == nullptr) {
    return;
  }
  const Vector2 world = GetScreenToWorld2D(GetMousePosition(), camera);
  const pipeload::core::Vec2d point{world.x, -world.y};
  for (const auto& placed : load->bundles) {
    if (pipeload::core::distance(point, placed.center) <= placed.bundle.footprint_diameter_mm() * 0.5) {
      ui_state.selected_bundle_id = placed.bundle.id;
      return;
    }
  }
}

Color BundleFillColor(const pipeload::core::Bundle& bundle, bool selected) {
  if (selected) {
    return Color{90, 150, 220, 255};
  }
  if (bundle.extraction_warning) {
    return Color{200, 120, 50, 255};
  }
  return bundle.is_singleton() ? Color{70, 84, 100, 255} : Color{64, 120, 96, 255};
}

void DrawContainerSection(const ViewerUiState& ui_state) {
  const auto* load = SelectedContainer(ui_state);
  if (load == nullptr) {
    return;
  }
  const float width = static_cast<float>(load->container.internal_width_mm);
  const float height = static_cast<float>(load->container.internal_height_mm);
  DrawRectangleRec(Rectangle{0.0f, -height, width, height}, Color{36, 44, 54, 255});
  DrawRectangleLinesEx(Rectangle{0.0f, -height, width, height}, 6.0f, Color{180, 190, 200, 255});

  if (ui_state.show_row_guides) {
    double last_row_y = -1.0;
    for (const auto& placed : load->bundles) {
      const double base = placed.center.y - placed.bundle.footprint_diameter_mm() * 0.5;
      if (std::fabs(base - last_row_y) > 1.0) {
        DrawLineEx({0.0f, static_cast<float>(-base)}, {width, static_cast<float>(-base)}, 2.0f,
                   Color{90, 100, 110, 255});
        last_row_y = base;
      }
    }
  }

  for (const auto& placed : load->bundles) {
    const auto& bundle = placed.bundle;
    const bool selected = bundle.id == ui_state.selected_bundle_id;
    const Vector2 center = ToScreenWorld(placed.center);
    DrawCircleV(center, static_cast<float>(bundle.host().outer_diameter_mm * 0.5), BundleFillColor(bundle, selected));
    // Guests sit concentric in the host bore.
    for (const auto& pipe : bundle.chain) {
      DrawCircleLinesV(center, static_cast<float>(pipe.outer_diameter_mm * 0.5), Color{230, 235, 240, 255});
      DrawCircleLinesV(center, static_cast<float>(pipe.inner_diameter_mm * 0.5), Color{140, 150, 160, 255});
    }
    if (ui_state.show_bundle_labels) {
      const float font = std::max(24.0f, static_cast<float>(bundle.footprint_diameter_mm() * 0.12));
      DrawTextEx(GetFontDefault(), bundle.display_id.c_str(), {center.x - font * 1.4f, center.y - font * 0.5f}, font,
                 1.0f, RAYWHITE);
    }
  }
}

void SeedNestingControls(const LoadingEngine& engine, ViewerUiState& ui_state) {
  const pipeload::core::OrderRequest defaults = engine.MakeRequest();
  ui_state.enable_nesting = defaults.enable_nesting;
  ui_state.max_nesting_levels = defaults.max_nesting_levels;
}

bool RunOptimize(const LoadingEngine& engine, ViewerUiState& ui_state) {
  const auto templates = pipeload::core::default_container_templates();
  pipeload::core::OrderRequest request = engine.MakeRequest();
  request.lines = ui_state.order_lines;
  request.pipe_length_m = ui_state.pipe_length_m;
  request.enable_nesting = ui_state.enable_nesting;
  request.max_nesting_levels = ui_state.max_nesting_levels;
  request.container = templates[ClampedIndex(ui_state.template_index, templates.size())];

  auto result = engine.Optimize(request);
  if (!result.ok) {
    for (const auto& issue : result.validation.issues) {
      PushLog(ui_state, "[error] " + issue.code + ": " + issue.message);
    }
    HandleResultError(ui_state, result.error, "[error] Optimize failed");
    return false;
  }

  ui_state.plan = std::move(result.value);
  ui_state.has_plan = true;
  ui_state.selected_container_index = 0;
  ui_state.selected_bundle_id = pipeload::core::kInvalidObjectId;
  ui_state.selected_trace_index = 0;
  ui_state.fit_camera_request = true;
  ui_state.last_error.clear();
  const auto& stats = ui_state.plan.stats;
  PushLog(ui_state, "[plan] trucks=" + std::to_string(stats.container_count) +
                        " bundles=" + std::to_string(stats.bundle_count) +
                        " pipes=" + std::to_string(stats.total_pipes) +
                        " nested=" + std::to_string(stats.nested_pipes));
  if (!ui_state.plan.warnings.empty()) {
    PushLog(ui_state, "[warn] " + std::to_string(ui_state.plan.warnings.size()) + " plan warnings");
  }
  return true;
}

void DrawOrderEditorContent(LoadingEngine& engine, ViewerUiState& ui_state) {
  const auto& pipes = engine.catalog().items();
  if (pipes.empty()) {
    ImGui::TextUnformatted("Catalog is empty");
    return;
  }
  const std::size_t pipe_index = ClampedIndex(ui_state.catalog_index, pipes.size());
  if (ImGui::BeginCombo("Pipe Type", pipes[pipe_index].code.c_str())) {
    for (std::size_t i = 0; i < pipes.size(); ++i) {
      const bool is_selected = i == pipe_index;
      if (ImGui::Selectable(pipes[i].code.c_str(), is_selected)) {
        ui_state.catalog_index = static_cast<int>(i);
      }
      if (is_selected) {
        ImGui::SetItemDefaultFocus();
      }
    }
    ImGui::EndCombo();
  }
  const auto& pipe = pipes[pipe_index];
  ImGui::Text("OD %.1f  ID %.1f  SDR%d  %.2f kg/m", pipe.outer_diameter_mm, pipe.inner_diameter_mm, pipe.sdr,
              pipe.weight_per_meter_kg);
  ImGui::InputInt("Quantity", &ui_state.order_quantity);
  ui_state.order_quantity = std::max(1, ui_state.order_quantity);
  if (ImGui::Button("Add Line")) {
    ui_state.order_lines.push_back({pipe.id, ui_state.order_quantity});
    PushLog(ui_state, "[info] added " + std::to_string(ui_state.order_quantity) + " x " + pipe.code);
  }
  ImGui::SameLine();
  if (ImGui::Button("Clear Order")) {
    ui_state.order_lines.clear();
    PushLog(ui_state, "[info] order cleared");
  }

  ImGui::InputText("Order CSV", ui_state.order_csv_path.data(), ui_state.order_csv_path.size());
  if (ImGui::Button("Import CSV")) {
    const auto parsed = pipeload::core::parse_order_csv_file(ui_state.order_csv_path.data());
    for (const auto& warning : parsed.warnings) {
      PushLog(ui_state, "[warn] " + warning);
    }
    if (!parsed.ok()) {
      for (const auto& error : parsed.errors) {
        PushLog(ui_state, "[error] " + error);
      }
      HandleResultError(ui_state, parsed.errors.front(), "[error] CSV import failed");
    } else {
      const auto resolved = pipeload::core::resolve_order_lines(parsed, engine.catalog());
      if (!resolved.ok) {
        HandleResultError(ui_state, resolved.error, "[error] CSV rows not in catalog");
      } else {
        ui_state.order_lines = resolved.value;
        ui_state.last_error.clear();
        PushLog(ui_state, "[info] imported " + std::to_string(resolved.value.size()) + " order lines");
      }
    }
  }

  ImGui::Separator();
  if (ImGui::BeginTable("OrderLines", 3, ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg)) {
    ImGui::TableSetupColumn("Code");
    ImGui::TableSetupColumn("Qty");
    ImGui::TableSetupColumn("");
    ImGui::TableHeadersRow();
    int remove_index = -1;
    for (std::size_t i = 0; i < ui_state.order_lines.size(); ++i) {
      const auto& line = ui_state.order_lines[i];
      const auto* line_pipe = engine.catalog().Find(line.pipe_type_id);
      ImGui::TableNextRow();
      ImGui::TableNextColumn();
      ImGui::TextUnformatted(line_pipe != nullptr ? line_pipe->code.c_str() : "?");
      ImGui::TableNextColumn();
      ImGui::Text("%d", line.quantity);
      ImGui::TableNextColumn();
      ImGui::PushID(static_cast<int>(i));
      if (ImGui::SmallButton("Remove")) {
        remove_index = static_cast<int>(i);
      }
      ImGui::PopID();
    }
    ImGui::EndTable();
    if (remove_index >= 0) {
      ui_state.order_lines.erase(ui_state.order_lines.begin() + remove_index);
    }
  }

  ImGui::Separator();
  ImGui::InputDouble("Pipe Length (m)", &ui_state.pipe_length_m, 0.5, 1.0, "%.2f");
  ImGui::Checkbox("Enable Nesting", &ui_state.enable_nesting);
  ImGui::SliderInt("Max Nesting Levels", &ui_state.max_nesting_levels, 1, pipeload::core::kMaxNestingLevels);
  const auto templates = pipeload::core::default_container_templates();
  const std::size_t template_index = ClampedIndex(ui_state.template_index, templates.size());
  if (ImGui::BeginCombo("Truck", templates[template_index].name.c_str())) {
    for (std::size_t i = 0; i < templates.size(); ++i) {
      if (ImGui::Selectable(templates[i].name.c_str(), i == template_index)) {
        ui_state.template_index = static_cast<int>(i);
      }
    }
    ImGui::EndCombo();
  }
  if (ImGui::Button("Optimize", ImVec2(-1.0f, 0.0f))) {
    (void)RunOptimize(engine, ui_state);
  }
}

void DrawInspectorContent(const LoadingEngine& engine, ViewerUiState& ui_state) {
  const auto* bundle = FindPlanBundle(ui_state, ui_state.selected_bundle_id);
  if (bundle == nullptr) {
    ImGui::TextUnformatted("Select a bundle in the outliner or the cross-section view.");
    return;
  }
  ImGui::Text("%s  depth %d", bundle->display_id.c_str(), static_cast<int>(bundle->depth()));
  ImGui::Text("Total %.1f kg  inner %.1f kg", bundle->total_weight_kg, bundle->inner_weight_kg);
  if (bundle->extraction_warning) {
    ImGui::TextColored(ImVec4(0.95f, 0.6f, 0.25f, 1.0f), "Heavy extraction equipment required");
  }
  ImGui::Separator();
  for (std::size_t i = 0; i < bundle->chain.size(); ++i) {
    const auto& pipe = bundle->chain[i];
    ImGui::BulletText("%s  OD %.1f  ID %.1f  %.2f kg/m", pipe.code.c_str(), pipe.outer_diameter_mm,
                      pipe.inner_diameter_mm, pipe.weight_per_meter_kg);
    if (i + 1 < bundle->chain.size()) {
      const auto report =
          pipeload::core::evaluate_clearance(pipe, bundle->chain[i + 1], engine.settings().clearance);
      ImGui::Indent();
      ImGui::TextWrapped("%s", report.message.c_str());
      ImGui::Unindent();
    }
  }
}

void DrawOutlinerContent(ViewerUiState& ui_state) {
  if (!ui_state.has_plan) {
    ImGui::TextUnformatted("No plan yet.");
    return;
  }
  const auto& plan = ui_state.plan;
  for (std::size_t i = 0; i < plan.containers.size(); ++i) {
    const auto& load = plan.containers[i];
    char label[128];
    std::snprintf(label, sizeof(label), "%s  %.0f kg (%.1f%%)  %d pipes###truck%d", load.display_id.c_str(),
                  load.current_weight_kg, load.weight_utilization_pct, static_cast<int>(load.pipe_count),
                  static_cast<int>(i));
    const bool open = ImGui::TreeNodeEx(label, static_cast<int>(i) == ui_state.selected_container_index
                                                    ? ImGuiTreeNodeFlags_Selected
                                                    : ImGuiTreeNodeFlags_None);
    if (ImGui::IsItemClicked()) {
      ui_state.selected_container_index = static_cast<int>(i);
      ui_state.fit_camera_request = true;
    }
    if (!open) {
      continue;
    }
    for (const auto& placed : load.bundles) {
      const std::string bundle_label =
          placed.bundle.display_id + "  " + pipeload::core::describe_chain(placed.bundle);
      if (ImGui::Selectable(bundle_label.c_str(), placed.bundle.id == ui_state.selected_bundle_id)) {
        ui_state.selected_bundle_id = placed.bundle.id;
        ui_state.selected_container_index = static_cast<int>(i);
      }
    }
    ImGui::TreePop();
  }
  if (!plan.unplaceable.empty() && ImGui::CollapsingHeader("Unplaceable", ImGuiTreeNodeFlags_DefaultOpen)) {
    for (const auto& item : plan.unplaceable) {
      const std::string label = item.bundle.display_id + " [" +
                                pipeload::core::infeasible_reason_label(item.reason) + "] " + item.message;
      if (ImGui::Selectable(label.c_str(), item.bundle.id == ui_state.selected_bundle_id)) {
        ui_state.selected_bundle_id = item.bundle.id;
      }
    }
  }
}

void DrawSettingsPanel(LoadingEngine& engine, ViewerUiState& ui_state) {
  if (!ui_state.settings_loaded) {
    ui_state.edit_settings = engine.settings();
    ui_state.settings_loaded = true;
  }
  auto& settings = ui_state.edit_settings;
  ImGui::InputDouble("Ovality Factor", &settings.clearance.ovality_factor, 0.005, 0.01, "%.3f");
  ImGui::InputDouble("Diameter Factor", &settings.clearance.diameter_factor, 0.001, 0.005, "%.4f");
  ImGui::InputDouble("Base Clearance (mm)", &settings.clearance.base_clearance_mm, 1.0, 5.0, "%.1f");
  ImGui::Checkbox("Prefer Same SDR", &settings.nesting.prefer_same_sdr);
  ImGui::Checkbox("Allow Mixed SDR", &settings.nesting.allow_mixed_sdr);
  ImGui::InputDouble("Extraction Threshold (kg)", &settings.nesting.heavy_extraction_threshold_kg, 50.0, 250.0,
                     "%.0f");
  ImGui::InputDouble("Packing Gap (mm)", &settings.packing.gap_mm, 1.0, 5.0, "%.1f");
  ImGui::InputDouble("Safety Margin (%)", &settings.plan.weight_safety_margin_pct, 0.5, 1.0, "%.1f");
  ImGui::Checkbox("Record Placement Trace", &settings.plan.record_placement_trace);
  if (ImGui::Button("Apply Settings")) {
    const auto result = engine.UpdateSettings(settings);
    if (!result.ok) {
      HandleResultError(ui_state, result.error, "[error] UpdateSettings failed");
    } else {
      ui_state.last_error.clear();
      SeedNestingControls(engine, ui_state);
      PushLog(ui_state, "[info] engine settings updated");
    }
  }
  ImGui::SameLine();
  if (ImGui::Button("Revert")) {
    settings = engine.settings();
  }

  ImGui::InputText("Settings File", ui_state.settings_path.data(), ui_state.settings_path.size());
  if (ImGui::Button("Load")) {
    const auto loaded = pipeload::core::load_engine_settings(ui_state.settings_path.data());
    if (!loaded.file_found) {
      HandleResultError(ui_state, "", "[error] settings file not found");
    } else {
      for (const auto& warning : loaded.warnings) {
        PushLog(ui_state, "[warn] " + warning);
      }
      settings = loaded.settings;
      PushLog(ui_state, "[info] settings loaded, press Apply to use them");
    }
  }
  ImGui::SameLine();
  if (ImGui::Button("Save")) {
    const auto result = pipeload::core::save_engine_settings(engine.settings(), ui_state.settings_path.data());
    if (!result.ok) {
      HandleResultError(ui_state, result.error, "[error] settings save failed");
    } else {
      PushLog(ui_state, "[info] settings saved");
    }
  }
}

void DrawDiagnosticsContent(LoadingEngine& engine, ViewerUiState& ui_state) {
  if (ImGui::CollapsingHeader("Engine Settings")) {
    DrawSettingsPanel(engine, ui_state);
  }

  if (ui_state.has_plan && ImGui::CollapsingHeader("Warnings", ImGuiTreeNodeFlags_DefaultOpen)) {
    for (const auto& warning : ui_state.plan.warnings) {
      ImGui::TextWrapped("[%s] %s", pipeload::core::plan_warning_label(warning.kind), warning.message.c_str());
    }
  }

  if (ui_state.has_plan && ImGui::CollapsingHeader("Placement Trace")) {
    const auto& trace = ui_state.plan.placement_trace;
    ImGui::Text("Events: %d", static_cast<int>(trace.size()));
    if (!trace.empty()) {
      ui_state.selected_trace_index = std::clamp(ui_state.selected_trace_index, 0, static_cast<int>(trace.size() - 1));
      ImGui::SliderInt("Event Index", &ui_state.selected_trace_index, 0, static_cast<int>(trace.size() - 1));
      const auto& event = trace[static_cast<std::size_t>(ui_state.selected_trace_index)];
      ImGui::Text("Bundle=%llu Truck=%d %s", static_cast<unsigned long long>(event.bundle_id),
                  event.container_number, pipeload::core::placement_outcome_label(event.outcome));
      ImGui::TextWrapped("%s", event.detail.c_str());
    }
  }

  if (ui_state.has_plan && ImGui::CollapsingHeader("Report")) {
    ImGui::Checkbox("Include Trace", &ui_state.include_trace_in_report);
    ImGui::InputText("Report File", ui_state.report_path.data(), ui_state.report_path.size());
    if (ImGui::Button("Export Report")) {
      std::ofstream ofs(ui_state.report_path.data(), std::ios::trunc);
      if (!ofs.is_open()) {
        HandleResultError(ui_state, "", "[error] cannot open report file");
      } else {
        ofs << pipeload::core::format_plan_report(ui_state.plan, ui_state.include_trace_in_report);
        PushLog(ui_state, std::string("[info] report written to ") + ui_state.report_path.data());
      }
    }
  }

  if (!ui_state.last_error.empty()) {
    ImGui::Separator();
    ImGui::TextWrapped("Error: %s", ui_state.last_error.c_str());
  }
  ImGui::Separator();
  ImGui::BeginChild("LogArea", ImVec2(0.0f, 90.0f), true, ImGuiWindowFlags_HorizontalScrollbar);
  for (const std::string& line : ui_state.logs) {
    ImGui::TextWrapped("%s", line.c_str());
  }
  ImGui::EndChild();
}

void DrawTopbarWindow(const LoadingEngine& engine, ViewerUiState& ui_state) {
  const float w = static_cast<float>(GetScreenWidth());
  ImGui::SetNextWindowPos(ImVec2(8.0f, 8.0f), ImGuiCond_Always);
  ImGui::SetNextWindowSize(ImVec2(std::max(320.0f, w - 16.0f), kTopbarHeight), ImGuiCond_Always);
  const ImGuiWindowFlags flags =
      ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoScrollbar | ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize;
  if (!ImGui::Begin("Topbar", nullptr, flags)) {
    ImGui::End();
    return;
  }

  if (ImGui::Button("Optimize")) {
    (void)RunOptimize(engine, ui_state);
  }
  ImGui::SameLine();
  if (ImGui::Button("Fit View")) {
    ui_state.fit_camera_request = true;
  }
  ImGui::SameLine();
  ImGui::Checkbox("Labels", &ui_state.show_bundle_labels);
  ImGui::SameLine();
  ImGui::Checkbox("Row Guides", &ui_state.show_row_guides);
  ImGui::SameLine();
  ImGui::SetCursorPosX(std::max(ImGui::GetCursorPosX(), ImGui::GetWindowWidth() - 250.0f));
  ImGui::Checkbox("Unified UI", &ui_state.ui_unified_workspace);
  ImGui::SameLine();
  ImGui::Checkbox("Show Workspace", &ui_state.ui_show_workspace);
  ImGui::Separator();
  if (ui_state.has_plan) {
    const auto& stats = ui_state.plan.stats;
    ImGui::Text("Trucks:%d  Bundles:%d  Pipes:%d  Nested:%d (%.1f%%)  Weight:%.0f kg",
                static_cast<int>(stats.container_count), static_cast<int>(stats.bundle_count),
                static_cast<int>(stats.total_pipes), static_cast<int>(stats.nested_pipes),
                stats.nesting_efficiency * 100.0, stats.total_weight_kg);
    if (const auto* load = SelectedContainer(ui_state); load != nullptr) {
      ImGui::SameLine();
      ImGui::Text("|  %s area %.1f%%", load->display_id.c_str(), load->area_utilization_pct);
    }
  } else {
    ImGui::Text("Order lines:%d  Catalog:%d", static_cast<int>(ui_state.order_lines.size()),
                static_cast<int>(engine.catalog().size()));
  }
  ImGui::End();
}

void DrawWorkspaceWindow(const char* title, ImVec2 pos, ImVec2 size, const std::function<void()>& draw_content) {
  ImGui::SetNextWindowPos(pos, ImGuiCond_FirstUseEver);
  ImGui::SetNextWindowSize(size, ImGuiCond_FirstUseEver);
  if (!ImGui::Begin(title, nullptr, ImGuiWindowFlags_NoCollapse)) {
    ImGui::End();
    return;
  }
  draw_content();
  ImGui::End();
}

void DrawUnifiedWorkspaceWindow(LoadingEngine& engine, ViewerUiState& ui_state) {
  if (!ui_state.ui_show_workspace) {
    return;
  }
  const float screen_w = static_cast<float>(GetScreenWidth());
  const float screen_h = static_cast<float>(GetScreenHeight());
  const float margin = 8.0f;
  const float min_w = 300.0f;
  const float max_w = std::max(min_w, screen_w - margin * 2.0f);
  if (ui_state.ui_workspace_width <= 1.0f) {
    ui_state.ui_workspace_width = std::clamp(screen_w * 0.36f, min_w, std::min(760.0f, max_w));
  }
  ui_state.ui_workspace_width = std::clamp(ui_state.ui_workspace_width, min_w, std::min(760.0f, max_w));
  const float workspace_w = ui_state.ui_workspace_width;
  const float x = std::max(margin, screen_w - workspace_w - margin);
  const float y = kTopbarHeight + margin + 8.0f;
  const float h = std::max(240.0f, screen_h - y - margin);

  ImGui::SetNextWindowPos(ImVec2(x, y), ImGuiCond_Always);
  ImGui::SetNextWindowSize(ImVec2(workspace_w, h), ImGuiCond_FirstUseEver);
  ImGui::SetNextWindowSizeConstraints(ImVec2(min_w, 240.0f), ImVec2(std::min(760.0f, max_w), h));
  const ImGuiWindowFlags flags = ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoMove;
  if (!ImGui::Begin("Workspace", nullptr, flags)) {
    ImGui::End();
    return;
  }
  ui_state.ui_workspace_width = ImGui::GetWindowSize().x;
  if (ImGui::BeginTabBar("WorkspaceTabs")) {
    if (ImGui::BeginTabItem("Order")) {
      DrawOrderEditorContent(engine, ui_state);
      ImGui::EndTabItem();
    }
    if (ImGui::BeginTabItem("Inspector")) {
      DrawInspectorContent(engine, ui_state);
      ImGui::EndTabItem();
    }
    if (ImGui::BeginTabItem("Outliner")) {
      DrawOutlinerContent(ui_state);
      ImGui::EndTabItem();
    }
    if (ImGui::BeginTabItem("Diagnostics")) {
      DrawDiagnosticsContent(engine, ui_state);
      ImGui::EndTabItem();
    }
    ImGui::EndTabBar();
  }
  ImGui::End();
}

void DrawPanels(LoadingEngine& engine, ViewerUiState& ui_state) {
  DrawTopbarWindow(engine, ui_state);
  if (ui_state.ui_unified_workspace) {
    DrawUnifiedWorkspaceWindow(engine, ui_state);
    return;
  }
  const float w = static_cast<float>(GetScreenWidth());
  const float h = static_cast<float>(GetScreenHeight());
  const float right_x = std::max(440.0f, w - 430.0f);
  DrawWorkspaceWindow("Order", ImVec2(8.0f, 90.0f), ImVec2(420.0f, 520.0f),
                      [&]() { DrawOrderEditorContent(engine, ui_state); });
  DrawWorkspaceWindow("Inspector", ImVec2(right_x, 90.0f), ImVec2(420.0f, 300.0f),
                      [&]() { DrawInspectorContent(engine, ui_state); });
  DrawWorkspaceWindow("Outliner", ImVec2(8.0f, 620.0f), ImVec2(420.0f, 260.0f),
                      [&]() { DrawOutlinerContent(ui_state); });
  DrawWorkspaceWindow("Diagnostics", ImVec2(right_x, std::max(90.0f, h - 360.0f)), ImVec2(420.0f, 340.0f),
                      [&]() { DrawDiagnosticsContent(engine, ui_state); });
}

void SeedDemoOrder(const LoadingEngine& engine, ViewerUiState& ui_state) {
  const std::array<std::pair<const char*, int>, 4> demo = {{
      {"TPE800/PN6", 4},
      {"TPE630/PN6", 4},
      {"TPE500/PN10", 6},
      {"TPE315/PN6", 10},
  }};
  for (const auto& [code, quantity] : demo) {
    if (const auto* pipe = engine.catalog().FindByCode(code); pipe != nullptr) {
      ui_state.order_lines.push_back({pipe->id, quantity});
    }
  }
}

}  // namespace

int main() {
  const ViewerPersistentSettings persisted = LoadViewerPersistentSettings();
  SetConfigFlags(FLAG_WINDOW_RESIZABLE | FLAG_MSAA_4X_HINT | FLAG_VSYNC_HINT);
  InitWindow(persisted.window_width, persisted.window_height, "pipeload viewer");
  SetExitKey(KEY_NULL);
  SetTargetFPS(60);

  Camera2D camera{};
  camera.zoom = 0.2f;

  LoadingEngine engine;
  ViewerUiState ui_state;
  ui_state.ui_unified_workspace = persisted.ui_unified_workspace;
  ui_state.ui_show_workspace = persisted.ui_show_workspace;
  ui_state.ui_workspace_width = persisted.ui_workspace_width;
  ui_state.template_index = persisted.template_index;
  ui_state.pipe_length_m = persisted.pipe_length_m;
  std::snprintf(ui_state.order_csv_path.data(), ui_state.order_csv_path.size(), "%s", "order.csv");
  std::snprintf(ui_state.settings_path.data(), ui_state.settings_path.size(), "%s", "pipeload_settings.ini");
  std::snprintf(ui_state.report_path.data(), ui_state.report_path.size(), "%s", "loading_plan.txt");
  SeedNestingControls(engine, ui_state);
  SeedDemoOrder(engine, ui_state);
  PushLog(ui_state, "[info] viewer started");
  PushLog(ui_state, "[info] catalog loaded (" + std::to_string(engine.catalog().size()) + " pipe types)");
  PushLog(ui_state, "[hint] MMB pan, mouse wheel zoom, LMB select bundle");
  (void)RunOptimize(engine, ui_state);

  rlImGuiSetup(true);
  ImGui::StyleColorsDark();
  {
    ImGuiStyle& style = ImGui::GetStyle();
    style.WindowRounding = 3.0f;
    style.FrameRounding = 2.0f;
    style.GrabRounding = 2.0f;
    style.WindowBorderSize = 1.0f;
    style.FrameBorderSize = 0.0f;
  }
  while (!WindowShouldClose()) {
    BeginDrawing();
    ClearBackground(Color{26, 32, 39, 255});

    rlImGuiBegin();
    if (ui_state.fit_camera_request) {
      if (const auto* load = SelectedContainer(ui_state); load != nullptr) {
        FitCameraToContainer(&camera, load->container, ui_state);
      }
      ui_state.fit_camera_request = false;
    }
    UpdateCameraForViewport(&camera, ui_state);
    UpdateBundlePicking(camera, ui_state);

    BeginMode2D(camera);
    DrawContainerSection(ui_state);
    EndMode2D();

    DrawPanels(engine, ui_state);
    rlImGuiEnd();

    DrawFPS(10, GetScreenHeight() - 24);
    EndDrawing();
  }

  rlImGuiShutdown();
  {
    ViewerPersistentSettings out{};
    out.window_width = GetScreenWidth();
    out.window_height = GetScreenHeight();
    out.ui_unified_workspace = ui_state.ui_unified_workspace;
    out.ui_show_workspace = ui_state.ui_show_workspace;
    out.ui_workspace_width = ui_state.ui_workspace_width;
    out.template_index = ui_state.template_index;
    out.pipe_length_m = ui_state.pipe_length_m;
    SaveViewerPersistentSettings(out);
  }
  CloseWindow();
  return 0;
}
