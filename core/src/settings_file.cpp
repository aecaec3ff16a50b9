#include "pipeload/core/settings_file.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace pipeload::core {

namespace {

bool parse_bool(std::string_view value, bool& out) {
  if (value == "1" || value == "true" || value == "True") {
    out = true;
    return true;
  }
  if (value == "0" || value == "false" || value == "False") {
    out = false;
    return true;
  }
  return false;
}

std::string trim(std::string_view value) {
  const std::size_t begin = value.find_first_not_of(" \t\r");
  if (begin == std::string_view::npos) {
    return {};
  }
  const std::size_t end = value.find_last_not_of(" \t\r");
  return std::string(value.substr(begin, end - begin + 1));
}

bool parse_double(const std::string& value, double& out) {
  std::size_t consumed = 0;
  const double parsed = std::stod(value, &consumed);
  if (consumed != value.size()) {
    return false;
  }
  out = parsed;
  return true;
}

bool parse_int(const std::string& value, int& out) {
  std::size_t consumed = 0;
  const int parsed = std::stoi(value, &consumed);
  if (consumed != value.size()) {
    return false;
  }
  out = parsed;
  return true;
}

bool parse_size(const std::string& value, std::size_t& out) {
  std::size_t consumed = 0;
  const unsigned long long parsed = std::stoull(value, &consumed);
  if (consumed != value.size() || value.front() == '-') {
    return false;
  }
  out = static_cast<std::size_t>(parsed);
  return true;
}

// Returns false for an unknown key; sets `valid` false when the value did not parse.
bool apply_setting(EngineSettings& settings, const std::string& key, const std::string& value, bool& valid) {
  ClearanceParams& clearance = settings.clearance;
  NestingSettings& nesting = settings.nesting;
  PlanSettings& plan = settings.plan;
  if (key == "clearance.ovality_factor") {
    valid = parse_double(value, clearance.ovality_factor);
  } else if (key == "clearance.diameter_factor") {
    valid = parse_double(value, clearance.diameter_factor);
  } else if (key == "clearance.base_clearance_mm") {
    valid = parse_double(value, clearance.base_clearance_mm);
  } else if (key == "nesting.enabled") {
    valid = parse_bool(value, nesting.enabled);
  } else if (key == "nesting.max_levels") {
    valid = parse_int(value, nesting.max_levels);
  } else if (key == "nesting.prefer_same_sdr") {
    valid = parse_bool(value, nesting.prefer_same_sdr);
  } else if (key == "nesting.allow_mixed_sdr") {
    valid = parse_bool(value, nesting.allow_mixed_sdr);
  } else if (key == "nesting.heavy_extraction_threshold_kg") {
    valid = parse_double(value, nesting.heavy_extraction_threshold_kg);
  } else if (key == "nesting.max_guest_weight_ratio") {
    valid = parse_double(value, nesting.max_guest_weight_ratio);
  } else if (key == "packing.gap_mm") {
    valid = parse_double(value, settings.packing.gap_mm);
  } else if (key == "plan.min_pipe_length_m") {
    valid = parse_double(value, plan.min_pipe_length_m);
  } else if (key == "plan.max_pipe_length_m") {
    valid = parse_double(value, plan.max_pipe_length_m);
  } else if (key == "plan.weight_safety_margin_pct") {
    valid = parse_double(value, plan.weight_safety_margin_pct);
  } else if (key == "plan.underutilization_threshold_pct") {
    valid = parse_double(value, plan.underutilization_threshold_pct);
  } else if (key == "plan.max_total_pipes") {
    valid = parse_size(value, plan.max_total_pipes);
  } else if (key == "plan.record_placement_trace") {
    valid = parse_bool(value, plan.record_placement_trace);
  } else {
    return false;
  }
  return true;
}

}  // namespace

SettingsLoadResult parse_engine_settings(std::string_view content) {
  SettingsLoadResult result;
  std::istringstream iss{std::string(content)};
  std::string line;
  int line_number = 0;
  while (std::getline(iss, line)) {
    ++line_number;
    const std::string trimmed = trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    const std::string location = "line " + std::to_string(line_number);
    const std::size_t eq = trimmed.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 >= trimmed.size()) {
      result.warnings.push_back(location + ": expected key=value");
      continue;
    }
    const std::string key = trim(std::string_view(trimmed).substr(0, eq));
    const std::string value = trim(std::string_view(trimmed).substr(eq + 1));

    // Parse into a copy so a malformed value never leaves a partial write behind.
    EngineSettings candidate = result.settings;
    bool valid = false;
    bool known = false;
    try {
      known = apply_setting(candidate, key, value, valid);
    } catch (const std::invalid_argument&) {
      known = true;
      valid = false;
    } catch (const std::out_of_range&) {
      known = true;
      valid = false;
    }
    if (!known) {
      result.warnings.push_back(location + ": unknown key '" + key + "'");
    } else if (!valid) {
      result.warnings.push_back(location + ": malformed value '" + value + "' for " + key + ", keeping default");
    } else {
      result.settings = candidate;
    }
  }
  return result;
}

SettingsLoadResult load_engine_settings(const std::filesystem::path& path) {
  std::ifstream ifs(path);
  if (!ifs.is_open()) {
    return {};
  }
  std::ostringstream oss;
  oss << ifs.rdbuf();
  SettingsLoadResult result = parse_engine_settings(oss.str());
  result.file_found = true;
  return result;
}

std::string serialize_engine_settings(const EngineSettings& settings) {
  std::ostringstream oss;
  oss << std::setprecision(17);
  oss << "clearance.ovality_factor=" << settings.clearance.ovality_factor << "\n";
  oss << "clearance.diameter_factor=" << settings.clearance.diameter_factor << "\n";
  oss << "clearance.base_clearance_mm=" << settings.clearance.base_clearance_mm << "\n";
  oss << "nesting.enabled=" << (settings.nesting.enabled ? 1 : 0) << "\n";
  oss << "nesting.max_levels=" << settings.nesting.max_levels << "\n";
  oss << "nesting.prefer_same_sdr=" << (settings.nesting.prefer_same_sdr ? 1 : 0) << "\n";
  oss << "nesting.allow_mixed_sdr=" << (settings.nesting.allow_mixed_sdr ? 1 : 0) << "\n";
  oss << "nesting.heavy_extraction_threshold_kg=" << settings.nesting.heavy_extraction_threshold_kg << "\n";
  oss << "nesting.max_guest_weight_ratio=" << settings.nesting.max_guest_weight_ratio << "\n";
  oss << "packing.gap_mm=" << settings.packing.gap_mm << "\n";
  oss << "plan.min_pipe_length_m=" << settings.plan.min_pipe_length_m << "\n";
  oss << "plan.max_pipe_length_m=" << settings.plan.max_pipe_length_m << "\n";
  oss << "plan.weight_safety_margin_pct=" << settings.plan.weight_safety_margin_pct << "\n";
  oss << "plan.underutilization_threshold_pct=" << settings.plan.underutilization_threshold_pct << "\n";
  oss << "plan.max_total_pipes=" << settings.plan.max_total_pipes << "\n";
  oss << "plan.record_placement_trace=" << (settings.plan.record_placement_trace ? 1 : 0) << "\n";
  return oss.str();
}

EngineResult<bool> save_engine_settings(const EngineSettings& settings, const std::filesystem::path& path) {
  EngineResult<bool> result;
  std::ofstream ofs(path, std::ios::trunc);
  if (!ofs.is_open()) {
    result.error = "cannot open " + path.string() + " for writing";
    return result;
  }
  ofs << serialize_engine_settings(settings);
  if (!ofs.good()) {
    result.error = "failed writing " + path.string();
    return result;
  }
  result.ok = true;
  result.value = true;
  return result;
}

}  // namespace pipeload::core
