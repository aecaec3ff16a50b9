#include "pipeload/core/compatibility.hpp"

#include <cstdio>

namespace pipeload::core {

namespace {

std::string format_clearance_message(double available, double required, bool compatible) {
  char buffer[128];
  if (compatible) {
    std::snprintf(buffer, sizeof(buffer), "Valid: %.1fmm gap >= %.1fmm required", available, required);
  } else {
    std::snprintf(buffer, sizeof(buffer), "Invalid: %.1fmm gap < %.1fmm required (deficit: %.1fmm)", available,
                  required, required - available);
  }
  return buffer;
}

}  // namespace

double effective_inner_diameter_mm(const PipeType& host, const ClearanceParams& params) {
  return host.inner_diameter_mm * (1.0 - params.ovality_factor);
}

double required_gap_mm(const PipeType& host, const ClearanceParams& params) {
  return params.base_clearance_mm + params.diameter_factor * host.outer_diameter_mm;
}

ClearanceReport evaluate_clearance(const PipeType& host, const PipeType& guest, const ClearanceParams& params) {
  ClearanceReport report{};
  report.effective_inner_diameter_mm = effective_inner_diameter_mm(host, params);
  report.available_gap_mm = report.effective_inner_diameter_mm - guest.outer_diameter_mm;
  report.required_gap_mm = required_gap_mm(host, params);
  // A guest at least as wide as the host never nests, whatever the parameters say.
  report.compatible = guest.outer_diameter_mm < host.outer_diameter_mm &&
                      report.available_gap_mm >= report.required_gap_mm;
  report.message = format_clearance_message(report.available_gap_mm, report.required_gap_mm, report.compatible);
  return report;
}

bool is_compatible(const PipeType& host, const PipeType& guest, const ClearanceParams& params) {
  if (guest.outer_diameter_mm >= host.outer_diameter_mm) {
    return false;
  }
  const double available = effective_inner_diameter_mm(host, params) - guest.outer_diameter_mm;
  return available >= required_gap_mm(host, params);
}

}  // namespace pipeload::core
