#pragma once

#include <string>

#include "pipeload/core/entities.hpp"

namespace pipeload::core {

struct ClearanceParams {
  double ovality_factor = 0.04;
  double diameter_factor = 0.015;
  double base_clearance_mm = 15.0;
};

struct ClearanceReport {
  double effective_inner_diameter_mm = 0.0;
  double available_gap_mm = 0.0;
  double required_gap_mm = 0.0;
  bool compatible = false;
  std::string message{};
};

// Host inner bore shrunk by ovality, then compared against a clearance that grows with the host size.
[[nodiscard]] ClearanceReport evaluate_clearance(
    const PipeType& host,
    const PipeType& guest,
    const ClearanceParams& params = {});

[[nodiscard]] bool is_compatible(const PipeType& host, const PipeType& guest, const ClearanceParams& params = {});

[[nodiscard]] double required_gap_mm(const PipeType& host, const ClearanceParams& params = {});

[[nodiscard]] double effective_inner_diameter_mm(const PipeType& host, const ClearanceParams& params = {});

}  // namespace pipeload::core
