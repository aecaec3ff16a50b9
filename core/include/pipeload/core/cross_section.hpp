#pragma once

#include <cstddef>
#include <cstdint>

#include "pipeload/core/types.hpp"

namespace pipeload::core {

struct PackingSettings {
  double gap_mm = 20.0;
};

// Row cursor of the hexagonal row packer for one container.
// Rows fill across the width (z) and stack upwards (y); odd rows are shifted by half a diameter.
struct CrossSectionState {
  double cursor_z_mm = 0.0;
  double row_base_y_mm = 0.0;
  bool offset_row = false;
  double row_max_diameter_mm = 0.0;
  int row_index = 0;
  double used_height_mm = 0.0;
  double occupied_area_mm2 = 0.0;
  std::size_t placed_count = 0;
};

enum class PlacementRejection : std::uint8_t {
  kNone = 0,
  kWidth = 1,
  kHeight = 2,
};

struct PlacementResult {
  bool accepted = false;
  PlacementRejection rejection = PlacementRejection::kNone;
  Vec2d center{};
  int row = 0;
};

// Places a circle of the given diameter. The state only advances when the placement is accepted.
PlacementResult try_place(
    CrossSectionState& state,
    const Extent2d& envelope,
    double diameter_mm,
    const PackingSettings& settings = {});

// True when an empty envelope would accept the diameter on its first row.
[[nodiscard]] bool fits_empty_envelope(const Extent2d& envelope, double diameter_mm);

}  // namespace pipeload::core
