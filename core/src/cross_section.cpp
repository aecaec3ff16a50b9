#include "pipeload/core/cross_section.hpp"

#include <algorithm>

namespace pipeload::core {

namespace {

constexpr double kGeometryEps = 1e-9;

double row_shift(const CrossSectionState& state, double diameter_mm) {
  return state.offset_row ? diameter_mm * 0.5 : 0.0;
}

double right_edge(const CrossSectionState& state, double diameter_mm) {
  return state.cursor_z_mm + diameter_mm * 0.5 + row_shift(state, diameter_mm) + diameter_mm * 0.5;
}

void start_next_row(CrossSectionState& state) {
  state.cursor_z_mm = 0.0;
  state.row_base_y_mm += state.row_max_diameter_mm * kSqrt3Over2;
  state.offset_row = !state.offset_row;
  state.row_max_diameter_mm = 0.0;
  ++state.row_index;
}

}  // namespace

PlacementResult try_place(
    CrossSectionState& state,
    const Extent2d& envelope,
    double diameter_mm,
    const PackingSettings& settings) {
  PlacementResult result{};
  if (diameter_mm <= 0.0) {
    result.rejection = PlacementRejection::kWidth;
    return result;
  }

  CrossSectionState next = state;
  if (right_edge(next, diameter_mm) > envelope.width + kGeometryEps) {
    // An empty first row has nothing to wrap around; the width check below rejects it.
    if (next.row_max_diameter_mm > 0.0) {
      start_next_row(next);
    }
    if (right_edge(next, diameter_mm) > envelope.width + kGeometryEps) {
      result.rejection = PlacementRejection::kWidth;
      return result;
    }
  }
  if (next.row_base_y_mm + diameter_mm > envelope.height + kGeometryEps) {
    result.rejection = PlacementRejection::kHeight;
    return result;
  }

  result.accepted = true;
  result.center = {next.cursor_z_mm + row_shift(next, diameter_mm) + diameter_mm * 0.5,
                   next.row_base_y_mm + diameter_mm * 0.5};
  result.row = next.row_index;

  next.cursor_z_mm += diameter_mm + settings.gap_mm;
  next.row_max_diameter_mm = std::max(next.row_max_diameter_mm, diameter_mm);
  next.used_height_mm = std::max(next.used_height_mm, next.row_base_y_mm + diameter_mm);
  next.occupied_area_mm2 += circle_area(diameter_mm);
  ++next.placed_count;
  state = next;
  return result;
}

bool fits_empty_envelope(const Extent2d& envelope, double diameter_mm) {
  return diameter_mm > 0.0 && diameter_mm <= envelope.width + kGeometryEps &&
         diameter_mm <= envelope.height + kGeometryEps;
}

}  // namespace pipeload::core
