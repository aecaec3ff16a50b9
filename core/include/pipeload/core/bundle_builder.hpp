#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "pipeload/core/compatibility.hpp"
#include "pipeload/core/entities.hpp"

namespace pipeload::core {

struct NestingSettings {
  bool enabled = true;
  int max_levels = 4;
  bool prefer_same_sdr = true;
  bool allow_mixed_sdr = true;
  double heavy_extraction_threshold_kg = 2000.0;
  // Advisory only: guest heavier per metre than ratio x host raises a warning.
  double max_guest_weight_ratio = 2.0;
};

struct InventoryEntry {
  PipeType pipe_type{};
  int quantity = 0;
};

// A pipe type that still has stock and passed the clearance check for the current host.
struct GuestCandidate {
  const PipeType* pipe_type = nullptr;
  int remaining = 0;
};

// Picks the guest for one nesting step. Candidates arrive already filtered for
// clearance and SDR policy, ordered by outer diameter descending.
class GuestSelector {
 public:
  virtual ~GuestSelector() = default;

  [[nodiscard]] virtual std::optional<std::size_t> Select(
      const PipeType& host,
      const std::vector<GuestCandidate>& candidates,
      const NestingSettings& settings) const = 0;
};

// Largest outer diameter wins; exact diameter ties go to the host's SDR when preferred.
class LargestFitSelector final : public GuestSelector {
 public:
  [[nodiscard]] std::optional<std::size_t> Select(
      const PipeType& host,
      const std::vector<GuestCandidate>& candidates,
      const NestingSettings& settings) const override;
};

struct BundleBuildResult {
  std::vector<Bundle> bundles{};
  std::vector<std::string> warnings{};
  std::size_t total_pipes = 0;
  std::size_t nested_pipes = 0;
};

// Builds a bundle from a chain ordered outer to inner and derives its weights.
[[nodiscard]] Bundle make_bundle(
    BundleId id,
    std::vector<PipeType> chain,
    double pipe_length_m,
    double heavy_extraction_threshold_kg);

// Greedy single-pass Matryoshka nesting. This is a heuristic: it never
// backtracks over a guest choice and nests at most one chain per host.
// Swap the selector to change step 2a without touching the rest.
[[nodiscard]] BundleBuildResult build_bundles(
    const std::vector<InventoryEntry>& inventory,
    double pipe_length_m,
    const NestingSettings& settings = {},
    const ClearanceParams& clearance = {},
    const GuestSelector* selector = nullptr);

}  // namespace pipeload::core
