#include "pipeload/core/bundle_builder.hpp"

#include <algorithm>
#include <cstdio>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace pipeload::core {

namespace {

struct StockSlot {
  PipeType pipe_type{};
  int remaining = 0;
};

std::vector<StockSlot> merge_inventory(const std::vector<InventoryEntry>& inventory) {
  std::vector<StockSlot> slots;
  for (const InventoryEntry& entry : inventory) {
    if (entry.quantity <= 0) {
      continue;
    }
    auto it = std::find_if(slots.begin(), slots.end(), [&](const StockSlot& slot) {
      return slot.pipe_type.id == entry.pipe_type.id;
    });
    if (it != slots.end()) {
      it->remaining += entry.quantity;
    } else {
      slots.push_back({entry.pipe_type, entry.quantity});
    }
  }
  std::stable_sort(slots.begin(), slots.end(), [](const StockSlot& a, const StockSlot& b) {
    return a.pipe_type.outer_diameter_mm > b.pipe_type.outer_diameter_mm;
  });
  return slots;
}

std::string format_kg(double value) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.1f", value);
  return buffer;
}

void collect_pair_advisories(
    const PipeType& host,
    const PipeType& guest,
    const NestingSettings& settings,
    std::set<std::pair<PipeTypeId, PipeTypeId>>& reported,
    std::vector<std::string>& warnings) {
  if (!reported.insert({host.id, guest.id}).second) {
    return;
  }
  const double host_weight = host.weight_per_meter_kg;
  const double guest_weight = guest.weight_per_meter_kg;
  if (host_weight > 0.0 && guest_weight / host_weight > settings.max_guest_weight_ratio) {
    warnings.push_back("Inner pipe " + guest.code + " (" + format_kg(guest_weight) + " kg/m) is more than " +
                       format_kg(settings.max_guest_weight_ratio) + "x heavier than outer pipe " + host.code + " (" +
                       format_kg(host_weight) + " kg/m)");
  }
  // Higher SDR means a thinner wall on the host.
  if (host.sdr > guest.sdr && guest_weight > host_weight) {
    warnings.push_back("Caution: heavier pipe " + guest.code + " (SDR" + std::to_string(guest.sdr) +
                       ") inside lighter pipe " + host.code + " (SDR" + std::to_string(host.sdr) +
                       ") may deform the outer pipe");
  }
}

}  // namespace

std::optional<std::size_t> LargestFitSelector::Select(
    const PipeType& host,
    const std::vector<GuestCandidate>& candidates,
    const NestingSettings& settings) const {
  std::optional<std::size_t> best;
  for (std::size_t i = 0; i < candidates.size(); ++i) {
    const PipeType* candidate = candidates[i].pipe_type;
    if (candidate == nullptr || candidates[i].remaining <= 0) {
      continue;
    }
    if (!best) {
      best = i;
      continue;
    }
    const PipeType* current = candidates[*best].pipe_type;
    if (candidate->outer_diameter_mm > current->outer_diameter_mm) {
      best = i;
    } else if (candidate->outer_diameter_mm == current->outer_diameter_mm && settings.prefer_same_sdr &&
               current->sdr != host.sdr && candidate->sdr == host.sdr) {
      best = i;
    }
  }
  return best;
}

Bundle make_bundle(BundleId id, std::vector<PipeType> chain, double pipe_length_m, double heavy_extraction_threshold_kg) {
  Bundle bundle{};
  bundle.id = id;
  bundle.chain = std::move(chain);
  bundle.pipe_length_m = pipe_length_m;
  double total = 0.0;
  for (const PipeType& pipe : bundle.chain) {
    total += pipe.weight_per_meter_kg * pipe_length_m;
  }
  bundle.total_weight_kg = total;
  if (!bundle.chain.empty()) {
    bundle.inner_weight_kg = total - bundle.chain.front().weight_per_meter_kg * pipe_length_m;
  }
  bundle.extraction_warning = bundle.inner_weight_kg > heavy_extraction_threshold_kg;
  return bundle;
}

BundleBuildResult build_bundles(
    const std::vector<InventoryEntry>& inventory,
    double pipe_length_m,
    const NestingSettings& settings,
    const ClearanceParams& clearance,
    const GuestSelector* selector) {
  const LargestFitSelector default_selector;
  const GuestSelector& chooser = selector != nullptr ? *selector : default_selector;
  const std::size_t max_depth =
      settings.enabled ? static_cast<std::size_t>(std::max(1, settings.max_levels)) : std::size_t{1};

  BundleBuildResult result{};
  std::vector<StockSlot> slots = merge_inventory(inventory);
  std::set<std::pair<PipeTypeId, PipeTypeId>> reported_pairs;
  IdGenerator bundle_ids;
  DisplayIdSequencer display_ids;

  while (true) {
    auto host_it = std::find_if(slots.begin(), slots.end(), [](const StockSlot& slot) { return slot.remaining > 0; });
    if (host_it == slots.end()) {
      break;
    }
    --host_it->remaining;
    std::vector<PipeType> chain{host_it->pipe_type};

    while (chain.size() < max_depth) {
      const PipeType& current = chain.back();
      std::vector<GuestCandidate> candidates;
      std::vector<std::size_t> slot_of_candidate;
      for (std::size_t i = 0; i < slots.size(); ++i) {
        const StockSlot& slot = slots[i];
        if (slot.remaining <= 0) {
          continue;
        }
        if (!settings.allow_mixed_sdr && slot.pipe_type.sdr != current.sdr) {
          continue;
        }
        if (!is_compatible(current, slot.pipe_type, clearance)) {
          continue;
        }
        candidates.push_back({&slot.pipe_type, slot.remaining});
        slot_of_candidate.push_back(i);
      }
      if (candidates.empty()) {
        break;
      }
      const std::optional<std::size_t> pick = chooser.Select(current, candidates, settings);
      if (!pick || *pick >= candidates.size()) {
        break;
      }
      StockSlot& chosen = slots[slot_of_candidate[*pick]];
      --chosen.remaining;
      collect_pair_advisories(current, chosen.pipe_type, settings, reported_pairs, result.warnings);
      chain.push_back(chosen.pipe_type);
    }

    result.total_pipes += chain.size();
    result.nested_pipes += chain.size() - 1;
    Bundle bundle = make_bundle(bundle_ids.next(), std::move(chain), pipe_length_m, settings.heavy_extraction_threshold_kg);
    bundle.display_id = display_ids.next("B");
    result.bundles.push_back(std::move(bundle));
  }
  return result;
}

}  // namespace pipeload::core
