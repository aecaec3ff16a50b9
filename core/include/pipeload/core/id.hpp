#pragma once

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>

namespace pipeload::core {

using ObjectId = std::uint64_t;
constexpr ObjectId kInvalidObjectId = 0;

using PipeTypeId = ObjectId;
using BundleId = ObjectId;

class IdGenerator {
 public:
  explicit IdGenerator(ObjectId next_id = 1) : next_id_(next_id) {}

  [[nodiscard]] ObjectId next() { return next_id_++; }

 private:
  ObjectId next_id_ = 1;
};

inline std::string make_display_id(std::string_view prefix, std::uint64_t sequence, int pad_width = 4) {
  std::ostringstream oss;
  oss << prefix << "-" << std::setw(pad_width) << std::setfill('0') << sequence;
  return oss.str();
}

// Per-prefix counters so "B-0001" and "T-0001" advance independently within one run.
class DisplayIdSequencer {
 public:
  std::string next(std::string_view prefix, int pad_width = 4) {
    std::uint64_t& counter = counters_[std::string(prefix)];
    ++counter;
    return make_display_id(prefix, counter, pad_width);
  }

 private:
  std::unordered_map<std::string, std::uint64_t> counters_{};
};

}  // namespace pipeload::core
