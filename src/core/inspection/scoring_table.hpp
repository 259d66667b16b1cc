#pragma once

#include <array>
#include <cstdint>

#include "core/config/protocol_config.hpp"

namespace regen {

// Seven-tier point table shared by trees and biodiversity results.
class ScoringTable {
public:
  static constexpr std::array<std::uint64_t, 7> kTierPoints = {0, 1, 2, 4, 8, 16, 32};
  static constexpr std::uint64_t kMaxScore = 64;

  explicit ScoringTable(const ScoringThresholds& thresholds) : thresholds_(thresholds) {}

  [[nodiscard]] std::uint64_t tree_points(std::uint64_t trees) const;
  [[nodiscard]] std::uint64_t biodiversity_points(std::uint64_t species) const;
  [[nodiscard]] std::uint64_t score(std::uint64_t trees, std::uint64_t species) const;

  static std::uint64_t points_for(std::uint64_t value, const std::array<std::uint64_t, 6>& lower_bounds);

private:
  ScoringThresholds thresholds_;
};

}  // namespace regen
