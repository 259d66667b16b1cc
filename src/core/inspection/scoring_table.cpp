#include "core/inspection/scoring_table.hpp"

namespace regen {

std::uint64_t ScoringTable::points_for(std::uint64_t value, const std::array<std::uint64_t, 6>& lower_bounds) {
  std::size_t tier = 0;
  for (std::size_t i = 0; i < lower_bounds.size(); ++i) {
    if (value >= lower_bounds[i]) {
      tier = i + 1;
    }
  }
  return kTierPoints[tier];
}

std::uint64_t ScoringTable::tree_points(std::uint64_t trees) const {
  return points_for(trees, thresholds_.trees);
}

std::uint64_t ScoringTable::biodiversity_points(std::uint64_t species) const {
  return points_for(species, thresholds_.biodiversity);
}

std::uint64_t ScoringTable::score(std::uint64_t trees, std::uint64_t species) const {
  return tree_points(trees) + biodiversity_points(species);
}

}  // namespace regen
