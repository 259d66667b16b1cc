#include "core/time/time_bucketing.hpp"

namespace regen {

TimeBucketing::TimeBucketing(const EraSchedule& schedule) : schedule_(schedule) {}

std::optional<TimeBucketing> TimeBucketing::create(const EraSchedule& schedule) {
  if (schedule.blocks_per_era == 0 || schedule.halving == 0 || schedule.precision == 0) {
    return std::nullopt;
  }
  return TimeBucketing{schedule};
}

Era TimeBucketing::current_era(BlockHeight block) const {
  // Heights before deployment belong to the first era.
  if (block < schedule_.deploy_block) {
    return 1;
  }
  return ((block - schedule_.deploy_block) / schedule_.blocks_per_era) + 1;
}

Epoch TimeBucketing::epoch_of(Era era) const {
  if (era == 0) {
    return 1;
  }
  return ((era - 1) / schedule_.halving) + 1;
}

BlockHeight TimeBucketing::era_start_block(Era era) const {
  if (era == 0) {
    return schedule_.deploy_block;
  }
  return schedule_.deploy_block + ((era - 1) * schedule_.blocks_per_era);
}

BlockHeight TimeBucketing::era_end_block(Era era) const {
  return schedule_.deploy_block + (era * schedule_.blocks_per_era);
}

std::int64_t TimeBucketing::blocks_until_era_end(Era target_era, BlockHeight block) const {
  const BlockHeight end = era_end_block(target_era);
  if (end >= block) {
    return static_cast<std::int64_t>(end - block);
  }
  return -static_cast<std::int64_t>(block - end);
}

std::uint64_t TimeBucketing::elapsed_eras_since(Era user_era, BlockHeight block) const {
  const std::int64_t remaining = blocks_until_era_end(user_era, block);
  if (remaining >= 0) {
    return 0;
  }
  const auto elapsed_blocks = static_cast<unsigned __int128>(-remaining);
  return static_cast<std::uint64_t>((elapsed_blocks * schedule_.precision) / schedule_.blocks_per_era);
}

}  // namespace regen
