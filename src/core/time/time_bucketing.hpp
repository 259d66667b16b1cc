#pragma once

#include <cstdint>
#include <optional>

#include "core/model/types.hpp"

namespace regen {

struct EraSchedule {
  BlockHeight deploy_block = 0;
  BlockHeight blocks_per_era = 0;
  std::uint64_t halving = 0;
  std::uint64_t precision = 100'000;
};

// Pure block -> era -> epoch arithmetic. Eras and epochs are 1-indexed.
class TimeBucketing {
public:
  // No value when blocks_per_era, halving or precision is zero.
  static std::optional<TimeBucketing> create(const EraSchedule& schedule);

  [[nodiscard]] Era current_era(BlockHeight block) const;
  [[nodiscard]] Epoch epoch_of(Era era) const;

  // > 0 while `target_era` runs, 0 on the first block after it, < 0 later.
  [[nodiscard]] std::int64_t blocks_until_era_end(Era target_era, BlockHeight block) const;

  // Full era-lengths elapsed since `user_era` ended, scaled by precision.
  [[nodiscard]] std::uint64_t elapsed_eras_since(Era user_era, BlockHeight block) const;

  [[nodiscard]] BlockHeight era_start_block(Era era) const;
  [[nodiscard]] BlockHeight era_end_block(Era era) const;

  [[nodiscard]] const EraSchedule& schedule() const { return schedule_; }
  [[nodiscard]] std::uint64_t halving() const { return schedule_.halving; }
  [[nodiscard]] std::uint64_t precision() const { return schedule_.precision; }

private:
  explicit TimeBucketing(const EraSchedule& schedule);

  EraSchedule schedule_;
};

}  // namespace regen
