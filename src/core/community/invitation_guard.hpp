#pragma once

#include <cstdint>

#include "core/model/types.hpp"

namespace regen {

// Aggregates of the inviter's (or voter's) own type at the time of the call.
struct LevelSnapshot {
  Level total_levels_of_type = 0;
  std::uint64_t total_users_of_type = 0;
  Level own_levels = 0;
};

// Anti-Sybil gate: once a type is past its bootstrap population only
// strictly above-average accounts may grow the network or vote.
class InvitationGuard {
public:
  explicit InvitationGuard(std::uint64_t bootstrap_threshold) : bootstrap_threshold_(bootstrap_threshold) {}

  [[nodiscard]] bool can_invite(Level total_levels_of_type, std::uint64_t total_users_of_type,
                                Level inviter_levels) const;
  [[nodiscard]] bool can_invite(const LevelSnapshot& snapshot) const;

  // avg + 1, or 0 while the bootstrap bypass applies.
  [[nodiscard]] Level required_level(Level total_levels_of_type, std::uint64_t total_users_of_type) const;

  [[nodiscard]] std::uint64_t bootstrap_threshold() const { return bootstrap_threshold_; }

private:
  std::uint64_t bootstrap_threshold_;
};

}  // namespace regen
