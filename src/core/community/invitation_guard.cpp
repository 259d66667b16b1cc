#include "core/community/invitation_guard.hpp"

namespace regen {

Level InvitationGuard::required_level(Level total_levels_of_type, std::uint64_t total_users_of_type) const {
  if (total_users_of_type <= bootstrap_threshold_ || total_users_of_type == 0) {
    return 0;
  }
  return total_levels_of_type / total_users_of_type + 1;
}

bool InvitationGuard::can_invite(Level total_levels_of_type, std::uint64_t total_users_of_type,
                                 Level inviter_levels) const {
  if (total_users_of_type <= bootstrap_threshold_) {
    return true;
  }
  return inviter_levels >= required_level(total_levels_of_type, total_users_of_type);
}

bool InvitationGuard::can_invite(const LevelSnapshot& snapshot) const {
  return can_invite(snapshot.total_levels_of_type, snapshot.total_users_of_type, snapshot.own_levels);
}

}  // namespace regen
