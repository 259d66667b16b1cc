#pragma once

#include <memory>
#include <vector>

#include "core/config/protocol_config.hpp"
#include "core/events/event_bus.hpp"
#include "core/ledger/token_ledger.hpp"
#include "core/pool/reward_pool.hpp"
#include "core/time/time_bucketing.hpp"

namespace regen {

// The seven reward pools, indexed by PoolKind.
class PoolSet {
public:
  PoolSet(const ProtocolConfig& config, const TimeBucketing& time, ITokenLedger& ledger);

  RewardPool& pool(PoolKind kind);
  [[nodiscard]] const RewardPool& pool(PoolKind kind) const;

  // nullptr for Supporter, Denied and Undefined.
  RewardPool* pool_for(UserType type);
  [[nodiscard]] const RewardPool* pool_for(UserType type) const;

  [[nodiscard]] Level level_of(UserType type, const Address& account) const;
  [[nodiscard]] Level total_levels(UserType type) const;

  // Removes every level the account holds in its type pool and in the
  // Validator pool.
  Result strip_all(const Address& account, UserType type, Era current_era);

  // Hooks strip_all onto UserDenied.
  void attach(EventBus& bus);

private:
  std::vector<std::unique_ptr<RewardPool>> pools_;
};

}  // namespace regen
