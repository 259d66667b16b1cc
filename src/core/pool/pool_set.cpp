#include "core/pool/pool_set.hpp"

namespace regen {

PoolSet::PoolSet(const ProtocolConfig& config, const TimeBucketing& time, ITokenLedger& ledger) {
  pools_.reserve(kPoolKindCount);
  for (const PoolKind kind : all_pool_kinds()) {
    PoolPolicy policy{.kind = kind, .total_pool_tokens = 0};
    if (const PoolPolicy* configured = config.pool_policy(kind); configured != nullptr) {
      policy = *configured;
    }
    pools_.push_back(std::make_unique<RewardPool>(policy, time, ledger));
  }
}

RewardPool& PoolSet::pool(PoolKind kind) {
  return *pools_.at(static_cast<std::size_t>(kind));
}

const RewardPool& PoolSet::pool(PoolKind kind) const {
  return *pools_.at(static_cast<std::size_t>(kind));
}

RewardPool* PoolSet::pool_for(UserType type) {
  const auto kind = pool_for_type(type);
  return kind.has_value() ? &pool(*kind) : nullptr;
}

const RewardPool* PoolSet::pool_for(UserType type) const {
  const auto kind = pool_for_type(type);
  return kind.has_value() ? &pool(*kind) : nullptr;
}

Level PoolSet::level_of(UserType type, const Address& account) const {
  const RewardPool* target = pool_for(type);
  return target == nullptr ? 0 : target->total_level_of(account);
}

Level PoolSet::total_levels(UserType type) const {
  const RewardPool* target = pool_for(type);
  return target == nullptr ? 0 : target->total_active_levels();
}

Result PoolSet::strip_all(const Address& account, UserType type, Era current_era) {
  if (RewardPool* target = pool_for(type); target != nullptr) {
    const Result removed = target->remove_level(account, current_era, 0, true, current_era);
    if (!removed.ok) {
      return removed;
    }
  }
  return pool(PoolKind::Validator).remove_level(account, current_era, 0, true, current_era);
}

void PoolSet::attach(EventBus& bus) {
  bus.subscribe(DomainEventKind::UserDenied, "pools.strip", [this](const DomainEvent& event) {
    return strip_all(event.subject, event.user_type, event.era);
  });
}

}  // namespace regen
