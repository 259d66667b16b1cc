#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>

#include "core/config/protocol_config.hpp"
#include "core/ledger/token_ledger.hpp"
#include "core/model/types.hpp"
#include "core/time/time_bucketing.hpp"

namespace regen {

struct EraAggregate {
  std::uint64_t claims_count = 0;
  TokenAmount tokens_claimed = 0;
  Level total_levels = 0;
};

struct PoolAccount {
  Era current_era = 0;
  Level total_level = 0;
  TokenAmount tokens_withdrawn = 0;
  std::uint64_t withdrawals = 0;
};

struct WithdrawReceipt {
  Era era = 0;
  TokenAmount payout = 0;
  bool claimed = false;
  bool skipped = false;
  Era next_era = 0;
};

// Token budget of one participant class plus its per-era level and claim
// bookkeeping. The pool is additive: callers dedupe grants by event id.
class RewardPool {
public:
  RewardPool(PoolPolicy policy, const TimeBucketing& time, ITokenLedger& ledger);

  RewardPool(const RewardPool&) = delete;
  RewardPool& operator=(const RewardPool&) = delete;

  [[nodiscard]] PoolKind kind() const { return policy_.kind; }
  [[nodiscard]] const Address& address() const { return address_; }
  [[nodiscard]] TokenAmount total_pool_tokens() const { return policy_.total_pool_tokens; }

  // total / 2^epoch; the integer remainder stays locked in the pool.
  [[nodiscard]] TokenAmount tokens_per_epoch(Epoch epoch) const;
  [[nodiscard]] TokenAmount tokens_per_era(Epoch epoch, std::uint64_t halving) const;
  [[nodiscard]] TokenAmount tokens_per_era(Epoch epoch) const;

  void enroll(const Address& account, Era era);
  Result grant_level(const Address& account, Level amount, Era era, Era current_era);

  // With `denied` every era's levels go, not only `era`. A closed era keeps
  // its denominator frozen; only the account's slot is cleared.
  Result remove_level(const Address& account, Era era, Level amount, bool denied, Era current_era);

  // At most one payout per (account, era); repeats are no-ops.
  Result withdraw(const Address& account, BlockHeight block, WithdrawReceipt* receipt = nullptr);

  [[nodiscard]] Level level_of(const Address& account, Era era) const;
  [[nodiscard]] Level total_level_of(const Address& account) const;
  [[nodiscard]] EraAggregate era_aggregate(Era era) const;
  [[nodiscard]] bool has_withdrawn(const Address& account, Era era) const;
  [[nodiscard]] std::optional<PoolAccount> account(const Address& account) const;
  [[nodiscard]] Level total_active_levels() const { return total_active_levels_; }
  [[nodiscard]] std::size_t participant_count() const { return accounts_.size(); }
  [[nodiscard]] std::uint64_t eras_behind(const Address& account, BlockHeight block) const;
  [[nodiscard]] TokenAmount tokens_distributed() const { return tokens_distributed_; }

private:
  [[nodiscard]] Era next_claimable_era(const Address& account, Era after, Era current_era) const;
  [[nodiscard]] bool has_unclaimed_levels_from(const Address& account, Era from) const;

  PoolPolicy policy_;
  Address address_;
  const TimeBucketing& time_;
  ITokenLedger& ledger_;

  std::map<Era, EraAggregate> eras_;
  std::unordered_map<Address, std::map<Era, Level>> levels_;
  std::unordered_map<Address, PoolAccount> accounts_;
  std::set<std::pair<Era, Address>> withdrawn_;
  Level total_active_levels_ = 0;
  TokenAmount tokens_distributed_ = 0;
};

}  // namespace regen
