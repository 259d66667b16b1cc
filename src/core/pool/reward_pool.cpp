#include "core/pool/reward_pool.hpp"

#include <utility>
#include <vector>

#include "core/model/app_meta.hpp"

namespace regen {

RewardPool::RewardPool(PoolPolicy policy, const TimeBucketing& time, ITokenLedger& ledger)
    : policy_(policy),
      address_(std::string{kPoolAddressPrefix} + std::string{to_string(policy.kind)}),
      time_(time),
      ledger_(ledger) {}

TokenAmount RewardPool::tokens_per_epoch(Epoch epoch) const {
  if (epoch >= 64) {
    return 0;
  }
  return policy_.total_pool_tokens >> epoch;
}

TokenAmount RewardPool::tokens_per_era(Epoch epoch, std::uint64_t halving) const {
  if (halving == 0) {
    return 0;
  }
  return tokens_per_epoch(epoch) / halving;
}

TokenAmount RewardPool::tokens_per_era(Epoch epoch) const {
  return tokens_per_era(epoch, time_.halving());
}

void RewardPool::enroll(const Address& account, Era era) {
  if (accounts_.contains(account)) {
    return;
  }
  PoolAccount state;
  state.current_era = era;
  accounts_.emplace(account, state);
}

Result RewardPool::grant_level(const Address& account, Level amount, Era era, Era current_era) {
  if (era == 0) {
    return Result::consistency("era-zero", "Levels cannot be granted to era 0.");
  }
  if (amount == 0) {
    return Result::success();
  }
  const auto era_it = eras_.find(era);
  if (era < current_era && era_it != eras_.end() && era_it->second.claims_count > 0) {
    return Result::consistency("closed-era-claimed",
                               "Era " + std::to_string(era) + " of " + address_ + " already paid out.");
  }

  enroll(account, era);
  PoolAccount& state = accounts_.at(account);
  if (state.current_era < era && !has_unclaimed_levels_from(account, state.current_era)) {
    state.current_era = era;
  }

  levels_[account][era] += amount;
  eras_[era].total_levels += amount;
  state.total_level += amount;
  total_active_levels_ += amount;
  return Result::success();
}

Result RewardPool::remove_level(const Address& account, Era era, Level amount, bool denied, Era current_era) {
  const auto levels_it = levels_.find(account);
  if (denied) {
    if (levels_it == levels_.end()) {
      return Result::success();
    }
    for (const auto& [level_era, level] : levels_it->second) {
      if (level_era >= current_era && eras_[level_era].total_levels < level) {
        return Result::consistency("era-underflow", "Era total below account level in " + address_ + ".");
      }
    }
    Level removed = 0;
    for (auto& [level_era, level] : levels_it->second) {
      if (level_era >= current_era) {
        eras_[level_era].total_levels -= level;
      }
      removed += level;
      level = 0;
    }
    if (total_active_levels_ < removed) {
      return Result::consistency("pool-underflow", "Active levels below removed amount in " + address_ + ".");
    }
    total_active_levels_ -= removed;
    accounts_[account].total_level = 0;
    levels_.erase(levels_it);
    return Result::success(std::to_string(removed));
  }

  if (amount == 0) {
    return Result::success("0");
  }
  const Level held = level_of(account, era);
  if (held < amount) {
    return Result::consistency("level-underflow", "Account " + account + " holds " + std::to_string(held) +
                                                      " levels in era " + std::to_string(era) + ", cannot remove " +
                                                      std::to_string(amount) + ".");
  }
  const bool ongoing = era >= current_era;
  if (ongoing && eras_[era].total_levels < amount) {
    return Result::consistency("era-underflow", "Era total below removal amount in " + address_ + ".");
  }
  if (total_active_levels_ < amount) {
    return Result::consistency("pool-underflow", "Active levels below removal amount in " + address_ + ".");
  }

  levels_it->second[era] = held - amount;
  if (ongoing) {
    eras_[era].total_levels -= amount;
  }
  accounts_[account].total_level -= amount;
  total_active_levels_ -= amount;
  return Result::success(std::to_string(amount));
}

Result RewardPool::withdraw(const Address& account, BlockHeight block, WithdrawReceipt* receipt) {
  const auto account_it = accounts_.find(account);
  if (account_it == accounts_.end()) {
    return Result::precondition("not-enrolled", account + " has no position in " + address_ + ".");
  }
  PoolAccount& state = account_it->second;
  const Era current = time_.current_era(block);
  const Era recorded = state.current_era;

  WithdrawReceipt local;
  local.era = recorded;
  local.next_era = recorded;
  if (recorded >= current) {
    if (receipt != nullptr) {
      *receipt = local;
    }
    return Result::success("Era " + std::to_string(recorded) + " is still running.", "0");
  }

  if (withdrawn_.contains({recorded, account})) {
    state.current_era = next_claimable_era(account, recorded, current);
    local.next_era = state.current_era;
    if (receipt != nullptr) {
      *receipt = local;
    }
    return Result::success("Era " + std::to_string(recorded) + " already claimed.", "0");
  }

  const TokenAmount era_budget = tokens_per_era(time_.epoch_of(recorded));
  const Level level = level_of(account, recorded);
  if (level == 0) {
    state.current_era = current;
    local.skipped = true;
    local.next_era = current;
    if (receipt != nullptr) {
      *receipt = local;
    }
    return Result::success("No levels in era " + std::to_string(recorded) + "; pointer moved to era " +
                               std::to_string(current) + ".",
                           "0");
  }

  EraAggregate& aggregate = eras_[recorded];
  if (aggregate.total_levels == 0 || aggregate.total_levels < level) {
    return Result::consistency("era-denominator", "Era " + std::to_string(recorded) + " of " + address_ +
                                                      " has a total below the account level.");
  }
  const auto payout = static_cast<TokenAmount>((static_cast<unsigned __int128>(level) * era_budget) /
                                               aggregate.total_levels);
  if (aggregate.tokens_claimed + payout > era_budget) {
    return Result::consistency("era-overdraw", "Payout would exceed the budget of era " + std::to_string(recorded) +
                                                   " in " + address_ + ".");
  }
  if (ledger_.balance_of(address_) < payout || ledger_.total_locked() < payout) {
    return Result::consistency("pool-balance", address_ + " cannot cover a payout of " + std::to_string(payout) + ".");
  }

  const Result unlocked = ledger_.decrease_locked(payout);
  if (!unlocked.ok) {
    return unlocked;
  }
  const Result credited = ledger_.transfer(address_, account, payout);
  if (!credited.ok) {
    return Result::consistency("pool-transfer", credited.message);
  }

  withdrawn_.insert({recorded, account});
  ++aggregate.claims_count;
  aggregate.tokens_claimed += payout;
  state.tokens_withdrawn += payout;
  ++state.withdrawals;
  tokens_distributed_ += payout;
  state.current_era = next_claimable_era(account, recorded, current);

  local.payout = payout;
  local.claimed = true;
  local.next_era = state.current_era;
  if (receipt != nullptr) {
    *receipt = local;
  }
  return Result::success("Withdrew " + std::to_string(payout) + " for era " + std::to_string(recorded) + ".",
                         std::to_string(payout));
}

Level RewardPool::level_of(const Address& account, Era era) const {
  const auto it = levels_.find(account);
  if (it == levels_.end()) {
    return 0;
  }
  const auto era_it = it->second.find(era);
  return era_it == it->second.end() ? 0 : era_it->second;
}

Level RewardPool::total_level_of(const Address& account) const {
  const auto it = accounts_.find(account);
  return it == accounts_.end() ? 0 : it->second.total_level;
}

EraAggregate RewardPool::era_aggregate(Era era) const {
  const auto it = eras_.find(era);
  return it == eras_.end() ? EraAggregate{} : it->second;
}

bool RewardPool::has_withdrawn(const Address& account, Era era) const {
  return withdrawn_.contains({era, account});
}

std::optional<PoolAccount> RewardPool::account(const Address& account) const {
  const auto it = accounts_.find(account);
  if (it == accounts_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::uint64_t RewardPool::eras_behind(const Address& account, BlockHeight block) const {
  const auto it = accounts_.find(account);
  if (it == accounts_.end()) {
    return 0;
  }
  return time_.elapsed_eras_since(it->second.current_era, block);
}

Era RewardPool::next_claimable_era(const Address& account, Era after, Era current_era) const {
  const auto it = levels_.find(account);
  if (it != levels_.end()) {
    for (auto era_it = it->second.upper_bound(after); era_it != it->second.end(); ++era_it) {
      if (era_it->first >= current_era) {
        break;
      }
      if (era_it->second > 0 && !withdrawn_.contains({era_it->first, account})) {
        return era_it->first;
      }
    }
  }
  return current_era;
}

bool RewardPool::has_unclaimed_levels_from(const Address& account, Era from) const {
  const auto it = levels_.find(account);
  if (it == levels_.end()) {
    return false;
  }
  for (auto era_it = it->second.lower_bound(from); era_it != it->second.end(); ++era_it) {
    if (era_it->second > 0 && !withdrawn_.contains({era_it->first, account})) {
      return true;
    }
  }
  return false;
}

}  // namespace regen
