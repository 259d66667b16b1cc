#include "core/ledger/token_ledger.hpp"

#include <algorithm>

namespace regen {

Result InMemoryTokenLedger::mint(const Address& to, TokenAmount amount, bool locked) {
  if (to.empty()) {
    return Result::precondition("empty-address", "Cannot mint to an empty address.");
  }
  balances_[to] += amount;
  total_supply_ += amount;
  if (locked) {
    total_locked_ += amount;
  }
  return Result::success();
}

TokenAmount InMemoryTokenLedger::balance_of(const Address& address) const {
  const auto it = balances_.find(address);
  if (it == balances_.end()) {
    return 0;
  }
  return it->second;
}

Result InMemoryTokenLedger::transfer(const Address& from, const Address& to, TokenAmount amount) {
  if (to.empty()) {
    return Result::precondition("empty-address", "Transfer target is empty.");
  }
  const TokenAmount available = balance_of(from);
  if (available < amount) {
    return Result::precondition("insufficient-balance",
                                "Balance of " + from + " is below " + std::to_string(amount) + ".");
  }
  if (amount == 0 || from == to) {
    return Result::success();
  }
  balances_[from] = available - amount;
  balances_[to] += amount;
  return Result::success();
}

Result InMemoryTokenLedger::burn_from(const Address& from, TokenAmount amount) {
  const TokenAmount available = balance_of(from);
  if (available < amount) {
    return Result::precondition("insufficient-balance",
                                "Balance of " + from + " is below burn amount " + std::to_string(amount) + ".");
  }
  balances_[from] = available - amount;
  total_supply_ -= amount;
  return Result::success();
}

Result InMemoryTokenLedger::decrease_locked(TokenAmount amount) {
  if (total_locked_ < amount) {
    return Result::consistency("locked-underflow", "Locked supply is below the requested release.");
  }
  total_locked_ -= amount;
  return Result::success();
}

void InMemoryTokenLedger::add_certified(TokenAmount amount) {
  total_certified_ += amount;
}

std::vector<LedgerBalance> InMemoryTokenLedger::balances() const {
  std::vector<LedgerBalance> out;
  out.reserve(balances_.size());
  for (const auto& [address, balance] : balances_) {
    out.push_back({address, balance});
  }
  std::ranges::sort(out, [](const LedgerBalance& lhs, const LedgerBalance& rhs) {
    return lhs.address < rhs.address;
  });
  return out;
}

std::unique_ptr<InMemoryTokenLedger> make_token_ledger() {
  return std::make_unique<InMemoryTokenLedger>();
}

}  // namespace regen
