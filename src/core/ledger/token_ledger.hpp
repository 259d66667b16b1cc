#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/model/types.hpp"

namespace regen {

struct LedgerBalance {
  Address address;
  TokenAmount balance = 0;
};

// Balance ledger the pools pay out of. Pools call decrease_locked right
// before they transfer a withdrawal from their own address.
class ITokenLedger {
public:
  virtual ~ITokenLedger() = default;

  [[nodiscard]] virtual TokenAmount balance_of(const Address& address) const = 0;
  virtual Result transfer(const Address& from, const Address& to, TokenAmount amount) = 0;
  virtual Result burn_from(const Address& from, TokenAmount amount) = 0;
  virtual Result decrease_locked(TokenAmount amount) = 0;
  virtual void add_certified(TokenAmount amount) = 0;

  [[nodiscard]] virtual TokenAmount total_supply() const = 0;
  [[nodiscard]] virtual TokenAmount total_locked() const = 0;
  [[nodiscard]] virtual TokenAmount total_certified() const = 0;
};

class InMemoryTokenLedger final : public ITokenLedger {
public:
  // Locked mints back the pools; unlocked mints circulate immediately.
  Result mint(const Address& to, TokenAmount amount, bool locked);

  [[nodiscard]] TokenAmount balance_of(const Address& address) const override;
  Result transfer(const Address& from, const Address& to, TokenAmount amount) override;
  Result burn_from(const Address& from, TokenAmount amount) override;
  Result decrease_locked(TokenAmount amount) override;
  void add_certified(TokenAmount amount) override;

  [[nodiscard]] TokenAmount total_supply() const override { return total_supply_; }
  [[nodiscard]] TokenAmount total_locked() const override { return total_locked_; }
  [[nodiscard]] TokenAmount total_certified() const override { return total_certified_; }

  [[nodiscard]] std::vector<LedgerBalance> balances() const;

private:
  std::unordered_map<Address, TokenAmount> balances_;
  TokenAmount total_supply_ = 0;
  TokenAmount total_locked_ = 0;
  TokenAmount total_certified_ = 0;
};

std::unique_ptr<InMemoryTokenLedger> make_token_ledger();

}  // namespace regen
