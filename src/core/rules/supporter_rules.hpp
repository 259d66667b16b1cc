#pragma once

#include <unordered_map>

#include "core/community/community_registry.hpp"
#include "core/events/event_bus.hpp"
#include "core/ledger/token_ledger.hpp"
#include "core/time/time_bucketing.hpp"

namespace regen {

struct SupporterProfile {
  Address address;
  TokenAmount certified = 0;
  std::uint64_t burns = 0;
  BlockHeight last_burn_at = 0;
};

// Supporters offset by burning tokens; each burn is a certificate.
class SupporterRules {
public:
  SupporterRules(const TimeBucketing& time, CommunityRegistry& registry, ITokenLedger& ledger, EventBus& bus);

  Result burn(const Address& supporter, TokenAmount amount, BlockHeight block);

  [[nodiscard]] const SupporterProfile* profile(const Address& address) const;

private:
  const TimeBucketing& time_;
  CommunityRegistry& registry_;
  ITokenLedger& ledger_;
  EventBus& bus_;
  std::unordered_map<Address, SupporterProfile> profiles_;
};

}  // namespace regen
