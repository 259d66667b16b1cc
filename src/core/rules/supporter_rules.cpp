#include "core/rules/supporter_rules.hpp"

namespace regen {

SupporterRules::SupporterRules(const TimeBucketing& time, CommunityRegistry& registry, ITokenLedger& ledger,
                               EventBus& bus)
    : time_(time), registry_(registry), ledger_(ledger), bus_(bus) {}

Result SupporterRules::burn(const Address& supporter, TokenAmount amount, BlockHeight block) {
  if (!registry_.is_active_as(supporter, UserType::Supporter)) {
    return Result::precondition("not-supporter", supporter + " is not an active supporter.");
  }
  if (amount == 0) {
    return Result::precondition("zero-amount", "Burn amount must be greater than zero.");
  }
  const Result burned = ledger_.burn_from(supporter, amount);
  if (!burned.ok) {
    return burned;
  }
  ledger_.add_certified(amount);

  SupporterProfile& profile = profiles_[supporter];
  profile.address = supporter;
  profile.certified += amount;
  ++profile.burns;
  profile.last_burn_at = block;

  DomainEvent event;
  event.kind = DomainEventKind::TokensBurned;
  event.event_id = "burn:" + supporter + ":" + std::to_string(profile.burns);
  event.block = block;
  event.era = time_.current_era(block);
  event.actor = supporter;
  event.subject = supporter;
  event.user_type = UserType::Supporter;
  event.amount = amount;
  const Result published = bus_.publish(event);
  if (!published.ok) {
    return published;
  }
  return Result::success("Certified " + std::to_string(amount) + " burned tokens.", std::to_string(profile.certified));
}

const SupporterProfile* SupporterRules::profile(const Address& address) const {
  const auto it = profiles_.find(address);
  return it == profiles_.end() ? nullptr : &it->second;
}

}  // namespace regen
