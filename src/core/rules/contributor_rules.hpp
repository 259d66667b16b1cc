#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "core/community/community_registry.hpp"
#include "core/config/protocol_config.hpp"
#include "core/events/event_bus.hpp"
#include "core/governance/governance_validation.hpp"
#include "core/pool/pool_set.hpp"
#include "core/time/time_bucketing.hpp"

namespace regen {

struct ContributorProfile {
  Address address;
  std::uint64_t resources_submitted = 0;
  std::uint64_t resources_invalidated = 0;
  bool has_submitted = false;
  BlockHeight last_submission_at = 0;
  std::uint64_t invitees_qualified = 0;
  Level levels_granted = 0;
};

// One engine for every type whose levels come from submitted resources or
// qualifying invitees; behaviour is selected by the TypePolicy.
class ContributorRules {
public:
  ContributorRules(const TypePolicy& policy, const ProtocolConfig& config, const TimeBucketing& time,
                   CommunityRegistry& registry, PoolSet& pools, GovernanceValidation& governance, EventBus& bus);

  void attach();

  Result submit(const ResourceDraft& draft, BlockHeight block);

  [[nodiscard]] UserType type() const { return policy_.type; }
  [[nodiscard]] const TypePolicy& policy() const { return policy_; }
  [[nodiscard]] const ContributorProfile* profile(const Address& address) const;
  [[nodiscard]] std::vector<ContributorProfile> profiles() const;

private:
  struct Grant {
    Address account;
    Era era = 0;
    Level level = 0;
  };

  Result on_registered(const DomainEvent& event);
  Result on_resource_invalidated(const DomainEvent& event);
  Result on_invitee_qualified(const DomainEvent& event);
  Result on_denied(const DomainEvent& event);
  Result grant(const Address& account, Level amount, const std::string& event_id, BlockHeight block, Era era);

  TypePolicy policy_;
  const ProtocolConfig& config_;
  const TimeBucketing& time_;
  CommunityRegistry& registry_;
  PoolSet& pools_;
  GovernanceValidation& governance_;
  EventBus& bus_;

  std::unordered_map<Address, ContributorProfile> profiles_;
  std::unordered_map<std::uint64_t, Grant> grants_by_resource_;
  std::unordered_set<std::string> applied_events_;
};

}  // namespace regen
