#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "core/community/community_registry.hpp"
#include "core/config/protocol_config.hpp"
#include "core/events/event_bus.hpp"
#include "core/pool/pool_set.hpp"

namespace regen {

struct InspectionRecord {
  std::uint64_t inspection_id = 0;
  Era era = 0;
  std::uint64_t score = 0;
  // Zero until the regenerator enters the pool.
  Level posted_level = 0;
  Era posted_era = 0;
};

struct RegeneratorProfile {
  Address address;
  std::uint64_t area = 0;
  bool pending_inspection = false;
  std::uint64_t total_inspections = 0;
  bool has_requested = false;
  BlockHeight last_request_at = 0;
  std::uint64_t regeneration_score = 0;
  bool on_contract_pool = false;
  bool qualified = false;
  std::vector<InspectionRecord> inspections;
};

// Owns regenerator profiles. Below min_inspections_to_pool nothing reaches
// the pool; the inspection that hits the threshold posts the whole
// accumulated score in its era, later ones post their own score.
class RegeneratorRules {
public:
  RegeneratorRules(const ProtocolConfig& config, CommunityRegistry& registry, PoolSet& pools, EventBus& bus);

  void attach();

  [[nodiscard]] const RegeneratorProfile* profile(const Address& address) const;
  [[nodiscard]] Level posted_level(const Address& address) const;
  [[nodiscard]] std::vector<RegeneratorProfile> profiles() const;

private:
  Result on_registered(const DomainEvent& event);
  Result on_requested(const DomainEvent& event);
  Result on_realized(const DomainEvent& event);
  Result on_invalidated(const DomainEvent& event);
  Result on_denied(const DomainEvent& event);

  Result post(RegeneratorProfile& profile, Level amount, const DomainEvent& cause);
  Result claw_back(RegeneratorProfile& profile, InspectionRecord& record, const DomainEvent& cause);

  const ProtocolConfig& config_;
  CommunityRegistry& registry_;
  PoolSet& pools_;
  EventBus& bus_;
  std::unordered_map<Address, RegeneratorProfile> profiles_;
  std::unordered_set<std::string> applied_events_;
};

}  // namespace regen
