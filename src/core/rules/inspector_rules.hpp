#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "core/community/community_registry.hpp"
#include "core/config/protocol_config.hpp"
#include "core/events/event_bus.hpp"
#include "core/pool/pool_set.hpp"

namespace regen {

struct PostedLevel {
  Era era = 0;
  Level level = 0;
};

struct InspectorProfile {
  Address address;
  std::uint64_t total_inspections = 0;
  std::uint64_t give_ups = 0;
  std::uint64_t penalties = 0;
  bool has_accepted = false;
  BlockHeight last_accepted_at = 0;
  BlockHeight last_realized_at = 0;
  std::optional<std::uint64_t> active_inspection;
  // Append-only.
  std::set<Address> excluded_regenerators;
  bool qualified = false;
  std::map<std::uint64_t, PostedLevel> levels_by_inspection;
};

class InspectorRules {
public:
  InspectorRules(const ProtocolConfig& config, CommunityRegistry& registry, PoolSet& pools, EventBus& bus);

  void attach();

  [[nodiscard]] const InspectorProfile* profile(const Address& address) const;
  [[nodiscard]] bool has_inspected(const Address& inspector, const Address& regenerator) const;
  [[nodiscard]] std::vector<InspectorProfile> profiles() const;

private:
  Result on_registered(const DomainEvent& event);
  Result on_accepted(const DomainEvent& event);
  Result on_realized(const DomainEvent& event);
  Result on_expired(const DomainEvent& event);
  Result on_invalidated(const DomainEvent& event);
  Result on_denied(const DomainEvent& event);

  InspectorProfile* find(const Address& address);

  const ProtocolConfig& config_;
  CommunityRegistry& registry_;
  PoolSet& pools_;
  EventBus& bus_;
  std::unordered_map<Address, InspectorProfile> profiles_;
  std::unordered_set<std::string> applied_events_;
};

}  // namespace regen
