#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "core/community/community_registry.hpp"
#include "core/config/protocol_config.hpp"
#include "core/events/event_bus.hpp"
#include "core/governance/governance_validation.hpp"
#include "core/inspection/scoring_table.hpp"
#include "core/rules/inspector_rules.hpp"
#include "core/rules/regenerator_rules.hpp"
#include "core/time/time_bucketing.hpp"

namespace regen {

enum class InspectionStatus {
  Open,
  Accepted,
  Inspected,
  Invalidated,
};

std::string_view to_string(InspectionStatus status);

struct Inspection {
  std::uint64_t id = 0;
  InspectionStatus status = InspectionStatus::Open;
  Address regenerator;
  Address inspector;
  std::uint64_t trees_result = 0;
  std::uint64_t biodiversity_result = 0;
  std::uint64_t regeneration_score = 0;
  std::string evidence_hash;
  std::string justification_hash;
  BlockHeight created_at = 0;
  BlockHeight accepted_at = 0;
  BlockHeight inspected_at = 0;
  Era inspected_at_era = 0;
  BlockHeight invalidated_at = 0;
  std::uint64_t expirations = 0;
};

struct EraImpact {
  std::uint64_t trees = 0;
  std::uint64_t biodiversity = 0;
  std::uint64_t realized = 0;
  std::uint64_t invalidated = 0;
  std::uint64_t expired = 0;
  std::uint64_t score = 0;
};

// Open -> Accepted -> Inspected, Invalidated from Accepted or Inspected.
// An expired acceptance reopens the inspection for another inspector.
class InspectionLifecycle {
public:
  InspectionLifecycle(const ProtocolConfig& config, const TimeBucketing& time, CommunityRegistry& registry,
                      const RegeneratorRules& regenerators, const InspectorRules& inspectors,
                      const GovernanceValidation& governance, EventBus& bus);

  void attach();

  Result request(const Address& regenerator, BlockHeight block);
  Result accept(const Address& inspector, std::uint64_t inspection_id, BlockHeight block);
  Result realize(const InspectionReport& report, BlockHeight block);
  Result expire(std::uint64_t inspection_id, BlockHeight block);
  // Expires every acceptance whose deadline has passed; data holds the count.
  Result expire_overdue(BlockHeight block);

  [[nodiscard]] BlockHeight deadline_of(const Inspection& inspection) const;
  [[nodiscard]] const Inspection* inspection(std::uint64_t id) const;
  [[nodiscard]] std::vector<Inspection> inspections() const;
  [[nodiscard]] EraImpact impact(Era era) const;
  [[nodiscard]] EraImpact total_impact() const;
  [[nodiscard]] const ScoringTable& scoring() const { return scoring_; }

private:
  Result expire_inspection(Inspection& inspection, BlockHeight block);
  Result publish(DomainEventKind kind, const Inspection& inspection, BlockHeight block, std::uint64_t amount = 0);
  Result on_resource_invalidated(const DomainEvent& event);
  Result on_user_denied(const DomainEvent& event);

  const ProtocolConfig& config_;
  const TimeBucketing& time_;
  CommunityRegistry& registry_;
  const RegeneratorRules& regenerators_;
  const InspectorRules& inspectors_;
  const GovernanceValidation& governance_;
  EventBus& bus_;
  ScoringTable scoring_;

  std::uint64_t next_id_ = 1;
  std::map<std::uint64_t, Inspection> inspections_;
  std::map<Era, EraImpact> impact_;
};

}  // namespace regen
