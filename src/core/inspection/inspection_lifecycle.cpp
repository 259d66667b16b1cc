#include "core/inspection/inspection_lifecycle.hpp"

#include "core/util/hash.hpp"

namespace regen {

std::string_view to_string(InspectionStatus status) {
  switch (status) {
    case InspectionStatus::Open:
      return "Open";
    case InspectionStatus::Accepted:
      return "Accepted";
    case InspectionStatus::Inspected:
      return "Inspected";
    case InspectionStatus::Invalidated:
      return "Invalidated";
  }
  return "Open";
}

InspectionLifecycle::InspectionLifecycle(const ProtocolConfig& config, const TimeBucketing& time,
                                         CommunityRegistry& registry, const RegeneratorRules& regenerators,
                                         const InspectorRules& inspectors, const GovernanceValidation& governance,
                                         EventBus& bus)
    : config_(config),
      time_(time),
      registry_(registry),
      regenerators_(regenerators),
      inspectors_(inspectors),
      governance_(governance),
      bus_(bus),
      scoring_(config.scoring) {}

void InspectionLifecycle::attach() {
  bus_.subscribe(DomainEventKind::ResourceInvalidated, "inspection.invalidate",
                 [this](const DomainEvent& event) { return on_resource_invalidated(event); });
  bus_.subscribe(DomainEventKind::UserDenied, "inspection.regenerator-denied",
                 [this](const DomainEvent& event) { return on_user_denied(event); });
}

Result InspectionLifecycle::publish(DomainEventKind kind, const Inspection& inspection, BlockHeight block,
                                    std::uint64_t amount) {
  DomainEvent event;
  event.kind = kind;
  event.event_id = std::string{to_string(kind)} + ":" + std::to_string(inspection.id) + ":" + std::to_string(block);
  event.block = block;
  event.era = time_.current_era(block);
  event.actor = inspection.inspector;
  event.subject = inspection.regenerator;
  event.user_type = UserType::Regenerator;
  event.resource_kind = ResourceKind::Inspection;
  event.ref_id = inspection.id;
  event.amount = amount;
  event.score = inspection.regeneration_score;
  return bus_.publish(event);
}

BlockHeight InspectionLifecycle::deadline_of(const Inspection& inspection) const {
  return inspection.accepted_at + config_.inspection_deadline_blocks;
}

Result InspectionLifecycle::request(const Address& regenerator, BlockHeight block) {
  if (!registry_.is_active_as(regenerator, UserType::Regenerator)) {
    return Result::precondition("not-regenerator", regenerator + " is not an active regenerator.");
  }
  const RegeneratorProfile* profile = regenerators_.profile(regenerator);
  if (profile == nullptr) {
    return Result::consistency("missing-regenerator", "No regenerator profile for " + regenerator + ".");
  }
  if (profile->pending_inspection) {
    return Result::precondition("pending-inspection", regenerator + " already has a pending inspection.");
  }
  if (profile->area < config_.min_regenerator_area || profile->area > config_.max_regenerator_area) {
    return Result::precondition("area-out-of-bounds", "Registered area is outside the protocol bounds.");
  }
  if (profile->total_inspections >= config_.max_lifetime_inspections) {
    return Result::precondition("inspection-cap", regenerator + " reached " +
                                                      std::to_string(config_.max_lifetime_inspections) +
                                                      " lifetime inspections.");
  }
  if (profile->has_requested && block < profile->last_request_at + config_.inspection_request_delay_blocks) {
    const BlockHeight retry_at = profile->last_request_at + config_.inspection_request_delay_blocks;
    return Result::temporal("request-cooldown",
                            "Request cooldown active; try again after block " + std::to_string(retry_at) + ".",
                            retry_at);
  }

  Inspection inspection;
  inspection.id = next_id_++;
  inspection.regenerator = regenerator;
  inspection.created_at = block;
  const std::uint64_t id = inspection.id;
  const auto [it, inserted] = inspections_.emplace(id, std::move(inspection));
  const Result published = publish(DomainEventKind::InspectionRequested, it->second, block);
  if (!published.ok) {
    return published;
  }
  return Result::success("Inspection " + std::to_string(id) + " requested.", std::to_string(id));
}

Result InspectionLifecycle::accept(const Address& inspector, std::uint64_t inspection_id, BlockHeight block) {
  if (!registry_.is_active_as(inspector, UserType::Inspector)) {
    return Result::precondition("not-inspector", inspector + " is not an active inspector.");
  }
  const InspectorProfile* profile = inspectors_.profile(inspector);
  if (profile == nullptr) {
    return Result::consistency("missing-inspector", "No inspector profile for " + inspector + ".");
  }
  const auto it = inspections_.find(inspection_id);
  if (it == inspections_.end()) {
    return Result::precondition("unknown-inspection", "Inspection " + std::to_string(inspection_id) + " not found.");
  }
  Inspection& inspection = it->second;
  if (inspection.status != InspectionStatus::Open) {
    return Result::precondition("not-open", "Inspection " + std::to_string(inspection_id) + " is " +
                                                std::string{to_string(inspection.status)} + ".");
  }
  if (!registry_.is_active_as(inspection.regenerator, UserType::Regenerator)) {
    return Result::precondition("regenerator-inactive", inspection.regenerator + " is no longer active.");
  }
  if (profile->active_inspection.has_value()) {
    return Result::precondition("inspector-busy", inspector + " already has inspection " +
                                                      std::to_string(*profile->active_inspection) + " in progress.");
  }
  if (inspectors_.has_inspected(inspector, inspection.regenerator)) {
    return Result::precondition("already-inspected", inspector + " already inspected " + inspection.regenerator + ".");
  }
  if (profile->has_accepted && block < profile->last_accepted_at + config_.inter_inspection_delay_blocks) {
    const BlockHeight retry_at = profile->last_accepted_at + config_.inter_inspection_delay_blocks;
    return Result::temporal("inspector-cooldown",
                            "Inter-inspection delay active; try again after block " + std::to_string(retry_at) + ".",
                            retry_at);
  }
  const Result window = governance_.safeguard_gate(block, "Accepting inspections");
  if (!window.ok) {
    return window;
  }

  inspection.status = InspectionStatus::Accepted;
  inspection.inspector = inspector;
  inspection.accepted_at = block;
  const Result published = publish(DomainEventKind::InspectionAccepted, inspection, block);
  if (!published.ok) {
    return published;
  }
  return Result::success("Inspection " + std::to_string(inspection_id) + " accepted; deadline block " +
                             std::to_string(deadline_of(inspection)) + ".",
                         std::to_string(inspection_id));
}

Result InspectionLifecycle::realize(const InspectionReport& report, BlockHeight block) {
  const auto it = inspections_.find(report.inspection_id);
  if (it == inspections_.end()) {
    return Result::precondition("unknown-inspection",
                                "Inspection " + std::to_string(report.inspection_id) + " not found.");
  }
  Inspection& inspection = it->second;
  if (inspection.status != InspectionStatus::Accepted) {
    return Result::precondition("not-accepted", "Inspection " + std::to_string(report.inspection_id) + " is " +
                                                    std::string{to_string(inspection.status)} + ".");
  }
  if (inspection.inspector != report.inspector) {
    return Result::precondition("not-assigned", report.inspector + " did not accept this inspection.");
  }
  if (!registry_.is_active_as(report.inspector, UserType::Inspector)) {
    return Result::precondition("not-inspector", report.inspector + " is not an active inspector.");
  }
  if (block > deadline_of(inspection)) {
    return Result::precondition("inspection-expired",
                                "Deadline block " + std::to_string(deadline_of(inspection)) + " has passed.");
  }
  if (report.trees_result > config_.max_trees_result) {
    return Result::precondition("trees-out-of-range", "Trees result exceeds " +
                                                          std::to_string(config_.max_trees_result) + ".");
  }
  if (report.biodiversity_result > config_.max_biodiversity_result) {
    return Result::precondition("biodiversity-out-of-range", "Biodiversity result exceeds " +
                                                                 std::to_string(config_.max_biodiversity_result) + ".");
  }
  if (!util::looks_like_content_hash(report.evidence_hash, config_.max_hash_length)) {
    return Result::precondition("invalid-evidence-hash", "Evidence must be a non-empty content hash.");
  }
  if (!util::looks_like_content_hash(report.justification_hash, config_.max_hash_length)) {
    return Result::precondition("invalid-justification-hash", "Justification must be a non-empty content hash.");
  }

  const Era era = time_.current_era(block);
  inspection.status = InspectionStatus::Inspected;
  inspection.trees_result = report.trees_result;
  inspection.biodiversity_result = report.biodiversity_result;
  inspection.regeneration_score = scoring_.score(report.trees_result, report.biodiversity_result);
  inspection.evidence_hash = report.evidence_hash;
  inspection.justification_hash = report.justification_hash;
  inspection.inspected_at = block;
  inspection.inspected_at_era = era;

  EraImpact& impact = impact_[era];
  impact.trees += report.trees_result;
  impact.biodiversity += report.biodiversity_result;
  impact.score += inspection.regeneration_score;
  ++impact.realized;

  const Result published = publish(DomainEventKind::InspectionRealized, inspection, block, report.trees_result);
  if (!published.ok) {
    return published;
  }
  return Result::success("Inspection " + std::to_string(inspection.id) + " scored " +
                             std::to_string(inspection.regeneration_score) + ".",
                         std::to_string(inspection.regeneration_score));
}

Result InspectionLifecycle::expire_inspection(Inspection& inspection, BlockHeight block) {
  Inspection expired = inspection;
  inspection.status = InspectionStatus::Open;
  inspection.inspector.clear();
  inspection.accepted_at = 0;
  ++inspection.expirations;
  ++impact_[time_.current_era(block)].expired;
  return publish(DomainEventKind::InspectionExpired, expired, block);
}

Result InspectionLifecycle::expire(std::uint64_t inspection_id, BlockHeight block) {
  const auto it = inspections_.find(inspection_id);
  if (it == inspections_.end()) {
    return Result::precondition("unknown-inspection", "Inspection " + std::to_string(inspection_id) + " not found.");
  }
  Inspection& inspection = it->second;
  if (inspection.status != InspectionStatus::Accepted) {
    return Result::precondition("not-accepted", "Inspection " + std::to_string(inspection_id) + " is " +
                                                    std::string{to_string(inspection.status)} + ".");
  }
  const BlockHeight deadline = deadline_of(inspection);
  if (block <= deadline) {
    return Result::temporal("deadline-not-reached",
                            "Inspection is still within its deadline; try again after block " +
                                std::to_string(deadline + 1) + ".",
                            deadline + 1);
  }
  const Result expired = expire_inspection(inspection, block);
  if (!expired.ok) {
    return expired;
  }
  return Result::success("Inspection " + std::to_string(inspection_id) + " expired and reopened.");
}

Result InspectionLifecycle::expire_overdue(BlockHeight block) {
  std::uint64_t count = 0;
  for (auto& [id, inspection] : inspections_) {
    if (inspection.status == InspectionStatus::Accepted && block > deadline_of(inspection)) {
      const Result expired = expire_inspection(inspection, block);
      if (!expired.ok) {
        return expired;
      }
      ++count;
    }
  }
  return Result::success(std::to_string(count) + " inspections expired.", std::to_string(count));
}

Result InspectionLifecycle::on_resource_invalidated(const DomainEvent& event) {
  if (event.resource_kind != ResourceKind::Inspection) {
    return Result::success();
  }
  const auto it = inspections_.find(event.ref_id);
  if (it == inspections_.end()) {
    return Result::consistency("unknown-inspection", "Invalidated resource points at missing inspection " +
                                                         std::to_string(event.ref_id) + ".");
  }
  Inspection& inspection = it->second;
  if (inspection.status != InspectionStatus::Accepted && inspection.status != InspectionStatus::Inspected) {
    return Result::success();
  }
  const bool was_inspected = inspection.status == InspectionStatus::Inspected;
  inspection.status = InspectionStatus::Invalidated;
  inspection.invalidated_at = event.block;
  if (was_inspected) {
    ++impact_[inspection.inspected_at_era].invalidated;
  }
  return publish(DomainEventKind::InspectionInvalidated, inspection, event.block, was_inspected ? 1 : 0);
}

Result InspectionLifecycle::on_user_denied(const DomainEvent& event) {
  if (event.user_type != UserType::Regenerator) {
    return Result::success();
  }
  for (auto& [id, inspection] : inspections_) {
    if (inspection.regenerator != event.subject) {
      continue;
    }
    if (inspection.status == InspectionStatus::Open || inspection.status == InspectionStatus::Accepted) {
      inspection.status = InspectionStatus::Invalidated;
      inspection.invalidated_at = event.block;
      const Result published = publish(DomainEventKind::InspectionInvalidated, inspection, event.block, 0);
      if (!published.ok) {
        return published;
      }
    }
  }
  return Result::success();
}

const Inspection* InspectionLifecycle::inspection(std::uint64_t id) const {
  const auto it = inspections_.find(id);
  return it == inspections_.end() ? nullptr : &it->second;
}

std::vector<Inspection> InspectionLifecycle::inspections() const {
  std::vector<Inspection> out;
  out.reserve(inspections_.size());
  for (const auto& [id, inspection] : inspections_) {
    out.push_back(inspection);
  }
  return out;
}

EraImpact InspectionLifecycle::impact(Era era) const {
  const auto it = impact_.find(era);
  return it == impact_.end() ? EraImpact{} : it->second;
}

EraImpact InspectionLifecycle::total_impact() const {
  EraImpact total;
  for (const auto& [era, impact] : impact_) {
    total.trees += impact.trees;
    total.biodiversity += impact.biodiversity;
    total.realized += impact.realized;
    total.invalidated += impact.invalidated;
    total.expired += impact.expired;
    total.score += impact.score;
  }
  return total;
}

}  // namespace regen
