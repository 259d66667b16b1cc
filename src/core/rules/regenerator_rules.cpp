#include "core/rules/regenerator_rules.hpp"

#include <algorithm>

namespace regen {

RegeneratorRules::RegeneratorRules(const ProtocolConfig& config, CommunityRegistry& registry, PoolSet& pools,
                                   EventBus& bus)
    : config_(config), registry_(registry), pools_(pools), bus_(bus) {}

void RegeneratorRules::attach() {
  bus_.subscribe(DomainEventKind::UserRegistered, "regenerator.profile",
                 [this](const DomainEvent& event) { return on_registered(event); });
  bus_.subscribe(DomainEventKind::InspectionRequested, "regenerator.request",
                 [this](const DomainEvent& event) { return on_requested(event); });
  bus_.subscribe(DomainEventKind::InspectionRealized, "regenerator.levels",
                 [this](const DomainEvent& event) { return on_realized(event); });
  bus_.subscribe(DomainEventKind::InspectionInvalidated, "regenerator.rollback",
                 [this](const DomainEvent& event) { return on_invalidated(event); });
  bus_.subscribe(DomainEventKind::UserDenied, "regenerator.denied",
                 [this](const DomainEvent& event) { return on_denied(event); });
}

Result RegeneratorRules::on_registered(const DomainEvent& event) {
  if (event.user_type != UserType::Regenerator) {
    return Result::success();
  }
  RegeneratorProfile profile;
  profile.address = event.subject;
  profile.area = event.amount;
  profiles_.insert_or_assign(event.subject, std::move(profile));
  return Result::success();
}

Result RegeneratorRules::on_requested(const DomainEvent& event) {
  const auto it = profiles_.find(event.subject);
  if (it == profiles_.end()) {
    return Result::consistency("missing-regenerator", "No regenerator profile for " + event.subject + ".");
  }
  it->second.pending_inspection = true;
  it->second.has_requested = true;
  it->second.last_request_at = event.block;
  return Result::success();
}

Result RegeneratorRules::post(RegeneratorProfile& profile, Level amount, const DomainEvent& cause) {
  if (amount == 0) {
    return Result::success();
  }
  const Result granted = pools_.pool(PoolKind::Regenerator).grant_level(profile.address, amount, cause.era, cause.era);
  if (!granted.ok) {
    return granted;
  }
  return bus_.publish(make_level_event(DomainEventKind::LevelGranted, "regenerator-level:" + cause.event_id,
                                       cause.block, cause.era, profile.address, UserType::Regenerator, amount));
}

Result RegeneratorRules::claw_back(RegeneratorProfile& profile, InspectionRecord& record, const DomainEvent& cause) {
  if (record.posted_level == 0) {
    return Result::success();
  }
  const Level amount = record.posted_level;
  const Result removed = pools_.pool(PoolKind::Regenerator)
                             .remove_level(profile.address, record.posted_era, amount, false, cause.era);
  if (!removed.ok) {
    return removed;
  }
  record.posted_level = 0;
  return bus_.publish(make_level_event(DomainEventKind::LevelRemoved,
                                       "regenerator-clawback:" + std::to_string(record.inspection_id) + ":" +
                                           cause.event_id,
                                       cause.block, cause.era, profile.address, UserType::Regenerator, amount));
}

Result RegeneratorRules::on_realized(const DomainEvent& event) {
  if (!applied_events_.insert(event.event_id).second) {
    return Result::success();
  }
  const auto it = profiles_.find(event.subject);
  if (it == profiles_.end()) {
    return Result::consistency("missing-regenerator", "No regenerator profile for " + event.subject + ".");
  }
  RegeneratorProfile& profile = it->second;
  profile.pending_inspection = false;
  ++profile.total_inspections;
  profile.regeneration_score += event.score;
  profile.inspections.push_back({.inspection_id = event.ref_id,
                                 .era = event.era,
                                 .score = event.score,
                                 .posted_level = 0,
                                 .posted_era = 0});

  if (profile.total_inspections >= config_.min_inspections_to_pool) {
    Level amount = 0;
    if (!profile.on_contract_pool) {
      // Threshold reached: every unposted score goes in now.
      for (auto& record : profile.inspections) {
        record.posted_level = record.score;
        record.posted_era = event.era;
        amount += record.score;
      }
      profile.on_contract_pool = true;
    } else {
      InspectionRecord& record = profile.inspections.back();
      record.posted_level = record.score;
      record.posted_era = event.era;
      amount = record.score;
    }
    const Result posted = post(profile, amount, event);
    if (!posted.ok) {
      return posted;
    }
  }

  if (profile.total_inspections >= config_.min_inspections_to_pool && !profile.qualified) {
    profile.qualified = true;
    const Account* account = registry_.account(profile.address);
    if (account != nullptr && !account->inviter.empty()) {
      DomainEvent qualified;
      qualified.kind = DomainEventKind::InviteeQualified;
      qualified.event_id = "invitee:" + profile.address;
      qualified.block = event.block;
      qualified.era = event.era;
      qualified.actor = account->inviter;
      qualified.subject = profile.address;
      qualified.user_type = UserType::Regenerator;
      return bus_.publish(qualified);
    }
  }
  return Result::success();
}

Result RegeneratorRules::on_invalidated(const DomainEvent& event) {
  const auto it = profiles_.find(event.subject);
  if (it == profiles_.end()) {
    return Result::consistency("missing-regenerator", "No regenerator profile for " + event.subject + ".");
  }
  RegeneratorProfile& profile = it->second;
  const bool was_inspected = event.amount != 0;
  if (!was_inspected) {
    profile.pending_inspection = false;
    return Result::success();
  }

  const auto record_it = std::ranges::find_if(profile.inspections, [&event](const InspectionRecord& record) {
    return record.inspection_id == event.ref_id;
  });
  if (record_it == profile.inspections.end() || profile.total_inspections == 0) {
    return Result::consistency("missing-inspection-record", "Inspection " + std::to_string(event.ref_id) +
                                                                " was never credited to " + profile.address + ".");
  }
  const Result removed = claw_back(profile, *record_it, event);
  if (!removed.ok) {
    return removed;
  }
  profile.regeneration_score -= std::min(profile.regeneration_score, record_it->score);
  profile.inspections.erase(record_it);
  --profile.total_inspections;

  if (profile.on_contract_pool && profile.total_inspections < config_.min_inspections_to_pool) {
    for (auto& record : profile.inspections) {
      const Result clawed = claw_back(profile, record, event);
      if (!clawed.ok) {
        return clawed;
      }
    }
    profile.on_contract_pool = false;
  }
  return Result::success();
}

Result RegeneratorRules::on_denied(const DomainEvent& event) {
  const auto it = profiles_.find(event.subject);
  if (it == profiles_.end()) {
    return Result::success();
  }
  // Pool levels are already stripped; forget what was posted.
  for (auto& record : it->second.inspections) {
    record.posted_level = 0;
  }
  it->second.on_contract_pool = false;
  it->second.pending_inspection = false;
  return Result::success();
}

const RegeneratorProfile* RegeneratorRules::profile(const Address& address) const {
  const auto it = profiles_.find(address);
  return it == profiles_.end() ? nullptr : &it->second;
}

Level RegeneratorRules::posted_level(const Address& address) const {
  const RegeneratorProfile* found = profile(address);
  if (found == nullptr) {
    return 0;
  }
  Level total = 0;
  for (const auto& record : found->inspections) {
    total += record.posted_level;
  }
  return total;
}

std::vector<RegeneratorProfile> RegeneratorRules::profiles() const {
  std::vector<RegeneratorProfile> out;
  out.reserve(profiles_.size());
  for (const auto& [address, profile] : profiles_) {
    out.push_back(profile);
  }
  std::ranges::sort(out, [](const RegeneratorProfile& lhs, const RegeneratorProfile& rhs) {
    return lhs.address < rhs.address;
  });
  return out;
}

}  // namespace regen
