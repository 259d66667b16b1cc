#include "core/rules/inspector_rules.hpp"

#include <algorithm>

namespace regen {

InspectorRules::InspectorRules(const ProtocolConfig& config, CommunityRegistry& registry, PoolSet& pools,
                               EventBus& bus)
    : config_(config), registry_(registry), pools_(pools), bus_(bus) {}

void InspectorRules::attach() {
  bus_.subscribe(DomainEventKind::UserRegistered, "inspector.profile",
                 [this](const DomainEvent& event) { return on_registered(event); });
  bus_.subscribe(DomainEventKind::InspectionAccepted, "inspector.accept",
                 [this](const DomainEvent& event) { return on_accepted(event); });
  bus_.subscribe(DomainEventKind::InspectionRealized, "inspector.levels",
                 [this](const DomainEvent& event) { return on_realized(event); });
  bus_.subscribe(DomainEventKind::InspectionExpired, "inspector.give-up",
                 [this](const DomainEvent& event) { return on_expired(event); });
  bus_.subscribe(DomainEventKind::InspectionInvalidated, "inspector.rollback",
                 [this](const DomainEvent& event) { return on_invalidated(event); });
  bus_.subscribe(DomainEventKind::UserDenied, "inspector.denied",
                 [this](const DomainEvent& event) { return on_denied(event); });
}

InspectorProfile* InspectorRules::find(const Address& address) {
  const auto it = profiles_.find(address);
  return it == profiles_.end() ? nullptr : &it->second;
}

Result InspectorRules::on_registered(const DomainEvent& event) {
  if (event.user_type != UserType::Inspector) {
    return Result::success();
  }
  InspectorProfile profile;
  profile.address = event.subject;
  profiles_.insert_or_assign(event.subject, std::move(profile));
  return Result::success();
}

Result InspectorRules::on_accepted(const DomainEvent& event) {
  InspectorProfile* profile = find(event.actor);
  if (profile == nullptr) {
    return Result::consistency("missing-inspector", "No inspector profile for " + event.actor + ".");
  }
  profile->active_inspection = event.ref_id;
  profile->has_accepted = true;
  profile->last_accepted_at = event.block;
  profile->excluded_regenerators.insert(event.subject);
  return Result::success();
}

Result InspectorRules::on_realized(const DomainEvent& event) {
  if (!applied_events_.insert(event.event_id).second) {
    return Result::success();
  }
  InspectorProfile* profile = find(event.actor);
  if (profile == nullptr) {
    return Result::consistency("missing-inspector", "No inspector profile for " + event.actor + ".");
  }
  profile->active_inspection.reset();
  profile->last_realized_at = event.block;
  ++profile->total_inspections;

  const Level amount = config_.inspector_levels_per_inspection;
  if (amount > 0) {
    const Result granted = pools_.pool(PoolKind::Inspector).grant_level(profile->address, amount, event.era, event.era);
    if (!granted.ok) {
      return granted;
    }
    profile->levels_by_inspection[event.ref_id] = PostedLevel{.era = event.era, .level = amount};
    const Result recorded = bus_.publish(make_level_event(DomainEventKind::LevelGranted,
                                                          "inspector-level:" + event.event_id, event.block, event.era,
                                                          profile->address, UserType::Inspector, amount));
    if (!recorded.ok) {
      return recorded;
    }
  }

  if (profile->total_inspections >= config_.min_inspections_to_pool && !profile->qualified) {
    profile->qualified = true;
    const Account* account = registry_.account(profile->address);
    if (account != nullptr && !account->inviter.empty()) {
      DomainEvent qualified;
      qualified.kind = DomainEventKind::InviteeQualified;
      qualified.event_id = "invitee:" + profile->address;
      qualified.block = event.block;
      qualified.era = event.era;
      qualified.actor = account->inviter;
      qualified.subject = profile->address;
      qualified.user_type = UserType::Inspector;
      return bus_.publish(qualified);
    }
  }
  return Result::success();
}

Result InspectorRules::on_expired(const DomainEvent& event) {
  InspectorProfile* profile = find(event.actor);
  if (profile == nullptr) {
    return Result::consistency("missing-inspector", "No inspector profile for " + event.actor + ".");
  }
  profile->active_inspection.reset();
  ++profile->give_ups;
  ++profile->penalties;
  if (profile->give_ups >= config_.max_give_ups && registry_.is_active(profile->address)) {
    return registry_.deny(profile->address, event.block, event.era,
                          std::to_string(profile->give_ups) + " inspection give-ups");
  }
  return Result::success();
}

Result InspectorRules::on_invalidated(const DomainEvent& event) {
  if (event.actor.empty()) {
    return Result::success();
  }
  InspectorProfile* profile = find(event.actor);
  if (profile == nullptr) {
    return Result::consistency("missing-inspector", "No inspector profile for " + event.actor + ".");
  }
  const bool was_inspected = event.amount != 0;
  if (!was_inspected) {
    if (profile->active_inspection == event.ref_id) {
      profile->active_inspection.reset();
    }
    return Result::success();
  }
  if (profile->total_inspections == 0) {
    return Result::consistency("inspection-underflow", profile->address + " has no realized inspections.");
  }
  --profile->total_inspections;

  const auto it = profile->levels_by_inspection.find(event.ref_id);
  if (it == profile->levels_by_inspection.end() || it->second.level == 0) {
    return Result::success();
  }
  const PostedLevel posted = it->second;
  profile->levels_by_inspection.erase(it);
  const Result removed = pools_.pool(PoolKind::Inspector)
                             .remove_level(profile->address, posted.era, posted.level, false, event.era);
  if (!removed.ok) {
    return removed;
  }
  return bus_.publish(make_level_event(DomainEventKind::LevelRemoved, "inspector-clawback:" + event.event_id,
                                       event.block, event.era, profile->address, UserType::Inspector,
                                       posted.level));
}

Result InspectorRules::on_denied(const DomainEvent& event) {
  InspectorProfile* profile = find(event.subject);
  if (profile == nullptr) {
    return Result::success();
  }
  profile->levels_by_inspection.clear();
  return Result::success();
}

const InspectorProfile* InspectorRules::profile(const Address& address) const {
  const auto it = profiles_.find(address);
  return it == profiles_.end() ? nullptr : &it->second;
}

bool InspectorRules::has_inspected(const Address& inspector, const Address& regenerator) const {
  const InspectorProfile* found = profile(inspector);
  return found != nullptr && found->excluded_regenerators.contains(regenerator);
}

std::vector<InspectorProfile> InspectorRules::profiles() const {
  std::vector<InspectorProfile> out;
  out.reserve(profiles_.size());
  for (const auto& [address, profile] : profiles_) {
    out.push_back(profile);
  }
  std::ranges::sort(out, [](const InspectorProfile& lhs, const InspectorProfile& rhs) {
    return lhs.address < rhs.address;
  });
  return out;
}

}  // namespace regen
