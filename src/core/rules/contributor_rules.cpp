#include "core/rules/contributor_rules.hpp"

#include <algorithm>

#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace regen {

ContributorRules::ContributorRules(const TypePolicy& policy, const ProtocolConfig& config, const TimeBucketing& time,
                                   CommunityRegistry& registry, PoolSet& pools, GovernanceValidation& governance,
                                   EventBus& bus)
    : policy_(policy),
      config_(config),
      time_(time),
      registry_(registry),
      pools_(pools),
      governance_(governance),
      bus_(bus) {}

void ContributorRules::attach() {
  const std::string prefix = util::lowercase_copy(to_string(policy_.type));
  bus_.subscribe(DomainEventKind::UserRegistered, prefix + ".profile",
                 [this](const DomainEvent& event) { return on_registered(event); });
  bus_.subscribe(DomainEventKind::UserDenied, prefix + ".denied",
                 [this](const DomainEvent& event) { return on_denied(event); });
  if (policy_.level_rule == LevelRule::PerResource) {
    bus_.subscribe(DomainEventKind::ResourceInvalidated, prefix + ".rollback",
                   [this](const DomainEvent& event) { return on_resource_invalidated(event); });
  }
  if (policy_.level_rule == LevelRule::PerInviteeMilestone) {
    bus_.subscribe(DomainEventKind::InviteeQualified, prefix + ".invitee",
                   [this](const DomainEvent& event) { return on_invitee_qualified(event); });
  }
}

Result ContributorRules::grant(const Address& account, Level amount, const std::string& event_id, BlockHeight block,
                               Era era) {
  RewardPool* pool = pools_.pool_for(policy_.type);
  if (pool == nullptr) {
    return Result::configuration("missing-pool", std::string{to_string(policy_.type)} + " has no reward pool.");
  }
  const Result granted = pool->grant_level(account, amount, era, era);
  if (!granted.ok) {
    return granted;
  }
  profiles_[account].levels_granted += amount;
  return bus_.publish(
      make_level_event(DomainEventKind::LevelGranted, event_id, block, era, account, policy_.type, amount));
}

Result ContributorRules::submit(const ResourceDraft& draft, BlockHeight block) {
  if (policy_.level_rule != LevelRule::PerResource || !policy_.resource_kind.has_value()) {
    return Result::precondition("type-does-not-submit",
                                std::string{to_string(policy_.type)} + " accounts do not submit resources.");
  }
  if (!registry_.is_active_as(draft.author, policy_.type)) {
    return Result::precondition("not-" + util::lowercase_copy(to_string(policy_.type)),
                                draft.author + " is not an active " + std::string{to_string(policy_.type)} + ".");
  }
  if (draft.title.empty() || draft.title.size() > config_.max_text_length) {
    return Result::precondition("invalid-title", "Title must be non-empty and within the text limit.");
  }
  if (!util::looks_like_content_hash(draft.content_hash, config_.max_hash_length)) {
    return Result::precondition("invalid-content-hash", "Content must be an opaque content hash.");
  }
  const Result window = governance_.safeguard_gate(block, "Submitting resources");
  if (!window.ok) {
    return window;
  }
  const auto found = profiles_.find(draft.author);
  if (found == profiles_.end()) {
    return Result::consistency("missing-profile", "No profile for " + draft.author + ".");
  }
  ContributorProfile& profile = found->second;
  if (profile.has_submitted && block < profile.last_submission_at + policy_.submission_delay_blocks) {
    const BlockHeight retry_at = profile.last_submission_at + policy_.submission_delay_blocks;
    return Result::temporal("submission-cooldown",
                            "Submission delay active; try again after block " + std::to_string(retry_at) + ".",
                            retry_at);
  }

  std::uint64_t resource_id = 0;
  const Result registered = governance_.register_resource(*policy_.resource_kind, draft.author, draft.title,
                                                          draft.content_hash, std::nullopt, block, resource_id);
  if (!registered.ok) {
    return registered;
  }
  profile.has_submitted = true;
  profile.last_submission_at = block;
  ++profile.resources_submitted;

  const Era era = time_.current_era(block);
  const Level amount = policy_.levels_per_resource;
  if (amount > 0) {
    const Result granted = grant(draft.author, amount, "resource-level:" + std::to_string(resource_id), block, era);
    if (!granted.ok) {
      return granted;
    }
    grants_by_resource_.insert_or_assign(resource_id, Grant{.account = draft.author, .era = era, .level = amount});
  }
  return Result::success(std::string{to_string(*policy_.resource_kind)} + " " + std::to_string(resource_id) +
                             " submitted.",
                         std::to_string(resource_id));
}

Result ContributorRules::on_registered(const DomainEvent& event) {
  if (event.user_type != policy_.type) {
    return Result::success();
  }
  ContributorProfile profile;
  profile.address = event.subject;
  profiles_.insert_or_assign(event.subject, std::move(profile));
  return Result::success();
}

Result ContributorRules::on_resource_invalidated(const DomainEvent& event) {
  if (!policy_.resource_kind.has_value() || event.resource_kind != *policy_.resource_kind) {
    return Result::success();
  }
  const auto it = grants_by_resource_.find(event.amount);
  if (it == grants_by_resource_.end()) {
    return Result::success();
  }
  const Grant grant = it->second;
  grants_by_resource_.erase(it);
  if (auto profile = profiles_.find(grant.account); profile != profiles_.end()) {
    ++profile->second.resources_invalidated;
    profile->second.levels_granted -= std::min(profile->second.levels_granted, grant.level);
  }
  RewardPool* pool = pools_.pool_for(policy_.type);
  if (pool == nullptr) {
    return Result::configuration("missing-pool", std::string{to_string(policy_.type)} + " has no reward pool.");
  }
  const Result removed = pool->remove_level(grant.account, grant.era, grant.level, false, event.era);
  if (!removed.ok) {
    return removed;
  }
  return bus_.publish(make_level_event(DomainEventKind::LevelRemoved, "resource-clawback:" + std::to_string(event.amount),
                                       event.block, event.era, grant.account, policy_.type, grant.level));
}

Result ContributorRules::on_invitee_qualified(const DomainEvent& event) {
  if (!registry_.is_active_as(event.actor, policy_.type)) {
    return Result::success();
  }
  if (!applied_events_.insert(event.event_id).second) {
    return Result::success();
  }
  auto& profile = profiles_[event.actor];
  profile.address = event.actor;
  ++profile.invitees_qualified;
  return grant(event.actor, policy_.levels_per_resource, event.event_id, event.block, event.era);
}

Result ContributorRules::on_denied(const DomainEvent& event) {
  if (event.user_type != policy_.type) {
    return Result::success();
  }
  // The pool already dropped every level of this account.
  std::erase_if(grants_by_resource_, [&event](const auto& entry) { return entry.second.account == event.subject; });
  if (auto it = profiles_.find(event.subject); it != profiles_.end()) {
    it->second.levels_granted = 0;
  }
  return Result::success();
}

const ContributorProfile* ContributorRules::profile(const Address& address) const {
  const auto it = profiles_.find(address);
  return it == profiles_.end() ? nullptr : &it->second;
}

std::vector<ContributorProfile> ContributorRules::profiles() const {
  std::vector<ContributorProfile> out;
  out.reserve(profiles_.size());
  for (const auto& [address, profile] : profiles_) {
    out.push_back(profile);
  }
  std::ranges::sort(out, [](const ContributorProfile& lhs, const ContributorProfile& rhs) {
    return lhs.address < rhs.address;
  });
  return out;
}

}  // namespace regen
