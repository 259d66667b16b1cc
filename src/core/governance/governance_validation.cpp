#include "core/governance/governance_validation.hpp"

#include <algorithm>

#include "core/util/hash.hpp"

namespace regen {

GovernanceValidation::GovernanceValidation(const ProtocolConfig& config, const TimeBucketing& time,
                                           CommunityRegistry& registry, PoolSet& pools, EventBus& bus)
    : config_(config), time_(time), registry_(registry), pools_(pools), bus_(bus) {}

void GovernanceValidation::attach() {
  bus_.subscribe(DomainEventKind::InspectionAccepted, "governance.inspection-resource",
                 [this](const DomainEvent& event) { return on_inspection_accepted(event); });
  bus_.subscribe(DomainEventKind::InspectionRealized, "governance.inspection-restamp",
                 [this](const DomainEvent& event) { return on_inspection_realized(event); });
  bus_.subscribe(DomainEventKind::InspectionExpired, "governance.inspection-withdraw",
                 [this](const DomainEvent& event) { return on_inspection_expired(event); });
}

bool GovernanceValidation::in_safeguard_window(BlockHeight block) const {
  const Era era = time_.current_era(block);
  const std::int64_t remaining = time_.blocks_until_era_end(era, block);
  return remaining >= 0 && static_cast<std::uint64_t>(remaining) <= config_.safeguard_window_blocks;
}

Result GovernanceValidation::safeguard_gate(BlockHeight block, std::string_view action) const {
  if (!in_safeguard_window(block)) {
    return Result::success();
  }
  const BlockHeight retry_at = time_.era_end_block(time_.current_era(block));
  return Result::temporal("safeguard-window",
                          std::string{action} + " is closed until the era ends; try again after block " +
                              std::to_string(retry_at) + ".",
                          retry_at);
}

Result GovernanceValidation::register_resource(ResourceKind kind, const Address& author, std::string title,
                                               std::string content_hash, std::optional<std::uint64_t> ref_id,
                                               BlockHeight block, std::uint64_t& out_id) {
  Resource resource;
  resource.id = next_resource_id_++;
  resource.kind = kind;
  resource.author = author;
  resource.title = std::move(title);
  resource.content_hash = std::move(content_hash);
  resource.ref_id = ref_id.value_or(resource.id);
  resource.created_at = block;
  resource.era = time_.current_era(block);
  out_id = resource.id;

  DomainEvent event;
  event.kind = DomainEventKind::ResourceSubmitted;
  event.event_id = "resource:" + std::to_string(resource.id);
  event.block = block;
  event.era = resource.era;
  event.actor = author;
  event.subject = author;
  event.user_type = registry_.type_of(author);
  event.resource_kind = kind;
  event.ref_id = resource.ref_id;
  event.amount = resource.id;
  resources_.emplace(resource.id, std::move(resource));
  return bus_.publish(event);
}

bool GovernanceValidation::can_vote(const Address& voter) const {
  if (!registry_.is_active(voter)) {
    return false;
  }
  const UserType type = registry_.type_of(voter);
  const TypePolicy* policy = config_.policy_for(type);
  if (policy == nullptr || !policy->voter_eligible) {
    return false;
  }
  return registry_.guard().can_invite(pools_.total_levels(type), registry_.population(type),
                                      pools_.level_of(type, voter));
}

std::uint64_t GovernanceValidation::votes_to_invalidate() const {
  const std::uint64_t divisor = std::max<std::uint64_t>(config_.invalidation_quorum_divisor, 1);
  return std::max(config_.min_votes_to_invalidate, registry_.voter_population() / divisor + 1);
}

Result GovernanceValidation::check_voter(const Address& voter, BlockHeight block) const {
  if (!registry_.is_active(voter)) {
    return Result::precondition("voter-not-active", voter + " is not an active member.");
  }
  const UserType type = registry_.type_of(voter);
  const TypePolicy* policy = config_.policy_for(type);
  if (policy == nullptr || !policy->voter_eligible) {
    return Result::precondition("voter-type", std::string{to_string(type)} + " accounts cannot vote.");
  }
  if (!can_vote(voter)) {
    return Result::precondition("voter-level",
                                voter + " needs " +
                                    std::to_string(registry_.guard().required_level(pools_.total_levels(type),
                                                                                    registry_.population(type))) +
                                    " levels to vote.");
  }
  const auto it = voters_.find(voter);
  if (it != voters_.end() && it->second.has_voted &&
      block < it->second.last_vote_at + config_.voter_min_interval_blocks) {
    const BlockHeight retry_at = it->second.last_vote_at + config_.voter_min_interval_blocks;
    return Result::temporal("vote-interval", "Voting too often; try again after block " + std::to_string(retry_at) + ".",
                            retry_at);
  }
  return Result::success();
}

void GovernanceValidation::record_vote(const Address& voter, BlockHeight block) {
  VoterState& state = voters_[voter];
  ++state.points;
  ++state.votes_cast;
  state.has_voted = true;
  state.last_vote_at = block;
}

Result GovernanceValidation::grant_validator_level(const Address& account, std::string event_id, BlockHeight block,
                                                   Era era) {
  const Result granted = pools_.pool(PoolKind::Validator).grant_level(account, 1, era, era);
  if (!granted.ok) {
    return granted;
  }
  return bus_.publish(
      make_level_event(DomainEventKind::LevelGranted, std::move(event_id), block, era, account, UserType::Undefined, 1));
}

Result GovernanceValidation::invalidate_resource(Resource& resource, BlockHeight block, Era era) {
  resource.valid = false;
  resource.invalidated_at = block;
  const std::uint64_t penalties = ++resource_penalties_[resource.author];

  DomainEvent event;
  event.kind = DomainEventKind::ResourceInvalidated;
  event.event_id = "invalidate:" + std::to_string(resource.id);
  event.block = block;
  event.era = era;
  event.actor = resource.author;
  event.subject = resource.author;
  event.user_type = registry_.type_of(resource.author);
  event.resource_kind = resource.kind;
  event.ref_id = resource.ref_id;
  event.amount = resource.id;
  const Result published = bus_.publish(event);
  if (!published.ok) {
    return published;
  }

  if (penalties >= config_.max_resource_penalties && registry_.is_active(resource.author)) {
    return registry_.deny(resource.author, block, era, std::to_string(penalties) + " invalidated resources");
  }
  return Result::success();
}

Result GovernanceValidation::vote_resource(const ResourceVoteDraft& draft, BlockHeight block) {
  const Result eligible = check_voter(draft.voter, block);
  if (!eligible.ok) {
    return eligible;
  }
  if (draft.justification.size() > config_.max_text_length) {
    return Result::precondition("justification-too-long", "Justification exceeds the text limit.");
  }
  const auto it = resources_.find(draft.resource_id);
  if (it == resources_.end()) {
    return Result::precondition("unknown-resource", "Resource " + std::to_string(draft.resource_id) + " not found.");
  }
  Resource& resource = it->second;
  const Era era = time_.current_era(block);
  if (!resource.open) {
    return Result::precondition("resource-withdrawn", "Resource " + std::to_string(resource.id) + " was withdrawn.");
  }
  if (!resource.valid) {
    return Result::precondition("already-invalidated", "Resource " + std::to_string(resource.id) + " is invalid.");
  }
  if (resource.era != era) {
    return Result::precondition("resource-final", "Resource " + std::to_string(resource.id) + " belongs to era " +
                                                      std::to_string(resource.era) + " and is final.");
  }
  if (resource.author == draft.voter) {
    return Result::precondition("self-vote", "Authors cannot vote on their own resources.");
  }
  if (resource.voters.contains(draft.voter)) {
    return Result::precondition("duplicate-vote", draft.voter + " already voted on this resource.");
  }

  record_vote(draft.voter, block);
  resource.voters.insert(draft.voter);
  ++resource.validation_count;
  const std::uint64_t needed = votes_to_invalidate();
  if (resource.validation_count >= needed) {
    const Result invalidated = invalidate_resource(resource, block, era);
    if (!invalidated.ok) {
      return invalidated;
    }
    return Result::success("Resource " + std::to_string(resource.id) + " invalidated.", "invalidated");
  }
  return Result::success("Vote recorded (" + std::to_string(resource.validation_count) + "/" +
                             std::to_string(needed) + ").",
                         std::to_string(resource.validation_count));
}

Result GovernanceValidation::vote_user(const UserVoteDraft& draft, BlockHeight block) {
  const Result eligible = check_voter(draft.voter, block);
  if (!eligible.ok) {
    return eligible;
  }
  if (draft.justification.size() > config_.max_text_length) {
    return Result::precondition("justification-too-long", "Justification exceeds the text limit.");
  }
  if (!registry_.is_active(draft.target)) {
    return Result::precondition("target-not-active", draft.target + " is not an active member.");
  }
  if (draft.target == draft.voter) {
    return Result::precondition("self-vote", "Members cannot vote against themselves.");
  }
  const Era era = time_.current_era(block);
  const Account* target = registry_.account(draft.target);
  if (target->registered_era != era) {
    return Result::precondition("user-final", draft.target + " joined in era " +
                                                  std::to_string(target->registered_era) +
                                                  " and can no longer be challenged.");
  }
  const auto key = std::make_pair(era, draft.target);
  if (const auto it = challenges_.find(key); it != challenges_.end() && it->second.voters.contains(draft.voter)) {
    return Result::precondition("duplicate-vote", draft.voter + " already voted against " + draft.target + " this era.");
  }

  auto [it, opened] = challenges_.try_emplace(key);
  UserChallenge& challenge = it->second;
  if (opened) {
    challenge.era = era;
    challenge.target = draft.target;
    challenge.hunter = draft.voter;
    challenge.opened_at = block;
  }
  record_vote(draft.voter, block);
  challenge.voters.insert(draft.voter);
  ++challenge.votes;

  const std::uint64_t needed = votes_to_invalidate();
  if (challenge.votes < needed) {
    return Result::success("Vote recorded (" + std::to_string(challenge.votes) + "/" + std::to_string(needed) + ").",
                           std::to_string(challenge.votes));
  }

  challenge.resolved = true;
  const Result denied = registry_.deny(draft.target, block, era, "community vote");
  if (!denied.ok) {
    return denied;
  }
  if (registry_.is_active(challenge.hunter)) {
    const Result rewarded =
        grant_validator_level(challenge.hunter, "hunter:" + std::to_string(era) + ":" + draft.target, block, era);
    if (!rewarded.ok) {
      return rewarded;
    }
    ++voters_[challenge.hunter].hunter_levels;
  }
  return Result::success(draft.target + " denied by vote.", "denied");
}

Result GovernanceValidation::add_delation(const DelationDraft& draft, BlockHeight block) {
  if (!registry_.is_active(draft.informer)) {
    return Result::precondition("informer-not-active", draft.informer + " is not an active member.");
  }
  const Account* reported = registry_.account(draft.reported);
  if (reported == nullptr || reported->type == UserType::Undefined || draft.reported == draft.informer) {
    return Result::precondition("invalid-reported", "Reported address must be another registered member.");
  }
  if (draft.title.empty() || draft.title.size() > config_.max_text_length) {
    return Result::precondition("invalid-title", "Title must be non-empty and within the text limit.");
  }
  if (!util::looks_like_content_hash(draft.testimony_hash, config_.max_hash_length)) {
    return Result::precondition("invalid-testimony-hash", "Testimony must be an opaque content hash.");
  }

  Delation delation;
  delation.id = next_delation_id_++;
  delation.informer = draft.informer;
  delation.reported = draft.reported;
  delation.title = draft.title;
  delation.testimony_hash = draft.testimony_hash;
  delation.created_at = block;
  delation.era = time_.current_era(block);
  const std::uint64_t id = delation.id;
  delations_.emplace(id, std::move(delation));
  return Result::success("Delation " + std::to_string(id) + " filed.", std::to_string(id));
}

Result GovernanceValidation::thumb_delation(const Address& voter, std::uint64_t delation_id, bool up) {
  if (!registry_.is_active(voter)) {
    return Result::precondition("voter-not-active", voter + " is not an active member.");
  }
  const auto it = delations_.find(delation_id);
  if (it == delations_.end()) {
    return Result::precondition("unknown-delation", "Delation " + std::to_string(delation_id) + " not found.");
  }
  Delation& delation = it->second;
  if (delation.informer == voter) {
    return Result::precondition("self-thumb", "Informers cannot rate their own delation.");
  }
  if (!delation.thumbs.insert(voter).second) {
    return Result::precondition("duplicate-thumb", voter + " already rated delation " + std::to_string(delation_id) + ".");
  }
  if (up) {
    ++delation.thumbs_up;
  } else {
    ++delation.thumbs_down;
  }
  return Result::success("Delation " + std::to_string(delation_id) + ": " + std::to_string(delation.thumbs_up) +
                         " up, " + std::to_string(delation.thumbs_down) + " down.");
}

Result GovernanceValidation::convert_points(const Address& voter, BlockHeight block) {
  if (!registry_.is_active(voter)) {
    return Result::precondition("voter-not-active", voter + " is not an active member.");
  }
  const auto it = voters_.find(voter);
  const std::uint64_t points = it == voters_.end() ? 0 : it->second.points;
  if (it == voters_.end() || points < config_.points_per_validator_level) {
    return Result::precondition("insufficient-points", voter + " holds " + std::to_string(points) + " of " +
                                                           std::to_string(config_.points_per_validator_level) +
                                                           " validation points.");
  }
  VoterState& state = it->second;
  const Era era = time_.current_era(block);
  const Result granted =
      grant_validator_level(voter, "convert:" + voter + ":" + std::to_string(state.converted_levels + 1), block, era);
  if (!granted.ok) {
    return granted;
  }
  state.points -= config_.points_per_validator_level;
  ++state.converted_levels;
  return Result::success("Converted " + std::to_string(config_.points_per_validator_level) +
                             " points into one Validator level.",
                         std::to_string(state.points));
}

Result GovernanceValidation::on_inspection_accepted(const DomainEvent& event) {
  std::uint64_t id = 0;
  const Result registered = register_resource(ResourceKind::Inspection, event.actor,
                                              "inspection #" + std::to_string(event.ref_id), {}, event.ref_id,
                                              event.block, id);
  if (!registered.ok) {
    return registered;
  }
  inspection_resources_.insert_or_assign(event.ref_id, id);
  return Result::success();
}

Result GovernanceValidation::on_inspection_realized(const DomainEvent& event) {
  const auto it = inspection_resources_.find(event.ref_id);
  if (it == inspection_resources_.end()) {
    return Result::consistency("missing-inspection-resource",
                               "Inspection " + std::to_string(event.ref_id) + " has no governance resource.");
  }
  Resource& resource = resources_.at(it->second);
  if (resource.era != event.era) {
    // Votes cast in the acceptance era do not carry into the era the report lands in.
    resource.validation_count = 0;
    resource.voters.clear();
  }
  resource.era = event.era;
  resource.created_at = event.block;
  return Result::success();
}

Result GovernanceValidation::on_inspection_expired(const DomainEvent& event) {
  const auto it = inspection_resources_.find(event.ref_id);
  if (it == inspection_resources_.end()) {
    return Result::success();
  }
  resources_.at(it->second).open = false;
  inspection_resources_.erase(it);
  return Result::success();
}

const Resource* GovernanceValidation::resource(std::uint64_t id) const {
  const auto it = resources_.find(id);
  return it == resources_.end() ? nullptr : &it->second;
}

std::vector<Resource> GovernanceValidation::resources() const {
  std::vector<Resource> out;
  out.reserve(resources_.size());
  for (const auto& [id, resource] : resources_) {
    out.push_back(resource);
  }
  return out;
}

const Delation* GovernanceValidation::delation(std::uint64_t id) const {
  const auto it = delations_.find(id);
  return it == delations_.end() ? nullptr : &it->second;
}

std::vector<Delation> GovernanceValidation::delations() const {
  std::vector<Delation> out;
  out.reserve(delations_.size());
  for (const auto& [id, delation] : delations_) {
    out.push_back(delation);
  }
  return out;
}

VoterState GovernanceValidation::voter(const Address& address) const {
  const auto it = voters_.find(address);
  return it == voters_.end() ? VoterState{} : it->second;
}

const UserChallenge* GovernanceValidation::challenge(Era era, const Address& target) const {
  const auto it = challenges_.find({era, target});
  return it == challenges_.end() ? nullptr : &it->second;
}

std::uint64_t GovernanceValidation::resource_penalties(const Address& author) const {
  const auto it = resource_penalties_.find(author);
  return it == resource_penalties_.end() ? 0 : it->second;
}

}  // namespace regen
