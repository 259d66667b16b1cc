#include "core/community/community_registry.hpp"

#include <algorithm>

#include "core/util/hash.hpp"

namespace regen {

CommunityRegistry::CommunityRegistry(const ProtocolConfig& config, EventBus& bus)
    : config_(config), bus_(bus), guard_(config.bootstrap_threshold) {}

Result CommunityRegistry::validate_draft(const RegistrationDraft& draft) const {
  if (draft.address.empty()) {
    return Result::precondition("empty-address", "Address is required.");
  }
  if (draft.type == UserType::Undefined || draft.type == UserType::Denied) {
    return Result::precondition("invalid-type", "Choose a registrable user type.");
  }
  if (config_.policy_for(draft.type) == nullptr) {
    return Result::configuration("missing-policy", "No policy configured for " + std::string{to_string(draft.type)} + ".");
  }
  if (draft.name.size() > config_.max_text_length) {
    return Result::precondition("name-too-long", "Name exceeds the text limit.");
  }
  if (!draft.proof_hash.empty() && !util::looks_like_content_hash(draft.proof_hash, config_.max_hash_length)) {
    return Result::precondition("invalid-proof-hash", "Proof must be an opaque content hash.");
  }
  if (draft.type == UserType::Regenerator &&
      (draft.area < config_.min_regenerator_area || draft.area > config_.max_regenerator_area)) {
    return Result::precondition("area-out-of-bounds", "Regenerator area must be within [" +
                                                          std::to_string(config_.min_regenerator_area) + ", " +
                                                          std::to_string(config_.max_regenerator_area) + "] m2.");
  }
  if (const auto it = accounts_.find(draft.address); it != accounts_.end() && it->second.type != UserType::Undefined) {
    return Result::precondition("already-registered", draft.address + " is already registered as " +
                                                          std::string{to_string(it->second.type)} + ".");
  }
  return Result::success();
}

Account& CommunityRegistry::insert_account(const RegistrationDraft& draft, BlockHeight block, Era era) {
  Account& account = accounts_[draft.address];
  account.address = draft.address;
  account.type = draft.type;
  account.registered_as = draft.type;
  account.name = draft.name;
  account.proof_hash = draft.proof_hash;
  account.area = draft.type == UserType::Regenerator ? draft.area : 0;
  account.registered_at = block;
  account.registered_era = era;
  ++population_[draft.type];
  return account;
}

Result CommunityRegistry::publish_registered(const Account& account, BlockHeight block, Era era) {
  DomainEvent event;
  event.kind = DomainEventKind::UserRegistered;
  event.event_id = "register:" + account.address;
  event.block = block;
  event.era = era;
  event.actor = account.inviter;
  event.subject = account.address;
  event.user_type = account.type;
  event.amount = account.area;
  return bus_.publish(event);
}

Result CommunityRegistry::add_user(const RegistrationDraft& draft, BlockHeight block, Era era) {
  const Result valid = validate_draft(draft);
  if (!valid.ok) {
    return valid;
  }
  const TypePolicy& policy = *config_.policy_for(draft.type);

  if (const auto cap = population_cap(draft.type); cap.has_value() && population(draft.type) >= *cap) {
    return Result::precondition("population-cap", std::string{to_string(draft.type)} + " population reached its cap of " +
                                                      std::to_string(*cap) + ".");
  }

  Invitation* pending = nullptr;
  if (policy.need_invitation_on_register) {
    const auto it = invitations_.find(draft.address);
    if (it == invitations_.end() || it->second.consumed) {
      return Result::precondition("no-invitation", draft.address + " has no live invitation.");
    }
    if (it->second.revoked) {
      return Result::precondition("invitation-revoked", "The invitation for " + draft.address + " was revoked.");
    }
    if (it->second.type != draft.type) {
      return Result::precondition("invitation-type-mismatch", "Invitation was issued for " +
                                                                  std::string{to_string(it->second.type)} + ".");
    }
    if (!invitation_live(it->second, block)) {
      return Result::precondition("invitation-expired", "The invitation for " + draft.address + " expired.");
    }
    pending = &it->second;
  }

  Account& account = insert_account(draft, block, era);
  if (pending != nullptr) {
    pending->consumed = true;
    account.inviter = pending->inviter;
    if (const auto inviter = accounts_.find(pending->inviter); inviter != accounts_.end()) {
      inviter->second.invitees.push_back(draft.address);
    }
  }

  const Result published = publish_registered(account, block, era);
  if (!published.ok) {
    return published;
  }
  return Result::success("Registered " + draft.address + " as " + std::string{to_string(draft.type)} + ".",
                         draft.address);
}

Result CommunityRegistry::add_genesis_member(const GenesisMember& member, BlockHeight block, Era era) {
  RegistrationDraft draft;
  draft.address = member.address;
  draft.type = member.type;
  draft.name = member.address;
  draft.area = member.area;
  const Result valid = validate_draft(draft);
  if (!valid.ok) {
    return valid;
  }
  const Account& account = insert_account(draft, block, era);
  return publish_registered(account, block, era);
}

Result CommunityRegistry::invite(const InvitationDraft& draft, BlockHeight block, Era era,
                                 const LevelSnapshot& inviter_stats) {
  const auto inviter_it = accounts_.find(draft.inviter);
  if (inviter_it == accounts_.end() || inviter_it->second.type == UserType::Undefined ||
      inviter_it->second.type == UserType::Denied) {
    return Result::precondition("inviter-not-active", draft.inviter + " is not an active member.");
  }
  Account& inviter = inviter_it->second;
  if (inviter.invite_rights_revoked) {
    return Result::precondition("invite-rights-revoked", draft.inviter + " lost invitation rights after " +
                                                             std::to_string(inviter.inviter_penalties) + " penalties.");
  }
  if (draft.invited.empty() || draft.invited == draft.inviter) {
    return Result::precondition("invalid-invitee", "Invitee must be another address.");
  }
  const TypePolicy* target = config_.policy_for(draft.type);
  if (target == nullptr || !target->need_invitation_on_register) {
    return Result::precondition("type-not-invitable", std::string{to_string(draft.type)} + " does not use invitations.");
  }
  if (std::ranges::find(target->inviter_types, inviter.type) == target->inviter_types.end()) {
    return Result::precondition("inviter-type-not-allowed", std::string{to_string(inviter.type)} + " cannot invite " +
                                                                std::string{to_string(draft.type)} + ".");
  }
  if (const auto it = accounts_.find(draft.invited); it != accounts_.end() && it->second.type != UserType::Undefined) {
    return Result::precondition("already-registered", draft.invited + " is already registered.");
  }
  if (const auto it = invitations_.find(draft.invited);
      it != invitations_.end() && !it->second.revoked && invitation_live(it->second, block)) {
    return Result::precondition("duplicate-invitation", draft.invited + " already holds a live invitation.");
  }

  const TypePolicy* own = config_.policy_for(inviter.type);
  const BlockHeight delay = own == nullptr ? 0 : own->invitation_delay_blocks;
  if (inviter.has_invited && block < inviter.last_invitation_at + delay) {
    const BlockHeight retry_at = inviter.last_invitation_at + delay;
    return Result::temporal("invitation-cooldown",
                            "Invitation delay not elapsed; try again after block " + std::to_string(retry_at) + ".",
                            retry_at);
  }
  if (!guard_.can_invite(inviter_stats)) {
    return Result::precondition("invite-eligibility",
                                "Inviter needs " +
                                    std::to_string(guard_.required_level(inviter_stats.total_levels_of_type,
                                                                         inviter_stats.total_users_of_type)) +
                                    " levels, holds " + std::to_string(inviter_stats.own_levels) + ".");
  }

  invitations_.insert_or_assign(draft.invited, Invitation{.invited = draft.invited,
                                                          .inviter = draft.inviter,
                                                          .type = draft.type,
                                                          .created_at = block,
                                                          .consumed = false,
                                                          .revoked = false});
  inviter.has_invited = true;
  inviter.last_invitation_at = block;

  DomainEvent event;
  event.kind = DomainEventKind::InvitationIssued;
  event.event_id = "invite:" + draft.invited + ":" + std::to_string(block);
  event.block = block;
  event.era = era;
  event.actor = draft.inviter;
  event.subject = draft.invited;
  event.user_type = draft.type;
  const Result published = bus_.publish(event);
  if (!published.ok) {
    return published;
  }
  return Result::success("Invited " + draft.invited + " as " + std::string{to_string(draft.type)} + ".", draft.invited);
}

void CommunityRegistry::revoke_issued_invitations(const Address& inviter) {
  for (auto& [invited, invitation] : invitations_) {
    if (invitation.inviter == inviter && !invitation.consumed) {
      invitation.revoked = true;
    }
  }
}

Result CommunityRegistry::deny(const Address& address, BlockHeight block, Era era, std::string_view reason) {
  const auto it = accounts_.find(address);
  if (it == accounts_.end() || it->second.type == UserType::Undefined) {
    return Result::precondition("unknown-account", address + " is not registered.");
  }
  Account& account = it->second;
  if (account.type == UserType::Denied) {
    return Result::success(address + " is already denied.");
  }

  auto& count = population_[account.type];
  if (count == 0) {
    return Result::consistency("population-underflow", "Population of " + std::string{to_string(account.type)} +
                                                           " is already zero.");
  }
  --count;
  account.registered_as = account.type;
  account.type = UserType::Denied;
  account.denied_at = block;
  revoke_issued_invitations(address);

  if (!account.inviter.empty()) {
    if (const auto inviter_it = accounts_.find(account.inviter); inviter_it != accounts_.end()) {
      Account& inviter = inviter_it->second;
      ++inviter.inviter_penalties;
      if (inviter.inviter_penalties >= config_.max_inviter_penalties && !inviter.invite_rights_revoked) {
        inviter.invite_rights_revoked = true;
        revoke_issued_invitations(inviter.address);
      }
    }
  }

  DomainEvent event;
  event.kind = DomainEventKind::UserDenied;
  event.event_id = "deny:" + address;
  event.block = block;
  event.era = era;
  event.actor = account.inviter;
  event.subject = address;
  event.user_type = account.registered_as;
  const Result published = bus_.publish(event);
  if (!published.ok) {
    return published;
  }
  return Result::success(address + " denied: " + std::string{reason} + ".");
}

const Account* CommunityRegistry::account(const Address& address) const {
  const auto it = accounts_.find(address);
  return it == accounts_.end() ? nullptr : &it->second;
}

UserType CommunityRegistry::type_of(const Address& address) const {
  const Account* found = account(address);
  return found == nullptr ? UserType::Undefined : found->type;
}

bool CommunityRegistry::is_active(const Address& address) const {
  const UserType type = type_of(address);
  return type != UserType::Undefined && type != UserType::Denied;
}

bool CommunityRegistry::is_active_as(const Address& address, UserType type) const {
  return type_of(address) == type;
}

const Invitation* CommunityRegistry::invitation(const Address& invited) const {
  const auto it = invitations_.find(invited);
  return it == invitations_.end() ? nullptr : &it->second;
}

bool CommunityRegistry::invitation_live(const Invitation& invitation, BlockHeight block) const {
  if (invitation.consumed || invitation.revoked) {
    return false;
  }
  if (config_.invitation_expiry_blocks == 0) {
    return true;
  }
  return block <= invitation.created_at + config_.invitation_expiry_blocks;
}

std::uint64_t CommunityRegistry::population(UserType type) const {
  const auto it = population_.find(type);
  return it == population_.end() ? 0 : it->second;
}

std::uint64_t CommunityRegistry::voter_population() const {
  std::uint64_t total = 0;
  for (const auto& policy : config_.types) {
    if (policy.voter_eligible) {
      total += population(policy.type);
    }
  }
  return total;
}

std::optional<std::uint64_t> CommunityRegistry::population_cap(UserType type) const {
  const TypePolicy* policy = config_.policy_for(type);
  if (policy == nullptr) {
    return std::nullopt;
  }
  std::optional<std::uint64_t> cap;
  const std::uint64_t regenerators = population(UserType::Regenerator);
  switch (policy->proportionality) {
    case CapDirection::Multiply:
      cap = std::max(regenerators * policy->proportionality_ratio, policy->proportionality_floor);
      break;
    case CapDirection::Divide:
      cap = std::max(policy->proportionality_ratio == 0 ? 0 : regenerators / policy->proportionality_ratio,
                     policy->proportionality_floor);
      break;
    case CapDirection::None:
      break;
  }
  if (policy->max_population > 0) {
    cap = cap.has_value() ? std::min(*cap, policy->max_population) : policy->max_population;
  }
  return cap;
}

std::vector<Account> CommunityRegistry::accounts() const {
  std::vector<Account> out;
  out.reserve(accounts_.size());
  for (const auto& [address, account] : accounts_) {
    out.push_back(account);
  }
  std::ranges::sort(out, [](const Account& lhs, const Account& rhs) { return lhs.address < rhs.address; });
  return out;
}

}  // namespace regen
