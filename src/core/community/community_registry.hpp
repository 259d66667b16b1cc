#pragma once

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/community/invitation_guard.hpp"
#include "core/config/protocol_config.hpp"
#include "core/events/event_bus.hpp"
#include "core/model/types.hpp"

namespace regen {

struct Account {
  Address address;
  UserType type = UserType::Undefined;
  // Type held before denial; equals `type` while active.
  UserType registered_as = UserType::Undefined;
  std::string name;
  std::string proof_hash;
  std::uint64_t area = 0;
  Address inviter;
  BlockHeight registered_at = 0;
  Era registered_era = 0;
  BlockHeight denied_at = 0;

  std::uint64_t inviter_penalties = 0;
  bool invite_rights_revoked = false;
  bool has_invited = false;
  BlockHeight last_invitation_at = 0;
  std::vector<Address> invitees;
};

struct Invitation {
  Address invited;
  Address inviter;
  UserType type = UserType::Undefined;
  BlockHeight created_at = 0;
  bool consumed = false;
  bool revoked = false;
};

// Identity, invitation graph, population caps and the denial cascade.
class CommunityRegistry {
public:
  CommunityRegistry(const ProtocolConfig& config, EventBus& bus);

  Result add_user(const RegistrationDraft& draft, BlockHeight block, Era era);
  // Setup-phase registration: no invitation and no population cap.
  Result add_genesis_member(const GenesisMember& member, BlockHeight block, Era era);

  // `inviter_stats` describes the inviter's own type.
  Result invite(const InvitationDraft& draft, BlockHeight block, Era era, const LevelSnapshot& inviter_stats);

  // Flips the account to Denied, revokes its invitations, penalises its
  // inviter and publishes UserDenied.
  Result deny(const Address& address, BlockHeight block, Era era, std::string_view reason);

  [[nodiscard]] const Account* account(const Address& address) const;
  [[nodiscard]] UserType type_of(const Address& address) const;
  [[nodiscard]] bool is_active(const Address& address) const;
  [[nodiscard]] bool is_active_as(const Address& address, UserType type) const;
  [[nodiscard]] const Invitation* invitation(const Address& invited) const;
  [[nodiscard]] bool invitation_live(const Invitation& invitation, BlockHeight block) const;

  [[nodiscard]] std::uint64_t population(UserType type) const;
  [[nodiscard]] std::uint64_t voter_population() const;
  // nullopt when the type is unbounded.
  [[nodiscard]] std::optional<std::uint64_t> population_cap(UserType type) const;
  [[nodiscard]] std::vector<Account> accounts() const;
  [[nodiscard]] const InvitationGuard& guard() const { return guard_; }

private:
  Result validate_draft(const RegistrationDraft& draft) const;
  Account& insert_account(const RegistrationDraft& draft, BlockHeight block, Era era);
  void revoke_issued_invitations(const Address& inviter);
  Result publish_registered(const Account& account, BlockHeight block, Era era);

  const ProtocolConfig& config_;
  EventBus& bus_;
  InvitationGuard guard_;
  std::unordered_map<Address, Account> accounts_;
  std::unordered_map<Address, Invitation> invitations_;
  std::map<UserType, std::uint64_t> population_;
};

}  // namespace regen
