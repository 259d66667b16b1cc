#pragma once

#include <optional>
#include <string>

#include "core/model/types.hpp"
#include "core/service/regen_service.hpp"

namespace regen {

class CoreApi {
public:
  Result init(const InitConfig& config);

  Result advance_to_block(BlockHeight block);

  Result register_user(const RegistrationDraft& draft);
  Result invite(const InvitationDraft& draft);

  Result request_inspection(const Address& regenerator);
  Result accept_inspection(const Address& inspector, std::uint64_t inspection_id);
  Result realize_inspection(const InspectionReport& report);
  Result expire_inspection(std::uint64_t inspection_id);

  Result submit_resource(const ResourceDraft& draft);
  Result vote_resource(const ResourceVoteDraft& draft);
  Result vote_user(const UserVoteDraft& draft);
  Result add_delation(const DelationDraft& draft);
  Result thumb_delation(const Address& voter, std::uint64_t delation_id, bool up);
  Result convert_points(const Address& voter);

  Result withdraw(const Address& account, std::optional<PoolKind> pool = std::nullopt);
  Result burn(const Address& supporter, TokenAmount amount);
  Result transfer(const Address& from, const Address& to, TokenAmount amount);

  StatusReport status() const;
  std::string state_digest() const;
  TokenAmount balance_of(const Address& address) const;
  std::optional<Account> account(const Address& address) const;
  std::optional<Inspection> inspection(std::uint64_t id) const;
  Level level_of(const Address& address) const;
  VoterState voter(const Address& address) const;

  const RegenService& service() const { return service_; }

private:
  RegenService service_;
};

}  // namespace regen
