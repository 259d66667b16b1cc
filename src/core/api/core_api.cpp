#include "core/api/core_api.hpp"

namespace regen {

Result CoreApi::init(const InitConfig& config) {
  return service_.init(config);
}

Result CoreApi::advance_to_block(BlockHeight block) {
  return service_.advance_to_block(block);
}

Result CoreApi::register_user(const RegistrationDraft& draft) {
  return service_.register_user(draft);
}

Result CoreApi::invite(const InvitationDraft& draft) {
  return service_.invite(draft);
}

Result CoreApi::request_inspection(const Address& regenerator) {
  return service_.request_inspection(regenerator);
}

Result CoreApi::accept_inspection(const Address& inspector, std::uint64_t inspection_id) {
  return service_.accept_inspection(inspector, inspection_id);
}

Result CoreApi::realize_inspection(const InspectionReport& report) {
  return service_.realize_inspection(report);
}

Result CoreApi::expire_inspection(std::uint64_t inspection_id) {
  return service_.expire_inspection(inspection_id);
}

Result CoreApi::submit_resource(const ResourceDraft& draft) {
  return service_.submit_resource(draft);
}

Result CoreApi::vote_resource(const ResourceVoteDraft& draft) {
  return service_.vote_resource(draft);
}

Result CoreApi::vote_user(const UserVoteDraft& draft) {
  return service_.vote_user(draft);
}

Result CoreApi::add_delation(const DelationDraft& draft) {
  return service_.add_delation(draft);
}

Result CoreApi::thumb_delation(const Address& voter, std::uint64_t delation_id, bool up) {
  return service_.thumb_delation(voter, delation_id, up);
}

Result CoreApi::convert_points(const Address& voter) {
  return service_.convert_points(voter);
}

Result CoreApi::withdraw(const Address& account, std::optional<PoolKind> pool) {
  return service_.withdraw(account, pool);
}

Result CoreApi::burn(const Address& supporter, TokenAmount amount) {
  return service_.burn(supporter, amount);
}

Result CoreApi::transfer(const Address& from, const Address& to, TokenAmount amount) {
  return service_.transfer(from, to, amount);
}

StatusReport CoreApi::status() const {
  return service_.status();
}

std::string CoreApi::state_digest() const {
  return service_.state_digest();
}

TokenAmount CoreApi::balance_of(const Address& address) const {
  return service_.balance_of(address);
}

std::optional<Account> CoreApi::account(const Address& address) const {
  return service_.find_account(address);
}

std::optional<Inspection> CoreApi::inspection(std::uint64_t id) const {
  return service_.find_inspection(id);
}

Level CoreApi::level_of(const Address& address) const {
  return service_.level_of(address);
}

VoterState CoreApi::voter(const Address& address) const {
  return service_.voter_state(address);
}

}  // namespace regen
