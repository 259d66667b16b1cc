#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "core/community/community_registry.hpp"
#include "core/config/protocol_config.hpp"
#include "core/events/event_bus.hpp"
#include "core/pool/pool_set.hpp"
#include "core/time/time_bucketing.hpp"

namespace regen {

struct Resource {
  std::uint64_t id = 0;
  ResourceKind kind = ResourceKind::Report;
  Address author;
  std::string title;
  std::string content_hash;
  // Inspection id for Inspection resources, otherwise the resource id.
  std::uint64_t ref_id = 0;
  BlockHeight created_at = 0;
  Era era = 0;
  bool valid = true;
  // Cleared when an expired inspection withdraws its resource.
  bool open = true;
  std::uint64_t validation_count = 0;
  BlockHeight invalidated_at = 0;
  std::set<Address> voters;
};

struct UserChallenge {
  Era era = 0;
  Address target;
  Address hunter;
  BlockHeight opened_at = 0;
  std::uint64_t votes = 0;
  bool resolved = false;
  std::set<Address> voters;
};

// Non-binding pre-filter; thumbs never change account state.
struct Delation {
  std::uint64_t id = 0;
  Address informer;
  Address reported;
  std::string title;
  std::string testimony_hash;
  BlockHeight created_at = 0;
  Era era = 0;
  std::uint64_t thumbs_up = 0;
  std::uint64_t thumbs_down = 0;
  std::set<Address> thumbs;
};

struct VoterState {
  std::uint64_t points = 0;
  std::uint64_t votes_cast = 0;
  bool has_voted = false;
  BlockHeight last_vote_at = 0;
  Level converted_levels = 0;
  Level hunter_levels = 0;
};

// Era-bounded challenge process over resources and users. Resource votes
// count only in the resource's era; user tallies and hunters are per era.
class GovernanceValidation {
public:
  GovernanceValidation(const ProtocolConfig& config, const TimeBucketing& time, CommunityRegistry& registry,
                       PoolSet& pools, EventBus& bus);

  void attach();

  [[nodiscard]] bool in_safeguard_window(BlockHeight block) const;
  // TemporalGate inside the window, retry at the next era's first block.
  [[nodiscard]] Result safeguard_gate(BlockHeight block, std::string_view action) const;

  Result register_resource(ResourceKind kind, const Address& author, std::string title, std::string content_hash,
                           std::optional<std::uint64_t> ref_id, BlockHeight block, std::uint64_t& out_id);

  [[nodiscard]] bool can_vote(const Address& voter) const;
  [[nodiscard]] std::uint64_t votes_to_invalidate() const;

  Result vote_resource(const ResourceVoteDraft& draft, BlockHeight block);
  Result vote_user(const UserVoteDraft& draft, BlockHeight block);
  Result add_delation(const DelationDraft& draft, BlockHeight block);
  Result thumb_delation(const Address& voter, std::uint64_t delation_id, bool up);
  Result convert_points(const Address& voter, BlockHeight block);

  [[nodiscard]] const Resource* resource(std::uint64_t id) const;
  [[nodiscard]] std::vector<Resource> resources() const;
  [[nodiscard]] const Delation* delation(std::uint64_t id) const;
  [[nodiscard]] std::vector<Delation> delations() const;
  [[nodiscard]] VoterState voter(const Address& address) const;
  [[nodiscard]] const UserChallenge* challenge(Era era, const Address& target) const;
  [[nodiscard]] std::uint64_t resource_penalties(const Address& author) const;

private:
  Result check_voter(const Address& voter, BlockHeight block) const;
  void record_vote(const Address& voter, BlockHeight block);
  Result invalidate_resource(Resource& resource, BlockHeight block, Era era);
  Result grant_validator_level(const Address& account, std::string event_id, BlockHeight block, Era era);

  Result on_inspection_accepted(const DomainEvent& event);
  Result on_inspection_realized(const DomainEvent& event);
  Result on_inspection_expired(const DomainEvent& event);

  const ProtocolConfig& config_;
  const TimeBucketing& time_;
  CommunityRegistry& registry_;
  PoolSet& pools_;
  EventBus& bus_;

  std::uint64_t next_resource_id_ = 1;
  std::uint64_t next_delation_id_ = 1;
  std::map<std::uint64_t, Resource> resources_;
  std::unordered_map<std::uint64_t, std::uint64_t> inspection_resources_;
  std::map<std::pair<Era, Address>, UserChallenge> challenges_;
  std::map<std::uint64_t, Delation> delations_;
  std::unordered_map<Address, VoterState> voters_;
  std::unordered_map<Address, std::uint64_t> resource_penalties_;
};

}  // namespace regen
