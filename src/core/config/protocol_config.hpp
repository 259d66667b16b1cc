#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"

namespace regen {

enum class CapDirection {
  None,
  Multiply,
  Divide,
};

enum class LevelRule {
  None,
  PerResource,
  PerInviteeMilestone,
};

struct TypePolicy {
  UserType type = UserType::Undefined;
  bool need_invitation_on_register = true;
  std::vector<UserType> inviter_types;
  BlockHeight invitation_delay_blocks = 0;
  std::uint64_t max_population = 0;  // 0 -> unbounded

  // Cap derived from the live Regenerator population.
  CapDirection proportionality = CapDirection::None;
  std::uint64_t proportionality_ratio = 0;
  std::uint64_t proportionality_floor = 0;

  bool voter_eligible = false;
  LevelRule level_rule = LevelRule::None;
  std::optional<ResourceKind> resource_kind;
  Level levels_per_resource = 1;
  BlockHeight submission_delay_blocks = 0;
};

struct PoolPolicy {
  PoolKind kind = PoolKind::Regenerator;
  TokenAmount total_pool_tokens = 0;
};

// Lower bounds of tiers 1..6; tier points are {1, 2, 4, 8, 16, 32} and
// anything below the first bound scores 0.
struct ScoringThresholds {
  std::array<std::uint64_t, 6> trees = {500, 1'000, 5'000, 10'000, 50'000, 100'000};
  std::array<std::uint64_t, 6> biodiversity = {5, 10, 20, 40, 80, 160};
};

// Registered without invitation during the one-time setup phase.
struct GenesisMember {
  Address address;
  UserType type = UserType::Undefined;
  std::uint64_t area = 0;
};

struct ProtocolConfig {
  BlockHeight deploy_block = 0;
  BlockHeight blocks_per_era = 12'000;
  std::uint64_t halving = 12;
  std::uint64_t era_precision = 100'000;

  std::uint64_t bootstrap_threshold = 5;
  std::uint64_t max_inviter_penalties = 5;
  BlockHeight invitation_expiry_blocks = 0;

  BlockHeight inter_inspection_delay_blocks = 6'000;
  BlockHeight inspection_deadline_blocks = 50'000;
  BlockHeight inspection_request_delay_blocks = 6'000;
  std::uint64_t max_give_ups = 4;
  std::uint64_t min_regenerator_area = 2'500;
  std::uint64_t max_regenerator_area = 1'000'000;
  std::uint64_t max_lifetime_inspections = 6;
  std::uint64_t min_inspections_to_pool = 3;
  std::uint64_t max_trees_result = 10'000'000;
  std::uint64_t max_biodiversity_result = 5'000;
  Level inspector_levels_per_inspection = 1;
  std::size_t max_hash_length = 128;
  std::size_t max_text_length = 2'000;
  ScoringThresholds scoring;

  BlockHeight safeguard_window_blocks = 1'000;
  BlockHeight voter_min_interval_blocks = 100;
  std::uint64_t points_per_validator_level = 50;
  std::uint64_t invalidation_quorum_divisor = 2;
  std::uint64_t min_votes_to_invalidate = 2;
  std::uint64_t max_resource_penalties = 3;

  TokenAmount total_supply = 1'500'000'000;
  Address treasury_account = "treasury";
  std::vector<PoolPolicy> pools;
  std::vector<TypePolicy> types;
  std::vector<GenesisMember> genesis_members;

  [[nodiscard]] const TypePolicy* policy_for(UserType type) const;
  [[nodiscard]] const PoolPolicy* pool_policy(PoolKind kind) const;
  [[nodiscard]] TokenAmount total_pool_tokens() const;
};

ProtocolConfig default_protocol_config();
Result validate_protocol_config(const ProtocolConfig& config);

// Overrides fields of `config` from a key=value profile file.
Result load_protocol_config(std::string_view path, ProtocolConfig& config);
Result apply_protocol_overrides(std::string_view payload, ProtocolConfig& config);

// Canonical text form; equal fingerprints mean identical configuration.
std::string protocol_config_fingerprint(const ProtocolConfig& config);

}  // namespace regen
