#include "core/config/protocol_config.hpp"

#include <algorithm>
#include <fstream>
#include <functional>
#include <sstream>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "core/util/canonical.hpp"

namespace regen {
namespace {

std::string_view cap_direction_to_string(CapDirection direction) {
  switch (direction) {
    case CapDirection::None:
      return "none";
    case CapDirection::Multiply:
      return "multiply";
    case CapDirection::Divide:
      return "divide";
  }
  return "none";
}

std::optional<CapDirection> cap_direction_from_string(std::string_view text) {
  const std::string value = util::lowercase_copy(text);
  if (value == "none") {
    return CapDirection::None;
  }
  if (value == "multiply") {
    return CapDirection::Multiply;
  }
  if (value == "divide") {
    return CapDirection::Divide;
  }
  return std::nullopt;
}

std::vector<std::string> split_csv(std::string_view csv) {
  std::vector<std::string> values;
  std::string current;
  for (char c : csv) {
    if (c == ',') {
      const std::string trimmed = util::trim_copy(current);
      if (!trimmed.empty()) {
        values.push_back(trimmed);
      }
      current.clear();
      continue;
    }
    current.push_back(c);
  }
  const std::string trimmed = util::trim_copy(current);
  if (!trimmed.empty()) {
    values.push_back(trimmed);
  }
  return values;
}

template <typename Values>
std::string join_numbers(const Values& values) {
  std::ostringstream out;
  bool first = true;
  for (const auto value : values) {
    if (!first) {
      out << ',';
    }
    first = false;
    out << value;
  }
  return out.str();
}

TypePolicy make_type_policy(UserType type, std::vector<UserType> inviters, BlockHeight delay) {
  TypePolicy policy;
  policy.type = type;
  policy.need_invitation_on_register = true;
  policy.inviter_types = std::move(inviters);
  policy.invitation_delay_blocks = delay;
  return policy;
}

std::string type_prefix(UserType type) {
  return "type." + std::string{to_string(type)} + ".";
}

std::string pool_prefix(PoolKind kind) {
  return "pool." + std::string{to_string(kind)} + ".";
}

Result parse_thresholds(std::string_view text, std::array<std::uint64_t, 6>& out, std::string_view key) {
  const auto parts = split_csv(text);
  if (parts.size() != out.size()) {
    return Result::configuration("scoring-table", std::string{key} + " needs exactly 6 thresholds.");
  }
  for (std::size_t i = 0; i < parts.size(); ++i) {
    const auto parsed = util::parse_u64(parts[i]);
    if (!parsed.has_value()) {
      return Result::configuration("scoring-table", std::string{key} + " has a non-numeric threshold.");
    }
    out[i] = *parsed;
  }
  return Result::success();
}

Result parse_genesis_members(std::string_view text, std::vector<GenesisMember>& out) {
  out.clear();
  for (const auto& entry : split_csv(text)) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : entry) {
      if (c == ':') {
        parts.push_back(util::trim_copy(current));
        current.clear();
        continue;
      }
      current.push_back(c);
    }
    parts.push_back(util::trim_copy(current));
    if (parts.size() < 2 || parts.size() > 3 || parts[0].empty()) {
      return Result::configuration("genesis-member", "Genesis member must be address:Type[:area]: " + entry);
    }
    const auto type = user_type_from_string(parts[1]);
    if (!type.has_value()) {
      return Result::configuration("genesis-member", "Unknown genesis member type: " + parts[1]);
    }
    GenesisMember member;
    member.address = parts[0];
    member.type = *type;
    if (parts.size() == 3) {
      const auto area = util::parse_u64(parts[2]);
      if (!area.has_value()) {
        return Result::configuration("genesis-member", "Genesis member area is not numeric: " + entry);
      }
      member.area = *area;
    }
    out.push_back(std::move(member));
  }
  return Result::success();
}

bool strictly_increasing(const std::array<std::uint64_t, 6>& values) {
  for (std::size_t i = 1; i < values.size(); ++i) {
    if (values[i] <= values[i - 1]) {
      return false;
    }
  }
  return values.front() > 0;
}

}  // namespace

const TypePolicy* ProtocolConfig::policy_for(UserType type) const {
  const auto it = std::ranges::find_if(types, [type](const TypePolicy& policy) {
    return policy.type == type;
  });
  return it == types.end() ? nullptr : &*it;
}

const PoolPolicy* ProtocolConfig::pool_policy(PoolKind kind) const {
  const auto it = std::ranges::find_if(pools, [kind](const PoolPolicy& policy) {
    return policy.kind == kind;
  });
  return it == pools.end() ? nullptr : &*it;
}

TokenAmount ProtocolConfig::total_pool_tokens() const {
  TokenAmount total = 0;
  for (const auto& pool : pools) {
    total += pool.total_pool_tokens;
  }
  return total;
}

ProtocolConfig default_protocol_config() {
  ProtocolConfig config;
  config.pools = {
      {PoolKind::Regenerator, 750'000'000},
      {PoolKind::Inspector, 180'000'000},
      {PoolKind::Researcher, 120'000'000},
      {PoolKind::Developer, 120'000'000},
      {PoolKind::Contributor, 60'000'000},
      {PoolKind::Activist, 60'000'000},
      {PoolKind::Validator, 60'000'000},
  };

  TypePolicy regenerator = make_type_policy(UserType::Regenerator, {UserType::Activist}, 0);

  TypePolicy inspector = make_type_policy(UserType::Inspector, {UserType::Activist}, 0);
  inspector.proportionality = CapDirection::Multiply;
  inspector.proportionality_ratio = 20;
  inspector.proportionality_floor = 5;

  TypePolicy researcher = make_type_policy(UserType::Researcher, {UserType::Researcher}, 6'000);
  researcher.proportionality = CapDirection::Divide;
  researcher.proportionality_ratio = 10;
  researcher.proportionality_floor = 5;
  researcher.voter_eligible = true;
  researcher.level_rule = LevelRule::PerResource;
  researcher.resource_kind = ResourceKind::Research;
  researcher.submission_delay_blocks = 1'000;

  TypePolicy developer = make_type_policy(UserType::Developer, {UserType::Developer}, 6'000);
  developer.proportionality = CapDirection::Divide;
  developer.proportionality_ratio = 10;
  developer.proportionality_floor = 5;
  developer.voter_eligible = true;
  developer.level_rule = LevelRule::PerResource;
  developer.resource_kind = ResourceKind::Report;
  developer.submission_delay_blocks = 1'000;

  TypePolicy contributor = make_type_policy(UserType::Contributor, {UserType::Contributor}, 6'000);
  contributor.proportionality = CapDirection::Divide;
  contributor.proportionality_ratio = 10;
  contributor.proportionality_floor = 5;
  contributor.voter_eligible = true;
  contributor.level_rule = LevelRule::PerResource;
  contributor.resource_kind = ResourceKind::Contribution;
  contributor.submission_delay_blocks = 1'000;

  TypePolicy activist = make_type_policy(UserType::Activist, {UserType::Activist}, 6'000);
  activist.proportionality = CapDirection::Divide;
  activist.proportionality_ratio = 10;
  activist.proportionality_floor = 5;
  activist.voter_eligible = true;
  activist.level_rule = LevelRule::PerInviteeMilestone;

  TypePolicy supporter = make_type_policy(UserType::Supporter, {}, 0);
  supporter.need_invitation_on_register = false;

  config.types = {regenerator, inspector, researcher, developer, contributor, activist, supporter};
  return config;
}

Result validate_protocol_config(const ProtocolConfig& config) {
  if (config.blocks_per_era == 0) {
    return Result::configuration("zero-era-length", "blocks_per_era must be greater than zero.");
  }
  if (config.halving == 0) {
    return Result::configuration("zero-halving", "halving must be greater than zero.");
  }
  if (config.era_precision == 0) {
    return Result::configuration("zero-precision", "era_precision must be greater than zero.");
  }
  if (config.safeguard_window_blocks >= config.blocks_per_era) {
    return Result::configuration("safeguard-window", "safeguard_window_blocks must be shorter than an era.");
  }
  if (config.inspection_deadline_blocks == 0) {
    return Result::configuration("inspection-deadline", "inspection_deadline_blocks must be greater than zero.");
  }
  if (config.min_regenerator_area > config.max_regenerator_area) {
    return Result::configuration("area-bounds", "min_regenerator_area exceeds max_regenerator_area.");
  }
  if (config.min_inspections_to_pool == 0 ||
      config.min_inspections_to_pool > config.max_lifetime_inspections) {
    return Result::configuration("pool-entry",
                                 "min_inspections_to_pool must be within [1, max_lifetime_inspections].");
  }
  if (config.max_give_ups == 0 || config.max_inviter_penalties == 0 || config.max_resource_penalties == 0) {
    return Result::configuration("penalty-limits", "Penalty limits must be greater than zero.");
  }
  if (config.points_per_validator_level == 0) {
    return Result::configuration("points-rate", "points_per_validator_level must be greater than zero.");
  }
  if (config.invalidation_quorum_divisor == 0) {
    return Result::configuration("quorum-divisor", "invalidation_quorum_divisor must be greater than zero.");
  }
  if (config.max_hash_length == 0 || config.max_text_length == 0) {
    return Result::configuration("text-limits", "Hash and text limits must be greater than zero.");
  }
  if (!strictly_increasing(config.scoring.trees) || !strictly_increasing(config.scoring.biodiversity)) {
    return Result::configuration("scoring-table", "Scoring thresholds must be positive and strictly increasing.");
  }
  if (config.treasury_account.empty()) {
    return Result::configuration("treasury", "treasury_account must not be empty.");
  }

  for (const PoolKind kind : all_pool_kinds()) {
    if (config.pool_policy(kind) == nullptr) {
      return Result::configuration("missing-pool", "Missing pool policy for " + std::string{to_string(kind)} + ".");
    }
  }
  if (config.total_pool_tokens() > config.total_supply) {
    return Result::configuration("pool-budget", "Pool budgets exceed total_supply.");
  }

  for (const UserType type : registrable_user_types()) {
    const TypePolicy* policy = config.policy_for(type);
    if (policy == nullptr) {
      return Result::configuration("missing-type-policy",
                                   "Missing type policy for " + std::string{to_string(type)} + ".");
    }
    if (policy->proportionality != CapDirection::None && policy->proportionality_ratio == 0) {
      return Result::configuration("proportionality",
                                   "Proportional type " + std::string{to_string(type)} + " needs a ratio.");
    }
    if (policy->level_rule == LevelRule::PerResource && !policy->resource_kind.has_value()) {
      return Result::configuration("resource-kind",
                                   "Type " + std::string{to_string(type)} + " earns per resource but has none.");
    }
    for (const UserType inviter : policy->inviter_types) {
      if (inviter == UserType::Undefined || inviter == UserType::Denied || inviter == UserType::Supporter) {
        return Result::configuration("inviter-type",
                                     "Type " + std::string{to_string(type)} + " lists an invalid inviter type.");
      }
    }
  }

  std::unordered_set<Address> seen;
  for (const auto& member : config.genesis_members) {
    if (member.address.empty() || !seen.insert(member.address).second) {
      return Result::configuration("genesis-member", "Genesis members need unique, non-empty addresses.");
    }
    if (member.type == UserType::Undefined || member.type == UserType::Denied) {
      return Result::configuration("genesis-member", "Genesis member " + member.address + " has no usable type.");
    }
    if (member.type == UserType::Regenerator &&
        (member.area < config.min_regenerator_area || member.area > config.max_regenerator_area)) {
      return Result::configuration("genesis-member", "Genesis regenerator " + member.address + " area out of bounds.");
    }
  }

  return Result::success();
}

Result apply_protocol_overrides(std::string_view payload, ProtocolConfig& config) {
  std::unordered_map<std::string, std::function<bool(std::uint64_t)>> numeric;
  const auto bind = [&numeric](std::string key, auto& field) {
    numeric.emplace(std::move(key), [&field](std::uint64_t value) {
      field = static_cast<std::remove_reference_t<decltype(field)>>(value);
      return true;
    });
  };

  bind("deploy_block", config.deploy_block);
  bind("blocks_per_era", config.blocks_per_era);
  bind("halving", config.halving);
  bind("era_precision", config.era_precision);
  bind("bootstrap_threshold", config.bootstrap_threshold);
  bind("max_inviter_penalties", config.max_inviter_penalties);
  bind("invitation_expiry_blocks", config.invitation_expiry_blocks);
  bind("inter_inspection_delay_blocks", config.inter_inspection_delay_blocks);
  bind("inspection_deadline_blocks", config.inspection_deadline_blocks);
  bind("inspection_request_delay_blocks", config.inspection_request_delay_blocks);
  bind("max_give_ups", config.max_give_ups);
  bind("min_regenerator_area", config.min_regenerator_area);
  bind("max_regenerator_area", config.max_regenerator_area);
  bind("max_lifetime_inspections", config.max_lifetime_inspections);
  bind("min_inspections_to_pool", config.min_inspections_to_pool);
  bind("max_trees_result", config.max_trees_result);
  bind("max_biodiversity_result", config.max_biodiversity_result);
  bind("inspector_levels_per_inspection", config.inspector_levels_per_inspection);
  bind("max_hash_length", config.max_hash_length);
  bind("max_text_length", config.max_text_length);
  bind("safeguard_window_blocks", config.safeguard_window_blocks);
  bind("voter_min_interval_blocks", config.voter_min_interval_blocks);
  bind("points_per_validator_level", config.points_per_validator_level);
  bind("invalidation_quorum_divisor", config.invalidation_quorum_divisor);
  bind("min_votes_to_invalidate", config.min_votes_to_invalidate);
  bind("max_resource_penalties", config.max_resource_penalties);
  bind("total_supply", config.total_supply);

  for (auto& pool : config.pools) {
    bind(pool_prefix(pool.kind) + "total_tokens", pool.total_pool_tokens);
  }
  for (auto& policy : config.types) {
    const std::string prefix = type_prefix(policy.type);
    bind(prefix + "invitation_delay_blocks", policy.invitation_delay_blocks);
    bind(prefix + "max_population", policy.max_population);
    bind(prefix + "proportionality_ratio", policy.proportionality_ratio);
    bind(prefix + "proportionality_floor", policy.proportionality_floor);
    bind(prefix + "levels_per_resource", policy.levels_per_resource);
    bind(prefix + "submission_delay_blocks", policy.submission_delay_blocks);
  }

  for (const auto& [key, value] : util::parse_canonical_map(payload)) {
    if (const auto it = numeric.find(key); it != numeric.end()) {
      const auto parsed = util::parse_u64(value);
      if (!parsed.has_value()) {
        return Result::configuration("not-numeric", "Config key " + key + " expects an unsigned integer.");
      }
      it->second(*parsed);
      continue;
    }

    if (key == "treasury_account") {
      config.treasury_account = value;
      continue;
    }
    if (key == "scoring.trees") {
      const Result parsed = parse_thresholds(value, config.scoring.trees, key);
      if (!parsed.ok) {
        return parsed;
      }
      continue;
    }
    if (key == "scoring.biodiversity") {
      const Result parsed = parse_thresholds(value, config.scoring.biodiversity, key);
      if (!parsed.ok) {
        return parsed;
      }
      continue;
    }
    if (key == "genesis.members") {
      const Result parsed = parse_genesis_members(value, config.genesis_members);
      if (!parsed.ok) {
        return parsed;
      }
      continue;
    }

    bool handled = false;
    for (auto& policy : config.types) {
      const std::string prefix = type_prefix(policy.type);
      if (!key.starts_with(prefix)) {
        continue;
      }
      const std::string field = key.substr(prefix.size());
      if (field == "proportionality") {
        const auto direction = cap_direction_from_string(value);
        if (!direction.has_value()) {
          return Result::configuration("proportionality", "Unknown proportionality direction: " + value);
        }
        policy.proportionality = *direction;
        handled = true;
      } else if (field == "need_invitation") {
        policy.need_invitation_on_register = util::parse_boolish(value);
        handled = true;
      } else if (field == "inviters") {
        policy.inviter_types.clear();
        for (const auto& name : split_csv(value)) {
          const auto inviter = user_type_from_string(name);
          if (!inviter.has_value()) {
            return Result::configuration("inviter-type", "Unknown inviter type: " + name);
          }
          policy.inviter_types.push_back(*inviter);
        }
        handled = true;
      }
      break;
    }
    if (!handled) {
      return Result::configuration("unknown-key", "Unknown config key: " + key);
    }
  }

  return Result::success();
}

Result load_protocol_config(std::string_view path, ProtocolConfig& config) {
  std::ifstream in{std::string{path}};
  if (!in) {
    return Result::configuration("config-file", "Unable to open config file: " + std::string{path});
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  std::string payload = buffer.str();
  if (!payload.empty() && payload.back() != '\n') {
    payload.push_back('\n');
  }
  return apply_protocol_overrides(payload, config);
}

std::string protocol_config_fingerprint(const ProtocolConfig& config) {
  std::vector<std::pair<std::string, std::string>> fields = {
      {"deploy_block", std::to_string(config.deploy_block)},
      {"blocks_per_era", std::to_string(config.blocks_per_era)},
      {"halving", std::to_string(config.halving)},
      {"era_precision", std::to_string(config.era_precision)},
      {"bootstrap_threshold", std::to_string(config.bootstrap_threshold)},
      {"max_inviter_penalties", std::to_string(config.max_inviter_penalties)},
      {"invitation_expiry_blocks", std::to_string(config.invitation_expiry_blocks)},
      {"inter_inspection_delay_blocks", std::to_string(config.inter_inspection_delay_blocks)},
      {"inspection_deadline_blocks", std::to_string(config.inspection_deadline_blocks)},
      {"inspection_request_delay_blocks", std::to_string(config.inspection_request_delay_blocks)},
      {"max_give_ups", std::to_string(config.max_give_ups)},
      {"min_regenerator_area", std::to_string(config.min_regenerator_area)},
      {"max_regenerator_area", std::to_string(config.max_regenerator_area)},
      {"max_lifetime_inspections", std::to_string(config.max_lifetime_inspections)},
      {"min_inspections_to_pool", std::to_string(config.min_inspections_to_pool)},
      {"max_trees_result", std::to_string(config.max_trees_result)},
      {"max_biodiversity_result", std::to_string(config.max_biodiversity_result)},
      {"inspector_levels_per_inspection", std::to_string(config.inspector_levels_per_inspection)},
      {"max_hash_length", std::to_string(config.max_hash_length)},
      {"max_text_length", std::to_string(config.max_text_length)},
      {"scoring.trees", join_numbers(config.scoring.trees)},
      {"scoring.biodiversity", join_numbers(config.scoring.biodiversity)},
      {"safeguard_window_blocks", std::to_string(config.safeguard_window_blocks)},
      {"voter_min_interval_blocks", std::to_string(config.voter_min_interval_blocks)},
      {"points_per_validator_level", std::to_string(config.points_per_validator_level)},
      {"invalidation_quorum_divisor", std::to_string(config.invalidation_quorum_divisor)},
      {"min_votes_to_invalidate", std::to_string(config.min_votes_to_invalidate)},
      {"max_resource_penalties", std::to_string(config.max_resource_penalties)},
      {"total_supply", std::to_string(config.total_supply)},
      {"treasury_account", config.treasury_account},
  };

  for (const auto& pool : config.pools) {
    fields.emplace_back(pool_prefix(pool.kind) + "total_tokens", std::to_string(pool.total_pool_tokens));
  }
  for (const auto& policy : config.types) {
    const std::string prefix = type_prefix(policy.type);
    std::vector<std::string> inviters;
    for (const UserType inviter : policy.inviter_types) {
      inviters.emplace_back(to_string(inviter));
    }
    std::string inviter_list;
    for (const auto& name : inviters) {
      if (!inviter_list.empty()) {
        inviter_list.push_back(',');
      }
      inviter_list += name;
    }
    fields.emplace_back(prefix + "need_invitation", policy.need_invitation_on_register ? "true" : "false");
    fields.emplace_back(prefix + "inviters", inviter_list);
    fields.emplace_back(prefix + "invitation_delay_blocks", std::to_string(policy.invitation_delay_blocks));
    fields.emplace_back(prefix + "max_population", std::to_string(policy.max_population));
    fields.emplace_back(prefix + "proportionality", std::string{cap_direction_to_string(policy.proportionality)});
    fields.emplace_back(prefix + "proportionality_ratio", std::to_string(policy.proportionality_ratio));
    fields.emplace_back(prefix + "proportionality_floor", std::to_string(policy.proportionality_floor));
    fields.emplace_back(prefix + "levels_per_resource", std::to_string(policy.levels_per_resource));
    fields.emplace_back(prefix + "submission_delay_blocks", std::to_string(policy.submission_delay_blocks));
    fields.emplace_back(prefix + "voter_eligible", policy.voter_eligible ? "true" : "false");
    fields.emplace_back(prefix + "level_rule", std::to_string(static_cast<int>(policy.level_rule)));
    fields.emplace_back(prefix + "resource_kind", policy.resource_kind.has_value()
                                                       ? std::string{to_string(*policy.resource_kind)}
                                                       : std::string{});
  }

  std::string members;
  for (const auto& member : config.genesis_members) {
    if (!members.empty()) {
      members.push_back(',');
    }
    members += member.address + ":" + std::string{to_string(member.type)} + ":" + std::to_string(member.area);
  }
  fields.emplace_back("genesis.members", members);

  return util::canonical_join(std::move(fields));
}

}  // namespace regen
