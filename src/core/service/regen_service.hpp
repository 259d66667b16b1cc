#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "core/community/community_registry.hpp"
#include "core/config/protocol_config.hpp"
#include "core/events/event_bus.hpp"
#include "core/governance/governance_validation.hpp"
#include "core/inspection/inspection_lifecycle.hpp"
#include "core/ledger/token_ledger.hpp"
#include "core/model/types.hpp"
#include "core/pool/pool_set.hpp"
#include "core/rules/contributor_rules.hpp"
#include "core/rules/inspector_rules.hpp"
#include "core/rules/regenerator_rules.hpp"
#include "core/rules/supporter_rules.hpp"
#include "core/storage/journal.hpp"
#include "core/time/time_bucketing.hpp"

namespace regen {

struct InitConfig {
  // Empty keeps the journal in memory.
  std::string data_dir;
  // Optional key=value profile applied on top of `protocol`.
  std::string config_path;
  ProtocolConfig protocol = default_protocol_config();
};

struct PoolStatus {
  PoolKind kind = PoolKind::Regenerator;
  Address address;
  TokenAmount total_tokens = 0;
  TokenAmount current_era_budget = 0;
  TokenAmount balance = 0;
  TokenAmount distributed = 0;
  Level active_levels = 0;
  std::size_t participants = 0;
};

struct StatusReport {
  bool initialized = false;
  bool faulted = false;
  std::string fault_reason;
  BlockHeight current_block = 0;
  Era current_era = 0;
  Epoch current_epoch = 0;
  bool in_safeguard_window = false;

  std::map<UserType, std::uint64_t> population;
  std::vector<PoolStatus> pools;

  TokenAmount total_supply = 0;
  TokenAmount total_locked = 0;
  TokenAmount total_certified = 0;
  TokenAmount treasury_balance = 0;

  std::size_t inspections = 0;
  std::size_t resources = 0;
  std::size_t domain_events = 0;
  std::size_t journal_entries = 0;
  std::size_t rejected_commands = 0;
  std::string journal_head;
  std::string config_fingerprint;
  std::string data_dir;
};

// Single-writer facade. Every command runs under one lock, is journaled
// when accepted and written to rejected.log when refused. A consistency
// failure latches the service and refuses further commands.
class RegenService {
public:
  RegenService() = default;
  RegenService(const RegenService&) = delete;
  RegenService& operator=(const RegenService&) = delete;

  // One-time lock: the same configuration again is a no-op, a different
  // one is refused.
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

  // Without `pool` the account's own type pool is used.
  Result withdraw(const Address& account, std::optional<PoolKind> pool = std::nullopt);
  Result burn(const Address& supporter, TokenAmount amount);
  Result transfer(const Address& from, const Address& to, TokenAmount amount);

  [[nodiscard]] bool initialized() const;
  [[nodiscard]] bool faulted() const;
  [[nodiscard]] BlockHeight current_block() const;
  [[nodiscard]] Era current_era() const;
  [[nodiscard]] StatusReport status() const;
  // sha256 over a canonical dump of aggregate state.
  [[nodiscard]] std::string state_digest() const;

  // Copies taken under the service lock; safe while other threads run commands.
  [[nodiscard]] std::optional<Account> find_account(const Address& address) const;
  [[nodiscard]] std::optional<Inspection> find_inspection(std::uint64_t id) const;
  [[nodiscard]] TokenAmount balance_of(const Address& address) const;
  [[nodiscard]] Level level_of(const Address& address) const;
  [[nodiscard]] VoterState voter_state(const Address& address) const;

  // Component views below are not synchronized. They are for single-threaded
  // callers (tests, tooling) that do not run commands concurrently.
  [[nodiscard]] const ProtocolConfig& config() const { return config_; }
  [[nodiscard]] const TimeBucketing& time() const { return *time_; }
  [[nodiscard]] const CommunityRegistry& registry() const { return *registry_; }
  [[nodiscard]] const PoolSet& pools() const { return *pools_; }
  [[nodiscard]] const InMemoryTokenLedger& ledger() const { return *ledger_; }
  [[nodiscard]] const EventBus& events() const { return *bus_; }
  [[nodiscard]] const InspectionLifecycle& inspections() const { return *lifecycle_; }
  [[nodiscard]] const GovernanceValidation& governance() const { return *governance_; }
  [[nodiscard]] const RegeneratorRules& regenerators() const { return *regenerators_; }
  [[nodiscard]] const InspectorRules& inspectors() const { return *inspectors_; }
  [[nodiscard]] const SupporterRules& supporters() const { return *supporters_; }
  [[nodiscard]] const ContributorRules* contributor_rules(UserType type) const;
  [[nodiscard]] const Journal& journal() const { return journal_; }

private:
  using Fields = std::unordered_map<std::string, std::string>;

  Result build_components();
  Result mint_pool_budgets();
  Result register_genesis_members();
  Result replay_journal();

  Result execute(CommandKind kind, const Address& actor,
                 std::vector<std::pair<std::string, std::string>> fields);
  Result apply(CommandKind kind, const Address& actor, BlockHeight block, const Fields& fields);
  Result apply_advance(const Fields& fields);
  Result apply_invite(const Fields& fields, BlockHeight block);
  Result apply_submit(const Fields& fields, BlockHeight block);
  Result apply_withdraw(const Fields& fields, BlockHeight block);

  [[nodiscard]] LevelSnapshot snapshot_for(const Address& account) const;
  ContributorRules* contributor_rules_for(UserType type);

  mutable std::mutex mutex_;
  bool initialized_ = false;
  bool faulted_ = false;
  bool replaying_ = false;
  std::string fault_reason_;
  InitConfig init_config_;
  ProtocolConfig config_;
  std::string fingerprint_;
  BlockHeight current_block_ = 0;

  std::optional<TimeBucketing> time_;
  std::unique_ptr<EventBus> bus_;
  std::unique_ptr<InMemoryTokenLedger> ledger_;
  std::unique_ptr<PoolSet> pools_;
  std::unique_ptr<CommunityRegistry> registry_;
  std::unique_ptr<RegeneratorRules> regenerators_;
  std::unique_ptr<InspectorRules> inspectors_;
  std::unique_ptr<GovernanceValidation> governance_;
  std::unique_ptr<InspectionLifecycle> lifecycle_;
  std::vector<std::unique_ptr<ContributorRules>> contributors_;
  std::unique_ptr<SupporterRules> supporters_;
  Journal journal_;
};

}  // namespace regen
