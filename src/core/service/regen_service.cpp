#include "core/service/regen_service.hpp"

#include <algorithm>
#include <utility>

#include "core/model/app_meta.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace regen {
namespace {

std::string field(const std::unordered_map<std::string, std::string>& fields, std::string_view key) {
  const auto it = fields.find(std::string{key});
  return it == fields.end() ? std::string{} : it->second;
}

std::uint64_t number_field(const std::unordered_map<std::string, std::string>& fields, std::string_view key) {
  return util::parse_u64_or(field(fields, key), 0);
}

Result not_ready(bool initialized, bool faulted, std::string_view fault_reason) {
  if (!initialized) {
    return Result::configuration("not-initialized", "Service is not initialized.");
  }
  if (faulted) {
    return Result::consistency("service-faulted",
                               "Service halted after a consistency failure: " + std::string{fault_reason});
  }
  return Result::success();
}

}  // namespace

Result RegenService::init(const InitConfig& config) {
  std::lock_guard<std::mutex> lock(mutex_);

  const Result hashing = util::init_hashing();
  if (!hashing.ok) {
    return hashing;
  }

  ProtocolConfig protocol = config.protocol;
  if (!config.config_path.empty()) {
    const Result loaded = load_protocol_config(config.config_path, protocol);
    if (!loaded.ok) {
      return loaded;
    }
  }
  const Result valid = validate_protocol_config(protocol);
  if (!valid.ok) {
    return valid;
  }

  const std::string fingerprint = protocol_config_fingerprint(protocol);
  if (initialized_) {
    if (fingerprint == fingerprint_) {
      return Result::success("Already initialized with this configuration.");
    }
    return Result::configuration("config-locked", "Configuration is locked after the first init.");
  }

  const auto time = TimeBucketing::create({
      .deploy_block = protocol.deploy_block,
      .blocks_per_era = protocol.blocks_per_era,
      .halving = protocol.halving,
      .precision = protocol.era_precision,
  });
  if (!time.has_value()) {
    return Result::configuration("era-schedule", "Era schedule needs non-zero blocks_per_era, halving and precision.");
  }

  init_config_ = config;
  config_ = std::move(protocol);
  fingerprint_ = fingerprint;
  time_ = time;
  current_block_ = config_.deploy_block;
  faulted_ = false;
  fault_reason_.clear();

  const Result built = build_components();
  if (!built.ok) {
    return built;
  }
  const Result minted = mint_pool_budgets();
  if (!minted.ok) {
    return minted;
  }
  const Result genesis = register_genesis_members();
  if (!genesis.ok) {
    return genesis;
  }

  journal_ = Journal{};
  if (!config.data_dir.empty()) {
    const Result opened = journal_.open(config.data_dir);
    if (!opened.ok) {
      return opened;
    }
  }
  const Result replayed = replay_journal();
  if (!replayed.ok) {
    return replayed;
  }

  initialized_ = true;
  return Result::success(std::string{kAppDisplayName} + " initialized at block " + std::to_string(current_block_) +
                         " with " + std::to_string(journal_.entries().size()) + " replayed commands.");
}

Result RegenService::build_components() {
  bus_ = std::make_unique<EventBus>();
  ledger_ = make_token_ledger();
  pools_ = std::make_unique<PoolSet>(config_, *time_, *ledger_);
  registry_ = std::make_unique<CommunityRegistry>(config_, *bus_);
  regenerators_ = std::make_unique<RegeneratorRules>(config_, *registry_, *pools_, *bus_);
  inspectors_ = std::make_unique<InspectorRules>(config_, *registry_, *pools_, *bus_);
  governance_ = std::make_unique<GovernanceValidation>(config_, *time_, *registry_, *pools_, *bus_);
  lifecycle_ = std::make_unique<InspectionLifecycle>(config_, *time_, *registry_, *regenerators_, *inspectors_,
                                                     *governance_, *bus_);
  supporters_ = std::make_unique<SupporterRules>(*time_, *registry_, *ledger_, *bus_);

  contributors_.clear();
  for (const TypePolicy& policy : config_.types) {
    if (policy.level_rule == LevelRule::None) {
      continue;
    }
    if (!pool_for_type(policy.type).has_value()) {
      return Result::configuration("missing-pool", std::string{to_string(policy.type)} +
                                                       " earns levels but has no reward pool.");
    }
    contributors_.push_back(std::make_unique<ContributorRules>(policy, config_, *time_, *registry_, *pools_,
                                                               *governance_, *bus_));
  }

  // Pools strip first so the rules see a consistent pool on UserDenied.
  pools_->attach(*bus_);
  regenerators_->attach();
  inspectors_->attach();
  governance_->attach();
  lifecycle_->attach();
  for (auto& rules : contributors_) {
    rules->attach();
  }
  return Result::success();
}

Result RegenService::mint_pool_budgets() {
  for (const PoolKind kind : all_pool_kinds()) {
    const RewardPool& pool = pools_->pool(kind);
    if (pool.total_pool_tokens() == 0) {
      continue;
    }
    const Result minted = ledger_->mint(pool.address(), pool.total_pool_tokens(), true);
    if (!minted.ok) {
      return minted;
    }
  }
  const TokenAmount remainder = config_.total_supply - config_.total_pool_tokens();
  if (remainder > 0) {
    return ledger_->mint(config_.treasury_account, remainder, false);
  }
  return Result::success();
}

Result RegenService::register_genesis_members() {
  const Era era = time_->current_era(config_.deploy_block);
  for (const GenesisMember& member : config_.genesis_members) {
    const Result added = registry_->add_genesis_member(member, config_.deploy_block, era);
    if (!added.ok) {
      return added;
    }
  }
  return Result::success();
}

Result RegenService::replay_journal() {
  replaying_ = true;
  for (const JournalEntry& entry : journal_.entries()) {
    const Result applied = apply(entry.kind, entry.actor, entry.block, util::parse_canonical_map(entry.payload));
    if (!applied.ok) {
      replaying_ = false;
      return Result::consistency("journal-replay", "Journal command " + std::to_string(entry.sequence) + " (" +
                                                       std::string{to_string(entry.kind)} +
                                                       ") no longer applies: " + applied.message);
    }
  }
  replaying_ = false;
  return Result::success();
}

Result RegenService::execute(CommandKind kind, const Address& actor,
                             std::vector<std::pair<std::string, std::string>> fields) {
  std::lock_guard<std::mutex> lock(mutex_);
  const Result ready = not_ready(initialized_, faulted_, fault_reason_);
  if (!ready.ok) {
    return ready;
  }

  // Commands run from the parsed payload so a replay sees the same input.
  const BlockHeight block = current_block_;
  std::string payload = util::canonical_join(std::move(fields));
  const Result result = apply(kind, actor, block, util::parse_canonical_map(payload));
  if (!result.ok) {
    if (result.kind == ErrorKind::Consistency) {
      faulted_ = true;
      fault_reason_ = result.code + ": " + result.message;
    }
    const Result logged = journal_.record_rejected(kind, actor, block, result);
    if (!logged.ok) {
      // The rejection stands; the caller still learns the log is not being kept.
      Result reported = result;
      reported.message += " [" + logged.code + ": " + logged.message + "]";
      return reported;
    }
    return result;
  }

  const Result journaled = journal_.append(kind, actor, block, std::move(payload));
  if (!journaled.ok) {
    faulted_ = true;
    fault_reason_ = journaled.code + ": " + journaled.message;
    return journaled;
  }
  return result;
}

Result RegenService::apply(CommandKind kind, const Address& actor, BlockHeight block, const Fields& fields) {
  const Era era = time_->current_era(block);
  switch (kind) {
    case CommandKind::Advance:
      return apply_advance(fields);
    case CommandKind::Register:
      return registry_->add_user(
          {
              .address = actor,
              .type = user_type_from_string(field(fields, "type")).value_or(UserType::Undefined),
              .name = field(fields, "name"),
              .proof_hash = field(fields, "proof"),
              .area = number_field(fields, "area"),
          },
          block, era);
    case CommandKind::Invite:
      return apply_invite(fields, block);
    case CommandKind::Request:
      return lifecycle_->request(actor, block);
    case CommandKind::Accept:
      return lifecycle_->accept(actor, number_field(fields, "inspection"), block);
    case CommandKind::Realize:
      return lifecycle_->realize(
          {
              .inspector = actor,
              .inspection_id = number_field(fields, "inspection"),
              .trees_result = number_field(fields, "trees"),
              .biodiversity_result = number_field(fields, "biodiversity"),
              .evidence_hash = field(fields, "evidence"),
              .justification_hash = field(fields, "justification"),
          },
          block);
    case CommandKind::Expire:
      return lifecycle_->expire(number_field(fields, "inspection"), block);
    case CommandKind::Submit:
      return apply_submit(fields, block);
    case CommandKind::VoteResource:
      return governance_->vote_resource(
          {.voter = actor, .resource_id = number_field(fields, "resource"), .justification = field(fields, "justification")},
          block);
    case CommandKind::VoteUser:
      return governance_->vote_user(
          {.voter = actor, .target = field(fields, "target"), .justification = field(fields, "justification")}, block);
    case CommandKind::Delate:
      return governance_->add_delation(
          {
              .informer = actor,
              .reported = field(fields, "reported"),
              .title = field(fields, "title"),
              .testimony_hash = field(fields, "testimony"),
          },
          block);
    case CommandKind::Thumb:
      return governance_->thumb_delation(actor, number_field(fields, "delation"), util::parse_boolish(field(fields, "up")));
    case CommandKind::Convert:
      return governance_->convert_points(actor, block);
    case CommandKind::Withdraw:
      return apply_withdraw(fields, block);
    case CommandKind::Burn:
      return supporters_->burn(actor, number_field(fields, "amount"), block);
    case CommandKind::Transfer: {
      const TokenAmount amount = number_field(fields, "amount");
      if (amount == 0) {
        return Result::precondition("zero-amount", "Transfer amount must be greater than zero.");
      }
      // Pool balances leave only through withdraw.
      if (actor.starts_with(kPoolAddressPrefix)) {
        return Result::precondition("pool-account", actor + " cannot be debited by a transfer.");
      }
      return ledger_->transfer(actor, field(fields, "to"), amount);
    }
  }
  return Result::precondition("unknown-command", "Unknown command.");
}

Result RegenService::apply_advance(const Fields& fields) {
  const auto target = util::parse_u64(field(fields, "block"));
  if (!target.has_value()) {
    return Result::precondition("invalid-block", "Block height must be numeric.");
  }
  if (*target < current_block_) {
    return Result::precondition("block-regression", "Block " + std::to_string(*target) + " is behind current block " +
                                                        std::to_string(current_block_) + ".");
  }
  current_block_ = *target;
  // Deadlines only pass when the chain moves, so overdue inspections are swept here and the
  // sweep is journaled with the advance that caused it.
  const Result swept = lifecycle_->expire_overdue(current_block_);
  if (!swept.ok) {
    return swept;
  }
  return Result::success("Now at block " + std::to_string(current_block_) + " (era " +
                             std::to_string(time_->current_era(current_block_)) + ").",
                         std::to_string(time_->current_era(current_block_)));
}

Result RegenService::apply_invite(const Fields& fields, BlockHeight block) {
  const InvitationDraft draft{
      .inviter = field(fields, "inviter"),
      .invited = field(fields, "invited"),
      .type = user_type_from_string(field(fields, "type")).value_or(UserType::Undefined),
  };
  return registry_->invite(draft, block, time_->current_era(block), snapshot_for(draft.inviter));
}

Result RegenService::apply_submit(const Fields& fields, BlockHeight block) {
  const Address author = field(fields, "author");
  ContributorRules* rules = contributor_rules_for(registry_->type_of(author));
  if (rules == nullptr || !rules->policy().resource_kind.has_value()) {
    return Result::precondition("type-does-not-submit", author + " cannot submit resources.");
  }
  return rules->submit({.author = author, .title = field(fields, "title"), .content_hash = field(fields, "content")},
                       block);
}

Result RegenService::apply_withdraw(const Fields& fields, BlockHeight block) {
  const Address account = field(fields, "account");
  const Account* holder = registry_->account(account);
  if (holder == nullptr || !registry_->is_active(account)) {
    return Result::precondition("not-active", account + " is not an active account.");
  }

  const std::optional<PoolKind> own_pool = pool_for_type(holder->type);
  PoolKind kind = PoolKind::Validator;
  const std::string requested = field(fields, "pool");
  if (requested.empty()) {
    if (!own_pool.has_value()) {
      return Result::precondition("no-pool", std::string{to_string(holder->type)} + " accounts have no reward pool.");
    }
    kind = *own_pool;
  } else {
    const auto parsed = pool_kind_from_string(requested);
    if (!parsed.has_value()) {
      return Result::precondition("unknown-pool", "Unknown pool: " + requested);
    }
    if (*parsed != PoolKind::Validator && parsed != own_pool) {
      return Result::precondition("pool-mismatch", account + " does not belong to the " + requested + " pool.");
    }
    kind = *parsed;
  }

  WithdrawReceipt receipt;
  const Result withdrawn = pools_->pool(kind).withdraw(account, block, &receipt);
  if (!withdrawn.ok || !receipt.claimed) {
    return withdrawn;
  }

  DomainEvent event;
  event.kind = DomainEventKind::TokensWithdrawn;
  event.event_id = "withdraw:" + std::string{to_string(kind)} + ":" + account + ":" + std::to_string(receipt.era);
  event.block = block;
  event.era = time_->current_era(block);
  event.actor = account;
  event.subject = account;
  event.user_type = holder->type;
  event.ref_id = receipt.era;
  event.amount = receipt.payout;
  const Result published = bus_->publish(event);
  if (!published.ok) {
    return published;
  }
  return withdrawn;
}

LevelSnapshot RegenService::snapshot_for(const Address& account) const {
  const UserType type = registry_->type_of(account);
  return {
      .total_levels_of_type = pools_->total_levels(type),
      .total_users_of_type = registry_->population(type),
      .own_levels = pools_->level_of(type, account),
  };
}

ContributorRules* RegenService::contributor_rules_for(UserType type) {
  const auto it = std::ranges::find_if(contributors_, [type](const auto& rules) { return rules->type() == type; });
  return it == contributors_.end() ? nullptr : it->get();
}

const ContributorRules* RegenService::contributor_rules(UserType type) const {
  const auto it = std::ranges::find_if(contributors_, [type](const auto& rules) { return rules->type() == type; });
  return it == contributors_.end() ? nullptr : it->get();
}

Result RegenService::advance_to_block(BlockHeight block) {
  return execute(CommandKind::Advance, {}, {{"block", std::to_string(block)}});
}

Result RegenService::register_user(const RegistrationDraft& draft) {
  return execute(CommandKind::Register, draft.address,
                 {
                     {"type", std::string{to_string(draft.type)}},
                     {"name", draft.name},
                     {"proof", draft.proof_hash},
                     {"area", std::to_string(draft.area)},
                 });
}

Result RegenService::invite(const InvitationDraft& draft) {
  return execute(CommandKind::Invite, draft.inviter,
                 {
                     {"inviter", draft.inviter},
                     {"invited", draft.invited},
                     {"type", std::string{to_string(draft.type)}},
                 });
}

Result RegenService::request_inspection(const Address& regenerator) {
  return execute(CommandKind::Request, regenerator, {});
}

Result RegenService::accept_inspection(const Address& inspector, std::uint64_t inspection_id) {
  return execute(CommandKind::Accept, inspector, {{"inspection", std::to_string(inspection_id)}});
}

Result RegenService::realize_inspection(const InspectionReport& report) {
  return execute(CommandKind::Realize, report.inspector,
                 {
                     {"inspection", std::to_string(report.inspection_id)},
                     {"trees", std::to_string(report.trees_result)},
                     {"biodiversity", std::to_string(report.biodiversity_result)},
                     {"evidence", report.evidence_hash},
                     {"justification", report.justification_hash},
                 });
}

Result RegenService::expire_inspection(std::uint64_t inspection_id) {
  return execute(CommandKind::Expire, {}, {{"inspection", std::to_string(inspection_id)}});
}

Result RegenService::submit_resource(const ResourceDraft& draft) {
  return execute(CommandKind::Submit, draft.author,
                 {
                     {"author", draft.author},
                     {"title", draft.title},
                     {"content", draft.content_hash},
                 });
}

Result RegenService::vote_resource(const ResourceVoteDraft& draft) {
  return execute(CommandKind::VoteResource, draft.voter,
                 {{"resource", std::to_string(draft.resource_id)}, {"justification", draft.justification}});
}

Result RegenService::vote_user(const UserVoteDraft& draft) {
  return execute(CommandKind::VoteUser, draft.voter, {{"target", draft.target}, {"justification", draft.justification}});
}

Result RegenService::add_delation(const DelationDraft& draft) {
  return execute(CommandKind::Delate, draft.informer,
                 {
                     {"reported", draft.reported},
                     {"title", draft.title},
                     {"testimony", draft.testimony_hash},
                 });
}

Result RegenService::thumb_delation(const Address& voter, std::uint64_t delation_id, bool up) {
  return execute(CommandKind::Thumb, voter, {{"delation", std::to_string(delation_id)}, {"up", up ? "1" : "0"}});
}

Result RegenService::convert_points(const Address& voter) {
  return execute(CommandKind::Convert, voter, {});
}

Result RegenService::withdraw(const Address& account, std::optional<PoolKind> pool) {
  return execute(CommandKind::Withdraw, account,
                 {{"account", account}, {"pool", pool.has_value() ? std::string{to_string(*pool)} : std::string{}}});
}

Result RegenService::burn(const Address& supporter, TokenAmount amount) {
  return execute(CommandKind::Burn, supporter, {{"amount", std::to_string(amount)}});
}

Result RegenService::transfer(const Address& from, const Address& to, TokenAmount amount) {
  return execute(CommandKind::Transfer, from, {{"to", to}, {"amount", std::to_string(amount)}});
}

bool RegenService::initialized() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return initialized_;
}

bool RegenService::faulted() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return faulted_;
}

BlockHeight RegenService::current_block() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_block_;
}

Era RegenService::current_era() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return time_.has_value() ? time_->current_era(current_block_) : 0;
}

std::optional<Account> RegenService::find_account(const Address& address) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!initialized_) {
    return std::nullopt;
  }
  const Account* found = registry_->account(address);
  if (found == nullptr) {
    return std::nullopt;
  }
  return *found;
}

std::optional<Inspection> RegenService::find_inspection(std::uint64_t id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!initialized_) {
    return std::nullopt;
  }
  const Inspection* found = lifecycle_->inspection(id);
  if (found == nullptr) {
    return std::nullopt;
  }
  return *found;
}

TokenAmount RegenService::balance_of(const Address& address) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return initialized_ ? ledger_->balance_of(address) : 0;
}

Level RegenService::level_of(const Address& address) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!initialized_) {
    return 0;
  }
  return pools_->level_of(registry_->type_of(address), address);
}

VoterState RegenService::voter_state(const Address& address) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return initialized_ ? governance_->voter(address) : VoterState{};
}

StatusReport RegenService::status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  StatusReport report;
  report.initialized = initialized_;
  report.faulted = faulted_;
  report.fault_reason = fault_reason_;
  report.current_block = current_block_;
  report.data_dir = init_config_.data_dir;
  if (!initialized_) {
    return report;
  }

  report.current_era = time_->current_era(current_block_);
  report.current_epoch = time_->epoch_of(report.current_era);
  report.in_safeguard_window = governance_->in_safeguard_window(current_block_);
  for (const UserType type : registrable_user_types()) {
    report.population[type] = registry_->population(type);
  }
  for (const PoolKind kind : all_pool_kinds()) {
    const RewardPool& pool = pools_->pool(kind);
    report.pools.push_back({
        .kind = kind,
        .address = pool.address(),
        .total_tokens = pool.total_pool_tokens(),
        .current_era_budget = pool.tokens_per_era(report.current_epoch),
        .balance = ledger_->balance_of(pool.address()),
        .distributed = pool.tokens_distributed(),
        .active_levels = pool.total_active_levels(),
        .participants = pool.participant_count(),
    });
  }
  report.total_supply = ledger_->total_supply();
  report.total_locked = ledger_->total_locked();
  report.total_certified = ledger_->total_certified();
  report.treasury_balance = ledger_->balance_of(config_.treasury_account);
  report.inspections = lifecycle_->inspections().size();
  report.resources = governance_->resources().size();
  report.domain_events = bus_->history().size();
  report.journal_entries = journal_.entries().size();
  report.rejected_commands = journal_.rejected_count();
  report.journal_head = journal_.head();
  report.config_fingerprint = util::sha256_hex(fingerprint_);
  return report;
}

std::string RegenService::state_digest() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!initialized_) {
    return {};
  }

  std::vector<std::pair<std::string, std::string>> fields = {
      {"block", std::to_string(current_block_)},
      {"supply", std::to_string(ledger_->total_supply())},
      {"locked", std::to_string(ledger_->total_locked())},
      {"certified", std::to_string(ledger_->total_certified())},
  };
  for (const PoolKind kind : all_pool_kinds()) {
    const RewardPool& pool = pools_->pool(kind);
    const std::string prefix = "pool." + util::lowercase_copy(to_string(kind)) + ".";
    fields.emplace_back(prefix + "levels", std::to_string(pool.total_active_levels()));
    fields.emplace_back(prefix + "distributed", std::to_string(pool.tokens_distributed()));
    fields.emplace_back(prefix + "participants", std::to_string(pool.participant_count()));
  }
  for (const Account& account : registry_->accounts()) {
    fields.emplace_back("account." + account.address, std::string{to_string(account.type)});
  }
  for (const LedgerBalance& entry : ledger_->balances()) {
    fields.emplace_back("balance." + entry.address, std::to_string(entry.balance));
  }
  for (const Inspection& inspection : lifecycle_->inspections()) {
    fields.emplace_back("inspection." + std::to_string(inspection.id),
                        std::string{to_string(inspection.status)} + ":" +
                            std::to_string(inspection.regeneration_score));
  }
  for (const Resource& resource : governance_->resources()) {
    fields.emplace_back("resource." + std::to_string(resource.id), resource.valid ? "valid" : "invalid");
  }
  return util::sha256_hex(util::canonical_join(std::move(fields)));
}

}  // namespace regen
