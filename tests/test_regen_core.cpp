#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/api/core_api.hpp"
#include "core/community/community_registry.hpp"
#include "core/community/invitation_guard.hpp"
#include "core/config/protocol_config.hpp"
#include "core/events/event_bus.hpp"
#include "core/inspection/scoring_table.hpp"
#include "core/ledger/token_ledger.hpp"
#include "core/pool/reward_pool.hpp"
#include "core/service/regen_service.hpp"
#include "core/storage/journal.hpp"
#include "core/time/time_bucketing.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace {

std::filesystem::path temp_dir(const std::string& name) {
  const auto root = std::filesystem::temp_directory_path() / "regen-core-tests" / name;
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  return root;
}

regen::TimeBucketing default_time() {
  const auto time = regen::TimeBucketing::create({
      .deploy_block = 0,
      .blocks_per_era = 12'000,
      .halving = 12,
      .precision = 100'000,
  });
  assert(time.has_value());
  return *time;
}

regen::ProtocolConfig inspection_config() {
  regen::ProtocolConfig config = regen::default_protocol_config();
  config.genesis_members = {
      {.address = "act1", .type = regen::UserType::Activist},
      {.address = "insp1", .type = regen::UserType::Inspector},
      {.address = "insp2", .type = regen::UserType::Inspector},
      {.address = "insp3", .type = regen::UserType::Inspector},
      {.address = "insp4", .type = regen::UserType::Inspector},
  };
  return config;
}

std::uint64_t run_inspection(regen::RegenService& service, const std::string& regenerator,
                             const std::string& inspector, regen::BlockHeight block, std::uint64_t trees,
                             std::uint64_t species) {
  const regen::Result advanced = service.advance_to_block(block);
  assert(advanced.ok);
  const regen::Result requested = service.request_inspection(regenerator);
  assert(requested.ok);
  const std::uint64_t id = regen::util::parse_u64_or(requested.data, 0);
  assert(id > 0);
  const regen::Result accepted = service.accept_inspection(inspector, id);
  assert(accepted.ok);
  const regen::Result realized = service.realize_inspection({
      .inspector = inspector,
      .inspection_id = id,
      .trees_result = trees,
      .biodiversity_result = species,
      .evidence_hash = "evidence-" + std::to_string(id),
      .justification_hash = "report-" + std::to_string(id),
  });
  assert(realized.ok);
  return id;
}

void test_era_bucketing() {
  const auto time = regen::TimeBucketing::create({
      .deploy_block = 100,
      .blocks_per_era = 10,
      .halving = 2,
      .precision = 100'000,
  });
  assert(time.has_value());
  assert(time->current_era(50) == 1);
  assert(time->current_era(100) == 1);
  assert(time->current_era(109) == 1);
  assert(time->current_era(110) == 2);
  assert(time->current_era(135) == 4);

  regen::Era previous = 0;
  for (regen::BlockHeight block = 0; block < 500; ++block) {
    const regen::Era era = time->current_era(block);
    assert(era >= previous);
    previous = era;
  }

  assert(time->epoch_of(1) == 1);
  assert(time->epoch_of(2) == 1);
  assert(time->epoch_of(3) == 2);
  assert(time->era_start_block(2) == 110);
  assert(time->era_end_block(2) == 120);
  assert(time->blocks_until_era_end(1, 105) == 5);
  assert(time->blocks_until_era_end(1, 110) == 0);
  assert(time->blocks_until_era_end(1, 115) == -5);
  assert(time->elapsed_eras_since(1, 110) == 0);
  assert(time->elapsed_eras_since(1, 115) == 50'000);

  assert(!regen::TimeBucketing::create({.deploy_block = 0, .blocks_per_era = 0, .halving = 12, .precision = 1})
              .has_value());
}

void test_halving_budgets() {
  const regen::TimeBucketing time = default_time();
  regen::InMemoryTokenLedger ledger;
  regen::RewardPool pool({.kind = regen::PoolKind::Regenerator, .total_pool_tokens = 750'000'000}, time, ledger);

  assert(pool.address() == "pool:Regenerator");
  assert(pool.tokens_per_epoch(1) == 375'000'000);
  assert(pool.tokens_per_era(1) == 31'250'000);
  assert(pool.tokens_per_era(2) == 15'625'000);
  assert(pool.tokens_per_epoch(64) == 0);
  for (regen::Epoch epoch = 1; epoch < 40; ++epoch) {
    assert(pool.tokens_per_era(epoch + 1) <= pool.tokens_per_era(epoch));
  }
}

void test_withdraw_once_and_share_conservation() {
  const regen::TimeBucketing time = default_time();
  regen::InMemoryTokenLedger ledger;
  regen::RewardPool pool({.kind = regen::PoolKind::Regenerator, .total_pool_tokens = 750'000'000}, time, ledger);
  assert(ledger.mint(pool.address(), 750'000'000, true).ok);

  assert(pool.grant_level("alice", 60, 1, 1).ok);
  assert(pool.grant_level("bob", 49'940, 1, 1).ok);
  assert(pool.era_aggregate(1).total_levels == 50'000);
  assert(!pool.grant_level("carol", 1, 0, 1).ok);

  regen::Result early = pool.withdraw("alice", 100);
  assert(early.ok);
  assert(early.data == "0");
  assert(ledger.balance_of("alice") == 0);

  regen::WithdrawReceipt receipt;
  const regen::Result alice = pool.withdraw("alice", 12'000, &receipt);
  assert(alice.ok);
  assert(receipt.claimed);
  assert(receipt.era == 1);
  assert(receipt.payout == 37'500);
  assert(ledger.balance_of("alice") == 37'500);
  assert(pool.has_withdrawn("alice", 1));

  const regen::Result again = pool.withdraw("alice", 12'500);
  assert(again.ok);
  assert(again.data == "0");
  assert(ledger.balance_of("alice") == 37'500);

  assert(pool.eras_behind("bob", 18'000) == 50'000);
  const regen::Result bob = pool.withdraw("bob", 13'000);
  assert(bob.ok);
  assert(ledger.balance_of("bob") == 31'212'500);

  const regen::EraAggregate aggregate = pool.era_aggregate(1);
  assert(aggregate.claims_count == 2);
  assert(aggregate.tokens_claimed == 31'250'000);
  assert(aggregate.tokens_claimed <= pool.tokens_per_era(time.epoch_of(1)));
  assert(ledger.total_locked() == 750'000'000 - 31'250'000);
  assert(pool.tokens_distributed() == 31'250'000);

  // Closed, already-claimed eras cannot take new levels.
  const regen::Result late = pool.grant_level("dave", 5, 1, 2);
  assert(!late.ok);
  assert(late.kind == regen::ErrorKind::Consistency);

  const regen::Result stranger = pool.withdraw("nobody", 13'000);
  assert(!stranger.ok);
  assert(stranger.code == "not-enrolled");
}

void test_scoring_table() {
  const regen::ScoringTable table(regen::ScoringThresholds{});
  assert(table.tree_points(0) == 0);
  assert(table.tree_points(499) == 0);
  assert(table.tree_points(500) == 1);
  assert(table.tree_points(20'000) == 8);
  assert(table.tree_points(50'000) == 16);
  assert(table.tree_points(5'000'000) == 32);
  assert(table.biodiversity_points(60) == 8);
  assert(table.biodiversity_points(20) == 4);
  assert(table.score(20'000, 60) == 16);
  assert(table.score(50'000, 20) == 20);
  assert(table.score(10'000'000, 5'000) == regen::ScoringTable::kMaxScore);
}

void test_invitation_guard_boundary() {
  const regen::InvitationGuard guard(5);
  assert(guard.can_invite(0, 5, 0));
  assert(guard.required_level(60, 5) == 0);
  assert(guard.required_level(60, 6) == 11);
  assert(!guard.can_invite(60, 6, 10));
  assert(guard.can_invite(60, 6, 11));
}

void test_registry_invitations_and_caps() {
  regen::ProtocolConfig config = regen::default_protocol_config();
  regen::EventBus bus;
  regen::CommunityRegistry registry(config, bus);

  assert(registry.add_genesis_member({.address = "act1", .type = regen::UserType::Activist}, 0, 1).ok);
  assert(registry.is_active_as("act1", regen::UserType::Activist));
  assert(registry.population_cap(regen::UserType::Inspector) == 5U);
  assert(registry.population_cap(regen::UserType::Researcher) == 5U);
  assert(!registry.population_cap(regen::UserType::Supporter).has_value());

  const regen::Result below =
      registry.invite({.inviter = "act1", .invited = "reg1", .type = regen::UserType::Regenerator}, 10, 1,
                      {.total_levels_of_type = 60, .total_users_of_type = 6, .own_levels = 10});
  assert(!below.ok);
  assert(below.code == "invite-eligibility");

  const regen::Result at_boundary =
      registry.invite({.inviter = "act1", .invited = "reg1", .type = regen::UserType::Regenerator}, 10, 1,
                      {.total_levels_of_type = 60, .total_users_of_type = 6, .own_levels = 11});
  assert(at_boundary.ok);

  const regen::Result cooldown =
      registry.invite({.inviter = "act1", .invited = "insp1", .type = regen::UserType::Inspector}, 20, 1, {});
  assert(!cooldown.ok);
  assert(cooldown.kind == regen::ErrorKind::TemporalGate);
  assert(cooldown.retry_at_block == 6'010);

  const regen::Result uninvited = registry.add_user(
      {.address = "stranger", .type = regen::UserType::Regenerator, .name = "x", .proof_hash = {}, .area = 5'000}, 30,
      1);
  assert(!uninvited.ok);
  assert(uninvited.code == "no-invitation");

  const regen::Result mismatch = registry.add_user(
      {.address = "reg1", .type = regen::UserType::Inspector, .name = "x", .proof_hash = {}, .area = 0}, 30, 1);
  assert(!mismatch.ok);
  assert(mismatch.code == "invitation-type-mismatch");

  const regen::Result small = registry.add_user(
      {.address = "reg1", .type = regen::UserType::Regenerator, .name = "x", .proof_hash = {}, .area = 100}, 30, 1);
  assert(!small.ok);
  assert(small.code == "area-out-of-bounds");

  const regen::Result joined = registry.add_user(
      {.address = "reg1", .type = regen::UserType::Regenerator, .name = "farm", .proof_hash = "cid-1", .area = 5'000},
      30, 1);
  assert(joined.ok);
  assert(registry.account("reg1")->inviter == "act1");
  assert(registry.population(regen::UserType::Regenerator) == 1);
  assert(registry.population_cap(regen::UserType::Inspector) == 20U);

  const regen::Result supporter = registry.add_user(
      {.address = "sup1", .type = regen::UserType::Supporter, .name = "s", .proof_hash = {}, .area = 0}, 40, 1);
  assert(supporter.ok);

  const regen::Result denied = registry.deny("reg1", 50, 1, "test");
  assert(denied.ok);
  assert(registry.type_of("reg1") == regen::UserType::Denied);
  assert(registry.account("reg1")->registered_as == regen::UserType::Regenerator);
  assert(registry.account("act1")->inviter_penalties == 1);
  assert(registry.population(regen::UserType::Regenerator) == 0);
  assert(bus.count(regen::DomainEventKind::UserDenied) == 1);
}

void test_regenerator_pool_entry_and_withdraw() {
  regen::RegenService service;
  const regen::Result init = service.init({.data_dir = {}, .config_path = {}, .protocol = inspection_config()});
  assert(init.ok);

  const regen::Result invited = service.invite({.inviter = "act1", .invited = "reg1", .type = regen::UserType::Regenerator});
  assert(invited.ok);
  const regen::Result registered = service.register_user(
      {.address = "reg1", .type = regen::UserType::Regenerator, .name = "farm", .proof_hash = "cid-farm", .area = 5'000});
  assert(registered.ok);

  run_inspection(service, "reg1", "insp1", 100, 20'000, 60);
  run_inspection(service, "reg1", "insp2", 6'100, 20'000, 60);
  assert(service.pools().level_of(regen::UserType::Regenerator, "reg1") == 0);
  assert(!service.regenerators().profile("reg1")->on_contract_pool);

  run_inspection(service, "reg1", "insp3", 12'100, 20'000, 60);
  assert(service.regenerators().profile("reg1")->on_contract_pool);
  assert(service.pools().level_of(regen::UserType::Regenerator, "reg1") == 48);
  assert(service.pools().pool(regen::PoolKind::Regenerator).level_of("reg1", 2) == 48);

  // The invitee reached the pool, so its inviter earns an Activist level.
  assert(service.pools().level_of(regen::UserType::Activist, "act1") == 1);

  run_inspection(service, "reg1", "insp4", 18'100, 50'000, 20);
  assert(service.pools().level_of(regen::UserType::Regenerator, "reg1") == 68);
  assert(service.regenerators().posted_level("reg1") == 68);
  assert(service.regenerators().profile("reg1")->regeneration_score == 68);
  assert(service.inspections().total_impact().realized == 4);
  assert(service.inspections().total_impact().trees == 110'000);
  assert(service.inspections().impact(2).score == 36);

  assert(service.advance_to_block(24'000).ok);
  assert(service.current_era() == 3);

  const regen::Result paid = service.withdraw("reg1");
  assert(paid.ok);
  assert(paid.data == "31250000");
  assert(service.ledger().balance_of("reg1") == 31'250'000);
  const regen::Result repeat = service.withdraw("reg1");
  assert(repeat.ok);
  assert(repeat.data == "0");
  assert(service.ledger().balance_of("reg1") == 31'250'000);

  const regen::Result insp1 = service.withdraw("insp1");
  const regen::Result insp2 = service.withdraw("insp2");
  assert(insp1.ok && insp2.ok);
  assert(service.ledger().balance_of("insp1") == 3'750'000);
  assert(service.ledger().balance_of("insp1") + service.ledger().balance_of("insp2") == 7'500'000);

  assert(service.withdraw("act1").ok);
  assert(service.ledger().balance_of("act1") == 2'500'000);

  const regen::Result wrong_pool = service.withdraw("reg1", regen::PoolKind::Inspector);
  assert(!wrong_pool.ok);
  assert(wrong_pool.code == "pool-mismatch");
  assert(service.events().count(regen::DomainEventKind::TokensWithdrawn) == 4);
}

void test_inspector_exclusivity_and_cooldowns() {
  regen::ProtocolConfig config = regen::default_protocol_config();
  config.genesis_members = {
      {.address = "reg1", .type = regen::UserType::Regenerator, .area = 5'000},
      {.address = "reg2", .type = regen::UserType::Regenerator, .area = 8'000},
      {.address = "insp1", .type = regen::UserType::Inspector},
      {.address = "insp2", .type = regen::UserType::Inspector},
  };
  regen::RegenService service;
  assert(service.init({.data_dir = {}, .config_path = {}, .protocol = config}).ok);

  assert(service.advance_to_block(100).ok);
  const regen::Result first = service.request_inspection("reg1");
  const regen::Result second = service.request_inspection("reg2");
  assert(first.ok && second.ok);
  assert(first.data == "1" && second.data == "2");

  const regen::Result pending = service.request_inspection("reg1");
  assert(!pending.ok);
  assert(pending.code == "pending-inspection");

  assert(service.accept_inspection("insp1", 1).ok);
  const regen::Result busy = service.accept_inspection("insp1", 2);
  assert(!busy.ok);
  assert(busy.code == "inspector-busy");

  const regen::Result stranger = service.realize_inspection({.inspector = "insp2",
                                                             .inspection_id = 1,
                                                             .trees_result = 1'000,
                                                             .biodiversity_result = 5,
                                                             .evidence_hash = "ev",
                                                             .justification_hash = "just"});
  assert(!stranger.ok);
  assert(stranger.code == "not-assigned");

  const regen::Result realized = service.realize_inspection({.inspector = "insp1",
                                                             .inspection_id = 1,
                                                             .trees_result = 1'000,
                                                             .biodiversity_result = 5,
                                                             .evidence_hash = "ev",
                                                             .justification_hash = "just"});
  assert(realized.ok);
  assert(realized.data == "3");
  assert(service.inspections().inspection(1)->status == regen::InspectionStatus::Inspected);

  assert(service.advance_to_block(5'000).ok);
  const regen::Result request_early = service.request_inspection("reg1");
  assert(!request_early.ok);
  assert(request_early.kind == regen::ErrorKind::TemporalGate);
  assert(request_early.retry_at_block == 6'100);
  const regen::Result accept_early = service.accept_inspection("insp1", 2);
  assert(!accept_early.ok);
  assert(accept_early.kind == regen::ErrorKind::TemporalGate);
  assert(accept_early.retry_at_block == 6'100);

  assert(service.advance_to_block(6'100).ok);
  const regen::Result third = service.request_inspection("reg1");
  assert(third.ok);
  const regen::Result repeat = service.accept_inspection("insp1", 3);
  assert(!repeat.ok);
  assert(repeat.code == "already-inspected");
  assert(service.accept_inspection("insp2", 3).ok);
  assert(service.accept_inspection("insp1", 2).ok);
}

void test_safeguard_window_blocks_acceptance() {
  regen::ProtocolConfig config = regen::default_protocol_config();
  config.genesis_members = {
      {.address = "reg1", .type = regen::UserType::Regenerator, .area = 5'000},
      {.address = "insp1", .type = regen::UserType::Inspector},
  };
  regen::RegenService service;
  assert(service.init({.data_dir = {}, .config_path = {}, .protocol = config}).ok);

  assert(service.advance_to_block(11'500).ok);
  assert(service.request_inspection("reg1").ok);
  const regen::Result window = service.accept_inspection("insp1", 1);
  assert(!window.ok);
  assert(window.kind == regen::ErrorKind::TemporalGate);
  assert(window.code == "safeguard-window");
  assert(window.retry_at_block == 12'000);

  assert(service.advance_to_block(12'000).ok);
  assert(service.accept_inspection("insp1", 1).ok);
}

void test_give_up_denial_zeroes_levels() {
  regen::ProtocolConfig config = regen::default_protocol_config();
  config.max_give_ups = 1;
  config.genesis_members = {
      {.address = "reg1", .type = regen::UserType::Regenerator, .area = 5'000},
      {.address = "reg2", .type = regen::UserType::Regenerator, .area = 5'000},
      {.address = "insp1", .type = regen::UserType::Inspector},
  };
  regen::RegenService service;
  assert(service.init({.data_dir = {}, .config_path = {}, .protocol = config}).ok);

  run_inspection(service, "reg1", "insp1", 100, 5'000, 10);
  assert(service.pools().level_of(regen::UserType::Inspector, "insp1") == 1);

  assert(service.advance_to_block(6'100).ok);
  const regen::Result requested = service.request_inspection("reg2");
  assert(requested.ok);
  assert(service.accept_inspection("insp1", 2).ok);
  assert(service.inspections().deadline_of(*service.inspections().inspection(2)) == 56'100);

  const regen::Result not_yet = service.expire_inspection(2);
  assert(!not_yet.ok);
  assert(not_yet.retry_at_block == 56'101);

  // Advancing past the deadline expires the acceptance on the spot.
  assert(service.advance_to_block(56'101).ok);
  assert(service.registry().type_of("insp1") == regen::UserType::Denied);
  assert(service.pools().pool(regen::PoolKind::Inspector).total_level_of("insp1") == 0);
  assert(service.pools().pool(regen::PoolKind::Inspector).total_active_levels() == 0);
  assert(service.inspectors().profile("insp1")->give_ups == 1);

  const regen::Result again = service.expire_inspection(2);
  assert(!again.ok);
  assert(again.code == "not-accepted");

  const regen::Inspection* reopened = service.inspections().inspection(2);
  assert(reopened->status == regen::InspectionStatus::Open);
  assert(reopened->inspector.empty());
  assert(reopened->expirations == 1);
}

void test_governance_flows() {
  regen::ProtocolConfig config = regen::default_protocol_config();
  config.genesis_members = {
      {.address = "res1", .type = regen::UserType::Researcher},
      {.address = "res2", .type = regen::UserType::Researcher},
      {.address = "res3", .type = regen::UserType::Researcher},
      {.address = "res4", .type = regen::UserType::Researcher},
  };
  regen::RegenService service;
  assert(service.init({.data_dir = {}, .config_path = {}, .protocol = config}).ok);
  assert(service.advance_to_block(100).ok);

  const regen::Result submitted =
      service.submit_resource({.author = "res1", .title = "Soil carbon survey", .content_hash = "cid-soil"});
  assert(submitted.ok);
  assert(submitted.data == "1");
  assert(service.pools().level_of(regen::UserType::Researcher, "res1") == 1);
  assert(service.governance().votes_to_invalidate() == 3);

  const regen::Result self_vote = service.vote_resource({.voter = "res1", .resource_id = 1, .justification = {}});
  assert(!self_vote.ok);
  assert(self_vote.code == "self-vote");

  assert(service.vote_resource({.voter = "res2", .resource_id = 1, .justification = "copied"}).ok);
  assert(service.vote_resource({.voter = "res3", .resource_id = 1, .justification = "copied"}).ok);
  const regen::Result third = service.vote_resource({.voter = "res4", .resource_id = 1, .justification = "copied"});
  assert(third.ok);
  assert(third.data == "invalidated");
  assert(!service.governance().resource(1)->valid);
  assert(service.pools().level_of(regen::UserType::Researcher, "res1") == 0);
  assert(service.governance().resource_penalties("res1") == 1);

  const regen::Result too_soon = service.vote_user({.voter = "res2", .target = "res1", .justification = {}});
  assert(!too_soon.ok);
  assert(too_soon.code == "vote-interval");

  assert(service.advance_to_block(300).ok);
  assert(service.vote_user({.voter = "res2", .target = "res1", .justification = "spam"}).ok);
  assert(service.vote_user({.voter = "res3", .target = "res1", .justification = "spam"}).ok);
  const regen::Result denial = service.vote_user({.voter = "res4", .target = "res1", .justification = "spam"});
  assert(denial.ok);
  assert(denial.data == "denied");
  assert(service.registry().type_of("res1") == regen::UserType::Denied);
  assert(service.pools().pool(regen::PoolKind::Validator).total_level_of("res2") == 1);
  assert(service.governance().voter("res2").hunter_levels == 1);
  assert(service.governance().voter("res2").points == 2);
  assert(service.governance().challenge(1, "res1")->hunter == "res2");

  const regen::Result expelled = service.vote_user({.voter = "res1", .target = "res2", .justification = {}});
  assert(!expelled.ok);
  assert(expelled.code == "voter-not-active");

  const regen::Result convert = service.convert_points("res2");
  assert(!convert.ok);
  assert(convert.code == "insufficient-points");

  const regen::Result delation = service.add_delation(
      {.informer = "res2", .reported = "res3", .title = "Fabricated data", .testimony_hash = "cid-testimony"});
  assert(delation.ok);
  assert(service.thumb_delation("res4", 1, true).ok);
  const regen::Result twice = service.thumb_delation("res4", 1, false);
  assert(!twice.ok);
  assert(twice.code == "duplicate-thumb");
  const regen::Result own = service.thumb_delation("res2", 1, true);
  assert(!own.ok);
  assert(own.code == "self-thumb");
  assert(service.governance().delation(1)->thumbs_up == 1);
  assert(service.registry().is_active("res3"));

  assert(service.advance_to_block(11'500).ok);
  const regen::Result window =
      service.submit_resource({.author = "res2", .title = "Late report", .content_hash = "cid-late"});
  assert(!window.ok);
  assert(window.code == "safeguard-window");
  assert(window.retry_at_block == 12'000);

  assert(service.advance_to_block(12'000).ok);
  assert(service.submit_resource({.author = "res2", .title = "Late report", .content_hash = "cid-late"}).ok);
}

void test_supporter_burn_and_transfers() {
  regen::RegenService service;
  assert(service.init({}).ok);

  assert(service.register_user(
                    {.address = "sup1", .type = regen::UserType::Supporter, .name = "backer", .proof_hash = {}, .area = 0})
             .ok);
  assert(service.ledger().balance_of("treasury") == 90'000'000);
  assert(service.ledger().total_locked() == 1'410'000'000);

  assert(service.transfer("treasury", "sup1", 1'000).ok);
  const regen::Result burned = service.burn("sup1", 400);
  assert(burned.ok);
  assert(service.ledger().balance_of("sup1") == 600);
  assert(service.ledger().total_certified() == 400);
  assert(service.ledger().total_supply() == 1'500'000'000 - 400);
  assert(service.supporters().profile("sup1")->certified == 400);

  const regen::Result too_much = service.burn("sup1", 1'000);
  assert(!too_much.ok);
  assert(too_much.code == "insufficient-balance");

  const regen::Result not_supporter = service.burn("treasury", 10);
  assert(!not_supporter.ok);
  assert(not_supporter.code == "not-supporter");

  const regen::Result from_pool = service.transfer("pool:Regenerator", "sup1", 10);
  assert(!from_pool.ok);
  assert(from_pool.code == "pool-account");

  const regen::Result no_pool = service.withdraw("sup1");
  assert(!no_pool.ok);
  assert(no_pool.code == "no-pool");
}

void test_config_profile_and_init_lock() {
  const auto dir = temp_dir("config");
  const auto profile = dir / "regen.conf";
  {
    std::ofstream out(profile);
    out << "# test profile\n"
        << "blocks_per_era=100\n"
        << "halving=4\n"
        << "safeguard_window_blocks=10\n"
        << "genesis.members=alice:Activist,bob:Regenerator:5000\n"
        << "type.Researcher.submission_delay_blocks=50\n";
  }

  regen::ProtocolConfig loaded = regen::default_protocol_config();
  assert(regen::load_protocol_config(profile.string(), loaded).ok);
  assert(loaded.blocks_per_era == 100);
  assert(loaded.halving == 4);
  assert(loaded.genesis_members.size() == 2);
  assert(loaded.genesis_members[1].area == 5'000);
  assert(loaded.policy_for(regen::UserType::Researcher)->submission_delay_blocks == 50);
  assert(regen::validate_protocol_config(loaded).ok);

  regen::ProtocolConfig broken = regen::default_protocol_config();
  broken.safeguard_window_blocks = broken.blocks_per_era;
  const regen::Result invalid = regen::validate_protocol_config(broken);
  assert(!invalid.ok);
  assert(invalid.kind == regen::ErrorKind::Configuration);

  regen::ProtocolConfig unknown = regen::default_protocol_config();
  const regen::Result bogus = regen::apply_protocol_overrides("bogus_key=1\n", unknown);
  assert(!bogus.ok);
  assert(bogus.code == "unknown-key");

  regen::RegenService fresh;
  const regen::Result not_ready = fresh.advance_to_block(10);
  assert(!not_ready.ok);
  assert(not_ready.code == "not-initialized");

  regen::RegenService service;
  const regen::InitConfig init{.data_dir = {}, .config_path = profile.string(), .protocol = regen::default_protocol_config()};
  assert(service.init(init).ok);
  assert(service.time().schedule().blocks_per_era == 100);
  assert(service.registry().is_active_as("bob", regen::UserType::Regenerator));
  assert(service.init(init).ok);

  regen::InitConfig changed = init;
  changed.protocol.halving = 6;
  changed.config_path.clear();
  const regen::Result locked = service.init(changed);
  assert(!locked.ok);
  assert(locked.code == "config-locked");

  assert(service.advance_to_block(250).ok);
  assert(service.current_era() == 3);
  const regen::Result backwards = service.advance_to_block(200);
  assert(!backwards.ok);
  assert(backwards.code == "block-regression");
  assert(service.current_block() == 250);
}

void test_journal_replay() {
  const auto dir = temp_dir("journal");
  regen::ProtocolConfig config = regen::default_protocol_config();
  config.genesis_members = {
      {.address = "reg1", .type = regen::UserType::Regenerator, .area = 5'000},
      {.address = "insp1", .type = regen::UserType::Inspector},
  };
  const regen::InitConfig init{.data_dir = dir.string(), .config_path = {}, .protocol = config};

  std::string digest;
  {
    regen::RegenService service;
    assert(service.init(init).ok);
    run_inspection(service, "reg1", "insp1", 100, 20'000, 60);

    const std::string before = service.state_digest();
    const regen::Result rejected = service.accept_inspection("reg1", 1);
    assert(!rejected.ok);
    assert(service.state_digest() == before);
    assert(service.journal().rejected_count() == 1);
    assert(service.journal().entries().size() == 4);
    assert(std::filesystem::exists(dir / "journal.log"));
    assert(std::filesystem::exists(dir / "rejected.log"));
    digest = service.state_digest();
    assert(!digest.empty());
  }

  {
    regen::RegenService replayed;
    const regen::Result init_again = replayed.init(init);
    assert(init_again.ok);
    assert(replayed.current_block() == 100);
    assert(replayed.journal().entries().size() == 4);
    assert(replayed.inspections().inspection(1)->status == regen::InspectionStatus::Inspected);
    assert(replayed.state_digest() == digest);
    assert(replayed.status().journal_head == replayed.journal().entries().back().chain);
  }

  {
    std::ofstream out(dir / "journal.log", std::ios::out | std::ios::app);
    out << "deadbeef\tadvance\t\t500\t\tfeed\n";
  }
  regen::RegenService tampered;
  const regen::Result refused = tampered.init(init);
  assert(!refused.ok);
  assert(refused.kind == regen::ErrorKind::Consistency);
  assert(refused.code == "journal-id");
}

void test_overdue_sweep_is_part_of_advance() {
  const auto dir = temp_dir("sweep");
  regen::ProtocolConfig config = regen::default_protocol_config();
  config.max_give_ups = 1;
  for (regen::TypePolicy& policy : config.types) {
    if (policy.type == regen::UserType::Inspector) {
      policy.max_population = 1;
    }
  }
  config.genesis_members = {
      {.address = "reg1", .type = regen::UserType::Regenerator, .area = 5'000},
      {.address = "insp1", .type = regen::UserType::Inspector},
      {.address = "act1", .type = regen::UserType::Activist},
  };
  const regen::InitConfig init{.data_dir = dir.string(), .config_path = {}, .protocol = config};

  std::string digest;
  {
    regen::RegenService service;
    assert(service.init(init).ok);
    assert(service.advance_to_block(100).ok);
    assert(service.request_inspection("reg1").ok);
    assert(service.accept_inspection("insp1", 1).ok);
    assert(service.invite({.inviter = "act1", .invited = "insp2", .type = regen::UserType::Inspector}).ok);

    const regen::Result full = service.register_user(
        {.address = "insp2", .type = regen::UserType::Inspector, .name = "auditor", .proof_hash = {}, .area = 0});
    assert(!full.ok);
    assert(full.code == "population-cap");

    const regen::Result advanced = service.advance_to_block(60'000);
    assert(advanced.ok);
    assert(service.registry().type_of("insp1") == regen::UserType::Denied);
    assert(service.inspections().inspection(1)->status == regen::InspectionStatus::Open);

    const std::string before = service.state_digest();
    const std::size_t rejected_before = service.journal().rejected_count();
    const regen::Result pending = service.request_inspection("reg1");
    assert(!pending.ok);
    assert(pending.code == "pending-inspection");
    assert(service.state_digest() == before);
    assert(service.journal().rejected_count() == rejected_before + 1);

    assert(service.register_user(
                      {.address = "insp2", .type = regen::UserType::Inspector, .name = "auditor", .proof_hash = {}, .area = 0})
               .ok);
    digest = service.state_digest();
  }

  regen::RegenService replayed;
  const regen::Result restored = replayed.init(init);
  assert(restored.ok);
  assert(!replayed.faulted());
  assert(replayed.state_digest() == digest);
  assert(replayed.registry().type_of("insp1") == regen::UserType::Denied);
  assert(replayed.registry().is_active_as("insp2", regen::UserType::Inspector));
}

void test_fourth_give_up_denies_and_freezes_closed_eras() {
  regen::ProtocolConfig config = regen::default_protocol_config();
  assert(config.max_give_ups == 4);
  config.genesis_members = {
      {.address = "reg1", .type = regen::UserType::Regenerator, .area = 5'000},
      {.address = "reg2", .type = regen::UserType::Regenerator, .area = 5'000},
      {.address = "reg3", .type = regen::UserType::Regenerator, .area = 5'000},
      {.address = "reg4", .type = regen::UserType::Regenerator, .area = 5'000},
      {.address = "reg5", .type = regen::UserType::Regenerator, .area = 5'000},
      {.address = "reg6", .type = regen::UserType::Regenerator, .area = 5'000},
      {.address = "insp1", .type = regen::UserType::Inspector},
      {.address = "insp2", .type = regen::UserType::Inspector},
  };
  regen::RegenService service;
  assert(service.init({.data_dir = {}, .config_path = {}, .protocol = config}).ok);

  run_inspection(service, "reg1", "insp1", 100, 5'000, 10);
  run_inspection(service, "reg2", "insp2", 100, 5'000, 10);
  run_inspection(service, "reg2", "insp1", 12'100, 5'000, 10);

  const regen::RewardPool& pool = service.pools().pool(regen::PoolKind::Inspector);
  assert(pool.level_of("insp1", 1) == 1);
  assert(pool.level_of("insp1", 2) == 1);
  assert(pool.era_aggregate(1).total_levels == 2);
  assert(pool.era_aggregate(2).total_levels == 1);

  // Each acceptance lapses 50000 blocks later; none lands in a safeguard window.
  const std::vector<std::pair<std::string, regen::BlockHeight>> abandoned = {
      {"reg3", 18'200}, {"reg4", 68'201}, {"reg5", 118'202}, {"reg6", 168'203}};
  std::uint64_t give_ups = 0;
  for (const auto& [regenerator, block] : abandoned) {
    assert(service.registry().is_active_as("insp1", regen::UserType::Inspector));
    assert(service.advance_to_block(block).ok);
    const regen::Result requested = service.request_inspection(regenerator);
    assert(requested.ok);
    assert(service.accept_inspection("insp1", regen::util::parse_u64_or(requested.data, 0)).ok);
    assert(service.advance_to_block(block + 50'001).ok);
    ++give_ups;
    assert(service.inspectors().profile("insp1")->give_ups == give_ups);
  }

  assert(service.registry().type_of("insp1") == regen::UserType::Denied);
  assert(pool.level_of("insp1", 1) == 0);
  assert(pool.level_of("insp1", 2) == 0);
  assert(pool.total_level_of("insp1") == 0);
  assert(pool.era_aggregate(1).total_levels == 2);
  assert(pool.era_aggregate(2).total_levels == 1);

  const regen::Result paid = service.withdraw("insp2");
  assert(paid.ok);
  assert(service.ledger().balance_of("insp2") == 3'750'000);
  assert(service.ledger().balance_of("pool:Inspector") == 180'000'000 - 3'750'000);

  const regen::Result stripped = service.withdraw("insp1");
  assert(!stripped.ok);
  assert(stripped.code == "not-active");
}

void test_late_report_is_refused_as_expired() {
  const regen::ProtocolConfig config = regen::default_protocol_config();
  const regen::TimeBucketing time = default_time();
  regen::EventBus bus;
  regen::InMemoryTokenLedger ledger;
  regen::PoolSet pools(config, time, ledger);
  regen::CommunityRegistry registry(config, bus);
  regen::RegeneratorRules regenerators(config, registry, pools, bus);
  regen::InspectorRules inspectors(config, registry, pools, bus);
  regen::GovernanceValidation governance(config, time, registry, pools, bus);
  regen::InspectionLifecycle lifecycle(config, time, registry, regenerators, inspectors, governance, bus);
  pools.attach(bus);
  regenerators.attach();
  inspectors.attach();
  governance.attach();
  lifecycle.attach();

  assert(registry.add_genesis_member({.address = "reg1", .type = regen::UserType::Regenerator, .area = 5'000}, 0, 1).ok);
  assert(registry.add_genesis_member({.address = "insp1", .type = regen::UserType::Inspector}, 0, 1).ok);
  assert(lifecycle.request("reg1", 100).ok);
  assert(lifecycle.accept("insp1", 1, 100).ok);

  const regen::Result late = lifecycle.realize({.inspector = "insp1",
                                                .inspection_id = 1,
                                                .trees_result = 5'000,
                                                .biodiversity_result = 10,
                                                .evidence_hash = "ev",
                                                .justification_hash = "just"},
                                               50'101);
  assert(!late.ok);
  assert(late.kind == regen::ErrorKind::Precondition);
  assert(late.code == "inspection-expired");
  assert(lifecycle.inspection(1)->status == regen::InspectionStatus::Accepted);
}

void test_vote_tally_restarts_when_report_lands_in_new_era() {
  regen::ProtocolConfig config = regen::default_protocol_config();
  config.genesis_members = {
      {.address = "reg1", .type = regen::UserType::Regenerator, .area = 5'000},
      {.address = "insp1", .type = regen::UserType::Inspector},
      {.address = "res1", .type = regen::UserType::Researcher},
      {.address = "res2", .type = regen::UserType::Researcher},
      {.address = "res3", .type = regen::UserType::Researcher},
      {.address = "res4", .type = regen::UserType::Researcher},
  };
  regen::RegenService service;
  assert(service.init({.data_dir = {}, .config_path = {}, .protocol = config}).ok);
  assert(service.governance().votes_to_invalidate() == 3);

  assert(service.advance_to_block(10'000).ok);
  assert(service.request_inspection("reg1").ok);
  assert(service.accept_inspection("insp1", 1).ok);
  assert(service.governance().resource(1)->era == 1);
  assert(service.vote_resource({.voter = "res2", .resource_id = 1, .justification = "no trees"}).ok);
  const regen::Result second = service.vote_resource({.voter = "res3", .resource_id = 1, .justification = "no trees"});
  assert(second.ok);
  assert(second.data == "2");

  assert(service.advance_to_block(12'100).ok);
  assert(service.realize_inspection({.inspector = "insp1",
                                     .inspection_id = 1,
                                     .trees_result = 5'000,
                                     .biodiversity_result = 10,
                                     .evidence_hash = "ev",
                                     .justification_hash = "just"})
             .ok);
  assert(service.governance().resource(1)->era == 2);
  assert(service.governance().resource(1)->validation_count == 0);

  const regen::Result fresh = service.vote_resource({.voter = "res4", .resource_id = 1, .justification = "no trees"});
  assert(fresh.ok);
  assert(fresh.data == "1");
  const regen::Result repeat = service.vote_resource({.voter = "res2", .resource_id = 1, .justification = "no trees"});
  assert(repeat.ok);
  assert(repeat.data == "2");
  assert(service.governance().resource(1)->validation_count == 2);
  assert(service.governance().resource(1)->valid);
  assert(service.inspections().inspection(1)->status == regen::InspectionStatus::Inspected);
}

void test_user_challenges_close_after_registration_era() {
  regen::ProtocolConfig config = regen::default_protocol_config();
  config.genesis_members = {
      {.address = "res1", .type = regen::UserType::Researcher},
      {.address = "res2", .type = regen::UserType::Researcher},
      {.address = "res3", .type = regen::UserType::Researcher},
  };
  regen::RegenService service;
  assert(service.init({.data_dir = {}, .config_path = {}, .protocol = config}).ok);

  assert(service.advance_to_block(100).ok);
  const regen::Result same_era = service.vote_user({.voter = "res2", .target = "res1", .justification = "spam"});
  assert(same_era.ok);
  assert(same_era.data == "1");

  assert(service.advance_to_block(12'100).ok);
  const regen::Result settled = service.vote_user({.voter = "res3", .target = "res1", .justification = "spam"});
  assert(!settled.ok);
  assert(settled.kind == regen::ErrorKind::Precondition);
  assert(settled.code == "user-final");
  assert(service.governance().challenge(2, "res1") == nullptr);

  assert(service.register_user(
                    {.address = "sup1", .type = regen::UserType::Supporter, .name = "backer", .proof_hash = {}, .area = 0})
             .ok);
  const regen::Result newcomer = service.vote_user({.voter = "res3", .target = "sup1", .justification = "spam"});
  assert(newcomer.ok);
  assert(newcomer.data == "1");
}

void test_rejected_log_failure_is_reported() {
  const auto dir = temp_dir("rejected-log");
  std::filesystem::create_directories(dir / "rejected.log");

  regen::RegenService service;
  assert(service.init({.data_dir = dir.string(), .config_path = {}, .protocol = regen::default_protocol_config()}).ok);
  const regen::Result rejected = service.request_inspection("nobody");
  assert(!rejected.ok);
  assert(rejected.kind == regen::ErrorKind::Precondition);
  assert(rejected.message.find("rejected-log-write") != std::string::npos);
  assert(service.journal().rejected_count() == 1);
  assert(!service.faulted());
}

void test_core_api_status() {
  regen::CoreApi api;
  assert(api.init({.data_dir = {}, .config_path = {}, .protocol = inspection_config()}).ok);
  assert(api.advance_to_block(11'200).ok);

  const regen::StatusReport status = api.status();
  assert(status.initialized);
  assert(!status.faulted);
  assert(status.current_era == 1);
  assert(status.current_epoch == 1);
  assert(status.in_safeguard_window);
  assert(status.pools.size() == regen::kPoolKindCount);
  assert(status.pools.front().current_era_budget == 31'250'000);
  assert(status.population.at(regen::UserType::Inspector) == 4);
  assert(status.journal_entries == 1);
  const std::optional<regen::Account> inspector = api.account("insp1");
  assert(inspector.has_value());
  assert(inspector->type == regen::UserType::Inspector);
  assert(!api.account("nobody").has_value());
  assert(!api.inspection(1).has_value());
  assert(api.level_of("insp1") == 0);
  assert(api.balance_of("treasury") == 90'000'000);
  assert(regen::command_kind_from_string("vote-resource") == regen::CommandKind::VoteResource);
  assert(!regen::command_kind_from_string("mine").has_value());
}

}  // namespace

int main() {
  const regen::Result hashing = regen::util::init_hashing();
  assert(hashing.ok);

  test_era_bucketing();
  test_halving_budgets();
  test_withdraw_once_and_share_conservation();
  test_scoring_table();
  test_invitation_guard_boundary();
  test_registry_invitations_and_caps();
  test_regenerator_pool_entry_and_withdraw();
  test_inspector_exclusivity_and_cooldowns();
  test_safeguard_window_blocks_acceptance();
  test_give_up_denial_zeroes_levels();
  test_governance_flows();
  test_supporter_burn_and_transfers();
  test_config_profile_and_init_lock();
  test_journal_replay();
  test_core_api_status();
  test_overdue_sweep_is_part_of_advance();
  test_fourth_give_up_denies_and_freezes_closed_eras();
  test_late_report_is_refused_as_expired();
  test_vote_tally_restarts_when_report_lands_in_new_era();
  test_user_challenges_close_after_registration_era();
  test_rejected_log_failure_is_reported();

  std::cout << "regen_core_tests passed\n";
  return 0;
}
