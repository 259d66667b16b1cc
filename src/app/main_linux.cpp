#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "core/api/core_api.hpp"
#include "core/model/app_meta.hpp"
#include "core/util/canonical.hpp"

namespace {

constexpr std::string_view kUsage =
    "Commands:\n"
    "  advance <block>\n"
    "  register <address> <Type> <name> <proof_hash> [area]\n"
    "  invite <inviter> <invited> <Type>\n"
    "  request <regenerator>\n"
    "  accept <inspector> <inspection_id>\n"
    "  realize <inspector> <inspection_id> <trees> <species> <evidence_hash> <justification_hash>\n"
    "  expire <inspection_id>\n"
    "  submit <author> <content_hash> <title...>\n"
    "  vote-resource <voter> <resource_id> [justification...]\n"
    "  vote-user <voter> <target> [justification...]\n"
    "  delate <informer> <reported> <testimony_hash> <title...>\n"
    "  thumb <voter> <delation_id> up|down\n"
    "  convert <voter>\n"
    "  withdraw <account> [Pool]\n"
    "  burn <supporter> <amount>\n"
    "  transfer <from> <to> <amount>\n"
    "  balance <address> | account <address> | inspection <id>\n"
    "  status | digest | help | quit\n";

std::string join_tail(const std::vector<std::string>& words, std::size_t from) {
  std::string out;
  for (std::size_t i = from; i < words.size(); ++i) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += words[i];
  }
  return out;
}

std::uint64_t number_at(const std::vector<std::string>& words, std::size_t index) {
  return index < words.size() ? regen::util::parse_u64_or(words[index], 0) : 0;
}

void print_result(const regen::Result& result) {
  if (result.ok) {
    std::cout << "ok";
    if (!result.message.empty()) {
      std::cout << ": " << result.message;
    }
    std::cout << '\n';
    return;
  }
  std::cout << "error[" << regen::to_string(result.kind) << "/" << result.code << "]: " << result.message;
  if (result.kind == regen::ErrorKind::TemporalGate && result.retry_at_block > 0) {
    std::cout << " (try again after block " << result.retry_at_block << ")";
  }
  std::cout << '\n';
}

void print_status(const regen::StatusReport& status) {
  std::cout << regen::kAppDisplayName << " " << regen::kAppVersion << " (" << regen::kBuildRelease << ")\n";
  std::cout << regen::kCurrencyName << " ledger, " << regen::kAuthorList << '\n';
  std::cout << "Block: " << status.current_block << "  Era: " << status.current_era
            << "  Epoch: " << status.current_epoch;
  if (status.in_safeguard_window) {
    std::cout << "  [safeguard window]";
  }
  std::cout << '\n';
  if (status.faulted) {
    std::cout << "FAULTED: " << status.fault_reason << '\n';
  }
  std::cout << "Population:";
  for (const auto& [type, count] : status.population) {
    std::cout << ' ' << regen::to_string(type) << '=' << count;
  }
  std::cout << '\n';
  for (const regen::PoolStatus& pool : status.pools) {
    std::cout << "  " << pool.address << " budget/era=" << pool.current_era_budget << " balance=" << pool.balance
              << " distributed=" << pool.distributed << " levels=" << pool.active_levels
              << " participants=" << pool.participants << '\n';
  }
  std::cout << "Supply: " << status.total_supply << " " << regen::kCurrencySymbol << "  locked=" << status.total_locked
            << "  certified=" << status.total_certified << "  treasury=" << status.treasury_balance << '\n';
  std::cout << "Inspections: " << status.inspections << "  Resources: " << status.resources
            << "  Events: " << status.domain_events << '\n';
  std::cout << "Journal: " << status.journal_entries << " entries, " << status.rejected_commands
            << " rejected, head=" << status.journal_head << '\n';
  std::cout << "Data dir: " << (status.data_dir.empty() ? "(memory)" : status.data_dir) << '\n';
}

std::optional<regen::Result> dispatch(regen::CoreApi& api, const std::vector<std::string>& words) {
  const std::string& command = words.front();
  const auto need = [&words](std::size_t count) -> std::optional<regen::Result> {
    if (words.size() < count) {
      return regen::Result::precondition("usage", "Missing arguments; type help.");
    }
    return std::nullopt;
  };

  if (command == "advance") {
    if (auto missing = need(2)) {
      return missing;
    }
    return api.advance_to_block(number_at(words, 1));
  }
  if (command == "register") {
    if (auto missing = need(5)) {
      return missing;
    }
    return api.register_user({
        .address = words[1],
        .type = regen::user_type_from_string(words[2]).value_or(regen::UserType::Undefined),
        .name = words[3],
        .proof_hash = words[4],
        .area = number_at(words, 5),
    });
  }
  if (command == "invite") {
    if (auto missing = need(4)) {
      return missing;
    }
    return api.invite({
        .inviter = words[1],
        .invited = words[2],
        .type = regen::user_type_from_string(words[3]).value_or(regen::UserType::Undefined),
    });
  }
  if (command == "request") {
    if (auto missing = need(2)) {
      return missing;
    }
    return api.request_inspection(words[1]);
  }
  if (command == "accept") {
    if (auto missing = need(3)) {
      return missing;
    }
    return api.accept_inspection(words[1], number_at(words, 2));
  }
  if (command == "realize") {
    if (auto missing = need(7)) {
      return missing;
    }
    return api.realize_inspection({
        .inspector = words[1],
        .inspection_id = number_at(words, 2),
        .trees_result = number_at(words, 3),
        .biodiversity_result = number_at(words, 4),
        .evidence_hash = words[5],
        .justification_hash = words[6],
    });
  }
  if (command == "expire") {
    if (auto missing = need(2)) {
      return missing;
    }
    return api.expire_inspection(number_at(words, 1));
  }
  if (command == "submit") {
    if (auto missing = need(4)) {
      return missing;
    }
    return api.submit_resource({.author = words[1], .title = join_tail(words, 3), .content_hash = words[2]});
  }
  if (command == "vote-resource") {
    if (auto missing = need(3)) {
      return missing;
    }
    return api.vote_resource({.voter = words[1], .resource_id = number_at(words, 2), .justification = join_tail(words, 3)});
  }
  if (command == "vote-user") {
    if (auto missing = need(3)) {
      return missing;
    }
    return api.vote_user({.voter = words[1], .target = words[2], .justification = join_tail(words, 3)});
  }
  if (command == "delate") {
    if (auto missing = need(5)) {
      return missing;
    }
    return api.add_delation({
        .informer = words[1],
        .reported = words[2],
        .title = join_tail(words, 4),
        .testimony_hash = words[3],
    });
  }
  if (command == "thumb") {
    if (auto missing = need(4)) {
      return missing;
    }
    return api.thumb_delation(words[1], number_at(words, 2), words[3] == "up");
  }
  if (command == "convert") {
    if (auto missing = need(2)) {
      return missing;
    }
    return api.convert_points(words[1]);
  }
  if (command == "withdraw") {
    if (auto missing = need(2)) {
      return missing;
    }
    std::optional<regen::PoolKind> pool;
    if (words.size() > 2) {
      pool = regen::pool_kind_from_string(words[2]);
      if (!pool.has_value()) {
        return regen::Result::precondition("unknown-pool", "Unknown pool: " + words[2]);
      }
    }
    return api.withdraw(words[1], pool);
  }
  if (command == "burn") {
    if (auto missing = need(3)) {
      return missing;
    }
    return api.burn(words[1], number_at(words, 2));
  }
  if (command == "transfer") {
    if (auto missing = need(4)) {
      return missing;
    }
    return api.transfer(words[1], words[2], number_at(words, 3));
  }
  return std::nullopt;
}

bool print_query(const regen::CoreApi& api, const std::vector<std::string>& words) {
  const std::string& command = words.front();
  if (command == "status") {
    print_status(api.status());
    return true;
  }
  if (command == "digest") {
    std::cout << api.state_digest() << '\n';
    return true;
  }
  if (command == "balance" && words.size() > 1) {
    std::cout << words[1] << ": " << api.balance_of(words[1]) << ' ' << regen::kCurrencySymbol << '\n';
    return true;
  }
  if (command == "account" && words.size() > 1) {
    const std::optional<regen::Account> account = api.account(words[1]);
    if (!account.has_value()) {
      std::cout << words[1] << ": not registered\n";
      return true;
    }
    std::cout << account->address << " type=" << regen::to_string(account->type)
              << " inviter=" << (account->inviter.empty() ? "-" : account->inviter)
              << " level=" << api.level_of(account->address)
              << " voter-points=" << api.voter(account->address).points << '\n';
    return true;
  }
  if (command == "inspection" && words.size() > 1) {
    const std::optional<regen::Inspection> inspection = api.inspection(number_at(words, 1));
    if (!inspection.has_value()) {
      std::cout << "inspection " << words[1] << ": unknown\n";
      return true;
    }
    std::cout << "inspection " << inspection->id << " status=" << regen::to_string(inspection->status)
              << " regenerator=" << inspection->regenerator
              << " inspector=" << (inspection->inspector.empty() ? "-" : inspection->inspector)
              << " score=" << inspection->regeneration_score << '\n';
    return true;
  }
  return false;
}

}  // namespace

int main(int argc, char** argv) {
  regen::InitConfig config;
  if (argc > 1) {
    config.data_dir = argv[1];
  }
  if (argc > 2) {
    config.config_path = argv[2];
  }

  regen::CoreApi api;
  const regen::Result init = api.init(config);
  if (!init.ok) {
    std::cerr << "regen-cli init failed: " << init.message << '\n';
    return 1;
  }
  std::cout << init.message << '\n';

  std::string line;
  while (std::getline(std::cin, line)) {
    const std::vector<std::string> words = regen::util::split_words(line);
    if (words.empty() || words.front().starts_with('#')) {
      continue;
    }
    if (words.front() == "quit" || words.front() == "exit") {
      break;
    }
    if (words.front() == "help") {
      std::cout << kUsage;
      continue;
    }
    if (print_query(api, words)) {
      continue;
    }
    const std::optional<regen::Result> result = dispatch(api, words);
    if (!result.has_value()) {
      std::cout << "unknown command: " << words.front() << " (type help)\n";
      continue;
    }
    print_result(*result);
  }
  return 0;
}
