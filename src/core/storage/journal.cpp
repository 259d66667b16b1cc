#include "core/storage/journal.hpp"

#include <array>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace regen {
namespace {

constexpr std::string_view kJournalFile = "journal.log";
constexpr std::string_view kRejectedFile = "rejected.log";
constexpr std::string_view kJournalHeader = "# regen-core journal v1";
constexpr std::string_view kGenesisChain = "genesis";

constexpr std::array<CommandKind, 16> kAllCommands = {
    CommandKind::Advance,  CommandKind::Register,     CommandKind::Invite,   CommandKind::Request,
    CommandKind::Accept,   CommandKind::Realize,      CommandKind::Expire,   CommandKind::Submit,
    CommandKind::VoteResource, CommandKind::VoteUser, CommandKind::Delate,   CommandKind::Thumb,
    CommandKind::Convert,  CommandKind::Withdraw,     CommandKind::Burn,     CommandKind::Transfer,
};

std::string serialize_entry_line(const JournalEntry& entry) {
  std::ostringstream out;
  out << entry.command_id << '\t' << to_string(entry.kind) << '\t' << entry.actor << '\t' << entry.block << '\t'
      << util::to_hex(entry.payload) << '\t' << entry.chain << '\n';
  return out.str();
}

bool parse_entry_line(std::string_view line, JournalEntry& out) {
  std::array<std::string_view, 6> fields{};
  std::size_t field_index = 0;
  std::size_t start = 0;
  for (std::size_t i = 0; i <= line.size(); ++i) {
    if (i == line.size() || line[i] == '\t') {
      if (field_index >= fields.size()) {
        return false;
      }
      fields[field_index++] = line.substr(start, i - start);
      start = i + 1U;
    }
  }
  if (field_index != fields.size()) {
    return false;
  }

  const auto kind = command_kind_from_string(fields[1]);
  const auto block = util::parse_u64(fields[3]);
  if (!kind.has_value() || !block.has_value()) {
    return false;
  }
  out.command_id = std::string{fields[0]};
  out.kind = *kind;
  out.actor = std::string{fields[2]};
  out.block = *block;
  out.payload = util::from_hex(fields[4]);
  out.chain = std::string{fields[5]};
  return !out.command_id.empty() && !out.chain.empty();
}

}  // namespace

std::string_view to_string(CommandKind kind) {
  switch (kind) {
    case CommandKind::Advance:
      return "advance";
    case CommandKind::Register:
      return "register";
    case CommandKind::Invite:
      return "invite";
    case CommandKind::Request:
      return "request";
    case CommandKind::Accept:
      return "accept";
    case CommandKind::Realize:
      return "realize";
    case CommandKind::Expire:
      return "expire";
    case CommandKind::Submit:
      return "submit";
    case CommandKind::VoteResource:
      return "vote-resource";
    case CommandKind::VoteUser:
      return "vote-user";
    case CommandKind::Delate:
      return "delate";
    case CommandKind::Thumb:
      return "thumb";
    case CommandKind::Convert:
      return "convert";
    case CommandKind::Withdraw:
      return "withdraw";
    case CommandKind::Burn:
      return "burn";
    case CommandKind::Transfer:
      return "transfer";
  }
  return "advance";
}

std::optional<CommandKind> command_kind_from_string(std::string_view text) {
  for (const CommandKind kind : kAllCommands) {
    if (to_string(kind) == text) {
      return kind;
    }
  }
  return std::nullopt;
}

std::string Journal::command_id_for(std::uint64_t sequence, CommandKind kind, const Address& actor,
                                    BlockHeight block, std::string_view payload) {
  return util::sha256_hex(util::canonical_join({
      {"sequence", std::to_string(sequence)},
      {"kind", std::string{to_string(kind)}},
      {"actor", actor},
      {"block", std::to_string(block)},
      {"payload", util::to_hex(payload)},
  }));
}

std::string Journal::head() const {
  return entries_.empty() ? std::string{kGenesisChain} : entries_.back().chain;
}

Result Journal::open(std::string_view data_dir) {
  std::error_code ec;
  std::filesystem::create_directories(std::filesystem::path{data_dir}, ec);
  if (ec) {
    return Result::configuration("data-dir", "Failed to create data directory " + std::string{data_dir} + ": " +
                                                 ec.message());
  }
  journal_path_ = (std::filesystem::path{data_dir} / std::string{kJournalFile}).string();
  rejected_path_ = (std::filesystem::path{data_dir} / std::string{kRejectedFile}).string();
  return load();
}

Result Journal::load() {
  entries_.clear();

  std::ifstream in(journal_path_);
  if (!in) {
    return Result::success("Journal will be created on first command.");
  }

  std::string line;
  std::size_t line_number = 0;
  while (std::getline(in, line)) {
    ++line_number;
    if (line.empty() || line.front() == '#') {
      continue;
    }
    JournalEntry entry;
    if (!parse_entry_line(line, entry)) {
      return Result::consistency("journal-parse", "Journal line " + std::to_string(line_number) + " is malformed.");
    }
    entry.sequence = entries_.size() + 1;
    const std::string expected_id =
        command_id_for(entry.sequence, entry.kind, entry.actor, entry.block, entry.payload);
    if (expected_id != entry.command_id) {
      return Result::consistency("journal-id", "Journal line " + std::to_string(line_number) +
                                                   " does not match its command id.");
    }
    if (util::sha256_hex(head() + entry.command_id) != entry.chain) {
      return Result::consistency("journal-chain", "Journal line " + std::to_string(line_number) +
                                                      " breaks the hash chain.");
    }
    entries_.push_back(std::move(entry));
  }
  return Result::success("Loaded " + std::to_string(entries_.size()) + " journal entries.");
}

Result Journal::persist(const JournalEntry& entry) const {
  const bool fresh = !std::filesystem::exists(journal_path_);
  std::ofstream out(journal_path_, std::ios::out | std::ios::app);
  if (!out) {
    return Result::consistency("journal-write", "Failed to open journal file.");
  }
  if (fresh) {
    out << kJournalHeader << '\n';
  }
  out << serialize_entry_line(entry);
  if (!out.good()) {
    return Result::consistency("journal-write", "Failed to flush journal file.");
  }
  return Result::success();
}

Result Journal::append(CommandKind kind, const Address& actor, BlockHeight block, std::string payload) {
  JournalEntry entry;
  entry.sequence = entries_.size() + 1;
  entry.kind = kind;
  entry.actor = actor;
  entry.block = block;
  entry.payload = std::move(payload);
  entry.command_id = command_id_for(entry.sequence, entry.kind, entry.actor, entry.block, entry.payload);
  entry.chain = util::sha256_hex(head() + entry.command_id);

  if (persistent()) {
    const Result written = persist(entry);
    if (!written.ok) {
      return written;
    }
  }
  entries_.push_back(std::move(entry));
  return Result::success();
}

Result Journal::record_rejected(CommandKind kind, const Address& actor, BlockHeight block, const Result& failure) {
  ++rejected_count_;
  if (rejected_path_.empty()) {
    return Result::success();
  }
  std::ofstream out(rejected_path_, std::ios::out | std::ios::app);
  if (!out) {
    return Result::configuration("rejected-log-write", "Failed to open " + rejected_path_ + ".");
  }
  out << block << '\t' << to_string(kind) << '\t' << actor << '\t' << to_string(failure.kind) << '\t'
      << failure.code << '\t' << failure.message << '\n';
  out.flush();
  if (!out) {
    return Result::configuration("rejected-log-write", "Failed to write " + rejected_path_ + ".");
  }
  return Result::success();
}

}  // namespace regen
