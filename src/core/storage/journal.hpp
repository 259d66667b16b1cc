#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"

namespace regen {

enum class CommandKind {
  Advance,
  Register,
  Invite,
  Request,
  Accept,
  Realize,
  Expire,
  Submit,
  VoteResource,
  VoteUser,
  Delate,
  Thumb,
  Convert,
  Withdraw,
  Burn,
  Transfer,
};

std::string_view to_string(CommandKind kind);
std::optional<CommandKind> command_kind_from_string(std::string_view text);

struct JournalEntry {
  std::uint64_t sequence = 0;
  std::string command_id;
  CommandKind kind = CommandKind::Advance;
  Address actor;
  BlockHeight block = 0;
  std::string payload;
  // sha256(previous chain + command_id)
  std::string chain;
};

// Append-only log of accepted commands. Without a data directory entries
// are kept in memory only.
class Journal {
public:
  Result open(std::string_view data_dir);
  [[nodiscard]] bool persistent() const { return !journal_path_.empty(); }

  Result append(CommandKind kind, const Address& actor, BlockHeight block, std::string payload);
  // Counts the rejection even when the rejected log cannot be written.
  Result record_rejected(CommandKind kind, const Address& actor, BlockHeight block, const Result& failure);

  [[nodiscard]] const std::vector<JournalEntry>& entries() const { return entries_; }
  [[nodiscard]] std::string head() const;
  [[nodiscard]] std::size_t rejected_count() const { return rejected_count_; }
  [[nodiscard]] const std::string& journal_path() const { return journal_path_; }
  [[nodiscard]] const std::string& rejected_path() const { return rejected_path_; }

  static std::string command_id_for(std::uint64_t sequence, CommandKind kind, const Address& actor,
                                    BlockHeight block, std::string_view payload);

private:
  Result load();
  Result persist(const JournalEntry& entry) const;

  std::string journal_path_;
  std::string rejected_path_;
  std::vector<JournalEntry> entries_;
  std::size_t rejected_count_ = 0;
};

}  // namespace regen
