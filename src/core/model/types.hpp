#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace regen {

using Address = std::string;
using BlockHeight = std::uint64_t;
using Era = std::uint64_t;
using Epoch = std::uint64_t;
using Level = std::uint64_t;
using TokenAmount = std::uint64_t;

enum class ErrorKind {
  None,
  Configuration,
  Precondition,
  TemporalGate,
  Consistency,
};

struct Result {
  bool ok = false;
  ErrorKind kind = ErrorKind::None;
  std::string code;
  std::string message;
  std::string data;
  BlockHeight retry_at_block = 0;

  static Result success(std::string msg = {}, std::string payload = {}) {
    Result result;
    result.ok = true;
    result.message = std::move(msg);
    result.data = std::move(payload);
    return result;
  }

  static Result failure(ErrorKind kind, std::string code, std::string msg) {
    Result result;
    result.kind = kind;
    result.code = std::move(code);
    result.message = std::move(msg);
    return result;
  }

  static Result configuration(std::string code, std::string msg) {
    return failure(ErrorKind::Configuration, std::move(code), std::move(msg));
  }

  static Result precondition(std::string code, std::string msg) {
    return failure(ErrorKind::Precondition, std::move(code), std::move(msg));
  }

  // Clients show "try again after block N" from retry_at_block.
  static Result temporal(std::string code, std::string msg, BlockHeight retry_at) {
    Result result = failure(ErrorKind::TemporalGate, std::move(code), std::move(msg));
    result.retry_at_block = retry_at;
    return result;
  }

  static Result consistency(std::string code, std::string msg) {
    return failure(ErrorKind::Consistency, std::move(code), std::move(msg));
  }
};

enum class UserType {
  Undefined,
  Regenerator,
  Inspector,
  Researcher,
  Developer,
  Contributor,
  Activist,
  Supporter,
  Denied,
};

enum class PoolKind {
  Regenerator,
  Inspector,
  Researcher,
  Developer,
  Contributor,
  Activist,
  Validator,
};

enum class ResourceKind {
  Report,
  Research,
  Contribution,
  Inspection,
};

inline constexpr std::size_t kPoolKindCount = 7;

std::string_view to_string(UserType type);
std::string_view to_string(PoolKind kind);
std::string_view to_string(ResourceKind kind);
std::string_view to_string(ErrorKind kind);

std::optional<UserType> user_type_from_string(std::string_view text);
std::optional<PoolKind> pool_kind_from_string(std::string_view text);

// Supporters have no pool; Denied and Undefined never map to one.
std::optional<PoolKind> pool_for_type(UserType type);
const std::vector<PoolKind>& all_pool_kinds();
const std::vector<UserType>& registrable_user_types();

struct RegistrationDraft {
  Address address;
  UserType type = UserType::Undefined;
  std::string name;
  std::string proof_hash;
  std::uint64_t area = 0;
};

struct InvitationDraft {
  Address inviter;
  Address invited;
  UserType type = UserType::Undefined;
};

struct InspectionReport {
  Address inspector;
  std::uint64_t inspection_id = 0;
  std::uint64_t trees_result = 0;
  std::uint64_t biodiversity_result = 0;
  std::string evidence_hash;
  std::string justification_hash;
};

struct ResourceDraft {
  Address author;
  std::string title;
  std::string content_hash;
};

struct ResourceVoteDraft {
  Address voter;
  std::uint64_t resource_id = 0;
  std::string justification;
};

struct UserVoteDraft {
  Address voter;
  Address target;
  std::string justification;
};

struct DelationDraft {
  Address informer;
  Address reported;
  std::string title;
  std::string testimony_hash;
};

}  // namespace regen
