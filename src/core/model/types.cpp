#include "core/model/types.hpp"

namespace regen {

std::string_view to_string(UserType type) {
  switch (type) {
    case UserType::Undefined:
      return "Undefined";
    case UserType::Regenerator:
      return "Regenerator";
    case UserType::Inspector:
      return "Inspector";
    case UserType::Researcher:
      return "Researcher";
    case UserType::Developer:
      return "Developer";
    case UserType::Contributor:
      return "Contributor";
    case UserType::Activist:
      return "Activist";
    case UserType::Supporter:
      return "Supporter";
    case UserType::Denied:
      return "Denied";
  }
  return "Undefined";
}

std::string_view to_string(PoolKind kind) {
  switch (kind) {
    case PoolKind::Regenerator:
      return "Regenerator";
    case PoolKind::Inspector:
      return "Inspector";
    case PoolKind::Researcher:
      return "Researcher";
    case PoolKind::Developer:
      return "Developer";
    case PoolKind::Contributor:
      return "Contributor";
    case PoolKind::Activist:
      return "Activist";
    case PoolKind::Validator:
      return "Validator";
  }
  return "Regenerator";
}

std::string_view to_string(ResourceKind kind) {
  switch (kind) {
    case ResourceKind::Report:
      return "Report";
    case ResourceKind::Research:
      return "Research";
    case ResourceKind::Contribution:
      return "Contribution";
    case ResourceKind::Inspection:
      return "Inspection";
  }
  return "Report";
}

std::string_view to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None:
      return "None";
    case ErrorKind::Configuration:
      return "ConfigurationError";
    case ErrorKind::Precondition:
      return "PreconditionViolation";
    case ErrorKind::TemporalGate:
      return "TemporalGate";
    case ErrorKind::Consistency:
      return "ConsistencyViolation";
  }
  return "None";
}

std::optional<UserType> user_type_from_string(std::string_view text) {
  for (const UserType type : registrable_user_types()) {
    if (to_string(type) == text) {
      return type;
    }
  }
  if (text == "Denied") {
    return UserType::Denied;
  }
  return std::nullopt;
}

std::optional<PoolKind> pool_kind_from_string(std::string_view text) {
  for (const PoolKind kind : all_pool_kinds()) {
    if (to_string(kind) == text) {
      return kind;
    }
  }
  return std::nullopt;
}

std::optional<PoolKind> pool_for_type(UserType type) {
  switch (type) {
    case UserType::Regenerator:
      return PoolKind::Regenerator;
    case UserType::Inspector:
      return PoolKind::Inspector;
    case UserType::Researcher:
      return PoolKind::Researcher;
    case UserType::Developer:
      return PoolKind::Developer;
    case UserType::Contributor:
      return PoolKind::Contributor;
    case UserType::Activist:
      return PoolKind::Activist;
    case UserType::Undefined:
    case UserType::Supporter:
    case UserType::Denied:
      return std::nullopt;
  }
  return std::nullopt;
}

const std::vector<PoolKind>& all_pool_kinds() {
  static const std::vector<PoolKind> kinds = {
      PoolKind::Regenerator, PoolKind::Inspector,   PoolKind::Researcher, PoolKind::Developer,
      PoolKind::Contributor, PoolKind::Activist,    PoolKind::Validator,
  };
  return kinds;
}

const std::vector<UserType>& registrable_user_types() {
  static const std::vector<UserType> types = {
      UserType::Regenerator, UserType::Inspector, UserType::Researcher, UserType::Developer,
      UserType::Contributor, UserType::Activist,  UserType::Supporter,
  };
  return types;
}

}  // namespace regen
