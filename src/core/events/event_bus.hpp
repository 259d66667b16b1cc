#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"

namespace regen {

enum class DomainEventKind {
  UserRegistered,
  UserDenied,
  InvitationIssued,
  InspectionRequested,
  InspectionAccepted,
  InspectionRealized,
  InspectionExpired,
  InspectionInvalidated,
  InviteeQualified,
  ResourceSubmitted,
  ResourceInvalidated,
  LevelGranted,
  LevelRemoved,
  TokensWithdrawn,
  TokensBurned,
};

std::string_view to_string(DomainEventKind kind);

// Field meaning depends on kind; unused fields stay zero/empty.
struct DomainEvent {
  DomainEventKind kind = DomainEventKind::UserRegistered;
  std::string event_id;
  BlockHeight block = 0;
  Era era = 0;
  Address actor;
  Address subject;
  UserType user_type = UserType::Undefined;
  ResourceKind resource_kind = ResourceKind::Report;
  std::uint64_t ref_id = 0;
  std::uint64_t amount = 0;
  std::uint64_t score = 0;
};

// LevelGranted / LevelRemoved record; `type` names the pool's user type,
// Undefined for the Validator pool.
DomainEvent make_level_event(DomainEventKind kind, std::string event_id, BlockHeight block, Era era,
                             Address account, UserType type, Level amount);

using DomainEventHandler = std::function<Result(const DomainEvent&)>;

// Synchronous dispatch in subscription order. A failing handler stops the
// chain and its Result is returned to the publisher.
class EventBus {
public:
  void subscribe(DomainEventKind kind, std::string handler_name, DomainEventHandler handler);
  Result publish(const DomainEvent& event);

  [[nodiscard]] const std::vector<DomainEvent>& history() const { return history_; }
  [[nodiscard]] std::vector<std::string> handler_names(DomainEventKind kind) const;
  [[nodiscard]] std::size_t count(DomainEventKind kind) const;

private:
  struct Subscription {
    DomainEventKind kind;
    std::string name;
    DomainEventHandler handler;
  };

  std::vector<Subscription> subscriptions_;
  std::vector<DomainEvent> history_;
};

}  // namespace regen
