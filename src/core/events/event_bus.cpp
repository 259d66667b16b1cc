#include "core/events/event_bus.hpp"

#include <algorithm>
#include <utility>

namespace regen {

std::string_view to_string(DomainEventKind kind) {
  switch (kind) {
    case DomainEventKind::UserRegistered:
      return "UserRegistered";
    case DomainEventKind::UserDenied:
      return "UserDenied";
    case DomainEventKind::InvitationIssued:
      return "InvitationIssued";
    case DomainEventKind::InspectionRequested:
      return "InspectionRequested";
    case DomainEventKind::InspectionAccepted:
      return "InspectionAccepted";
    case DomainEventKind::InspectionRealized:
      return "InspectionRealized";
    case DomainEventKind::InspectionExpired:
      return "InspectionExpired";
    case DomainEventKind::InspectionInvalidated:
      return "InspectionInvalidated";
    case DomainEventKind::InviteeQualified:
      return "InviteeQualified";
    case DomainEventKind::ResourceSubmitted:
      return "ResourceSubmitted";
    case DomainEventKind::ResourceInvalidated:
      return "ResourceInvalidated";
    case DomainEventKind::LevelGranted:
      return "LevelGranted";
    case DomainEventKind::LevelRemoved:
      return "LevelRemoved";
    case DomainEventKind::TokensWithdrawn:
      return "TokensWithdrawn";
    case DomainEventKind::TokensBurned:
      return "TokensBurned";
  }
  return "UserRegistered";
}

DomainEvent make_level_event(DomainEventKind kind, std::string event_id, BlockHeight block, Era era,
                             Address account, UserType type, Level amount) {
  DomainEvent event;
  event.kind = kind;
  event.event_id = std::move(event_id);
  event.block = block;
  event.era = era;
  event.subject = std::move(account);
  event.user_type = type;
  event.amount = amount;
  return event;
}

void EventBus::subscribe(DomainEventKind kind, std::string handler_name, DomainEventHandler handler) {
  subscriptions_.push_back({kind, std::move(handler_name), std::move(handler)});
}

Result EventBus::publish(const DomainEvent& event) {
  history_.push_back(event);
  // Handlers may publish nested events.
  for (std::size_t i = 0; i < subscriptions_.size(); ++i) {
    if (subscriptions_[i].kind != event.kind) {
      continue;
    }
    const Result handled = subscriptions_[i].handler(event);
    if (!handled.ok) {
      Result failed = handled;
      failed.message = subscriptions_[i].name + ": " + handled.message;
      return failed;
    }
  }
  return Result::success();
}

std::vector<std::string> EventBus::handler_names(DomainEventKind kind) const {
  std::vector<std::string> names;
  for (const auto& subscription : subscriptions_) {
    if (subscription.kind == kind) {
      names.push_back(subscription.name);
    }
  }
  return names;
}

std::size_t EventBus::count(DomainEventKind kind) const {
  return static_cast<std::size_t>(std::ranges::count_if(history_, [kind](const DomainEvent& event) {
    return event.kind == kind;
  }));
}

}  // namespace regen
