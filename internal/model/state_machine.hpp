#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "internal/model/enum_names.hpp"

namespace warranty::model {

enum class ClaimStatus : std::uint8_t {
  kPending   = 1,
  kValidated = 2,
  kRejected  = 3,
  kAssigned  = 4,
  kInRepair  = 5,
  kRepaired  = 6,
  kReplaced  = 7,
  kShipped   = 8,
  kDelivered = 9,
  kCompleted = 10,
  kCancelled = 11,
  kDisputed  = 12,
};

inline constexpr NameTable<ClaimStatus, 12> kClaimStatusNames{{
    {ClaimStatus::kPending, "pending"},
    {ClaimStatus::kValidated, "validated"},
    {ClaimStatus::kRejected, "rejected"},
    {ClaimStatus::kAssigned, "assigned"},
    {ClaimStatus::kInRepair, "in_repair"},
    {ClaimStatus::kRepaired, "repaired"},
    {ClaimStatus::kReplaced, "replaced"},
    {ClaimStatus::kShipped, "shipped"},
    {ClaimStatus::kDelivered, "delivered"},
    {ClaimStatus::kCompleted, "completed"},
    {ClaimStatus::kCancelled, "cancelled"},
    {ClaimStatus::kDisputed, "disputed"},
}};

constexpr std::string_view ToString(ClaimStatus s) {
  return NameOf(kClaimStatusNames, s);
}

constexpr std::optional<ClaimStatus> ParseClaimStatus(std::string_view name) {
  return ValueOf(kClaimStatusNames, name);
}

enum class ClaimAction : std::uint8_t {
  kValidate = 1,
  kReject   = 2,
  kCancel   = 3,
  kAssign   = 4,
  kStart    = 5,
  kRepair   = 6,
  kReplace  = 7,
  kShip     = 8,
  kDeliver  = 9,
  kComplete = 10,
  kDispute  = 11,
  kResolve  = 12,
};

inline constexpr NameTable<ClaimAction, 12> kClaimActionNames{{
    {ClaimAction::kValidate, "validate"},
    {ClaimAction::kReject, "reject"},
    {ClaimAction::kCancel, "cancel"},
    {ClaimAction::kAssign, "assign"},
    {ClaimAction::kStart, "start"},
    {ClaimAction::kRepair, "repair"},
    {ClaimAction::kReplace, "replace"},
    {ClaimAction::kShip, "ship"},
    {ClaimAction::kDeliver, "deliver"},
    {ClaimAction::kComplete, "complete"},
    {ClaimAction::kDispute, "dispute"},
    {ClaimAction::kResolve, "resolve"},
}};

constexpr std::string_view ToString(ClaimAction a) {
  return NameOf(kClaimActionNames, a);
}

constexpr std::optional<ClaimAction> ParseClaimAction(std::string_view name) {
  return ValueOf(kClaimActionNames, name);
}

constexpr bool IsTerminal(ClaimStatus s) {
  return s == ClaimStatus::kRejected || s == ClaimStatus::kCompleted || s == ClaimStatus::kCancelled;
}

/*
  Claim transition table.

  Returns the target status for (from, action), or nullopt when the pair is
  not in the table. resolve reports completed; the claim may instead return
  to the status it held before the dispute (see ResolveTargetAllowed).
*/
constexpr std::optional<ClaimStatus> NextStatus(ClaimStatus from, ClaimAction action) {
  if (action == ClaimAction::kDispute) {
    if (IsTerminal(from) || from == ClaimStatus::kDisputed) return std::nullopt;
    return ClaimStatus::kDisputed;
  }

  switch (from) {
    case ClaimStatus::kPending:
      if (action == ClaimAction::kValidate) return ClaimStatus::kValidated;
      if (action == ClaimAction::kReject) return ClaimStatus::kRejected;
      if (action == ClaimAction::kCancel) return ClaimStatus::kCancelled;
      break;
    case ClaimStatus::kValidated:
      if (action == ClaimAction::kAssign) return ClaimStatus::kAssigned;
      if (action == ClaimAction::kCancel) return ClaimStatus::kCancelled;
      break;
    case ClaimStatus::kAssigned:
      if (action == ClaimAction::kStart) return ClaimStatus::kInRepair;
      break;
    case ClaimStatus::kInRepair:
      if (action == ClaimAction::kRepair) return ClaimStatus::kRepaired;
      if (action == ClaimAction::kReplace) return ClaimStatus::kReplaced;
      break;
    case ClaimStatus::kRepaired:
    case ClaimStatus::kReplaced:
      if (action == ClaimAction::kShip) return ClaimStatus::kShipped;
      break;
    case ClaimStatus::kShipped:
      if (action == ClaimAction::kDeliver) return ClaimStatus::kDelivered;
      break;
    case ClaimStatus::kDelivered:
      if (action == ClaimAction::kComplete) return ClaimStatus::kCompleted;
      break;
    case ClaimStatus::kDisputed:
      if (action == ClaimAction::kResolve) return ClaimStatus::kCompleted;
      break;
    default:
      break;
  }
  return std::nullopt;
}

constexpr bool ResolveTargetAllowed(ClaimStatus disputed_from, ClaimStatus target) {
  return target == disputed_from || target == ClaimStatus::kCompleted;
}

inline std::vector<ClaimAction> LegalActions(ClaimStatus from) {
  std::vector<ClaimAction> actions;
  for (const auto& [action, _] : kClaimActionNames) {
    if (NextStatus(from, action)) actions.push_back(action);
  }
  return actions;
}

inline std::vector<std::string_view> LegalActionNames(ClaimStatus from) {
  std::vector<std::string_view> names;
  for (auto action : LegalActions(from)) {
    names.push_back(ToString(action));
  }
  return names;
}

} // namespace warranty::model
