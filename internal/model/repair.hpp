#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "internal/model/enum_names.hpp"

namespace warranty::model {

enum class TicketStatus : std::uint8_t {
  kPending    = 1,
  kAssigned   = 2,
  kInProgress = 3,
  kCompleted  = 4,
  kCancelled  = 5,
};

inline constexpr NameTable<TicketStatus, 5> kTicketStatusNames{{
    {TicketStatus::kPending, "pending"},
    {TicketStatus::kAssigned, "assigned"},
    {TicketStatus::kInProgress, "in_progress"},
    {TicketStatus::kCompleted, "completed"},
    {TicketStatus::kCancelled, "cancelled"},
}};

constexpr std::string_view ToString(TicketStatus s) {
  return NameOf(kTicketStatusNames, s);
}

constexpr std::optional<TicketStatus> ParseTicketStatus(std::string_view name) {
  return ValueOf(kTicketStatusNames, name);
}

constexpr bool CanTransition(TicketStatus from, TicketStatus to) {
  switch (from) {
    case TicketStatus::kPending:
      return to == TicketStatus::kAssigned || to == TicketStatus::kCancelled;
    case TicketStatus::kAssigned:
      return to == TicketStatus::kAssigned || to == TicketStatus::kInProgress || to == TicketStatus::kCancelled;
    case TicketStatus::kInProgress:
      return to == TicketStatus::kCompleted || to == TicketStatus::kCancelled;
    case TicketStatus::kCompleted:
      // QA rejection reopens the same ticket.
      return to == TicketStatus::kInProgress;
    case TicketStatus::kCancelled:
    default:
      return false;
  }
}

// Technicians may be swapped until the work is completed.
constexpr bool CanReassign(TicketStatus status) {
  return CanTransition(status, TicketStatus::kAssigned) || status == TicketStatus::kInProgress;
}

enum class QualityCheckStatus : std::uint8_t {
  kPending  = 1,
  kApproved = 2,
  kRejected = 3,
};

inline constexpr NameTable<QualityCheckStatus, 3> kQualityCheckNames{{
    {QualityCheckStatus::kPending, "pending"},
    {QualityCheckStatus::kApproved, "approved"},
    {QualityCheckStatus::kRejected, "rejected"},
}};

constexpr std::string_view ToString(QualityCheckStatus s) {
  return NameOf(kQualityCheckNames, s);
}

constexpr std::optional<QualityCheckStatus> ParseQualityCheckStatus(std::string_view name) {
  return ValueOf(kQualityCheckNames, name);
}

enum class CustomerApprovalStatus : std::uint8_t {
  kNotRequired = 1,
  kPending     = 2,
  kApproved    = 3,
  kRejected    = 4,
};

inline constexpr NameTable<CustomerApprovalStatus, 4> kCustomerApprovalNames{{
    {CustomerApprovalStatus::kNotRequired, "not_required"},
    {CustomerApprovalStatus::kPending, "pending"},
    {CustomerApprovalStatus::kApproved, "approved"},
    {CustomerApprovalStatus::kRejected, "rejected"},
}};

constexpr std::string_view ToString(CustomerApprovalStatus s) {
  return NameOf(kCustomerApprovalNames, s);
}

constexpr std::optional<CustomerApprovalStatus> ParseCustomerApprovalStatus(std::string_view name) {
  return ValueOf(kCustomerApprovalNames, name);
}

// A ticket releases its claim for resolution once work is done, QA has
// signed off, and any required customer approval is in.
constexpr bool ReleasesClaim(TicketStatus status, QualityCheckStatus qa, CustomerApprovalStatus approval) {
  return status == TicketStatus::kCompleted && qa == QualityCheckStatus::kApproved &&
         (approval == CustomerApprovalStatus::kNotRequired || approval == CustomerApprovalStatus::kApproved);
}

} // namespace warranty::model
