#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "internal/model/enum_names.hpp"
#include "internal/model/state_machine.hpp"

namespace warranty::model {

enum class Severity : std::uint8_t {
  kLow      = 1,
  kMedium   = 2,
  kHigh     = 3,
  kCritical = 4,
};

inline constexpr NameTable<Severity, 4> kSeverityNames{{
    {Severity::kLow, "low"},
    {Severity::kMedium, "medium"},
    {Severity::kHigh, "high"},
    {Severity::kCritical, "critical"},
}};

constexpr std::string_view ToString(Severity s) {
  return NameOf(kSeverityNames, s);
}

constexpr std::optional<Severity> ParseSeverity(std::string_view name) {
  return ValueOf(kSeverityNames, name);
}

enum class Priority : std::uint8_t {
  kLow    = 1,
  kNormal = 2,
  kHigh   = 3,
  kUrgent = 4,
};

inline constexpr NameTable<Priority, 4> kPriorityNames{{
    {Priority::kLow, "low"},
    {Priority::kNormal, "normal"},
    {Priority::kHigh, "high"},
    {Priority::kUrgent, "urgent"},
}};

constexpr std::string_view ToString(Priority p) {
  return NameOf(kPriorityNames, p);
}

constexpr std::optional<Priority> ParsePriority(std::string_view name) {
  return ValueOf(kPriorityNames, name);
}

enum class IssueCategory : std::uint8_t {
  kHardware    = 1,
  kSoftware    = 2,
  kPerformance = 3,
  kDefect      = 4,
  kDamage      = 5,
  kMalfunction = 6,
  kOther       = 7,
};

inline constexpr NameTable<IssueCategory, 7> kIssueCategoryNames{{
    {IssueCategory::kHardware, "hardware"},
    {IssueCategory::kSoftware, "software"},
    {IssueCategory::kPerformance, "performance"},
    {IssueCategory::kDefect, "defect"},
    {IssueCategory::kDamage, "damage"},
    {IssueCategory::kMalfunction, "malfunction"},
    {IssueCategory::kOther, "other"},
}};

constexpr std::string_view ToString(IssueCategory c) {
  return NameOf(kIssueCategoryNames, c);
}

constexpr std::optional<IssueCategory> ParseIssueCategory(std::string_view name) {
  return ValueOf(kIssueCategoryNames, name);
}

// Priority assigned on validation. The claim priority scale has no
// "medium", so medium severity lands on normal.
constexpr Priority DefaultPriority(Severity severity, IssueCategory category) {
  if (severity == Severity::kCritical) return Priority::kHigh;
  if (severity == Severity::kHigh && (category == IssueCategory::kDefect || category == IssueCategory::kMalfunction)) {
    return Priority::kHigh;
  }
  if (severity == Severity::kMedium) return Priority::kNormal;
  return Priority::kLow;
}

enum class ResolutionType : std::uint8_t {
  kRepair  = 1,
  kReplace = 2,
  kRefund  = 3,
};

inline constexpr NameTable<ResolutionType, 3> kResolutionTypeNames{{
    {ResolutionType::kRepair, "repair"},
    {ResolutionType::kReplace, "replace"},
    {ResolutionType::kRefund, "refund"},
}};

constexpr std::string_view ToString(ResolutionType r) {
  return NameOf(kResolutionTypeNames, r);
}

constexpr std::optional<ResolutionType> ParseResolutionType(std::string_view name) {
  return ValueOf(kResolutionTypeNames, name);
}

enum class TimelineEventType : std::uint8_t {
  kSubmitted          = 1,
  kValidated          = 2,
  kRejected           = 3,
  kAssigned           = 4,
  kRepairStarted      = 5,
  kRepairCompleted    = 6,
  kQualityApproved    = 7,
  kCustomerApproved   = 8,
  kCompleted          = 9,
  kNoteAdded          = 10,
  kAttachmentUploaded = 11,
  kStatusUpdated      = 12,
};

inline constexpr NameTable<TimelineEventType, 12> kTimelineEventNames{{
    {TimelineEventType::kSubmitted, "submitted"},
    {TimelineEventType::kValidated, "validated"},
    {TimelineEventType::kRejected, "rejected"},
    {TimelineEventType::kAssigned, "assigned"},
    {TimelineEventType::kRepairStarted, "repair_started"},
    {TimelineEventType::kRepairCompleted, "repair_completed"},
    {TimelineEventType::kQualityApproved, "quality_approved"},
    {TimelineEventType::kCustomerApproved, "customer_approved"},
    {TimelineEventType::kCompleted, "completed"},
    {TimelineEventType::kNoteAdded, "note_added"},
    {TimelineEventType::kAttachmentUploaded, "attachment_uploaded"},
    {TimelineEventType::kStatusUpdated, "status_updated"},
}};

constexpr std::string_view ToString(TimelineEventType t) {
  return NameOf(kTimelineEventNames, t);
}

constexpr std::optional<TimelineEventType> ParseTimelineEventType(std::string_view name) {
  return ValueOf(kTimelineEventNames, name);
}

// One event per status transition; transitions without a dedicated event
// type are recorded as status_updated.
constexpr TimelineEventType EventForTransition(ClaimAction action) {
  switch (action) {
    case ClaimAction::kValidate:
      return TimelineEventType::kValidated;
    case ClaimAction::kReject:
      return TimelineEventType::kRejected;
    case ClaimAction::kAssign:
      return TimelineEventType::kAssigned;
    case ClaimAction::kStart:
      return TimelineEventType::kRepairStarted;
    case ClaimAction::kRepair:
      return TimelineEventType::kRepairCompleted;
    case ClaimAction::kComplete:
      return TimelineEventType::kCompleted;
    default:
      return TimelineEventType::kStatusUpdated;
  }
}

enum class ActorType : std::uint8_t {
  kCustomer   = 1,
  kAgent      = 2,
  kTechnician = 3,
  kSystem     = 4,
};

inline constexpr NameTable<ActorType, 4> kActorTypeNames{{
    {ActorType::kCustomer, "customer"},
    {ActorType::kAgent, "agent"},
    {ActorType::kTechnician, "technician"},
    {ActorType::kSystem, "system"},
}};

constexpr std::string_view ToString(ActorType a) {
  return NameOf(kActorTypeNames, a);
}

constexpr std::optional<ActorType> ParseActorType(std::string_view name) {
  return ValueOf(kActorTypeNames, name);
}

// Customer-facing rendering of a claim status.
constexpr std::string_view DisplayStatus(ClaimStatus s) {
  switch (s) {
    case ClaimStatus::kPending:
      return "Submitted";
    case ClaimStatus::kValidated:
      return "Under Review";
    case ClaimStatus::kRejected:
      return "Rejected";
    case ClaimStatus::kAssigned:
      return "Technician Assigned";
    case ClaimStatus::kInRepair:
      return "In Repair";
    case ClaimStatus::kRepaired:
      return "Repaired";
    case ClaimStatus::kReplaced:
      return "Replaced";
    case ClaimStatus::kShipped:
      return "Shipped";
    case ClaimStatus::kDelivered:
      return "Delivered";
    case ClaimStatus::kCompleted:
      return "Completed";
    case ClaimStatus::kCancelled:
      return "Cancelled";
    case ClaimStatus::kDisputed:
      return "Disputed";
  }
  return "Unknown";
}

} // namespace warranty::model
