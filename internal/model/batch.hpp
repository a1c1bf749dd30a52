#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "internal/model/enum_names.hpp"

namespace warranty::model {

enum class BatchStatus : std::uint8_t {
  kPending    = 1,
  kInProgress = 2,
  kCompleted  = 3,
  kCancelled  = 4,
  kFailed     = 5,
};

inline constexpr NameTable<BatchStatus, 5> kBatchStatusNames{{
    {BatchStatus::kPending, "pending"},
    {BatchStatus::kInProgress, "in_progress"},
    {BatchStatus::kCompleted, "completed"},
    {BatchStatus::kCancelled, "cancelled"},
    {BatchStatus::kFailed, "failed"},
}};

constexpr std::string_view ToString(BatchStatus s) {
  return NameOf(kBatchStatusNames, s);
}

constexpr std::optional<BatchStatus> ParseBatchStatus(std::string_view name) {
  return ValueOf(kBatchStatusNames, name);
}

constexpr bool IsTerminal(BatchStatus s) {
  return s == BatchStatus::kCompleted || s == BatchStatus::kCancelled || s == BatchStatus::kFailed;
}

constexpr bool CanTransition(BatchStatus from, BatchStatus to) {
  if (IsTerminal(from)) {
    return false;
  }
  switch (to) {
    case BatchStatus::kInProgress:
      return from == BatchStatus::kPending;
    case BatchStatus::kCompleted:
    case BatchStatus::kFailed:
      return from == BatchStatus::kInProgress;
    case BatchStatus::kCancelled:
      return true;
    case BatchStatus::kPending:
    default:
      return false;
  }
}

enum class BatchPriority : std::uint8_t {
  kLow    = 1,
  kNormal = 2,
  kHigh   = 3,
  kUrgent = 4,
};

inline constexpr NameTable<BatchPriority, 4> kBatchPriorityNames{{
    {BatchPriority::kLow, "low"},
    {BatchPriority::kNormal, "normal"},
    {BatchPriority::kHigh, "high"},
    {BatchPriority::kUrgent, "urgent"},
}};

constexpr std::string_view ToString(BatchPriority p) {
  return NameOf(kBatchPriorityNames, p);
}

constexpr std::optional<BatchPriority> ParseBatchPriority(std::string_view name) {
  return ValueOf(kBatchPriorityNames, name);
}

enum class CollisionType : std::uint8_t {
  kDuplicateInBatch = 1,
  kDuplicateInStore = 2,
};

inline constexpr NameTable<CollisionType, 2> kCollisionTypeNames{{
    {CollisionType::kDuplicateInBatch, "duplicate_in_batch"},
    {CollisionType::kDuplicateInStore, "duplicate_in_store"},
}};

constexpr std::string_view ToString(CollisionType t) {
  return NameOf(kCollisionTypeNames, t);
}

constexpr std::optional<CollisionType> ParseCollisionType(std::string_view name) {
  return ValueOf(kCollisionTypeNames, name);
}

enum class CollisionResolution : std::uint8_t {
  kRegenerated = 1,
  kDropped     = 2,
};

inline constexpr NameTable<CollisionResolution, 2> kCollisionResolutionNames{{
    {CollisionResolution::kRegenerated, "regenerated"},
    {CollisionResolution::kDropped, "dropped"},
}};

constexpr std::string_view ToString(CollisionResolution r) {
  return NameOf(kCollisionResolutionNames, r);
}

constexpr std::optional<CollisionResolution> ParseCollisionResolution(std::string_view name) {
  return ValueOf(kCollisionResolutionNames, name);
}

} // namespace warranty::model
