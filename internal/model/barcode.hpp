#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "internal/model/enum_names.hpp"

namespace warranty::model {

enum class BarcodeStatus : std::uint8_t {
  kGenerated = 1,
  kActive    = 2,
  kClaimed   = 3,
  kExpired   = 4,
  kRevoked   = 5,
};

inline constexpr NameTable<BarcodeStatus, 5> kBarcodeStatusNames{{
    {BarcodeStatus::kGenerated, "generated"},
    {BarcodeStatus::kActive, "active"},
    {BarcodeStatus::kClaimed, "claimed"},
    {BarcodeStatus::kExpired, "expired"},
    {BarcodeStatus::kRevoked, "revoked"},
}};

constexpr std::string_view ToString(BarcodeStatus s) {
  return NameOf(kBarcodeStatusNames, s);
}

constexpr std::optional<BarcodeStatus> ParseBarcodeStatus(std::string_view name) {
  return ValueOf(kBarcodeStatusNames, name);
}

// expired is projected on read; the stored row only moves through
// generated -> active -> claimed, with revoked reachable from any live state.
constexpr bool CanTransition(BarcodeStatus from, BarcodeStatus to) {
  if (from == BarcodeStatus::kRevoked) {
    return false;
  }
  switch (to) {
    case BarcodeStatus::kActive:
      return from == BarcodeStatus::kGenerated;
    case BarcodeStatus::kClaimed:
      return from == BarcodeStatus::kActive;
    case BarcodeStatus::kExpired:
      return from == BarcodeStatus::kActive;
    case BarcodeStatus::kRevoked:
      return true;
    case BarcodeStatus::kGenerated:
    default:
      return false;
  }
}

enum class BarcodeEventType : std::uint8_t {
  kActivated = 1,
  kRevoked   = 2,
  kClaimed   = 3,
  kStatusUpdated = 4,
};

inline constexpr NameTable<BarcodeEventType, 4> kBarcodeEventNames{{
    {BarcodeEventType::kActivated, "activated"},
    {BarcodeEventType::kRevoked, "revoked"},
    {BarcodeEventType::kClaimed, "claimed"},
    {BarcodeEventType::kStatusUpdated, "status_updated"},
}};

constexpr std::string_view ToString(BarcodeEventType e) {
  return NameOf(kBarcodeEventNames, e);
}

constexpr std::optional<BarcodeEventType> ParseBarcodeEventType(std::string_view name) {
  return ValueOf(kBarcodeEventNames, name);
}

} // namespace warranty::model
