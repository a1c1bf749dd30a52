#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "internal/model/enum_names.hpp"

namespace warranty::model {

enum class AttachmentType : std::uint8_t {
  kReceipt  = 1,
  kPhoto    = 2,
  kVideo    = 3,
  kDocument = 4,
  kOther    = 5,
};

inline constexpr NameTable<AttachmentType, 5> kAttachmentTypeNames{{
    {AttachmentType::kReceipt, "receipt"},
    {AttachmentType::kPhoto, "photo"},
    {AttachmentType::kVideo, "video"},
    {AttachmentType::kDocument, "document"},
    {AttachmentType::kOther, "other"},
}};

constexpr std::string_view ToString(AttachmentType t) {
  return NameOf(kAttachmentTypeNames, t);
}

constexpr std::optional<AttachmentType> ParseAttachmentType(std::string_view name) {
  return ValueOf(kAttachmentTypeNames, name);
}

enum class ScanStatus : std::uint8_t {
  kPending = 1,
  kPassed  = 2,
  kFailed  = 3,
};

inline constexpr NameTable<ScanStatus, 3> kScanStatusNames{{
    {ScanStatus::kPending, "pending"},
    {ScanStatus::kPassed, "passed"},
    {ScanStatus::kFailed, "failed"},
}};

constexpr std::string_view ToString(ScanStatus s) {
  return NameOf(kScanStatusNames, s);
}

constexpr std::optional<ScanStatus> ParseScanStatus(std::string_view name) {
  return ValueOf(kScanStatusNames, name);
}

} // namespace warranty::model
