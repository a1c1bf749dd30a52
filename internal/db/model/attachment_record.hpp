#pragma once

#include <cstdint>
#include <string>

#include "internal/model/attachment.hpp"

namespace warranty::db::model {

using AttachmentType = warranty::model::AttachmentType;
using ScanStatus     = warranty::model::ScanStatus;

struct AttachmentRecord {
  std::string    id;
  std::string    claim_id;
  std::string    filename;
  std::string    storage_ref;
  uint64_t       size_bytes = 0;
  std::string    mime_type;
  AttachmentType type        = AttachmentType::kOther;
  ScanStatus     scan_status = ScanStatus::kPending;
  std::string    scan_detail;
  uint64_t       scanned_at_ms = 0;
  std::string    uploaded_by;
  uint64_t       uploaded_at_ms = 0;
};

} // namespace warranty::db::model
