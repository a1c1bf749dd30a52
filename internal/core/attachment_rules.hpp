#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/model/attachment_record.hpp"

namespace warranty::core {

struct AttachmentOptions {
  std::vector<std::string> allowed_mime_types = {"image/jpeg", "image/png",  "image/webp",      "image/heic", "application/pdf",
                                                 "video/mp4",  "video/quicktime", "text/plain"};
  uint64_t                 max_image_bytes    = 5ULL << 20;
  uint64_t                 max_document_bytes = 10ULL << 20;
  uint64_t                 max_video_bytes    = 50ULL << 20;
  uint64_t                 max_other_bytes    = 10ULL << 20;
};

// Infers the attachment type from the MIME type, then the file name.
warranty::model::AttachmentType DetectAttachmentType(std::string_view mime_type, std::string_view filename);

// File metadata; the bytes live in external storage under storage_ref.
struct AttachmentUpload {
  std::string                                    filename;
  std::string                                    mime_type;
  uint64_t                                       size_bytes = 0;
  std::string                                    storage_ref;
  std::optional<warranty::model::AttachmentType> type;
};

/*
  Admission rules shared by standalone uploads and claim submission.

  Admit throws InvalidArgument for bad metadata or a MIME type outside the
  whitelist, and PayloadTooLarge past the per-type size limit.
*/
class AttachmentRules {
 public:
  explicit AttachmentRules(AttachmentOptions options = {});

  db::model::AttachmentRecord Admit(const std::string& claim_id, const AttachmentUpload& upload, const std::string& uploader_id,
                                    uint64_t now_ms) const;

  uint64_t SizeLimit(std::string_view mime_type) const;

 private:
  AttachmentOptions options_;
};

} // namespace warranty::core
