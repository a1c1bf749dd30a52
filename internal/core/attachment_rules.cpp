#include "attachment_rules.hpp"

#include <algorithm>
#include <cctype>

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace warranty::core {

using warranty::model::AttachmentType;
using warranty::model::ScanStatus;

namespace {

constexpr std::size_t kMaxFilenameLength = 255;

std::string Lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool StartsWith(std::string_view s, std::string_view prefix) {
  return s.substr(0, prefix.size()) == prefix;
}

bool EndsWith(std::string_view s, std::string_view suffix) {
  return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

bool IsDocumentMime(std::string_view mime) {
  return mime == "application/pdf" || mime == "text/plain" || mime == "application/msword" ||
         mime == "application/vnd.openxmlformats-officedocument.wordprocessingml.document";
}

} // namespace

AttachmentType DetectAttachmentType(std::string_view mime_type, std::string_view filename) {
  const auto mime = Lower(mime_type);
  const auto name = Lower(filename);

  if (name.find("receipt") != std::string::npos || name.find("invoice") != std::string::npos) {
    return AttachmentType::kReceipt;
  }
  if (StartsWith(mime, "image/")) return AttachmentType::kPhoto;
  if (StartsWith(mime, "video/")) return AttachmentType::kVideo;
  if (IsDocumentMime(mime)) return AttachmentType::kDocument;

  for (auto ext : {".jpg", ".jpeg", ".png", ".webp", ".heic"}) {
    if (EndsWith(name, ext)) return AttachmentType::kPhoto;
  }
  for (auto ext : {".mp4", ".mov"}) {
    if (EndsWith(name, ext)) return AttachmentType::kVideo;
  }
  for (auto ext : {".pdf", ".txt", ".doc", ".docx"}) {
    if (EndsWith(name, ext)) return AttachmentType::kDocument;
  }
  return AttachmentType::kOther;
}

AttachmentRules::AttachmentRules(AttachmentOptions options) : options_(std::move(options)) {
}

uint64_t AttachmentRules::SizeLimit(std::string_view mime_type) const {
  const auto mime = Lower(mime_type);
  if (StartsWith(mime, "image/")) return options_.max_image_bytes;
  if (StartsWith(mime, "video/")) return options_.max_video_bytes;
  if (IsDocumentMime(mime)) return options_.max_document_bytes;
  return options_.max_other_bytes;
}

db::model::AttachmentRecord AttachmentRules::Admit(const std::string& claim_id, const AttachmentUpload& upload, const std::string& uploader_id,
                                                   uint64_t now_ms) const {
  const auto mime = Lower(upload.mime_type);

  std::vector<util::FieldViolation> violations;
  if (upload.filename.empty() || upload.filename.size() > kMaxFilenameLength) {
    violations.push_back({"filename", "must be 1 to 255 characters", upload.filename.substr(0, 32)});
  }
  if (upload.storage_ref.empty()) {
    violations.push_back({"storage_ref", "is required", ""});
  }
  if (upload.size_bytes == 0) {
    violations.push_back({"size_bytes", "must be positive", "0"});
  }
  if (std::find(options_.allowed_mime_types.begin(), options_.allowed_mime_types.end(), mime) == options_.allowed_mime_types.end()) {
    violations.push_back({"mime_type", "is not an accepted file type", upload.mime_type});
  }
  if (!violations.empty()) {
    throw util::InvalidArgument("invalid attachment", std::move(violations));
  }

  const auto limit = SizeLimit(mime);
  if (upload.size_bytes > limit) {
    throw util::PayloadTooLarge("attachment is " + std::to_string(upload.size_bytes) + " bytes; limit for " + mime + " is " +
                                std::to_string(limit));
  }

  db::model::AttachmentRecord record;
  record.id             = util::NewId();
  record.claim_id       = claim_id;
  record.filename       = upload.filename;
  record.storage_ref    = upload.storage_ref;
  record.size_bytes     = upload.size_bytes;
  record.mime_type      = mime;
  record.type           = upload.type.value_or(DetectAttachmentType(mime, upload.filename));
  record.scan_status    = ScanStatus::kPending;
  record.uploaded_by    = uploader_id;
  record.uploaded_at_ms = now_ms;
  return record;
}

} // namespace warranty::core
