#include "attachment_service.hpp"

#include "internal/core/attachment_custodian.hpp"
#include "observe_rpc.hpp"
#include "proto_convert.hpp"

namespace warranty::service {

using namespace warranty::v1;

AttachmentService::AttachmentService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

UploadAttachmentResponse AttachmentService::UploadAttachment(const UploadAttachmentRequest& req) {
  return ObserveRpc("AttachmentService.UploadAttachment", req.claim_id(), [&] {
    core::UploadRequest in;
    in.claim_id    = req.claim_id();
    in.filename    = req.filename();
    in.mime_type   = req.mime_type();
    in.size_bytes  = req.size_bytes();
    in.storage_ref = req.storage_ref();
    in.type        = ParseOptionalField("type", req.type(), warranty::model::ParseAttachmentType);

    UploadAttachmentResponse resp;
    ToProto(ctx_.attachments->Upload(ToContext(req.meta()), in), resp.mutable_attachment());
    return resp;
  });
}

RecordScanResultResponse AttachmentService::RecordScanResult(const RecordScanResultRequest& req) {
  return ObserveRpc("AttachmentService.RecordScanResult", req.attachment_id(), [&] {
    RecordScanResultResponse resp;
    ToProto(ctx_.attachments->RecordScanResult(ToContext(req.meta()), req.attachment_id(), req.passed(), req.detail()),
            resp.mutable_attachment());
    return resp;
  });
}

ListAttachmentsResponse AttachmentService::ListAttachments(const ListAttachmentsRequest& req) {
  return ObserveRpc("AttachmentService.ListAttachments", req.claim_id(), [&] {
    ListAttachmentsResponse resp;
    for (const auto& a : ctx_.attachments->List(ToContext(req.meta()), req.claim_id())) {
      ToProto(a, resp.add_attachments());
    }
    return resp;
  });
}

} // namespace warranty::service
