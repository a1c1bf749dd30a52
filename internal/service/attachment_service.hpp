#pragma once

#include "service_context.hpp"
#include "warranty/v1.hpp"

namespace warranty::service {

class AttachmentService {
public:
  explicit AttachmentService(ServiceContext ctx);

  warranty::v1::UploadAttachmentResponse UploadAttachment(const warranty::v1::UploadAttachmentRequest& req);
  warranty::v1::RecordScanResultResponse RecordScanResult(const warranty::v1::RecordScanResultRequest& req);
  warranty::v1::ListAttachmentsResponse  ListAttachments(const warranty::v1::ListAttachmentsRequest& req);

private:
  ServiceContext ctx_;
};

}
