#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "warranty/services/v1/attachment_service.grpc.pb.h"
#include "internal/service/attachment_service.hpp"
#include "warranty/v1.hpp"

namespace warranty::grpc {

class AttachmentServer final : public warranty::services::v1::AttachmentService::Service {
public:
  explicit AttachmentServer(std::shared_ptr<warranty::service::AttachmentService> svc);

  ::grpc::Status UploadAttachment(::grpc::ServerContext* ctx, const warranty::v1::UploadAttachmentRequest* req,
                         warranty::v1::UploadAttachmentResponse* resp) override;
  ::grpc::Status RecordScanResult(::grpc::ServerContext* ctx, const warranty::v1::RecordScanResultRequest* req,
                         warranty::v1::RecordScanResultResponse* resp) override;
  ::grpc::Status ListAttachments(::grpc::ServerContext* ctx, const warranty::v1::ListAttachmentsRequest* req,
                         warranty::v1::ListAttachmentsResponse* resp) override;

private:
  std::shared_ptr<warranty::service::AttachmentService> service_;
};

}
