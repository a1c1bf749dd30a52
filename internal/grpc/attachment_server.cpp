#include "attachment_server.hpp"
#include "call_deadline.hpp"
#include "grpc_error.hpp"

namespace warranty::grpc {

AttachmentServer::AttachmentServer(std::shared_ptr<warranty::service::AttachmentService> svc)
    : service_(std::move(svc)) {}

::grpc::Status AttachmentServer::UploadAttachment(::grpc::ServerContext* ctx,
                                 const warranty::v1::UploadAttachmentRequest* req,
                                 warranty::v1::UploadAttachmentResponse* resp) {
  try {
    *resp = service_->UploadAttachment(WithCallDeadline(ctx, *req));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AttachmentServer::RecordScanResult(::grpc::ServerContext* ctx,
                                 const warranty::v1::RecordScanResultRequest* req,
                                 warranty::v1::RecordScanResultResponse* resp) {
  try {
    *resp = service_->RecordScanResult(WithCallDeadline(ctx, *req));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AttachmentServer::ListAttachments(::grpc::ServerContext* ctx,
                                 const warranty::v1::ListAttachmentsRequest* req,
                                 warranty::v1::ListAttachmentsResponse* resp) {
  try {
    *resp = service_->ListAttachments(WithCallDeadline(ctx, *req));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
