#include "batch_server.hpp"
#include "call_deadline.hpp"
#include "grpc_error.hpp"

namespace warranty::grpc {

BatchServer::BatchServer(std::shared_ptr<warranty::service::BatchService> svc)
    : service_(std::move(svc)) {}

::grpc::Status BatchServer::CreateBatch(::grpc::ServerContext* ctx,
                                 const warranty::v1::CreateBatchRequest* req,
                                 warranty::v1::CreateBatchResponse* resp) {
  try {
    *resp = service_->CreateBatch(WithCallDeadline(ctx, *req));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BatchServer::StartBatch(::grpc::ServerContext* ctx,
                                 const warranty::v1::StartBatchRequest* req,
                                 warranty::v1::StartBatchResponse* resp) {
  try {
    *resp = service_->StartBatch(WithCallDeadline(ctx, *req));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BatchServer::GetBatchProgress(::grpc::ServerContext* ctx,
                                 const warranty::v1::GetBatchProgressRequest* req,
                                 warranty::v1::GetBatchProgressResponse* resp) {
  try {
    *resp = service_->GetBatchProgress(WithCallDeadline(ctx, *req));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BatchServer::CancelBatch(::grpc::ServerContext* ctx,
                                 const warranty::v1::CancelBatchRequest* req,
                                 warranty::v1::CancelBatchResponse* resp) {
  try {
    *resp = service_->CancelBatch(WithCallDeadline(ctx, *req));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BatchServer::GetBatch(::grpc::ServerContext* ctx,
                                 const warranty::v1::GetBatchRequest* req,
                                 warranty::v1::GetBatchResponse* resp) {
  try {
    *resp = service_->GetBatch(WithCallDeadline(ctx, *req));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BatchServer::ListBatches(::grpc::ServerContext* ctx,
                                 const warranty::v1::ListBatchesRequest* req,
                                 warranty::v1::ListBatchesResponse* resp) {
  try {
    *resp = service_->ListBatches(WithCallDeadline(ctx, *req));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BatchServer::ListCollisions(::grpc::ServerContext* ctx,
                                 const warranty::v1::ListCollisionsRequest* req,
                                 warranty::v1::ListCollisionsResponse* resp) {
  try {
    *resp = service_->ListCollisions(WithCallDeadline(ctx, *req));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BatchServer::ListBatchBarcodes(::grpc::ServerContext* ctx,
                                 const warranty::v1::ListBatchBarcodesRequest* req,
                                 warranty::v1::ListBatchBarcodesResponse* resp) {
  try {
    *resp = service_->ListBatchBarcodes(WithCallDeadline(ctx, *req));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
