#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "warranty/services/v1/batch_service.grpc.pb.h"
#include "internal/service/batch_service.hpp"
#include "warranty/v1.hpp"

namespace warranty::grpc {

class BatchServer final : public warranty::services::v1::BatchService::Service {
public:
  explicit BatchServer(std::shared_ptr<warranty::service::BatchService> svc);

  ::grpc::Status CreateBatch(::grpc::ServerContext* ctx, const warranty::v1::CreateBatchRequest* req,
                         warranty::v1::CreateBatchResponse* resp) override;
  ::grpc::Status StartBatch(::grpc::ServerContext* ctx, const warranty::v1::StartBatchRequest* req,
                         warranty::v1::StartBatchResponse* resp) override;
  ::grpc::Status GetBatchProgress(::grpc::ServerContext* ctx, const warranty::v1::GetBatchProgressRequest* req,
                         warranty::v1::GetBatchProgressResponse* resp) override;
  ::grpc::Status CancelBatch(::grpc::ServerContext* ctx, const warranty::v1::CancelBatchRequest* req,
                         warranty::v1::CancelBatchResponse* resp) override;
  ::grpc::Status GetBatch(::grpc::ServerContext* ctx, const warranty::v1::GetBatchRequest* req,
                         warranty::v1::GetBatchResponse* resp) override;
  ::grpc::Status ListBatches(::grpc::ServerContext* ctx, const warranty::v1::ListBatchesRequest* req,
                         warranty::v1::ListBatchesResponse* resp) override;
  ::grpc::Status ListCollisions(::grpc::ServerContext* ctx, const warranty::v1::ListCollisionsRequest* req,
                         warranty::v1::ListCollisionsResponse* resp) override;
  ::grpc::Status ListBatchBarcodes(::grpc::ServerContext* ctx, const warranty::v1::ListBatchBarcodesRequest* req,
                         warranty::v1::ListBatchBarcodesResponse* resp) override;

private:
  std::shared_ptr<warranty::service::BatchService> service_;
};

}
