#pragma once

#include "service_context.hpp"
#include "warranty/v1.hpp"

namespace warranty::service {

class BatchService {
public:
  explicit BatchService(ServiceContext ctx);

  warranty::v1::CreateBatchResponse      CreateBatch(const warranty::v1::CreateBatchRequest& req);
  warranty::v1::StartBatchResponse       StartBatch(const warranty::v1::StartBatchRequest& req);
  warranty::v1::GetBatchProgressResponse GetBatchProgress(const warranty::v1::GetBatchProgressRequest& req);
  warranty::v1::CancelBatchResponse      CancelBatch(const warranty::v1::CancelBatchRequest& req);
  warranty::v1::GetBatchResponse         GetBatch(const warranty::v1::GetBatchRequest& req);
  warranty::v1::ListBatchesResponse      ListBatches(const warranty::v1::ListBatchesRequest& req);
  warranty::v1::ListCollisionsResponse   ListCollisions(const warranty::v1::ListCollisionsRequest& req);
  warranty::v1::ListBatchBarcodesResponse ListBatchBarcodes(const warranty::v1::ListBatchBarcodesRequest& req);

private:
  ServiceContext ctx_;
};

}
