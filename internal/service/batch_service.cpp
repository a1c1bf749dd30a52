#include "batch_service.hpp"

#include "internal/core/batch_engine.hpp"
#include "internal/core/warranty_registry.hpp"
#include "observe_rpc.hpp"
#include "proto_convert.hpp"

namespace warranty::service {

using namespace warranty::v1;

namespace {

std::optional<std::string> NonEmpty(const std::string& value) {
  if (value.empty()) return std::nullopt;
  return value;
}

} // namespace

BatchService::BatchService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CreateBatchResponse BatchService::CreateBatch(const CreateBatchRequest& req) {
  return ObserveRpc("BatchService.CreateBatch", req.product_id(), [&] {
    core::CreateBatchRequest in;
    in.product_id         = req.product_id();
    in.storefront_id      = req.storefront_id();
    in.quantity           = req.quantity();
    in.prefix             = req.prefix();
    in.expiry_months      = req.expiry_months();
    in.priority           = ParseOptionalField("priority", req.priority(), warranty::model::ParseBatchPriority)
                      .value_or(warranty::model::BatchPriority::kNormal);
    in.description        = req.description();
    in.tags.assign(req.tags().begin(), req.tags().end());
    in.notify_on_complete = req.notify_on_complete();
    if (req.has_max_retries()) in.max_retries = req.max_retries();

    CreateBatchResponse resp;
    ToProto(ctx_.batches->CreateBatch(ToContext(req.meta()), in), resp.mutable_batch());
    return resp;
  });
}

StartBatchResponse BatchService::StartBatch(const StartBatchRequest& req) {
  return ObserveRpc("BatchService.StartBatch", req.batch_id(), [&] {
    StartBatchResponse resp;
    ToProto(ctx_.batches->StartBatch(ToContext(req.meta()), req.batch_id()), resp.mutable_batch());
    return resp;
  });
}

GetBatchProgressResponse BatchService::GetBatchProgress(const GetBatchProgressRequest& req) {
  return ObserveRpc("BatchService.GetBatchProgress", req.batch_id(), [&] {
    GetBatchProgressResponse resp;
    ToProto(ctx_.batches->GetProgress(ToContext(req.meta()), req.batch_id()), resp.mutable_progress());
    return resp;
  });
}

CancelBatchResponse BatchService::CancelBatch(const CancelBatchRequest& req) {
  return ObserveRpc("BatchService.CancelBatch", req.batch_id(), [&] {
    CancelBatchResponse resp;
    ToProto(ctx_.batches->CancelBatch(ToContext(req.meta()), req.batch_id(), req.reason(), req.force()), resp.mutable_batch());
    return resp;
  });
}

GetBatchResponse BatchService::GetBatch(const GetBatchRequest& req) {
  return ObserveRpc("BatchService.GetBatch", req.batch_id(), [&] {
    GetBatchResponse resp;
    ToProto(ctx_.batches->GetBatch(ToContext(req.meta()), req.batch_id()), resp.mutable_batch());
    return resp;
  });
}

ListBatchesResponse BatchService::ListBatches(const ListBatchesRequest& req) {
  return ObserveRpc("BatchService.ListBatches", "", [&] {
    db::BatchFilter filter;
    filter.status          = ParseOptionalField("status", req.status(), warranty::model::ParseBatchStatus);
    filter.priority        = ParseOptionalField("priority", req.priority(), warranty::model::ParseBatchPriority);
    filter.product_id      = NonEmpty(req.product_id());
    filter.storefront_id   = NonEmpty(req.storefront_id());
    filter.created_by      = NonEmpty(req.created_by());
    filter.created_from_ms = req.has_created_from() ? util::ProtoToMillis(req.created_from()) : 0;
    filter.created_to_ms   = req.has_created_to() ? util::ProtoToMillis(req.created_to()) : 0;

    ListBatchesResponse resp;
    for (const auto& batch : ctx_.batches->ListBatches(ToContext(req.meta()), filter, ToPagination(req.page(), req.has_page()))) {
      ToProto(batch, resp.add_batches());
    }
    return resp;
  });
}

ListCollisionsResponse BatchService::ListCollisions(const ListCollisionsRequest& req) {
  return ObserveRpc("BatchService.ListCollisions", req.batch_id(), [&] {
    ListCollisionsResponse resp;
    for (const auto& c : ctx_.batches->ListCollisions(ToContext(req.meta()), req.batch_id(), ToPagination(req.page(), req.has_page()))) {
      ToProto(c, resp.add_collisions());
    }
    return resp;
  });
}

ListBatchBarcodesResponse BatchService::ListBatchBarcodes(const ListBatchBarcodesRequest& req) {
  return ObserveRpc("BatchService.ListBatchBarcodes", req.batch_id(), [&] {
    ListBatchBarcodesResponse resp;
    for (const auto& row : ctx_.batches->ListBarcodes(ToContext(req.meta()), req.batch_id(), ToPagination(req.page(), req.has_page()))) {
      ToProto(ctx_.registry->View(row), resp.add_barcodes());
    }
    return resp;
  });
}

} // namespace warranty::service
