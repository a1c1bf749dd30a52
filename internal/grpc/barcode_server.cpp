#include "barcode_server.hpp"
#include "call_deadline.hpp"
#include "grpc_error.hpp"

namespace warranty::grpc {

BarcodeServer::BarcodeServer(std::shared_ptr<warranty::service::BarcodeService> svc)
    : service_(std::move(svc)) {}

::grpc::Status BarcodeServer::ActivateWarranty(::grpc::ServerContext* ctx,
                                 const warranty::v1::ActivateWarrantyRequest* req,
                                 warranty::v1::ActivateWarrantyResponse* resp) {
  try {
    *resp = service_->ActivateWarranty(WithCallDeadline(ctx, *req));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BarcodeServer::GetBarcode(::grpc::ServerContext* ctx,
                                 const warranty::v1::GetBarcodeRequest* req,
                                 warranty::v1::GetBarcodeResponse* resp) {
  try {
    *resp = service_->GetBarcode(WithCallDeadline(ctx, *req));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BarcodeServer::RevokeBarcode(::grpc::ServerContext* ctx,
                                 const warranty::v1::RevokeBarcodeRequest* req,
                                 warranty::v1::RevokeBarcodeResponse* resp) {
  try {
    *resp = service_->RevokeBarcode(WithCallDeadline(ctx, *req));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BarcodeServer::ListBarcodeEvents(::grpc::ServerContext* ctx,
                                 const warranty::v1::ListBarcodeEventsRequest* req,
                                 warranty::v1::ListBarcodeEventsResponse* resp) {
  try {
    *resp = service_->ListBarcodeEvents(WithCallDeadline(ctx, *req));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
