#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "warranty/services/v1/barcode_service.grpc.pb.h"
#include "internal/service/barcode_service.hpp"
#include "warranty/v1.hpp"

namespace warranty::grpc {

class BarcodeServer final : public warranty::services::v1::BarcodeService::Service {
public:
  explicit BarcodeServer(std::shared_ptr<warranty::service::BarcodeService> svc);

  ::grpc::Status ActivateWarranty(::grpc::ServerContext* ctx, const warranty::v1::ActivateWarrantyRequest* req,
                         warranty::v1::ActivateWarrantyResponse* resp) override;
  ::grpc::Status GetBarcode(::grpc::ServerContext* ctx, const warranty::v1::GetBarcodeRequest* req,
                         warranty::v1::GetBarcodeResponse* resp) override;
  ::grpc::Status RevokeBarcode(::grpc::ServerContext* ctx, const warranty::v1::RevokeBarcodeRequest* req,
                         warranty::v1::RevokeBarcodeResponse* resp) override;
  ::grpc::Status ListBarcodeEvents(::grpc::ServerContext* ctx, const warranty::v1::ListBarcodeEventsRequest* req,
                         warranty::v1::ListBarcodeEventsResponse* resp) override;

private:
  std::shared_ptr<warranty::service::BarcodeService> service_;
};

}
