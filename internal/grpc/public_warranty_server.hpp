#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "warranty/services/v1/public_warranty_service.grpc.pb.h"
#include "internal/service/public_warranty_service.hpp"
#include "warranty/v1.hpp"

namespace warranty::grpc {

// Served on the public listener when one is configured.
class PublicWarrantyServer final : public warranty::services::v1::PublicWarrantyService::Service {
public:
  explicit PublicWarrantyServer(std::shared_ptr<warranty::service::PublicWarrantyService> svc);

  ::grpc::Status ValidateWarranty(::grpc::ServerContext* ctx, const warranty::v1::ValidateWarrantyRequest* req,
                         warranty::v1::ValidateWarrantyResponse* resp) override;
  ::grpc::Status LookupWarranties(::grpc::ServerContext* ctx, const warranty::v1::LookupWarrantiesRequest* req,
                         warranty::v1::LookupWarrantiesResponse* resp) override;
  ::grpc::Status CheckCoverage(::grpc::ServerContext* ctx, const warranty::v1::CheckCoverageRequest* req,
                         warranty::v1::CheckCoverageResponse* resp) override;

private:
  std::shared_ptr<warranty::service::PublicWarrantyService> service_;
};

}
