#include "public_warranty_server.hpp"
#include "grpc_error.hpp"

namespace warranty::grpc {

PublicWarrantyServer::PublicWarrantyServer(std::shared_ptr<warranty::service::PublicWarrantyService> svc)
    : service_(std::move(svc)) {}

::grpc::Status PublicWarrantyServer::ValidateWarranty(::grpc::ServerContext*,
                                 const warranty::v1::ValidateWarrantyRequest* req,
                                 warranty::v1::ValidateWarrantyResponse* resp) {
  try {
    *resp = service_->ValidateWarranty(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PublicWarrantyServer::LookupWarranties(::grpc::ServerContext*,
                                 const warranty::v1::LookupWarrantiesRequest* req,
                                 warranty::v1::LookupWarrantiesResponse* resp) {
  try {
    *resp = service_->LookupWarranties(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PublicWarrantyServer::CheckCoverage(::grpc::ServerContext*,
                                 const warranty::v1::CheckCoverageRequest* req,
                                 warranty::v1::CheckCoverageResponse* resp) {
  try {
    *resp = service_->CheckCoverage(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
