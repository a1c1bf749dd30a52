#pragma once

#include "service_context.hpp"
#include "warranty/v1.hpp"

namespace warranty::service {

// Unauthenticated surface: no RequestMeta, no role checks.
class PublicWarrantyService {
public:
  explicit PublicWarrantyService(ServiceContext ctx);

  warranty::v1::ValidateWarrantyResponse ValidateWarranty(const warranty::v1::ValidateWarrantyRequest& req);
  warranty::v1::LookupWarrantiesResponse LookupWarranties(const warranty::v1::LookupWarrantiesRequest& req);
  warranty::v1::CheckCoverageResponse    CheckCoverage(const warranty::v1::CheckCoverageRequest& req);

private:
  ServiceContext ctx_;
};

}
