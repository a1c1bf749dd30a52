#pragma once

#include "service_context.hpp"
#include "warranty/v1.hpp"

namespace warranty::service {

class BarcodeService {
public:
  explicit BarcodeService(ServiceContext ctx);

  warranty::v1::ActivateWarrantyResponse  ActivateWarranty(const warranty::v1::ActivateWarrantyRequest& req);
  warranty::v1::GetBarcodeResponse        GetBarcode(const warranty::v1::GetBarcodeRequest& req);
  warranty::v1::RevokeBarcodeResponse     RevokeBarcode(const warranty::v1::RevokeBarcodeRequest& req);
  warranty::v1::ListBarcodeEventsResponse ListBarcodeEvents(const warranty::v1::ListBarcodeEventsRequest& req);

private:
  ServiceContext ctx_;
};

}
