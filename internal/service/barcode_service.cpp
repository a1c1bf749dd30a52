#include "barcode_service.hpp"

#include "internal/core/warranty_registry.hpp"
#include "observe_rpc.hpp"
#include "proto_convert.hpp"

namespace warranty::service {

using namespace warranty::v1;

BarcodeService::BarcodeService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ActivateWarrantyResponse BarcodeService::ActivateWarranty(const ActivateWarrantyRequest& req) {
  return ObserveRpc("BarcodeService.ActivateWarranty", req.barcode(), [&] {
    core::ActivationRequest in;
    in.barcode          = req.barcode();
    in.customer_id      = req.customer_id();
    in.customer_email   = req.customer_email();
    in.retailer         = req.retailer();
    in.invoice_number   = req.invoice_number();
    in.serial_number    = req.serial_number();
    in.purchase_date_ms = req.has_purchase_date() ? util::ProtoToMillis(req.purchase_date()) : 0;
    if (req.has_purchase_price_cents()) in.purchase_price_cents = req.purchase_price_cents();

    ActivateWarrantyResponse resp;
    ToProto(ctx_.registry->Activate(ToContext(req.meta()), in), resp.mutable_barcode());
    return resp;
  });
}

GetBarcodeResponse BarcodeService::GetBarcode(const GetBarcodeRequest& req) {
  return ObserveRpc("BarcodeService.GetBarcode", req.barcode(), [&] {
    GetBarcodeResponse resp;
    ToProto(ctx_.registry->GetBarcode(ToContext(req.meta()), req.barcode()), resp.mutable_barcode());
    return resp;
  });
}

RevokeBarcodeResponse BarcodeService::RevokeBarcode(const RevokeBarcodeRequest& req) {
  return ObserveRpc("BarcodeService.RevokeBarcode", req.barcode(), [&] {
    RevokeBarcodeResponse resp;
    ToProto(ctx_.registry->Revoke(ToContext(req.meta()), req.barcode(), req.reason()), resp.mutable_barcode());
    return resp;
  });
}

ListBarcodeEventsResponse BarcodeService::ListBarcodeEvents(const ListBarcodeEventsRequest& req) {
  return ObserveRpc("BarcodeService.ListBarcodeEvents", req.barcode(), [&] {
    ListBarcodeEventsResponse resp;
    for (const auto& event : ctx_.registry->ListEvents(ToContext(req.meta()), req.barcode())) {
      ToProto(event, resp.add_events());
    }
    return resp;
  });
}

} // namespace warranty::service
