#include "public_warranty_service.hpp"

#include "internal/core/public_validator.hpp"
#include "observe_rpc.hpp"
#include "proto_convert.hpp"

namespace warranty::service {

using namespace warranty::v1;

PublicWarrantyService::PublicWarrantyService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ValidateWarrantyResponse PublicWarrantyService::ValidateWarranty(const ValidateWarrantyRequest& req) {
  return ObserveRpc("PublicWarrantyService.ValidateWarranty", "", [&] {
    const auto result = ctx_.validator->Validate(req.barcode(), req.sku());

    ValidateWarrantyResponse resp;
    resp.set_valid(result.valid);
    resp.set_status(result.status);
    resp.set_message(result.message);
    if (result.warranty) ToProto(*result.warranty, resp.mutable_warranty());
    ToProto(result.coverage, resp.mutable_coverage());
    return resp;
  });
}

LookupWarrantiesResponse PublicWarrantyService::LookupWarranties(const LookupWarrantiesRequest& req) {
  return ObserveRpc("PublicWarrantyService.LookupWarranties", "", [&] {
    core::LookupQuery query;
    query.sku              = req.sku();
    query.serial_number    = req.serial_number();
    query.purchase_date_ms = req.has_purchase_date() ? util::ProtoToMillis(req.purchase_date()) : 0;
    query.customer_email   = req.customer_email();

    LookupWarrantiesResponse resp;
    for (const auto& summary : ctx_.validator->Lookup(query)) {
      ToProto(summary, resp.add_warranties());
    }
    return resp;
  });
}

CheckCoverageResponse PublicWarrantyService::CheckCoverage(const CheckCoverageRequest& req) {
  return ObserveRpc("PublicWarrantyService.CheckCoverage", "", [&] {
    core::CoverageCheckRequest in{req.barcode(), req.issue_type(), req.issue_category(), req.description()};
    const auto result = ctx_.validator->CheckCoverage(in);

    CheckCoverageResponse resp;
    resp.set_covered(result.decision.covered);
    resp.set_barcode(result.barcode);
    resp.set_issue_type(result.issue_type);
    resp.set_coverage_type(result.decision.coverage_type);
    resp.set_estimated_cost_cents(result.decision.estimated_cost_cents);
    resp.set_message(result.decision.message);
    for (const auto& r : result.decision.recommendations) resp.add_recommendations(r);
    for (const auto& s : result.decision.next_steps) resp.add_next_steps(s);
    ToProto(result.coverage, resp.mutable_coverage());
    *resp.mutable_checked_at() = util::MillisToProto(result.checked_at_ms);
    return resp;
  });
}

} // namespace warranty::service
