#include "claim_service.hpp"

#include "internal/core/attachment_custodian.hpp"
#include "internal/core/claim_workflow.hpp"
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

ClaimService::ClaimService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

SubmitClaimResponse ClaimService::SubmitClaim(const SubmitClaimRequest& req) {
  return ObserveRpc("ClaimService.SubmitClaim", req.barcode(), [&] {
    core::SubmitClaimRequest in;
    in.barcode           = req.barcode();
    in.issue_category    = ParseField("issue_category", req.issue_category(), warranty::model::ParseIssueCategory);
    in.issue_description = req.issue_description();
    in.severity          = ParseOptionalField("severity", req.severity(), warranty::model::ParseSeverity).value_or(warranty::model::Severity::kMedium);
    in.customer_name     = req.customer_name();
    in.customer_email    = req.customer_email();
    in.customer_phone    = req.customer_phone();
    in.pickup_address    = req.pickup_address();
    in.customer_notes    = req.customer_notes();
    in.tags.assign(req.tags().begin(), req.tags().end());
    for (const auto& a : req.attachments()) {
      core::AttachmentUpload upload;
      upload.filename    = a.filename();
      upload.mime_type   = a.mime_type();
      upload.size_bytes  = a.size_bytes();
      upload.storage_ref = a.storage_ref();
      upload.type        = ParseOptionalField("attachments.type", a.type(), warranty::model::ParseAttachmentType);
      in.attachments.push_back(std::move(upload));
    }

    auto view = ctx_.claims->Submit(ToContext(req.meta()), in);
    if (!in.attachments.empty() && ctx_.attachments) ctx_.attachments->DispatchPendingScans(view.claim.id);

    SubmitClaimResponse resp;
    ToProto(view, resp.mutable_claim());
    return resp;
  });
}

GetClaimResponse ClaimService::GetClaim(const GetClaimRequest& req) {
  return ObserveRpc("ClaimService.GetClaim", req.claim_id(), [&] {
    GetClaimResponse resp;
    ToProto(ctx_.claims->GetClaim(ToContext(req.meta()), req.claim_id()), resp.mutable_claim());
    return resp;
  });
}

ListClaimsResponse ClaimService::ListClaims(const ListClaimsRequest& req) {
  return ObserveRpc("ClaimService.ListClaims", "", [&] {
    db::ClaimFilter filter;
    filter.status             = ParseOptionalField("status", req.status(), warranty::model::ParseClaimStatus);
    filter.priority           = ParseOptionalField("priority", req.priority(), warranty::model::ParsePriority);
    filter.severity           = ParseOptionalField("severity", req.severity(), warranty::model::ParseSeverity);
    filter.customer_id        = NonEmpty(req.customer_id());
    filter.technician_id      = NonEmpty(req.technician_id());
    filter.barcode_id         = NonEmpty(req.barcode_id());
    filter.claim_date_from_ms = req.has_claim_date_from() ? util::ProtoToMillis(req.claim_date_from()) : 0;
    filter.claim_date_to_ms   = req.has_claim_date_to() ? util::ProtoToMillis(req.claim_date_to()) : 0;

    ListClaimsResponse resp;
    for (const auto& view : ctx_.claims->ListClaims(ToContext(req.meta()), filter, ToPagination(req.page(), req.has_page()))) {
      ToProto(view, resp.add_claims());
    }
    return resp;
  });
}

TransitionClaimResponse ClaimService::TransitionClaim(const TransitionClaimRequest& req) {
  return ObserveRpc("ClaimService.TransitionClaim", req.claim_id(), [&] {
    const auto ctx    = ToContext(req.meta());
    const auto action = ParseField("action", req.action(), warranty::model::ParseClaimAction);

    TransitionClaimResponse resp;
    ToProto(ctx_.claims->Transition(ctx, req.claim_id(), action, FromProto(req.options())), resp.mutable_claim());
    return resp;
  });
}

AssignTechnicianResponse ClaimService::AssignTechnician(const AssignTechnicianRequest& req) {
  return ObserveRpc("ClaimService.AssignTechnician", req.claim_id(), [&] {
    const auto ctx      = ToContext(req.meta());
    const auto priority = ParseOptionalField("priority", req.priority(), warranty::model::ParsePriority);
    const auto eta      = req.has_estimated_completion() ? util::ProtoToMillis(req.estimated_completion()) : 0;

    AssignTechnicianResponse resp;
    ToProto(ctx_.claims->AssignTechnician(ctx, req.claim_id(), req.technician_id(), eta, priority), resp.mutable_claim());
    return resp;
  });
}

CompleteClaimResponse ClaimService::CompleteClaim(const CompleteClaimRequest& req) {
  return ObserveRpc("ClaimService.CompleteClaim", req.claim_id(), [&] {
    const auto ctx        = ToContext(req.meta());
    const auto resolution = ParseField("resolution_type", req.resolution_type(), warranty::model::ParseResolutionType);

    CompleteClaimResponse resp;
    ToProto(ctx_.claims->Complete(ctx, req.claim_id(), resolution, req.resolution_notes()), resp.mutable_claim());
    return resp;
  });
}

BulkUpdateClaimStatusResponse ClaimService::BulkUpdateClaimStatus(const BulkUpdateClaimStatusRequest& req) {
  return ObserveRpc("ClaimService.BulkUpdateClaimStatus", "", [&] {
    const auto ctx    = ToContext(req.meta());
    const auto action = ParseField("action", req.action(), warranty::model::ParseClaimAction);
    const std::vector<std::string> ids(req.claim_ids().begin(), req.claim_ids().end());

    BulkUpdateClaimStatusResponse resp;
    for (const auto& item : ctx_.claims->BulkTransition(ctx, ids, action, FromProto(req.options()))) {
      auto* out = resp.add_results();
      out->set_claim_id(item.claim_id);
      out->set_ok(item.ok);
      out->set_error_kind(item.error_kind);
      out->set_message(item.message);
      if (item.claim) ToProto(*item.claim, out->mutable_claim());
      if (item.ok) {
        resp.set_succeeded(resp.succeeded() + 1);
      } else {
        resp.set_failed(resp.failed() + 1);
      }
    }
    return resp;
  });
}

AddClaimNoteResponse ClaimService::AddClaimNote(const AddClaimNoteRequest& req) {
  return ObserveRpc("ClaimService.AddClaimNote", req.claim_id(), [&] {
    AddClaimNoteResponse resp;
    ToProto(ctx_.claims->AddNote(ToContext(req.meta()), req.claim_id(), req.note(), req.visible_to_customer()), resp.mutable_event());
    return resp;
  });
}

RequestClaimInfoResponse ClaimService::RequestClaimInfo(const RequestClaimInfoRequest& req) {
  return ObserveRpc("ClaimService.RequestClaimInfo", req.claim_id(), [&] {
    RequestClaimInfoResponse resp;
    ToProto(ctx_.claims->RequestInfo(ToContext(req.meta()), req.claim_id(), req.message()), resp.mutable_claim());
    return resp;
  });
}

UpdateClaimCostsResponse ClaimService::UpdateClaimCosts(const UpdateClaimCostsRequest& req) {
  return ObserveRpc("ClaimService.UpdateClaimCosts", req.claim_id(), [&] {
    core::CostUpdate update;
    if (req.has_repair_cost_cents()) update.repair_cost_cents = req.repair_cost_cents();
    if (req.has_shipping_cost_cents()) update.shipping_cost_cents = req.shipping_cost_cents();
    if (req.has_replacement_cost_cents()) update.replacement_cost_cents = req.replacement_cost_cents();
    if (req.has_expected_version()) update.expected_version = req.expected_version();

    UpdateClaimCostsResponse resp;
    ToProto(ctx_.claims->UpdateCosts(ToContext(req.meta()), req.claim_id(), update), resp.mutable_claim());
    return resp;
  });
}

GetClaimTimelineResponse ClaimService::GetClaimTimeline(const GetClaimTimelineRequest& req) {
  return ObserveRpc("ClaimService.GetClaimTimeline", req.claim_id(), [&] {
    GetClaimTimelineResponse resp;
    for (const auto& event : ctx_.claims->GetTimeline(ToContext(req.meta()), req.claim_id())) {
      ToProto(event, resp.add_events());
    }
    return resp;
  });
}

} // namespace warranty::service
