#pragma once

#include "service_context.hpp"
#include "warranty/v1.hpp"

namespace warranty::service {

class ClaimService {
public:
  explicit ClaimService(ServiceContext ctx);

  warranty::v1::SubmitClaimResponse           SubmitClaim(const warranty::v1::SubmitClaimRequest& req);
  warranty::v1::GetClaimResponse              GetClaim(const warranty::v1::GetClaimRequest& req);
  warranty::v1::ListClaimsResponse            ListClaims(const warranty::v1::ListClaimsRequest& req);
  warranty::v1::TransitionClaimResponse       TransitionClaim(const warranty::v1::TransitionClaimRequest& req);
  warranty::v1::AssignTechnicianResponse      AssignTechnician(const warranty::v1::AssignTechnicianRequest& req);
  warranty::v1::CompleteClaimResponse         CompleteClaim(const warranty::v1::CompleteClaimRequest& req);
  warranty::v1::BulkUpdateClaimStatusResponse BulkUpdateClaimStatus(const warranty::v1::BulkUpdateClaimStatusRequest& req);
  warranty::v1::AddClaimNoteResponse          AddClaimNote(const warranty::v1::AddClaimNoteRequest& req);
  warranty::v1::RequestClaimInfoResponse      RequestClaimInfo(const warranty::v1::RequestClaimInfoRequest& req);
  warranty::v1::UpdateClaimCostsResponse      UpdateClaimCosts(const warranty::v1::UpdateClaimCostsRequest& req);
  warranty::v1::GetClaimTimelineResponse      GetClaimTimeline(const warranty::v1::GetClaimTimelineRequest& req);

private:
  ServiceContext ctx_;
};

}
