#include "claim_server.hpp"
#include "call_deadline.hpp"
#include "grpc_error.hpp"

namespace warranty::grpc {

ClaimServer::ClaimServer(std::shared_ptr<warranty::service::ClaimService> svc)
    : service_(std::move(svc)) {}

::grpc::Status ClaimServer::SubmitClaim(::grpc::ServerContext* ctx,
                                 const warranty::v1::SubmitClaimRequest* req,
                                 warranty::v1::SubmitClaimResponse* resp) {
  try {
    *resp = service_->SubmitClaim(WithCallDeadline(ctx, *req));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ClaimServer::GetClaim(::grpc::ServerContext* ctx,
                                 const warranty::v1::GetClaimRequest* req,
                                 warranty::v1::GetClaimResponse* resp) {
  try {
    *resp = service_->GetClaim(WithCallDeadline(ctx, *req));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ClaimServer::ListClaims(::grpc::ServerContext* ctx,
                                 const warranty::v1::ListClaimsRequest* req,
                                 warranty::v1::ListClaimsResponse* resp) {
  try {
    *resp = service_->ListClaims(WithCallDeadline(ctx, *req));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ClaimServer::TransitionClaim(::grpc::ServerContext* ctx,
                                 const warranty::v1::TransitionClaimRequest* req,
                                 warranty::v1::TransitionClaimResponse* resp) {
  try {
    *resp = service_->TransitionClaim(WithCallDeadline(ctx, *req));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ClaimServer::AssignTechnician(::grpc::ServerContext* ctx,
                                 const warranty::v1::AssignTechnicianRequest* req,
                                 warranty::v1::AssignTechnicianResponse* resp) {
  try {
    *resp = service_->AssignTechnician(WithCallDeadline(ctx, *req));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ClaimServer::CompleteClaim(::grpc::ServerContext* ctx,
                                 const warranty::v1::CompleteClaimRequest* req,
                                 warranty::v1::CompleteClaimResponse* resp) {
  try {
    *resp = service_->CompleteClaim(WithCallDeadline(ctx, *req));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ClaimServer::BulkUpdateClaimStatus(::grpc::ServerContext* ctx,
                                 const warranty::v1::BulkUpdateClaimStatusRequest* req,
                                 warranty::v1::BulkUpdateClaimStatusResponse* resp) {
  try {
    *resp = service_->BulkUpdateClaimStatus(WithCallDeadline(ctx, *req));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ClaimServer::AddClaimNote(::grpc::ServerContext* ctx,
                                 const warranty::v1::AddClaimNoteRequest* req,
                                 warranty::v1::AddClaimNoteResponse* resp) {
  try {
    *resp = service_->AddClaimNote(WithCallDeadline(ctx, *req));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ClaimServer::RequestClaimInfo(::grpc::ServerContext* ctx,
                                 const warranty::v1::RequestClaimInfoRequest* req,
                                 warranty::v1::RequestClaimInfoResponse* resp) {
  try {
    *resp = service_->RequestClaimInfo(WithCallDeadline(ctx, *req));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ClaimServer::UpdateClaimCosts(::grpc::ServerContext* ctx,
                                 const warranty::v1::UpdateClaimCostsRequest* req,
                                 warranty::v1::UpdateClaimCostsResponse* resp) {
  try {
    *resp = service_->UpdateClaimCosts(WithCallDeadline(ctx, *req));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ClaimServer::GetClaimTimeline(::grpc::ServerContext* ctx,
                                 const warranty::v1::GetClaimTimelineRequest* req,
                                 warranty::v1::GetClaimTimelineResponse* resp) {
  try {
    *resp = service_->GetClaimTimeline(WithCallDeadline(ctx, *req));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
