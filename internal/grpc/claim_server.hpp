#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "warranty/services/v1/claim_service.grpc.pb.h"
#include "internal/service/claim_service.hpp"
#include "warranty/v1.hpp"

namespace warranty::grpc {

class ClaimServer final : public warranty::services::v1::ClaimService::Service {
public:
  explicit ClaimServer(std::shared_ptr<warranty::service::ClaimService> svc);

  ::grpc::Status SubmitClaim(::grpc::ServerContext* ctx, const warranty::v1::SubmitClaimRequest* req,
                         warranty::v1::SubmitClaimResponse* resp) override;
  ::grpc::Status GetClaim(::grpc::ServerContext* ctx, const warranty::v1::GetClaimRequest* req,
                         warranty::v1::GetClaimResponse* resp) override;
  ::grpc::Status ListClaims(::grpc::ServerContext* ctx, const warranty::v1::ListClaimsRequest* req,
                         warranty::v1::ListClaimsResponse* resp) override;
  ::grpc::Status TransitionClaim(::grpc::ServerContext* ctx, const warranty::v1::TransitionClaimRequest* req,
                         warranty::v1::TransitionClaimResponse* resp) override;
  ::grpc::Status AssignTechnician(::grpc::ServerContext* ctx, const warranty::v1::AssignTechnicianRequest* req,
                         warranty::v1::AssignTechnicianResponse* resp) override;
  ::grpc::Status CompleteClaim(::grpc::ServerContext* ctx, const warranty::v1::CompleteClaimRequest* req,
                         warranty::v1::CompleteClaimResponse* resp) override;
  ::grpc::Status BulkUpdateClaimStatus(::grpc::ServerContext* ctx, const warranty::v1::BulkUpdateClaimStatusRequest* req,
                         warranty::v1::BulkUpdateClaimStatusResponse* resp) override;
  ::grpc::Status AddClaimNote(::grpc::ServerContext* ctx, const warranty::v1::AddClaimNoteRequest* req,
                         warranty::v1::AddClaimNoteResponse* resp) override;
  ::grpc::Status RequestClaimInfo(::grpc::ServerContext* ctx, const warranty::v1::RequestClaimInfoRequest* req,
                         warranty::v1::RequestClaimInfoResponse* resp) override;
  ::grpc::Status UpdateClaimCosts(::grpc::ServerContext* ctx, const warranty::v1::UpdateClaimCostsRequest* req,
                         warranty::v1::UpdateClaimCostsResponse* resp) override;
  ::grpc::Status GetClaimTimeline(::grpc::ServerContext* ctx, const warranty::v1::GetClaimTimelineRequest* req,
                         warranty::v1::GetClaimTimelineResponse* resp) override;

private:
  std::shared_ptr<warranty::service::ClaimService> service_;
};

}
