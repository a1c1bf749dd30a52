#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "warranty/services/v1/repair_ticket_service.grpc.pb.h"
#include "internal/service/repair_ticket_service.hpp"
#include "warranty/v1.hpp"

namespace warranty::grpc {

class RepairTicketServer final : public warranty::services::v1::RepairTicketService::Service {
public:
  explicit RepairTicketServer(std::shared_ptr<warranty::service::RepairTicketService> svc);

  ::grpc::Status CreateTicket(::grpc::ServerContext* ctx, const warranty::v1::CreateTicketRequest* req,
                         warranty::v1::TicketResponse* resp) override;
  ::grpc::Status AssignTicket(::grpc::ServerContext* ctx, const warranty::v1::AssignTicketRequest* req,
                         warranty::v1::TicketResponse* resp) override;
  ::grpc::Status StartTicket(::grpc::ServerContext* ctx, const warranty::v1::StartTicketRequest* req,
                         warranty::v1::TicketResponse* resp) override;
  ::grpc::Status CompleteTicket(::grpc::ServerContext* ctx, const warranty::v1::CompleteTicketRequest* req,
                         warranty::v1::TicketResponse* resp) override;
  ::grpc::Status QualityCheck(::grpc::ServerContext* ctx, const warranty::v1::QualityCheckRequest* req,
                         warranty::v1::TicketResponse* resp) override;
  ::grpc::Status CustomerApproval(::grpc::ServerContext* ctx, const warranty::v1::CustomerApprovalRequest* req,
                         warranty::v1::TicketResponse* resp) override;
  ::grpc::Status GetTicket(::grpc::ServerContext* ctx, const warranty::v1::GetTicketRequest* req,
                         warranty::v1::TicketResponse* resp) override;
  ::grpc::Status ListTickets(::grpc::ServerContext* ctx, const warranty::v1::ListTicketsRequest* req,
                         warranty::v1::ListTicketsResponse* resp) override;

private:
  std::shared_ptr<warranty::service::RepairTicketService> service_;
};

}
