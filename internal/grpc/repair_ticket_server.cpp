#include "repair_ticket_server.hpp"
#include "call_deadline.hpp"
#include "grpc_error.hpp"

namespace warranty::grpc {

RepairTicketServer::RepairTicketServer(std::shared_ptr<warranty::service::RepairTicketService> svc)
    : service_(std::move(svc)) {}

::grpc::Status RepairTicketServer::CreateTicket(::grpc::ServerContext* ctx,
                                 const warranty::v1::CreateTicketRequest* req,
                                 warranty::v1::TicketResponse* resp) {
  try {
    *resp = service_->CreateTicket(WithCallDeadline(ctx, *req));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RepairTicketServer::AssignTicket(::grpc::ServerContext* ctx,
                                 const warranty::v1::AssignTicketRequest* req,
                                 warranty::v1::TicketResponse* resp) {
  try {
    *resp = service_->AssignTicket(WithCallDeadline(ctx, *req));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RepairTicketServer::StartTicket(::grpc::ServerContext* ctx,
                                 const warranty::v1::StartTicketRequest* req,
                                 warranty::v1::TicketResponse* resp) {
  try {
    *resp = service_->StartTicket(WithCallDeadline(ctx, *req));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RepairTicketServer::CompleteTicket(::grpc::ServerContext* ctx,
                                 const warranty::v1::CompleteTicketRequest* req,
                                 warranty::v1::TicketResponse* resp) {
  try {
    *resp = service_->CompleteTicket(WithCallDeadline(ctx, *req));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RepairTicketServer::QualityCheck(::grpc::ServerContext* ctx,
                                 const warranty::v1::QualityCheckRequest* req,
                                 warranty::v1::TicketResponse* resp) {
  try {
    *resp = service_->QualityCheck(WithCallDeadline(ctx, *req));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RepairTicketServer::CustomerApproval(::grpc::ServerContext* ctx,
                                 const warranty::v1::CustomerApprovalRequest* req,
                                 warranty::v1::TicketResponse* resp) {
  try {
    *resp = service_->CustomerApproval(WithCallDeadline(ctx, *req));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RepairTicketServer::GetTicket(::grpc::ServerContext* ctx,
                                 const warranty::v1::GetTicketRequest* req,
                                 warranty::v1::TicketResponse* resp) {
  try {
    *resp = service_->GetTicket(WithCallDeadline(ctx, *req));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RepairTicketServer::ListTickets(::grpc::ServerContext* ctx,
                                 const warranty::v1::ListTicketsRequest* req,
                                 warranty::v1::ListTicketsResponse* resp) {
  try {
    *resp = service_->ListTickets(WithCallDeadline(ctx, *req));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
