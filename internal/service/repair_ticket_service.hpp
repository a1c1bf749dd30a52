#pragma once

#include "service_context.hpp"
#include "warranty/v1.hpp"

namespace warranty::service {

class RepairTicketService {
public:
  explicit RepairTicketService(ServiceContext ctx);

  warranty::v1::TicketResponse      CreateTicket(const warranty::v1::CreateTicketRequest& req);
  warranty::v1::TicketResponse      AssignTicket(const warranty::v1::AssignTicketRequest& req);
  warranty::v1::TicketResponse      StartTicket(const warranty::v1::StartTicketRequest& req);
  warranty::v1::TicketResponse      CompleteTicket(const warranty::v1::CompleteTicketRequest& req);
  warranty::v1::TicketResponse      QualityCheck(const warranty::v1::QualityCheckRequest& req);
  warranty::v1::TicketResponse      CustomerApproval(const warranty::v1::CustomerApprovalRequest& req);
  warranty::v1::TicketResponse      GetTicket(const warranty::v1::GetTicketRequest& req);
  warranty::v1::ListTicketsResponse ListTickets(const warranty::v1::ListTicketsRequest& req);

private:
  ServiceContext ctx_;
};

}
