#include "repair_ticket_service.hpp"

#include "internal/core/repair_ticket_engine.hpp"
#include "observe_rpc.hpp"
#include "proto_convert.hpp"

namespace warranty::service {

using namespace warranty::v1;

namespace {

TicketResponse Wrap(const db::model::RepairTicketRecord& ticket) {
  TicketResponse resp;
  ToProto(ticket, resp.mutable_ticket());
  return resp;
}

} // namespace

RepairTicketService::RepairTicketService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

TicketResponse RepairTicketService::CreateTicket(const CreateTicketRequest& req) {
  return ObserveRpc("RepairTicketService.CreateTicket", req.claim_id(), [&] {
    core::CreateTicketRequest in;
    in.claim_id                = req.claim_id();
    in.technician_id           = req.technician_id();
    in.priority                = ParseOptionalField("priority", req.priority(), warranty::model::ParsePriority);
    in.estimated_hours         = req.estimated_hours();
    in.estimated_completion_ms = req.has_estimated_completion() ? util::ProtoToMillis(req.estimated_completion()) : 0;
    in.description             = req.description();
    in.special_instructions    = req.special_instructions();
    for (const auto& part : req.required_parts()) in.required_parts.push_back(FromProto(part));
    if (req.has_estimated_cost_cents()) in.estimated_cost_cents = req.estimated_cost_cents();
    in.customer_approval_required = req.customer_approval_required();

    return Wrap(ctx_.tickets->CreateTicket(ToContext(req.meta()), in));
  });
}

TicketResponse RepairTicketService::AssignTicket(const AssignTicketRequest& req) {
  return ObserveRpc("RepairTicketService.AssignTicket", req.ticket_id(), [&] {
    const auto eta = req.has_estimated_completion() ? util::ProtoToMillis(req.estimated_completion()) : 0;
    return Wrap(ctx_.tickets->AssignTicket(ToContext(req.meta()), req.ticket_id(), req.technician_id(), eta));
  });
}

TicketResponse RepairTicketService::StartTicket(const StartTicketRequest& req) {
  return ObserveRpc("RepairTicketService.StartTicket", req.ticket_id(), [&] {
    return Wrap(ctx_.tickets->StartTicket(ToContext(req.meta()), req.ticket_id()));
  });
}

TicketResponse RepairTicketService::CompleteTicket(const CompleteTicketRequest& req) {
  return ObserveRpc("RepairTicketService.CompleteTicket", req.ticket_id(), [&] {
    core::CompleteTicketRequest in;
    in.ticket_id        = req.ticket_id();
    in.actual_hours     = req.actual_hours();
    for (const auto& part : req.used_parts()) in.used_parts.push_back(FromProto(part));
    in.labor_cost_cents = req.labor_cost_cents();
    if (req.has_parts_cost_cents()) in.parts_cost_cents = req.parts_cost_cents();
    in.repair_notes     = req.repair_notes();
    for (const auto& result : req.test_results()) in.test_results.push_back(FromProto(result));

    return Wrap(ctx_.tickets->CompleteTicket(ToContext(req.meta()), in));
  });
}

TicketResponse RepairTicketService::QualityCheck(const QualityCheckRequest& req) {
  return ObserveRpc("RepairTicketService.QualityCheck", req.ticket_id(), [&] {
    return Wrap(ctx_.tickets->QualityCheck(ToContext(req.meta()), req.ticket_id(), req.approve(), req.notes()));
  });
}

TicketResponse RepairTicketService::CustomerApproval(const CustomerApprovalRequest& req) {
  return ObserveRpc("RepairTicketService.CustomerApproval", req.ticket_id(), [&] {
    return Wrap(ctx_.tickets->CustomerApproval(ToContext(req.meta()), req.ticket_id(), req.approve(), req.notes()));
  });
}

TicketResponse RepairTicketService::GetTicket(const GetTicketRequest& req) {
  return ObserveRpc("RepairTicketService.GetTicket", req.ticket_id(), [&] {
    return Wrap(ctx_.tickets->GetTicket(ToContext(req.meta()), req.ticket_id()));
  });
}

ListTicketsResponse RepairTicketService::ListTickets(const ListTicketsRequest& req) {
  return ObserveRpc("RepairTicketService.ListTickets", req.claim_id(), [&] {
    db::TicketFilter filter;
    filter.status = ParseOptionalField("status", req.status(), warranty::model::ParseTicketStatus);
    if (!req.claim_id().empty()) filter.claim_id = req.claim_id();
    if (!req.technician_id().empty()) filter.technician_id = req.technician_id();

    ListTicketsResponse resp;
    for (const auto& ticket : ctx_.tickets->ListTickets(ToContext(req.meta()), filter, ToPagination(req.page(), req.has_page()))) {
      ToProto(ticket, resp.add_tickets());
    }
    return resp;
  });
}

} // namespace warranty::service
