#include "internal/core/repair_ticket_engine.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "support/test_fixtures.hpp"

namespace {

using warranty::core::CompleteTicketRequest;
using warranty::core::CreateTicketRequest;
using warranty::core::TransitionInput;
using warranty::db::model::PartUsage;
using warranty::model::ClaimAction;
using warranty::model::ClaimStatus;
using warranty::model::CustomerApprovalStatus;
using warranty::model::QualityCheckStatus;
using warranty::model::TicketStatus;
using warranty::model::TimelineEventType;
using warranty::testing::AgentContext;
using warranty::testing::CustomerContext;
using warranty::testing::TechnicianContext;
using warranty::testing::Throws;
using warranty::testing::WarrantyHarness;

std::string AssignedClaim(WarrantyHarness& h, const std::string& barcode) {
  auto claim = h.SubmitClaim(barcode);
  h.claims->Validate(AgentContext(), claim.claim.id, "");
  h.claims->AssignTechnician(AgentContext(), claim.claim.id, "tech-1", 0, std::nullopt);
  return claim.claim.id;
}

CreateTicketRequest TicketFor(const std::string& claim_id) {
  CreateTicketRequest req;
  req.claim_id        = claim_id;
  req.technician_id   = "tech-1";
  req.estimated_hours = 3.0;
  req.description     = "Swap the battery module";
  return req;
}

void TestCreateTicketValidation() {
  WarrantyHarness h;
  auto            pending = h.SubmitClaim("SSW-2024-00000000T1");

  CreateTicketRequest bad;
  bad.claim_id        = pending.claim.id;
  bad.estimated_hours = 0.0;
  bad.description     = "short";
  bad.required_parts  = {PartUsage{"", "P-1", 1, 100}};
  try {
    h.tickets->CreateTicket(AgentContext(), bad);
    assert(false);
  } catch (const warranty::util::InvalidArgument& e) {
    assert(e.Violations().size() == 3);
  }

  // Tickets open on assigned claims only.
  assert(Throws<warranty::util::InvalidState>([&] { h.tickets->CreateTicket(AgentContext(), TicketFor(pending.claim.id)); }));
  assert(Throws<warranty::util::Forbidden>([&] { h.tickets->CreateTicket(TechnicianContext(), TicketFor(pending.claim.id)); }));
}

void TestOneLiveTicketPerClaim() {
  WarrantyHarness h;
  const auto      claim_id = AssignedClaim(h, "SSW-2024-00000000T2");

  auto ticket = h.tickets->CreateTicket(AgentContext(), TicketFor(claim_id));
  assert(ticket.ticket_number == "RPR-2024-000001");
  assert(ticket.status == TicketStatus::kAssigned);
  assert(ticket.assigned_technician_id == "tech-1");

  assert(Throws<warranty::util::Conflict>([&] { h.tickets->CreateTicket(AgentContext(), TicketFor(claim_id)); }));
}

void TestOnlyAssignedTechnicianWorksTheTicket() {
  WarrantyHarness h;
  const auto      claim_id = AssignedClaim(h, "SSW-2024-00000000T3");
  auto            ticket   = h.tickets->CreateTicket(AgentContext(), TicketFor(claim_id));

  assert(Throws<warranty::util::Forbidden>([&] { h.tickets->StartTicket(TechnicianContext("tech-2"), ticket.id); }));

  auto started = h.tickets->StartTicket(TechnicianContext("tech-1"), ticket.id);
  assert(started.status == TicketStatus::kInProgress);
  assert(started.started_at_ms > 0);
  assert(h.claims->GetClaim(AgentContext(), claim_id).claim.status == ClaimStatus::kInRepair);

  assert(Throws<warranty::util::InvalidState>([&] { h.tickets->StartTicket(TechnicianContext("tech-1"), ticket.id); }));
}

void TestCompletionTotalsLaborAndParts() {
  WarrantyHarness h;
  const auto      claim_id = AssignedClaim(h, "SSW-2024-00000000T4");
  auto            ticket   = h.tickets->CreateTicket(AgentContext(), TicketFor(claim_id));
  h.tickets->StartTicket(TechnicianContext(), ticket.id);

  CompleteTicketRequest negative;
  negative.ticket_id        = ticket.id;
  negative.labor_cost_cents = -5;
  assert(Throws<warranty::util::InvalidArgument>([&] { h.tickets->CompleteTicket(TechnicianContext(), negative); }));

  CompleteTicketRequest complete;
  complete.ticket_id        = ticket.id;
  complete.actual_hours     = 2.5;
  complete.labor_cost_cents = 4000;
  complete.used_parts       = {PartUsage{"battery", "BAT-9", 2, 1500}};
  auto done                 = h.tickets->CompleteTicket(TechnicianContext(), complete);

  assert(done.status == TicketStatus::kCompleted);
  assert(done.parts_cost_cents == 3000);
  assert(done.total_cost_cents == 7000);
  assert(done.quality_check_status == QualityCheckStatus::kPending);
  assert(done.actual_completion_ms == warranty::util::ToUnixMillis(h.clock->Now()));

  auto timeline = h.claims->GetTimeline(CustomerContext(), claim_id);
  assert(timeline.back().event_type == TimelineEventType::kRepairCompleted);
  assert(timeline.back().actor_id == "tech-1");
  assert(timeline.back().at_ms >= timeline[timeline.size() - 2].at_ms);
}

void TestQualityRejectReopensTicket() {
  WarrantyHarness h;
  const auto      claim_id = AssignedClaim(h, "SSW-2024-00000000T5");
  auto            ticket   = h.tickets->CreateTicket(AgentContext(), TicketFor(claim_id));
  h.tickets->StartTicket(TechnicianContext(), ticket.id);

  CompleteTicketRequest complete;
  complete.ticket_id        = ticket.id;
  complete.labor_cost_cents = 2000;
  h.tickets->CompleteTicket(TechnicianContext(), complete);

  assert(Throws<warranty::util::InvalidArgument>([&] { h.tickets->QualityCheck(AgentContext(), ticket.id, false, ""); }));

  const auto before   = h.claims->GetTimeline(AgentContext(), claim_id).size();
  auto       rejected = h.tickets->QualityCheck(AgentContext(), ticket.id, false, "still flickers under load");
  assert(rejected.status == TicketStatus::kInProgress);
  assert(rejected.quality_check_status == QualityCheckStatus::kRejected);
  assert(rejected.total_cost_cents == 0);
  assert(rejected.reopen_count == 1);
  assert(rejected.quality_checked_by == "agent-1");

  // The QA note is staff-only.
  assert(h.claims->GetTimeline(AgentContext(), claim_id).size() == before + 1);
  assert(h.claims->GetTimeline(AgentContext(), claim_id).back().event_type == TimelineEventType::kStatusUpdated);
  assert(!h.claims->GetTimeline(AgentContext(), claim_id).back().visible_to_customer);

  // Nothing to check until the technician completes again.
  assert(Throws<warranty::util::InvalidState>([&] { h.tickets->QualityCheck(AgentContext(), ticket.id, true, ""); }));

  complete.labor_cost_cents = 2600;
  auto again                = h.tickets->CompleteTicket(TechnicianContext(), complete);
  assert(again.quality_check_status == QualityCheckStatus::kPending);
  assert(again.total_cost_cents == 2600);

  auto approved = h.tickets->QualityCheck(AgentContext(), ticket.id, true, "");
  assert(approved.quality_check_status == QualityCheckStatus::kApproved);
  assert(approved.reopen_count == 1);

  // Reject note, second completion and approval, in order.
  auto timeline = h.claims->GetTimeline(AgentContext(), claim_id);
  assert(timeline.size() == before + 3);
  assert(timeline[before + 1].event_type == TimelineEventType::kRepairCompleted);
  assert(timeline[before + 2].event_type == TimelineEventType::kQualityApproved);
  assert(timeline[before + 2].visible_to_customer);
  assert(timeline[before + 2].at_ms >= timeline[before + 1].at_ms);

  auto repaired = h.claims->Transition(AgentContext(), claim_id, ClaimAction::kRepair, TransitionInput{});
  assert(repaired.claim.repair_cost_cents == 2600);
}

void TestCostOverrunNeedsCustomerApproval() {
  WarrantyHarness h;
  const auto      claim_id = AssignedClaim(h, "SSW-2024-00000000T6");

  auto create                 = TicketFor(claim_id);
  create.estimated_cost_cents = 10000;
  auto ticket                 = h.tickets->CreateTicket(AgentContext(), create);
  h.tickets->StartTicket(TechnicianContext(), ticket.id);

  CompleteTicketRequest complete;
  complete.ticket_id        = ticket.id;
  complete.labor_cost_cents = 9000;
  complete.parts_cost_cents = 3500;
  auto done                 = h.tickets->CompleteTicket(TechnicianContext(), complete);
  assert(done.customer_approval_required);
  assert(done.customer_approval_status == CustomerApprovalStatus::kPending);

  h.tickets->QualityCheck(AgentContext(), ticket.id, true, "");
  try {
    h.claims->Transition(AgentContext(), claim_id, ClaimAction::kRepair, TransitionInput{});
    assert(false);
  } catch (const warranty::util::PreconditionFailed& e) {
    assert(e.Reason() == "repair_ticket_not_released");
  }

  assert(Throws<warranty::util::NotFound>([&] { h.tickets->CustomerApproval(CustomerContext("cust-bob"), ticket.id, true, ""); }));

  auto approved = h.tickets->CustomerApproval(CustomerContext("cust-alice"), ticket.id, true, "go ahead");
  assert(approved.customer_approval_status == CustomerApprovalStatus::kApproved);
  assert(h.claims->GetTimeline(CustomerContext(), claim_id).back().event_type == TimelineEventType::kCustomerApproved);

  assert(Throws<warranty::util::InvalidState>([&] { h.tickets->CustomerApproval(CustomerContext(), ticket.id, true, ""); }));

  auto repaired = h.claims->Transition(AgentContext(), claim_id, ClaimAction::kRepair, TransitionInput{});
  assert(repaired.claim.status == ClaimStatus::kRepaired);
  assert(repaired.claim.repair_cost_cents == 12500);
}

void TestDeclinedApprovalReturnsTicketForRework() {
  WarrantyHarness h;
  const auto      claim_id = AssignedClaim(h, "SSW-2024-0000000T10");

  auto create                 = TicketFor(claim_id);
  create.estimated_cost_cents = 10000;
  auto ticket                 = h.tickets->CreateTicket(AgentContext(), create);
  h.tickets->StartTicket(TechnicianContext(), ticket.id);

  CompleteTicketRequest complete;
  complete.ticket_id        = ticket.id;
  complete.labor_cost_cents = 15000;
  h.tickets->CompleteTicket(TechnicianContext(), complete);
  h.tickets->QualityCheck(AgentContext(), ticket.id, true, "");

  auto declined = h.tickets->CustomerApproval(CustomerContext(), ticket.id, false, "too expensive");
  assert(declined.customer_approval_status == CustomerApprovalStatus::kRejected);
  assert(declined.status == TicketStatus::kInProgress);
  assert(declined.quality_check_status == QualityCheckStatus::kPending);
  assert(declined.total_cost_cents == 0);
  assert(declined.reopen_count == 1);
  assert(h.claims->GetTimeline(CustomerContext(), claim_id).back().event_type == TimelineEventType::kNoteAdded);
  assert(h.claims->GetClaim(AgentContext(), claim_id).claim.status == ClaimStatus::kInRepair);

  // The revised repair fits the estimate but still needs the customer's yes.
  complete.labor_cost_cents = 9000;
  auto revised              = h.tickets->CompleteTicket(TechnicianContext(), complete);
  assert(revised.total_cost_cents == 9000);
  assert(revised.customer_approval_status == CustomerApprovalStatus::kPending);
  h.tickets->QualityCheck(AgentContext(), ticket.id, true, "");
  assert(Throws<warranty::util::PreconditionFailed>(
      [&] { h.claims->Transition(AgentContext(), claim_id, ClaimAction::kRepair, TransitionInput{}); }));

  h.tickets->CustomerApproval(CustomerContext(), ticket.id, true, "");
  auto repaired = h.claims->Transition(AgentContext(), claim_id, ClaimAction::kRepair, TransitionInput{});
  assert(repaired.claim.status == ClaimStatus::kRepaired);
  assert(repaired.claim.repair_cost_cents == 9000);
}

void TestOverrunWithinToleranceNeedsNoApproval() {
  WarrantyHarness h;
  const auto      claim_id = AssignedClaim(h, "SSW-2024-00000000T7");

  auto create                 = TicketFor(claim_id);
  create.estimated_cost_cents = 10000;
  auto ticket                 = h.tickets->CreateTicket(AgentContext(), create);
  h.tickets->StartTicket(TechnicianContext(), ticket.id);

  CompleteTicketRequest complete;
  complete.ticket_id        = ticket.id;
  complete.labor_cost_cents = 12000;
  auto done                 = h.tickets->CompleteTicket(TechnicianContext(), complete);
  assert(!done.customer_approval_required);
  assert(done.customer_approval_status == CustomerApprovalStatus::kNotRequired);
}

void TestClaimStartOpensTicket() {
  WarrantyHarness h;
  const auto      claim_id = AssignedClaim(h, "SSW-2024-00000000T8");

  auto started = h.claims->Transition(AgentContext(), claim_id, ClaimAction::kStart, TransitionInput{});
  assert(started.claim.status == ClaimStatus::kInRepair);

  warranty::db::TicketFilter filter;
  filter.claim_id = claim_id;
  auto tickets    = h.tickets->ListTickets(AgentContext(), filter, {});
  assert(tickets.size() == 1);
  assert(tickets[0].status == TicketStatus::kInProgress);
  assert(tickets[0].assigned_technician_id == "tech-1");

  // Technicians only see their own queue.
  assert(h.tickets->ListTickets(TechnicianContext("tech-1"), {}, {}).size() == 1);
  assert(h.tickets->ListTickets(TechnicianContext("tech-2"), {}, {}).empty());
  assert(Throws<warranty::util::Forbidden>([&] { h.tickets->ListTickets(CustomerContext(), {}, {}); }));
}

void TestReassignKeepsClaimInStep() {
  WarrantyHarness h;
  const auto      claim_id = AssignedClaim(h, "SSW-2024-00000000T9");
  auto            ticket   = h.tickets->CreateTicket(AgentContext(), TicketFor(claim_id));

  auto reassigned = h.tickets->AssignTicket(AgentContext(), ticket.id, "tech-2", 0);
  assert(reassigned.assigned_technician_id == "tech-2");
  assert(h.claims->GetClaim(AgentContext(), claim_id).claim.assigned_technician_id == "tech-2");

  assert(Throws<warranty::util::InvalidArgument>([&] { h.tickets->AssignTicket(AgentContext(), ticket.id, "", 0); }));
  assert(Throws<warranty::util::NotFound>([&] { h.tickets->GetTicket(AgentContext(), warranty::util::NewId()); }));
}

void TestReassignWhileInProgress() {
  WarrantyHarness h;
  const auto      claim_id = AssignedClaim(h, "SSW-2024-0000000T11");
  auto            ticket   = h.tickets->CreateTicket(AgentContext(), TicketFor(claim_id));
  auto            started  = h.tickets->StartTicket(TechnicianContext("tech-1"), ticket.id);

  auto swapped = h.tickets->AssignTicket(AgentContext(), ticket.id, "tech-2", 0);
  assert(swapped.status == TicketStatus::kInProgress);
  assert(swapped.assigned_technician_id == "tech-2");
  assert(swapped.started_at_ms == started.started_at_ms);
  assert(h.claims->GetClaim(AgentContext(), claim_id).claim.assigned_technician_id == "tech-2");
  assert(h.claims->GetClaim(AgentContext(), claim_id).claim.status == ClaimStatus::kInRepair);

  // The new technician finishes the work; the old one is locked out.
  CompleteTicketRequest complete;
  complete.ticket_id        = ticket.id;
  complete.labor_cost_cents = 1000;
  assert(Throws<warranty::util::Forbidden>([&] { h.tickets->CompleteTicket(TechnicianContext("tech-1"), complete); }));
  auto done = h.tickets->CompleteTicket(TechnicianContext("tech-2"), complete);
  assert(done.status == TicketStatus::kCompleted);

  // Completed work is no longer reassignable.
  assert(Throws<warranty::util::InvalidState>([&] { h.tickets->AssignTicket(AgentContext(), ticket.id, "tech-3", 0); }));
}

} // namespace

int main() {
  TestCreateTicketValidation();
  TestOneLiveTicketPerClaim();
  TestOnlyAssignedTechnicianWorksTheTicket();
  TestCompletionTotalsLaborAndParts();
  TestQualityRejectReopensTicket();
  TestCostOverrunNeedsCustomerApproval();
  TestDeclinedApprovalReturnsTicketForRework();
  TestOverrunWithinToleranceNeedsNoApproval();
  TestClaimStartOpensTicket();
  TestReassignKeepsClaimInStep();
  TestReassignWhileInProgress();

  std::cout << "warranty_core_repair_ticket_engine: pass\n";
  return 0;
}
