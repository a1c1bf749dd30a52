#include "internal/core/claim_workflow.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "support/test_fixtures.hpp"

namespace {

using warranty::core::AttachmentUpload;
using warranty::core::ClaimView;
using warranty::core::CompleteTicketRequest;
using warranty::core::CostUpdate;
using warranty::core::CreateTicketRequest;
using warranty::core::SubmitClaimRequest;
using warranty::core::TransitionInput;
using warranty::model::AttachmentType;
using warranty::model::BarcodeStatus;
using warranty::model::ClaimAction;
using warranty::model::ClaimStatus;
using warranty::model::IssueCategory;
using warranty::model::Priority;
using warranty::model::ResolutionType;
using warranty::model::Severity;
using warranty::model::TimelineEventType;
using warranty::testing::AgentContext;
using warranty::testing::CustomerContext;
using warranty::testing::TechnicianContext;
using warranty::testing::Throws;
using warranty::testing::WarrantyHarness;

// validated -> assigned -> in_repair with a completed, QA-approved ticket.
std::string RepairThroughQa(WarrantyHarness& h, const std::string& claim_id, int64_t labor_cents, int64_t parts_cents) {
  h.claims->Validate(AgentContext(), claim_id, "receipt checked");
  h.claims->AssignTechnician(AgentContext(), claim_id, "tech-1", 0, std::nullopt);

  CreateTicketRequest create;
  create.claim_id        = claim_id;
  create.technician_id   = "tech-1";
  create.estimated_hours = 2.0;
  create.description     = "Replace display connector";
  auto ticket            = h.tickets->CreateTicket(AgentContext(), create);

  h.tickets->StartTicket(TechnicianContext("tech-1"), ticket.id);

  CompleteTicketRequest complete;
  complete.ticket_id        = ticket.id;
  complete.actual_hours     = 1.5;
  complete.labor_cost_cents = labor_cents;
  complete.parts_cost_cents = parts_cents;
  complete.repair_notes     = "connector reseated";
  h.tickets->CompleteTicket(TechnicianContext("tech-1"), complete);

  h.tickets->QualityCheck(AgentContext(), ticket.id, true, "");
  return ticket.id;
}

void TestCustomerClaimHappyPath() {
  WarrantyHarness h;
  h.clock->Set(warranty::util::MakeDate(2024, 1, 10));
  h.SeedBarcode("WB-2024-00000001", 24);
  h.Activate("WB-2024-00000001", "cust-alice");

  h.clock->Set(warranty::util::MakeDate(2024, 3, 1));
  SubmitClaimRequest req;
  req.barcode           = "WB-2024-00000001";
  req.issue_category    = IssueCategory::kHardware;
  req.issue_description = "Device no longer charges over USB-C";
  req.severity          = Severity::kMedium;
  auto submitted        = h.claims->Submit(CustomerContext("cust-alice"), req);

  assert(submitted.claim.claim_number == "WAR-2024-000001");
  assert(submitted.claim.status == ClaimStatus::kPending);
  assert(submitted.claim.customer_email == "alice@example.com");
  assert(submitted.derived.display_status == "Submitted");
  assert(submitted.derived.can_cancel);

  const auto id = submitted.claim.id;
  RepairThroughQa(h, id, 80, 20);

  auto repaired = h.claims->Transition(AgentContext(), id, ClaimAction::kRepair, TransitionInput{});
  assert(repaired.claim.status == ClaimStatus::kRepaired);
  assert(repaired.claim.repair_cost_cents == 100);

  h.claims->Transition(AgentContext(), id, ClaimAction::kShip, TransitionInput{});
  h.claims->Transition(AgentContext(), id, ClaimAction::kDeliver, TransitionInput{});
  auto completed = h.claims->Complete(AgentContext(), id, ResolutionType::kRepair, "repaired under warranty");

  assert(completed.claim.status == ClaimStatus::kCompleted);
  assert(completed.claim.previous_status == ClaimStatus::kDelivered);
  assert(completed.claim.total_cost_cents == 100);
  assert(completed.claim.resolution_type == ResolutionType::kRepair);
  assert(completed.claim.completed_at_ms == warranty::util::ToUnixMillis(h.clock->Now()));
  assert(completed.derived.next_actions.empty());
  assert(!completed.derived.can_update);

  auto timeline = h.claims->GetTimeline(AgentContext(), id);
  const std::vector<TimelineEventType> expected = {
      TimelineEventType::kSubmitted,       TimelineEventType::kValidated,       TimelineEventType::kAssigned,
      TimelineEventType::kRepairStarted,   TimelineEventType::kRepairCompleted, TimelineEventType::kQualityApproved,
      TimelineEventType::kRepairCompleted, TimelineEventType::kStatusUpdated,   TimelineEventType::kStatusUpdated,
      TimelineEventType::kCompleted,
  };
  assert(timeline.size() == expected.size());
  for (std::size_t i = 0; i < timeline.size(); ++i) {
    assert(timeline[i].event_type == expected[i]);
    if (i > 0) {
      assert(timeline[i].sequence > timeline[i - 1].sequence);
      assert(timeline[i].at_ms >= timeline[i - 1].at_ms);
    }
  }

  // Resolution is recorded once; a second completion has nowhere to go.
  assert(Throws<warranty::util::InvalidTransition>(
      [&] { h.claims->Complete(AgentContext(), id, ResolutionType::kRefund, "second resolution"); }));

  // Repair resolution leaves the warranty active.
  auto barcode = h.registry->GetBarcode(AgentContext(), "WB-2024-00000001");
  assert(barcode.barcode.status == BarcodeStatus::kActive);
}

void TestReplacementResolutionClaimsTheBarcode() {
  WarrantyHarness h;
  auto            claim = h.SubmitClaim("SSW-2024-00000000R1");
  RepairThroughQa(h, claim.claim.id, 0, 0);

  TransitionInput replace;
  replace.replacement_product_id = "prod-phone-v2";
  auto replaced                  = h.claims->Transition(AgentContext(), claim.claim.id, ClaimAction::kReplace, replace);
  assert(replaced.claim.status == ClaimStatus::kReplaced);
  assert(replaced.claim.replacement_product_id == "prod-phone-v2");

  h.claims->Transition(AgentContext(), claim.claim.id, ClaimAction::kShip, TransitionInput{});
  h.claims->Transition(AgentContext(), claim.claim.id, ClaimAction::kDeliver, TransitionInput{});
  h.claims->Complete(AgentContext(), claim.claim.id, ResolutionType::kReplace, "unit swapped");

  auto barcode = h.registry->GetBarcode(AgentContext(), "SSW-2024-00000000R1");
  assert(barcode.barcode.status == BarcodeStatus::kClaimed);
  assert(!barcode.derived.can_claim);
}

void TestInvalidTransitionLeavesClaimUnchanged() {
  WarrantyHarness h;
  auto            claim = h.SubmitClaim("SSW-2024-00000000B1");

  try {
    h.claims->Transition(AgentContext(), claim.claim.id, ClaimAction::kShip, TransitionInput{});
    assert(false);
  } catch (const warranty::util::InvalidTransition& e) {
    assert(e.CurrentState() == "pending");
    const std::vector<std::string> legal = {"validate", "reject", "cancel", "dispute"};
    assert(e.LegalActions() == legal);
  }

  auto reread = h.claims->GetClaim(AgentContext(), claim.claim.id);
  assert(reread.claim.status == ClaimStatus::kPending);
  assert(reread.claim.version == claim.claim.version);
  assert(h.claims->GetTimeline(AgentContext(), claim.claim.id).size() == 1);
}

void TestExpiredWarrantyBlocksSubmission() {
  WarrantyHarness h;
  h.clock->Set(warranty::util::MakeDate(2023, 1, 10));
  h.SeedBarcode("SSW-2023-00000000E1", 1);
  h.Activate("SSW-2023-00000000E1");

  h.clock->Set(warranty::util::MakeDate(2023, 6, 1));
  SubmitClaimRequest req;
  req.barcode           = "SSW-2023-00000000E1";
  req.issue_description = "Battery swells when charging";
  try {
    h.claims->Submit(CustomerContext(), req);
    assert(false);
  } catch (const warranty::util::PreconditionFailed& e) {
    assert(e.Reason() == "warranty_expired");
  }
}

void TestSubmissionPreconditions() {
  WarrantyHarness h;
  h.SeedBarcode("SSW-2024-00000000G1");

  SubmitClaimRequest req;
  req.barcode           = "SSW-2024-00000000G1";
  req.issue_description = "Speaker crackles at high volume";

  // Not yet activated: nobody owns it, so the caller is not the owner.
  assert(Throws<warranty::util::Forbidden>([&] { h.claims->Submit(CustomerContext(), req); }));

  req.issue_description = "short";
  assert(Throws<warranty::util::InvalidArgument>([&] { h.claims->Submit(CustomerContext(), req); }));

  req.barcode           = "SSW-2024-0000000404";
  req.issue_description = "Speaker crackles at high volume";
  assert(Throws<warranty::util::NotFound>([&] { h.claims->Submit(CustomerContext(), req); }));

  assert(Throws<warranty::util::Forbidden>([&] { h.claims->Submit(AgentContext(), req); }));
}

void TestDuplicateSubmissionConflicts() {
  WarrantyHarness h;
  auto            first = h.SubmitClaim("SSW-2024-00000000D1");

  SubmitClaimRequest again;
  again.barcode           = "SSW-2024-00000000D1";
  again.issue_description = "Still flickering after the first report";
  assert(Throws<warranty::util::Conflict>([&] { h.claims->Submit(CustomerContext(), again); }));

  // A closed claim frees the barcode for a new one.
  h.claims->Cancel(CustomerContext(), first.claim.id, "resolved itself");
  auto second = h.claims->Submit(CustomerContext(), again);
  assert(second.claim.claim_number == "WAR-2024-000002");
}

void TestSubmitReplayReturnsTheSameClaim() {
  WarrantyHarness h;
  h.SeedBarcode("SSW-2024-00000000I1");
  h.Activate("SSW-2024-00000000I1");

  auto ctx       = CustomerContext();
  ctx.request_id = "submit-once";

  SubmitClaimRequest req;
  req.barcode           = "SSW-2024-00000000I1";
  req.issue_description = "Camera fails to focus";

  auto first  = h.claims->Submit(ctx, req);
  auto second = h.claims->Submit(ctx, req);
  assert(first.claim.id == second.claim.id);
  assert(h.notifier->Count("claim_submitted") == 1);
}

AttachmentUpload Upload(const std::string& filename, const std::string& mime, uint64_t size) {
  AttachmentUpload upload;
  upload.filename    = filename;
  upload.mime_type   = mime;
  upload.size_bytes  = size;
  upload.storage_ref = "s3://claims/" + filename;
  return upload;
}

void TestSubmitFilesAttachmentsWithTheClaim() {
  WarrantyHarness h;
  h.SeedBarcode("SSW-2024-00000000A1");
  h.Activate("SSW-2024-00000000A1");

  SubmitClaimRequest req;
  req.barcode           = "SSW-2024-00000000A1";
  req.issue_description = "Hinge cracked after two weeks";
  req.attachments       = {Upload("receipt.pdf", "application/pdf", 120 * 1024), Upload("hinge.jpg", "IMAGE/JPEG", 900 * 1024)};

  auto claim = h.claims->Submit(CustomerContext(), req);

  auto files = h.attachments->List(AgentContext(), claim.claim.id);
  assert(files.size() == 2);
  assert(files[0].type == AttachmentType::kReceipt);
  assert(files[1].type == AttachmentType::kPhoto);
  assert(files[1].mime_type == "image/jpeg");
  for (const auto& f : files) {
    assert(f.scan_status == warranty::model::ScanStatus::kPending);
    assert(f.uploaded_by == "cust-alice");
  }
  // Pending scans stay hidden from the customer.
  assert(h.attachments->List(CustomerContext(), claim.claim.id).empty());

  auto timeline = h.claims->GetTimeline(AgentContext(), claim.claim.id);
  assert(timeline.size() == 3);
  assert(timeline[0].event_type == TimelineEventType::kSubmitted);
  assert(timeline[1].event_type == TimelineEventType::kAttachmentUploaded);
  assert(timeline[2].event_type == TimelineEventType::kAttachmentUploaded);
}

void TestRejectedAttachmentRejectsTheClaim() {
  WarrantyHarness h;
  h.SeedBarcode("SSW-2024-00000000A2");
  h.Activate("SSW-2024-00000000A2");

  SubmitClaimRequest req;
  req.barcode           = "SSW-2024-00000000A2";
  req.issue_description = "Battery swells when charging";

  // The first file is fine; the second is over the 5 MiB image limit.
  req.attachments = {Upload("receipt.pdf", "application/pdf", 64 * 1024), Upload("battery.png", "image/png", (5ULL << 20) + 1)};
  assert(Throws<warranty::util::PayloadTooLarge>([&] { h.claims->Submit(CustomerContext(), req); }));
  assert(h.claims->ListClaims(AgentContext(), {}, {}).empty());

  req.attachments = {Upload("setup.exe", "application/x-msdownload", 64 * 1024)};
  assert(Throws<warranty::util::InvalidArgument>([&] { h.claims->Submit(CustomerContext(), req); }));
  assert(h.claims->ListClaims(AgentContext(), {}, {}).empty());

  // Nothing from the failed attempts survived, including the claim number.
  req.attachments = {Upload("battery.png", "image/png", 2ULL << 20)};
  auto claim      = h.claims->Submit(CustomerContext(), req);
  assert(claim.claim.claim_number == "WAR-2024-000001");
  assert(h.attachments->List(AgentContext(), claim.claim.id).size() == 1);
  assert(h.claims->GetTimeline(AgentContext(), claim.claim.id).size() == 2);
}

void TestTransitionReplayIsNoOp() {
  WarrantyHarness h;
  auto            claim = h.SubmitClaim("SSW-2024-00000000I2");

  auto ctx       = AgentContext();
  ctx.request_id = "validate-1";

  auto first  = h.claims->Transition(ctx, claim.claim.id, ClaimAction::kValidate, TransitionInput{});
  auto second = h.claims->Transition(ctx, claim.claim.id, ClaimAction::kValidate, TransitionInput{});

  assert(first.claim.status == ClaimStatus::kValidated);
  assert(second.claim.status == ClaimStatus::kValidated);
  assert(second.claim.version == first.claim.version);
  assert(h.claims->GetTimeline(AgentContext(), claim.claim.id).size() == 2);
}

void TestStaleVersionConflicts() {
  WarrantyHarness h;
  auto            claim = h.SubmitClaim("SSW-2024-00000000V1");

  TransitionInput stale;
  stale.expected_version = claim.claim.version + 5;
  assert(Throws<warranty::util::Conflict>([&] { h.claims->Transition(AgentContext(), claim.claim.id, ClaimAction::kValidate, stale); }));

  TransitionInput current;
  current.expected_version = claim.claim.version;
  auto validated           = h.claims->Transition(AgentContext(), claim.claim.id, ClaimAction::kValidate, current);
  assert(validated.claim.version == claim.claim.version + 1);
}

void TestRepairRequiresReleasedTicket() {
  WarrantyHarness h;
  auto            claim = h.SubmitClaim("SSW-2024-00000000Q1");
  const auto      id    = claim.claim.id;

  h.claims->Validate(AgentContext(), id, "");
  h.claims->AssignTechnician(AgentContext(), id, "tech-1", 0, Priority::kHigh);

  CreateTicketRequest create;
  create.claim_id        = id;
  create.estimated_hours = 1.0;
  create.description     = "Diagnose charging fault";
  auto ticket            = h.tickets->CreateTicket(AgentContext(), create);
  assert(ticket.assigned_technician_id == "tech-1");
  assert(ticket.priority == Priority::kHigh);

  h.tickets->StartTicket(TechnicianContext("tech-1"), ticket.id);

  CompleteTicketRequest complete;
  complete.ticket_id        = ticket.id;
  complete.labor_cost_cents = 5000;
  h.tickets->CompleteTicket(TechnicianContext("tech-1"), complete);

  // Completed but QA still pending.
  try {
    h.claims->Transition(AgentContext(), id, ClaimAction::kRepair, TransitionInput{});
    assert(false);
  } catch (const warranty::util::PreconditionFailed& e) {
    assert(e.Reason() == "repair_ticket_not_released");
  }
  assert(h.claims->GetClaim(AgentContext(), id).claim.status == ClaimStatus::kInRepair);
}

void TestRolesOnTransitions() {
  WarrantyHarness h;
  auto            claim = h.SubmitClaim("SSW-2024-00000000P1");

  assert(Throws<warranty::util::Forbidden>(
      [&] { h.claims->Transition(CustomerContext(), claim.claim.id, ClaimAction::kValidate, TransitionInput{}); }));
  assert(Throws<warranty::util::Forbidden>([&] { h.claims->Cancel(CustomerContext("cust-bob"), claim.claim.id, "not mine"); }));

  auto cancelled = h.claims->Cancel(CustomerContext(), claim.claim.id, "changed my mind");
  assert(cancelled.claim.status == ClaimStatus::kCancelled);
  assert(cancelled.claim.admin_notes.empty());
}

void TestRejectNeedsReason() {
  WarrantyHarness h;
  auto            claim = h.SubmitClaim("SSW-2024-00000000J1");

  assert(Throws<warranty::util::InvalidArgument>([&] { h.claims->Reject(AgentContext(), claim.claim.id, ""); }));
  auto rejected = h.claims->Reject(AgentContext(), claim.claim.id, "physical damage not covered");
  assert(rejected.claim.status == ClaimStatus::kRejected);
  assert(rejected.claim.rejection_reason == "physical damage not covered");
  assert(rejected.derived.display_status == "Rejected");
}

void TestValidationSetsPriorityFromSeverity() {
  WarrantyHarness h;
  auto            claim = h.SubmitClaim("SSW-2024-00000000S1", "cust-alice", Severity::kCritical);

  auto validated = h.claims->Validate(AgentContext(), claim.claim.id, "");
  assert(validated.claim.priority == Priority::kHigh);
  assert(validated.claim.validated_by == "agent-1");
}

void TestDisputeAndResolve() {
  WarrantyHarness h;
  auto            claim = h.SubmitClaim("SSW-2024-00000000X1");
  const auto      id    = claim.claim.id;
  h.claims->Validate(AgentContext(), id, "");

  auto disputed = h.claims->Transition(CustomerContext(), id, ClaimAction::kDispute, TransitionInput{});
  assert(disputed.claim.status == ClaimStatus::kDisputed);

  TransitionInput wrong;
  wrong.resolve_to = ClaimStatus::kAssigned;
  assert(Throws<warranty::util::InvalidArgument>([&] { h.claims->Transition(AgentContext(), id, ClaimAction::kResolve, wrong); }));

  TransitionInput back;
  back.resolve_to = ClaimStatus::kValidated;
  auto resolved   = h.claims->Transition(AgentContext(), id, ClaimAction::kResolve, back);
  assert(resolved.claim.status == ClaimStatus::kValidated);
  assert(!resolved.claim.disputed_from.has_value());
}

void TestBulkTransitionReportsPerItem() {
  WarrantyHarness h;
  auto            a = h.SubmitClaim("SSW-2024-00000000K1", "cust-alice");
  auto            b = h.SubmitClaim("SSW-2024-00000000K2", "cust-bob");

  auto results = h.claims->BulkTransition(AgentContext(), {a.claim.id, b.claim.id, "WAR-2024-999999"}, ClaimAction::kValidate,
                                          TransitionInput{});
  assert(results.size() == 3);
  assert(results[0].ok && results[1].ok);
  assert(!results[2].ok);
  assert(results[2].error_kind == "not_found");

  assert(Throws<warranty::util::InvalidArgument>([&] { h.claims->BulkTransition(AgentContext(), {}, ClaimAction::kValidate, TransitionInput{}); }));
}

void TestCostsAndNotes() {
  WarrantyHarness h;
  auto            claim = h.SubmitClaim("SSW-2024-00000000C1");
  const auto      id    = claim.claim.id;

  CostUpdate negative;
  negative.shipping_cost_cents = -1;
  assert(Throws<warranty::util::InvalidArgument>([&] { h.claims->UpdateCosts(AgentContext(), id, negative); }));

  CostUpdate update;
  update.repair_cost_cents   = 500;
  update.shipping_cost_cents = 200;
  auto costed                = h.claims->UpdateCosts(AgentContext(), id, update);
  assert(costed.claim.total_cost_cents == 700);

  h.claims->AddNote(AgentContext(), id, "internal: check supplier batch", false);
  auto own = h.claims->AddNote(CustomerContext(), id, "It happens mostly at night", false);
  assert(own.visible_to_customer);
  h.claims->RequestInfo(AgentContext(), id, "Please upload the receipt");

  auto staff    = h.claims->GetTimeline(AgentContext(), id);
  auto customer = h.claims->GetTimeline(CustomerContext(), id);
  assert(staff.size() == 4);
  assert(customer.size() == 3);
  assert(Throws<warranty::util::NotFound>([&] { h.claims->GetTimeline(CustomerContext("cust-bob"), id); }));
}

void TestListClaimsScopesCustomers() {
  WarrantyHarness h;
  auto alice = h.SubmitClaim("SSW-2024-00000000L1", "cust-alice");
  h.SubmitClaim("SSW-2024-00000000L2", "cust-bob");

  TransitionInput validate;
  validate.notes = "supplier lot 7 suspected";
  h.claims->Transition(AgentContext(), alice.claim.id, ClaimAction::kValidate, validate);
  assert(h.claims->GetClaim(AgentContext(), alice.claim.id).claim.admin_notes == "supplier lot 7 suspected");
  assert(h.claims->GetClaim(CustomerContext(), alice.claim.id).claim.admin_notes.empty());
  assert(h.claims->ListClaims(CustomerContext(), {}, {})[0].claim.admin_notes.empty());

  assert(h.claims->ListClaims(AgentContext(), {}, {}).size() == 2);
  auto mine = h.claims->ListClaims(CustomerContext("cust-bob"), {}, {});
  assert(mine.size() == 1);
  assert(mine[0].claim.customer_id == "cust-bob");
}

} // namespace

int main() {
  TestCustomerClaimHappyPath();
  TestReplacementResolutionClaimsTheBarcode();
  TestInvalidTransitionLeavesClaimUnchanged();
  TestExpiredWarrantyBlocksSubmission();
  TestSubmissionPreconditions();
  TestDuplicateSubmissionConflicts();
  TestSubmitReplayReturnsTheSameClaim();
  TestSubmitFilesAttachmentsWithTheClaim();
  TestRejectedAttachmentRejectsTheClaim();
  TestTransitionReplayIsNoOp();
  TestStaleVersionConflicts();
  TestRepairRequiresReleasedTicket();
  TestRolesOnTransitions();
  TestRejectNeedsReason();
  TestValidationSetsPriorityFromSeverity();
  TestDisputeAndResolve();
  TestBulkTransitionReportsPerItem();
  TestCostsAndNotes();
  TestListClaimsScopesCustomers();

  std::cout << "warranty_core_claim_workflow: pass\n";
  return 0;
}
