#include "internal/core/attachment_custodian.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

#include "internal/adapters/signature_scanner.hpp"
#include "support/test_fixtures.hpp"

namespace {

using warranty::core::AttachmentCustodian;
using warranty::core::DetectAttachmentType;
using warranty::core::UploadRequest;
using warranty::model::AttachmentType;
using warranty::model::ClaimStatus;
using warranty::model::ScanStatus;
using warranty::model::TimelineEventType;
using warranty::testing::AgentContext;
using warranty::testing::CustomerContext;
using warranty::testing::Throws;
using warranty::testing::WarrantyHarness;

UploadRequest Photo(const std::string& claim_id, uint64_t size = 200 * 1024) {
  UploadRequest req;
  req.claim_id    = claim_id;
  req.filename    = "screen.jpg";
  req.mime_type   = "IMAGE/JPEG";
  req.size_bytes  = size;
  req.storage_ref = "s3://claims/" + claim_id + "/screen.jpg";
  return req;
}

void TestDetectAttachmentType() {
  assert(DetectAttachmentType("application/pdf", "store-receipt.pdf") == AttachmentType::kReceipt);
  assert(DetectAttachmentType("image/png", "Invoice_March.png") == AttachmentType::kReceipt);
  assert(DetectAttachmentType("image/png", "crack.png") == AttachmentType::kPhoto);
  assert(DetectAttachmentType("video/mp4", "boot-loop.mp4") == AttachmentType::kVideo);
  assert(DetectAttachmentType("text/plain", "log.txt") == AttachmentType::kDocument);
  assert(DetectAttachmentType("application/octet-stream", "clip.MOV") == AttachmentType::kVideo);
  assert(DetectAttachmentType("application/octet-stream", "blob.bin") == AttachmentType::kOther);
}

void TestUploadRecordsPendingScanAndTimeline() {
  WarrantyHarness h;
  auto            claim = h.SubmitClaim("SSW-2024-00000000U1");

  auto record = h.attachments->Upload(CustomerContext(), Photo(claim.claim.id));
  assert(record.claim_id == claim.claim.id);
  assert(record.mime_type == "image/jpeg");
  assert(record.type == AttachmentType::kPhoto);
  assert(record.scan_status == ScanStatus::kPending);
  assert(record.uploaded_by == "cust-alice");

  auto timeline = h.claims->GetTimeline(CustomerContext(), claim.claim.id);
  assert(timeline.size() == 2);
  assert(timeline.back().event_type == TimelineEventType::kAttachmentUploaded);
}

void TestUploadValidation() {
  WarrantyHarness h;
  auto            claim = h.SubmitClaim("SSW-2024-00000000U2");

  UploadRequest bad;
  bad.claim_id  = claim.claim.id;
  bad.mime_type = "application/x-msdownload";
  try {
    h.attachments->Upload(CustomerContext(), bad);
    assert(false);
  } catch (const warranty::util::InvalidArgument& e) {
    assert(e.Violations().size() == 4);
  }

  // Images cap at 5 MiB; documents at 10 MiB.
  assert(Throws<warranty::util::PayloadTooLarge>([&] { h.attachments->Upload(CustomerContext(), Photo(claim.claim.id, (5ULL << 20) + 1)); }));
  auto pdf       = Photo(claim.claim.id, 8ULL << 20);
  pdf.filename   = "manual.pdf";
  pdf.mime_type  = "application/pdf";
  auto document  = h.attachments->Upload(CustomerContext(), pdf);
  assert(document.type == AttachmentType::kDocument);

  assert(Throws<warranty::util::NotFound>([&] { h.attachments->Upload(CustomerContext("cust-bob"), Photo(claim.claim.id)); }));
}

void TestClosedClaimsRefuseUploads() {
  WarrantyHarness h;
  auto            claim = h.SubmitClaim("SSW-2024-00000000U3");
  h.claims->Cancel(CustomerContext(), claim.claim.id, "duplicate report");
  assert(h.claims->GetClaim(AgentContext(), claim.claim.id).claim.status == ClaimStatus::kCancelled);

  assert(Throws<warranty::util::InvalidState>([&] { h.attachments->Upload(CustomerContext(), Photo(claim.claim.id)); }));
}

void TestCustomersOnlySeePassedFiles() {
  WarrantyHarness h;
  auto            claim = h.SubmitClaim("SSW-2024-00000000U4");

  auto clean   = h.attachments->Upload(CustomerContext(), Photo(claim.claim.id));
  auto flagged = h.attachments->Upload(CustomerContext(), Photo(claim.claim.id));
  h.attachments->Upload(CustomerContext(), Photo(claim.claim.id));

  assert(Throws<warranty::util::Forbidden>([&] { h.attachments->RecordScanResult(CustomerContext(), clean.id, true, ""); }));
  h.attachments->RecordScanResult(AgentContext(), clean.id, true, "clean");
  auto failed = h.attachments->RecordScanResult(AgentContext(), flagged.id, false, "eicar signature");
  assert(failed.scan_status == ScanStatus::kFailed);
  assert(failed.scanned_at_ms > 0);

  assert(Throws<warranty::util::InvalidState>([&] { h.attachments->RecordScanResult(AgentContext(), clean.id, false, "late"); }));

  assert(h.attachments->List(AgentContext(), claim.claim.id).size() == 3);
  auto visible = h.attachments->List(CustomerContext(), claim.claim.id);
  assert(visible.size() == 1);
  assert(visible[0].id == clean.id);
  assert(Throws<warranty::util::NotFound>([&] { h.attachments->List(CustomerContext("cust-bob"), claim.claim.id); }));
}

ScanStatus WaitForScan(AttachmentCustodian& custodian, const std::string& claim_id, const std::string& attachment_id) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (std::chrono::steady_clock::now() < deadline) {
    for (const auto& a : custodian.List(AgentContext(), claim_id)) {
      if (a.id == attachment_id && a.scan_status != ScanStatus::kPending) return a.scan_status;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return ScanStatus::kPending;
}

void TestInProcessScannerRecordsVerdicts() {
  WarrantyHarness     h;
  auto                claim = h.SubmitClaim("SSW-2024-00000000U5");
  AttachmentCustodian custodian(h.repository, h.claims, std::make_shared<warranty::adapters::SignatureScanner>(), h.clock);
  custodian.StartScanWorkers(2);

  auto good = custodian.Upload(CustomerContext(), Photo(claim.claim.id));
  assert(WaitForScan(custodian, claim.claim.id, good.id) == ScanStatus::kPassed);

  auto blocked        = Photo(claim.claim.id, 1024);
  blocked.filename    = "notes.txt";
  blocked.mime_type   = "text/plain";
  blocked.storage_ref = "s3://claims/uploads/setup.EXE";
  auto bad            = custodian.Upload(CustomerContext(), blocked);

  assert(WaitForScan(custodian, claim.claim.id, bad.id) == ScanStatus::kFailed);
  custodian.Shutdown();
}

} // namespace

int main() {
  TestDetectAttachmentType();
  TestUploadRecordsPendingScanAndTimeline();
  TestUploadValidation();
  TestClosedClaimsRefuseUploads();
  TestCustomersOnlySeePassedFiles();
  TestInProcessScannerRecordsVerdicts();

  std::cout << "warranty_core_attachment_custodian: pass\n";
  return 0;
}
