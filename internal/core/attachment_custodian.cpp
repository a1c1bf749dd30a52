#include "attachment_custodian.hpp"

#include <algorithm>

#include "db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace warranty::core {

using warranty::model::ScanStatus;

namespace {

constexpr int kScanRecordAttempts = 5;

} // namespace

AttachmentCustodian::AttachmentCustodian(std::shared_ptr<db::Repository> repository, std::shared_ptr<ClaimWorkflow> claims,
                                         std::shared_ptr<AttachmentScanner> scanner, std::shared_ptr<util::Clock> clock, AttachmentOptions options)
    : repository_(std::move(repository)),
      claims_(std::move(claims)),
      scanner_(std::move(scanner)),
      clock_(std::move(clock)),
      rules_(std::move(options)) {
}

AttachmentCustodian::~AttachmentCustodian() {
  Shutdown();
}

void AttachmentCustodian::StartScanWorkers(std::size_t count) {
  if (!scanner_ || scheduler_) return;

  scheduler_ = std::make_shared<attachment::ScanScheduler>();
  for (std::size_t i = 0; i < std::max<std::size_t>(count, 1); ++i) {
    auto worker = std::make_unique<attachment::ScanWorker>(scheduler_, this);
    worker->Start();
    workers_.push_back(std::move(worker));
  }
}

void AttachmentCustodian::Shutdown() {
  if (scheduler_) scheduler_->Shutdown();
  for (auto& worker : workers_) worker->Stop();
  workers_.clear();
}

db::model::AttachmentRecord AttachmentCustodian::Upload(const RequestContext& ctx, const UploadRequest& request) {
  RequireRole(ctx, {kRoleAgent, kRoleTechnician, kRoleCustomer});
  CheckDeadline(ctx, *clock_);

  db::model::AttachmentRecord record;
  try {
    auto tx    = repository_->Begin();
    auto claim = claims_->LoadClaim(*tx, request.claim_id);
    if (!ctx.caller.HasRole(kRoleAgent) && !ctx.caller.HasRole(kRoleTechnician) && claim.customer_id != ctx.caller.actor_id) {
      throw util::NotFound("claim not found: " + request.claim_id);
    }
    if (warranty::model::IsTerminal(claim.status)) {
      throw util::InvalidState("claim " + claim.claim_number + " is closed", std::string(warranty::model::ToString(claim.status)), {});
    }

    record = rules_.Admit(claim.id, request, ctx.caller.actor_id, util::ToUnixMillis(clock_->Now()));

    ThrowIfDbError(repository_->InsertAttachment(*tx, record), "insert attachment");
    claims_->AppendTimeline(*tx, claim.id, warranty::model::TimelineEventType::kAttachmentUploaded,
                            std::string(warranty::model::ToString(record.type)) + " uploaded: " + record.filename, ctx.caller, true);
    tx->Commit();
  } catch (const db::DbError& e) {
    ThrowDbError(e, "upload attachment");
  }

  if (scheduler_) {
    scheduler_->Enqueue(attachment::ScanTask{record.id, record.storage_ref});
  }
  return record;
}

void AttachmentCustodian::DispatchPendingScans(const std::string& claim_id) {
  if (!scheduler_) return;

  std::vector<db::model::AttachmentRecord> rows;
  try {
    auto tx = repository_->Begin();
    rows    = repository_->ListAttachments(*tx, claim_id);
    tx->Rollback();
  } catch (const db::DbError& e) {
    ThrowDbError(e, "list pending attachments");
  }

  for (const auto& row : rows) {
    if (row.scan_status == ScanStatus::kPending) {
      scheduler_->Enqueue(attachment::ScanTask{row.id, row.storage_ref});
    }
  }
}

db::model::AttachmentRecord AttachmentCustodian::RecordScanResult(const RequestContext& ctx, const std::string& attachment_id, bool passed,
                                                                  const std::string& detail) {
  RequireRole(ctx, {kRoleAgent});

  db::model::AttachmentRecord record;
  try {
    auto tx  = repository_->Begin();
    auto row = repository_->GetAttachment(*tx, attachment_id);
    if (!row) throw util::NotFound("attachment not found: " + attachment_id);
    record = *row;
    if (record.scan_status != ScanStatus::kPending) {
      throw util::InvalidState("attachment scan already recorded", std::string(warranty::model::ToString(record.scan_status)), {});
    }

    record.scan_status   = passed ? ScanStatus::kPassed : ScanStatus::kFailed;
    record.scan_detail   = detail;
    record.scanned_at_ms = util::ToUnixMillis(clock_->Now());
    ThrowIfDbError(repository_->UpdateAttachment(*tx, record), "record scan result");
    tx->Commit();
  } catch (const db::DbError& e) {
    ThrowDbError(e, "record scan result");
  }

  if (!passed) {
    WARRANTY_LOG_WARN("attachment failed scan", {observability::StringField("attachment_id", record.id),
                                                  observability::StringField("claim_id", record.claim_id),
                                                  observability::StringField("detail", detail)});
  }
  return record;
}

std::vector<db::model::AttachmentRecord> AttachmentCustodian::List(const RequestContext& ctx, const std::string& claim_id) {
  RequireRole(ctx, {kRoleAgent, kRoleTechnician, kRoleCustomer});

  std::vector<db::model::AttachmentRecord> rows;
  bool                                     customer_view = false;
  try {
    auto tx    = repository_->Begin();
    auto claim = claims_->LoadClaim(*tx, claim_id);
    if (!ctx.caller.HasRole(kRoleAgent) && !ctx.caller.HasRole(kRoleTechnician)) {
      if (claim.customer_id != ctx.caller.actor_id) throw util::NotFound("claim not found: " + claim_id);
      customer_view = true;
    }
    rows = repository_->ListAttachments(*tx, claim.id);
    tx->Rollback();
  } catch (const db::DbError& e) {
    ThrowDbError(e, "list attachments");
  }

  if (customer_view) {
    std::erase_if(rows, [](const auto& a) { return a.scan_status != ScanStatus::kPassed; });
  }
  return rows;
}

void AttachmentCustodian::RunScan(const attachment::ScanTask& task) {
  ScanVerdict verdict;
  try {
    verdict = scanner_->Scan(task.storage_ref);
  } catch (const util::DependencyFailure& e) {
    // Left pending; an external scanner can still report through RecordScanResult.
    WARRANTY_LOG_WARN("scanner unavailable", {observability::StringField("attachment_id", task.attachment_id),
                                              observability::StringField("error", e.what())});
    return;
  }
  // Optimistic stores reject the write when another commit raced it.
  for (int attempt = 1;; ++attempt) {
    try {
      RecordScanResult(SystemContext(), task.attachment_id, verdict.passed, verdict.detail);
      return;
    } catch (const util::Conflict&) {
      if (attempt >= kScanRecordAttempts) throw;
    }
  }
}

} // namespace warranty::core
