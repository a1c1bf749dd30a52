#include "sql_repository.hpp"

#include <limits>

#include "internal/db/sql/json_columns.hpp"
#include "internal/db/sql/sql_queries.hpp"

namespace warranty::db::sql {

namespace {

using warranty::model::ToString;

Param Int(int64_t v) {
  return v;
}

Param Text(std::string_view v) {
  return std::string(v);
}

Param Real(double v) {
  return v;
}

Param Bool(bool v) {
  return int64_t{v ? 1 : 0};
}

void AddPage(std::string& sql, Params& params, const Pagination& page) {
  sql += " LIMIT ? OFFSET ?;";
  params.push_back(Int(page.limit == 0 ? std::numeric_limits<int64_t>::max() : static_cast<int64_t>(page.limit)));
  params.push_back(Int(static_cast<int64_t>(page.offset)));
}

void AddWhere(std::string& sql, const std::vector<std::string>& clauses) {
  for (std::size_t i = 0; i < clauses.size(); ++i) {
    sql += i == 0 ? " WHERE " : " AND ";
    sql += clauses[i];
  }
}

template <typename E, typename ParseFn>
std::optional<E> OptionalEnum(const Row& row, int col, ParseFn parse) {
  auto text = row.GetText(col);
  if (text.empty()) return std::nullopt;
  return parse(text);
}

// ------------------------------------------------------------------
// Barcodes
// ------------------------------------------------------------------

Params BarcodeParams(const model::BarcodeRecord& r) {
  return {Text(r.id),
          Text(r.barcode),
          Text(r.product_id),
          Text(r.batch_id),
          Text(r.storefront_id),
          Text(ToString(r.status)),
          Int(r.warranty_period_months),
          Text(r.customer_id),
          Text(r.customer_email),
          Int(static_cast<int64_t>(r.activated_at_ms)),
          Int(static_cast<int64_t>(r.expiry_at_ms)),
          Text(r.retailer),
          Text(r.invoice_number),
          Text(r.serial_number),
          Int(static_cast<int64_t>(r.purchase_date_ms)),
          Int(r.purchase_price_cents),
          Text(r.revoked_reason),
          Text(r.revoked_by),
          Int(static_cast<int64_t>(r.revoked_at_ms)),
          Int(static_cast<int64_t>(r.created_at_ms)),
          Int(static_cast<int64_t>(r.updated_at_ms))};
}

model::BarcodeRecord ReadBarcode(const Row& row) {
  model::BarcodeRecord r;
  r.id                     = row.GetText(0);
  r.barcode                = row.GetText(1);
  r.product_id             = row.GetText(2);
  r.batch_id               = row.GetText(3);
  r.storefront_id          = row.GetText(4);
  r.status                 = warranty::model::ParseBarcodeStatus(row.GetText(5)).value_or(model::BarcodeStatus::kGenerated);
  r.warranty_period_months = row.GetInt(6);
  r.customer_id            = row.GetText(7);
  r.customer_email         = row.GetText(8);
  r.activated_at_ms        = row.GetU64(9);
  r.expiry_at_ms           = row.GetU64(10);
  r.retailer               = row.GetText(11);
  r.invoice_number         = row.GetText(12);
  r.serial_number          = row.GetText(13);
  r.purchase_date_ms       = row.GetU64(14);
  r.purchase_price_cents   = row.GetInt64(15);
  r.revoked_reason         = row.GetText(16);
  r.revoked_by             = row.GetText(17);
  r.revoked_at_ms          = row.GetU64(18);
  r.created_at_ms          = row.GetU64(19);
  r.updated_at_ms          = row.GetU64(20);
  return r;
}

model::BarcodeEventRecord ReadBarcodeEvent(const Row& row) {
  model::BarcodeEventRecord e;
  e.id         = row.GetText(0);
  e.barcode_id = row.GetText(1);
  e.event      = warranty::model::ParseBarcodeEventType(row.GetText(2)).value_or(model::BarcodeEventType::kStatusUpdated);
  e.actor_id   = row.GetText(3);
  e.detail     = row.GetText(4);
  e.at_ms      = row.GetU64(5);
  return e;
}

// ------------------------------------------------------------------
// Batches
// ------------------------------------------------------------------

Params BatchParams(const model::BatchRecord& r) {
  return {Text(r.id),
          Text(r.batch_number),
          Text(r.product_id),
          Text(r.storefront_id),
          Text(r.created_by),
          Int(r.requested_quantity),
          Int(r.generated_count),
          Int(r.successful_count),
          Int(r.failed_count),
          Int(r.error_count),
          Int(r.collision_count),
          Int(r.retry_count),
          Int(r.max_retries),
          Text(r.prefix),
          Text(r.description),
          Text(EncodeStrings(r.tags)),
          Bool(r.notify_on_complete),
          Int(r.expiry_months),
          Text(ToString(r.priority)),
          Text(ToString(r.status)),
          Int(static_cast<int64_t>(r.entropy_seed)),
          Int(static_cast<int64_t>(r.generation_time_ms)),
          Int(static_cast<int64_t>(r.created_at_ms)),
          Int(static_cast<int64_t>(r.started_at_ms)),
          Int(static_cast<int64_t>(r.completed_at_ms)),
          Int(static_cast<int64_t>(r.cancelled_at_ms)),
          Int(static_cast<int64_t>(r.updated_at_ms)),
          Text(r.cancelled_by),
          Text(r.cancel_reason),
          Text(r.last_error)};
}

model::BatchRecord ReadBatch(const Row& row) {
  model::BatchRecord r;
  r.id                 = row.GetText(0);
  r.batch_number       = row.GetText(1);
  r.product_id         = row.GetText(2);
  r.storefront_id      = row.GetText(3);
  r.created_by         = row.GetText(4);
  r.requested_quantity = static_cast<uint32_t>(row.GetInt64(5));
  r.generated_count    = static_cast<uint32_t>(row.GetInt64(6));
  r.successful_count   = static_cast<uint32_t>(row.GetInt64(7));
  r.failed_count       = static_cast<uint32_t>(row.GetInt64(8));
  r.error_count        = static_cast<uint32_t>(row.GetInt64(9));
  r.collision_count    = static_cast<uint32_t>(row.GetInt64(10));
  r.retry_count        = static_cast<uint32_t>(row.GetInt64(11));
  r.max_retries        = static_cast<uint32_t>(row.GetInt64(12));
  r.prefix             = row.GetText(13);
  r.description        = row.GetText(14);
  r.tags               = DecodeStrings(row.GetText(15));
  r.notify_on_complete = row.GetBool(16);
  r.expiry_months      = row.GetInt(17);
  r.priority           = warranty::model::ParseBatchPriority(row.GetText(18)).value_or(model::BatchPriority::kNormal);
  r.status             = warranty::model::ParseBatchStatus(row.GetText(19)).value_or(model::BatchStatus::kPending);
  r.entropy_seed       = row.GetU64(20);
  r.generation_time_ms = row.GetU64(21);
  r.created_at_ms      = row.GetU64(22);
  r.started_at_ms      = row.GetU64(23);
  r.completed_at_ms    = row.GetU64(24);
  r.cancelled_at_ms    = row.GetU64(25);
  r.updated_at_ms      = row.GetU64(26);
  r.cancelled_by       = row.GetText(27);
  r.cancel_reason      = row.GetText(28);
  r.last_error         = row.GetText(29);
  return r;
}

model::CollisionRecord ReadCollision(const Row& row) {
  model::CollisionRecord c;
  c.id             = row.GetText(0);
  c.batch_id       = row.GetText(1);
  c.candidate      = row.GetText(2);
  c.type           = warranty::model::ParseCollisionType(row.GetText(3)).value_or(model::CollisionType::kDuplicateInStore);
  c.resolution     = warranty::model::ParseCollisionResolution(row.GetText(4)).value_or(model::CollisionResolution::kRegenerated);
  c.slot           = static_cast<uint32_t>(row.GetInt64(5));
  c.attempt        = static_cast<uint32_t>(row.GetInt64(6));
  c.detected_at_ms = row.GetU64(7);
  c.resolved_at_ms = row.GetU64(8);
  return c;
}

// ------------------------------------------------------------------
// Claims
// ------------------------------------------------------------------

std::string OptionalName(const std::optional<model::ClaimStatus>& s) {
  return s ? std::string(ToString(*s)) : std::string();
}

Params ClaimParams(const model::ClaimRecord& r) {
  return {Text(r.id),
          Text(r.claim_number),
          Text(r.barcode_id),
          Text(r.barcode),
          Text(r.customer_id),
          Text(r.product_id),
          Text(r.storefront_id),
          Text(ToString(r.issue_category)),
          Text(r.issue_description),
          Text(ToString(r.severity)),
          Text(ToString(r.priority)),
          Text(ToString(r.status)),
          Text(OptionalName(r.previous_status)),
          Text(OptionalName(r.disputed_from)),
          Int(static_cast<int64_t>(r.status_updated_at_ms)),
          Text(r.status_updated_by),
          Int(static_cast<int64_t>(r.claim_date_ms)),
          Int(static_cast<int64_t>(r.validated_at_ms)),
          Text(r.validated_by),
          Int(static_cast<int64_t>(r.completed_at_ms)),
          Int(static_cast<int64_t>(r.estimated_completion_ms)),
          Int(static_cast<int64_t>(r.actual_completion_ms)),
          Text(r.resolution_type ? std::string(ToString(*r.resolution_type)) : std::string()),
          Text(r.resolution_notes),
          Int(r.repair_cost_cents),
          Int(r.shipping_cost_cents),
          Int(r.replacement_cost_cents),
          Int(r.total_cost_cents),
          Text(r.customer_name),
          Text(r.customer_email),
          Text(r.customer_phone),
          Text(r.pickup_address),
          Text(r.customer_notes),
          Text(r.admin_notes),
          Text(r.rejection_reason),
          Text(r.assigned_technician_id),
          Text(r.replacement_product_id),
          Text(EncodeStrings(r.tags)),
          Int(static_cast<int64_t>(r.version)),
          Int(static_cast<int64_t>(r.created_at_ms)),
          Int(static_cast<int64_t>(r.updated_at_ms))};
}

model::ClaimRecord ReadClaim(const Row& row) {
  using namespace warranty::model;

  model::ClaimRecord r;
  r.id                      = row.GetText(0);
  r.claim_number            = row.GetText(1);
  r.barcode_id              = row.GetText(2);
  r.barcode                 = row.GetText(3);
  r.customer_id             = row.GetText(4);
  r.product_id              = row.GetText(5);
  r.storefront_id           = row.GetText(6);
  r.issue_category          = ParseIssueCategory(row.GetText(7)).value_or(IssueCategory::kOther);
  r.issue_description       = row.GetText(8);
  r.severity                = ParseSeverity(row.GetText(9)).value_or(Severity::kMedium);
  r.priority                = ParsePriority(row.GetText(10)).value_or(Priority::kNormal);
  r.status                  = ParseClaimStatus(row.GetText(11)).value_or(ClaimStatus::kPending);
  r.previous_status         = OptionalEnum<ClaimStatus>(row, 12, ParseClaimStatus);
  r.disputed_from           = OptionalEnum<ClaimStatus>(row, 13, ParseClaimStatus);
  r.status_updated_at_ms    = row.GetU64(14);
  r.status_updated_by       = row.GetText(15);
  r.claim_date_ms           = row.GetU64(16);
  r.validated_at_ms         = row.GetU64(17);
  r.validated_by            = row.GetText(18);
  r.completed_at_ms         = row.GetU64(19);
  r.estimated_completion_ms = row.GetU64(20);
  r.actual_completion_ms    = row.GetU64(21);
  r.resolution_type         = OptionalEnum<ResolutionType>(row, 22, ParseResolutionType);
  r.resolution_notes        = row.GetText(23);
  r.repair_cost_cents       = row.GetInt64(24);
  r.shipping_cost_cents     = row.GetInt64(25);
  r.replacement_cost_cents  = row.GetInt64(26);
  r.total_cost_cents        = row.GetInt64(27);
  r.customer_name           = row.GetText(28);
  r.customer_email          = row.GetText(29);
  r.customer_phone          = row.GetText(30);
  r.pickup_address          = row.GetText(31);
  r.customer_notes          = row.GetText(32);
  r.admin_notes             = row.GetText(33);
  r.rejection_reason        = row.GetText(34);
  r.assigned_technician_id  = row.GetText(35);
  r.replacement_product_id  = row.GetText(36);
  r.tags                    = DecodeStrings(row.GetText(37));
  r.version                 = row.GetU64(38);
  r.created_at_ms           = row.GetU64(39);
  r.updated_at_ms           = row.GetU64(40);
  return r;
}

model::TimelineEventRecord ReadTimelineEvent(const Row& row) {
  model::TimelineEventRecord e;
  e.claim_id            = row.GetText(0);
  e.sequence            = row.GetU64(1);
  e.id                  = row.GetText(2);
  e.event_type          = warranty::model::ParseTimelineEventType(row.GetText(3)).value_or(model::TimelineEventType::kStatusUpdated);
  e.description         = row.GetText(4);
  e.actor_id            = row.GetText(5);
  e.actor_type          = warranty::model::ParseActorType(row.GetText(6)).value_or(model::ActorType::kSystem);
  e.at_ms               = row.GetU64(7);
  e.visible_to_customer = row.GetBool(8);
  return e;
}

// ------------------------------------------------------------------
// Repair tickets
// ------------------------------------------------------------------

Params TicketParams(const model::RepairTicketRecord& r) {
  return {Text(r.id),
          Text(r.ticket_number),
          Text(r.claim_id),
          Text(ToString(r.status)),
          Text(ToString(r.priority)),
          Text(r.assigned_technician_id),
          Int(static_cast<int64_t>(r.assigned_at_ms)),
          Real(r.estimated_hours),
          Real(r.actual_hours),
          Int(static_cast<int64_t>(r.estimated_completion_ms)),
          Int(static_cast<int64_t>(r.actual_completion_ms)),
          Int(static_cast<int64_t>(r.started_at_ms)),
          Text(r.description),
          Text(r.special_instructions),
          Text(r.repair_notes),
          Text(EncodeParts(r.required_parts)),
          Text(EncodeParts(r.used_parts)),
          Text(EncodeTestResults(r.test_results)),
          Int(r.labor_cost_cents),
          Int(r.parts_cost_cents),
          Int(r.total_cost_cents),
          Int(r.estimated_cost_cents),
          Text(ToString(r.quality_check_status)),
          Text(r.quality_checked_by),
          Int(static_cast<int64_t>(r.quality_checked_at_ms)),
          Text(r.quality_notes),
          Bool(r.customer_approval_required),
          Text(ToString(r.customer_approval_status)),
          Int(static_cast<int64_t>(r.customer_approved_at_ms)),
          Text(r.customer_approval_notes),
          Int(r.reopen_count),
          Int(static_cast<int64_t>(r.created_at_ms)),
          Int(static_cast<int64_t>(r.updated_at_ms))};
}

model::RepairTicketRecord ReadTicket(const Row& row) {
  using namespace warranty::model;

  model::RepairTicketRecord r;
  r.id                         = row.GetText(0);
  r.ticket_number              = row.GetText(1);
  r.claim_id                   = row.GetText(2);
  r.status                     = ParseTicketStatus(row.GetText(3)).value_or(TicketStatus::kPending);
  r.priority                   = ParsePriority(row.GetText(4)).value_or(Priority::kNormal);
  r.assigned_technician_id     = row.GetText(5);
  r.assigned_at_ms             = row.GetU64(6);
  r.estimated_hours            = row.GetDouble(7);
  r.actual_hours               = row.GetDouble(8);
  r.estimated_completion_ms    = row.GetU64(9);
  r.actual_completion_ms       = row.GetU64(10);
  r.started_at_ms              = row.GetU64(11);
  r.description                = row.GetText(12);
  r.special_instructions       = row.GetText(13);
  r.repair_notes               = row.GetText(14);
  r.required_parts             = DecodeParts(row.GetText(15));
  r.used_parts                 = DecodeParts(row.GetText(16));
  r.test_results               = DecodeTestResults(row.GetText(17));
  r.labor_cost_cents           = row.GetInt64(18);
  r.parts_cost_cents           = row.GetInt64(19);
  r.total_cost_cents           = row.GetInt64(20);
  r.estimated_cost_cents       = row.GetInt64(21);
  r.quality_check_status       = ParseQualityCheckStatus(row.GetText(22)).value_or(QualityCheckStatus::kPending);
  r.quality_checked_by         = row.GetText(23);
  r.quality_checked_at_ms      = row.GetU64(24);
  r.quality_notes              = row.GetText(25);
  r.customer_approval_required = row.GetBool(26);
  r.customer_approval_status   = ParseCustomerApprovalStatus(row.GetText(27)).value_or(CustomerApprovalStatus::kNotRequired);
  r.customer_approved_at_ms    = row.GetU64(28);
  r.customer_approval_notes    = row.GetText(29);
  r.reopen_count               = static_cast<uint32_t>(row.GetInt64(30));
  r.created_at_ms              = row.GetU64(31);
  r.updated_at_ms              = row.GetU64(32);
  return r;
}

// ------------------------------------------------------------------
// Attachments
// ------------------------------------------------------------------

Params AttachmentParams(const model::AttachmentRecord& r) {
  return {Text(r.id),
          Text(r.claim_id),
          Text(r.filename),
          Text(r.storage_ref),
          Int(static_cast<int64_t>(r.size_bytes)),
          Text(r.mime_type),
          Text(ToString(r.type)),
          Text(ToString(r.scan_status)),
          Text(r.scan_detail),
          Int(static_cast<int64_t>(r.scanned_at_ms)),
          Text(r.uploaded_by),
          Int(static_cast<int64_t>(r.uploaded_at_ms))};
}

model::AttachmentRecord ReadAttachment(const Row& row) {
  model::AttachmentRecord r;
  r.id             = row.GetText(0);
  r.claim_id       = row.GetText(1);
  r.filename       = row.GetText(2);
  r.storage_ref    = row.GetText(3);
  r.size_bytes     = row.GetU64(4);
  r.mime_type      = row.GetText(5);
  r.type           = warranty::model::ParseAttachmentType(row.GetText(6)).value_or(model::AttachmentType::kOther);
  r.scan_status    = warranty::model::ParseScanStatus(row.GetText(7)).value_or(model::ScanStatus::kPending);
  r.scan_detail    = row.GetText(8);
  r.scanned_at_ms  = row.GetU64(9);
  r.uploaded_by    = row.GetText(10);
  r.uploaded_at_ms = row.GetU64(11);
  return r;
}

// UPDATE statements bind every column but the key, then the key, then
// any compare-and-set operand.
Params UpdateParams(Params row, Param extra_guard = nullptr) {
  Param id = row.front();
  row.erase(row.begin());
  row.push_back(std::move(id));
  if (!std::holds_alternative<std::nullptr_t>(extra_guard)) row.push_back(std::move(extra_guard));
  return row;
}

} // namespace

template <typename T, typename Mapper>
std::vector<T> SqlRepository::Select(Transaction& t, const std::string& sql, const Params& params, Mapper map) {
  std::vector<T> rows;
  auto           r = Exec(t).Query(sql, params, [&](const Row& row) { rows.push_back(map(row)); });
  if (!r) throw DbError(r.code, r.message);
  return rows;
}

// ------------------------------------------------------------------
// Barcodes
// ------------------------------------------------------------------

Result SqlRepository::InsertBarcode(Transaction& t, const model::BarcodeRecord& r) {
  return Exec(t).Execute(INSERT_BARCODE, BarcodeParams(r));
}

Result SqlRepository::InsertBarcodes(Transaction& t, const std::vector<model::BarcodeRecord>& rows) {
  for (const auto& r : rows) {
    auto res = Exec(t).Execute(INSERT_BARCODE, BarcodeParams(r));
    if (!res) return res;
  }
  return Result::Ok(rows.size());
}

std::optional<model::BarcodeRecord> SqlRepository::GetBarcode(Transaction& t, const std::string& id) {
  auto rows = Select<model::BarcodeRecord>(t, SELECT_BARCODE, {Text(id)}, ReadBarcode);
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

std::optional<model::BarcodeRecord> SqlRepository::GetBarcodeByValue(Transaction& t, const std::string& barcode) {
  auto rows = Select<model::BarcodeRecord>(t, SELECT_BARCODE_BY_VALUE, {Text(barcode)}, ReadBarcode);
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

bool SqlRepository::BarcodeExists(Transaction& t, const std::string& barcode) {
  return !Select<int>(t, BARCODE_EXISTS, {Text(barcode)}, [](const Row& row) { return row.GetInt(0); }).empty();
}

std::vector<model::BarcodeRecord> SqlRepository::ListBarcodesByBatch(Transaction& t, const std::string& batch_id, const Pagination& page) {
  Params params{Text(batch_id),
                Int(page.limit == 0 ? std::numeric_limits<int64_t>::max() : static_cast<int64_t>(page.limit)),
                Int(static_cast<int64_t>(page.offset))};
  return Select<model::BarcodeRecord>(t, SELECT_BARCODES_BY_BATCH, params, ReadBarcode);
}

std::vector<model::BarcodeRecord> SqlRepository::ListBarcodesByProduct(Transaction& t, const std::string& product_id, const Pagination& page) {
  Params params{Text(product_id),
                Int(page.limit == 0 ? std::numeric_limits<int64_t>::max() : static_cast<int64_t>(page.limit)),
                Int(static_cast<int64_t>(page.offset))};
  return Select<model::BarcodeRecord>(t, SELECT_BARCODES_BY_PRODUCT, params, ReadBarcode);
}

Result SqlRepository::UpdateBarcode(Transaction& t, const model::BarcodeRecord& r, model::BarcodeStatus expected_status) {
  auto res = Exec(t).Execute(UPDATE_BARCODE, UpdateParams(BarcodeParams(r), Text(ToString(expected_status))));
  if (!res) return res;
  if (res.affected == 0) {
    auto exists = Select<int>(t, BARCODE_ID_EXISTS, {Text(r.id)}, [](const Row& row) { return row.GetInt(0); });
    if (exists.empty()) return Result::Err(ErrorCode::NotFound, "barcode not found: " + r.id);
    return Result::Err(ErrorCode::Conflict, "barcode status changed concurrently");
  }
  return res;
}

Result SqlRepository::InsertBarcodeEvent(Transaction& t, const model::BarcodeEventRecord& e) {
  return Exec(t).Execute(INSERT_BARCODE_EVENT, {Text(e.id), Text(e.barcode_id), Text(ToString(e.event)), Text(e.actor_id), Text(e.detail),
                                                Int(static_cast<int64_t>(e.at_ms))});
}

std::vector<model::BarcodeEventRecord> SqlRepository::ListBarcodeEvents(Transaction& t, const std::string& barcode_id) {
  return Select<model::BarcodeEventRecord>(t, SELECT_BARCODE_EVENTS, {Text(barcode_id)}, ReadBarcodeEvent);
}

// ------------------------------------------------------------------
// Batches
// ------------------------------------------------------------------

Result SqlRepository::InsertBatch(Transaction& t, const model::BatchRecord& r) {
  return Exec(t).Execute(INSERT_BATCH, BatchParams(r));
}

std::optional<model::BatchRecord> SqlRepository::GetBatch(Transaction& t, const std::string& id) {
  auto rows = Select<model::BatchRecord>(t, SELECT_BATCH, {Text(id)}, ReadBatch);
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

Result SqlRepository::UpdateBatch(Transaction& t, const model::BatchRecord& r) {
  auto res = Exec(t).Execute(UPDATE_BATCH, UpdateParams(BatchParams(r)));
  if (res && res.affected == 0) return Result::Err(ErrorCode::NotFound, "batch not found: " + r.id);
  return res;
}

std::vector<model::BatchRecord> SqlRepository::ListBatches(Transaction& t, const BatchFilter& f, const Pagination& page) {
  std::string              sql = SELECT_BATCHES;
  std::vector<std::string> where;
  Params                   params;

  if (f.status) {
    where.emplace_back("status=?");
    params.push_back(Text(ToString(*f.status)));
  }
  if (f.priority) {
    where.emplace_back("priority=?");
    params.push_back(Text(ToString(*f.priority)));
  }
  if (f.product_id) {
    where.emplace_back("product_id=?");
    params.push_back(Text(*f.product_id));
  }
  if (f.storefront_id) {
    where.emplace_back("storefront_id=?");
    params.push_back(Text(*f.storefront_id));
  }
  if (f.created_by) {
    where.emplace_back("created_by=?");
    params.push_back(Text(*f.created_by));
  }
  if (f.created_from_ms != 0) {
    where.emplace_back("created_at_ms>=?");
    params.push_back(Int(static_cast<int64_t>(f.created_from_ms)));
  }
  if (f.created_to_ms != 0) {
    where.emplace_back("created_at_ms<=?");
    params.push_back(Int(static_cast<int64_t>(f.created_to_ms)));
  }

  AddWhere(sql, where);
  sql += " ORDER BY created_at_ms DESC, batch_number DESC";
  AddPage(sql, params, page);
  return Select<model::BatchRecord>(t, sql, params, ReadBatch);
}

Result SqlRepository::InsertCollision(Transaction& t, const model::CollisionRecord& c) {
  return Exec(t).Execute(INSERT_COLLISION, {Text(c.id), Text(c.batch_id), Text(c.candidate), Text(ToString(c.type)), Text(ToString(c.resolution)),
                                            Int(c.slot), Int(c.attempt), Int(static_cast<int64_t>(c.detected_at_ms)),
                                            Int(static_cast<int64_t>(c.resolved_at_ms))});
}

std::vector<model::CollisionRecord> SqlRepository::ListCollisions(Transaction& t, const std::string& batch_id, const Pagination& page) {
  Params params{Text(batch_id),
                Int(page.limit == 0 ? std::numeric_limits<int64_t>::max() : static_cast<int64_t>(page.limit)),
                Int(static_cast<int64_t>(page.offset))};
  return Select<model::CollisionRecord>(t, SELECT_COLLISIONS, params, ReadCollision);
}

Result SqlRepository::NextSequence(Transaction& t, const std::string& kind, int32_t year, uint64_t& value) {
  auto res = Exec(t).Execute(BUMP_SEQUENCE, {Text(kind), Int(year)});
  if (!res) return res;

  auto rows = Select<uint64_t>(t, SELECT_SEQUENCE, {Text(kind), Int(year)}, [](const Row& row) { return row.GetU64(0); });
  if (rows.empty()) return Result::Err(ErrorCode::InternalError, "sequence row missing after bump: " + kind);
  value = rows.front();
  return Result::Ok(1);
}

// ------------------------------------------------------------------
// Claims
// ------------------------------------------------------------------

Result SqlRepository::InsertClaim(Transaction& t, const model::ClaimRecord& r) {
  return Exec(t).Execute(INSERT_CLAIM, ClaimParams(r));
}

std::optional<model::ClaimRecord> SqlRepository::GetClaim(Transaction& t, const std::string& id) {
  auto rows = Select<model::ClaimRecord>(t, SELECT_CLAIM, {Text(id)}, ReadClaim);
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

std::optional<model::ClaimRecord> SqlRepository::GetClaimByNumber(Transaction& t, const std::string& claim_number) {
  auto rows = Select<model::ClaimRecord>(t, SELECT_CLAIM_BY_NUMBER, {Text(claim_number)}, ReadClaim);
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

Result SqlRepository::UpdateClaim(Transaction& t, const model::ClaimRecord& r, uint64_t expected_version) {
  auto res = Exec(t).Execute(UPDATE_CLAIM, UpdateParams(ClaimParams(r), Int(static_cast<int64_t>(expected_version))));
  if (!res) return res;
  if (res.affected == 0) {
    auto exists = Select<int>(t, CLAIM_EXISTS, {Text(r.id)}, [](const Row& row) { return row.GetInt(0); });
    if (exists.empty()) return Result::Err(ErrorCode::NotFound, "claim not found: " + r.id);
    return Result::Err(ErrorCode::Conflict, "claim version changed concurrently");
  }
  return res;
}

std::vector<model::ClaimRecord> SqlRepository::ListClaims(Transaction& t, const ClaimFilter& f, const Pagination& page) {
  std::string              sql = SELECT_CLAIMS;
  std::vector<std::string> where;
  Params                   params;

  if (f.status) {
    where.emplace_back("status=?");
    params.push_back(Text(ToString(*f.status)));
  }
  if (f.priority) {
    where.emplace_back("priority=?");
    params.push_back(Text(ToString(*f.priority)));
  }
  if (f.severity) {
    where.emplace_back("severity=?");
    params.push_back(Text(ToString(*f.severity)));
  }
  if (f.customer_id) {
    where.emplace_back("customer_id=?");
    params.push_back(Text(*f.customer_id));
  }
  if (f.technician_id) {
    where.emplace_back("assigned_technician_id=?");
    params.push_back(Text(*f.technician_id));
  }
  if (f.barcode_id) {
    where.emplace_back("barcode_id=?");
    params.push_back(Text(*f.barcode_id));
  }
  if (f.claim_date_from_ms != 0) {
    where.emplace_back("claim_date_ms>=?");
    params.push_back(Int(static_cast<int64_t>(f.claim_date_from_ms)));
  }
  if (f.claim_date_to_ms != 0) {
    where.emplace_back("claim_date_ms<=?");
    params.push_back(Int(static_cast<int64_t>(f.claim_date_to_ms)));
  }

  AddWhere(sql, where);
  sql += " ORDER BY claim_date_ms DESC, claim_number DESC";
  AddPage(sql, params, page);
  return Select<model::ClaimRecord>(t, sql, params, ReadClaim);
}

std::vector<model::ClaimRecord> SqlRepository::ListClaimsByBarcode(Transaction& t, const std::string& barcode_id) {
  return Select<model::ClaimRecord>(t, SELECT_CLAIMS_BY_BARCODE, {Text(barcode_id)}, ReadClaim);
}

Result SqlRepository::DeleteClaim(Transaction& t, const std::string& id) {
  auto res = Exec(t).Execute(DELETE_CLAIM, {Text(id)});
  if (res && res.affected == 0) return Result::Err(ErrorCode::NotFound, "claim not found: " + id);
  return res;
}

// ------------------------------------------------------------------
// Timeline
// ------------------------------------------------------------------

Result SqlRepository::AppendTimelineEvent(Transaction& t, model::TimelineEventRecord& e) {
  std::vector<uint64_t> next;
  auto res = Exec(t).Query(NEXT_TIMELINE_SEQUENCE, {Text(e.claim_id)}, [&](const Row& row) { next.push_back(row.GetU64(0)); });
  if (!res) return res;

  e.sequence = next.empty() ? 1 : next.front();
  return Exec(t).Execute(INSERT_TIMELINE_EVENT, {Text(e.claim_id), Int(static_cast<int64_t>(e.sequence)), Text(e.id), Text(ToString(e.event_type)),
                                                 Text(e.description), Text(e.actor_id), Text(ToString(e.actor_type)),
                                                 Int(static_cast<int64_t>(e.at_ms)), Bool(e.visible_to_customer)});
}

std::vector<model::TimelineEventRecord> SqlRepository::ListTimeline(Transaction& t, const std::string& claim_id) {
  return Select<model::TimelineEventRecord>(t, SELECT_TIMELINE, {Text(claim_id)}, ReadTimelineEvent);
}

// ------------------------------------------------------------------
// Repair tickets
// ------------------------------------------------------------------

Result SqlRepository::InsertTicket(Transaction& t, const model::RepairTicketRecord& r) {
  return Exec(t).Execute(INSERT_TICKET, TicketParams(r));
}

std::optional<model::RepairTicketRecord> SqlRepository::GetTicket(Transaction& t, const std::string& id) {
  auto rows = Select<model::RepairTicketRecord>(t, SELECT_TICKET, {Text(id)}, ReadTicket);
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

Result SqlRepository::UpdateTicket(Transaction& t, const model::RepairTicketRecord& r) {
  auto res = Exec(t).Execute(UPDATE_TICKET, UpdateParams(TicketParams(r)));
  if (res && res.affected == 0) return Result::Err(ErrorCode::NotFound, "ticket not found: " + r.id);
  return res;
}

std::vector<model::RepairTicketRecord> SqlRepository::ListTickets(Transaction& t, const TicketFilter& f, const Pagination& page) {
  std::string              sql = SELECT_TICKETS;
  std::vector<std::string> where;
  Params                   params;

  if (f.status) {
    where.emplace_back("status=?");
    params.push_back(Text(ToString(*f.status)));
  }
  if (f.claim_id) {
    where.emplace_back("claim_id=?");
    params.push_back(Text(*f.claim_id));
  }
  if (f.technician_id) {
    where.emplace_back("assigned_technician_id=?");
    params.push_back(Text(*f.technician_id));
  }

  AddWhere(sql, where);
  sql += " ORDER BY created_at_ms, ticket_number";
  AddPage(sql, params, page);
  return Select<model::RepairTicketRecord>(t, sql, params, ReadTicket);
}

// ------------------------------------------------------------------
// Attachments
// ------------------------------------------------------------------

Result SqlRepository::InsertAttachment(Transaction& t, const model::AttachmentRecord& r) {
  return Exec(t).Execute(INSERT_ATTACHMENT, AttachmentParams(r));
}

std::optional<model::AttachmentRecord> SqlRepository::GetAttachment(Transaction& t, const std::string& id) {
  auto rows = Select<model::AttachmentRecord>(t, SELECT_ATTACHMENT, {Text(id)}, ReadAttachment);
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

Result SqlRepository::UpdateAttachment(Transaction& t, const model::AttachmentRecord& r) {
  auto res = Exec(t).Execute(UPDATE_ATTACHMENT, UpdateParams(AttachmentParams(r)));
  if (res && res.affected == 0) return Result::Err(ErrorCode::NotFound, "attachment not found: " + r.id);
  return res;
}

std::vector<model::AttachmentRecord> SqlRepository::ListAttachments(Transaction& t, const std::string& claim_id) {
  return Select<model::AttachmentRecord>(t, SELECT_ATTACHMENTS, {Text(claim_id)}, ReadAttachment);
}

// ------------------------------------------------------------------
// Idempotency
// ------------------------------------------------------------------

std::optional<model::IdempotencyRecord> SqlRepository::GetIdempotencyKey(Transaction& t, const std::string& scope, const std::string& request_id) {
  auto rows = Select<model::IdempotencyRecord>(t, SELECT_IDEMPOTENCY_KEY, {Text(scope), Text(request_id)}, [](const Row& row) {
    model::IdempotencyRecord r;
    r.scope         = row.GetText(0);
    r.request_id    = row.GetText(1);
    r.result_ref    = row.GetText(2);
    r.created_at_ms = row.GetU64(3);
    return r;
  });
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

Result SqlRepository::PutIdempotencyKey(Transaction& t, const model::IdempotencyRecord& r) {
  return Exec(t).Execute(INSERT_IDEMPOTENCY_KEY, {Text(r.scope), Text(r.request_id), Text(r.result_ref), Int(static_cast<int64_t>(r.created_at_ms))});
}

} // namespace warranty::db::sql
