#include "warranty_registry.hpp"

#include <algorithm>

#include "db_errors.hpp"
#include "identifier_generator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace warranty::core {

using warranty::model::BarcodeEventType;
using warranty::model::BarcodeStatus;

namespace {

constexpr std::size_t kMaxMetadataLength = 255;

std::string FormatPeriod(const db::model::BarcodeRecord& b) {
  if (b.warranty_period_months > 0) {
    return std::to_string(b.warranty_period_months) + " months";
  }
  if (b.activated_at_ms > 0 && b.expiry_at_ms > b.activated_at_ms) {
    return std::to_string((b.expiry_at_ms - b.activated_at_ms) / 86400000ULL) + " days";
  }
  return {};
}

void CheckLength(std::vector<util::FieldViolation>& violations, const char* field, const std::string& value) {
  if (value.size() > kMaxMetadataLength) {
    violations.push_back({field, "must be at most 255 characters", value.substr(0, 32)});
  }
}

} // namespace

WarrantyDerived Derive(const db::model::BarcodeRecord& barcode, util::TimePoint now) {
  WarrantyDerived d;
  d.effective_status = barcode.status;
  d.warranty_period  = FormatPeriod(barcode);
  d.qr_payload       = std::string(kQrPayloadBase) + barcode.barcode;

  if (barcode.expiry_at_ms > 0) {
    const auto expiry = util::FromUnixMillis(barcode.expiry_at_ms);
    d.is_expired      = expiry < now;
    d.days_remaining  = d.is_expired ? 0 : util::DaysBetween(now, expiry);
  }
  if (barcode.status == BarcodeStatus::kActive && d.is_expired) {
    d.effective_status = BarcodeStatus::kExpired;
  }
  d.can_claim = barcode.status == BarcodeStatus::kActive && !d.is_expired;
  return d;
}

WarrantyRegistry::WarrantyRegistry(std::shared_ptr<db::Repository> repository, std::shared_ptr<CustomerDirectory> customers,
                                   std::shared_ptr<util::Clock> clock)
    : repository_(std::move(repository)), customers_(std::move(customers)), clock_(std::move(clock)) {
}

WarrantyView WarrantyRegistry::View(const db::model::BarcodeRecord& record) const {
  return WarrantyView{record, Derive(record, clock_->Now())};
}

std::optional<db::model::BarcodeRecord> WarrantyRegistry::Find(db::Transaction& tx, const std::string& barcode_ref) {
  if (util::IsUUID(barcode_ref)) {
    if (auto row = repository_->GetBarcode(tx, barcode_ref)) return row;
  }
  return repository_->GetBarcodeByValue(tx, barcode_ref);
}

void WarrantyRegistry::AppendEvent(db::Transaction& tx, const std::string& barcode_id, BarcodeEventType event, const std::string& actor_id,
                                   const std::string& detail, uint64_t at_ms) {
  db::model::BarcodeEventRecord e;
  e.id         = util::NewId();
  e.barcode_id = barcode_id;
  e.event      = event;
  e.actor_id   = actor_id;
  e.detail     = detail;
  e.at_ms      = at_ms;
  ThrowIfDbError(repository_->InsertBarcodeEvent(tx, e), "append barcode event");
}

WarrantyView WarrantyRegistry::Activate(const RequestContext& ctx, const ActivationRequest& request) {
  RequireRole(ctx, {kRoleCustomer, kRoleAgent});
  CheckDeadline(ctx, *clock_);

  const auto now    = clock_->Now();
  const auto now_ms = util::ToUnixMillis(now);

  std::string customer_id = request.customer_id;
  if (customer_id.empty() && ctx.caller.actor_type == warranty::model::ActorType::kCustomer) {
    customer_id = ctx.caller.actor_id;
  }

  std::vector<util::FieldViolation> violations;
  if (!IsWellFormedBarcode(request.barcode)) {
    violations.push_back({"barcode", "malformed barcode", request.barcode});
  }
  if (customer_id.empty()) {
    violations.push_back({"customer_id", "is required", ""});
  }
  if (request.purchase_date_ms > now_ms) {
    violations.push_back({"purchase_date", "must not be in the future", std::to_string(request.purchase_date_ms)});
  }
  if (request.purchase_price_cents && *request.purchase_price_cents < 0) {
    violations.push_back({"purchase_price", "must not be negative", std::to_string(*request.purchase_price_cents)});
  }
  CheckLength(violations, "retailer", request.retailer);
  CheckLength(violations, "invoice_number", request.invoice_number);
  CheckLength(violations, "serial_number", request.serial_number);
  if (!violations.empty()) {
    throw util::InvalidArgument("invalid activation request", std::move(violations));
  }

  if (!ctx.caller.HasRole(kRoleAgent) && customer_id != ctx.caller.actor_id) {
    throw util::Forbidden("customers may only activate warranties for themselves");
  }

  std::string email = request.customer_email;
  if (email.empty() && customers_) {
    if (auto customer = customers_->LookupById(customer_id)) email = customer->email;
  }

  db::model::BarcodeRecord record;
  try {
    auto tx  = repository_->Begin();
    auto row = repository_->GetBarcodeByValue(*tx, request.barcode);
    if (!row) throw util::NotFound("barcode not found: " + request.barcode);
    record = *row;

    if (record.status == BarcodeStatus::kRevoked) {
      throw util::PreconditionFailed("barcode_revoked", "barcode has been revoked");
    }
    if (record.status != BarcodeStatus::kGenerated || record.activated_at_ms != 0) {
      throw util::Conflict("barcode already activated: " + request.barcode);
    }

    record.status               = BarcodeStatus::kActive;
    record.customer_id          = customer_id;
    record.customer_email       = email;
    record.activated_at_ms      = now_ms;
    record.expiry_at_ms         = util::ToUnixMillis(util::AddMonths(now, record.warranty_period_months));
    record.retailer             = request.retailer;
    record.invoice_number       = request.invoice_number;
    record.serial_number        = request.serial_number;
    record.purchase_date_ms     = request.purchase_date_ms;
    record.purchase_price_cents = request.purchase_price_cents.value_or(0);
    record.updated_at_ms        = now_ms;

    auto result = repository_->UpdateBarcode(*tx, record, BarcodeStatus::kGenerated);
    if (result.code == db::ErrorCode::Conflict) {
      throw util::Conflict("barcode already activated: " + request.barcode);
    }
    ThrowIfDbError(result, "activate barcode");
    AppendEvent(*tx, record.id, BarcodeEventType::kActivated, ctx.caller.actor_id, "customer " + customer_id, now_ms);
    tx->Commit();
  } catch (const db::DbError& e) {
    if (e.Code() == db::ErrorCode::Conflict) throw util::Conflict("barcode already activated: " + request.barcode);
    ThrowDbError(e, "activate barcode");
  }

  WARRANTY_LOG_INFO("warranty activated", {observability::StringField("barcode", record.barcode),
                                           observability::StringField("customer_id", customer_id),
                                           observability::IntField("period_months", record.warranty_period_months)});
  return View(record);
}

WarrantyView WarrantyRegistry::Revoke(const RequestContext& ctx, const std::string& barcode_ref, const std::string& reason) {
  RequireRole(ctx, {kRoleAdmin});
  CheckDeadline(ctx, *clock_);

  if (reason.empty()) {
    throw util::InvalidArgument("revocation reason is required", {{"reason", "is required", ""}});
  }

  db::model::BarcodeRecord record;
  try {
    auto tx  = repository_->Begin();
    auto row = Find(*tx, barcode_ref);
    if (!row) throw util::NotFound("barcode not found: " + barcode_ref);
    record = *row;

    if (record.status == BarcodeStatus::kRevoked) {
      throw util::InvalidState("barcode already revoked", "revoked", {});
    }

    const auto expected  = record.status;
    const auto now_ms    = util::ToUnixMillis(clock_->Now());
    record.status         = BarcodeStatus::kRevoked;
    record.revoked_reason = reason;
    record.revoked_by     = ctx.caller.actor_id;
    record.revoked_at_ms  = now_ms;
    record.updated_at_ms  = now_ms;

    ThrowIfDbError(repository_->UpdateBarcode(*tx, record, expected), "revoke barcode");
    AppendEvent(*tx, record.id, BarcodeEventType::kRevoked, ctx.caller.actor_id, reason, now_ms);
    tx->Commit();
  } catch (const db::DbError& e) {
    ThrowDbError(e, "revoke barcode");
  }

  WARRANTY_LOG_INFO("barcode revoked", {observability::StringField("barcode", record.barcode), observability::StringField("reason", reason)});
  return View(record);
}

WarrantyView WarrantyRegistry::GetBarcode(const RequestContext& ctx, const std::string& barcode_ref) {
  RequireRole(ctx, {kRoleAgent, kRoleCustomer});

  std::optional<db::model::BarcodeRecord> row;
  try {
    auto tx = repository_->Begin();
    row     = Find(*tx, barcode_ref);
    tx->Rollback();
  } catch (const db::DbError& e) {
    ThrowDbError(e, "get barcode");
  }

  if (!row) throw util::NotFound("barcode not found: " + barcode_ref);
  if (!ctx.caller.HasRole(kRoleAgent) && row->customer_id != ctx.caller.actor_id) {
    // customers never learn about barcodes bound to someone else
    throw util::NotFound("barcode not found: " + barcode_ref);
  }
  return View(*row);
}

std::vector<db::model::BarcodeEventRecord> WarrantyRegistry::ListEvents(const RequestContext& ctx, const std::string& barcode_ref) {
  RequireRole(ctx, {kRoleAgent});
  try {
    auto tx  = repository_->Begin();
    auto row = Find(*tx, barcode_ref);
    if (!row) throw util::NotFound("barcode not found: " + barcode_ref);
    auto events = repository_->ListBarcodeEvents(*tx, row->id);
    tx->Rollback();
    return events;
  } catch (const db::DbError& e) {
    ThrowDbError(e, "list barcode events");
  }
}

void WarrantyRegistry::MarkClaimed(db::Transaction& tx, const std::string& barcode_id, const std::string& actor_id, const std::string& detail) {
  auto row = repository_->GetBarcode(tx, barcode_id);
  if (!row) throw util::NotFound("barcode not found: " + barcode_id);
  if (row->status != BarcodeStatus::kActive) {
    throw util::PreconditionFailed("barcode_not_active", "barcode is " + std::string(warranty::model::ToString(row->status)));
  }

  const auto now_ms = util::ToUnixMillis(clock_->Now());
  row->status        = BarcodeStatus::kClaimed;
  row->updated_at_ms = now_ms;
  ThrowIfDbError(repository_->UpdateBarcode(tx, *row, BarcodeStatus::kActive), "mark barcode claimed");
  AppendEvent(tx, barcode_id, BarcodeEventType::kClaimed, actor_id, detail, now_ms);
}

} // namespace warranty::core
