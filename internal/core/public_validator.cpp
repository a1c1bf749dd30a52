#include "public_validator.hpp"

#include <algorithm>
#include <cctype>

#include "db_errors.hpp"
#include "identifier_generator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "warranty_registry.hpp"

namespace warranty::core {

using warranty::model::BarcodeStatus;

namespace {

constexpr char kNotFound[]        = "not_found";
constexpr char kNotFoundMessage[] = "No warranty found for this barcode";

bool SameEmail(const std::string& a, const std::string& b) {
  return std::equal(a.begin(), a.end(), b.begin(), b.end(),
                    [](unsigned char x, unsigned char y) { return std::tolower(x) == std::tolower(y); });
}

bool SameDay(uint64_t a_ms, uint64_t b_ms) {
  return a_ms / 86400000ULL == b_ms / 86400000ULL;
}

} // namespace

PublicValidator::PublicValidator(std::shared_ptr<db::Repository> repository, std::shared_ptr<catalog::ProductCache> products,
                                 std::shared_ptr<CoveragePolicy> policy, std::shared_ptr<util::Clock> clock, std::size_t lookup_limit)
    : repository_(std::move(repository)),
      products_(std::move(products)),
      policy_(std::move(policy)),
      clock_(std::move(clock)),
      lookup_limit_(lookup_limit) {
}

std::optional<db::model::BarcodeRecord> PublicValidator::FindPublic(const std::string& barcode) {
  if (!IsWellFormedBarcode(barcode)) return std::nullopt;

  std::optional<db::model::BarcodeRecord> row;
  try {
    auto tx = repository_->Begin();
    row     = repository_->GetBarcodeByValue(*tx, barcode);
    tx->Rollback();
  } catch (const db::DbError& e) {
    ThrowDbError(e, "public barcode lookup");
  }

  if (row && row->status == BarcodeStatus::kRevoked) return std::nullopt;
  return row;
}

std::optional<ProductInfo> PublicValidator::Product(const std::string& product_id) {
  if (!products_ || product_id.empty()) return std::nullopt;
  try {
    return products_->Get(product_id);
  } catch (const util::DependencyFailure& e) {
    WARRANTY_LOG_WARN("product lookup unavailable", {observability::StringField("product_id", product_id),
                                                      observability::StringField("error", e.what())});
    return std::nullopt;
  }
}

WarrantySummary PublicValidator::Summarize(const db::model::BarcodeRecord& barcode, const std::optional<ProductInfo>& product) const {
  const auto derived = Derive(barcode, clock_->Now());

  WarrantySummary s;
  s.barcode         = barcode.barcode;
  s.status          = std::string(warranty::model::ToString(derived.effective_status));
  s.activated_at_ms = barcode.activated_at_ms;
  s.expiry_at_ms    = barcode.expiry_at_ms;
  s.days_remaining  = derived.days_remaining;
  s.is_expired      = derived.is_expired;
  s.can_claim       = derived.can_claim;
  s.warranty_period = derived.warranty_period;
  s.qr_payload      = derived.qr_payload;
  if (product) {
    s.product = ProductSummary{product->sku, product->name, product->brand, product->category, product->image_url};
  }
  return s;
}

ValidationResult PublicValidator::Validate(const std::string& barcode, const std::string& sku) {
  ValidationResult result;

  auto row = FindPublic(barcode);
  if (!row) {
    result.status   = kNotFound;
    result.message  = kNotFoundMessage;
    result.coverage = policy_->Terms(std::nullopt);
    return result;
  }

  auto product = Product(row->product_id);
  if (!sku.empty() && (!product || product->sku != sku)) {
    result.status   = kNotFound;
    result.message  = kNotFoundMessage;
    result.coverage = policy_->Terms(std::nullopt);
    return result;
  }

  result.warranty = Summarize(*row, product);
  result.status   = result.warranty->status;
  result.coverage = policy_->Terms(product);

  // Only an active, unexpired warranty is valid.
  if (row->status == BarcodeStatus::kGenerated) {
    result.message = "Warranty has not been activated";
  } else if (result.warranty->is_expired) {
    result.message = "Warranty has expired";
  } else if (row->status == BarcodeStatus::kClaimed) {
    result.message = "Warranty has already been claimed";
  } else {
    result.valid   = row->status == BarcodeStatus::kActive;
    result.message = result.valid ? "Warranty is valid" : "Warranty is not active";
  }
  return result;
}

std::vector<WarrantySummary> PublicValidator::Lookup(const LookupQuery& query) {
  if (query.sku.empty()) {
    throw util::InvalidArgument("sku is required", {{"sku", "is required", ""}});
  }

  std::optional<ProductInfo> product;
  try {
    product = products_ ? products_->GetBySku(query.sku) : std::nullopt;
  } catch (const util::DependencyFailure& e) {
    WARRANTY_LOG_WARN("product lookup unavailable", {observability::StringField("sku", query.sku), observability::StringField("error", e.what())});
    throw;
  }
  if (!product) return {};

  std::vector<db::model::BarcodeRecord> rows;
  try {
    auto tx = repository_->Begin();
    rows    = repository_->ListBarcodesByProduct(*tx, product->id, db::Pagination{0, 0});
    tx->Rollback();
  } catch (const db::DbError& e) {
    ThrowDbError(e, "public warranty lookup");
  }

  std::vector<WarrantySummary> out;
  for (const auto& row : rows) {
    if (row.status == BarcodeStatus::kGenerated || row.status == BarcodeStatus::kRevoked) continue;
    if (!query.serial_number.empty() && row.serial_number != query.serial_number) continue;
    if (query.purchase_date_ms != 0 && !SameDay(row.purchase_date_ms, query.purchase_date_ms)) continue;
    if (!query.customer_email.empty() && !SameEmail(row.customer_email, query.customer_email)) continue;

    out.push_back(Summarize(row, product));
    if (lookup_limit_ != 0 && out.size() >= lookup_limit_) break;
  }
  return out;
}

CoverageCheckResult PublicValidator::CheckCoverage(const CoverageCheckRequest& request) {
  if (request.issue_type.empty()) {
    throw util::InvalidArgument("issue type is required", {{"issue_type", "is required", ""}});
  }

  CoverageCheckResult result;
  result.barcode       = request.barcode;
  result.issue_type    = request.issue_type;
  result.checked_at_ms = util::ToUnixMillis(clock_->Now());

  std::optional<ProductInfo> product;
  bool                       claimable = false;
  if (auto row = FindPublic(request.barcode)) {
    product   = Product(row->product_id);
    claimable = Derive(*row, clock_->Now()).can_claim;
  }

  result.decision = policy_->Decide(request.issue_type, request.issue_category, request.description, claimable);
  result.coverage = policy_->Terms(product);
  return result;
}

} // namespace warranty::core
