#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "collaborators.hpp"
#include "internal/catalog/product_cache.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace warranty::core {

struct ProductSummary {
  std::string sku;
  std::string name;
  std::string brand;
  std::string category;
  std::string image_url;
};

// Public projection of a warranty. Carries no customer data.
struct WarrantySummary {
  std::string                   barcode;
  std::string                   status;
  uint64_t                      activated_at_ms = 0;
  uint64_t                      expiry_at_ms    = 0;
  int64_t                       days_remaining  = 0;
  bool                          is_expired      = false;
  bool                          can_claim       = false;
  std::string                   warranty_period;
  std::string                   qr_payload;
  std::optional<ProductSummary> product;
};

struct ValidationResult {
  bool                           valid = false;
  std::string                    status;
  std::string                    message;
  std::optional<WarrantySummary> warranty;
  CoverageTerms                  coverage;
};

struct LookupQuery {
  std::string sku;
  std::string serial_number;
  uint64_t    purchase_date_ms = 0;
  std::string customer_email;
};

struct CoverageCheckRequest {
  std::string barcode;
  std::string issue_type;
  std::string issue_category;
  std::string description;
};

struct CoverageCheckResult {
  std::string      barcode;
  std::string      issue_type;
  CoverageDecision decision;
  CoverageTerms    coverage;
  uint64_t         checked_at_ms = 0;
};

/*
  PublicValidator

  Unauthenticated read path over the barcode store. Unknown and revoked
  barcodes produce the same not_found answer, and nothing returned here
  names the customer a warranty is bound to.
*/
class PublicValidator {
 public:
  PublicValidator(std::shared_ptr<db::Repository> repository, std::shared_ptr<catalog::ProductCache> products,
                  std::shared_ptr<CoveragePolicy> policy, std::shared_ptr<util::Clock> clock, std::size_t lookup_limit = 50);

  ValidationResult Validate(const std::string& barcode, const std::string& sku);

  std::vector<WarrantySummary> Lookup(const LookupQuery& query);

  CoverageCheckResult CheckCoverage(const CoverageCheckRequest& request);

 private:
  std::optional<db::model::BarcodeRecord> FindPublic(const std::string& barcode);
  std::optional<ProductInfo>              Product(const std::string& product_id);
  WarrantySummary                         Summarize(const db::model::BarcodeRecord& barcode, const std::optional<ProductInfo>& product) const;

  std::shared_ptr<db::Repository>        repository_;
  std::shared_ptr<catalog::ProductCache> products_;
  std::shared_ptr<CoveragePolicy>        policy_;
  std::shared_ptr<util::Clock>           clock_;
  std::size_t                            lookup_limit_;
};

} // namespace warranty::core
