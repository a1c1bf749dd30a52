#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace warranty::core {

/*
  Narrow capabilities the core consumes from outside the warranty domain.

  Implementations throw util::DependencyFailure when the backing system is
  unreachable. "Not found" is an empty optional, never an exception.
*/

struct ProductInfo {
  std::string id;
  std::string sku;
  std::string name;
  std::string brand;
  std::string category;
  std::string description;
  int64_t     base_price_cents       = 0;
  std::string image_url;
  int32_t     warranty_period_months = 0;
};

class ProductCatalog {
 public:
  virtual ~ProductCatalog() = default;

  virtual std::optional<ProductInfo> LookupProduct(const std::string& product_id) = 0;
  virtual std::optional<ProductInfo> LookupBySku(const std::string& sku)          = 0;
};

struct CustomerInfo {
  std::string id;
  std::string email;
  std::string name;
  std::string phone;
};

class CustomerDirectory {
 public:
  virtual ~CustomerDirectory() = default;

  virtual std::optional<CustomerInfo> LookupByEmail(const std::string& email) = 0;
  virtual std::optional<CustomerInfo> LookupById(const std::string& id)       = 0;
};

// Fire-and-forget. Callers log failures; nothing is retried.
class Notifier {
 public:
  virtual ~Notifier() = default;

  virtual void Notify(const std::string& recipient, const std::string& template_id, const std::map<std::string, std::string>& payload) = 0;
};

struct ScanVerdict {
  bool        passed = false;
  std::string detail;
};

class AttachmentScanner {
 public:
  virtual ~AttachmentScanner() = default;

  virtual ScanVerdict Scan(const std::string& storage_ref) = 0;
};

struct CoverageTerms {
  std::string              coverage_type = "comprehensive";
  std::vector<std::string> covered_components;
  std::vector<std::string> excluded_components;
  bool                     repair_coverage      = true;
  bool                     replacement_coverage = true;
  bool                     labor_coverage       = true;
  bool                     parts_coverage       = true;
  std::vector<std::string> terms;
};

struct CoverageDecision {
  bool                     covered              = false;
  std::string              coverage_type;
  int64_t                  estimated_cost_cents = 0;
  std::string              message;
  std::vector<std::string> recommendations;
  std::vector<std::string> next_steps;
};

class CoveragePolicy {
 public:
  virtual ~CoveragePolicy() = default;

  virtual CoverageTerms Terms(const std::optional<ProductInfo>& product) const = 0;

  // warranty_claimable is false when the barcode is not active or has expired.
  virtual CoverageDecision Decide(const std::string& issue_type, const std::string& issue_category, const std::string& description,
                                  bool warranty_claimable) const = 0;
};

} // namespace warranty::core
