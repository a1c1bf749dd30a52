#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "internal/core/collaborators.hpp"

namespace warranty::adapters {

// Product read-model backed by a fixed list, usually loaded from config.
class StaticProductCatalog final : public warranty::core::ProductCatalog {
 public:
  explicit StaticProductCatalog(std::vector<warranty::core::ProductInfo> products);

  std::optional<warranty::core::ProductInfo> LookupProduct(const std::string& product_id) override;
  std::optional<warranty::core::ProductInfo> LookupBySku(const std::string& sku) override;

 private:
  std::unordered_map<std::string, warranty::core::ProductInfo> by_id_;
  std::unordered_map<std::string, std::string>                 sku_to_id_;
};

class StaticCustomerDirectory final : public warranty::core::CustomerDirectory {
 public:
  explicit StaticCustomerDirectory(std::vector<warranty::core::CustomerInfo> customers);

  std::optional<warranty::core::CustomerInfo> LookupByEmail(const std::string& email) override;
  std::optional<warranty::core::CustomerInfo> LookupById(const std::string& id) override;

 private:
  std::unordered_map<std::string, warranty::core::CustomerInfo> by_id_;
  std::unordered_map<std::string, std::string>                  email_to_id_;
};

} // namespace warranty::adapters
