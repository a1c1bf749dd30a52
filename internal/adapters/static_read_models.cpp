#include "static_read_models.hpp"

#include <algorithm>
#include <cctype>

namespace warranty::adapters {

namespace {

std::string FoldEmail(std::string email) {
  std::transform(email.begin(), email.end(), email.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return email;
}

} // namespace

StaticProductCatalog::StaticProductCatalog(std::vector<warranty::core::ProductInfo> products) {
  for (auto& p : products) {
    if (!p.sku.empty()) sku_to_id_[p.sku] = p.id;
    by_id_[p.id] = std::move(p);
  }
}

std::optional<warranty::core::ProductInfo> StaticProductCatalog::LookupProduct(const std::string& product_id) {
  auto it = by_id_.find(product_id);
  if (it == by_id_.end()) return std::nullopt;
  return it->second;
}

std::optional<warranty::core::ProductInfo> StaticProductCatalog::LookupBySku(const std::string& sku) {
  auto it = sku_to_id_.find(sku);
  if (it == sku_to_id_.end()) return std::nullopt;
  return LookupProduct(it->second);
}

StaticCustomerDirectory::StaticCustomerDirectory(std::vector<warranty::core::CustomerInfo> customers) {
  for (auto& c : customers) {
    if (!c.email.empty()) email_to_id_[FoldEmail(c.email)] = c.id;
    by_id_[c.id] = std::move(c);
  }
}

std::optional<warranty::core::CustomerInfo> StaticCustomerDirectory::LookupByEmail(const std::string& email) {
  auto it = email_to_id_.find(FoldEmail(email));
  if (it == email_to_id_.end()) return std::nullopt;
  return LookupById(it->second);
}

std::optional<warranty::core::CustomerInfo> StaticCustomerDirectory::LookupById(const std::string& id) {
  auto it = by_id_.find(id);
  if (it == by_id_.end()) return std::nullopt;
  return it->second;
}

} // namespace warranty::adapters
