#include "product_cache.hpp"

#include <mutex>

namespace warranty::catalog {

using warranty::core::ProductInfo;

ProductCache::ProductCache(std::shared_ptr<warranty::core::ProductCatalog> catalog, std::shared_ptr<util::Clock> clock, uint64_t ttl_ms,
                           std::size_t max_entries)
    : catalog_(std::move(catalog)), clock_(std::move(clock)), ttl_ms_(ttl_ms), max_entries_(max_entries == 0 ? 1 : max_entries) {
}

std::optional<ProductInfo> ProductCache::Lookup(const std::string& product_id, uint64_t now_ms) const {
  auto it = by_id_.find(product_id);
  if (it == by_id_.end() || it->second.expires_at_ms <= now_ms) return std::nullopt;
  return it->second.product;
}

void ProductCache::Store(const ProductInfo& product, uint64_t now_ms) {
  std::unique_lock lock(mutex_);
  if (by_id_.size() >= max_entries_ && by_id_.find(product.id) == by_id_.end()) {
    by_id_.clear();
    sku_to_id_.clear();
  }
  by_id_[product.id] = Entry{product, now_ms + ttl_ms_};
  if (!product.sku.empty()) sku_to_id_[product.sku] = product.id;
}

// ------------------------------------------------------------
// Read-through
// ------------------------------------------------------------

std::optional<ProductInfo> ProductCache::Get(const std::string& product_id) {
  const auto now_ms = util::ToUnixMillis(clock_->Now());
  {
    std::shared_lock lock(mutex_);
    if (auto hit = Lookup(product_id, now_ms)) return hit;
  }

  auto product = catalog_->LookupProduct(product_id);
  if (product) Store(*product, now_ms);
  return product;
}

std::optional<ProductInfo> ProductCache::GetBySku(const std::string& sku) {
  const auto now_ms = util::ToUnixMillis(clock_->Now());
  {
    std::shared_lock lock(mutex_);
    auto             it = sku_to_id_.find(sku);
    if (it != sku_to_id_.end()) {
      if (auto hit = Lookup(it->second, now_ms)) return hit;
    }
  }

  auto product = catalog_->LookupBySku(sku);
  if (product) Store(*product, now_ms);
  return product;
}

void ProductCache::Invalidate(const std::string& product_id) {
  std::unique_lock lock(mutex_);
  auto             it = by_id_.find(product_id);
  if (it == by_id_.end()) return;
  sku_to_id_.erase(it->second.product.sku);
  by_id_.erase(it);
}

std::size_t ProductCache::Size() const {
  std::shared_lock lock(mutex_);
  return by_id_.size();
}

} // namespace warranty::catalog
