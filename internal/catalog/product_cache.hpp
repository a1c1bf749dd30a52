#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/core/collaborators.hpp"
#include "internal/util/time.hpp"

namespace warranty::catalog {

/*
  Read-through cache in front of the product read-model.

  Entries live for ttl_ms and are keyed by product id; a SKU index points
  into the same entries. Misses are not cached. When the cache is full the
  whole table is dropped and refilled on demand.
*/
class ProductCache {
 public:
  ProductCache(std::shared_ptr<warranty::core::ProductCatalog> catalog, std::shared_ptr<util::Clock> clock, uint64_t ttl_ms,
               std::size_t max_entries = 4096);

  std::optional<warranty::core::ProductInfo> Get(const std::string& product_id);
  std::optional<warranty::core::ProductInfo> GetBySku(const std::string& sku);

  void Invalidate(const std::string& product_id);

  std::size_t Size() const;

 private:
  struct Entry {
    warranty::core::ProductInfo product;
    uint64_t                    expires_at_ms = 0;
  };

  std::optional<warranty::core::ProductInfo> Lookup(const std::string& product_id, uint64_t now_ms) const;
  void                                       Store(const warranty::core::ProductInfo& product, uint64_t now_ms);

  std::shared_ptr<warranty::core::ProductCatalog> catalog_;
  std::shared_ptr<util::Clock>                    clock_;
  uint64_t                                        ttl_ms_;
  std::size_t                                     max_entries_;

  mutable std::shared_mutex              mutex_;
  std::unordered_map<std::string, Entry> by_id_;
  std::unordered_map<std::string, std::string> sku_to_id_;
};

} // namespace warranty::catalog
