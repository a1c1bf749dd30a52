#include "internal/catalog/product_cache.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "support/test_fixtures.hpp"

namespace {

using warranty::catalog::ProductCache;
using warranty::core::ProductInfo;
using warranty::testing::CountingCatalog;
using warranty::testing::ManualClock;
using warranty::testing::PhoneProduct;
using warranty::testing::Throws;

ProductInfo Product(const std::string& id, const std::string& sku) {
  ProductInfo p;
  p.id                     = id;
  p.sku                    = sku;
  p.name                   = "Product " + id;
  p.warranty_period_months = 24;
  return p;
}

std::shared_ptr<ManualClock> Clock() {
  return std::make_shared<ManualClock>(warranty::util::MakeDate(2024, 3, 10));
}

void TestHitsAreServedFromCache() {
  auto         catalog = std::make_shared<CountingCatalog>(std::vector<ProductInfo>{PhoneProduct()});
  ProductCache cache(catalog, Clock(), 60000);

  auto first  = cache.Get("prod-phone");
  auto second = cache.Get("prod-phone");
  assert(first && second);
  assert(second->sku == "SKU-PHONE-1");
  assert(catalog->lookups == 1);

  // The SKU index shares the entry.
  auto by_sku = cache.GetBySku("SKU-PHONE-1");
  assert(by_sku && by_sku->id == "prod-phone");
  assert(catalog->lookups == 1);
}

void TestEntriesExpireAfterTtl() {
  auto         catalog = std::make_shared<CountingCatalog>(std::vector<ProductInfo>{PhoneProduct()});
  auto         clock   = Clock();
  ProductCache cache(catalog, clock, 60000);

  cache.Get("prod-phone");
  clock->AdvanceMs(59999);
  cache.Get("prod-phone");
  assert(catalog->lookups == 1);

  clock->AdvanceMs(1);
  cache.Get("prod-phone");
  assert(catalog->lookups == 2);
}

void TestMissesAreNotCached() {
  auto         catalog = std::make_shared<CountingCatalog>(std::vector<ProductInfo>{PhoneProduct()});
  ProductCache cache(catalog, Clock(), 60000);

  assert(!cache.Get("prod-unknown").has_value());
  assert(!cache.Get("prod-unknown").has_value());
  assert(catalog->lookups == 2);
  assert(cache.Size() == 0);
}

void TestFullCacheIsDropped() {
  auto         catalog = std::make_shared<CountingCatalog>(std::vector<ProductInfo>{Product("p1", "S1"), Product("p2", "S2"), Product("p3", "S3")});
  ProductCache cache(catalog, Clock(), 60000, 2);

  cache.Get("p1");
  cache.Get("p2");
  assert(cache.Size() == 2);

  cache.Get("p3");
  assert(cache.Size() == 1);

  // p1 went with the table.
  const int before = catalog->lookups;
  cache.Get("p1");
  assert(catalog->lookups == before + 1);
}

void TestInvalidateForcesReload() {
  auto         catalog = std::make_shared<CountingCatalog>(std::vector<ProductInfo>{PhoneProduct()});
  ProductCache cache(catalog, Clock(), 60000);

  cache.Get("prod-phone");
  cache.Invalidate("prod-phone");
  cache.Invalidate("prod-never-loaded");
  assert(cache.Size() == 0);

  cache.GetBySku("SKU-PHONE-1");
  assert(catalog->lookups == 2);
}

void TestCatalogOutagePropagates() {
  auto         catalog = std::make_shared<CountingCatalog>(std::vector<ProductInfo>{PhoneProduct()});
  ProductCache cache(catalog, Clock(), 60000);

  catalog->unavailable = true;
  assert(Throws<warranty::util::DependencyFailure>([&] { cache.Get("prod-phone"); }));

  catalog->unavailable = false;
  assert(cache.Get("prod-phone").has_value());
}

} // namespace

int main() {
  TestHitsAreServedFromCache();
  TestEntriesExpireAfterTtl();
  TestMissesAreNotCached();
  TestFullCacheIsDropped();
  TestInvalidateForcesReload();
  TestCatalogOutagePropagates();

  std::cout << "warranty_catalog_product_cache: pass\n";
  return 0;
}
