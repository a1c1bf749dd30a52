#include "internal/core/collision_detector.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "support/test_fixtures.hpp"

namespace {

using warranty::core::BatchReservations;
using warranty::core::CollisionDetector;
using warranty::model::CollisionType;

void TestFreshCandidateIsAcceptedAndReserved() {
  auto              repository = std::make_shared<warranty::db::memory::MemoryRepository>();
  CollisionDetector detector(repository);
  BatchReservations batch;

  assert(!detector.Check(batch, "SSW-2024-0000000001").has_value());
  assert(batch.Size() == 1);
}

void TestRepeatWithinBatchIsDuplicateInBatch() {
  auto              repository = std::make_shared<warranty::db::memory::MemoryRepository>();
  CollisionDetector detector(repository);
  BatchReservations batch;

  assert(!detector.Check(batch, "SSW-2024-0000000002").has_value());
  auto second = detector.Check(batch, "SSW-2024-0000000002");
  assert(second.has_value());
  assert(*second == CollisionType::kDuplicateInBatch);
  assert(batch.Size() == 1);
}

void TestStoredBarcodeIsDuplicateInStoreAndNotReserved() {
  warranty::testing::WarrantyHarness h;
  h.SeedBarcode("SSW-2024-0000000003");

  CollisionDetector detector(h.repository);
  BatchReservations batch;

  auto result = detector.Check(batch, "SSW-2024-0000000003");
  assert(result.has_value());
  assert(*result == CollisionType::kDuplicateInStore);
  assert(batch.Size() == 0);
  assert(detector.ExistsInStore("SSW-2024-0000000003"));
  assert(!detector.ExistsInStore("SSW-2024-0000000004"));
}

void TestReleasedReservationCanBeReused() {
  auto              repository = std::make_shared<warranty::db::memory::MemoryRepository>();
  CollisionDetector detector(repository);
  BatchReservations batch;

  assert(!detector.Check(batch, "SSW-2024-0000000005").has_value());
  batch.Release("SSW-2024-0000000005");
  assert(!detector.Check(batch, "SSW-2024-0000000005").has_value());
}

void TestSeparateBatchesDoNotShareReservations() {
  auto              repository = std::make_shared<warranty::db::memory::MemoryRepository>();
  CollisionDetector detector(repository);
  BatchReservations first;
  BatchReservations second;

  assert(!detector.Check(first, "SSW-2024-0000000006").has_value());
  // Cross-batch duplicates are caught by the store at commit, not here.
  assert(!detector.Check(second, "SSW-2024-0000000006").has_value());
}

} // namespace

int main() {
  TestFreshCandidateIsAcceptedAndReserved();
  TestRepeatWithinBatchIsDuplicateInBatch();
  TestStoredBarcodeIsDuplicateInStoreAndNotReserved();
  TestReleasedReservationCanBeReused();
  TestSeparateBatchesDoNotShareReservations();

  std::cout << "warranty_core_collision_detector: pass\n";
  return 0;
}
