#include "internal/core/batch_engine.hpp"

#include <cassert>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <thread>

#include "support/fault_injecting_repository.hpp"
#include "support/test_fixtures.hpp"

namespace {

using warranty::core::BatchEngine;
using warranty::core::BatchEngineOptions;
using warranty::core::CreateBatchRequest;
using warranty::core::EntropyBarcodeGenerator;
using warranty::core::GeneratorInput;
using warranty::db::Pagination;
using warranty::db::model::BatchRecord;
using warranty::model::BatchStatus;
using warranty::model::CollisionResolution;
using warranty::model::CollisionType;
using warranty::testing::AdminContext;
using warranty::db::ErrorCode;
using warranty::testing::AgentContext;
using warranty::testing::FaultInjectingRepository;
using warranty::testing::Throws;
using warranty::testing::WarrantyHarness;

// First attempt of every slot yields the same string; retries are unique.
class FirstAttemptCollides final : public warranty::core::BarcodeGenerator {
 public:
  std::string Generate(const GeneratorInput& input) const override {
    if (input.attempt == 0) return input.prefix + "-2024-0000000000";
    return inner_.Generate(input);
  }

 private:
  EntropyBarcodeGenerator inner_;
};

class AlwaysSame final : public warranty::core::BarcodeGenerator {
 public:
  std::string Generate(const GeneratorInput& input) const override {
    return input.prefix + "-2024-SAMESAME00";
  }
};

// Lets the first `open_calls` generations through, then holds every caller
// until Open().
class GatedGenerator final : public warranty::core::BarcodeGenerator {
 public:
  explicit GatedGenerator(uint32_t open_calls) : open_calls_(open_calls) {
  }

  std::string Generate(const GeneratorInput& input) const override {
    {
      std::unique_lock lock(mutex_);
      if (calls_++ >= open_calls_) {
        ++held_;
        cv_.notify_all();
        cv_.wait(lock, [&] { return open_; });
        --held_;
      }
    }
    return inner_.Generate(input);
  }

  bool WaitHeld(uint32_t n) const {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, std::chrono::seconds(30), [&] { return held_ >= n; });
  }

  void Open() {
    std::lock_guard lock(mutex_);
    open_ = true;
    cv_.notify_all();
  }

 private:
  const uint32_t                  open_calls_;
  mutable std::mutex              mutex_;
  mutable std::condition_variable cv_;
  mutable uint32_t                calls_ = 0;
  mutable uint32_t                held_  = 0;
  bool                            open_  = false;
  EntropyBarcodeGenerator         inner_;
};

struct BatchFixture {
  explicit BatchFixture(std::shared_ptr<warranty::core::BarcodeGenerator> generator  = std::make_shared<EntropyBarcodeGenerator>(),
                        BatchEngineOptions                                options    = SmallChunks(),
                        std::shared_ptr<warranty::db::Repository>         repository = nullptr) {
    if (!repository) repository = h.repository;
    engine = std::make_shared<BatchEngine>(std::move(repository), h.catalog, h.notifier, h.clock, std::move(generator), options);
    engine->StartWorkers();
  }

  static BatchEngineOptions SmallChunks() {
    BatchEngineOptions options;
    options.worker_threads    = 4;
    options.commit_chunk_size = 50;
    options.retry_backoff_ms  = 1;
    return options;
  }

  CreateBatchRequest Request(uint32_t quantity) const {
    CreateBatchRequest req;
    req.product_id    = "prod-phone";
    req.storefront_id = "store-1";
    req.quantity      = quantity;
    req.prefix        = "ssw";
    req.expiry_months = 24;
    return req;
  }

  BatchRecord WaitTerminal(const std::string& batch_id) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(30);
    while (std::chrono::steady_clock::now() < deadline) {
      auto batch = engine->GetBatch(AdminContext(), batch_id);
      if (warranty::model::IsTerminal(batch.status)) return batch;
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    assert(false && "batch did not finish");
    return {};
  }

  WarrantyHarness              h;
  std::shared_ptr<BatchEngine> engine;
};

void TestCreateValidatesEveryField() {
  BatchFixture f;

  CreateBatchRequest bad;
  bad.quantity      = 0;
  bad.prefix        = "X";
  bad.expiry_months = 0;

  try {
    f.engine->CreateBatch(AdminContext(), bad);
    assert(false);
  } catch (const warranty::util::InvalidArgument& e) {
    // quantity, prefix, expiry, product and storefront
    assert(e.Violations().size() == 5);
  }

  auto unknown       = f.Request(10);
  unknown.product_id = "prod-missing";
  assert(Throws<warranty::util::InvalidArgument>([&] { f.engine->CreateBatch(AdminContext(), unknown); }));

  auto too_many     = f.Request(100001);
  assert(Throws<warranty::util::InvalidArgument>([&] { f.engine->CreateBatch(AdminContext(), too_many); }));
}

void TestCreateRequiresAdmin() {
  BatchFixture f;
  assert(Throws<warranty::util::Forbidden>([&] { f.engine->CreateBatch(AgentContext(), f.Request(10)); }));
}

void TestCreateAllocatesSequentialNumbers() {
  BatchFixture f;

  auto first  = f.engine->CreateBatch(AdminContext(), f.Request(5));
  auto second = f.engine->CreateBatch(AdminContext(), f.Request(5));

  assert(first.batch_number == "BATCH-2024-000001");
  assert(second.batch_number == "BATCH-2024-000002");
  assert(first.status == BatchStatus::kPending);
  assert(first.prefix == "SSW");
  assert(first.created_by == "admin-1");
}

void TestBatchCompletesWithUniqueWellFormedBarcodes() {
  BatchFixture f;

  auto created = f.engine->CreateBatch(AdminContext(), f.Request(250));
  auto started = f.engine->StartBatch(AdminContext(), created.id);
  assert(started.status == BatchStatus::kInProgress);

  auto done = f.WaitTerminal(created.id);
  assert(done.status == BatchStatus::kCompleted);
  assert(done.generated_count == 250);
  assert(done.successful_count == 250);
  assert(done.failed_count == 0);
  assert(done.completed_at_ms > 0);

  auto barcodes = f.engine->ListBarcodes(AdminContext(), created.id, Pagination{0, 0});
  assert(barcodes.size() == 250);

  std::set<std::string> unique;
  for (const auto& b : barcodes) {
    assert(warranty::core::IsWellFormedBarcode(b.barcode));
    assert(b.barcode.rfind("SSW-2024-", 0) == 0);
    assert(b.status == warranty::model::BarcodeStatus::kGenerated);
    assert(b.warranty_period_months == 24);
    assert(b.activated_at_ms == 0);
    unique.insert(b.barcode);
  }
  assert(unique.size() == 250);

  auto progress = f.engine->GetProgress(AdminContext(), created.id);
  assert(progress.progress_percent == 100.0);
  assert(progress.remaining == 0);
  assert(progress.current_step == "completed");
}

void TestStartIsIdempotentForRunningOrFinishedBatch() {
  BatchFixture f;

  auto created = f.engine->CreateBatch(AdminContext(), f.Request(20));
  f.engine->StartBatch(AdminContext(), created.id);
  f.WaitTerminal(created.id);

  auto again = f.engine->StartBatch(AdminContext(), created.id);
  assert(again.status == BatchStatus::kCompleted);
  assert(f.engine->ListBarcodes(AdminContext(), created.id, Pagination{0, 0}).size() == 20);
}

void TestInBatchCollisionsAreRegenerated() {
  BatchFixture f(std::make_shared<FirstAttemptCollides>());

  auto created = f.engine->CreateBatch(AdminContext(), f.Request(40));
  f.engine->StartBatch(AdminContext(), created.id);
  auto done = f.WaitTerminal(created.id);

  assert(done.status == BatchStatus::kCompleted);
  assert(done.successful_count == 40);
  assert(done.collision_count == 39);

  auto collisions = f.engine->ListCollisions(AdminContext(), created.id, Pagination{0, 0});
  assert(collisions.size() == 39);
  for (const auto& c : collisions) {
    assert(c.type == CollisionType::kDuplicateInBatch);
    assert(c.resolution == CollisionResolution::kRegenerated);
    assert(c.attempt == 0);
    assert(c.candidate == "SSW-2024-0000000000");
  }

  auto stats = BatchEngine::Statistics(done);
  assert(stats.success_rate == 100.0);
  assert(stats.security_score == "POOR");
  assert(stats.recommended_action == "review_algorithm");
}

void TestStoreCollisionsAreRegenerated() {
  // One worker, so no slot ever sees another slot's short-lived reservation.
  auto options           = BatchFixture::SmallChunks();
  options.worker_threads = 1;
  BatchFixture f(std::make_shared<FirstAttemptCollides>(), options);
  f.h.SeedBarcode("SSW-2024-0000000000");

  auto created = f.engine->CreateBatch(AdminContext(), f.Request(10));
  f.engine->StartBatch(AdminContext(), created.id);
  auto done = f.WaitTerminal(created.id);

  assert(done.status == BatchStatus::kCompleted);
  assert(done.successful_count == 10);
  assert(done.collision_count == 10);
  for (const auto& c : f.engine->ListCollisions(AdminContext(), created.id, Pagination{0, 0})) {
    assert(c.type == CollisionType::kDuplicateInStore);
    assert(c.resolution == CollisionResolution::kRegenerated);
    assert(c.attempt == 0);
  }
}

void TestExhaustedRetriesFailTheBatch() {
  BatchFixture f(std::make_shared<AlwaysSame>());

  auto created = f.engine->CreateBatch(AdminContext(), f.Request(10));
  f.engine->StartBatch(AdminContext(), created.id);
  auto done = f.WaitTerminal(created.id);

  assert(done.status == BatchStatus::kFailed);
  assert(!done.last_error.empty());
  assert(done.successful_count + done.failed_count == done.generated_count);
  assert(done.generated_count <= done.requested_quantity);
}

void TestCancelPendingBatch() {
  BatchFixture f;

  auto created   = f.engine->CreateBatch(AdminContext(), f.Request(10));
  auto cancelled = f.engine->CancelBatch(AdminContext(), created.id, "ordered by mistake", false);
  assert(cancelled.status == BatchStatus::kCancelled);
  assert(cancelled.cancel_reason == "ordered by mistake");
  assert(cancelled.cancelled_by == "admin-1");

  assert(Throws<warranty::util::InvalidState>([&] { f.engine->CancelBatch(AdminContext(), created.id, "again", false); }));
  assert(Throws<warranty::util::InvalidState>([&] { f.engine->StartBatch(AdminContext(), created.id); }));
  assert(f.engine->ListBarcodes(AdminContext(), created.id, Pagination{0, 0}).empty());
}

// 120 slots pass the gate: two chunks of 50 commit and 20 stay staged.
void TestCancelRunningBatchCommitsStagedBarcodes() {
  auto         gate = std::make_shared<GatedGenerator>(120);
  BatchFixture f(gate);

  auto created = f.engine->CreateBatch(AdminContext(), f.Request(200));
  f.engine->StartBatch(AdminContext(), created.id);
  assert(gate->WaitHeld(4));
  assert(f.engine->GetBatch(AdminContext(), created.id).generated_count == 100);

  auto cancelled = f.engine->CancelBatch(AdminContext(), created.id, "storefront closed", false);
  gate->Open();

  assert(cancelled.status == BatchStatus::kCancelled);
  assert(cancelled.generated_count > 100);
  assert(cancelled.generated_count <= 120);
  assert(cancelled.generated_count == cancelled.successful_count + cancelled.failed_count);
  assert(f.engine->ListBarcodes(AdminContext(), created.id, Pagination{0, 0}).size() == cancelled.successful_count);

  // Workers released after the cancel write nothing more.
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  auto after = f.engine->GetBatch(AdminContext(), created.id);
  assert(after.status == BatchStatus::kCancelled);
  assert(after.generated_count == cancelled.generated_count);
  assert(f.engine->ListBarcodes(AdminContext(), created.id, Pagination{0, 0}).size() == after.successful_count);
}

void TestForceCancelDropsStagedBarcodes() {
  auto         gate = std::make_shared<GatedGenerator>(120);
  BatchFixture f(gate);

  auto created = f.engine->CreateBatch(AdminContext(), f.Request(200));
  f.engine->StartBatch(AdminContext(), created.id);
  assert(gate->WaitHeld(4));

  auto cancelled = f.engine->CancelBatch(AdminContext(), created.id, "wrong product", true);
  gate->Open();

  assert(cancelled.status == BatchStatus::kCancelled);
  assert(cancelled.generated_count == 100);
  assert(cancelled.successful_count + cancelled.failed_count == 100);
  assert(cancelled.cancel_reason == "wrong product");

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  assert(f.engine->GetBatch(AdminContext(), created.id).generated_count == 100);
  assert(f.engine->ListBarcodes(AdminContext(), created.id, Pagination{0, 0}).size() == 100);
  assert(Throws<warranty::util::InvalidState>([&] { f.engine->CancelBatch(AdminContext(), created.id, "again", true); }));
}

void TestTransientCommitErrorsAreRetried() {
  auto         store = std::make_shared<FaultInjectingRepository>(std::make_shared<warranty::db::memory::MemoryRepository>());
  BatchFixture f(std::make_shared<EntropyBarcodeGenerator>(), BatchFixture::SmallChunks(), store);

  store->FailChunkInserts(ErrorCode::Busy, 2, "database is locked");
  auto busy = f.engine->CreateBatch(AdminContext(), f.Request(10));
  f.engine->StartBatch(AdminContext(), busy.id);
  auto done = f.WaitTerminal(busy.id);

  assert(done.status == BatchStatus::kCompleted);
  assert(done.successful_count == 10);
  assert(done.retry_count == 2);
  assert(store->ChunkInsertCalls() == 3);
  assert(f.engine->ListBarcodes(AdminContext(), busy.id, Pagination{0, 0}).size() == 10);

  store->FailChunkInserts(ErrorCode::Conflict, 1, "row version moved");
  auto conflict = f.engine->CreateBatch(AdminContext(), f.Request(10));
  f.engine->StartBatch(AdminContext(), conflict.id);
  done = f.WaitTerminal(conflict.id);

  assert(done.status == BatchStatus::kCompleted);
  assert(done.retry_count == 1);
  assert(done.last_error.empty());
}

void TestPermanentStoreErrorFailsTheBatch() {
  auto         store = std::make_shared<FaultInjectingRepository>(std::make_shared<warranty::db::memory::MemoryRepository>());
  BatchFixture f(std::make_shared<EntropyBarcodeGenerator>(), BatchFixture::SmallChunks(), store);

  store->FailChunkInserts(ErrorCode::ConstraintViolation, -1, "barcode check constraint violated");
  auto created = f.engine->CreateBatch(AdminContext(), f.Request(10));
  f.engine->StartBatch(AdminContext(), created.id);
  auto done = f.WaitTerminal(created.id);

  assert(done.status == BatchStatus::kFailed);
  assert(done.last_error == "barcode check constraint violated");
  assert(done.generated_count == 0);
  assert(done.retry_count == 0);
  assert(store->ChunkInsertCalls() == 1);
  assert(f.engine->ListBarcodes(AdminContext(), created.id, Pagination{0, 0}).empty());

  // A transient error that outlasts the retry budget fails the batch too.
  store->FailChunkInserts(ErrorCode::Busy, -1, "database is locked");
  auto stuck = f.engine->CreateBatch(AdminContext(), f.Request(10));
  f.engine->StartBatch(AdminContext(), stuck.id);
  done = f.WaitTerminal(stuck.id);

  assert(done.status == BatchStatus::kFailed);
  assert(done.last_error == "database is locked");
  assert(f.engine->ListBarcodes(AdminContext(), stuck.id, Pagination{0, 0}).empty());
}

void TestCancelUnknownBatch() {
  BatchFixture f;
  assert(Throws<warranty::util::NotFound>([&] { f.engine->CancelBatch(AdminContext(), "9b2f1c1e-0000-4000-8000-000000000000", "x", false); }));
}

void TestCompletionNotifiesCreator() {
  BatchFixture f;

  auto req               = f.Request(5);
  req.notify_on_complete = true;
  auto created           = f.engine->CreateBatch(AdminContext(), req);
  f.engine->StartBatch(AdminContext(), created.id);
  f.WaitTerminal(created.id);

  // The notification follows the terminal write; give the worker a moment.
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (f.h.notifier->Count("batch_completed") == 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  auto sent = f.h.notifier->Sent();
  assert(sent.size() == 1);
  assert(sent[0].recipient == "admin-1");
  assert(sent[0].payload.at("batch_number") == created.batch_number);
}

void TestInterruptedBatchResumesFromCommittedCount() {
  WarrantyHarness h;

  // A batch that committed 4 of 10 before the process went away.
  BatchRecord record;
  record.id                 = warranty::util::NewId();
  record.batch_number       = "BATCH-2024-000009";
  record.product_id         = "prod-phone";
  record.storefront_id      = "store-1";
  record.created_by         = "admin-1";
  record.requested_quantity = 10;
  record.generated_count    = 4;
  record.successful_count   = 4;
  record.prefix             = "RES";
  record.expiry_months      = 12;
  record.status             = BatchStatus::kInProgress;
  record.entropy_seed       = 1;
  {
    auto tx = h.repository->Begin();
    assert(h.repository->InsertBatch(*tx, record));
    tx->Commit();
  }

  auto engine = std::make_shared<BatchEngine>(h.repository, h.catalog, h.notifier, h.clock, std::make_shared<EntropyBarcodeGenerator>(),
                                              BatchFixture::SmallChunks());
  engine->StartWorkers();
  assert(engine->ResumeInterrupted() == 1);

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(30);
  BatchRecord done;
  while (std::chrono::steady_clock::now() < deadline) {
    done = engine->GetBatch(AdminContext(), record.id);
    if (done.status != BatchStatus::kInProgress) break;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  assert(done.status == BatchStatus::kCompleted);
  assert(done.generated_count == 10);
  assert(done.successful_count == 10);
  assert(done.entropy_seed != 1);
  assert(engine->ListBarcodes(AdminContext(), record.id, Pagination{0, 0}).size() == 6);
  engine->Shutdown();
}

void TestStatisticsScores() {
  BatchRecord b;
  b.requested_quantity = 1000;
  b.generated_count    = 1000;
  b.successful_count   = 1000;
  b.generation_time_ms = 2000;

  auto clean = BatchEngine::Statistics(b);
  assert(clean.success_rate == 100.0);
  assert(clean.collision_rate == 0.0);
  assert(clean.average_generation_ms == 2.0);
  assert(clean.performance_score == "EXCELLENT");
  assert(clean.security_score == "EXCELLENT");
  assert(clean.recommended_action == "continue");

  b.successful_count = 960;
  b.failed_count     = 40;
  auto fair          = BatchEngine::Statistics(b);
  assert(fair.performance_score == "FAIR");

  b.successful_count = 900;
  auto poor          = BatchEngine::Statistics(b);
  assert(poor.performance_score == "POOR");
}

} // namespace

int main() {
  TestCreateValidatesEveryField();
  TestCreateRequiresAdmin();
  TestCreateAllocatesSequentialNumbers();
  TestBatchCompletesWithUniqueWellFormedBarcodes();
  TestStartIsIdempotentForRunningOrFinishedBatch();
  TestInBatchCollisionsAreRegenerated();
  TestStoreCollisionsAreRegenerated();
  TestExhaustedRetriesFailTheBatch();
  TestCancelPendingBatch();
  TestCancelRunningBatchCommitsStagedBarcodes();
  TestForceCancelDropsStagedBarcodes();
  TestTransientCommitErrorsAreRetried();
  TestPermanentStoreErrorFailsTheBatch();
  TestCancelUnknownBatch();
  TestCompletionNotifiesCreator();
  TestInterruptedBatchResumesFromCommittedCount();
  TestStatisticsScores();

  std::cout << "warranty_core_batch_engine: pass\n";
  return 0;
}
