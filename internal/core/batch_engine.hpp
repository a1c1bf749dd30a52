#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include "collaborators.hpp"
#include "collision_detector.hpp"
#include "identifier_generator.hpp"
#include "internal/batch/batch_worker.hpp"
#include "internal/batch/slot_queue.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "request_context.hpp"

namespace warranty::core {

struct BatchEngineOptions {
  uint32_t    worker_threads     = 4;
  std::size_t queue_capacity     = 1024;
  uint32_t    commit_chunk_size  = 500;
  uint32_t    max_retries        = 3;
  double      hard_failure_ratio = 0.05;
  uint32_t    retry_backoff_ms   = 50;
};

struct CreateBatchRequest {
  std::string                          product_id;
  std::string                          storefront_id;
  uint32_t                             quantity = 0;
  std::string                          prefix;
  int32_t                              expiry_months = 0;
  warranty::model::BatchPriority       priority      = warranty::model::BatchPriority::kNormal;
  std::string                          description;
  std::vector<std::string>             tags;
  bool                                 notify_on_complete = false;
  std::optional<uint32_t>              max_retries;
};

struct BatchProgress {
  db::model::BatchRecord  batch;
  double                  progress_percent = 0.0;
  std::string             current_step;
  uint32_t                processed        = 0;
  uint32_t                remaining        = 0;
  double                  items_per_second = 0.0;
  uint64_t                last_updated_ms  = 0;
  std::optional<uint64_t> estimated_completion_ms;
};

struct BatchStatistics {
  double      success_rate          = 0.0; // percent
  double      collision_rate        = 0.0; // percent
  double      average_generation_ms = 0.0;
  std::string performance_score;
  std::string security_score;
  std::string recommended_action;
};

struct StagedBarcode {
  uint32_t    slot    = 0;
  uint32_t    attempt = 0;
  std::string barcode;
};

/*
  In-memory state of one running batch.

  commit_mutex is the per-batch lock: staging outcomes, committing a chunk
  and closing the job all happen under it, so the batch row only ever
  moves forward.
*/
class BatchJob {
 public:
  BatchJob(const db::model::BatchRecord& record, int year, uint64_t started_ms);

  const std::string batch_id;
  const std::string batch_number;
  const std::string product_id;
  const std::string storefront_id;
  const std::string created_by;
  const std::string prefix;
  const int32_t     expiry_months;
  const bool        notify_on_complete;
  const int         year;
  const uint64_t    seed;
  const uint32_t    max_retries;
  const uint32_t    requested;
  const uint32_t    first_slot;
  const uint64_t    started_ms;
  const uint64_t    base_generation_ms;

  BatchReservations reservations;

  std::atomic<bool> cancel_requested{false};
  std::atomic<bool> interrupted{false};
  std::atomic<bool> closed{false};

  std::mutex                              commit_mutex;
  std::vector<StagedBarcode>              staged;
  std::vector<db::model::CollisionRecord> collisions;
  uint32_t                                pending_failures = 0;
  uint32_t                                pending_retries  = 0;
  std::string                             last_error;
  uint32_t                                resolved = 0;

  // Committed totals, mirror the batch row.
  uint32_t generated       = 0;
  uint32_t successful      = 0;
  uint32_t failed          = 0;
  uint32_t error_count     = 0;
  uint32_t collision_count = 0;
  uint32_t retry_count     = 0;

  uint32_t SlotCount() const {
    return requested - first_slot;
  }

  void AddSample(uint64_t at_ms, uint32_t generated_total);

  // (unix ms, generated) pairs, oldest first.
  std::vector<std::pair<uint64_t, uint32_t>> Samples() const;

 private:
  mutable std::mutex                          samples_mutex_;
  std::deque<std::pair<uint64_t, uint32_t>>   samples_;
};

/*
  BatchEngine

  Runs barcode issuance batches:

    CreateBatch   pending row, BATCH-<year>-<seq> number
    StartBatch    pending -> in_progress, slots handed to the worker pool
    CancelBatch   cooperative; force also drops staged, uncommitted barcodes

  A dispatcher thread feeds slots of started batches into a bounded queue;
  BatchWorkers generate and check one candidate per slot and stage it on
  the job. Whoever stages the slot that fills a chunk commits it: barcodes,
  collision records and counters in one transaction.
*/
class BatchEngine {
 public:
  BatchEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<ProductCatalog> catalog, std::shared_ptr<Notifier> notifier,
              std::shared_ptr<util::Clock> clock, std::shared_ptr<BarcodeGenerator> generator, BatchEngineOptions options = {});
  ~BatchEngine();

  BatchEngine(const BatchEngine&)            = delete;
  BatchEngine& operator=(const BatchEngine&) = delete;

  void StartWorkers();
  void Shutdown();

  // Re-schedules every in_progress batch with a fresh seed. Returns the count.
  std::size_t ResumeInterrupted();

  db::model::BatchRecord CreateBatch(const RequestContext& ctx, const CreateBatchRequest& request);
  db::model::BatchRecord StartBatch(const RequestContext& ctx, const std::string& batch_id);
  db::model::BatchRecord CancelBatch(const RequestContext& ctx, const std::string& batch_id, const std::string& reason, bool force);
  db::model::BatchRecord GetBatch(const RequestContext& ctx, const std::string& batch_id);
  BatchProgress          GetProgress(const RequestContext& ctx, const std::string& batch_id);

  std::vector<db::model::BatchRecord>     ListBatches(const RequestContext& ctx, const db::BatchFilter& filter, const db::Pagination& page);
  std::vector<db::model::CollisionRecord> ListCollisions(const RequestContext& ctx, const std::string& batch_id, const db::Pagination& page);
  std::vector<db::model::BarcodeRecord>   ListBarcodes(const RequestContext& ctx, const std::string& batch_id, const db::Pagination& page);

  static BatchStatistics Statistics(const db::model::BatchRecord& batch);

  // Worker entry point.
  void ProcessSlot(const batch::SlotTask& task);

 private:
  void Dispatch();
  void Schedule(const db::model::BatchRecord& record);
  void Release(const std::string& batch_id);
  std::shared_ptr<BatchJob> FindJob(const std::string& batch_id) const;

  std::optional<StagedBarcode> GenerateSlot(BatchJob& job, uint32_t slot, uint32_t first_attempt,
                                            std::vector<db::model::CollisionRecord>& collisions);
  db::model::CollisionRecord   MakeCollision(const BatchJob& job, const std::string& candidate, warranty::model::CollisionType type,
                                             uint32_t slot, uint32_t attempt);

  bool       HardFailureCrossed(const BatchJob& job) const;
  bool       CommitChunkLocked(BatchJob& job);
  db::Result WriteChunkLocked(BatchJob& job);
  void       RegenerateStoreDuplicatesLocked(BatchJob& job);
  void       FinishLocked(BatchJob& job);
  void       FailLocked(BatchJob& job, const std::string& error);
  void       NotifyCompletion(const BatchJob& job);

  db::model::BatchRecord LoadBatch(const std::string& batch_id);

  std::shared_ptr<db::Repository>   repository_;
  std::shared_ptr<ProductCatalog>   catalog_;
  std::shared_ptr<Notifier>         notifier_;
  std::shared_ptr<util::Clock>      clock_;
  std::shared_ptr<BarcodeGenerator> generator_;
  BatchEngineOptions                options_;
  CollisionDetector                 detector_;

  std::shared_ptr<batch::SlotQueue>                  slots_;
  std::vector<std::unique_ptr<batch::BatchWorker>>   workers_;
  std::thread                                        dispatcher_;

  mutable std::mutex                                         mutex_;
  std::condition_variable                                    jobs_cv_;
  std::deque<std::shared_ptr<BatchJob>>                      pending_jobs_;
  std::unordered_map<std::string, std::shared_ptr<BatchJob>> active_jobs_;
  bool                                                       running_  = false;
  bool                                                       stopping_ = false;
};

} // namespace warranty::core
