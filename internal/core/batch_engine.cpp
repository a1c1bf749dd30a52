#include "batch_engine.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>

#include "db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace warranty::core {

using warranty::model::BatchStatus;
using warranty::model::CollisionResolution;
using warranty::model::CollisionType;

namespace {

constexpr uint32_t    kMaxQuantity        = 100000;
constexpr int32_t     kMaxExpiryMonths    = 120;
constexpr uint32_t    kMaxRetriesCeiling  = 10;
constexpr uint32_t    kMaxChunkSize       = 1000;
constexpr std::size_t kMaxProgressSamples = 16;

// Collision-rate thresholds, percent of attempts.
constexpr double kCollisionWarningPct  = 0.01;
constexpr double kCollisionCriticalPct = 0.1;

std::string ToUpper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return value;
}

std::vector<std::string> LegalBatchActions(BatchStatus status) {
  switch (status) {
    case BatchStatus::kPending:
      return {"start", "cancel"};
    case BatchStatus::kInProgress:
      return {"cancel"};
    default:
      return {};
  }
}

std::string CurrentStep(BatchStatus status, bool running) {
  switch (status) {
    case BatchStatus::kPending:
      return "queued";
    case BatchStatus::kInProgress:
      return running ? "generating" : "awaiting_resume";
    default:
      return std::string(warranty::model::ToString(status));
  }
}

} // namespace

// ---------------------------------------------------------------------------
// BatchJob
// ---------------------------------------------------------------------------

BatchJob::BatchJob(const db::model::BatchRecord& record, int year_, uint64_t started_ms_)
    : batch_id(record.id),
      batch_number(record.batch_number),
      product_id(record.product_id),
      storefront_id(record.storefront_id),
      created_by(record.created_by),
      prefix(record.prefix),
      expiry_months(record.expiry_months),
      notify_on_complete(record.notify_on_complete),
      year(year_),
      seed(record.entropy_seed),
      max_retries(record.max_retries),
      requested(record.requested_quantity),
      first_slot(std::min(record.generated_count, record.requested_quantity)),
      started_ms(started_ms_),
      base_generation_ms(record.generation_time_ms),
      generated(record.generated_count),
      successful(record.successful_count),
      failed(record.failed_count),
      error_count(record.error_count),
      collision_count(record.collision_count),
      retry_count(record.retry_count) {
  AddSample(started_ms_, record.generated_count);
}

void BatchJob::AddSample(uint64_t at_ms, uint32_t generated_total) {
  std::lock_guard lock(samples_mutex_);
  samples_.emplace_back(at_ms, generated_total);
  while (samples_.size() > kMaxProgressSamples) samples_.pop_front();
}

std::vector<std::pair<uint64_t, uint32_t>> BatchJob::Samples() const {
  std::lock_guard lock(samples_mutex_);
  return {samples_.begin(), samples_.end()};
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

BatchEngine::BatchEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<ProductCatalog> catalog, std::shared_ptr<Notifier> notifier,
                         std::shared_ptr<util::Clock> clock, std::shared_ptr<BarcodeGenerator> generator, BatchEngineOptions options)
    : repository_(std::move(repository)),
      catalog_(std::move(catalog)),
      notifier_(std::move(notifier)),
      clock_(std::move(clock)),
      generator_(std::move(generator)),
      options_(options),
      detector_(repository_) {
  options_.commit_chunk_size = std::clamp<uint32_t>(options_.commit_chunk_size, 1, kMaxChunkSize);
  options_.worker_threads    = std::max<uint32_t>(options_.worker_threads, 1);
  options_.max_retries       = std::min(options_.max_retries, kMaxRetriesCeiling);
  slots_                     = std::make_shared<batch::SlotQueue>(options_.queue_capacity);
}

BatchEngine::~BatchEngine() {
  Shutdown();
}

void BatchEngine::StartWorkers() {
  std::lock_guard lock(mutex_);
  if (running_) return;
  running_ = true;

  for (uint32_t i = 0; i < options_.worker_threads; ++i) {
    auto worker = std::make_unique<batch::BatchWorker>(slots_, this);
    worker->Start();
    workers_.push_back(std::move(worker));
  }
  dispatcher_ = std::thread(&BatchEngine::Dispatch, this);
}

void BatchEngine::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    if (!running_ || stopping_) return;
    stopping_ = true;
  }
  jobs_cv_.notify_all();
  slots_->Shutdown();

  if (dispatcher_.joinable()) dispatcher_.join();
  for (auto& worker : workers_) worker->Stop();
  workers_.clear();

  std::lock_guard lock(mutex_);
  pending_jobs_.clear();
  active_jobs_.clear();
  running_ = false;
}

void BatchEngine::Dispatch() {
  while (true) {
    std::shared_ptr<BatchJob> job;
    {
      std::unique_lock lock(mutex_);
      jobs_cv_.wait(lock, [&] { return stopping_ || !pending_jobs_.empty(); });
      if (stopping_) return;
      job = std::move(pending_jobs_.front());
      pending_jobs_.pop_front();
    }

    for (uint32_t slot = job->first_slot; slot < job->requested; ++slot) {
      if (job->cancel_requested || job->closed) break;
      if (!slots_->Enqueue(batch::SlotTask{job, slot})) return;
    }
  }
}

void BatchEngine::Schedule(const db::model::BatchRecord& record) {
  auto job = std::make_shared<BatchJob>(record, util::YearOf(clock_->Now()), util::ToUnixMillis(clock_->Now()));
  {
    std::lock_guard lock(mutex_);
    if (active_jobs_.contains(record.id)) return;
    active_jobs_.emplace(record.id, job);
  }

  if (job->SlotCount() == 0) {
    std::lock_guard commit_lock(job->commit_mutex);
    FinishLocked(*job);
    return;
  }

  {
    std::lock_guard lock(mutex_);
    pending_jobs_.push_back(job);
  }
  jobs_cv_.notify_one();
}

void BatchEngine::Release(const std::string& batch_id) {
  std::lock_guard lock(mutex_);
  active_jobs_.erase(batch_id);
}

std::shared_ptr<BatchJob> BatchEngine::FindJob(const std::string& batch_id) const {
  std::lock_guard lock(mutex_);
  auto            it = active_jobs_.find(batch_id);
  return it == active_jobs_.end() ? nullptr : it->second;
}

std::size_t BatchEngine::ResumeInterrupted() {
  db::BatchFilter filter;
  filter.status = BatchStatus::kInProgress;

  std::vector<db::model::BatchRecord> interrupted;
  try {
    auto tx     = repository_->Begin();
    interrupted = repository_->ListBatches(*tx, filter, db::Pagination{0, 0});
    for (auto& record : interrupted) {
      record.entropy_seed  = DrawEntropySeed();
      record.updated_at_ms = util::ToUnixMillis(clock_->Now());
      ThrowIfDbError(repository_->UpdateBatch(*tx, record), "reseed batch " + record.id);
    }
    tx->Commit();
  } catch (const db::DbError& e) {
    ThrowDbError(e, "resume interrupted batches");
  }

  for (const auto& record : interrupted) {
    WARRANTY_LOG_INFO("resuming batch", {observability::StringField("batch_id", record.id),
                                         observability::StringField("batch_number", record.batch_number),
                                         observability::IntField("generated", record.generated_count),
                                         observability::IntField("requested", record.requested_quantity)});
    Schedule(record);
  }
  return interrupted.size();
}

// ---------------------------------------------------------------------------
// Public operations
// ---------------------------------------------------------------------------

db::model::BatchRecord BatchEngine::CreateBatch(const RequestContext& ctx, const CreateBatchRequest& request) {
  RequireRole(ctx, {kRoleAdmin});
  CheckDeadline(ctx, *clock_);

  const auto prefix = ToUpper(request.prefix);

  std::vector<util::FieldViolation> violations;
  if (request.quantity < 1 || request.quantity > kMaxQuantity) {
    violations.push_back({"quantity", "must be between 1 and 100000", std::to_string(request.quantity)});
  }
  if (!IsValidPrefix(prefix)) {
    violations.push_back({"prefix", "must be 2 to 10 letters", request.prefix});
  }
  if (request.expiry_months < 1 || request.expiry_months > kMaxExpiryMonths) {
    violations.push_back({"expiry_months", "must be between 1 and 120", std::to_string(request.expiry_months)});
  }
  if (request.product_id.empty()) {
    violations.push_back({"product_id", "is required", ""});
  }
  if (request.storefront_id.empty()) {
    violations.push_back({"storefront_id", "is required", ""});
  }
  if (request.max_retries && *request.max_retries > kMaxRetriesCeiling) {
    violations.push_back({"max_retries", "must be at most 10", std::to_string(*request.max_retries)});
  }
  if (violations.empty() && !catalog_->LookupProduct(request.product_id)) {
    violations.push_back({"product_id", "unknown product", request.product_id});
  }
  if (!violations.empty()) {
    throw util::InvalidArgument("invalid batch request", std::move(violations));
  }

  const auto now    = clock_->Now();
  const auto now_ms = util::ToUnixMillis(now);

  db::model::BatchRecord record;
  record.id                 = util::NewId();
  record.product_id         = request.product_id;
  record.storefront_id      = request.storefront_id;
  record.created_by         = ctx.caller.actor_id;
  record.requested_quantity = request.quantity;
  record.max_retries        = request.max_retries.value_or(options_.max_retries);
  record.prefix             = prefix;
  record.description        = request.description;
  record.tags               = request.tags;
  record.notify_on_complete = request.notify_on_complete;
  record.expiry_months      = request.expiry_months;
  record.priority           = request.priority;
  record.status             = BatchStatus::kPending;
  record.entropy_seed       = DrawEntropySeed();
  record.created_at_ms      = now_ms;
  record.updated_at_ms      = now_ms;

  try {
    auto     tx  = repository_->Begin();
    uint64_t seq = 0;
    ThrowIfDbError(repository_->NextSequence(*tx, "batch", util::YearOf(now), seq), "allocate batch number");
    record.batch_number = FormatSequenceNumber("BATCH", util::YearOf(now), seq);
    ThrowIfDbError(repository_->InsertBatch(*tx, record), "insert batch");
    tx->Commit();
  } catch (const db::DbError& e) {
    ThrowDbError(e, "create batch");
  }

  WARRANTY_LOG_INFO("batch created", {observability::StringField("batch_id", record.id),
                                      observability::StringField("batch_number", record.batch_number),
                                      observability::IntField("quantity", record.requested_quantity),
                                      observability::StringField("prefix", record.prefix)});
  return record;
}

db::model::BatchRecord BatchEngine::StartBatch(const RequestContext& ctx, const std::string& batch_id) {
  RequireRole(ctx, {kRoleAdmin});
  CheckDeadline(ctx, *clock_);

  db::model::BatchRecord record;
  try {
    auto tx   = repository_->Begin();
    auto row  = repository_->GetBatch(*tx, batch_id);
    if (!row) throw util::NotFound("batch not found: " + batch_id);
    record = *row;

    if (record.status == BatchStatus::kInProgress || record.status == BatchStatus::kCompleted) {
      tx->Rollback();
      return record;
    }
    if (record.status != BatchStatus::kPending) {
      throw util::InvalidState("batch is " + std::string(warranty::model::ToString(record.status)),
                               std::string(warranty::model::ToString(record.status)), LegalBatchActions(record.status));
    }

    const auto now_ms    = util::ToUnixMillis(clock_->Now());
    record.status        = BatchStatus::kInProgress;
    record.started_at_ms = now_ms;
    record.updated_at_ms = now_ms;
    ThrowIfDbError(repository_->UpdateBatch(*tx, record), "start batch");
    tx->Commit();
  } catch (const db::DbError& e) {
    ThrowDbError(e, "start batch");
  }

  WARRANTY_LOG_INFO("batch started", {observability::StringField("batch_id", record.id),
                                      observability::StringField("batch_number", record.batch_number),
                                      observability::IntField("requested", record.requested_quantity)});
  Schedule(record);
  return record;
}

db::model::BatchRecord BatchEngine::CancelBatch(const RequestContext& ctx, const std::string& batch_id, const std::string& reason, bool force) {
  RequireRole(ctx, {kRoleAdmin});
  CheckDeadline(ctx, *clock_);

  auto job = FindJob(batch_id);

  std::unique_lock<std::mutex> commit_lock;
  if (job) {
    job->cancel_requested = true;
    if (force) job->interrupted = true;

    commit_lock = std::unique_lock(job->commit_mutex);
    if (!job->closed) {
      if (force) {
        for (const auto& s : job->staged) job->reservations.Release(s.barcode);
        job->staged.clear();
      }
      // Failures and collisions already counted stay durable either way.
      CommitChunkLocked(*job);
      job->closed = true;
    }
  }

  db::model::BatchRecord record;
  try {
    auto tx  = repository_->Begin();
    auto row = repository_->GetBatch(*tx, batch_id);
    if (!row) throw util::NotFound("batch not found: " + batch_id);
    record = *row;

    if (warranty::model::IsTerminal(record.status)) {
      throw util::InvalidState("batch is " + std::string(warranty::model::ToString(record.status)),
                               std::string(warranty::model::ToString(record.status)), {});
    }

    const auto now_ms      = util::ToUnixMillis(clock_->Now());
    record.status          = BatchStatus::kCancelled;
    record.cancelled_at_ms = now_ms;
    record.cancelled_by    = ctx.caller.actor_id;
    record.cancel_reason   = reason;
    record.updated_at_ms   = now_ms;
    ThrowIfDbError(repository_->UpdateBatch(*tx, record), "cancel batch");
    tx->Commit();
  } catch (const db::DbError& e) {
    ThrowDbError(e, "cancel batch");
  }

  if (job) {
    commit_lock.unlock();
    Release(batch_id);
  }

  WARRANTY_LOG_INFO("batch cancelled", {observability::StringField("batch_id", record.id),
                                        observability::StringField("reason", reason),
                                        observability::BoolField("force", force),
                                        observability::IntField("generated", record.generated_count)});
  return record;
}

db::model::BatchRecord BatchEngine::LoadBatch(const std::string& batch_id) {
  try {
    auto tx  = repository_->Begin();
    auto row = repository_->GetBatch(*tx, batch_id);
    tx->Rollback();
    if (!row) throw util::NotFound("batch not found: " + batch_id);
    return *row;
  } catch (const db::DbError& e) {
    ThrowDbError(e, "load batch");
  }
}

db::model::BatchRecord BatchEngine::GetBatch(const RequestContext& ctx, const std::string& batch_id) {
  RequireRole(ctx, {kRoleAdmin, kRoleAgent});
  return LoadBatch(batch_id);
}

BatchProgress BatchEngine::GetProgress(const RequestContext& ctx, const std::string& batch_id) {
  RequireRole(ctx, {kRoleAdmin, kRoleAgent});

  BatchProgress progress;
  progress.batch = LoadBatch(batch_id);
  const auto& b  = progress.batch;
  auto        job = FindJob(batch_id);

  progress.processed        = b.generated_count;
  progress.remaining        = b.requested_quantity - std::min(b.generated_count, b.requested_quantity);
  progress.progress_percent = b.requested_quantity == 0 ? 0.0 : 100.0 * b.generated_count / b.requested_quantity;
  if (b.status == BatchStatus::kCompleted) progress.progress_percent = 100.0;
  progress.current_step    = CurrentStep(b.status, job != nullptr);
  progress.last_updated_ms = b.updated_at_ms;

  if (job) {
    const auto samples = job->Samples();
    if (samples.size() >= 2) {
      const auto& [t0, g0] = samples.front();
      const auto& [t1, g1] = samples.back();
      if (t1 > t0 && g1 > g0) {
        progress.items_per_second = (g1 - g0) * 1000.0 / static_cast<double>(t1 - t0);
      }
    }
    if (progress.items_per_second > 0.0 && b.status == BatchStatus::kInProgress) {
      const auto now_ms                = util::ToUnixMillis(clock_->Now());
      progress.estimated_completion_ms = now_ms + static_cast<uint64_t>(progress.remaining * 1000.0 / progress.items_per_second);
    }
  } else if (b.generation_time_ms > 0) {
    progress.items_per_second = b.generated_count * 1000.0 / static_cast<double>(b.generation_time_ms);
  }
  return progress;
}

std::vector<db::model::BatchRecord> BatchEngine::ListBatches(const RequestContext& ctx, const db::BatchFilter& filter, const db::Pagination& page) {
  RequireRole(ctx, {kRoleAdmin, kRoleAgent});
  try {
    auto tx   = repository_->Begin();
    auto rows = repository_->ListBatches(*tx, filter, page);
    tx->Rollback();
    return rows;
  } catch (const db::DbError& e) {
    ThrowDbError(e, "list batches");
  }
}

std::vector<db::model::CollisionRecord> BatchEngine::ListCollisions(const RequestContext& ctx, const std::string& batch_id, const db::Pagination& page) {
  RequireRole(ctx, {kRoleAdmin, kRoleAgent});
  LoadBatch(batch_id);
  try {
    auto tx   = repository_->Begin();
    auto rows = repository_->ListCollisions(*tx, batch_id, page);
    tx->Rollback();
    return rows;
  } catch (const db::DbError& e) {
    ThrowDbError(e, "list collisions");
  }
}

std::vector<db::model::BarcodeRecord> BatchEngine::ListBarcodes(const RequestContext& ctx, const std::string& batch_id, const db::Pagination& page) {
  RequireRole(ctx, {kRoleAdmin, kRoleAgent});
  LoadBatch(batch_id);
  try {
    auto tx   = repository_->Begin();
    auto rows = repository_->ListBarcodesByBatch(*tx, batch_id, page);
    tx->Rollback();
    return rows;
  } catch (const db::DbError& e) {
    ThrowDbError(e, "list batch barcodes");
  }
}

BatchStatistics BatchEngine::Statistics(const db::model::BatchRecord& batch) {
  BatchStatistics stats;
  if (batch.requested_quantity > 0) {
    stats.success_rate = 100.0 * batch.successful_count / batch.requested_quantity;
  }
  const uint64_t attempts = static_cast<uint64_t>(batch.generated_count) + batch.collision_count;
  if (attempts > 0) {
    stats.collision_rate = 100.0 * batch.collision_count / static_cast<double>(attempts);
  }
  if (batch.generated_count > 0) {
    stats.average_generation_ms = static_cast<double>(batch.generation_time_ms) / batch.generated_count;
  }

  if (stats.collision_rate > kCollisionCriticalPct) {
    stats.security_score     = "POOR";
    stats.recommended_action = "review_algorithm";
  } else if (stats.collision_rate > kCollisionWarningPct) {
    stats.security_score     = "GOOD";
    stats.recommended_action = "monitor";
  } else {
    stats.security_score     = "EXCELLENT";
    stats.recommended_action = "continue";
  }

  if (stats.success_rate >= 99.9) {
    stats.performance_score = "EXCELLENT";
  } else if (stats.success_rate >= 99.0) {
    stats.performance_score = "GOOD";
  } else if (stats.success_rate >= 95.0) {
    stats.performance_score = "FAIR";
  } else {
    stats.performance_score = "POOR";
  }
  return stats;
}

// ---------------------------------------------------------------------------
// Slot processing
// ---------------------------------------------------------------------------

db::model::CollisionRecord BatchEngine::MakeCollision(const BatchJob& job, const std::string& candidate, CollisionType type, uint32_t slot,
                                                      uint32_t attempt) {
  const auto now_ms = util::ToUnixMillis(clock_->Now());

  db::model::CollisionRecord c;
  c.id             = util::NewId();
  c.batch_id       = job.batch_id;
  c.candidate      = candidate;
  c.type           = type;
  c.resolution     = attempt < job.max_retries ? CollisionResolution::kRegenerated : CollisionResolution::kDropped;
  c.slot           = slot;
  c.attempt        = attempt;
  c.detected_at_ms = now_ms;
  c.resolved_at_ms = now_ms;

  observability::Metrics::Instance().RecordCollision(warranty::model::ToString(type));
  return c;
}

std::optional<StagedBarcode> BatchEngine::GenerateSlot(BatchJob& job, uint32_t slot, uint32_t first_attempt,
                                                       std::vector<db::model::CollisionRecord>& collisions) {
  for (uint32_t attempt = first_attempt; attempt <= job.max_retries; ++attempt) {
    if (job.interrupted) return std::nullopt;

    auto candidate = generator_->Generate(GeneratorInput{job.prefix, job.year, job.seed, slot, attempt});
    auto collision = detector_.Check(job.reservations, candidate);
    if (!collision) {
      return StagedBarcode{slot, attempt, std::move(candidate)};
    }
    collisions.push_back(MakeCollision(job, candidate, *collision, slot, attempt));
  }

  WARRANTY_LOG_WARN("collision retry budget exhausted", {observability::StringField("batch_id", job.batch_id),
                                                          observability::IntField("slot", slot),
                                                          observability::IntField("max_retries", job.max_retries)});
  return std::nullopt;
}

void BatchEngine::ProcessSlot(const batch::SlotTask& task) {
  auto& job = *task.job;
  if (job.closed || job.cancel_requested) return;

  std::vector<db::model::CollisionRecord> collisions;
  std::optional<StagedBarcode>            outcome;
  std::string                             error = "collision retry budget exhausted";
  try {
    outcome = GenerateSlot(job, task.slot, 0, collisions);
  } catch (const std::exception& e) {
    error = e.what();
    WARRANTY_LOG_WARN("barcode slot failed", {observability::StringField("batch_id", job.batch_id),
                                               observability::IntField("slot", task.slot),
                                               observability::StringField("error", error)});
  }

  std::lock_guard lock(job.commit_mutex);
  if (job.closed) {
    if (outcome) job.reservations.Release(outcome->barcode);
    return;
  }
  if (job.interrupted) return;

  job.collisions.insert(job.collisions.end(), std::make_move_iterator(collisions.begin()), std::make_move_iterator(collisions.end()));
  if (outcome) {
    job.staged.push_back(std::move(*outcome));
  } else {
    ++job.pending_failures;
    job.last_error = error;
  }
  ++job.resolved;

  const bool last = job.resolved >= job.SlotCount();

  if (HardFailureCrossed(job)) {
    if (CommitChunkLocked(job)) FailLocked(job, "hard failure threshold exceeded");
    return;
  }
  if (job.staged.size() >= options_.commit_chunk_size || last) {
    if (!CommitChunkLocked(job)) return;
  }
  if (last) FinishLocked(job);
}

bool BatchEngine::HardFailureCrossed(const BatchJob& job) const {
  const double failures = static_cast<double>(job.failed) + job.pending_failures;
  return failures > options_.hard_failure_ratio * job.requested;
}

// ---------------------------------------------------------------------------
// Chunk commit
// ---------------------------------------------------------------------------

db::Result BatchEngine::WriteChunkLocked(BatchJob& job) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetBatch(*tx, job.batch_id);
  if (!record) return db::Result::Err(db::ErrorCode::NotFound, "batch vanished: " + job.batch_id);

  if (record->status != BatchStatus::kInProgress) {
    job.closed = true;
    return db::Result::Ok();
  }

  const auto now_ms = util::ToUnixMillis(clock_->Now());

  std::vector<db::model::BarcodeRecord> rows;
  rows.reserve(job.staged.size());
  for (const auto& s : job.staged) {
    db::model::BarcodeRecord b;
    b.id                     = util::NewId();
    b.barcode                = s.barcode;
    b.product_id             = job.product_id;
    b.batch_id               = job.batch_id;
    b.storefront_id          = job.storefront_id;
    b.status                 = warranty::model::BarcodeStatus::kGenerated;
    b.warranty_period_months = job.expiry_months;
    b.created_at_ms          = now_ms;
    b.updated_at_ms          = now_ms;
    rows.push_back(std::move(b));
  }

  if (!rows.empty()) {
    if (auto r = repository_->InsertBarcodes(*tx, rows); !r) return r;
  }
  for (const auto& c : job.collisions) {
    if (auto r = repository_->InsertCollision(*tx, c); !r) return r;
  }

  const auto added = static_cast<uint32_t>(job.staged.size());
  record->generated_count    = job.generated + added + job.pending_failures;
  record->successful_count   = job.successful + added;
  record->failed_count       = job.failed + job.pending_failures;
  record->error_count        = job.error_count + job.pending_failures;
  record->collision_count    = job.collision_count + static_cast<uint32_t>(job.collisions.size());
  record->retry_count        = job.retry_count + job.pending_retries;
  record->generation_time_ms = job.base_generation_ms + (now_ms > job.started_ms ? now_ms - job.started_ms : 0);
  record->updated_at_ms      = now_ms;
  if (job.pending_failures > 0) record->last_error = job.last_error;

  if (auto r = repository_->UpdateBatch(*tx, *record); !r) return r;
  tx->Commit();
  return db::Result::Ok();
}

void BatchEngine::RegenerateStoreDuplicatesLocked(BatchJob& job) {
  for (auto it = job.staged.begin(); it != job.staged.end();) {
    bool exists = false;
    try {
      exists = detector_.ExistsInStore(it->barcode);
    } catch (const std::exception& e) {
      WARRANTY_LOG_WARN("collision recheck failed", {observability::StringField("batch_id", job.batch_id),
                                                      observability::StringField("error", e.what())});
      return;
    }
    if (!exists) {
      ++it;
      continue;
    }

    job.reservations.Release(it->barcode);
    job.collisions.push_back(MakeCollision(job, it->barcode, CollisionType::kDuplicateInStore, it->slot, it->attempt));

    std::optional<StagedBarcode> replacement;
    try {
      replacement = GenerateSlot(job, it->slot, it->attempt + 1, job.collisions);
    } catch (const std::exception& e) {
      job.last_error = e.what();
    }

    if (replacement) {
      *it = std::move(*replacement);
      ++it;
    } else {
      ++job.pending_failures;
      if (job.last_error.empty()) job.last_error = "collision retry budget exhausted";
      it = job.staged.erase(it);
    }
  }
}

bool BatchEngine::CommitChunkLocked(BatchJob& job) {
  if (job.staged.empty() && job.pending_failures == 0 && job.collisions.empty()) return true;

  const auto started = std::chrono::steady_clock::now();

  for (uint32_t attempt = 0;; ++attempt) {
    db::Result result;
    try {
      result = WriteChunkLocked(job);
    } catch (const db::DbError& e) {
      result = db::Result::Err(e.Code(), e.what());
    }

    if (result) {
      if (job.closed) return false;

      const auto added = static_cast<uint32_t>(job.staged.size());
      job.generated += added + job.pending_failures;
      job.successful += added;
      job.failed += job.pending_failures;
      job.error_count += job.pending_failures;
      job.collision_count += static_cast<uint32_t>(job.collisions.size());
      job.retry_count += job.pending_retries;
      job.staged.clear();
      job.collisions.clear();
      job.pending_failures = 0;
      job.pending_retries  = 0;
      job.AddSample(util::ToUnixMillis(clock_->Now()), job.generated);

      const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
      observability::Metrics::Instance().AddBarcodesGenerated(added);
      observability::Metrics::Instance().ObserveChunkCommitMs(elapsed);
      WARRANTY_LOG_DEBUG("batch chunk committed", {observability::StringField("batch_id", job.batch_id),
                                                   observability::IntField("added", added),
                                                   observability::IntField("generated", job.generated)});
      return true;
    }

    if (attempt < job.max_retries) {
      if (result.code == db::ErrorCode::AlreadyExists) {
        RegenerateStoreDuplicatesLocked(job);
        continue;
      }
      if (db::IsTransient(result.code)) {
        ++job.pending_retries;
        WARRANTY_LOG_WARN("batch chunk commit retry", {observability::StringField("batch_id", job.batch_id),
                                                        observability::IntField("attempt", attempt + 1),
                                                        observability::StringField("code", db::ToString(result.code)),
                                                        observability::StringField("error", result.message)});
        std::this_thread::sleep_for(std::chrono::milliseconds(options_.retry_backoff_ms * (attempt + 1)));
        continue;
      }
    }

    FailLocked(job, result.message.empty() ? db::ToString(result.code) : result.message);
    return false;
  }
}

void BatchEngine::FinishLocked(BatchJob& job) {
  job.closed = true;

  db::model::BatchRecord record;
  for (uint32_t attempt = 0;; ++attempt) {
    try {
      auto tx  = repository_->Begin();
      auto row = repository_->GetBatch(*tx, job.batch_id);
      if (!row || row->status != BatchStatus::kInProgress) {
        Release(job.batch_id);
        return;
      }
      record                 = *row;
      const auto now_ms      = util::ToUnixMillis(clock_->Now());
      record.status          = BatchStatus::kCompleted;
      record.completed_at_ms = now_ms;
      record.updated_at_ms   = now_ms;
      if (auto r = repository_->UpdateBatch(*tx, record); !r) throw db::DbError(r.code, r.message);
      tx->Commit();
      break;
    } catch (const db::DbError& e) {
      if (!db::IsTransient(e.Code()) || attempt >= job.max_retries) {
        WARRANTY_LOG_ERROR("batch completion failed", {observability::StringField("batch_id", job.batch_id),
                                                        observability::StringField("error", e.what())});
        Release(job.batch_id);
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(options_.retry_backoff_ms * (attempt + 1)));
    }
  }

  Release(job.batch_id);
  WARRANTY_LOG_INFO("batch completed", {observability::StringField("batch_id", record.id),
                                        observability::StringField("batch_number", record.batch_number),
                                        observability::IntField("successful", record.successful_count),
                                        observability::IntField("failed", record.failed_count),
                                        observability::IntField("collisions", record.collision_count)});
  if (job.notify_on_complete) NotifyCompletion(job);
}

void BatchEngine::FailLocked(BatchJob& job, const std::string& error) {
  job.closed = true;
  for (const auto& s : job.staged) job.reservations.Release(s.barcode);
  job.staged.clear();

  try {
    auto tx  = repository_->Begin();
    auto row = repository_->GetBatch(*tx, job.batch_id);
    if (row && row->status == BatchStatus::kInProgress) {
      row->status        = BatchStatus::kFailed;
      row->last_error    = error;
      row->updated_at_ms = util::ToUnixMillis(clock_->Now());
      if (auto r = repository_->UpdateBatch(*tx, *row); !r) throw db::DbError(r.code, r.message);
      tx->Commit();
    }
  } catch (const db::DbError& e) {
    WARRANTY_LOG_ERROR("batch failure could not be recorded", {observability::StringField("batch_id", job.batch_id),
                                                                observability::StringField("error", e.what())});
  }

  Release(job.batch_id);
  WARRANTY_LOG_ERROR("batch failed", {observability::StringField("batch_id", job.batch_id), observability::StringField("error", error)});
}

void BatchEngine::NotifyCompletion(const BatchJob& job) {
  if (!notifier_) return;
  try {
    notifier_->Notify(job.created_by, "batch_completed",
                      {{"batch_id", job.batch_id}, {"batch_number", job.batch_number}, {"successful", std::to_string(job.successful)}});
  } catch (const std::exception& e) {
    WARRANTY_LOG_WARN("batch completion notification failed", {observability::StringField("batch_id", job.batch_id),
                                                                observability::StringField("error", e.what())});
  }
}

} // namespace warranty::core
