#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"

#if WARRANTY_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if WARRANTY_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using warranty::db::ClaimFilter;
using warranty::db::DbError;
using warranty::db::ErrorCode;
using warranty::db::Pagination;
using warranty::db::Repository;
using warranty::db::TicketFilter;
using warranty::db::memory::MemoryRepository;
using warranty::db::model::AttachmentRecord;
using warranty::db::model::BarcodeEventRecord;
using warranty::db::model::BarcodeRecord;
using warranty::db::model::BarcodeStatus;
using warranty::db::model::BatchRecord;
using warranty::db::model::BatchStatus;
using warranty::db::model::ClaimRecord;
using warranty::db::model::ClaimStatus;
using warranty::db::model::CollisionRecord;
using warranty::db::model::IdempotencyRecord;
using warranty::db::model::PartUsage;
using warranty::db::model::RepairTicketRecord;
using warranty::db::model::ScanStatus;
using warranty::db::model::Severity;
using warranty::db::model::TicketStatus;
using warranty::db::model::TimelineEventRecord;
using warranty::db::model::TimelineEventType;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  // Two open writers may both proceed and the loser fails at Commit().
  bool optimistic_commit = false;
};

BarcodeRecord Barcode(const std::string& id, const std::string& value, const std::string& batch_id = "") {
  BarcodeRecord r;
  r.id                     = id;
  r.barcode                = value;
  r.product_id             = "prod-phone";
  r.batch_id               = batch_id;
  r.status                 = BarcodeStatus::kGenerated;
  r.warranty_period_months = 12;
  r.created_at_ms          = 1000;
  r.updated_at_ms          = 1000;
  return r;
}

ClaimRecord Claim(const std::string& id, const std::string& number, const std::string& barcode_id, const std::string& customer, uint64_t date_ms) {
  ClaimRecord c;
  c.id                = id;
  c.claim_number      = number;
  c.barcode_id        = barcode_id;
  c.barcode           = barcode_id;
  c.customer_id       = customer;
  c.product_id        = "prod-phone";
  c.issue_description = "Screen flickers after boot";
  c.claim_date_ms     = date_ms;
  c.created_at_ms     = date_ms;
  c.updated_at_ms     = date_ms;
  c.tags              = {"screen", "flicker"};
  return c;
}

void SeedBarcode(Repository& repo, const BarcodeRecord& r) {
  auto tx = repo.Begin();
  assert(repo.InsertBarcode(*tx, r));
  tx->Commit();
}

void VerifyBarcodeLifecycle(Repository& repo, const std::string& tag) {
  const auto id    = tag + "-bc-1";
  const auto value = "SSW-2024-" + tag + "A1";
  SeedBarcode(repo, Barcode(id, value));

  {
    auto tx = repo.Begin();
    auto dup = repo.InsertBarcode(*tx, Barcode(tag + "-bc-dup", value));
    assert(dup.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  auto tx = repo.Begin();
  assert(repo.BarcodeExists(*tx, value));
  assert(!repo.BarcodeExists(*tx, value + "Z"));

  auto by_value = repo.GetBarcodeByValue(*tx, value);
  assert(by_value.has_value());
  assert(by_value->id == id);
  assert(by_value->status == BarcodeStatus::kGenerated);

  auto active            = *by_value;
  active.status          = BarcodeStatus::kActive;
  active.customer_id     = "cust-alice";
  active.activated_at_ms = 2000;
  active.expiry_at_ms    = 3000;
  active.serial_number   = "SN-" + value;
  assert(repo.UpdateBarcode(*tx, active, BarcodeStatus::kGenerated));

  // Second activation loses the compare-and-set.
  auto again = repo.UpdateBarcode(*tx, active, BarcodeStatus::kGenerated);
  assert(again.code == ErrorCode::Conflict);

  auto ghost = Barcode(tag + "-bc-ghost", value + "G");
  assert(repo.UpdateBarcode(*tx, ghost, BarcodeStatus::kGenerated).code == ErrorCode::NotFound);

  BarcodeEventRecord ev{.id = tag + "-bev-1", .barcode_id = id, .actor_id = "cust-alice", .detail = "activated", .at_ms = 2000};
  ev.event = warranty::db::model::BarcodeEventType::kActivated;
  assert(repo.InsertBarcodeEvent(*tx, ev));
  tx->Commit();

  auto check = repo.Begin();
  auto stored = repo.GetBarcode(*check, id);
  assert(stored.has_value());
  assert(stored->status == BarcodeStatus::kActive);
  assert(stored->customer_id == "cust-alice");
  assert(stored->expiry_at_ms == 3000);
  assert(stored->serial_number == "SN-" + value);

  auto events = repo.ListBarcodeEvents(*check, id);
  assert(events.size() == 1);
  assert(events[0].event == warranty::db::model::BarcodeEventType::kActivated);
  check->Commit();
}

void VerifyBulkInsertIsAllOrNothing(Repository& repo, const std::string& tag) {
  const auto taken = "SSW-2024-" + tag + "B0";
  SeedBarcode(repo, Barcode(tag + "-bulk-0", taken));

  {
    auto tx = repo.Begin();
    std::vector<BarcodeRecord> chunk{Barcode(tag + "-bulk-1", "SSW-2024-" + tag + "B1"), Barcode(tag + "-bulk-2", taken)};
    auto res = repo.InsertBarcodes(*tx, chunk);
    assert(res.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  auto tx = repo.Begin();
  assert(!repo.BarcodeExists(*tx, "SSW-2024-" + tag + "B1"));
  tx->Commit();
}

void VerifyBatchesAndCollisions(Repository& repo, const std::string& tag) {
  BatchRecord batch;
  batch.id                 = tag + "-batch";
  batch.batch_number       = "BATCH-" + tag;
  batch.product_id         = "prod-" + tag;
  batch.created_by         = "agent-1";
  batch.requested_quantity = 3;
  batch.tags               = {"launch"};
  batch.created_at_ms      = 5000;
  batch.updated_at_ms      = 5000;

  {
    auto tx = repo.Begin();
    assert(repo.InsertBatch(*tx, batch));

    std::vector<BarcodeRecord> rows;
    for (int i = 0; i < 3; ++i) {
      rows.push_back(Barcode(tag + "-batch-bc-" + std::to_string(i), "SSW-2024-" + tag + "C" + std::to_string(i), batch.id));
    }
    assert(repo.InsertBarcodes(*tx, rows));

    CollisionRecord collision{.id = tag + "-col-1", .batch_id = batch.id, .candidate = "SSW-2024-" + tag + "C0", .slot = 1, .attempt = 1,
                              .detected_at_ms = 5001, .resolved_at_ms = 5002};
    assert(repo.InsertCollision(*tx, collision));

    batch.status           = BatchStatus::kCompleted;
    batch.generated_count  = 3;
    batch.successful_count = 3;
    batch.collision_count  = 1;
    assert(repo.UpdateBatch(*tx, batch));
    tx->Commit();
  }

  auto tx = repo.Begin();
  auto stored = repo.GetBatch(*tx, batch.id);
  assert(stored.has_value());
  assert(stored->status == BatchStatus::kCompleted);
  assert(stored->successful_count == 3);
  assert(stored->tags.size() == 1 && stored->tags[0] == "launch");

  assert(repo.ListBarcodesByBatch(*tx, batch.id, Pagination{}).size() == 3);
  auto page = repo.ListBarcodesByBatch(*tx, batch.id, Pagination{.limit = 2, .offset = 2});
  assert(page.size() == 1);
  assert(page[0].barcode == "SSW-2024-" + tag + "C2");

  warranty::db::BatchFilter filter;
  filter.product_id = batch.product_id;
  filter.status     = BatchStatus::kCompleted;
  assert(repo.ListBatches(*tx, filter, Pagination{}).size() == 1);
  filter.status = BatchStatus::kPending;
  assert(repo.ListBatches(*tx, filter, Pagination{}).empty());

  auto collisions = repo.ListCollisions(*tx, batch.id, Pagination{});
  assert(collisions.size() == 1);
  assert(collisions[0].slot == 1);
  tx->Commit();
}

void VerifySequences(Repository& repo, const std::string& tag) {
  const auto kind = "WAR-" + tag;
  auto       tx   = repo.Begin();

  uint64_t first = 0, second = 0, other_year = 0;
  assert(repo.NextSequence(*tx, kind, 2024, first));
  assert(repo.NextSequence(*tx, kind, 2024, second));
  assert(repo.NextSequence(*tx, kind, 2025, other_year));
  assert(first == 1);
  assert(second == 2);
  assert(other_year == 1);
  tx->Commit();

  auto next_tx = repo.Begin();
  uint64_t third = 0;
  assert(repo.NextSequence(*next_tx, kind, 2024, third));
  assert(third == 3);
  next_tx->Commit();
}

void VerifyClaimsAndTimeline(Repository& repo, const std::string& tag) {
  const auto barcode_id = tag + "-claim-bc";
  SeedBarcode(repo, Barcode(barcode_id, "SSW-2024-" + tag + "D1"));

  auto first  = Claim(tag + "-claim-1", "WAR-" + tag + "-01", barcode_id, "cust-" + tag, 10000);
  auto second = Claim(tag + "-claim-2", "WAR-" + tag + "-02", barcode_id, "cust-" + tag, 20000);
  second.severity = Severity::kCritical;

  {
    auto tx = repo.Begin();
    assert(repo.InsertClaim(*tx, first));
    assert(repo.InsertClaim(*tx, second));
    auto dup = Claim(tag + "-claim-3", first.claim_number, barcode_id, "cust-" + tag, 30000);
    assert(repo.InsertClaim(*tx, dup).code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }
  {
    auto tx = repo.Begin();
    assert(repo.InsertClaim(*tx, first));
    assert(repo.InsertClaim(*tx, second));
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    auto by_number = repo.GetClaimByNumber(*tx, second.claim_number);
    assert(by_number.has_value());
    assert(by_number->id == second.id);
    assert(by_number->tags.size() == 2);

    ClaimFilter mine;
    mine.customer_id = "cust-" + tag;
    auto listed      = repo.ListClaims(*tx, mine, Pagination{});
    assert(listed.size() == 2);
    assert(listed[0].id == second.id);  // newest claim date first

    auto paged = repo.ListClaims(*tx, mine, Pagination{.limit = 1, .offset = 1});
    assert(paged.size() == 1 && paged[0].id == first.id);

    ClaimFilter critical = mine;
    critical.severity    = Severity::kCritical;
    assert(repo.ListClaims(*tx, critical, Pagination{}).size() == 1);

    ClaimFilter dated        = mine;
    dated.claim_date_from_ms = 15000;
    assert(repo.ListClaims(*tx, dated, Pagination{}).size() == 1);

    auto by_barcode = repo.ListClaimsByBarcode(*tx, barcode_id);
    assert(by_barcode.size() == 2);
    assert(by_barcode[0].id == first.id);
    tx->Commit();
  }

  // Version compare-and-set.
  {
    auto tx = repo.Begin();
    auto stored = repo.GetClaim(*tx, first.id);
    assert(stored.has_value() && stored->version == 1);

    auto validated            = *stored;
    validated.status          = ClaimStatus::kValidated;
    validated.previous_status = ClaimStatus::kPending;
    validated.version         = 2;
    assert(repo.UpdateClaim(*tx, validated, 1));
    tx->Commit();

    auto stale_tx     = repo.Begin();
    auto stale        = *stored;
    stale.status      = ClaimStatus::kCancelled;
    stale.version     = 2;
    assert(repo.UpdateClaim(*stale_tx, stale, 1).code == ErrorCode::Conflict);

    auto missing = Claim(tag + "-claim-missing", "WAR-" + tag + "-99", barcode_id, "cust-" + tag, 1);
    missing.version = 2;
    assert(repo.UpdateClaim(*stale_tx, missing, 1).code == ErrorCode::NotFound);
    stale_tx->Rollback();

    auto check = repo.Begin();
    auto after = repo.GetClaim(*check, first.id);
    assert(after->status == ClaimStatus::kValidated);
    assert(after->previous_status == ClaimStatus::kPending);
    assert(!after->disputed_from.has_value());
    assert(after->version == 2);
    check->Commit();
  }

  // Timeline sequences are assigned per claim, in append order.
  {
    auto tx = repo.Begin();
    for (int i = 0; i < 3; ++i) {
      TimelineEventRecord ev;
      ev.id                  = tag + "-tl-" + std::to_string(i);
      ev.claim_id            = first.id;
      ev.event_type          = i == 0 ? TimelineEventType::kSubmitted : TimelineEventType::kStatusUpdated;
      ev.description         = "event " + std::to_string(i);
      ev.actor_id            = "agent-1";
      ev.at_ms               = 10000 + i;
      ev.visible_to_customer = i != 2;
      assert(repo.AppendTimelineEvent(*tx, ev));
      assert(ev.sequence == static_cast<uint64_t>(i + 1));
    }

    TimelineEventRecord other{.id = tag + "-tl-other", .claim_id = second.id, .description = "submitted", .actor_id = "cust-" + tag};
    other.event_type = TimelineEventType::kSubmitted;
    assert(repo.AppendTimelineEvent(*tx, other));
    assert(other.sequence == 1);
    tx->Commit();

    auto check    = repo.Begin();
    auto timeline = repo.ListTimeline(*check, first.id);
    assert(timeline.size() == 3);
    assert(timeline[0].event_type == TimelineEventType::kSubmitted);
    assert(timeline[2].sequence == 3);
    assert(!timeline[2].visible_to_customer);
    check->Commit();
  }
}

void VerifyTicketsAttachmentsAndCascade(Repository& repo, const std::string& tag) {
  const auto barcode_id = tag + "-cascade-bc";
  SeedBarcode(repo, Barcode(barcode_id, "SSW-2024-" + tag + "E1"));
  auto claim = Claim(tag + "-cascade-claim", "WAR-" + tag + "-10", barcode_id, "cust-" + tag, 40000);
  claim.assigned_technician_id = "tech-" + tag;

  RepairTicketRecord ticket;
  ticket.id                     = tag + "-ticket";
  ticket.ticket_number          = "RPR-" + tag;
  ticket.claim_id               = claim.id;
  ticket.status                 = TicketStatus::kAssigned;
  ticket.assigned_technician_id = claim.assigned_technician_id;
  ticket.estimated_hours        = 2.5;
  ticket.description            = "Replace display connector";
  ticket.required_parts         = {PartUsage{.name = "connector", .part_number = "CN-1", .quantity = 2, .unit_cost_cents = 1500}};
  ticket.created_at_ms          = 40001;

  AttachmentRecord photo;
  photo.id             = tag + "-att";
  photo.claim_id       = claim.id;
  photo.filename       = "crack.jpg";
  photo.storage_ref    = "s3://claims/" + claim.id + "/crack.jpg";
  photo.size_bytes     = 2048;
  photo.mime_type      = "image/jpeg";
  photo.type           = warranty::db::model::AttachmentType::kPhoto;
  photo.uploaded_by    = "cust-" + tag;
  photo.uploaded_at_ms = 40002;

  {
    auto tx = repo.Begin();
    assert(repo.InsertClaim(*tx, claim));
    assert(repo.InsertTicket(*tx, ticket));
    assert(repo.InsertAttachment(*tx, photo));
    TimelineEventRecord ev{.id = tag + "-cascade-tl", .claim_id = claim.id, .description = "submitted", .actor_id = "cust-" + tag};
    assert(repo.AppendTimelineEvent(*tx, ev));
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    auto stored = repo.GetTicket(*tx, ticket.id);
    assert(stored.has_value());
    assert(stored->required_parts.size() == 1);
    assert(stored->required_parts[0].quantity == 2);
    assert(stored->estimated_hours == 2.5);

    stored->status           = TicketStatus::kInProgress;
    stored->started_at_ms    = 40100;
    stored->labor_cost_cents = 4000;
    assert(repo.UpdateTicket(*tx, *stored));

    auto ghost = ticket;
    ghost.id   = tag + "-ticket-ghost";
    assert(repo.UpdateTicket(*tx, ghost).code == ErrorCode::NotFound);

    auto scanned          = *repo.GetAttachment(*tx, photo.id);
    scanned.scan_status   = ScanStatus::kPassed;
    scanned.scan_detail   = "clean";
    scanned.scanned_at_ms = 40200;
    assert(repo.UpdateAttachment(*tx, scanned));
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    TicketFilter by_tech;
    by_tech.technician_id = "tech-" + tag;
    auto mine             = repo.ListTickets(*tx, by_tech, Pagination{});
    assert(mine.size() == 1);
    assert(mine[0].status == TicketStatus::kInProgress);
    assert(mine[0].labor_cost_cents == 4000);

    by_tech.status = TicketStatus::kCompleted;
    assert(repo.ListTickets(*tx, by_tech, Pagination{}).empty());

    auto attachments = repo.ListAttachments(*tx, claim.id);
    assert(attachments.size() == 1);
    assert(attachments[0].scan_status == ScanStatus::kPassed);
    assert(attachments[0].scan_detail == "clean");
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(repo.DeleteClaim(*tx, claim.id));
    assert(repo.DeleteClaim(*tx, claim.id).code == ErrorCode::NotFound);
    tx->Commit();
  }

  auto tx = repo.Begin();
  assert(!repo.GetClaim(*tx, claim.id).has_value());
  assert(!repo.GetTicket(*tx, ticket.id).has_value());
  assert(!repo.GetAttachment(*tx, photo.id).has_value());
  assert(repo.ListTimeline(*tx, claim.id).empty());
  assert(repo.GetBarcode(*tx, barcode_id).has_value());
  tx->Commit();
}

void VerifyIdempotencyKeys(Repository& repo, const std::string& tag) {
  IdempotencyRecord key{.scope = "claim:" + tag, .request_id = "req-1", .result_ref = "validated", .created_at_ms = 7000};

  {
    auto tx = repo.Begin();
    assert(!repo.GetIdempotencyKey(*tx, key.scope, key.request_id).has_value());
    assert(repo.PutIdempotencyKey(*tx, key));
    tx->Commit();
  }

  auto tx = repo.Begin();
  auto stored = repo.GetIdempotencyKey(*tx, key.scope, key.request_id);
  assert(stored.has_value());
  assert(stored->result_ref == "validated");
  assert(!repo.GetIdempotencyKey(*tx, "claim:other", key.request_id).has_value());

  auto replay = key;
  replay.result_ref = "cancelled";
  assert(repo.PutIdempotencyKey(*tx, replay).code == ErrorCode::AlreadyExists);
  tx->Rollback();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& tag) {
  const auto value = "SSW-2024-" + tag + "F1";
  {
    auto tx = repo.Begin();
    assert(repo.InsertBarcode(*tx, Barcode(tag + "-rollback", value)));
    tx->Rollback();
  }

  auto check_tx = repo.Begin();
  assert(!repo.BarcodeExists(*check_tx, value));
  check_tx->Commit();
}

void VerifyOptimisticCommit(Repository& repo, const std::string& tag, bool optimistic_commit) {
  if (!optimistic_commit) {
    return;
  }

  auto tx1 = repo.Begin();
  auto tx2 = repo.Begin();
  assert(repo.InsertBarcode(*tx1, Barcode(tag + "-race-1", "SSW-2024-" + tag + "R1")));
  assert(repo.InsertBarcode(*tx2, Barcode(tag + "-race-2", "SSW-2024-" + tag + "R2")));
  tx1->Commit();

  bool conflicted = false;
  try {
    tx2->Commit();
  } catch (const DbError& e) {
    conflicted = e.Code() == ErrorCode::Conflict;
  }
  assert(conflicted);

  auto check = repo.Begin();
  assert(repo.BarcodeExists(*check, "SSW-2024-" + tag + "R1"));
  assert(!repo.BarcodeExists(*check, "SSW-2024-" + tag + "R2"));
  check->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& tag) {
  if (!backend.supports_restart()) {
    return;
  }

  auto       repo       = backend.make_repository();
  const auto barcode_id = tag + "-durable-bc";
  const auto claim_id   = tag + "-durable-claim";
  {
    auto tx = repo->Begin();
    auto bc   = Barcode(barcode_id, "SSW-2024-" + tag + "H1");
    bc.status = BarcodeStatus::kActive;
    assert(repo->InsertBarcode(*tx, bc));

    auto claim               = Claim(claim_id, "WAR-" + tag + "-20", barcode_id, "cust-" + tag, 50000);
    claim.repair_cost_cents  = 2500;
    claim.total_cost_cents   = 2500;
    claim.resolution_type    = warranty::db::model::ResolutionType::kRepair;
    assert(repo->InsertClaim(*tx, claim));

    uint64_t seq = 0;
    assert(repo->NextSequence(*tx, "RPR-" + tag, 2024, seq));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto bc = repo->GetBarcode(*tx, barcode_id);
  assert(bc.has_value());
  assert(bc->status == BarcodeStatus::kActive);

  auto claim = repo->GetClaim(*tx, claim_id);
  assert(claim.has_value());
  assert(claim->total_cost_cents == 2500);
  assert(claim->resolution_type == warranty::db::model::ResolutionType::kRepair);

  uint64_t seq = 0;
  assert(repo->NextSequence(*tx, "RPR-" + tag, 2024, seq));
  assert(seq == 2);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name              = "memory",
      .make_repository   = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart  = []() { return false; },
      .restart           = [](std::shared_ptr<Repository>&) {},
      .cleanup           = []() {},
      .optimistic_commit = true,
  };
}

#if WARRANTY_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("warranty_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db   = std::make_shared<warranty::db::sqlite::SqliteDB>(db_path);
    auto repo = std::make_shared<warranty::db::sqlite::SqliteRepository>(std::move(db));
    repo->Migrate();
    return repo;
  };

  return BackendFactory{
      .name              = "sqlite",
      .make_repository   = make_repo,
      .supports_restart  = []() { return true; },
      .restart           = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup           = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
      .optimistic_commit = false,
  };
}
#endif

#if WARRANTY_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("WARRANTY_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("WARRANTY_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<warranty::db::postgres::PgPool>(conninfo, 4);
    auto repo = std::make_shared<warranty::db::postgres::PgRepository>(std::move(pool));
    repo->Migrate();
    return repo;
  };

  return BackendFactory{
      .name              = "postgres",
      .make_repository   = make_repo,
      .supports_restart  = []() { return true; },
      .restart           = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup           = []() {},
      .optimistic_commit = false,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";

  // Rows outlive the run on postgres; keep every key unique per run.
  const auto tag  = backend.name + std::to_string(NowMs());
  {
    auto repo = backend.make_repository();

    VerifyBarcodeLifecycle(*repo, tag);
    VerifyBulkInsertIsAllOrNothing(*repo, tag);
    VerifyBatchesAndCollisions(*repo, tag);
    VerifySequences(*repo, tag);
    VerifyClaimsAndTimeline(*repo, tag);
    VerifyTicketsAttachmentsAndCascade(*repo, tag);
    VerifyIdempotencyKeys(*repo, tag);
    VerifyRollbackBehavior(*repo, tag);
    VerifyOptimisticCommit(*repo, tag, backend.optimistic_commit);
  }

  VerifyRestartDurability(backend, tag);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if WARRANTY_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if WARRANTY_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "warranty_integration_repository_parity: pass\n";
  return 0;
}
