#include "memory_repository.hpp"

#include <algorithm>
#include <unordered_set>

#include "memory_tx.hpp"

namespace warranty::db::memory {

namespace {

template <typename T>
std::vector<T> Page(std::vector<T> rows, const Pagination& page) {
  if (page.offset >= rows.size()) return {};
  auto first = rows.begin() + static_cast<std::ptrdiff_t>(page.offset);
  auto last  = rows.end();
  if (page.limit > 0 && page.limit < static_cast<std::size_t>(last - first)) {
    last = first + static_cast<std::ptrdiff_t>(page.limit);
  }
  return {std::make_move_iterator(first), std::make_move_iterator(last)};
}

bool InRange(uint64_t value, uint64_t from, uint64_t to) {
  if (from != 0 && value < from) return false;
  if (to != 0 && value > to) return false;
  return true;
}

std::string SequenceKey(const std::string& kind, int32_t year) {
  return kind + "#" + std::to_string(year);
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Barcodes
// ------------------------------------------------------------------

Result MemoryRepository::InsertBarcode(Transaction& t, const model::BarcodeRecord& r) {
  const auto& v = TX(t).View();
  if (v.barcodes.Get().contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "barcode id exists: " + r.id);
  if (v.barcode_index.Get().contains(r.barcode)) return Result::Err(ErrorCode::AlreadyExists, "barcode exists: " + r.barcode);

  auto& s = TX(t).Mutable();
  s.barcodes.Mut()[r.id]           = r;
  s.barcode_index.Mut()[r.barcode] = r.id;
  return Result::Ok(1);
}

Result MemoryRepository::InsertBarcodes(Transaction& t, const std::vector<model::BarcodeRecord>& rows) {
  const auto& v = TX(t).View();

  std::unordered_set<std::string> chunk;
  for (const auto& r : rows) {
    if (v.barcode_index.Get().contains(r.barcode) || !chunk.insert(r.barcode).second) {
      return Result::Err(ErrorCode::AlreadyExists, "barcode exists: " + r.barcode);
    }
    if (v.barcodes.Get().contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "barcode id exists: " + r.id);
  }

  auto& s     = TX(t).Mutable();
  auto& table = s.barcodes.Mut();
  auto& index = s.barcode_index.Mut();
  for (const auto& r : rows) {
    table[r.id]      = r;
    index[r.barcode] = r.id;
  }
  return Result::Ok(rows.size());
}

std::optional<model::BarcodeRecord> MemoryRepository::GetBarcode(Transaction& t, const std::string& id) {
  const auto& table = TX(t).View().barcodes.Get();
  auto        it    = table.find(id);
  if (it == table.end()) return std::nullopt;
  return it->second;
}

std::optional<model::BarcodeRecord> MemoryRepository::GetBarcodeByValue(Transaction& t, const std::string& barcode) {
  const auto& index = TX(t).View().barcode_index.Get();
  auto        it    = index.find(barcode);
  if (it == index.end()) return std::nullopt;
  return GetBarcode(t, it->second);
}

bool MemoryRepository::BarcodeExists(Transaction& t, const std::string& barcode) {
  return TX(t).View().barcode_index.Get().contains(barcode);
}

std::vector<model::BarcodeRecord> MemoryRepository::ListBarcodesByBatch(Transaction& t, const std::string& batch_id, const Pagination& page) {
  std::vector<model::BarcodeRecord> rows;
  for (const auto& [_, r] : TX(t).View().barcodes.Get()) {
    if (r.batch_id == batch_id) rows.push_back(r);
  }
  std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) { return a.barcode < b.barcode; });
  return Page(std::move(rows), page);
}

std::vector<model::BarcodeRecord> MemoryRepository::ListBarcodesByProduct(Transaction& t, const std::string& product_id, const Pagination& page) {
  std::vector<model::BarcodeRecord> rows;
  for (const auto& [_, r] : TX(t).View().barcodes.Get()) {
    if (r.product_id == product_id) rows.push_back(r);
  }
  std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) { return a.barcode < b.barcode; });
  return Page(std::move(rows), page);
}

Result MemoryRepository::UpdateBarcode(Transaction& t, const model::BarcodeRecord& r, model::BarcodeStatus expected_status) {
  const auto& table = TX(t).View().barcodes.Get();
  auto        it    = table.find(r.id);
  if (it == table.end()) return Result::Err(ErrorCode::NotFound, "barcode not found: " + r.id);
  if (it->second.status != expected_status) return Result::Err(ErrorCode::Conflict, "barcode status changed concurrently");

  TX(t).Mutable().barcodes.Mut()[r.id] = r;
  return Result::Ok(1);
}

Result MemoryRepository::InsertBarcodeEvent(Transaction& t, const model::BarcodeEventRecord& r) {
  TX(t).Mutable().barcode_events.Mut().push_back(r);
  return Result::Ok(1);
}

std::vector<model::BarcodeEventRecord> MemoryRepository::ListBarcodeEvents(Transaction& t, const std::string& barcode_id) {
  std::vector<model::BarcodeEventRecord> rows;
  for (const auto& e : TX(t).View().barcode_events.Get()) {
    if (e.barcode_id == barcode_id) rows.push_back(e);
  }
  return rows;
}

// ------------------------------------------------------------------
// Batches
// ------------------------------------------------------------------

Result MemoryRepository::InsertBatch(Transaction& t, const model::BatchRecord& r) {
  const auto& table = TX(t).View().batches.Get();
  if (table.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "batch exists: " + r.id);
  for (const auto& [_, b] : table) {
    if (b.batch_number == r.batch_number) return Result::Err(ErrorCode::AlreadyExists, "batch number exists: " + r.batch_number);
  }
  TX(t).Mutable().batches.Mut()[r.id] = r;
  return Result::Ok(1);
}

std::optional<model::BatchRecord> MemoryRepository::GetBatch(Transaction& t, const std::string& id) {
  const auto& table = TX(t).View().batches.Get();
  auto        it    = table.find(id);
  if (it == table.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateBatch(Transaction& t, const model::BatchRecord& r) {
  if (!TX(t).View().batches.Get().contains(r.id)) return Result::Err(ErrorCode::NotFound, "batch not found: " + r.id);
  TX(t).Mutable().batches.Mut()[r.id] = r;
  return Result::Ok(1);
}

std::vector<model::BatchRecord> MemoryRepository::ListBatches(Transaction& t, const BatchFilter& f, const Pagination& page) {
  std::vector<model::BatchRecord> rows;
  for (const auto& [_, b] : TX(t).View().batches.Get()) {
    if (f.status && b.status != *f.status) continue;
    if (f.priority && b.priority != *f.priority) continue;
    if (f.product_id && b.product_id != *f.product_id) continue;
    if (f.storefront_id && b.storefront_id != *f.storefront_id) continue;
    if (f.created_by && b.created_by != *f.created_by) continue;
    if (!InRange(b.created_at_ms, f.created_from_ms, f.created_to_ms)) continue;
    rows.push_back(b);
  }
  std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms > b.created_at_ms;
    return a.batch_number > b.batch_number;
  });
  return Page(std::move(rows), page);
}

Result MemoryRepository::InsertCollision(Transaction& t, const model::CollisionRecord& r) {
  TX(t).Mutable().collisions.Mut().push_back(r);
  return Result::Ok(1);
}

std::vector<model::CollisionRecord> MemoryRepository::ListCollisions(Transaction& t, const std::string& batch_id, const Pagination& page) {
  std::vector<model::CollisionRecord> rows;
  for (const auto& c : TX(t).View().collisions.Get()) {
    if (c.batch_id == batch_id) rows.push_back(c);
  }
  return Page(std::move(rows), page);
}

Result MemoryRepository::NextSequence(Transaction& t, const std::string& kind, int32_t year, uint64_t& value) {
  auto& seq = TX(t).Mutable().sequences.Mut()[SequenceKey(kind, year)];
  value     = ++seq;
  return Result::Ok(1);
}

// ------------------------------------------------------------------
// Claims
// ------------------------------------------------------------------

Result MemoryRepository::InsertClaim(Transaction& t, const model::ClaimRecord& r) {
  const auto& table = TX(t).View().claims.Get();
  if (table.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "claim exists: " + r.id);
  for (const auto& [_, c] : table) {
    if (c.claim_number == r.claim_number) return Result::Err(ErrorCode::AlreadyExists, "claim number exists: " + r.claim_number);
  }
  TX(t).Mutable().claims.Mut()[r.id] = r;
  return Result::Ok(1);
}

std::optional<model::ClaimRecord> MemoryRepository::GetClaim(Transaction& t, const std::string& id) {
  const auto& table = TX(t).View().claims.Get();
  auto        it    = table.find(id);
  if (it == table.end()) return std::nullopt;
  return it->second;
}

std::optional<model::ClaimRecord> MemoryRepository::GetClaimByNumber(Transaction& t, const std::string& claim_number) {
  for (const auto& [_, c] : TX(t).View().claims.Get()) {
    if (c.claim_number == claim_number) return c;
  }
  return std::nullopt;
}

Result MemoryRepository::UpdateClaim(Transaction& t, const model::ClaimRecord& r, uint64_t expected_version) {
  const auto& table = TX(t).View().claims.Get();
  auto        it    = table.find(r.id);
  if (it == table.end()) return Result::Err(ErrorCode::NotFound, "claim not found: " + r.id);
  if (it->second.version != expected_version) return Result::Err(ErrorCode::Conflict, "claim version changed concurrently");

  TX(t).Mutable().claims.Mut()[r.id] = r;
  return Result::Ok(1);
}

std::vector<model::ClaimRecord> MemoryRepository::ListClaims(Transaction& t, const ClaimFilter& f, const Pagination& page) {
  std::vector<model::ClaimRecord> rows;
  for (const auto& [_, c] : TX(t).View().claims.Get()) {
    if (f.status && c.status != *f.status) continue;
    if (f.priority && c.priority != *f.priority) continue;
    if (f.severity && c.severity != *f.severity) continue;
    if (f.customer_id && c.customer_id != *f.customer_id) continue;
    if (f.technician_id && c.assigned_technician_id != *f.technician_id) continue;
    if (f.barcode_id && c.barcode_id != *f.barcode_id) continue;
    if (!InRange(c.claim_date_ms, f.claim_date_from_ms, f.claim_date_to_ms)) continue;
    rows.push_back(c);
  }
  std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
    if (a.claim_date_ms != b.claim_date_ms) return a.claim_date_ms > b.claim_date_ms;
    return a.claim_number > b.claim_number;
  });
  return Page(std::move(rows), page);
}

std::vector<model::ClaimRecord> MemoryRepository::ListClaimsByBarcode(Transaction& t, const std::string& barcode_id) {
  std::vector<model::ClaimRecord> rows;
  for (const auto& [_, c] : TX(t).View().claims.Get()) {
    if (c.barcode_id == barcode_id) rows.push_back(c);
  }
  std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
    if (a.claim_date_ms != b.claim_date_ms) return a.claim_date_ms < b.claim_date_ms;
    return a.claim_number < b.claim_number;
  });
  return rows;
}

Result MemoryRepository::DeleteClaim(Transaction& t, const std::string& id) {
  if (!TX(t).View().claims.Get().contains(id)) return Result::Err(ErrorCode::NotFound, "claim not found: " + id);

  auto& s = TX(t).Mutable();
  s.claims.Mut().erase(id);
  s.timelines.Mut().erase(id);

  auto& attachments = s.attachments.Mut();
  std::erase_if(attachments, [&](const auto& a) { return a.claim_id == id; });

  auto& tickets = s.tickets.Mut();
  std::erase_if(tickets, [&](const auto& kv) { return kv.second.claim_id == id; });
  return Result::Ok(1);
}

// ------------------------------------------------------------------
// Timeline
// ------------------------------------------------------------------

Result MemoryRepository::AppendTimelineEvent(Transaction& t, model::TimelineEventRecord& e) {
  if (!TX(t).View().claims.Get().contains(e.claim_id)) return Result::Err(ErrorCode::ConstraintViolation, "claim not found: " + e.claim_id);

  auto& events = TX(t).Mutable().timelines.Mut()[e.claim_id];
  e.sequence   = events.empty() ? 1 : events.back().sequence + 1;
  events.push_back(e);
  return Result::Ok(1);
}

std::vector<model::TimelineEventRecord> MemoryRepository::ListTimeline(Transaction& t, const std::string& claim_id) {
  const auto& timelines = TX(t).View().timelines.Get();
  auto        it        = timelines.find(claim_id);
  if (it == timelines.end()) return {};
  return it->second;
}

// ------------------------------------------------------------------
// Repair tickets
// ------------------------------------------------------------------

Result MemoryRepository::InsertTicket(Transaction& t, const model::RepairTicketRecord& r) {
  const auto& v = TX(t).View();
  if (!v.claims.Get().contains(r.claim_id)) return Result::Err(ErrorCode::ConstraintViolation, "claim not found: " + r.claim_id);
  if (v.tickets.Get().contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "ticket exists: " + r.id);
  TX(t).Mutable().tickets.Mut()[r.id] = r;
  return Result::Ok(1);
}

std::optional<model::RepairTicketRecord> MemoryRepository::GetTicket(Transaction& t, const std::string& id) {
  const auto& table = TX(t).View().tickets.Get();
  auto        it    = table.find(id);
  if (it == table.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateTicket(Transaction& t, const model::RepairTicketRecord& r) {
  if (!TX(t).View().tickets.Get().contains(r.id)) return Result::Err(ErrorCode::NotFound, "ticket not found: " + r.id);
  TX(t).Mutable().tickets.Mut()[r.id] = r;
  return Result::Ok(1);
}

std::vector<model::RepairTicketRecord> MemoryRepository::ListTickets(Transaction& t, const TicketFilter& f, const Pagination& page) {
  std::vector<model::RepairTicketRecord> rows;
  for (const auto& [_, r] : TX(t).View().tickets.Get()) {
    if (f.status && r.status != *f.status) continue;
    if (f.claim_id && r.claim_id != *f.claim_id) continue;
    if (f.technician_id && r.assigned_technician_id != *f.technician_id) continue;
    rows.push_back(r);
  }
  std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
    return a.ticket_number < b.ticket_number;
  });
  return Page(std::move(rows), page);
}

// ------------------------------------------------------------------
// Attachments
// ------------------------------------------------------------------

Result MemoryRepository::InsertAttachment(Transaction& t, const model::AttachmentRecord& r) {
  const auto& v = TX(t).View();
  if (!v.claims.Get().contains(r.claim_id)) return Result::Err(ErrorCode::ConstraintViolation, "claim not found: " + r.claim_id);
  for (const auto& a : v.attachments.Get()) {
    if (a.id == r.id) return Result::Err(ErrorCode::AlreadyExists, "attachment exists: " + r.id);
  }
  TX(t).Mutable().attachments.Mut().push_back(r);
  return Result::Ok(1);
}

std::optional<model::AttachmentRecord> MemoryRepository::GetAttachment(Transaction& t, const std::string& id) {
  for (const auto& a : TX(t).View().attachments.Get()) {
    if (a.id == id) return a;
  }
  return std::nullopt;
}

Result MemoryRepository::UpdateAttachment(Transaction& t, const model::AttachmentRecord& r) {
  const auto& rows = TX(t).View().attachments.Get();
  auto        it   = std::find_if(rows.begin(), rows.end(), [&](const auto& a) { return a.id == r.id; });
  if (it == rows.end()) return Result::Err(ErrorCode::NotFound, "attachment not found: " + r.id);

  const auto index = static_cast<std::size_t>(it - rows.begin());
  TX(t).Mutable().attachments.Mut()[index] = r;
  return Result::Ok(1);
}

std::vector<model::AttachmentRecord> MemoryRepository::ListAttachments(Transaction& t, const std::string& claim_id) {
  std::vector<model::AttachmentRecord> rows;
  for (const auto& a : TX(t).View().attachments.Get()) {
    if (a.claim_id == claim_id) rows.push_back(a);
  }
  return rows;
}

// ------------------------------------------------------------------
// Idempotency
// ------------------------------------------------------------------

std::optional<model::IdempotencyRecord> MemoryRepository::GetIdempotencyKey(Transaction& t, const std::string& scope, const std::string& request_id) {
  const auto& table = TX(t).View().idempotency.Get();
  auto        it    = table.find(scope + "#" + request_id);
  if (it == table.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::PutIdempotencyKey(Transaction& t, const model::IdempotencyRecord& r) {
  const auto key = r.scope + "#" + r.request_id;
  if (TX(t).View().idempotency.Get().contains(key)) return Result::Err(ErrorCode::AlreadyExists, "request already applied");
  TX(t).Mutable().idempotency.Mut()[key] = r;
  return Result::Ok(1);
}

} // namespace warranty::db::memory
