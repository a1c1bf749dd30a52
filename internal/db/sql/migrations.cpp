#include "migrations.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace warranty::db::sql {

namespace {

// Column sets shared by both dialects. Only the surrogate key and real
// number spellings differ.
std::string BarcodesTable() {
  return "CREATE TABLE IF NOT EXISTS barcodes("
         "id TEXT PRIMARY KEY,"
         "barcode TEXT NOT NULL UNIQUE,"
         "product_id TEXT NOT NULL,"
         "batch_id TEXT NOT NULL DEFAULT '',"
         "storefront_id TEXT NOT NULL DEFAULT '',"
         "status TEXT NOT NULL,"
         "warranty_period_months INTEGER NOT NULL,"
         "customer_id TEXT NOT NULL DEFAULT '',"
         "customer_email TEXT NOT NULL DEFAULT '',"
         "activated_at_ms BIGINT NOT NULL DEFAULT 0,"
         "expiry_at_ms BIGINT NOT NULL DEFAULT 0,"
         "retailer TEXT NOT NULL DEFAULT '',"
         "invoice_number TEXT NOT NULL DEFAULT '',"
         "serial_number TEXT NOT NULL DEFAULT '',"
         "purchase_date_ms BIGINT NOT NULL DEFAULT 0,"
         "purchase_price_cents BIGINT NOT NULL DEFAULT 0,"
         "revoked_reason TEXT NOT NULL DEFAULT '',"
         "revoked_by TEXT NOT NULL DEFAULT '',"
         "revoked_at_ms BIGINT NOT NULL DEFAULT 0,"
         "created_at_ms BIGINT NOT NULL,"
         "updated_at_ms BIGINT NOT NULL);";
}

std::string BatchesTable() {
  return "CREATE TABLE IF NOT EXISTS batches("
         "id TEXT PRIMARY KEY,"
         "batch_number TEXT NOT NULL UNIQUE,"
         "product_id TEXT NOT NULL,"
         "storefront_id TEXT NOT NULL DEFAULT '',"
         "created_by TEXT NOT NULL DEFAULT '',"
         "requested_quantity INTEGER NOT NULL,"
         "generated_count INTEGER NOT NULL DEFAULT 0,"
         "successful_count INTEGER NOT NULL DEFAULT 0,"
         "failed_count INTEGER NOT NULL DEFAULT 0,"
         "error_count INTEGER NOT NULL DEFAULT 0,"
         "collision_count INTEGER NOT NULL DEFAULT 0,"
         "retry_count INTEGER NOT NULL DEFAULT 0,"
         "max_retries INTEGER NOT NULL DEFAULT 3,"
         "prefix TEXT NOT NULL,"
         "description TEXT NOT NULL DEFAULT '',"
         "tags TEXT NOT NULL DEFAULT '[]',"
         "notify_on_complete INTEGER NOT NULL DEFAULT 0,"
         "expiry_months INTEGER NOT NULL DEFAULT 0,"
         "priority TEXT NOT NULL,"
         "status TEXT NOT NULL,"
         "entropy_seed BIGINT NOT NULL DEFAULT 0,"
         "generation_time_ms BIGINT NOT NULL DEFAULT 0,"
         "created_at_ms BIGINT NOT NULL,"
         "started_at_ms BIGINT NOT NULL DEFAULT 0,"
         "completed_at_ms BIGINT NOT NULL DEFAULT 0,"
         "cancelled_at_ms BIGINT NOT NULL DEFAULT 0,"
         "updated_at_ms BIGINT NOT NULL,"
         "cancelled_by TEXT NOT NULL DEFAULT '',"
         "cancel_reason TEXT NOT NULL DEFAULT '',"
         "last_error TEXT NOT NULL DEFAULT '');";
}

std::string SequencesTable() {
  return "CREATE TABLE IF NOT EXISTS sequences("
         "kind TEXT NOT NULL,"
         "year INTEGER NOT NULL,"
         "value BIGINT NOT NULL,"
         "PRIMARY KEY(kind,year));";
}

std::string ClaimsTable() {
  return "CREATE TABLE IF NOT EXISTS claims("
         "id TEXT PRIMARY KEY,"
         "claim_number TEXT NOT NULL UNIQUE,"
         "barcode_id TEXT NOT NULL REFERENCES barcodes(id),"
         "barcode TEXT NOT NULL,"
         "customer_id TEXT NOT NULL,"
         "product_id TEXT NOT NULL,"
         "storefront_id TEXT NOT NULL DEFAULT '',"
         "issue_category TEXT NOT NULL,"
         "issue_description TEXT NOT NULL,"
         "severity TEXT NOT NULL,"
         "priority TEXT NOT NULL,"
         "status TEXT NOT NULL,"
         "previous_status TEXT NOT NULL DEFAULT '',"
         "disputed_from TEXT NOT NULL DEFAULT '',"
         "status_updated_at_ms BIGINT NOT NULL DEFAULT 0,"
         "status_updated_by TEXT NOT NULL DEFAULT '',"
         "claim_date_ms BIGINT NOT NULL,"
         "validated_at_ms BIGINT NOT NULL DEFAULT 0,"
         "validated_by TEXT NOT NULL DEFAULT '',"
         "completed_at_ms BIGINT NOT NULL DEFAULT 0,"
         "estimated_completion_ms BIGINT NOT NULL DEFAULT 0,"
         "actual_completion_ms BIGINT NOT NULL DEFAULT 0,"
         "resolution_type TEXT NOT NULL DEFAULT '',"
         "resolution_notes TEXT NOT NULL DEFAULT '',"
         "repair_cost_cents BIGINT NOT NULL DEFAULT 0,"
         "shipping_cost_cents BIGINT NOT NULL DEFAULT 0,"
         "replacement_cost_cents BIGINT NOT NULL DEFAULT 0,"
         "total_cost_cents BIGINT NOT NULL DEFAULT 0,"
         "customer_name TEXT NOT NULL DEFAULT '',"
         "customer_email TEXT NOT NULL DEFAULT '',"
         "customer_phone TEXT NOT NULL DEFAULT '',"
         "pickup_address TEXT NOT NULL DEFAULT '',"
         "customer_notes TEXT NOT NULL DEFAULT '',"
         "admin_notes TEXT NOT NULL DEFAULT '',"
         "rejection_reason TEXT NOT NULL DEFAULT '',"
         "assigned_technician_id TEXT NOT NULL DEFAULT '',"
         "replacement_product_id TEXT NOT NULL DEFAULT '',"
         "tags TEXT NOT NULL DEFAULT '[]',"
         "version BIGINT NOT NULL,"
         "created_at_ms BIGINT NOT NULL,"
         "updated_at_ms BIGINT NOT NULL);";
}

std::string TimelineTable() {
  return "CREATE TABLE IF NOT EXISTS claim_timeline("
         "claim_id TEXT NOT NULL REFERENCES claims(id) ON DELETE CASCADE,"
         "sequence BIGINT NOT NULL,"
         "id TEXT NOT NULL UNIQUE,"
         "event_type TEXT NOT NULL,"
         "description TEXT NOT NULL DEFAULT '',"
         "actor_id TEXT NOT NULL DEFAULT '',"
         "actor_type TEXT NOT NULL,"
         "at_ms BIGINT NOT NULL,"
         "visible_to_customer INTEGER NOT NULL DEFAULT 1,"
         "PRIMARY KEY(claim_id,sequence));";
}

std::string TicketsTable(const char* real) {
  return std::string("CREATE TABLE IF NOT EXISTS repair_tickets("
                     "id TEXT PRIMARY KEY,"
                     "ticket_number TEXT NOT NULL UNIQUE,"
                     "claim_id TEXT NOT NULL REFERENCES claims(id) ON DELETE CASCADE,"
                     "status TEXT NOT NULL,"
                     "priority TEXT NOT NULL,"
                     "assigned_technician_id TEXT NOT NULL DEFAULT '',"
                     "assigned_at_ms BIGINT NOT NULL DEFAULT 0,"
                     "estimated_hours ") +
         real + " NOT NULL DEFAULT 0,actual_hours " + real +
         " NOT NULL DEFAULT 0,"
         "estimated_completion_ms BIGINT NOT NULL DEFAULT 0,"
         "actual_completion_ms BIGINT NOT NULL DEFAULT 0,"
         "started_at_ms BIGINT NOT NULL DEFAULT 0,"
         "description TEXT NOT NULL DEFAULT '',"
         "special_instructions TEXT NOT NULL DEFAULT '',"
         "repair_notes TEXT NOT NULL DEFAULT '',"
         "required_parts TEXT NOT NULL DEFAULT '[]',"
         "used_parts TEXT NOT NULL DEFAULT '[]',"
         "test_results TEXT NOT NULL DEFAULT '[]',"
         "labor_cost_cents BIGINT NOT NULL DEFAULT 0,"
         "parts_cost_cents BIGINT NOT NULL DEFAULT 0,"
         "total_cost_cents BIGINT NOT NULL DEFAULT 0,"
         "estimated_cost_cents BIGINT NOT NULL DEFAULT 0,"
         "quality_check_status TEXT NOT NULL,"
         "quality_checked_by TEXT NOT NULL DEFAULT '',"
         "quality_checked_at_ms BIGINT NOT NULL DEFAULT 0,"
         "quality_notes TEXT NOT NULL DEFAULT '',"
         "customer_approval_required INTEGER NOT NULL DEFAULT 0,"
         "customer_approval_status TEXT NOT NULL,"
         "customer_approved_at_ms BIGINT NOT NULL DEFAULT 0,"
         "customer_approval_notes TEXT NOT NULL DEFAULT '',"
         "reopen_count INTEGER NOT NULL DEFAULT 0,"
         "created_at_ms BIGINT NOT NULL,"
         "updated_at_ms BIGINT NOT NULL);";
}

std::string IdempotencyTable() {
  return "CREATE TABLE IF NOT EXISTS idempotency_keys("
         "scope TEXT NOT NULL,"
         "request_id TEXT NOT NULL,"
         "result_ref TEXT NOT NULL DEFAULT '',"
         "created_at_ms BIGINT NOT NULL,"
         "PRIMARY KEY(scope,request_id));";
}

std::vector<std::string> Indexes() {
  return {
      "CREATE INDEX IF NOT EXISTS barcodes_batch_idx ON barcodes(batch_id);",
      "CREATE INDEX IF NOT EXISTS barcodes_product_idx ON barcodes(product_id);",
      "CREATE INDEX IF NOT EXISTS barcode_events_barcode_idx ON barcode_events(barcode_id);",
      "CREATE INDEX IF NOT EXISTS batches_status_idx ON batches(status,created_at_ms);",
      "CREATE INDEX IF NOT EXISTS batch_collisions_batch_idx ON batch_collisions(batch_id);",
      "CREATE INDEX IF NOT EXISTS claims_status_idx ON claims(status,claim_date_ms);",
      "CREATE INDEX IF NOT EXISTS claims_barcode_idx ON claims(barcode_id);",
      "CREATE INDEX IF NOT EXISTS claims_customer_idx ON claims(customer_id);",
      "CREATE INDEX IF NOT EXISTS repair_tickets_claim_idx ON repair_tickets(claim_id);",
      "CREATE INDEX IF NOT EXISTS claim_attachments_claim_idx ON claim_attachments(claim_id);",
  };
}

std::vector<std::string> BuildSchema(const char* serial, const char* real) {
  const std::string seq = std::string("seq ") + serial + ",";

  std::vector<std::string> out{
      BarcodesTable(),
      "CREATE TABLE IF NOT EXISTS barcode_events(" + seq +
          "id TEXT NOT NULL UNIQUE,"
          "barcode_id TEXT NOT NULL REFERENCES barcodes(id) ON DELETE CASCADE,"
          "event TEXT NOT NULL,"
          "actor_id TEXT NOT NULL DEFAULT '',"
          "detail TEXT NOT NULL DEFAULT '',"
          "at_ms BIGINT NOT NULL);",
      BatchesTable(),
      "CREATE TABLE IF NOT EXISTS batch_collisions(" + seq +
          "id TEXT NOT NULL UNIQUE,"
          "batch_id TEXT NOT NULL REFERENCES batches(id) ON DELETE CASCADE,"
          "candidate TEXT NOT NULL,"
          "type TEXT NOT NULL,"
          "resolution TEXT NOT NULL,"
          "slot INTEGER NOT NULL,"
          "attempt INTEGER NOT NULL,"
          "detected_at_ms BIGINT NOT NULL,"
          "resolved_at_ms BIGINT NOT NULL DEFAULT 0);",
      SequencesTable(),
      ClaimsTable(),
      TimelineTable(),
      TicketsTable(real),
      "CREATE TABLE IF NOT EXISTS claim_attachments(" + seq +
          "id TEXT NOT NULL UNIQUE,"
          "claim_id TEXT NOT NULL REFERENCES claims(id) ON DELETE CASCADE,"
          "filename TEXT NOT NULL,"
          "storage_ref TEXT NOT NULL DEFAULT '',"
          "size_bytes BIGINT NOT NULL,"
          "mime_type TEXT NOT NULL,"
          "type TEXT NOT NULL,"
          "scan_status TEXT NOT NULL,"
          "scan_detail TEXT NOT NULL DEFAULT '',"
          "scanned_at_ms BIGINT NOT NULL DEFAULT 0,"
          "uploaded_by TEXT NOT NULL DEFAULT '',"
          "uploaded_at_ms BIGINT NOT NULL);",
      IdempotencyTable(),
  };

  for (auto& idx : Indexes()) {
    out.push_back(std::move(idx));
  }
  return out;
}

} // namespace

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  std::size_t applied = 0;
  for (const auto& stmt : ordered_sql) {
    try {
      executor.ExecuteSQL(stmt);
    } catch (const std::exception& e) {
      WARRANTY_LOG_ERROR("migration failed", {observability::IntField("statement", static_cast<int64_t>(applied)),
                                              observability::StringField("error", e.what())});
      throw;
    }
    ++applied;
  }
  WARRANTY_LOG_INFO("schema migrations applied", {observability::IntField("statements", static_cast<int64_t>(applied))});
}

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> schema = BuildSchema("INTEGER PRIMARY KEY AUTOINCREMENT", "REAL");
  return schema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> schema = BuildSchema("BIGSERIAL PRIMARY KEY", "DOUBLE PRECISION");
  return schema;
}

} // namespace warranty::db::sql
