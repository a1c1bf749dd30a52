#pragma once

namespace warranty::db::sql {

/*
  Canonical SQL used by all backends.

  IMPORTANT:
  These are written in SQLite-compatible SQL subset
  so they work in both engines. Column order in every statement matches
  the Params builders in sql_repository.cpp.
*/

#define WARRANTY_BARCODE_COLUMNS                                                                                  \
  "id,barcode,product_id,batch_id,storefront_id,status,warranty_period_months,customer_id,customer_email,"        \
  "activated_at_ms,expiry_at_ms,retailer,invoice_number,serial_number,purchase_date_ms,purchase_price_cents,"    \
  "revoked_reason,revoked_by,revoked_at_ms,created_at_ms,updated_at_ms"

#define WARRANTY_BATCH_COLUMNS                                                                                    \
  "id,batch_number,product_id,storefront_id,created_by,requested_quantity,generated_count,successful_count,"     \
  "failed_count,error_count,collision_count,retry_count,max_retries,prefix,description,tags,notify_on_complete," \
  "expiry_months,priority,status,entropy_seed,generation_time_ms,created_at_ms,started_at_ms,completed_at_ms,"   \
  "cancelled_at_ms,updated_at_ms,cancelled_by,cancel_reason,last_error"

#define WARRANTY_CLAIM_COLUMNS                                                                                    \
  "id,claim_number,barcode_id,barcode,customer_id,product_id,storefront_id,issue_category,issue_description,"    \
  "severity,priority,status,previous_status,disputed_from,status_updated_at_ms,status_updated_by,claim_date_ms," \
  "validated_at_ms,validated_by,completed_at_ms,estimated_completion_ms,actual_completion_ms,resolution_type,"   \
  "resolution_notes,repair_cost_cents,shipping_cost_cents,replacement_cost_cents,total_cost_cents,"              \
  "customer_name,customer_email,customer_phone,pickup_address,customer_notes,admin_notes,rejection_reason,"      \
  "assigned_technician_id,replacement_product_id,tags,version,created_at_ms,updated_at_ms"

#define WARRANTY_TICKET_COLUMNS                                                                                   \
  "id,ticket_number,claim_id,status,priority,assigned_technician_id,assigned_at_ms,estimated_hours,actual_hours," \
  "estimated_completion_ms,actual_completion_ms,started_at_ms,description,special_instructions,repair_notes,"     \
  "required_parts,used_parts,test_results,labor_cost_cents,parts_cost_cents,total_cost_cents,"                   \
  "estimated_cost_cents,quality_check_status,quality_checked_by,quality_checked_at_ms,quality_notes,"           \
  "customer_approval_required,customer_approval_status,customer_approved_at_ms,customer_approval_notes,"        \
  "reopen_count,created_at_ms,updated_at_ms"

#define WARRANTY_ATTACHMENT_COLUMNS                                                                               \
  "id,claim_id,filename,storage_ref,size_bytes,mime_type,type,scan_status,scan_detail,scanned_at_ms,"            \
  "uploaded_by,uploaded_at_ms"

// barcodes

static constexpr const char* INSERT_BARCODE =
    "INSERT INTO barcodes(" WARRANTY_BARCODE_COLUMNS ")"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_BARCODE =
    "SELECT " WARRANTY_BARCODE_COLUMNS " FROM barcodes WHERE id=?;";

static constexpr const char* SELECT_BARCODE_BY_VALUE =
    "SELECT " WARRANTY_BARCODE_COLUMNS " FROM barcodes WHERE barcode=?;";

static constexpr const char* BARCODE_EXISTS =
    "SELECT 1 FROM barcodes WHERE barcode=?;";

static constexpr const char* BARCODE_ID_EXISTS =
    "SELECT 1 FROM barcodes WHERE id=?;";

static constexpr const char* SELECT_BARCODES_BY_BATCH =
    "SELECT " WARRANTY_BARCODE_COLUMNS " FROM barcodes WHERE batch_id=?"
    " ORDER BY barcode LIMIT ? OFFSET ?;";

static constexpr const char* SELECT_BARCODES_BY_PRODUCT =
    "SELECT " WARRANTY_BARCODE_COLUMNS " FROM barcodes WHERE product_id=?"
    " ORDER BY barcode LIMIT ? OFFSET ?;";

// compare-and-set on status
static constexpr const char* UPDATE_BARCODE =
    "UPDATE barcodes SET barcode=?,product_id=?,batch_id=?,storefront_id=?,status=?,warranty_period_months=?,"
    "customer_id=?,customer_email=?,activated_at_ms=?,expiry_at_ms=?,retailer=?,invoice_number=?,serial_number=?,"
    "purchase_date_ms=?,purchase_price_cents=?,revoked_reason=?,revoked_by=?,revoked_at_ms=?,created_at_ms=?,"
    "updated_at_ms=?"
    " WHERE id=? AND status=?;";

static constexpr const char* INSERT_BARCODE_EVENT =
    "INSERT INTO barcode_events(id,barcode_id,event,actor_id,detail,at_ms) VALUES(?,?,?,?,?,?);";

static constexpr const char* SELECT_BARCODE_EVENTS =
    "SELECT id,barcode_id,event,actor_id,detail,at_ms FROM barcode_events WHERE barcode_id=? ORDER BY seq;";

// batches

static constexpr const char* INSERT_BATCH =
    "INSERT INTO batches(" WARRANTY_BATCH_COLUMNS ")"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_BATCH =
    "SELECT " WARRANTY_BATCH_COLUMNS " FROM batches WHERE id=?;";

static constexpr const char* UPDATE_BATCH =
    "UPDATE batches SET batch_number=?,product_id=?,storefront_id=?,created_by=?,requested_quantity=?,"
    "generated_count=?,successful_count=?,failed_count=?,error_count=?,collision_count=?,retry_count=?,"
    "max_retries=?,prefix=?,description=?,tags=?,notify_on_complete=?,expiry_months=?,priority=?,status=?,"
    "entropy_seed=?,generation_time_ms=?,created_at_ms=?,started_at_ms=?,completed_at_ms=?,cancelled_at_ms=?,"
    "updated_at_ms=?,cancelled_by=?,cancel_reason=?,last_error=?"
    " WHERE id=?;";

// WHERE clause and paging appended by the repository.
static constexpr const char* SELECT_BATCHES =
    "SELECT " WARRANTY_BATCH_COLUMNS " FROM batches";

static constexpr const char* INSERT_COLLISION =
    "INSERT INTO batch_collisions(id,batch_id,candidate,type,resolution,slot,attempt,detected_at_ms,resolved_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_COLLISIONS =
    "SELECT id,batch_id,candidate,type,resolution,slot,attempt,detected_at_ms,resolved_at_ms"
    " FROM batch_collisions WHERE batch_id=? ORDER BY seq LIMIT ? OFFSET ?;";

// sequences

static constexpr const char* BUMP_SEQUENCE =
    "INSERT INTO sequences(kind,year,value) VALUES(?,?,1)"
    " ON CONFLICT(kind,year) DO UPDATE SET value=sequences.value+1;";

static constexpr const char* SELECT_SEQUENCE =
    "SELECT value FROM sequences WHERE kind=? AND year=?;";

// claims

static constexpr const char* INSERT_CLAIM =
    "INSERT INTO claims(" WARRANTY_CLAIM_COLUMNS ")"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_CLAIM =
    "SELECT " WARRANTY_CLAIM_COLUMNS " FROM claims WHERE id=?;";

static constexpr const char* SELECT_CLAIM_BY_NUMBER =
    "SELECT " WARRANTY_CLAIM_COLUMNS " FROM claims WHERE claim_number=?;";

static constexpr const char* CLAIM_EXISTS =
    "SELECT 1 FROM claims WHERE id=?;";

// optimistic version check
static constexpr const char* UPDATE_CLAIM =
    "UPDATE claims SET claim_number=?,barcode_id=?,barcode=?,customer_id=?,product_id=?,storefront_id=?,"
    "issue_category=?,issue_description=?,severity=?,priority=?,status=?,previous_status=?,disputed_from=?,"
    "status_updated_at_ms=?,status_updated_by=?,claim_date_ms=?,validated_at_ms=?,validated_by=?,completed_at_ms=?,"
    "estimated_completion_ms=?,actual_completion_ms=?,resolution_type=?,resolution_notes=?,repair_cost_cents=?,"
    "shipping_cost_cents=?,replacement_cost_cents=?,total_cost_cents=?,customer_name=?,customer_email=?,"
    "customer_phone=?,pickup_address=?,customer_notes=?,admin_notes=?,rejection_reason=?,assigned_technician_id=?,"
    "replacement_product_id=?,tags=?,version=?,created_at_ms=?,updated_at_ms=?"
    " WHERE id=? AND version=?;";

static constexpr const char* SELECT_CLAIMS =
    "SELECT " WARRANTY_CLAIM_COLUMNS " FROM claims";

static constexpr const char* SELECT_CLAIMS_BY_BARCODE =
    "SELECT " WARRANTY_CLAIM_COLUMNS " FROM claims WHERE barcode_id=? ORDER BY claim_date_ms, claim_number;";

static constexpr const char* DELETE_CLAIM =
    "DELETE FROM claims WHERE id=?;";

// timeline

static constexpr const char* NEXT_TIMELINE_SEQUENCE =
    "SELECT COALESCE(MAX(sequence),0)+1 FROM claim_timeline WHERE claim_id=?;";

static constexpr const char* INSERT_TIMELINE_EVENT =
    "INSERT INTO claim_timeline(claim_id,sequence,id,event_type,description,actor_id,actor_type,at_ms,"
    "visible_to_customer) VALUES(?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_TIMELINE =
    "SELECT claim_id,sequence,id,event_type,description,actor_id,actor_type,at_ms,visible_to_customer"
    " FROM claim_timeline WHERE claim_id=? ORDER BY sequence;";

// repair tickets

static constexpr const char* INSERT_TICKET =
    "INSERT INTO repair_tickets(" WARRANTY_TICKET_COLUMNS ")"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_TICKET =
    "SELECT " WARRANTY_TICKET_COLUMNS " FROM repair_tickets WHERE id=?;";

static constexpr const char* UPDATE_TICKET =
    "UPDATE repair_tickets SET ticket_number=?,claim_id=?,status=?,priority=?,assigned_technician_id=?,"
    "assigned_at_ms=?,estimated_hours=?,actual_hours=?,estimated_completion_ms=?,actual_completion_ms=?,"
    "started_at_ms=?,description=?,special_instructions=?,repair_notes=?,required_parts=?,used_parts=?,"
    "test_results=?,labor_cost_cents=?,parts_cost_cents=?,total_cost_cents=?,estimated_cost_cents=?,"
    "quality_check_status=?,quality_checked_by=?,quality_checked_at_ms=?,quality_notes=?,"
    "customer_approval_required=?,customer_approval_status=?,customer_approved_at_ms=?,customer_approval_notes=?,"
    "reopen_count=?,created_at_ms=?,updated_at_ms=?"
    " WHERE id=?;";

static constexpr const char* SELECT_TICKETS =
    "SELECT " WARRANTY_TICKET_COLUMNS " FROM repair_tickets";

// attachments

static constexpr const char* INSERT_ATTACHMENT =
    "INSERT INTO claim_attachments(" WARRANTY_ATTACHMENT_COLUMNS ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_ATTACHMENT =
    "SELECT " WARRANTY_ATTACHMENT_COLUMNS " FROM claim_attachments WHERE id=?;";

static constexpr const char* UPDATE_ATTACHMENT =
    "UPDATE claim_attachments SET claim_id=?,filename=?,storage_ref=?,size_bytes=?,mime_type=?,type=?,"
    "scan_status=?,scan_detail=?,scanned_at_ms=?,uploaded_by=?,uploaded_at_ms=?"
    " WHERE id=?;";

static constexpr const char* SELECT_ATTACHMENTS =
    "SELECT " WARRANTY_ATTACHMENT_COLUMNS " FROM claim_attachments WHERE claim_id=? ORDER BY seq;";

// idempotency

static constexpr const char* SELECT_IDEMPOTENCY_KEY =
    "SELECT scope,request_id,result_ref,created_at_ms FROM idempotency_keys WHERE scope=? AND request_id=?;";

static constexpr const char* INSERT_IDEMPOTENCY_KEY =
    "INSERT INTO idempotency_keys(scope,request_id,result_ref,created_at_ms) VALUES(?,?,?,?);";

}
