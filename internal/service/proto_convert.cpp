#include "proto_convert.hpp"

#include <algorithm>

#include "internal/util/time.hpp"

namespace warranty::service {

using namespace warranty::v1;

namespace {

void SetTime(uint64_t unix_ms, google::protobuf::Timestamp* out) {
  if (unix_ms == 0) return;
  *out = util::MillisToProto(unix_ms);
}

template <typename Enum>
std::string Name(Enum value) {
  return std::string(warranty::model::ToString(value));
}

warranty::model::ActorType InferActorType(const std::vector<std::string>& roles) {
  auto has = [&](std::string_view role) { return std::find(roles.begin(), roles.end(), role) != roles.end(); };
  if (has(core::kRoleCustomer)) return warranty::model::ActorType::kCustomer;
  if (has(core::kRoleTechnician)) return warranty::model::ActorType::kTechnician;
  if (has(core::kRoleAgent) || has(core::kRoleAdmin)) return warranty::model::ActorType::kAgent;
  return warranty::model::ActorType::kSystem;
}

void ToProto(const db::model::PartUsage& part, warranty::v1::PartUsage* out) {
  out->set_name(part.name);
  out->set_part_number(part.part_number);
  out->set_quantity(part.quantity);
  out->set_unit_cost_cents(part.unit_cost_cents);
}

} // namespace

core::RequestContext ToContext(const RequestMeta& meta) {
  core::RequestContext ctx;
  ctx.caller.actor_id = meta.caller().actor_id();
  ctx.caller.roles.assign(meta.caller().roles().begin(), meta.caller().roles().end());
  ctx.caller.actor_type = meta.caller().actor_type().empty()
                              ? InferActorType(ctx.caller.roles)
                              : ParseField("caller.actor_type", meta.caller().actor_type(), warranty::model::ParseActorType);
  ctx.request_id       = meta.request_id();
  ctx.deadline_unix_ms = meta.deadline_unix_ms();

  if (ctx.caller.actor_id.empty()) {
    throw util::InvalidArgument("caller identity is required", {{"meta.caller.actor_id", "is required", ""}});
  }
  return ctx;
}

db::Pagination ToPagination(const Page& page, bool has_page) {
  db::Pagination out;
  if (has_page) {
    out.limit  = page.limit();
    out.offset = page.offset();
  }
  return out;
}

// ------------------------------------------------------------
// Barcodes
// ------------------------------------------------------------

void ToProto(const core::WarrantyView& view, Barcode* out) {
  const auto& b = view.barcode;
  out->set_id(b.id);
  out->set_barcode(b.barcode);
  out->set_product_id(b.product_id);
  out->set_batch_id(b.batch_id);
  out->set_storefront_id(b.storefront_id);
  out->set_status(Name(b.status));
  out->set_warranty_period_months(b.warranty_period_months);
  out->set_customer_id(b.customer_id);
  out->set_customer_email(b.customer_email);
  SetTime(b.activated_at_ms, out->mutable_activated_at());
  SetTime(b.expiry_at_ms, out->mutable_expiry_at());
  out->set_retailer(b.retailer);
  out->set_invoice_number(b.invoice_number);
  out->set_serial_number(b.serial_number);
  SetTime(b.purchase_date_ms, out->mutable_purchase_date());
  out->set_purchase_price_cents(b.purchase_price_cents);
  out->set_revoked_reason(b.revoked_reason);
  out->set_revoked_by(b.revoked_by);
  SetTime(b.revoked_at_ms, out->mutable_revoked_at());
  SetTime(b.created_at_ms, out->mutable_created_at());
  SetTime(b.updated_at_ms, out->mutable_updated_at());

  const auto& d = view.derived;
  out->set_effective_status(Name(d.effective_status));
  out->set_is_expired(d.is_expired);
  out->set_days_remaining(d.days_remaining);
  out->set_can_claim(d.can_claim);
  out->set_warranty_period(d.warranty_period);
  out->set_qr_payload(d.qr_payload);
}

void ToProto(const db::model::BarcodeEventRecord& event, BarcodeEvent* out) {
  out->set_id(event.id);
  out->set_barcode_id(event.barcode_id);
  out->set_event(Name(event.event));
  out->set_actor_id(event.actor_id);
  out->set_detail(event.detail);
  SetTime(event.at_ms, out->mutable_at());
}

// ------------------------------------------------------------
// Batches
// ------------------------------------------------------------

void ToProto(const db::model::BatchRecord& b, Batch* out) {
  out->set_id(b.id);
  out->set_batch_number(b.batch_number);
  out->set_product_id(b.product_id);
  out->set_storefront_id(b.storefront_id);
  out->set_created_by(b.created_by);
  out->set_requested_quantity(b.requested_quantity);
  out->set_generated_count(b.generated_count);
  out->set_successful_count(b.successful_count);
  out->set_failed_count(b.failed_count);
  out->set_error_count(b.error_count);
  out->set_collision_count(b.collision_count);
  out->set_retry_count(b.retry_count);
  out->set_max_retries(b.max_retries);
  out->set_prefix(b.prefix);
  out->set_description(b.description);
  for (const auto& tag : b.tags) out->add_tags(tag);
  out->set_notify_on_complete(b.notify_on_complete);
  out->set_expiry_months(b.expiry_months);
  out->set_priority(Name(b.priority));
  out->set_status(Name(b.status));
  out->set_generation_time_ms(b.generation_time_ms);
  SetTime(b.created_at_ms, out->mutable_created_at());
  SetTime(b.started_at_ms, out->mutable_started_at());
  SetTime(b.completed_at_ms, out->mutable_completed_at());
  SetTime(b.cancelled_at_ms, out->mutable_cancelled_at());
  SetTime(b.updated_at_ms, out->mutable_updated_at());
  out->set_cancelled_by(b.cancelled_by);
  out->set_cancel_reason(b.cancel_reason);
  out->set_last_error(b.last_error);

  const auto stats = core::BatchEngine::Statistics(b);
  auto*      s     = out->mutable_statistics();
  s->set_success_rate(stats.success_rate);
  s->set_collision_rate(stats.collision_rate);
  s->set_average_generation_ms(stats.average_generation_ms);
  s->set_performance_score(stats.performance_score);
  s->set_security_score(stats.security_score);
  s->set_recommended_action(stats.recommended_action);
}

void ToProto(const core::BatchProgress& p, BatchProgress* out) {
  ToProto(p.batch, out->mutable_batch());
  out->set_progress_percent(p.progress_percent);
  out->set_current_step(p.current_step);
  out->set_processed(p.processed);
  out->set_remaining(p.remaining);
  out->set_items_per_second(p.items_per_second);
  SetTime(p.last_updated_ms, out->mutable_last_updated());
  if (p.estimated_completion_ms) SetTime(*p.estimated_completion_ms, out->mutable_estimated_completion());
}

void ToProto(const db::model::CollisionRecord& c, Collision* out) {
  out->set_id(c.id);
  out->set_batch_id(c.batch_id);
  out->set_candidate(c.candidate);
  out->set_type(Name(c.type));
  out->set_resolution(Name(c.resolution));
  out->set_slot(c.slot);
  out->set_attempt(c.attempt);
  SetTime(c.detected_at_ms, out->mutable_detected_at());
  SetTime(c.resolved_at_ms, out->mutable_resolved_at());
}

// ------------------------------------------------------------
// Claims
// ------------------------------------------------------------

void ToProto(const core::ClaimView& view, Claim* out) {
  const auto& c = view.claim;
  out->set_id(c.id);
  out->set_claim_number(c.claim_number);
  out->set_barcode_id(c.barcode_id);
  out->set_barcode(c.barcode);
  out->set_customer_id(c.customer_id);
  out->set_product_id(c.product_id);
  out->set_storefront_id(c.storefront_id);
  out->set_issue_category(Name(c.issue_category));
  out->set_issue_description(c.issue_description);
  out->set_severity(Name(c.severity));
  out->set_priority(Name(c.priority));
  out->set_status(Name(c.status));
  if (c.previous_status) out->set_previous_status(Name(*c.previous_status));
  if (c.disputed_from) out->set_disputed_from(Name(*c.disputed_from));
  SetTime(c.status_updated_at_ms, out->mutable_status_updated_at());
  out->set_status_updated_by(c.status_updated_by);
  SetTime(c.claim_date_ms, out->mutable_claim_date());
  SetTime(c.validated_at_ms, out->mutable_validated_at());
  out->set_validated_by(c.validated_by);
  SetTime(c.completed_at_ms, out->mutable_completed_at());
  SetTime(c.estimated_completion_ms, out->mutable_estimated_completion());
  SetTime(c.actual_completion_ms, out->mutable_actual_completion());
  if (c.resolution_type) out->set_resolution_type(Name(*c.resolution_type));
  out->set_resolution_notes(c.resolution_notes);
  out->set_repair_cost_cents(c.repair_cost_cents);
  out->set_shipping_cost_cents(c.shipping_cost_cents);
  out->set_replacement_cost_cents(c.replacement_cost_cents);
  out->set_total_cost_cents(c.total_cost_cents);
  out->set_customer_name(c.customer_name);
  out->set_customer_email(c.customer_email);
  out->set_customer_phone(c.customer_phone);
  out->set_pickup_address(c.pickup_address);
  out->set_customer_notes(c.customer_notes);
  out->set_admin_notes(c.admin_notes);
  out->set_rejection_reason(c.rejection_reason);
  out->set_assigned_technician_id(c.assigned_technician_id);
  out->set_replacement_product_id(c.replacement_product_id);
  for (const auto& tag : c.tags) out->add_tags(tag);
  out->set_version(c.version);
  SetTime(c.created_at_ms, out->mutable_created_at());
  SetTime(c.updated_at_ms, out->mutable_updated_at());

  out->set_can_cancel(view.derived.can_cancel);
  out->set_can_update(view.derived.can_update);
  for (const auto& action : view.derived.next_actions) out->add_next_actions(action);
  out->set_display_status(view.derived.display_status);
}

void ToProto(const db::model::TimelineEventRecord& e, TimelineEvent* out) {
  out->set_id(e.id);
  out->set_claim_id(e.claim_id);
  out->set_sequence(e.sequence);
  out->set_event_type(Name(e.event_type));
  out->set_description(e.description);
  out->set_actor_id(e.actor_id);
  out->set_actor_type(Name(e.actor_type));
  SetTime(e.at_ms, out->mutable_at());
  out->set_visible_to_customer(e.visible_to_customer);
}

core::TransitionInput FromProto(const TransitionOptions& o) {
  core::TransitionInput in;
  in.notes                   = o.notes();
  in.repair_notes            = o.repair_notes();
  in.reason                  = o.reason();
  in.technician_id           = o.technician_id();
  in.estimated_completion_ms = o.has_estimated_completion() ? util::ProtoToMillis(o.estimated_completion()) : 0;
  in.priority                = ParseOptionalField("priority", o.priority(), warranty::model::ParsePriority);
  in.resolution_type         = ParseOptionalField("resolution_type", o.resolution_type(), warranty::model::ParseResolutionType);
  in.resolution_notes        = o.resolution_notes();
  in.replacement_product_id  = o.replacement_product_id();
  in.resolve_to              = ParseOptionalField("resolve_to", o.resolve_to(), warranty::model::ParseClaimStatus);
  if (o.has_expected_version()) in.expected_version = o.expected_version();
  if (o.has_visible_to_customer()) in.visible_to_customer = o.visible_to_customer();
  return in;
}

// ------------------------------------------------------------
// Repair tickets
// ------------------------------------------------------------

void ToProto(const db::model::RepairTicketRecord& t, RepairTicket* out) {
  out->set_id(t.id);
  out->set_ticket_number(t.ticket_number);
  out->set_claim_id(t.claim_id);
  out->set_status(Name(t.status));
  out->set_priority(Name(t.priority));
  out->set_assigned_technician_id(t.assigned_technician_id);
  SetTime(t.assigned_at_ms, out->mutable_assigned_at());
  out->set_estimated_hours(t.estimated_hours);
  out->set_actual_hours(t.actual_hours);
  SetTime(t.estimated_completion_ms, out->mutable_estimated_completion());
  SetTime(t.actual_completion_ms, out->mutable_actual_completion());
  SetTime(t.started_at_ms, out->mutable_started_at());
  out->set_description(t.description);
  out->set_special_instructions(t.special_instructions);
  out->set_repair_notes(t.repair_notes);
  for (const auto& p : t.required_parts) ToProto(p, out->add_required_parts());
  for (const auto& p : t.used_parts) ToProto(p, out->add_used_parts());
  for (const auto& r : t.test_results) {
    auto* tr = out->add_test_results();
    tr->set_name(r.name);
    tr->set_passed(r.passed);
    tr->set_notes(r.notes);
  }
  out->set_labor_cost_cents(t.labor_cost_cents);
  out->set_parts_cost_cents(t.parts_cost_cents);
  out->set_total_cost_cents(t.total_cost_cents);
  out->set_estimated_cost_cents(t.estimated_cost_cents);
  out->set_quality_check_status(Name(t.quality_check_status));
  out->set_quality_checked_by(t.quality_checked_by);
  SetTime(t.quality_checked_at_ms, out->mutable_quality_checked_at());
  out->set_quality_notes(t.quality_notes);
  out->set_customer_approval_required(t.customer_approval_required);
  out->set_customer_approval_status(Name(t.customer_approval_status));
  SetTime(t.customer_approved_at_ms, out->mutable_customer_approved_at());
  out->set_customer_approval_notes(t.customer_approval_notes);
  out->set_reopen_count(t.reopen_count);
  SetTime(t.created_at_ms, out->mutable_created_at());
  SetTime(t.updated_at_ms, out->mutable_updated_at());
  out->set_releases_claim(warranty::model::ReleasesClaim(t.status, t.quality_check_status, t.customer_approval_status));
}

db::model::PartUsage FromProto(const warranty::v1::PartUsage& part) {
  db::model::PartUsage out;
  out.name            = part.name();
  out.part_number     = part.part_number();
  out.quantity        = part.quantity();
  out.unit_cost_cents = part.unit_cost_cents();
  return out;
}

db::model::TestResult FromProto(const warranty::v1::TestResult& result) {
  return db::model::TestResult{result.name(), result.passed(), result.notes()};
}

// ------------------------------------------------------------
// Attachments and public views
// ------------------------------------------------------------

void ToProto(const db::model::AttachmentRecord& a, Attachment* out) {
  out->set_id(a.id);
  out->set_claim_id(a.claim_id);
  out->set_filename(a.filename);
  out->set_storage_ref(a.storage_ref);
  out->set_size_bytes(a.size_bytes);
  out->set_mime_type(a.mime_type);
  out->set_type(Name(a.type));
  out->set_scan_status(Name(a.scan_status));
  out->set_scan_detail(a.scan_detail);
  SetTime(a.scanned_at_ms, out->mutable_scanned_at());
  out->set_uploaded_by(a.uploaded_by);
  SetTime(a.uploaded_at_ms, out->mutable_uploaded_at());
}

void ToProto(const core::WarrantySummary& s, warranty::v1::WarrantySummary* out) {
  out->set_barcode(s.barcode);
  out->set_status(s.status);
  SetTime(s.activated_at_ms, out->mutable_activated_at());
  SetTime(s.expiry_at_ms, out->mutable_expiry_at());
  out->set_days_remaining(s.days_remaining);
  out->set_is_expired(s.is_expired);
  out->set_can_claim(s.can_claim);
  out->set_warranty_period(s.warranty_period);
  out->set_qr_payload(s.qr_payload);
  if (s.product) {
    auto* p = out->mutable_product();
    p->set_sku(s.product->sku);
    p->set_name(s.product->name);
    p->set_brand(s.product->brand);
    p->set_category(s.product->category);
    p->set_image_url(s.product->image_url);
  }
}

void ToProto(const core::CoverageTerms& t, warranty::v1::CoverageTerms* out) {
  out->set_coverage_type(t.coverage_type);
  for (const auto& c : t.covered_components) out->add_covered_components(c);
  for (const auto& c : t.excluded_components) out->add_excluded_components(c);
  out->set_repair_coverage(t.repair_coverage);
  out->set_replacement_coverage(t.replacement_coverage);
  out->set_labor_coverage(t.labor_coverage);
  out->set_parts_coverage(t.parts_coverage);
  for (const auto& term : t.terms) out->add_terms(term);
}

} // namespace warranty::service
