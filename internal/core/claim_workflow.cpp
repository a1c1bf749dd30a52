#include "claim_workflow.hpp"

#include <algorithm>

#include "db_errors.hpp"
#include "identifier_generator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"
#include "repair_ticket_engine.hpp"

namespace warranty::core {

using warranty::model::ActorType;
using warranty::model::BarcodeStatus;
using warranty::model::ClaimAction;
using warranty::model::ClaimStatus;
using warranty::model::ResolutionType;
using warranty::model::TicketStatus;
using warranty::model::TimelineEventType;

namespace {

constexpr std::size_t kMinDescriptionLength = 10;
constexpr std::size_t kMaxDescriptionLength = 2000;
constexpr std::size_t kMaxNoteLength        = 2000;

std::vector<std::string> LegalNames(ClaimStatus status) {
  std::vector<std::string> out;
  for (auto name : warranty::model::LegalActionNames(status)) out.emplace_back(name);
  return out;
}

std::string Name(ClaimStatus s) {
  return std::string(warranty::model::ToString(s));
}

void RecomputeTotal(db::model::ClaimRecord& claim) {
  claim.total_cost_cents = claim.repair_cost_cents + claim.shipping_cost_cents + claim.replacement_cost_cents;
}

std::string Describe(ClaimAction action, ClaimStatus from, ClaimStatus to, const TransitionInput& input) {
  std::string text = Name(from) + " -> " + Name(to);
  if (action == ClaimAction::kReject && !input.reason.empty()) {
    text += ": " + input.reason;
  } else if (!input.notes.empty()) {
    text += ": " + input.notes;
  }
  return text;
}

} // namespace

ClaimDerived DeriveClaim(const db::model::ClaimRecord& claim) {
  ClaimDerived d;
  d.can_cancel     = claim.status == ClaimStatus::kPending || claim.status == ClaimStatus::kValidated;
  d.can_update     = !warranty::model::IsTerminal(claim.status);
  d.next_actions   = LegalNames(claim.status);
  d.display_status = std::string(warranty::model::DisplayStatus(claim.status));
  return d;
}

ClaimWorkflow::ClaimWorkflow(std::shared_ptr<db::Repository> repository, std::shared_ptr<WarrantyRegistry> registry,
                             std::shared_ptr<CustomerDirectory> customers, std::shared_ptr<Notifier> notifier, std::shared_ptr<util::Clock> clock,
                             ClaimWorkflowOptions options)
    : repository_(std::move(repository)),
      registry_(std::move(registry)),
      customers_(std::move(customers)),
      notifier_(std::move(notifier)),
      clock_(std::move(clock)),
      options_(options),
      attachment_rules_(options_.attachments) {
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

db::model::ClaimRecord ClaimWorkflow::LoadClaim(db::Transaction& tx, const std::string& claim_ref) {
  std::optional<db::model::ClaimRecord> row;
  if (util::IsUUID(claim_ref)) {
    row = repository_->GetClaim(tx, claim_ref);
  } else {
    row = repository_->GetClaimByNumber(tx, claim_ref);
  }
  if (!row) throw util::NotFound("claim not found: " + claim_ref);
  return *row;
}

bool ClaimWorkflow::Replayed(db::Transaction& tx, const RequestContext& ctx, const std::string& scope) {
  if (ctx.request_id.empty()) return false;
  return repository_->GetIdempotencyKey(tx, scope, ctx.request_id).has_value();
}

void ClaimWorkflow::Remember(db::Transaction& tx, const RequestContext& ctx, const std::string& scope, const std::string& result_ref) {
  if (ctx.request_id.empty()) return;
  db::model::IdempotencyRecord key;
  key.scope         = scope;
  key.request_id    = ctx.request_id;
  key.result_ref    = result_ref;
  key.created_at_ms = util::ToUnixMillis(clock_->Now());
  ThrowIfDbError(repository_->PutIdempotencyKey(tx, key), "record request id");
}

void ClaimWorkflow::NotifyCustomer(const db::model::ClaimRecord& claim, const std::string& template_id) {
  if (!notifier_) return;
  const auto& recipient = claim.customer_email.empty() ? claim.customer_id : claim.customer_email;
  try {
    notifier_->Notify(recipient, template_id,
                      {{"claim_id", claim.id}, {"claim_number", claim.claim_number}, {"status", Name(claim.status)},
                       {"display_status", std::string(warranty::model::DisplayStatus(claim.status))}});
  } catch (const std::exception& e) {
    WARRANTY_LOG_WARN("claim notification failed", {observability::StringField("claim_id", claim.id),
                                                     observability::StringField("template", template_id),
                                                     observability::StringField("error", e.what())});
  }
}

db::model::TimelineEventRecord ClaimWorkflow::AppendTimeline(db::Transaction& tx, const std::string& claim_id, TimelineEventType type,
                                                             const std::string& description, const Caller& actor, bool visible_to_customer) {
  const auto history = repository_->ListTimeline(tx, claim_id);

  uint64_t at_ms = util::ToUnixMillis(clock_->Now());
  if (!history.empty()) at_ms = std::max(at_ms, history.back().at_ms);

  db::model::TimelineEventRecord event;
  event.id                  = util::NewId();
  event.claim_id            = claim_id;
  event.event_type          = type;
  event.description         = description;
  event.actor_id            = actor.actor_id;
  event.actor_type          = actor.actor_type;
  event.at_ms               = at_ms;
  event.visible_to_customer = visible_to_customer;
  ThrowIfDbError(repository_->AppendTimelineEvent(tx, event), "append timeline event");
  return event;
}

void ClaimWorkflow::RequireTransitionRole(const RequestContext& ctx, const db::model::ClaimRecord& claim, ClaimAction action) const {
  if (ctx.caller.HasRole(kRoleAgent)) return;
  const bool owner = ctx.caller.HasRole(kRoleCustomer) && claim.customer_id == ctx.caller.actor_id;
  if (owner && (action == ClaimAction::kCancel || action == ClaimAction::kDispute)) return;
  throw util::Forbidden("caller may not " + std::string(warranty::model::ToString(action)) + " this claim");
}

// ---------------------------------------------------------------------------
// Submit
// ---------------------------------------------------------------------------

ClaimView ClaimWorkflow::Submit(const RequestContext& ctx, const SubmitClaimRequest& request) {
  RequireRole(ctx, {kRoleCustomer});
  CheckDeadline(ctx, *clock_);

  std::vector<util::FieldViolation> violations;
  if (request.barcode.empty()) {
    violations.push_back({"barcode", "is required", ""});
  }
  if (request.issue_description.size() < kMinDescriptionLength || request.issue_description.size() > kMaxDescriptionLength) {
    violations.push_back({"issue_description", "must be 10 to 2000 characters", std::to_string(request.issue_description.size())});
  }
  if (!violations.empty()) {
    throw util::InvalidArgument("invalid claim submission", std::move(violations));
  }

  const auto scope = "claim.submit:" + ctx.caller.actor_id;
  const auto now   = clock_->Now();

  db::model::ClaimRecord claim;
  bool                   replay = false;
  try {
    auto tx = repository_->Begin();

    if (!ctx.request_id.empty()) {
      if (auto key = repository_->GetIdempotencyKey(*tx, scope, ctx.request_id)) {
        claim  = LoadClaim(*tx, key->result_ref);
        replay = true;
      }
    }

    if (!replay) {
      auto barcode = repository_->GetBarcodeByValue(*tx, request.barcode);
      if (!barcode) throw util::NotFound("barcode not found: " + request.barcode);
      if (barcode->customer_id != ctx.caller.actor_id) {
        throw util::Forbidden("barcode is not registered to the caller");
      }

      const auto derived = Derive(*barcode, now);
      switch (barcode->status) {
        case BarcodeStatus::kRevoked:
          throw util::PreconditionFailed("warranty_revoked", "warranty has been revoked");
        case BarcodeStatus::kClaimed:
          throw util::PreconditionFailed("warranty_already_claimed", "warranty has already been claimed");
        case BarcodeStatus::kGenerated:
          throw util::PreconditionFailed("warranty_not_active", "warranty has not been activated");
        default:
          break;
      }
      if (derived.is_expired) {
        throw util::PreconditionFailed("warranty_expired", "warranty expired");
      }

      for (const auto& existing : repository_->ListClaimsByBarcode(*tx, barcode->id)) {
        if (!warranty::model::IsTerminal(existing.status)) {
          throw util::Conflict("open claim " + existing.claim_number + " already exists for this barcode");
        }
      }

      std::optional<CustomerInfo> contact;
      if (customers_) contact = customers_->LookupById(ctx.caller.actor_id);

      const auto now_ms = util::ToUnixMillis(now);
      uint64_t   seq    = 0;
      ThrowIfDbError(repository_->NextSequence(*tx, "claim", util::YearOf(now), seq), "allocate claim number");

      claim.id                   = util::NewId();
      claim.claim_number         = FormatSequenceNumber("WAR", util::YearOf(now), seq);
      claim.barcode_id           = barcode->id;
      claim.barcode              = barcode->barcode;
      claim.customer_id          = ctx.caller.actor_id;
      claim.product_id           = barcode->product_id;
      claim.storefront_id        = barcode->storefront_id;
      claim.issue_category       = request.issue_category;
      claim.issue_description    = request.issue_description;
      claim.severity             = request.severity;
      claim.priority             = warranty::model::Priority::kNormal;
      claim.status               = ClaimStatus::kPending;
      claim.status_updated_at_ms = now_ms;
      claim.status_updated_by    = ctx.caller.actor_id;
      claim.claim_date_ms        = now_ms;
      claim.customer_name        = !request.customer_name.empty() ? request.customer_name : (contact ? contact->name : "");
      claim.customer_email       = !request.customer_email.empty() ? request.customer_email
                                   : contact && !contact->email.empty() ? contact->email
                                                                        : barcode->customer_email;
      claim.customer_phone       = !request.customer_phone.empty() ? request.customer_phone : (contact ? contact->phone : "");
      claim.pickup_address       = request.pickup_address;
      claim.customer_notes       = request.customer_notes;
      claim.tags                 = request.tags;
      claim.version              = 1;
      claim.created_at_ms        = now_ms;
      claim.updated_at_ms        = now_ms;

      ThrowIfDbError(repository_->InsertClaim(*tx, claim), "insert claim");
      AppendTimeline(*tx, claim.id, TimelineEventType::kSubmitted, "claim submitted", ctx.caller, true);
      for (const auto& upload : request.attachments) {
        auto record = attachment_rules_.Admit(claim.id, upload, ctx.caller.actor_id, now_ms);
        ThrowIfDbError(repository_->InsertAttachment(*tx, record), "insert attachment");
        AppendTimeline(*tx, claim.id, TimelineEventType::kAttachmentUploaded,
                       std::string(warranty::model::ToString(record.type)) + " uploaded: " + record.filename, ctx.caller, true);
      }
      Remember(*tx, ctx, scope, claim.id);
      tx->Commit();
    }
  } catch (const db::DbError& e) {
    ThrowDbError(e, "submit claim");
  }

  if (!replay) {
    WARRANTY_LOG_INFO("claim submitted", {observability::StringField("claim_id", claim.id),
                                          observability::StringField("claim_number", claim.claim_number),
                                          observability::StringField("barcode", claim.barcode),
                                          observability::IntField("attachments", static_cast<int64_t>(request.attachments.size()))});
    NotifyCustomer(claim, "claim_submitted");
  }
  return ClaimView{claim, DeriveClaim(claim)};
}

// ---------------------------------------------------------------------------
// Transitions
// ---------------------------------------------------------------------------

void ClaimWorkflow::TransitionInTx(db::Transaction& tx, const RequestContext& ctx, db::model::ClaimRecord& claim, ClaimAction action,
                                   const TransitionInput& input, bool ticket_driven) {
  if (input.expected_version && *input.expected_version != claim.version) {
    throw util::Conflict("claim " + claim.claim_number + " is at version " + std::to_string(claim.version));
  }

  const auto from = claim.status;
  const auto next = warranty::model::NextStatus(from, action);
  if (!next) {
    throw util::InvalidTransition("cannot " + std::string(warranty::model::ToString(action)) + " a " + Name(from) + " claim", Name(from),
                                  LegalNames(from));
  }

  auto       target = *next;
  const auto now    = clock_->Now();
  const auto now_ms = util::ToUnixMillis(now);
  bool       resolves = false;

  switch (action) {
    case ClaimAction::kValidate:
      claim.validated_at_ms = now_ms;
      claim.validated_by    = ctx.caller.actor_id;
      claim.priority        = warranty::model::DefaultPriority(claim.severity, claim.issue_category);
      break;

    case ClaimAction::kReject:
      if (input.reason.empty()) {
        throw util::InvalidArgument("rejection reason is required", {{"reason", "is required", ""}});
      }
      claim.rejection_reason = input.reason;
      break;

    case ClaimAction::kAssign:
      if (input.technician_id.empty()) {
        throw util::InvalidArgument("technician is required", {{"technician_id", "is required", ""}});
      }
      claim.assigned_technician_id = input.technician_id;
      if (input.estimated_completion_ms > 0) claim.estimated_completion_ms = input.estimated_completion_ms;
      if (input.priority) claim.priority = *input.priority;
      break;

    case ClaimAction::kStart:
      if (!ticket_driven) StartTicketForClaim(*repository_, tx, claim, now);
      break;

    case ClaimAction::kRepair:
    case ClaimAction::kReplace: {
      auto ticket = FindLiveTicket(*repository_, tx, claim.id);
      if (!ticket || !warranty::model::ReleasesClaim(ticket->status, ticket->quality_check_status, ticket->customer_approval_status)) {
        throw util::PreconditionFailed("repair_ticket_not_released",
                                       "repair ticket must be completed, quality approved and customer approved where required");
      }
      if (action == ClaimAction::kRepair) {
        claim.repair_cost_cents = ticket->total_cost_cents;
      } else {
        const auto& product = !input.replacement_product_id.empty() ? input.replacement_product_id : claim.replacement_product_id;
        if (product.empty()) {
          throw util::InvalidArgument("replacement product is required", {{"replacement_product_id", "is required", ""}});
        }
        claim.replacement_product_id = product;
      }
      if (!input.repair_notes.empty()) {
        ticket->repair_notes  = ticket->repair_notes.empty() ? input.repair_notes : ticket->repair_notes + "\n" + input.repair_notes;
        ticket->updated_at_ms = now_ms;
        ThrowIfDbError(repository_->UpdateTicket(tx, *ticket), "update repair notes");
      }
      break;
    }

    case ClaimAction::kDispute:
      claim.disputed_from = from;
      break;

    case ClaimAction::kResolve:
      target = input.resolve_to.value_or(ClaimStatus::kCompleted);
      if (!claim.disputed_from || !warranty::model::ResolveTargetAllowed(*claim.disputed_from, target)) {
        throw util::InvalidArgument("dispute resolves to the pre-dispute status or completed",
                                    {{"resolve_to", "must be the pre-dispute status or completed", Name(target)}});
      }
      claim.disputed_from.reset();
      resolves = target == ClaimStatus::kCompleted;
      break;

    case ClaimAction::kComplete:
      resolves = true;
      break;

    default:
      break;
  }

  if (resolves) {
    if (claim.resolution_type) {
      throw util::InvalidState("claim resolution already recorded", Name(from), LegalNames(from));
    }
    if (!input.resolution_type) {
      throw util::InvalidArgument("resolution type is required", {{"resolution_type", "is required", ""}});
    }
    if (input.resolution_notes.empty()) {
      throw util::InvalidArgument("resolution notes are required", {{"resolution_notes", "is required", ""}});
    }
    claim.resolution_type      = input.resolution_type;
    claim.resolution_notes     = input.resolution_notes;
    claim.completed_at_ms      = now_ms;
    claim.actual_completion_ms = now_ms;
    if (*input.resolution_type == ResolutionType::kReplace) {
      registry_->MarkClaimed(tx, claim.barcode_id, ctx.caller.actor_id, "replacement resolution of " + claim.claim_number);
    }
  }

  if (!input.notes.empty() && ctx.caller.actor_type != ActorType::kCustomer) claim.admin_notes = input.notes;

  claim.previous_status      = from;
  claim.status               = target;
  claim.status_updated_at_ms = now_ms;
  claim.status_updated_by    = ctx.caller.actor_id;
  RecomputeTotal(claim);

  const auto expected = claim.version;
  claim.version       = expected + 1;
  claim.updated_at_ms = now_ms;

  auto result = repository_->UpdateClaim(tx, claim, expected);
  if (result.code == db::ErrorCode::Conflict) {
    throw util::Conflict("claim " + claim.claim_number + " was modified concurrently");
  }
  ThrowIfDbError(result, "update claim");

  AppendTimeline(tx, claim.id, warranty::model::EventForTransition(action), Describe(action, from, target, input), ctx.caller,
                 input.visible_to_customer);
}

ClaimView ClaimWorkflow::Transition(const RequestContext& ctx, const std::string& claim_id, ClaimAction action, const TransitionInput& input) {
  CheckDeadline(ctx, *clock_);

  db::model::ClaimRecord claim;
  ClaimStatus            from   = ClaimStatus::kPending;
  bool                   replay = false;
  try {
    auto tx = repository_->Begin();
    claim   = LoadClaim(*tx, claim_id);
    RequireTransitionRole(ctx, claim, action);

    const auto scope = "claim:" + claim.id;
    if (Replayed(*tx, ctx, scope)) {
      replay = true;
      tx->Rollback();
    } else {
      from = claim.status;
      TransitionInTx(*tx, ctx, claim, action, input, false);
      Remember(*tx, ctx, scope, std::to_string(claim.version));
      tx->Commit();
    }
  } catch (const db::DbError& e) {
    ThrowDbError(e, "transition claim");
  }

  if (!replay) {
    observability::Metrics::Instance().RecordClaimTransition(warranty::model::ToString(action));
    WARRANTY_LOG_INFO("claim transitioned", {observability::StringField("claim_id", claim.id),
                                             observability::StringField("action", warranty::model::ToString(action)),
                                             observability::StringField("from", Name(from)),
                                             observability::StringField("to", Name(claim.status)),
                                             observability::StringField("actor", ctx.caller.actor_id)});
    NotifyCustomer(claim, "claim_status_changed");
  }
  return ClaimView{claim, DeriveClaim(claim)};
}

ClaimView ClaimWorkflow::Validate(const RequestContext& ctx, const std::string& claim_id, const std::string& notes) {
  TransitionInput input;
  input.notes = notes;
  return Transition(ctx, claim_id, ClaimAction::kValidate, input);
}

ClaimView ClaimWorkflow::Reject(const RequestContext& ctx, const std::string& claim_id, const std::string& reason) {
  if (reason.empty()) {
    throw util::InvalidArgument("rejection reason is required", {{"reason", "is required", ""}});
  }
  TransitionInput input;
  input.reason = reason;
  return Transition(ctx, claim_id, ClaimAction::kReject, input);
}

ClaimView ClaimWorkflow::Cancel(const RequestContext& ctx, const std::string& claim_id, const std::string& reason) {
  TransitionInput input;
  input.notes = reason;
  return Transition(ctx, claim_id, ClaimAction::kCancel, input);
}

ClaimView ClaimWorkflow::AssignTechnician(const RequestContext& ctx, const std::string& claim_id, const std::string& technician_id,
                                          uint64_t estimated_completion_ms, std::optional<warranty::model::Priority> priority) {
  if (technician_id.empty()) {
    throw util::InvalidArgument("technician is required", {{"technician_id", "is required", ""}});
  }
  TransitionInput input;
  input.technician_id           = technician_id;
  input.estimated_completion_ms = estimated_completion_ms;
  input.priority                = priority;
  return Transition(ctx, claim_id, ClaimAction::kAssign, input);
}

ClaimView ClaimWorkflow::Complete(const RequestContext& ctx, const std::string& claim_id, ResolutionType resolution,
                                  const std::string& resolution_notes) {
  if (resolution_notes.empty()) {
    throw util::InvalidArgument("resolution notes are required", {{"resolution_notes", "is required", ""}});
  }
  TransitionInput input;
  input.resolution_type  = resolution;
  input.resolution_notes = resolution_notes;
  return Transition(ctx, claim_id, ClaimAction::kComplete, input);
}

ClaimView ClaimWorkflow::RequestInfo(const RequestContext& ctx, const std::string& claim_id, const std::string& message) {
  RequireRole(ctx, {kRoleAgent});
  CheckDeadline(ctx, *clock_);
  if (message.empty() || message.size() > kMaxNoteLength) {
    throw util::InvalidArgument("message must be 1 to 2000 characters", {{"message", "must be 1 to 2000 characters", ""}});
  }

  db::model::ClaimRecord claim;
  bool                   replay = false;
  try {
    auto tx = repository_->Begin();
    claim   = LoadClaim(*tx, claim_id);
    if (claim.status != ClaimStatus::kPending) {
      throw util::InvalidState("information can only be requested on pending claims", Name(claim.status), LegalNames(claim.status));
    }

    const auto scope = "claim:" + claim.id;
    if (Replayed(*tx, ctx, scope)) {
      replay = true;
      tx->Rollback();
    } else {
      AppendTimeline(*tx, claim.id, TimelineEventType::kNoteAdded, "Additional information requested: " + message, ctx.caller, true);
      Remember(*tx, ctx, scope, std::to_string(claim.version));
      tx->Commit();
    }
  } catch (const db::DbError& e) {
    ThrowDbError(e, "request claim info");
  }

  if (!replay) NotifyCustomer(claim, "claim_info_requested");
  return ClaimView{claim, DeriveClaim(claim)};
}

std::vector<BulkItemResult> ClaimWorkflow::BulkTransition(const RequestContext& ctx, const std::vector<std::string>& claim_ids,
                                                          ClaimAction action, const TransitionInput& input) {
  RequireRole(ctx, {kRoleAgent});
  if (claim_ids.empty() || claim_ids.size() > options_.bulk_update_limit) {
    throw util::InvalidArgument("bulk update takes 1 to " + std::to_string(options_.bulk_update_limit) + " claims",
                                {{"claim_ids", "out of range", std::to_string(claim_ids.size())}});
  }

  std::vector<BulkItemResult> results;
  results.reserve(claim_ids.size());
  for (const auto& id : claim_ids) {
    BulkItemResult item;
    item.claim_id = id;
    try {
      item.claim = Transition(ctx, id, action, input);
      item.ok    = true;
    } catch (const std::exception& e) {
      item.error_kind = std::string(util::ErrorKind(e));
      item.message    = e.what();
      WARRANTY_LOG_WARN("bulk claim update item failed", {observability::StringField("claim_id", id),
                                                           observability::StringField("kind", item.error_kind),
                                                           observability::StringField("error", item.message)});
    }
    results.push_back(std::move(item));
  }
  return results;
}

// ---------------------------------------------------------------------------
// Notes, costs, reads
// ---------------------------------------------------------------------------

db::model::TimelineEventRecord ClaimWorkflow::AddNote(const RequestContext& ctx, const std::string& claim_id, const std::string& note,
                                                      bool visible_to_customer) {
  RequireRole(ctx, {kRoleAgent, kRoleTechnician, kRoleCustomer});
  CheckDeadline(ctx, *clock_);
  if (note.empty() || note.size() > kMaxNoteLength) {
    throw util::InvalidArgument("note must be 1 to 2000 characters", {{"note", "must be 1 to 2000 characters", std::to_string(note.size())}});
  }

  db::model::TimelineEventRecord event;
  try {
    auto tx    = repository_->Begin();
    auto claim = LoadClaim(*tx, claim_id);

    bool visible = visible_to_customer;
    if (!ctx.caller.HasRole(kRoleAgent) && !ctx.caller.HasRole(kRoleTechnician)) {
      if (claim.customer_id != ctx.caller.actor_id) throw util::NotFound("claim not found: " + claim_id);
      visible = true;
    }

    event = AppendTimeline(*tx, claim.id, TimelineEventType::kNoteAdded, note, ctx.caller, visible);
    tx->Commit();
  } catch (const db::DbError& e) {
    ThrowDbError(e, "add claim note");
  }
  return event;
}

ClaimView ClaimWorkflow::UpdateCosts(const RequestContext& ctx, const std::string& claim_id, const CostUpdate& update) {
  RequireRole(ctx, {kRoleAgent});
  CheckDeadline(ctx, *clock_);

  std::vector<util::FieldViolation> violations;
  auto check = [&](const char* field, const std::optional<int64_t>& v) {
    if (v && *v < 0) violations.push_back({field, "must not be negative", std::to_string(*v)});
  };
  check("repair_cost", update.repair_cost_cents);
  check("shipping_cost", update.shipping_cost_cents);
  check("replacement_cost", update.replacement_cost_cents);
  if (!violations.empty()) {
    throw util::InvalidArgument("invalid cost update", std::move(violations));
  }

  db::model::ClaimRecord claim;
  try {
    auto tx = repository_->Begin();
    claim   = LoadClaim(*tx, claim_id);
    if (warranty::model::IsTerminal(claim.status)) {
      throw util::InvalidState("claim is " + Name(claim.status), Name(claim.status), {});
    }
    if (update.expected_version && *update.expected_version != claim.version) {
      throw util::Conflict("claim " + claim.claim_number + " is at version " + std::to_string(claim.version));
    }

    if (update.repair_cost_cents) claim.repair_cost_cents = *update.repair_cost_cents;
    if (update.shipping_cost_cents) claim.shipping_cost_cents = *update.shipping_cost_cents;
    if (update.replacement_cost_cents) claim.replacement_cost_cents = *update.replacement_cost_cents;
    RecomputeTotal(claim);

    const auto expected = claim.version;
    claim.version       = expected + 1;
    claim.updated_at_ms = util::ToUnixMillis(clock_->Now());

    auto result = repository_->UpdateClaim(*tx, claim, expected);
    if (result.code == db::ErrorCode::Conflict) {
      throw util::Conflict("claim " + claim.claim_number + " was modified concurrently");
    }
    ThrowIfDbError(result, "update claim costs");
    tx->Commit();
  } catch (const db::DbError& e) {
    ThrowDbError(e, "update claim costs");
  }
  return ClaimView{claim, DeriveClaim(claim)};
}

ClaimView ClaimWorkflow::GetClaim(const RequestContext& ctx, const std::string& claim_ref) {
  RequireRole(ctx, {kRoleAgent, kRoleTechnician, kRoleCustomer});

  db::model::ClaimRecord claim;
  try {
    auto tx = repository_->Begin();
    claim   = LoadClaim(*tx, claim_ref);
    tx->Rollback();
  } catch (const db::DbError& e) {
    ThrowDbError(e, "get claim");
  }

  if (!ctx.caller.HasRole(kRoleAgent) && !ctx.caller.HasRole(kRoleTechnician)) {
    if (claim.customer_id != ctx.caller.actor_id) throw util::NotFound("claim not found: " + claim_ref);
    claim.admin_notes.clear();
  }
  return ClaimView{claim, DeriveClaim(claim)};
}

std::vector<ClaimView> ClaimWorkflow::ListClaims(const RequestContext& ctx, db::ClaimFilter filter, const db::Pagination& page) {
  RequireRole(ctx, {kRoleAgent, kRoleTechnician, kRoleCustomer});
  if (!ctx.caller.HasRole(kRoleAgent)) {
    if (ctx.caller.HasRole(kRoleTechnician)) {
      filter.technician_id = ctx.caller.actor_id;
    } else {
      filter.customer_id = ctx.caller.actor_id;
    }
  }

  std::vector<db::model::ClaimRecord> rows;
  try {
    auto tx = repository_->Begin();
    rows    = repository_->ListClaims(*tx, filter, page);
    tx->Rollback();
  } catch (const db::DbError& e) {
    ThrowDbError(e, "list claims");
  }

  std::vector<ClaimView> views;
  views.reserve(rows.size());
  const bool customer_view = !ctx.caller.HasRole(kRoleAgent) && !ctx.caller.HasRole(kRoleTechnician);
  for (auto& row : rows) {
    if (customer_view) row.admin_notes.clear();
    auto derived = DeriveClaim(row);
    views.push_back(ClaimView{std::move(row), std::move(derived)});
  }
  return views;
}

std::vector<db::model::TimelineEventRecord> ClaimWorkflow::GetTimeline(const RequestContext& ctx, const std::string& claim_id) {
  RequireRole(ctx, {kRoleAgent, kRoleTechnician, kRoleCustomer});

  std::vector<db::model::TimelineEventRecord> events;
  bool                                        customer_view = false;
  try {
    auto tx    = repository_->Begin();
    auto claim = LoadClaim(*tx, claim_id);
    if (!ctx.caller.HasRole(kRoleAgent) && !ctx.caller.HasRole(kRoleTechnician)) {
      if (claim.customer_id != ctx.caller.actor_id) throw util::NotFound("claim not found: " + claim_id);
      customer_view = true;
    }
    events = repository_->ListTimeline(*tx, claim.id);
    tx->Rollback();
  } catch (const db::DbError& e) {
    ThrowDbError(e, "get claim timeline");
  }

  if (customer_view) {
    std::erase_if(events, [](const auto& e) { return !e.visible_to_customer; });
  }
  return events;
}

} // namespace warranty::core
