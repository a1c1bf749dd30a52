#include "repair_ticket_engine.hpp"

#include "db_errors.hpp"
#include "identifier_generator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace warranty::core {

using warranty::model::ClaimAction;
using warranty::model::ClaimStatus;
using warranty::model::CustomerApprovalStatus;
using warranty::model::QualityCheckStatus;
using warranty::model::TicketStatus;
using warranty::model::TimelineEventType;

namespace {

constexpr double      kMinEstimatedHours      = 0.1;
constexpr double      kMaxEstimatedHours      = 1000.0;
constexpr std::size_t kMinTicketDescription   = 10;

int64_t PartsTotal(const std::vector<db::model::PartUsage>& parts) {
  int64_t total = 0;
  for (const auto& p : parts) total += static_cast<int64_t>(p.quantity) * p.unit_cost_cents;
  return total;
}

void CheckParts(std::vector<util::FieldViolation>& violations, const char* field, const std::vector<db::model::PartUsage>& parts) {
  for (const auto& p : parts) {
    if (p.name.empty() || p.quantity == 0 || p.unit_cost_cents < 0) {
      violations.push_back({field, "each part needs a name, a positive quantity and a non-negative unit cost", p.name});
      return;
    }
  }
}

std::string TicketState(const db::model::RepairTicketRecord& t) {
  return std::string(warranty::model::ToString(t.status));
}

} // namespace

std::optional<db::model::RepairTicketRecord> FindLiveTicket(db::Repository& repository, db::Transaction& tx, const std::string& claim_id) {
  db::TicketFilter filter;
  filter.claim_id = claim_id;
  auto tickets    = repository.ListTickets(tx, filter, db::Pagination{0, 0});
  for (auto it = tickets.rbegin(); it != tickets.rend(); ++it) {
    if (it->status != TicketStatus::kCancelled) return *it;
  }
  return std::nullopt;
}

db::model::RepairTicketRecord NewTicketRecord(db::Repository& repository, db::Transaction& tx, const db::model::ClaimRecord& claim,
                                              util::TimePoint now) {
  const auto year = util::YearOf(now);
  uint64_t   seq  = 0;
  ThrowIfDbError(repository.NextSequence(tx, "ticket", year, seq), "allocate ticket number");

  const auto now_ms = util::ToUnixMillis(now);

  db::model::RepairTicketRecord t;
  t.id                      = util::NewId();
  t.ticket_number           = FormatSequenceNumber("RPR", year, seq);
  t.claim_id                = claim.id;
  t.priority                = claim.priority;
  t.assigned_technician_id  = claim.assigned_technician_id;
  t.status                  = claim.assigned_technician_id.empty() ? TicketStatus::kPending : TicketStatus::kAssigned;
  t.assigned_at_ms          = claim.assigned_technician_id.empty() ? 0 : now_ms;
  t.estimated_completion_ms = claim.estimated_completion_ms;
  t.description             = "Repair for claim " + claim.claim_number;
  t.created_at_ms           = now_ms;
  t.updated_at_ms           = now_ms;
  return t;
}

void StartTicketForClaim(db::Repository& repository, db::Transaction& tx, const db::model::ClaimRecord& claim, util::TimePoint now) {
  const auto now_ms = util::ToUnixMillis(now);
  auto       ticket = FindLiveTicket(repository, tx, claim.id);

  if (!ticket) {
    auto fresh          = NewTicketRecord(repository, tx, claim, now);
    fresh.status        = TicketStatus::kInProgress;
    fresh.started_at_ms = now_ms;
    ThrowIfDbError(repository.InsertTicket(tx, fresh), "open repair ticket");
    return;
  }

  switch (ticket->status) {
    case TicketStatus::kPending:
    case TicketStatus::kAssigned:
      if (ticket->assigned_technician_id.empty()) {
        ticket->assigned_technician_id = claim.assigned_technician_id;
        ticket->assigned_at_ms         = now_ms;
      }
      ticket->status        = TicketStatus::kInProgress;
      ticket->started_at_ms = now_ms;
      ticket->updated_at_ms = now_ms;
      ThrowIfDbError(repository.UpdateTicket(tx, *ticket), "start repair ticket");
      return;
    case TicketStatus::kInProgress:
      return;
    default:
      throw util::PreconditionFailed("repair_ticket_not_startable", "repair ticket " + ticket->ticket_number + " is " + TicketState(*ticket));
  }
}

RepairTicketEngine::RepairTicketEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<ClaimWorkflow> claims,
                                       std::shared_ptr<util::Clock> clock, RepairTicketOptions options)
    : repository_(std::move(repository)), claims_(std::move(claims)), clock_(std::move(clock)), options_(options) {
}

db::model::RepairTicketRecord RepairTicketEngine::LoadTicket(db::Transaction& tx, const std::string& ticket_id) {
  auto row = repository_->GetTicket(tx, ticket_id);
  if (!row) throw util::NotFound("repair ticket not found: " + ticket_id);
  return *row;
}

void RepairTicketEngine::RequireTicketWorker(const RequestContext& ctx, const db::model::RepairTicketRecord& ticket) const {
  if (ctx.caller.HasRole(kRoleAgent)) return;
  if (ctx.caller.HasRole(kRoleTechnician) && ticket.assigned_technician_id == ctx.caller.actor_id) return;
  throw util::Forbidden("caller is not working repair ticket " + ticket.ticket_number);
}

void RepairTicketEngine::Save(db::Transaction& tx, db::model::RepairTicketRecord& ticket) {
  ticket.updated_at_ms = util::ToUnixMillis(clock_->Now());
  ThrowIfDbError(repository_->UpdateTicket(tx, ticket), "update repair ticket");
}

db::model::RepairTicketRecord RepairTicketEngine::CreateTicket(const RequestContext& ctx, const CreateTicketRequest& request) {
  RequireRole(ctx, {kRoleAgent});
  CheckDeadline(ctx, *clock_);

  std::vector<util::FieldViolation> violations;
  if (request.estimated_hours < kMinEstimatedHours || request.estimated_hours > kMaxEstimatedHours) {
    violations.push_back({"estimated_hours", "must be between 0.1 and 1000", std::to_string(request.estimated_hours)});
  }
  if (request.description.size() < kMinTicketDescription) {
    violations.push_back({"description", "must be at least 10 characters", request.description});
  }
  if (request.estimated_cost_cents && *request.estimated_cost_cents < 0) {
    violations.push_back({"estimated_cost", "must not be negative", std::to_string(*request.estimated_cost_cents)});
  }
  CheckParts(violations, "required_parts", request.required_parts);
  if (!violations.empty()) {
    throw util::InvalidArgument("invalid repair ticket", std::move(violations));
  }

  db::model::RepairTicketRecord ticket;
  try {
    auto tx    = repository_->Begin();
    auto claim = claims_->LoadClaim(*tx, request.claim_id);
    if (claim.status != ClaimStatus::kAssigned) {
      throw util::InvalidState("repair tickets are opened on assigned claims", std::string(warranty::model::ToString(claim.status)),
                               {});
    }
    if (auto live = FindLiveTicket(*repository_, *tx, claim.id)) {
      throw util::Conflict("claim " + claim.claim_number + " already has repair ticket " + live->ticket_number);
    }

    const auto now = clock_->Now();
    ticket         = NewTicketRecord(*repository_, *tx, claim, now);
    if (!request.technician_id.empty()) {
      ticket.assigned_technician_id = request.technician_id;
      ticket.status                 = TicketStatus::kAssigned;
      ticket.assigned_at_ms         = util::ToUnixMillis(now);
    }
    if (request.priority) ticket.priority = *request.priority;
    if (request.estimated_completion_ms > 0) ticket.estimated_completion_ms = request.estimated_completion_ms;
    ticket.estimated_hours      = request.estimated_hours;
    ticket.description          = request.description;
    ticket.special_instructions = request.special_instructions;
    ticket.required_parts       = request.required_parts;
    ticket.estimated_cost_cents = request.estimated_cost_cents.value_or(PartsTotal(request.required_parts));
    if (request.customer_approval_required) {
      ticket.customer_approval_required = true;
      ticket.customer_approval_status   = CustomerApprovalStatus::kPending;
    }

    ThrowIfDbError(repository_->InsertTicket(*tx, ticket), "insert repair ticket");
    tx->Commit();
  } catch (const db::DbError& e) {
    ThrowDbError(e, "create repair ticket");
  }

  WARRANTY_LOG_INFO("repair ticket created", {observability::StringField("ticket", ticket.ticket_number),
                                              observability::StringField("claim_id", ticket.claim_id),
                                              observability::StringField("technician", ticket.assigned_technician_id)});
  return ticket;
}

db::model::RepairTicketRecord RepairTicketEngine::AssignTicket(const RequestContext& ctx, const std::string& ticket_id,
                                                               const std::string& technician_id, uint64_t estimated_completion_ms) {
  RequireRole(ctx, {kRoleAgent});
  CheckDeadline(ctx, *clock_);
  if (technician_id.empty()) {
    throw util::InvalidArgument("technician is required", {{"technician_id", "is required", ""}});
  }

  db::model::RepairTicketRecord ticket;
  try {
    auto tx = repository_->Begin();
    ticket  = LoadTicket(*tx, ticket_id);
    if (!warranty::model::CanReassign(ticket.status)) {
      throw util::InvalidState("repair ticket " + ticket.ticket_number + " cannot be reassigned", TicketState(ticket), {});
    }

    const auto now_ms             = util::ToUnixMillis(clock_->Now());
    ticket.assigned_technician_id = technician_id;
    ticket.assigned_at_ms         = now_ms;
    // Work already started stays in progress under the new technician.
    if (ticket.status != TicketStatus::kInProgress) ticket.status = TicketStatus::kAssigned;
    if (estimated_completion_ms > 0) ticket.estimated_completion_ms = estimated_completion_ms;
    Save(*tx, ticket);

    // Keep the claim's technician in step with the ticket.
    auto claim = claims_->LoadClaim(*tx, ticket.claim_id);
    if (claim.assigned_technician_id != technician_id) {
      const auto expected          = claim.version;
      claim.assigned_technician_id = technician_id;
      if (estimated_completion_ms > 0) claim.estimated_completion_ms = estimated_completion_ms;
      claim.version       = expected + 1;
      claim.updated_at_ms = now_ms;
      auto result         = repository_->UpdateClaim(*tx, claim, expected);
      if (result.code == db::ErrorCode::Conflict) {
        throw util::Conflict("claim " + claim.claim_number + " was modified concurrently");
      }
      ThrowIfDbError(result, "reassign claim technician");
    }
    tx->Commit();
  } catch (const db::DbError& e) {
    ThrowDbError(e, "assign repair ticket");
  }
  return ticket;
}

db::model::RepairTicketRecord RepairTicketEngine::StartTicket(const RequestContext& ctx, const std::string& ticket_id) {
  CheckDeadline(ctx, *clock_);

  db::model::RepairTicketRecord ticket;
  try {
    auto tx = repository_->Begin();
    ticket  = LoadTicket(*tx, ticket_id);
    RequireTicketWorker(ctx, ticket);
    if (ticket.status != TicketStatus::kAssigned) {
      throw util::InvalidState("repair ticket " + ticket.ticket_number + " is not assigned", TicketState(ticket), {});
    }

    auto claim = claims_->LoadClaim(*tx, ticket.claim_id);
    if (claim.status == ClaimStatus::kAssigned) {
      TransitionInput input;
      input.notes = "repair ticket " + ticket.ticket_number + " started";
      claims_->TransitionInTx(*tx, ctx, claim, ClaimAction::kStart, input, true);
    } else if (claim.status != ClaimStatus::kInRepair) {
      throw util::InvalidState("claim " + claim.claim_number + " is not ready for repair", std::string(warranty::model::ToString(claim.status)),
                               {});
    }

    ticket.status        = TicketStatus::kInProgress;
    ticket.started_at_ms = util::ToUnixMillis(clock_->Now());
    Save(*tx, ticket);
    tx->Commit();
  } catch (const db::DbError& e) {
    ThrowDbError(e, "start repair ticket");
  }

  WARRANTY_LOG_INFO("repair started", {observability::StringField("ticket", ticket.ticket_number),
                                       observability::StringField("technician", ticket.assigned_technician_id)});
  return ticket;
}

db::model::RepairTicketRecord RepairTicketEngine::CompleteTicket(const RequestContext& ctx, const CompleteTicketRequest& request) {
  CheckDeadline(ctx, *clock_);

  std::vector<util::FieldViolation> violations;
  if (request.actual_hours < 0) {
    violations.push_back({"actual_hours", "must not be negative", std::to_string(request.actual_hours)});
  }
  if (request.labor_cost_cents < 0) {
    violations.push_back({"labor_cost", "must not be negative", std::to_string(request.labor_cost_cents)});
  }
  if (request.parts_cost_cents && *request.parts_cost_cents < 0) {
    violations.push_back({"parts_cost", "must not be negative", std::to_string(*request.parts_cost_cents)});
  }
  CheckParts(violations, "used_parts", request.used_parts);
  if (!violations.empty()) {
    throw util::InvalidArgument("invalid ticket completion", std::move(violations));
  }

  db::model::RepairTicketRecord ticket;
  try {
    auto tx = repository_->Begin();
    ticket  = LoadTicket(*tx, request.ticket_id);
    RequireTicketWorker(ctx, ticket);
    if (ticket.status != TicketStatus::kInProgress) {
      throw util::InvalidState("repair ticket " + ticket.ticket_number + " is not in progress", TicketState(ticket), {});
    }

    ticket.actual_hours         = request.actual_hours;
    ticket.used_parts           = request.used_parts;
    ticket.test_results         = request.test_results;
    ticket.labor_cost_cents     = request.labor_cost_cents;
    ticket.parts_cost_cents     = request.parts_cost_cents.value_or(PartsTotal(request.used_parts));
    ticket.total_cost_cents     = ticket.labor_cost_cents + ticket.parts_cost_cents;
    ticket.actual_completion_ms = util::ToUnixMillis(clock_->Now());
    ticket.status               = TicketStatus::kCompleted;
    ticket.quality_check_status = QualityCheckStatus::kPending;
    if (!request.repair_notes.empty()) ticket.repair_notes = request.repair_notes;
    // A declined approval is asked for again on the revised work.
    if (ticket.customer_approval_status == CustomerApprovalStatus::kRejected) {
      ticket.customer_approval_status = CustomerApprovalStatus::kPending;
    }

    const auto ceiling = static_cast<double>(ticket.estimated_cost_cents) * (1.0 + options_.approval_overrun_ratio);
    if (ticket.estimated_cost_cents > 0 && static_cast<double>(ticket.total_cost_cents) > ceiling &&
        ticket.customer_approval_status != CustomerApprovalStatus::kApproved) {
      ticket.customer_approval_required = true;
      ticket.customer_approval_status   = CustomerApprovalStatus::kPending;
      WARRANTY_LOG_INFO("repair cost overrun needs customer approval", {observability::StringField("ticket", ticket.ticket_number),
                                                                        observability::IntField("total_cost", ticket.total_cost_cents),
                                                                        observability::IntField("estimated_cost", ticket.estimated_cost_cents)});
    }

    Save(*tx, ticket);
    claims_->AppendTimeline(*tx, ticket.claim_id, TimelineEventType::kRepairCompleted,
                            "repair ticket " + ticket.ticket_number + " completed", ctx.caller, true);
    tx->Commit();
  } catch (const db::DbError& e) {
    ThrowDbError(e, "complete repair ticket");
  }
  return ticket;
}

db::model::RepairTicketRecord RepairTicketEngine::QualityCheck(const RequestContext& ctx, const std::string& ticket_id, bool approve,
                                                               const std::string& notes) {
  RequireRole(ctx, {kRoleAgent});
  CheckDeadline(ctx, *clock_);
  if (!approve && notes.empty()) {
    throw util::InvalidArgument("rejection notes are required", {{"notes", "is required when rejecting", ""}});
  }

  db::model::RepairTicketRecord ticket;
  try {
    auto tx = repository_->Begin();
    ticket  = LoadTicket(*tx, ticket_id);
    if (ticket.status != TicketStatus::kCompleted || ticket.quality_check_status != QualityCheckStatus::kPending) {
      throw util::InvalidState("repair ticket " + ticket.ticket_number + " is not awaiting quality check", TicketState(ticket), {});
    }

    ticket.quality_checked_by    = ctx.caller.actor_id;
    ticket.quality_checked_at_ms = util::ToUnixMillis(clock_->Now());
    ticket.quality_notes         = notes;

    if (approve) {
      ticket.quality_check_status = QualityCheckStatus::kApproved;
      claims_->AppendTimeline(*tx, ticket.claim_id, TimelineEventType::kQualityApproved,
                              "quality check approved repair ticket " + ticket.ticket_number, ctx.caller, true);
    } else {
      ticket.quality_check_status = QualityCheckStatus::kRejected;
      ticket.status               = TicketStatus::kInProgress;
      ticket.total_cost_cents     = 0;
      ticket.reopen_count += 1;
      claims_->AppendTimeline(*tx, ticket.claim_id, TimelineEventType::kStatusUpdated,
                              "quality check rejected repair ticket " + ticket.ticket_number + ": " + notes, ctx.caller, false);
    }
    Save(*tx, ticket);
    tx->Commit();
  } catch (const db::DbError& e) {
    ThrowDbError(e, "quality check");
  }

  WARRANTY_LOG_INFO("quality check recorded", {observability::StringField("ticket", ticket.ticket_number),
                                               observability::BoolField("approved", approve),
                                               observability::IntField("reopen_count", ticket.reopen_count)});
  return ticket;
}

db::model::RepairTicketRecord RepairTicketEngine::CustomerApproval(const RequestContext& ctx, const std::string& ticket_id, bool approve,
                                                                   const std::string& notes) {
  RequireRole(ctx, {kRoleAgent, kRoleCustomer});
  CheckDeadline(ctx, *clock_);

  db::model::RepairTicketRecord ticket;
  try {
    auto tx    = repository_->Begin();
    ticket     = LoadTicket(*tx, ticket_id);
    auto claim = claims_->LoadClaim(*tx, ticket.claim_id);
    if (!ctx.caller.HasRole(kRoleAgent) && claim.customer_id != ctx.caller.actor_id) {
      throw util::NotFound("repair ticket not found: " + ticket_id);
    }
    if (!ticket.customer_approval_required || ticket.customer_approval_status != CustomerApprovalStatus::kPending) {
      throw util::InvalidState("repair ticket " + ticket.ticket_number + " is not awaiting customer approval",
                               std::string(warranty::model::ToString(ticket.customer_approval_status)), {});
    }

    ticket.customer_approval_status = approve ? CustomerApprovalStatus::kApproved : CustomerApprovalStatus::kRejected;
    ticket.customer_approved_at_ms  = util::ToUnixMillis(clock_->Now());
    ticket.customer_approval_notes  = notes;

    if (approve) {
      claims_->AppendTimeline(*tx, claim.id, TimelineEventType::kCustomerApproved, "customer approved repair ticket " + ticket.ticket_number,
                              ctx.caller, true);
    } else {
      claims_->AppendTimeline(*tx, claim.id, TimelineEventType::kNoteAdded,
                              "customer declined repair ticket " + ticket.ticket_number + (notes.empty() ? "" : ": " + notes), ctx.caller, true);
      // Declined work goes back to the technician for a revised repair.
      if (ticket.status == TicketStatus::kCompleted) {
        ticket.status               = TicketStatus::kInProgress;
        ticket.quality_check_status = QualityCheckStatus::kPending;
        ticket.total_cost_cents     = 0;
        ticket.reopen_count += 1;
      }
    }
    Save(*tx, ticket);
    tx->Commit();
  } catch (const db::DbError& e) {
    ThrowDbError(e, "customer approval");
  }
  return ticket;
}

db::model::RepairTicketRecord RepairTicketEngine::GetTicket(const RequestContext& ctx, const std::string& ticket_id) {
  RequireRole(ctx, {kRoleAgent, kRoleTechnician, kRoleCustomer});

  db::model::RepairTicketRecord ticket;
  try {
    auto tx = repository_->Begin();
    ticket  = LoadTicket(*tx, ticket_id);
    if (!ctx.caller.HasRole(kRoleAgent) && !ctx.caller.HasRole(kRoleTechnician)) {
      auto claim = claims_->LoadClaim(*tx, ticket.claim_id);
      if (claim.customer_id != ctx.caller.actor_id) throw util::NotFound("repair ticket not found: " + ticket_id);
    }
    tx->Rollback();
  } catch (const db::DbError& e) {
    ThrowDbError(e, "get repair ticket");
  }
  return ticket;
}

std::vector<db::model::RepairTicketRecord> RepairTicketEngine::ListTickets(const RequestContext& ctx, db::TicketFilter filter,
                                                                           const db::Pagination& page) {
  RequireRole(ctx, {kRoleAgent, kRoleTechnician});
  if (!ctx.caller.HasRole(kRoleAgent)) filter.technician_id = ctx.caller.actor_id;

  try {
    auto tx   = repository_->Begin();
    auto rows = repository_->ListTickets(*tx, filter, page);
    tx->Rollback();
    return rows;
  } catch (const db::DbError& e) {
    ThrowDbError(e, "list repair tickets");
  }
}

} // namespace warranty::core
