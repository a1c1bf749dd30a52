#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "claim_workflow.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "request_context.hpp"

namespace warranty::core {

// The claim's current repair attempt: newest ticket that is not cancelled.
std::optional<db::model::RepairTicketRecord> FindLiveTicket(db::Repository& repository, db::Transaction& tx, const std::string& claim_id);

// Allocates an RPR- number and fills defaults from the claim. Not inserted.
db::model::RepairTicketRecord NewTicketRecord(db::Repository& repository, db::Transaction& tx, const db::model::ClaimRecord& claim,
                                              util::TimePoint now);

// Ticket side of claim `start`: opens a ticket when none exists, otherwise
// moves the live one to in_progress.
void StartTicketForClaim(db::Repository& repository, db::Transaction& tx, const db::model::ClaimRecord& claim, util::TimePoint now);

struct CreateTicketRequest {
  std::string                                claim_id;
  std::string                                technician_id;
  std::optional<warranty::model::Priority>   priority;
  double                                     estimated_hours = 0.0;
  uint64_t                                   estimated_completion_ms = 0;
  std::string                                description;
  std::string                                special_instructions;
  std::vector<db::model::PartUsage>          required_parts;
  std::optional<int64_t>                     estimated_cost_cents;
  bool                                       customer_approval_required = false;
};

struct CompleteTicketRequest {
  std::string                        ticket_id;
  double                             actual_hours = 0.0;
  std::vector<db::model::PartUsage>  used_parts;
  int64_t                            labor_cost_cents = 0;
  std::optional<int64_t>             parts_cost_cents; // defaults to the sum over used_parts
  std::string                        repair_notes;
  std::vector<db::model::TestResult> test_results;
};

struct RepairTicketOptions {
  double approval_overrun_ratio = 0.2;
};

/*
  RepairTicketEngine

  One live ticket per claim. Lifecycle:

    pending -> assigned -> in_progress -> completed
                                  ^            |
                                  +-- QA reject+

  Completion fixes total_cost = labor + parts and resets QA to pending.
  The claim may leave in_repair only once ReleasesClaim() holds for the
  live ticket (enforced by ClaimWorkflow).
*/
class RepairTicketEngine {
 public:
  RepairTicketEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<ClaimWorkflow> claims, std::shared_ptr<util::Clock> clock,
                     RepairTicketOptions options = {});

  db::model::RepairTicketRecord CreateTicket(const RequestContext& ctx, const CreateTicketRequest& request);

  db::model::RepairTicketRecord AssignTicket(const RequestContext& ctx, const std::string& ticket_id, const std::string& technician_id,
                                             uint64_t estimated_completion_ms);

  // assigned -> in_progress; drives the claim from assigned to in_repair.
  db::model::RepairTicketRecord StartTicket(const RequestContext& ctx, const std::string& ticket_id);

  db::model::RepairTicketRecord CompleteTicket(const RequestContext& ctx, const CompleteTicketRequest& request);

  db::model::RepairTicketRecord QualityCheck(const RequestContext& ctx, const std::string& ticket_id, bool approve, const std::string& notes);

  db::model::RepairTicketRecord CustomerApproval(const RequestContext& ctx, const std::string& ticket_id, bool approve, const std::string& notes);

  db::model::RepairTicketRecord              GetTicket(const RequestContext& ctx, const std::string& ticket_id);
  std::vector<db::model::RepairTicketRecord> ListTickets(const RequestContext& ctx, db::TicketFilter filter, const db::Pagination& page);

 private:
  db::model::RepairTicketRecord LoadTicket(db::Transaction& tx, const std::string& ticket_id);
  void RequireTicketWorker(const RequestContext& ctx, const db::model::RepairTicketRecord& ticket) const;
  void Save(db::Transaction& tx, db::model::RepairTicketRecord& ticket);

  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<ClaimWorkflow>  claims_;
  std::shared_ptr<util::Clock>    clock_;
  RepairTicketOptions             options_;
};

} // namespace warranty::core
