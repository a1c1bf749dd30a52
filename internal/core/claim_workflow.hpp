#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "attachment_rules.hpp"
#include "collaborators.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/util/time.hpp"
#include "request_context.hpp"
#include "warranty_registry.hpp"

namespace warranty::core {

struct ClaimDerived {
  bool                     can_cancel = false;
  bool                     can_update = false;
  std::vector<std::string> next_actions;
  std::string              display_status;
};

struct ClaimView {
  db::model::ClaimRecord claim;
  ClaimDerived           derived;
};

ClaimDerived DeriveClaim(const db::model::ClaimRecord& claim);

struct SubmitClaimRequest {
  std::string                      barcode;
  warranty::model::IssueCategory   issue_category = warranty::model::IssueCategory::kOther;
  std::string                      issue_description;
  warranty::model::Severity        severity = warranty::model::Severity::kMedium;
  std::string                      customer_name;
  std::string                      customer_email;
  std::string                      customer_phone;
  std::string                      pickup_address;
  std::string                      customer_notes;
  std::vector<std::string>         tags;
  // Filed with the claim; any rejected file rejects the whole submission.
  std::vector<AttachmentUpload>    attachments;
};

// Optional inputs carried by a transition; which ones matter depends on the action.
struct TransitionInput {
  std::string                                    notes;
  std::string                                    repair_notes;
  std::string                                    reason;
  std::string                                    technician_id;
  uint64_t                                       estimated_completion_ms = 0;
  std::optional<warranty::model::Priority>       priority;
  std::optional<warranty::model::ResolutionType> resolution_type;
  std::string                                    resolution_notes;
  std::string                                    replacement_product_id;
  std::optional<warranty::model::ClaimStatus>    resolve_to;
  std::optional<uint64_t>                        expected_version;
  bool                                           visible_to_customer = true;
};

struct CostUpdate {
  std::optional<int64_t>  repair_cost_cents;
  std::optional<int64_t>  shipping_cost_cents;
  std::optional<int64_t>  replacement_cost_cents;
  std::optional<uint64_t> expected_version;
};

struct BulkItemResult {
  std::string              claim_id;
  bool                     ok = false;
  std::string              error_kind;
  std::string              message;
  std::optional<ClaimView> claim;
};

struct ClaimWorkflowOptions {
  uint32_t          bulk_update_limit = 100;
  AttachmentOptions attachments;
};

/*
  ClaimWorkflow

  Drives a claim through the transition table in state_machine.hpp.

  Every accepted transition, inside one transaction:
    - compare-and-set on claim.version
    - previous_status <- status, status <- target
    - exactly one timeline event, stamped no earlier than the last one
    - idempotency key (claim, request_id) when the caller sent one

  Notifications go out after commit and never undo it.
*/
class ClaimWorkflow {
 public:
  ClaimWorkflow(std::shared_ptr<db::Repository> repository, std::shared_ptr<WarrantyRegistry> registry,
                std::shared_ptr<CustomerDirectory> customers, std::shared_ptr<Notifier> notifier, std::shared_ptr<util::Clock> clock,
                ClaimWorkflowOptions options = {});

  ClaimView Submit(const RequestContext& ctx, const SubmitClaimRequest& request);

  ClaimView Transition(const RequestContext& ctx, const std::string& claim_id, warranty::model::ClaimAction action, const TransitionInput& input);

  ClaimView Validate(const RequestContext& ctx, const std::string& claim_id, const std::string& notes);
  ClaimView Reject(const RequestContext& ctx, const std::string& claim_id, const std::string& reason);
  ClaimView Cancel(const RequestContext& ctx, const std::string& claim_id, const std::string& reason);

  // pending only; appends a timeline entry without changing status.
  ClaimView RequestInfo(const RequestContext& ctx, const std::string& claim_id, const std::string& message);

  ClaimView AssignTechnician(const RequestContext& ctx, const std::string& claim_id, const std::string& technician_id,
                             uint64_t estimated_completion_ms, std::optional<warranty::model::Priority> priority);

  ClaimView Complete(const RequestContext& ctx, const std::string& claim_id, warranty::model::ResolutionType resolution,
                     const std::string& resolution_notes);

  std::vector<BulkItemResult> BulkTransition(const RequestContext& ctx, const std::vector<std::string>& claim_ids,
                                             warranty::model::ClaimAction action, const TransitionInput& input);

  db::model::TimelineEventRecord AddNote(const RequestContext& ctx, const std::string& claim_id, const std::string& note, bool visible_to_customer);

  ClaimView UpdateCosts(const RequestContext& ctx, const std::string& claim_id, const CostUpdate& update);

  ClaimView                              GetClaim(const RequestContext& ctx, const std::string& claim_ref);
  std::vector<ClaimView>                 ListClaims(const RequestContext& ctx, db::ClaimFilter filter, const db::Pagination& page);
  std::vector<db::model::TimelineEventRecord> GetTimeline(const RequestContext& ctx, const std::string& claim_id);

  // Applies a transition inside the caller's transaction without role
  // checks. ticket_driven skips the ticket side of `start`.
  void TransitionInTx(db::Transaction& tx, const RequestContext& ctx, db::model::ClaimRecord& claim, warranty::model::ClaimAction action,
                      const TransitionInput& input, bool ticket_driven);

  db::model::TimelineEventRecord AppendTimeline(db::Transaction& tx, const std::string& claim_id, warranty::model::TimelineEventType type,
                                                const std::string& description, const Caller& actor, bool visible_to_customer);

  db::model::ClaimRecord LoadClaim(db::Transaction& tx, const std::string& claim_ref);

 private:
  void RequireTransitionRole(const RequestContext& ctx, const db::model::ClaimRecord& claim, warranty::model::ClaimAction action) const;
  bool Replayed(db::Transaction& tx, const RequestContext& ctx, const std::string& scope);
  void Remember(db::Transaction& tx, const RequestContext& ctx, const std::string& scope, const std::string& result_ref);
  void NotifyCustomer(const db::model::ClaimRecord& claim, const std::string& template_id);

  std::shared_ptr<db::Repository>    repository_;
  std::shared_ptr<WarrantyRegistry>  registry_;
  std::shared_ptr<CustomerDirectory> customers_;
  std::shared_ptr<Notifier>          notifier_;
  std::shared_ptr<util::Clock>       clock_;
  ClaimWorkflowOptions               options_;
  AttachmentRules                    attachment_rules_;
};

} // namespace warranty::core
