#include "coverage_policy.hpp"

#include <algorithm>

namespace warranty::adapters {

using warranty::core::CoverageDecision;
using warranty::core::CoverageTerms;

DefaultCoveragePolicy::DefaultCoveragePolicy(CoveragePolicyOptions options) : options_(std::move(options)) {
}

bool DefaultCoveragePolicy::Excluded(const std::string& value) const {
  return !value.empty() && std::find(options_.excluded_issue_types.begin(), options_.excluded_issue_types.end(), value) !=
                               options_.excluded_issue_types.end();
}

CoverageTerms DefaultCoveragePolicy::Terms(const std::optional<warranty::core::ProductInfo>& product) const {
  CoverageTerms terms;
  terms.covered_components  = options_.covered_components;
  terms.excluded_components = options_.excluded_issue_types;
  terms.terms               = options_.terms;
  if (product && product->warranty_period_months > 0) {
    terms.terms.push_back(std::to_string(product->warranty_period_months) + " month manufacturer warranty");
  }
  return terms;
}

CoverageDecision DefaultCoveragePolicy::Decide(const std::string& issue_type, const std::string& issue_category, const std::string&,
                                               bool warranty_claimable) const {
  CoverageDecision d;
  if (warranty_claimable && !Excluded(issue_type) && !Excluded(issue_category)) {
    d.covered              = true;
    d.coverage_type        = "full";
    d.estimated_cost_cents = 0;
    d.message              = "This issue is fully covered under your warranty";
    d.next_steps           = {"Submit warranty claim", "Schedule repair appointment"};
    d.recommendations      = {"Contact authorized service center", "Backup your data before repair"};
    return d;
  }

  d.covered              = false;
  d.coverage_type        = "not_covered";
  d.estimated_cost_cents = options_.uncovered_estimated_cost_cents;
  d.message = warranty_claimable ? "This issue is not covered under your warranty" : "No active warranty covers this product";
  d.next_steps      = {"Contact customer service for paid repair options", "Get quote from authorized service center"};
  d.recommendations = {"Consider extended warranty for future coverage", "Review warranty terms and conditions"};
  return d;
}

} // namespace warranty::adapters
