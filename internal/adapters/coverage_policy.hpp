#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/core/collaborators.hpp"

namespace warranty::adapters {

struct CoveragePolicyOptions {
  std::vector<std::string> excluded_issue_types           = {"water_damage", "physical_abuse"};
  int64_t                  uncovered_estimated_cost_cents = 15000;
  std::vector<std::string> covered_components             = {"hardware", "software", "battery", "screen"};
  std::vector<std::string> terms = {"Must provide proof of purchase", "Damage must be reported within 30 days"};
};

/*
  Exclusion-list coverage policy.

  An issue is covered when the warranty is claimable and neither the issue
  type nor its category is on the exclusion list. Uncovered issues quote a
  flat estimated repair cost.
*/
class DefaultCoveragePolicy final : public warranty::core::CoveragePolicy {
 public:
  explicit DefaultCoveragePolicy(CoveragePolicyOptions options = {});

  warranty::core::CoverageTerms Terms(const std::optional<warranty::core::ProductInfo>& product) const override;

  warranty::core::CoverageDecision Decide(const std::string& issue_type, const std::string& issue_category, const std::string& description,
                                          bool warranty_claimable) const override;

 private:
  bool Excluded(const std::string& value) const;

  CoveragePolicyOptions options_;
};

} // namespace warranty::adapters
