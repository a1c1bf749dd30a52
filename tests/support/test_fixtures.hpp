#pragma once

#include <atomic>
#include <cassert>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/adapters/coverage_policy.hpp"
#include "internal/adapters/static_read_models.hpp"
#include "internal/catalog/product_cache.hpp"
#include "internal/core/attachment_custodian.hpp"
#include "internal/core/claim_workflow.hpp"
#include "internal/core/public_validator.hpp"
#include "internal/core/repair_ticket_engine.hpp"
#include "internal/core/request_context.hpp"
#include "internal/core/warranty_registry.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace warranty::testing {

// Clock pinned by the test; Advance() moves it forward.
class ManualClock final : public util::Clock {
 public:
  explicit ManualClock(util::TimePoint start) : now_ms_(util::ToUnixMillis(start)) {
  }

  util::TimePoint Now() const override {
    return util::FromUnixMillis(now_ms_.load());
  }

  void Set(util::TimePoint tp) {
    now_ms_ = util::ToUnixMillis(tp);
  }

  void AdvanceMs(uint64_t ms) {
    now_ms_ += ms;
  }

  void AdvanceDays(uint64_t days) {
    AdvanceMs(days * 86400000ULL);
  }

 private:
  std::atomic<uint64_t> now_ms_;
};

struct SentNotification {
  std::string                        recipient;
  std::string                        template_id;
  std::map<std::string, std::string> payload;
};

class RecordingNotifier final : public core::Notifier {
 public:
  void Notify(const std::string& recipient, const std::string& template_id, const std::map<std::string, std::string>& payload) override {
    std::lock_guard lock(mutex_);
    sent_.push_back({recipient, template_id, payload});
  }

  std::vector<SentNotification> Sent() const {
    std::lock_guard lock(mutex_);
    return sent_;
  }

  std::size_t Count(const std::string& template_id) const {
    std::lock_guard lock(mutex_);
    std::size_t n = 0;
    for (const auto& s : sent_) {
      if (s.template_id == template_id) ++n;
    }
    return n;
  }

 private:
  mutable std::mutex            mutex_;
  std::vector<SentNotification> sent_;
};

// Catalog wrapper counting how often the backing read-model is hit.
class CountingCatalog final : public core::ProductCatalog {
 public:
  explicit CountingCatalog(std::vector<core::ProductInfo> products) : inner_(std::move(products)) {
  }

  std::optional<core::ProductInfo> LookupProduct(const std::string& product_id) override {
    ++lookups;
    if (unavailable) throw util::DependencyFailure("product catalog unavailable");
    return inner_.LookupProduct(product_id);
  }

  std::optional<core::ProductInfo> LookupBySku(const std::string& sku) override {
    ++lookups;
    if (unavailable) throw util::DependencyFailure("product catalog unavailable");
    return inner_.LookupBySku(sku);
  }

  std::atomic<int>  lookups{0};
  std::atomic<bool> unavailable{false};

 private:
  adapters::StaticProductCatalog inner_;
};

inline core::ProductInfo PhoneProduct() {
  core::ProductInfo p;
  p.id                     = "prod-phone";
  p.sku                    = "SKU-PHONE-1";
  p.name                   = "Smart Phone X";
  p.brand                  = "Acme";
  p.category               = "phones";
  p.base_price_cents       = 49900;
  p.image_url              = "https://cdn.example.com/phone.png";
  p.warranty_period_months = 12;
  return p;
}

inline core::CustomerInfo CustomerAlice() {
  return core::CustomerInfo{"cust-alice", "alice@example.com", "Alice Moreau", "+33 6 00 00 00 01"};
}

inline core::CustomerInfo CustomerBob() {
  return core::CustomerInfo{"cust-bob", "bob@example.com", "Bob Keller", "+33 6 00 00 00 02"};
}

inline core::RequestContext MakeContext(const std::string& actor_id, model::ActorType type, const std::string& role) {
  core::RequestContext ctx;
  ctx.caller.actor_id   = actor_id;
  ctx.caller.actor_type = type;
  ctx.caller.roles      = {role};
  return ctx;
}

inline core::RequestContext AdminContext() {
  return MakeContext("admin-1", model::ActorType::kAgent, "admin");
}

inline core::RequestContext AgentContext() {
  return MakeContext("agent-1", model::ActorType::kAgent, "agent");
}

inline core::RequestContext TechnicianContext(const std::string& id = "tech-1") {
  return MakeContext(id, model::ActorType::kTechnician, "technician");
}

inline core::RequestContext CustomerContext(const std::string& id = "cust-alice") {
  return MakeContext(id, model::ActorType::kCustomer, "customer");
}

// Runs fn and reports whether it threw E.
template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

/*
  Engines wired over one in-memory repository with a manual clock.

  The clock starts at 2024-03-10 12:00 UTC.
*/
struct WarrantyHarness {
  WarrantyHarness()
      : repository(std::make_shared<db::memory::MemoryRepository>()),
        clock(std::make_shared<ManualClock>(util::MakeDate(2024, 3, 10) + std::chrono::hours(12))),
        catalog(std::make_shared<CountingCatalog>(std::vector<core::ProductInfo>{PhoneProduct()})),
        customers(std::make_shared<adapters::StaticCustomerDirectory>(std::vector<core::CustomerInfo>{CustomerAlice(), CustomerBob()})),
        notifier(std::make_shared<RecordingNotifier>()),
        policy(std::make_shared<adapters::DefaultCoveragePolicy>()) {
    registry    = std::make_shared<core::WarrantyRegistry>(repository, customers, clock);
    claims      = std::make_shared<core::ClaimWorkflow>(repository, registry, customers, notifier, clock);
    tickets     = std::make_shared<core::RepairTicketEngine>(repository, claims, clock);
    attachments = std::make_shared<core::AttachmentCustodian>(repository, claims, nullptr, clock);
    products    = std::make_shared<warranty::catalog::ProductCache>(catalog, clock, 300000);
    validator   = std::make_shared<core::PublicValidator>(repository, products, policy, clock);
  }

  // Inserts a generated barcode directly, as a completed batch would.
  db::model::BarcodeRecord SeedBarcode(const std::string& barcode, int32_t months = 12, const std::string& product_id = "prod-phone") {
    db::model::BarcodeRecord b;
    b.id                     = util::NewId();
    b.barcode                = barcode;
    b.product_id             = product_id;
    b.storefront_id          = "store-1";
    b.status                 = model::BarcodeStatus::kGenerated;
    b.warranty_period_months = months;
    b.created_at_ms          = util::ToUnixMillis(clock->Now());
    b.updated_at_ms          = b.created_at_ms;

    auto tx = repository->Begin();
    auto r  = repository->InsertBarcode(*tx, b);
    assert(r);
    tx->Commit();
    return b;
  }

  core::WarrantyView Activate(const std::string& barcode, const std::string& customer_id = "cust-alice") {
    core::ActivationRequest req;
    req.barcode       = barcode;
    req.serial_number = "SN-" + barcode;
    return registry->Activate(CustomerContext(customer_id), req);
  }

  // Seeds and activates a barcode for the customer, then submits a claim on it.
  core::ClaimView SubmitClaim(const std::string& barcode, const std::string& customer_id = "cust-alice",
                              model::Severity severity = model::Severity::kMedium) {
    SeedBarcode(barcode);
    Activate(barcode, customer_id);

    core::SubmitClaimRequest req;
    req.barcode           = barcode;
    req.issue_category    = model::IssueCategory::kHardware;
    req.issue_description = "Screen flickers after ten minutes of use";
    req.severity          = severity;
    return claims->Submit(CustomerContext(customer_id), req);
  }

  std::shared_ptr<db::memory::MemoryRepository>      repository;
  std::shared_ptr<ManualClock>                       clock;
  std::shared_ptr<CountingCatalog>                   catalog;
  std::shared_ptr<adapters::StaticCustomerDirectory> customers;
  std::shared_ptr<RecordingNotifier>                 notifier;
  std::shared_ptr<adapters::DefaultCoveragePolicy>   policy;

  std::shared_ptr<core::WarrantyRegistry>    registry;
  std::shared_ptr<core::ClaimWorkflow>       claims;
  std::shared_ptr<core::RepairTicketEngine>  tickets;
  std::shared_ptr<core::AttachmentCustodian> attachments;
  std::shared_ptr<warranty::catalog::ProductCache> products;
  std::shared_ptr<core::PublicValidator>     validator;
};

} // namespace warranty::testing
