#include "factory.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/adapters/coverage_policy.hpp"
#include "internal/adapters/log_notifier.hpp"
#include "internal/adapters/signature_scanner.hpp"
#include "internal/adapters/static_read_models.hpp"
#include "internal/catalog/product_cache.hpp"
#include "internal/core/attachment_custodian.hpp"
#include "internal/core/batch_engine.hpp"
#include "internal/core/claim_workflow.hpp"
#include "internal/core/public_validator.hpp"
#include "internal/core/repair_ticket_engine.hpp"
#include "internal/core/warranty_registry.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/attachment_server.hpp"
#include "internal/grpc/barcode_server.hpp"
#include "internal/grpc/batch_server.hpp"
#include "internal/grpc/claim_server.hpp"
#include "internal/grpc/public_warranty_server.hpp"
#include "internal/grpc/repair_ticket_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/attachment_service.hpp"
#include "internal/service/barcode_service.hpp"
#include "internal/service/batch_service.hpp"
#include "internal/service/claim_service.hpp"
#include "internal/service/public_warranty_service.hpp"
#include "internal/service/repair_ticket_service.hpp"
#if WARRANTY_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if WARRANTY_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace warranty::factory {

using warranty::runtime::config::RuntimeConfig;

namespace {

template <typename T>
T OrDefault(T value, T fallback) {
  return value == T{} ? fallback : value;
}

core::BatchEngineOptions BatchOptions(const RuntimeConfig& config) {
  const auto&              c = config.batch();
  core::BatchEngineOptions o;
  o.worker_threads    = OrDefault(c.worker_threads(), o.worker_threads);
  o.queue_capacity    = OrDefault<std::size_t>(c.queue_capacity(), o.queue_capacity);
  o.commit_chunk_size = std::clamp<uint32_t>(OrDefault(c.commit_chunk_size(), o.commit_chunk_size), 1, 1000);
  if (c.has_max_retries()) o.max_retries = c.max_retries();
  if (c.has_hard_failure_ratio()) o.hard_failure_ratio = c.hard_failure_ratio();
  o.retry_backoff_ms = OrDefault(c.retry_backoff_ms(), o.retry_backoff_ms);
  return o;
}

core::AttachmentOptions AttachmentOptions(const RuntimeConfig& config) {
  const auto&             c = config.attachments();
  core::AttachmentOptions o;
  if (c.allowed_mime_types_size() > 0) o.allowed_mime_types.assign(c.allowed_mime_types().begin(), c.allowed_mime_types().end());
  o.max_image_bytes    = OrDefault(c.max_image_bytes(), o.max_image_bytes);
  o.max_document_bytes = OrDefault(c.max_document_bytes(), o.max_document_bytes);
  o.max_video_bytes    = OrDefault(c.max_video_bytes(), o.max_video_bytes);
  o.max_other_bytes    = OrDefault(c.max_other_bytes(), o.max_other_bytes);
  return o;
}

adapters::CoveragePolicyOptions CoverageOptions(const RuntimeConfig& config) {
  const auto&                     c = config.coverage();
  adapters::CoveragePolicyOptions o;
  if (c.excluded_issue_types_size() > 0) o.excluded_issue_types.assign(c.excluded_issue_types().begin(), c.excluded_issue_types().end());
  if (c.has_uncovered_estimated_cost_cents()) o.uncovered_estimated_cost_cents = c.uncovered_estimated_cost_cents();
  if (c.covered_components_size() > 0) o.covered_components.assign(c.covered_components().begin(), c.covered_components().end());
  if (c.terms_size() > 0) o.terms.assign(c.terms().begin(), c.terms().end());
  return o;
}

std::vector<core::ProductInfo> Products(const RuntimeConfig& config) {
  std::vector<core::ProductInfo> out;
  for (const auto& p : config.collaborators().products()) {
    out.push_back(core::ProductInfo{p.id(), p.sku(), p.name(), p.brand(), p.category(), p.description(), p.base_price_cents(), p.image_url(),
                                    p.warranty_period_months()});
  }
  return out;
}

std::vector<core::CustomerInfo> Customers(const RuntimeConfig& config) {
  std::vector<core::CustomerInfo> out;
  for (const auto& c : config.collaborators().customers()) {
    out.push_back(core::CustomerInfo{c.id(), c.email(), c.name(), c.phone()});
  }
  return out;
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if WARRANTY_DB_SQLITE
    auto sqlite_db  = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    auto repository = std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
    repository->Migrate();
    return repository;
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if WARRANTY_DB_POSTGRES
    const auto max_connections = OrDefault<std::size_t>(database.postgres().max_connections(), 16);
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    auto       repository      = std::make_shared<db::postgres::PgRepository>(std::move(pool));
    repository->Migrate();
    return repository;
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;
  app.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Collaborators
  // ------------------------------------------------------------------
  auto clock     = std::make_shared<util::SystemClockSource>();
  auto catalog   = std::make_shared<adapters::StaticProductCatalog>(Products(config));
  auto customers = std::make_shared<adapters::StaticCustomerDirectory>(Customers(config));
  auto notifier  = std::make_shared<adapters::LogNotifier>();
  auto policy    = std::make_shared<adapters::DefaultCoveragePolicy>(CoverageOptions(config));

  std::shared_ptr<core::AttachmentScanner> scanner;
  if (config.attachments().builtin_scanner()) {
    const auto& blocked = config.attachments().blocked_extensions();
    scanner = blocked.empty() ? std::make_shared<adapters::SignatureScanner>()
                              : std::make_shared<adapters::SignatureScanner>(std::vector<std::string>(blocked.begin(), blocked.end()));
  }

  const auto& public_api = config.public_api();
  auto products = std::make_shared<catalog::ProductCache>(catalog, clock, OrDefault<uint64_t>(public_api.product_cache_ttl_ms(), 300000),
                                                          OrDefault<std::size_t>(public_api.product_cache_max_entries(), 4096));

  // ------------------------------------------------------------------
  // Core engines
  // ------------------------------------------------------------------
  auto generator = std::make_shared<core::EntropyBarcodeGenerator>();
  auto batches   = std::make_shared<core::BatchEngine>(app.repository, catalog, notifier, clock, generator, BatchOptions(config));
  auto registry  = std::make_shared<core::WarrantyRegistry>(app.repository, customers, clock);

  core::ClaimWorkflowOptions claim_options;
  claim_options.bulk_update_limit = OrDefault(config.claims().bulk_update_limit(), claim_options.bulk_update_limit);
  claim_options.attachments       = AttachmentOptions(config);
  auto claims = std::make_shared<core::ClaimWorkflow>(app.repository, registry, customers, notifier, clock, claim_options);

  core::RepairTicketOptions ticket_options;
  if (config.repair().has_approval_overrun_ratio()) ticket_options.approval_overrun_ratio = config.repair().approval_overrun_ratio();
  auto tickets = std::make_shared<core::RepairTicketEngine>(app.repository, claims, clock, ticket_options);

  auto attachments = std::make_shared<core::AttachmentCustodian>(app.repository, claims, scanner, clock, AttachmentOptions(config));
  auto validator   = std::make_shared<core::PublicValidator>(app.repository, products, policy, clock,
                                                             OrDefault<std::size_t>(public_api.lookup_limit(), 50));

  // ------------------------------------------------------------------
  // Background workers
  // ------------------------------------------------------------------
  batches->StartWorkers();
  if (!config.batch().has_resume_interrupted() || config.batch().resume_interrupted()) {
    const auto resumed = batches->ResumeInterrupted();
    if (resumed > 0) {
      WARRANTY_LOG_INFO("Resumed interrupted batches", {observability::IntField("count", static_cast<int64_t>(resumed))});
    }
  }
  attachments->StartScanWorkers(OrDefault<std::size_t>(config.attachments().scan_workers(), 1));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext& ctx = app.context;
  ctx.batches     = batches;
  ctx.registry    = registry;
  ctx.claims      = claims;
  ctx.tickets     = tickets;
  ctx.attachments = attachments;
  ctx.validator   = validator;
  ctx.clock       = clock;

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::BatchServer>(std::make_shared<service::BatchService>(ctx)));
  app.grpc_services.push_back(std::make_unique<grpc::BarcodeServer>(std::make_shared<service::BarcodeService>(ctx)));
  app.grpc_services.push_back(std::make_unique<grpc::ClaimServer>(std::make_shared<service::ClaimService>(ctx)));
  app.grpc_services.push_back(std::make_unique<grpc::RepairTicketServer>(std::make_shared<service::RepairTicketService>(ctx)));
  app.grpc_services.push_back(std::make_unique<grpc::AttachmentServer>(std::make_shared<service::AttachmentService>(ctx)));
  app.grpc_services.push_back(std::make_unique<grpc::PublicWarrantyServer>(std::make_shared<service::PublicWarrantyService>(ctx)));

  return app;
}

void Application::Shutdown() {
  // In-flight batches stay in_progress and resume on the next start.
  if (context.batches) context.batches->Shutdown();
  if (context.attachments) context.attachments->Shutdown();
}

} // namespace warranty::factory
