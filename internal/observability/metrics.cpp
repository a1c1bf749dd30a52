#include "internal/observability/spans.hpp"

#ifdef WARRANTY_ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>

#include "config/config.pb.h"

namespace warranty::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {

using Attribute = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
using Counter   = opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>>;
using Histogram = opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>;

constexpr std::chrono::milliseconds kDefaultExportInterval{1000};

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string MetricEndpoint(const OtlpSettings& settings) {
  if (!settings.endpoint.empty()) return settings.endpoint;
  for (const char* var : {"OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    if (const char* value = std::getenv(var)) return value;
  }
  return settings.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeMetricExporter(const OtlpSettings& settings) {
  if (settings.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = MetricEndpoint(settings);
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = MetricEndpoint(settings);
  options.use_ssl_credentials = !settings.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

} // namespace

bool InitializeMetrics(const warranty::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto settings = OtlpSettingsFrom(config);

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = kDefaultExportInterval;
  if (observability.metrics().collection_interval_ms() > 0) {
    reader_options.export_interval_millis = std::chrono::milliseconds(observability.metrics().collection_interval_ms());
  }
  if (observability.metrics().export_timeout_ms() > 0) {
    reader_options.export_timeout_millis = std::chrono::milliseconds(observability.metrics().export_timeout_ms());
  }

  resource::ResourceAttributes attrs = {{"service.name", settings.service_name}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), resource::Resource::Create(attrs));
  g_provider->AddMetricReader(sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeMetricExporter(settings), reader_options));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

struct Metrics::Impl {
  Counter   requests;
  Histogram request_latency_ms;
  Counter   barcodes_generated;
  Counter   collisions;
  Histogram chunk_commit_ms;
  Counter   claim_transitions;
};

// Instruments bind to the provider installed when Instance() is first
// called, so InitializeMetrics must run before the first RPC.
Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto meter = metrics_api::Provider::GetMeterProvider()->GetMeter("warranty-core", "0.1.0");

  impl_->requests           = meter->CreateUInt64Counter("warranty.rpc.requests", "RPCs handled", "1");
  impl_->request_latency_ms = meter->CreateDoubleHistogram("warranty.rpc.latency_ms", "RPC latency", "ms");
  impl_->barcodes_generated = meter->CreateUInt64Counter("warranty.batch.barcodes_generated", "Barcodes persisted by batch jobs", "1");
  impl_->collisions         = meter->CreateUInt64Counter("warranty.batch.collisions", "Barcode collisions detected", "1");
  impl_->chunk_commit_ms    = meter->CreateDoubleHistogram("warranty.batch.chunk_commit_ms", "Batch chunk commit duration", "ms");
  impl_->claim_transitions  = meter->CreateUInt64Counter("warranty.claim.transitions", "Applied claim transitions", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  impl_->requests->Add(1, std::initializer_list<Attribute>{{"route", std::string(route)}, {"success", success}});
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  impl_->request_latency_ms->Record(latency_ms, std::initializer_list<Attribute>{{"route", std::string(route)}}, opentelemetry::context::Context{});
}

void Metrics::AddBarcodesGenerated(std::uint64_t count) {
  impl_->barcodes_generated->Add(count);
}

void Metrics::RecordCollision(std::string_view type) {
  impl_->collisions->Add(1, std::initializer_list<Attribute>{{"type", std::string(type)}});
}

void Metrics::ObserveChunkCommitMs(double duration_ms) {
  impl_->chunk_commit_ms->Record(duration_ms, opentelemetry::context::Context{});
}

void Metrics::RecordClaimTransition(std::string_view action) {
  impl_->claim_transitions->Add(1, std::initializer_list<Attribute>{{"action", std::string(action)}});
}

} // namespace warranty::observability

#endif
