#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

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
#include <map>
#include <memory>
#include <mutex>
#include <utility>

#include "config/config.pb.h"

namespace treasury::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
using Int64Result   = opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

struct MetricsOptions {
  bool route_labels_enabled{true};
  bool ledger_gauges_enabled{true};
};

MetricsOptions g_metrics_options;

std::unique_ptr<sdkmetrics::PushMetricExporter> BuildExporter(const OtlpConfig& config) {
  auto endpoint = ResolveOtlpEndpoint(config, "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "/v1/metrics");
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   supply_gauge;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   ratio_gauge;

  std::mutex                             gauge_mutex;
  std::map<std::string, std::int64_t>    supply_values;
  std::map<std::string, std::int64_t>    ratio_values;
};

bool InitializeMetrics(const treasury::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto otlp_config = OtlpConfigFrom(config);

  const auto&                                      metric_config = observability.metrics();
  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis =
      std::chrono::milliseconds(metric_config.collection_interval_ms() > 0 ? metric_config.collection_interval_ms() : 1000);
  if (metric_config.export_timeout_ms() > 0) {
    reader_options.export_timeout_millis = std::chrono::milliseconds(metric_config.export_timeout_ms());
  }

  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(BuildExporter(otlp_config), reader_options);

  auto res   = resource::Resource::Create({{"service.name", otlp_config.service_name}});
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), res);
  g_provider->AddMetricReader(std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));

  g_metrics_options.route_labels_enabled  = metric_config.route_labels_enabled();
  g_metrics_options.ledger_gauges_enabled = metric_config.ledger_gauges_enabled();
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("treasury-ledger", "0.1.0");

  impl_->request_count      = impl_->meter->CreateUInt64Counter("treasury.request.count", "Total number of service requests", "1");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("treasury.request.latency_ms", "End-to-end request latency in milliseconds", "ms");
  impl_->supply_gauge       = impl_->meter->CreateInt64ObservableGauge("treasury.ledger.circulating_supply", "Circulating supply per ledger", "1");
  impl_->ratio_gauge        = impl_->meter->CreateInt64ObservableGauge("treasury.ledger.collateral_ratio_bps", "Collateral ratio per ledger in basis points", "1");

  impl_->supply_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto*                       impl = static_cast<Impl*>(state);
        std::lock_guard<std::mutex> lock(impl->gauge_mutex);
        auto                        out = opentelemetry::nostd::get<Int64Result>(result);
        for (const auto& [ledger, supply] : impl->supply_values) {
          const std::initializer_list<AttributePair> attributes = {{"ledger", ledger}};
          out->Observe(supply, attributes);
        }
      },
      impl_.get());
  impl_->ratio_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto*                       impl = static_cast<Impl*>(state);
        std::lock_guard<std::mutex> lock(impl->gauge_mutex);
        auto                        out = opentelemetry::nostd::get<Int64Result>(result);
        for (const auto& [ledger, ratio] : impl->ratio_values) {
          const std::initializer_list<AttributePair> attributes = {{"ledger", ledger}};
          out->Observe(ratio, attributes);
        }
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count) {
    return;
  }

  if (g_metrics_options.route_labels_enabled) {
    const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}, {"success", success}};
    AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms) {
    return;
  }

  if (g_metrics_options.route_labels_enabled) {
    const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}};
    RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
    return;
  }

  RecordWithAttributes(impl_->request_latency_ms, latency_ms, std::initializer_list<AttributePair>{});
}

void Metrics::SetCirculatingSupply(std::string_view ledger_id, std::uint64_t supply) {
  if (!impl_ || !g_metrics_options.ledger_gauges_enabled) {
    return;
  }
  std::lock_guard<std::mutex> lock(impl_->gauge_mutex);
  impl_->supply_values[std::string(ledger_id)] = static_cast<std::int64_t>(supply);
}

void Metrics::SetCollateralRatioBps(std::string_view ledger_id, std::uint64_t ratio_bps) {
  if (!impl_ || !g_metrics_options.ledger_gauges_enabled) {
    return;
  }
  std::lock_guard<std::mutex> lock(impl_->gauge_mutex);
  impl_->ratio_values[std::string(ledger_id)] = static_cast<std::int64_t>(ratio_bps);
}

} // namespace treasury::observability

#endif
