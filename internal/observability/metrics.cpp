#include "internal/observability/metrics.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <initializer_list>
#include <string>
#include <utility>

#include "config/config.pb.h"
#include "internal/util/time.hpp"

namespace eryzaa::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string ResolveEndpoint(const eryzaa::runtime::config::ObservabilityConfig& config) {
  if (!config.otlp_endpoint().empty()) {
    return config.otlp_endpoint();
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }
  return "localhost:4317";
}

template <typename Instrument, typename Value>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value,
                       std::initializer_list<AttributePair> attributes) {
  if constexpr (requires { instrument->Add(value, attributes, opentelemetry::context::Context{}); }) {
    instrument->Add(value, attributes, opentelemetry::context::Context{});
  } else {
    instrument->Add(value, attributes);
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> advertisements_sent;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> datagrams_received;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> lease_operations;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   peer_gauge;

  std::atomic<std::int64_t> peer_count{0};
};

bool InitializeMetrics(const eryzaa::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  otlp::OtlpGrpcMetricExporterOptions exporter_options;
  exporter_options.endpoint            = ResolveEndpoint(observability);
  exporter_options.use_ssl_credentials = false;
  auto exporter                        = otlp::OtlpGrpcMetricExporterFactory::Create(exporter_options);

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = eryzaa::util::FromProto(observability.metrics_interval());
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  resource::ResourceAttributes attrs = {{"service.name", "eryzaa-node"}, {"node.id", config.node().node_id()}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create(attrs));
  g_provider->AddMetricReader(std::move(reader));

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

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("eryzaa-node", "0.1.0");

  impl_->advertisements_sent = impl_->meter->CreateUInt64Counter("eryzaa.discovery.advertisements_sent", "Advertisement datagrams sent", "1");
  impl_->datagrams_received  = impl_->meter->CreateUInt64Counter("eryzaa.discovery.datagrams_received", "Discovery datagrams received", "1");
  impl_->lease_operations    = impl_->meter->CreateUInt64Counter("eryzaa.access.lease_operations", "Lease grants and revocations", "1");
  impl_->peer_gauge          = impl_->meter->CreateInt64ObservableGauge("eryzaa.discovery.peers", "Live entries in the peer table", "1");
  impl_->peer_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl       = static_cast<Impl*>(state);
        auto  int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        int_result->Observe(impl->peer_count.load());
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordAdvertisementSent(std::string_view target, bool success) {
  if (!impl_ || !impl_->advertisements_sent) {
    return;
  }
  AddWithAttributes(impl_->advertisements_sent, static_cast<std::uint64_t>(1), {{"target", std::string(target)}, {"success", success}});
}

void Metrics::RecordDatagram(std::string_view outcome) {
  if (!impl_ || !impl_->datagrams_received) {
    return;
  }
  AddWithAttributes(impl_->datagrams_received, static_cast<std::uint64_t>(1), {{"outcome", std::string(outcome)}});
}

void Metrics::SetPeerCount(std::int64_t count) {
  if (!impl_) {
    return;
  }
  impl_->peer_count.store(count);
}

void Metrics::RecordLease(std::string_view op, std::string_view outcome) {
  if (!impl_ || !impl_->lease_operations) {
    return;
  }
  AddWithAttributes(impl_->lease_operations, static_cast<std::uint64_t>(1), {{"op", std::string(op)}, {"outcome", std::string(outcome)}});
}

} // namespace eryzaa::observability

#endif
