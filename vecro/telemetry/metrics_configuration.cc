// Copyright 2025 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "vecro/telemetry/metrics_configuration.h"
#include "vecro/log.h"
#include "vecro/workload/internal/workload_metrics_decorator.h"
#include "vecro/workload/workload_options.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include <opentelemetry/exporters/prometheus/exporter_factory.h>
#include <opentelemetry/exporters/prometheus/exporter_options.h>
#include <opentelemetry/sdk/metrics/aggregation/aggregation_config.h>
#include <opentelemetry/sdk/metrics/view/instrument_selector_factory.h>
#include <opentelemetry/sdk/metrics/view/meter_selector_factory.h>
#include <opentelemetry/sdk/metrics/view/view_factory.h>
#include <opentelemetry/sdk/metrics/view/view_registry.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <exception>

namespace vecro {
namespace telemetry {
VECRO_INLINE_NAMESPACE_BEGIN
namespace {

namespace metrics_sdk = ::opentelemetry::sdk::metrics;

class PrometheusMetricsConfiguration : public MetricsConfiguration {
 public:
  PrometheusMetricsConfiguration(
      std::shared_ptr<metrics_sdk::MeterProvider> provider, bool exposed)
      : provider_(std::move(provider)), exposed_(exposed) {}

  ~PrometheusMetricsConfiguration() override {
    if (!provider_->Shutdown()) {
      VECRO_LOG(WARNING) << "metrics provider did not shut down cleanly";
    }
  }

  opentelemetry::nostd::shared_ptr<opentelemetry::metrics::MeterProvider>
  provider() const override {
    return opentelemetry::nostd::shared_ptr<
        opentelemetry::metrics::MeterProvider>(provider_);
  }

  bool exposed() const override { return exposed_; }

 private:
  std::shared_ptr<metrics_sdk::MeterProvider> provider_;
  bool exposed_;
};

}  // namespace

std::vector<double> LatencyHistogramBoundaries() {
  return {.0002, .001, .005, .01, .025, .05, .1, .25,
          .5,    1,    2.5,  5,   10,  15,  25};
}

std::shared_ptr<metrics_sdk::MeterProvider> MakeMeterProvider(
    Options const& opts) {
  auto const& service_name = opts.get<workload::TraceServiceNameOption>();
  auto resource = opentelemetry::sdk::resource::Resource::Create(
      {{"service.name", opentelemetry::nostd::string_view{service_name}}});
  auto provider = std::make_shared<metrics_sdk::MeterProvider>(
      std::make_unique<metrics_sdk::ViewRegistry>(), resource);

  auto const name = workload_internal::WorkloadMetricName(
      opts.get<workload::SubsystemOption>(), "latency_histogram");
  auto config = std::make_shared<metrics_sdk::HistogramAggregationConfig>();
  config->boundaries_ = LatencyHistogramBoundaries();
  provider->AddView(
      metrics_sdk::InstrumentSelectorFactory::Create(
          metrics_sdk::InstrumentType::kHistogram, name, "s"),
      metrics_sdk::MeterSelectorFactory::Create(
          workload_internal::kWorkloadMeterName, version_string(), ""),
      metrics_sdk::ViewFactory::Create(
          name, "Processing time taken of requests in seconds, as histogram.",
          "s", metrics_sdk::AggregationType::kHistogram, std::move(config)));
  return provider;
}

std::string PrometheusListenAddress(std::string const& address) {
  if (absl::StartsWith(address, ":")) return absl::StrCat("0.0.0.0", address);
  return address;
}

opentelemetry::exporter::metrics::PrometheusExporterOptions
MakePrometheusExporterOptions(Options const& opts) {
  opentelemetry::exporter::metrics::PrometheusExporterOptions options;
  options.url =
      PrometheusListenAddress(opts.get<workload::MetricsAddressOption>());
  options.without_units = true;
  options.without_type_suffix = true;
  return options;
}

std::unique_ptr<MetricsConfiguration> ConfigureMetrics(Options const& opts) {
  auto provider = MakeMeterProvider(opts);
  auto const options = MakePrometheusExporterOptions(opts);
  auto const& address = options.url;
  bool exposed = false;
  try {
    provider->AddMetricReader(
        opentelemetry::exporter::metrics::PrometheusExporterFactory::Create(
            options));
    exposed = true;
    VECRO_LOG(INFO) << "serving metrics on http://" << address << "/metrics";
  } catch (std::exception const& ex) {
    VECRO_LOG(WARNING) << "cannot serve metrics on " << address << ": "
                       << ex.what();
  }
  return std::make_unique<PrometheusMetricsConfiguration>(std::move(provider),
                                                          exposed);
}

VECRO_INLINE_NAMESPACE_END
}  // namespace telemetry
}  // namespace vecro
