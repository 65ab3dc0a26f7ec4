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

#ifndef VECRO_TELEMETRY_METRICS_CONFIGURATION_H
#define VECRO_TELEMETRY_METRICS_CONFIGURATION_H

#include "vecro/options.h"
#include "vecro/version.h"
#include <opentelemetry/exporters/prometheus/exporter_options.h>
#include <opentelemetry/metrics/meter_provider.h>
#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <memory>
#include <string>
#include <vector>

namespace vecro {
namespace telemetry {
VECRO_INLINE_NAMESPACE_BEGIN

/// The bucket boundaries of the latency histogram, in seconds.
std::vector<double> LatencyHistogramBoundaries();

/**
 * Creates a meter provider for the workload instruments.
 *
 * The provider has no readers. It carries the `service.name` resource and
 * the view that sets the latency histogram buckets for
 * `SubsystemOption`.
 */
std::shared_ptr<opentelemetry::sdk::metrics::MeterProvider> MakeMeterProvider(
    Options const& opts);

/// Normalizes `:port` to `0.0.0.0:port`, other addresses are unchanged.
std::string PrometheusListenAddress(std::string const& address);

/**
 * The Prometheus exporter configuration.
 *
 * The metric families are exposed under their instrument names, without the
 * unit or type suffixes the exporter adds by default.
 */
opentelemetry::exporter::metrics::PrometheusExporterOptions
MakePrometheusExporterOptions(Options const& opts);

/// Owns the meter provider and the Prometheus endpoint serving its metrics.
class MetricsConfiguration {
 public:
  virtual ~MetricsConfiguration() = default;

  virtual opentelemetry::nostd::shared_ptr<
      opentelemetry::metrics::MeterProvider>
  provider() const = 0;

  /// True if the metrics are served on `MetricsAddressOption`.
  virtual bool exposed() const = 0;
};

/**
 * Serves the workload metrics in the Prometheus format.
 *
 * If the Prometheus exporter cannot listen on `MetricsAddressOption` this
 * logs a warning, the instruments still work but nothing is exposed.
 */
std::unique_ptr<MetricsConfiguration> ConfigureMetrics(Options const& opts);

VECRO_INLINE_NAMESPACE_END
}  // namespace telemetry
}  // namespace vecro

#endif  // VECRO_TELEMETRY_METRICS_CONFIGURATION_H
