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

#ifndef VECRO_TELEMETRY_TRACING_CONFIGURATION_H
#define VECRO_TELEMETRY_TRACING_CONFIGURATION_H

#include "vecro/options.h"
#include "vecro/version.h"
#include <iosfwd>
#include <memory>

namespace vecro {
namespace telemetry {
VECRO_INLINE_NAMESPACE_BEGIN

enum class TracingMode {
  /// Spans are sampled and exported to the configured collector.
  kExport,
  /// No exporter is installed, spans are not recorded.
  kTraceless,
};

std::ostream& operator<<(std::ostream& os, TracingMode mode);

/**
 * Holds the process-wide tracing configuration.
 *
 * Destroying this object flushes any pending spans and restores the previous
 * global tracer provider.
 */
class TracingConfiguration {
 public:
  virtual ~TracingConfiguration() = default;

  virtual TracingMode mode() const = 0;
};

/**
 * Installs a global tracer provider exporting spans over OTLP/HTTP.
 *
 * Uses `TraceEndpointOption`, `TraceSamplingRatioOption` and
 * `TraceServiceNameOption` from @p opts. Also installs the W3C Trace Context
 * propagator.
 *
 * Tracing problems are never fatal. If the endpoint is empty, or the exporter
 * cannot be created, this logs a warning and returns a configuration in
 * `TracingMode::kTraceless`.
 */
std::unique_ptr<TracingConfiguration> ConfigureTracing(Options const& opts);

VECRO_INLINE_NAMESPACE_END
}  // namespace telemetry
}  // namespace vecro

#endif  // VECRO_TELEMETRY_TRACING_CONFIGURATION_H
