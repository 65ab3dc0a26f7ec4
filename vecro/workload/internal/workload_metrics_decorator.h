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

#ifndef VECRO_WORKLOAD_INTERNAL_WORKLOAD_METRICS_DECORATOR_H
#define VECRO_WORKLOAD_INTERNAL_WORKLOAD_METRICS_DECORATOR_H

#include "vecro/version.h"
#include "vecro/workload/workload_service.h"
#include "absl/strings/string_view.h"
#include <opentelemetry/metrics/meter_provider.h>
#include <opentelemetry/metrics/sync_instruments.h>
#include <opentelemetry/nostd/shared_ptr.h>
#include <cstdint>
#include <memory>
#include <string>

namespace vecro {
namespace workload_internal {
VECRO_INLINE_NAMESPACE_BEGIN

/// The meter, and the prefix of all the instrument names.
auto constexpr kWorkloadMeterName = "vecro_base";

/// The attribute carrying the configured service name.
auto constexpr kServiceNameAttribute = "vecrosim_service_name";

/// Returns `vecro_base_<subsystem>_<metric>`.
std::string WorkloadMetricName(absl::string_view subsystem,
                               absl::string_view metric);

/// The instruments shared by all the calls to one service.
struct WorkloadInstruments {
  std::string service_name;
  opentelemetry::nostd::shared_ptr<
      opentelemetry::metrics::Counter<std::uint64_t>>
      request_count;
  opentelemetry::nostd::shared_ptr<opentelemetry::metrics::Counter<double>>
      latency_counter;
  opentelemetry::nostd::shared_ptr<opentelemetry::metrics::Histogram<double>>
      latency_histogram;
  opentelemetry::nostd::shared_ptr<
      opentelemetry::metrics::Counter<std::uint64_t>>
      throughput;
};

/**
 * Creates the workload instruments from @p provider.
 *
 * All the instruments belong to the `vecro_base` meter, and their names
 * include @p subsystem. Every observation is labeled with @p service_name.
 */
WorkloadInstruments MakeWorkloadInstruments(
    opentelemetry::nostd::shared_ptr<
        opentelemetry::metrics::MeterProvider> const& provider,
    std::string service_name, std::string const& subsystem);

/// Adds @p bytes to the throughput counter.
void RecordThroughput(WorkloadInstruments const& instruments,
                      std::size_t bytes);

/**
 * Records the count and latency of each call.
 *
 * The metrics are recorded after the wrapped call returns, whether it
 * succeeded or not.
 */
class WorkloadServiceMetrics : public workload::WorkloadService {
 public:
  WorkloadServiceMetrics(std::shared_ptr<workload::WorkloadService> child,
                         WorkloadInstruments instruments)
      : child_(std::move(child)), instruments_(std::move(instruments)) {}

  StatusOr<workload::WorkloadResponse> Execute(
      workload::CallContext& context,
      workload::WorkloadRequest const& request) override;

 private:
  std::shared_ptr<workload::WorkloadService> child_;
  WorkloadInstruments instruments_;
};

VECRO_INLINE_NAMESPACE_END
}  // namespace workload_internal
}  // namespace vecro

#endif  // VECRO_WORKLOAD_INTERNAL_WORKLOAD_METRICS_DECORATOR_H
