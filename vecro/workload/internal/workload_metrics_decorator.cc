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

#include "vecro/workload/internal/workload_metrics_decorator.h"
#include "vecro/version.h"
#include "absl/strings/str_cat.h"
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/metrics/meter.h>
#include <chrono>
#include <map>

namespace vecro {
namespace workload_internal {
VECRO_INLINE_NAMESPACE_BEGIN
namespace {

using LabelMap = std::map<std::string, std::string>;
using Seconds = std::chrono::duration<double>;

LabelMap MakeLabels(WorkloadInstruments const& instruments) {
  return LabelMap{{kServiceNameAttribute, instruments.service_name}};
}

}  // namespace

std::string WorkloadMetricName(absl::string_view subsystem,
                               absl::string_view metric) {
  return absl::StrCat(kWorkloadMeterName, "_", subsystem, "_", metric);
}

WorkloadInstruments MakeWorkloadInstruments(
    opentelemetry::nostd::shared_ptr<
        opentelemetry::metrics::MeterProvider> const& provider,
    std::string service_name, std::string const& subsystem) {
  auto meter = provider->GetMeter(kWorkloadMeterName, version_string());
  WorkloadInstruments instruments;
  instruments.service_name = std::move(service_name);
  instruments.request_count = meter->CreateUInt64Counter(
      WorkloadMetricName(subsystem, "request_count"),
      "Number of requests received.");
  instruments.latency_counter = meter->CreateDoubleCounter(
      WorkloadMetricName(subsystem, "latency_counter"),
      "Processing time taken of requests in seconds, as counter.", "s");
  instruments.latency_histogram = meter->CreateDoubleHistogram(
      WorkloadMetricName(subsystem, "latency_histogram"),
      "Processing time taken of requests in seconds, as histogram.", "s");
  instruments.throughput = meter->CreateUInt64Counter(
      WorkloadMetricName(subsystem, "throughput"),
      "Size of data transmitted in bytes.", "By");
  return instruments;
}

void RecordThroughput(WorkloadInstruments const& instruments,
                      std::size_t bytes) {
  auto const context = opentelemetry::context::RuntimeContext::GetCurrent();
  instruments.throughput->Add(static_cast<std::uint64_t>(bytes),
                              MakeLabels(instruments), context);
}

StatusOr<workload::WorkloadResponse> WorkloadServiceMetrics::Execute(
    workload::CallContext& context, workload::WorkloadRequest const& request) {
  auto const start = std::chrono::steady_clock::now();
  auto response = child_->Execute(context, request);
  auto const elapsed = std::chrono::duration_cast<Seconds>(
      std::chrono::steady_clock::now() - start);

  auto const labels = MakeLabels(instruments_);
  auto const otel_context =
      opentelemetry::context::RuntimeContext::GetCurrent();
  instruments_.request_count->Add(1, labels, otel_context);
  instruments_.latency_counter->Add(elapsed.count(), labels, otel_context);
  instruments_.latency_histogram->Record(elapsed.count(), labels,
                                         otel_context);
  return response;
}

VECRO_INLINE_NAMESPACE_END
}  // namespace workload_internal
}  // namespace vecro
