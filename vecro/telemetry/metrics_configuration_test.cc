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
#include "vecro/workload/internal/workload_metrics_decorator.h"
#include "vecro/workload/workload_options.h"
#include <gmock/gmock.h>
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/exporters/prometheus/exporter_utils.h>
#include <opentelemetry/sdk/metrics/export/metric_producer.h>
#include <opentelemetry/sdk/metrics/metric_reader.h>
#include <algorithm>
#include <map>
#include <string>

namespace vecro {
namespace telemetry {
VECRO_INLINE_NAMESPACE_BEGIN
namespace {

namespace metrics_sdk = ::opentelemetry::sdk::metrics;
using ::testing::ElementsAreArray;
using ::testing::UnorderedElementsAre;
using ::vecro::workload::MetricsAddressOption;
using ::vecro::workload::SubsystemOption;
using ::vecro::workload::TraceServiceNameOption;
using ::vecro::workload_internal::kServiceNameAttribute;
using ::vecro::workload_internal::MakeWorkloadInstruments;
using ::vecro::workload_internal::RecordThroughput;

class TestReader : public metrics_sdk::MetricReader {
 public:
  metrics_sdk::AggregationTemporality GetAggregationTemporality(
      metrics_sdk::InstrumentType) const noexcept override {
    return metrics_sdk::AggregationTemporality::kCumulative;
  }

 private:
  bool OnForceFlush(std::chrono::microseconds) noexcept override {
    return true;
  }
  bool OnShutDown(std::chrono::microseconds) noexcept override {
    return true;
  }
};

// Collects the point data of each metric, by name.
std::map<std::string, metrics_sdk::PointDataAttributes> Collect(
    TestReader& reader) {
  std::map<std::string, metrics_sdk::PointDataAttributes> points;
  reader.Collect([&points](metrics_sdk::ResourceMetrics& rm) {
    for (auto const& scope : rm.scope_metric_data_) {
      for (auto const& metric : scope.metric_data_) {
        if (metric.point_data_attr_.empty()) continue;
        points.emplace(metric.instrument_descriptor.name_,
                       metric.point_data_attr_.front());
      }
    }
    return true;
  });
  return points;
}

std::string ServiceLabel(metrics_sdk::PointDataAttributes const& p) {
  auto it = p.attributes.find(kServiceNameAttribute);
  if (it == p.attributes.end()) return {};
  return opentelemetry::nostd::get<std::string>(it->second);
}

TEST(MetricsConfiguration, InstrumentsAndBuckets) {
  auto const opts = Options{}
                        .set<SubsystemOption>("cart")
                        .set<TraceServiceNameOption>("frontend");
  auto provider = MakeMeterProvider(opts);
  auto reader = std::make_shared<TestReader>();
  provider->AddMetricReader(reader);

  auto instruments = MakeWorkloadInstruments(
      opentelemetry::nostd::shared_ptr<opentelemetry::metrics::MeterProvider>(
          provider),
      "frontend", "cart");
  std::map<std::string, std::string> const labels{
      {kServiceNameAttribute, "frontend"}};
  auto const context = opentelemetry::context::RuntimeContext::GetCurrent();
  instruments.request_count->Add(1, labels, context);
  instruments.latency_counter->Add(0.003, labels, context);
  instruments.latency_histogram->Record(0.003, labels, context);
  RecordThroughput(instruments, 128);

  auto const points = Collect(*reader);
  std::vector<std::string> names;
  for (auto const& kv : points) names.push_back(kv.first);
  EXPECT_THAT(names, UnorderedElementsAre("vecro_base_cart_request_count",
                                          "vecro_base_cart_latency_counter",
                                          "vecro_base_cart_latency_histogram",
                                          "vecro_base_cart_throughput"));
  for (auto const& kv : points) {
    EXPECT_EQ(ServiceLabel(kv.second), "frontend") << kv.first;
  }

  auto const& histogram = points.at("vecro_base_cart_latency_histogram");
  auto const* data = opentelemetry::nostd::get_if<
      metrics_sdk::HistogramPointData>(&histogram.point_data);
  ASSERT_NE(data, nullptr);
  EXPECT_THAT(data->boundaries_,
              ElementsAreArray(LatencyHistogramBoundaries()));
  EXPECT_EQ(data->count_, 1U);
}

TEST(MetricsConfiguration, PrometheusFamilyNames) {
  auto const opts = Options{}
                        .set<SubsystemOption>("cart")
                        .set<TraceServiceNameOption>("frontend")
                        .set<MetricsAddressOption>(":9464");
  auto const options = MakePrometheusExporterOptions(opts);
  EXPECT_EQ(options.url, "0.0.0.0:9464");

  auto provider = MakeMeterProvider(opts);
  auto reader = std::make_shared<TestReader>();
  provider->AddMetricReader(reader);
  auto instruments = MakeWorkloadInstruments(
      opentelemetry::nostd::shared_ptr<opentelemetry::metrics::MeterProvider>(
          provider),
      "frontend", "cart");
  std::map<std::string, std::string> const labels{
      {kServiceNameAttribute, "frontend"}};
  auto const context = opentelemetry::context::RuntimeContext::GetCurrent();
  instruments.request_count->Add(1, labels, context);
  instruments.latency_counter->Add(0.003, labels, context);
  instruments.latency_histogram->Record(0.003, labels, context);
  RecordThroughput(instruments, 128);

  std::vector<std::string> names;
  reader->Collect([&](metrics_sdk::ResourceMetrics& rm) {
    auto families = opentelemetry::exporter::metrics::PrometheusExporterUtils::
        TranslateToPrometheus(rm, options.populate_target_info,
                              options.without_otel_scope,
                              options.without_units,
                              options.without_type_suffix);
    for (auto const& f : families) {
      if (f.name.rfind("vecro_", 0) == 0) names.push_back(f.name);
    }
    return true;
  });
  // The names scraped by existing dashboards, without `_total` or units.
  EXPECT_THAT(names, UnorderedElementsAre("vecro_base_cart_request_count",
                                          "vecro_base_cart_latency_counter",
                                          "vecro_base_cart_latency_histogram",
                                          "vecro_base_cart_throughput"));
}

TEST(MetricsConfiguration, PrometheusListenAddress) {
  EXPECT_EQ(PrometheusListenAddress(":9464"), "0.0.0.0:9464");
  EXPECT_EQ(PrometheusListenAddress("127.0.0.1:9464"), "127.0.0.1:9464");
}

TEST(MetricsConfiguration, LatencyHistogramBoundaries) {
  auto const b = LatencyHistogramBoundaries();
  ASSERT_EQ(b.size(), 15U);
  EXPECT_DOUBLE_EQ(b.front(), 0.0002);
  EXPECT_DOUBLE_EQ(b.back(), 25.0);
  EXPECT_TRUE(std::is_sorted(b.begin(), b.end()));
}

}  // namespace
VECRO_INLINE_NAMESPACE_END
}  // namespace telemetry
}  // namespace vecro
