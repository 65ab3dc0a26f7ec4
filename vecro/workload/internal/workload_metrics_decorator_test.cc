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
#include "vecro/internal/make_status.h"
#include "vecro/testing_util/mock_instruments.h"
#include "vecro/testing_util/status_matchers.h"
#include "vecro/workload/mocks/mock_workload_service.h"
#include <gmock/gmock.h>
#include <opentelemetry/metrics/noop.h>
#include <chrono>
#include <thread>

namespace vecro {
namespace workload_internal {
VECRO_INLINE_NAMESPACE_BEGIN
namespace {

using ::opentelemetry::common::KeyValueIterable;
using ::opentelemetry::context::Context;
using ::opentelemetry::metrics::Counter;
using ::opentelemetry::metrics::Histogram;
using ::testing::A;
using ::testing::Ge;
using ::testing::Pair;
using ::testing::Return;
using ::testing::UnorderedElementsAre;
using ::vecro::testing_util::AsInstrument;
using ::vecro::testing_util::IsOkAndHolds;
using ::vecro::testing_util::MakeAttributesMap;
using ::vecro::testing_util::MockCounter;
using ::vecro::testing_util::MockHistogram;
using ::vecro::testing_util::StatusIs;
using ::vecro::workload::CallContext;
using ::vecro::workload::WorkloadRequest;
using ::vecro::workload::WorkloadResponse;
using ::vecro::workload_mocks::MockWorkloadService;

class MetricsDecoratorTest : public ::testing::Test {
 protected:
  MetricsDecoratorTest()
      : mock_(std::make_shared<MockWorkloadService>()),
        request_count_(std::make_shared<MockCounter<std::uint64_t>>()),
        latency_counter_(std::make_shared<MockCounter<double>>()),
        latency_histogram_(std::make_shared<MockHistogram<double>>()),
        throughput_(std::make_shared<MockCounter<std::uint64_t>>()) {}

  WorkloadInstruments MakeInstruments() {
    WorkloadInstruments instruments;
    instruments.service_name = "test-service";
    instruments.request_count =
        AsInstrument<Counter<std::uint64_t>>(request_count_);
    instruments.latency_counter =
        AsInstrument<Counter<double>>(latency_counter_);
    instruments.latency_histogram =
        AsInstrument<Histogram<double>>(latency_histogram_);
    instruments.throughput = AsInstrument<Counter<std::uint64_t>>(throughput_);
    return instruments;
  }

  // Expects `n` calls, each taking at least `min_latency` seconds.
  void ExpectObservations(int n, double min_latency) {
    EXPECT_CALL(*request_count_,
                Add(A<std::uint64_t>(), A<KeyValueIterable const&>(),
                    A<Context const&>()))
        .Times(n)
        .WillRepeatedly([](std::uint64_t value,
                           KeyValueIterable const& attributes,
                           Context const&) {
          EXPECT_EQ(value, 1U);
          EXPECT_THAT(MakeAttributesMap(attributes),
                      UnorderedElementsAre(
                          Pair(kServiceNameAttribute, "test-service")));
        });
    EXPECT_CALL(*latency_counter_,
                Add(A<double>(), A<KeyValueIterable const&>(),
                    A<Context const&>()))
        .Times(n)
        .WillRepeatedly([min_latency](double value,
                                      KeyValueIterable const& attributes,
                                      Context const&) {
          EXPECT_THAT(value, Ge(min_latency));
          EXPECT_THAT(MakeAttributesMap(attributes),
                      UnorderedElementsAre(
                          Pair(kServiceNameAttribute, "test-service")));
        });
    EXPECT_CALL(*latency_histogram_,
                Record(A<double>(), A<KeyValueIterable const&>(),
                       A<Context const&>()))
        .Times(n)
        .WillRepeatedly([min_latency](double value, KeyValueIterable const&,
                                      Context const&) {
          EXPECT_THAT(value, Ge(min_latency));
        });
  }

  std::shared_ptr<MockWorkloadService> mock_;
  std::shared_ptr<MockCounter<std::uint64_t>> request_count_;
  std::shared_ptr<MockCounter<double>> latency_counter_;
  std::shared_ptr<MockHistogram<double>> latency_histogram_;
  std::shared_ptr<MockCounter<std::uint64_t>> throughput_;
};

TEST_F(MetricsDecoratorTest, SuccessRecordsCountAndLatency) {
  auto constexpr kStoreTime = std::chrono::milliseconds(20);
  WorkloadResponse response;
  response.bytes = 50;
  response.ok = true;
  EXPECT_CALL(*mock_, Execute).WillOnce([&](CallContext&,
                                            WorkloadRequest const&) {
    std::this_thread::sleep_for(kStoreTime);
    return StatusOr<WorkloadResponse>(response);
  });
  ExpectObservations(1, 0.020);

  WorkloadServiceMetrics under_test(mock_, MakeInstruments());
  CallContext context;
  EXPECT_THAT(under_test.Execute(context, WorkloadRequest{}),
              IsOkAndHolds(response));
}

TEST_F(MetricsDecoratorTest, FailureIsStillCounted) {
  EXPECT_CALL(*mock_, Execute)
      .WillOnce(Return(internal::UnavailableError("store is down")));
  ExpectObservations(1, 0.0);

  WorkloadServiceMetrics under_test(mock_, MakeInstruments());
  CallContext context;
  EXPECT_THAT(under_test.Execute(context, WorkloadRequest{}),
              StatusIs(StatusCode::kUnavailable, "store is down"));
}

TEST_F(MetricsDecoratorTest, OneObservationPerCall) {
  EXPECT_CALL(*mock_, Execute)
      .WillOnce(Return(WorkloadResponse{}))
      .WillOnce(Return(internal::CancelledError("cancelled")))
      .WillOnce(Return(WorkloadResponse{}));
  ExpectObservations(3, 0.0);

  WorkloadServiceMetrics under_test(mock_, MakeInstruments());
  for (int i = 0; i != 3; ++i) {
    CallContext context;
    (void)under_test.Execute(context, WorkloadRequest{});
  }
}

TEST_F(MetricsDecoratorTest, RecordThroughput) {
  EXPECT_CALL(*throughput_,
              Add(A<std::uint64_t>(), A<KeyValueIterable const&>(),
                  A<Context const&>()))
      .WillOnce([](std::uint64_t value, KeyValueIterable const& attributes,
                   Context const&) {
        EXPECT_EQ(value, 42U);
        EXPECT_THAT(MakeAttributesMap(attributes),
                    UnorderedElementsAre(
                        Pair(kServiceNameAttribute, "test-service")));
      });
  RecordThroughput(MakeInstruments(), 42);
}

TEST(MakeWorkloadInstruments, CreatesEveryInstrument) {
  auto provider =
      opentelemetry::nostd::shared_ptr<opentelemetry::metrics::MeterProvider>(
          std::make_shared<opentelemetry::metrics::NoopMeterProvider>());
  auto instruments = MakeWorkloadInstruments(provider, "test-service", "cart");
  EXPECT_EQ(instruments.service_name, "test-service");
  ASSERT_TRUE(instruments.request_count);
  ASSERT_TRUE(instruments.latency_counter);
  ASSERT_TRUE(instruments.latency_histogram);
  ASSERT_TRUE(instruments.throughput);

  // The instruments are usable as created.
  RecordThroughput(instruments, 42);
}

TEST(WorkloadMetricName, Format) {
  EXPECT_EQ(WorkloadMetricName("cart", "request_count"),
            "vecro_base_cart_request_count");
}

}  // namespace
VECRO_INLINE_NAMESPACE_END
}  // namespace workload_internal
}  // namespace vecro
