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

#include "vecro/workload/internal/workload_endpoint.h"
#include "vecro/internal/make_status.h"
#include "vecro/internal/random.h"
#include "vecro/testing_util/mock_instruments.h"
#include "vecro/testing_util/scoped_log.h"
#include "vecro/testing_util/status_matchers.h"
#include "vecro/workload/internal/base_workload_service.h"
#include "vecro/workload/mocks/mock_store_gateway.h"
#include "vecro/workload/mocks/mock_workload_service.h"
#include <gmock/gmock.h>

namespace vecro {
namespace workload_internal {
VECRO_INLINE_NAMESPACE_BEGIN
namespace {

using ::opentelemetry::common::KeyValueIterable;
using ::opentelemetry::context::Context;
using ::opentelemetry::metrics::Counter;
using ::opentelemetry::metrics::Histogram;
using ::testing::_;
using ::testing::A;
using ::testing::AllOf;
using ::testing::Contains;
using ::testing::Field;
using ::testing::HasSubstr;
using ::testing::Return;
using ::vecro::testing_util::AsInstrument;
using ::vecro::testing_util::MockCounter;
using ::vecro::testing_util::MockHistogram;
using ::vecro::testing_util::ScopedLog;
using ::vecro::testing_util::StatusIs;
using ::vecro::workload::CallContext;
using ::vecro::workload::WorkloadConfig;
using ::vecro::workload::WorkloadRequest;
using ::vecro::workload::WorkloadResponse;
using ::vecro::workload_mocks::MockStoreGateway;
using ::vecro::workload_mocks::MockWorkloadService;

WorkloadResponse MakeResponse() {
  WorkloadResponse response;
  response.bytes = 50;
  response.reads = 3;
  response.writes = 2;
  response.ok = true;
  return response;
}

TEST(WorkloadEndpoint, Success) {
  auto mock = std::make_shared<MockWorkloadService>();
  EXPECT_CALL(*mock, Execute(_, Field(&WorkloadRequest::payload, "{}")))
      .WillOnce(Return(MakeResponse()));

  auto endpoint = MakeWorkloadEndpoint(mock);
  CallContext context;
  auto actual = endpoint(context, absl::any(WorkloadRequest{"{}"}));
  ASSERT_STATUS_OK(actual);
  auto const* response = absl::any_cast<WorkloadResponse>(&*actual);
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(*response, MakeResponse());
}

TEST(WorkloadEndpoint, WrongRequestType) {
  auto mock = std::make_shared<MockWorkloadService>();
  EXPECT_CALL(*mock, Execute).Times(0);

  auto endpoint = MakeWorkloadEndpoint(mock);
  CallContext context;
  auto actual = endpoint(context, absl::any(42));
  EXPECT_THAT(actual, StatusIs(StatusCode::kInvalidArgument));
  EXPECT_EQ(actual.status().error_info().reason(), "DECODE_FAILED");
}

TEST(WorkloadEndpoint, ErrorIsUnchanged) {
  auto const error = internal::UnavailableError("store is down");
  auto mock = std::make_shared<MockWorkloadService>();
  EXPECT_CALL(*mock, Execute).WillOnce(Return(error));

  auto endpoint = MakeWorkloadEndpoint(mock);
  CallContext context;
  auto actual = endpoint(context, absl::any(WorkloadRequest{}));
  EXPECT_EQ(actual.status(), error);
}

class DecoratedServiceTest : public ::testing::Test {
 protected:
  DecoratedServiceTest()
      : request_count_(std::make_shared<MockCounter<std::uint64_t>>()),
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

  std::shared_ptr<MockCounter<std::uint64_t>> request_count_;
  std::shared_ptr<MockCounter<double>> latency_counter_;
  std::shared_ptr<MockHistogram<double>> latency_histogram_;
  std::shared_ptr<MockCounter<std::uint64_t>> throughput_;
};

TEST_F(DecoratedServiceTest, LogsAndCountsOnce) {
  EXPECT_CALL(*request_count_, Add(A<std::uint64_t>(),
                                   A<KeyValueIterable const&>(),
                                   A<Context const&>()))
      .Times(1);
  EXPECT_CALL(*latency_counter_,
              Add(A<double>(), A<KeyValueIterable const&>(),
                  A<Context const&>()))
      .Times(1);
  EXPECT_CALL(*latency_histogram_,
              Record(A<double>(), A<KeyValueIterable const&>(),
                     A<Context const&>()))
      .Times(1);
  auto mock = std::make_shared<MockWorkloadService>();
  EXPECT_CALL(*mock, Execute)
      .WillOnce(Return(internal::UnavailableError("store is down")));

  ScopedLog log;
  auto service = DecorateWorkloadService(mock, MakeInstruments());
  CallContext context;
  EXPECT_THAT(service->Execute(context, WorkloadRequest{}),
              StatusIs(StatusCode::kUnavailable, "store is down"));
  EXPECT_THAT(log.ExtractLines(),
              Contains(AllOf(HasSubstr("Execute >> status="),
                             HasSubstr("store is down"))));
}

TEST_F(DecoratedServiceTest, FailedReadCountsOneRequest) {
  EXPECT_CALL(*request_count_, Add(A<std::uint64_t>(),
                                   A<KeyValueIterable const&>(),
                                   A<Context const&>()))
      .WillOnce([](std::uint64_t value, KeyValueIterable const&,
                   Context const&) { EXPECT_EQ(value, 1U); });
  EXPECT_CALL(*latency_counter_,
              Add(A<double>(), A<KeyValueIterable const&>(),
                  A<Context const&>()))
      .Times(1);
  EXPECT_CALL(*latency_histogram_,
              Record(A<double>(), A<KeyValueIterable const&>(),
                     A<Context const&>()))
      .Times(1);
  auto gateway = std::make_shared<MockStoreGateway>();
  EXPECT_CALL(*gateway, ReadOne)
      .Times(2)
      .WillOnce(Return(10))
      .WillOnce(Return(internal::UnavailableError("connection reset")));
  EXPECT_CALL(*gateway, WriteOne).Times(0);

  WorkloadConfig config;
  config.read_ops = 2;
  config.write_ops = 0;
  config.value_size = 8;
  auto base = std::make_shared<BaseWorkloadService>(
      gateway, config, internal::DefaultPRNG(42));

  ScopedLog log;
  auto service = DecorateWorkloadService(base, MakeInstruments());
  CallContext context;
  auto response = service->Execute(context, WorkloadRequest{});
  EXPECT_THAT(response, StatusIs(StatusCode::kUnavailable,
                                 HasSubstr("connection reset")));
  EXPECT_EQ(response.status().error_info().reason(),
            "STORE_OPERATION_FAILED");
}

TEST_F(DecoratedServiceTest, ThroughputFinalizer) {
  EXPECT_CALL(*throughput_, Add(A<std::uint64_t>(),
                                A<KeyValueIterable const&>(),
                                A<Context const&>()))
      .WillOnce([](std::uint64_t value, KeyValueIterable const&,
                   Context const&) { EXPECT_EQ(value, 64U); });

  ScopedLog log;
  auto finalizer = MakeThroughputFinalizer(MakeInstruments());
  CallContext context;
  finalizer(context, 200, 64);
  EXPECT_THAT(log.ExtractLines(),
              Contains(HasSubstr("response size=64 http_status=200")));
}

}  // namespace
VECRO_INLINE_NAMESPACE_END
}  // namespace workload_internal
}  // namespace vecro
