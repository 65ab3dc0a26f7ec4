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

#include "vecro/workload/call_context.h"
#include "vecro/testing_util/status_matchers.h"
#include <gmock/gmock.h>

namespace vecro {
namespace workload {
VECRO_INLINE_NAMESPACE_BEGIN
namespace {

using ::testing::Optional;
using ::testing::Pair;
using ::testing::UnorderedElementsAre;
using ::vecro::testing_util::StatusIs;

TEST(CallContext, HeadersAreCaseInsensitive) {
  CallContext context;
  context.AddHeader("TraceParent", "00-abc-def-01")
      .AddHeader("Content-Type", "application/json");
  EXPECT_THAT(context.GetHeader("traceparent"),
              Optional(std::string("00-abc-def-01")));
  EXPECT_THAT(context.GetHeader("TRACEPARENT"),
              Optional(std::string("00-abc-def-01")));
  EXPECT_EQ(context.GetHeader("tracestate"), absl::nullopt);
  EXPECT_THAT(context.headers(),
              UnorderedElementsAre(Pair("traceparent", "00-abc-def-01"),
                                   Pair("content-type", "application/json")));
}

TEST(CallContext, RepeatedHeaderReplacesValue) {
  CallContext context;
  context.AddHeader("x-test", "a").AddHeader("X-Test", "b");
  EXPECT_THAT(context.GetHeader("x-test"), Optional(std::string("b")));
}

TEST(CallContext, ActiveByDefault) {
  CallContext context;
  EXPECT_STATUS_OK(context.CheckActive());
  EXPECT_EQ(context.deadline(), absl::nullopt);
  EXPECT_EQ(context.remaining(), absl::nullopt);
}

TEST(CallContext, Cancelled) {
  CallContext context;
  auto copy = context;
  copy.Cancel();
  EXPECT_TRUE(context.cancelled());
  EXPECT_THAT(context.CheckActive(), StatusIs(StatusCode::kCancelled));
}

TEST(CallContext, DeadlineExceeded) {
  CallContext context;
  context.set_deadline(CallContext::Clock::now() - std::chrono::seconds(1));
  EXPECT_THAT(context.CheckActive(), StatusIs(StatusCode::kDeadlineExceeded));
  EXPECT_THAT(context.remaining(), Optional(std::chrono::milliseconds(0)));
}

TEST(CallContext, CancelledTakesPrecedence) {
  CallContext context;
  context.set_deadline(CallContext::Clock::now() - std::chrono::seconds(1));
  context.Cancel();
  EXPECT_THAT(context.CheckActive(), StatusIs(StatusCode::kCancelled));
}

TEST(CallContext, Remaining) {
  CallContext context;
  context.set_deadline(CallContext::Clock::now() + std::chrono::minutes(5));
  EXPECT_STATUS_OK(context.CheckActive());
  auto remaining = context.remaining();
  ASSERT_TRUE(remaining.has_value());
  EXPECT_GT(*remaining, std::chrono::minutes(4));
  EXPECT_LE(*remaining, std::chrono::minutes(5));
}

}  // namespace
VECRO_INLINE_NAMESPACE_END
}  // namespace workload
}  // namespace vecro
