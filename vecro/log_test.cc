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

#include "vecro/log.h"
#include "vecro/internal/log_impl.h"
#include "vecro/testing_util/scoped_environment.h"
#include <gmock/gmock.h>
#include <chrono>
#include <thread>

namespace vecro {
VECRO_INLINE_NAMESPACE_BEGIN
namespace {

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Optional;

TEST(LogSeverityTest, Streaming) {
  std::ostringstream os;
  os << Severity::VECRO_LS_CRITICAL;
  EXPECT_EQ("CRITICAL", os.str());
}

TEST(LogSeverityTest, Parse) {
  EXPECT_THAT(ParseSeverity("debug"), Optional(Severity::VECRO_LS_DEBUG));
  EXPECT_THAT(ParseSeverity("WARNING"), Optional(Severity::VECRO_LS_WARNING));
  EXPECT_THAT(ParseSeverity("Critical"),
              Optional(Severity::VECRO_LS_CRITICAL));
  EXPECT_EQ(ParseSeverity("verbose"), absl::nullopt);
}

TEST(LogRecordTest, Streaming) {
  LogRecord lr;
  lr.severity = Severity::VECRO_LS_INFO;
  lr.function = "Func";
  lr.filename = "filename.cc";
  lr.lineno = 123;
  lr.thread_id = std::this_thread::get_id();
  lr.timestamp = std::chrono::system_clock::from_time_t(1585112316) +
                 std::chrono::microseconds(123456);
  lr.message = "message";
  auto const actual = [&] {
    std::ostringstream os;
    os << lr;
    return std::move(os).str();
  }();
  auto tid = [] {
    std::ostringstream os;
    os << std::this_thread::get_id();
    return std::move(os).str();
  }();
  EXPECT_THAT(actual, HasSubstr("2020-03-25T04:58:36.123456000Z"));
  EXPECT_THAT(actual, HasSubstr("[INFO]"));
  EXPECT_THAT(actual, HasSubstr("<" + tid + ">"));
  EXPECT_THAT(actual, HasSubstr("message"));
  EXPECT_THAT(actual, HasSubstr("(filename.cc:123)"));
}

TEST(LogSinkTest, CompileTimeEnabled) {
  EXPECT_TRUE(LogSink::CompileTimeEnabled(Severity::VECRO_LS_CRITICAL));
  if (Severity::VECRO_LS_LOWEST_ENABLED > Severity::VECRO_LS_TRACE) {
    EXPECT_FALSE(LogSink::CompileTimeEnabled(Severity::VECRO_LS_TRACE));
  }
}

TEST(LogSinkTest, RuntimeSeverity) {
  LogSink sink;
  EXPECT_EQ(Severity::VECRO_LS_LOWEST_ENABLED, sink.minimum_severity());
  sink.set_minimum_severity(Severity::VECRO_LS_ERROR);
  EXPECT_EQ(Severity::VECRO_LS_ERROR, sink.minimum_severity());
}

class MockLogBackend : public LogBackend {
 public:
  MOCK_METHOD(void, Process, (LogRecord const&), (override));
  MOCK_METHOD(void, ProcessWithOwnership, (LogRecord), (override));
};

TEST(LogSinkTest, BackendAddRemove) {
  LogSink sink;
  EXPECT_TRUE(sink.empty());
  auto id = sink.AddBackend(std::make_shared<MockLogBackend>());
  EXPECT_FALSE(sink.empty());
  EXPECT_EQ(1, sink.BackendCount());
  sink.RemoveBackend(id);
  EXPECT_TRUE(sink.empty());
}

TEST(LogSinkTest, LogEnabled) {
  LogSink sink;
  auto backend = std::make_shared<MockLogBackend>();
  EXPECT_CALL(*backend, ProcessWithOwnership(_))
      .WillOnce([](LogRecord const& lr) {
        EXPECT_EQ(Severity::VECRO_LS_WARNING, lr.severity);
        EXPECT_EQ("store is slow", lr.message);
      });
  sink.AddBackend(backend);

  VECRO_LOG_I(VECRO_LS_WARNING, sink) << "store is slow";
}

TEST(LogSinkTest, LogEnabledMultipleBackends) {
  LogSink sink;
  auto be1 = std::make_shared<MockLogBackend>();
  auto be2 = std::make_shared<MockLogBackend>();
  EXPECT_CALL(*be1, Process(_)).WillOnce([](LogRecord const& lr) {
    EXPECT_EQ("test message", lr.message);
  });
  EXPECT_CALL(*be2, Process(_)).WillOnce([](LogRecord const& lr) {
    EXPECT_EQ("test message", lr.message);
  });
  sink.AddBackend(be1);
  sink.AddBackend(be2);

  VECRO_LOG_I(VECRO_LS_ERROR, sink) << "test message";
}

TEST(LogSinkTest, LogBelowMinimumSeverity) {
  LogSink sink;
  auto backend = std::make_shared<MockLogBackend>();
  EXPECT_CALL(*backend, ProcessWithOwnership).Times(0);
  sink.AddBackend(backend);
  sink.set_minimum_severity(Severity::VECRO_LS_ERROR);

  VECRO_LOG_I(VECRO_LS_INFO, sink) << "not logged";
}

TEST(LogSinkTest, LogCheckCounter) {
  LogSink sink;
  int counter = 0;
  auto backend = std::make_shared<MockLogBackend>();
  EXPECT_CALL(*backend, ProcessWithOwnership).Times(0);
  sink.AddBackend(backend);
  sink.set_minimum_severity(Severity::VECRO_LS_ALERT);

  // The message is not even formatted when the severity is disabled.
  VECRO_LOG_I(VECRO_LS_INFO, sink) << "count is " << ++counter;
  EXPECT_EQ(0, counter);
}

TEST(DefaultLogBackend, HonorsEnableClog) {
  testing_util::ScopedEnvironment env("VECRO_ENABLE_CLOG", "warning");
  auto backend = std::dynamic_pointer_cast<internal::StdClogBackend>(
      internal::DefaultLogBackend());
  ASSERT_NE(backend, nullptr);
  EXPECT_EQ(backend->min_severity(), Severity::VECRO_LS_WARNING);
}

TEST(DefaultLogBackend, DefaultsToInfo) {
  testing_util::ScopedEnvironment env("VECRO_ENABLE_CLOG", absl::nullopt);
  auto backend = std::dynamic_pointer_cast<internal::StdClogBackend>(
      internal::DefaultLogBackend());
  ASSERT_NE(backend, nullptr);
  EXPECT_EQ(backend->min_severity(), Severity::VECRO_LS_INFO);
}

TEST(DefaultLogBackend, UnknownNameDefaultsToInfo) {
  testing_util::ScopedEnvironment env("VECRO_ENABLE_CLOG", "chatty");
  auto backend = std::dynamic_pointer_cast<internal::StdClogBackend>(
      internal::DefaultLogBackend());
  ASSERT_NE(backend, nullptr);
  EXPECT_EQ(backend->min_severity(), Severity::VECRO_LS_INFO);
}

}  // namespace
VECRO_INLINE_NAMESPACE_END
}  // namespace vecro
