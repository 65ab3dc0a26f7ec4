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

#ifndef VECRO_TESTING_UTIL_OPENTELEMETRY_MATCHERS_H
#define VECRO_TESTING_UTIL_OPENTELEMETRY_MATCHERS_H

#include "vecro/version.h"
#include <gmock/gmock.h>
#include <opentelemetry/exporters/memory/in_memory_span_data.h>
#include <opentelemetry/sdk/trace/span_data.h>
#include <opentelemetry/trace/span.h>
#include <opentelemetry/trace/span_context.h>
#include <opentelemetry/trace/span_metadata.h>
#include <opentelemetry/trace/tracer_provider.h>
#include <iosfwd>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * Provide `opentelemetry::sdk::trace::SpanData` output streaming.
 *
 * Opening a namespace outside our control is generally not a good idea, but
 * it works and it is limited to tests.
 */
OPENTELEMETRY_BEGIN_NAMESPACE
namespace sdk {
namespace trace {

std::ostream& operator<<(std::ostream&, SpanData const&);

}  // namespace trace
}  // namespace sdk
OPENTELEMETRY_END_NAMESPACE

namespace vecro {
VECRO_INLINE_NAMESPACE_BEGIN
namespace testing_util_internal {

using OTelAttributeMap =
    std::unordered_map<std::string,
                       opentelemetry::sdk::common::OwnedAttributeValue>;

MATCHER_P(SpanAttributesImpl, matcher,
          ::testing::DescribeMatcher<OTelAttributeMap>(matcher)) {
  return ::testing::ExplainMatchResult(matcher, arg->GetAttributes(),
                                       result_listener);
}

}  // namespace testing_util_internal
namespace testing_util {

using SpanDataPtr = std::unique_ptr<opentelemetry::sdk::trace::SpanData>;

std::string ToString(opentelemetry::trace::SpanKind k);

std::string ToString(opentelemetry::trace::StatusCode c);

std::string ToString(opentelemetry::trace::SpanId span_id);

bool ThereIsAnActiveSpan();

MATCHER(SpanKindIsServer,
        "has kind: " + ToString(opentelemetry::trace::SpanKind::kServer)) {
  auto const& kind = arg->GetSpanKind();
  *result_listener << "has kind: " << ToString(kind);
  return kind == opentelemetry::trace::SpanKind::kServer;
}

MATCHER(SpanHasServiceScope, "has instrumentation scope vecro-service") {
  auto const& name = arg->GetInstrumentationScope().GetName();
  *result_listener << "has instrumentation scope: " << name;
  return name == "vecro-service";
}

/// Matches a span whose parent is the span described by @p context.
MATCHER_P(SpanWithParentContext, context,
          "has parent span id: " + ToString(context.span_id())) {
  auto const& actual = arg->GetParentSpanId();
  *result_listener << "has parent span id: " << ToString(actual)
                   << " and trace id match: "
                   << (arg->GetTraceId() == context.trace_id());
  return actual == context.span_id() &&
         arg->GetTraceId() == context.trace_id();
}

MATCHER_P(SpanWithParent, span,
          "has parent span id: " + ToString(span->GetContext().span_id())) {
  auto const& actual = arg->GetParentSpanId();
  *result_listener << "has parent span id: " << ToString(actual);
  return actual == span->GetContext().span_id();
}

MATCHER(SpanIsRoot, "is root span") {
  auto const actual = arg->GetParentSpanId() == opentelemetry::trace::SpanId();
  *result_listener << "is root span: " << (actual ? "true" : "false");
  return actual;
}

MATCHER_P(SpanNamed, name, "has name: " + std::string{name}) {
  auto const& actual = arg->GetName();
  *result_listener << "has name: " << actual;
  return actual == name;
}

MATCHER_P(SpanWithStatus, status, "has status: " + ToString(status)) {
  auto const& actual = arg->GetStatus();
  *result_listener << "has status: " << ToString(actual);
  return actual == status;
}

MATCHER_P2(SpanWithStatus, status, description,
           "has (status: " + ToString(status) +
               " | description: " + description + ")") {
  auto const& s = arg->GetStatus();
  auto const& d = arg->GetDescription();
  *result_listener << "has (status: " << ToString(s) << " | description: " << d
                   << ")";
  return s == status && d == description;
}

template <typename... Args>
::testing::Matcher<SpanDataPtr> SpanHasAttributes(Args const&... matchers) {
  return testing_util_internal::SpanAttributesImpl(
      ::testing::IsSupersetOf({matchers...}));
}

template <typename T>
::testing::Matcher<
    std::pair<std::string, opentelemetry::sdk::common::OwnedAttributeValue>>
OTelAttribute(std::string const& key, ::testing::Matcher<T const&> matcher) {
  return ::testing::Pair(key, ::testing::VariantWith<T>(matcher));
}

/**
 * Captures the spans created while this object is alive.
 *
 * Installs an SDK tracer provider with an in-memory exporter as the global
 * provider, and restores the previous provider on destruction. Each call to
 * `GetSpans()` clears the previously collected spans. Tests using this class
 * must not run in parallel within the same process.
 */
class SpanCatcher {
 public:
  SpanCatcher();
  ~SpanCatcher();

  std::vector<SpanDataPtr> GetSpans();

 private:
  std::shared_ptr<opentelemetry::exporter::memory::InMemorySpanData> span_data_;
  opentelemetry::nostd::shared_ptr<opentelemetry::trace::TracerProvider>
      previous_;
};

std::shared_ptr<SpanCatcher> InstallSpanCatcher();

}  // namespace testing_util
VECRO_INLINE_NAMESPACE_END
}  // namespace vecro

#endif  // VECRO_TESTING_UTIL_OPENTELEMETRY_MATCHERS_H
