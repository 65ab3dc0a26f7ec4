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

#ifndef VECRO_INTERNAL_OPENTELEMETRY_H
#define VECRO_INTERNAL_OPENTELEMETRY_H

#include "vecro/status.h"
#include "vecro/status_or.h"
#include "vecro/version.h"
#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/nostd/string_view.h>
#include <opentelemetry/trace/span.h>
#include <opentelemetry/trace/span_id.h>
#include <opentelemetry/trace/span_startoptions.h>
#include <opentelemetry/trace/trace_id.h>
#include <opentelemetry/trace/tracer.h>
#include <string>

namespace vecro {
VECRO_INLINE_NAMESPACE_BEGIN
namespace internal {

/// The name of the tracer (the instrumentation scope) used by the service.
auto constexpr kTracerName = "vecro-service";

/**
 * Returns a tracer to use for creating spans.
 *
 * The tracer comes from the global provider. Until `ConfigureTracing()`
 * installs an SDK provider this is a no-op tracer.
 */
opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> GetTracer();

/**
 * Start a span using the current tracer provider.
 *
 * The span is not activated, callers use an `opentelemetry::trace::Scope`
 * when the span should be the parent of any nested spans.
 */
opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> MakeSpan(
    opentelemetry::nostd::string_view name,
    opentelemetry::trace::StartSpanOptions const& options = {});

void EndSpanImpl(opentelemetry::trace::Span& span, Status const& status);

/**
 * Extracts information from a `Status` and adds it to a span.
 *
 * The span is ended. The original value is returned, for the sake of
 * composition.
 */
Status EndSpan(opentelemetry::trace::Span& span, Status const& status);

/// Extracts information from a `StatusOr<>`, adds it to a span and ends it.
template <typename T>
StatusOr<T> EndSpan(opentelemetry::trace::Span& span, StatusOr<T> value) {
  EndSpanImpl(span, value.status());
  return value;
}

std::string ToString(opentelemetry::trace::TraceId const& trace_id);

std::string ToString(opentelemetry::trace::SpanId const& span_id);

}  // namespace internal
VECRO_INLINE_NAMESPACE_END
}  // namespace vecro

#endif  // VECRO_INTERNAL_OPENTELEMETRY_H
