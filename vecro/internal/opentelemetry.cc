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

#include "vecro/internal/opentelemetry.h"
#include <opentelemetry/trace/provider.h>

namespace vecro {
VECRO_INLINE_NAMESPACE_BEGIN
namespace internal {

opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> GetTracer() {
  auto provider = opentelemetry::trace::Provider::GetTracerProvider();
  return provider->GetTracer(kTracerName, version_string());
}

opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> MakeSpan(
    opentelemetry::nostd::string_view name,
    opentelemetry::trace::StartSpanOptions const& options) {
  return GetTracer()->StartSpan(name, options);
}

void EndSpanImpl(opentelemetry::trace::Span& span, Status const& status) {
  if (status.ok()) {
    span.SetStatus(opentelemetry::trace::StatusCode::kOk);
    span.SetAttribute("vecro.status_code", StatusCodeToString(status.code()));
    span.End();
    return;
  }
  // Some trace viewers drop the span status, so it is also recorded as an
  // attribute.
  span.SetStatus(opentelemetry::trace::StatusCode::kError, status.message());
  span.SetAttribute("vecro.status_code", StatusCodeToString(status.code()));
  span.SetAttribute("vecro.error.message", status.message());
  auto const& ei = status.error_info();
  if (!ei.reason().empty()) {
    span.SetAttribute("vecro.error.reason", ei.reason());
  }
  if (!ei.domain().empty()) {
    span.SetAttribute("vecro.error.domain", ei.domain());
  }
  span.End();
}

Status EndSpan(opentelemetry::trace::Span& span, Status const& status) {
  EndSpanImpl(span, status);
  return status;
}

std::string ToString(opentelemetry::trace::TraceId const& trace_id) {
  constexpr int kSize = opentelemetry::trace::TraceId::kSize * 2;
  char trace_id_array[kSize];
  trace_id.ToLowerBase16(trace_id_array);
  return std::string(trace_id_array, kSize);
}

std::string ToString(opentelemetry::trace::SpanId const& span_id) {
  constexpr int kSize = opentelemetry::trace::SpanId::kSize * 2;
  char span_id_array[kSize];
  span_id.ToLowerBase16(span_id_array);
  return std::string(span_id_array, kSize);
}

}  // namespace internal
VECRO_INLINE_NAMESPACE_END
}  // namespace vecro
