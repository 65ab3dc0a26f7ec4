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

#include "vecro/workload/internal/tracing_middleware.h"
#include "vecro/internal/make_status.h"
#include "vecro/internal/opentelemetry.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/context.h>
#include <opentelemetry/trace/propagation/http_trace_context.h>
#include <opentelemetry/trace/scope.h>
#include <opentelemetry/trace/span_startoptions.h>
#include <exception>

namespace vecro {
namespace workload_internal {
VECRO_INLINE_NAMESPACE_BEGIN

opentelemetry::nostd::string_view CallContextCarrier::Get(
    opentelemetry::nostd::string_view key) const noexcept {
  auto const& headers = context_.headers();
  auto it = headers.find(
      absl::AsciiStrToLower(absl::string_view{key.data(), key.size()}));
  if (it == headers.end()) return "";
  return {it->second.data(), it->second.size()};
}

EndpointMiddleware MakeTracingMiddleware(
    std::string span_name,
    std::shared_ptr<opentelemetry::context::propagation::TextMapPropagator>
        propagator) {
  return [span_name = std::move(span_name),
          propagator = std::move(propagator)](Endpoint next) -> Endpoint {
    return [span_name, propagator, next = std::move(next)](
               workload::CallContext& context,
               absl::any const& request) -> StatusOr<absl::any> {
      CallContextCarrier carrier(context);
      auto current = opentelemetry::context::RuntimeContext::GetCurrent();
      auto parent = propagator->Extract(carrier, current);

      opentelemetry::trace::StartSpanOptions options;
      options.kind = opentelemetry::trace::SpanKind::kServer;
      options.parent = opentelemetry::trace::GetSpan(parent)->GetContext();
      auto span = internal::MakeSpan(span_name, options);
      opentelemetry::trace::Scope scope(span);
      try {
        return internal::EndSpan(*span, next(context, request));
      } catch (std::exception const& ex) {
        internal::EndSpanImpl(*span, internal::UnknownError(absl::StrCat(
                                         "exception thrown: ", ex.what())));
        throw;
      } catch (...) {
        internal::EndSpanImpl(
            *span, internal::UnknownError("unknown exception thrown"));
        throw;
      }
    };
  };
}

EndpointMiddleware MakeTracingMiddleware(std::string span_name) {
  return MakeTracingMiddleware(
      std::move(span_name),
      std::make_shared<opentelemetry::trace::propagation::HttpTraceContext>());
}

VECRO_INLINE_NAMESPACE_END
}  // namespace workload_internal
}  // namespace vecro
