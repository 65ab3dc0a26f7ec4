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

#ifndef VECRO_WORKLOAD_INTERNAL_TRACING_MIDDLEWARE_H
#define VECRO_WORKLOAD_INTERNAL_TRACING_MIDDLEWARE_H

#include "vecro/version.h"
#include "vecro/workload/call_context.h"
#include "vecro/workload/internal/workload_endpoint.h"
#include <opentelemetry/context/propagation/text_map_propagator.h>
#include <opentelemetry/nostd/string_view.h>
#include <memory>
#include <string>

namespace vecro {
namespace workload_internal {
VECRO_INLINE_NAMESPACE_BEGIN

/// The name of the span created for each inbound call.
auto constexpr kWorkloadSpanName = "BaseRequest";

/**
 * A [carrier] over the inbound headers of a call.
 *
 * [carrier]:
 * https://opentelemetry.io/docs/reference/specification/context/api-propagators/#carrier
 */
class CallContextCarrier
    : public opentelemetry::context::propagation::TextMapCarrier {
 public:
  explicit CallContextCarrier(workload::CallContext const& context)
      : context_(context) {}

  opentelemetry::nostd::string_view Get(
      opentelemetry::nostd::string_view key) const noexcept override;

  // Unneeded by servers.
  void Set(opentelemetry::nostd::string_view,
           opentelemetry::nostd::string_view) noexcept override {}

 private:
  workload::CallContext const& context_;
};

/**
 * Creates a server span around each call to the wrapped endpoint.
 *
 * The parent of the span is extracted from the inbound headers using
 * @p propagator. Without a valid parent the span is a new root. The span is
 * active while the wrapped endpoint runs, and ended on every exit path,
 * including exceptions.
 */
EndpointMiddleware MakeTracingMiddleware(
    std::string span_name,
    std::shared_ptr<opentelemetry::context::propagation::TextMapPropagator>
        propagator);

/// Uses the W3C Trace Context propagator.
EndpointMiddleware MakeTracingMiddleware(
    std::string span_name = kWorkloadSpanName);

VECRO_INLINE_NAMESPACE_END
}  // namespace workload_internal
}  // namespace vecro

#endif  // VECRO_WORKLOAD_INTERNAL_TRACING_MIDDLEWARE_H
