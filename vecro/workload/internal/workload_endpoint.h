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

#ifndef VECRO_WORKLOAD_INTERNAL_WORKLOAD_ENDPOINT_H
#define VECRO_WORKLOAD_INTERNAL_WORKLOAD_ENDPOINT_H

#include "vecro/status_or.h"
#include "vecro/version.h"
#include "vecro/workload/call_context.h"
#include "vecro/workload/internal/workload_metrics_decorator.h"
#include "vecro/workload/workload_service.h"
#include "absl/types/any.h"
#include <cstddef>
#include <functional>
#include <memory>

namespace vecro {
namespace workload_internal {
VECRO_INLINE_NAMESPACE_BEGIN

/**
 * A type-erased call, as seen by the transport.
 *
 * The transport decodes the inbound body into a request object, and passes
 * it to the endpoint. The endpoint narrows the request to the type it
 * expects, and returns its result in the same generic form.
 */
using Endpoint = std::function<StatusOr<absl::any>(workload::CallContext&,
                                                   absl::any const&)>;

/// Wraps an endpoint with additional behavior, e.g. tracing.
using EndpointMiddleware = std::function<Endpoint(Endpoint)>;

/**
 * Called by the transport once the response is encoded.
 *
 * Receives the call context, the HTTP status code and the size of the
 * encoded response body.
 */
using ResponseFinalizer =
    std::function<void(workload::CallContext&, int, std::size_t)>;

/// Logs the response size, and adds it to the throughput counter.
ResponseFinalizer MakeThroughputFinalizer(WorkloadInstruments instruments);

/**
 * Adapts @p service to an `Endpoint`.
 *
 * The endpoint expects a `workload::WorkloadRequest` and returns a
 * `workload::WorkloadResponse`. Any other request type results in a
 * `kInvalidArgument` error with reason `DECODE_FAILED`, without calling
 * @p service.
 */
Endpoint MakeWorkloadEndpoint(
    std::shared_ptr<workload::WorkloadService> service);

/**
 * Wraps @p base with the logging and metrics decorators.
 *
 * The metrics decorator is innermost, its timer covers only the store
 * round-trips. The logging decorator sees the metrics decorator's result.
 */
std::shared_ptr<workload::WorkloadService> DecorateWorkloadService(
    std::shared_ptr<workload::WorkloadService> base,
    WorkloadInstruments instruments);

VECRO_INLINE_NAMESPACE_END
}  // namespace workload_internal
}  // namespace vecro

#endif  // VECRO_WORKLOAD_INTERNAL_WORKLOAD_ENDPOINT_H
