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
#include "vecro/log.h"
#include "vecro/workload/internal/workload_logging_decorator.h"

namespace vecro {
namespace workload_internal {
VECRO_INLINE_NAMESPACE_BEGIN

Endpoint MakeWorkloadEndpoint(
    std::shared_ptr<workload::WorkloadService> service) {
  return [service = std::move(service)](
             workload::CallContext& context,
             absl::any const& request) -> StatusOr<absl::any> {
    auto const* r = absl::any_cast<workload::WorkloadRequest>(&request);
    if (r == nullptr) {
      return internal::InvalidArgumentError(
          "unexpected request type", VECRO_ERROR_INFO().WithReason(
                                         "DECODE_FAILED"));
    }
    auto response = service->Execute(context, *r);
    if (!response) return std::move(response).status();
    return absl::any(*std::move(response));
  };
}

ResponseFinalizer MakeThroughputFinalizer(WorkloadInstruments instruments) {
  return [instruments = std::move(instruments)](
             workload::CallContext&, int http_status, std::size_t size) {
    VECRO_LOG(DEBUG) << "response size=" << size
                     << " http_status=" << http_status;
    RecordThroughput(instruments, size);
  };
}

std::shared_ptr<workload::WorkloadService> DecorateWorkloadService(
    std::shared_ptr<workload::WorkloadService> base,
    WorkloadInstruments instruments) {
  auto metrics = std::make_shared<WorkloadServiceMetrics>(
      std::move(base), std::move(instruments));
  return std::make_shared<WorkloadServiceLogging>(std::move(metrics));
}

VECRO_INLINE_NAMESPACE_END
}  // namespace workload_internal
}  // namespace vecro
