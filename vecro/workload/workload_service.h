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

#ifndef VECRO_WORKLOAD_WORKLOAD_SERVICE_H
#define VECRO_WORKLOAD_WORKLOAD_SERVICE_H

#include "vecro/status_or.h"
#include "vecro/version.h"
#include "vecro/workload/call_context.h"
#include "vecro/workload/workload_types.h"

namespace vecro {
namespace workload {
VECRO_INLINE_NAMESPACE_BEGIN

/**
 * The capability shared by the base workload and all its decorators.
 *
 * Decorators (logging, metrics) implement this interface and hold the next
 * layer as a `std::shared_ptr<WorkloadService>`, so any order of wraps can
 * be built by composition.
 */
class WorkloadService {
 public:
  virtual ~WorkloadService() = default;

  virtual StatusOr<WorkloadResponse> Execute(
      CallContext& context, WorkloadRequest const& request) = 0;
};

VECRO_INLINE_NAMESPACE_END
}  // namespace workload
}  // namespace vecro

#endif  // VECRO_WORKLOAD_WORKLOAD_SERVICE_H
