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

#include "vecro/workload/internal/workload_logging_decorator.h"
#include "vecro/internal/log_wrapper.h"

namespace vecro {
namespace workload_internal {
VECRO_INLINE_NAMESPACE_BEGIN

StatusOr<workload::WorkloadResponse> WorkloadServiceLogging::Execute(
    workload::CallContext& context, workload::WorkloadRequest const& request) {
  return internal::LogWrapper(
      [this](workload::CallContext& context,
             workload::WorkloadRequest const& request) {
        return child_->Execute(context, request);
      },
      context, request, __func__);
}

VECRO_INLINE_NAMESPACE_END
}  // namespace workload_internal
}  // namespace vecro
