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

#ifndef VECRO_WORKLOAD_INTERNAL_WORKLOAD_LOGGING_DECORATOR_H
#define VECRO_WORKLOAD_INTERNAL_WORKLOAD_LOGGING_DECORATOR_H

#include "vecro/version.h"
#include "vecro/workload/workload_service.h"
#include <memory>

namespace vecro {
namespace workload_internal {
VECRO_INLINE_NAMESPACE_BEGIN

/// Logs each call, its result and its duration.
class WorkloadServiceLogging : public workload::WorkloadService {
 public:
  explicit WorkloadServiceLogging(
      std::shared_ptr<workload::WorkloadService> child)
      : child_(std::move(child)) {}

  StatusOr<workload::WorkloadResponse> Execute(
      workload::CallContext& context,
      workload::WorkloadRequest const& request) override;

 private:
  std::shared_ptr<workload::WorkloadService> child_;
};

VECRO_INLINE_NAMESPACE_END
}  // namespace workload_internal
}  // namespace vecro

#endif  // VECRO_WORKLOAD_INTERNAL_WORKLOAD_LOGGING_DECORATOR_H
