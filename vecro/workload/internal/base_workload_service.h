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

#ifndef VECRO_WORKLOAD_INTERNAL_BASE_WORKLOAD_SERVICE_H
#define VECRO_WORKLOAD_INTERNAL_BASE_WORKLOAD_SERVICE_H

#include "vecro/internal/random.h"
#include "vecro/version.h"
#include "vecro/workload/store_gateway.h"
#include "vecro/workload/workload_service.h"
#include <memory>
#include <mutex>
#include <string>

namespace vecro {
namespace workload_internal {
VECRO_INLINE_NAMESPACE_BEGIN

/// The length of the random keys used by reads and writes.
std::size_t constexpr kWorkloadKeySize = 16;

/**
 * Performs the configured number of store reads and writes per call.
 *
 * The reads run first, then the writes, all sequentially. The call stops at
 * the first failed operation, operations already performed are not rolled
 * back.
 *
 * Keys and values are drawn from the PRNG passed at construction, so tests
 * can reproduce the content of each call.
 */
class BaseWorkloadService : public workload::WorkloadService {
 public:
  BaseWorkloadService(std::shared_ptr<workload::StoreGateway> gateway,
                      workload::WorkloadConfig config,
                      internal::DefaultPRNG generator);

  StatusOr<workload::WorkloadResponse> Execute(
      workload::CallContext& context,
      workload::WorkloadRequest const& request) override;

  workload::WorkloadConfig const& config() const { return config_; }

 private:
  std::string RandomKey();
  workload::StoreItem RandomItem();

  std::shared_ptr<workload::StoreGateway> gateway_;
  workload::WorkloadConfig const config_;
  std::mutex mu_;
  internal::DefaultPRNG generator_;  // GUARDED_BY(mu_)
};

VECRO_INLINE_NAMESPACE_END
}  // namespace workload_internal
}  // namespace vecro

#endif  // VECRO_WORKLOAD_INTERNAL_BASE_WORKLOAD_SERVICE_H
