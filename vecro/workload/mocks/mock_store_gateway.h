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

#ifndef VECRO_WORKLOAD_MOCKS_MOCK_STORE_GATEWAY_H
#define VECRO_WORKLOAD_MOCKS_MOCK_STORE_GATEWAY_H

#include "vecro/version.h"
#include "vecro/workload/store_gateway.h"
#include <gmock/gmock.h>

namespace vecro {
namespace workload_mocks {
VECRO_INLINE_NAMESPACE_BEGIN

/**
 * A class to mock `vecro::workload::StoreGateway`.
 *
 * Use it to test the workload service, and its decorators, with simulated
 * store latencies and failures.
 */
class MockStoreGateway : public workload::StoreGateway {
 public:
  MOCK_METHOD(StatusOr<std::size_t>, ReadOne,
              (workload::CallContext&, std::string const& key), (override));

  MOCK_METHOD(StatusOr<std::size_t>, WriteOne,
              (workload::CallContext&, workload::StoreItem const& item),
              (override));
};

VECRO_INLINE_NAMESPACE_END
}  // namespace workload_mocks
}  // namespace vecro

#endif  // VECRO_WORKLOAD_MOCKS_MOCK_STORE_GATEWAY_H
