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

#ifndef VECRO_WORKLOAD_STORE_GATEWAY_H
#define VECRO_WORKLOAD_STORE_GATEWAY_H

#include "vecro/status_or.h"
#include "vecro/version.h"
#include "vecro/workload/call_context.h"
#include "vecro/workload/workload_types.h"
#include <cstddef>
#include <string>

namespace vecro {
namespace workload {
VECRO_INLINE_NAMESPACE_BEGIN

/**
 * Performs single logical operations against the backing store.
 *
 * Implementations are shared by all concurrent calls and must be thread-safe.
 * Each operation checks `context.CheckActive()` before it touches the store,
 * and aborts with the matching error if the call is cancelled or its deadline
 * expires while waiting for the store.
 */
class StoreGateway {
 public:
  virtual ~StoreGateway() = default;

  /**
   * Reads the first item whose key sorts at or after @p key.
   *
   * @return the size of the item read, or 0 if there is no such item.
   */
  virtual StatusOr<std::size_t> ReadOne(CallContext& context,
                                        std::string const& key) = 0;

  /// Persists @p item, returns the number of bytes written.
  virtual StatusOr<std::size_t> WriteOne(CallContext& context,
                                         StoreItem const& item) = 0;
};

VECRO_INLINE_NAMESPACE_END
}  // namespace workload
}  // namespace vecro

#endif  // VECRO_WORKLOAD_STORE_GATEWAY_H
