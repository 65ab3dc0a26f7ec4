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

#ifndef VECRO_WORKLOAD_WORKLOAD_TYPES_H
#define VECRO_WORKLOAD_WORKLOAD_TYPES_H

#include "vecro/version.h"
#include <cstddef>
#include <iosfwd>
#include <string>

namespace vecro {
namespace workload {
VECRO_INLINE_NAMESPACE_BEGIN

/**
 * The workload shape, fixed for the lifetime of a service instance.
 *
 * Every call to `WorkloadService::Execute()` performs exactly `read_ops`
 * reads and `write_ops` writes, regardless of the request content.
 */
struct WorkloadConfig {
  int read_ops = 0;
  int write_ops = 0;
  /// The size of each value written to the store.
  std::size_t value_size = 64;
};

bool operator==(WorkloadConfig const& a, WorkloadConfig const& b);
inline bool operator!=(WorkloadConfig const& a, WorkloadConfig const& b) {
  return !(a == b);
}
std::ostream& operator<<(std::ostream& os, WorkloadConfig const& rhs);

/// An inbound request. The payload is opaque to the service.
struct WorkloadRequest {
  std::string payload;
};

std::ostream& operator<<(std::ostream& os, WorkloadRequest const& rhs);

/// The result of a successful call.
struct WorkloadResponse {
  /// The total size of all the items read and written.
  std::size_t bytes = 0;
  int reads = 0;
  int writes = 0;
  bool ok = false;
};

bool operator==(WorkloadResponse const& a, WorkloadResponse const& b);
inline bool operator!=(WorkloadResponse const& a, WorkloadResponse const& b) {
  return !(a == b);
}
std::ostream& operator<<(std::ostream& os, WorkloadResponse const& rhs);

/// A single key/value pair persisted in the backing store.
struct StoreItem {
  std::string key;
  std::string value;

  std::size_t size() const { return key.size() + value.size(); }
};

VECRO_INLINE_NAMESPACE_END
}  // namespace workload
}  // namespace vecro

#endif  // VECRO_WORKLOAD_WORKLOAD_TYPES_H
