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

#include "vecro/workload/workload_types.h"
#include <ostream>

namespace vecro {
namespace workload {
VECRO_INLINE_NAMESPACE_BEGIN

bool operator==(WorkloadConfig const& a, WorkloadConfig const& b) {
  return a.read_ops == b.read_ops && a.write_ops == b.write_ops &&
         a.value_size == b.value_size;
}

std::ostream& operator<<(std::ostream& os, WorkloadConfig const& rhs) {
  return os << "WorkloadConfig{read_ops=" << rhs.read_ops
            << ", write_ops=" << rhs.write_ops
            << ", value_size=" << rhs.value_size << "}";
}

std::ostream& operator<<(std::ostream& os, WorkloadRequest const& rhs) {
  return os << "WorkloadRequest{payload_size=" << rhs.payload.size() << "}";
}

bool operator==(WorkloadResponse const& a, WorkloadResponse const& b) {
  return a.bytes == b.bytes && a.reads == b.reads && a.writes == b.writes &&
         a.ok == b.ok;
}

std::ostream& operator<<(std::ostream& os, WorkloadResponse const& rhs) {
  return os << "WorkloadResponse{bytes=" << rhs.bytes
            << ", reads=" << rhs.reads << ", writes=" << rhs.writes
            << ", ok=" << (rhs.ok ? "true" : "false") << "}";
}

VECRO_INLINE_NAMESPACE_END
}  // namespace workload
}  // namespace vecro
