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

#include "vecro/internal/getenv.h"
#include <cstdlib>

namespace vecro {
VECRO_INLINE_NAMESPACE_BEGIN
namespace internal {

absl::optional<std::string> GetEnv(char const* variable) {
  char const* buffer = std::getenv(variable);
  if (buffer == nullptr) return absl::nullopt;
  return std::string{buffer};
}

}  // namespace internal
VECRO_INLINE_NAMESPACE_END
}  // namespace vecro
