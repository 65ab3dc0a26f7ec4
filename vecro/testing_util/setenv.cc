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

#include "vecro/testing_util/setenv.h"
#include <stdlib.h>  // NOLINT(modernize-deprecated-headers)

namespace vecro {
VECRO_INLINE_NAMESPACE_BEGIN
namespace testing_util {

void UnsetEnv(char const* variable) { unsetenv(variable); }

void SetEnv(char const* variable, absl::optional<std::string> const& value) {
  if (!value.has_value()) {
    UnsetEnv(variable);
    return;
  }
  (void)setenv(variable, value->c_str(), 1);
}

}  // namespace testing_util
VECRO_INLINE_NAMESPACE_END
}  // namespace vecro
