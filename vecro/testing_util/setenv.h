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

#ifndef VECRO_TESTING_UTIL_SETENV_H
#define VECRO_TESTING_UTIL_SETENV_H

#include "vecro/version.h"
#include "absl/types/optional.h"
#include <string>

namespace vecro {
VECRO_INLINE_NAMESPACE_BEGIN
namespace testing_util {

/**
 * Set the @p variable environment variable to @p value.
 *
 * If @p value is an unset `absl::optional` then the variable is unset.
 *
 * @warning A modification to the environment must be serialized with all
 *   other environment reads and writes, so this should only be used when
 *   we are single-threaded.
 */
void SetEnv(char const* variable, absl::optional<std::string> const& value);

/// Unset (remove) an environment variable.
void UnsetEnv(char const* variable);

}  // namespace testing_util
VECRO_INLINE_NAMESPACE_END
}  // namespace vecro

#endif  // VECRO_TESTING_UTIL_SETENV_H
