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

#ifndef VECRO_VERSION_H
#define VECRO_VERSION_H

#include <string>

#define VECRO_VERSION_MAJOR 1
#define VECRO_VERSION_MINOR 2
#define VECRO_VERSION_PATCH 0

#define VECRO_VCONCAT(Ma, Mi, Pa) v##Ma##_##Mi##_##Pa
#define VECRO_VEVAL(Ma, Mi, Pa) VECRO_VCONCAT(Ma, Mi, Pa)
#define VECRO_NS \
  VECRO_VEVAL(VECRO_VERSION_MAJOR, VECRO_VERSION_MINOR, VECRO_VERSION_PATCH)

/**
 * Versioned inline namespace that users should generally avoid spelling.
 *
 * The namespace is inlined, so code can use `vecro::Foo` in its source, while
 * the symbols are versioned, i.e., the symbol becomes `vecro::vXYZ::Foo`.
 */
#define VECRO_INLINE_NAMESPACE_BEGIN inline namespace VECRO_NS {
#define VECRO_INLINE_NAMESPACE_END } /* namespace VECRO_NS */

namespace vecro {
VECRO_INLINE_NAMESPACE_BEGIN

/// The service major version.
int constexpr version_major() { return VECRO_VERSION_MAJOR; }

/// The service minor version.
int constexpr version_minor() { return VECRO_VERSION_MINOR; }

/// The service patch version.
int constexpr version_patch() { return VECRO_VERSION_PATCH; }

/// The version as a string, in MAJOR.MINOR.PATCH format.
std::string version_string();

VECRO_INLINE_NAMESPACE_END
}  // namespace vecro

#endif  // VECRO_VERSION_H
