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

#ifndef VECRO_WORKLOAD_INTERNAL_WORKLOAD_OPTION_DEFAULTS_H
#define VECRO_WORKLOAD_INTERNAL_WORKLOAD_OPTION_DEFAULTS_H

#include "vecro/options.h"
#include "vecro/version.h"
#include "vecro/workload/workload_types.h"
#include <string>

namespace vecro {
namespace workload_internal {
VECRO_INLINE_NAMESPACE_BEGIN

/**
 * Fills any unset workload option from its `VECRO_*` environment variable,
 * or from the built-in default.
 *
 * Options already set in @p opts take precedence over the environment. A
 * malformed or out of range value is logged as a WARNING and replaced by the
 * default, it is never fatal.
 */
Options PopulateWorkloadOptions(Options opts);

/// The workload shape implied by @p opts.
workload::WorkloadConfig MakeWorkloadConfig(Options const& opts);

/// A single-line description of @p opts for logging, without secrets.
std::string DescribeWorkloadOptions(Options const& opts);

VECRO_INLINE_NAMESPACE_END
}  // namespace workload_internal
}  // namespace vecro

#endif  // VECRO_WORKLOAD_INTERNAL_WORKLOAD_OPTION_DEFAULTS_H
