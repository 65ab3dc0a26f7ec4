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

#ifndef VECRO_WORKLOAD_INTERNAL_POSTGRES_STORE_GATEWAY_H
#define VECRO_WORKLOAD_INTERNAL_POSTGRES_STORE_GATEWAY_H

#include "vecro/options.h"
#include "vecro/status_or.h"
#include "vecro/version.h"
#include "vecro/workload/store_gateway.h"
#include "absl/strings/string_view.h"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace vecro {
namespace workload_internal {
VECRO_INLINE_NAMESPACE_BEGIN

using ConnectionParameters = std::vector<std::pair<std::string, std::string>>;

/**
 * The libpq connection keywords and values for the store options.
 *
 * Empty credentials are omitted, so libpq falls back to its own defaults
 * (e.g. `PGUSER` or the `.pgpass` file).
 */
ConnectionParameters MakeConnectionParameters(Options const& opts);

/// Quotes @p name for use as a SQL identifier.
std::string QuoteIdentifier(absl::string_view name);

/**
 * Connects to the PostgreSQL store described by @p opts.
 *
 * Opens `StorePoolSizeOption` connections, verifies them, and creates the
 * collection table and its index if needed. Any failure is reported as
 * `kUnavailable` with reason `STORE_CONNECT_FAILED`.
 */
StatusOr<std::shared_ptr<workload::StoreGateway>> MakePostgresStoreGateway(
    Options const& opts);

VECRO_INLINE_NAMESPACE_END
}  // namespace workload_internal
}  // namespace vecro

#endif  // VECRO_WORKLOAD_INTERNAL_POSTGRES_STORE_GATEWAY_H
