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

#ifndef VECRO_WORKLOAD_WORKLOAD_OPTIONS_H
#define VECRO_WORKLOAD_WORKLOAD_OPTIONS_H

/**
 * @file
 *
 * The service configuration. Every option is filled from a `VECRO_*`
 * environment variable by `PopulateWorkloadOptions()`.
 */

#include "vecro/options.h"
#include "vecro/version.h"
#include <chrono>
#include <string>

namespace vecro {
namespace workload {
VECRO_INLINE_NAMESPACE_BEGIN

/// The service name, used to label metrics and spans. (`VECRO_NAME`)
struct ServiceNameOption {
  using Type = std::string;
};

/// The subsystem name, part of every metric name. (`VECRO_SUBSYSTEM`)
struct SubsystemOption {
  using Type = std::string;
};

/**
 * The address for the workload endpoint. (`VECRO_LISTEN_ADDRESS`)
 *
 * Accepts `host:port`, `:port` (all interfaces) or a bare `port`.
 */
struct ListenAddressOption {
  using Type = std::string;
};

/// The number of reads per request. (`VECRO_DB_READ_OPS`)
struct ReadOpsOption {
  using Type = int;
};

/// The number of writes per request. (`VECRO_DB_WRITE_OPS`)
struct WriteOpsOption {
  using Type = int;
};

/// The size of each value written to the store. (`VECRO_DB_VALUE_SIZE`)
struct ValueSizeOption {
  using Type = int;
};

/// The store user name. (`VECRO_DB_USER`)
struct StoreUserOption {
  using Type = std::string;
};

/// The store password, never logged. (`VECRO_DB_PASSWORD`)
struct StorePasswordOption {
  using Type = std::string;
};

/// The table holding the workload items. (`VECRO_DB_COLLECTION`)
struct StoreCollectionOption {
  using Type = std::string;
};

struct StoreHostOption {
  using Type = std::string;
};

struct StorePortOption {
  using Type = int;
};

/// The database name. (`VECRO_DB_NAME`)
struct StoreDatabaseOption {
  using Type = std::string;
};

/// The number of store connections shared by all calls.
struct StorePoolSizeOption {
  using Type = int;
};

struct StoreConnectTimeoutOption {
  using Type = std::chrono::seconds;
};

/// The deadline for each inbound call. (`VECRO_REQUEST_TIMEOUT`)
struct RequestTimeoutOption {
  using Type = std::chrono::seconds;
};

/// The number of threads serving inbound calls. (`VECRO_THREADS`)
struct ServerThreadsOption {
  using Type = int;
};

/// The `host:port` for the Prometheus scrape endpoint.
struct MetricsAddressOption {
  using Type = std::string;
};

/**
 * The OTLP/HTTP endpoint receiving spans. (`VECRO_TRACE_ENDPOINT`)
 *
 * An empty value disables the trace export.
 */
struct TraceEndpointOption {
  using Type = std::string;
};

/// The fraction of traces sampled, in [0, 1]. (`VECRO_TRACE_RATIO`)
struct TraceSamplingRatioOption {
  using Type = double;
};

/// The `service.name` resource attribute of exported spans.
struct TraceServiceNameOption {
  using Type = std::string;
};

VECRO_INLINE_NAMESPACE_END
}  // namespace workload
}  // namespace vecro

#endif  // VECRO_WORKLOAD_WORKLOAD_OPTIONS_H
