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

#include "vecro/workload/internal/workload_option_defaults.h"
#include "vecro/internal/getenv.h"
#include "vecro/log.h"
#include "vecro/workload/workload_options.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include <algorithm>
#include <chrono>
#include <thread>

namespace vecro {
namespace workload_internal {
VECRO_INLINE_NAMESPACE_BEGIN
namespace {

using ::vecro::internal::GetEnv;

auto constexpr kDefaultName = "name";
auto constexpr kDefaultSubsystem = "subsystem";
auto constexpr kDefaultListenAddress = ":8080";
auto constexpr kDefaultCollection = "items";
auto constexpr kDefaultHost = "localhost";
auto constexpr kDefaultPort = 5432;
auto constexpr kDefaultDatabase = "data";
auto constexpr kDefaultPoolSize = 4;
auto constexpr kDefaultValueSize = 64;
auto constexpr kDefaultConnectTimeout = std::chrono::seconds(10);
auto constexpr kDefaultRequestTimeout = std::chrono::seconds(30);
auto constexpr kDefaultMetricsAddress = "0.0.0.0:9464";
auto constexpr kDefaultTraceEndpoint = "http://jaeger-collector:4318/v1/traces";
auto constexpr kDefaultTraceRatio = 1.0;
auto constexpr kDefaultTraceServiceName = "default-service";

template <typename Option>
void SetString(Options& opts, char const* variable, std::string value) {
  if (opts.has<Option>()) return;
  opts.set<Option>(GetEnv(variable).value_or(std::move(value)));
}

// Integers below `minimum` are treated like malformed values.
int ParseInt(char const* variable, int minimum, int default_value) {
  auto env = GetEnv(variable);
  if (!env || env->empty()) return default_value;
  int value;
  if (!absl::SimpleAtoi(*env, &value) || value < minimum) {
    VECRO_LOG(WARNING) << "invalid value for " << variable << "=<" << *env
                       << ">, using default " << default_value;
    return default_value;
  }
  return value;
}

template <typename Option>
void SetInt(Options& opts, char const* variable, int minimum,
            int default_value) {
  if (opts.has<Option>()) return;
  opts.set<Option>(ParseInt(variable, minimum, default_value));
}

template <typename Option>
void SetSeconds(Options& opts, char const* variable,
                std::chrono::seconds default_value) {
  if (opts.has<Option>()) return;
  auto const s = ParseInt(variable, 1, static_cast<int>(default_value.count()));
  opts.set<Option>(std::chrono::seconds(s));
}

double ParseRatio(char const* variable, double default_value) {
  auto env = GetEnv(variable);
  if (!env || env->empty()) return default_value;
  double value;
  if (!absl::SimpleAtod(*env, &value) || value < 0.0 || value > 1.0) {
    VECRO_LOG(WARNING) << "invalid value for " << variable << "=<" << *env
                       << ">, using default " << default_value;
    return default_value;
  }
  return value;
}

int DefaultThreadCount() {
  // hardware_concurrency() is only a hint, and may be 0.
  return static_cast<int>((std::max)(1U, std::thread::hardware_concurrency()));
}

}  // namespace

Options PopulateWorkloadOptions(Options opts) {
  using namespace ::vecro::workload;  // NOLINT(google-build-using-namespace)
  // Only an explicit service name labels the exported spans.
  auto const named =
      opts.has<ServiceNameOption>() || GetEnv("VECRO_NAME").has_value();
  SetString<ServiceNameOption>(opts, "VECRO_NAME", kDefaultName);
  SetString<SubsystemOption>(opts, "VECRO_SUBSYSTEM", kDefaultSubsystem);
  SetString<ListenAddressOption>(opts, "VECRO_LISTEN_ADDRESS",
                                 kDefaultListenAddress);
  SetInt<ReadOpsOption>(opts, "VECRO_DB_READ_OPS", 0, 0);
  SetInt<WriteOpsOption>(opts, "VECRO_DB_WRITE_OPS", 0, 0);
  SetInt<ValueSizeOption>(opts, "VECRO_DB_VALUE_SIZE", 0, kDefaultValueSize);
  SetString<StoreUserOption>(opts, "VECRO_DB_USER", "");
  SetString<StorePasswordOption>(opts, "VECRO_DB_PASSWORD", "");
  SetString<StoreCollectionOption>(opts, "VECRO_DB_COLLECTION",
                                   kDefaultCollection);
  // An empty collection name cannot be used as a table name.
  if (opts.get<StoreCollectionOption>().empty()) {
    opts.set<StoreCollectionOption>(kDefaultCollection);
  }
  SetString<StoreHostOption>(opts, "VECRO_DB_HOST", kDefaultHost);
  SetInt<StorePortOption>(opts, "VECRO_DB_PORT", 1, kDefaultPort);
  SetString<StoreDatabaseOption>(opts, "VECRO_DB_NAME", kDefaultDatabase);
  SetInt<StorePoolSizeOption>(opts, "VECRO_DB_POOL_SIZE", 1, kDefaultPoolSize);
  SetSeconds<StoreConnectTimeoutOption>(opts, "VECRO_DB_CONNECT_TIMEOUT",
                                        kDefaultConnectTimeout);
  SetSeconds<RequestTimeoutOption>(opts, "VECRO_REQUEST_TIMEOUT",
                                   kDefaultRequestTimeout);
  SetInt<ServerThreadsOption>(opts, "VECRO_THREADS", 1, DefaultThreadCount());
  SetString<MetricsAddressOption>(opts, "VECRO_METRICS_ADDRESS",
                                  kDefaultMetricsAddress);
  SetString<TraceEndpointOption>(opts, "VECRO_TRACE_ENDPOINT",
                                 kDefaultTraceEndpoint);
  if (!opts.has<TraceSamplingRatioOption>()) {
    opts.set<TraceSamplingRatioOption>(
        ParseRatio("VECRO_TRACE_RATIO", kDefaultTraceRatio));
  }
  if (!opts.has<TraceServiceNameOption>()) {
    auto name = named ? opts.get<ServiceNameOption>() : std::string{};
    opts.set<TraceServiceNameOption>(name.empty() ? kDefaultTraceServiceName
                                                  : std::move(name));
  }
  return opts;
}

workload::WorkloadConfig MakeWorkloadConfig(Options const& opts) {
  workload::WorkloadConfig config;
  config.read_ops = (std::max)(0, opts.get<workload::ReadOpsOption>());
  config.write_ops = (std::max)(0, opts.get<workload::WriteOpsOption>());
  config.value_size = static_cast<std::size_t>(
      (std::max)(0, opts.get<workload::ValueSizeOption>()));
  return config;
}

std::string DescribeWorkloadOptions(Options const& opts) {
  using namespace ::vecro::workload;  // NOLINT(google-build-using-namespace)
  auto const& password = opts.get<StorePasswordOption>();
  return absl::StrCat(
      "name=", opts.get<ServiceNameOption>(),
      ", subsystem=", opts.get<SubsystemOption>(),
      ", listen_address=", opts.get<ListenAddressOption>(),
      ", db_read_ops=", opts.get<ReadOpsOption>(),
      ", db_write_ops=", opts.get<WriteOpsOption>(),
      ", db_value_size=", opts.get<ValueSizeOption>(),
      ", db_user=", opts.get<StoreUserOption>(),
      ", db_password=", password.empty() ? "" : "[censored]",
      ", db_collection=", opts.get<StoreCollectionOption>(),
      ", db_host=", opts.get<StoreHostOption>(),
      ", db_port=", opts.get<StorePortOption>(),
      ", db_name=", opts.get<StoreDatabaseOption>(),
      ", db_pool_size=", opts.get<StorePoolSizeOption>(),
      ", db_connect_timeout=", opts.get<StoreConnectTimeoutOption>().count(),
      "s, request_timeout=", opts.get<RequestTimeoutOption>().count(),
      "s, threads=", opts.get<ServerThreadsOption>(),
      ", metrics_address=", opts.get<MetricsAddressOption>(),
      ", trace_endpoint=", opts.get<TraceEndpointOption>(),
      ", trace_ratio=", opts.get<TraceSamplingRatioOption>(),
      ", trace_service_name=", opts.get<TraceServiceNameOption>());
}

VECRO_INLINE_NAMESPACE_END
}  // namespace workload_internal
}  // namespace vecro
