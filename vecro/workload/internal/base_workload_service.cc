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

#include "vecro/workload/internal/base_workload_service.h"
#include "vecro/internal/make_status.h"
#include "absl/strings/str_cat.h"

namespace vecro {
namespace workload_internal {
VECRO_INLINE_NAMESPACE_BEGIN
namespace {

// Cancellation and deadline errors are propagated unchanged, anything else
// becomes a store-operation error.
Status StoreOperationError(Status const& status, char const* operation,
                           int index) {
  if (status.code() == StatusCode::kCancelled ||
      status.code() == StatusCode::kDeadlineExceeded) {
    return status;
  }
  return internal::UnavailableError(
      absl::StrCat("store ", operation, " #", index,
                   " failed: ", status.message()),
      VECRO_ERROR_INFO()
          .WithReason("STORE_OPERATION_FAILED")
          .WithMetadata("operation", operation)
          .WithMetadata("index", std::to_string(index))
          .WithMetadata("store_code", StatusCodeToString(status.code())));
}

}  // namespace

BaseWorkloadService::BaseWorkloadService(
    std::shared_ptr<workload::StoreGateway> gateway,
    workload::WorkloadConfig config, internal::DefaultPRNG generator)
    : gateway_(std::move(gateway)),
      config_(std::move(config)),
      generator_(std::move(generator)) {}

StatusOr<workload::WorkloadResponse> BaseWorkloadService::Execute(
    workload::CallContext& context, workload::WorkloadRequest const&) {
  workload::WorkloadResponse response;
  int index = 0;
  for (int i = 0; i < config_.read_ops; ++i) {
    ++index;
    auto bytes = gateway_->ReadOne(context, RandomKey());
    if (!bytes) return StoreOperationError(bytes.status(), "read", index);
    response.bytes += *bytes;
    ++response.reads;
  }
  for (int i = 0; i < config_.write_ops; ++i) {
    ++index;
    auto bytes = gateway_->WriteOne(context, RandomItem());
    if (!bytes) return StoreOperationError(bytes.status(), "write", index);
    response.bytes += *bytes;
    ++response.writes;
  }
  response.ok = true;
  return response;
}

std::string BaseWorkloadService::RandomKey() {
  std::lock_guard<std::mutex> lk(mu_);
  return internal::RandomAlphanumeric(generator_, kWorkloadKeySize);
}

workload::StoreItem BaseWorkloadService::RandomItem() {
  std::lock_guard<std::mutex> lk(mu_);
  workload::StoreItem item;
  item.key = internal::RandomAlphanumeric(generator_, kWorkloadKeySize);
  item.value = internal::RandomAlphanumeric(generator_, config_.value_size);
  return item;
}

VECRO_INLINE_NAMESPACE_END
}  // namespace workload_internal
}  // namespace vecro
