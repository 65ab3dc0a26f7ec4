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

#ifndef VECRO_WORKLOAD_CALL_CONTEXT_H
#define VECRO_WORKLOAD_CALL_CONTEXT_H

#include "vecro/status.h"
#include "vecro/version.h"
#include "absl/types/optional.h"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <unordered_map>

namespace vecro {
namespace workload {
VECRO_INLINE_NAMESPACE_BEGIN

/**
 * The state of a single inbound call.
 *
 * The transport creates one `CallContext` per inbound call and passes it
 * through every layer, down to the `StoreGateway`. It carries the inbound
 * headers (used to extract a propagated trace context), the call deadline,
 * and a cancellation flag.
 *
 * Copies share the cancellation flag, cancelling any copy cancels them all.
 */
class CallContext {
 public:
  using Clock = std::chrono::steady_clock;
  using Headers = std::unordered_map<std::string, std::string>;

  CallContext() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

  /// Header names are case-insensitive, a repeated header replaces the value.
  CallContext& AddHeader(std::string name, std::string value);

  /// Returns the value of @p name, if present.
  absl::optional<std::string> GetHeader(std::string name) const;

  /// The headers, with lowercase names.
  Headers const& headers() const { return headers_; }

  CallContext& set_deadline(Clock::time_point deadline) {
    deadline_ = deadline;
    return *this;
  }
  absl::optional<Clock::time_point> deadline() const { return deadline_; }

  /// The time left until the deadline, zero if expired, unset without one.
  absl::optional<std::chrono::milliseconds> remaining() const;

  void Cancel() { cancelled_->store(true); }
  bool cancelled() const { return cancelled_->load(); }

  /**
   * Returns an error if the call should not continue.
   *
   * The result is `kCancelled` after `Cancel()`, `kDeadlineExceeded` once
   * the deadline has passed, and OK otherwise.
   */
  Status CheckActive() const;

 private:
  Headers headers_;
  absl::optional<Clock::time_point> deadline_;
  std::shared_ptr<std::atomic<bool>> cancelled_;
};

VECRO_INLINE_NAMESPACE_END
}  // namespace workload
}  // namespace vecro

#endif  // VECRO_WORKLOAD_CALL_CONTEXT_H
