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

#ifndef VECRO_INTERNAL_LOG_IMPL_H
#define VECRO_INTERNAL_LOG_IMPL_H

#include "vecro/log.h"
#include "vecro/version.h"
#include <mutex>

namespace vecro {
VECRO_INLINE_NAMESPACE_BEGIN
namespace internal {

/// Writes records at or above a minimum severity to `std::clog`.
class StdClogBackend : public LogBackend {
 public:
  explicit StdClogBackend(Severity min_severity)
      : min_severity_(min_severity) {}

  void Process(LogRecord const& lr) override;
  void ProcessWithOwnership(LogRecord lr) override { Process(lr); }
  void Flush() override;

  Severity min_severity() const { return min_severity_; }

 private:
  std::mutex mu_;
  Severity min_severity_;
};

}  // namespace internal
VECRO_INLINE_NAMESPACE_END
}  // namespace vecro

#endif  // VECRO_INTERNAL_LOG_IMPL_H
