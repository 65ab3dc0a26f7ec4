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

#ifndef VECRO_TESTING_UTIL_MOCK_INSTRUMENTS_H
#define VECRO_TESTING_UTIL_MOCK_INSTRUMENTS_H

#include "vecro/version.h"
#include <gmock/gmock.h>
#include <opentelemetry/common/key_value_iterable.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/metrics/sync_instruments.h>
#include <opentelemetry/nostd/shared_ptr.h>
#include <memory>
#include <string>
#include <unordered_map>

namespace vecro {
VECRO_INLINE_NAMESPACE_BEGIN
namespace testing_util {

template <typename T>
class MockHistogram : public opentelemetry::metrics::Histogram<T> {
 public:
#if OPENTELEMETRY_ABI_VERSION_NO >= 2
  MOCK_METHOD(void, Record,  // NOLINT(bugprone-exception-escape)
              (T value), (noexcept, override));
  MOCK_METHOD(void, Record,  // NOLINT(bugprone-exception-escape)
              (T, opentelemetry::common::KeyValueIterable const&),
              (noexcept, override));
#endif
  MOCK_METHOD(void, Record,  // NOLINT(bugprone-exception-escape)
              (T value, opentelemetry::context::Context const& context),
              (noexcept, override));
  MOCK_METHOD(void, Record,  // NOLINT(bugprone-exception-escape)
              (T value,
               opentelemetry::common::KeyValueIterable const& attributes,
               opentelemetry::context::Context const& context),
              (noexcept, override));
};

template <typename T>
class MockCounter : public opentelemetry::metrics::Counter<T> {
 public:
  MOCK_METHOD(void, Add,  // NOLINT(bugprone-exception-escape)
              (T value), (noexcept, override));
  MOCK_METHOD(void, Add,  // NOLINT(bugprone-exception-escape)
              (T value, opentelemetry::context::Context const&),
              (noexcept, override));
  MOCK_METHOD(void, Add,  // NOLINT(bugprone-exception-escape)
              (T value, opentelemetry::common::KeyValueIterable const&),
              (noexcept, override));
  MOCK_METHOD(void, Add,  // NOLINT(bugprone-exception-escape)
              (T value, opentelemetry::common::KeyValueIterable const&,
               opentelemetry::context::Context const&),
              (noexcept, override));
};

/// Returns the string-valued attributes of a measurement.
/// Converts a mock to the smart pointer type used to hold instruments.
template <typename Instrument, typename Mock>
opentelemetry::nostd::shared_ptr<Instrument> AsInstrument(
    std::shared_ptr<Mock> mock) {
  return opentelemetry::nostd::shared_ptr<Instrument>(
      std::shared_ptr<Instrument>(std::move(mock)));
}

inline std::unordered_map<std::string, std::string> MakeAttributesMap(
    opentelemetry::common::KeyValueIterable const& attributes) {
  std::unordered_map<std::string, std::string> m;
  attributes.ForEachKeyValue([&](opentelemetry::nostd::string_view k,
                                 opentelemetry::common::AttributeValue v) {
    if (opentelemetry::nostd::holds_alternative<
            opentelemetry::nostd::string_view>(v)) {
      m.emplace(
          std::string{k},
          opentelemetry::nostd::get<opentelemetry::nostd::string_view>(v));
    }
    return true;
  });
  return m;
}

}  // namespace testing_util
VECRO_INLINE_NAMESPACE_END
}  // namespace vecro

#endif  // VECRO_TESTING_UTIL_MOCK_INSTRUMENTS_H
