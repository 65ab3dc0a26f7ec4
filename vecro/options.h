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

#ifndef VECRO_OPTIONS_H
#define VECRO_OPTIONS_H

#include "vecro/version.h"
#include "absl/memory/memory.h"
#include <typeindex>
#include <typeinfo>
#include <unordered_map>

namespace vecro {
VECRO_INLINE_NAMESPACE_BEGIN

class Options;
namespace internal {
Options MergeOptions(Options, Options);
template <typename T>
inline T const& DefaultValue() {
  static auto const* const kDefaultValue = new T{};
  return *kDefaultValue;
}
}  // namespace internal

/**
 * A class that holds option structs indexed by their type.
 *
 * An "Option" is any struct that has a public `Type` member typedef. By
 * convention these structs are named like "FooOption". The service
 * configuration is held in a single `Options` instance, populated from the
 * environment at startup.
 *
 * @par Example:
 *
 * @code
 * struct ReadOpsOption {
 *   using Type = int;
 * };
 * auto opts = Options{}.set<ReadOpsOption>(3);
 * assert(opts.get<ReadOpsOption>() == 3);
 * @endcode
 */
class Options {
 private:
  template <typename T>
  using ValueTypeT = typename T::Type;

 public:
  /// Constructs an empty instance.
  Options() = default;

  Options(Options const& rhs) {
    for (auto const& kv : rhs.m_) m_.emplace(kv.first, kv.second->clone());
  }
  Options& operator=(Options const& rhs) {
    Options tmp(rhs);
    std::swap(m_, tmp.m_);
    return *this;
  }
  Options(Options&&) = default;
  Options& operator=(Options&&) = default;

  /// Sets option `T` to the value @p v and returns a reference to `*this`.
  template <typename T>
  Options& set(ValueTypeT<T> v) {
    m_[typeid(T)] = absl::make_unique<Data<T>>(std::move(v));
    return *this;
  }

  /// Returns true IFF an option with type `T` exists.
  template <typename T>
  bool has() const {
    return m_.find(typeid(T)) != m_.end();
  }

  /// Erases the option specified by the type `T`.
  template <typename T>
  void unset() {
    m_.erase(typeid(T));
  }

  /**
   * Returns a reference to the value for `T`, or a value-initialized default
   * if `T` was not set.
   *
   * Use `has<T>()` to check whether or not the option has been set.
   */
  template <typename T>
  ValueTypeT<T> const& get() const {
    auto const it = m_.find(typeid(T));
    if (it == m_.end()) return internal::DefaultValue<ValueTypeT<T>>();
    auto const* value = it->second->data_address();
    return *reinterpret_cast<ValueTypeT<T> const*>(value);
  }

  /**
   * Returns a reference to the value for option `T`, setting the value to
   * @p value if necessary.
   */
  template <typename T>
  ValueTypeT<T>& lookup(ValueTypeT<T> value = {}) {
    auto p = m_.find(typeid(T));
    if (p == m_.end()) {
      p = m_.emplace(typeid(T), absl::make_unique<Data<T>>(std::move(value)))
              .first;
    }
    auto* v = p->second->data_address();
    return *reinterpret_cast<ValueTypeT<T>*>(v);
  }

 private:
  friend Options internal::MergeOptions(Options, Options);

  // The data holder for all the option values.
  class DataHolder {
   public:
    virtual ~DataHolder() = default;
    virtual void const* data_address() const = 0;
    virtual void* data_address() = 0;
    virtual std::unique_ptr<DataHolder> clone() const = 0;
  };

  // The data holder implementation for T.
  template <typename T>
  class Data : public DataHolder {
   public:
    explicit Data(ValueTypeT<T> v) : value_(std::move(v)) {}
    ~Data() override = default;

    void const* data_address() const override { return &value_; }
    void* data_address() override { return &value_; }
    std::unique_ptr<DataHolder> clone() const override {
      return absl::make_unique<Data<T>>(*this);
    }

   private:
    ValueTypeT<T> value_;
  };

  std::unordered_map<std::type_index, std::unique_ptr<DataHolder>> m_;
};

namespace internal {

/**
 * Moves the options from @p alternatives into @p preferred and returns the
 * result. If an option already exists in @p preferred its value will not be
 * replaced by the one in @p alternatives.
 */
Options MergeOptions(Options preferred, Options alternatives);

}  // namespace internal
VECRO_INLINE_NAMESPACE_END
}  // namespace vecro

#endif  // VECRO_OPTIONS_H
