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

#ifndef VECRO_INTERNAL_RANDOM_H
#define VECRO_INTERNAL_RANDOM_H

#include "vecro/version.h"
#include <random>
#include <string>
#include <vector>

namespace vecro {
VECRO_INLINE_NAMESPACE_BEGIN
namespace internal {

/**
 * Retrieve at least @p desired_bits of entropy from `std::random_device`.
 */
std::vector<unsigned int> FetchEntropy(std::size_t desired_bits);

using DefaultPRNG = std::mt19937_64;

inline DefaultPRNG MakeDefaultPRNG() {
  auto const entropy = FetchEntropy(DefaultPRNG::word_size);
  // `std::seed_seq` consumes a reference, we need a named object.
  std::seed_seq seq(entropy.begin(), entropy.end());
  return DefaultPRNG(seq);
}

/**
 * Take @p n samples out of @p population, using the @p gen PRNG.
 *
 * Note that sampling is done with repetition, the same element from the
 * population may appear multiple times.
 */
std::string Sample(DefaultPRNG& gen, int n, std::string const& population);

/// Returns @p size random lowercase letters and digits.
std::string RandomAlphanumeric(DefaultPRNG& gen, std::size_t size);

}  // namespace internal
VECRO_INLINE_NAMESPACE_END
}  // namespace vecro

#endif  // VECRO_INTERNAL_RANDOM_H
