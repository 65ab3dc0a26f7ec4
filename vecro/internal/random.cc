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

#include "vecro/internal/random.h"
#include <algorithm>
#include <limits>

namespace vecro {
VECRO_INLINE_NAMESPACE_BEGIN
namespace internal {

std::vector<unsigned int> FetchEntropy(std::size_t desired_bits) {
  // Some libstdc++ releases (see gcc bug 94087) exhaust the default random
  // device when many threads create their own. /dev/urandom is not affected.
#if defined(__linux) && defined(__GLIBCXX__) && __GLIBCXX__ >= 20200128 && \
    __GLIBCXX__ < 20200520
  std::random_device rd("/dev/urandom");
#else
  std::random_device rd;
#endif  // __GLIBCXX__ >= 20200128 && __GLIBCXX__ < 20200520

  auto constexpr kWordSize = std::numeric_limits<unsigned int>::digits;
  auto const n = (desired_bits + kWordSize - 1) / kWordSize;
  std::vector<unsigned int> entropy(n);
  std::generate(entropy.begin(), entropy.end(), [&rd]() { return rd(); });
  return entropy;
}

std::string Sample(DefaultPRNG& gen, int n, std::string const& population) {
  std::uniform_int_distribution<std::size_t> rd(0, population.size() - 1);

  std::string result(n, '0');
  std::generate(result.begin(), result.end(),
                [&rd, &gen, &population]() { return population[rd(gen)]; });
  return result;
}

std::string RandomAlphanumeric(DefaultPRNG& gen, std::size_t size) {
  return Sample(gen, static_cast<int>(size),
                "abcdefghijklmnopqrstuvwxyz0123456789");
}

}  // namespace internal
VECRO_INLINE_NAMESPACE_END
}  // namespace vecro
