// Copyright 2017 The Fuchsia Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "algorithms/recovery/subset_source.h"

#include <cstdint>

namespace shamir {
namespace recovery {

CombinationEnumerator::CombinationEnumerator(size_t n, size_t k)
    : n_(n), k_(k) {
  Reset();
}

void CombinationEnumerator::Reset() {
  indices_.resize(k_);
  for (size_t i = 0; i < k_; i++) {
    indices_[i] = i;
  }
  started_ = false;
  done_ = k_ > n_;
}

bool CombinationEnumerator::Advance() {
  // Find the rightmost index that has not reached its maximum. Index i may
  // be at most n - k + i.
  size_t i = k_;
  while (i > 0 && indices_[i - 1] == n_ - k_ + (i - 1)) {
    i--;
  }
  if (i == 0) {
    return false;
  }
  indices_[i - 1]++;
  for (size_t j = i; j < k_; j++) {
    indices_[j] = indices_[j - 1] + 1;
  }
  return true;
}

bool CombinationEnumerator::Next(std::vector<size_t>* subset_out) {
  if (done_) {
    return false;
  }
  if (started_ && !Advance()) {
    done_ = true;
    return false;
  }
  started_ = true;
  *subset_out = indices_;
  return true;
}

size_t CombinationEnumerator::Count(size_t n, size_t k) {
  if (k > n) {
    return 0;
  }
  if (k > n - k) {
    k = n - k;
  }
  // After step i the running value is C(n - k + i, i), always an integer.
  size_t count = 1;
  for (size_t i = 1; i <= k; i++) {
    size_t factor = n - k + i;
    if (count > SIZE_MAX / factor) {
      return SIZE_MAX;
    }
    count = count * factor / i;
  }
  return count;
}

}  // namespace recovery
}  // namespace shamir
