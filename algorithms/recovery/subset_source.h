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

#ifndef SHAMIR_ALGORITHMS_RECOVERY_SUBSET_SOURCE_H_
#define SHAMIR_ALGORITHMS_RECOVERY_SUBSET_SOURCE_H_

#include <cstddef>
#include <utility>
#include <vector>

namespace shamir {
namespace recovery {

// A SubsetSource yields a finite sequence of index subsets, one at a time.
// The SecretRecoverer evaluates one interpolation per yielded subset.
class SubsetSource {
 public:
  virtual ~SubsetSource() = default;

  // Writes the next subset to *subset_out and returns true, or returns false
  // if the sequence is exhausted.
  virtual bool Next(std::vector<size_t>* subset_out) = 0;

  // Starts the sequence over from its first subset.
  virtual void Reset() = 0;
};

// Yields every k-element subset of the indices [0, n) as a strictly
// increasing vector, in lexicographic order, beginning with [0, 1, ... k-1].
// Subsets are computed on demand; only the current one is held in memory.
//
// For k == 0 a single empty subset is yielded and for k > n nothing is.
class CombinationEnumerator : public SubsetSource {
 public:
  CombinationEnumerator(size_t n, size_t k);

  bool Next(std::vector<size_t>* subset_out) override;

  void Reset() override;

  // Returns C(n, k), the number of subsets in a full enumeration, or
  // SIZE_MAX if it is too large to compute in a size_t.
  static size_t Count(size_t n, size_t k);

 private:
  // Moves |indices_| to the lexicographically next subset. Returns false if
  // |indices_| already holds the last one.
  bool Advance();

  size_t n_;
  size_t k_;
  std::vector<size_t> indices_;
  bool started_ = false;
  bool done_ = false;
};

// Yields a fixed list of subsets supplied by the caller, in the given order.
class ListSubsetSource : public SubsetSource {
 public:
  explicit ListSubsetSource(std::vector<std::vector<size_t>> subsets)
      : subsets_(std::move(subsets)) {}

  bool Next(std::vector<size_t>* subset_out) override {
    if (next_ >= subsets_.size()) {
      return false;
    }
    *subset_out = subsets_[next_++];
    return true;
  }

  void Reset() override { next_ = 0; }

 private:
  std::vector<std::vector<size_t>> subsets_;
  size_t next_ = 0;
};

}  // namespace recovery
}  // namespace shamir

#endif  // SHAMIR_ALGORITHMS_RECOVERY_SUBSET_SOURCE_H_
