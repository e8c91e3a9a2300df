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

#include "algorithms/recovery/vote_tally.h"

#include <algorithm>

namespace shamir {
namespace recovery {

void VoteTally::AddVote(const mpz_class& value,
                        const std::vector<size_t>& subset, uint64_t ordinal) {
  num_votes_++;
  auto iter = index_.find(value);
  if (iter == index_.end()) {
    index_.emplace(value, candidates_.size());
    candidates_.emplace_back(value, subset, ordinal);
    return;
  }
  Candidate& candidate = candidates_[iter->second];
  candidate.votes++;
  if (ordinal < candidate.witness_ordinal) {
    candidate.witness = subset;
    candidate.witness_ordinal = ordinal;
  }
}

void VoteTally::Merge(const VoteTally& other) {
  for (const Candidate& theirs : other.candidates_) {
    auto iter = index_.find(theirs.value);
    if (iter == index_.end()) {
      index_.emplace(theirs.value, candidates_.size());
      candidates_.push_back(theirs);
      continue;
    }
    Candidate& ours = candidates_[iter->second];
    ours.votes += theirs.votes;
    if (theirs.witness_ordinal < ours.witness_ordinal) {
      ours.witness = theirs.witness;
      ours.witness_ordinal = theirs.witness_ordinal;
    }
  }
  num_votes_ += other.num_votes_;

  // Restore first-seen order, which after a merge is witness order.
  std::stable_sort(candidates_.begin(), candidates_.end(),
                   [](const Candidate& a, const Candidate& b) {
                     return a.witness_ordinal < b.witness_ordinal;
                   });
  for (size_t i = 0; i < candidates_.size(); i++) {
    index_[candidates_[i].value] = i;
  }
}

const VoteTally::Candidate* VoteTally::Winner() const {
  const Candidate* best = nullptr;
  for (const Candidate& candidate : candidates_) {
    if (best == nullptr || candidate.votes > best->votes) {
      best = &candidate;
    }
  }
  return best;
}

}  // namespace recovery
}  // namespace shamir
