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

#ifndef SHAMIR_ALGORITHMS_RECOVERY_VOTE_TALLY_H_
#define SHAMIR_ALGORITHMS_RECOVERY_VOTE_TALLY_H_

#include <gmpxx.h>

#include <cstdint>
#include <map>
#include <utility>
#include <vector>

namespace shamir {
namespace recovery {

// A VoteTally counts, for each candidate secret, how many subsets produced
// it. It is built by a single reconstruction and owned by it.
//
// Candidates are kept in first-seen order. Every vote is accompanied by the
// ordinal of the subset that cast it (its position in the enumeration) and the
// subset with the smallest ordinal is kept as the candidate's witness. Tallies
// built by separate workers over disjoint ordinals can be combined with
// Merge(), and the result is the same as if a single tally had seen every
// vote in ordinal order.
//
// An instance of VoteTally is not thread-safe.
class VoteTally {
 public:
  struct Candidate {
    Candidate(mpz_class value, std::vector<size_t> witness,
              uint64_t witness_ordinal)
        : value(std::move(value)),
          votes(1),
          witness(std::move(witness)),
          witness_ordinal(witness_ordinal) {}

    // The candidate secret.
    mpz_class value;

    // The number of subsets that produced |value|.
    size_t votes;

    // The indices of the first subset that produced |value|.
    std::vector<size_t> witness;

    // The position of |witness| in the enumeration.
    uint64_t witness_ordinal;
  };

  // Records one vote for |value| cast by |subset| at position |ordinal|.
  void AddVote(const mpz_class& value, const std::vector<size_t>& subset,
               uint64_t ordinal);

  // Adds all of the votes in |other| to this tally.
  void Merge(const VoteTally& other);

  // Returns the candidate with the strictly highest number of votes, ties
  // going to the candidate seen first, or nullptr if the tally is empty. The
  // pointer is invalidated by the next call to AddVote() or Merge().
  const Candidate* Winner() const;

  // The candidates in first-seen order.
  const std::vector<Candidate>& candidates() const { return candidates_; }

  // The total number of votes cast.
  size_t num_votes() const { return num_votes_; }

  bool empty() const { return candidates_.empty(); }

 private:
  std::vector<Candidate> candidates_;

  // A map from candidate values to their position in |candidates_|.
  std::map<mpz_class, size_t> index_;

  size_t num_votes_ = 0;
};

}  // namespace recovery
}  // namespace shamir

#endif  // SHAMIR_ALGORITHMS_RECOVERY_VOTE_TALLY_H_
