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

#ifndef SHAMIR_ALGORITHMS_RECOVERY_SECRET_RECOVERER_H_
#define SHAMIR_ALGORITHMS_RECOVERY_SECRET_RECOVERER_H_

#include <gmpxx.h>

#include <cstdint>
#include <string>
#include <vector>

#include "algorithms/recovery/point.h"
#include "algorithms/recovery/polynomial_computations.h"
#include "algorithms/recovery/recovery_status.h"
#include "algorithms/recovery/subset_source.h"
#include "algorithms/recovery/vote_tally.h"

namespace shamir {
namespace recovery {

struct RecoveryOptions {
  // The interpolation used for every subset.
  InterpolationMethod method = kLagrange;

  // The number of threads that evaluate subsets in voting mode. Each thread
  // keeps a private VoteTally and the tallies are merged when all of them are
  // done, so the result does not depend on this value.
  size_t num_workers = 1;
};

// The outcome of a reconstruction.
struct RecoveryResult {
  // The recovered secret.
  mpz_class secret;

  // Indices into the caller's points of the subset that produced |secret|.
  // In voting mode this is the first subset, in enumeration order, to do so.
  std::vector<size_t> witness;

  // The number of subsets that produced |secret|. Always 1 in direct mode.
  size_t votes = 0;

  // Voting mode only: every candidate secret with its vote count, in the
  // order in which the candidates were first seen.
  std::vector<VoteTally::Candidate> candidates;

  // Voting mode only: the number of subsets evaluated, and the number of
  // those that cast no vote because their interpolation failed.
  size_t subsets_evaluated = 0;
  size_t subsets_discarded = 0;

  // When the reconstruction fails, a description of the failure that names
  // the offending key or the expected and actual sizes.
  std::string error_details;
};

// Recovers the secret shared among a set of points with a given threshold k:
// the constant term of a polynomial of degree k - 1 through k of the points.
//
// In direct mode exactly k points are used, either all of the points or a
// subset chosen by the caller by x value, and any failure to interpolate them
// is reported to the caller.
//
// In voting mode every k-subset of the points is interpolated. Subsets whose
// interpolation fails, or is not an integer, are discarded. Every other subset
// votes for the integer it produced, and the value with the most votes wins.
// A small number of corrupted points can not outvote the C(n - e, k) subsets
// made only of genuine points, all of which agree on the true secret.
//
// An instance of SecretRecoverer keeps no state between calls.
class SecretRecoverer {
 public:
  SecretRecoverer(size_t threshold, RecoveryOptions options);

  // Uses direct mode if |points| has exactly |threshold| elements and voting
  // mode if it has more. Returns kWrongSubsetSize if it has fewer.
  Status Recover(const std::vector<Point>& points,
                 RecoveryResult* result_out) const;

  // Interpolates all of |points|, which must have exactly |threshold|
  // elements; otherwise returns kWrongSubsetSize. Returns kDivisionByZero,
  // kSingularSystem or kNonIntegerResult if the interpolation fails.
  Status RecoverDirect(const std::vector<Point>& points,
                       RecoveryResult* result_out) const;

  // Interpolates the points whose x values are listed in |x_keys|. Before
  // doing any arithmetic, returns kWrongSubsetSize if |x_keys| does not hold
  // exactly |threshold| distinct values and kUnknownKey if one of them is not
  // the x value of any point.
  Status RecoverFromKeys(const std::vector<Point>& points,
                         const std::vector<mpz_class>& x_keys,
                         RecoveryResult* result_out) const;

  // Runs voting mode over every |threshold|-subset of |points|. Returns
  // kWrongSubsetSize if there are fewer than |threshold| points and
  // kNoConsistentSubset if no subset produced an integer.
  Status RecoverByVoting(const std::vector<Point>& points,
                         RecoveryResult* result_out) const;

  // Interpolates each subset yielded by |source| and adds a vote to |tally|
  // for each one that produces an integer. The ordinal of a vote is the
  // position of its subset in |source|. Returns the number of subsets that
  // were discarded.
  //
  // REQUIRES: every subset has |threshold| indices into |points|.
  size_t TallySubsets(const std::vector<Point>& points, SubsetSource* source,
                      VoteTally* tally) const;

  // Fills in the winner of |tally| in *result_out. Returns
  // kNoConsistentSubset if |tally| is empty.
  Status SelectWinner(const VoteTally& tally,
                      RecoveryResult* result_out) const;

  size_t threshold() const { return threshold_; }

 private:
  // Like TallySubsets() but only evaluates the subsets whose ordinal is
  // congruent to |shard| modulo |num_shards|.
  size_t TallyShard(const std::vector<Point>& points, SubsetSource* source,
                    size_t shard, size_t num_shards, size_t* num_evaluated,
                    VoteTally* tally) const;

  // Interpolates the points of |points| selected by |subset|.
  Status InterpolateSubset(const std::vector<Point>& points,
                           const std::vector<size_t>& subset,
                           mpz_class* secret_out) const;

  // Shared by RecoverDirect() and RecoverFromKeys().
  Status RecoverFromSubset(const std::vector<Point>& points,
                           std::vector<size_t> subset,
                           RecoveryResult* result_out) const;

  size_t threshold_;
  RecoveryOptions options_;
};

}  // namespace recovery
}  // namespace shamir

#endif  // SHAMIR_ALGORITHMS_RECOVERY_SECRET_RECOVERER_H_
