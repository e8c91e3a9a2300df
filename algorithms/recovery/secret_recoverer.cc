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

#include "algorithms/recovery/secret_recoverer.h"

#include <glog/logging.h>

#include <map>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

namespace shamir {
namespace recovery {

namespace {
// Produces a string used in log and error messages to describe the x values
// of the points selected by |subset|.
std::string DescribeSubset(const std::vector<Point>& points,
                           const std::vector<size_t>& subset) {
  std::ostringstream stream;
  stream << "x={";
  for (size_t i = 0; i < subset.size(); i++) {
    if (i > 0) {
      stream << ", ";
    }
    stream << points[subset[i]].x;
  }
  stream << "}";
  return stream.str();
}

}  // namespace

SecretRecoverer::SecretRecoverer(size_t threshold, RecoveryOptions options)
    : threshold_(threshold), options_(options) {
  CHECK_GT(options_.num_workers, 0u);
}

Status SecretRecoverer::Recover(const std::vector<Point>& points,
                                RecoveryResult* result_out) const {
  if (points.size() > threshold_) {
    return RecoverByVoting(points, result_out);
  }
  return RecoverDirect(points, result_out);
}

Status SecretRecoverer::RecoverDirect(const std::vector<Point>& points,
                                      RecoveryResult* result_out) const {
  if (points.size() != threshold_) {
    std::ostringstream stream;
    stream << "expected " << threshold_ << " points but got "
           << points.size();
    result_out->error_details = stream.str();
    LOG(ERROR) << "Direct recovery failed: " << result_out->error_details;
    return kWrongSubsetSize;
  }
  std::vector<size_t> subset(threshold_);
  for (size_t i = 0; i < threshold_; i++) {
    subset[i] = i;
  }
  return RecoverFromSubset(points, std::move(subset), result_out);
}

Status SecretRecoverer::RecoverFromKeys(const std::vector<Point>& points,
                                        const std::vector<mpz_class>& x_keys,
                                        RecoveryResult* result_out) const {
  std::set<mpz_class> distinct_keys(x_keys.begin(), x_keys.end());
  if (x_keys.size() != threshold_ || distinct_keys.size() != threshold_) {
    std::ostringstream stream;
    stream << "expected " << threshold_ << " distinct keys but got "
           << distinct_keys.size() << " distinct of " << x_keys.size();
    result_out->error_details = stream.str();
    LOG(ERROR) << "Recovery from picked keys failed: "
               << result_out->error_details;
    return kWrongSubsetSize;
  }

  // A map from x values to positions in |points|.
  std::map<mpz_class, size_t> positions;
  for (size_t i = 0; i < points.size(); i++) {
    positions.emplace(points[i].x, i);
  }

  std::vector<size_t> subset;
  subset.reserve(threshold_);
  for (const mpz_class& key : x_keys) {
    auto iter = positions.find(key);
    if (iter == positions.end()) {
      result_out->error_details = "no point has x=" + key.get_str();
      LOG(ERROR) << "Recovery from picked keys failed: "
                 << result_out->error_details;
      return kUnknownKey;
    }
    subset.push_back(iter->second);
  }
  return RecoverFromSubset(points, std::move(subset), result_out);
}

Status SecretRecoverer::RecoverFromSubset(const std::vector<Point>& points,
                                          std::vector<size_t> subset,
                                          RecoveryResult* result_out) const {
  mpz_class secret;
  Status status = InterpolateSubset(points, subset, &secret);
  if (status != kOK) {
    result_out->error_details = "interpolation of " +
                                DescribeSubset(points, subset) +
                                " failed with " + StatusName(status);
    LOG(ERROR) << "Direct recovery failed: " << result_out->error_details;
    return status;
  }
  result_out->secret = std::move(secret);
  result_out->witness = std::move(subset);
  result_out->votes = 1;
  result_out->candidates.clear();
  result_out->subsets_evaluated = 1;
  result_out->subsets_discarded = 0;
  result_out->error_details.clear();
  return kOK;
}

Status SecretRecoverer::RecoverByVoting(const std::vector<Point>& points,
                                        RecoveryResult* result_out) const {
  size_t n = points.size();
  if (n < threshold_) {
    std::ostringstream stream;
    stream << "voting needs at least " << threshold_ << " points but got "
           << n;
    result_out->error_details = stream.str();
    LOG(ERROR) << "Voting recovery failed: " << result_out->error_details;
    return kWrongSubsetSize;
  }
  VLOG(1) << "Voting over " << CombinationEnumerator::Count(n, threshold_)
          << " subsets of size " << threshold_ << " using "
          << InterpolationMethodName(options_.method) << " interpolation and "
          << options_.num_workers << " worker(s).";

  VoteTally tally;
  size_t num_evaluated = 0;
  size_t num_discarded = 0;
  if (options_.num_workers == 1) {
    CombinationEnumerator enumerator(n, threshold_);
    num_discarded =
        TallyShard(points, &enumerator, 0, 1, &num_evaluated, &tally);
  } else {
    size_t num_workers = options_.num_workers;
    std::vector<VoteTally> worker_tallies(num_workers);
    std::vector<size_t> worker_evaluated(num_workers, 0);
    std::vector<size_t> worker_discarded(num_workers, 0);
    std::vector<std::thread> workers;
    workers.reserve(num_workers);
    for (size_t w = 0; w < num_workers; w++) {
      workers.emplace_back([this, &points, &worker_tallies, &worker_evaluated,
                            &worker_discarded, n, w, num_workers]() {
        CombinationEnumerator enumerator(n, threshold_);
        worker_discarded[w] =
            TallyShard(points, &enumerator, w, num_workers,
                       &worker_evaluated[w], &worker_tallies[w]);
      });
    }
    for (std::thread& worker : workers) {
      worker.join();
    }
    for (size_t w = 0; w < num_workers; w++) {
      tally.Merge(worker_tallies[w]);
      num_evaluated += worker_evaluated[w];
      num_discarded += worker_discarded[w];
    }
  }

  result_out->subsets_evaluated = num_evaluated;
  result_out->subsets_discarded = num_discarded;
  return SelectWinner(tally, result_out);
}

size_t SecretRecoverer::TallySubsets(const std::vector<Point>& points,
                                     SubsetSource* source,
                                     VoteTally* tally) const {
  size_t num_evaluated = 0;
  return TallyShard(points, source, 0, 1, &num_evaluated, tally);
}

size_t SecretRecoverer::TallyShard(const std::vector<Point>& points,
                                   SubsetSource* source, size_t shard,
                                   size_t num_shards, size_t* num_evaluated,
                                   VoteTally* tally) const {
  size_t num_discarded = 0;
  std::vector<size_t> subset;
  for (uint64_t ordinal = 0; source->Next(&subset); ordinal++) {
    if (ordinal % num_shards != shard) {
      continue;
    }
    (*num_evaluated)++;
    mpz_class secret;
    Status status = InterpolateSubset(points, subset, &secret);
    if (status != kOK) {
      VLOG(3) << "Discarding subset " << DescribeSubset(points, subset)
              << ": " << StatusName(status);
      num_discarded++;
      continue;
    }
    VLOG(4) << "Subset " << DescribeSubset(points, subset) << " votes for "
            << secret;
    tally->AddVote(secret, subset, ordinal);
  }
  return num_discarded;
}

Status SecretRecoverer::SelectWinner(const VoteTally& tally,
                                     RecoveryResult* result_out) const {
  const VoteTally::Candidate* winner = tally.Winner();
  if (winner == nullptr) {
    std::ostringstream stream;
    stream << "none of the " << result_out->subsets_evaluated
           << " subsets of size " << threshold_
           << " interpolated to an integer";
    result_out->error_details = stream.str();
    LOG(ERROR) << "Voting recovery failed: " << result_out->error_details;
    return kNoConsistentSubset;
  }
  VLOG(1) << "Secret " << winner->value << " won with " << winner->votes
          << " of " << tally.num_votes() << " votes among "
          << tally.candidates().size() << " candidate(s).";
  result_out->secret = winner->value;
  result_out->witness = winner->witness;
  result_out->votes = winner->votes;
  result_out->candidates = tally.candidates();
  result_out->error_details.clear();
  return kOK;
}

Status SecretRecoverer::InterpolateSubset(const std::vector<Point>& points,
                                          const std::vector<size_t>& subset,
                                          mpz_class* secret_out) const {
  CHECK_EQ(subset.size(), threshold_);
  std::vector<const Point*> selected(subset.size());
  for (size_t i = 0; i < subset.size(); i++) {
    CHECK_LT(subset[i], points.size());
    selected[i] = &points[subset[i]];
  }
  return InterpolateSecret(options_.method, selected, secret_out);
}

}  // namespace recovery
}  // namespace shamir
