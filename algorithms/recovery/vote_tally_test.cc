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

#include <gtest/gtest.h>

#include <vector>

namespace shamir {
namespace recovery {

TEST(VoteTallyTest, Empty) {
  VoteTally tally;
  EXPECT_TRUE(tally.empty());
  EXPECT_EQ(nullptr, tally.Winner());
  EXPECT_EQ(0u, tally.num_votes());
}

TEST(VoteTallyTest, CountsAndWitnesses) {
  VoteTally tally;
  tally.AddVote(7, {0, 1}, 0);
  tally.AddVote(9, {0, 2}, 1);
  tally.AddVote(7, {1, 2}, 2);
  tally.AddVote(7, {1, 3}, 3);

  EXPECT_EQ(4u, tally.num_votes());
  ASSERT_EQ(2u, tally.candidates().size());

  const VoteTally::Candidate& seven = tally.candidates()[0];
  EXPECT_EQ(7, seven.value);
  EXPECT_EQ(3u, seven.votes);
  EXPECT_EQ(std::vector<size_t>({0, 1}), seven.witness);
  EXPECT_EQ(0u, seven.witness_ordinal);

  const VoteTally::Candidate& nine = tally.candidates()[1];
  EXPECT_EQ(9, nine.value);
  EXPECT_EQ(1u, nine.votes);
  EXPECT_EQ(std::vector<size_t>({0, 2}), nine.witness);

  ASSERT_NE(nullptr, tally.Winner());
  EXPECT_EQ(7, tally.Winner()->value);
}

// A tie goes to the candidate that was seen first.
TEST(VoteTallyTest, TieGoesToFirstSeen) {
  VoteTally tally;
  tally.AddVote(mpz_class("-100000000000000000000"), {0, 1}, 0);
  tally.AddVote(3, {0, 2}, 1);
  tally.AddVote(3, {0, 3}, 2);
  tally.AddVote(mpz_class("-100000000000000000000"), {1, 2}, 3);

  ASSERT_NE(nullptr, tally.Winner());
  EXPECT_EQ(mpz_class("-100000000000000000000"), tally.Winner()->value);
  EXPECT_EQ(2u, tally.Winner()->votes);

  tally.AddVote(3, {2, 3}, 4);
  EXPECT_EQ(3, tally.Winner()->value);
}

// Merging tallies built over interleaved ordinals gives the same candidates,
// counts, order and witnesses as one tally that saw every vote.
TEST(VoteTallyTest, Merge) {
  struct Vote {
    long value;
    std::vector<size_t> subset;
  };
  std::vector<Vote> votes = {
      {5, {0, 1}}, {8, {0, 2}}, {5, {0, 3}}, {2, {1, 2}},
      {8, {1, 3}}, {5, {2, 3}}, {2, {2, 4}}, {9, {3, 4}},
  };

  VoteTally single;
  std::vector<VoteTally> shards(3);
  for (size_t ordinal = 0; ordinal < votes.size(); ordinal++) {
    single.AddVote(votes[ordinal].value, votes[ordinal].subset, ordinal);
    shards[ordinal % 3].AddVote(votes[ordinal].value, votes[ordinal].subset,
                                ordinal);
  }

  // Merge the shards in reverse order for good measure.
  VoteTally merged;
  for (size_t i = shards.size(); i-- > 0;) {
    merged.Merge(shards[i]);
  }

  EXPECT_EQ(single.num_votes(), merged.num_votes());
  ASSERT_EQ(single.candidates().size(), merged.candidates().size());
  for (size_t i = 0; i < single.candidates().size(); i++) {
    const auto& expected = single.candidates()[i];
    const auto& actual = merged.candidates()[i];
    EXPECT_EQ(expected.value, actual.value);
    EXPECT_EQ(expected.votes, actual.votes);
    EXPECT_EQ(expected.witness, actual.witness);
    EXPECT_EQ(expected.witness_ordinal, actual.witness_ordinal);
  }
  EXPECT_EQ(5, merged.Winner()->value);

  // The merged tally keeps counting correctly.
  merged.AddVote(9, {0, 4}, 8);
  merged.AddVote(9, {1, 4}, 9);
  merged.AddVote(9, {2, 3}, 10);
  EXPECT_EQ(4u, merged.candidates()[3].votes);
  EXPECT_EQ(9, merged.Winner()->value);
}

}  // namespace recovery
}  // namespace shamir
