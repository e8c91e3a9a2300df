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

#include "decoding/share_file_parser.h"

#include <gtest/gtest.h>

#include <fstream>
#include <string>
#include <vector>

namespace shamir {
namespace decoding {

using recovery::Point;

namespace {
const char kSampleJson[] = R"({
  "keys": { "n": 4, "k": 3 },
  "1": { "base": "10", "value": "4" },
  "2": { "base": "2", "value": "111" },
  "3": { "base": "10", "value": "12" },
  "6": { "base": "4", "value": "213" }
})";

const char kSampleText[] = R"(
n: 4
k: 3
share { x: "6" base: 4 value: "213" }
share { x: "1" base: 10 value: "4" }
share { x: "3" base: 10 value: "12" }
share { x: "2" base: 2 value: "111" }
)";

// Adds a share to |share_set|.
void AddShare(ShareSet* share_set, const std::string& x, uint32_t base,
              const std::string& value) {
  Share* share = share_set->add_share();
  share->set_x(x);
  share->set_base(base);
  share->set_value(value);
}

// Checks that |points| are the decoded shares of the samples above.
void ExpectSamplePoints(const std::vector<Point>& points) {
  ASSERT_EQ(4u, points.size());
  EXPECT_EQ(Point(1, 4), points[0]);
  EXPECT_EQ(Point(2, 7), points[1]);
  EXPECT_EQ(Point(3, 12), points[2]);
  EXPECT_EQ(Point(6, 39), points[3]);
}
}  // namespace

TEST(ShareFileParserTest, ParseJson) {
  ShareSet share_set;
  ASSERT_TRUE(ParseShareSetFromJson(kSampleJson, &share_set).ok());
  EXPECT_EQ(4u, share_set.n());
  EXPECT_EQ(3u, share_set.k());
  ASSERT_EQ(4, share_set.share_size());

  size_t threshold;
  std::vector<Point> points;
  ASSERT_TRUE(DecodeShares(share_set, &threshold, &points).ok());
  EXPECT_EQ(3u, threshold);
  ExpectSamplePoints(points);
}

TEST(ShareFileParserTest, ParseJsonSkipsNonShares) {
  ShareSet share_set;
  ASSERT_TRUE(ParseShareSetFromJson(R"({
      "keys": { "n": 2, "k": 1 },
      "comment": "not a share",
      "7": { "base": 16 },
      "1": { "base": "10", "value": "4" },
      "2": { "base": "10", "value": "5" }
  })",
                                    &share_set)
                  .ok());
  ASSERT_EQ(2, share_set.share_size());
  EXPECT_EQ("1", share_set.share(0).x());
  EXPECT_EQ("2", share_set.share(1).x());
}

TEST(ShareFileParserTest, ParseJsonErrors) {
  ShareSet share_set;
  EXPECT_EQ(util::StatusCode::INVALID_ARGUMENT,
            ParseShareSetFromJson("{ not json", &share_set).error_code());
  EXPECT_EQ(util::StatusCode::INVALID_ARGUMENT,
            ParseShareSetFromJson(R"({ "1": { "base": "10", "value": "4" } })",
                                  &share_set)
                .error_code());
  EXPECT_FALSE(
      ParseShareSetFromJson(R"({ "keys": { "n": "4", "k": 3 } })", &share_set)
          .ok());
  EXPECT_FALSE(
      ParseShareSetFromJson(R"({ "keys": { "n": 4, "k": 2.5 } })", &share_set)
          .ok());
  EXPECT_FALSE(ParseShareSetFromJson(
                   R"({ "keys": { "n": 1, "k": 1 },
                        "1": { "base": "ten", "value": "4" } })",
                   &share_set)
                   .ok());
}

TEST(ShareFileParserTest, ParseText) {
  ShareSet share_set;
  ASSERT_TRUE(ParseShareSetFromText(kSampleText, &share_set).ok());
  EXPECT_EQ(3u, share_set.k());

  size_t threshold;
  std::vector<Point> points;
  ASSERT_TRUE(DecodeShares(share_set, &threshold, &points).ok());
  EXPECT_EQ(3u, threshold);
  // The shares come out sorted by x.
  ExpectSamplePoints(points);
}

TEST(ShareFileParserTest, ParseTextError) {
  ShareSet share_set;
  util::Status status =
      ParseShareSetFromText("n: 4\nk: three\n", &share_set);
  EXPECT_EQ(util::StatusCode::INVALID_ARGUMENT, status.error_code());
  EXPECT_NE(std::string::npos, status.error_details().find("line 2"));
}

TEST(ShareFileParserTest, ReadShareFile) {
  std::string json_path = ::testing::TempDir() + "share_file_test.json";
  std::string text_path = ::testing::TempDir() + "share_file_test.textproto";
  {
    std::ofstream json_file(json_path);
    json_file << kSampleJson;
    std::ofstream text_file(text_path);
    text_file << kSampleText;
  }

  size_t threshold;
  std::vector<Point> points;
  ShareSet share_set;
  ASSERT_TRUE(ReadShareFile(json_path, &share_set).ok());
  ASSERT_TRUE(DecodeShares(share_set, &threshold, &points).ok());
  ExpectSamplePoints(points);

  ASSERT_TRUE(ReadShareFile(text_path, &share_set).ok());
  ASSERT_TRUE(DecodeShares(share_set, &threshold, &points).ok());
  ExpectSamplePoints(points);

  EXPECT_EQ(util::StatusCode::NOT_FOUND,
            ReadShareFile(::testing::TempDir() + "no_such_file.json",
                          &share_set)
                .error_code());
}

TEST(ShareFileParserTest, DecodeSharesValidation) {
  size_t threshold = 0;
  std::vector<Point> points;

  ShareSet share_set;
  share_set.set_n(2);
  share_set.set_k(0);
  AddShare(&share_set, "1", 10, "4");
  AddShare(&share_set, "2", 10, "5");
  EXPECT_EQ(util::StatusCode::INVALID_ARGUMENT,
            DecodeShares(share_set, &threshold, &points).error_code());

  // n < k.
  share_set.set_k(3);
  EXPECT_FALSE(DecodeShares(share_set, &threshold, &points).ok());

  // Fewer shares than k.
  share_set.set_n(3);
  EXPECT_FALSE(DecodeShares(share_set, &threshold, &points).ok());

  // A bad digit.
  AddShare(&share_set, "3", 2, "12");
  util::Status status = DecodeShares(share_set, &threshold, &points);
  EXPECT_EQ(util::StatusCode::INVALID_ARGUMENT, status.error_code());
  EXPECT_EQ("Share 3 could not be decoded", status.error_message());

  // A bad key.
  share_set.mutable_share(2)->set_value("11");
  share_set.mutable_share(2)->set_x("three");
  EXPECT_FALSE(DecodeShares(share_set, &threshold, &points).ok());

  // A repeated key.
  share_set.mutable_share(2)->set_x("1");
  status = DecodeShares(share_set, &threshold, &points);
  EXPECT_EQ(util::StatusCode::INVALID_ARGUMENT, status.error_code());
  EXPECT_EQ("x=1", status.error_details());

  // Nothing was written by the failed calls.
  EXPECT_EQ(0u, threshold);
  EXPECT_TRUE(points.empty());

  share_set.mutable_share(2)->set_x("-3");
  ASSERT_TRUE(DecodeShares(share_set, &threshold, &points).ok());
  EXPECT_EQ(3u, threshold);
  ASSERT_EQ(3u, points.size());
  EXPECT_EQ(Point(-3, 3), points[0]);
}

}  // namespace decoding
}  // namespace shamir
