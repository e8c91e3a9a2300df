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

#ifndef SHAMIR_DECODING_SHARE_FILE_PARSER_H_
#define SHAMIR_DECODING_SHARE_FILE_PARSER_H_

#include <string>
#include <vector>

#include "./shares.pb.h"
#include "algorithms/recovery/point.h"
#include "util/status.h"

namespace shamir {
namespace decoding {

// Parses a share file in JSON form:
//
//   {
//     "keys": { "n": 4, "k": 3 },
//     "1": { "base": "10", "value": "4" },
//     "2": { "base": "2", "value": "111" },
//     ...
//   }
//
// Every member other than "keys" whose value is an object with string
// members "base" and "value" is one share; its name is the x value. Other
// members are ignored with a warning. Returns INVALID_ARGUMENT if the text is
// not JSON or if "keys" does not hold the integers "n" and "k".
util::Status ParseShareSetFromJson(const std::string& json,
                                   ShareSet* share_set_out);

// Parses a ShareSet written in protocol buffer text format. Returns
// INVALID_ARGUMENT, with the line and column of the first error, if the text
// can not be parsed.
util::Status ParseShareSetFromText(const std::string& text,
                                   ShareSet* share_set_out);

// Reads and parses the share file at |file_path|. Files whose name ends in
// ".json" are parsed with ParseShareSetFromJson() and all other files with
// ParseShareSetFromText(). Returns NOT_FOUND if the file can not be read.
util::Status ReadShareFile(const std::string& file_path,
                           ShareSet* share_set_out);

// Validates |share_set| and decodes it into the threshold and the points the
// reconstruction works on. On success *points_out is sorted by x.
//
// Returns INVALID_ARGUMENT if k is zero, if n is less than k, if there are
// fewer than k shares, if an x value is not a decimal integer, if a value
// can not be decoded in its base, or if two shares have the same x value.
util::Status DecodeShares(const ShareSet& share_set, size_t* threshold_out,
                          std::vector<recovery::Point>* points_out);

}  // namespace decoding
}  // namespace shamir

#endif  // SHAMIR_DECODING_SHARE_FILE_PARSER_H_
