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

#include <glog/logging.h>
#include <google/protobuf/io/tokenizer.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/text_format.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <map>
#include <sstream>
#include <utility>

#include "decoding/radix.h"

namespace shamir {
namespace decoding {

using google::protobuf::Struct;
using google::protobuf::Value;

namespace {

const char kKeysMember[] = "keys";
const char kJsonSuffix[] = ".json";

// Records the first error reported by the text format parser.
class FirstErrorCollector : public google::protobuf::io::ErrorCollector {
 public:
  void AddError(int line, google::protobuf::io::ColumnNumber column,
                const std::string& message) override {
    if (!first_error_.empty()) {
      return;
    }
    // The parser reports zero-based positions.
    std::ostringstream stream;
    stream << "line " << line + 1 << " column " << column + 1 << ": "
           << message;
    first_error_ = stream.str();
  }

  const std::string& first_error() const { return first_error_; }

 private:
  std::string first_error_;
};

// Reads the member |name| of |keys| as a non-negative integer that fits in a
// uint32_t. Returns false if it is missing or is not such a number.
bool GetCount(const Struct& keys, const std::string& name, uint32_t* count) {
  auto iter = keys.fields().find(name);
  if (iter == keys.fields().end() ||
      iter->second.kind_case() != Value::kNumberValue) {
    return false;
  }
  double number = iter->second.number_value();
  if (number < 0 || number > UINT32_MAX || std::floor(number) != number) {
    return false;
  }
  *count = static_cast<uint32_t>(number);
  return true;
}

// Reads the member |name| of |entry| into *value. Returns false if it is
// missing or is not a string.
bool GetString(const Struct& entry, const std::string& name,
               std::string* value) {
  auto iter = entry.fields().find(name);
  if (iter == entry.fields().end() ||
      iter->second.kind_case() != Value::kStringValue) {
    return false;
  }
  *value = iter->second.string_value();
  return true;
}

bool HasSuffix(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

util::Status ParseShareSetFromJson(const std::string& json,
                                   ShareSet* share_set_out) {
  Struct root;
  auto parse_status = google::protobuf::util::JsonStringToMessage(json, &root);
  if (!parse_status.ok()) {
    return util::Status(util::StatusCode::INVALID_ARGUMENT,
                        "Share file is not valid JSON",
                        parse_status.ToString());
  }

  auto keys_iter = root.fields().find(kKeysMember);
  if (keys_iter == root.fields().end() ||
      keys_iter->second.kind_case() != Value::kStructValue) {
    return util::Status(util::StatusCode::INVALID_ARGUMENT,
                        "Share file is missing keys.n or keys.k");
  }
  uint32_t n;
  uint32_t k;
  const Struct& keys = keys_iter->second.struct_value();
  if (!GetCount(keys, "n", &n) || !GetCount(keys, "k", &k)) {
    return util::Status(util::StatusCode::INVALID_ARGUMENT,
                        "Share file is missing keys.n or keys.k");
  }

  // Visit the members in name order so the output does not depend on the
  // iteration order of the protobuf map.
  std::map<std::string, const Value*> members;
  for (const auto& field : root.fields()) {
    if (field.first != kKeysMember) {
      members.emplace(field.first, &field.second);
    }
  }

  ShareSet share_set;
  share_set.set_n(n);
  share_set.set_k(k);
  for (const auto& member : members) {
    const std::string& name = member.first;
    const Value& value = *member.second;
    std::string base;
    std::string digits;
    if (value.kind_case() != Value::kStructValue ||
        !GetString(value.struct_value(), "base", &base) ||
        !GetString(value.struct_value(), "value", &digits)) {
      LOG(WARNING) << "Ignoring member \"" << name
                   << "\" of the share file: it is not a share.";
      continue;
    }
    mpz_class base_value;
    util::Status status = DecodeRadix(base, 10, &base_value);
    if (!status.ok() || !base_value.fits_uint_p()) {
      return util::Status(util::StatusCode::INVALID_ARGUMENT,
                          "Share \"" + name + "\" has an invalid base",
                          "base=" + base);
    }
    Share* share = share_set.add_share();
    share->set_x(name);
    share->set_base(base_value.get_ui());
    share->set_value(digits);
  }

  share_set_out->Swap(&share_set);
  return util::Status::OK;
}

util::Status ParseShareSetFromText(const std::string& text,
                                   ShareSet* share_set_out) {
  ShareSet share_set;
  FirstErrorCollector error_collector;
  google::protobuf::TextFormat::Parser parser;
  parser.RecordErrorsTo(&error_collector);
  if (!parser.ParseFromString(text, &share_set)) {
    return util::Status(util::StatusCode::INVALID_ARGUMENT,
                        "Share file could not be parsed",
                        error_collector.first_error());
  }
  share_set_out->Swap(&share_set);
  return util::Status::OK;
}

util::Status ReadShareFile(const std::string& file_path,
                           ShareSet* share_set_out) {
  std::ifstream stream(file_path);
  if (!stream) {
    return util::Status(util::StatusCode::NOT_FOUND,
                        "Unable to open share file " + file_path);
  }
  std::stringstream contents;
  contents << stream.rdbuf();
  if (stream.bad()) {
    return util::Status(util::StatusCode::NOT_FOUND,
                        "Unable to read share file " + file_path);
  }
  VLOG(2) << "Read " << contents.str().size() << " bytes from " << file_path;

  if (HasSuffix(file_path, kJsonSuffix)) {
    return ParseShareSetFromJson(contents.str(), share_set_out)
        .Annotate(file_path);
  }
  return ParseShareSetFromText(contents.str(), share_set_out)
      .Annotate(file_path);
}

util::Status DecodeShares(const ShareSet& share_set, size_t* threshold_out,
                          std::vector<recovery::Point>* points_out) {
  uint32_t n = share_set.n();
  uint32_t k = share_set.k();
  if (k == 0) {
    return util::Status(util::StatusCode::INVALID_ARGUMENT,
                        "The threshold k must be at least 1");
  }
  if (n < k) {
    std::ostringstream stream;
    stream << "n=" << n << " k=" << k;
    return util::Status(util::StatusCode::INVALID_ARGUMENT,
                        "The share count n is less than the threshold k",
                        stream.str());
  }
  if (static_cast<uint32_t>(share_set.share_size()) < k) {
    std::ostringstream stream;
    stream << "expected at least " << k << " but got "
           << share_set.share_size();
    return util::Status(util::StatusCode::INVALID_ARGUMENT,
                        "Not enough shares", stream.str());
  }
  if (static_cast<uint32_t>(share_set.share_size()) != n) {
    LOG(WARNING) << "The share file declares n=" << n << " but contains "
                 << share_set.share_size() << " shares.";
  }

  std::vector<recovery::Point> points;
  points.reserve(share_set.share_size());
  for (const Share& share : share_set.share()) {
    mpz_class x;
    util::Status status = DecodeDecimal(share.x(), &x);
    if (!status.ok()) {
      return util::Status(util::StatusCode::INVALID_ARGUMENT,
                          "Share key " + share.x() + " is not an integer",
                          status.error_message());
    }
    mpz_class y;
    status = DecodeRadix(share.value(), share.base(), &y);
    if (!status.ok()) {
      return util::Status(util::StatusCode::INVALID_ARGUMENT,
                          "Share " + share.x() + " could not be decoded",
                          status.error_message());
    }
    points.emplace_back(std::move(x), std::move(y));
  }

  std::sort(points.begin(), points.end(),
            [](const recovery::Point& a, const recovery::Point& b) {
              return a.x < b.x;
            });
  for (size_t i = 1; i < points.size(); i++) {
    if (points[i].x == points[i - 1].x) {
      return util::Status(util::StatusCode::INVALID_ARGUMENT,
                          "Two shares have the same key",
                          "x=" + points[i].x.get_str());
    }
  }

  *threshold_out = k;
  points_out->swap(points);
  return util::Status::OK;
}

}  // namespace decoding
}  // namespace shamir
