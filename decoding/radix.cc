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

#include "decoding/radix.h"

#include <sstream>
#include <utility>

namespace shamir {
namespace decoding {

namespace {
// Returns the value of the digit |c|, or kMaxRadix if |c| is not a digit in
// any supported base.
uint32_t DigitValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'z') {
    return 10 + (c - 'a');
  }
  if (c >= 'A' && c <= 'Z') {
    return 10 + (c - 'A');
  }
  return kMaxRadix;
}

}  // namespace

util::Status DecodeRadix(const std::string& digits, uint32_t base,
                         mpz_class* value_out) {
  if (base < kMinRadix || base > kMaxRadix) {
    std::ostringstream stream;
    stream << "Unsupported base " << base;
    return util::Status(util::StatusCode::INVALID_ARGUMENT, stream.str(),
                        "the base must be between 2 and 36");
  }
  if (digits.empty()) {
    return util::Status(util::StatusCode::INVALID_ARGUMENT,
                        "Empty value string");
  }
  for (char c : digits) {
    if (DigitValue(c) >= base) {
      std::ostringstream stream;
      stream << "Digit '" << c << "' not valid for base " << base;
      return util::Status(util::StatusCode::INVALID_ARGUMENT, stream.str(),
                          "value=" + digits);
    }
  }
  // Every character has been validated so GMP can not fail. For bases up to
  // 36 it treats upper and lower case letters alike.
  mpz_class value;
  if (value.set_str(digits, base) != 0) {
    return util::Status(util::StatusCode::INTERNAL,
                        "Could not decode value " + digits);
  }
  *value_out = std::move(value);
  return util::Status::OK;
}

util::Status DecodeDecimal(const std::string& digits, mpz_class* value_out) {
  bool negative = !digits.empty() && digits[0] == '-';
  mpz_class magnitude;
  util::Status status =
      DecodeRadix(negative ? digits.substr(1) : digits, 10, &magnitude);
  if (!status.ok()) {
    return status;
  }
  *value_out = negative ? mpz_class(-magnitude) : magnitude;
  return util::Status::OK;
}

}  // namespace decoding
}  // namespace shamir
