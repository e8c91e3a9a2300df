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

#ifndef SHAMIR_DECODING_RADIX_H_
#define SHAMIR_DECODING_RADIX_H_

#include <gmpxx.h>

#include <cstdint>
#include <string>

#include "util/status.h"

namespace shamir {
namespace decoding {

static const uint32_t kMinRadix = 2;
static const uint32_t kMaxRadix = 36;

// Decodes the non-negative integer written with |digits| in base |base| and
// writes it to *value_out. The digits 0-9 stand for 0 to 9 and the letters
// a-z, in either case, stand for 10 to 35.
//
// Returns INVALID_ARGUMENT if |base| is not in [kMinRadix, kMaxRadix], if
// |digits| is empty, or if it contains a character that is not a digit of
// |base|. *value_out is not modified on error.
util::Status DecodeRadix(const std::string& digits, uint32_t base,
                         mpz_class* value_out);

// Decodes a decimal integer with an optional leading '-'.
util::Status DecodeDecimal(const std::string& digits, mpz_class* value_out);

}  // namespace decoding
}  // namespace shamir

#endif  // SHAMIR_DECODING_RADIX_H_
