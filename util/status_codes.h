// Copyright 2018 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef SHAMIR_UTIL_STATUS_CODES_H_
#define SHAMIR_UTIL_STATUS_CODES_H_

namespace shamir {
namespace util {

// The error codes used by the decoding and tool layers. The values match the
// canonical gRPC codes of the same name.
enum StatusCode {
  OK = 0,
  INVALID_ARGUMENT = 3,
  NOT_FOUND = 5,
  FAILED_PRECONDITION = 9,
  INTERNAL = 13,
};

// Returns the name of |code|, e.g. "NOT_FOUND".
const char* StatusCodeName(StatusCode code);

}  // namespace util
}  // namespace shamir

#endif  // SHAMIR_UTIL_STATUS_CODES_H_
