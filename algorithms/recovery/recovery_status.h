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

#ifndef SHAMIR_ALGORITHMS_RECOVERY_RECOVERY_STATUS_H_
#define SHAMIR_ALGORITHMS_RECOVERY_RECOVERY_STATUS_H_

namespace shamir {
namespace recovery {

// The result codes of the reconstruction engine. None of the errors are
// retryable: each one reflects a structural property of the input.
enum Status {
  kOK = 0,

  // A Rational was constructed with a zero denominator, or divided by zero.
  // During interpolation this means two points in a subset share an x value.
  kDivisionByZero,

  // An interpolation attempt produced a value that is not an integer.
  kNonIntegerResult,

  // The Vandermonde system for a subset has no pivot in some column.
  kSingularSystem,

  // Voting mode evaluated every subset and none of them yielded an integer.
  kNoConsistentSubset,

  // The caller supplied a pick list or point set of the wrong size.
  kWrongSubsetSize,

  // A key in the caller's pick list does not match the x value of any point.
  kUnknownKey,
};

// Returns a stable, human-readable name for |status|, e.g. "DivisionByZero".
const char* StatusName(Status status);

}  // namespace recovery
}  // namespace shamir

#endif  // SHAMIR_ALGORITHMS_RECOVERY_RECOVERY_STATUS_H_
