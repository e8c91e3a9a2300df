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

#ifndef SHAMIR_ALGORITHMS_RECOVERY_POINT_H_
#define SHAMIR_ALGORITHMS_RECOVERY_POINT_H_

#include <gmpxx.h>

#include <utility>

namespace shamir {
namespace recovery {

// A share: one sample (x, y) of the secret polynomial. Within one problem
// instance the x values are pairwise distinct.
struct Point {
  Point(mpz_class x, mpz_class y) : x(std::move(x)), y(std::move(y)) {}

  bool operator==(const Point& other) const {
    return x == other.x && y == other.y;
  }

  mpz_class x;
  mpz_class y;
};

}  // namespace recovery
}  // namespace shamir

#endif  // SHAMIR_ALGORITHMS_RECOVERY_POINT_H_
