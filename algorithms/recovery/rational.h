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

#ifndef SHAMIR_ALGORITHMS_RECOVERY_RATIONAL_H_
#define SHAMIR_ALGORITHMS_RECOVERY_RATIONAL_H_

#include <gmpxx.h>

#include <iostream>
#include <string>

#include "algorithms/recovery/recovery_status.h"

namespace shamir {
namespace recovery {

// An exact fraction of two arbitrary-precision integers.
//
// A Rational is always kept in lowest terms with a strictly positive
// denominator: gcd(|numerator|, denominator) == 1 and denominator > 0. Zero is
// represented as 0/1. Rationals are values; the arithmetic operators return
// new, normalized Rationals and never modify their operands.
class Rational {
 public:
  // Constructs the Rational zero.
  Rational() : numerator_(0), denominator_(1) {}

  // Constructs the Rational |integer|/1.
  explicit Rational(const mpz_class& integer)
      : numerator_(integer), denominator_(1) {}

  // Constructs the Rational |integer|/1.
  explicit Rational(long integer) : numerator_(integer), denominator_(1) {}

  // Writes the normalized form of |numerator|/|denominator| to *rational_out.
  // Returns kOK on success or kDivisionByZero if |denominator| is zero, in
  // which case *rational_out is left untouched.
  static Status Create(const mpz_class& numerator,
                       const mpz_class& denominator, Rational* rational_out);

  Rational operator+(const Rational& other) const;
  Rational operator-(const Rational& other) const;
  Rational operator*(const Rational& other) const;
  Rational operator-() const;

  void operator+=(const Rational& other) { *this = *this + other; }
  void operator-=(const Rational& other) { *this = *this - other; }
  void operator*=(const Rational& other) { *this = *this * other; }

  // Writes this Rational divided by |divisor| to *quotient_out. Returns
  // kDivisionByZero if |divisor| is zero.
  Status Divide(const Rational& divisor, Rational* quotient_out) const;

  // Both members are normalized so structural equality is value equality.
  bool operator==(const Rational& other) const {
    return numerator_ == other.numerator_ &&
           denominator_ == other.denominator_;
  }

  bool operator!=(const Rational& other) const { return !(*this == other); }

  bool is_zero() const { return numerator_ == 0; }

  bool is_integer() const { return denominator_ == 1; }

  // Writes the integer value of this Rational to *integer_out. Returns
  // kNonIntegerResult if the denominator is not one.
  Status ToInteger(mpz_class* integer_out) const;

  const mpz_class& numerator() const { return numerator_; }
  const mpz_class& denominator() const { return denominator_; }

  // Returns "n" for integers and "n/d" otherwise.
  std::string ToString() const;

 private:
  // Used by the arithmetic operators, which never produce a zero denominator.
  Rational(mpz_class numerator, mpz_class denominator);

  // Divides out the gcd and moves the sign to the numerator.
  void Normalize();

  mpz_class numerator_;
  mpz_class denominator_;
};

std::ostream& operator<<(std::ostream& os, const Rational& r);

}  // namespace recovery
}  // namespace shamir

#endif  // SHAMIR_ALGORITHMS_RECOVERY_RATIONAL_H_
