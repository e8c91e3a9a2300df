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

#include "algorithms/recovery/rational.h"

#include <utility>

namespace shamir {
namespace recovery {

Rational::Rational(mpz_class numerator, mpz_class denominator)
    : numerator_(std::move(numerator)), denominator_(std::move(denominator)) {
  Normalize();
}

void Rational::Normalize() {
  if (denominator_ < 0) {
    numerator_ = -numerator_;
    denominator_ = -denominator_;
  }
  // gcd(0, d) = d, so zero always normalizes to 0/1.
  mpz_class divisor = gcd(numerator_, denominator_);
  if (divisor != 1) {
    mpz_divexact(numerator_.get_mpz_t(), numerator_.get_mpz_t(),
                 divisor.get_mpz_t());
    mpz_divexact(denominator_.get_mpz_t(), denominator_.get_mpz_t(),
                 divisor.get_mpz_t());
  }
}

Status Rational::Create(const mpz_class& numerator,
                        const mpz_class& denominator,
                        Rational* rational_out) {
  if (denominator == 0) {
    return kDivisionByZero;
  }
  *rational_out = Rational(numerator, denominator);
  return kOK;
}

Rational Rational::operator+(const Rational& other) const {
  return Rational(numerator_ * other.denominator_ +
                      other.numerator_ * denominator_,
                  denominator_ * other.denominator_);
}

Rational Rational::operator-(const Rational& other) const {
  return Rational(numerator_ * other.denominator_ -
                      other.numerator_ * denominator_,
                  denominator_ * other.denominator_);
}

Rational Rational::operator*(const Rational& other) const {
  return Rational(numerator_ * other.numerator_,
                  denominator_ * other.denominator_);
}

Rational Rational::operator-() const {
  Rational negated;
  negated.numerator_ = -numerator_;
  negated.denominator_ = denominator_;
  return negated;
}

Status Rational::Divide(const Rational& divisor,
                        Rational* quotient_out) const {
  return Create(numerator_ * divisor.denominator_,
                denominator_ * divisor.numerator_, quotient_out);
}

Status Rational::ToInteger(mpz_class* integer_out) const {
  if (!is_integer()) {
    return kNonIntegerResult;
  }
  *integer_out = numerator_;
  return kOK;
}

std::string Rational::ToString() const {
  if (is_integer()) {
    return numerator_.get_str();
  }
  return numerator_.get_str() + "/" + denominator_.get_str();
}

std::ostream& operator<<(std::ostream& os, const Rational& r) {
  return os << r.ToString();
}

}  // namespace recovery
}  // namespace shamir
