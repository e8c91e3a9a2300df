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

#include <gtest/gtest.h>

#include <vector>

namespace shamir {
namespace recovery {

namespace {
// Creates the Rational numerator/denominator, expecting success.
Rational MakeRational(const mpz_class& numerator,
                      const mpz_class& denominator) {
  Rational r;
  EXPECT_EQ(kOK, Rational::Create(numerator, denominator, &r));
  return r;
}

// Checks that |r| is in lowest terms with a positive denominator.
void ExpectNormalized(const Rational& r) {
  EXPECT_GT(r.denominator(), 0);
  mpz_class divisor = gcd(r.numerator(), r.denominator());
  EXPECT_EQ(1, divisor) << r;
}
}  // namespace

TEST(RationalTest, Normalization) {
  Rational r = MakeRational(6, 8);
  EXPECT_EQ(3, r.numerator());
  EXPECT_EQ(4, r.denominator());

  // The sign moves to the numerator.
  r = MakeRational(6, -8);
  EXPECT_EQ(-3, r.numerator());
  EXPECT_EQ(4, r.denominator());

  r = MakeRational(-6, -8);
  EXPECT_EQ(3, r.numerator());
  EXPECT_EQ(4, r.denominator());

  // Zero is always 0/1.
  r = MakeRational(0, -17);
  EXPECT_EQ(0, r.numerator());
  EXPECT_EQ(1, r.denominator());
  EXPECT_TRUE(r.is_zero());
  EXPECT_EQ(Rational(), r);

  std::vector<long> values({-360, -35, -1, 1, 2, 12, 35, 97, 360, 1001});
  for (long n : values) {
    for (long d : values) {
      ExpectNormalized(MakeRational(n, d));
    }
  }
}

TEST(RationalTest, ZeroDenominator) {
  Rational r(7);
  EXPECT_EQ(kDivisionByZero, Rational::Create(1, 0, &r));
  EXPECT_EQ(kDivisionByZero, Rational::Create(0, 0, &r));
  // The output is untouched on failure.
  EXPECT_EQ(Rational(7), r);
}

TEST(RationalTest, Arithmetic) {
  Rational half = MakeRational(1, 2);
  Rational third = MakeRational(1, 3);

  EXPECT_EQ(MakeRational(5, 6), half + third);
  EXPECT_EQ(MakeRational(1, 6), half - third);
  EXPECT_EQ(MakeRational(-1, 6), third - half);
  EXPECT_EQ(MakeRational(1, 6), half * third);

  Rational quotient;
  EXPECT_EQ(kOK, half.Divide(third, &quotient));
  EXPECT_EQ(MakeRational(3, 2), quotient);

  // The operands are never modified.
  EXPECT_EQ(MakeRational(1, 2), half);
  EXPECT_EQ(MakeRational(1, 3), third);

  Rational sum = half;
  sum += half;
  EXPECT_EQ(Rational(1), sum);
  sum *= third;
  EXPECT_EQ(third, sum);
  sum -= third;
  EXPECT_TRUE(sum.is_zero());
}

TEST(RationalTest, DivideByZero) {
  Rational quotient(5);
  EXPECT_EQ(kDivisionByZero, Rational(3).Divide(Rational(), &quotient));
  EXPECT_EQ(Rational(5), quotient);
}

TEST(RationalTest, AddNegationIsZero) {
  std::vector<Rational> values({MakeRational(1, 2), MakeRational(-7, 3),
                                Rational(42), MakeRational(22, 7)});
  for (const Rational& r : values) {
    Rational zero = r + (-r);
    EXPECT_EQ(0, zero.numerator());
    EXPECT_EQ(1, zero.denominator());
  }
}

TEST(RationalTest, ToInteger) {
  mpz_class integer;
  EXPECT_EQ(kOK, MakeRational(-12, 4).ToInteger(&integer));
  EXPECT_EQ(-3, integer);
  EXPECT_TRUE(MakeRational(-12, 4).is_integer());

  EXPECT_FALSE(MakeRational(1, 3).is_integer());
  EXPECT_EQ(kNonIntegerResult, MakeRational(1, 3).ToInteger(&integer));
  EXPECT_EQ(-3, integer);
}

TEST(RationalTest, ToString) {
  EXPECT_EQ("-3", MakeRational(-12, 4).ToString());
  EXPECT_EQ("5/7", MakeRational(10, 14).ToString());
  EXPECT_EQ("-5/7", MakeRational(10, -14).ToString());
}

// Products of large numbers are exact.
TEST(RationalTest, NoTruncation) {
  mpz_class big("123456789012345678901234567890123456789");
  Rational r(big);
  Rational square = r * r;
  EXPECT_EQ(mpz_class(big * big), square.numerator());

  Rational quotient;
  EXPECT_EQ(kOK, square.Divide(r, &quotient));
  EXPECT_EQ(r, quotient);

  EXPECT_EQ(kOK, Rational(1).Divide(square, &quotient));
  EXPECT_EQ(1, quotient.numerator());
  EXPECT_EQ(mpz_class(big * big), quotient.denominator());
}

}  // namespace recovery
}  // namespace shamir
