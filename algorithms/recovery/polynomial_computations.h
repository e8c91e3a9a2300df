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

#ifndef SHAMIR_ALGORITHMS_RECOVERY_POLYNOMIAL_COMPUTATIONS_H_
#define SHAMIR_ALGORITHMS_RECOVERY_POLYNOMIAL_COMPUTATIONS_H_

#include <gmpxx.h>

#include <string>
#include <vector>

#include "algorithms/recovery/point.h"
#include "algorithms/recovery/rational.h"
#include "algorithms/recovery/recovery_status.h"

namespace shamir {
namespace recovery {

// Utility functions for computing with polynomials over the rationals.

// The two ways of recovering a polynomial from sample points. Both yield the
// same constant term for any subset of distinct points.
enum InterpolationMethod {
  // Evaluates the Lagrange basis polynomials at zero. O(k^2) operations.
  kLagrange = 0,

  // Solves the Vandermonde system by Gaussian elimination. O(k^3) operations
  // but yields every coefficient of the polynomial.
  kGaussianElimination,
};

// Parses "lagrange" or "gaussian" into *method_out. Returns false if |name|
// is neither.
bool ParseInterpolationMethod(const std::string& name,
                              InterpolationMethod* method_out);

const char* InterpolationMethodName(InterpolationMethod method);

// Computes f(x) where f is the polynomial c0 + c1*x + c2*x^2 + ... cn*x^n
// where n = coefficients.size() - 1 and ci = coefficients[i].
// REQUIRES: coefficients is not empty.
mpz_class Evaluate(const std::vector<mpz_class>& coefficients,
                   const mpz_class& x);

// Computes the constant term c0 of the unique polynomial of degree d that
// passes through the points p0, p1, ... p_{d} where d = points.size() - 1,
// using Lagrange interpolation at zero. The result is exact and need not be
// an integer.
//
// Returns kDivisionByZero if two of the points share an x value.
Status InterpolateConstant(const std::vector<const Point*>& points,
                           Rational* constant_out);

// Finds the coefficients of the unique polynomial of degree d that passes
// through the points p0, p1, ... p_{d} where d = points.size() - 1, by
// Gaussian elimination on the system whose i-th row is
// [x_i^d, x_i^(d-1), ..., x_i, 1] with right hand side y_i.
//
// On success *coefficients_out is [a_d, a_{d-1}, ..., a_1, a_0], highest
// degree first. Returns kSingularSystem if some column has no nonzero pivot,
// which happens exactly when two points share an x value.
Status SolveVandermonde(const std::vector<const Point*>& points,
                        std::vector<Rational>* coefficients_out);

// Recovers the secret, the integer constant term of the polynomial through
// |points|, using |method|.
//
// Returns kWrongSubsetSize if |points| is empty, kNonIntegerResult if the
// constant term is not an integer, and otherwise the error of the underlying
// method.
Status InterpolateSecret(InterpolationMethod method,
                         const std::vector<const Point*>& points,
                         mpz_class* secret_out);

}  // namespace recovery
}  // namespace shamir

#endif  // SHAMIR_ALGORITHMS_RECOVERY_POLYNOMIAL_COMPUTATIONS_H_
