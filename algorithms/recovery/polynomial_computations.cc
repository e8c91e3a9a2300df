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

#include "algorithms/recovery/polynomial_computations.h"

#include <glog/logging.h>

#include <utility>

namespace shamir {
namespace recovery {

namespace {

// Returns base^exponent.
mpz_class Power(const mpz_class& base, unsigned long exponent) {
  mpz_class result;
  mpz_pow_ui(result.get_mpz_t(), base.get_mpz_t(), exponent);
  return result;
}

}  // namespace

bool ParseInterpolationMethod(const std::string& name,
                              InterpolationMethod* method_out) {
  if (name == "lagrange") {
    *method_out = kLagrange;
    return true;
  }
  if (name == "gaussian") {
    *method_out = kGaussianElimination;
    return true;
  }
  return false;
}

const char* InterpolationMethodName(InterpolationMethod method) {
  switch (method) {
    case kLagrange:
      return "lagrange";
    case kGaussianElimination:
      return "gaussian";
  }
  return "unknown";
}

mpz_class Evaluate(const std::vector<mpz_class>& coefficients,
                   const mpz_class& x) {
  size_t num_coefficients = coefficients.size();
  mpz_class y = coefficients[num_coefficients - 1];
  for (int i = num_coefficients - 2; i >= 0; i--) {
    y *= x;
    y += coefficients[i];
  }
  return y;
}

Status InterpolateConstant(const std::vector<const Point*>& points,
                           Rational* constant_out) {
  size_t num_points = points.size();
  // We use Lagrange Interpolation evaluated at zero:
  // https://en.wikipedia.org/wiki/Lagrange_polynomial
  //
  //                      product_{j != i} (-x_j)
  //   c0 = Sum_i  y_i * -------------------------
  //                      product_{j != i} (x_i - x_j)
  //
  Rational sigma;
  for (size_t i = 0; i < num_points; i++) {
    const mpz_class& x_i = points[i]->x;
    mpz_class numerator = 1;
    mpz_class denominator = 1;
    for (size_t j = 0; j < num_points; j++) {
      if (j == i) {
        continue;
      }
      numerator *= -points[j]->x;
      denominator *= x_i - points[j]->x;
    }
    Rational basis_at_zero;
    Status status = Rational::Create(numerator, denominator, &basis_at_zero);
    if (status != kOK) {
      return status;
    }
    sigma += Rational(points[i]->y) * basis_at_zero;
  }
  *constant_out = std::move(sigma);
  return kOK;
}

Status SolveVandermonde(const std::vector<const Point*>& points,
                        std::vector<Rational>* coefficients_out) {
  size_t k = points.size();
  size_t degree = k - 1;

  // Build the augmented matrix [A | b]. Column |k| holds the y values.
  std::vector<std::vector<Rational>> m(k);
  for (size_t row = 0; row < k; row++) {
    m[row].reserve(k + 1);
    for (size_t col = 0; col < k; col++) {
      m[row].emplace_back(Power(points[row]->x, degree - col));
    }
    m[row].emplace_back(points[row]->y);
  }

  // Forward elimination.
  for (size_t col = 0; col < k; col++) {
    // The pivot is the first row at or below |col| with a nonzero entry.
    size_t pivot = col;
    while (pivot < k && m[pivot][col].is_zero()) {
      pivot++;
    }
    if (pivot == k) {
      return kSingularSystem;
    }
    if (pivot != col) {
      std::swap(m[pivot], m[col]);
    }

    // Normalize the pivot row so that the pivot becomes one.
    Rational pivot_value = m[col][col];
    for (size_t c = col; c <= k; c++) {
      Status status = m[col][c].Divide(pivot_value, &m[col][c]);
      if (status != kOK) {
        return status;
      }
    }

    // Eliminate the column from the rows below.
    for (size_t row = col + 1; row < k; row++) {
      Rational factor = m[row][col];
      if (factor.is_zero()) {
        continue;
      }
      for (size_t c = col; c <= k; c++) {
        m[row][c] -= factor * m[col][c];
      }
    }
  }

  // Back substitution. Every pivot is one after normalization.
  std::vector<Rational> solution(k);
  for (size_t r = k; r-- > 0;) {
    Rational sum;
    for (size_t c = r + 1; c < k; c++) {
      sum += m[r][c] * solution[c];
    }
    solution[r] = m[r][k] - sum;
  }

  VLOG(5) << "Solved a " << k << "x" << k << " Vandermonde system.";
  *coefficients_out = std::move(solution);
  return kOK;
}

Status InterpolateSecret(InterpolationMethod method,
                         const std::vector<const Point*>& points,
                         mpz_class* secret_out) {
  if (points.empty()) {
    return kWrongSubsetSize;
  }
  Rational constant_term;
  switch (method) {
    case kLagrange: {
      Status status = InterpolateConstant(points, &constant_term);
      if (status != kOK) {
        return status;
      }
    } break;
    case kGaussianElimination: {
      std::vector<Rational> coefficients;
      Status status = SolveVandermonde(points, &coefficients);
      if (status != kOK) {
        return status;
      }
      constant_term = coefficients.back();
    } break;
  }
  return constant_term.ToInteger(secret_out);
}

}  // namespace recovery
}  // namespace shamir
