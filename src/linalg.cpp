#include "../include/linalg.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace {

constexpr double GRADIENT_TOL = 1e-10;
constexpr double ZERO_TOL = 1e-12;

double dot(const Vector &a, const Vector &b) {
  double s = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i)
    s += a[i] * b[i];
  return s;
}

} // namespace

// 1. Gaussian elimination on the augmented matrix [A | b]
std::optional<Vector> gauss_solve(const Matrix &A, const Vector &b) {
  const std::size_t n = b.size();
  if (n == 0)
    return Vector{};
  if (A.size() != n)
    return std::nullopt;

  Matrix M(n, Vector(n + 1, 0.0));
  for (std::size_t i = 0; i < n; ++i) {
    if (A[i].size() != n)
      return std::nullopt;
    std::copy(A[i].begin(), A[i].end(), M[i].begin());
    M[i][n] = b[i];
  }

  // forward elimination
  for (std::size_t col = 0; col < n; ++col) {
    std::size_t max_row = col;
    double max_val = std::abs(M[col][col]);
    for (std::size_t row = col + 1; row < n; ++row) {
      if (std::abs(M[row][col]) > max_val) {
        max_val = std::abs(M[row][col]);
        max_row = row;
      }
    }
    if (max_val < PIVOT_TOL)
      return std::nullopt;
    if (max_row != col)
      std::swap(M[col], M[max_row]);

    for (std::size_t row = col + 1; row < n; ++row) {
      double factor = M[row][col] / M[col][col];
      for (std::size_t j = col; j <= n; ++j)
        M[row][j] -= factor * M[col][j];
    }
  }

  // back substitution
  Vector x(n, 0.0);
  for (std::size_t ii = n; ii-- > 0;) {
    if (std::abs(M[ii][ii]) < PIVOT_TOL)
      return std::nullopt;
    double v = M[ii][n];
    for (std::size_t j = ii + 1; j < n; ++j)
      v -= M[ii][j] * x[j];
    x[ii] = v / M[ii][ii];
  }
  return x;
}

// 2. NNLS
Vector nnls(const Matrix &columns, const Vector &b) {
  const std::size_t n = b.size();
  const std::size_t k = columns.size();
  if (k == 0)
    return {};

  Vector x(k, 0.0);
  std::vector<bool> free_set(k, false);
  const std::size_t max_iter = 3 * k + 1;

  for (std::size_t outer = 0; outer < max_iter; ++outer) {
    // residual r = b - A x
    Vector r(b);
    for (std::size_t j = 0; j < k; ++j) {
      if (x[j] == 0.0)
        continue;
      for (std::size_t i = 0; i < n; ++i)
        r[i] -= columns[j][i] * x[j];
    }

    // w = A^T r; most positive entry among the active (zero) set enters
    std::size_t best_j = k;
    double best_w = GRADIENT_TOL;
    for (std::size_t j = 0; j < k; ++j) {
      if (free_set[j])
        continue;
      double w = dot(columns[j], r);
      if (w > best_w) {
        best_w = w;
        best_j = j;
      }
    }
    if (best_j == k)
      break; // optimal
    free_set[best_j] = true;

    for (std::size_t inner = 0; inner < max_iter; ++inner) {
      std::vector<std::size_t> idx;
      for (std::size_t j = 0; j < k; ++j) {
        if (free_set[j])
          idx.push_back(j);
      }
      const std::size_t nf = idx.size();

      // normal equations on the free set
      Matrix AtA(nf, Vector(nf, 0.0));
      Vector Atb(nf, 0.0);
      for (std::size_t a = 0; a < nf; ++a) {
        for (std::size_t c = 0; c < nf; ++c)
          AtA[a][c] = dot(columns[idx[a]], columns[idx[c]]);
        Atb[a] = dot(columns[idx[a]], b);
      }

      std::optional<Vector> s = gauss_solve(AtA, Atb);
      if (!s)
        break;

      bool feasible = std::all_of(s->begin(), s->end(),
                                  [](double v) { return v >= 0.0; });
      if (feasible) {
        for (std::size_t a = 0; a < nf; ++a)
          x[idx[a]] = (*s)[a];
        break;
      }

      // step toward s until the first free variable hits zero
      double alpha = 1.0;
      for (std::size_t a = 0; a < nf; ++a) {
        std::size_t j = idx[a];
        if ((*s)[a] <= 0.0 && x[j] > 0.0)
          alpha = std::min(alpha, x[j] / (x[j] - (*s)[a]));
      }
      for (std::size_t a = 0; a < nf; ++a) {
        std::size_t j = idx[a];
        x[j] += alpha * ((*s)[a] - x[j]);
        if (x[j] <= ZERO_TOL) {
          free_set[j] = false;
          x[j] = 0.0;
        }
      }
    }
  }
  return x;
}

Vector combine_columns(const Matrix &columns, const Vector &x, std::size_t n) {
  Vector out(n, 0.0);
  for (std::size_t j = 0; j < columns.size() && j < x.size(); ++j) {
    for (std::size_t i = 0; i < n; ++i)
      out[i] += x[j] * columns[j][i];
  }
  return out;
}

double mean_square_error(const Vector &target, const Vector &fitted) {
  if (target.empty())
    return 0.0;
  double s = 0.0;
  for (std::size_t i = 0; i < target.size(); ++i) {
    double e = target[i] - (i < fitted.size() ? fitted[i] : 0.0);
    s += e * e;
  }
  return s / static_cast<double>(target.size());
}
