#pragma once

#include <cstddef>
#include <optional>
#include <vector>

using Vector = std::vector<double>;
using Matrix = std::vector<Vector>; // row-major, Matrix[row][col]

// Pivots smaller than this make a system unsolvable
constexpr double PIVOT_TOL = 1e-14;

// Solve A x = b (A square) by Gaussian elimination with partial pivoting.
// Returns std::nullopt for a singular or near-singular system.
std::optional<Vector> gauss_solve(const Matrix &A, const Vector &b);

// Non-negative least squares, min ||sum_j x_j columns[j] - b||^2 s.t. x >= 0.
// Lawson-Hanson active set; loops bounded by 3k + 1 for k columns.
// Every column must have b.size() entries.
Vector nnls(const Matrix &columns, const Vector &b);

// sum_j x_j columns[j], length n
Vector combine_columns(const Matrix &columns, const Vector &x, std::size_t n);

double mean_square_error(const Vector &target, const Vector &fitted);
