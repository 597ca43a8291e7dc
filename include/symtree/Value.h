#pragma once

#include <Eigen/Dense>
#include <Eigen/SparseCore>

#include <variant>

using dvec = Eigen::VectorXd;
using dmat = Eigen::MatrixXd;
// compressed-row storage, as produced by the Jacobian of state vectors
using spmat = Eigen::SparseMatrix<double, Eigen::RowMajor, int>;

// Result of a numeric evaluation: a number, a dense array or a sparse matrix
using Value = std::variant<double, dmat, spmat>;

// ============================================================================
// Inspection helpers
// ============================================================================
[[nodiscard]] inline bool is_scalar(const Value &v) noexcept {
    return std::holds_alternative<double>(v);
}
[[nodiscard]] inline bool is_dense(const Value &v) noexcept {
    return std::holds_alternative<dmat>(v);
}
[[nodiscard]] inline bool is_sparse(const Value &v) noexcept {
    return std::holds_alternative<spmat>(v);
}

Eigen::Index value_rows(const Value &v);
Eigen::Index value_cols(const Value &v);

// Scalars become 1x1 matrices
dmat to_dense(const Value &v);
// Compressed-row copy; explicit zeros are dropped
spmat to_sparse(const Value &v);
// Scalar or any 1x1 array; throws ShapeError otherwise
double as_double(const Value &v);
// Every entry is exactly zero
bool is_all_zero(const Value &v);
// Same shape (and sparsity when fill == 0) filled with `fill`
Value filled_like(const Value &v, double fill);

// ============================================================================
// Numeric kernels used by the operator nodes. IEEE-754 non-trapping semantics
// throughout: NaN and inf results are values, never errors.
// ============================================================================
namespace numeric {

Value add(const Value &l, const Value &r);
Value subtract(const Value &l, const Value &r);
Value multiply(const Value &l, const Value &r); // Hadamard
Value matmul(const Value &l, const Value &r);
Value divide(const Value &l, const Value &r);
Value power(const Value &l, const Value &r);
Value modulo(const Value &l, const Value &r);
Value minimum(const Value &l, const Value &r);
Value maximum(const Value &l, const Value &r);
Value less_equal(const Value &l, const Value &r);
Value less(const Value &l, const Value &r);

Value negate(const Value &v);
Value exp(const Value &v);
Value log(const Value &v);
Value tanh(const Value &v);
Value floor(const Value &v);

} // namespace numeric
