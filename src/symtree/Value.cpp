#include "../../include/symtree/Value.h"
#include "../../include/symtree/Errors.h"

#include <fmt/core.h>

#include <cmath>
#include <functional>
#include <limits>
#include <vector>

// ============================== Local helpers ================================
namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

Eigen::Index broadcast_extent(Eigen::Index a, Eigen::Index b) {
    if (a == b || b == 1)
        return a;
    if (a == 1)
        return b;
    throw ShapeError(fmt::format(
        "operands could not be broadcast together (extent {} vs {})", a, b));
}

// numpy-style 2-D broadcasting over extents of length one
template <typename Fn>
dmat broadcast_dense(const dmat &a, const dmat &b, Fn &&fn) {
    const Eigen::Index rows = broadcast_extent(a.rows(), b.rows());
    const Eigen::Index cols = broadcast_extent(a.cols(), b.cols());
    dmat out(rows, cols);
    const bool ar = a.rows() == 1, ac = a.cols() == 1;
    const bool br = b.rows() == 1, bc = b.cols() == 1;
    for (Eigen::Index j = 0; j < cols; ++j) {
        for (Eigen::Index i = 0; i < rows; ++i) {
            out(i, j) = fn(a(ar ? 0 : i, ac ? 0 : j), b(br ? 0 : i, bc ? 0 : j));
        }
    }
    return out;
}

template <typename Fn>
Value elementwise(const Value &l, const Value &r, Fn &&fn) {
    if (is_scalar(l) && is_scalar(r)) [[likely]]
        return fn(std::get<double>(l), std::get<double>(r));
    return broadcast_dense(to_dense(l), to_dense(r), std::forward<Fn>(fn));
}

template <typename Fn> Value unary(const Value &v, Fn &&fn) {
    if (is_scalar(v))
        return fn(std::get<double>(v));
    return dmat(to_dense(v).unaryExpr(std::forward<Fn>(fn)));
}

// Sparse-preserving unary map (only valid when fn(0) == 0)
template <typename Fn> Value unary_keep_sparse(const Value &v, Fn &&fn) {
    if (is_sparse(v)) {
        spmat out = std::get<spmat>(v).unaryExpr(std::forward<Fn>(fn));
        out.makeCompressed();
        return out;
    }
    return unary(v, std::forward<Fn>(fn));
}

void check_same_shape(const spmat &a, Eigen::Index rows, Eigen::Index cols) {
    if (a.rows() != rows || a.cols() != cols)
        throw ShapeError(fmt::format(
            "sparse operand of shape ({}, {}) incompatible with ({}, {})",
            a.rows(), a.cols(), rows, cols));
}

// Broadcast Hadamard product: each stored entry of s is spread along its
// length-one extents and scaled by the matching entry of the other operand
template <typename At>
spmat sparse_broadcast(const spmat &s, Eigen::Index o_rows, Eigen::Index o_cols,
                       At &&at) {
    const Eigen::Index rows = broadcast_extent(s.rows(), o_rows);
    const Eigen::Index cols = broadcast_extent(s.cols(), o_cols);
    const bool spread_r = s.rows() == 1 && rows > 1;
    const bool spread_c = s.cols() == 1 && cols > 1;
    const bool or1 = o_rows == 1, oc1 = o_cols == 1;
    std::vector<Eigen::Triplet<double>> trips;
    trips.reserve(static_cast<std::size_t>(s.nonZeros()) *
                  static_cast<std::size_t>((spread_r ? rows : 1) *
                                           (spread_c ? cols : 1)));
    for (int k = 0; k < s.outerSize(); ++k) {
        for (spmat::InnerIterator it(s, k); it; ++it) {
            const Eigen::Index r0 = spread_r ? 0 : it.row();
            const Eigen::Index r1 = spread_r ? rows : it.row() + 1;
            const Eigen::Index c0 = spread_c ? 0 : it.col();
            const Eigen::Index c1 = spread_c ? cols : it.col() + 1;
            for (Eigen::Index i = r0; i < r1; ++i)
                for (Eigen::Index j = c0; j < c1; ++j)
                    trips.emplace_back(i, j,
                                       it.value() * at(or1 ? 0 : i, oc1 ? 0 : j));
        }
    }
    spmat out(rows, cols);
    out.setFromTriplets(trips.begin(), trips.end());
    return out;
}

// Hadamard product with a sparse left factor; the result stays sparse
spmat sparse_multiply(const spmat &s, const Value &other) {
    spmat out;
    if (is_scalar(other)) {
        out = s * std::get<double>(other);
    } else if (is_sparse(other)) {
        const auto &o = std::get<spmat>(other);
        if (o.rows() == s.rows() && o.cols() == s.cols())
            out = s.cwiseProduct(o);
        else if (o.rows() == 1 && o.cols() == 1)
            out = s * o.coeff(0, 0);
        else if (s.rows() == 1 && s.cols() == 1)
            out = o * s.coeff(0, 0);
        else
            out = sparse_broadcast(s, o.rows(), o.cols(),
                                   [&o](Eigen::Index i, Eigen::Index j) {
                                       return o.coeff(i, j);
                                   });
    } else {
        const auto &d = std::get<dmat>(other);
        if (d.rows() == s.rows() && d.cols() == s.cols()) {
            const spmat ds = d.sparseView();
            out = s.cwiseProduct(ds);
        } else if (d.rows() == 1 && d.cols() == 1) {
            out = s * d(0, 0);
        } else if (d.cols() == 1 && d.rows() == s.rows()) {
            const dvec w = d.col(0);
            out = w.asDiagonal() * s;
        } else if (d.rows() == 1 && d.cols() == s.cols()) {
            const dvec w = d.row(0).transpose();
            out = s * w.asDiagonal();
        } else {
            out = sparse_broadcast(s, d.rows(), d.cols(),
                                   [&d](Eigen::Index i, Eigen::Index j) {
                                       return d(i, j);
                                   });
        }
    }
    out.makeCompressed();
    return out;
}

Value reciprocal(const Value &v) {
    return unary(v, [](double x) { return 1.0 / x; });
}

// floored modulo: the result takes the sign of the divisor
double floored_mod(double a, double b) {
    const double r = std::fmod(a, b);
    if (r != 0.0 && ((r < 0.0) != (b < 0.0)))
        return r + b;
    return r;
}

} // namespace

// ============================================================================
// Inspection helpers
// ============================================================================
Eigen::Index value_rows(const Value &v) {
    if (is_scalar(v))
        return 1;
    if (is_dense(v))
        return std::get<dmat>(v).rows();
    return std::get<spmat>(v).rows();
}

Eigen::Index value_cols(const Value &v) {
    if (is_scalar(v))
        return 1;
    if (is_dense(v))
        return std::get<dmat>(v).cols();
    return std::get<spmat>(v).cols();
}

dmat to_dense(const Value &v) {
    if (is_scalar(v))
        return dmat::Constant(1, 1, std::get<double>(v));
    if (is_dense(v))
        return std::get<dmat>(v);
    return dmat(std::get<spmat>(v));
}

spmat to_sparse(const Value &v) {
    if (is_sparse(v))
        return std::get<spmat>(v);
    spmat out = to_dense(v).sparseView();
    out.makeCompressed();
    return out;
}

double as_double(const Value &v) {
    if (is_scalar(v))
        return std::get<double>(v);
    if (value_rows(v) != 1 || value_cols(v) != 1)
        throw ShapeError(fmt::format("expected a number, got shape ({}, {})",
                                     value_rows(v), value_cols(v)));
    return to_dense(v)(0, 0);
}

bool is_all_zero(const Value &v) {
    if (is_scalar(v))
        return std::get<double>(v) == 0.0;
    if (is_dense(v))
        return (std::get<dmat>(v).array() == 0.0).all();
    const auto &s = std::get<spmat>(v);
    for (int k = 0; k < s.outerSize(); ++k)
        for (spmat::InnerIterator it(s, k); it; ++it)
            if (it.value() != 0.0)
                return false;
    return true;
}

Value filled_like(const Value &v, double fill) {
    if (is_scalar(v))
        return fill;
    if (is_sparse(v) && fill == 0.0)
        return spmat(value_rows(v), value_cols(v));
    return dmat(dmat::Constant(value_rows(v), value_cols(v), fill));
}

// ============================================================================
// Binary kernels
// ============================================================================
namespace numeric {

Value add(const Value &l, const Value &r) {
    if (is_sparse(l) && is_sparse(r)) {
        const auto &a = std::get<spmat>(l);
        const auto &b = std::get<spmat>(r);
        check_same_shape(a, b.rows(), b.cols());
        spmat out = a + b;
        return out;
    }
    if (is_sparse(l) && is_scalar(r) && std::get<double>(r) == 0.0)
        return l;
    if (is_sparse(r) && is_scalar(l) && std::get<double>(l) == 0.0)
        return r;
    return elementwise(l, r, std::plus<double>{});
}

Value subtract(const Value &l, const Value &r) {
    if (is_sparse(l) && is_sparse(r)) {
        const auto &a = std::get<spmat>(l);
        const auto &b = std::get<spmat>(r);
        check_same_shape(a, b.rows(), b.cols());
        spmat out = a - b;
        return out;
    }
    if (is_sparse(l) && is_scalar(r) && std::get<double>(r) == 0.0)
        return l;
    if (is_sparse(r) && is_scalar(l) && std::get<double>(l) == 0.0)
        return negate(r);
    return elementwise(l, r, std::minus<double>{});
}

Value multiply(const Value &l, const Value &r) {
    if (is_sparse(l))
        return sparse_multiply(std::get<spmat>(l), r);
    // Hadamard product is commutative, so the sparse factor can go first
    if (is_sparse(r))
        return sparse_multiply(std::get<spmat>(r), l);
    return elementwise(l, r, std::multiplies<double>{});
}

Value matmul(const Value &l, const Value &r) {
    if (is_scalar(l) || is_scalar(r))
        return multiply(l, r);
    if (value_cols(l) != value_rows(r))
        throw ShapeError(fmt::format(
            "matmul: inner dimensions do not agree ({}, {}) @ ({}, {})",
            value_rows(l), value_cols(l), value_rows(r), value_cols(r)));
    if (is_sparse(l) && is_sparse(r)) {
        spmat out = std::get<spmat>(l) * std::get<spmat>(r);
        out.makeCompressed();
        return out;
    }
    if (is_sparse(l))
        return dmat(std::get<spmat>(l) * std::get<dmat>(r));
    if (is_sparse(r))
        return dmat(std::get<dmat>(l) * std::get<spmat>(r));
    return dmat(std::get<dmat>(l) * std::get<dmat>(r));
}

Value divide(const Value &l, const Value &r) {
    if (is_sparse(l))
        return multiply(l, reciprocal(r));
    if (is_scalar(r) && std::get<double>(r) == 0.0)
        return multiply(l, kInf); // 0 / 0 stays NaN
    return elementwise(l, r, std::divides<double>{});
}

Value power(const Value &l, const Value &r) {
    return elementwise(l, r, [](double a, double b) { return std::pow(a, b); });
}

Value modulo(const Value &l, const Value &r) {
    return elementwise(l, r, floored_mod);
}

Value minimum(const Value &l, const Value &r) {
    return elementwise(l, r, [](double a, double b) {
        if (std::isnan(a) || std::isnan(b))
            return kNaN;
        return a < b ? a : b;
    });
}

Value maximum(const Value &l, const Value &r) {
    return elementwise(l, r, [](double a, double b) {
        if (std::isnan(a) || std::isnan(b))
            return kNaN;
        return a > b ? a : b;
    });
}

Value less_equal(const Value &l, const Value &r) {
    return elementwise(l, r, [](double a, double b) { return a <= b ? 1.0 : 0.0; });
}

Value less(const Value &l, const Value &r) {
    return elementwise(l, r, [](double a, double b) { return a < b ? 1.0 : 0.0; });
}

// ============================================================================
// Unary kernels
// ============================================================================
Value negate(const Value &v) {
    return unary_keep_sparse(v, [](double x) { return -x; });
}

Value exp(const Value &v) {
    return unary(v, [](double x) { return std::exp(x); });
}

Value log(const Value &v) {
    return unary(v, [](double x) { return std::log(x); });
}

Value tanh(const Value &v) {
    return unary_keep_sparse(v, [](double x) { return std::tanh(x); });
}

Value floor(const Value &v) {
    return unary_keep_sparse(v, [](double x) { return std::floor(x); });
}

} // namespace numeric
