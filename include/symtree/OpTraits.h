#pragma once

#include "BinaryOperators.h"
#include "Errors.h"
#include "Node.h"
#include "Operators.h"
#include "Simplify.h"
#include "UnaryOperators.h"
#include "Value.h"

#include <fmt/core.h>

#include <limits>

// ============================================================================
// Per-operator behaviour. Every operator reachable from a dispatch switch must
// specialise OpTraits; the primary template is left undefined.
//
// Binary members:
//   name, precedence, overrides_diff
//   evaluate(l, r)                 numeric combinator
//   diff(node, var)                symbolic derivative (product/chain rules)
//   jac(node, lj, rj)              Jacobian from the children's Jacobians
//   simplify(node, l, r)           rebuild over simplified children
// Unary members:
//   name, evaluate(x), shape(node, x), diff(node, var), jac(node, cj)
// ============================================================================
template <Operator Op> struct OpTraits;

namespace detail {

inline NodePtr zero() { return make_scalar(0.0); }

inline bool both_constant(const NodePtr &l, const NodePtr &r) {
    return evaluates_to_constant_number(l) && evaluates_to_constant_number(r);
}

inline NodePtr fold(Operator op, const NodePtr &l, const NodePtr &r) {
    return simplify_if_constant(make_binary(op, l, r), false);
}

inline Value nan_like(const Value &shape) {
    return filled_like(shape, std::numeric_limits<double>::quiet_NaN());
}

} // namespace detail

// ===== BINARY: arithmetic =====
template <> struct OpTraits<Operator::Add> {
    static constexpr const char *name = "+";
    static constexpr int precedence = 10;
    static constexpr bool overrides_diff = false;
    static Value evaluate(const Value &l, const Value &r) {
        return numeric::add(l, r);
    }
    static NodePtr diff(const NodePtr &n, const NodePtr &v) {
        return ::diff(n->left(), v) + ::diff(n->right(), v);
    }
    static NodePtr jac(const NodePtr &, const NodePtr &lj, const NodePtr &rj) {
        return lj + rj;
    }
    static NodePtr simplify(const NodePtr &, const NodePtr &l,
                            const NodePtr &r) {
        return simplify_addition_subtraction(Operator::Add, l, r);
    }
};

template <> struct OpTraits<Operator::Subtract> {
    static constexpr const char *name = "-";
    static constexpr int precedence = 10;
    static constexpr bool overrides_diff = false;
    static Value evaluate(const Value &l, const Value &r) {
        return numeric::subtract(l, r);
    }
    static NodePtr diff(const NodePtr &n, const NodePtr &v) {
        return ::diff(n->left(), v) - ::diff(n->right(), v);
    }
    static NodePtr jac(const NodePtr &, const NodePtr &lj, const NodePtr &rj) {
        return lj - rj;
    }
    static NodePtr simplify(const NodePtr &, const NodePtr &l,
                            const NodePtr &r) {
        return simplify_addition_subtraction(Operator::Subtract, l, r);
    }
};

template <> struct OpTraits<Operator::Multiply> {
    static constexpr const char *name = "*";
    static constexpr int precedence = 20;
    static constexpr bool overrides_diff = false;
    static Value evaluate(const Value &l, const Value &r) {
        return numeric::multiply(l, r);
    }
    static NodePtr diff(const NodePtr &n, const NodePtr &v) {
        const auto &l = n->left();
        const auto &r = n->right();
        return ::diff(l, v) * r + l * ::diff(r, v);
    }
    static NodePtr jac(const NodePtr &n, const NodePtr &lj, const NodePtr &rj) {
        const auto &l = n->left();
        const auto &r = n->right();
        if (detail::both_constant(l, r))
            return detail::zero();
        if (evaluates_to_constant_number(l))
            return l * rj;
        if (evaluates_to_constant_number(r))
            return r * lj;
        return r * lj + l * rj;
    }
    static NodePtr simplify(const NodePtr &, const NodePtr &l,
                            const NodePtr &r) {
        return simplify_multiplication_division(Operator::Multiply, l, r);
    }
};

template <> struct OpTraits<Operator::MatMul> {
    static constexpr const char *name = "@";
    static constexpr int precedence = 20;
    static constexpr bool overrides_diff = true;
    static Value evaluate(const Value &l, const Value &r) {
        return numeric::matmul(l, r);
    }
    static NodePtr diff(const NodePtr &, const NodePtr &) {
        throw UnsupportedOperation(
            "diff not implemented for symbol of type 'MatrixMultiplication'");
    }
    // Only a constant matrix (or its negation) on the left is supported
    static NodePtr jac(const NodePtr &n, const NodePtr &, const NodePtr &rj) {
        const auto &l = n->left();
        const bool constant_matrix =
            l->type == Operator::Array ||
            (l->type == Operator::Negate &&
             l->child()->type == Operator::Array);
        if (!constant_matrix)
            throw UnsupportedOperation(fmt::format(
                "jac of 'MatrixMultiplication' is only implemented for left "
                "of type 'Array', not '{}'",
                to_string(l)));
        return matmul(make_array(to_sparse(::evaluate(l))), rj);
    }
    static NodePtr simplify(const NodePtr &, const NodePtr &l,
                            const NodePtr &r) {
        return simplify_multiplication_division(Operator::MatMul, l, r);
    }
};

template <> struct OpTraits<Operator::Divide> {
    static constexpr const char *name = "/";
    static constexpr int precedence = 20;
    static constexpr bool overrides_diff = false;
    static Value evaluate(const Value &l, const Value &r) {
        return numeric::divide(l, r);
    }
    static NodePtr diff(const NodePtr &n, const NodePtr &v) {
        const auto &top = n->left();
        const auto &bottom = n->right();
        return (::diff(top, v) * bottom - top * ::diff(bottom, v)) /
               power(bottom, 2);
    }
    static NodePtr jac(const NodePtr &n, const NodePtr &lj, const NodePtr &rj) {
        const auto &l = n->left();
        const auto &r = n->right();
        if (detail::both_constant(l, r))
            return detail::zero();
        if (evaluates_to_constant_number(l))
            return -l / power(r, 2) * rj;
        if (evaluates_to_constant_number(r))
            return lj / r;
        return (r * lj - l * rj) / power(r, 2);
    }
    static NodePtr simplify(const NodePtr &, const NodePtr &l,
                            const NodePtr &r) {
        return simplify_multiplication_division(Operator::Divide, l, r);
    }
};

template <> struct OpTraits<Operator::Power> {
    static constexpr const char *name = "**";
    static constexpr int precedence = 30;
    static constexpr bool overrides_diff = false;
    static Value evaluate(const Value &l, const Value &r) {
        return numeric::power(l, r);
    }
    static NodePtr diff(const NodePtr &n, const NodePtr &v) {
        const auto &base = n->left();
        const auto &exponent = n->right();
        NodePtr out = exponent * power(base, exponent - 1.0) * ::diff(base, v);
        if (contains(exponent, v))
            out = out + power(base, exponent) * log(base) * ::diff(exponent, v);
        return out;
    }
    static NodePtr jac(const NodePtr &n, const NodePtr &lj, const NodePtr &rj) {
        const auto &l = n->left();
        const auto &r = n->right();
        if (detail::both_constant(l, r))
            return detail::zero();
        if (evaluates_to_constant_number(r))
            return (r * power(l, r - 1.0)) * lj;
        if (evaluates_to_constant_number(l))
            return (power(l, r) * log(l)) * rj;
        return power(l, r - 1.0) * (r * lj + l * log(l) * rj);
    }
    static NodePtr simplify(const NodePtr &, const NodePtr &l,
                            const NodePtr &r) {
        return detail::fold(Operator::Power, l, r);
    }
};

template <> struct OpTraits<Operator::Modulo> {
    static constexpr const char *name = "mod";
    static constexpr int precedence = 20;
    static constexpr bool overrides_diff = false;
    static Value evaluate(const Value &l, const Value &r) {
        return numeric::modulo(l, r);
    }
    static NodePtr diff(const NodePtr &n, const NodePtr &v) {
        const auto &l = n->left();
        const auto &r = n->right();
        NodePtr out = ::diff(l, v);
        if (contains(r, v))
            out = out + (-floor(l / r)) * ::diff(r, v);
        return out;
    }
    static NodePtr jac(const NodePtr &n, const NodePtr &lj, const NodePtr &rj) {
        const auto &l = n->left();
        const auto &r = n->right();
        if (detail::both_constant(l, r))
            return detail::zero();
        if (evaluates_to_constant_number(r))
            return lj;
        if (evaluates_to_constant_number(l))
            return -rj * floor(l / r);
        return lj - rj * floor(l / r);
    }
    static NodePtr simplify(const NodePtr &, const NodePtr &l,
                            const NodePtr &r) {
        return detail::fold(Operator::Modulo, l, r);
    }
};

// ===== BINARY: comparisons =====
template <> struct OpTraits<Operator::Minimum> {
    static constexpr const char *name = "minimum";
    static constexpr int precedence = 100; // printed as a function call
    static constexpr bool overrides_diff = false;
    static Value evaluate(const Value &l, const Value &r) {
        return numeric::minimum(l, r);
    }
    // d min(l, r) = (l <= r) dl + (r < l) dr
    static NodePtr diff(const NodePtr &n, const NodePtr &v) {
        const auto &l = n->left();
        const auto &r = n->right();
        return equal_heaviside(l, r) * ::diff(l, v) +
               not_equal_heaviside(r, l) * ::diff(r, v);
    }
    static NodePtr jac(const NodePtr &n, const NodePtr &lj, const NodePtr &rj) {
        const auto &l = n->left();
        const auto &r = n->right();
        return equal_heaviside(l, r) * lj + not_equal_heaviside(r, l) * rj;
    }
    static NodePtr simplify(const NodePtr &, const NodePtr &l,
                            const NodePtr &r) {
        return detail::fold(Operator::Minimum, l, r);
    }
};

template <> struct OpTraits<Operator::Maximum> {
    static constexpr const char *name = "maximum";
    static constexpr int precedence = 100;
    static constexpr bool overrides_diff = false;
    static Value evaluate(const Value &l, const Value &r) {
        return numeric::maximum(l, r);
    }
    // d max(l, r) = (r <= l) dl + (l < r) dr
    static NodePtr diff(const NodePtr &n, const NodePtr &v) {
        const auto &l = n->left();
        const auto &r = n->right();
        return equal_heaviside(r, l) * ::diff(l, v) +
               not_equal_heaviside(l, r) * ::diff(r, v);
    }
    static NodePtr jac(const NodePtr &n, const NodePtr &lj, const NodePtr &rj) {
        const auto &l = n->left();
        const auto &r = n->right();
        return equal_heaviside(r, l) * lj + not_equal_heaviside(l, r) * rj;
    }
    static NodePtr simplify(const NodePtr &, const NodePtr &l,
                            const NodePtr &r) {
        return detail::fold(Operator::Maximum, l, r);
    }
};

template <> struct OpTraits<Operator::EqualHeaviside> {
    static constexpr const char *name = "<=";
    static constexpr int precedence = 0;
    static constexpr bool overrides_diff = true;
    static Value evaluate(const Value &l, const Value &r) {
        return numeric::less_equal(l, r);
    }
    // Step functions are treated as flat everywhere
    static NodePtr diff(const NodePtr &, const NodePtr &) {
        return detail::zero();
    }
    static NodePtr jac(const NodePtr &, const NodePtr &, const NodePtr &) {
        return detail::zero();
    }
    static NodePtr simplify(const NodePtr &, const NodePtr &l,
                            const NodePtr &r) {
        return detail::fold(Operator::EqualHeaviside, l, r);
    }
};

template <> struct OpTraits<Operator::NotEqualHeaviside> {
    static constexpr const char *name = "<";
    static constexpr int precedence = 0;
    static constexpr bool overrides_diff = true;
    static Value evaluate(const Value &l, const Value &r) {
        return numeric::less(l, r);
    }
    static NodePtr diff(const NodePtr &, const NodePtr &) {
        return detail::zero();
    }
    static NodePtr jac(const NodePtr &, const NodePtr &, const NodePtr &) {
        return detail::zero();
    }
    static NodePtr simplify(const NodePtr &, const NodePtr &l,
                            const NodePtr &r) {
        return detail::fold(Operator::NotEqualHeaviside, l, r);
    }
};

template <> struct OpTraits<Operator::Inner> {
    static constexpr const char *name = "inner product";
    static constexpr int precedence = 20;
    static constexpr bool overrides_diff = false;
    static Value evaluate(const Value &l, const Value &r) {
        return numeric::multiply(l, r);
    }
    static NodePtr diff(const NodePtr &n, const NodePtr &v) {
        const auto &l = n->left();
        const auto &r = n->right();
        return ::diff(l, v) * r + l * ::diff(r, v);
    }
    static NodePtr jac(const NodePtr &n, const NodePtr &lj, const NodePtr &rj) {
        const auto &l = n->left();
        const auto &r = n->right();
        if (detail::both_constant(l, r))
            return detail::zero();
        if (evaluates_to_constant_number(l))
            return l * rj;
        if (evaluates_to_constant_number(r))
            return r * lj;
        return r * lj + l * rj;
    }
    static NodePtr simplify(const NodePtr &, const NodePtr &l,
                            const NodePtr &r) {
        return simplify_multiplication_division(Operator::Inner, l, r);
    }
};

// ===== UNARY =====
template <> struct OpTraits<Operator::Negate> {
    static constexpr const char *name = "-";
    static Value evaluate(const Value &x) { return numeric::negate(x); }
    static Value shape(const Node &, const Value &x) {
        return numeric::negate(x);
    }
    static NodePtr diff(const NodePtr &n, const NodePtr &v) {
        return -::diff(n->child(), v);
    }
    static NodePtr jac(const NodePtr &, const NodePtr &cj) { return -cj; }
};

template <> struct OpTraits<Operator::Exp> {
    static constexpr const char *name = "exp";
    static Value evaluate(const Value &x) { return numeric::exp(x); }
    static Value shape(const Node &, const Value &x) { return numeric::exp(x); }
    static NodePtr diff(const NodePtr &n, const NodePtr &v) {
        return n * ::diff(n->child(), v);
    }
    static NodePtr jac(const NodePtr &n, const NodePtr &cj) { return n * cj; }
};

template <> struct OpTraits<Operator::Log> {
    static constexpr const char *name = "log";
    static Value evaluate(const Value &x) { return numeric::log(x); }
    static Value shape(const Node &, const Value &x) { return numeric::log(x); }
    static NodePtr diff(const NodePtr &n, const NodePtr &v) {
        return ::diff(n->child(), v) / n->child();
    }
    static NodePtr jac(const NodePtr &n, const NodePtr &cj) {
        return cj / n->child();
    }
};

template <> struct OpTraits<Operator::Tanh> {
    static constexpr const char *name = "tanh";
    static Value evaluate(const Value &x) { return numeric::tanh(x); }
    static Value shape(const Node &, const Value &x) {
        return numeric::tanh(x);
    }
    static NodePtr diff(const NodePtr &n, const NodePtr &v) {
        return (1.0 - power(n, 2)) * ::diff(n->child(), v);
    }
    static NodePtr jac(const NodePtr &n, const NodePtr &cj) {
        return (1.0 - power(n, 2)) * cj;
    }
};

template <> struct OpTraits<Operator::Floor> {
    static constexpr const char *name = "floor";
    static Value evaluate(const Value &x) { return numeric::floor(x); }
    static Value shape(const Node &, const Value &x) {
        return numeric::floor(x);
    }
    static NodePtr diff(const NodePtr &, const NodePtr &) {
        return detail::zero();
    }
    static NodePtr jac(const NodePtr &, const NodePtr &) {
        return detail::zero();
    }
};

template <> struct OpTraits<Operator::PrimaryBroadcast> {
    static constexpr const char *name = "broadcast";
    static Value evaluate(const Value &) {
        throw UnsupportedOperation(
            "cannot evaluate a broadcast before discretisation");
    }
    // one copy of the child per point of the broadcast domain
    static Value shape(const Node &n, const Value &x) {
        const Eigen::Index size =
            value_rows(x) * value_cols(x) * domain_size(n.domain);
        return detail::nan_like(dmat(size, 1));
    }
    static NodePtr diff(const NodePtr &n, const NodePtr &v) {
        return make_primary_broadcast(::diff(n->child(), v), n->domain);
    }
    static NodePtr jac(const NodePtr &, const NodePtr &) {
        throw UnsupportedOperation(
            "cannot compute the Jacobian of a broadcast before "
            "discretisation");
    }
};

template <> struct OpTraits<Operator::Mass> {
    static constexpr const char *name = "mass";
    static Value evaluate(const Value &) {
        throw UnsupportedOperation(
            "cannot evaluate a mass matrix before discretisation");
    }
    static Value shape(const Node &, const Value &x) {
        const Eigen::Index size = value_rows(x);
        return detail::nan_like(dmat(size, size));
    }
    static NodePtr diff(const NodePtr &, const NodePtr &) {
        throw UnsupportedOperation("diff not implemented for symbol of type "
                                   "'Mass'");
    }
    static NodePtr jac(const NodePtr &, const NodePtr &) {
        throw UnsupportedOperation("jac not implemented for symbol of type "
                                   "'Mass'");
    }
};

template <> struct OpTraits<Operator::BoundaryMass> {
    static constexpr const char *name = "boundary mass";
    static Value evaluate(const Value &) {
        throw UnsupportedOperation(
            "cannot evaluate a boundary mass matrix before discretisation");
    }
    static Value shape(const Node &, const Value &x) {
        const Eigen::Index size = value_rows(x);
        return detail::nan_like(dmat(size, size));
    }
    static NodePtr diff(const NodePtr &, const NodePtr &) {
        throw UnsupportedOperation("diff not implemented for symbol of type "
                                   "'BoundaryMass'");
    }
    static NodePtr jac(const NodePtr &, const NodePtr &) {
        throw UnsupportedOperation("jac not implemented for symbol of type "
                                   "'BoundaryMass'");
    }
};
