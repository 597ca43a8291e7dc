#pragma once

#include "Errors.h"
#include "OpTraits.h"

#include <fmt/core.h>

#include <string>

// ============================================================================
// Functors forwarding to OpTraits<Op>
// ============================================================================
struct BinaryEvaluateFunctor {
    const Value &l;
    const Value &r;
    template <Operator Op> inline Value operator()() const {
        return OpTraits<Op>::evaluate(l, r);
    }
};

struct BinaryDiffFunctor {
    const NodePtr &n;
    const NodePtr &v;
    template <Operator Op> inline NodePtr operator()() const {
        return OpTraits<Op>::diff(n, v);
    }
};

struct BinaryOverridesDiffFunctor {
    template <Operator Op> inline bool operator()() const {
        return OpTraits<Op>::overrides_diff;
    }
};

struct BinaryJacFunctor {
    const NodePtr &n;
    const NodePtr &lj;
    const NodePtr &rj;
    template <Operator Op> inline NodePtr operator()() const {
        return OpTraits<Op>::jac(n, lj, rj);
    }
};

struct BinarySimplifyFunctor {
    const NodePtr &n;
    const NodePtr &l;
    const NodePtr &r;
    template <Operator Op> inline NodePtr operator()() const {
        return OpTraits<Op>::simplify(n, l, r);
    }
};

struct BinaryNameFunctor {
    template <Operator Op> inline const char *operator()() const {
        return OpTraits<Op>::name;
    }
};

struct BinaryPrecedenceFunctor {
    template <Operator Op> inline int operator()() const {
        return OpTraits<Op>::precedence;
    }
};

struct UnaryEvaluateFunctor {
    const Value &x;
    template <Operator Op> inline Value operator()() const {
        return OpTraits<Op>::evaluate(x);
    }
};

struct UnaryShapeFunctor {
    const Node &n;
    const Value &x;
    template <Operator Op> inline Value operator()() const {
        return OpTraits<Op>::shape(n, x);
    }
};

struct UnaryDiffFunctor {
    const NodePtr &n;
    const NodePtr &v;
    template <Operator Op> inline NodePtr operator()() const {
        return OpTraits<Op>::diff(n, v);
    }
};

struct UnaryJacFunctor {
    const NodePtr &n;
    const NodePtr &cj;
    template <Operator Op> inline NodePtr operator()() const {
        return OpTraits<Op>::jac(n, cj);
    }
};

struct UnaryNameFunctor {
    template <Operator Op> inline const char *operator()() const {
        return OpTraits<Op>::name;
    }
};

// ============================================================================
// Dispatch: one case per operator, every specialisation must exist
// ============================================================================
template <typename Fn> inline decltype(auto) dispatch_binary(Operator op, Fn &&fn) {
    switch (op) {
    case Operator::Add: return fn.template operator()<Operator::Add>();
    case Operator::Subtract: return fn.template operator()<Operator::Subtract>();
    case Operator::Multiply: return fn.template operator()<Operator::Multiply>();
    case Operator::MatMul: return fn.template operator()<Operator::MatMul>();
    case Operator::Divide: return fn.template operator()<Operator::Divide>();
    case Operator::Power: return fn.template operator()<Operator::Power>();
    case Operator::Modulo: return fn.template operator()<Operator::Modulo>();
    case Operator::Minimum: return fn.template operator()<Operator::Minimum>();
    case Operator::Maximum: return fn.template operator()<Operator::Maximum>();
    case Operator::EqualHeaviside: return fn.template operator()<Operator::EqualHeaviside>();
    case Operator::NotEqualHeaviside: return fn.template operator()<Operator::NotEqualHeaviside>();
    case Operator::Inner: return fn.template operator()<Operator::Inner>();
    default:
        throw std::invalid_argument(fmt::format(
            "operator {} is not binary", static_cast<int>(op)));
    }
}

template <typename Fn> inline decltype(auto) dispatch_unary(Operator op, Fn &&fn) {
    switch (op) {
    case Operator::Negate: return fn.template operator()<Operator::Negate>();
    case Operator::Exp: return fn.template operator()<Operator::Exp>();
    case Operator::Log: return fn.template operator()<Operator::Log>();
    case Operator::Tanh: return fn.template operator()<Operator::Tanh>();
    case Operator::Floor: return fn.template operator()<Operator::Floor>();
    case Operator::PrimaryBroadcast: return fn.template operator()<Operator::PrimaryBroadcast>();
    case Operator::Mass: return fn.template operator()<Operator::Mass>();
    case Operator::BoundaryMass: return fn.template operator()<Operator::BoundaryMass>();
    default:
        throw std::invalid_argument(fmt::format(
            "operator {} is not unary", static_cast<int>(op)));
    }
}
