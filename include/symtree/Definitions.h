#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#define SYMTREE_LIKELY(x) __builtin_expect(!!(x), 1)
#define SYMTREE_UNLIKELY(x) __builtin_expect(!!(x), 0)

struct Node;

using NodePtr = std::shared_ptr<const Node>;
using NodeId = std::int64_t;

// Ordered list of spatial-domain labels
using Domain = std::vector<std::string>;
// Domain role ("secondary", "tertiary", ...) -> domain labels
using AuxDomains = std::map<std::string, Domain>;

enum class Operator {
    NA = 0,
    // leaves
    Scalar,
    Array,
    StateVector,
    Variable,
    Time,
    InputParameter,
    // unary
    Negate,
    Exp,
    Log,
    Tanh,
    Floor,
    PrimaryBroadcast,
    Mass,
    BoundaryMass,
    // binary
    Add,
    Subtract,
    Multiply,
    MatMul,
    Divide,
    Power,
    Modulo,
    Minimum,
    Maximum,
    EqualHeaviside,
    NotEqualHeaviside,
    Inner
};

constexpr bool is_leaf(Operator op) noexcept {
    return op >= Operator::Scalar && op <= Operator::InputParameter;
}
constexpr bool is_unary(Operator op) noexcept {
    return op >= Operator::Negate && op <= Operator::BoundaryMass;
}
constexpr bool is_binary(Operator op) noexcept {
    return op >= Operator::Add && op <= Operator::Inner;
}

