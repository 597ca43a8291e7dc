#include "../../include/symtree/Operators.h"
#include "../../include/symtree/BinaryOperators.h"
#include "../../include/symtree/Node.h"
#include "../../include/symtree/UnaryOperators.h"

#include <fmt/core.h>

// ============================================================================
// Operand
// ============================================================================
NodePtr Operand::toNode() const {
    if (isNumber())
        return make_scalar(number());
    return std::get<NodePtr>(value_);
}

std::string Operand::typeName() const {
    if (isNumber())
        return "number";
    const auto &node = std::get<NodePtr>(value_);
    if (!node)
        return "null";
    return fmt::format("Symbol '{}'", to_string(node));
}

// ============================================================================
// Overloads
// ============================================================================
#define SYMTREE_BINARY_OVERLOADS(SYM, OP)                                      \
    NodePtr operator SYM(const NodePtr &lhs, const NodePtr &rhs) {             \
        return make_binary(Operator::OP, lhs, rhs);                            \
    }                                                                          \
    NodePtr operator SYM(const NodePtr &lhs, double rhs) {                     \
        return make_binary(Operator::OP, lhs, rhs);                            \
    }                                                                          \
    NodePtr operator SYM(double lhs, const NodePtr &rhs) {                     \
        return make_binary(Operator::OP, lhs, rhs);                            \
    }

SYMTREE_BINARY_OVERLOADS(+, Add)
SYMTREE_BINARY_OVERLOADS(-, Subtract)
SYMTREE_BINARY_OVERLOADS(*, Multiply)
SYMTREE_BINARY_OVERLOADS(/, Divide)
SYMTREE_BINARY_OVERLOADS(%, Modulo)

#undef SYMTREE_BINARY_OVERLOADS

NodePtr operator-(const NodePtr &x) { return make_unary(Operator::Negate, x); }

NodePtr matmul(const Operand &lhs, const Operand &rhs) {
    return make_binary(Operator::MatMul, lhs, rhs);
}

NodePtr power(const Operand &base, const Operand &exponent) {
    return make_binary(Operator::Power, base, exponent);
}

NodePtr equal_heaviside(const Operand &lhs, const Operand &rhs) {
    return make_binary(Operator::EqualHeaviside, lhs, rhs);
}

NodePtr not_equal_heaviside(const Operand &lhs, const Operand &rhs) {
    return make_binary(Operator::NotEqualHeaviside, lhs, rhs);
}

NodePtr exp(const NodePtr &x) { return make_unary(Operator::Exp, x); }
NodePtr log(const NodePtr &x) { return make_unary(Operator::Log, x); }
NodePtr tanh(const NodePtr &x) { return make_unary(Operator::Tanh, x); }
NodePtr floor(const NodePtr &x) { return make_unary(Operator::Floor, x); }
