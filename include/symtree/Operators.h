#pragma once

#include "Definitions.h"
#include "Operand.h"

// ============================================================================
// Algebra on node handles. Each overload builds exactly one new node (no
// simplification), so derivative and Jacobian rules produce predictable trees.
// ============================================================================

// node ⊕ node
NodePtr operator+(const NodePtr &lhs, const NodePtr &rhs);
NodePtr operator-(const NodePtr &lhs, const NodePtr &rhs);
NodePtr operator*(const NodePtr &lhs, const NodePtr &rhs);
NodePtr operator/(const NodePtr &lhs, const NodePtr &rhs);
NodePtr operator%(const NodePtr &lhs, const NodePtr &rhs);

// node ⊕ double
NodePtr operator+(const NodePtr &lhs, double rhs);
NodePtr operator-(const NodePtr &lhs, double rhs);
NodePtr operator*(const NodePtr &lhs, double rhs);
NodePtr operator/(const NodePtr &lhs, double rhs);
NodePtr operator%(const NodePtr &lhs, double rhs);

// double ⊕ node
NodePtr operator+(double lhs, const NodePtr &rhs);
NodePtr operator-(double lhs, const NodePtr &rhs);
NodePtr operator*(double lhs, const NodePtr &rhs);
NodePtr operator/(double lhs, const NodePtr &rhs);
NodePtr operator%(double lhs, const NodePtr &rhs);

// Unary minus
NodePtr operator-(const NodePtr &x);

// -------- operators without a C++ spelling --------
NodePtr matmul(const Operand &lhs, const Operand &rhs);
NodePtr power(const Operand &base, const Operand &exponent);
NodePtr equal_heaviside(const Operand &lhs, const Operand &rhs);     // lhs <= rhs
NodePtr not_equal_heaviside(const Operand &lhs, const Operand &rhs); // lhs < rhs

// -------- elementwise functions --------
NodePtr exp(const NodePtr &x);
NodePtr log(const NodePtr &x);
NodePtr tanh(const NodePtr &x);
NodePtr floor(const NodePtr &x);
