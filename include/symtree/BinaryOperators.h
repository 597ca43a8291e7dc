#pragma once

#include "Definitions.h"
#include "Node.h"
#include "Operand.h"
#include "Settings.h"

#include <string>
#include <utility>

// ============================================================================
// Construction
// ============================================================================
// Convert numbers to Scalar leaves and broadcast a child whose domain equals
// the other child's "secondary" auxiliary domain. Throws TypeError when
// either operand is a null handle.
std::pair<NodePtr, NodePtr> format_children(Operator op, const Operand &left,
                                            const Operand &right);

// Equal domains, or the non-empty one; DomainError otherwise
Domain get_children_domains(const Domain &left, const Domain &right);
// Role-wise merge; DomainError when a role carries two different non-empty
// domains
AuxDomains get_children_auxiliary_domains(const NodePtr &left,
                                          const NodePtr &right);

// Build one binary node (no simplification)
NodePtr make_binary(Operator op, const Operand &left, const Operand &right);

// Printable symbol of a binary operator ("+", "mod", "minimum", ...)
const char *binary_symbol(Operator op);
// Binding strength used when printing; leaves and function calls bind tightest
int print_precedence(const Node &node);

// ============================================================================
// Passes over binary nodes (called by the drivers in Node.cpp)
// ============================================================================
// Numeric combinator of `op` applied to already evaluated children
Value binary_combine(Operator op, const Value &left, const Value &right);

Value binary_evaluate(const NodePtr &node, const EvalState &state,
                      KnownEvals *known_evals);
Value binary_evaluate_for_shape(const NodePtr &node);
NodePtr binary_diff(const NodePtr &node, const NodePtr &variable);
NodePtr binary_jac(const NodePtr &node, const NodePtr &left_jac,
                   const NodePtr &right_jac);
NodePtr binary_new_copy(const NodePtr &node);
NodePtr binary_simplify(const NodePtr &node, const NodePtr &left,
                        const NodePtr &right);
bool binary_evaluates_on_edges(const NodePtr &node,
                               const std::string &dimension);
std::string binary_to_string(const NodePtr &node);

// ============================================================================
// Factories
// ============================================================================
// Exact Minimum/Maximum node, or a smooth approximation when the settings ask
// for one and either side is non-constant. Constant results are folded.
NodePtr minimum(const Operand &left, const Operand &right,
                const Settings &settings = {});
NodePtr maximum(const Operand &left, const Operand &right,
                const Settings &settings = {});

// log(exp(-k*l) + exp(-k*r)) / -k
NodePtr softminus(const Operand &left, const Operand &right, double k);
// log(exp(k*l) + exp(k*r)) / k
NodePtr softplus(const Operand &left, const Operand &right, double k);
// (1 + tanh(k*(r - l))) / 2, a smooth step for l < r
NodePtr sigmoid(const Operand &left, const Operand &right, double k);

// l <= r (equal) or l < r, exact or through sigmoid()
NodePtr heaviside(const Operand &left, const Operand &right, bool equal,
                  const Settings &settings = {});

// Inner product with zero and one short-circuits
NodePtr inner(const Operand &left, const Operand &right);

// Finite-element source term in the current collector: mass(right) @ left.
// A numeric `left` is broadcast onto the current collector first.
NodePtr source(const Operand &left, const NodePtr &right,
               bool boundary = false);
