#pragma once

#include "Definitions.h"
#include "Node.h"
#include "Operand.h"

#include <string>

// ============================================================================
// Construction
// ============================================================================
// Negate, Exp, Log, Tanh, Floor, Mass, BoundaryMass. Domains are inherited
// from the child.
NodePtr make_unary(Operator op, const Operand &child);

// Broadcast `child` onto `broadcast_domain`. The child's domain becomes the
// "secondary" auxiliary domain of the result and its own "secondary" moves to
// "tertiary".
NodePtr make_primary_broadcast(const Operand &child,
                               const Domain &broadcast_domain);

NodePtr mass(const NodePtr &child);
NodePtr boundary_mass(const NodePtr &child);

// ============================================================================
// Passes over unary nodes (called by the drivers in Node.cpp)
// ============================================================================
Value unary_evaluate(const NodePtr &node, const EvalState &state,
                     KnownEvals *known_evals);
Value unary_evaluate_for_shape(const NodePtr &node);
NodePtr unary_diff(const NodePtr &node, const NodePtr &variable);
NodePtr unary_jac(const NodePtr &node, const NodePtr &child_jac);
NodePtr unary_new_copy(const NodePtr &node);
// Same operator over a replacement child, original domains kept
NodePtr unary_rebuild(const NodePtr &node, const NodePtr &child);
std::string unary_to_string(const NodePtr &node);
