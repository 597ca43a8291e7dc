#pragma once

#include "Definitions.h"
#include "Node.h"

#include <tsl/robin_map.h>

// ============================================================================
// Constant folding helpers
// ============================================================================
// Replace a constant node by its value (Scalar or Array). Nodes that cannot
// be evaluated yet are returned unchanged.
NodePtr simplify_if_constant(const NodePtr &node, bool clear_domains = false);

// Flatten an add/subtract chain, fold its constant terms into one leading
// constant and drop a zero scalar
NodePtr simplify_addition_subtraction(Operator op, const NodePtr &left,
                                      const NodePtr &right);
// Flatten a multiply/divide chain and fold its constant factors into one
// leading constant. MatMul and Inner are handled without flattening.
NodePtr simplify_multiplication_division(Operator op, const NodePtr &left,
                                         const NodePtr &right);

// Zero of the same shape: Scalar 0 for numbers, an all-zero Array otherwise
NodePtr zeros_like(const NodePtr &node);

bool is_scalar_zero(const NodePtr &node);
bool is_scalar_one(const NodePtr &node);
bool is_matrix_zero(const NodePtr &node);

// ============================================================================
// Simplification: bottom-up rewrite of a whole tree, memoised by identity.
// ============================================================================
class Simplification {
public:
    explicit Simplification(bool verbose = false) : verbose_(verbose) {}

    NodePtr simplify(const NodePtr &node);
    void clear() { simplified_.clear(); }

private:
    NodePtr simplify_(const NodePtr &node);

    tsl::robin_map<NodeId, NodePtr> simplified_;
    bool verbose_ = false;
};

NodePtr simplify(const NodePtr &node);
