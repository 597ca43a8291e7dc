#pragma once

#include "Definitions.h"
#include "Node.h"

#include <tsl/robin_map.h>

// ============================================================================
// Jacobian with respect to a StateVector. Results are expression trees whose
// evaluation gives an (n x m) matrix, usually sparse. Sub-results are cached
// per node identity for as long as the variable stays the same.
// ============================================================================
class Jacobian {
public:
    explicit Jacobian(bool verbose = false) : verbose_(verbose) {}

    NodePtr jac(const NodePtr &node, const NodePtr &variable);
    void clear() {
        known_jacs_.clear();
        variable_id_ = -1;
    }

private:
    NodePtr jac_(const NodePtr &node, const Node &variable);
    static NodePtr leaf_jac(const NodePtr &node, const Node &variable);

    tsl::robin_map<NodeId, NodePtr> known_jacs_;
    NodeId variable_id_ = -1;
    bool verbose_ = false;
};

NodePtr jacobian(const NodePtr &node, const NodePtr &variable);
