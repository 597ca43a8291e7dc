#pragma once

#include "Definitions.h"
#include "Value.h"

#include <tsl/robin_map.h>

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// ============================================================================
// Node (immutable record; children are shared, never deep-copied implicitly)
// ============================================================================
struct Node {
    Operator type = Operator::NA;
    std::string name;
    NodeId id = -1; // process-unique identity

    Domain domain;
    AuxDomains auxiliary_domains;

    std::vector<NodePtr> children;

    // Leaf payloads
    Value data = 0.0;                       // Scalar / Array
    Eigen::Index start = 0, stop = 0;       // StateVector slice [start, stop)
    std::vector<std::string> edge_dimensions; // dimensions evaluated on edges

    const NodePtr &left() const { return children[0]; }
    const NodePtr &right() const { return children[1]; }
    const NodePtr &child() const { return children[0]; }
};

// ============================================================================
// Evaluation context
// ============================================================================
using InputMap = std::unordered_map<std::string, double>;

struct EvalState {
    double t = 0.0;
    const dvec *y = nullptr;
    const dvec *y_dot = nullptr;
    const InputMap *inputs = nullptr;
};

// Request-scoped memo: node identity -> value. Must not be reused across
// different (t, y, inputs) tuples.
struct KnownEvals {
    tsl::robin_map<NodeId, Value> values;
    std::size_t binary_evaluations = 0; // operator combinator invocations
};

// ============================================================================
// Allocation
// ============================================================================
// Fresh mutable record with a new identity; becomes immutable once published
// as a NodePtr.
std::shared_ptr<Node> allocate_node(Operator type);

// Shallow clone of `node` carrying the given domains (same node if unchanged)
NodePtr with_domains(const NodePtr &node, const Domain &domain,
                     const AuxDomains &auxiliary_domains);

// ============================================================================
// Leaves
// ============================================================================
NodePtr make_scalar(double value, const std::string &name = "",
                    const Domain &domain = {});
NodePtr make_array(Value data, const std::string &name = "",
                   const Domain &domain = {},
                   const AuxDomains &auxiliary_domains = {});
NodePtr make_state_vector(Eigen::Index start, Eigen::Index stop,
                          const Domain &domain = {},
                          const AuxDomains &auxiliary_domains = {});
NodePtr make_variable(const std::string &name, const Domain &domain = {},
                      const AuxDomains &auxiliary_domains = {},
                      std::vector<std::string> edge_dimensions = {});
NodePtr make_time();
NodePtr make_input_parameter(const std::string &name);

// ============================================================================
// Tree queries
// ============================================================================
// Pre-order traversal; a shared subtree is visited once per parent
std::vector<NodePtr> pre_order(const NodePtr &node);
// true if `variable` (by identity) appears anywhere below and including node
bool contains(const NodePtr &node, const NodePtr &variable);
// Number of distinct nodes reachable from `node`
std::size_t count_nodes(const NodePtr &node);

bool is_constant(const NodePtr &node);
bool evaluates_to_number(const NodePtr &node);
bool evaluates_to_constant_number(const NodePtr &node);
bool evaluates_on_edges(const NodePtr &node, const std::string &dimension);

// Placeholder size used for shape inference on an undiscretised domain
Eigen::Index domain_size(const Domain &domain);
// "['a', 'b']", for error messages
std::string domain_repr(const Domain &domain);

// ============================================================================
// Passes
// ============================================================================
Value evaluate(const NodePtr &node, const EvalState &state = {},
               KnownEvals *known_evals = nullptr);
Value evaluate_for_shape(const NodePtr &node);
// Constant subtrees that cannot be evaluated before discretisation yield
// std::nullopt instead of throwing UnsupportedOperation
std::optional<Value> evaluate_ignoring_errors(const NodePtr &node);

NodePtr diff(const NodePtr &node, const NodePtr &variable);
NodePtr new_copy(const NodePtr &node);
std::string to_string(const NodePtr &node);
