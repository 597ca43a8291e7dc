#include "../../include/symtree/Node.h"
#include "../../include/symtree/BinaryOperators.h"
#include "../../include/symtree/Errors.h"
#include "../../include/symtree/UnaryOperators.h"

#include <fmt/core.h>

#include <tsl/robin_set.h>

#include <atomic>
#include <limits>

namespace {

std::atomic<NodeId> next_id_{0};

// Points per domain label used for shape inference before discretisation
constexpr Eigen::Index kPointsPerDomain = 10;

Eigen::Index shape_size(const Domain &domain,
                        const AuxDomains &auxiliary_domains) {
    Eigen::Index size = domain_size(domain);
    for (const auto &[role, aux] : auxiliary_domains)
        if (!aux.empty())
            size *= domain_size(aux);
    return size;
}

Value nan_column(Eigen::Index rows) {
    return dmat(dmat::Constant(rows, 1, std::numeric_limits<double>::quiet_NaN()));
}

Value leaf_evaluate(const Node &n, const EvalState &state) {
    switch (n.type) {
    case Operator::Scalar:
    case Operator::Array:
        return n.data;
    case Operator::StateVector: {
        if (!state.y)
            throw std::invalid_argument(fmt::format(
                "cannot evaluate '{}' without a state vector y",
                n.name.empty() ? "StateVector" : n.name));
        if (n.stop > state.y->size())
            throw ShapeError(fmt::format(
                "state vector slice [{}:{}] exceeds y of size {}", n.start,
                n.stop, state.y->size()));
        return dmat(state.y->segment(n.start, n.stop - n.start));
    }
    case Operator::Time:
        return state.t;
    case Operator::InputParameter: {
        if (!state.inputs)
            throw std::invalid_argument(fmt::format(
                "input parameter '{}' not found", n.name));
        auto it = state.inputs->find(n.name);
        if (it == state.inputs->end())
            throw std::invalid_argument(fmt::format(
                "input parameter '{}' not found", n.name));
        return it->second;
    }
    case Operator::Variable:
        throw UnsupportedOperation(fmt::format(
            "cannot evaluate variable '{}' before discretisation", n.name));
    default:
        throw std::invalid_argument("leaf_evaluate: not a leaf");
    }
}

Value leaf_evaluate_for_shape(const Node &n) {
    switch (n.type) {
    case Operator::StateVector:
        return nan_column(n.stop - n.start);
    case Operator::Variable:
        if (n.domain.empty())
            return std::numeric_limits<double>::quiet_NaN();
        return nan_column(shape_size(n.domain, n.auxiliary_domains));
    case Operator::Time:
        return 0.0;
    case Operator::InputParameter:
        return std::numeric_limits<double>::quiet_NaN();
    default:
        return n.data;
    }
}

std::string leaf_to_string(const Node &n) {
    if (!n.name.empty())
        return n.name;
    switch (n.type) {
    case Operator::Scalar:
        return fmt::format("{}", std::get<double>(n.data));
    case Operator::Array:
        return fmt::format("Array of shape ({}, {})", value_rows(n.data),
                           value_cols(n.data));
    case Operator::StateVector:
        return fmt::format("y[{}:{}]", n.start, n.stop);
    case Operator::Time:
        return "t";
    default:
        return "?";
    }
}

void collect(const NodePtr &node, tsl::robin_set<NodeId> &seen) {
    if (!seen.insert(node->id).second)
        return;
    for (const auto &c : node->children)
        collect(c, seen);
}

bool find_id(const NodePtr &node, NodeId id, tsl::robin_set<NodeId> &seen) {
    if (node->id == id)
        return true;
    if (!seen.insert(node->id).second)
        return false;
    for (const auto &c : node->children)
        if (find_id(c, id, seen))
            return true;
    return false;
}

// A node already in `seen` was fully visited and found constant
bool constant_below(const NodePtr &node, tsl::robin_set<NodeId> &seen) {
    switch (node->type) {
    case Operator::StateVector:
    case Operator::Variable:
    case Operator::Time:
    case Operator::InputParameter:
        return false;
    default:
        break;
    }
    for (const auto &c : node->children)
        if (seen.insert(c->id).second && !constant_below(c, seen))
            return false;
    return true;
}

} // namespace

// ============================================================================
// Allocation
// ============================================================================
std::shared_ptr<Node> allocate_node(Operator type) {
    auto n = std::make_shared<Node>();
    n->type = type;
    n->id = next_id_.fetch_add(1, std::memory_order_relaxed);
    return n;
}

NodePtr with_domains(const NodePtr &node, const Domain &domain,
                     const AuxDomains &auxiliary_domains) {
    if (node->domain == domain && node->auxiliary_domains == auxiliary_domains)
        return node;
    auto out = allocate_node(node->type);
    const NodeId id = out->id;
    *out = *node;
    out->id = id;
    out->domain = domain;
    out->auxiliary_domains = auxiliary_domains;
    return out;
}

// ============================================================================
// Leaves
// ============================================================================
NodePtr make_scalar(double value, const std::string &name,
                    const Domain &domain) {
    auto n = allocate_node(Operator::Scalar);
    n->data = value;
    n->name = name;
    n->domain = domain;
    return n;
}

NodePtr make_array(Value data, const std::string &name, const Domain &domain,
                   const AuxDomains &auxiliary_domains) {
    auto n = allocate_node(Operator::Array);
    // arrays are always two dimensional
    if (is_scalar(data))
        data = to_dense(data);
    n->data = std::move(data);
    n->name = name;
    n->domain = domain;
    n->auxiliary_domains = auxiliary_domains;
    return n;
}

NodePtr make_state_vector(Eigen::Index start, Eigen::Index stop,
                          const Domain &domain,
                          const AuxDomains &auxiliary_domains) {
    if (start < 0 || stop <= start)
        throw std::invalid_argument(fmt::format(
            "invalid state vector slice [{}:{}]", start, stop));
    auto n = allocate_node(Operator::StateVector);
    n->start = start;
    n->stop = stop;
    n->domain = domain;
    n->auxiliary_domains = auxiliary_domains;
    return n;
}

NodePtr make_variable(const std::string &name, const Domain &domain,
                      const AuxDomains &auxiliary_domains,
                      std::vector<std::string> edge_dimensions) {
    auto n = allocate_node(Operator::Variable);
    n->name = name;
    n->domain = domain;
    n->auxiliary_domains = auxiliary_domains;
    n->edge_dimensions = std::move(edge_dimensions);
    return n;
}

NodePtr make_time() { return allocate_node(Operator::Time); }

NodePtr make_input_parameter(const std::string &name) {
    auto n = allocate_node(Operator::InputParameter);
    n->name = name;
    return n;
}

// ============================================================================
// Tree queries
// ============================================================================
std::vector<NodePtr> pre_order(const NodePtr &node) {
    std::vector<NodePtr> out;
    std::vector<NodePtr> stack{node};
    while (!stack.empty()) {
        NodePtr n = std::move(stack.back());
        stack.pop_back();
        for (auto it = n->children.rbegin(); it != n->children.rend(); ++it)
            stack.push_back(*it);
        out.push_back(std::move(n));
    }
    return out;
}

bool contains(const NodePtr &node, const NodePtr &variable) {
    tsl::robin_set<NodeId> seen;
    return find_id(node, variable->id, seen);
}

std::size_t count_nodes(const NodePtr &node) {
    tsl::robin_set<NodeId> seen;
    collect(node, seen);
    return seen.size();
}

bool is_constant(const NodePtr &node) {
    tsl::robin_set<NodeId> seen;
    return constant_below(node, seen);
}

bool evaluates_to_number(const NodePtr &node) {
    return is_scalar(evaluate_for_shape(node));
}

bool evaluates_to_constant_number(const NodePtr &node) {
    return is_constant(node) && evaluates_to_number(node);
}

bool evaluates_on_edges(const NodePtr &node, const std::string &dimension) {
    if (is_binary(node->type))
        return binary_evaluates_on_edges(node, dimension);
    if (is_unary(node->type))
        return evaluates_on_edges(node->child(), dimension);
    for (const auto &d : node->edge_dimensions)
        if (d == dimension)
            return true;
    return false;
}

Eigen::Index domain_size(const Domain &domain) {
    if (domain.empty())
        return 1;
    return kPointsPerDomain * static_cast<Eigen::Index>(domain.size());
}

std::string domain_repr(const Domain &domain) {
    std::string out = "[";
    for (std::size_t i = 0; i < domain.size(); ++i) {
        if (i)
            out += ", ";
        out += fmt::format("'{}'", domain[i]);
    }
    return out + "]";
}

// ============================================================================
// Pass drivers
// ============================================================================
Value evaluate(const NodePtr &node, const EvalState &state,
               KnownEvals *known_evals) {
    if (is_binary(node->type))
        return binary_evaluate(node, state, known_evals);
    if (is_unary(node->type))
        return unary_evaluate(node, state, known_evals);
    return leaf_evaluate(*node, state);
}

Value evaluate_for_shape(const NodePtr &node) {
    if (is_binary(node->type))
        return binary_evaluate_for_shape(node);
    if (is_unary(node->type))
        return unary_evaluate_for_shape(node);
    return leaf_evaluate_for_shape(*node);
}

std::optional<Value> evaluate_ignoring_errors(const NodePtr &node) {
    try {
        return evaluate(node);
    } catch (const UnsupportedOperation &) {
        return std::nullopt;
    }
}

NodePtr diff(const NodePtr &node, const NodePtr &variable) {
    if (!node || !variable)
        throw TypeError("diff: null node");
    if (is_binary(node->type))
        return binary_diff(node, variable);
    if (node->id == variable->id)
        return make_scalar(1.0);
    if (!contains(node, variable))
        return make_scalar(0.0);
    if (is_unary(node->type))
        return unary_diff(node, variable);
    return make_scalar(0.0);
}

NodePtr new_copy(const NodePtr &node) {
    if (is_binary(node->type))
        return binary_new_copy(node);
    if (is_unary(node->type))
        return unary_new_copy(node);
    return node;
}

std::string to_string(const NodePtr &node) {
    if (is_binary(node->type))
        return binary_to_string(node);
    if (is_unary(node->type))
        return unary_to_string(node);
    return leaf_to_string(*node);
}
