#include "../../include/symtree/BinaryOperators.h"
#include "../../include/symtree/Errors.h"
#include "../../include/symtree/OpDispatch.h"
#include "../../include/symtree/Operators.h"
#include "../../include/symtree/Simplify.h"
#include "../../include/symtree/UnaryOperators.h"

#include <fmt/core.h>

namespace {

const Domain kCurrentCollector{"current collector"};

std::shared_ptr<Node> construct_binary(Operator op, NodePtr left,
                                       NodePtr right) {
    auto n = allocate_node(op);
    n->domain = get_children_domains(left->domain, right->domain);
    n->auxiliary_domains = get_children_auxiliary_domains(left, right);
    n->children = {std::move(left), std::move(right)};
    return n;
}

bool is_comparison(Operator op) {
    return op == Operator::EqualHeaviside || op == Operator::NotEqualHeaviside;
}

// Right operand printed without parentheses at equal precedence
bool associates_right(Operator parent, Operator child) {
    if (parent == Operator::Add)
        return child == Operator::Add || child == Operator::Subtract;
    if (parent == Operator::Multiply)
        return child == Operator::Multiply || child == Operator::Divide;
    return parent == Operator::Power && child == Operator::Power;
}

std::string operand_string(const NodePtr &child, bool parenthesise) {
    if (parenthesise)
        return fmt::format("({})", to_string(child));
    return to_string(child);
}

} // namespace

// ============================================================================
// Construction
// ============================================================================
std::pair<NodePtr, NodePtr> format_children(Operator op, const Operand &left,
                                            const Operand &right) {
    NodePtr l = left.toNode();
    NodePtr r = right.toNode();
    if (SYMTREE_UNLIKELY(!l || !r))
        throw TypeError(fmt::format(
            "'{}' not implemented for operands of type {} and {}",
            binary_symbol(op), left.typeName(), right.typeName()));

    // Broadcast a child living on the other child's secondary domain
    if (!l->domain.empty() && !r->domain.empty()) {
        if (l->domain != r->domain) {
            auto it = r->auxiliary_domains.find("secondary");
            if (it != r->auxiliary_domains.end() && l->domain == it->second)
                l = make_primary_broadcast(l, r->domain);
        }
        if (r->domain != l->domain) {
            auto it = l->auxiliary_domains.find("secondary");
            if (it != l->auxiliary_domains.end() && r->domain == it->second)
                r = make_primary_broadcast(r, l->domain);
        }
    }
    return {std::move(l), std::move(r)};
}

Domain get_children_domains(const Domain &left, const Domain &right) {
    if (left == right || right.empty())
        return left;
    if (left.empty())
        return right;
    throw DomainError(fmt::format(
        "children must have same (or empty) domains, but left.domain is {} "
        "and right.domain is {}",
        domain_repr(left), domain_repr(right)));
}

AuxDomains get_children_auxiliary_domains(const NodePtr &left,
                                          const NodePtr &right) {
    AuxDomains out;
    for (const NodePtr *child : {&left, &right}) {
        for (const auto &[role, domain] : (*child)->auxiliary_domains) {
            auto it = out.find(role);
            if (it == out.end() || it->second.empty() || it->second == domain) {
                out[role] = domain;
            } else if (!domain.empty()) {
                throw DomainError(fmt::format(
                    "children must have same or empty auxiliary domains, not "
                    "{} and {}",
                    domain_repr(it->second), domain_repr(domain)));
            }
        }
    }
    return out;
}

NodePtr make_binary(Operator op, const Operand &left, const Operand &right) {
    if (!is_binary(op))
        throw std::invalid_argument(fmt::format(
            "make_binary: operator {} is not binary", static_cast<int>(op)));
    auto [l, r] = format_children(op, left, right);
    return construct_binary(op, std::move(l), std::move(r));
}

const char *binary_symbol(Operator op) {
    return dispatch_binary(op, BinaryNameFunctor{});
}

int print_precedence(const Node &node) {
    if (is_binary(node.type))
        return dispatch_binary(node.type, BinaryPrecedenceFunctor{});
    if (node.type == Operator::Negate)
        return 25;
    // a negative literal reads like a negation
    if (node.type == Operator::Scalar && node.name.empty() &&
        std::get<double>(node.data) < 0.0)
        return 25;
    return 100;
}

// ============================================================================
// Numeric passes
// ============================================================================
Value binary_combine(Operator op, const Value &left, const Value &right) {
    return dispatch_binary(op, BinaryEvaluateFunctor{left, right});
}

Value binary_evaluate(const NodePtr &node, const EvalState &state,
                      KnownEvals *known_evals) {
    if (!known_evals)
        return binary_combine(node->type, evaluate(node->left(), state),
                              evaluate(node->right(), state));

    auto it = known_evals->values.find(node->id);
    if (it != known_evals->values.end())
        return it->second;
    Value left = evaluate(node->left(), state, known_evals);
    Value right = evaluate(node->right(), state, known_evals);
    Value value = binary_combine(node->type, left, right);
    ++known_evals->binary_evaluations;
    known_evals->values.emplace(node->id, value);
    return value;
}

Value binary_evaluate_for_shape(const NodePtr &node) {
    return binary_combine(node->type, evaluate_for_shape(node->left()),
                          evaluate_for_shape(node->right()));
}

// ============================================================================
// Symbolic passes
// ============================================================================
NodePtr binary_diff(const NodePtr &node, const NodePtr &variable) {
    if (dispatch_binary(node->type, BinaryOverridesDiffFunctor{}))
        return dispatch_binary(node->type, BinaryDiffFunctor{node, variable});
    if (node->id == variable->id)
        return make_scalar(1.0);
    if (!contains(node, variable))
        return make_scalar(0.0);
    return dispatch_binary(node->type, BinaryDiffFunctor{node, variable});
}

NodePtr binary_jac(const NodePtr &node, const NodePtr &left_jac,
                   const NodePtr &right_jac) {
    return dispatch_binary(node->type,
                           BinaryJacFunctor{node, left_jac, right_jac});
}

NodePtr binary_new_copy(const NodePtr &node) {
    NodePtr out = construct_binary(node->type, new_copy(node->left()),
                                   new_copy(node->right()));
    return with_domains(out, node->domain, node->auxiliary_domains);
}

NodePtr binary_simplify(const NodePtr &node, const NodePtr &left,
                        const NodePtr &right) {
    return dispatch_binary(node->type, BinarySimplifyFunctor{node, left, right});
}

bool binary_evaluates_on_edges(const NodePtr &node,
                               const std::string &dimension) {
    if (node->type == Operator::Inner)
        return false;
    return evaluates_on_edges(node->left(), dimension) ||
           evaluates_on_edges(node->right(), dimension);
}

std::string binary_to_string(const NodePtr &node) {
    const auto &l = node->left();
    const auto &r = node->right();
    if (node->type == Operator::Minimum || node->type == Operator::Maximum)
        return fmt::format("{}({}, {})", binary_symbol(node->type),
                           to_string(l), to_string(r));

    const int p = print_precedence(*node);
    const int lp = print_precedence(*l);
    const int rp = print_precedence(*r);
    const bool strict = node->type == Operator::Power || is_comparison(node->type);
    const bool left_parens = lp < p || (lp == p && strict);
    const bool right_parens =
        rp < p || (rp == p && !associates_right(node->type, r->type));
    return fmt::format("{} {} {}", operand_string(l, left_parens),
                       binary_symbol(node->type), operand_string(r, right_parens));
}

// ============================================================================
// Factories
// ============================================================================
NodePtr minimum(const Operand &left, const Operand &right,
                const Settings &settings) {
    auto [l, r] = format_children(Operator::Minimum, left, right);
    const Smoothing &s = settings.min_smoothing;
    NodePtr out;
    if (s.exact || (is_constant(l) && is_constant(r)))
        out = construct_binary(Operator::Minimum, l, r);
    else {
        if (settings.verbose)
            fmt::print("minimum: smoothed with k = {}\n", s.k);
        out = softminus(l, r, s.k);
    }
    return simplify_if_constant(out, false);
}

NodePtr maximum(const Operand &left, const Operand &right,
                const Settings &settings) {
    auto [l, r] = format_children(Operator::Maximum, left, right);
    const Smoothing &s = settings.max_smoothing;
    NodePtr out;
    if (s.exact || (is_constant(l) && is_constant(r)))
        out = construct_binary(Operator::Maximum, l, r);
    else {
        if (settings.verbose)
            fmt::print("maximum: smoothed with k = {}\n", s.k);
        out = softplus(l, r, s.k);
    }
    return simplify_if_constant(out, false);
}

NodePtr softminus(const Operand &left, const Operand &right, double k) {
    auto [l, r] = format_children(Operator::Minimum, left, right);
    return log(exp(-k * l) + exp(-k * r)) / -k;
}

NodePtr softplus(const Operand &left, const Operand &right, double k) {
    auto [l, r] = format_children(Operator::Maximum, left, right);
    return log(exp(k * l) + exp(k * r)) / k;
}

NodePtr sigmoid(const Operand &left, const Operand &right, double k) {
    auto [l, r] = format_children(Operator::NotEqualHeaviside, left, right);
    return (1.0 + tanh(k * (r - l))) / 2.0;
}

NodePtr heaviside(const Operand &left, const Operand &right, bool equal,
                  const Settings &settings) {
    const Operator op =
        equal ? Operator::EqualHeaviside : Operator::NotEqualHeaviside;
    auto [l, r] = format_children(op, left, right);
    const Smoothing &s = settings.heaviside_smoothing;
    NodePtr out;
    if (s.exact || (is_constant(l) && is_constant(r)))
        out = construct_binary(op, l, r);
    else {
        if (settings.verbose)
            fmt::print("heaviside: smoothed with k = {}\n", s.k);
        out = sigmoid(l, r, s.k);
    }
    return simplify_if_constant(out, false);
}

NodePtr inner(const Operand &left, const Operand &right) {
    auto [l, r] = format_children(Operator::Inner, left, right);
    if (is_scalar_zero(l))
        return zeros_like(r);
    if (is_scalar_zero(r))
        return zeros_like(l);
    // a zero matrix keeps the shape of the whole product
    if (is_matrix_zero(l) || is_matrix_zero(r))
        return zeros_like(construct_binary(Operator::Inner, l, r));
    if (is_scalar_one(l))
        return r;
    if (is_scalar_one(r))
        return l;
    return simplify_if_constant(construct_binary(Operator::Inner, l, r), false);
}

NodePtr source(const Operand &left, const NodePtr &right, bool boundary) {
    NodePtr l = left.isNumber()
                    ? make_primary_broadcast(left.number(), kCurrentCollector)
                    : left.toNode();
    if (!l || !right)
        throw TypeError(fmt::format(
            "'source' not implemented for operands of type {} and {}",
            left.typeName(), Operand(right).typeName()));
    if (l->domain != kCurrentCollector || right->domain != kCurrentCollector)
        throw DomainError(fmt::format(
            "'source' only implemented in the 'current collector' domain, but "
            "symbols have domains {} and {}",
            domain_repr(l->domain), domain_repr(right->domain)));
    NodePtr m = boundary ? boundary_mass(right) : mass(right);
    return make_binary(Operator::MatMul, m, l);
}
