#include "../../include/symtree/UnaryOperators.h"
#include "../../include/symtree/BinaryOperators.h"
#include "../../include/symtree/Errors.h"
#include "../../include/symtree/OpDispatch.h"

#include <fmt/core.h>

namespace {

NodePtr checked_child(Operator op, const Operand &child) {
    NodePtr c = child.toNode();
    if (!c)
        throw TypeError(fmt::format("'{}' not implemented for operand of type "
                                    "{}",
                                    dispatch_unary(op, UnaryNameFunctor{}),
                                    child.typeName()));
    return c;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================
NodePtr make_unary(Operator op, const Operand &child) {
    if (!is_unary(op) || op == Operator::PrimaryBroadcast)
        throw std::invalid_argument(
            "make_unary: use make_primary_broadcast for broadcasts");
    NodePtr c = checked_child(op, child);
    auto n = allocate_node(op);
    n->domain = c->domain;
    n->auxiliary_domains = c->auxiliary_domains;
    n->children = {std::move(c)};
    return n;
}

NodePtr make_primary_broadcast(const Operand &child,
                               const Domain &broadcast_domain) {
    NodePtr c = checked_child(Operator::PrimaryBroadcast, child);
    if (broadcast_domain.empty())
        throw DomainError("cannot broadcast onto an empty domain");
    auto n = allocate_node(Operator::PrimaryBroadcast);
    n->domain = broadcast_domain;
    if (!c->domain.empty()) {
        n->auxiliary_domains["secondary"] = c->domain;
        auto it = c->auxiliary_domains.find("secondary");
        if (it != c->auxiliary_domains.end())
            n->auxiliary_domains["tertiary"] = it->second;
    }
    n->children = {std::move(c)};
    return n;
}

NodePtr mass(const NodePtr &child) {
    return make_unary(Operator::Mass, child);
}

NodePtr boundary_mass(const NodePtr &child) {
    return make_unary(Operator::BoundaryMass, child);
}

// ============================================================================
// Passes
// ============================================================================
Value unary_evaluate(const NodePtr &node, const EvalState &state,
                     KnownEvals *known_evals) {
    if (known_evals) {
        auto it = known_evals->values.find(node->id);
        if (it != known_evals->values.end())
            return it->second;
    }
    Value x = evaluate(node->child(), state, known_evals);
    Value out = dispatch_unary(node->type, UnaryEvaluateFunctor{x});
    if (known_evals)
        known_evals->values.emplace(node->id, out);
    return out;
}

Value unary_evaluate_for_shape(const NodePtr &node) {
    Value x = evaluate_for_shape(node->child());
    return dispatch_unary(node->type, UnaryShapeFunctor{*node, x});
}

NodePtr unary_diff(const NodePtr &node, const NodePtr &variable) {
    return dispatch_unary(node->type, UnaryDiffFunctor{node, variable});
}

NodePtr unary_jac(const NodePtr &node, const NodePtr &child_jac) {
    return dispatch_unary(node->type, UnaryJacFunctor{node, child_jac});
}

NodePtr unary_rebuild(const NodePtr &node, const NodePtr &child) {
    NodePtr out = node->type == Operator::PrimaryBroadcast
                      ? make_primary_broadcast(child, node->domain)
                      : make_unary(node->type, child);
    return with_domains(out, node->domain, node->auxiliary_domains);
}

NodePtr unary_new_copy(const NodePtr &node) {
    return unary_rebuild(node, new_copy(node->child()));
}

std::string unary_to_string(const NodePtr &node) {
    const auto &c = node->child();
    if (node->type == Operator::Negate) {
        // -x binds tighter than * and looser than **
        constexpr int negate_precedence = 25;
        if (print_precedence(*c) <= negate_precedence)
            return fmt::format("-({})", to_string(c));
        return fmt::format("-{}", to_string(c));
    }
    return fmt::format("{}({})", dispatch_unary(node->type, UnaryNameFunctor{}),
                       to_string(c));
}
