#include "../../include/symtree/Simplify.h"
#include "../../include/symtree/BinaryOperators.h"
#include "../../include/symtree/Operators.h"
#include "../../include/symtree/UnaryOperators.h"

#include <fmt/core.h>

#include <optional>
#include <vector>

namespace {

NodePtr value_node(const Value &v, const Domain &domain = {},
                   const AuxDomains &auxiliary_domains = {}) {
    if (is_scalar(v))
        return make_scalar(std::get<double>(v), "", domain);
    return make_array(v, "", domain, auxiliary_domains);
}

std::optional<Value> constant_value(const NodePtr &node) {
    if (!is_constant(node))
        return std::nullopt;
    return evaluate_ignoring_errors(node);
}

struct Term {
    NodePtr node;
    bool negative;
};

void flatten_sum(Operator op, const NodePtr &left, const NodePtr &right,
                 bool negated, std::vector<Term> &terms);

void push_term(const NodePtr &node, bool negative, std::vector<Term> &terms) {
    if (node->type == Operator::Add || node->type == Operator::Subtract)
        flatten_sum(node->type, node->left(), node->right(), negative, terms);
    else
        terms.push_back({node, negative});
}

void flatten_sum(Operator op, const NodePtr &left, const NodePtr &right,
                 bool negated, std::vector<Term> &terms) {
    push_term(left, negated, terms);
    push_term(right, negated != (op == Operator::Subtract), terms);
}

struct Factor {
    NodePtr node;
    bool inverted;
};

void flatten_product(Operator op, const NodePtr &left, const NodePtr &right,
                     bool inverted, std::vector<Factor> &factors);

void push_factor(const NodePtr &node, bool inverted,
                 std::vector<Factor> &factors) {
    if (node->type == Operator::Multiply || node->type == Operator::Divide)
        flatten_product(node->type, node->left(), node->right(), inverted,
                        factors);
    else
        factors.push_back({node, inverted});
}

void flatten_product(Operator op, const NodePtr &left, const NodePtr &right,
                     bool inverted, std::vector<Factor> &factors) {
    push_factor(left, inverted, factors);
    push_factor(right, inverted != (op == Operator::Divide), factors);
}

} // namespace

// ============================================================================
// Constant folding helpers
// ============================================================================
NodePtr simplify_if_constant(const NodePtr &node, bool clear_domains) {
    if (node->type == Operator::Scalar || node->type == Operator::Array)
        return node;
    if (!is_constant(node))
        return node;
    auto result = evaluate_ignoring_errors(node);
    if (!result)
        return node;
    if (clear_domains)
        return value_node(*result);
    return value_node(*result, node->domain, node->auxiliary_domains);
}

NodePtr simplify_addition_subtraction(Operator op, const NodePtr &left,
                                      const NodePtr &right) {
    std::vector<Term> terms;
    flatten_sum(op, left, right, false, terms);

    std::optional<Value> constant;
    std::vector<Term> others;
    for (const auto &term : terms) {
        auto v = constant_value(term.node);
        if (!v) {
            others.push_back(term);
            continue;
        }
        if (!constant)
            constant = term.negative ? numeric::negate(*v) : *v;
        else if (term.negative)
            constant = numeric::subtract(*constant, *v);
        else
            constant = numeric::add(*constant, *v);
    }

    NodePtr out;
    const bool zero_constant = constant && is_scalar(*constant) &&
                               std::get<double>(*constant) == 0.0;
    if (constant && !(zero_constant && !others.empty()))
        out = value_node(*constant);
    for (const auto &term : others) {
        if (!out)
            out = term.negative ? -term.node : term.node;
        else
            out = make_binary(term.negative ? Operator::Subtract : Operator::Add,
                              out, term.node);
    }
    return out;
}

NodePtr simplify_multiplication_division(Operator op, const NodePtr &left,
                                         const NodePtr &right) {
    if (op == Operator::Inner)
        return inner(left, right);
    if (op != Operator::Multiply && op != Operator::Divide)
        return simplify_if_constant(make_binary(op, left, right), false);

    std::vector<Factor> factors;
    flatten_product(op, left, right, false, factors);

    double folded = 1.0;
    bool have_constant = false;
    std::vector<Factor> others;
    for (const auto &factor : factors) {
        std::optional<Value> v;
        if (evaluates_to_constant_number(factor.node))
            v = evaluate_ignoring_errors(factor.node);
        if (!v) {
            others.push_back(factor);
            continue;
        }
        const double x = as_double(*v);
        folded = factor.inverted ? folded / x : folded * x;
        have_constant = true;
    }

    if (others.empty())
        return make_scalar(folded);
    if (have_constant && folded == 0.0)
        return zeros_like(make_binary(op, left, right));

    NodePtr numerator;
    if (have_constant && folded != 1.0)
        numerator = make_scalar(folded);
    NodePtr denominator;
    for (const auto &factor : others) {
        NodePtr &target = factor.inverted ? denominator : numerator;
        target = target ? make_binary(Operator::Multiply, target, factor.node)
                        : factor.node;
    }
    if (!numerator)
        numerator = make_scalar(1.0);
    NodePtr out = denominator
                      ? make_binary(Operator::Divide, numerator, denominator)
                      : numerator;
    return simplify_if_constant(out, false);
}

NodePtr zeros_like(const NodePtr &node) {
    if (evaluates_to_number(node))
        return make_scalar(0.0);
    return make_array(filled_like(evaluate_for_shape(node), 0.0), "",
                      node->domain, node->auxiliary_domains);
}

bool is_scalar_zero(const NodePtr &node) {
    auto v = constant_value(node);
    return v && is_scalar(*v) && std::get<double>(*v) == 0.0;
}

bool is_scalar_one(const NodePtr &node) {
    auto v = constant_value(node);
    return v && is_scalar(*v) && std::get<double>(*v) == 1.0;
}

bool is_matrix_zero(const NodePtr &node) {
    auto v = constant_value(node);
    return v && !is_scalar(*v) && is_all_zero(*v);
}

// ============================================================================
// Simplification
// ============================================================================
NodePtr Simplification::simplify(const NodePtr &node) {
    const std::size_t before = count_nodes(node);
    NodePtr out = simplify_(node);
    if (verbose_)
        fmt::print("simplify: {} -> {} nodes\n", before, count_nodes(out));
    return out;
}

NodePtr Simplification::simplify_(const NodePtr &node) {
    auto it = simplified_.find(node->id);
    if (it != simplified_.end())
        return it->second;

    NodePtr out;
    if (is_binary(node->type)) {
        NodePtr l = simplify_(node->left());
        NodePtr r = simplify_(node->right());
        out = binary_simplify(node, l, r);
    } else if (is_unary(node->type)) {
        NodePtr c = simplify_(node->child());
        if (node->type == Operator::Negate && c->type == Operator::Negate)
            out = c->child();
        else
            out = simplify_if_constant(unary_rebuild(node, c), false);
    } else {
        out = new_copy(node);
    }

    if (verbose_ && is_constant(out) && !is_leaf(out->type))
        fmt::print(stderr, "Warning: constant subtree '{}' left unfolded\n",
                   to_string(out));

    out = with_domains(out, node->domain, node->auxiliary_domains);
    simplified_.emplace(node->id, out);
    return out;
}

NodePtr simplify(const NodePtr &node) { return Simplification().simplify(node); }
