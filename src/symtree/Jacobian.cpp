#include "../../include/symtree/Jacobian.h"
#include "../../include/symtree/BinaryOperators.h"
#include "../../include/symtree/Errors.h"
#include "../../include/symtree/UnaryOperators.h"

#include <fmt/core.h>

#include <vector>

NodePtr Jacobian::jac(const NodePtr &node, const NodePtr &variable) {
    if (!node || !variable)
        throw TypeError("jac: null node");
    if (variable->type != Operator::StateVector)
        throw std::invalid_argument(fmt::format(
            "Jacobian can only be taken with respect to a StateVector, not "
            "'{}'",
            to_string(variable)));
    // cached sub-Jacobians belong to one variable
    if (variable->id != variable_id_) {
        known_jacs_.clear();
        variable_id_ = variable->id;
    }

    NodePtr out = jac_(node, *variable);
    if (verbose_)
        fmt::print("jacobian: {} -> {} nodes\n", count_nodes(node),
                   count_nodes(out));
    return out;
}

NodePtr Jacobian::jac_(const NodePtr &node, const Node &variable) {
    auto it = known_jacs_.find(node->id);
    if (it != known_jacs_.end())
        return it->second;

    NodePtr out;
    if (is_binary(node->type)) {
        NodePtr left_jac = jac_(node->left(), variable);
        NodePtr right_jac = jac_(node->right(), variable);
        out = binary_jac(node, left_jac, right_jac);
    } else if (is_unary(node->type)) {
        out = unary_jac(node, jac_(node->child(), variable));
    } else {
        out = leaf_jac(node, variable);
    }
    known_jacs_.emplace(node->id, out);
    return out;
}

// Selection matrix of the slice within the variable's slice
NodePtr Jacobian::leaf_jac(const NodePtr &node, const Node &variable) {
    switch (node->type) {
    case Operator::StateVector: {
        const Eigen::Index rows = node->stop - node->start;
        const Eigen::Index cols = variable.stop - variable.start;
        std::vector<Eigen::Triplet<double, int>> entries;
        for (Eigen::Index i = 0; i < rows; ++i) {
            const Eigen::Index col = node->start + i - variable.start;
            if (col >= 0 && col < cols)
                entries.emplace_back(static_cast<int>(i), static_cast<int>(col),
                                     1.0);
        }
        spmat selection(rows, cols);
        selection.setFromTriplets(entries.begin(), entries.end());
        selection.makeCompressed();
        return make_array(std::move(selection));
    }
    case Operator::Variable:
        throw UnsupportedOperation(fmt::format(
            "cannot compute the Jacobian of variable '{}' before "
            "discretisation",
            node->name));
    default:
        return make_scalar(0.0);
    }
}

NodePtr jacobian(const NodePtr &node, const NodePtr &variable) {
    return Jacobian().jac(node, variable);
}
