#include <gtest/gtest.h>

#include "../include/symtree/BinaryOperators.h"
#include "../include/symtree/Errors.h"
#include "../include/symtree/Node.h"
#include "../include/symtree/Operators.h"
#include "../include/symtree/UnaryOperators.h"

namespace {

const Domain kNegElectrode{"negative electrode"};
const Domain kNegParticle{"negative particle"};
const Domain kSeparator{"separator"};

} // namespace

TEST(Construction, NumbersBecomeScalars) {
    NodePtr n = make_binary(Operator::Add, 2.0, 3);
    EXPECT_EQ(n->left()->type, Operator::Scalar);
    EXPECT_EQ(n->right()->type, Operator::Scalar);
    EXPECT_DOUBLE_EQ(as_double(evaluate(n)), 5.0);
}

TEST(Construction, NullOperandIsTypeError) {
    EXPECT_THROW(make_binary(Operator::Add, NodePtr{}, 1.0), TypeError);
    EXPECT_THROW(make_binary(Operator::Multiply, 1.0, NodePtr{}), TypeError);
}

TEST(Construction, EmptyDomainTakesOther) {
    NodePtr a = make_variable("a", kNegElectrode);
    NodePtr n = a + 1.0;
    EXPECT_EQ(n->domain, kNegElectrode);
    EXPECT_EQ((1.0 * a)->domain, kNegElectrode);
}

TEST(Construction, MismatchedDomainsRaise) {
    NodePtr a = make_variable("a", kNegElectrode);
    NodePtr b = make_variable("b", kSeparator);
    EXPECT_THROW(a + b, DomainError);
    EXPECT_THROW(get_children_domains(kNegElectrode, kSeparator), DomainError);
}

TEST(Construction, SecondaryDomainTriggersBroadcast) {
    NodePtr c = make_variable("c", kNegParticle,
                              {{"secondary", kNegElectrode}});
    NodePtr x = make_variable("x", kNegElectrode);

    NodePtr n = x * c;
    EXPECT_EQ(n->domain, kNegParticle);
    EXPECT_EQ(n->left()->type, Operator::PrimaryBroadcast);
    EXPECT_EQ(n->left()->domain, kNegParticle);
    EXPECT_EQ(n->left()->child(), x);
    EXPECT_EQ(n->right(), c);
    EXPECT_EQ(n->auxiliary_domains.at("secondary"), kNegElectrode);

    NodePtr m = c - x;
    EXPECT_EQ(m->right()->type, Operator::PrimaryBroadcast);
}

TEST(Construction, ConflictingAuxiliaryDomainsRaise) {
    NodePtr a = make_variable("a", kNegParticle, {{"secondary", kNegElectrode}});
    NodePtr b = make_variable("b", kNegParticle, {{"secondary", kSeparator}});
    EXPECT_THROW(a + b, DomainError);
}

TEST(Construction, EmptyAuxiliaryDomainIsFilled) {
    NodePtr a = make_variable("a", kNegParticle, {{"secondary", {}}});
    NodePtr b = make_variable("b", kNegParticle, {{"secondary", kNegElectrode}});
    EXPECT_EQ((a + b)->auxiliary_domains.at("secondary"), kNegElectrode);
}

TEST(Construction, ChildrenAreSharedNotCopied) {
    NodePtr a = make_variable("a");
    NodePtr n = a * a;
    EXPECT_EQ(n->left(), n->right());
    EXPECT_NE(n->id, a->id);
}

TEST(Construction, IdentitiesAreUnique) {
    NodePtr a = make_scalar(1.0);
    NodePtr b = make_scalar(1.0);
    EXPECT_NE(a->id, b->id);
}

TEST(Construction, EdgeEvaluationPropagates) {
    NodePtr flux = make_variable("N", kNegElectrode, {}, {"primary"});
    NodePtr c = make_variable("c", kNegElectrode);
    EXPECT_TRUE(evaluates_on_edges(flux * c, "primary"));
    EXPECT_FALSE(evaluates_on_edges(c * c, "primary"));
    EXPECT_FALSE(evaluates_on_edges(make_binary(Operator::Inner, flux, flux),
                                    "primary"));
}

TEST(Construction, PreOrderVisitsParentsFirst) {
    NodePtr a = make_variable("a");
    NodePtr b = make_variable("b");
    NodePtr sum = a + b;
    NodePtr tree = sum * a;
    const auto order = pre_order(tree);
    ASSERT_EQ(order.size(), 5u);
    EXPECT_EQ(order[0], tree);
    EXPECT_EQ(order[1], sum);
    EXPECT_EQ(order[2], a);
    EXPECT_EQ(order[3], b);
    EXPECT_EQ(order[4], a);
    EXPECT_EQ(count_nodes(tree), 4u);
    EXPECT_TRUE(contains(tree, b));
    EXPECT_FALSE(contains(sum, tree));
}

TEST(Construction, QueriesVisitSharedSubtreesOnce) {
    NodePtr y = make_state_vector(0, 1);
    NodePtr c = y;
    // every level doubles the number of root-to-leaf paths
    for (int level = 0; level < 60; ++level)
        c = c * 1.0001 + c * 0.5;
    EXPECT_LE(count_nodes(c), 301u);
    EXPECT_TRUE(contains(c, y));
    EXPECT_FALSE(contains(c, make_time()));
    EXPECT_FALSE(is_constant(c));

    NodePtr k = make_scalar(2.0);
    for (int level = 0; level < 60; ++level)
        k = k * 3.0 + k;
    EXPECT_TRUE(is_constant(k));
}

TEST(Printing, ProductInsideSumNeedsNoParentheses) {
    NodePtr a = make_variable("a");
    NodePtr b = make_variable("b");
    NodePtr c = make_variable("c");
    EXPECT_EQ(to_string(a * b + c), "a * b + c");
    EXPECT_EQ(to_string((a + b) * c), "(a + b) * c");
}

TEST(Printing, AssociativityDecidesRightParentheses) {
    NodePtr a = make_variable("a");
    NodePtr b = make_variable("b");
    NodePtr c = make_variable("c");
    EXPECT_EQ(to_string(a - b - c), "a - b - c");
    EXPECT_EQ(to_string(a - (b - c)), "a - (b - c)");
    EXPECT_EQ(to_string(a + (b + c)), "a + b + c");
    EXPECT_EQ(to_string(a / (b * c)), "a / (b * c)");
    EXPECT_EQ(to_string(a * (b / c)), "a * b / c");
    EXPECT_EQ(to_string(power(a * b, c)), "(a * b) ** c");
}

TEST(Printing, NamedForms) {
    NodePtr a = make_variable("a");
    NodePtr b = make_variable("b");
    EXPECT_EQ(to_string(a % b), "a mod b");
    EXPECT_EQ(to_string(make_binary(Operator::Minimum, a, b)), "minimum(a, b)");
    EXPECT_EQ(to_string(make_binary(Operator::Maximum, a, b)), "maximum(a, b)");
    EXPECT_EQ(to_string(equal_heaviside(a, b)), "a <= b");
    EXPECT_EQ(to_string(not_equal_heaviside(a, b)), "a < b");
    EXPECT_EQ(to_string(matmul(a, b)), "a @ b");
    EXPECT_EQ(to_string(-(a + b)), "-(a + b)");
    EXPECT_EQ(to_string(exp(a) * b), "exp(a) * b");
    EXPECT_EQ(to_string(make_state_vector(0, 3)), "y[0:3]");
}

TEST(Printing, NegativeLiteralsBindLikeNegation) {
    NodePtr x = make_variable("x");
    EXPECT_EQ(to_string(power(-2.0, x)), "(-2) ** x");
    EXPECT_EQ(to_string(power(x, -2.0)), "x ** (-2)");
    EXPECT_EQ(to_string(x * -2.0), "x * -2");
    EXPECT_EQ(to_string(x + -2.0), "x + -2");
}
