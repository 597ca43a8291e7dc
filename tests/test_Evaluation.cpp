#include <gtest/gtest.h>

#include "../include/symtree/BinaryOperators.h"
#include "../include/symtree/Errors.h"
#include "../include/symtree/Node.h"
#include "../include/symtree/Operators.h"
#include "../include/symtree/UnaryOperators.h"

#include <cmath>

namespace {

dvec state(std::initializer_list<double> values) {
    dvec y(static_cast<Eigen::Index>(values.size()));
    Eigen::Index i = 0;
    for (double v : values)
        y(i++) = v;
    return y;
}

} // namespace

TEST(Evaluation, StateVectorArithmetic) {
    const dvec y = state({1.0, 2.0, 3.0});
    EvalState s;
    s.y = &y;
    NodePtr sv = make_state_vector(0, 3);

    const dmat out = to_dense(evaluate(sv * sv + 2.0, s));
    EXPECT_DOUBLE_EQ(out(0, 0), 3.0);
    EXPECT_DOUBLE_EQ(out(1, 0), 6.0);
    EXPECT_DOUBLE_EQ(out(2, 0), 11.0);
}

TEST(Evaluation, SliceOfState) {
    const dvec y = state({1.0, 2.0, 3.0});
    EvalState s;
    s.y = &y;
    const dmat out = to_dense(evaluate(make_state_vector(1, 3), s));
    ASSERT_EQ(out.rows(), 2);
    EXPECT_DOUBLE_EQ(out(0, 0), 2.0);
}

TEST(Evaluation, MissingStateIsAnError) {
    EXPECT_THROW(evaluate(make_state_vector(0, 2)), std::invalid_argument);
}

TEST(Evaluation, TimeAndInputs) {
    InputMap inputs{{"current", 2.5}};
    EvalState s;
    s.t = 4.0;
    s.inputs = &inputs;
    NodePtr n = make_time() * make_input_parameter("current");
    EXPECT_DOUBLE_EQ(as_double(evaluate(n, s)), 10.0);
    EXPECT_THROW(evaluate(make_input_parameter("voltage"), s),
                 std::invalid_argument);
}

TEST(Evaluation, UndiscretisedVariableIsUnsupported) {
    NodePtr v = make_variable("c");
    EXPECT_THROW(evaluate(v + 1.0), UnsupportedOperation);
    EXPECT_FALSE(evaluate_ignoring_errors(make_primary_broadcast(
                     1.0, {"negative electrode"}))
                     .has_value());
}

TEST(Evaluation, DivisionByZeroGivesInfinity) {
    NodePtr n = make_binary(Operator::Divide, 1.0, 0.0);
    EXPECT_TRUE(std::isinf(as_double(evaluate(n))));
}

TEST(Evaluation, SharedSubtreeIsCombinedOnce) {
    const dvec y = state({1.0, 2.0});
    EvalState s;
    s.y = &y;
    NodePtr sv = make_state_vector(0, 2);
    NodePtr shared = sv * sv;
    NodePtr tree = (shared + 1.0) * (shared - 1.0);

    KnownEvals known;
    const dmat memoised = to_dense(evaluate(tree, s, &known));
    // shared, +, - and * each combined exactly once
    EXPECT_EQ(known.binary_evaluations, 4u);
    EXPECT_EQ(known.values.count(shared->id), 1u);

    const dmat plain = to_dense(evaluate(tree, s));
    EXPECT_TRUE(memoised.isApprox(plain));
    EXPECT_DOUBLE_EQ(plain(1, 0), 15.0);
}

TEST(Evaluation, MemoIsReusedAcrossCalls) {
    const dvec y = state({3.0});
    EvalState s;
    s.y = &y;
    NodePtr tree = make_state_vector(0, 1) * 2.0;

    KnownEvals known;
    evaluate(tree, s, &known);
    evaluate(tree, s, &known);
    EXPECT_EQ(known.binary_evaluations, 1u);
}

TEST(Evaluation, ShapeOfUndiscretisedTree) {
    NodePtr c = make_variable("c", {"negative electrode"});
    const Value shape = evaluate_for_shape(c * 2.0);
    EXPECT_EQ(value_rows(shape), domain_size({"negative electrode"}));
    EXPECT_EQ(value_cols(shape), 1);
    EXPECT_TRUE(evaluates_to_number(make_variable("t0") + 1.0));
    EXPECT_FALSE(evaluates_to_constant_number(make_variable("t0") + 1.0));
    EXPECT_TRUE(evaluates_to_constant_number(make_binary(Operator::Add, 1, 2)));
}

TEST(Evaluation, BroadcastShapeFollowsSecondaryDomain) {
    NodePtr x = make_variable("x", {"negative electrode"});
    NodePtr c = make_variable("c", {"negative particle"},
                              {{"secondary", {"negative electrode"}}});
    const Value shape = evaluate_for_shape(x * c);
    EXPECT_EQ(value_rows(shape), value_rows(evaluate_for_shape(c)));
}

TEST(Copy, NewCopyEvaluatesIdentically) {
    const dvec y = state({0.5, 1.5});
    EvalState s;
    s.y = &y;
    NodePtr sv = make_state_vector(0, 2);
    NodePtr tree = power(sv, 2.0) / (sv + 1.0) - sv % 1.0;

    NodePtr copy = new_copy(tree);
    EXPECT_NE(copy->id, tree->id);
    EXPECT_NE(copy->left()->id, tree->left()->id);
    EXPECT_EQ(to_string(copy), to_string(tree));
    EXPECT_TRUE(to_dense(evaluate(copy, s)).isApprox(to_dense(evaluate(tree, s))));
}

TEST(Copy, NewCopyKeepsDomains) {
    NodePtr c = make_variable("c", {"negative particle"},
                              {{"secondary", {"negative electrode"}}});
    NodePtr x = make_variable("x", {"negative electrode"});
    NodePtr tree = x * c;
    NodePtr copy = new_copy(tree);
    EXPECT_EQ(copy->domain, tree->domain);
    EXPECT_EQ(copy->auxiliary_domains, tree->auxiliary_domains);
    EXPECT_EQ(copy->left()->type, Operator::PrimaryBroadcast);
}

TEST(Copy, LeavesAreShared) {
    NodePtr sv = make_state_vector(0, 2);
    NodePtr copy = new_copy(sv * 3.0);
    EXPECT_EQ(copy->left(), sv);
}
