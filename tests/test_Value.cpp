#include <gtest/gtest.h>

#include "../include/symtree/Errors.h"
#include "../include/symtree/Value.h"

#include <cmath>
#include <limits>

TEST(ValueKernels, ScalarBroadcastsOverColumn) {
    dmat v(2, 1);
    v << 1.0, 2.0;
    const dmat out = to_dense(numeric::add(v, 3.0));
    EXPECT_DOUBLE_EQ(out(0, 0), 4.0);
    EXPECT_DOUBLE_EQ(out(1, 0), 5.0);
}

TEST(ValueKernels, ScalarOperandsStayScalar) {
    const Value out = numeric::multiply(2.0, 4.0);
    ASSERT_TRUE(is_scalar(out));
    EXPECT_DOUBLE_EQ(std::get<double>(out), 8.0);
}

TEST(ValueKernels, DivisionByScalarZeroIsInfinite) {
    const Value out = numeric::divide(1.0, 0.0);
    EXPECT_TRUE(std::isinf(as_double(out)));
    EXPECT_TRUE(std::isnan(as_double(numeric::divide(0.0, 0.0))));
}

TEST(ValueKernels, SparseAndDenseHadamardAgree) {
    dmat m(2, 2);
    m << 1.0, 0.0, 2.0, 3.0;
    dmat w(2, 1);
    w << 2.0, 5.0;

    const Value sparse = numeric::multiply(to_sparse(m), w);
    const Value dense = numeric::multiply(m, w);
    ASSERT_TRUE(is_sparse(sparse));
    EXPECT_TRUE(to_dense(sparse).isApprox(to_dense(dense)));
    EXPECT_DOUBLE_EQ(to_dense(sparse)(1, 0), 10.0);
    EXPECT_DOUBLE_EQ(to_dense(sparse)(1, 1), 15.0);
}

TEST(ValueKernels, HadamardIsCommutativeForSparse) {
    dmat m(2, 2);
    m << 1.0, 4.0, 2.0, 3.0;
    dmat w(2, 1);
    w << -1.0, 0.5;
    const Value a = numeric::multiply(to_sparse(m), w);
    const Value b = numeric::multiply(w, to_sparse(m));
    EXPECT_TRUE(to_dense(a).isApprox(to_dense(b)));
}

TEST(ValueKernels, SparseOuterBroadcastMatchesDense) {
    dmat row(1, 4);
    row << 1.0, 0.0, -2.0, 3.0;
    dmat col(3, 1);
    col << 2.0, 5.0, -1.0;

    const Value outer = numeric::multiply(col, to_sparse(row));
    ASSERT_TRUE(is_sparse(outer));
    ASSERT_EQ(value_rows(outer), 3);
    ASSERT_EQ(value_cols(outer), 4);
    EXPECT_TRUE(to_dense(outer).isApprox(to_dense(numeric::multiply(col, row))));

    // sparse column against a dense row
    const Value transposed = numeric::multiply(to_sparse(col), row);
    EXPECT_TRUE(
        to_dense(transposed).isApprox(to_dense(numeric::multiply(col, row))));
}

TEST(ValueKernels, SingleEntrySparseScalesOtherOperand) {
    const dmat one = dmat::Constant(1, 1, 4.0);
    dmat col(3, 1);
    col << 1.0, -2.0, 0.5;

    const Value scaled = numeric::multiply(col, to_sparse(one));
    ASSERT_EQ(value_rows(scaled), 3);
    EXPECT_TRUE(to_dense(scaled).isApprox(to_dense(numeric::multiply(col, one))));

    dmat m(2, 2);
    m << 1.0, 0.0, 2.0, 3.0;
    const Value left = numeric::multiply(to_sparse(one), to_sparse(m));
    const Value right = numeric::multiply(to_sparse(m), to_sparse(one));
    ASSERT_TRUE(is_sparse(left));
    EXPECT_TRUE(to_dense(left).isApprox(m * 4.0));
    EXPECT_TRUE(to_dense(right).isApprox(m * 4.0));
}

TEST(ValueKernels, IncompatibleSparseShapesRaise) {
    const dmat wide = dmat::Ones(2, 3);
    const dmat tall = dmat::Ones(4, 1);
    EXPECT_THROW(numeric::multiply(to_sparse(wide), tall), ShapeError);
}

TEST(ValueKernels, SparseDividedByColumnScalesRows) {
    dmat m = dmat::Identity(2, 2);
    dmat w(2, 1);
    w << 2.0, 4.0;
    const Value out = numeric::divide(to_sparse(m), w);
    ASSERT_TRUE(is_sparse(out));
    EXPECT_DOUBLE_EQ(to_dense(out)(0, 0), 0.5);
    EXPECT_DOUBLE_EQ(to_dense(out)(1, 1), 0.25);
}

TEST(ValueKernels, MatmulMixedSparsityIsDense) {
    dmat a(2, 2);
    a << 1.0, 2.0, 3.0, 4.0;
    dmat x(2, 1);
    x << 1.0, 1.0;
    const Value out = numeric::matmul(to_sparse(a), x);
    ASSERT_TRUE(is_dense(out));
    EXPECT_DOUBLE_EQ(to_dense(out)(0, 0), 3.0);
    EXPECT_DOUBLE_EQ(to_dense(out)(1, 0), 7.0);
    EXPECT_THROW(numeric::matmul(x, a), ShapeError);
}

TEST(ValueKernels, ModuloTakesSignOfDivisor) {
    EXPECT_DOUBLE_EQ(as_double(numeric::modulo(-1.0, 3.0)), 2.0);
    EXPECT_DOUBLE_EQ(as_double(numeric::modulo(7.0, 3.0)), 1.0);
}

TEST(ValueKernels, MinimumPropagatesNaN) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_TRUE(std::isnan(as_double(numeric::minimum(nan, 1.0))));
    EXPECT_DOUBLE_EQ(as_double(numeric::maximum(2.0, 1.0)), 2.0);
}

TEST(ValueKernels, ComparisonsReturnIndicators) {
    EXPECT_DOUBLE_EQ(as_double(numeric::less_equal(2.0, 2.0)), 1.0);
    EXPECT_DOUBLE_EQ(as_double(numeric::less(2.0, 2.0)), 0.0);
}

TEST(ValueKernels, AsDoubleRejectsVectors) {
    EXPECT_THROW(as_double(dmat(dmat::Zero(2, 1))), ShapeError);
    EXPECT_DOUBLE_EQ(as_double(dmat(dmat::Constant(1, 1, 4.0))), 4.0);
}

TEST(ValueKernels, FilledLikeKeepsSparsityForZero) {
    const Value s = to_sparse(dmat(dmat::Identity(3, 3)));
    const Value z = filled_like(s, 0.0);
    ASSERT_TRUE(is_sparse(z));
    EXPECT_TRUE(is_all_zero(z));
    EXPECT_EQ(value_rows(z), 3);
}
