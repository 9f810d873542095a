#include <gtest/gtest.h>

#include <cmath>

#include "core/errors.h"
#include "problem/box_qp.h"
#include "problem/objective.h"

using namespace qpscd;

namespace {

/// Q = [[2, 1], [1, 3]], p = [-1, -1], box [-1, 1]^2.
BoxQP make_2d() {
    RowMajorMatrixXd Q(2, 2);
    Q << 2.0, 1.0,
         1.0, 3.0;
    VectorXd p(2);
    p << -1.0, -1.0;
    return BoxQP(Q, p, VectorXd::Constant(2, -1.0), VectorXd::Ones(2));
}

}  // namespace

// ── Construction ────────────────────────────────────────────────────

TEST(BoxQP, DiagonalDefaultsToQDiagonal) {
    BoxQP bqp = make_2d();
    EXPECT_EQ(bqp.size(), 2);
    EXPECT_DOUBLE_EQ(bqp.diag(0), 2.0);
    EXPECT_DOUBLE_EQ(bqp.diag(1), 3.0);
}

TEST(BoxQP, ExplicitDiagonalIsKept) {
    // A regularized diagonal must not be replaced by Q(i, i).
    RowMajorMatrixXd Q = RowMajorMatrixXd::Identity(3, 3);
    VectorXd diag = VectorXd::Constant(3, 5.0);
    BoxQP bqp(Q, VectorXd::Zero(3), VectorXd::Zero(3), VectorXd::Ones(3),
              diag);
    for (Index i = 0; i < 3; ++i) {
        EXPECT_DOUBLE_EQ(bqp.diag(i), 5.0);
        EXPECT_DOUBLE_EQ(bqp.Q()(i, i), 1.0);
    }
}

TEST(BoxQP, RowIsContiguousViewOfQ) {
    BoxQP bqp = make_2d();
    RowView r1 = bqp.row(1);
    ASSERT_EQ(r1.size(), 2);
    EXPECT_DOUBLE_EQ(r1(0), 1.0);
    EXPECT_DOUBLE_EQ(r1(1), 3.0);
    // View, not a copy.
    EXPECT_EQ(r1.data(), bqp.Q().data() + 2);
}

TEST(BoxQP, ScalarAccessors) {
    BoxQP bqp = make_2d();
    EXPECT_DOUBLE_EQ(bqp.p(0), -1.0);
    EXPECT_DOUBLE_EQ(bqp.lb(1), -1.0);
    EXPECT_DOUBLE_EQ(bqp.ub(1), 1.0);
}

TEST(BoxQP, EmptyProblemIsAllowed) {
    BoxQP bqp(RowMajorMatrixXd(0, 0), VectorXd(0), VectorXd(0), VectorXd(0));
    EXPECT_EQ(bqp.size(), 0);
}

// ── Dimension validation ────────────────────────────────────────────

TEST(BoxQP, NonSquareQThrows) {
    RowMajorMatrixXd Q(2, 3);
    Q.setZero();
    EXPECT_THROW(BoxQP(Q, VectorXd::Zero(2), VectorXd::Zero(2),
                       VectorXd::Ones(2), VectorXd::Ones(2)),
                 InvalidDimensions);
}

TEST(BoxQP, ShortPThrows) {
    RowMajorMatrixXd Q = RowMajorMatrixXd::Identity(3, 3);
    try {
        BoxQP bqp(Q, VectorXd::Zero(2), VectorXd::Zero(3), VectorXd::Ones(3));
        FAIL() << "expected InvalidDimensions";
    } catch (const InvalidDimensions& e) {
        EXPECT_EQ(e.component(), "p");
        EXPECT_EQ(e.expected(), 3);
        EXPECT_EQ(e.actual(), 2);
    }
}

TEST(BoxQP, MismatchedBoundsThrow) {
    RowMajorMatrixXd Q = RowMajorMatrixXd::Identity(3, 3);
    EXPECT_THROW(BoxQP(Q, VectorXd::Zero(3), VectorXd::Zero(4),
                       VectorXd::Ones(3)),
                 InvalidDimensions);
    EXPECT_THROW(BoxQP(Q, VectorXd::Zero(3), VectorXd::Zero(3),
                       VectorXd::Ones(1)),
                 InvalidDimensions);
}

TEST(BoxQP, MismatchedDiagThrows) {
    RowMajorMatrixXd Q = RowMajorMatrixXd::Identity(3, 3);
    EXPECT_THROW(BoxQP(Q, VectorXd::Zero(3), VectorXd::Zero(3),
                       VectorXd::Ones(3), VectorXd::Ones(2)),
                 InvalidDimensions);
}

TEST(BoxQP, InvalidDimensionsIsRuntimeError) {
    RowMajorMatrixXd Q = RowMajorMatrixXd::Identity(2, 2);
    EXPECT_THROW(BoxQP(Q, VectorXd::Zero(5), VectorXd::Zero(2),
                       VectorXd::Ones(2)),
                 std::runtime_error);
}

// ── Objective diagnostics ───────────────────────────────────────────

TEST(Objective, ValueMatchesClosedForm) {
    BoxQP bqp = make_2d();
    VectorXd x(2);
    x << 1.0, -1.0;
    // 0.5 * (2 - 1 - 1 + 3) + (-1 + 1) = 1.5
    EXPECT_NEAR(objective_value(bqp, x), 1.5, 1e-14);
}

TEST(Objective, GradientResidualIsUnprojected) {
    // Identity Q, p = [1, 1]: at x = 0 the residual is sqrt(2) even though
    // x = 0 is the constrained optimum on [0, 1]^2.
    RowMajorMatrixXd Q = RowMajorMatrixXd::Identity(2, 2);
    BoxQP bqp(Q, VectorXd::Ones(2), VectorXd::Zero(2), VectorXd::Ones(2));
    VectorXd x = VectorXd::Zero(2);
    EXPECT_NEAR(gradient_residual(bqp, x), std::sqrt(2.0), 1e-14);
    EXPECT_NEAR(projected_gradient_norm(bqp, x), 0.0, 1e-14);
}

TEST(Objective, ProjectedGradientNonzeroAwayFromOptimum) {
    RowMajorMatrixXd Q = RowMajorMatrixXd::Identity(2, 2);
    BoxQP bqp(Q, VectorXd::Ones(2), VectorXd::Zero(2), VectorXd::Ones(2));
    VectorXd x = VectorXd::Constant(2, 0.5);
    // x - clamp(x - (x + 1)) = 0.5 - 0 per coordinate.
    EXPECT_NEAR(projected_gradient_norm(bqp, x), std::sqrt(0.5), 1e-14);
}

TEST(Objective, WrongLengthThrows) {
    BoxQP bqp = make_2d();
    EXPECT_THROW(objective_value(bqp, VectorXd::Zero(3)), InvalidDimensions);
    EXPECT_THROW(gradient_residual(bqp, VectorXd::Zero(1)), InvalidDimensions);
    EXPECT_THROW(projected_gradient_norm(bqp, VectorXd::Zero(0)),
                 InvalidDimensions);
}

// ── Box projection ──────────────────────────────────────────────────

TEST(BoxProjection, ClampsBothSides) {
    VectorXd v(3);
    v << -0.5, 0.3, 1.7;
    auto w = project_box(v, VectorXd::Zero(3), VectorXd::Ones(3));
    EXPECT_DOUBLE_EQ(w(0), 0.0);
    EXPECT_DOUBLE_EQ(w(1), 0.3);
    EXPECT_DOUBLE_EQ(w(2), 1.0);
}

TEST(BoxProjection, BoundaryValuesKept) {
    VectorXd v(2);
    v << 0.0, 1.0;
    auto w = project_box(v, VectorXd::Zero(2), VectorXd::Ones(2));
    EXPECT_EQ(w(0), 0.0);
    EXPECT_EQ(w(1), 1.0);
}

TEST(BoxProjection, DimensionMismatchThrows) {
    VectorXd v = VectorXd::Zero(3);
    EXPECT_THROW(project_box(v, VectorXd::Zero(2), VectorXd::Ones(3)),
                 InvalidDimensions);
    EXPECT_THROW(project_box(v, VectorXd::Zero(3), VectorXd::Ones(4)),
                 InvalidDimensions);
}
