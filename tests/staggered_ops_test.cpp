#include <Kokkos_Core.hpp>
#include <gtest/gtest.h>

#include <plumix/core/domain.hpp>
#include <plumix/field/field_ops.hpp>
#include <plumix/field/grid_field.hpp>
#include <plumix/field/staggered_ops.hpp>

#include "plumix_test_utils.hpp"

#include <stdexcept>
#include <vector>

using namespace plumix;
using plumix_test::fill;
using plumix_test::value_at;

// ============================================================================
// DIVERGENCE
// ============================================================================

TEST(StaggeredOpsTest, UniformVelocityHasZeroDivergence) {
  const Domain domain = Domain::open(4, 5);
  StaggeredField v = make_staggered_field(domain, 2);
  fill(v[0], [](int, int, int, int) { return Real(1.5); });
  fill(v[1], [](int, int, int, int) { return Real(-0.25); });

  const ScalarField div = divergence(v, domain);
  EXPECT_EQ(div.batch(), 2);
  EXPECT_EQ(div.extents(), domain.resolution);
  EXPECT_NEAR(max_abs(div), 0.0, 1e-14);
}

TEST(StaggeredOpsTest, LinearVelocityHasConstantDivergence) {
  Domain domain = Domain::open(4, 3);
  domain.dx = Real(0.5);
  StaggeredField v = make_staggered_field(domain, 1);
  // u0 at face f equals f
  fill(v[0], [](int, int i, int, int) { return static_cast<Real>(i); });

  const ScalarField div = divergence(v, domain);
  for (int i = 0; i < 4; ++i) {
    for (int j = 0; j < 3; ++j) {
      EXPECT_NEAR(value_at(div, 0, i, j), 2.0, 1e-12) << "cell " << i << "," << j;
    }
  }
}

TEST(StaggeredOpsTest, DivergenceRejectsWrongComponentCount) {
  const Domain domain2 = Domain::open(4, 4);
  const Domain domain3 = Domain::open(4, 4, 4);
  const StaggeredField v = make_staggered_field(domain3, 1);
  EXPECT_THROW(divergence(v, domain2), std::invalid_argument);
}

// ============================================================================
// GRADIENT
// ============================================================================

TEST(StaggeredOpsTest, GradientOpenBoundaryUsesZeroExterior) {
  const Domain domain = Domain::open(3, 3);
  ScalarField p = make_scalar_field(domain, 1, Real(1));

  const StaggeredField g = gradient(p, domain);
  ASSERT_EQ(g.rank(), 2);
  EXPECT_EQ(g[0].extents(), domain.face_resolution(0));
  for (int j = 0; j < 3; ++j) {
    EXPECT_NEAR(value_at(g[0], 0, 0, j), 1.0, 1e-14);
    EXPECT_NEAR(value_at(g[0], 0, 1, j), 0.0, 1e-14);
    EXPECT_NEAR(value_at(g[0], 0, 2, j), 0.0, 1e-14);
    EXPECT_NEAR(value_at(g[0], 0, 3, j), -1.0, 1e-14);
  }
}

TEST(StaggeredOpsTest, GradientClosedBoundaryMirrors) {
  const Domain domain = Domain::closed(3, 3);
  ScalarField p = make_scalar_field(domain, 1);
  fill(p, [](int, int i, int j, int) { return static_cast<Real>(i * i + j); });

  const StaggeredField g = gradient(p, domain);
  for (int j = 0; j < 3; ++j) {
    EXPECT_NEAR(value_at(g[0], 0, 0, j), 0.0, 1e-14);
    EXPECT_NEAR(value_at(g[0], 0, 1, j), 1.0, 1e-14);
    EXPECT_NEAR(value_at(g[0], 0, 2, j), 3.0, 1e-14);
    EXPECT_NEAR(value_at(g[0], 0, 3, j), 0.0, 1e-14);
  }
  for (int i = 0; i < 3; ++i) {
    EXPECT_NEAR(value_at(g[1], 0, i, 0), 0.0, 1e-14);
    EXPECT_NEAR(value_at(g[1], 0, i, 1), 1.0, 1e-14);
    EXPECT_NEAR(value_at(g[1], 0, i, 3), 0.0, 1e-14);
  }
}

// ============================================================================
// SCALAR TO FACES
// ============================================================================

TEST(StaggeredOpsTest, FromScalarAveragesAdjacentCells) {
  const Domain domain = Domain::open(4, 2);
  ScalarField s = make_scalar_field(domain, 1);
  fill(s, [](int, int i, int, int) { return static_cast<Real>(i); });

  const StaggeredField f = from_scalar(s, {Real(2), Real(0)}, domain);
  for (int j = 0; j < 2; ++j) {
    EXPECT_NEAR(value_at(f[0], 0, 0, j), 0.0, 1e-14);  // replicated edge
    EXPECT_NEAR(value_at(f[0], 0, 1, j), 1.0, 1e-14);
    EXPECT_NEAR(value_at(f[0], 0, 2, j), 3.0, 1e-14);
    EXPECT_NEAR(value_at(f[0], 0, 3, j), 5.0, 1e-14);
    EXPECT_NEAR(value_at(f[0], 0, 4, j), 6.0, 1e-14);  // replicated edge
  }
  EXPECT_NEAR(max_abs(f[1]), 0.0, 1e-14);
}

TEST(StaggeredOpsTest, FromScalarRejectsFactorCountMismatch) {
  const Domain domain = Domain::open(4, 4);
  const ScalarField s = make_scalar_field(domain, 1);
  EXPECT_THROW(from_scalar(s, {Real(1), Real(0), Real(0)}, domain), std::invalid_argument);
}

TEST(StaggeredOpsTest, CellCenteredAveragesFaces) {
  const Domain domain = Domain::open(3, 2);
  StaggeredField v = make_staggered_field(domain, 1);
  fill(v[0], [](int, int i, int, int) { return static_cast<Real>(i); });
  fill(v[1], [](int, int, int j, int) { return static_cast<Real>(2 * j); });

  const std::vector<ScalarField> c = cell_centered(v, domain);
  ASSERT_EQ(c.size(), 2u);
  EXPECT_NEAR(value_at(c[0], 0, 0, 0), 0.5, 1e-14);
  EXPECT_NEAR(value_at(c[0], 0, 2, 1), 2.5, 1e-14);
  EXPECT_NEAR(value_at(c[1], 0, 1, 0), 1.0, 1e-14);
  EXPECT_NEAR(value_at(c[1], 0, 1, 1), 3.0, 1e-14);
}

TEST(StaggeredOpsTest, OperatorsLeaveInputsUntouched) {
  const Domain domain = Domain::open(4, 4);
  ScalarField p = make_scalar_field(domain, 1);
  fill(p, [](int, int i, int j, int) { return static_cast<Real>(i - 2 * j); });
  const ScalarField before = clone(p);

  (void)gradient(p, domain);
  (void)from_scalar(p, {Real(1), Real(1)}, domain);
  EXPECT_EQ(max_abs_difference(p, before), 0.0);
}

// ============================================================================
// MAIN
// ============================================================================

int main(int argc, char** argv) {
  Kokkos::initialize(argc, argv);
  ::testing::InitGoogleTest(&argc, argv);
  int result = RUN_ALL_TESTS();
  Kokkos::finalize();
  return result;
}
