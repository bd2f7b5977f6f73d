#include <Kokkos_Core.hpp>
#include <gtest/gtest.h>

#include <plumix/core/domain.hpp>
#include <plumix/core/errors.hpp>
#include <plumix/field/field_ops.hpp>
#include <plumix/field/grid_field.hpp>
#include <plumix/field/staggered_ops.hpp>
#include <plumix/physics/domain_state.hpp>
#include <plumix/solver/conjugate_gradient.hpp>
#include <plumix/solver/jacobi.hpp>
#include <plumix/solver/poisson.hpp>
#include <plumix/world/geometry.hpp>
#include <plumix/world/world.hpp>

#include "plumix_test_utils.hpp"

#include <optional>
#include <stdexcept>

using namespace plumix;
using plumix_test::fill;
using plumix_test::max_fluid_divergence;
using plumix_test::value_at;

namespace {

/// Divergence of a swirling, non-solenoidal velocity restricted to the masks.
ScalarField sample_divergence(const DomainState& state, int batch = 1) {
  const Domain& domain = state.domain();
  StaggeredField v = make_staggered_field(domain, batch);
  fill(v[0], [](int b, int i, int j, int) {
    return Real(0.3) * static_cast<Real>((i * 7 + j * 3 + b) % 5) - Real(0.5);
  });
  fill(v[1], [](int b, int i, int j, int) {
    return Real(0.2) * static_cast<Real>((i * 2 + j * 5 + 2 * b) % 7) - Real(0.6);
  });
  return divergence(state.with_hard_boundary_conditions(v), domain);
}

} // namespace

// ============================================================================
// CONJUGATE GRADIENT
// ============================================================================

TEST(PressureSolverTest, ConjugateGradientConvergesOnOpenDomain) {
  World world;
  world.add_obstacle(GeometryPrimitive::box(3, 5, 3, 5));
  const DomainState state(Domain::open(10, 9), world);
  const ScalarField div = sample_divergence(state, 2);

  ConjugateGradientSolver::Config cfg;
  cfg.accuracy = Real(1e-8);
  ConjugateGradientSolver cg(cfg);
  const PressureSolution sol = cg.solve(div, state, std::nullopt);

  EXPECT_TRUE(sol.converged);
  EXPECT_GT(sol.iterations, 0);
  EXPECT_LE(sol.residual, 1e-8);
  EXPECT_LE(solver::residual_max_norm(solver::PoissonMasks::from(state), sol.pressure.data, div.data),
            1e-8);
  // zero pressure inside the obstacle
  EXPECT_EQ(value_at(sol.pressure, 0, 3, 3), 0.0);
  EXPECT_EQ(value_at(sol.pressure, 1, 4, 4), 0.0);
}

TEST(PressureSolverTest, ConjugateGradientHandlesSingularClosedBox) {
  const World world;
  const DomainState state(Domain::closed(8, 8), world);
  const ScalarField div = sample_divergence(state);
  // zero wall flux: the divergence sums to zero
  EXPECT_NEAR(total(div, 0), 0.0, 1e-10);

  ConjugateGradientSolver solver(ConjugateGradientSolver::Config::with_accuracy(Real(1e-7)));
  const PressureSolution sol = solver.solve(div, state, std::nullopt);
  EXPECT_TRUE(sol.converged);
  EXPECT_LE(sol.residual, 1e-7);
}

TEST(PressureSolverTest, ProjectedVelocityDivergenceMatchesResidual) {
  World world;
  world.add_obstacle(GeometryPrimitive::sphere(5, 5, 2));
  const Domain domain = Domain::open(12, 12);
  const DomainState state(domain, world);

  StaggeredField v = make_staggered_field(domain, 1);
  fill(v[0], [](int, int i, int j, int) { return static_cast<Real>((i + 2 * j) % 3); });
  v = state.with_hard_boundary_conditions(v);

  ConjugateGradientSolver solver(ConjugateGradientSolver::Config::with_accuracy(Real(1e-6)));
  const PressureSolution sol = solver.solve(divergence(v, domain), state, std::nullopt);
  ASSERT_TRUE(sol.converged);

  const StaggeredField grad = state.with_hard_boundary_conditions(gradient(sol.pressure, domain));
  const StaggeredField projected = subtract(v, grad);
  EXPECT_LE(max_fluid_divergence(projected, state), 1e-6 + 1e-12);
}

TEST(PressureSolverTest, ConjugateGradientProjectsThreeDimensionalClosedBox) {
  World world;
  world.add_obstacle(GeometryPrimitive::sphere({Real(3.5), Real(3.5), Real(3)}, Real(1.2)));
  const Domain domain = Domain::closed(7, 7, 6);
  const DomainState state(domain, world);

  StaggeredField v = make_staggered_field(domain, 1);
  for (int a = 0; a < 3; ++a) {
    fill(v[a], [a](int, int i, int j, int k) {
      return Real(0.1) * static_cast<Real>((i + 2 * j + 3 * k + a) % 5) - Real(0.2);
    });
  }
  v = state.with_hard_boundary_conditions(v);
  const ScalarField div = divergence(v, domain);
  // no flux through walls or the sphere: the system is consistent
  EXPECT_NEAR(total(div, 0), 0.0, 1e-10);

  ConjugateGradientSolver cg(ConjugateGradientSolver::Config::with_accuracy(Real(1e-7)));
  const PressureSolution sol = cg.solve(div, state, std::nullopt);
  ASSERT_TRUE(sol.converged);
  EXPECT_GT(sol.iterations, 0);

  const StaggeredField grad = state.with_hard_boundary_conditions(gradient(sol.pressure, domain));
  const StaggeredField projected = subtract(v, grad);
  EXPECT_LE(max_fluid_divergence(projected, state), 1e-7 + 1e-12);
  // top and bottom walls along axis 2 stay shut
  EXPECT_EQ(value_at(projected[2], 0, 1, 2, 0), 0.0);
  EXPECT_EQ(value_at(projected[2], 0, 1, 2, 6), 0.0);
}

TEST(PressureSolverTest, IterationCapReportsNonConvergence) {
  const World world;
  const DomainState state(Domain::open(10, 10), world);
  const ScalarField div = sample_divergence(state);

  ConjugateGradientSolver::Config cfg;
  cfg.accuracy = Real(1e-12);
  cfg.max_iterations = 1;
  ConjugateGradientSolver solver(cfg);
  const PressureSolution sol = solver.solve(div, state, std::nullopt);
  EXPECT_FALSE(sol.converged);
  EXPECT_EQ(sol.iterations, 1);
  EXPECT_GT(sol.residual, 1e-12);
}

TEST(PressureSolverTest, ZeroDivergenceConvergesImmediately) {
  const World world;
  const Domain domain = Domain::open(6, 6);
  const DomainState state(domain, world);
  const ScalarField div = make_scalar_field(domain, 1);

  ConjugateGradientSolver solver;
  const PressureSolution sol = solver.solve(div, state, std::nullopt);
  EXPECT_TRUE(sol.converged);
  EXPECT_EQ(sol.iterations, 0);
  EXPECT_EQ(max_abs(sol.pressure), 0.0);
}

TEST(PressureSolverTest, ExactGuessNeedsNoIterations) {
  const World world;
  const DomainState state(Domain::open(8, 8), world);
  const ScalarField div = sample_divergence(state);

  ConjugateGradientSolver solver(ConjugateGradientSolver::Config::with_accuracy(Real(1e-9)));
  const PressureSolution first = solver.solve(div, state, std::nullopt);
  ASSERT_TRUE(first.converged);
  const PressureSolution second = solver.solve(div, state, first.pressure);
  EXPECT_TRUE(second.converged);
  EXPECT_EQ(second.iterations, 0);
}

TEST(PressureSolverTest, SolversLeaveInputsUntouched) {
  const World world;
  const DomainState state(Domain::open(8, 8), world);
  const ScalarField div = sample_divergence(state);
  const ScalarField before = clone(div);

  ConjugateGradientSolver cg;
  (void)cg.solve(div, state, std::nullopt);
  JacobiSolver jacobi;
  (void)jacobi.solve(div, state, std::nullopt);
  EXPECT_EQ(max_abs_difference(div, before), 0.0);
}

TEST(PressureSolverTest, RejectsMismatchedDivergence) {
  const World world;
  const DomainState state(Domain::open(8, 8), world);
  const ScalarField wrong = make_scalar_field(Domain::open(8, 7), 1);
  ConjugateGradientSolver solver;
  EXPECT_THROW(solver.solve(wrong, state, std::nullopt), std::invalid_argument);
}

TEST(PressureSolverTest, InvalidConfigurationThrows) {
  ConjugateGradientSolver::Config cg_cfg;
  cg_cfg.accuracy = Real(0);
  EXPECT_THROW(ConjugateGradientSolver{cg_cfg}, ConfigurationError);

  JacobiSolver::Config jac_cfg;
  jac_cfg.omega = Real(1.5);
  EXPECT_THROW(JacobiSolver{jac_cfg}, ConfigurationError);
}

// ============================================================================
// JACOBI
// ============================================================================

TEST(PressureSolverTest, JacobiConvergesOnOpenDomain) {
  World world;
  world.add_obstacle(GeometryPrimitive::box(2, 3, 2, 4));
  const DomainState state(Domain::open(8, 8), world);
  const ScalarField div = sample_divergence(state);

  JacobiSolver::Config cfg;
  cfg.accuracy = Real(1e-5);
  JacobiSolver solver(cfg);
  const PressureSolution sol = solver.solve(div, state, std::nullopt);
  EXPECT_TRUE(sol.converged);
  EXPECT_LE(sol.residual, 1e-5);
  EXPECT_EQ(solver.name(), "Jacobi");
}

TEST(PressureSolverTest, JacobiAgreesWithConjugateGradient) {
  const World world;
  const DomainState state(Domain::open(8, 8), world);
  const ScalarField div = sample_divergence(state);

  JacobiSolver::Config jac_cfg;
  jac_cfg.accuracy = Real(1e-9);
  JacobiSolver jacobi(jac_cfg);
  ConjugateGradientSolver cg(ConjugateGradientSolver::Config::with_accuracy(Real(1e-9)));

  const PressureSolution a = jacobi.solve(div, state, std::nullopt);
  const PressureSolution b = cg.solve(div, state, std::nullopt);
  ASSERT_TRUE(a.converged);
  ASSERT_TRUE(b.converged);
  // open boundaries make the system non-singular: one solution
  EXPECT_LE(max_abs_difference(a.pressure, b.pressure), 1e-6);
}

int main(int argc, char** argv) {
  Kokkos::initialize(argc, argv);
  ::testing::InitGoogleTest(&argc, argv);
  int result = RUN_ALL_TESTS();
  Kokkos::finalize();
  return result;
}
