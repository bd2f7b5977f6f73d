#include <Kokkos_Core.hpp>
#include <gtest/gtest.h>

#include <plumix/core/domain.hpp>
#include <plumix/field/field_ops.hpp>
#include <plumix/field/grid_field.hpp>
#include <plumix/physics/diagnostics.hpp>
#include <plumix/physics/smoke_state.hpp>

#include "plumix_test_utils.hpp"

#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

using namespace plumix;
using plumix_test::fill;

namespace {

SmokeState make_state(const Domain& domain, int batch) {
  ScalarField rho = make_scalar_field(domain, batch);
  fill(rho, [](int b, int i, int j, int k) { return static_cast<Real>(b + i + 2 * j + 3 * k); });
  StaggeredField v = make_staggered_field(domain, batch);
  for (int a = 0; a < domain.rank; ++a) {
    fill(v[a], [a](int b, int i, int j, int) { return static_cast<Real>(a - b + i * j); });
  }
  return SmokeState(rho, v);
}

} // namespace

// ============================================================================
// SMOKE STATE
// ============================================================================

TEST(SmokeStateTest, ReportsBatchAndRank) {
  const SmokeState s2 = make_state(Domain::open(4, 3), 2);
  EXPECT_EQ(s2.batch_size(), 2);
  EXPECT_EQ(s2.rank(), 2);

  const SmokeState s3 = make_state(Domain::closed(3, 3, 3), 1);
  EXPECT_EQ(s3.batch_size(), 1);
  EXPECT_EQ(s3.rank(), 3);
}

TEST(SmokeStateTest, RejectsBatchMismatch) {
  const Domain domain = Domain::open(4, 4);
  EXPECT_THROW(SmokeState(make_scalar_field(domain, 2), make_staggered_field(domain, 1)),
               std::invalid_argument);
}

TEST(SmokeStateTest, DisassembleOrdersDensityThenComponents) {
  const Domain domain = Domain::open(4, 3, 2);
  const SmokeState s = make_state(domain, 1);
  const DisassembledState parts = s.disassemble();
  ASSERT_EQ(parts.fields.size(), 4u);
  EXPECT_EQ(parts.fields[0].data.data(), s.density().data.data());
  for (int a = 0; a < 3; ++a) {
    EXPECT_EQ(parts.fields[static_cast<std::size_t>(a + 1)].data.data(),
              s.velocity()[a].data.data());
  }
}

TEST(SmokeStateTest, ReassembleRoundTrip) {
  const Domain domain = Domain::open(5, 4);
  const SmokeState s = make_state(domain, 2);
  const DisassembledState parts = s.disassemble();

  const SmokeState back = parts.reassemble(parts.fields);
  EXPECT_EQ(back.batch_size(), s.batch_size());
  EXPECT_EQ(max_abs_difference(back.density(), s.density()), 0.0);
  EXPECT_EQ(max_abs_difference(back.velocity(), s.velocity()), 0.0);
}

TEST(SmokeStateTest, ReassembleAcceptsFreshFieldsOfSameShape) {
  const Domain domain = Domain::open(5, 4);
  const SmokeState s = make_state(domain, 1);
  const DisassembledState parts = s.disassemble();

  std::vector<GridField> doubled;
  for (const GridField& f : parts.fields) {
    doubled.push_back(axpy(f, Real(1), f));
  }
  const SmokeState scaled = parts.reassemble(doubled);
  EXPECT_NEAR(total(scaled.density(), 0), 2 * total(s.density(), 0), 1e-10);
}

TEST(SmokeStateTest, ReassembleRejectsWrongCount) {
  const SmokeState s = make_state(Domain::open(4, 4), 1);
  const DisassembledState parts = s.disassemble();
  std::vector<GridField> fewer(parts.fields.begin(), parts.fields.end() - 1);
  EXPECT_THROW(parts.reassemble(fewer), std::invalid_argument);
}

TEST(SmokeStateTest, ReassembleRejectsWrongShape) {
  const SmokeState s = make_state(Domain::open(4, 4), 1);
  const DisassembledState parts = s.disassemble();
  std::vector<GridField> swapped = parts.fields;
  std::swap(swapped[1], swapped[2]);
  EXPECT_THROW(parts.reassemble(swapped), std::invalid_argument);
}

// ============================================================================
// DIAGNOSTICS
// ============================================================================

TEST(DiagnosticsTest, MassPeakAndSpeedPerBatch) {
  const Domain domain = Domain::open(3, 4);
  ScalarField rho = make_scalar_field(domain, 2);
  fill(rho, [](int b, int i, int j, int) {
    return (i == 1 && j == 2) ? Real(5 + b) : Real(1);
  });
  StaggeredField v = make_staggered_field(domain, 2);
  Kokkos::deep_copy(v[0].data, Real(3));
  Kokkos::deep_copy(v[1].data, Real(4));

  const StateDiagnostics d = diagnostics(SmokeState(rho, v), domain);
  ASSERT_EQ(d.mass.size(), 2u);
  EXPECT_NEAR(d.mass[0], 11.0 + 5.0, 1e-12);
  EXPECT_NEAR(d.mass[1], 11.0 + 6.0, 1e-12);
  EXPECT_NEAR(d.max_density[0], 5.0, 1e-12);
  EXPECT_NEAR(d.max_density[1], 6.0, 1e-12);
  EXPECT_NEAR(d.max_speed[0], 5.0, 1e-12);
  EXPECT_NEAR(d.max_speed[1], 5.0, 1e-12);
}

int main(int argc, char** argv) {
  Kokkos::initialize(argc, argv);
  ::testing::InitGoogleTest(&argc, argv);
  int result = RUN_ALL_TESTS();
  Kokkos::finalize();
  return result;
}
