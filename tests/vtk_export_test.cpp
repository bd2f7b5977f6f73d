#include <Kokkos_Core.hpp>
#include <gtest/gtest.h>

#include <plumix/core/domain.hpp>
#include <plumix/field/grid_field.hpp>
#include <plumix/io/vtk_export.hpp>
#include <plumix/physics/smoke_state.hpp>

#include "plumix_test_utils.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace plumix;
using plumix_test::fill;

namespace {

// Helper to read big-endian float from binary stream
inline float read_be_float(std::ifstream& ifs) {
  std::array<unsigned char, 4> bytes{};
  ifs.read(reinterpret_cast<char*>(bytes.data()), 4);
  std::reverse(bytes.begin(), bytes.end());
  float v;
  std::memcpy(&v, bytes.data(), 4);
  return v;
}

SmokeState sample_state(const Domain& domain) {
  ScalarField rho = make_scalar_field(domain, 2);
  fill(rho, [](int b, int i, int j, int) { return static_cast<Real>(100 * b + 10 * i + j); });
  StaggeredField v = make_staggered_field(domain, 2);
  Kokkos::deep_copy(v[0].data, Real(2));
  Kokkos::deep_copy(v[1].data, Real(-1));
  return SmokeState(rho, v);
}

} // namespace

TEST(VTKExportTest, WriteStructuredPointsBinaryContent) {
  const Domain domain = Domain::open(2, 3);
  const SmokeState state = sample_state(domain);
  const std::string filename = "test_plumix_structured_points.vtk";

  vtk::write_structured_points(state, filename, 1);

  std::ifstream ifs(filename, std::ios::binary);
  ASSERT_TRUE(ifs.is_open()) << "Failed to open exported VTK file";

  std::string line;
  std::getline(ifs, line);
  EXPECT_EQ(line, "# vtk DataFile Version 3.0");
  std::getline(ifs, line);
  EXPECT_EQ(line, "plumix smoke state");
  std::getline(ifs, line);
  EXPECT_EQ(line, "BINARY");
  std::getline(ifs, line);
  EXPECT_EQ(line, "DATASET STRUCTURED_POINTS");
  std::getline(ifs, line);
  EXPECT_EQ(line, "DIMENSIONS 4 3 1");
  std::getline(ifs, line);
  EXPECT_EQ(line, "ORIGIN 0 0 0");
  std::getline(ifs, line);
  EXPECT_EQ(line, "SPACING 1 1 1");
  std::getline(ifs, line);
  EXPECT_EQ(line, "CELL_DATA 6");
  std::getline(ifs, line);
  EXPECT_EQ(line, "SCALARS density float 1");
  std::getline(ifs, line);
  EXPECT_EQ(line, "LOOKUP_TABLE default");

  // x (axis 1) fastest, then the vertical axis 0
  const float expected[6] = {100.f, 101.f, 102.f, 110.f, 111.f, 112.f};
  for (float e : expected) {
    EXPECT_FLOAT_EQ(read_be_float(ifs), e);
  }
  ifs.get();  // newline

  std::getline(ifs, line);
  EXPECT_EQ(line, "VECTORS velocity float");
  // (u1, u0, 0) per cell
  EXPECT_FLOAT_EQ(read_be_float(ifs), -1.f);
  EXPECT_FLOAT_EQ(read_be_float(ifs), 2.f);
  EXPECT_FLOAT_EQ(read_be_float(ifs), 0.f);

  ifs.close();
  std::remove(filename.c_str());
}

TEST(VTKExportTest, ThreeDimensionalDimensions) {
  const Domain domain = Domain::open(2, 3, 4);
  const SmokeState state(make_scalar_field(domain, 1), make_staggered_field(domain, 1));
  const std::string filename = "test_plumix_structured_points_3d.vtk";

  vtk::write_structured_points(state, filename);

  std::ifstream ifs(filename, std::ios::binary);
  ASSERT_TRUE(ifs.is_open());
  std::string line;
  for (int n = 0; n < 5; ++n) {
    std::getline(ifs, line);
  }
  EXPECT_EQ(line, "DIMENSIONS 4 3 5");
  std::getline(ifs, line);
  std::getline(ifs, line);
  std::getline(ifs, line);
  EXPECT_EQ(line, "CELL_DATA 24");

  ifs.close();
  std::remove(filename.c_str());
}

TEST(VTKExportTest, RejectsBatchOutOfRange) {
  const Domain domain = Domain::open(2, 3);
  const SmokeState state = sample_state(domain);
  EXPECT_THROW(vtk::write_structured_points(state, "unused.vtk", 2), std::out_of_range);
}

int main(int argc, char** argv) {
  Kokkos::initialize(argc, argv);
  ::testing::InitGoogleTest(&argc, argv);
  int result = RUN_ALL_TESTS();
  Kokkos::finalize();
  return result;
}
