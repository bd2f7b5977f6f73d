#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include <plumix/core/backend.hpp>
#include <plumix/core/domain.hpp>
#include <plumix/field/grid_field.hpp>
#include <plumix/field/staggered_ops.hpp>
#include <plumix/physics/smoke_state.hpp>

namespace plumix {
namespace vtk {

namespace detail {

template <typename T>
inline T byte_swap(T value) {
  static_assert(std::is_trivially_copyable<T>::value,
                "byte_swap requires trivially copyable type");
  std::array<unsigned char, sizeof(T)> bytes{};
  std::memcpy(bytes.data(), &value, sizeof(T));
  std::reverse(bytes.begin(), bytes.end());
  T out{};
  std::memcpy(&out, bytes.data(), sizeof(T));
  return out;
}

template <typename T>
inline T to_big_endian(T value) {
#if defined(__BYTE_ORDER__) && defined(__ORDER_BIG_ENDIAN__) && \
    (__BYTE_ORDER__ == __ORDER_BIG_ENDIAN__)
  return value;
#else
  return byte_swap(value);
#endif
}

template <typename T>
inline void write_binary(std::ofstream& ofs, T value) {
  const T be = to_big_endian(value);
  ofs.write(reinterpret_cast<const char*>(&be), sizeof(T));
}

// VTK orders cells x fastest. Grid axis 1 maps to x, the vertical axis 0 to
// y and axis 2 to z, so the plume rises along +y in ParaView.
template <typename Fn>
inline void for_each_cell_vtk_order(int n0, int n1, int n2, Fn&& fn) {
  for (int k = 0; k < n2; ++k) {
    for (int i = 0; i < n0; ++i) {
      for (int j = 0; j < n1; ++j) {
        fn(i, j, k);
      }
    }
  }
}

} // namespace detail

/**
 * @brief Export one batch entry of a smoke state to a binary legacy VTK
 *        STRUCTURED_POINTS file (.vtk).
 *
 * Cell data: `density` (scalar) and `velocity` (vector averaged from the
 * faces onto cell centres). Values are written as big-endian float.
 */
inline void write_structured_points(const SmokeState& state,
                                    const std::string& filename,
                                    int batch = 0,
                                    Real dx = Real(1)) {
  if (batch < 0 || batch >= state.batch_size()) {
    throw std::out_of_range("plumix: write_structured_points: batch index " +
                            std::to_string(batch) + " out of range");
  }
  const ScalarField& density = state.density();
  Domain domain;
  domain.rank = state.rank();
  domain.resolution = density.extents();
  domain.dx = dx;

  const GridHostView rho = to_host(density);
  const std::vector<ScalarField> centered = cell_centered(state.velocity(), domain);
  std::vector<GridHostView> vel;
  vel.reserve(centered.size());
  for (const ScalarField& c : centered) {
    vel.push_back(to_host(c));
  }

  const int n0 = domain.extent(0);
  const int n1 = domain.extent(1);
  const int n2 = domain.extent(2);
  const std::size_t num_cells = domain.cell_count();

  std::ofstream ofs(filename, std::ios::binary);
  if (!ofs.is_open()) {
    throw std::runtime_error("plumix: write_structured_points: cannot open " + filename);
  }
  ofs << "# vtk DataFile Version 3.0\n";
  ofs << "plumix smoke state\n";
  ofs << "BINARY\n";
  ofs << "DATASET STRUCTURED_POINTS\n";
  ofs << "DIMENSIONS " << n1 + 1 << " " << n0 + 1 << " " << (domain.rank > 2 ? n2 + 1 : 1)
      << "\n";
  ofs << "ORIGIN 0 0 0\n";
  ofs << "SPACING " << dx << " " << dx << " " << dx << "\n";
  ofs << "CELL_DATA " << num_cells << "\n";

  ofs << "SCALARS density float 1\n";
  ofs << "LOOKUP_TABLE default\n";
  detail::for_each_cell_vtk_order(n0, n1, n2, [&](int i, int j, int k) {
    detail::write_binary(ofs, static_cast<float>(rho(batch, i, j, k)));
  });
  ofs << "\n";

  ofs << "VECTORS velocity float\n";
  detail::for_each_cell_vtk_order(n0, n1, n2, [&](int i, int j, int k) {
    detail::write_binary(ofs, static_cast<float>(vel[1](batch, i, j, k)));
    detail::write_binary(ofs, static_cast<float>(vel[0](batch, i, j, k)));
    detail::write_binary(ofs, vel.size() > 2 ? static_cast<float>(vel[2](batch, i, j, k)) : 0.0f);
  });
  ofs << "\n";

  if (!ofs) {
    throw std::runtime_error("plumix: write_structured_points: write failed for " + filename);
  }
}

} // namespace vtk
} // namespace plumix
