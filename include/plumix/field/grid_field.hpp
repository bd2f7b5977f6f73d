#pragma once

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <Kokkos_Core.hpp>

#include <plumix/core/backend.hpp>
#include <plumix/core/domain.hpp>

namespace plumix {

/**
 * @brief Dense batched array over a regular grid.
 *
 * Layout: data(b, i, j, k) with b the batch index. Used for cell-centred
 * scalars (density, pressure, divergence) and for each face component of a
 * staggered field. The view is a shared handle; operators in this library
 * always allocate a fresh output and never write into their inputs.
 */
struct GridField {
  GridView data;

  GridField() = default;

  explicit GridField(const GridView& view) : data(view) {}

  GridField(const std::string& label, int batch, const std::array<int, 3>& extents)
      : data(label,
             static_cast<std::size_t>(batch),
             static_cast<std::size_t>(extents[0]),
             static_cast<std::size_t>(extents[1]),
             static_cast<std::size_t>(extents[2])) {}

  int batch() const { return static_cast<int>(data.extent(0)); }
  int extent(int axis) const {
    return static_cast<int>(data.extent(static_cast<std::size_t>(axis + 1)));
  }
  std::array<int, 3> extents() const { return {extent(0), extent(1), extent(2)}; }
  std::size_t size() const { return data.size(); }
  bool empty() const { return data.size() == 0; }

  bool same_shape(const GridField& other) const {
    return batch() == other.batch() && extents() == other.extents();
  }
};

using ScalarField = GridField;

/**
 * @brief Marker-and-cell velocity: one face-centred component per axis.
 *
 * Component `a` has extent n_a + 1 along axis `a` and the cell extents on the
 * other axes. The number of components equals the domain rank.
 */
struct StaggeredField {
  std::vector<GridField> components;

  StaggeredField() = default;

  explicit StaggeredField(std::vector<GridField> comps)
      : components(std::move(comps)) {}

  int rank() const { return static_cast<int>(components.size()); }
  int batch() const { return components.empty() ? 0 : components.front().batch(); }

  const GridField& operator[](int axis) const {
    return components[static_cast<std::size_t>(axis)];
  }
  GridField& operator[](int axis) {
    return components[static_cast<std::size_t>(axis)];
  }

  bool same_shape(const StaggeredField& other) const {
    if (rank() != other.rank()) {
      return false;
    }
    for (int a = 0; a < rank(); ++a) {
      if (!(*this)[a].same_shape(other[a])) {
        return false;
      }
    }
    return true;
  }
};

// ============================================================================
// ALLOCATION
// ============================================================================

inline ScalarField make_scalar_field(const Domain& domain,
                                     int batch,
                                     Real value = Real(0),
                                     const std::string& label = "plumix_scalar") {
  ScalarField f(label, batch, domain.resolution);
  if (value != Real(0)) {
    Kokkos::deep_copy(f.data, value);
  }
  return f;
}

inline StaggeredField make_staggered_field(const Domain& domain,
                                           int batch,
                                           Real value = Real(0),
                                           const std::string& label = "plumix_velocity") {
  std::vector<GridField> comps;
  comps.reserve(static_cast<std::size_t>(domain.rank));
  for (int a = 0; a < domain.rank; ++a) {
    GridField c(label + "_" + std::to_string(a), batch, domain.face_resolution(a));
    if (value != Real(0)) {
      Kokkos::deep_copy(c.data, value);
    }
    comps.push_back(c);
  }
  return StaggeredField(std::move(comps));
}

/// Uninitialized field with the same shape as `like`.
inline GridField make_like(const GridField& like, const std::string& label) {
  return GridField(GridView(Kokkos::view_alloc(Kokkos::WithoutInitializing, label),
                            like.data.extent(0), like.data.extent(1),
                            like.data.extent(2), like.data.extent(3)));
}

inline GridField clone(const GridField& src, const std::string& label = "plumix_clone") {
  GridField out = make_like(src, label);
  Kokkos::deep_copy(out.data, src.data);
  return out;
}

inline StaggeredField clone(const StaggeredField& src,
                            const std::string& label = "plumix_clone") {
  std::vector<GridField> comps;
  comps.reserve(src.components.size());
  for (int a = 0; a < src.rank(); ++a) {
    comps.push_back(clone(src[a], label + "_" + std::to_string(a)));
  }
  return StaggeredField(std::move(comps));
}

// ============================================================================
// HOST TRANSFER
// ============================================================================

inline GridHostView to_host(const GridField& field) {
  GridHostView host = Kokkos::create_mirror_view(field.data);
  Kokkos::deep_copy(host, field.data);
  return host;
}

// ============================================================================
// SHAPE CHECKS
// ============================================================================

inline void require_same_shape(const GridField& a, const GridField& b, const char* op) {
  if (!a.same_shape(b)) {
    throw std::invalid_argument(std::string("plumix: ") + op + ": field shape mismatch");
  }
}

inline void require_same_shape(const StaggeredField& a, const StaggeredField& b, const char* op) {
  if (!a.same_shape(b)) {
    throw std::invalid_argument(std::string("plumix: ") + op +
                                ": staggered field shape mismatch");
  }
}

inline void require_on_domain(const ScalarField& f, const Domain& domain, const char* op) {
  if (f.extents() != domain.resolution) {
    throw std::invalid_argument(std::string("plumix: ") + op +
                                ": scalar field does not match domain resolution");
  }
}

inline void require_on_domain(const StaggeredField& v, const Domain& domain, const char* op) {
  if (v.rank() != domain.rank) {
    throw std::invalid_argument(std::string("plumix: ") + op +
                                ": velocity component count differs from domain rank");
  }
  for (int a = 0; a < domain.rank; ++a) {
    if (v[a].extents() != domain.face_resolution(a)) {
      throw std::invalid_argument(std::string("plumix: ") + op +
                                  ": velocity component " + std::to_string(a) +
                                  " does not match the face grid");
    }
  }
}

} // namespace plumix
