#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <Kokkos_Core.hpp>

#include <plumix/core/backend.hpp>
#include <plumix/core/domain.hpp>
#include <plumix/field/field_ops.hpp>
#include <plumix/field/grid_field.hpp>

namespace plumix {

// ----------------------------------------------------------------------------
// MAC stencils on the staggered grid.
//
// Face f of component a sits between cells f - e_a and f. The divergence of
// cell c reads the two faces c and c + e_a on every axis; the gradient on a
// face reads the two adjacent cells. Cells outside the box are resolved by
// the boundary type: zero pressure when open, mirrored when closed.
// ----------------------------------------------------------------------------

namespace detail {

struct ComponentViews {
  GridView u0;
  GridView u1;
  GridView u2;
};

inline ComponentViews component_views(const StaggeredField& v) {
  ComponentViews views;
  views.u0 = v[0].data;
  views.u1 = v[1].data;
  if (v.rank() > 2) {
    views.u2 = v[2].data;
  }
  return views;
}

KOKKOS_INLINE_FUNCTION
int offset_on(int axis, int which) { return axis == which ? 1 : 0; }

} // namespace detail

/**
 * @brief Discrete divergence of a staggered field on cell centres.
 *
 * div(c) = sum_a (u_a(c + e_a) - u_a(c)) / dx
 */
inline ScalarField divergence(const StaggeredField& velocity, const Domain& domain) {
  require_on_domain(velocity, domain, "divergence");
  ScalarField out = make_scalar_field(domain, velocity.batch(), Real(0), "plumix_divergence");
  const detail::ComponentViews views = detail::component_views(velocity);
  const int rank = velocity.rank();
  const Real inv_dx = Real(1) / domain.dx;
  auto ov = out.data;
  Kokkos::parallel_for(
      "plumix_divergence", detail::full_policy(out),
      KOKKOS_LAMBDA(const int b, const int i, const int j, const int k) {
        Real div = (views.u0(b, i + 1, j, k) - views.u0(b, i, j, k)) +
                   (views.u1(b, i, j + 1, k) - views.u1(b, i, j, k));
        if (rank > 2) {
          div += views.u2(b, i, j, k + 1) - views.u2(b, i, j, k);
        }
        ov(b, i, j, k) = div * inv_dx;
      });
  ExecSpace().fence();
  return out;
}

/**
 * @brief Face-centred gradient of a cell-centred scalar.
 *
 * grad_a(f) = (p(f) - p(f - e_a)) / dx. Out-of-box cells hold zero for an
 * open boundary and repeat the interior cell for a closed one, so the
 * closed-wall gradient is zero.
 */
inline StaggeredField gradient(const ScalarField& pressure, const Domain& domain) {
  require_on_domain(pressure, domain, "gradient");
  StaggeredField out = make_staggered_field(domain, pressure.batch(), Real(0), "plumix_gradient");
  const auto pv = pressure.data;
  const bool open = domain.boundary == Boundary::Open;
  const Real inv_dx = Real(1) / domain.dx;

  for (int axis = 0; axis < domain.rank; ++axis) {
    auto gv = out[axis].data;
    const int n_axis = domain.extent(axis);
    Kokkos::parallel_for(
        "plumix_gradient", detail::full_policy(out[axis]),
        KOKKOS_LAMBDA(const int b, const int i, const int j, const int k) {
          const int f = (axis == 0) ? i : (axis == 1) ? j : k;
          const int di = detail::offset_on(axis, 0);
          const int dj = detail::offset_on(axis, 1);
          const int dk = detail::offset_on(axis, 2);
          Real upper;
          Real lower;
          if (f == 0) {
            upper = pv(b, i, j, k);
            lower = open ? Real(0) : upper;
          } else if (f == n_axis) {
            lower = pv(b, i - di, j - dj, k - dk);
            upper = open ? Real(0) : lower;
          } else {
            upper = pv(b, i, j, k);
            lower = pv(b, i - di, j - dj, k - dk);
          }
          gv(b, i, j, k) = (upper - lower) * inv_dx;
        });
  }
  ExecSpace().fence();
  return out;
}

/**
 * @brief Sample a cell-centred scalar onto faces and scale per axis.
 *
 * Component a at face f is factors[a] * (s(f - e_a) + s(f)) / 2; edge faces
 * repeat their single interior neighbour.
 */
inline StaggeredField from_scalar(const ScalarField& scalar,
                                  const std::vector<Real>& factors,
                                  const Domain& domain) {
  require_on_domain(scalar, domain, "from_scalar");
  if (static_cast<int>(factors.size()) != domain.rank) {
    throw std::invalid_argument("plumix: from_scalar: factor count differs from domain rank");
  }
  StaggeredField out = make_staggered_field(domain, scalar.batch(), Real(0), "plumix_from_scalar");
  const auto sv = scalar.data;

  for (int axis = 0; axis < domain.rank; ++axis) {
    auto ov = out[axis].data;
    const Real factor = factors[static_cast<std::size_t>(axis)];
    const int n_axis = domain.extent(axis);
    if (factor == Real(0)) {
      continue;
    }
    Kokkos::parallel_for(
        "plumix_from_scalar", detail::full_policy(out[axis]),
        KOKKOS_LAMBDA(const int b, const int i, const int j, const int k) {
          const int f = (axis == 0) ? i : (axis == 1) ? j : k;
          const int di = detail::offset_on(axis, 0);
          const int dj = detail::offset_on(axis, 1);
          const int dk = detail::offset_on(axis, 2);
          Real upper;
          Real lower;
          if (f == 0) {
            upper = sv(b, i, j, k);
            lower = upper;
          } else if (f == n_axis) {
            lower = sv(b, i - di, j - dj, k - dk);
            upper = lower;
          } else {
            upper = sv(b, i, j, k);
            lower = sv(b, i - di, j - dj, k - dk);
          }
          ov(b, i, j, k) = factor * Real(0.5) * (upper + lower);
        });
  }
  ExecSpace().fence();
  return out;
}

/**
 * @brief Average each component onto cell centres.
 *
 * Returns one scalar per axis; used for output and speed diagnostics.
 */
inline std::vector<ScalarField> cell_centered(const StaggeredField& velocity,
                                              const Domain& domain) {
  require_on_domain(velocity, domain, "cell_centered");
  std::vector<ScalarField> out;
  out.reserve(static_cast<std::size_t>(domain.rank));
  for (int axis = 0; axis < domain.rank; ++axis) {
    ScalarField c = make_scalar_field(domain, velocity.batch(), Real(0),
                                      "plumix_centered_" + std::to_string(axis));
    const auto uv = velocity[axis].data;
    auto cv = c.data;
    Kokkos::parallel_for(
        "plumix_cell_centered", detail::full_policy(c),
        KOKKOS_LAMBDA(const int b, const int i, const int j, const int k) {
          const int di = detail::offset_on(axis, 0);
          const int dj = detail::offset_on(axis, 1);
          const int dk = detail::offset_on(axis, 2);
          cv(b, i, j, k) = Real(0.5) * (uv(b, i, j, k) + uv(b, i + di, j + dj, k + dk));
        });
    out.push_back(c);
  }
  ExecSpace().fence();
  return out;
}

} // namespace plumix
