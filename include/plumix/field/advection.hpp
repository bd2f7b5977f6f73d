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
#include <plumix/field/staggered_ops.hpp>

namespace plumix {

namespace detail {

// ---------------------------------------------------------------------------
// Linear sampling. Positions are continuous sample indices; outside the
// sample grid they clamp to the nearest edge sample (replicate boundary).
// ---------------------------------------------------------------------------

KOKKOS_INLINE_FUNCTION
void lerp_index(Real q, int n, int& i0, Real& t) {
  if (n <= 1) {
    i0 = 0;
    t = Real(0);
    return;
  }
  const Real hi = static_cast<Real>(n - 1);
  if (q <= Real(0)) {
    q = Real(0);
  } else if (q >= hi) {
    q = hi;
  }
  int i = static_cast<int>(Kokkos::floor(q));
  if (i > n - 2) {
    i = n - 2;
  }
  i0 = i;
  t = q - static_cast<Real>(i);
}

KOKKOS_INLINE_FUNCTION
Real sample_linear(const GridView& v, int b, Real q0, Real q1, Real q2) {
  int i0;
  int j0;
  int k0;
  Real t0;
  Real t1;
  Real t2;
  lerp_index(q0, static_cast<int>(v.extent(1)), i0, t0);
  lerp_index(q1, static_cast<int>(v.extent(2)), j0, t1);
  lerp_index(q2, static_cast<int>(v.extent(3)), k0, t2);
  const int i1 = t0 > Real(0) ? i0 + 1 : i0;
  const int j1 = t1 > Real(0) ? j0 + 1 : j0;
  const int k1 = t2 > Real(0) ? k0 + 1 : k0;

  const Real c00 = v(b, i0, j0, k0) * (Real(1) - t0) + v(b, i1, j0, k0) * t0;
  const Real c10 = v(b, i0, j1, k0) * (Real(1) - t0) + v(b, i1, j1, k0) * t0;
  const Real c01 = v(b, i0, j0, k1) * (Real(1) - t0) + v(b, i1, j0, k1) * t0;
  const Real c11 = v(b, i0, j1, k1) * (Real(1) - t0) + v(b, i1, j1, k1) * t0;
  const Real c0 = c00 * (Real(1) - t1) + c10 * t1;
  const Real c1 = c01 * (Real(1) - t1) + c11 * t1;
  return c0 * (Real(1) - t2) + c1 * t2;
}

/// Cell-centred scalar at physical position x (cell units).
KOKKOS_INLINE_FUNCTION
Real sample_centered(const GridView& v, int b, Real x0, Real x1, Real x2) {
  return sample_linear(v, b, x0 - Real(0.5), x1 - Real(0.5), x2 - Real(0.5));
}

/// Face-centred component `axis` at physical position x (cell units).
KOKKOS_INLINE_FUNCTION
Real sample_face(const GridView& v, int axis, int b, Real x0, Real x1, Real x2) {
  const Real q0 = axis == 0 ? x0 : x0 - Real(0.5);
  const Real q1 = axis == 1 ? x1 : x1 - Real(0.5);
  const Real q2 = axis == 2 ? x2 : x2 - Real(0.5);
  return sample_linear(v, b, q0, q1, q2);
}

/// Back-trace x by dt along the interpolated velocity.
KOKKOS_INLINE_FUNCTION
void trace_back(const ComponentViews& u, int rank, int b, Real step,
                Real& x0, Real& x1, Real& x2) {
  const Real v0 = sample_face(u.u0, 0, b, x0, x1, x2);
  const Real v1 = sample_face(u.u1, 1, b, x0, x1, x2);
  const Real v2 = rank > 2 ? sample_face(u.u2, 2, b, x0, x1, x2) : Real(0);
  x0 -= step * v0;
  x1 -= step * v1;
  x2 -= step * v2;
}

} // namespace detail

/**
 * @brief Semi-Lagrangian transport of a cell-centred scalar.
 *
 * Each cell centre is traced back by dt along `velocity` and the field is
 * linearly resampled there.
 */
inline ScalarField advect(const ScalarField& field,
                          const StaggeredField& velocity,
                          Real dt,
                          const Domain& domain) {
  require_on_domain(field, domain, "advect");
  require_on_domain(velocity, domain, "advect");
  if (field.batch() != velocity.batch()) {
    throw std::invalid_argument("plumix: advect: batch size mismatch");
  }
  ScalarField out = make_like(field, "plumix_advected");
  const detail::ComponentViews u = detail::component_views(velocity);
  const int rank = domain.rank;
  const Real step = dt / domain.dx;
  const auto src = field.data;
  auto ov = out.data;
  Kokkos::parallel_for(
      "plumix_advect_scalar", detail::full_policy(field),
      KOKKOS_LAMBDA(const int b, const int i, const int j, const int k) {
        Real x0 = static_cast<Real>(i) + Real(0.5);
        Real x1 = static_cast<Real>(j) + Real(0.5);
        Real x2 = static_cast<Real>(k) + Real(0.5);
        detail::trace_back(u, rank, b, step, x0, x1, x2);
        ov(b, i, j, k) = detail::sample_centered(src, b, x0, x1, x2);
      });
  ExecSpace().fence();
  return out;
}

/**
 * @brief Semi-Lagrangian self-advection of a staggered velocity.
 *
 * Every face sample of component a is traced back along the full
 * interpolated velocity and component a is resampled at the origin.
 */
inline StaggeredField advect(const StaggeredField& velocity,
                             Real dt,
                             const Domain& domain) {
  require_on_domain(velocity, domain, "advect");
  const detail::ComponentViews u = detail::component_views(velocity);
  const int rank = domain.rank;
  const Real step = dt / domain.dx;

  std::vector<GridField> comps;
  comps.reserve(static_cast<std::size_t>(rank));
  for (int axis = 0; axis < rank; ++axis) {
    GridField c = make_like(velocity[axis], "plumix_advected_velocity_" + std::to_string(axis));
    const auto src = velocity[axis].data;
    auto cv = c.data;
    Kokkos::parallel_for(
        "plumix_advect_velocity", detail::full_policy(c),
        KOKKOS_LAMBDA(const int b, const int i, const int j, const int k) {
          Real x0 = static_cast<Real>(i) + (axis == 0 ? Real(0) : Real(0.5));
          Real x1 = static_cast<Real>(j) + (axis == 1 ? Real(0) : Real(0.5));
          Real x2 = static_cast<Real>(k) + (axis == 2 ? Real(0) : Real(0.5));
          detail::trace_back(u, rank, b, step, x0, x1, x2);
          cv(b, i, j, k) = detail::sample_face(src, axis, b, x0, x1, x2);
        });
    comps.push_back(c);
  }
  ExecSpace().fence();
  return StaggeredField(std::move(comps));
}

} // namespace plumix
