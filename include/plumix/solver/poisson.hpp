#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include <Kokkos_Core.hpp>

#include <plumix/core/backend.hpp>
#include <plumix/core/domain.hpp>
#include <plumix/field/field_ops.hpp>
#include <plumix/field/grid_field.hpp>
#include <plumix/physics/domain_state.hpp>

namespace plumix {
namespace solver {

// ----------------------------------------------------------------------------
// Masked pressure Laplacian shared by the iterative solvers.
//
// For a cell c and axis a, the upper face is c + e_a and the lower face is c.
// A face contributes only when its face mask is set; a closed face drops out,
// an open face on the box edge couples to a zero exterior pressure.
//
//   (A p)(c) = acc(c) * sum_a [ m_a(c+e_a) (p(c+e_a) - p(c))
//                              - m_a(c)     (p(c) - p(c-e_a)) ] / dx^2
// ----------------------------------------------------------------------------

struct PoissonMasks {
  MaskView accessible;
  MaskView face0;
  MaskView face1;
  MaskView face2;
  int rank = 2;
  int n0 = 1;
  int n1 = 1;
  int n2 = 1;
  Real inv_dx2 = Real(1);

  static PoissonMasks from(const DomainState& state) {
    PoissonMasks m;
    const Domain& d = state.domain();
    m.accessible = state.accessible();
    m.face0 = state.face_mask(0);
    m.face1 = state.face_mask(1);
    if (d.rank > 2) {
      m.face2 = state.face_mask(2);
    }
    m.rank = d.rank;
    m.n0 = d.extent(0);
    m.n1 = d.extent(1);
    m.n2 = d.extent(2);
    m.inv_dx2 = Real(1) / (d.dx * d.dx);
    return m;
  }

  /// Pressure at (i, j, k), zero outside the box.
  KOKKOS_INLINE_FUNCTION
  Real at(const GridView& p, int b, int i, int j, int k) const {
    if (i < 0 || j < 0 || k < 0 || i >= n0 || j >= n1 || k >= n2) {
      return Real(0);
    }
    return p(b, i, j, k);
  }

  /// Weighted neighbour sum and diagonal weight of cell (i, j, k).
  KOKKOS_INLINE_FUNCTION
  void neighbours(const GridView& p, int b, int i, int j, int k,
                  Real& sum, Real& weight) const {
    const Real w0l = face0(i, j, k);
    const Real w0u = face0(i + 1, j, k);
    const Real w1l = face1(i, j, k);
    const Real w1u = face1(i, j + 1, k);
    sum = w0l * at(p, b, i - 1, j, k) + w0u * at(p, b, i + 1, j, k) +
          w1l * at(p, b, i, j - 1, k) + w1u * at(p, b, i, j + 1, k);
    weight = w0l + w0u + w1l + w1u;
    if (rank > 2) {
      const Real w2l = face2(i, j, k);
      const Real w2u = face2(i, j, k + 1);
      sum += w2l * at(p, b, i, j, k - 1) + w2u * at(p, b, i, j, k + 1);
      weight += w2l + w2u;
    }
  }

  /// -(A p)(c); positive semi-definite form used by conjugate gradient.
  KOKKOS_INLINE_FUNCTION
  Real negative_laplacian(const GridView& p, int b, int i, int j, int k) const {
    if (accessible(i, j, k) == Real(0)) {
      return Real(0);
    }
    Real sum;
    Real weight;
    neighbours(p, b, i, j, k, sum, weight);
    return (weight * p(b, i, j, k) - sum) * inv_dx2;
  }
};

inline void require_solvable(const ScalarField& divergence, const DomainState& state) {
  require_on_domain(divergence, state.domain(), "pressure solve");
}

/// out = -A p
inline void apply_negative_laplacian(const PoissonMasks& masks,
                                     const GridView& p,
                                     const GridView& out) {
  Kokkos::parallel_for(
      "plumix_poisson_apply",
      Policy4D({0, 0, 0, 0},
               {static_cast<std::int64_t>(p.extent(0)), static_cast<std::int64_t>(masks.n0),
                static_cast<std::int64_t>(masks.n1), static_cast<std::int64_t>(masks.n2)}),
      KOKKOS_LAMBDA(const int b, const int i, const int j, const int k) {
        out(b, i, j, k) = masks.negative_laplacian(p, b, i, j, k);
      });
  ExecSpace().fence();
}

/// max |A p - div| over accessible cells.
inline Real residual_max_norm(const PoissonMasks& masks,
                              const GridView& p,
                              const GridView& divergence) {
  Real result = Real(0);
  Kokkos::parallel_reduce(
      "plumix_poisson_residual",
      Policy4D({0, 0, 0, 0},
               {static_cast<std::int64_t>(p.extent(0)), static_cast<std::int64_t>(masks.n0),
                static_cast<std::int64_t>(masks.n1), static_cast<std::int64_t>(masks.n2)}),
      KOKKOS_LAMBDA(const int b, const int i, const int j, const int k, Real& acc) {
        if (masks.accessible(i, j, k) == Real(0)) {
          return;
        }
        const Real r = Kokkos::fabs(-masks.negative_laplacian(p, b, i, j, k) -
                                    divergence(b, i, j, k));
        if (r > acc) {
          acc = r;
        }
      },
      Kokkos::Max<Real>(result));
  return result;
}

inline Real dot(const GridView& x, const GridView& y) {
  Real result = Real(0);
  Kokkos::parallel_reduce(
      "plumix_dot",
      Policy4D({0, 0, 0, 0},
               {static_cast<std::int64_t>(x.extent(0)), static_cast<std::int64_t>(x.extent(1)),
                static_cast<std::int64_t>(x.extent(2)), static_cast<std::int64_t>(x.extent(3))}),
      KOKKOS_LAMBDA(const int b, const int i, const int j, const int k, Real& acc) {
        acc += x(b, i, j, k) * y(b, i, j, k);
      },
      result);
  return result;
}

/// Starting pressure: the guess restricted to accessible cells, or zero.
inline ScalarField initial_pressure(const ScalarField& divergence,
                                    const DomainState& state,
                                    const std::optional<ScalarField>& guess) {
  if (guess.has_value()) {
    require_same_shape(*guess, divergence, "pressure guess");
    return multiply_mask(*guess, state.accessible(), "plumix_pressure");
  }
  ScalarField p = make_like(divergence, "plumix_pressure");
  Kokkos::deep_copy(p.data, Real(0));
  return p;
}

} // namespace solver
} // namespace plumix
