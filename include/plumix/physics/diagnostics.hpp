#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include <Kokkos_Core.hpp>

#include <plumix/core/backend.hpp>
#include <plumix/core/domain.hpp>
#include <plumix/field/field_ops.hpp>
#include <plumix/field/grid_field.hpp>
#include <plumix/field/staggered_ops.hpp>
#include <plumix/physics/smoke_state.hpp>

namespace plumix {

/**
 * @brief Per-batch summary of a smoke state.
 *
 * `mass` is the density sum, `max_speed` the largest cell-centred velocity
 * magnitude.
 */
struct StateDiagnostics {
  std::vector<Real> mass;
  std::vector<Real> max_density;
  std::vector<Real> max_speed;
};

inline StateDiagnostics diagnostics(const SmokeState& state, const Domain& domain) {
  require_on_domain(state.density(), domain, "diagnostics");
  StateDiagnostics out;
  out.mass = totals(state.density());

  const std::vector<ScalarField> centered = cell_centered(state.velocity(), domain);
  const auto rho = state.density().data;
  const auto c0 = centered[0].data;
  const auto c1 = centered[1].data;
  const GridView c2 = centered.size() > 2 ? centered[2].data : GridView();
  const bool has_c2 = centered.size() > 2;
  const Policy3D policy = detail::cell_policy(state.density());

  const int nb = state.batch_size();
  out.max_density.resize(static_cast<std::size_t>(nb));
  out.max_speed.resize(static_cast<std::size_t>(nb));
  for (int b = 0; b < nb; ++b) {
    Real rho_max = Real(0);
    Kokkos::parallel_reduce(
        "plumix_diag_max_density", policy,
        KOKKOS_LAMBDA(const int i, const int j, const int k, Real& acc) {
          const Real v = rho(b, i, j, k);
          if (v > acc) {
            acc = v;
          }
        },
        Kokkos::Max<Real>(rho_max));

    Real speed2_max = Real(0);
    Kokkos::parallel_reduce(
        "plumix_diag_max_speed", policy,
        KOKKOS_LAMBDA(const int i, const int j, const int k, Real& acc) {
          Real s2 = c0(b, i, j, k) * c0(b, i, j, k) + c1(b, i, j, k) * c1(b, i, j, k);
          if (has_c2) {
            s2 += c2(b, i, j, k) * c2(b, i, j, k);
          }
          if (s2 > acc) {
            acc = s2;
          }
        },
        Kokkos::Max<Real>(speed2_max));

    out.max_density[static_cast<std::size_t>(b)] = rho_max;
    out.max_speed[static_cast<std::size_t>(b)] = Kokkos::sqrt(speed2_max);
  }
  return out;
}

} // namespace plumix
