#pragma once

#include <optional>
#include <string>
#include <utility>

#include <Kokkos_Core.hpp>

#include <plumix/core/backend.hpp>
#include <plumix/core/errors.hpp>
#include <plumix/field/grid_field.hpp>
#include <plumix/physics/domain_state.hpp>
#include <plumix/solver/poisson.hpp>
#include <plumix/solver/pressure_solver.hpp>

namespace plumix {

/**
 * @brief Weighted Jacobi relaxation of the masked pressure Poisson system.
 *
 * Each sweep writes into a scratch buffer and swaps. The residual is checked
 * every `check_stride` sweeps and after the last one. Plain Jacobi
 * (omega = 1) stalls on the checkerboard mode of closed boxes, hence the
 * default under-relaxation.
 */
class JacobiSolver final : public PressureSolver {
public:
  struct Config {
    Real accuracy = Real(1e-3);
    int max_iterations = 20000;
    Real omega = Real(0.8);
    int check_stride = 10;
  };

  JacobiSolver() = default;

  explicit JacobiSolver(const Config& cfg) : cfg_(cfg) {
    if (!(cfg_.accuracy > Real(0))) {
      throw ConfigurationError("jacobi accuracy must be positive");
    }
    if (!(cfg_.omega > Real(0)) || cfg_.omega > Real(1)) {
      throw ConfigurationError("jacobi relaxation must lie in (0, 1]");
    }
    if (cfg_.max_iterations < 0 || cfg_.check_stride <= 0) {
      throw ConfigurationError("jacobi iteration limits must be positive");
    }
  }

  PressureSolution solve(const ScalarField& divergence,
                         const DomainState& domain,
                         const std::optional<ScalarField>& guess) override {
    solver::require_solvable(divergence, domain);
    const solver::PoissonMasks masks = solver::PoissonMasks::from(domain);

    PressureSolution out;
    ScalarField p = solver::initial_pressure(divergence, domain, guess);
    ScalarField tmp = make_like(divergence, "plumix_jacobi_tmp");
    Kokkos::deep_copy(tmp.data, Real(0));

    const auto div = divergence.data;
    const Real dx2 = Real(1) / masks.inv_dx2;
    const Real omega = cfg_.omega;
    const Policy4D policy = detail::full_policy(divergence);

    out.residual = solver::residual_max_norm(masks, p.data, div);
    if (out.residual <= cfg_.accuracy) {
      out.pressure = p;
      out.converged = true;
      return out;
    }

    auto p_vals = p.data;
    auto tmp_vals = tmp.data;
    for (int iter = 1; iter <= cfg_.max_iterations; ++iter) {
      Kokkos::parallel_for(
          "plumix_jacobi_sweep", policy,
          KOKKOS_LAMBDA(const int b, const int i, const int j, const int k) {
            if (masks.accessible(i, j, k) == Real(0)) {
              tmp_vals(b, i, j, k) = Real(0);
              return;
            }
            Real sum;
            Real weight;
            masks.neighbours(p_vals, b, i, j, k, sum, weight);
            const Real old = p_vals(b, i, j, k);
            const Real relaxed =
                weight > Real(0) ? (sum - div(b, i, j, k) * dx2) / weight : Real(0);
            tmp_vals(b, i, j, k) = (Real(1) - omega) * old + omega * relaxed;
          });
      ExecSpace().fence();
      std::swap(p_vals, tmp_vals);
      out.iterations = iter;

      if (iter % cfg_.check_stride == 0 || iter == cfg_.max_iterations) {
        out.residual = solver::residual_max_norm(masks, p_vals, div);
        if (out.residual <= cfg_.accuracy) {
          out.converged = true;
          break;
        }
      }
    }
    out.pressure = ScalarField(p_vals);
    return out;
  }

  std::string name() const override { return "Jacobi"; }
  Real accuracy() const override { return cfg_.accuracy; }
  int max_iterations() const override { return cfg_.max_iterations; }

  const Config& config() const { return cfg_; }

private:
  Config cfg_;
};

} // namespace plumix
