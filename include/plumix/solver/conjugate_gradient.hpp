#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include <Kokkos_Core.hpp>

#include <plumix/core/backend.hpp>
#include <plumix/core/errors.hpp>
#include <plumix/field/grid_field.hpp>
#include <plumix/physics/domain_state.hpp>
#include <plumix/solver/poisson.hpp>
#include <plumix/solver/pressure_solver.hpp>

namespace plumix {

/**
 * @brief Matrix-free conjugate gradient on the masked pressure Laplacian.
 *
 * Solves -A p = -div, which is symmetric positive semi-definite. Every batch
 * entry is an independent block of one block-diagonal system. Closed boxes
 * without open faces are singular but consistent (the divergence of a
 * velocity with zero wall flux sums to zero), which CG handles.
 */
class ConjugateGradientSolver final : public PressureSolver {
public:
  struct Config {
    Real accuracy = Real(1e-3);
    int max_iterations = 2000;

    static Config with_accuracy(Real acc) {
      Config cfg;
      cfg.accuracy = acc;
      return cfg;
    }
  };

  ConjugateGradientSolver() = default;

  explicit ConjugateGradientSolver(const Config& cfg) : cfg_(cfg) {
    if (!(cfg_.accuracy > Real(0))) {
      throw ConfigurationError("conjugate gradient accuracy must be positive");
    }
    if (cfg_.max_iterations < 0) {
      throw ConfigurationError("conjugate gradient iteration cap must be non-negative");
    }
  }

  PressureSolution solve(const ScalarField& divergence,
                         const DomainState& domain,
                         const std::optional<ScalarField>& guess) override {
    solver::require_solvable(divergence, domain);
    const solver::PoissonMasks masks = solver::PoissonMasks::from(domain);

    PressureSolution out;
    out.pressure = solver::initial_pressure(divergence, domain, guess);

    // Work vectors live for one solve only, so engines may share a solver.
    const ScalarField r_field = make_like(divergence, "plumix_cg_residual");
    const ScalarField d_field = make_like(divergence, "plumix_cg_direction");
    const ScalarField q_field = make_like(divergence, "plumix_cg_image");
    auto x = out.pressure.data;
    auto r = r_field.data;
    auto d = d_field.data;
    auto q = q_field.data;
    const auto div = divergence.data;
    const auto acc = domain.accessible();
    const Policy4D policy = detail::full_policy(divergence);

    // r = -div - (-A x), restricted to fluid cells
    solver::apply_negative_laplacian(masks, x, q);
    Kokkos::parallel_for(
        "plumix_cg_init", policy,
        KOKKOS_LAMBDA(const int b, const int i, const int j, const int k) {
          const Real rv = acc(i, j, k) * (-div(b, i, j, k) - q(b, i, j, k));
          r(b, i, j, k) = rv;
          d(b, i, j, k) = rv;
        });
    ExecSpace().fence();

    out.residual = solver::residual_max_norm(masks, x, div);
    if (out.residual <= cfg_.accuracy) {
      out.converged = true;
      return out;
    }

    Real rr = solver::dot(r, r);
    for (int it = 1; it <= cfg_.max_iterations; ++it) {
      solver::apply_negative_laplacian(masks, d, q);
      const Real dq = solver::dot(d, q);
      if (!(dq > Real(0))) {
        // Search direction lies in the null space; no further progress.
        out.iterations = it;
        break;
      }
      const Real alpha = rr / dq;
      Kokkos::parallel_for(
          "plumix_cg_update", policy,
          KOKKOS_LAMBDA(const int b, const int i, const int j, const int k) {
            x(b, i, j, k) += alpha * d(b, i, j, k);
            r(b, i, j, k) -= alpha * q(b, i, j, k);
          });
      ExecSpace().fence();

      out.iterations = it;
      out.residual = solver::residual_max_norm(masks, x, div);
      if (out.residual <= cfg_.accuracy) {
        out.converged = true;
        return out;
      }

      const Real rr_next = solver::dot(r, r);
      const Real beta = rr_next / rr;
      rr = rr_next;
      Kokkos::parallel_for(
          "plumix_cg_direction", policy,
          KOKKOS_LAMBDA(const int b, const int i, const int j, const int k) {
            d(b, i, j, k) = r(b, i, j, k) + beta * d(b, i, j, k);
          });
      ExecSpace().fence();
    }
    out.converged = out.residual <= cfg_.accuracy;
    return out;
  }

  std::string name() const override { return "ConjugateGradient"; }
  Real accuracy() const override { return cfg_.accuracy; }
  int max_iterations() const override { return cfg_.max_iterations; }

  const Config& config() const { return cfg_; }

private:
  Config cfg_;
};

} // namespace plumix
