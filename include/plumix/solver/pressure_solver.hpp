#pragma once

#include <optional>
#include <string>

#include <plumix/core/backend.hpp>
#include <plumix/field/grid_field.hpp>
#include <plumix/physics/domain_state.hpp>

namespace plumix {

/**
 * @brief Result of one pressure solve.
 *
 * `residual` is max |A p - div| over accessible cells after the last
 * iteration. `converged` is false when the iteration cap was reached first.
 */
struct PressureSolution {
  ScalarField pressure;
  int iterations = 0;
  Real residual = Real(0);
  bool converged = false;
};

/**
 * @brief Poisson solver for the projection pressure.
 *
 * Solves A p = div where A p = div(face_mask * grad p) on accessible cells
 * of `domain`, p = 0 inside obstacles and, for open boundaries, outside the
 * box. Implementations never modify `divergence` or `guess`.
 */
class PressureSolver {
public:
  virtual ~PressureSolver() = default;

  virtual PressureSolution solve(const ScalarField& divergence,
                                 const DomainState& domain,
                                 const std::optional<ScalarField>& guess) = 0;

  virtual std::string name() const = 0;

  /// Convergence threshold on the max-norm residual.
  virtual Real accuracy() const = 0;

  /// Iteration cap; reaching it above `accuracy()` is a failed solve.
  virtual int max_iterations() const = 0;
};

} // namespace plumix
