#pragma once

#include <stdexcept>
#include <string>

namespace plumix {

/**
 * @brief Invalid engine or domain configuration detected at construction.
 */
class ConfigurationError : public std::invalid_argument {
public:
  explicit ConfigurationError(const std::string& what)
      : std::invalid_argument("plumix: configuration: " + what) {}
};

/**
 * @brief Pressure solve stopped at its iteration cap above tolerance.
 *
 * Carries the iteration count and the last max-norm residual so the caller
 * can tell a failed solve from an imprecise one.
 */
class SolverConvergenceFailure : public std::runtime_error {
public:
  SolverConvergenceFailure(const std::string& solver,
                           int iterations,
                           double residual,
                           double tolerance)
      : std::runtime_error("plumix: " + solver + " did not converge after " +
                           std::to_string(iterations) +
                           " iterations (residual=" + std::to_string(residual) +
                           ", tolerance=" + std::to_string(tolerance) + ")"),
        iterations_(iterations),
        residual_(residual),
        tolerance_(tolerance) {}

  int iterations() const noexcept { return iterations_; }
  double residual() const noexcept { return residual_; }
  double tolerance() const noexcept { return tolerance_; }

private:
  int iterations_ = 0;
  double residual_ = 0.0;
  double tolerance_ = 0.0;
};

/**
 * @brief Operation that exists on the interface but is not supported.
 */
class UnsupportedOperation : public std::logic_error {
public:
  explicit UnsupportedOperation(const std::string& what)
      : std::logic_error("plumix: unsupported: " + what) {}
};

} // namespace plumix
