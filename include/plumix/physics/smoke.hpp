#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include <plumix/core/backend.hpp>
#include <plumix/core/domain.hpp>
#include <plumix/core/errors.hpp>
#include <plumix/field/advection.hpp>
#include <plumix/field/field_ops.hpp>
#include <plumix/field/grid_field.hpp>
#include <plumix/field/staggered_ops.hpp>
#include <plumix/physics/domain_state.hpp>
#include <plumix/physics/observer.hpp>
#include <plumix/physics/physics.hpp>
#include <plumix/physics/smoke_state.hpp>
#include <plumix/solver/conjugate_gradient.hpp>
#include <plumix/solver/pressure_solver.hpp>
#include <plumix/world/world.hpp>

namespace plumix {

// ============================================================================
// PRESSURE SOLVE INPUT
// ============================================================================

/// Divergence already computed by the caller; used as is.
struct RawDivergence {
  ScalarField divergence;
};

/// Velocity whose divergence is to be removed.
struct VelocityInput {
  StaggeredField velocity;
};

using PressureInput = std::variant<RawDivergence, VelocityInput>;

// ============================================================================
// SMOKE ENGINE
// ============================================================================

/**
 * @brief Incompressible buoyant smoke on a MAC grid.
 *
 * One step runs the fixed stage table
 *
 *   advect -> inflow -> buoyancy -> friction -> divergence_free
 *
 * Each stage takes a state and returns a new one; input views are never
 * written. The engine owns two pieces of mutable bookkeeping: the cached
 * DomainState, rebuilt when the world's geometry version moves, and the
 * diagnostics of the last pressure solve.
 *
 * Usage:
 * @code
 *   auto world = std::make_shared<plumix::World>();
 *   world->add_inflow(plumix::GeometryPrimitive::sphere(8, 32, 4), 0.2);
 *   plumix::Smoke smoke(plumix::Domain::closed(64, 64), world);
 *   plumix::SmokeState s = smoke.shape(1);
 *   for (int n = 0; n < 100; ++n) s = smoke.step(s);
 * @endcode
 */
class Smoke {
public:
  using State = SmokeState;

  /// Scalar g means [g, 0, ..., 0]; a vector must have one entry per axis.
  using Gravity = std::variant<Real, std::vector<Real>>;

  struct Config {
    Gravity gravity = Real(-9.81);
    Real buoyancy_factor = Real(0.1);
    bool conserve_density = false;
    Real dt = Real(1);
    // The built-in solvers keep no state between solves and may be shared.
    std::shared_ptr<PressureSolver> pressure_solver =
        std::make_shared<ConjugateGradientSolver>();
  };

  using StageFn = SmokeState (Smoke::*)(const SmokeState&);

  struct Stage {
    const char* name;
    StageFn apply;
  };

  static constexpr std::size_t stage_count = 5;

  Smoke(const Domain& domain, std::shared_ptr<const World> world)
      : Smoke(domain, std::move(world), Config{}) {}

  Smoke(const Domain& domain, std::shared_ptr<const World> world, Config cfg)
      : domain_(domain),
        world_(std::move(world)),
        cfg_(std::move(cfg)),
        created_(std::chrono::steady_clock::now()) {
    domain_.validate();
    if (!world_) {
      throw ConfigurationError("smoke engine needs a world");
    }
    if (!cfg_.pressure_solver) {
      throw ConfigurationError("smoke engine needs a pressure solver");
    }
    if (!(cfg_.dt > Real(0))) {
      throw ConfigurationError("time step must be positive, got " +
                               std::to_string(cfg_.dt));
    }
    gravity_ = resolve_gravity(cfg_.gravity, domain_.rank);
    domain_state_ = std::make_shared<const DomainState>(domain_, *world_);
  }

  Smoke(const Smoke&) = delete;
  Smoke& operator=(const Smoke&) = delete;

  // ==========================================================================
  // PHYSICS INTERFACE
  // ==========================================================================

  /// Zero density and velocity for `batch` independent simulations.
  SmokeState shape(int batch) const {
    if (batch <= 0) {
      throw std::invalid_argument("plumix: shape: batch size must be positive");
    }
    return SmokeState(make_scalar_field(domain_, batch, Real(0), "plumix_density"),
                      make_staggered_field(domain_, batch, Real(0), "plumix_velocity"));
  }

  SmokeState step(const SmokeState& state) {
    require_state(state, "step");
    const auto t0 = std::chrono::steady_clock::now();
    refresh_domain();

    SmokeState current = state;
    {
      const StepInProgress in_progress(stepping_);
      if (!observers_.empty()) {
        observers_.notify(SmokeEvent::StepBegin, make_report());
      }
      for (const Stage& stage : pipeline()) {
        current = (this->*stage.apply)(current);
      }
    }
    // a step that throws leaves the count unchanged
    ++step_index_;

    if (!observers_.empty()) {
      StepReport report = make_report();
      report.density_total = total(current.density(), 0);
      report.step_time =
          std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
      observers_.notify(SmokeEvent::StepEnd, report);
    }
    return current;
  }

  nlohmann::json serialize() const {
    nlohmann::json j;
    j["type"] = "smoke";
    j["class"] = "Smoke";
    j["module"] = "plumix::physics";
    j["rank"] = domain_.rank;
    j["domain"] = domain_.to_json();
    j["gravity"] = gravity_;
    j["buoyancy_factor"] = cfg_.buoyancy_factor;
    j["conserve_density"] = cfg_.conserve_density;
    j["dt"] = cfg_.dt;
    j["solver"] = cfg_.pressure_solver->name();
    return j;
  }

  /// Engines are not reconstructible from their serialized form.
  static std::unique_ptr<Smoke> deserialize(const nlohmann::json& data) {
    const std::string type = data.is_object() && data.contains("type") && data["type"].is_string()
                                 ? data["type"].get<std::string>()
                                 : std::string("<none>");
    throw UnsupportedOperation("Smoke cannot be deserialized (type=" + type + ")");
  }

  // ==========================================================================
  // STAGES
  // ==========================================================================

  /// Ordered stage table run by step().
  static const std::array<Stage, stage_count>& pipeline() {
    static const std::array<Stage, stage_count> stages{{
        {"advect", &Smoke::advect},
        {"inflow", &Smoke::inflow},
        {"buoyancy", &Smoke::buoyancy},
        {"friction", &Smoke::friction},
        {"divergence_free", &Smoke::divergence_free},
    }};
    return stages;
  }

  /**
   * @brief Semi-Lagrangian transport of density and velocity.
   *
   * Both are traced back through the incoming velocity. With
   * `conserve_density` each batch entry is rescaled to its pre-advection
   * total.
   */
  SmokeState advect(const SmokeState& state) {
    ScalarField density = plumix::advect(state.density(), state.velocity(), cfg_.dt, domain_);
    if (cfg_.conserve_density) {
      density = normalize_to(density, state.density());
    }
    StaggeredField velocity = plumix::advect(state.velocity(), cfg_.dt, domain_);
    return SmokeState(std::move(density), std::move(velocity));
  }

  /// density + inflow_rate * dt
  SmokeState inflow(const SmokeState& state) {
    const auto ds = domain_state();
    ScalarField density = add_mask(state.density(), cfg_.dt, ds->inflow(), "plumix_density");
    return SmokeState(std::move(density), state.velocity());
  }

  /// velocity + from_scalar(density, -gravity * buoyancy_factor * dt)
  SmokeState buoyancy(const SmokeState& state) {
    std::vector<Real> factors(gravity_.size());
    for (std::size_t a = 0; a < gravity_.size(); ++a) {
      factors[a] = gravity_[a] * cfg_.buoyancy_factor * Real(-1) * cfg_.dt;
    }
    StaggeredField force = from_scalar(state.density(), factors, domain_);
    return SmokeState(state.density(), add(state.velocity(), force));
  }

  /// Hard boundary conditions only; no material friction model.
  SmokeState friction(const SmokeState& state) {
    const auto ds = domain_state();
    return SmokeState(state.density(), ds->with_hard_boundary_conditions(state.velocity()));
  }

  /**
   * @brief Chorin projection onto the divergence-free subspace.
   *
   * v <- bc(v) - bc(grad p) with A p = div(bc(v)). After the solve,
   * max |div v| over accessible cells equals the solver residual.
   */
  SmokeState divergence_free(const SmokeState& state) {
    const auto ds = domain_state();
    StaggeredField velocity = ds->with_hard_boundary_conditions(state.velocity());
    const ScalarField pressure = solve_pressure(VelocityInput{velocity});
    StaggeredField grad = ds->with_hard_boundary_conditions(gradient(pressure, domain_));
    return SmokeState(state.density(), subtract(velocity, grad));
  }

  // ==========================================================================
  // PRESSURE
  // ==========================================================================

  /**
   * @brief Solve A p = div for the current domain.
   *
   * Diagnostics are recorded before convergence is checked, so they remain
   * available when SolverConvergenceFailure is thrown.
   */
  ScalarField solve_pressure(const PressureInput& input) {
    refresh_domain();
    const auto ds = domain_state();

    ScalarField div;
    if (const RawDivergence* raw = std::get_if<RawDivergence>(&input)) {
      require_on_domain(raw->divergence, domain_, "solve_pressure");
      div = raw->divergence;
    } else {
      const VelocityInput& vin = std::get<VelocityInput>(input);
      div = divergence(ds->with_hard_boundary_conditions(vin.velocity), domain_);
    }

    PressureSolution solution = cfg_.pressure_solver->solve(div, *ds, std::nullopt);
    last_pressure_ = solution.pressure;
    last_iterations_ = solution.iterations;
    last_residual_ = solution.residual;

    if (!observers_.empty()) {
      observers_.notify(SmokeEvent::PressureSolved, make_report());
    }

    if (!solution.converged) {
      SolverConvergenceFailure failure(cfg_.pressure_solver->name(),
                                       solution.iterations,
                                       static_cast<double>(solution.residual),
                                       static_cast<double>(cfg_.pressure_solver->accuracy()));
      if (!observers_.empty()) {
        StepReport report = make_report();
        report.message = failure.what();
        observers_.notify(SmokeEvent::Error, report);
      }
      throw failure;
    }
    return solution.pressure;
  }

  const std::optional<ScalarField>& last_pressure() const { return last_pressure_; }
  int last_iteration_count() const { return last_iterations_; }
  Real last_residual() const { return last_residual_; }

  // ==========================================================================
  // ACCESSORS
  // ==========================================================================

  const Domain& domain() const { return domain_; }
  const Config& config() const { return cfg_; }
  const std::vector<Real>& gravity() const { return gravity_; }
  /// Number of completed steps.
  int step_index() const { return step_index_; }
  int domain_rebuilds() const { return domain_rebuilds_; }

  /// Snapshot of the cached domain; stays valid across later rebuilds.
  std::shared_ptr<const DomainState> domain_state() const {
    std::lock_guard<std::mutex> lock(domain_mutex_);
    return domain_state_;
  }

  ObserverManager& observers() { return observers_; }

private:
  /// Marks the body of step(); reports raised inside it carry the step number in flight.
  class StepInProgress {
  public:
    explicit StepInProgress(bool& flag) : flag_(flag) { flag_ = true; }
    ~StepInProgress() { flag_ = false; }
    StepInProgress(const StepInProgress&) = delete;
    StepInProgress& operator=(const StepInProgress&) = delete;

  private:
    bool& flag_;
  };

  static std::vector<Real> resolve_gravity(const Gravity& gravity, int rank) {
    if (const Real* g = std::get_if<Real>(&gravity)) {
      std::vector<Real> out(static_cast<std::size_t>(rank), Real(0));
      out[0] = *g;
      return out;
    }
    const std::vector<Real>& vec = std::get<std::vector<Real>>(gravity);
    if (static_cast<int>(vec.size()) != rank) {
      throw ConfigurationError("gravity has " + std::to_string(vec.size()) +
                               " components but the domain has rank " +
                               std::to_string(rank));
    }
    return vec;
  }

  void require_state(const SmokeState& state, const char* op) const {
    require_on_domain(state.density(), domain_, op);
    require_on_domain(state.velocity(), domain_, op);
  }

  void refresh_domain() {
    const std::uint64_t version = world_->geometry_version();
    if (domain_state()->geometry_version() == version) {
      return;
    }
    auto rebuilt = std::make_shared<const DomainState>(domain_, *world_);
    {
      std::lock_guard<std::mutex> lock(domain_mutex_);
      domain_state_ = std::move(rebuilt);
    }
    ++domain_rebuilds_;
    if (!observers_.empty()) {
      observers_.notify(SmokeEvent::DomainRebuilt, make_report());
    }
  }

  StepReport make_report() const {
    StepReport r;
    r.step = stepping_ ? step_index_ + 1 : step_index_;
    r.dt = cfg_.dt;
    r.solver = cfg_.pressure_solver->name();
    r.iterations = last_iterations_;
    r.residual = last_residual_;
    r.wall_time =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - created_).count();
    return r;
  }

  Domain domain_;
  std::shared_ptr<const World> world_;
  Config cfg_;
  std::vector<Real> gravity_;
  std::chrono::steady_clock::time_point created_;

  mutable std::mutex domain_mutex_;
  std::shared_ptr<const DomainState> domain_state_;
  int domain_rebuilds_ = 0;

  int step_index_ = 0;
  bool stepping_ = false;
  std::optional<ScalarField> last_pressure_;
  int last_iterations_ = 0;
  Real last_residual_ = Real(0);

  ObserverManager observers_;
};

static_assert(Physics<Smoke>);

} // namespace plumix
