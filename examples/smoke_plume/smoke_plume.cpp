#include <Kokkos_Core.hpp>

#include "../example_output.hpp"

#include <plumix/core/domain.hpp>
#include <plumix/core/errors.hpp>
#include <plumix/io/vtk_export.hpp>
#include <plumix/physics/diagnostics.hpp>
#include <plumix/physics/observer.hpp>
#include <plumix/physics/smoke.hpp>
#include <plumix/solver/conjugate_gradient.hpp>
#include <plumix/solver/jacobi.hpp>
#include <plumix/world/geometry.hpp>
#include <plumix/world/world.hpp>

#include <algorithm>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

namespace {

using plumix::Real;
using plumix_examples::make_example_output_dir;
using plumix_examples::output_file;
using plumix_examples::step_file_name;

struct RunConfig {
  int nx = 64;           // horizontal cells (axis 1)
  int ny = 96;           // vertical cells (axis 0)
  int max_steps = 200;
  Real dt = 0.5;
  Real gravity = -9.81;
  Real buoyancy = 0.1;
  Real accuracy = 1e-3;
  int max_iters = 2000;
  std::string solver = "cg";
  bool closed = false;
  bool conserve_density = false;
  bool obstacle = false;
  Real source_rate = 0.2;
  int output_stride = 10;
  int diag_stride = 10;
  bool enable_output = true;
  bool verbose = false;
};

RunConfig
parse_args(int argc, char* argv[]) {
  RunConfig cfg;
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg(argv[i]);
    auto read_int = [&](int& target) {
      if (i + 1 < argc) {
        target = std::atoi(argv[++i]);
      }
    };
    auto read_real = [&](Real& target) {
      if (i + 1 < argc) {
        target = static_cast<Real>(std::atof(argv[++i]));
      }
    };

    if (arg == "--nx") read_int(cfg.nx);
    else if (arg == "--ny") read_int(cfg.ny);
    else if (arg == "--steps") read_int(cfg.max_steps);
    else if (arg == "--dt") read_real(cfg.dt);
    else if (arg == "--gravity") read_real(cfg.gravity);
    else if (arg == "--buoyancy") read_real(cfg.buoyancy);
    else if (arg == "--accuracy") read_real(cfg.accuracy);
    else if (arg == "--max-iters") read_int(cfg.max_iters);
    else if (arg == "--solver" && i + 1 < argc) cfg.solver = argv[++i];
    else if (arg == "--source-rate") read_real(cfg.source_rate);
    else if (arg == "--output-stride") read_int(cfg.output_stride);
    else if (arg == "--diag-stride") read_int(cfg.diag_stride);
    else if (arg == "--closed") cfg.closed = true;
    else if (arg == "--conserve-density") cfg.conserve_density = true;
    else if (arg == "--obstacle") cfg.obstacle = true;
    else if (arg == "--no-output") cfg.enable_output = false;
    else if (arg == "--verbose") cfg.verbose = true;
  }
  return cfg;
}

std::shared_ptr<plumix::PressureSolver>
make_solver(const RunConfig& cfg) {
  if (cfg.solver == "cg") {
    plumix::ConjugateGradientSolver::Config solver_cfg;
    solver_cfg.accuracy = cfg.accuracy;
    solver_cfg.max_iterations = cfg.max_iters;
    return std::make_shared<plumix::ConjugateGradientSolver>(solver_cfg);
  }
  if (cfg.solver == "jacobi") {
    plumix::JacobiSolver::Config solver_cfg;
    solver_cfg.accuracy = cfg.accuracy;
    solver_cfg.max_iterations = cfg.max_iters;
    return std::make_shared<plumix::JacobiSolver>(solver_cfg);
  }
  throw plumix::ConfigurationError("unknown solver '" + cfg.solver +
                                   "' (expected cg or jacobi)");
}

int run(int argc, char* argv[]) {
  const RunConfig cfg = parse_args(argc, argv);

  const plumix::Domain domain =
      cfg.closed ? plumix::Domain::closed(cfg.ny, cfg.nx) : plumix::Domain::open(cfg.ny, cfg.nx);

  // Source near the floor, centred horizontally.
  auto world = std::make_shared<plumix::World>();
  const Real center = static_cast<Real>(cfg.nx) * Real(0.5);
  const Real radius = std::max(Real(2), static_cast<Real>(cfg.nx) / Real(16));
  world->add_inflow(plumix::GeometryPrimitive::sphere(static_cast<Real>(cfg.ny) * Real(0.1),
                                                      center, radius),
                    cfg.source_rate);
  if (cfg.obstacle) {
    world->add_obstacle(plumix::GeometryPrimitive::sphere(static_cast<Real>(cfg.ny) * Real(0.5),
                                                          center, radius * Real(1.5)));
  }

  plumix::Smoke::Config smoke_cfg;
  smoke_cfg.gravity = cfg.gravity;
  smoke_cfg.buoyancy_factor = cfg.buoyancy;
  smoke_cfg.conserve_density = cfg.conserve_density;
  smoke_cfg.dt = cfg.dt;
  smoke_cfg.pressure_solver = make_solver(cfg);

  plumix::Smoke smoke(domain, world, smoke_cfg);
  if (cfg.verbose) {
    smoke.observers().add_callback(plumix::SmokeEvent::StepEnd,
                                   plumix::observers::progress_printer(1));
  }
  smoke.observers().add_callback(plumix::SmokeEvent::Error, plumix::observers::error_printer());

  const std::filesystem::path output_dir =
      cfg.enable_output ? make_example_output_dir("smoke_plume", argc, argv)
                        : std::filesystem::path();

  std::cout << "Smoke plume: nx=" << cfg.nx
            << " ny=" << cfg.ny
            << " steps=" << cfg.max_steps
            << " dt=" << cfg.dt
            << " boundary=" << plumix::to_string(domain.boundary)
            << " solver=" << smoke_cfg.pressure_solver->name()
            << " accuracy=" << cfg.accuracy
            << " output=" << (cfg.enable_output ? output_dir.string() : "(disabled)")
            << "\n";
  if (cfg.verbose) {
    std::cout << "config " << smoke.serialize().dump() << "\n";
  }

  plumix::SmokeState state = smoke.shape(1);
  if (cfg.enable_output) {
    plumix::vtk::write_structured_points(state, output_file(output_dir, step_file_name("smoke", 0)));
  }

  for (int step = 1; step <= cfg.max_steps; ++step) {
    state = smoke.step(state);

    if (cfg.enable_output && cfg.output_stride > 0 && step % cfg.output_stride == 0) {
      plumix::vtk::write_structured_points(state,
                                           output_file(output_dir, step_file_name("smoke", step)));
    }

    if (cfg.diag_stride > 0 && step % cfg.diag_stride == 0) {
      const plumix::StateDiagnostics diag = plumix::diagnostics(state, domain);
      std::cout << "diag step=" << step
                << " t=" << static_cast<Real>(step) * cfg.dt
                << " mass=" << diag.mass[0]
                << " max=" << diag.max_density[0]
                << " max_speed=" << diag.max_speed[0]
                << " iters=" << smoke.last_iteration_count()
                << " residual=" << smoke.last_residual()
                << "\n";
    }
  }

  if (cfg.enable_output) {
    plumix::vtk::write_structured_points(
        state, output_file(output_dir, step_file_name("smoke", cfg.max_steps)));
  }
  return 0;
}

} // namespace

int main(int argc, char* argv[]) {
  Kokkos::initialize(argc, argv);
  int err = 0;
  try {
    err = run(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    err = 1;
  }
  Kokkos::finalize();
  return err;
}
