#include <benchmark/benchmark.h>
#include <Kokkos_Core.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>

#include <plumix/plumix.hpp>

using namespace plumix;

namespace {

std::shared_ptr<World> make_plume_world(int n) {
  auto world = std::make_shared<World>();
  const Real r = static_cast<Real>(n) / Real(8);
  world->add_inflow(GeometryPrimitive::sphere(Real(2) * r, Real(0.5) * static_cast<Real>(n), r),
                    Real(0.2));
  return world;
}

// Swirling, non-solenoidal velocity so that every solve has work to do.
StaggeredField make_test_velocity(const Domain& domain) {
  StaggeredField v = make_staggered_field(domain, 1);
  for (int a = 0; a < domain.rank; ++a) {
    auto data = v[a].data;
    const Real phase = static_cast<Real>(a + 1);
    Kokkos::parallel_for(
        "plumix_bench_fill_velocity",
        Policy3D({0, 0, 0},
                 {static_cast<int64_t>(data.extent(1)), static_cast<int64_t>(data.extent(2)),
                  static_cast<int64_t>(data.extent(3))}),
        KOKKOS_LAMBDA(const int i, const int j, const int k) {
          data(0, i, j, k) = Kokkos::sin(Real(0.37) * phase * i + Real(0.23) * j + k);
        });
  }
  Kokkos::fence();
  return v;
}

void report_cells(benchmark::State& state, std::size_t cells, double total_seconds) {
  const double total_cells =
      static_cast<double>(cells) * static_cast<double>(state.iterations());
  state.counters["ns_per_cell"] = (total_seconds / total_cells) * 1e9;
}

void BM_SmokeStep(benchmark::State& state) {
  const int n = static_cast<int>(state.range(0));
  const Domain domain = Domain::open(n, n);
  Smoke smoke(domain, make_plume_world(n));
  SmokeState s = smoke.shape(1);

  double total_seconds = 0.0;
  for (auto _ : state) {
    const auto t0 = std::chrono::steady_clock::now();
    try {
      s = smoke.step(s);
    } catch (const std::exception& e) {
      state.SkipWithError(e.what());
      return;
    }
    const auto t1 = std::chrono::steady_clock::now();
    total_seconds += std::chrono::duration<double>(t1 - t0).count();
    benchmark::DoNotOptimize(s.density().data.data());
  }
  report_cells(state, domain.cell_count(), total_seconds);
  state.counters["cg_iterations"] = static_cast<double>(smoke.last_iteration_count());
}

template <class Solver>
void bench_pressure_solve(benchmark::State& state, const Domain& domain) {
  World world;
  world.add_obstacle(GeometryPrimitive::sphere(Real(0.5) * static_cast<Real>(domain.extent(0)),
                                               Real(0.5) * static_cast<Real>(domain.extent(1)),
                                               Real(0.1) * static_cast<Real>(domain.extent(0))));
  const DomainState ds(domain, world);
  const ScalarField div =
      divergence(ds.with_hard_boundary_conditions(make_test_velocity(domain)), domain);

  Solver solver;
  int iterations = 0;
  double total_seconds = 0.0;
  for (auto _ : state) {
    const auto t0 = std::chrono::steady_clock::now();
    const PressureSolution sol = solver.solve(div, ds, std::nullopt);
    const auto t1 = std::chrono::steady_clock::now();
    total_seconds += std::chrono::duration<double>(t1 - t0).count();
    iterations = sol.iterations;
    benchmark::DoNotOptimize(sol.pressure.data.data());
  }
  report_cells(state, domain.cell_count(), total_seconds);
  state.counters["iterations"] = static_cast<double>(iterations);
}

void BM_ConjugateGradientOpen2D(benchmark::State& state) {
  const int n = static_cast<int>(state.range(0));
  bench_pressure_solve<ConjugateGradientSolver>(state, Domain::open(n, n));
}

void BM_ConjugateGradientClosed2D(benchmark::State& state) {
  const int n = static_cast<int>(state.range(0));
  bench_pressure_solve<ConjugateGradientSolver>(state, Domain::closed(n, n));
}

void BM_ConjugateGradientOpen3D(benchmark::State& state) {
  const int n = static_cast<int>(state.range(0));
  bench_pressure_solve<ConjugateGradientSolver>(state, Domain::open(n, n, n));
}

void BM_JacobiOpen2D(benchmark::State& state) {
  const int n = static_cast<int>(state.range(0));
  bench_pressure_solve<JacobiSolver>(state, Domain::open(n, n));
}

void BM_Advection2D(benchmark::State& state) {
  const int n = static_cast<int>(state.range(0));
  const Domain domain = Domain::open(n, n);
  const StaggeredField v = make_test_velocity(domain);
  const ScalarField rho = make_scalar_field(domain, 1, Real(1));

  double total_seconds = 0.0;
  for (auto _ : state) {
    const auto t0 = std::chrono::steady_clock::now();
    const ScalarField out = advect(rho, v, Real(1), domain);
    Kokkos::fence();
    const auto t1 = std::chrono::steady_clock::now();
    total_seconds += std::chrono::duration<double>(t1 - t0).count();
    benchmark::DoNotOptimize(out.data.data());
  }
  report_cells(state, domain.cell_count(), total_seconds);
}

} // namespace

BENCHMARK(BM_SmokeStep)->Arg(32)->Arg(64)->Arg(128)->Unit(benchmark::kMillisecond);
BENCHMARK(BM_ConjugateGradientOpen2D)->Arg(32)->Arg(64)->Arg(128)->Unit(benchmark::kMillisecond);
BENCHMARK(BM_ConjugateGradientClosed2D)->Arg(32)->Arg(64)->Unit(benchmark::kMillisecond);
BENCHMARK(BM_ConjugateGradientOpen3D)->Arg(16)->Arg(32)->Unit(benchmark::kMillisecond);
BENCHMARK(BM_JacobiOpen2D)->Arg(16)->Arg(32)->Unit(benchmark::kMillisecond);
BENCHMARK(BM_Advection2D)->Arg(64)->Arg(256)->Arg(1024)->Unit(benchmark::kMicrosecond);

int main(int argc, char** argv) {
  Kokkos::initialize(argc, argv);
  ::benchmark::Initialize(&argc, argv);
  if (::benchmark::ReportUnrecognizedArguments(argc, argv)) {
    return 1;
  }
  ::benchmark::RunSpecifiedBenchmarks();
  Kokkos::finalize();
  return 0;
}
