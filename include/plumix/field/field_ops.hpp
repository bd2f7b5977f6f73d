#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <Kokkos_Core.hpp>

#include <plumix/core/backend.hpp>
#include <plumix/field/grid_field.hpp>

namespace plumix {

namespace detail {

inline Policy4D full_policy(const GridField& f) {
  return Policy4D({0, 0, 0, 0},
                  {static_cast<std::int64_t>(f.data.extent(0)),
                   static_cast<std::int64_t>(f.data.extent(1)),
                   static_cast<std::int64_t>(f.data.extent(2)),
                   static_cast<std::int64_t>(f.data.extent(3))});
}

inline Policy3D cell_policy(const GridField& f) {
  return Policy3D({0, 0, 0},
                  {static_cast<std::int64_t>(f.data.extent(1)),
                   static_cast<std::int64_t>(f.data.extent(2)),
                   static_cast<std::int64_t>(f.data.extent(3))});
}

} // namespace detail

// ============================================================================
// ELEMENTWISE ARITHMETIC (fresh output, inputs untouched)
// ============================================================================

/// out = x + alpha * y
inline GridField axpy(const GridField& x, Real alpha, const GridField& y,
                      const std::string& label = "plumix_axpy") {
  require_same_shape(x, y, "axpy");
  GridField out = make_like(x, label);
  const auto xv = x.data;
  const auto yv = y.data;
  auto ov = out.data;
  Kokkos::parallel_for(
      "plumix_axpy", detail::full_policy(x),
      KOKKOS_LAMBDA(const int b, const int i, const int j, const int k) {
        ov(b, i, j, k) = xv(b, i, j, k) + alpha * yv(b, i, j, k);
      });
  ExecSpace().fence();
  return out;
}

inline GridField add(const GridField& x, const GridField& y) {
  return axpy(x, Real(1), y, "plumix_add");
}

inline GridField subtract(const GridField& x, const GridField& y) {
  return axpy(x, Real(-1), y, "plumix_subtract");
}

inline StaggeredField add(const StaggeredField& x, const StaggeredField& y) {
  require_same_shape(x, y, "add");
  std::vector<GridField> comps;
  comps.reserve(x.components.size());
  for (int a = 0; a < x.rank(); ++a) {
    comps.push_back(axpy(x[a], Real(1), y[a], "plumix_add"));
  }
  return StaggeredField(std::move(comps));
}

inline StaggeredField subtract(const StaggeredField& x, const StaggeredField& y) {
  require_same_shape(x, y, "subtract");
  std::vector<GridField> comps;
  comps.reserve(x.components.size());
  for (int a = 0; a < x.rank(); ++a) {
    comps.push_back(axpy(x[a], Real(-1), y[a], "plumix_subtract"));
  }
  return StaggeredField(std::move(comps));
}

/// out(b, ...) = x(b, ...) * mask(...)
inline GridField multiply_mask(const GridField& x, const MaskView& mask,
                               const std::string& label = "plumix_masked") {
  if (mask.extent(0) != x.data.extent(1) || mask.extent(1) != x.data.extent(2) ||
      mask.extent(2) != x.data.extent(3)) {
    throw std::invalid_argument("plumix: multiply_mask: mask does not match field grid");
  }
  GridField out = make_like(x, label);
  const auto xv = x.data;
  auto ov = out.data;
  Kokkos::parallel_for(
      "plumix_multiply_mask", detail::full_policy(x),
      KOKKOS_LAMBDA(const int b, const int i, const int j, const int k) {
        ov(b, i, j, k) = xv(b, i, j, k) * mask(i, j, k);
      });
  ExecSpace().fence();
  return out;
}

/// out(b, ...) = x(b, ...) + alpha * mask(...)
inline GridField add_mask(const GridField& x, Real alpha, const MaskView& mask,
                          const std::string& label = "plumix_add_mask") {
  if (mask.extent(0) != x.data.extent(1) || mask.extent(1) != x.data.extent(2) ||
      mask.extent(2) != x.data.extent(3)) {
    throw std::invalid_argument("plumix: add_mask: mask does not match field grid");
  }
  GridField out = make_like(x, label);
  const auto xv = x.data;
  auto ov = out.data;
  Kokkos::parallel_for(
      "plumix_add_mask", detail::full_policy(x),
      KOKKOS_LAMBDA(const int b, const int i, const int j, const int k) {
        ov(b, i, j, k) = xv(b, i, j, k) + alpha * mask(i, j, k);
      });
  ExecSpace().fence();
  return out;
}

// ============================================================================
// REDUCTIONS
// ============================================================================

/// Sum of every cell of batch entry `b`.
inline Real total(const GridField& f, int b) {
  Real sum = Real(0);
  const auto v = f.data;
  Kokkos::parallel_reduce(
      "plumix_total", detail::cell_policy(f),
      KOKKOS_LAMBDA(const int i, const int j, const int k, Real& acc) {
        acc += v(b, i, j, k);
      },
      sum);
  return sum;
}

inline std::vector<Real> totals(const GridField& f) {
  std::vector<Real> out(static_cast<std::size_t>(f.batch()), Real(0));
  for (int b = 0; b < f.batch(); ++b) {
    out[static_cast<std::size_t>(b)] = total(f, b);
  }
  return out;
}

inline Real max_abs(const GridField& f) {
  Real result = Real(0);
  if (f.empty()) {
    return result;
  }
  const auto v = f.data;
  Kokkos::parallel_reduce(
      "plumix_max_abs", detail::full_policy(f),
      KOKKOS_LAMBDA(const int b, const int i, const int j, const int k, Real& acc) {
        const Real a = Kokkos::fabs(v(b, i, j, k));
        if (a > acc) {
          acc = a;
        }
      },
      Kokkos::Max<Real>(result));
  return result;
}

inline Real max_abs(const StaggeredField& v) {
  Real result = Real(0);
  for (const GridField& c : v.components) {
    result = Kokkos::max(result, max_abs(c));
  }
  return result;
}

/// Largest |f| over cells where mask != 0.
inline Real max_abs_masked(const GridField& f, const MaskView& mask) {
  Real result = Real(0);
  if (f.empty()) {
    return result;
  }
  const auto v = f.data;
  Kokkos::parallel_reduce(
      "plumix_max_abs_masked", detail::full_policy(f),
      KOKKOS_LAMBDA(const int b, const int i, const int j, const int k, Real& acc) {
        const Real a = mask(i, j, k) != Real(0) ? Kokkos::fabs(v(b, i, j, k)) : Real(0);
        if (a > acc) {
          acc = a;
        }
      },
      Kokkos::Max<Real>(result));
  return result;
}

/// Largest |x - y|; shapes must match.
inline Real max_abs_difference(const GridField& x, const GridField& y) {
  require_same_shape(x, y, "max_abs_difference");
  Real result = Real(0);
  if (x.empty()) {
    return result;
  }
  const auto xv = x.data;
  const auto yv = y.data;
  Kokkos::parallel_reduce(
      "plumix_max_abs_difference", detail::full_policy(x),
      KOKKOS_LAMBDA(const int b, const int i, const int j, const int k, Real& acc) {
        const Real a = Kokkos::fabs(xv(b, i, j, k) - yv(b, i, j, k));
        if (a > acc) {
          acc = a;
        }
      },
      Kokkos::Max<Real>(result));
  return result;
}

inline Real max_abs_difference(const StaggeredField& x, const StaggeredField& y) {
  require_same_shape(x, y, "max_abs_difference");
  Real result = Real(0);
  for (int a = 0; a < x.rank(); ++a) {
    result = Kokkos::max(result, max_abs_difference(x[a], y[a]));
  }
  return result;
}

// ============================================================================
// NORMALIZATION
// ============================================================================

/**
 * @brief Rescale every batch entry of `f` so its total matches `reference`.
 *
 * Entries whose current total is zero are copied unchanged.
 */
inline GridField normalize_to(const GridField& f, const GridField& reference) {
  if (f.batch() != reference.batch()) {
    throw std::invalid_argument("plumix: normalize_to: batch size mismatch");
  }
  const int nb = f.batch();
  Kokkos::View<Real*, DeviceMemorySpace> factors("plumix_normalize_factors",
                                                 static_cast<std::size_t>(nb));
  auto h_factors = Kokkos::create_mirror_view(factors);
  for (int b = 0; b < nb; ++b) {
    const Real current = total(f, b);
    const Real target = total(reference, b);
    h_factors(b) = (current != Real(0)) ? target / current : Real(1);
  }
  Kokkos::deep_copy(factors, h_factors);

  GridField out = make_like(f, "plumix_normalized");
  const auto fv = f.data;
  auto ov = out.data;
  Kokkos::parallel_for(
      "plumix_normalize_to", detail::full_policy(f),
      KOKKOS_LAMBDA(const int b, const int i, const int j, const int k) {
        ov(b, i, j, k) = fv(b, i, j, k) * factors(b);
      });
  ExecSpace().fence();
  return out;
}

} // namespace plumix
