#pragma once

#include <array>
#include <cstddef>

#include <Kokkos_Core.hpp>

#include <plumix/core/backend.hpp>

namespace plumix {

// ============================================================================
// GEOMETRY PRIMITIVES
// ============================================================================

/**
 * @brief Solid or source shape in grid coordinates (cell units).
 *
 * Coordinates follow the domain axes: axis 0 is vertical. For rank 2
 * domains the third coordinate is ignored.
 */
struct GeometryPrimitive {
  enum Type : int {
    Box = 0,
    Sphere = 1
  };

  Type type = Box;
  Real params[6] = {Real(0)};

  /// Axis-aligned box [lower, upper) per axis.
  static GeometryPrimitive box(const std::array<Real, 3>& lower,
                               const std::array<Real, 3>& upper) {
    GeometryPrimitive g;
    g.type = Box;
    for (int a = 0; a < 3; ++a) {
      g.params[a] = lower[static_cast<std::size_t>(a)];
      g.params[3 + a] = upper[static_cast<std::size_t>(a)];
    }
    return g;
  }

  /// 2D convenience: box over [lo0, hi0) x [lo1, hi1).
  static GeometryPrimitive box(Real lo0, Real hi0, Real lo1, Real hi1) {
    return box({lo0, lo1, Real(0)}, {hi0, hi1, Real(1)});
  }

  /// Sphere (circle in 2D) of `radius` around `center`.
  static GeometryPrimitive sphere(const std::array<Real, 3>& center, Real radius) {
    GeometryPrimitive g;
    g.type = Sphere;
    g.params[0] = center[0];
    g.params[1] = center[1];
    g.params[2] = center[2];
    g.params[3] = radius;
    return g;
  }

  static GeometryPrimitive sphere(Real c0, Real c1, Real radius) {
    return sphere({c0, c1, Real(0.5)}, radius);
  }

  /// Whether point x lies inside; `rank` selects how many axes are tested.
  KOKKOS_INLINE_FUNCTION
  bool contains(Real x0, Real x1, Real x2, int rank) const {
    if (type == Box) {
      const bool in01 = x0 >= params[0] && x0 < params[3] &&
                        x1 >= params[1] && x1 < params[4];
      if (rank < 3) {
        return in01;
      }
      return in01 && x2 >= params[2] && x2 < params[5];
    }
    const Real d0 = x0 - params[0];
    const Real d1 = x1 - params[1];
    const Real d2 = rank < 3 ? Real(0) : x2 - params[2];
    return d0 * d0 + d1 * d1 + d2 * d2 <= params[3] * params[3];
  }
};

/**
 * @brief Source region emitting density at `rate` per unit time.
 */
struct Inflow {
  GeometryPrimitive shape;
  Real rate = Real(1);
};

} // namespace plumix
