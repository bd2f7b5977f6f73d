#pragma once

#include <array>
#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

#include <plumix/core/backend.hpp>
#include <plumix/core/errors.hpp>

namespace plumix {

/**
 * @brief Treatment of the faces on the outer edge of the grid.
 *
 * Open: fluid may cross the edge, pressure outside the box is zero.
 * Closed: the edge is a solid wall, normal velocity is zero there.
 */
enum class Boundary : int {
  Open = 0,
  Closed = 1
};

inline const char* to_string(Boundary boundary) {
  switch (boundary) {
    case Boundary::Open: return "open";
    case Boundary::Closed: return "closed";
    default: return "unknown";
  }
}

/**
 * @brief Rectangular grid domain of rank 2 or 3.
 *
 * Axis 0 is the vertical axis. Cell (i, j, k) covers
 * [i, i+1) x [j, j+1) x [k, k+1) in cell units; physical size is `dx` per
 * cell on every axis. For rank 2 the third extent is 1.
 */
struct Domain {
  int rank = 2;
  std::array<int, 3> resolution{64, 64, 1};
  Boundary boundary = Boundary::Open;
  Real dx = Real(1);

  static Domain open(int n0, int n1) {
    return Domain{2, {n0, n1, 1}, Boundary::Open, Real(1)};
  }

  static Domain open(int n0, int n1, int n2) {
    return Domain{3, {n0, n1, n2}, Boundary::Open, Real(1)};
  }

  static Domain closed(int n0, int n1) {
    return Domain{2, {n0, n1, 1}, Boundary::Closed, Real(1)};
  }

  static Domain closed(int n0, int n1, int n2) {
    return Domain{3, {n0, n1, n2}, Boundary::Closed, Real(1)};
  }

  int extent(int axis) const { return resolution[static_cast<std::size_t>(axis)]; }

  std::size_t cell_count() const {
    return static_cast<std::size_t>(resolution[0]) *
           static_cast<std::size_t>(resolution[1]) *
           static_cast<std::size_t>(resolution[2]);
  }

  /// Extents of the face grid normal to `axis`.
  std::array<int, 3> face_resolution(int axis) const {
    std::array<int, 3> r = resolution;
    r[static_cast<std::size_t>(axis)] += 1;
    return r;
  }

  void validate() const {
    if (rank != 2 && rank != 3) {
      throw ConfigurationError("domain rank must be 2 or 3, got " +
                               std::to_string(rank));
    }
    for (int a = 0; a < rank; ++a) {
      if (extent(a) <= 0) {
        throw ConfigurationError("domain resolution must be positive on axis " +
                                 std::to_string(a));
      }
    }
    if (rank == 2 && resolution[2] != 1) {
      throw ConfigurationError("rank 2 domain must have unit extent on axis 2");
    }
    if (!(dx > Real(0))) {
      throw ConfigurationError("cell size must be positive");
    }
  }

  nlohmann::json to_json() const {
    nlohmann::json j;
    j["rank"] = rank;
    nlohmann::json res = nlohmann::json::array();
    for (int a = 0; a < rank; ++a) {
      res.push_back(extent(a));
    }
    j["resolution"] = res;
    j["boundary"] = to_string(boundary);
    j["dx"] = dx;
    return j;
  }
};

inline bool operator==(const Domain& a, const Domain& b) {
  return a.rank == b.rank && a.resolution == b.resolution &&
         a.boundary == b.boundary && a.dx == b.dx;
}

} // namespace plumix
