#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <Kokkos_Core.hpp>

#include <plumix/core/backend.hpp>
#include <plumix/core/domain.hpp>
#include <plumix/world/geometry.hpp>

namespace plumix {

/**
 * @brief Scene geometry: solid obstacles and density inflows.
 *
 * Every mutation advances `geometry_version()`. Engines compare the version
 * against the one their cached domain masks were built from and rebuild
 * only when it moved. Mutation is expected from a single thread between
 * steps.
 */
class World {
public:
  World() = default;

  World& add_obstacle(const GeometryPrimitive& shape) {
    obstacles_.push_back(shape);
    ++version_;
    return *this;
  }

  World& add_inflow(const GeometryPrimitive& shape, Real rate = Real(1)) {
    inflows_.push_back(Inflow{shape, rate});
    ++version_;
    return *this;
  }

  void clear() {
    obstacles_.clear();
    inflows_.clear();
    ++version_;
  }

  const std::vector<GeometryPrimitive>& obstacles() const { return obstacles_; }
  const std::vector<Inflow>& inflows() const { return inflows_; }

  std::uint64_t geometry_version() const { return version_; }

  /// 1 where a cell centre lies inside any obstacle, 0 elsewhere.
  MaskView obstacle_mask(const Domain& domain) const {
    auto host = make_host_mask(domain);
    for_each_cell(domain, [&](int i, int j, int k, Real x0, Real x1, Real x2) {
      for (const GeometryPrimitive& g : obstacles_) {
        if (g.contains(x0, x1, x2, domain.rank)) {
          host(i, j, k) = Real(1);
          break;
        }
      }
    });
    return to_device(host, "plumix_obstacle_mask");
  }

  /// Sum of inflow rates covering each cell centre.
  MaskView inflow_mask(const Domain& domain) const {
    auto host = make_host_mask(domain);
    for_each_cell(domain, [&](int i, int j, int k, Real x0, Real x1, Real x2) {
      for (const Inflow& src : inflows_) {
        if (src.shape.contains(x0, x1, x2, domain.rank)) {
          host(i, j, k) += src.rate;
        }
      }
    });
    return to_device(host, "plumix_inflow_mask");
  }

private:
  using HostMask = Kokkos::View<Real***, HostMemorySpace>;

  static HostMask make_host_mask(const Domain& domain) {
    return HostMask("plumix_mask_host",
                    static_cast<std::size_t>(domain.extent(0)),
                    static_cast<std::size_t>(domain.extent(1)),
                    static_cast<std::size_t>(domain.extent(2)));
  }

  template <typename Fn>
  static void for_each_cell(const Domain& domain, Fn&& fn) {
    for (int i = 0; i < domain.extent(0); ++i) {
      for (int j = 0; j < domain.extent(1); ++j) {
        for (int k = 0; k < domain.extent(2); ++k) {
          fn(i, j, k,
             static_cast<Real>(i) + Real(0.5),
             static_cast<Real>(j) + Real(0.5),
             static_cast<Real>(k) + Real(0.5));
        }
      }
    }
  }

  static MaskView to_device(const HostMask& host, const std::string& label) {
    MaskView dev(label, host.extent(0), host.extent(1), host.extent(2));
    auto mirror = Kokkos::create_mirror_view(dev);
    for (std::size_t i = 0; i < host.extent(0); ++i) {
      for (std::size_t j = 0; j < host.extent(1); ++j) {
        for (std::size_t k = 0; k < host.extent(2); ++k) {
          mirror(i, j, k) = host(i, j, k);
        }
      }
    }
    Kokkos::deep_copy(dev, mirror);
    return dev;
  }

  std::vector<GeometryPrimitive> obstacles_;
  std::vector<Inflow> inflows_;
  std::uint64_t version_ = 0;
};

} // namespace plumix
