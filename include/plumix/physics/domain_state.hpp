#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <Kokkos_Core.hpp>

#include <plumix/core/backend.hpp>
#include <plumix/core/domain.hpp>
#include <plumix/field/field_ops.hpp>
#include <plumix/field/grid_field.hpp>
#include <plumix/world/world.hpp>

namespace plumix {

/**
 * @brief Cached fluid masks derived from one world geometry snapshot.
 *
 * `active` and `accessible` are 1 on fluid cells and 0 inside obstacles;
 * `inflow` holds the world's inflow rates rasterized on the same cells.
 * `face_mask(a)` is 1 on faces normal to axis a that fluid may cross: both
 * neighbours accessible in the interior; on the box edge, the interior
 * neighbour accessible and the boundary open.
 *
 * Instances are never edited after construction; a geometry change produces
 * a new instance.
 */
class DomainState {
public:
  DomainState(const Domain& domain, const World& world)
      : domain_(domain), geometry_version_(world.geometry_version()) {
    domain_.validate();
    const MaskView obstacles = world.obstacle_mask(domain_);
    accessible_ = MaskView("plumix_accessible",
                           static_cast<std::size_t>(domain_.extent(0)),
                           static_cast<std::size_t>(domain_.extent(1)),
                           static_cast<std::size_t>(domain_.extent(2)));
    auto acc = accessible_;
    Kokkos::parallel_for(
        "plumix_accessible_mask",
        Policy3D({0, 0, 0}, {domain_.extent(0), domain_.extent(1), domain_.extent(2)}),
        KOKKOS_LAMBDA(const int i, const int j, const int k) {
          acc(i, j, k) = Real(1) - obstacles(i, j, k);
        });
    ExecSpace().fence();
    active_ = accessible_;
    inflow_ = world.inflow_mask(domain_);
    build_face_masks();
  }

  const Domain& domain() const { return domain_; }
  const MaskView& active() const { return active_; }
  const MaskView& accessible() const { return accessible_; }
  /// Inflow rate per cell, summed over overlapping sources.
  const MaskView& inflow() const { return inflow_; }
  const MaskView& face_mask(int axis) const {
    return face_masks_[static_cast<std::size_t>(axis)];
  }
  std::uint64_t geometry_version() const { return geometry_version_; }

  /**
   * @brief Zero every velocity component on faces fluid may not cross.
   */
  StaggeredField with_hard_boundary_conditions(const StaggeredField& velocity) const {
    require_on_domain(velocity, domain_, "with_hard_boundary_conditions");
    std::vector<GridField> comps;
    comps.reserve(static_cast<std::size_t>(velocity.rank()));
    for (int a = 0; a < velocity.rank(); ++a) {
      comps.push_back(multiply_mask(velocity[a], face_mask(a),
                                    "plumix_bc_velocity_" + std::to_string(a)));
    }
    return StaggeredField(std::move(comps));
  }

private:
  void build_face_masks() {
    const bool open = domain_.boundary == Boundary::Open;
    const auto acc = accessible_;
    face_masks_.clear();
    for (int axis = 0; axis < domain_.rank; ++axis) {
      const auto fr = domain_.face_resolution(axis);
      MaskView mask("plumix_face_mask_" + std::to_string(axis),
                    static_cast<std::size_t>(fr[0]),
                    static_cast<std::size_t>(fr[1]),
                    static_cast<std::size_t>(fr[2]));
      const int n_axis = domain_.extent(axis);
      Kokkos::parallel_for(
          "plumix_face_mask",
          Policy3D({0, 0, 0}, {fr[0], fr[1], fr[2]}),
          KOKKOS_LAMBDA(const int i, const int j, const int k) {
            const int f = (axis == 0) ? i : (axis == 1) ? j : k;
            const int di = axis == 0 ? 1 : 0;
            const int dj = axis == 1 ? 1 : 0;
            const int dk = axis == 2 ? 1 : 0;
            Real m;
            if (f == 0) {
              m = open ? acc(i, j, k) : Real(0);
            } else if (f == n_axis) {
              m = open ? acc(i - di, j - dj, k - dk) : Real(0);
            } else {
              m = acc(i, j, k) * acc(i - di, j - dj, k - dk);
            }
            mask(i, j, k) = m;
          });
      face_masks_.push_back(mask);
    }
    ExecSpace().fence();
  }

  Domain domain_;
  std::uint64_t geometry_version_ = 0;
  MaskView active_;
  MaskView accessible_;
  MaskView inflow_;
  std::vector<MaskView> face_masks_;
};

} // namespace plumix
