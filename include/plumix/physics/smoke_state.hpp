#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <plumix/core/backend.hpp>
#include <plumix/field/grid_field.hpp>

namespace plumix {

/**
 * @brief Smoke snapshot at one time step: density on cells, MAC velocity.
 *
 * Instances are never modified after construction. The views are shared
 * handles, so copies are cheap and every copy sees the same values.
 */
class SmokeState;

/// Flat field list plus the inverse mapping back to a state.
struct DisassembledState {
  std::vector<GridField> fields;
  std::function<SmokeState(const std::vector<GridField>&)> reassemble;
};

class SmokeState {
public:
  SmokeState() = default;

  SmokeState(ScalarField density, StaggeredField velocity)
      : density_(std::move(density)), velocity_(std::move(velocity)) {
    if (density_.batch() != velocity_.batch()) {
      throw std::invalid_argument("plumix: SmokeState: density and velocity batch sizes differ");
    }
  }

  const ScalarField& density() const { return density_; }
  const StaggeredField& velocity() const { return velocity_; }

  int batch_size() const { return density_.batch(); }
  int rank() const { return velocity_.rank(); }

  /**
   * @brief Flatten to [density, velocity_0, velocity_1, ...].
   *
   * The reassembler accepts any list of the same length whose fields have
   * the same shapes, in the same order, and rebuilds a state around them
   * without copying.
   */
  DisassembledState disassemble() const;

private:
  ScalarField density_;
  StaggeredField velocity_;
};

inline DisassembledState SmokeState::disassemble() const {
  DisassembledState out;
  out.fields.reserve(1 + velocity_.components.size());
  out.fields.push_back(density_);
  for (const GridField& c : velocity_.components) {
    out.fields.push_back(c);
  }

  std::vector<std::array<int, 4>> shapes;
  shapes.reserve(out.fields.size());
  for (const GridField& f : out.fields) {
    shapes.push_back({f.batch(), f.extent(0), f.extent(1), f.extent(2)});
  }

  out.reassemble = [shapes](const std::vector<GridField>& fields) {
    if (fields.size() != shapes.size()) {
      throw std::invalid_argument("plumix: SmokeState reassemble: expected " +
                                  std::to_string(shapes.size()) + " fields, got " +
                                  std::to_string(fields.size()));
    }
    for (std::size_t n = 0; n < fields.size(); ++n) {
      const GridField& f = fields[n];
      const std::array<int, 4> shape{f.batch(), f.extent(0), f.extent(1), f.extent(2)};
      if (shape != shapes[n]) {
        throw std::invalid_argument("plumix: SmokeState reassemble: field " +
                                    std::to_string(n) + " has a different shape");
      }
    }
    std::vector<GridField> comps(fields.begin() + 1, fields.end());
    return SmokeState(fields.front(), StaggeredField(std::move(comps)));
  };
  return out;
}

} // namespace plumix
