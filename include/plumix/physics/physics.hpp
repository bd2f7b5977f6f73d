#pragma once

#include <concepts>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace plumix {

/**
 * @brief Concept for a time-stepping physics engine.
 *
 * An engine maps an immutable state to the next one:
 * - step(state) -> State
 * - shape(batch) -> State   (zero-initialized state of the right layout)
 * - serialize() -> json      (configuration, not state)
 *
 * No virtual base; engines are used through templates.
 */
template<typename P>
concept Physics = requires {
  typename P::State;
} && requires(P& physics, const typename P::State& state, int batch) {
  { physics.step(state) } -> std::same_as<typename P::State>;
  { physics.shape(batch) } -> std::same_as<typename P::State>;
  { physics.serialize() } -> std::convertible_to<nlohmann::json>;
};

/// Apply `steps` consecutive steps.
template<Physics P>
typename P::State advance(P& physics, typename P::State state, int steps) {
  if (steps < 0) {
    throw std::invalid_argument("plumix: advance: negative step count");
  }
  for (int n = 0; n < steps; ++n) {
    state = physics.step(state);
  }
  return state;
}

} // namespace plumix
