#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <exception>
#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <plumix/core/backend.hpp>

namespace plumix {

// ============================================================================
// STEP REPORT
// ============================================================================

/**
 * @brief Snapshot of engine progress handed to observers.
 *
 * Fields that do not apply to an event keep their defaults; `message` is set
 * only for `SmokeEvent::Error`.
 */
struct StepReport {
  int step = 0;
  Real dt = Real(0);

  // Last pressure solve
  std::string solver;
  int iterations = 0;
  Real residual = Real(0);

  Real density_total = Real(0);   // batch entry 0
  double step_time = 0.0;         // seconds spent in the last step
  double wall_time = 0.0;         // seconds since the engine was created

  std::string message;
};

// ============================================================================
// EVENTS
// ============================================================================

enum class SmokeEvent : int {
  StepBegin = 0,
  StepEnd,
  DomainRebuilt,
  PressureSolved,
  Error
};

inline const char* to_string(SmokeEvent event) {
  switch (event) {
    case SmokeEvent::StepBegin: return "StepBegin";
    case SmokeEvent::StepEnd: return "StepEnd";
    case SmokeEvent::DomainRebuilt: return "DomainRebuilt";
    case SmokeEvent::PressureSolved: return "PressureSolved";
    case SmokeEvent::Error: return "Error";
    default: return "Unknown";
  }
}

using SmokeCallback = std::function<void(SmokeEvent, const StepReport&)>;

// ============================================================================
// OBSERVER MANAGER
// ============================================================================

/**
 * @brief Callbacks attached to engine events.
 *
 * Callbacks run sequentially on the stepping thread. A callback that throws
 * is reported on stderr and does not prevent the others from running.
 */
class ObserverManager {
public:
  ObserverManager() = default;

  ObserverManager(const ObserverManager&) = delete;
  ObserverManager& operator=(const ObserverManager&) = delete;
  ObserverManager(ObserverManager&&) = default;
  ObserverManager& operator=(ObserverManager&&) = default;

  /// @return id usable with remove_callback
  int add_callback(SmokeEvent event, SmokeCallback callback) {
    const int id = next_id_++;
    callbacks_[event].push_back({id, std::move(callback)});
    return id;
  }

  /// Called after every completed step.
  int on_step(std::function<void(const StepReport&)> callback) {
    return add_callback(SmokeEvent::StepEnd,
                        [cb = std::move(callback)](SmokeEvent, const StepReport& r) {
                          cb(r);
                        });
  }

  int on_error(std::function<void(const std::string&)> callback) {
    return add_callback(SmokeEvent::Error,
                        [cb = std::move(callback)](SmokeEvent, const StepReport& r) {
                          cb(r.message);
                        });
  }

  bool remove_callback(int id) {
    for (auto& [event, cbs] : callbacks_) {
      auto it = std::remove_if(cbs.begin(), cbs.end(),
                               [id](const CallbackInfo& cb) { return cb.id == id; });
      if (it != cbs.end()) {
        cbs.erase(it, cbs.end());
        return true;
      }
    }
    return false;
  }

  void notify(SmokeEvent event, const StepReport& report) const {
    auto it = callbacks_.find(event);
    if (it == callbacks_.end()) {
      return;
    }
    for (const auto& [id, callback] : it->second) {
      try {
        callback(event, report);
      } catch (const std::exception& e) {
        std::fprintf(stderr, "[plumix] observer %d threw on %s: %s\n",
                     id, to_string(event), e.what());
      }
    }
  }

  void clear() { callbacks_.clear(); }

  std::size_t count() const {
    std::size_t total = 0;
    for (const auto& [event, cbs] : callbacks_) {
      total += cbs.size();
    }
    return total;
  }

  bool empty() const { return count() == 0; }

private:
  struct CallbackInfo {
    int id;
    SmokeCallback callback;
  };

  int next_id_ = 0;
  std::unordered_map<SmokeEvent, std::vector<CallbackInfo>> callbacks_;
};

// ============================================================================
// PREDEFINED OBSERVERS
// ============================================================================

namespace observers {

/**
 * @brief One `key=value` line every `interval` steps on stdout.
 *
 * step=10 dt=0.5 solver=ConjugateGradient iters=37 residual=8.1e-04 mass=12.5
 */
inline SmokeCallback progress_printer(int interval = 1) {
  return [interval](SmokeEvent event, const StepReport& r) {
    if (event != SmokeEvent::StepEnd || interval <= 0 || r.step % interval != 0) {
      return;
    }
    std::printf("step=%d dt=%g solver=%s iters=%d residual=%.3e mass=%.6g step_ms=%.3f\n",
                r.step, static_cast<double>(r.dt), r.solver.c_str(), r.iterations,
                static_cast<double>(r.residual), static_cast<double>(r.density_total),
                r.step_time * 1000.0);
  };
}

inline SmokeCallback error_printer() {
  return [](SmokeEvent event, const StepReport& r) {
    if (event == SmokeEvent::Error) {
      std::fprintf(stderr, "error step=%d %s\n", r.step, r.message.c_str());
    }
  };
}

} // namespace observers

} // namespace plumix
