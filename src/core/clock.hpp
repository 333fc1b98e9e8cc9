/**
 * @file clock.hpp
 * @brief Injectable wall clock.
 * @author AnalyzerOrchestrator Team
 *
 * Components that compare ages (cooldowns, sweep thresholds) read time
 * through a ClockFn so tests can drive it with ManualClock.
 */

#pragma once

#include "core/types.hpp"

#include <functional>
#include <memory>
#include <mutex>

namespace analyzer_orchestrator {

using ClockFn = std::function<Timestamp()>;

[[nodiscard]] inline ClockFn system_clock_fn() {
    return [] { return std::chrono::system_clock::now(); };
}

/**
 * @brief Test clock that only moves when told to.
 *
 * fn() returns a ClockFn sharing this clock's reference-counted state; it
 * stays valid after the ManualClock itself is destroyed.
 */
class ManualClock {
public:
    explicit ManualClock(Timestamp start = from_epoch_ms(1'700'000'000'000))
        : state_(std::make_shared<State>()) {
        state_->now = start;
    }

    [[nodiscard]] Timestamp now() const {
        std::lock_guard lock(state_->mutex);
        return state_->now;
    }

    void advance(Duration delta) {
        std::lock_guard lock(state_->mutex);
        state_->now += delta;
    }

    void set(Timestamp ts) {
        std::lock_guard lock(state_->mutex);
        state_->now = ts;
    }

    [[nodiscard]] ClockFn fn() const {
        return [state = state_] {
            std::lock_guard lock(state->mutex);
            return state->now;
        };
    }

private:
    struct State {
        std::mutex mutex;
        Timestamp now;
    };
    std::shared_ptr<State> state_;
};

}  // namespace analyzer_orchestrator
