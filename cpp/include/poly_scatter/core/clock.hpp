#pragma once

#include <chrono>

namespace poly_scatter {

// Monotonic time source injected into anything that polls a deadline
class Clock {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Duration = std::chrono::steady_clock::duration;

    virtual ~Clock() = default;

    [[nodiscard]] virtual TimePoint now() const = 0;

    [[nodiscard]] double seconds_since(TimePoint start) const {
        return std::chrono::duration<double>(now() - start).count();
    }
};

class SteadyClock final : public Clock {
public:
    [[nodiscard]] TimePoint now() const override {
        return std::chrono::steady_clock::now();
    }
};

// Time moves only when advanced explicitly, or by `tick` on every read.
class ManualClock final : public Clock {
public:
    ManualClock() = default;
    explicit ManualClock(Duration tick) : tick_(tick) {}

    [[nodiscard]] TimePoint now() const override {
        TimePoint t = current_;
        current_ += tick_;
        return t;
    }

    void advance(Duration d) { current_ += d; }

private:
    mutable TimePoint current_{};
    Duration tick_{Duration::zero()};
};

}  // namespace poly_scatter
