#pragma once

#include <atomic>
#include <chrono>

/// Monotonic time source for restart deadlines
class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;
    using duration = std::chrono::steady_clock::duration;

    virtual ~Clock() = default;
    virtual time_point now() const = 0;
};

class SteadyClock : public Clock {
public:
    time_point now() const override { return std::chrono::steady_clock::now(); }
};

/// Time only moves when advance() is called
class ManualClock : public Clock {
public:
    ManualClock() : ticks_(std::chrono::steady_clock::now().time_since_epoch().count()) {}

    time_point now() const override { return time_point(duration(ticks_.load())); }

    void advance(duration d) { ticks_.fetch_add(d.count()); }

private:
    std::atomic<duration::rep> ticks_;
};
