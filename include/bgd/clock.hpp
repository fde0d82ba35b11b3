#pragma once

#include "bgd/types.hpp"
#include <chrono>

namespace bgd {

// Time source for every wait in a release. Production code sleeps for real;
// tests substitute a manual clock so retry timing is deterministic.
class Clock {
public:
    virtual ~Clock() = default;

    virtual TimePoint wall_now() const = 0;
    virtual std::chrono::steady_clock::time_point now() const = 0;
    virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

class SystemClock : public Clock {
public:
    TimePoint wall_now() const override { return WallClock::now(); }
    std::chrono::steady_clock::time_point now() const override { return std::chrono::steady_clock::now(); }
    void sleep_for(std::chrono::milliseconds duration) override;
};

// ISO-8601 UTC with millisecond precision, as written to reports and the journal.
std::string format_timestamp(TimePoint time);

} // namespace bgd
