#ifndef CLOCK_HPP
#define CLOCK_HPP

#include <chrono>
#include <cstdint>

// Millisecond time source for the partial-update throttle.
class Clock {
public:
    virtual ~Clock() = default;
    virtual int64_t nowMs() const = 0;
};

class SteadyClock : public Clock {
public:
    int64_t nowMs() const override {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::steady_clock::now().time_since_epoch())
            .count();
    }
};

#endif
