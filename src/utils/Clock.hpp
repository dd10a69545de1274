#pragma once
#include <ctime>

// Source of "now" for scheduling. Injected so tests can pin time.
class Clock {
public:
    virtual ~Clock() = default;
    virtual std::time_t now() const = 0;
};

class SystemClock : public Clock {
public:
    std::time_t now() const override { return std::time(nullptr); }
};

// Clock that only moves when told to.
class ManualClock : public Clock {
public:
    explicit ManualClock(std::time_t start = 1700000000) : current(start) {}

    std::time_t now() const override { return current; }

    void set(std::time_t t) { current = t; }
    void advanceSeconds(long long s) { current += static_cast<std::time_t>(s); }
    void advanceDays(double days) { current += static_cast<std::time_t>(days * 86400.0); }

private:
    std::time_t current;
};
