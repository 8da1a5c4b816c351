#pragma once
#include <chrono>
#include <mutex>

// Leaky-bucket pacing shared by every exchange of one transport.
// The allowance refills at `requestsPerSecond`, is capped at one second's
// worth and costs one unit per exchange. A caller short of a full unit
// reserves the next free slot under the lock and sleeps outside it, so
// concurrent callers are released one interval apart in lock order.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    // requestsPerSecond <= 0 disables pacing.
    explicit RateLimiter(double requestsPerSecond, Clock::time_point start = Clock::now());

    void wait();

    // How long a caller arriving at `now` must sleep before its exchange.
    Clock::duration reserve(Clock::time_point now);

private:
    double rps_;
    double allowance_ = 0.0;
    Clock::time_point lastCheck_;
    std::mutex mtx_;
};
