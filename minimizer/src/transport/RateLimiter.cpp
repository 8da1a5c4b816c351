#include "transport/RateLimiter.hpp"

#include <thread>

RateLimiter::RateLimiter(double requestsPerSecond, Clock::time_point start)
    : rps_(requestsPerSecond), lastCheck_(start) {}

void RateLimiter::wait() {
    if (rps_ <= 0.0) return;

    Clock::duration delay = reserve(Clock::now());
    if (delay > Clock::duration::zero()) {
        std::this_thread::sleep_for(delay);
    }
}

RateLimiter::Clock::duration RateLimiter::reserve(Clock::time_point now) {
    using std::chrono::duration;
    using std::chrono::duration_cast;

    if (rps_ <= 0.0) return Clock::duration::zero();

    std::lock_guard<std::mutex> lock(mtx_);

    // negative while earlier callers hold future slots
    const double elapsed = duration<double>(now - lastCheck_).count();
    lastCheck_ = now;

    allowance_ += elapsed * rps_;
    if (allowance_ > rps_) allowance_ = rps_;

    if (allowance_ >= 1.0) {
        allowance_ -= 1.0;
        return Clock::duration::zero();
    }

    const auto delay = duration_cast<Clock::duration>(duration<double>((1.0 - allowance_) / rps_));
    allowance_ = 0.0;
    lastCheck_ = now + delay;
    return delay;
}
