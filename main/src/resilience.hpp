#pragma once

#include "http.hpp"

#include <chrono>
#include <functional>
#include <mutex>
#include <random>
#include <string>
#include <string_view>

class Clock {
public:
    virtual ~Clock() = default;
    virtual std::chrono::system_clock::time_point now() const = 0;
    virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

class SystemClock : public Clock {
public:
    std::chrono::system_clock::time_point now() const override;
    void sleep_for(std::chrono::milliseconds duration) override;
};

struct RetryPolicy {
    int max_retries = 3;
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    double jitter = 0.1;

    // Delay before retry number `attempt` (0-based). `unit` is uniform in [0, 1).
    std::chrono::milliseconds delay_for(int attempt, double unit) const;
};

struct CircuitBreakerSettings {
    int failure_threshold = 5;
    int success_threshold = 3;
    std::chrono::milliseconds cooldown{60000};
};

struct RateLimitSettings {
    std::chrono::milliseconds max_wait{300000};
    std::chrono::milliseconds default_wait{60000};
    int max_waits = 5;
    int throttle_threshold = 100;
};

enum class CircuitState { Closed, Open, HalfOpen };

std::string_view circuit_state_name(CircuitState state);

class CircuitBreaker {
public:
    CircuitBreaker(CircuitBreakerSettings settings, const Clock& clock);

    // Admits a call. In HALF_OPEN only one probe may be in flight; its outcome
    // must be reported through record_success, record_failure or release.
    bool try_acquire();
    void record_success();
    void record_failure();
    void release();

    CircuitState state() const;
    std::chrono::milliseconds remaining_cooldown() const;

private:
    void open_locked();

    CircuitBreakerSettings settings_;
    const Clock& clock_;
    mutable std::mutex mutex_;
    CircuitState state_ = CircuitState::Closed;
    int consecutive_failures_ = 0;
    int consecutive_successes_ = 0;
    bool probe_in_flight_ = false;
    std::chrono::system_clock::time_point opened_at_{};
};

class RateLimiter {
public:
    explicit RateLimiter(RateLimitSettings settings);

    void update(const HttpResponse& response);
    // How long to hold back the next request given the last known quota.
    std::chrono::milliseconds delay_before_request(std::chrono::system_clock::time_point now) const;
    // How long to wait after a rate-limit rejection.
    std::chrono::milliseconds delay_after_rejection(const HttpResponse& response, std::chrono::system_clock::time_point now) const;

    const RateLimitSettings& settings() const { return settings_; }
    int remaining() const;
    int limit() const;

private:
    std::chrono::milliseconds bounded(std::chrono::milliseconds wait) const;

    RateLimitSettings settings_;
    mutable std::mutex mutex_;
    int remaining_ = 5000;
    int limit_ = 5000;
    std::chrono::system_clock::time_point reset_at_{};
};

enum class ResponseClass { Success, Transient, RateLimited };

ResponseClass classify_response(const HttpResponse& response);

// Runs remote calls through rate limiting, the circuit breaker and retry with
// backoff. One instance is shared by every component that talks to the API.
class ResilientExecutor {
public:
    ResilientExecutor(RetryPolicy retry, CircuitBreakerSettings breaker, RateLimitSettings rate_limit,
                      Clock& clock, unsigned int seed = std::random_device{}());

    HttpResponse execute(const std::string& operation, const std::string& resource,
                         const std::function<HttpResponse()>& attempt);

    CircuitBreaker& breaker() { return breaker_; }

private:
    std::chrono::milliseconds next_backoff(int attempt);

    RetryPolicy retry_;
    Clock& clock_;
    CircuitBreaker breaker_;
    RateLimiter limiter_;
    std::mutex rng_mutex_;
    std::mt19937 rng_;
};
