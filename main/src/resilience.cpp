#include "resilience.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <thread>

namespace {
    std::optional<long long> header_number(const HttpResponse& response, const std::string& name) {
        auto value = response.header(name);
        if (!value) {
            return std::nullopt;
        }
        std::string text = trim(*value);
        long long number = 0;
        auto res = std::from_chars(text.data(), text.data() + text.size(), number);
        if (res.ec != std::errc() || res.ptr != text.data() + text.size()) {
            return std::nullopt;
        }
        return number;
    }

    std::string body_excerpt(const std::string& body) {
        constexpr size_t limit = 200;
        if (body.size() <= limit) {
            return body;
        }
        return body.substr(0, limit) + "...";
    }
}

std::chrono::system_clock::time_point SystemClock::now() const {
    return std::chrono::system_clock::now();
}

void SystemClock::sleep_for(std::chrono::milliseconds duration) {
    std::this_thread::sleep_for(duration);
}

std::chrono::milliseconds RetryPolicy::delay_for(int attempt, double unit) const {
    int exponent = std::clamp(attempt, 0, 30);
    double raw = static_cast<double>(base_delay.count()) * std::pow(2.0, exponent);
    double factor = 1.0 + jitter * (2.0 * unit - 1.0);
    double delay = std::min(raw * factor, static_cast<double>(max_delay.count()));
    return std::chrono::milliseconds(std::llround(std::max(0.0, delay)));
}

std::string_view circuit_state_name(CircuitState state) {
    switch (state) {
        case CircuitState::Closed: return "CLOSED";
        case CircuitState::Open: return "OPEN";
        case CircuitState::HalfOpen: return "HALF_OPEN";
    }
    return "UNKNOWN";
}

CircuitBreaker::CircuitBreaker(CircuitBreakerSettings settings, const Clock& clock)
    : settings_(settings), clock_(clock) {}

bool CircuitBreaker::try_acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (state_) {
        case CircuitState::Closed:
            return true;
        case CircuitState::Open:
            if (clock_.now() - opened_at_ < settings_.cooldown) {
                return false;
            }
            state_ = CircuitState::HalfOpen;
            consecutive_successes_ = 0;
            probe_in_flight_ = true;
            log_info(get_string("info.circuit_half_open"));
            return true;
        case CircuitState::HalfOpen:
            if (probe_in_flight_) {
                return false;
            }
            probe_in_flight_ = true;
            return true;
    }
    return false;
}

void CircuitBreaker::record_success() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == CircuitState::HalfOpen) {
        probe_in_flight_ = false;
        if (++consecutive_successes_ >= settings_.success_threshold) {
            state_ = CircuitState::Closed;
            consecutive_failures_ = 0;
            consecutive_successes_ = 0;
            log_info(get_string("info.circuit_closed"));
        }
    } else if (state_ == CircuitState::Closed) {
        consecutive_failures_ = 0;
    }
}

void CircuitBreaker::record_failure() {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (state_) {
        case CircuitState::Closed:
            if (++consecutive_failures_ >= settings_.failure_threshold) {
                open_locked();
            }
            break;
        case CircuitState::HalfOpen:
            probe_in_flight_ = false;
            open_locked();
            break;
        case CircuitState::Open:
            opened_at_ = clock_.now();
            break;
    }
}

void CircuitBreaker::release() {
    std::lock_guard<std::mutex> lock(mutex_);
    probe_in_flight_ = false;
}

CircuitState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::chrono::milliseconds CircuitBreaker::remaining_cooldown() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != CircuitState::Open) {
        return std::chrono::milliseconds(0);
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock_.now() - opened_at_);
    return std::max(std::chrono::milliseconds(0), settings_.cooldown - elapsed);
}

void CircuitBreaker::open_locked() {
    state_ = CircuitState::Open;
    opened_at_ = clock_.now();
    consecutive_successes_ = 0;
    log_warning(string_format("warning.circuit_opened", consecutive_failures_, settings_.cooldown.count()));
}

RateLimiter::RateLimiter(RateLimitSettings settings) : settings_(settings) {}

void RateLimiter::update(const HttpResponse& response) {
    auto remaining = header_number(response, "x-ratelimit-remaining");
    auto limit = header_number(response, "x-ratelimit-limit");
    auto reset = header_number(response, "x-ratelimit-reset");

    std::lock_guard<std::mutex> lock(mutex_);
    if (remaining) {
        remaining_ = static_cast<int>(*remaining);
    }
    if (limit) {
        limit_ = static_cast<int>(*limit);
    }
    if (reset) {
        reset_at_ = std::chrono::system_clock::time_point(std::chrono::seconds(*reset));
    }
}

std::chrono::milliseconds RateLimiter::delay_before_request(std::chrono::system_clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reset_at_ <= now) {
        return std::chrono::milliseconds(0);
    }
    auto until_reset = std::chrono::duration_cast<std::chrono::milliseconds>(reset_at_ - now);
    if (remaining_ <= 0) {
        return bounded(until_reset);
    }
    if (remaining_ < settings_.throttle_threshold) {
        auto spread = until_reset / remaining_;
        return std::clamp(spread, std::chrono::milliseconds(100), std::chrono::milliseconds(5000));
    }
    return std::chrono::milliseconds(0);
}

std::chrono::milliseconds RateLimiter::delay_after_rejection(const HttpResponse& response,
                                                             std::chrono::system_clock::time_point now) const {
    if (auto retry_after = header_number(response, "retry-after"); retry_after && *retry_after >= 0) {
        return bounded(std::chrono::seconds(*retry_after));
    }
    auto remaining = header_number(response, "x-ratelimit-remaining");
    auto reset = header_number(response, "x-ratelimit-reset");
    if (remaining && *remaining == 0 && reset) {
        auto reset_at = std::chrono::system_clock::time_point(std::chrono::seconds(*reset));
        if (reset_at > now) {
            return bounded(std::chrono::duration_cast<std::chrono::milliseconds>(reset_at - now));
        }
    }
    return bounded(settings_.default_wait);
}

int RateLimiter::remaining() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return remaining_;
}

int RateLimiter::limit() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return limit_;
}

std::chrono::milliseconds RateLimiter::bounded(std::chrono::milliseconds wait) const {
    return std::clamp(wait, std::chrono::milliseconds(0), settings_.max_wait);
}

ResponseClass classify_response(const HttpResponse& response) {
    if (response.status == 429) {
        return ResponseClass::RateLimited;
    }
    // Any rejection naming a Retry-After is waited out rather than retried.
    if (response.status >= 400 && response.header("retry-after")) {
        return ResponseClass::RateLimited;
    }
    if (response.status == 403) {
        if (response.header("x-ratelimit-remaining") == "0" ||
            to_lower(response.body).find("rate limit") != std::string::npos) {
            return ResponseClass::RateLimited;
        }
    }
    if (response.status == 502 || response.status == 503 || response.status == 504) {
        return ResponseClass::Transient;
    }
    return ResponseClass::Success;
}

ResilientExecutor::ResilientExecutor(RetryPolicy retry, CircuitBreakerSettings breaker, RateLimitSettings rate_limit,
                                     Clock& clock, unsigned int seed)
    : retry_(retry), clock_(clock), breaker_(breaker, clock), limiter_(rate_limit), rng_(seed) {}

HttpResponse ResilientExecutor::execute(const std::string& operation, const std::string& resource,
                                        const std::function<HttpResponse()>& attempt) {
    int retries = 0;
    int rate_limit_waits = 0;
    const RateLimitSettings& rate_settings = limiter_.settings();

    while (true) {
        auto hold = limiter_.delay_before_request(clock_.now());
        if (hold.count() > 0) {
            log_debug(string_format("debug.rate_limit_hold", operation, hold.count()));
            clock_.sleep_for(hold);
        }

        if (!breaker_.try_acquire()) {
            throw CircuitOpenException(operation, resource, 0,
                                       string_format("error.circuit_open", breaker_.remaining_cooldown().count()));
        }

        long last_status = 0;
        std::string last_detail;
        try {
            HttpResponse response = attempt();
            limiter_.update(response);
            switch (classify_response(response)) {
                case ResponseClass::Success:
                    breaker_.record_success();
                    return response;
                case ResponseClass::RateLimited: {
                    breaker_.release();
                    if (rate_limit_waits >= rate_settings.max_waits) {
                        throw RateLimitedException(operation, resource, response.status, body_excerpt(response.body));
                    }
                    ++rate_limit_waits;
                    auto wait = limiter_.delay_after_rejection(response, clock_.now());
                    log_warning(string_format("warning.rate_limited", operation, wait.count()));
                    clock_.sleep_for(wait);
                    continue;
                }
                case ResponseClass::Transient:
                    breaker_.record_failure();
                    last_status = response.status;
                    last_detail = body_excerpt(response.body);
                    break;
            }
        } catch (const TransientException& e) {
            breaker_.record_failure();
            last_status = e.status();
            last_detail = e.detail();
        } catch (...) {
            breaker_.release();
            throw;
        }

        if (retries >= retry_.max_retries) {
            throw RetryExhaustedException(operation, resource, last_status,
                                          string_format("error.retry_exhausted", retries + 1, last_detail), retries + 1);
        }
        auto delay = next_backoff(retries);
        ++retries;
        log_warning(string_format("warning.retrying", operation, retries, retry_.max_retries, delay.count()));
        clock_.sleep_for(delay);
    }
}

std::chrono::milliseconds ResilientExecutor::next_backoff(int attempt) {
    double unit;
    {
        std::lock_guard<std::mutex> lock(rng_mutex_);
        unit = std::uniform_real_distribution<double>(0.0, 1.0)(rng_);
    }
    return retry_.delay_for(attempt, unit);
}
