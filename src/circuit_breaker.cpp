#include "circuit_breaker.hpp"
#include <iostream>
#include <stdexcept>

namespace vantage {

CircuitBreaker::CircuitBreaker(std::string name, uint32_t failure_threshold,
                               uint32_t cooldown_seconds, Clock clock)
    : name_(std::move(name)),
      failure_threshold_(failure_threshold),
      cooldown_seconds_(cooldown_seconds),
      clock_(std::move(clock)) {
    if (failure_threshold_ == 0) {
        throw std::invalid_argument("Circuit breaker for " + name_ +
                                    " requires failure_threshold > 0");
    }
    if (!clock_) {
        clock_ = system_clock();
    }
}

void CircuitBreaker::refresh_locked(uint64_t now) {
    if (state_.phase == CircuitPhase::Open && now >= state_.open_until_ms) {
        state_.phase = CircuitPhase::HalfOpen;
        state_.open_until_ms = 0;
        probe_in_flight_ = false;
    }
}

void CircuitBreaker::trip_locked(uint64_t now) {
    state_.phase = CircuitPhase::Open;
    state_.open_until_ms = now + static_cast<uint64_t>(cooldown_seconds_) * 1000;
    probe_in_flight_ = false;
    std::cerr << "[circuit] " << name_ << " opened after "
              << state_.consecutive_failures << " consecutive failures; cooling down "
              << cooldown_seconds_ << "s\n";
}

bool CircuitBreaker::allow_request() {
    uint64_t now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    refresh_locked(now);

    switch (state_.phase) {
        case CircuitPhase::Closed:
            return true;
        case CircuitPhase::Open:
            return false;
        case CircuitPhase::HalfOpen:
            if (probe_in_flight_) return false;
            probe_in_flight_ = true;
            return true;
    }
    return false;
}

void CircuitBreaker::record_success() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.phase != CircuitPhase::Closed) {
        std::cerr << "[circuit] " << name_ << " recovered, closing circuit\n";
    }
    state_.phase = CircuitPhase::Closed;
    state_.consecutive_failures = 0;
    state_.open_until_ms = 0;
    probe_in_flight_ = false;
}

bool CircuitBreaker::record_failure() {
    uint64_t now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    refresh_locked(now);

    state_.consecutive_failures++;

    switch (state_.phase) {
        case CircuitPhase::HalfOpen:
            trip_locked(now);
            break;
        case CircuitPhase::Closed:
            if (state_.consecutive_failures >= failure_threshold_) {
                trip_locked(now);
            }
            break;
        case CircuitPhase::Open:
            // A call admitted before another caller tripped the circuit.
            break;
    }
    return state_.phase == CircuitPhase::Open;
}

void CircuitBreaker::record_rejection() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.phase == CircuitPhase::HalfOpen) {
        probe_in_flight_ = false;
    }
}

bool CircuitBreaker::is_open() {
    return snapshot().phase == CircuitPhase::Open;
}

CircuitState CircuitBreaker::snapshot() {
    uint64_t now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    refresh_locked(now);
    return state_;
}

} // namespace vantage
