#pragma once
#include "util.hpp"
#include <cstdint>
#include <mutex>
#include <string>

namespace vantage {

enum class CircuitPhase { Closed, Open, HalfOpen };

inline const char* circuit_phase_to_string(CircuitPhase phase) {
    switch (phase) {
        case CircuitPhase::Closed: return "closed";
        case CircuitPhase::Open: return "open";
        case CircuitPhase::HalfOpen: return "half_open";
    }
    return "closed";
}

struct CircuitState {
    CircuitPhase phase = CircuitPhase::Closed;
    uint32_t consecutive_failures = 0;
    uint64_t open_until_ms = 0;  // 0 when not open
};

// Per-provider failure guard. Opens after `failure_threshold` consecutive
// health failures and refuses calls for `cooldown_seconds`; afterwards a single
// probe call decides between closing and reopening. Thread-safe.
class CircuitBreaker {
public:
    // Throws std::invalid_argument when failure_threshold is zero.
    CircuitBreaker(std::string name, uint32_t failure_threshold,
                   uint32_t cooldown_seconds, Clock clock = system_clock());

    // True when a network attempt may proceed. After the cooldown only the
    // first caller is admitted until that probe reports back.
    bool allow_request();

    // Resets the failure count and closes the circuit.
    void record_success();

    // Transport error, timeout or 5xx. Returns true if the circuit is open
    // after recording.
    bool record_failure();

    // The provider answered but the call failed for caller-side reasons
    // (4xx, malformed payload). Counts nothing; frees a half-open probe slot.
    void record_rejection();

    bool is_open();
    CircuitState snapshot();

    const std::string& name() const { return name_; }
    uint32_t failure_threshold() const { return failure_threshold_; }
    uint32_t cooldown_seconds() const { return cooldown_seconds_; }

private:
    void refresh_locked(uint64_t now);
    void trip_locked(uint64_t now);

    std::string name_;
    uint32_t failure_threshold_;
    uint32_t cooldown_seconds_;
    Clock clock_;

    CircuitState state_;
    bool probe_in_flight_ = false;
    std::mutex mutex_;
};

} // namespace vantage
