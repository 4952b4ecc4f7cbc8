#pragma once
#include "provider.hpp"
#include "circuit_breaker.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace vantage {

struct ProviderEntry;

struct RetryPolicy {
    uint32_t max_retries = 2;                          // total attempts, minimum 1
    std::chrono::milliseconds backoff{1000};           // sleep backoff * n after attempt n
};

enum class CompletionStatus {
    Ok,           // text holds the answer
    Skipped,      // circuit open; no network I/O happened
    Rejected,     // the vendor refused the request (4xx)
    Unavailable   // attempted and failed
};

struct CompletionResult {
    CompletionStatus status = CompletionStatus::Unavailable;
    std::string text;
    uint32_t attempts = 0;
    std::string last_error;

    bool ok() const { return status == CompletionStatus::Ok; }
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

// One provider gated by its circuit breaker, with bounded retries and linear
// backoff for transient failures. Thread-safe; shared by all requests.
class ProviderClient {
public:
    ProviderClient(std::unique_ptr<Provider> provider,
                   GenerationSettings settings,
                   RetryPolicy retry,
                   std::unique_ptr<CircuitBreaker> breaker,
                   Sleeper sleeper = {});

    // Build from configuration; the adapter is looked up by entry.name.
    static std::unique_ptr<ProviderClient> from_entry(const ProviderEntry& entry,
                                                      HttpClient& http,
                                                      Clock clock = system_clock(),
                                                      Sleeper sleeper = {});

    // Transport/timeout/5xx are retried until max_retries or until the
    // breaker opens. 4xx and malformed replies end the call immediately and
    // are not counted against the provider; a 4xx reports Rejected. `cancel`
    // (optional) stops further attempts and skips backoff sleeps.
    CompletionResult complete(const std::string& prompt,
                              const std::atomic<bool>* cancel = nullptr);

    // True when the breaker is open (calls would be skipped).
    bool is_open() { return breaker_->is_open(); }

    CircuitState circuit_state() { return breaker_->snapshot(); }

    const std::string& name() const { return name_; }
    const GenerationSettings& settings() const { return settings_; }
    const RetryPolicy& retry_policy() const { return retry_; }

private:
    std::unique_ptr<Provider> provider_;
    std::string name_;
    GenerationSettings settings_;
    RetryPolicy retry_;
    std::unique_ptr<CircuitBreaker> breaker_;
    Sleeper sleeper_;
};

} // namespace vantage
