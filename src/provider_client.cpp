#include "provider_client.hpp"
#include "config.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace vantage {

static bool cancelled(const std::atomic<bool>* cancel) {
    return cancel && cancel->load(std::memory_order_relaxed);
}

ProviderClient::ProviderClient(std::unique_ptr<Provider> provider,
                               GenerationSettings settings,
                               RetryPolicy retry,
                               std::unique_ptr<CircuitBreaker> breaker,
                               Sleeper sleeper)
    : provider_(std::move(provider)),
      settings_(std::move(settings)),
      retry_(retry),
      breaker_(std::move(breaker)),
      sleeper_(std::move(sleeper)) {
    if (!provider_) {
        throw std::invalid_argument("ProviderClient requires a provider");
    }
    if (!breaker_) {
        throw std::invalid_argument("ProviderClient requires a circuit breaker");
    }
    name_ = provider_->provider_name();
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

std::unique_ptr<ProviderClient> ProviderClient::from_entry(const ProviderEntry& entry,
                                                           HttpClient& http,
                                                           Clock clock,
                                                           Sleeper sleeper) {
    GenerationSettings settings;
    settings.model = entry.model;
    settings.temperature = entry.temperature;
    settings.max_output_tokens = entry.max_output_length;
    settings.timeout_seconds = static_cast<long>(entry.timeout_seconds);

    RetryPolicy retry;
    retry.max_retries = entry.max_retries;
    retry.backoff = std::chrono::milliseconds(
        static_cast<int64_t>(entry.retry_backoff_seconds * 1000.0));

    auto breaker = std::make_unique<CircuitBreaker>(
        entry.name, entry.circuit_failure_threshold, entry.circuit_cooldown_seconds,
        std::move(clock));

    return std::make_unique<ProviderClient>(create_provider(entry, http), std::move(settings),
                                            retry, std::move(breaker), std::move(sleeper));
}

CompletionResult ProviderClient::complete(const std::string& prompt,
                                          const std::atomic<bool>* cancel) {
    CompletionResult result;
    const uint32_t total = std::max<uint32_t>(1, retry_.max_retries);

    for (uint32_t attempt = 1; attempt <= total; ++attempt) {
        if (cancelled(cancel)) {
            result.last_error = "request cancelled";
            return result;
        }

        if (!breaker_->allow_request()) {
            if (result.attempts == 0) {
                result.status = CompletionStatus::Skipped;
                result.last_error = "circuit open";
            }
            return result;
        }

        result.attempts = attempt;
        try {
            result.text = provider_->generate(prompt, settings_);
            breaker_->record_success();
            result.status = CompletionStatus::Ok;
            result.last_error.clear();
            return result;
        } catch (const ProviderError& e) {
            result.last_error = e.what();
            std::cerr << "[" << name_ << "] Attempt " << attempt << "/" << total
                      << " failed (" << error_kind_to_string(e.kind()) << "): "
                      << e.what() << '\n';
            if (!e.is_health_failure()) {
                breaker_->record_rejection();
                if (e.kind() == ProviderErrorKind::Client) {
                    result.status = CompletionStatus::Rejected;
                }
                return result;
            }
            if (breaker_->record_failure()) {
                return result;
            }
        } catch (const std::exception& e) {
            // Anything else escaping an adapter is a response it could not
            // interpret, not a provider outage.
            result.last_error = e.what();
            std::cerr << "[" << name_ << "] Attempt " << attempt << "/" << total
                      << " failed (malformed): " << e.what() << '\n';
            breaker_->record_rejection();
            return result;
        }

        if (attempt < total && !cancelled(cancel)) {
            sleeper_(retry_.backoff * attempt);
        }
    }

    return result;
}

} // namespace vantage
