#pragma once
#include "http.hpp"
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace vantage {

struct ProviderEntry;

// Why a single provider attempt failed. Transport and Server are provider
// health signals; Client and Malformed are not.
enum class ProviderErrorKind { Transport, Server, Client, Malformed };

inline const char* error_kind_to_string(ProviderErrorKind kind) {
    switch (kind) {
        case ProviderErrorKind::Transport: return "transport";
        case ProviderErrorKind::Server: return "server";
        case ProviderErrorKind::Client: return "client";
        case ProviderErrorKind::Malformed: return "malformed";
    }
    return "transport";
}

class ProviderError : public std::runtime_error {
public:
    ProviderError(ProviderErrorKind kind, long status_code, const std::string& message)
        : std::runtime_error(message), kind_(kind), status_code_(status_code) {}

    ProviderErrorKind kind() const { return kind_; }
    long status_code() const { return status_code_; }

    // Worth retrying and counted by the circuit breaker.
    bool is_health_failure() const {
        return kind_ == ProviderErrorKind::Transport || kind_ == ProviderErrorKind::Server;
    }

private:
    ProviderErrorKind kind_;
    long status_code_;
};

struct GenerationSettings {
    std::string model;
    double temperature = 0.35;
    uint32_t max_output_tokens = 220;
    long timeout_seconds = 15;
};

// One vendor's text-completion endpoint. generate() performs exactly one
// network attempt and either returns non-empty text or throws ProviderError.
class Provider {
public:
    virtual ~Provider() = default;

    virtual std::string generate(const std::string& prompt,
                                 const GenerationSettings& settings) = 0;

    virtual std::string provider_name() const = 0;
};

// Factory: create provider by registered name (entry.name).
// Throws std::invalid_argument for unknown names.
std::unique_ptr<Provider> create_provider(const ProviderEntry& entry, HttpClient& http);

// Throws ProviderError unless the response is a 2xx.
void check_http_status(const std::string& provider, const HttpResponse& response);

// Parses a JSON body; throws ProviderError(Malformed) on failure.
nlohmann::json parse_response_body(const std::string& provider, const std::string& body);

// Throws ProviderError(Malformed) for empty or whitespace-only text.
std::string require_text(const std::string& provider, const std::string& text);

} // namespace vantage
