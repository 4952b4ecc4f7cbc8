#pragma once
#include <string>
#include <cstdint>
#include <vector>
#include <nlohmann/json.hpp>

namespace vantage {

struct ProviderEntry {
    std::string name;          // registered adapter name: gemini, openai, ollama
    bool enabled = true;       // operability override, independent of credentials
    std::string api_key;
    std::string base_url;      // empty = adapter default
    std::string model;
    uint32_t max_retries = 2;
    double retry_backoff_seconds = 1.0;
    uint32_t circuit_failure_threshold = 3;
    uint32_t circuit_cooldown_seconds = 60;
    uint32_t timeout_seconds = 15;
    uint32_t max_output_length = 220;   // output token limit sent to the vendor
    double temperature = 0.35;

    // Enabled and reachable: an API key, or an explicit base URL for
    // keyless local endpoints.
    bool is_active() const {
        return enabled && (!api_key.empty() || !base_url.empty());
    }
};

struct CacheConfig {
    uint32_t ttl_seconds = 600;
    uint32_t max_entries = 256;
};

struct ServerConfig {
    std::string listen = "127.0.0.1:8080";
    uint32_t workers = 4;
    uint32_t max_body = 65536;
};

struct Config {
    // Priority order: earlier entries are tried first.
    std::vector<ProviderEntry> providers;
    CacheConfig cache;
    ServerConfig server;

    // Load from $VANTAGE_CONFIG or ~/.vantage/config.json, then apply env vars.
    static Config load();

    // Load from an explicit path, then apply env vars.
    static Config load(const std::string& path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse a config document; absent keys keep their defaults.
    static Config from_json(const nlohmann::json& j);

    // Environment variables always override the config file.
    void apply_env_overrides();

    // Throws std::invalid_argument on settings the gateway cannot run with.
    void validate() const;

    const ProviderEntry* provider(const std::string& name) const;
    ProviderEntry* provider(const std::string& name);

    // Active providers in priority order.
    std::vector<ProviderEntry> active_providers() const;
};

} // namespace vantage
