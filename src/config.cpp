#include "config.hpp"
#include "util.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <unordered_set>

namespace vantage {

static nlohmann::json provider_defaults(const std::string& name, const std::string& model) {
    return {
        {"name", name},
        {"enabled", true},
        {"api_key", ""},
        {"base_url", ""},
        {"model", model},
        {"max_retries", 2},
        {"retry_backoff_seconds", 1.0},
        {"circuit_failure_threshold", 3},
        {"circuit_cooldown_seconds", 60},
        {"timeout_seconds", 15},
        {"max_output_length", 220},
        {"temperature", 0.35}
    };
}

nlohmann::json Config::defaults_json() {
    return {
        {"providers", nlohmann::json::array({
            provider_defaults("gemini", "gemini-2.5-flash"),
            provider_defaults("openai", "gpt-4o-mini"),
            provider_defaults("ollama", "llama3.2")
        })},
        {"cache", {
            {"ttl_seconds", 600},
            {"max_entries", 256}
        }},
        {"server", {
            {"listen", "127.0.0.1:8080"},
            {"workers", 4},
            {"max_body", 65536}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_u32(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (!obj.contains(key)) return;
    const auto& v = obj[key];
    if (v.is_number_unsigned())
        out = v.get<uint32_t>();
    else if (v.is_number_integer() && v.get<int64_t>() >= 0)
        out = static_cast<uint32_t>(v.get<int64_t>());
}

static void read_double(const nlohmann::json& obj, const char* key, double& out) {
    if (obj.contains(key) && obj[key].is_number())
        out = obj[key].get<double>();
}

static void read_string(const nlohmann::json& obj, const char* key, std::string& out) {
    if (obj.contains(key) && obj[key].is_string())
        out = obj[key].get<std::string>();
}

static void read_bool(const nlohmann::json& obj, const char* key, bool& out) {
    if (obj.contains(key) && obj[key].is_boolean())
        out = obj[key].get<bool>();
}

static ProviderEntry read_provider(const nlohmann::json& obj) {
    ProviderEntry entry;
    read_string(obj, "name", entry.name);
    read_bool(obj, "enabled", entry.enabled);
    read_string(obj, "api_key", entry.api_key);
    read_string(obj, "base_url", entry.base_url);
    read_string(obj, "model", entry.model);
    read_u32(obj, "max_retries", entry.max_retries);
    read_double(obj, "retry_backoff_seconds", entry.retry_backoff_seconds);
    read_u32(obj, "circuit_failure_threshold", entry.circuit_failure_threshold);
    read_u32(obj, "circuit_cooldown_seconds", entry.circuit_cooldown_seconds);
    read_u32(obj, "timeout_seconds", entry.timeout_seconds);
    read_u32(obj, "max_output_length", entry.max_output_length);
    read_double(obj, "temperature", entry.temperature);
    return entry;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    const nlohmann::json* providers = nullptr;
    if (j.contains("providers") && j["providers"].is_array()) {
        providers = &j["providers"];
    }
    nlohmann::json fallback = defaults_json()["providers"];
    if (!providers) providers = &fallback;

    for (const auto& obj : *providers) {
        if (!obj.is_object()) continue;
        ProviderEntry entry = read_provider(obj);
        if (entry.name.empty()) continue;
        cfg.providers.push_back(std::move(entry));
    }

    if (j.contains("cache") && j["cache"].is_object()) {
        const auto& c = j["cache"];
        read_u32(c, "ttl_seconds", cfg.cache.ttl_seconds);
        read_u32(c, "max_entries", cfg.cache.max_entries);
    }

    if (j.contains("server") && j["server"].is_object()) {
        const auto& s = j["server"];
        read_string(s, "listen", cfg.server.listen);
        read_u32(s, "workers", cfg.server.workers);
        read_u32(s, "max_body", cfg.server.max_body);
    }

    return cfg;
}

Config Config::load() {
    if (const char* v = std::getenv("VANTAGE_CONFIG")) {
        if (*v) return load(std::string(v));
    }
    return load(expand_home("~/.vantage/config.json"));
}

Config Config::load(const std::string& config_path) {
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
                }
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed config " << config_path
                      << " (" << e.what() << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);
    cfg.apply_env_overrides();
    return cfg;
}

static bool env_truthy(const char* v) {
    std::string s = to_lower(trim(v));
    return s == "1" || s == "true" || s == "yes" || s == "on";
}

void Config::apply_env_overrides() {
    // A provider named only by the environment starts from its built-in
    // defaults, model included.
    auto ensure = [this](const std::string& name) -> ProviderEntry& {
        if (ProviderEntry* existing = provider(name)) return *existing;
        ProviderEntry entry;
        entry.name = name;
        for (const auto& obj : defaults_json()["providers"]) {
            if (obj.value("name", "") == name) {
                entry = read_provider(obj);
                break;
            }
        }
        providers.push_back(std::move(entry));
        return providers.back();
    };

    if (const char* v = std::getenv("GEMINI_API_KEY"))
        ensure("gemini").api_key = v;
    if (const char* v = std::getenv("GEMINI_MODEL"))
        ensure("gemini").model = v;
    if (const char* v = std::getenv("OPENAI_API_KEY"))
        ensure("openai").api_key = v;
    if (const char* v = std::getenv("OPENAI_MODEL"))
        ensure("openai").model = v;
    if (const char* v = std::getenv("OLLAMA_BASE_URL"))
        ensure("ollama").base_url = v;
    if (const char* v = std::getenv("VANTAGE_LISTEN"))
        server.listen = v;

    for (auto& entry : providers) {
        std::string var = "VANTAGE_DISABLE_" + entry.name;
        for (auto& c : var) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        if (const char* v = std::getenv(var.c_str())) {
            if (env_truthy(v)) entry.enabled = false;
        }
    }
}

void Config::validate() const {
    if (cache.max_entries == 0) {
        throw std::invalid_argument("cache.max_entries must be greater than 0");
    }
    if (server.workers == 0) {
        throw std::invalid_argument("server.workers must be greater than 0");
    }

    std::unordered_set<std::string> seen;
    for (const auto& entry : providers) {
        if (!seen.insert(entry.name).second) {
            throw std::invalid_argument("Duplicate provider entry: " + entry.name);
        }
        if (!entry.is_active()) continue;
        if (entry.circuit_failure_threshold == 0) {
            throw std::invalid_argument("providers." + entry.name +
                                        ".circuit_failure_threshold must be greater than 0");
        }
        if (entry.timeout_seconds == 0) {
            throw std::invalid_argument("providers." + entry.name +
                                        ".timeout_seconds must be greater than 0");
        }
        if (entry.retry_backoff_seconds < 0) {
            throw std::invalid_argument("providers." + entry.name +
                                        ".retry_backoff_seconds must not be negative");
        }
    }
}

const ProviderEntry* Config::provider(const std::string& name) const {
    for (const auto& entry : providers) {
        if (entry.name == name) return &entry;
    }
    return nullptr;
}

ProviderEntry* Config::provider(const std::string& name) {
    for (auto& entry : providers) {
        if (entry.name == name) return &entry;
    }
    return nullptr;
}

std::vector<ProviderEntry> Config::active_providers() const {
    std::vector<ProviderEntry> result;
    for (const auto& entry : providers) {
        if (entry.is_active()) result.push_back(entry);
    }
    return result;
}

} // namespace vantage
