#include "provider.hpp"
#include "plugin.hpp"
#include "config.hpp"
#include "util.hpp"

namespace vantage {

std::unique_ptr<Provider> create_provider(const ProviderEntry& entry, HttpClient& http) {
    return PluginRegistry::instance().create_provider(entry.name, entry, http);
}

void check_http_status(const std::string& provider, const HttpResponse& response) {
    long status = response.status_code;
    if (status >= 200 && status < 300) return;

    if (status == 0) {
        throw ProviderError(ProviderErrorKind::Transport, 0,
            provider + " request failed: " +
            (response.error.empty() ? std::string("no response") : response.error));
    }

    // Cap the echoed body; some vendors return whole HTML error pages.
    std::string snippet = response.body.substr(0, 300);
    std::string message = provider + " API error (HTTP " + std::to_string(status) + "): " + snippet;
    if (status >= 500) {
        throw ProviderError(ProviderErrorKind::Server, status, message);
    }
    throw ProviderError(ProviderErrorKind::Client, status, message);
}

nlohmann::json parse_response_body(const std::string& provider, const std::string& body) {
    try {
        return nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& e) {
        throw ProviderError(ProviderErrorKind::Malformed, 200,
            provider + " returned malformed JSON: " + e.what());
    }
}

std::string require_text(const std::string& provider, const std::string& text) {
    std::string trimmed = trim(text);
    if (trimmed.empty()) {
        throw ProviderError(ProviderErrorKind::Malformed, 200,
            provider + " returned no text");
    }
    return trimmed;
}

} // namespace vantage
