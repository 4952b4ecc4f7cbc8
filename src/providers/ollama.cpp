#include "ollama.hpp"
#include "../config.hpp"
#include "../plugin.hpp"
#include <nlohmann/json.hpp>

static vantage::ProviderRegistrar reg_ollama("ollama",
    [](const vantage::ProviderEntry& entry, vantage::HttpClient& http) {
        std::string url = entry.base_url.empty() ? "http://localhost:11434" : entry.base_url;
        return std::make_unique<vantage::OllamaProvider>(http, url);
    });

using json = nlohmann::json;

namespace vantage {

OllamaProvider::OllamaProvider(HttpClient& http, const std::string& base_url)
    : http_(http), base_url_(base_url) {}

std::string OllamaProvider::generate(const std::string& prompt,
                                     const GenerationSettings& settings) {
    json request;
    request["model"] = settings.model;
    request["stream"] = false;
    request["messages"] = json::array({
        {{"role", "user"}, {"content", prompt}}
    });
    request["options"] = {
        {"temperature", settings.temperature},
        {"num_predict", settings.max_output_tokens}
    };

    std::vector<Header> headers = {
        {"Content-Type", "application/json"}
    };

    auto response = http_.post(base_url_ + "/api/chat", request.dump(), headers,
                               settings.timeout_seconds);
    check_http_status(provider_name(), response);

    json resp = parse_response_body(provider_name(), response.body);

    std::string text;
    if (resp.is_object() && resp.contains("message") && resp["message"].is_object() &&
        resp["message"].contains("content") && resp["message"]["content"].is_string()) {
        text = resp["message"]["content"].get<std::string>();
    }
    return require_text(provider_name(), text);
}

} // namespace vantage
