#include "gemini.hpp"
#include "../config.hpp"
#include "../plugin.hpp"
#include <nlohmann/json.hpp>

static vantage::ProviderRegistrar reg_gemini("gemini",
    [](const vantage::ProviderEntry& entry, vantage::HttpClient& http) {
        return std::make_unique<vantage::GeminiProvider>(entry.api_key, http, entry.base_url);
    });

using json = nlohmann::json;

namespace vantage {

GeminiProvider::GeminiProvider(const std::string& api_key, HttpClient& http,
                               const std::string& base_url)
    : api_key_(api_key), http_(http),
      base_url_(base_url.empty() ? "https://generativelanguage.googleapis.com/v1beta" : base_url) {}

json GeminiProvider::build_request(const std::string& prompt,
                                   const GenerationSettings& settings) const {
    json request;
    request["contents"] = json::array({
        {{"parts", json::array({{{"text", prompt}}})}}
    });
    request["generationConfig"] = {
        {"temperature", settings.temperature},
        {"maxOutputTokens", settings.max_output_tokens}
    };
    return request;
}

std::string GeminiProvider::extract_text(const json& resp) {
    if (!resp.is_object() || !resp.contains("candidates") || !resp["candidates"].is_array() ||
        resp["candidates"].empty()) {
        return {};
    }
    const auto& candidate = resp["candidates"][0];
    if (!candidate.contains("content") || !candidate["content"].is_object()) return {};
    const auto& content = candidate["content"];
    if (!content.contains("parts") || !content["parts"].is_array()) return {};

    std::string text;
    for (const auto& part : content["parts"]) {
        if (part.is_object() && part.contains("text") && part["text"].is_string()) {
            text += part["text"].get<std::string>();
        }
    }
    return text;
}

std::string GeminiProvider::generate(const std::string& prompt,
                                     const GenerationSettings& settings) {
    std::string url = base_url_ + "/models/" + settings.model + ":generateContent";
    std::vector<Header> headers = {
        {"x-goog-api-key", api_key_},
        {"Content-Type", "application/json"}
    };

    auto response = http_.post(url, build_request(prompt, settings).dump(), headers,
                               settings.timeout_seconds);
    check_http_status(provider_name(), response);

    json resp = parse_response_body(provider_name(), response.body);
    return require_text(provider_name(), extract_text(resp));
}

} // namespace vantage
