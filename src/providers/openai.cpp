#include "openai.hpp"
#include "../config.hpp"
#include "../plugin.hpp"
#include <nlohmann/json.hpp>

static vantage::ProviderRegistrar reg_openai("openai",
    [](const vantage::ProviderEntry& entry, vantage::HttpClient& http) {
        return std::make_unique<vantage::OpenAIProvider>(entry.api_key, http, entry.base_url);
    });

using json = nlohmann::json;

namespace vantage {

OpenAIProvider::OpenAIProvider(const std::string& api_key, HttpClient& http,
                               const std::string& base_url)
    : api_key_(api_key), http_(http),
      base_url_(base_url.empty() ? "https://api.openai.com/v1" : base_url) {}

json OpenAIProvider::build_request(const std::string& prompt,
                                   const GenerationSettings& settings) const {
    json request;
    request["model"] = settings.model;
    request["temperature"] = settings.temperature;
    request["max_tokens"] = settings.max_output_tokens;
    request["messages"] = json::array({
        {{"role", "user"}, {"content", prompt}}
    });
    return request;
}

std::string OpenAIProvider::extract_text(const json& resp) {
    if (!resp.is_object() || !resp.contains("choices") || !resp["choices"].is_array() ||
        resp["choices"].empty()) {
        return {};
    }
    const auto& choice = resp["choices"][0];
    if (!choice.contains("message") || !choice["message"].is_object()) return {};
    const auto& message = choice["message"];
    if (message.contains("content") && message["content"].is_string()) {
        return message["content"].get<std::string>();
    }
    return {};
}

std::string OpenAIProvider::generate(const std::string& prompt,
                                     const GenerationSettings& settings) {
    std::vector<Header> headers = {
        {"Content-Type", "application/json"}
    };
    if (!api_key_.empty()) {
        headers.emplace_back("Authorization", "Bearer " + api_key_);
    }

    auto response = http_.post(base_url_ + "/chat/completions",
                               build_request(prompt, settings).dump(), headers,
                               settings.timeout_seconds);
    check_http_status(provider_name(), response);

    json resp = parse_response_body(provider_name(), response.body);
    return require_text(provider_name(), extract_text(resp));
}

} // namespace vantage
