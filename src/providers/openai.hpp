#pragma once
#include "../provider.hpp"
#include "../http.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace vantage {

// OpenAI Chat Completions and API-compatible endpoints (set base_url).
class OpenAIProvider : public Provider {
public:
    OpenAIProvider(const std::string& api_key, HttpClient& http,
                   const std::string& base_url);

    std::string generate(const std::string& prompt,
                         const GenerationSettings& settings) override;

    std::string provider_name() const override { return "openai"; }

    nlohmann::json build_request(const std::string& prompt,
                                 const GenerationSettings& settings) const;
    static std::string extract_text(const nlohmann::json& resp);

private:
    std::string api_key_;
    HttpClient& http_;
    std::string base_url_;
};

} // namespace vantage
