#pragma once
#include "../provider.hpp"
#include "../http.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace vantage {

// Google Generative Language API (generateContent).
class GeminiProvider : public Provider {
public:
    GeminiProvider(const std::string& api_key, HttpClient& http,
                   const std::string& base_url);

    std::string generate(const std::string& prompt,
                         const GenerationSettings& settings) override;

    std::string provider_name() const override { return "gemini"; }

    nlohmann::json build_request(const std::string& prompt,
                                 const GenerationSettings& settings) const;
    static std::string extract_text(const nlohmann::json& resp);

private:
    std::string api_key_;
    HttpClient& http_;
    std::string base_url_;
};

} // namespace vantage
