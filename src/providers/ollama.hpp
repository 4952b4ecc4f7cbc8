#pragma once
#include "../provider.hpp"
#include "../http.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace vantage {

// Local Ollama server (/api/chat, non-streaming). No API key.
class OllamaProvider : public Provider {
public:
    OllamaProvider(HttpClient& http, const std::string& base_url);

    std::string generate(const std::string& prompt,
                         const GenerationSettings& settings) override;

    std::string provider_name() const override { return "ollama"; }

private:
    HttpClient& http_;
    std::string base_url_;
};

} // namespace vantage
