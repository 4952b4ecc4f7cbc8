#pragma once
#include "context.hpp"
#include "guidance.hpp"
#include "prompt.hpp"
#include "provider_client.hpp"
#include "response_cache.hpp"
#include "tool_resolver.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace vantage {

// Provider labels that are not provider names.
inline constexpr const char* kCacheLabel = "cache";
inline constexpr const char* kDeterministicLabel = "deterministic";
inline constexpr const char* kUnavailableLabel = "unavailable";

struct Answer {
    std::string text;
    std::string provider;   // provider name, or one of the labels above
    std::optional<std::string> tool;
    std::vector<std::string> tips;
    std::optional<std::string> example;
    std::vector<std::string> suggested_actions;
    std::string confidence;
    AssistantContext context;
    std::vector<std::string> available_tools;  // unavailable answers only
};

nlohmann::json answer_to_json(const Answer& answer);

struct ProviderStatus {
    std::string name;
    CircuitState circuit;
};

// The assistant facade: resolves the tool, consults the cache, walks providers
// in priority order and degrades to guidance text when none can answer.
// Holds no per-request state; safe to call from many threads at once.
class FallbackOrchestrator {
public:
    FallbackOrchestrator(const GuidanceCatalog& catalog,
                         std::unique_ptr<ResponseCache> cache,
                         std::vector<std::unique_ptr<ProviderClient>> providers,
                         std::vector<PromptStrategy> strategies = default_prompt_strategies());

    // Never throws for provider trouble; always returns a well-formed Answer.
    Answer answer(const std::string& question,
                  const std::string& tool_hint = "",
                  const AssistantContext& context = {},
                  const std::atomic<bool>* cancel = nullptr);

    std::vector<ProviderStatus> provider_status();
    ResponseCache& cache() { return *cache_; }
    size_t provider_count() const { return providers_.size(); }

    static constexpr const char* kIntroQuestion =
        "Briefly introduce how you can help with IT, systems, and networking questions.";

private:
    struct Generated {
        std::string text;
        std::string provider;
    };

    std::optional<Generated> ask_providers(const std::string& question,
                                           const ToolGuidance* tool,
                                           const AssistantContext& context,
                                           const std::atomic<bool>* cancel);

    Answer live_answer(const std::string& text, const std::string& provider,
                       const ToolGuidance* tool, const AssistantContext& context) const;
    Answer deterministic_answer(const ToolGuidance& tool,
                                const AssistantContext& context) const;
    Answer unavailable_answer() const;

    const GuidanceCatalog& catalog_;
    ToolResolver resolver_;
    std::unique_ptr<ResponseCache> cache_;
    std::vector<std::unique_ptr<ProviderClient>> providers_;
    std::vector<PromptStrategy> strategies_;
};

} // namespace vantage
