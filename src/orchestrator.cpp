#include "orchestrator.hpp"
#include "util.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace vantage {

static bool cancelled(const std::atomic<bool>* cancel) {
    return cancel && cancel->load(std::memory_order_relaxed);
}

nlohmann::json answer_to_json(const Answer& answer) {
    nlohmann::json j;
    j["answer"] = answer.text;
    j["provider"] = answer.provider;
    if (answer.tool) j["tool"] = *answer.tool;
    j["tips"] = answer.tips;
    if (answer.example) j["example"] = *answer.example;
    j["suggested_actions"] = answer.suggested_actions;
    j["confidence"] = answer.confidence;
    if (!answer.context.empty()) j["context"] = context_to_json(answer.context);
    if (!answer.available_tools.empty()) j["available_tools"] = answer.available_tools;
    return j;
}

FallbackOrchestrator::FallbackOrchestrator(const GuidanceCatalog& catalog,
                                           std::unique_ptr<ResponseCache> cache,
                                           std::vector<std::unique_ptr<ProviderClient>> providers,
                                           std::vector<PromptStrategy> strategies)
    : catalog_(catalog),
      resolver_(catalog),
      cache_(std::move(cache)),
      providers_(std::move(providers)),
      strategies_(std::move(strategies)) {
    if (!cache_) {
        throw std::invalid_argument("FallbackOrchestrator requires a response cache");
    }
    if (strategies_.empty()) {
        strategies_ = default_prompt_strategies();
    }
}

Answer FallbackOrchestrator::answer(const std::string& question,
                                    const std::string& tool_hint,
                                    const AssistantContext& context,
                                    const std::atomic<bool>* cancel) {
    std::string text = trim(question);

    if (text.empty()) {
        if (providers_.empty()) return unavailable_answer();

        const AssistantContext no_context;
        if (auto cached = cache_->get("", no_context, kIntroQuestion)) {
            return live_answer(*cached, kCacheLabel, nullptr, no_context);
        }
        if (auto generated = ask_providers(kIntroQuestion, nullptr, no_context, cancel)) {
            cache_->set("", no_context, kIntroQuestion, generated->text);
            return live_answer(generated->text, generated->provider, nullptr, no_context);
        }
        return unavailable_answer();
    }

    const ToolGuidance* tool = nullptr;
    if (auto resolved = resolver_.resolve(text, tool_hint)) {
        tool = catalog_.find(*resolved);
    } else {
        tool = catalog_.find(context.tool);
    }
    const std::string tool_key = tool ? tool->name : "";

    if (auto cached = cache_->get(tool_key, context, text)) {
        return live_answer(*cached, kCacheLabel, tool, context);
    }

    if (auto generated = ask_providers(text, tool, context, cancel)) {
        cache_->set(tool_key, context, text, generated->text);
        return live_answer(generated->text, generated->provider, tool, context);
    }

    if (tool) {
        if (!providers_.empty()) {
            std::cerr << "[assistant] No provider answered; using " << tool->name
                      << " guidance\n";
        }
        return deterministic_answer(*tool, context);
    }
    return unavailable_answer();
}

std::optional<FallbackOrchestrator::Generated>
FallbackOrchestrator::ask_providers(const std::string& question,
                                    const ToolGuidance* tool,
                                    const AssistantContext& context,
                                    const std::atomic<bool>* cancel) {
    for (auto& client : providers_) {
        if (cancelled(cancel)) return std::nullopt;

        if (client->is_open()) {
            std::cerr << "[assistant] Skipping " << client->name() << ": circuit open\n";
            continue;
        }

        for (PromptStrategy strategy : strategies_) {
            if (cancelled(cancel)) return std::nullopt;

            std::string prompt = build_prompt(strategy, question, tool, context);
            CompletionResult result = client->complete(prompt, cancel);
            if (result.ok()) {
                return Generated{result.text, client->name()};
            }
            if (result.status == CompletionStatus::Rejected) {
                std::cerr << "[assistant] " << client->name() << " rejected the request: "
                          << result.last_error << "\n";
                break;
            }
            if (result.status == CompletionStatus::Skipped || client->is_open()) {
                break;
            }
            std::cerr << "[assistant] " << client->name() << " gave no answer for "
                      << prompt_strategy_to_string(strategy) << " prompt\n";
        }
    }
    return std::nullopt;
}

Answer FallbackOrchestrator::live_answer(const std::string& text, const std::string& provider,
                                         const ToolGuidance* tool,
                                         const AssistantContext& context) const {
    Answer a;
    a.text = trim(text);
    a.provider = provider;
    a.context = context;
    if (tool) {
        a.tool = tool->name;
        a.tips = tool->usage;
        a.example = tool->example;
        a.suggested_actions = build_suggestions(*tool);
        a.confidence = "92%";
    } else {
        a.suggested_actions = default_actions();
        a.confidence = "90%";
    }
    return a;
}

Answer FallbackOrchestrator::deterministic_answer(const ToolGuidance& tool,
                                                  const AssistantContext& context) const {
    Answer a;
    a.text = tool.title + " helps with " + to_lower(tool.description) +
             " Ask for more details or use " + tool.example + ".";
    std::string line = context_line(context);
    if (!line.empty()) {
        a.text = line + " " + a.text;
    }
    a.provider = kDeterministicLabel;
    a.tool = tool.name;
    a.tips = tool.usage;
    a.example = tool.example;
    a.suggested_actions = build_suggestions(tool);
    size_t score = std::min<size_t>(95, 50 + tool.usage.size() * 10);
    a.confidence = std::to_string(score) + "%";
    a.context = context;
    return a;
}

Answer FallbackOrchestrator::unavailable_answer() const {
    Answer a;
    a.text = "I'm having trouble reaching the assistant right now. Please try again in a moment.";
    a.provider = kUnavailableLabel;
    a.suggested_actions = default_actions();
    a.confidence = "0%";
    a.available_tools = catalog_.supported_tools();
    return a;
}

std::vector<ProviderStatus> FallbackOrchestrator::provider_status() {
    std::vector<ProviderStatus> out;
    out.reserve(providers_.size());
    for (auto& client : providers_) {
        out.push_back({client->name(), client->circuit_state()});
    }
    return out;
}

} // namespace vantage
