#pragma once
#include "context.hpp"
#include "guidance.hpp"
#include <string>
#include <vector>

namespace vantage {

// How a prompt variant is built for a provider attempt.
enum class PromptStrategy {
    ToolSpecific,  // preamble + selected tool's guidance (general when no tool)
    General        // preamble only, tool-agnostic
};

inline const char* prompt_strategy_to_string(PromptStrategy s) {
    switch (s) {
        case PromptStrategy::ToolSpecific: return "tool";
        case PromptStrategy::General: return "general";
    }
    return "general";
}

// Variants tried against each provider, in order, until one yields text.
const std::vector<PromptStrategy>& default_prompt_strategies();

// Fixed scope statement opening every prompt.
const std::string& assistant_preamble();

// "Latest port scan on example.com (3 open ports)"; empty without context.
std::string context_line(const AssistantContext& context);

// Next steps offered alongside an answer about `tool`.
std::vector<std::string> build_suggestions(const ToolGuidance& tool);

// Next steps offered when no tool is involved.
const std::vector<std::string>& default_actions();

// Deterministic for identical inputs. `tool` may be null.
std::string build_prompt(PromptStrategy strategy,
                         const std::string& question,
                         const ToolGuidance* tool,
                         const AssistantContext& context);

} // namespace vantage
