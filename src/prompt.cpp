#include "prompt.hpp"
#include "util.hpp"
#include <sstream>

namespace vantage {

const std::vector<PromptStrategy>& default_prompt_strategies() {
    static const std::vector<PromptStrategy> strategies = {
        PromptStrategy::ToolSpecific,
        PromptStrategy::General,
        PromptStrategy::ToolSpecific
    };
    return strategies;
}

const std::string& assistant_preamble() {
    static const std::string preamble =
        "You are a knowledgeable teacher and technical expert specializing in IT, "
        "computer systems, and networking. You are helping a user inside the Vantage "
        "dashboard, which offers WHOIS, DNS records, IP Geolocation, Port Scan, Speed Test, "
        "and a combined Domain Research tool. Explain the 'why' and 'how' behind technical "
        "topics, keep advice actionable, and offer practice questions when helpful. If a "
        "question is unrelated to IT or networking, politely state your scope.";
    return preamble;
}

std::string context_line(const AssistantContext& context) {
    std::vector<std::string> parts;
    if (!context.tool.empty()) {
        parts.push_back("Latest " + replace_all(context.tool, "_", " "));
    }
    if (!context.target.empty()) {
        parts.push_back("on " + context.target);
    }
    if (!context.summary.empty()) {
        parts.push_back("(" + context.summary + ")");
    }

    std::string line;
    for (const auto& p : parts) {
        if (!line.empty()) line += ' ';
        line += p;
    }
    return trim(line);
}

std::vector<std::string> build_suggestions(const ToolGuidance& tool) {
    std::vector<std::string> actions;
    actions.push_back("Call `/api/tool-guidance?tool=" + tool.name + "` for step-by-step usage.");
    if (!tool.example.empty()) {
        actions.push_back(tool.example);
    }
    if (tool.name == "domain") {
        actions.push_back("Include the `fields` payload to filter the diagnostics you need.");
    }
    return actions;
}

const std::vector<std::string>& default_actions() {
    static const std::vector<std::string> actions = {
        "Review /api/tool-guidance?tool=whois to learn how the WHOIS lookup works.",
        "Use /api/domain with a `fields` array to combine multiple tools in one request.",
        "Check the FAQ or documentation panels inside the dashboard for more tips."
    };
    return actions;
}

static std::string bullet_list(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += '\n';
        out += "- " + items[i];
    }
    return out;
}

std::string build_prompt(PromptStrategy strategy,
                         const std::string& question,
                         const ToolGuidance* tool,
                         const AssistantContext& context) {
    std::string line = context_line(context);
    std::string context_block = line.empty() ? "" : "\nRecent context: " + line;

    std::ostringstream out;
    out << assistant_preamble() << "\n\n";

    if (strategy == PromptStrategy::ToolSpecific && tool) {
        out << "Selected tool: " << tool->name << "\n"
            << "Description: " << tool->description << "\n"
            << "Usage tips:\n" << bullet_list(tool->usage) << "\n"
            << "Example call: " << tool->example << "\n"
            << "Suggested actions:\n" << bullet_list(build_suggestions(*tool)) << "\n"
            << context_block << "\n\n";
    } else {
        out << context_block << "\n";
    }

    out << "User question: " << question << "\n"
        << "Respond concisely with 2-4 sentences.";
    return out.str();
}

} // namespace vantage
