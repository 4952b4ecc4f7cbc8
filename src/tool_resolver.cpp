#include "tool_resolver.hpp"
#include "util.hpp"

namespace vantage {

int ToolResolver::score(const ToolGuidance& tool, const std::string& lowered_question) {
    int total = 0;
    if (lowered_question.find(tool.name) != std::string::npos) {
        total += 3;
    }
    for (const auto& keyword : tool.keywords) {
        if (lowered_question.find(keyword) != std::string::npos) {
            total += 1;
        }
    }
    return total;
}

std::optional<std::string> ToolResolver::resolve(const std::string& question,
                                                 const std::string& tool_hint) const {
    if (const ToolGuidance* hinted = catalog_.find(tool_hint)) {
        return hinted->name;
    }

    std::string lowered = to_lower(question);
    const ToolGuidance* best = nullptr;
    int best_score = 0;
    for (const auto& tool : catalog_.tools()) {
        int s = score(tool, lowered);
        if (s > best_score) {
            best_score = s;
            best = &tool;
        }
    }

    if (!best) return std::nullopt;
    return best->name;
}

} // namespace vantage
