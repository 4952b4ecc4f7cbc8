#pragma once
#include "guidance.hpp"
#include <optional>
#include <string>

namespace vantage {

// Matches free-text questions to a catalog tool by keyword scoring.
class ToolResolver {
public:
    explicit ToolResolver(const GuidanceCatalog& catalog) : catalog_(catalog) {}

    // An explicit hint naming a known tool always wins. Otherwise each tool
    // scores +3 when its name occurs in the question and +1 per keyword hit;
    // the first tool with the highest nonzero score is returned.
    std::optional<std::string> resolve(const std::string& question,
                                       const std::string& tool_hint = "") const;

    // Score of a single tool against an already lowercased question.
    static int score(const ToolGuidance& tool, const std::string& lowered_question);

private:
    const GuidanceCatalog& catalog_;
};

} // namespace vantage
