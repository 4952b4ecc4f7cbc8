#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace vantage {

struct ToolGuidance {
    std::string name;        // registry key, e.g. "port_scan"
    std::string title;
    std::string description;
    std::vector<std::string> keywords;
    std::vector<std::string> usage;  // ordered usage tips
    std::string example;             // one example API call
};

// Static registry of the dashboard's diagnostic tools.
// Read-only after construction; iteration order is registration order.
class GuidanceCatalog {
public:
    // Catalog with the built-in dashboard tools.
    GuidanceCatalog();

    // Catalog with caller-supplied entries (tests, alternate deployments).
    explicit GuidanceCatalog(std::vector<ToolGuidance> tools);

    // Exact lookup on the normalized (trimmed, lowercased) name.
    const ToolGuidance* find(const std::string& name) const;

    const std::vector<ToolGuidance>& tools() const { return tools_; }

    // Tool names in sorted order.
    std::vector<std::string> supported_tools() const;

    // Guidance as JSON, or a "not found" record listing supported tools.
    nlohmann::json guidance_json(const std::string& name) const;

private:
    std::vector<ToolGuidance> tools_;
};

std::vector<ToolGuidance> builtin_tool_guidance();

} // namespace vantage
