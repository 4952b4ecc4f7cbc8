#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace vantage {

// The user's most recent diagnostic action, supplied by session history.
// All fields empty means "no context".
struct AssistantContext {
    std::string tool;
    std::string target;
    std::string summary;
    std::string timestamp;

    bool empty() const {
        return tool.empty() && target.empty() && summary.empty() && timestamp.empty();
    }

    // Cache-scoping string: tool, target and summary joined by \x01 ("" when empty).
    std::string fingerprint() const {
        if (tool.empty() && target.empty() && summary.empty()) return {};
        return tool + '\x01' + target + '\x01' + summary;
    }
};

// Missing or non-string fields are left empty.
inline AssistantContext context_from_json(const nlohmann::json& j) {
    AssistantContext ctx;
    if (!j.is_object()) return ctx;
    auto str = [&j](const char* key) -> std::string {
        auto it = j.find(key);
        if (it != j.end() && it->is_string()) return it->get<std::string>();
        return {};
    };
    ctx.tool = str("tool");
    ctx.target = str("target");
    ctx.summary = str("summary");
    ctx.timestamp = str("timestamp");
    return ctx;
}

inline nlohmann::json context_to_json(const AssistantContext& ctx) {
    nlohmann::json j = nlohmann::json::object();
    if (!ctx.tool.empty()) j["tool"] = ctx.tool;
    if (!ctx.target.empty()) j["target"] = ctx.target;
    if (!ctx.summary.empty()) j["summary"] = ctx.summary;
    if (!ctx.timestamp.empty()) j["timestamp"] = ctx.timestamp;
    return j;
}

} // namespace vantage
