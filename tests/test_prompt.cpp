#include <catch2/catch_test_macros.hpp>
#include "prompt.hpp"

using namespace vantage;

// ── Strategies ──────────────────────────────────────────────────

TEST_CASE("default_prompt_strategies: tool, general, tool", "[prompt]") {
    const auto& s = default_prompt_strategies();
    REQUIRE(s.size() == 3);
    REQUIRE(s[0] == PromptStrategy::ToolSpecific);
    REQUIRE(s[1] == PromptStrategy::General);
    REQUIRE(s[2] == PromptStrategy::ToolSpecific);
}

// ── context_line ────────────────────────────────────────────────

TEST_CASE("context_line: empty context yields empty string", "[prompt]") {
    REQUIRE(context_line({}).empty());
}

TEST_CASE("context_line: full context", "[prompt]") {
    AssistantContext ctx{"ip_geolocation", "8.8.8.8", "US, Google LLC", ""};
    REQUIRE(context_line(ctx) == "Latest ip geolocation on 8.8.8.8 (US, Google LLC)");
}

TEST_CASE("context_line: partial context", "[prompt]") {
    AssistantContext ctx;
    ctx.target = "example.com";
    REQUIRE(context_line(ctx) == "on example.com");
}

// ── Suggestions ─────────────────────────────────────────────────

TEST_CASE("build_suggestions: guidance link and example", "[prompt]") {
    GuidanceCatalog catalog;
    auto actions = build_suggestions(*catalog.find("whois"));
    REQUIRE(actions.size() == 2);
    REQUIRE(actions[0] == "Call `/api/tool-guidance?tool=whois` for step-by-step usage.");
    REQUIRE(actions[1] == catalog.find("whois")->example);
}

TEST_CASE("build_suggestions: domain research adds a fields hint", "[prompt]") {
    GuidanceCatalog catalog;
    auto actions = build_suggestions(*catalog.find("domain"));
    REQUIRE(actions.size() == 3);
    REQUIRE(actions[2].find("`fields`") != std::string::npos);
}

TEST_CASE("default_actions: three general next steps", "[prompt]") {
    REQUIRE(default_actions().size() == 3);
}

// ── build_prompt ────────────────────────────────────────────────

TEST_CASE("build_prompt: always opens with the preamble", "[prompt]") {
    auto p = build_prompt(PromptStrategy::General, "hi", nullptr, {});
    REQUIRE(p.find(assistant_preamble()) == 0);
    REQUIRE(p.find("Vantage") != std::string::npos);
}

TEST_CASE("build_prompt: tool-specific includes guidance details", "[prompt]") {
    GuidanceCatalog catalog;
    const ToolGuidance* tool = catalog.find("dns_records");
    auto p = build_prompt(PromptStrategy::ToolSpecific, "check mx", tool, {});

    REQUIRE(p.find("Selected tool: dns_records") != std::string::npos);
    REQUIRE(p.find("Description: " + tool->description) != std::string::npos);
    REQUIRE(p.find("- " + tool->usage[0]) != std::string::npos);
    REQUIRE(p.find("Example call: " + tool->example) != std::string::npos);
    REQUIRE(p.find("Suggested actions:") != std::string::npos);
}

TEST_CASE("build_prompt: general strategy omits tool details", "[prompt]") {
    GuidanceCatalog catalog;
    auto p = build_prompt(PromptStrategy::General, "check mx", catalog.find("dns_records"), {});
    REQUIRE(p.find("Selected tool:") == std::string::npos);
    REQUIRE(p.find("Example call:") == std::string::npos);
}

TEST_CASE("build_prompt: tool-specific without a tool renders the general form", "[prompt]") {
    auto tool_form = build_prompt(PromptStrategy::ToolSpecific, "q", nullptr, {});
    auto general_form = build_prompt(PromptStrategy::General, "q", nullptr, {});
    REQUIRE(tool_form == general_form);
}

TEST_CASE("build_prompt: ends with question and length instruction", "[prompt]") {
    auto p = build_prompt(PromptStrategy::General, "what is a CNAME?", nullptr, {});
    const std::string tail = "User question: what is a CNAME?\nRespond concisely with 2-4 sentences.";
    REQUIRE(p.size() >= tail.size());
    REQUIRE(p.compare(p.size() - tail.size(), tail.size(), tail) == 0);
}

TEST_CASE("build_prompt: includes recent context", "[prompt]") {
    AssistantContext ctx{"speed", "", "120 Mbps down", ""};
    auto p = build_prompt(PromptStrategy::General, "is that good?", nullptr, ctx);
    REQUIRE(p.find("Recent context: Latest speed (120 Mbps down)") != std::string::npos);
}

TEST_CASE("build_prompt: deterministic for identical inputs", "[prompt]") {
    GuidanceCatalog catalog;
    AssistantContext ctx{"whois", "example.com", "", ""};
    auto a = build_prompt(PromptStrategy::ToolSpecific, "q", catalog.find("whois"), ctx);
    auto b = build_prompt(PromptStrategy::ToolSpecific, "q", catalog.find("whois"), ctx);
    REQUIRE(a == b);
}
