#include <catch2/catch_test_macros.hpp>
#include "guidance.hpp"

using namespace vantage;

TEST_CASE("GuidanceCatalog: ships the six dashboard tools in order", "[guidance]") {
    GuidanceCatalog catalog;
    const auto& tools = catalog.tools();
    REQUIRE(tools.size() == 6);
    REQUIRE(tools[0].name == "whois");
    REQUIRE(tools[1].name == "dns_records");
    REQUIRE(tools[2].name == "ip_geolocation");
    REQUIRE(tools[3].name == "port_scan");
    REQUIRE(tools[4].name == "speed");
    REQUIRE(tools[5].name == "domain");
}

TEST_CASE("GuidanceCatalog: every entry is fully populated", "[guidance]") {
    GuidanceCatalog catalog;
    for (const auto& tool : catalog.tools()) {
        INFO(tool.name);
        REQUIRE_FALSE(tool.title.empty());
        REQUIRE_FALSE(tool.description.empty());
        REQUIRE_FALSE(tool.keywords.empty());
        REQUIRE_FALSE(tool.usage.empty());
        REQUIRE_FALSE(tool.example.empty());
    }
}

TEST_CASE("GuidanceCatalog: find is case-insensitive and trims", "[guidance]") {
    GuidanceCatalog catalog;
    const ToolGuidance* g = catalog.find("  Port_Scan ");
    REQUIRE(g != nullptr);
    REQUIRE(g->title == "Port Scan");
    REQUIRE(catalog.find("") == nullptr);
    REQUIRE(catalog.find("traceroute") == nullptr);
}

TEST_CASE("GuidanceCatalog: supported_tools is sorted", "[guidance]") {
    GuidanceCatalog catalog;
    auto names = catalog.supported_tools();
    REQUIRE(names.size() == 6);
    REQUIRE(names.front() == "dns_records");
    REQUIRE(names.back() == "whois");
}

TEST_CASE("GuidanceCatalog: guidance_json for a known tool", "[guidance]") {
    GuidanceCatalog catalog;
    auto j = catalog.guidance_json("speed");
    REQUIRE(j["tool"] == "speed");
    REQUIRE(j["title"] == "Speed Test");
    REQUIRE(j["usage"].size() == 2);
    REQUIRE(j["example"] == "/api/speed (POST without payload)");
}

TEST_CASE("GuidanceCatalog: guidance_json for an unknown tool lists supported tools", "[guidance]") {
    GuidanceCatalog catalog;
    auto j = catalog.guidance_json("nmap");
    REQUIRE(j["title"] == "Tool guidance not found");
    REQUIRE(j["supported_tools"].size() == 6);
    REQUIRE_FALSE(j.contains("tool"));
}

TEST_CASE("GuidanceCatalog: custom entries replace the built-ins", "[guidance]") {
    GuidanceCatalog catalog(std::vector<ToolGuidance>{{"ping", "Ping", "Sends ICMP echo requests.", {"icmp"},
                              {"Use sparingly."}, "/api/ping"}});
    REQUIRE(catalog.tools().size() == 1);
    REQUIRE(catalog.find("ping") != nullptr);
    REQUIRE(catalog.find("whois") == nullptr);
}
