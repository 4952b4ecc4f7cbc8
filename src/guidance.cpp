#include "guidance.hpp"
#include "util.hpp"
#include <algorithm>

namespace vantage {

std::vector<ToolGuidance> builtin_tool_guidance() {
    return {
        {"whois", "WHOIS Lookup",
         "Retrieves registration metadata, registrar, and key dates for a domain.",
         {"whois", "registration", "domain", "owner"},
         {"Provide a fully qualified domain name such as example.com.",
          "Check the creation/expiration dates to ensure domain ownership is current.",
          "Look at the registrar and name servers for signs of recent transfers."},
         R"(/api/whois (POST with JSON payload: {"host":"example.com"}))"},
        {"dns_records", "DNS Records",
         "Enumerates standard DNS record types (A, AAAA, MX, CNAME, TXT).",
         {"dns", "records", "mx", "cname", "txt"},
         {"Run it when you need to confirm IP resolution or MX mail server settings.",
          "Compare results across record types to catch inconsistencies."},
         R"(/api/dns (POST with JSON payload: {"host":"example.com"}))"},
        {"ip_geolocation", "IP Geolocation",
         "Translates a host into an IP address and fetches its geographic data.",
         {"geoip", "geolocation", "location", "ip"},
         {"Combine with DNS or WHOIS to understand where the infrastructure lives.",
          "Use the returned country and ISP data to highlight unexpected hosting locations."},
         R"(/api/geoip (POST with JSON payload: {"host":"example.com"}))"},
        {"port_scan", "Port Scan",
         "Checks whether a TCP port is open on the host.",
         {"port", "scan", "tcp", "open"},
         {"Default port is 80; specify another port via the `port` field.",
          "Use this tool before running intrusive scans; it keeps the timeout short."},
         R"(/api/port_scan (POST with JSON payload: {"host":"example.com", "port":443}))"},
        {"speed", "Speed Test",
         "Measures download, upload, and ping speeds from the server's location.",
         {"speed", "bandwidth", "ping", "download", "upload"},
         {"Run this to gauge the server's outbound bandwidth before launching downloads.",
          "Expect a longer response time; inform users that it may take a minute."},
         "/api/speed (POST without payload)"},
        {"domain", "Domain Research",
         "Runs configurable diagnostics for WHOIS, DNS, GeoIP, and port scans in one request.",
         {"domain research", "fields", "combined", "batch", "package"},
         {"Send a `fields` array to control which tools run (default is all).",
          "Validate the port range (1-65535) before requesting a custom port scan."},
         R"(/api/domain (POST with JSON payload: {"domain":"example.com","fields":["whois","dns_records"]}))"},
    };
}

GuidanceCatalog::GuidanceCatalog() : tools_(builtin_tool_guidance()) {}

GuidanceCatalog::GuidanceCatalog(std::vector<ToolGuidance> tools)
    : tools_(std::move(tools)) {}

const ToolGuidance* GuidanceCatalog::find(const std::string& name) const {
    std::string key = to_lower(trim(name));
    if (key.empty()) return nullptr;
    for (const auto& tool : tools_) {
        if (tool.name == key) return &tool;
    }
    return nullptr;
}

std::vector<std::string> GuidanceCatalog::supported_tools() const {
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& tool : tools_) {
        names.push_back(tool.name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

nlohmann::json GuidanceCatalog::guidance_json(const std::string& name) const {
    const ToolGuidance* g = find(name);
    if (!g) {
        return {
            {"title", "Tool guidance not found"},
            {"description", "Provide one of the supported tool names."},
            {"supported_tools", supported_tools()}
        };
    }
    return {
        {"tool", g->name},
        {"title", g->title},
        {"description", g->description},
        {"keywords", g->keywords},
        {"usage", g->usage},
        {"example", g->example}
    };
}

} // namespace vantage
