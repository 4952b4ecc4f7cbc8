#include "config.hpp"
#include "guidance.hpp"
#include "http.hpp"
#include "orchestrator.hpp"
#include "provider_client.hpp"
#include "response_cache.hpp"
#include "routes.hpp"
#include "server.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: vantage-assistant [options]\n"
              << "\n"
              << "Options:\n"
              << "  -q, --question TEXT     Ask a single question, print the answer JSON and exit\n"
              << "  -t, --tool NAME         Tool hint (whois, dns_records, ip_geolocation,\n"
              << "                          port_scan, speed, domain)\n"
              << "  --context-tool NAME     Most recent diagnostic tool used\n"
              << "  --context-target HOST   Target of the most recent diagnostic\n"
              << "  --context-summary TEXT  Summary of the most recent result\n"
              << "  --serve                 Run the HTTP endpoint\n"
              << "  --listen HOST:PORT      Listen address for --serve\n"
              << "  --config PATH           Config file (default ~/.vantage/config.json)\n"
              << "  -h, --help              Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  GEMINI_API_KEY          API key for Gemini\n"
              << "  GEMINI_MODEL            Gemini model override\n"
              << "  OPENAI_API_KEY          API key for OpenAI\n"
              << "  OPENAI_MODEL            OpenAI model override\n"
              << "  OLLAMA_BASE_URL         Base URL of a local Ollama server\n"
              << "  VANTAGE_DISABLE_<NAME>  Set to 1 to force-disable a provider\n"
              << "  VANTAGE_CONFIG          Config file path\n"
              << "  VANTAGE_LISTEN          Listen address for --serve\n";
}

static std::unique_ptr<vantage::FallbackOrchestrator> build_assistant(
        const vantage::Config& config,
        const vantage::GuidanceCatalog& catalog,
        vantage::HttpClient& http) {
    std::vector<std::unique_ptr<vantage::ProviderClient>> clients;
    for (const auto& entry : config.active_providers()) {
        clients.push_back(vantage::ProviderClient::from_entry(entry, http));
        std::cerr << "[assistant] Provider " << clients.size() << ": " << entry.name
                  << " (" << entry.model << ")\n";
    }
    if (clients.empty()) {
        std::cerr << "[assistant] No providers configured; answering from guidance only\n";
    }

    auto cache = std::make_unique<vantage::ResponseCache>(
        config.cache.ttl_seconds, config.cache.max_entries);
    return std::make_unique<vantage::FallbackOrchestrator>(
        catalog, std::move(cache), std::move(clients));
}

static int run_server(const vantage::Config& config,
                      vantage::FallbackOrchestrator& assistant,
                      const vantage::GuidanceCatalog& catalog) {
    vantage::ApiServer server(config.server.listen, config.server.workers,
                              config.server.max_body,
        [&assistant, &catalog](const vantage::ApiRequest& req) {
            return vantage::handle_api_request(assistant, catalog, req, &g_shutdown);
        });

    std::string error;
    if (!server.start(error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[server] Shutting down.\n";
    server.stop();
    return 0;
}

int main(int argc, char* argv[]) try {
    std::string question;
    bool have_question = false;
    std::string tool_hint;
    vantage::AssistantContext context;
    bool serve = false;
    std::string listen;
    std::string config_path;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-q") == 0 || std::strcmp(argv[i], "--question") == 0) && i + 1 < argc) {
            question = argv[++i];
            have_question = true;
        } else if ((std::strcmp(argv[i], "-t") == 0 || std::strcmp(argv[i], "--tool") == 0) && i + 1 < argc) {
            tool_hint = argv[++i];
        } else if (std::strcmp(argv[i], "--context-tool") == 0 && i + 1 < argc) {
            context.tool = argv[++i];
        } else if (std::strcmp(argv[i], "--context-target") == 0 && i + 1 < argc) {
            context.target = argv[++i];
        } else if (std::strcmp(argv[i], "--context-summary") == 0 && i + 1 < argc) {
            context.summary = argv[++i];
        } else if (std::strcmp(argv[i], "--serve") == 0) {
            serve = true;
        } else if (std::strcmp(argv[i], "--listen") == 0 && i + 1 < argc) {
            listen = argv[++i];
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    if (!serve && !have_question) {
        print_usage();
        return 1;
    }

    vantage::http_init();
    auto config = config_path.empty() ? vantage::Config::load()
                                      : vantage::Config::load(config_path);
    if (!listen.empty()) {
        config.server.listen = listen;
    }
    config.validate();

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    vantage::http_set_abort_flag(&g_shutdown);

    vantage::GuidanceCatalog catalog;
    vantage::CurlHttpClient http_client;
    auto assistant = build_assistant(config, catalog, http_client);

    int rc = 0;
    if (serve) {
        rc = run_server(config, *assistant, catalog);
    } else {
        vantage::Answer answer = assistant->answer(question, tool_hint, context, &g_shutdown);
        std::cout << vantage::answer_to_json(answer).dump(2) << '\n';
    }

    vantage::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
