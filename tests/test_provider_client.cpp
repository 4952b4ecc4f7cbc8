#include <catch2/catch_test_macros.hpp>
#include "provider_client.hpp"
#include "config.hpp"
#include "mock_http_client.hpp"
#include <atomic>
#include <chrono>
#include <vector>

using namespace vantage;
using namespace std::chrono_literals;

namespace {

// Scripted provider: each call pops the next outcome.
class ScriptedProvider : public Provider {
public:
    struct Outcome {
        bool ok;
        ProviderErrorKind kind;
        std::string text;
    };

    explicit ScriptedProvider(std::vector<Outcome> script) : script_(std::move(script)) {}

    std::string generate(const std::string& /*prompt*/,
                         const GenerationSettings& /*settings*/) override {
        calls++;
        Outcome o = script_.empty() ? Outcome{true, ProviderErrorKind::Transport, "default"}
                                    : script_.front();
        if (!script_.empty()) script_.erase(script_.begin());
        if (o.ok) return o.text;
        throw ProviderError(o.kind, o.kind == ProviderErrorKind::Server ? 503 : 0,
                            std::string("scripted ") + error_kind_to_string(o.kind));
    }

    std::string provider_name() const override { return "scripted"; }

    int calls = 0;

private:
    std::vector<Outcome> script_;
};

ScriptedProvider::Outcome ok(const std::string& text) {
    return {true, ProviderErrorKind::Transport, text};
}

ScriptedProvider::Outcome fail(ProviderErrorKind kind) {
    return {false, kind, ""};
}

struct Harness {
    uint64_t now_ms = 1000000;
    std::vector<std::chrono::milliseconds> sleeps;
    ScriptedProvider* provider = nullptr;
    std::unique_ptr<ProviderClient> client;

    Harness(std::vector<ScriptedProvider::Outcome> script,
            uint32_t max_retries, uint32_t threshold,
            std::chrono::milliseconds backoff = 1000ms) {
        auto p = std::make_unique<ScriptedProvider>(std::move(script));
        provider = p.get();
        RetryPolicy retry;
        retry.max_retries = max_retries;
        retry.backoff = backoff;
        auto breaker = std::make_unique<CircuitBreaker>(
            "scripted", threshold, 60, [this] { return now_ms; });
        client = std::make_unique<ProviderClient>(
            std::move(p), GenerationSettings{}, retry, std::move(breaker),
            [this](std::chrono::milliseconds d) { sleeps.push_back(d); });
    }
};

} // namespace

TEST_CASE("ProviderClient: first-attempt success", "[provider_client]") {
    Harness h({ok("WHOIS shows registration data.")}, 2, 3);
    auto result = h.client->complete("prompt");

    REQUIRE(result.ok());
    REQUIRE(result.text == "WHOIS shows registration data.");
    REQUIRE(result.attempts == 1);
    REQUIRE(h.sleeps.empty());
}

TEST_CASE("ProviderClient: retries transient failure with linear backoff", "[provider_client]") {
    Harness h({fail(ProviderErrorKind::Server), fail(ProviderErrorKind::Transport), ok("third time")},
              3, 5, 500ms);
    auto result = h.client->complete("prompt");

    REQUIRE(result.ok());
    REQUIRE(result.attempts == 3);
    REQUIRE(h.provider->calls == 3);
    REQUIRE(h.sleeps.size() == 2);
    REQUIRE(h.sleeps[0] == 500ms);
    REQUIRE(h.sleeps[1] == 1000ms);
    REQUIRE(h.client->circuit_state().consecutive_failures == 0);
}

TEST_CASE("ProviderClient: no sleep after the final attempt", "[provider_client]") {
    Harness h({fail(ProviderErrorKind::Server), fail(ProviderErrorKind::Server)}, 2, 5);
    auto result = h.client->complete("prompt");

    REQUIRE(result.status == CompletionStatus::Unavailable);
    REQUIRE(result.attempts == 2);
    REQUIRE(h.sleeps.size() == 1);
    REQUIRE_FALSE(result.last_error.empty());
}

TEST_CASE("ProviderClient: max_retries of zero still makes one attempt", "[provider_client]") {
    Harness h({fail(ProviderErrorKind::Transport)}, 0, 5);
    auto result = h.client->complete("prompt");
    REQUIRE(result.attempts == 1);
    REQUIRE(h.provider->calls == 1);
}

TEST_CASE("ProviderClient: stops retrying once the breaker opens", "[provider_client]") {
    Harness h({fail(ProviderErrorKind::Server), fail(ProviderErrorKind::Server),
               fail(ProviderErrorKind::Server)}, 5, 2);
    auto result = h.client->complete("prompt");

    REQUIRE(result.status == CompletionStatus::Unavailable);
    REQUIRE(result.attempts == 2);
    REQUIRE(h.provider->calls == 2);
    REQUIRE(h.client->is_open());
}

TEST_CASE("ProviderClient: open circuit skips without network I/O", "[provider_client]") {
    Harness h({fail(ProviderErrorKind::Server)}, 1, 1);
    h.client->complete("prompt");
    REQUIRE(h.client->is_open());

    auto result = h.client->complete("prompt");
    REQUIRE(result.status == CompletionStatus::Skipped);
    REQUIRE(result.attempts == 0);
    REQUIRE(h.provider->calls == 1);
}

TEST_CASE("ProviderClient: probe after cooldown closes the circuit on success", "[provider_client]") {
    Harness h({fail(ProviderErrorKind::Server), ok("back")}, 1, 1);
    h.client->complete("prompt");
    REQUIRE(h.client->is_open());

    h.now_ms += 60000;
    auto result = h.client->complete("prompt");
    REQUIRE(result.ok());
    REQUIRE(h.client->circuit_state().phase == CircuitPhase::Closed);
}

TEST_CASE("ProviderClient: client errors are not retried or counted", "[provider_client]") {
    Harness h({fail(ProviderErrorKind::Client), ok("unreached")}, 3, 1);
    auto result = h.client->complete("prompt");

    REQUIRE(result.status == CompletionStatus::Rejected);
    REQUIRE(result.attempts == 1);
    REQUIRE(h.provider->calls == 1);
    REQUIRE(h.sleeps.empty());
    REQUIRE_FALSE(h.client->is_open());
    REQUIRE(h.client->circuit_state().consecutive_failures == 0);
}

TEST_CASE("ProviderClient: malformed replies are not retried or counted", "[provider_client]") {
    Harness h({fail(ProviderErrorKind::Malformed)}, 3, 1);
    auto result = h.client->complete("prompt");

    REQUIRE(result.status == CompletionStatus::Unavailable);
    REQUIRE(result.attempts == 1);
    REQUIRE_FALSE(h.client->is_open());
}

TEST_CASE("ProviderClient: cancellation stops before the next attempt", "[provider_client]") {
    Harness h({fail(ProviderErrorKind::Transport), ok("unreached")}, 3, 5);
    std::atomic<bool> cancel{true};
    auto result = h.client->complete("prompt", &cancel);

    REQUIRE(result.status == CompletionStatus::Unavailable);
    REQUIRE(result.attempts == 0);
    REQUIRE(h.provider->calls == 0);
}

TEST_CASE("ProviderClient: null provider or breaker is rejected", "[provider_client]") {
    REQUIRE_THROWS_AS(ProviderClient(nullptr, {}, {},
                                     std::make_unique<CircuitBreaker>("x", 1, 1)),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(ProviderClient(std::make_unique<ScriptedProvider>(
                                         std::vector<ScriptedProvider::Outcome>{}),
                                     {}, {}, nullptr),
                      std::invalid_argument);
}

TEST_CASE("ProviderClient::from_entry: maps configuration onto settings", "[provider_client]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({"choices":[{"message":{"content":"hi"}}]})", ""};

    ProviderEntry entry;
    entry.name = "openai";
    entry.api_key = "k";
    entry.model = "gpt-4o-mini";
    entry.max_retries = 4;
    entry.retry_backoff_seconds = 0.25;
    entry.timeout_seconds = 9;
    entry.max_output_length = 128;
    entry.temperature = 0.1;

    auto client = ProviderClient::from_entry(entry, mock);
    REQUIRE(client->name() == "openai");
    REQUIRE(client->settings().model == "gpt-4o-mini");
    REQUIRE(client->settings().max_output_tokens == 128);
    REQUIRE(client->settings().timeout_seconds == 9);
    REQUIRE(client->retry_policy().max_retries == 4);
    REQUIRE(client->retry_policy().backoff == 250ms);

    auto result = client->complete("prompt");
    REQUIRE(result.ok());
    REQUIRE(mock.last_timeout == 9);
}

TEST_CASE("ProviderClient: HTTP 503 then 200 through a real adapter", "[provider_client]") {
    MockHttpClient mock;
    mock.response_queue = {
        {503, "busy", ""},
        {200, R"({"choices":[{"message":{"content":"recovered"}}]})", ""},
    };

    ProviderEntry entry;
    entry.name = "openai";
    entry.api_key = "k";
    entry.model = "m";
    entry.max_retries = 2;

    std::vector<std::chrono::milliseconds> sleeps;
    auto client = ProviderClient::from_entry(entry, mock, system_clock(),
        [&sleeps](std::chrono::milliseconds d) { sleeps.push_back(d); });

    auto result = client->complete("prompt");
    REQUIRE(result.ok());
    REQUIRE(result.text == "recovered");
    REQUIRE(mock.call_count == 2);
    REQUIRE(sleeps.size() == 1);
    REQUIRE(sleeps[0] == 1000ms);
}
