#include "routes.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace vantage {

static ApiResponse json_response(int status, const json& body) {
    return {status, "application/json", body.dump()};
}

static ApiResponse error_response(int status, const std::string& message) {
    return json_response(status, {{"error", message}});
}

static ApiResponse handle_assistant(FallbackOrchestrator& assistant,
                                    const ApiRequest& request,
                                    const std::atomic<bool>* cancel) {
    json body = json::parse(request.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        return error_response(400, "Request body must be a JSON object");
    }

    std::string question;
    if (body.contains("question") && body["question"].is_string()) {
        question = body["question"].get<std::string>();
    }
    std::string tool_hint;
    if (body.contains("tool") && body["tool"].is_string()) {
        tool_hint = body["tool"].get<std::string>();
    }
    AssistantContext context;
    if (body.contains("context")) {
        context = context_from_json(body["context"]);
    }

    Answer answer = assistant.answer(question, tool_hint, context, cancel);
    return json_response(200, answer_to_json(answer));
}

static ApiResponse handle_health(FallbackOrchestrator& assistant) {
    json providers = json::array();
    for (const auto& status : assistant.provider_status()) {
        providers.push_back({
            {"name", status.name},
            {"state", circuit_phase_to_string(status.circuit.phase)},
            {"consecutive_failures", status.circuit.consecutive_failures},
            {"open_until_ms", status.circuit.open_until_ms}
        });
    }
    return json_response(200, {
        {"status", "ok"},
        {"providers", providers},
        {"cache_entries", assistant.cache().size()}
    });
}

ApiResponse handle_api_request(FallbackOrchestrator& assistant,
                               const GuidanceCatalog& catalog,
                               const ApiRequest& request,
                               const std::atomic<bool>* cancel) {
    if (request.path == "/api/assistant") {
        if (request.method != "POST") return error_response(405, "Use POST");
        return handle_assistant(assistant, request, cancel);
    }
    if (request.path == "/api/tool-guidance") {
        if (request.method != "GET") return error_response(405, "Use GET");
        return json_response(200, catalog.guidance_json(request.query_param("tool")));
    }
    if (request.path == "/api/health") {
        if (request.method != "GET") return error_response(405, "Use GET");
        return handle_health(assistant);
    }
    return error_response(404, "Not found");
}

} // namespace vantage
