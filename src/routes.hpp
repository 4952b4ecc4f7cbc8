#pragma once
#include "orchestrator.hpp"
#include "server.hpp"
#include <atomic>

namespace vantage {

// Maps the assistant's HTTP surface onto the orchestrator:
//   POST /api/assistant       {"question", "tool"?, "context"?} -> Answer JSON
//   GET  /api/tool-guidance   ?tool=<name>                     -> guidance JSON
//   GET  /api/health                                           -> circuits + cache size
ApiResponse handle_api_request(FallbackOrchestrator& assistant,
                               const GuidanceCatalog& catalog,
                               const ApiRequest& request,
                               const std::atomic<bool>* cancel = nullptr);

} // namespace vantage
