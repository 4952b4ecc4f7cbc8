#pragma once
#include "context.hpp"
#include "util.hpp"
#include <string>
#include <unordered_map>
#include <mutex>
#include <cstdint>
#include <optional>

namespace vantage {

struct CacheEntry {
    std::string key_text;   // full normalized key, guards against hash collisions
    std::string response;
    uint64_t created_ms;
    uint64_t sequence;      // insertion order, breaks created_ms ties
};

// Time- and capacity-bounded cache of assistant answers keyed by
// (tool, context fingerprint, normalized question). Thread-safe.
class ResponseCache {
public:
    // Throws std::invalid_argument when max_entries is zero.
    ResponseCache(uint32_t ttl_seconds, uint32_t max_entries, Clock clock = system_clock());

    // Look up cached response. Returns nullopt on miss; an expired entry is
    // erased on the way out.
    std::optional<std::string> get(const std::string& tool,
                                   const AssistantContext& context,
                                   const std::string& question);

    // Store (or refresh) a response. Evicts the oldest other entry when the
    // cache grows past max_entries.
    void set(const std::string& tool,
             const AssistantContext& context,
             const std::string& question,
             const std::string& response);

    uint32_t size() const;
    void clear();

    uint32_t ttl_seconds() const { return ttl_seconds_; }
    uint32_t max_entries() const { return max_entries_; }

    static std::string key_text(const std::string& tool,
                                const AssistantContext& context,
                                const std::string& question);

private:
    static uint64_t compute_key(const std::string& key_text);
    bool expired(const CacheEntry& entry, uint64_t now) const;
    void evict_oldest_except(uint64_t keep);

    uint32_t ttl_seconds_;
    uint32_t max_entries_;
    Clock clock_;
    uint64_t next_sequence_ = 0;
    std::unordered_map<uint64_t, CacheEntry> entries_;
    mutable std::mutex mutex_;
};

} // namespace vantage
