#include "response_cache.hpp"
#include <stdexcept>

namespace vantage {

ResponseCache::ResponseCache(uint32_t ttl_seconds, uint32_t max_entries, Clock clock)
    : ttl_seconds_(ttl_seconds), max_entries_(max_entries), clock_(std::move(clock)) {
    if (max_entries_ == 0) {
        throw std::invalid_argument("ResponseCache requires max_entries > 0");
    }
    if (!clock_) {
        clock_ = system_clock();
    }
}

std::string ResponseCache::key_text(const std::string& tool,
                                    const AssistantContext& context,
                                    const std::string& question) {
    std::string key = tool;
    key += '\x01';
    key += context.fingerprint();
    key += '\x01';
    key += normalize_text(question);
    return key;
}

uint64_t ResponseCache::compute_key(const std::string& key_text) {
    constexpr uint64_t fnv_offset = 14695981039346656037ULL;
    constexpr uint64_t fnv_prime  = 1099511628211ULL;

    uint64_t hash = fnv_offset;
    for (unsigned char byte : key_text) {
        hash ^= byte;
        hash *= fnv_prime;
    }
    return hash;
}

bool ResponseCache::expired(const CacheEntry& entry, uint64_t now) const {
    if (now < entry.created_ms) return false;
    return (now - entry.created_ms) > static_cast<uint64_t>(ttl_seconds_) * 1000;
}

std::optional<std::string> ResponseCache::get(const std::string& tool,
                                              const AssistantContext& context,
                                              const std::string& question) {
    std::string text = key_text(tool, context, question);
    uint64_t key = compute_key(text);
    uint64_t now = clock_();

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    if (it->second.key_text != text) return std::nullopt;

    if (expired(it->second, now)) {
        entries_.erase(it);
        return std::nullopt;
    }

    return it->second.response;
}

void ResponseCache::set(const std::string& tool,
                        const AssistantContext& context,
                        const std::string& question,
                        const std::string& response) {
    std::string text = key_text(tool, context, question);
    uint64_t key = compute_key(text);
    uint64_t now = clock_();

    std::lock_guard<std::mutex> lock(mutex_);

    entries_[key] = CacheEntry{std::move(text), response, now, next_sequence_++};

    if (entries_.size() > max_entries_) {
        evict_oldest_except(key);
    }
}

void ResponseCache::evict_oldest_except(uint64_t keep) {
    // Must be called with mutex_ already held.
    auto oldest = entries_.end();
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->first == keep) continue;
        if (oldest == entries_.end() ||
            it->second.created_ms < oldest->second.created_ms ||
            (it->second.created_ms == oldest->second.created_ms &&
             it->second.sequence < oldest->second.sequence)) {
            oldest = it;
        }
    }
    if (oldest != entries_.end()) {
        entries_.erase(oldest);
    }
}

uint32_t ResponseCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(entries_.size());
}

void ResponseCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

} // namespace vantage
