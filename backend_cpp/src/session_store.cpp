#include "session_store.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <cstdio>
#include <random>
#include <unordered_set>

namespace doc_qa {

std::string uuid4() {
    thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dis;
    uint64_t hi = dis(gen);
    uint64_t lo = dis(gen);

    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL; // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL; // variant 10

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return std::string(buf);
}

SessionStore::SessionStore(std::shared_ptr<EmbeddingFunction> embedder, ClockFn clock)
    : embedder_(std::move(embedder)), clock_(std::move(clock)) {}

std::string SessionStore::create_session(std::vector<Chunk> chunks, std::optional<std::string> label) {
    if (chunks.empty()) throw EmptyDocument("Document produced no text chunks");

    size_t chunk_count = chunks.size();
    // Embedding can take seconds; never under the lock.
    auto index = std::make_shared<const RetrievalIndex>(std::move(chunks), embedder_);

    std::string session_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        do {
            session_id = uuid4();
        } while (sessions_.count(session_id));

        Session session;
        session.id = session_id;
        session.indices.push_back(std::move(index));
        session.last_accessed = clock_();
        session.label = std::move(label);
        sessions_.emplace(session_id, std::move(session));
    }

    spdlog::info("Session created: {} ({} chunks)", session_id, chunk_count);
    return session_id;
}

std::map<std::string, std::vector<IndexHandle>>
SessionStore::resolve_indices(const std::vector<std::string>& session_ids) {
    std::map<std::string, std::vector<IndexHandle>> resolved;
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_();
    for (const auto& sid : session_ids) {
        auto it = sessions_.find(sid);
        if (it == sessions_.end()) continue;
        it->second.last_accessed = now;
        resolved[sid] = it->second.indices;
    }
    return resolved;
}

std::vector<std::string> SessionStore::context_per_session(const std::vector<std::string>& session_ids,
                                                           const std::string& query, int k) {
    std::vector<IndexHandle> stores;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = clock_();
        std::unordered_set<std::string> seen;
        for (const auto& sid : session_ids) {
            if (!seen.insert(sid).second) continue;
            auto it = sessions_.find(sid);
            if (it == sessions_.end()) continue;
            it->second.last_accessed = now;
            stores.push_back(it->second.indices.front());
        }
    }

    std::vector<std::string> contexts;
    contexts.reserve(stores.size());
    for (const auto& index : stores) {
        contexts.push_back(join_chunk_texts(index->search(query, k), "\n"));
    }
    return contexts;
}

size_t SessionStore::sweep_expired(Clock::time_point now, std::chrono::seconds timeout) {
    size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (now - it->second.last_accessed > timeout) {
                it = sessions_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    if (removed > 0) {
        spdlog::info("Cleaned up {} expired session(s)", removed);
    }
    return removed;
}

void SessionStore::delete_session(const std::string& session_id) {
    bool erased = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        erased = sessions_.erase(session_id) > 0;
    }
    if (erased) spdlog::info("Session deleted: {}", session_id);
}

size_t SessionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

} // namespace doc_qa
