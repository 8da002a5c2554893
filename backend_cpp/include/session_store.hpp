#pragma once

#include "chunk.hpp"
#include "retrieval_index.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace doc_qa {

using IndexHandle = std::shared_ptr<const RetrievalIndex>;

// Random RFC 4122 version 4 identifier.
std::string uuid4();

struct Session {
    std::string id;
    std::vector<IndexHandle> indices;
    std::chrono::steady_clock::time_point last_accessed;
    std::optional<std::string> label;
};

// Owns every session and its indices behind one mutex. The mutex is held
// only while the map is touched: callers get handle snapshots and search
// after the lock is released, so a concurrent sweep can drop a session
// without invalidating an index another request is still reading.
class SessionStore {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    explicit SessionStore(std::shared_ptr<EmbeddingFunction> embedder, ClockFn clock = &Clock::now);

    // Builds the index outside the lock, then publishes the session in one
    // step. Throws EmptyDocument or IndexBuildFailed.
    std::string create_session(std::vector<Chunk> chunks, std::optional<std::string> label = std::nullopt);

    // Unknown ids are omitted. Refreshes last_accessed of every hit.
    std::map<std::string, std::vector<IndexHandle>> resolve_indices(const std::vector<std::string>& session_ids);

    // One joined context per distinct resolvable session, searched on its first
    // index. Repeated ids count once.
    std::vector<std::string> context_per_session(const std::vector<std::string>& session_ids,
                                                 const std::string& query, int k);

    size_t sweep_expired(Clock::time_point now, std::chrono::seconds timeout);
    size_t sweep_expired(std::chrono::seconds timeout) { return sweep_expired(clock_(), timeout); }

    void delete_session(const std::string& session_id);

    size_t size() const;

private:
    std::shared_ptr<EmbeddingFunction> embedder_;
    ClockFn clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Session> sessions_;
};

} // namespace doc_qa
