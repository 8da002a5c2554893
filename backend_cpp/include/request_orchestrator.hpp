#pragma once
#include "answer_validator.hpp"
#include "config.hpp"
#include "document_service.hpp"
#include "embedding_service.hpp"
#include "session_store.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace doc_qa {

enum class ResponseStatus {
    Ok,
    Unavailable   // embedding or generation backend failed
};

struct QaResponse {
    ResponseStatus status = ResponseStatus::Ok;
    std::string text;
    std::optional<std::string> error;
    std::optional<AnswerType> answer_type;
    std::optional<AnswerSource> source;
    std::vector<Chunk> context;
    bool generated = false;   // text came from the generation backend
};

struct UploadResponse {
    ResponseStatus status = ResponseStatus::Ok;
    std::string session_id;
    std::optional<std::string> error;
};

// Composes the store, planner, generation backend and validator for the
// ask / summarize / compare flows. Expired or unknown sessions produce
// friendly text, never exceptions.
class RequestOrchestrator {
public:
    RequestOrchestrator(std::shared_ptr<SessionStore> store,
                        std::shared_ptr<GenerationFunction> generator,
                        std::shared_ptr<DocumentLoader> loader,
                        ServiceConfig config);

    // Throws UnsupportedDocument or EmptyDocument for bad input.
    UploadResponse upload(const std::string& filename, const std::string& bytes);

    QaResponse ask(const std::string& question, const std::vector<std::string>& session_ids);
    QaResponse summarize(const std::vector<std::string>& session_ids);
    QaResponse compare(const std::vector<std::string>& session_ids);

    void delete_session(const std::string& session_id);

    const SessionStore& store() const { return *store_; }

private:
    std::shared_ptr<SessionStore> store_;
    std::shared_ptr<GenerationFunction> generator_;
    std::shared_ptr<DocumentLoader> loader_;
    TextSplitter splitter_;
    ServiceConfig config_;

    void sweep();

    // Searches every index concurrently; returns once all searches are done.
    std::vector<Chunk> fan_out_search(const std::vector<IndexHandle>& indices, const std::string& query, int k) const;

    // Fills text on success or marks the response unavailable.
    bool generate_into(QaResponse& response, const std::string& prompt, int max_tokens);

    void record(const std::string& endpoint, const std::vector<std::string>& session_ids,
                const std::string& question, const QaResponse& response, double duration_ms) const;
};

} // namespace doc_qa
