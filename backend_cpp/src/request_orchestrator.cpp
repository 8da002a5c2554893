#include "request_orchestrator.hpp"
#include "LogManager.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <ctime>
#include <future>
#include <unordered_set>

namespace doc_qa {

namespace {

constexpr size_t kMaxContextChars = 12000;

std::vector<IndexHandle> flatten(const std::map<std::string, std::vector<IndexHandle>>& resolved,
                                 const std::vector<std::string>& order) {
    std::vector<IndexHandle> indices;
    std::unordered_set<std::string> seen;
    for (const auto& sid : order) {
        if (!seen.insert(sid).second) continue;
        auto it = resolved.find(sid);
        if (it == resolved.end()) continue;
        indices.insert(indices.end(), it->second.begin(), it->second.end());
    }
    return indices;
}

double elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

QaResponse unavailable(const std::string& error) {
    QaResponse r;
    r.status = ResponseStatus::Unavailable;
    r.error = error;
    return r;
}

} // namespace

RequestOrchestrator::RequestOrchestrator(std::shared_ptr<SessionStore> store,
                                         std::shared_ptr<GenerationFunction> generator,
                                         std::shared_ptr<DocumentLoader> loader,
                                         ServiceConfig config)
    : store_(std::move(store)),
      generator_(std::move(generator)),
      loader_(std::move(loader)),
      splitter_(config.chunk_size, config.chunk_overlap),
      config_(std::move(config)) {}

void RequestOrchestrator::sweep() {
    store_->sweep_expired(std::chrono::seconds(config_.session_timeout_seconds));
}

UploadResponse RequestOrchestrator::upload(const std::string& filename, const std::string& bytes) {
    sweep();

    std::string basename = fs::path(filename).filename().string();
    if (!loader_->supports(basename)) {
        throw UnsupportedDocument("Unsupported document type: " + basename);
    }

    ScopedUpload temp(config_.upload_dir, basename, bytes);
    auto segments = loader_->load(temp.path(), basename);
    auto chunks = splitter_.split(segments);
    if (chunks.empty()) {
        throw EmptyDocument("No text could be extracted from " + basename);
    }

    UploadResponse response;
    try {
        response.session_id = store_->create_session(std::move(chunks), basename);
    } catch (const IndexBuildFailed& e) {
        spdlog::error("Index build failed for {}: {}", basename, e.what());
        response.status = ResponseStatus::Unavailable;
        response.error = "Embedding service unavailable";
    }
    return response;
}

std::vector<Chunk> RequestOrchestrator::fan_out_search(const std::vector<IndexHandle>& indices,
                                                       const std::string& query, int k) const {
    std::vector<std::future<std::vector<Chunk>>> pending;
    pending.reserve(indices.size());
    for (const auto& index : indices) {
        pending.push_back(std::async(std::launch::async, [index, &query, k]() {
            return index->search(query, k);
        }));
    }

    // Wait for every search before surfacing the first failure, so no task
    // outlives the query it references.
    for (auto& f : pending) f.wait();

    std::vector<Chunk> candidates;
    for (auto& f : pending) {
        auto found = f.get();
        candidates.insert(candidates.end(), found.begin(), found.end());
    }
    return candidates;
}

bool RequestOrchestrator::generate_into(QaResponse& response, const std::string& prompt, int max_tokens) {
    try {
        auto start = std::chrono::steady_clock::now();
        response.text = generator_->generate(prompt, max_tokens);
        response.generated = true;
        spdlog::debug("Generation took {:.2f} ms", elapsed_ms(start));
        return true;
    } catch (const ModelUnavailable& e) {
        spdlog::warn("Generation unavailable: {}", e.what());
        response.status = ResponseStatus::Unavailable;
        response.error = e.what();
        return false;
    }
}

QaResponse RequestOrchestrator::ask(const std::string& question, const std::vector<std::string>& session_ids) {
    auto start = std::chrono::steady_clock::now();
    sweep();

    QaResponse response;
    if (session_ids.empty()) {
        response.text = "No session selected.";
        record("ask", session_ids, question, response, elapsed_ms(start));
        return response;
    }

    auto indices = flatten(store_->resolve_indices(session_ids), session_ids);
    if (indices.empty()) {
        response.text = "No documents found for selected sessions.";
        record("ask", session_ids, question, response, elapsed_ms(start));
        return response;
    }

    AnswerType type = QueryPlanner::classify_answer_type(question);
    std::string hint = QueryPlanner::answer_type_hint(question);
    spdlog::info("Ask: type={}{}{} across {} index(es)", to_string(type),
                 hint.empty() ? "" : ", expecting ", hint, indices.size());

    std::vector<Chunk> candidates;
    try {
        candidates = fan_out_search(indices, QueryPlanner::expand_query(question), config_.ask_top_k);
    } catch (const IndexBuildFailed& e) {
        spdlog::error("Retrieval failed: {}", e.what());
        response = unavailable("Retrieval unavailable");
        record("ask", session_ids, question, response, elapsed_ms(start));
        return response;
    }

    if (candidates.empty()) {
        response.text = "No relevant context found.";
        record("ask", session_ids, question, response, elapsed_ms(start));
        return response;
    }

    response.context = QueryPlanner::rerank(std::move(candidates), question, config_.ask_top_k);
    std::string context = utf8_safe_substr(join_chunk_texts(response.context, "\n\n"), kMaxContextChars);
    std::string prompt =
        "Answer the question using ONLY the provided context.\n\n"
        "Context:\n" + context + "\n\n"
        "Question: " + question + "\nAnswer:";

    if (generate_into(response, prompt, config_.max_new_tokens_ask)) {
        auto result = AnswerValidator::reconcile_as(type, response.text, question, context);
        if (result.source != AnswerSource::Verbatim) {
            spdlog::info("Answer replaced ({}): '{}' -> '{}'", to_string(result.source), response.text, result.text);
        }
        response.text = result.text;
        response.source = result.source;
        response.answer_type = type;
    }

    record("ask", session_ids, question, response, elapsed_ms(start));
    return response;
}

QaResponse RequestOrchestrator::summarize(const std::vector<std::string>& session_ids) {
    auto start = std::chrono::steady_clock::now();
    sweep();

    QaResponse response;
    if (session_ids.empty()) {
        response.text = "No session selected.";
        record("summarize", session_ids, "", response, elapsed_ms(start));
        return response;
    }

    auto indices = flatten(store_->resolve_indices(session_ids), session_ids);
    if (indices.empty()) {
        response.text = "No documents found.";
        record("summarize", session_ids, "", response, elapsed_ms(start));
        return response;
    }

    try {
        response.context = fan_out_search(indices, "Summarize the document", config_.summarize_top_k);
    } catch (const IndexBuildFailed& e) {
        spdlog::error("Retrieval failed: {}", e.what());
        response = unavailable("Retrieval unavailable");
        record("summarize", session_ids, "", response, elapsed_ms(start));
        return response;
    }

    std::string context = utf8_safe_substr(join_chunk_texts(response.context, "\n\n"), kMaxContextChars);
    std::string prompt = "Summarize this document:\n\n" + context + "\n\nSummary:";
    generate_into(response, prompt, config_.max_new_tokens_summarize);

    record("summarize", session_ids, "", response, elapsed_ms(start));
    return response;
}

QaResponse RequestOrchestrator::compare(const std::vector<std::string>& session_ids) {
    auto start = std::chrono::steady_clock::now();
    sweep();

    QaResponse response;
    if (session_ids.size() < 2) {
        response.text = "Select at least 2 documents.";
        record("compare", session_ids, "", response, elapsed_ms(start));
        return response;
    }

    std::vector<std::string> contexts;
    try {
        contexts = store_->context_per_session(session_ids, "main topics", config_.compare_top_k);
    } catch (const IndexBuildFailed& e) {
        spdlog::error("Retrieval failed: {}", e.what());
        response = unavailable("Retrieval unavailable");
        record("compare", session_ids, "", response, elapsed_ms(start));
        return response;
    }

    if (contexts.size() < 2) {
        response.text = "Not enough documents to compare.";
        record("compare", session_ids, "", response, elapsed_ms(start));
        return response;
    }

    std::string combined;
    for (size_t i = 0; i < contexts.size(); ++i) {
        if (i > 0) combined += "\n\n---\n\n";
        combined += contexts[i];
    }
    combined = utf8_safe_substr(combined, kMaxContextChars);

    std::string prompt =
        "Compare the documents below.\n"
        "Give similarities and differences.\n\n" + combined + "\n\nComparison:";
    generate_into(response, prompt, config_.max_new_tokens_compare);

    record("compare", session_ids, "", response, elapsed_ms(start));
    return response;
}

void RequestOrchestrator::delete_session(const std::string& session_id) {
    store_->delete_session(session_id);
}

void RequestOrchestrator::record(const std::string& endpoint, const std::vector<std::string>& session_ids,
                                 const std::string& question, const QaResponse& response,
                                 double duration_ms) const {
    std::string source;
    if (response.status == ResponseStatus::Unavailable) source = "unavailable";
    else if (response.source) source = to_string(*response.source);
    else if (response.generated) source = "generated";
    else source = "no_context";

    std::vector<std::string> safe_ids;
    for (const auto& sid : session_ids) safe_ids.push_back(sanitize_utf8(sid));

    LogManager::instance().add_log({
        static_cast<long long>(std::time(nullptr)), endpoint, safe_ids,
        sanitize_utf8(question), sanitize_utf8(response.text), source, duration_ms
    });
    spdlog::info("{} finished in {:.2f} ms ({})", endpoint, duration_ms, source);
}

} // namespace doc_qa
