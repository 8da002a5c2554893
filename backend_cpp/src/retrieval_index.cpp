#include "retrieval_index.hpp"
#include "errors.hpp"
#include <faiss/IndexFlat.h>
#include <faiss/utils/distances.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>

namespace doc_qa {

namespace {

std::vector<Chunk> require_chunks(std::vector<Chunk> chunks) {
    if (chunks.empty()) throw EmptyDocument("Cannot build an index from an empty chunk list");
    return chunks;
}

} // namespace

RetrievalIndex::RetrievalIndex(std::vector<Chunk> chunks, std::shared_ptr<EmbeddingFunction> embedder)
    : dimension_(embedder->dimension()),
      chunks_(require_chunks(std::move(chunks))),
      embedder_(std::move(embedder))
{
    auto start = std::chrono::steady_clock::now();

    std::vector<float> vectors_flat;
    vectors_flat.reserve(chunks_.size() * static_cast<size_t>(dimension_));

    for (size_t i = 0; i < chunks_.size(); ++i) {
        std::vector<float> embedding;
        try {
            embedding = embedder_->embed(chunks_[i].text);
        } catch (const std::exception& e) {
            spdlog::error("Embedding failed for chunk {}/{}: {}", i + 1, chunks_.size(), e.what());
            throw IndexBuildFailed(std::string("Embedding failed: ") + e.what());
        }
        if (embedding.size() != static_cast<size_t>(dimension_)) {
            throw IndexBuildFailed("Embedding dimension mismatch: expected " + std::to_string(dimension_) +
                                   ", got " + std::to_string(embedding.size()));
        }
        vectors_flat.insert(vectors_flat.end(), embedding.begin(), embedding.end());
    }

    // Inner product over L2-normalised vectors is cosine similarity.
    auto n = static_cast<faiss::idx_t>(chunks_.size());
    faiss::fvec_renorm_L2(dimension_, n, vectors_flat.data());
    index_ = std::make_unique<faiss::IndexFlatIP>(dimension_);
    index_->add(n, vectors_flat.data());

    double duration = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    spdlog::info("Built retrieval index: {} chunks in {:.2f} ms", index_->ntotal, duration);
}

RetrievalIndex::~RetrievalIndex() {
}

std::vector<ScoredChunk> RetrievalIndex::search_scored(const std::string& query, int k) const {
    if (k <= 0 || index_->ntotal == 0) return {};

    std::vector<float> query_vector;
    try {
        query_vector = embedder_->embed(query);
    } catch (const std::exception& e) {
        throw IndexBuildFailed(std::string("Query embedding failed: ") + e.what());
    }
    if (query_vector.size() != static_cast<size_t>(dimension_)) {
        throw IndexBuildFailed("Query embedding has the wrong dimension");
    }
    faiss::fvec_renorm_L2(dimension_, 1, query_vector.data());

    faiss::idx_t want = std::min<faiss::idx_t>(k, index_->ntotal);
    std::vector<float> scores(want);
    std::vector<faiss::idx_t> ids(want);
    index_->search(1, query_vector.data(), want, scores.data(), ids.data());

    std::vector<ScoredChunk> results;
    results.reserve(want);
    for (faiss::idx_t i = 0; i < want; ++i) {
        if (ids[i] < 0) continue;
        auto pos = static_cast<size_t>(ids[i]);
        results.push_back({chunks_[pos], scores[i], pos});
    }

    std::sort(results.begin(), results.end(), [](const ScoredChunk& a, const ScoredChunk& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.position < b.position;
    });
    return results;
}

std::vector<Chunk> RetrievalIndex::search(const std::string& query, int k) const {
    std::vector<Chunk> chunks;
    for (auto& scored : search_scored(query, k)) {
        chunks.push_back(std::move(scored.chunk));
    }
    return chunks;
}

} // namespace doc_qa
