#pragma once

#include "chunk.hpp"
#include "embedding_service.hpp"
#include <memory>
#include <string>
#include <vector>

// Forward declare FAISS Index
namespace faiss { struct Index; }

namespace doc_qa {

struct ScoredChunk {
    Chunk chunk;
    float score;
    size_t position; // insertion order within the index
};

// Nearest-neighbour search over one upload's chunks. The chunk set is fixed
// at construction; a new upload builds a new index.
class RetrievalIndex {
public:
    // Embeds every chunk. Throws EmptyDocument for an empty list and
    // IndexBuildFailed if any embedding fails (no partial index).
    RetrievalIndex(std::vector<Chunk> chunks, std::shared_ptr<EmbeddingFunction> embedder);
    ~RetrievalIndex();

    RetrievalIndex(const RetrievalIndex&) = delete;
    RetrievalIndex& operator=(const RetrievalIndex&) = delete;

    // At most k chunks by descending cosine similarity, ties in insertion
    // order. k <= 0 yields an empty list.
    std::vector<Chunk> search(const std::string& query, int k) const;
    std::vector<ScoredChunk> search_scored(const std::string& query, int k) const;

    size_t size() const { return chunks_.size(); }
    const std::vector<Chunk>& chunks() const { return chunks_; }

private:
    int dimension_;
    std::unique_ptr<faiss::Index> index_;
    const std::vector<Chunk> chunks_;
    std::shared_ptr<EmbeddingFunction> embedder_;
};

} // namespace doc_qa
