#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace doc_qa {

// Smallest retrievable unit of document text. Produced by the splitter,
// never modified afterwards.
struct Chunk {
    std::string text;
    std::string source_id;
    std::optional<int> page;

    nlohmann::json to_json() const;
};

std::string sanitize_utf8(const std::string& str);

// Joins chunk texts with the given separator, in order.
std::string join_chunk_texts(const std::vector<Chunk>& chunks, const std::string& separator);

} // namespace doc_qa
