#include "chunk.hpp"

namespace doc_qa {

using json = nlohmann::json;

// Replaces bytes that do not form a valid UTF-8 sequence with '?', so the
// text can always be serialised by nlohmann::json.
std::string sanitize_utf8(const std::string& str) {
    std::string safe_str;
    safe_str.reserve(str.size());
    size_t i = 0;
    while (i < str.size()) {
        unsigned char c = static_cast<unsigned char>(str[i]);
        size_t len = 0;
        if (c < 0x80) len = 1;
        else if ((c & 0xE0) == 0xC0) len = 2;
        else if ((c & 0xF0) == 0xE0) len = 3;
        else if ((c & 0xF8) == 0xF0) len = 4;

        bool valid = len > 0 && i + len <= str.size();
        for (size_t k = 1; valid && k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(str[i + k]);
            if ((cc & 0xC0) != 0x80) valid = false;
        }

        if (valid) {
            safe_str.append(str, i, len);
            i += len;
        } else {
            safe_str += '?';
            ++i;
        }
    }
    return safe_str;
}

json Chunk::to_json() const {
    json j = {
        {"text", sanitize_utf8(text)},
        {"source_id", sanitize_utf8(source_id)}
    };
    if (page) j["page"] = *page;
    else j["page"] = nullptr;
    return j;
}

std::string join_chunk_texts(const std::vector<Chunk>& chunks, const std::string& separator) {
    std::string joined;
    for (size_t i = 0; i < chunks.size(); ++i) {
        if (i > 0) joined += separator;
        joined += chunks[i].text;
    }
    return joined;
}

} // namespace doc_qa
