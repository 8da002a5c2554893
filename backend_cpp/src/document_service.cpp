#include "document_service.hpp"
#include "errors.hpp"
#include "session_store.hpp"
#include <algorithm>
#include <cctype>
#include <deque>
#include <fstream>
#include <sstream>
#include <spdlog/spdlog.h>

namespace doc_qa {

namespace {

const std::vector<std::string> kSeparators = {"\n\n", "\n", ". ", " ", ""};

std::string lower_extension(const std::string& filename) {
    std::string ext = fs::path(filename).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
    return ext;
}

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n\f\v");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n\f\v");
    return s.substr(begin, end - begin + 1);
}

// Splits on a separator; the empty separator splits into UTF-8 characters.
std::vector<std::string> split_on(const std::string& text, const std::string& separator) {
    std::vector<std::string> parts;
    if (separator.empty()) {
        size_t i = 0;
        while (i < text.size()) {
            size_t len = 1;
            while (i + len < text.size() && (static_cast<unsigned char>(text[i + len]) & 0xC0) == 0x80) ++len;
            parts.push_back(text.substr(i, len));
            i += len;
        }
        return parts;
    }

    size_t start = 0;
    while (true) {
        size_t pos = text.find(separator, start);
        std::string piece = text.substr(start, pos == std::string::npos ? std::string::npos : pos - start);
        if (!piece.empty()) parts.push_back(piece);
        if (pos == std::string::npos) break;
        start = pos + separator.size();
    }
    return parts;
}

std::string join(const std::deque<std::string>& parts, const std::string& separator) {
    std::string joined;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) joined += separator;
        joined += parts[i];
    }
    return joined;
}

} // namespace

// --- LOADER ---

bool TextDocumentLoader::supports(const std::string& filename) const {
    std::string ext = lower_extension(filename);
    return ext == ".txt" || ext == ".md";
}

std::vector<TextSegment> TextDocumentLoader::load(const fs::path& path, const std::string& source_id) {
    if (!supports(path.filename().string())) {
        throw UnsupportedDocument("Unsupported document type: " + path.extension().string());
    }

    std::ifstream f(path, std::ios::binary);
    if (!f) throw UnsupportedDocument("Cannot open document: " + path.string());
    std::stringstream buffer;
    buffer << f.rdbuf();
    std::string content = buffer.str();

    std::vector<TextSegment> segments;
    int page = 1;
    size_t start = 0;
    while (start <= content.size()) {
        size_t pos = content.find('\f', start);
        std::string page_text = content.substr(start, pos == std::string::npos ? std::string::npos : pos - start);
        if (!is_blank(page_text)) {
            segments.push_back({page_text, source_id, page});
        }
        if (pos == std::string::npos) break;
        start = pos + 1;
        ++page;
    }

    spdlog::info("Loaded {}: {} non-empty page(s)", source_id, segments.size());
    return segments;
}

// --- SCOPED UPLOAD ---

ScopedUpload::ScopedUpload(const fs::path& upload_dir, const std::string& filename, const std::string& bytes)
    : filename_(fs::path(filename).filename().string())
{
    fs::create_directories(upload_dir);
    std::string token = uuid4();
    token.erase(std::remove(token.begin(), token.end(), '-'), token.end());
    path_ = upload_dir / (token + "_" + filename_);

    std::ofstream out(path_, std::ios::binary);
    if (!out) throw std::runtime_error("Cannot write upload to " + path_.string());
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.close();
    if (!out) {
        std::error_code ec;
        fs::remove(path_, ec);
        throw std::runtime_error("Failed writing upload to " + path_.string());
    }
}

ScopedUpload::~ScopedUpload() {
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) spdlog::warn("Could not remove temporary upload {}: {}", path_.string(), ec.message());
}

// --- SPLITTER ---

TextSplitter::TextSplitter(size_t chunk_size, size_t chunk_overlap)
    : chunk_size_(chunk_size == 0 ? 1 : chunk_size),
      chunk_overlap_(std::min(chunk_overlap, chunk_size == 0 ? 0 : chunk_size - 1)) {}

std::vector<Chunk> TextSplitter::split(const std::vector<TextSegment>& segments) const {
    std::vector<Chunk> chunks;
    for (const auto& segment : segments) {
        for (auto& piece : split_text(segment.text)) {
            chunks.push_back({std::move(piece), segment.source_id, segment.page});
        }
    }
    return chunks;
}

std::vector<std::string> TextSplitter::split_text(const std::string& text) const {
    return split_recursive(text, 0);
}

std::vector<std::string> TextSplitter::split_recursive(const std::string& text, size_t separator_index) const {
    // Pick the first separator that occurs in the text.
    size_t chosen = kSeparators.size() - 1;
    for (size_t i = separator_index; i < kSeparators.size(); ++i) {
        if (kSeparators[i].empty() || text.find(kSeparators[i]) != std::string::npos) {
            chosen = i;
            break;
        }
    }
    const std::string& separator = kSeparators[chosen];

    std::vector<std::string> final_chunks;
    std::vector<std::string> good_splits;
    for (const auto& piece : split_on(text, separator)) {
        if (piece.size() < chunk_size_) {
            good_splits.push_back(piece);
            continue;
        }
        if (!good_splits.empty()) {
            auto merged = merge_splits(good_splits, separator);
            final_chunks.insert(final_chunks.end(), merged.begin(), merged.end());
            good_splits.clear();
        }
        if (chosen + 1 < kSeparators.size()) {
            auto deeper = split_recursive(piece, chosen + 1);
            final_chunks.insert(final_chunks.end(), deeper.begin(), deeper.end());
        } else {
            final_chunks.push_back(piece);
        }
    }
    if (!good_splits.empty()) {
        auto merged = merge_splits(good_splits, separator);
        final_chunks.insert(final_chunks.end(), merged.begin(), merged.end());
    }
    return final_chunks;
}

std::vector<std::string> TextSplitter::merge_splits(const std::vector<std::string>& splits,
                                                    const std::string& separator) const {
    std::vector<std::string> docs;
    std::deque<std::string> current;
    size_t total = 0;
    const size_t sep_len = separator.size();

    auto emit = [&]() {
        std::string doc = trim(join(current, separator));
        if (!doc.empty()) docs.push_back(doc);
    };

    for (const auto& piece : splits) {
        size_t added = piece.size() + (current.empty() ? 0 : sep_len);
        if (total + added > chunk_size_ && !current.empty()) {
            emit();
            // Drop from the front until only the overlap remains and the
            // next piece fits.
            while (!current.empty() &&
                   (total > chunk_overlap_ ||
                    total + piece.size() + (current.empty() ? 0 : sep_len) > chunk_size_)) {
                total -= current.front().size() + (current.size() > 1 ? sep_len : 0);
                current.pop_front();
            }
        }
        total += piece.size() + (current.empty() ? 0 : sep_len);
        current.push_back(piece);
    }
    if (!current.empty()) emit();
    return docs;
}

} // namespace doc_qa
