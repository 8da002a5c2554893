#pragma once
#include "chunk.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace doc_qa {

namespace fs = std::filesystem;

struct TextSegment {
    std::string text;
    std::string source_id;
    std::optional<int> page;
};

class DocumentLoader {
public:
    virtual ~DocumentLoader() = default;
    // Non-empty text segments. Throws UnsupportedDocument for unreadable formats.
    virtual std::vector<TextSegment> load(const fs::path& path, const std::string& source_id) = 0;
    virtual bool supports(const std::string& filename) const = 0;
};

// Plain text and markdown. Form feeds separate pages.
class TextDocumentLoader : public DocumentLoader {
public:
    std::vector<TextSegment> load(const fs::path& path, const std::string& source_id) override;
    bool supports(const std::string& filename) const override;
};

// Owns a temporary copy of an uploaded file; the file is removed when the
// object goes out of scope, whatever the exit path.
class ScopedUpload {
public:
    ScopedUpload(const fs::path& upload_dir, const std::string& filename, const std::string& bytes);
    ~ScopedUpload();

    ScopedUpload(const ScopedUpload&) = delete;
    ScopedUpload& operator=(const ScopedUpload&) = delete;

    const fs::path& path() const { return path_; }
    const std::string& filename() const { return filename_; }

private:
    fs::path path_;
    std::string filename_;
};

// Recursive character splitter: tries paragraph, line, sentence, word and
// finally character boundaries, then merges pieces up to chunk_size with
// up to chunk_overlap characters repeated between neighbours.
class TextSplitter {
public:
    TextSplitter(size_t chunk_size = 1000, size_t chunk_overlap = 100);

    std::vector<Chunk> split(const std::vector<TextSegment>& segments) const;
    std::vector<std::string> split_text(const std::string& text) const;

private:
    size_t chunk_size_;
    size_t chunk_overlap_;

    std::vector<std::string> split_recursive(const std::string& text, size_t separator_index) const;
    std::vector<std::string> merge_splits(const std::vector<std::string>& splits, const std::string& separator) const;
};

} // namespace doc_qa
