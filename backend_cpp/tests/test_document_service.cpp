#include <gtest/gtest.h>

#include "document_service.hpp"
#include "errors.hpp"
#include "session_store.hpp"

#include <fstream>
#include <sstream>

using doc_qa::ScopedUpload;
using doc_qa::TextDocumentLoader;
using doc_qa::TextSegment;
using doc_qa::TextSplitter;
namespace fs = std::filesystem;

namespace {

class TempDir {
public:
    TempDir() : path_(fs::temp_directory_path() / ("doc_qa_test_" + doc_qa::uuid4())) {
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

void write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // namespace

TEST(TextSplitterTest, ShortTextIsOneTrimmedChunk) {
    TextSplitter splitter(1000, 100);
    auto chunks = splitter.split_text("  hello world  ");
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0], "hello world");
}

TEST(TextSplitterTest, WordsAreMergedWithOverlap) {
    TextSplitter splitter(20, 5);
    auto chunks = splitter.split_text("aaaa bbbb cccc dddd eeee ffff gggg");
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0], "aaaa bbbb cccc dddd");
    EXPECT_EQ(chunks[1], "dddd eeee ffff gggg");
}

TEST(TextSplitterTest, ParagraphsSplitFirst) {
    TextSplitter splitter(20, 5);
    auto chunks = splitter.split_text("First paragraph.\n\nSecond paragraph.");
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0], "First paragraph.");
    EXPECT_EQ(chunks[1], "Second paragraph.");
}

TEST(TextSplitterTest, FallsBackToCharacters) {
    TextSplitter splitter(4, 0);
    auto chunks = splitter.split_text("abcdefghij");
    EXPECT_EQ(chunks, (std::vector<std::string>{"abcd", "efgh", "ij"}));
}

TEST(TextSplitterTest, NeverSplitsInsideUtf8Sequence) {
    TextSplitter splitter(4, 0);
    auto chunks = splitter.split_text("\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9");
    EXPECT_EQ(chunks, (std::vector<std::string>{"\xC3\xA9\xC3\xA9", "\xC3\xA9\xC3\xA9", "\xC3\xA9"}));
}

TEST(TextSplitterTest, ChunksRespectSizeAndAreDeterministic) {
    std::string text;
    for (int i = 0; i < 200; ++i) {
        text += "Sentence number " + std::to_string(i) + " talks about sorting. ";
        if (i % 10 == 9) text += "\n\n";
    }
    TextSplitter splitter(120, 20);
    auto first = splitter.split_text(text);
    auto second = splitter.split_text(text);
    EXPECT_EQ(first, second);
    ASSERT_GT(first.size(), 1u);
    for (const auto& chunk : first) {
        EXPECT_FALSE(chunk.empty());
        EXPECT_LE(chunk.size(), 120u);
    }
}

TEST(TextSplitterTest, ChunksCarryPageMetadata) {
    TextSplitter splitter(100, 10);
    std::vector<TextSegment> segments = {
        {"page one text", "report.txt", 1},
        {"page two text", "report.txt", 2},
    };
    auto chunks = splitter.split(segments);
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].text, "page one text");
    EXPECT_EQ(chunks[0].page, 1);
    EXPECT_EQ(chunks[1].page, 2);
    EXPECT_EQ(chunks[1].source_id, "report.txt");
}

TEST(TextDocumentLoaderTest, SupportsTextFormatsOnly) {
    TextDocumentLoader loader;
    EXPECT_TRUE(loader.supports("notes.txt"));
    EXPECT_TRUE(loader.supports("README.MD"));
    EXPECT_FALSE(loader.supports("scan.pdf"));
    EXPECT_FALSE(loader.supports("noextension"));
}

TEST(TextDocumentLoaderTest, FormFeedsSeparatePagesAndBlankPagesAreDropped) {
    TempDir dir;
    auto path = dir.path() / "doc.txt";
    write_file(path, "Page one\fPage two\f   \fPage four");

    TextDocumentLoader loader;
    auto segments = loader.load(path, "doc.txt");
    ASSERT_EQ(segments.size(), 3u);
    EXPECT_EQ(segments[0].text, "Page one");
    EXPECT_EQ(segments[0].page, 1);
    EXPECT_EQ(segments[1].page, 2);
    EXPECT_EQ(segments[2].text, "Page four");
    EXPECT_EQ(segments[2].page, 4);
}

TEST(TextDocumentLoaderTest, BlankFileYieldsNoSegments) {
    TempDir dir;
    auto path = dir.path() / "blank.txt";
    write_file(path, " \n\t ");
    EXPECT_TRUE(TextDocumentLoader().load(path, "blank.txt").empty());
}

TEST(TextDocumentLoaderTest, UnsupportedExtensionThrows) {
    TempDir dir;
    auto path = dir.path() / "scan.pdf";
    write_file(path, "%PDF-1.4");
    EXPECT_THROW(TextDocumentLoader().load(path, "scan.pdf"), doc_qa::UnsupportedDocument);
}

TEST(ScopedUploadTest, FileExistsOnlyWhileInScope) {
    TempDir dir;
    fs::path written;
    {
        ScopedUpload upload(dir.path() / "uploads", "notes.txt", "some bytes");
        written = upload.path();
        ASSERT_TRUE(fs::exists(written));
        EXPECT_EQ(read_file(written), "some bytes");
        EXPECT_EQ(upload.filename(), "notes.txt");
    }
    EXPECT_FALSE(fs::exists(written));
}

TEST(ScopedUploadTest, DirectoryComponentsAreStripped) {
    TempDir dir;
    ScopedUpload upload(dir.path(), "../../escape.txt", "x");
    EXPECT_EQ(upload.filename(), "escape.txt");
    EXPECT_EQ(upload.path().parent_path(), dir.path());
}

TEST(ScopedUploadTest, FileIsRemovedWhenProcessingThrows) {
    TempDir dir;
    fs::path written;
    try {
        ScopedUpload upload(dir.path(), "notes.txt", "bytes");
        written = upload.path();
        throw std::runtime_error("processing failed");
    } catch (const std::runtime_error&) {
    }
    EXPECT_FALSE(written.empty());
    EXPECT_FALSE(fs::exists(written));
}
