#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <unistd.h>

#include "revive/history/index_loader.hpp"
#include "revive/io/file_io.hpp"

using namespace revive::history;
using revive::core::is_ok;
using revive::core::StatusCode;
using revive::core::TrackedFile;
using revive::paths::PathConvention;
namespace fs = std::filesystem;

// ============================================================================
// Record Parsing
// ============================================================================

TEST(ParseRecord, ReadsResourceAndEntries) {
    const std::string text = R"({
        "version": 1,
        "resource": "file:///home/u/proj/src/a.py",
        "entries": [
            {"id": "AbC1.py", "timestamp": 1700000000000},
            {"id": "XyZ2.py", "timestamp": 1700000100000, "source": "undoRedo.source"}
        ]
    })";
    TrackedFile file;
    std::string error;
    ASSERT_EQ(parse_record(text, "/h/abc", PathConvention::Posix, &file, &error), RecordParseResult::Ok);
    EXPECT_EQ(file.resource, fs::path("/home/u/proj/src/a.py"));
    EXPECT_EQ(file.record_dir, fs::path("/h/abc"));
    ASSERT_EQ(file.entries.size(), 2u);
    EXPECT_EQ(file.entries[0].blob_id, "AbC1.py");
    EXPECT_TRUE(file.entries[0].has_timestamp);
    EXPECT_EQ(file.entries[1].timestamp, 1700000100000);
}

TEST(ParseRecord, NonIntegerTimestampsAreUntimed) {
    const std::string text = R"({"resource": "file:///p/a", "entries": [
        {"id": "a", "timestamp": "1700000000000"},
        {"id": "b", "timestamp": 1.5},
        {"id": "c"},
        "not-an-object",
        {"timestamp": 5}
    ]})";
    TrackedFile file;
    std::string error;
    ASSERT_EQ(parse_record(text, "/h", PathConvention::Posix, &file, &error), RecordParseResult::Ok);
    ASSERT_EQ(file.entries.size(), 5u);
    for (size_t i = 0; i < 4; ++i) {
        EXPECT_FALSE(file.entries[i].has_timestamp) << i;
    }
    EXPECT_TRUE(file.entries[4].has_timestamp);
    EXPECT_TRUE(file.entries[4].blob_id.empty());
}

TEST(ParseRecord, SkipsUnusableRecords) {
    TrackedFile file;
    std::string error;
    EXPECT_EQ(parse_record("[1,2]", "/h", PathConvention::Posix, &file, &error), RecordParseResult::Skip);
    EXPECT_EQ(parse_record(R"({"entries": [{"id":"a"}]})", "/h", PathConvention::Posix, &file, &error),
        RecordParseResult::Skip);
    EXPECT_EQ(parse_record(R"({"resource": "file:///a"})", "/h", PathConvention::Posix, &file, &error),
        RecordParseResult::Skip);
    EXPECT_EQ(parse_record(R"({"resource": "file:///a", "entries": []})", "/h", PathConvention::Posix, &file, &error),
        RecordParseResult::Skip);
    EXPECT_EQ(parse_record(R"({"resource": "file:///a", "entries": {}})", "/h", PathConvention::Posix, &file, &error),
        RecordParseResult::Skip);
}

TEST(ParseRecord, MalformedRecordsReportError) {
    TrackedFile file;
    std::string error;
    EXPECT_EQ(parse_record("{not json", "/h", PathConvention::Posix, &file, &error), RecordParseResult::Malformed);
    EXPECT_FALSE(error.empty());

    error.clear();
    EXPECT_EQ(parse_record(R"({"resource": 7, "entries": [{}]})", "/h", PathConvention::Posix, &file, &error),
        RecordParseResult::Malformed);
    EXPECT_FALSE(error.empty());

    error.clear();
    EXPECT_EQ(parse_record(R"({"resource": "file://hostonly", "entries": [{}]})", "/h", PathConvention::Posix, &file,
                  &error),
        RecordParseResult::Malformed);
    EXPECT_FALSE(error.empty());
}

// ============================================================================
// Loading From Disk
// ============================================================================

class IndexLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() / ("revive_index_loader_test_" + std::to_string(::getpid()));
        std::error_code ec;
        fs::remove_all(root_, ec);
        fs::create_directories(root_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void put(const fs::path& rel, const std::string& data) {
        const fs::path p = root_ / rel;
        ASSERT_TRUE(is_ok(revive::io::ensure_directory(p.parent_path())));
        ASSERT_TRUE(is_ok(revive::io::write_file(p, data)));
    }

    fs::path root_;
};

TEST_F(IndexLoaderTest, FindsRecordsAtAnyDepth) {
    put("h1/entries.json", R"({"resource": "file:///p/a.txt", "entries": [{"id": "x", "timestamp": 1}]})");
    put("nested/deeper/h2/entries.json", R"({"resource": "file:///p/b.txt", "entries": [{"id": "y", "timestamp": 2}]})");
    put("h3/other.json", R"({"resource": "file:///p/c.txt", "entries": [{"id": "z", "timestamp": 3}]})");

    LoadResult r;
    ASSERT_TRUE(is_ok(load_all(root_, &r)));
    EXPECT_EQ(r.records_seen, 2u);
    ASSERT_EQ(r.files.size(), 2u);
    EXPECT_TRUE(r.issues.empty());

    std::vector<std::string> names;
    for (const TrackedFile& f : r.files) {
        names.push_back(f.resource.filename().string());
        EXPECT_EQ(f.record_dir.parent_path().filename() == "deeper", f.resource.filename() == "b.txt");
    }
    std::sort(names.begin(), names.end());
    EXPECT_EQ(names[0], "a.txt");
    EXPECT_EQ(names[1], "b.txt");
}

TEST_F(IndexLoaderTest, MalformedRecordsBecomeIssues) {
    put("good/entries.json", R"({"resource": "file:///p/a.txt", "entries": [{"id": "x", "timestamp": 1}]})");
    put("bad/entries.json", "{ definitely not json");
    put("skip/entries.json", R"({"resource": "file:///p/c.txt", "entries": []})");

    LoadResult r;
    ASSERT_TRUE(is_ok(load_all(root_, &r)));
    EXPECT_EQ(r.records_seen, 3u);
    EXPECT_EQ(r.files.size(), 1u);
    ASSERT_EQ(r.issues.size(), 1u);
    EXPECT_EQ(r.issues[0].record.parent_path().filename(), fs::path("bad"));
}

TEST_F(IndexLoaderTest, MissingRootIsNotFound) {
    LoadResult r;
    EXPECT_EQ(load_all(root_ / "absent", &r).code, StatusCode::NotFound);
    EXPECT_EQ(load_all(root_, nullptr).code, StatusCode::Invalid);
}

TEST_F(IndexLoaderTest, EmptyRootLoadsNothing) {
    LoadResult r;
    ASSERT_TRUE(is_ok(load_all(root_, &r)));
    EXPECT_TRUE(r.files.empty());
    EXPECT_EQ(r.records_seen, 0u);
}

// ============================================================================
// Blob Resolution
// ============================================================================

TEST_F(IndexLoaderTest, BlobBesideRecord) {
    put("h/AbC1.py", "content");
    TrackedFile file;
    file.record_dir = root_ / "h";
    fs::path blob;
    ASSERT_TRUE(is_ok(resolve_blob(file, "AbC1.py", &blob)));
    EXPECT_EQ(blob, root_ / "h" / "AbC1.py");
}

TEST_F(IndexLoaderTest, BlobFallbackDirectory) {
    put("h/entries/AbC1.py", "content");
    TrackedFile file;
    file.record_dir = root_ / "h";
    fs::path blob;
    ASSERT_TRUE(is_ok(resolve_blob(file, "AbC1.py", &blob)));
    EXPECT_EQ(blob, root_ / "h" / "entries" / "AbC1.py");
}

TEST_F(IndexLoaderTest, PrimaryBlobWinsOverFallback) {
    put("h/AbC1.py", "primary");
    put("h/entries/AbC1.py", "fallback");
    TrackedFile file;
    file.record_dir = root_ / "h";
    fs::path blob;
    ASSERT_TRUE(is_ok(resolve_blob(file, "AbC1.py", &blob)));
    EXPECT_EQ(blob, root_ / "h" / "AbC1.py");
}

TEST_F(IndexLoaderTest, MissingBlobIsNotFound) {
    fs::create_directories(root_ / "h");
    TrackedFile file;
    file.record_dir = root_ / "h";
    fs::path blob;
    EXPECT_EQ(resolve_blob(file, "gone.py", &blob).code, StatusCode::NotFound);
}

TEST_F(IndexLoaderTest, BlobIdsMustBePlainNames) {
    put("secret.txt", "x");
    TrackedFile file;
    file.record_dir = root_ / "h";
    fs::path blob;
    EXPECT_EQ(resolve_blob(file, "../secret.txt", &blob).code, StatusCode::Invalid);
    EXPECT_EQ(resolve_blob(file, "..", &blob).code, StatusCode::Invalid);
    EXPECT_EQ(resolve_blob(file, ".", &blob).code, StatusCode::Invalid);
    EXPECT_EQ(resolve_blob(file, "", &blob).code, StatusCode::Invalid);
    EXPECT_EQ(resolve_blob(file, "a\\b", &blob).code, StatusCode::Invalid);
}
