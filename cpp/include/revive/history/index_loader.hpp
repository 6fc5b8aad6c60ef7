#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "revive/core/errors.hpp"
#include "revive/core/models.hpp"
#include "revive/paths/resolver.hpp"

namespace revive::history {
    using u8 = revive::core::u8;
    using u64 = revive::core::u64;

    // Per-file record written by the editor next to its content blobs.
    inline constexpr const char* kRecordFileName = "entries.json";
    // Secondary blob location relative to the record folder.
    inline constexpr const char* kBlobFallbackDir = "entries";

    enum class RecordParseResult : u8 {
        Ok = 0,
        Skip = 1,       // well-formed but not a usable history record
        Malformed = 2,  // worth a warning
    };

    struct LoadIssue {
        std::filesystem::path record;
        std::string message;
    };

    struct LoadResult {
        std::vector<revive::core::TrackedFile> files;
        std::vector<LoadIssue> issues;
        u64 records_seen{0};
    };

    // Parses one entries.json document. `error` receives the reason for
    // Malformed and may be null.
    [[nodiscard]] RecordParseResult parse_record(const std::string& json_text,
        const std::filesystem::path& record_dir,
        revive::paths::PathConvention convention,
        revive::core::TrackedFile* out,
        std::string* error);

    // Walks `history_root` for entries.json records. NotFound when the root
    // is missing or not a directory; bad records land in `out->issues`.
    [[nodiscard]] revive::core::Status load_all(const std::filesystem::path& history_root, LoadResult* out);

    // <record_dir>/<blob_id>, then <record_dir>/entries/<blob_id>.
    [[nodiscard]] revive::core::Status resolve_blob(const revive::core::TrackedFile& file,
        const std::string& blob_id,
        std::filesystem::path* out);

} // namespace revive::history
