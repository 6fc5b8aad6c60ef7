#include "revive/history/index_loader.hpp"

#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

#include "revive/io/file_io.hpp"

namespace revive::history {
    namespace fs = std::filesystem;
    using json = nlohmann::json;
    using revive::core::make_status;
    using revive::core::ok_status;
    using revive::core::Status;
    using revive::core::StatusCode;
    using revive::core::StatusDomain;

    namespace {
        revive::core::Snapshot snapshot_from_json(const json& e) {
            revive::core::Snapshot s{};
            if (!e.is_object()) {
                return s;
            }

            const auto ts = e.find("timestamp");
            if (ts != e.end() && (ts->is_number_integer() || ts->is_number_unsigned())) {
                s.timestamp = ts->get<revive::core::TimestampMs>();
                s.has_timestamp = true;
            }

            const auto id = e.find("id");
            if (id != e.end() && id->is_string()) {
                s.blob_id = id->get<std::string>();
            }
            return s;
        }

        [[nodiscard]] bool is_plain_name(const std::string& s) noexcept {
            if (s.empty() || s == "." || s == "..") {
                return false;
            }
            return s.find('/') == std::string::npos && s.find('\\') == std::string::npos;
        }
    } // namespace

    RecordParseResult parse_record(const std::string& json_text,
        const fs::path& record_dir,
        revive::paths::PathConvention convention,
        revive::core::TrackedFile* out,
        std::string* error) {
        if (out == nullptr) {
            return RecordParseResult::Skip;
        }

        const json doc = json::parse(json_text, nullptr, false);
        if (doc.is_discarded()) {
            if (error) *error = "could not parse JSON";
            return RecordParseResult::Malformed;
        }
        if (!doc.is_object()) {
            return RecordParseResult::Skip;
        }

        const auto resource = doc.find("resource");
        const auto entries = doc.find("entries");
        if (resource == doc.end() || entries == doc.end()) {
            return RecordParseResult::Skip;
        }
        if (!entries->is_array() || entries->empty()) {
            return RecordParseResult::Skip;
        }
        if (!resource->is_string()) {
            if (error) *error = "resource is not a string";
            return RecordParseResult::Malformed;
        }

        std::string local;
        const Status s = revive::paths::locator_to_path(resource->get<std::string>(), convention, &local);
        if (!revive::core::is_ok(s)) {
            if (error) *error = "resource is not a file locator";
            return RecordParseResult::Malformed;
        }

        out->resource = revive::paths::normalize_path(fs::path(local));
        out->record_dir = record_dir;
        out->entries.clear();
        out->entries.reserve(entries->size());
        for (const json& e : *entries) {
            out->entries.push_back(snapshot_from_json(e));
        }
        return RecordParseResult::Ok;
    }

    Status load_all(const fs::path& history_root, LoadResult* out) {
        if (out == nullptr) {
            return make_status(StatusDomain::History, StatusCode::Invalid);
        }
        out->files.clear();
        out->issues.clear();
        out->records_seen = 0;

        std::error_code ec;
        if (!fs::is_directory(history_root, ec)) {
            return make_status(StatusDomain::History, StatusCode::NotFound);
        }

        fs::recursive_directory_iterator it(history_root, fs::directory_options::skip_permission_denied, ec);
        fs::recursive_directory_iterator end;
        for (; it != end; it.increment(ec)) {
            if (ec) {
                ec.clear();
                continue;
            }
            const fs::directory_entry& de = *it;
            if (de.path().filename() != kRecordFileName || !de.is_regular_file(ec)) {
                continue;
            }
            ++out->records_seen;

            std::string text;
            const Status rs = revive::io::read_file(de.path(), &text);
            if (!revive::core::is_ok(rs)) {
                out->issues.push_back(LoadIssue{de.path(), "could not read record"});
                continue;
            }

            revive::core::TrackedFile file;
            std::string error;
            const RecordParseResult r =
                parse_record(text, de.path().parent_path(), revive::paths::kNativeConvention, &file, &error);
            if (r == RecordParseResult::Malformed) {
                out->issues.push_back(LoadIssue{de.path(), error});
                continue;
            }
            if (r == RecordParseResult::Ok) {
                out->files.push_back(std::move(file));
            }
        }
        return ok_status();
    }

    Status resolve_blob(const revive::core::TrackedFile& file, const std::string& blob_id, fs::path* out) {
        if (out == nullptr || !is_plain_name(blob_id)) {
            return make_status(StatusDomain::History, StatusCode::Invalid);
        }

        std::error_code ec;
        const fs::path primary = file.record_dir / blob_id;
        if (fs::exists(primary, ec)) {
            *out = primary;
            return ok_status();
        }
        const fs::path alt = file.record_dir / kBlobFallbackDir / blob_id;
        if (fs::exists(alt, ec)) {
            *out = alt;
            return ok_status();
        }
        return make_status(StatusDomain::History, StatusCode::NotFound);
    }
} // namespace revive::history
