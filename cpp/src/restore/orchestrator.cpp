#include "revive/restore/orchestrator.hpp"

#include <system_error>
#include <utility>

#include "revive/history/index_loader.hpp"
#include "revive/history/selector.hpp"
#include "revive/io/file_io.hpp"
#include "revive/paths/resolver.hpp"

namespace revive::restore {
    namespace fs = std::filesystem;
    using revive::core::make_status;
    using revive::core::ok_status;
    using revive::core::Status;
    using revive::core::StatusCode;
    using revive::core::StatusDomain;

    namespace {
        void warn(const RestoreSink& sink, RestoreReport* report, const std::string& msg) {
            report->warnings.push_back(msg);
            if (sink.diag) {
                std::fprintf(sink.diag, "warn: %s\n", msg.c_str());
            }
        }
    } // namespace

    bool in_restore_scope(const fs::path& historical, const fs::path& source_root) {
        if (revive::paths::path_is_within(historical, source_root)) {
            return true;
        }

        const std::string root_name = source_root.filename().string();
        const std::vector<std::string> parts = revive::paths::path_segments(historical);
        if (parts.empty()) {
            return false;
        }
        if (parts.back() == root_name) {
            return true;
        }
        for (size_t i = 0; i + 1 < parts.size(); ++i) {
            if (parts[i] == root_name) {
                return true;
            }
        }
        return false;
    }

    std::string format_outcome(const RestoreOutcome& outcome, bool dry_run) {
        std::string line = dry_run ? "WOULD_RESTORE: " : "RESTORED: ";
        line += outcome.historical.string();
        line += " -> ";
        line += outcome.destination.string();
        return line;
    }

    std::string format_summary(u64 count, const fs::path& dest_root, bool dry_run) {
        const std::string n = std::to_string(count);
        if (dry_run) {
            return "Plan complete. Would restore " + n + " file(s) into: " + dest_root.string();
        }
        return "Done. Restored " + n + " file(s) into: " + dest_root.string();
    }

    Status run_restore(const RestoreConfig& cfg, const RestoreSink& sink, RestoreReport* report) {
        if (report == nullptr) {
            return make_status(StatusDomain::Restore, StatusCode::Invalid);
        }
        *report = RestoreReport{};

        if (!revive::core::window_is_valid(cfg.window)) {
            return make_status(StatusDomain::Restore, StatusCode::Invalid);
        }

        std::error_code ec;
        if (!fs::is_directory(cfg.history_root, ec)) {
            return make_status(StatusDomain::History, StatusCode::NotFound);
        }

        revive::placement::DestPlacer placer(cfg.source_root, cfg.dest_root, cfg.placer);
        if (!cfg.dry_run) {
            const Status ds = revive::io::ensure_directory(placer.dest_root());
            if (!revive::core::is_ok(ds)) {
                return make_status(StatusDomain::Restore, ds.code, ds.aux);
            }
        }

        revive::history::LoadResult loaded;
        const Status ls = revive::history::load_all(cfg.history_root, &loaded);
        if (!revive::core::is_ok(ls)) {
            return ls;
        }
        for (const revive::history::LoadIssue& issue : loaded.issues) {
            warn(sink, report, issue.message + ": " + issue.record.string());
        }
        report->records_loaded = loaded.files.size();

        if (loaded.files.empty()) {
            warn(sink, report, "no entries.json files found under history root.");
            return ok_status();
        }

        bool index_reported = false;
        for (const revive::core::TrackedFile& file : loaded.files) {
            const fs::path& src = file.resource;

            // Admit
            if (!in_restore_scope(src, placer.source_root())) {
                ++report->out_of_scope;
                continue;
            }

            // Select
            revive::core::Snapshot chosen;
            if (!revive::history::select_snapshot(file.entries, cfg.window, &chosen)) {
                ++report->no_match;
                continue;
            }
            if (chosen.blob_id.empty()) {
                ++report->no_match;
                continue;
            }

            // ResolveBlob
            fs::path blob;
            if (!revive::core::is_ok(revive::history::resolve_blob(file, chosen.blob_id, &blob))) {
                ++report->missing_blob;
                warn(sink, report, "missing content blob for " + src.string() + " (" + chosen.blob_id + ")");
                continue;
            }

            // Read
            std::string raw;
            const Status rs = revive::io::read_file(blob, &raw);
            if (!revive::core::is_ok(rs)) {
                ++report->read_failures;
                warn(sink, report, "could not read " + blob.string() + ": " + revive::core::status_reason(rs));
                continue;
            }
            const std::string text = revive::io::utf8_sanitize(raw);

            // Place
            const revive::placement::Placement dest = placer.choose_dest(src);
            if (!index_reported && !revive::core::is_ok(placer.index_status())) {
                index_reported = true;
                warn(sink, report,
                    "could not index " + placer.dest_root().string() + ": " + revive::core::status_reason(placer.index_status()));
            } else if (!index_reported && placer.index().truncated()) {
                index_reported = true;
                warn(sink, report,
                    "destination index stopped at " + std::to_string(placer.index().file_count()) +
                        " files (--max-index-files); some files may be placed by fallback");
            }

            // Write
            if (!cfg.dry_run) {
                Status ws = revive::io::ensure_directory(dest.path.parent_path());
                if (revive::core::is_ok(ws)) {
                    ws = revive::io::write_file(dest.path, text);
                }
                if (!revive::core::is_ok(ws)) {
                    ++report->write_failures;
                    warn(sink, report, "could not write " + dest.path.string() + ": " + revive::core::status_reason(ws));
                    continue;
                }
            }

            RestoreOutcome outcome{src, dest.path, dest.tier, chosen.timestamp, chosen.blob_id};
            if (sink.out) {
                std::fprintf(sink.out, "%s\n", format_outcome(outcome, cfg.dry_run).c_str());
            }
            report->restored.push_back(std::move(outcome));
        }

        if (sink.out) {
            std::fprintf(sink.out, "\n%s\n",
                format_summary(report->restored.size(), placer.dest_root(), cfg.dry_run).c_str());
        }
        return ok_status();
    }
} // namespace revive::restore
