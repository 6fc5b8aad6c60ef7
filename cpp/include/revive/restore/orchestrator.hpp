#pragma once

#include <cstdio>
#include <filesystem>
#include <string>
#include <vector>

#include "revive/core/errors.hpp"
#include "revive/core/models.hpp"
#include "revive/placement/placer.hpp"

namespace revive::restore {
    using u64 = revive::core::u64;

    struct RestoreConfig {
        std::filesystem::path source_root;   // tree the history was captured from
        std::filesystem::path history_root;  // editor local-history folder
        std::filesystem::path dest_root;     // tree to restore into
        revive::core::TimeWindow window{};
        bool dry_run{false};
        revive::placement::PlacerOptions placer{};
    };

    // Where per-file lines and diagnostics go. Null streams are silent.
    struct RestoreSink {
        FILE* out{nullptr};
        FILE* diag{nullptr};
    };

    struct RestoreOutcome {
        std::filesystem::path historical;
        std::filesystem::path destination;
        revive::placement::PlacementTier tier{revive::placement::PlacementTier::Flat};
        revive::core::TimestampMs timestamp{0};
        std::string blob_id;
    };

    struct RestoreReport {
        std::vector<RestoreOutcome> restored;  // written, or planned in dry-run
        std::vector<std::string> warnings;
        u64 records_loaded{0};
        u64 out_of_scope{0};
        u64 no_match{0};
        u64 missing_blob{0};
        u64 read_failures{0};
        u64 write_failures{0};
    };

    // Under the source root, or (roots differ across machines) the root's
    // folder name is one of the path's ancestors or the filename itself.
    [[nodiscard]] bool in_restore_scope(const std::filesystem::path& historical,
        const std::filesystem::path& source_root);

    [[nodiscard]] std::string format_outcome(const RestoreOutcome& outcome, bool dry_run);
    [[nodiscard]] std::string format_summary(u64 count, const std::filesystem::path& dest_root, bool dry_run);

    // One full run. Fails only on run-level preconditions (history root
    // missing, invalid window, destination root not creatable); per-file
    // problems become warnings in the report.
    [[nodiscard]] revive::core::Status run_restore(const RestoreConfig& cfg,
        const RestoreSink& sink,
        RestoreReport* report);

} // namespace revive::restore
