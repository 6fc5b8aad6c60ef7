#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "revive/core/errors.hpp"
#include "revive/core/types.hpp"
#include "revive/placement/dest_index.hpp"

namespace revive::placement {
    using u8 = revive::core::u8;
    using u32 = revive::core::u32;
    using u64 = revive::core::u64;

    enum class PlacementTier : u8 {
        DirectRemap = 1,   // under the source root: mirror the relative path
        SuffixMatch = 2,   // overwrite an existing namesake with the deepest agreeing directories
        AnchorFolder = 3,  // re-root what follows the source root's folder name
        Flat = 4,          // filename directly under the destination root
    };

    struct PlacerOptions {
        u64 max_index_files{revive::core::kDefaultMaxIndexFiles};
        // Rebuild the destination index before every suffix lookup instead of once.
        bool refresh_each_lookup{false};
        // Trailing segments (filename included) a namesake must share to be
        // accepted. 1 accepts any namesake.
        u32 min_suffix_segments{1};
    };

    struct Placement {
        std::filesystem::path path;
        PlacementTier tier{PlacementTier::Flat};
    };

    [[nodiscard]] const char* placement_tier_name(PlacementTier tier) noexcept;

    // Number of equal trailing segments: {"a","b","c"} vs {"x","b","c"} -> 2.
    [[nodiscard]] u32 common_suffix_len(const std::vector<std::string>& a, const std::vector<std::string>& b) noexcept;

    class DestPlacer {
    public:
        DestPlacer(const std::filesystem::path& source_root,
            const std::filesystem::path& dest_root,
            PlacerOptions options = {});

        // Total: always yields a destination for `historical`.
        [[nodiscard]] Placement choose_dest(const std::filesystem::path& historical);

        // Destination files named `filename`; builds the index on first use.
        [[nodiscard]] const std::vector<std::filesystem::path>& candidates(const std::string& filename);

        [[nodiscard]] const std::filesystem::path& source_root() const noexcept { return source_root_; }
        [[nodiscard]] const std::filesystem::path& dest_root() const noexcept { return dest_root_; }
        [[nodiscard]] const std::string& anchor_name() const noexcept { return anchor_name_; }
        [[nodiscard]] const PlacerOptions& options() const noexcept { return options_; }
        [[nodiscard]] const DestinationIndex& index() const noexcept { return index_; }
        [[nodiscard]] u64 index_builds() const noexcept { return index_builds_; }
        [[nodiscard]] revive::core::Status index_status() const noexcept { return index_status_; }

    private:
        std::filesystem::path source_root_;
        std::filesystem::path dest_root_;
        std::string anchor_name_;
        PlacerOptions options_;
        DestinationIndex index_;
        u64 index_builds_{0};
        revive::core::Status index_status_{};
    };

} // namespace revive::placement
