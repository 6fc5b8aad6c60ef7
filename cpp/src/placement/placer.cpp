#include "revive/placement/placer.hpp"

#include <array>

#include "revive/paths/resolver.hpp"

namespace revive::placement {
    namespace fs = std::filesystem;

    namespace {
        using Strategy = bool (*)(const fs::path& historical, DestPlacer& placer, fs::path* out);

        bool place_direct_remap(const fs::path& historical, DestPlacer& placer, fs::path* out) {
            if (!revive::paths::path_is_within(historical, placer.source_root())) {
                return false;
            }
            const fs::path rel = historical.lexically_relative(placer.source_root());
            *out = (rel == fs::path(".")) ? placer.dest_root() : placer.dest_root() / rel;
            return true;
        }

        bool place_suffix_match(const fs::path& historical, DestPlacer& placer, fs::path* out) {
            const std::vector<fs::path>& cands = placer.candidates(historical.filename().string());
            if (cands.empty()) {
                return false;
            }

            const std::vector<std::string> src_parts = revive::paths::path_segments(historical);
            const fs::path* best = nullptr;
            u32 best_suffix = 0;
            size_t best_depth = 0;
            for (const fs::path& cand : cands) {
                const std::vector<std::string> cand_parts = revive::paths::path_segments(cand);
                const u32 suffix = common_suffix_len(src_parts, cand_parts);
                const size_t depth = cand_parts.size();

                bool better = false;
                if (best == nullptr || suffix > best_suffix) {
                    better = true;
                } else if (suffix == best_suffix) {
                    // Shallower wins; path order settles the rest so walk order never leaks out.
                    better = depth < best_depth || (depth == best_depth && cand < *best);
                }
                if (better) {
                    best = &cand;
                    best_suffix = suffix;
                    best_depth = depth;
                }
            }

            const u32 gate = placer.options().min_suffix_segments > 0 ? placer.options().min_suffix_segments : 1;
            if (best == nullptr || best_suffix < gate) {
                return false;
            }
            *out = *best;
            return true;
        }

        bool place_anchor_folder(const fs::path& historical, DestPlacer& placer, fs::path* out) {
            if (placer.anchor_name().empty()) {
                return false;
            }
            const std::vector<std::string> parts = revive::paths::path_segments(historical);
            for (size_t i = 0; i < parts.size(); ++i) {
                if (parts[i] != placer.anchor_name()) {
                    continue;
                }
                if (i + 1 == parts.size()) {
                    *out = placer.dest_root() / historical.filename();
                    return true;
                }
                fs::path rel;
                for (size_t j = i + 1; j < parts.size(); ++j) {
                    rel /= parts[j];
                }
                *out = placer.dest_root() / rel;
                return true;
            }
            return false;
        }

        bool place_flat(const fs::path& historical, DestPlacer& placer, fs::path* out) {
            const fs::path name = historical.filename();
            *out = name.empty() ? placer.dest_root() : placer.dest_root() / name;
            return true;
        }

        struct StrategySlot {
            PlacementTier tier;
            Strategy fn;
        };

        constexpr std::array<StrategySlot, 4> kStrategies = {{
            {PlacementTier::DirectRemap, &place_direct_remap},
            {PlacementTier::SuffixMatch, &place_suffix_match},
            {PlacementTier::AnchorFolder, &place_anchor_folder},
            {PlacementTier::Flat, &place_flat},
        }};
    } // namespace

    const char* placement_tier_name(PlacementTier tier) noexcept {
        switch (tier) {
            case PlacementTier::DirectRemap: return "direct";
            case PlacementTier::SuffixMatch: return "suffix";
            case PlacementTier::AnchorFolder: return "anchor";
            case PlacementTier::Flat: return "flat";
        }
        return "unknown";
    }

    u32 common_suffix_len(const std::vector<std::string>& a, const std::vector<std::string>& b) noexcept {
        const size_t limit = a.size() < b.size() ? a.size() : b.size();
        size_t i = 0;
        while (i < limit && a[a.size() - 1 - i] == b[b.size() - 1 - i]) {
            ++i;
        }
        return static_cast<u32>(i);
    }

    DestPlacer::DestPlacer(const fs::path& source_root, const fs::path& dest_root, PlacerOptions options)
        : source_root_(revive::paths::normalize_path(source_root)),
          dest_root_(revive::paths::normalize_path(dest_root)),
          options_(options) {
        anchor_name_ = source_root_.filename().string();
    }

    const std::vector<fs::path>& DestPlacer::candidates(const std::string& filename) {
        if (!index_.built() || options_.refresh_each_lookup) {
            // A failed walk leaves an empty index; placement falls through to later tiers.
            index_status_ = index_.build(dest_root_, options_.max_index_files);
            ++index_builds_;
        }
        return index_.candidates(filename);
    }

    Placement DestPlacer::choose_dest(const fs::path& historical) {
        const fs::path src = revive::paths::normalize_path(historical);
        for (const StrategySlot& slot : kStrategies) {
            fs::path out;
            if (slot.fn(src, *this, &out)) {
                return Placement{out, slot.tier};
            }
        }
        // place_flat always succeeds.
        return Placement{dest_root_ / src.filename(), PlacementTier::Flat};
    }
} // namespace revive::placement
