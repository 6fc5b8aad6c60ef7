#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "revive/core/types.hpp"

namespace revive::core {

    // One saved revision of a tracked file.
    struct Snapshot {
        TimestampMs timestamp{0};
        bool has_timestamp{false};  // false for missing/null/non-integer timestamps
        std::string blob_id;        // empty when the record carries no id
    };

    // One history record: the file as originally saved plus its revisions.
    struct TrackedFile {
        std::filesystem::path resource;    // absolute, normalized
        std::filesystem::path record_dir;  // folder holding entries.json and the blobs
        std::vector<Snapshot> entries;     // source order; never empty
    };

    // Selection predicate: ts in [after_ms, before_ms).
    struct TimeWindow {
        TimestampMs after_ms{0};
        TimestampMs before_ms{0};
        bool has_after{false};
        bool has_before{false};
    };

    [[nodiscard]] constexpr TimeWindow window_after(TimestampMs after_ms) noexcept {
        return TimeWindow{after_ms, 0, true, false};
    }

    [[nodiscard]] constexpr TimeWindow window_before(TimestampMs before_ms) noexcept {
        return TimeWindow{0, before_ms, false, true};
    }

    [[nodiscard]] constexpr TimeWindow window_between(TimestampMs after_ms, TimestampMs before_ms) noexcept {
        return TimeWindow{after_ms, before_ms, true, true};
    }

    [[nodiscard]] constexpr bool window_contains(const TimeWindow& w, TimestampMs ts) noexcept {
        return (!w.has_after || ts >= w.after_ms) && (!w.has_before || ts < w.before_ms);
    }

    [[nodiscard]] constexpr bool window_is_valid(const TimeWindow& w) noexcept {
        if (!w.has_after && !w.has_before) {
            return false;
        }
        return !(w.has_after && w.has_before) || w.after_ms < w.before_ms;
    }

} // namespace revive::core
