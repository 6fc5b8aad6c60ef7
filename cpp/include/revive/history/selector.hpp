#pragma once

#include <vector>

#include "revive/core/models.hpp"

namespace revive::history {

    // Picks the newest snapshot with a timestamp inside `window`.
    // Snapshots without a timestamp are never eligible. Among equal
    // timestamps the one later in source order wins. Returns false when
    // nothing qualifies.
    [[nodiscard]] bool select_snapshot(const std::vector<revive::core::Snapshot>& entries,
        const revive::core::TimeWindow& window,
        revive::core::Snapshot* out);

    // Stable ascending order by timestamp, timestamp-less entries last.
    [[nodiscard]] std::vector<revive::core::Snapshot> sort_by_timestamp(
        const std::vector<revive::core::Snapshot>& entries);

} // namespace revive::history
