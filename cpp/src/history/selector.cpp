#include "revive/history/selector.hpp"

#include <algorithm>

namespace revive::history {
    std::vector<revive::core::Snapshot> sort_by_timestamp(const std::vector<revive::core::Snapshot>& entries) {
        std::vector<revive::core::Snapshot> sorted = entries;
        std::stable_sort(sorted.begin(), sorted.end(),
            [](const revive::core::Snapshot& a, const revive::core::Snapshot& b) {
                if (a.has_timestamp != b.has_timestamp) {
                    return a.has_timestamp;
                }
                return a.has_timestamp && a.timestamp < b.timestamp;
            });
        return sorted;
    }

    bool select_snapshot(const std::vector<revive::core::Snapshot>& entries,
        const revive::core::TimeWindow& window,
        revive::core::Snapshot* out) {
        if (out == nullptr || entries.empty()) {
            return false;
        }

        const std::vector<revive::core::Snapshot> sorted = sort_by_timestamp(entries);
        for (auto it = sorted.rbegin(); it != sorted.rend(); ++it) {
            if (!it->has_timestamp) {
                continue;
            }
            if (revive::core::window_contains(window, it->timestamp)) {
                *out = *it;
                return true;
            }
        }
        return false;
    }
} // namespace revive::history
