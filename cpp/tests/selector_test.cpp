#include <vector>

#include <gtest/gtest.h>

#include "revive/history/selector.hpp"

using revive::core::Snapshot;

namespace {
    Snapshot snap(revive::core::TimestampMs ts, const char* id) {
        return Snapshot{ts, true, id};
    }

    Snapshot untimed(const char* id) {
        return Snapshot{0, false, id};
    }
} // namespace

TEST(Selector, EmptyListSelectsNothing) {
    Snapshot out{};
    EXPECT_FALSE(revive::history::select_snapshot({}, revive::core::window_before(1000), &out));
}

TEST(Selector, NewestBeforeUpperBound) {
    const std::vector<Snapshot> entries = {snap(300, "c"), snap(100, "a"), snap(200, "b")};
    Snapshot out{};
    ASSERT_TRUE(revive::history::select_snapshot(entries, revive::core::window_before(250), &out));
    EXPECT_EQ(out.timestamp, 200);
    EXPECT_EQ(out.blob_id, "b");
}

TEST(Selector, LowerBoundOnlyPicksNewestOverall) {
    const std::vector<Snapshot> entries = {snap(100, "a"), snap(300, "b")};
    Snapshot out{};
    ASSERT_TRUE(revive::history::select_snapshot(entries, revive::core::window_after(150), &out));
    EXPECT_EQ(out.timestamp, 300);
}

TEST(Selector, UpperBoundIsExclusive) {
    const std::vector<Snapshot> entries = {snap(100, "a"), snap(200, "b")};
    Snapshot out{};
    ASSERT_TRUE(revive::history::select_snapshot(entries, revive::core::window_before(200), &out));
    EXPECT_EQ(out.blob_id, "a");

    EXPECT_FALSE(revive::history::select_snapshot({snap(200, "b")}, revive::core::window_before(200), &out));
}

TEST(Selector, LowerBoundIsInclusive) {
    Snapshot out{};
    ASSERT_TRUE(revive::history::select_snapshot({snap(150, "x")}, revive::core::window_after(150), &out));
    EXPECT_EQ(out.blob_id, "x");
}

TEST(Selector, NothingInsideWindow) {
    const std::vector<Snapshot> entries = {snap(100, "a"), snap(400, "b")};
    Snapshot out{};
    EXPECT_FALSE(revive::history::select_snapshot(entries, revive::core::window_between(150, 300), &out));
}

TEST(Selector, UntimedEntriesAreNeverSelected) {
    const std::vector<Snapshot> entries = {untimed("u1"), snap(100, "a"), untimed("u2")};
    Snapshot out{};
    ASSERT_TRUE(revive::history::select_snapshot(entries, revive::core::window_after(0), &out));
    EXPECT_EQ(out.blob_id, "a");

    EXPECT_FALSE(revive::history::select_snapshot({untimed("u")}, revive::core::window_before(1'000'000), &out));
}

TEST(Selector, TiesGoToLaterSourceEntry) {
    const std::vector<Snapshot> entries = {snap(100, "first"), snap(100, "second"), snap(50, "old")};
    Snapshot out{};
    ASSERT_TRUE(revive::history::select_snapshot(entries, revive::core::window_before(1000), &out));
    EXPECT_EQ(out.blob_id, "second");
}

TEST(Selector, SelectedIsMaximumQualifying) {
    std::vector<Snapshot> entries;
    for (int i = 0; i < 50; ++i) {
        entries.push_back(snap((i * 37) % 101, "x"));
    }
    const revive::core::TimeWindow w = revive::core::window_between(20, 80);
    Snapshot out{};
    ASSERT_TRUE(revive::history::select_snapshot(entries, w, &out));
    for (const Snapshot& s : entries) {
        if (revive::core::window_contains(w, s.timestamp)) {
            EXPECT_LE(s.timestamp, out.timestamp);
        }
    }
    EXPECT_TRUE(revive::core::window_contains(w, out.timestamp));
}

TEST(Selector, SortPutsUntimedLastAndKeepsOrder) {
    const std::vector<Snapshot> entries = {untimed("u"), snap(5, "b"), snap(1, "a"), snap(5, "c")};
    const std::vector<Snapshot> sorted = revive::history::sort_by_timestamp(entries);
    ASSERT_EQ(sorted.size(), 4u);
    EXPECT_EQ(sorted[0].blob_id, "a");
    EXPECT_EQ(sorted[1].blob_id, "b");
    EXPECT_EQ(sorted[2].blob_id, "c");
    EXPECT_EQ(sorted[3].blob_id, "u");
}

TEST(Selector, NullOutputSelectsNothing) {
    EXPECT_FALSE(revive::history::select_snapshot({snap(1, "a")}, revive::core::window_after(0), nullptr));
}
