#include "channel_ledger.h"
#include <gtest/gtest.h>
namespace {
constexpr qint64 kBase = 1700000000000000000LL;
constexpr qint64 kSecond = 1000000000LL;
void fillLedger(ChannelLedger& ledger, int points, double spacingSec) {
    for (int i = 0; i < points; ++i) {
        ledger.addPoint(TelemetryValue::number(i), kBase + static_cast<qint64>(i * spacingSec * kSecond), kBase);
    }
}
}
TEST(ChannelLedgerTest, ElapsedFromGlobalReference) {
    ChannelLedger ledger(QStringLiteral("/ch"));
    ledger.addPoint(TelemetryValue::number(1.0), kBase + 2 * kSecond, kBase);
    ASSERT_EQ(ledger.count(), 1);
    EXPECT_DOUBLE_EQ(ledger.lastPoint()->elapsed, 2.0);
}
TEST(ChannelLedgerTest, ElapsedFromOwnFirstPointWithoutReference) {
    ChannelLedger ledger(QStringLiteral("/ch"));
    ledger.addPoint(TelemetryValue::number(1.0), kBase);
    ledger.addPoint(TelemetryValue::number(2.0), kBase + kSecond / 2);
    EXPECT_DOUBLE_EQ(ledger.lastPoint()->elapsed, 0.5);
}
TEST(ChannelLedgerTest, InvalidTimestampUsesChannelFirst) {
    ChannelLedger ledger(QStringLiteral("/ch"));
    ledger.addPoint(TelemetryValue::number(1.0), 0, kBase);
    EXPECT_DOUBLE_EQ(ledger.lastPoint()->elapsed, 0.0);
}
TEST(ChannelLedgerTest, NearestWithinToleranceLinearAndBinary) {
    for (int points : {10, 500}) {
        ChannelLedger ledger(QStringLiteral("/ch"));
        fillLedger(ledger, points, 0.1);
        std::optional<DataPoint> hit = ledger.nearestPoint(0.32, 0.05);
        ASSERT_TRUE(hit.has_value()) << points;
        EXPECT_DOUBLE_EQ(hit->value.toNumber(), 3.0);
        EXPECT_FALSE(ledger.nearestPoint(0.35, 0.01).has_value()) << points;
    }
}
TEST(ChannelLedgerTest, NearestTieGoesToEarlierPoint) {
    for (int points : {10, 500}) {
        ChannelLedger ledger(QStringLiteral("/ch"));
        fillLedger(ledger, points, 1.0);
        std::optional<DataPoint> hit = ledger.nearestPoint(2.5, 1.0);
        ASSERT_TRUE(hit.has_value());
        EXPECT_DOUBLE_EQ(hit->value.toNumber(), 2.0) << points;
    }
}
TEST(ChannelLedgerTest, RangeIsInclusive) {
    for (int points : {20, 300}) {
        ChannelLedger ledger(QStringLiteral("/ch"));
        fillLedger(ledger, points, 1.0);
        QVector<DataPoint> range = ledger.pointsInRange(3.0, 6.0);
        ASSERT_EQ(range.size(), 4) << points;
        EXPECT_DOUBLE_EQ(range.first().elapsed, 3.0);
        EXPECT_DOUBLE_EQ(range.last().elapsed, 6.0);
        EXPECT_TRUE(ledger.pointsInRange(6.0, 3.0).isEmpty());
    }
}
TEST(ChannelLedgerTest, SnapshotIsolatedFromLaterAppends) {
    ChannelLedger ledger(QStringLiteral("/ch"));
    fillLedger(ledger, 5, 1.0);
    LedgerSnapshot snapshot = ledger.snapshot();
    ledger.addPoint(TelemetryValue::number(99.0), kBase + 10 * kSecond, kBase);
    EXPECT_EQ(snapshot.size(), 5);
    EXPECT_TRUE(snapshot.isConsistent());
    EXPECT_EQ(ledger.count(), 6);
}
TEST(ChannelLedgerTest, SnapshotCapKeepsMostRecent) {
    ChannelLedger ledger(QStringLiteral("/ch"));
    fillLedger(ledger, 50, 1.0);
    LedgerSnapshot snapshot = ledger.snapshot(10);
    ASSERT_EQ(snapshot.size(), 10);
    EXPECT_DOUBLE_EQ(snapshot.first().value.toNumber(), 40.0);
    EXPECT_TRUE(snapshot.isConsistent());
}
TEST(ChannelLedgerTest, RangeSnapshots) {
    ChannelLedger ledger(QStringLiteral("/ch"));
    fillLedger(ledger, 20, 1.0);
    LedgerSnapshot byElapsed = ledger.snapshotElapsedRange(4.5, 8.0);
    ASSERT_EQ(byElapsed.size(), 4);
    EXPECT_DOUBLE_EQ(byElapsed.first().elapsed, 5.0);
    LedgerSnapshot byTimestamp = ledger.snapshotTimestampRange(kBase + 18 * kSecond, kBase + 100 * kSecond);
    ASSERT_EQ(byTimestamp.size(), 2);
    EXPECT_DOUBLE_EQ(byTimestamp.last().value.toNumber(), 19.0);
}
TEST(ChannelLedgerTest, BracketFindsBothSides) {
    ChannelLedger ledger(QStringLiteral("/ch"));
    fillLedger(ledger, 5, 1.0);
    LedgerSnapshot snapshot = ledger.snapshot();
    auto [before, after] = snapshot.bracket(2.25, 1.0);
    ASSERT_TRUE(before && after);
    EXPECT_DOUBLE_EQ(before->elapsed, 2.0);
    EXPECT_DOUBLE_EQ(after->elapsed, 3.0);
    auto [onlyBefore, none] = snapshot.bracket(4.5, 1.0);
    EXPECT_TRUE(onlyBefore.has_value());
    EXPECT_FALSE(none.has_value());
}
TEST(ChannelLedgerTest, MatchTimestampWithinTolerance) {
    for (int points : {10, 200}) {
        ChannelLedger ledger(QStringLiteral("/ch"));
        fillLedger(ledger, points, 1.0);
        LedgerSnapshot snapshot = ledger.snapshot();
        std::optional<DataPoint> hit = snapshot.matchTimestamp(kBase + 3 * kSecond + 500, 1000);
        ASSERT_TRUE(hit.has_value());
        EXPECT_DOUBLE_EQ(hit->value.toNumber(), 3.0);
        EXPECT_FALSE(snapshot.matchTimestamp(kBase + 3 * kSecond + 5000, 1000).has_value());
    }
}
TEST(ChannelLedgerTest, RebasedDropsInvalidTimestamps) {
    ChannelLedger ledger(QStringLiteral("/ch"));
    ledger.addPoint(TelemetryValue::number(0.0), 0);
    ledger.addPoint(TelemetryValue::number(1.0), kBase);
    ledger.addPoint(TelemetryValue::number(2.0), kBase + kSecond);
    LedgerSnapshot rebased = ledger.snapshot().rebased(kBase);
    ASSERT_EQ(rebased.size(), 2);
    EXPECT_DOUBLE_EQ(rebased.first().elapsed, 0.0);
    EXPECT_DOUBLE_EQ(rebased.last().elapsed, 1.0);
    EXPECT_TRUE(rebased.isConsistent());
}
TEST(ChannelLedgerTest, PruneKeepsCountAndBoundsInStep) {
    ChannelLedger ledger(QStringLiteral("/ch"));
    fillLedger(ledger, 100, 1.0);
    EXPECT_EQ(ledger.pruneOlderThan(40.0), 40);
    EXPECT_EQ(ledger.count(), 60);
    EXPECT_EQ(ledger.pruneToCount(10), 50);
    LedgerStatistics stats = ledger.statistics();
    EXPECT_EQ(stats.count, 10);
    ASSERT_TRUE(stats.firstTimestamp.has_value());
    EXPECT_EQ(*stats.firstTimestamp, kBase + 90 * kSecond);
    EXPECT_DOUBLE_EQ(stats.timeSpan, 9.0);
    EXPECT_TRUE(ledger.snapshot().isConsistent());
}
TEST(ChannelLedgerTest, PruneEverythingEmptiesStatistics) {
    ChannelLedger ledger(QStringLiteral("/ch"));
    fillLedger(ledger, 5, 1.0);
    EXPECT_EQ(ledger.pruneOlderThan(100.0), 5);
    EXPECT_TRUE(ledger.isEmpty());
    EXPECT_FALSE(ledger.statistics().firstTimestamp.has_value());
    EXPECT_FALSE(ledger.lastPoint().has_value());
}
TEST(ChannelLedgerTest, SnapshotWithMismatchedCountIsInconsistent) {
    ChannelLedger ledger(QStringLiteral("/ch"));
    fillLedger(ledger, 3, 1.0);
    LedgerSnapshot snapshot(ledger.snapshot().points(), 5);
    EXPECT_EQ(snapshot.reportedCount(), 5);
    EXPECT_EQ(snapshot.size(), 3);
    EXPECT_FALSE(snapshot.isConsistent());
    // Range snapshots report what they copied
    EXPECT_TRUE(ledger.snapshotElapsedRange(1.0, 2.0).isConsistent());
}
