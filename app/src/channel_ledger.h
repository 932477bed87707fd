#ifndef CHANNEL_LEDGER_H
#define CHANNEL_LEDGER_H

#include <QMutex>
#include <QString>
#include <QVector>

#include <optional>
#include <utility>

#include "telemetry_value.h"

struct LedgerStatistics
{
    QString channelId;
    int count = 0;
    std::optional<qint64> firstTimestamp;
    std::optional<qint64> lastTimestamp;
    double timeSpan = 0.0;  // Seconds between first and last timestamp
    double rate = 0.0;      // Points per second over timeSpan
};

// Immutable copy of a ledger's points, taken under the ledger lock and
// queried without it. Points are assumed ordered by elapsed time.
class LedgerSnapshot
{
public:
    LedgerSnapshot() = default;
    LedgerSnapshot(QVector<DataPoint> points, int reportedCount);

    bool isEmpty() const { return m_points.isEmpty(); }
    int size() const { return m_points.size(); }
    const QVector<DataPoint>& points() const { return m_points; }
    const DataPoint& first() const { return m_points.first(); }
    const DataPoint& last() const { return m_points.last(); }

    // Count the ledger reported when the snapshot was taken
    int reportedCount() const { return m_reportedCount; }
    bool isConsistent() const { return m_reportedCount == m_points.size(); }

    // Closest point within tolerance; the earlier point wins a tie
    std::optional<DataPoint> nearest(double targetElapsed, double tolerance) const;

    // Points with start <= elapsed <= end
    QVector<DataPoint> inRange(double start, double end) const;

    // Nearest point before/at and strictly after the target, each within tolerance
    std::pair<std::optional<DataPoint>, std::optional<DataPoint>>
    bracket(double targetElapsed, double tolerance) const;

    // First point whose absolute timestamp lies within toleranceNs of timestampNs
    std::optional<DataPoint> matchTimestamp(qint64 timestampNs, qint64 toleranceNs) const;

    // Copy with elapsed recomputed as (timestamp - originNs) / 1e9
    LedgerSnapshot rebased(qint64 originNs) const;

    // Index of the first point with elapsed >= value
    int lowerBound(double elapsed) const;

    static constexpr int kLinearNearestLimit = 50;
    static constexpr int kLinearRangeLimit = 100;

private:
    QVector<DataPoint> m_points;
    int m_reportedCount = 0;
};

class ChannelLedger
{
public:
    explicit ChannelLedger(const QString& channelId);

    QString channelId() const { return m_channelId; }

    // globalReference is the store-wide first valid timestamp, when known
    void addPoint(const TelemetryValue& value,
                  qint64 timestampNs,
                  std::optional<qint64> globalReference = std::nullopt);

    std::optional<DataPoint> nearestPoint(double targetElapsed, double tolerance) const;
    QVector<DataPoint> pointsInRange(double startElapsed, double endElapsed) const;

    // Remove points older than minElapsed from the front
    int pruneOlderThan(double minElapsed);
    // Trim from the front until at most maxPoints remain
    int pruneToCount(int maxPoints);

    LedgerStatistics statistics() const;
    int count() const;
    bool isEmpty() const;
    std::optional<DataPoint> lastPoint() const;

    // Snapshot-then-query: every read goes through one of these.
    // maxPoints < 0 keeps everything, otherwise only the most recent points.
    LedgerSnapshot snapshot(int maxPoints = -1) const;
    // Points inside [min, max], by elapsed time or by absolute timestamp
    LedgerSnapshot snapshotElapsedRange(double minElapsed, double maxElapsed) const;
    LedgerSnapshot snapshotTimestampRange(qint64 minTimestampNs, qint64 maxTimestampNs) const;

private:
    LedgerSnapshot makeSnapshot(int from, int to, int maxPoints) const;
    void refreshBoundsLocked();

    mutable QMutex m_mutex;
    QString m_channelId;
    QVector<DataPoint> m_points;
    std::optional<qint64> m_firstTimestamp;
    std::optional<qint64> m_lastTimestamp;
    int m_count = 0;
};

#endif // CHANNEL_LEDGER_H
