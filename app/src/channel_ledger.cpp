#include "channel_ledger.h"

#include <QMutexLocker>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <initializer_list>
#include <limits>

static constexpr double kNanosPerSecond = 1e9;

// ============================================================================
// LedgerSnapshot
// ============================================================================

LedgerSnapshot::LedgerSnapshot(QVector<DataPoint> points, int reportedCount)
    : m_points(std::move(points))
    , m_reportedCount(reportedCount)
{
}

int LedgerSnapshot::lowerBound(double elapsed) const
{
    auto it = std::lower_bound(m_points.cbegin(), m_points.cend(), elapsed,
                               [](const DataPoint& p, double value) {
                                   return p.elapsed < value;
                               });
    return static_cast<int>(it - m_points.cbegin());
}

std::optional<DataPoint> LedgerSnapshot::nearest(double targetElapsed, double tolerance) const
{
    if (m_points.isEmpty()) {
        return std::nullopt;
    }

    std::optional<DataPoint> closest;
    double minDiff = std::numeric_limits<double>::infinity();

    if (m_points.size() < kLinearNearestLimit) {
        for (const DataPoint& point : m_points) {
            double diff = std::fabs(point.elapsed - targetElapsed);
            if (diff < minDiff && diff <= tolerance) {
                minDiff = diff;
                closest = point;
            }
        }
        return closest;
    }

    // Only the neighbours of the insertion point can be closest.
    // The earlier candidate is tested first so it keeps a tie.
    int idx = lowerBound(targetElapsed);
    for (int candidate : {idx - 1, idx}) {
        if (candidate < 0 || candidate >= m_points.size()) {
            continue;
        }
        const DataPoint& point = m_points[candidate];
        double diff = std::fabs(point.elapsed - targetElapsed);
        if (diff < minDiff && diff <= tolerance) {
            minDiff = diff;
            closest = point;
        }
    }
    return closest;
}

QVector<DataPoint> LedgerSnapshot::inRange(double start, double end) const
{
    QVector<DataPoint> result;
    if (m_points.isEmpty() || end < start) {
        return result;
    }

    if (m_points.size() < kLinearRangeLimit) {
        for (const DataPoint& point : m_points) {
            if (point.elapsed >= start && point.elapsed <= end) {
                result.append(point);
            }
        }
        return result;
    }

    int first = lowerBound(start);
    auto last = std::upper_bound(m_points.cbegin() + first, m_points.cend(), end,
                                 [](double value, const DataPoint& p) {
                                     return value < p.elapsed;
                                 });
    int count = static_cast<int>(last - m_points.cbegin()) - first;
    if (count > 0) {
        result = m_points.mid(first, count);
    }
    return result;
}

std::pair<std::optional<DataPoint>, std::optional<DataPoint>>
LedgerSnapshot::bracket(double targetElapsed, double tolerance) const
{
    std::optional<DataPoint> before;
    std::optional<DataPoint> after;
    if (m_points.isEmpty()) {
        return {before, after};
    }

    // First point strictly after the target
    auto it = std::upper_bound(m_points.cbegin(), m_points.cend(), targetElapsed,
                               [](double value, const DataPoint& p) {
                                   return value < p.elapsed;
                               });
    int idx = static_cast<int>(it - m_points.cbegin());

    if (idx > 0) {
        const DataPoint& candidate = m_points[idx - 1];
        if (targetElapsed - candidate.elapsed <= tolerance) {
            before = candidate;
        }
    }
    if (idx < m_points.size()) {
        const DataPoint& candidate = m_points[idx];
        if (candidate.elapsed - targetElapsed <= tolerance) {
            after = candidate;
        }
    }
    return {before, after};
}

std::optional<DataPoint> LedgerSnapshot::matchTimestamp(qint64 timestampNs, qint64 toleranceNs) const
{
    if (m_points.isEmpty()) {
        return std::nullopt;
    }

    if (m_points.size() < kLinearNearestLimit) {
        for (const DataPoint& point : m_points) {
            if (std::llabs(point.timestampNs - timestampNs) <= toleranceNs) {
                return point;
            }
        }
        return std::nullopt;
    }

    const qint64 low = timestampNs - toleranceNs;
    auto it = std::lower_bound(m_points.cbegin(), m_points.cend(), low,
                               [](const DataPoint& p, qint64 value) {
                                   return p.timestampNs < value;
                               });
    if (it != m_points.cend() && it->timestampNs <= timestampNs + toleranceNs) {
        return *it;
    }
    return std::nullopt;
}

LedgerSnapshot LedgerSnapshot::rebased(qint64 originNs) const
{
    QVector<DataPoint> points;
    points.reserve(m_points.size());
    for (const DataPoint& point : m_points) {
        // Invalid timestamps have no absolute position to rebase from
        if (point.timestampNs <= 0) {
            continue;
        }
        DataPoint copy = point;
        copy.elapsed = static_cast<double>(point.timestampNs - originNs) / kNanosPerSecond;
        points.append(copy);
    }
    const int count = points.size();
    return LedgerSnapshot(std::move(points), count);
}

// ============================================================================
// ChannelLedger
// ============================================================================

ChannelLedger::ChannelLedger(const QString& channelId)
    : m_channelId(channelId)
{
}

void ChannelLedger::addPoint(const TelemetryValue& value,
                             qint64 timestampNs,
                             std::optional<qint64> globalReference)
{
    QMutexLocker locker(&m_mutex);

    if (!m_firstTimestamp) {
        m_firstTimestamp = timestampNs;
    }
    m_lastTimestamp = timestampNs;

    qint64 reference = globalReference.value_or(*m_firstTimestamp);
    // Invalid samples never use the global reference, so they cannot
    // produce negative elapsed time next to valid data
    if (timestampNs <= 0) {
        reference = *m_firstTimestamp;
    }

    DataPoint point;
    point.value = value;
    point.timestampNs = timestampNs;
    point.elapsed = static_cast<double>(timestampNs - reference) / kNanosPerSecond;
    m_points.append(point);
    ++m_count;
}

std::optional<DataPoint> ChannelLedger::nearestPoint(double targetElapsed, double tolerance) const
{
    return snapshot().nearest(targetElapsed, tolerance);
}

QVector<DataPoint> ChannelLedger::pointsInRange(double startElapsed, double endElapsed) const
{
    return snapshot().inRange(startElapsed, endElapsed);
}

int ChannelLedger::pruneOlderThan(double minElapsed)
{
    QMutexLocker locker(&m_mutex);

    int toRemove = 0;
    while (toRemove < m_points.size() && m_points[toRemove].elapsed < minElapsed) {
        ++toRemove;
    }
    if (toRemove == 0) {
        return 0;
    }

    m_points.remove(0, toRemove);
    m_count -= toRemove;
    refreshBoundsLocked();
    return toRemove;
}

int ChannelLedger::pruneToCount(int maxPoints)
{
    QMutexLocker locker(&m_mutex);

    if (maxPoints < 0 || m_points.size() <= maxPoints) {
        return 0;
    }

    int toRemove = m_points.size() - maxPoints;
    m_points.remove(0, toRemove);
    m_count -= toRemove;
    refreshBoundsLocked();
    return toRemove;
}

void ChannelLedger::refreshBoundsLocked()
{
    if (m_points.isEmpty()) {
        m_firstTimestamp.reset();
        m_lastTimestamp.reset();
        m_count = 0;
        return;
    }
    m_firstTimestamp = m_points.first().timestampNs;
}

LedgerStatistics ChannelLedger::statistics() const
{
    QMutexLocker locker(&m_mutex);

    LedgerStatistics stats;
    stats.channelId = m_channelId;
    stats.count = m_count;
    stats.firstTimestamp = m_firstTimestamp;
    stats.lastTimestamp = m_lastTimestamp;

    if (m_count > 0 && m_firstTimestamp && m_lastTimestamp) {
        stats.timeSpan = static_cast<double>(*m_lastTimestamp - *m_firstTimestamp) / kNanosPerSecond;
        stats.rate = stats.timeSpan > 0.0 ? m_count / stats.timeSpan : 0.0;
    }
    return stats;
}

int ChannelLedger::count() const
{
    QMutexLocker locker(&m_mutex);
    return m_count;
}

bool ChannelLedger::isEmpty() const
{
    QMutexLocker locker(&m_mutex);
    return m_points.isEmpty();
}

std::optional<DataPoint> ChannelLedger::lastPoint() const
{
    QMutexLocker locker(&m_mutex);
    if (m_points.isEmpty()) {
        return std::nullopt;
    }
    return m_points.last();
}

LedgerSnapshot ChannelLedger::makeSnapshot(int from, int to, int maxPoints) const
{
    int available = to - from;
    if (maxPoints >= 0 && available > maxPoints) {
        from = to - maxPoints;
        available = maxPoints;
    }
    if (from == 0 && to == m_points.size()) {
        // Implicitly shared copy, detached by the writer on its next append
        return LedgerSnapshot(m_points, m_count);
    }
    // A partial snapshot is self-consistent by construction
    return LedgerSnapshot(m_points.mid(from, available), available);
}

LedgerSnapshot ChannelLedger::snapshot(int maxPoints) const
{
    QMutexLocker locker(&m_mutex);
    return makeSnapshot(0, m_points.size(), maxPoints);
}

LedgerSnapshot ChannelLedger::snapshotElapsedRange(double minElapsed, double maxElapsed) const
{
    QMutexLocker locker(&m_mutex);
    auto first = std::lower_bound(m_points.cbegin(), m_points.cend(), minElapsed,
                                  [](const DataPoint& p, double value) {
                                      return p.elapsed < value;
                                  });
    auto last = std::upper_bound(first, m_points.cend(), maxElapsed,
                                 [](double value, const DataPoint& p) {
                                     return value < p.elapsed;
                                 });
    return makeSnapshot(static_cast<int>(first - m_points.cbegin()),
                        static_cast<int>(last - m_points.cbegin()), -1);
}

LedgerSnapshot ChannelLedger::snapshotTimestampRange(qint64 minTimestampNs, qint64 maxTimestampNs) const
{
    QMutexLocker locker(&m_mutex);
    auto first = std::lower_bound(m_points.cbegin(), m_points.cend(), minTimestampNs,
                                  [](const DataPoint& p, qint64 value) {
                                      return p.timestampNs < value;
                                  });
    auto last = std::upper_bound(first, m_points.cend(), maxTimestampNs,
                                 [](qint64 value, const DataPoint& p) {
                                     return value < p.timestampNs;
                                 });
    return makeSnapshot(static_cast<int>(first - m_points.cbegin()),
                        static_cast<int>(last - m_points.cbegin()), -1);
}
