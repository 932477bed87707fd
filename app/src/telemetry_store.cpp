#include "telemetry_store.h"
#include <QMutexLocker>

TelemetryStore::TelemetryStore(QObject* parent)
    : QObject(parent)
    , m_sessionStart(QDateTime::currentDateTimeUtc())
{
}

void TelemetryStore::addPoint(const QString& channelId, const TelemetryValue& value, qint64 timestampNs)
{
    QMutexLocker locker(&m_mutex);

    bool created = false;
    QSharedPointer<ChannelLedger>& ledger = m_ledgers[channelId];
    if (!ledger) {
        ledger = QSharedPointer<ChannelLedger>::create(channelId);
        created = true;
    }

    if (!m_globalFirstTimestamp && timestampNs > 0) {
        m_globalFirstTimestamp = timestampNs;
    }

    // The ledger has its own lock; keep the map locked so clear() cannot
    // drop the ledger while the point is being recorded
    ledger->addPoint(value, timestampNs, m_globalFirstTimestamp);

    locker.unlock();
    if (created) {
        emit channelAdded(channelId);
    }
}

QSharedPointer<ChannelLedger> TelemetryStore::ledger(const QString& channelId) const
{
    QMutexLocker locker(&m_mutex);
    return m_ledgers.value(channelId);
}

QStringList TelemetryStore::channelIds() const
{
    QMutexLocker locker(&m_mutex);
    return m_ledgers.keys();
}

std::optional<qint64> TelemetryStore::globalFirstTimestamp() const
{
    QMutexLocker locker(&m_mutex);
    return m_globalFirstTimestamp;
}

QList<QSharedPointer<ChannelLedger>> TelemetryStore::ledgers() const
{
    QMutexLocker locker(&m_mutex);
    return m_ledgers.values();
}

QHash<QString, std::optional<DataPoint>> TelemetryStore::snapshotAt(double targetElapsed,
                                                                    double tolerance) const
{
    QHash<QString, std::optional<DataPoint>> result;
    for (const QSharedPointer<ChannelLedger>& ledger : ledgers()) {
        result.insert(ledger->channelId(), ledger->nearestPoint(targetElapsed, tolerance));
    }
    return result;
}

QHash<QString, QVector<DataPoint>> TelemetryStore::pointsInRange(double startElapsed,
                                                                 double endElapsed) const
{
    QHash<QString, QVector<DataPoint>> result;
    for (const QSharedPointer<ChannelLedger>& ledger : ledgers()) {
        result.insert(ledger->channelId(), ledger->pointsInRange(startElapsed, endElapsed));
    }
    return result;
}

QHash<QString, int> TelemetryStore::prune(double minElapsed, int maxPointsPerChannel)
{
    QHash<QString, int> pruned;
    for (const QSharedPointer<ChannelLedger>& ledger : ledgers()) {
        int removed = ledger->pruneOlderThan(minElapsed);
        // Hard cap applies even when nothing was old enough
        removed += ledger->pruneToCount(maxPointsPerChannel);
        if (removed > 0) {
            pruned.insert(ledger->channelId(), removed);
        }
    }
    return pruned;
}

StoreStatistics TelemetryStore::statistics() const
{
    StoreStatistics stats;
    {
        QMutexLocker locker(&m_mutex);
        stats.globalFirstTimestamp = m_globalFirstTimestamp;
        stats.sessionStart = m_sessionStart;
    }
    stats.sessionDuration = stats.sessionStart.msecsTo(QDateTime::currentDateTimeUtc()) / 1000.0;

    for (const QSharedPointer<ChannelLedger>& ledger : ledgers()) {
        LedgerStatistics channelStats = ledger->statistics();
        stats.totalPoints += channelStats.count;
        stats.channels.insert(channelStats.channelId, channelStats);
    }
    stats.totalChannels = stats.channels.size();
    return stats;
}

int TelemetryStore::channelCount(const QString& channelId) const
{
    QSharedPointer<ChannelLedger> channel = ledger(channelId);
    return channel ? channel->count() : 0;
}

qint64 TelemetryStore::totalCount() const
{
    qint64 total = 0;
    for (const QSharedPointer<ChannelLedger>& ledger : ledgers()) {
        total += ledger->count();
    }
    return total;
}

void TelemetryStore::clear()
{
    QMutexLocker locker(&m_mutex);
    m_ledgers.clear();
    m_globalFirstTimestamp.reset();
    m_sessionStart = QDateTime::currentDateTimeUtc();
}
