#ifndef TELEMETRY_STORE_H
#define TELEMETRY_STORE_H

#include <QObject>
#include <QMutex>
#include <QHash>
#include <QSharedPointer>
#include <QStringList>
#include <QDateTime>

#include <optional>

#include "channel_ledger.h"

struct StoreStatistics
{
    std::optional<qint64> globalFirstTimestamp;
    QDateTime sessionStart;
    double sessionDuration = 0.0;  // Seconds since sessionStart
    int totalChannels = 0;
    qint64 totalPoints = 0;
    QHash<QString, LedgerStatistics> channels;
};

class TelemetryStore : public QObject
{
    Q_OBJECT
public:
    explicit TelemetryStore(QObject* parent = nullptr);

    // Ingest entry point; never fails
    void addPoint(const QString& channelId, const TelemetryValue& value, qint64 timestampNs);

    // Data access
    QSharedPointer<ChannelLedger> ledger(const QString& channelId) const;
    QStringList channelIds() const;
    std::optional<qint64> globalFirstTimestamp() const;

    QHash<QString, std::optional<DataPoint>> snapshotAt(double targetElapsed,
                                                        double tolerance = 0.001) const;
    QHash<QString, QVector<DataPoint>> pointsInRange(double startElapsed, double endElapsed) const;

    // Returns removed counts for channels that lost points
    QHash<QString, int> prune(double minElapsed, int maxPointsPerChannel = 100000);

    StoreStatistics statistics() const;
    int channelCount(const QString& channelId) const;
    qint64 totalCount() const;

    // Clear all data, including the global reference
    void clear();

signals:
    void channelAdded(const QString& channelId);

private:
    QList<QSharedPointer<ChannelLedger>> ledgers() const;

    mutable QMutex m_mutex;
    QHash<QString, QSharedPointer<ChannelLedger>> m_ledgers;
    std::optional<qint64> m_globalFirstTimestamp;
    QDateTime m_sessionStart;
};

#endif // TELEMETRY_STORE_H
