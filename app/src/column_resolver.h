#ifndef COLUMN_RESOLVER_H
#define COLUMN_RESOLVER_H

#include <QHash>
#include <QString>
#include <QVector>

#include <optional>

#include "channel_ledger.h"
#include "column_spec.h"

using Cell = std::optional<TelemetryValue>;

// Snapshots taken once per build/rebuild call and handed to the resolvers
struct BuildSnapshot
{
    LedgerSnapshot reference;
    QHash<QString, LedgerSnapshot> channels;

    // nullptr when the channel had no ledger at snapshot time
    const LedgerSnapshot* channel(const QString& channelId) const;
};

struct ResolveParameters
{
    double rowInterval = 1.0;
    qint64 synchronizedToleranceNs = 1000;
};

// Last converted value per column, carried into rows with no fresh match
struct ForwardFillState
{
    QVector<Cell> values;

    void reset(int columnCount);
};

class ColumnResolver
{
public:
    // Reference point nearest t within half a row interval
    static std::optional<DataPoint> findAnchor(const LedgerSnapshot& reference,
                                               double targetElapsed,
                                               double rowInterval);

    // Point sharing the anchor's absolute timestamp; never approximated
    static Cell resolveSynchronized(const LedgerSnapshot& channel,
                                    const std::optional<DataPoint>& anchor,
                                    qint64 toleranceNs);

    static Cell resolveInterpolated(const LedgerSnapshot& channel,
                                    double targetElapsed,
                                    double tolerance);

    static Cell resolveNearest(const LedgerSnapshot& channel,
                               double targetElapsed,
                               double tolerance);

    // Linear for two numbers, otherwise the nearer point (earlier on a tie)
    static TelemetryValue interpolate(const DataPoint& before,
                                      const DataPoint& after,
                                      double targetElapsed);

    // Resolves and converts every column for one grid time. Computed columns
    // stay empty. conversionFailures counts cells dropped by converters.
    static QVector<Cell> resolveRow(const QVector<ColumnSpec>& columns,
                                    const BuildSnapshot& snapshot,
                                    double targetElapsed,
                                    const ResolveParameters& params,
                                    ForwardFillState& fill,
                                    int* conversionFailures = nullptr);
};

#endif // COLUMN_RESOLVER_H
