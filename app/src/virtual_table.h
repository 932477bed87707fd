#ifndef VIRTUAL_TABLE_H
#define VIRTUAL_TABLE_H

#include <QMutex>
#include <QString>
#include <QStringList>
#include <QVector>

#include <optional>

#include "column_resolver.h"
#include "diagnostics.h"
#include "table_definition.h"

class TelemetryStore;

struct VirtualRow
{
    double timestamp = 0.0;  // Grid position, elapsed seconds
    QVector<Cell> cells;     // One per column, in column order
};

struct TableStatistics
{
    int rowCount = 0;
    double timeSpan = 0.0;
    std::optional<double> firstTimestamp;
    std::optional<double> lastTimestamp;
    double samplingRate = 0.0;
    int expectedRows = 0;  // Grid points between first and last row
    double coverage = 0.0;
    qint64 conversionFailures = 0;
};

// Projects the channels of a TelemetryStore onto a regular grid of rows.
//
// build() materializes every grid point of the reference channel span once;
// rebuild() then appends the grid points that new reference data covers.
// Rows are only ever appended; pruneRows() is the only way to drop them.
//
// build()/rebuild() are meant to be called from a single polling thread.
// rows(), rowCount() and pruneRows() may be called from another thread.
class VirtualTable
{
public:
    enum class BuildOutcome {
        Built,              // Initial build produced rows
        Extended,           // rebuild() appended rows
        NoChange,           // Nothing new to materialize
        MissingReference,   // Reference channel absent or empty
        StructuralError,    // Inconsistent or implausible reference data
        ConfigurationError  // Sampling rate not usable
    };

    VirtualTable(const TelemetryStore* store, const TableDefinition& definition);
    VirtualTable(const TelemetryStore* store,
                 const QString& referenceChannel,
                 double samplingRate,
                 const QVector<ColumnSpec>& columns);

    void setDiagnosticSink(const DiagnosticSink& sink);
    void setLimits(const TableLimits& limits) { m_limits = limits; }
    void setBurstPolicy(const BurstPolicy& policy) { m_burstPolicy = policy; }

    BuildOutcome build();
    BuildOutcome rebuild();

    // Only call once the dropped rows have been durably consumed
    int pruneRows(int keepLastN);

    // Back to the empty state; the next build() starts from scratch
    void clear();

    // Persistence side
    QStringList headers() const;
    QVector<VirtualRow> rows() const;
    int rowCount() const;
    std::optional<VirtualRow> rowAt(int index) const;
    std::optional<VirtualRow> rowAtTime(double targetElapsed, double tolerance = 0.0001) const;

    int columnIndex(const QString& name) const;
    Cell cell(const VirtualRow& row, const QString& columnName) const;

    TableStatistics statistics() const;

    // State
    QString referenceChannel() const { return m_referenceChannel; }
    double samplingRate() const { return m_samplingRate; }
    double rowInterval() const;
    bool isBuilt() const;
    std::optional<double> lastBuiltTime() const;
    bool isRebased() const { return m_timebase.rebased; }

    // Diagnostics
    int consecutiveFailures() const { return m_throttle.consecutiveFailures(); }
    qint64 totalFailures() const { return m_throttle.totalFailures(); }
    FailureKind lastFailure() const { return m_throttle.lastFailure(); }
    int sinkFailureCount() const { return m_throttle.sinkFailureCount(); }

private:
    struct Timebase
    {
        bool rebased = false;  // Elapsed recomputed from absolute timestamps
        qint64 originNs = 0;   // Absolute time of elapsed 0 when rebased
    };

    // Table-time interval a rebuild needs to look at
    struct SnapshotWindow
    {
        double start = 0.0;
        double end = 0.0;
    };

    bool checkConfiguration();
    bool isSpanPlausible(double firstElapsed, double lastElapsed) const;
    bool isNewestPlausible(double newestElapsed) const;
    double gridTime(qint64 index) const;
    qint64 lastGridIndexAtOrBefore(double elapsed) const;

    // Snapshots of every channel the columns read
    BuildSnapshot takeSnapshot(const LedgerSnapshot& reference,
                               const std::optional<SnapshotWindow>& window,
                               const Timebase& timebase) const;
    LedgerSnapshot channelSnapshot(const QString& channelId,
                                   const std::optional<SnapshotWindow>& window,
                                   const Timebase& timebase) const;

    BuildOutcome failStructural(const QString& message);
    BuildOutcome failMissingReference(const QString& context);

    const TelemetryStore* m_store = nullptr;
    QString m_referenceChannel;
    double m_samplingRate = 0.0;
    QVector<ColumnSpec> m_columns;
    TableLimits m_limits;
    BurstPolicy m_burstPolicy;
    DiagnosticThrottle m_throttle;

    mutable QMutex m_rowsMutex;
    QVector<VirtualRow> m_rows;
    bool m_built = false;
    std::optional<double> m_lastBuiltTime;

    // Grid and timebase, fixed by build()
    double m_gridStart = 0.0;
    qint64 m_nextGridIndex = 0;
    Timebase m_timebase;
    qint64 m_gridStartTimestampNs = 0;

    int m_referenceCountAtWatermark = 0;
    ForwardFillState m_fill;
    qint64 m_conversionFailures = 0;
};

#endif // VIRTUAL_TABLE_H
