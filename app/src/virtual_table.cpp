#include "virtual_table.h"

#include <QMutexLocker>

#include <algorithm>
#include <cmath>
#include <limits>

#include "telemetry_store.h"

// Grid times that land this close past the newest point still count
static constexpr double kGridEpsilon = 1e-9;

// Minimum history, in grid steps, a rebuild window keeps before its first row.
// The interpolation bracket looks back two steps.
static constexpr int kMinLookbackRows = 3;

VirtualTable::VirtualTable(const TelemetryStore* store, const TableDefinition& definition)
    : m_store(store)
    , m_referenceChannel(definition.referenceChannel)
    , m_samplingRate(definition.samplingRate)
    , m_columns(definition.columns)
    , m_limits(definition.limits)
    , m_burstPolicy(definition.burstPolicy)
    , m_throttle(definition.diagnostics)
{
    m_fill.reset(m_columns.size());
}

VirtualTable::VirtualTable(const TelemetryStore* store,
                           const QString& referenceChannel,
                           double samplingRate,
                           const QVector<ColumnSpec>& columns)
    : m_store(store)
    , m_referenceChannel(referenceChannel)
    , m_samplingRate(samplingRate)
    , m_columns(columns)
{
    m_fill.reset(m_columns.size());
}

void VirtualTable::setDiagnosticSink(const DiagnosticSink& sink)
{
    m_throttle.setSink(sink);
}

// ============================================================================
// Build
// ============================================================================

VirtualTable::BuildOutcome VirtualTable::build()
{
    if (isBuilt()) {
        return BuildOutcome::NoChange;
    }
    if (!checkConfiguration()) {
        return BuildOutcome::ConfigurationError;
    }

    QSharedPointer<ChannelLedger> ledger = m_store ? m_store->ledger(m_referenceChannel)
                                                   : QSharedPointer<ChannelLedger>();
    if (!ledger) {
        return failMissingReference(QStringLiteral("build"));
    }

    const int referenceCount = ledger->count();
    LedgerSnapshot reference = ledger->snapshot(m_limits.maxSnapshotPoints);
    if (reference.isEmpty()) {
        return failMissingReference(QStringLiteral("build"));
    }
    if (!reference.isConsistent()) {
        return failStructural(QStringLiteral("Reference channel %1 reports %2 points but holds %3")
                                  .arg(m_referenceChannel)
                                  .arg(reference.reportedCount())
                                  .arg(reference.size()));
    }

    double first = reference.first().elapsed;
    double last = reference.last().elapsed;
    if (!std::isfinite(first) || !std::isfinite(last)) {
        return failStructural(QStringLiteral("Reference channel %1 has non-finite elapsed times")
                                  .arg(m_referenceChannel));
    }
    if (last < first) {
        return failStructural(QStringLiteral("Reference channel %1 ends at %2 s before it starts at %3 s")
                                  .arg(m_referenceChannel)
                                  .arg(last)
                                  .arg(first));
    }

    Timebase timebase;
    if (!isSpanPlausible(first, last)) {
        // Elapsed times were derived from a bad global reference; fall back
        // to the reference channel's own absolute timestamps
        const qint64 originNs = reference.first().timestampNs;
        if (originNs <= 0) {
            return failStructural(QStringLiteral("Reference span %1..%2 s is implausible and has no valid timestamp to recover from")
                                      .arg(first)
                                      .arg(last));
        }
        LedgerSnapshot recovered = reference.rebased(originNs);
        if (recovered.isEmpty()
            || recovered.last().elapsed < recovered.first().elapsed
            || !isSpanPlausible(recovered.first().elapsed, recovered.last().elapsed)) {
            return failStructural(QStringLiteral("Reference span %1..%2 s is implausible, even from absolute timestamps")
                                      .arg(first)
                                      .arg(last));
        }

        m_throttle.report(QStringLiteral("Reference span %1..%2 s is implausible; recomputed from absolute timestamps as %3..%4 s")
                              .arg(first)
                              .arg(last)
                              .arg(recovered.first().elapsed)
                              .arg(recovered.last().elapsed),
                          DiagnosticLevel::Warning);
        reference = recovered;
        first = reference.first().elapsed;
        last = reference.last().elapsed;
        timebase.rebased = true;
        timebase.originNs = originNs;
    }

    const BuildSnapshot snapshot = takeSnapshot(reference, std::nullopt, timebase);
    const double interval = rowInterval();
    ResolveParameters params;
    params.rowInterval = interval;
    params.synchronizedToleranceNs = m_limits.synchronizedToleranceNs;

    ForwardFillState fill;
    fill.reset(m_columns.size());
    int conversionFailures = 0;
    QVector<VirtualRow> rows;

    const double span = last - first;
    if (span == 0.0) {
        // Every reference point shares one instant
        VirtualRow row;
        row.timestamp = first;
        row.cells = ColumnResolver::resolveRow(m_columns, snapshot, first, params, fill,
                                               &conversionFailures);
        rows.append(row);
    } else {
        const qint64 estimated = static_cast<qint64>(std::floor(span / interval + kGridEpsilon)) + 1;
        const qint64 maxIterations = estimated + estimated / 10 + 10;
        rows.reserve(static_cast<int>(std::min<qint64>(estimated, std::numeric_limits<int>::max())));

        qint64 index = 0;
        for (; index < maxIterations; ++index) {
            const double t = first + static_cast<double>(index) * interval;
            if (t > last + kGridEpsilon) {
                break;
            }

            VirtualRow row;
            row.timestamp = t;
            row.cells = ColumnResolver::resolveRow(m_columns, snapshot, t, params, fill,
                                                   &conversionFailures);
            rows.append(row);

            if (m_limits.progressInterval > 0 && rows.size() % m_limits.progressInterval == 0) {
                m_throttle.report(QStringLiteral("Building rows: %1 of ~%2").arg(rows.size()).arg(estimated),
                                  DiagnosticLevel::Info);
            }
        }
        if (index >= maxIterations) {
            m_throttle.report(QStringLiteral("Build stopped at the iteration cap of %1 rows").arg(maxIterations),
                              DiagnosticLevel::Warning);
        }
    }

    {
        QMutexLocker locker(&m_rowsMutex);
        m_rows = rows;
        m_built = true;
        m_lastBuiltTime = rows.last().timestamp;
    }

    m_gridStart = first;
    m_nextGridIndex = rows.size();
    m_timebase = timebase;
    m_gridStartTimestampNs = reference.first().timestampNs;
    m_referenceCountAtWatermark = referenceCount;
    m_fill = fill;
    m_conversionFailures += conversionFailures;

    m_throttle.recordSuccess(QStringLiteral("build"));
    m_throttle.report(QStringLiteral("Built %1 rows from %2 s to %3 s")
                          .arg(rows.size())
                          .arg(rows.first().timestamp)
                          .arg(rows.last().timestamp),
                      DiagnosticLevel::Info);
    return BuildOutcome::Built;
}

// ============================================================================
// Incremental rebuild
// ============================================================================

VirtualTable::BuildOutcome VirtualTable::rebuild()
{
    if (!isBuilt()) {
        return build();
    }
    if (!checkConfiguration()) {
        return BuildOutcome::ConfigurationError;
    }

    QSharedPointer<ChannelLedger> ledger = m_store ? m_store->ledger(m_referenceChannel)
                                                   : QSharedPointer<ChannelLedger>();
    if (!ledger) {
        return failMissingReference(QStringLiteral("rebuild"));
    }
    const int referenceCount = ledger->count();
    const std::optional<DataPoint> newest = ledger->lastPoint();
    if (!newest) {
        return failMissingReference(QStringLiteral("rebuild"));
    }

    double newestElapsed = m_timebase.rebased
                               ? static_cast<double>(newest->timestampNs - m_timebase.originNs) / 1e9
                               : newest->elapsed;

    if (!isNewestPlausible(newestElapsed)) {
        if (m_timebase.rebased || newest->timestampNs <= 0) {
            return failStructural(QStringLiteral("Newest reference point at %1 s is implausible")
                                      .arg(newestElapsed));
        }
        const qint64 originNs = m_gridStartTimestampNs - std::llround(m_gridStart * 1e9);
        const double recomputed = static_cast<double>(newest->timestampNs - originNs) / 1e9;
        if (!isNewestPlausible(recomputed)) {
            return failStructural(QStringLiteral("Newest reference point at %1 s is implausible, even from absolute timestamps (%2 s)")
                                      .arg(newestElapsed)
                                      .arg(recomputed));
        }
        m_throttle.report(QStringLiteral("Newest reference point at %1 s is implausible; recomputed from absolute timestamps as %2 s")
                              .arg(newestElapsed)
                              .arg(recomputed),
                          DiagnosticLevel::Warning);
        m_timebase.rebased = true;
        m_timebase.originNs = originNs;
        newestElapsed = recomputed;
    }

    const double interval = rowInterval();
    const double start = gridTime(m_nextGridIndex);

    qint64 available = lastGridIndexAtOrBefore(newestElapsed) - m_nextGridIndex + 1;
    if (available <= 0) {
        const int fresh = referenceCount - m_referenceCountAtWatermark;
        if (m_burstPolicy.minNewReferencePoints > 0 && fresh >= m_burstPolicy.minNewReferencePoints) {
            available = std::max(1, m_burstPolicy.extensionRows);
            m_throttle.report(QStringLiteral("%1 reference points arrived without reaching %2 s; extending by %3 rows")
                                  .arg(fresh)
                                  .arg(start)
                                  .arg(available),
                              DiagnosticLevel::Info);
        } else {
            m_throttle.recordSuccess(QStringLiteral("rebuild"));
            return BuildOutcome::NoChange;
        }
    }

    qint64 count = available;
    if (m_limits.maxRowsPerRebuild > 0 && count > m_limits.maxRowsPerRebuild) {
        count = m_limits.maxRowsPerRebuild;
    }

    const double lookback = std::max(m_limits.lookbackRows, kMinLookbackRows) * interval;
    SnapshotWindow window;
    window.start = start - lookback;
    window.end = gridTime(m_nextGridIndex + count - 1) + lookback;

    const LedgerSnapshot reference = channelSnapshot(m_referenceChannel, window, m_timebase);
    const BuildSnapshot snapshot = takeSnapshot(reference, window, m_timebase);

    ResolveParameters params;
    params.rowInterval = interval;
    params.synchronizedToleranceNs = m_limits.synchronizedToleranceNs;

    // Continue from the last converted values, not the last row's cells; a
    // cell blanked by a failed conversion must not clear the fill
    ForwardFillState fill = m_fill;

    int conversionFailures = 0;
    QVector<VirtualRow> newRows;
    newRows.reserve(static_cast<int>(count));
    for (qint64 k = 0; k < count; ++k) {
        VirtualRow row;
        row.timestamp = gridTime(m_nextGridIndex + k);
        row.cells = ColumnResolver::resolveRow(m_columns, snapshot, row.timestamp, params, fill,
                                               &conversionFailures);
        newRows.append(row);
    }

    {
        QMutexLocker locker(&m_rowsMutex);
        m_rows += newRows;
        m_lastBuiltTime = newRows.last().timestamp;
    }

    m_nextGridIndex += count;
    m_referenceCountAtWatermark = referenceCount;
    m_fill = fill;
    m_conversionFailures += conversionFailures;

    m_throttle.recordSuccess(QStringLiteral("rebuild"));
    if (count < available) {
        m_throttle.report(QStringLiteral("Rebuild capped at %1 rows; %2 grid steps left for the next call")
                              .arg(count)
                              .arg(available - count),
                          DiagnosticLevel::Info);
    }
    return BuildOutcome::Extended;
}

// ============================================================================
// Rows
// ============================================================================

int VirtualTable::pruneRows(int keepLastN)
{
    QMutexLocker locker(&m_rowsMutex);
    const int removed = m_rows.size() - std::max(0, keepLastN);
    if (removed <= 0) {
        return 0;
    }
    m_rows.remove(0, removed);
    return removed;
}

void VirtualTable::clear()
{
    {
        QMutexLocker locker(&m_rowsMutex);
        m_rows.clear();
        m_built = false;
        m_lastBuiltTime.reset();
    }
    m_gridStart = 0.0;
    m_nextGridIndex = 0;
    m_timebase = Timebase();
    m_gridStartTimestampNs = 0;
    m_referenceCountAtWatermark = 0;
    m_fill.reset(m_columns.size());
    m_conversionFailures = 0;
    m_throttle.reset();
}

QStringList VirtualTable::headers() const
{
    QStringList names;
    names.reserve(m_columns.size());
    for (const ColumnSpec& column : m_columns) {
        names << column.name;
    }
    return names;
}

QVector<VirtualRow> VirtualTable::rows() const
{
    QMutexLocker locker(&m_rowsMutex);
    return m_rows;
}

int VirtualTable::rowCount() const
{
    QMutexLocker locker(&m_rowsMutex);
    return m_rows.size();
}

std::optional<VirtualRow> VirtualTable::rowAt(int index) const
{
    QMutexLocker locker(&m_rowsMutex);
    if (index < 0 || index >= m_rows.size()) {
        return std::nullopt;
    }
    return m_rows.at(index);
}

std::optional<VirtualRow> VirtualTable::rowAtTime(double targetElapsed, double tolerance) const
{
    QMutexLocker locker(&m_rowsMutex);
    if (m_rows.isEmpty()) {
        return std::nullopt;
    }

    auto it = std::lower_bound(m_rows.cbegin(), m_rows.cend(), targetElapsed - tolerance,
                               [](const VirtualRow& row, double value) {
                                   return row.timestamp < value;
                               });
    if (it == m_rows.cend() || it->timestamp > targetElapsed + tolerance) {
        return std::nullopt;
    }

    // Rows are a regular grid; the next one may be closer
    auto best = it;
    auto next = it + 1;
    if (next != m_rows.cend()
        && std::fabs(next->timestamp - targetElapsed) < std::fabs(best->timestamp - targetElapsed)) {
        best = next;
    }
    return *best;
}

int VirtualTable::columnIndex(const QString& name) const
{
    for (int i = 0; i < m_columns.size(); ++i) {
        if (m_columns[i].name == name) {
            return i;
        }
    }
    return -1;
}

Cell VirtualTable::cell(const VirtualRow& row, const QString& columnName) const
{
    const int index = columnIndex(columnName);
    if (index < 0 || index >= row.cells.size()) {
        return std::nullopt;
    }
    return row.cells[index];
}

TableStatistics VirtualTable::statistics() const
{
    TableStatistics stats;
    stats.samplingRate = m_samplingRate;
    stats.conversionFailures = m_conversionFailures;

    QMutexLocker locker(&m_rowsMutex);
    stats.rowCount = m_rows.size();
    if (m_rows.isEmpty()) {
        return stats;
    }

    stats.firstTimestamp = m_rows.first().timestamp;
    stats.lastTimestamp = m_rows.last().timestamp;
    stats.timeSpan = *stats.lastTimestamp - *stats.firstTimestamp;
    if (m_samplingRate > 0.0) {
        stats.expectedRows = static_cast<int>(std::llround(stats.timeSpan * m_samplingRate)) + 1;
        stats.coverage = static_cast<double>(stats.rowCount) / stats.expectedRows;
    }
    return stats;
}

// ============================================================================
// State
// ============================================================================

double VirtualTable::rowInterval() const
{
    return m_samplingRate > 0.0 ? 1.0 / m_samplingRate : 0.0;
}

bool VirtualTable::isBuilt() const
{
    QMutexLocker locker(&m_rowsMutex);
    return m_built;
}

std::optional<double> VirtualTable::lastBuiltTime() const
{
    QMutexLocker locker(&m_rowsMutex);
    return m_lastBuiltTime;
}

// ============================================================================
// Helpers
// ============================================================================

bool VirtualTable::checkConfiguration()
{
    if (std::isfinite(m_samplingRate) && m_samplingRate > 0.0) {
        return true;
    }
    m_throttle.recordFailure(FailureKind::ConfigurationError,
                             QStringLiteral("Sampling rate %1 is not a positive number").arg(m_samplingRate),
                             DiagnosticLevel::Error);
    return false;
}

bool VirtualTable::isSpanPlausible(double firstElapsed, double lastElapsed) const
{
    return std::isfinite(firstElapsed) && std::isfinite(lastElapsed)
           && firstElapsed >= 0.0
           && firstElapsed <= m_limits.maxPlausibleSpanSec
           && lastElapsed - firstElapsed <= m_limits.maxPlausibleSpanSec;
}

bool VirtualTable::isNewestPlausible(double newestElapsed) const
{
    if (!std::isfinite(newestElapsed) || newestElapsed < m_gridStart - kGridEpsilon) {
        return false;
    }
    const double watermark = lastBuiltTime().value_or(m_gridStart);
    return newestElapsed - watermark <= m_limits.maxPlausibleSpanSec;
}

double VirtualTable::gridTime(qint64 index) const
{
    return m_gridStart + static_cast<double>(index) * rowInterval();
}

qint64 VirtualTable::lastGridIndexAtOrBefore(double elapsed) const
{
    // Same admission rule as build(): t_i <= elapsed within kGridEpsilon
    qint64 index = static_cast<qint64>(std::floor((elapsed - m_gridStart) * m_samplingRate));
    while (gridTime(index + 1) <= elapsed + kGridEpsilon) {
        ++index;
    }
    while (index >= 0 && gridTime(index) > elapsed + kGridEpsilon) {
        --index;
    }
    return index;
}

BuildSnapshot VirtualTable::takeSnapshot(const LedgerSnapshot& reference,
                                         const std::optional<SnapshotWindow>& window,
                                         const Timebase& timebase) const
{
    BuildSnapshot snapshot;
    snapshot.reference = reference;

    for (const ColumnSpec& column : m_columns) {
        if (column.isComputed() || snapshot.channels.contains(*column.channelId)) {
            continue;
        }
        const QString& channelId = *column.channelId;
        if (channelId == m_referenceChannel) {
            snapshot.channels.insert(channelId, reference);
            continue;
        }
        if (!m_store->ledger(channelId)) {
            continue;
        }
        snapshot.channels.insert(channelId, channelSnapshot(channelId, window, timebase));
    }
    return snapshot;
}

LedgerSnapshot VirtualTable::channelSnapshot(const QString& channelId,
                                             const std::optional<SnapshotWindow>& window,
                                             const Timebase& timebase) const
{
    QSharedPointer<ChannelLedger> ledger = m_store->ledger(channelId);
    if (!ledger) {
        return LedgerSnapshot();
    }

    LedgerSnapshot snapshot;
    if (!window) {
        snapshot = ledger->snapshot(m_limits.maxSnapshotPoints);
    } else if (timebase.rebased) {
        const qint64 fromNs = timebase.originNs + static_cast<qint64>(std::floor(window->start * 1e9));
        const qint64 toNs = timebase.originNs + static_cast<qint64>(std::ceil(window->end * 1e9));
        snapshot = ledger->snapshotTimestampRange(fromNs, toNs);
    } else {
        snapshot = ledger->snapshotElapsedRange(window->start, window->end);
    }

    if (timebase.rebased) {
        return snapshot.rebased(timebase.originNs);
    }
    return snapshot;
}

VirtualTable::BuildOutcome VirtualTable::failStructural(const QString& message)
{
    m_throttle.recordFailure(FailureKind::StructuralError, message, DiagnosticLevel::Error);
    return BuildOutcome::StructuralError;
}

VirtualTable::BuildOutcome VirtualTable::failMissingReference(const QString& context)
{
    m_throttle.recordSoftFailure(FailureKind::MissingReference,
                                 QStringLiteral("%1: reference channel %2 has no data yet")
                                     .arg(context, m_referenceChannel));
    return BuildOutcome::MissingReference;
}
