#include "column_resolver.h"

#include <cmath>

static constexpr double kSameInstantEpsilon = 1e-9;

const LedgerSnapshot* BuildSnapshot::channel(const QString& channelId) const
{
    auto it = channels.constFind(channelId);
    if (it == channels.constEnd()) {
        return nullptr;
    }
    return &it.value();
}

void ForwardFillState::reset(int columnCount)
{
    values = QVector<Cell>(columnCount);
}

std::optional<DataPoint> ColumnResolver::findAnchor(const LedgerSnapshot& reference,
                                                    double targetElapsed,
                                                    double rowInterval)
{
    return reference.nearest(targetElapsed, rowInterval * 0.5);
}

Cell ColumnResolver::resolveSynchronized(const LedgerSnapshot& channel,
                                         const std::optional<DataPoint>& anchor,
                                         qint64 toleranceNs)
{
    if (!anchor) {
        return std::nullopt;
    }
    std::optional<DataPoint> match = channel.matchTimestamp(anchor->timestampNs, toleranceNs);
    if (!match) {
        return std::nullopt;
    }
    return match->value;
}

TelemetryValue ColumnResolver::interpolate(const DataPoint& before,
                                           const DataPoint& after,
                                           double targetElapsed)
{
    const double t1 = before.elapsed;
    const double t2 = after.elapsed;

    if (std::fabs(t2 - t1) < kSameInstantEpsilon) {
        return before.value;
    }

    if (before.value.isNumber() && after.value.isNumber()) {
        const double v1 = before.value.toNumber();
        const double v2 = after.value.toNumber();
        return TelemetryValue::number(v1 + (v2 - v1) * (targetElapsed - t1) / (t2 - t1));
    }

    // Non-numeric values cannot be blended
    return std::fabs(targetElapsed - t1) <= std::fabs(t2 - targetElapsed) ? before.value
                                                                          : after.value;
}

Cell ColumnResolver::resolveInterpolated(const LedgerSnapshot& channel,
                                         double targetElapsed,
                                         double tolerance)
{
    auto [before, after] = channel.bracket(targetElapsed, tolerance);

    if (before && after) {
        return interpolate(*before, *after, targetElapsed);
    }
    if (before) {
        return before->value;
    }
    if (after) {
        return after->value;
    }
    return std::nullopt;
}

Cell ColumnResolver::resolveNearest(const LedgerSnapshot& channel,
                                    double targetElapsed,
                                    double tolerance)
{
    std::optional<DataPoint> point = channel.nearest(targetElapsed, tolerance);
    if (!point) {
        return std::nullopt;
    }
    return point->value;
}

QVector<Cell> ColumnResolver::resolveRow(const QVector<ColumnSpec>& columns,
                                         const BuildSnapshot& snapshot,
                                         double targetElapsed,
                                         const ResolveParameters& params,
                                         ForwardFillState& fill,
                                         int* conversionFailures)
{
    QVector<Cell> cells(columns.size());
    if (fill.values.size() != columns.size()) {
        fill.reset(columns.size());
    }

    const double wideTolerance = params.rowInterval * 2.0;
    const std::optional<DataPoint> anchor =
        findAnchor(snapshot.reference, targetElapsed, params.rowInterval);

    for (int i = 0; i < columns.size(); ++i) {
        const ColumnSpec& column = columns[i];
        if (column.isComputed()) {
            continue;
        }

        const LedgerSnapshot* channel = snapshot.channel(*column.channelId);
        Cell raw;
        if (channel) {
            switch (column.policy) {
            case ColumnPolicy::Synchronized:
                raw = resolveSynchronized(*channel, anchor, params.synchronizedToleranceNs);
                break;
            case ColumnPolicy::Interpolated:
                raw = resolveInterpolated(*channel, targetElapsed, wideTolerance);
                break;
            case ColumnPolicy::Asynchronous:
                raw = resolveNearest(*channel, targetElapsed, wideTolerance);
                break;
            }
        }

        if (!raw) {
            // Synchronized cells are never filled from older data
            if (column.policy != ColumnPolicy::Synchronized) {
                cells[i] = fill.values[i];
            }
            continue;
        }

        ConversionResult converted = column.converter ? column.converter(*raw)
                                                      : ConversionResult::ok(*raw);
        if (!converted.success) {
            if (conversionFailures) {
                ++(*conversionFailures);
            }
            continue;
        }

        cells[i] = converted.value;
        fill.values[i] = converted.value;
    }

    return cells;
}
