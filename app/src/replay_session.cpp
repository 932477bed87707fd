#include "replay_session.h"

#include <QFile>
#include <QLoggingCategory>

#include <algorithm>

#include "telemetry_store.h"
#include "virtual_table.h"

Q_LOGGING_CATEGORY(lcGridSyncReplay, "gridsync.replay")

ReplaySession::ReplaySession(const TableDefinition& definition)
    : m_definition(definition)
{
}

ReplaySession::CaptureResult ReplaySession::loadCapture(const QString& filePath)
{
    CaptureResult result;

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        result.errorMessage = QStringLiteral("Cannot open file: %1").arg(file.errorString());
        return result;
    }

    QByteArray data = file.readAll();
    file.close();
    return parseCapture(data);
}

ReplaySession::CaptureResult ReplaySession::parseCapture(const QByteArray& data)
{
    CaptureResult result;

    const QList<QByteArray> lines = data.split('\n');
    for (const QByteArray& rawLine : lines) {
        const QString line = QString::fromUtf8(rawLine).trimmed();
        if (line.isEmpty() || line.startsWith(QLatin1Char('#'))) {
            continue;
        }

        // The value may itself contain commas
        const int firstComma = line.indexOf(QLatin1Char(','));
        const int secondComma = firstComma < 0 ? -1 : line.indexOf(QLatin1Char(','), firstComma + 1);
        if (secondComma < 0) {
            ++result.skippedLines;
            continue;
        }

        bool ok = false;
        CaptureRecord record;
        record.channelId = line.left(firstComma).trimmed();
        record.timestampNs = line.mid(firstComma + 1, secondComma - firstComma - 1).trimmed().toLongLong(&ok);
        if (!ok || record.channelId.isEmpty()) {
            ++result.skippedLines;
            continue;
        }
        record.value = parseValue(line.mid(secondComma + 1).trimmed());
        result.records.push_back(record);
    }

    result.success = true;
    return result;
}

TelemetryValue ReplaySession::parseValue(const QString& text)
{
    if (text.isEmpty()) {
        return TelemetryValue::missing();
    }
    bool ok = false;
    const double number = text.toDouble(&ok);
    if (ok) {
        return TelemetryValue::number(number);
    }
    if (text == QStringLiteral("true")) {
        return TelemetryValue::boolean(true);
    }
    if (text == QStringLiteral("false")) {
        return TelemetryValue::boolean(false);
    }
    return TelemetryValue::text(text);
}

ReplaySummary ReplaySession::run(const QVector<CaptureRecord>& records)
{
    ReplaySummary summary;

    TelemetryStore store;
    VirtualTable table(&store, m_definition);
    table.setDiagnosticSink(Diagnostics::loggingCategorySink());

    for (int offset = 0; offset < records.size(); offset += m_chunkSize) {
        const int end = std::min<int>(records.size(), offset + m_chunkSize);
        for (int i = offset; i < end; ++i) {
            const CaptureRecord& record = records[i];
            store.addPoint(record.channelId, record.value, record.timestampNs);
        }
        summary.pointsFed += end - offset;
        ++summary.chunks;

        VirtualTable::BuildOutcome outcome = table.rebuild();
        if (outcome == VirtualTable::BuildOutcome::StructuralError
            || outcome == VirtualTable::BuildOutcome::ConfigurationError) {
            ++summary.failedCalls;
        }

        // Rows before the retained tail count as written out
        summary.rowsPersisted += table.pruneRows(m_keepRows);

        qCDebug(lcGridSyncReplay) << "chunk" << summary.chunks << "points" << summary.pointsFed
                                  << "rows" << table.rowCount();
    }

    // Catch up rows capped by maxRowsPerRebuild
    while (table.rebuild() == VirtualTable::BuildOutcome::Extended) {
        summary.rowsPersisted += table.pruneRows(m_keepRows);
    }

    const TableStatistics stats = table.statistics();
    summary.rowsRemaining = stats.rowCount;
    summary.conversionFailures = stats.conversionFailures;
    summary.coverage = stats.coverage;

    const StoreStatistics storeStats = store.statistics();
    qCInfo(lcGridSyncReplay).noquote()
        << QStringLiteral("Replayed %1 points on %2 channels in %3 chunks")
               .arg(summary.pointsFed)
               .arg(storeStats.totalChannels)
               .arg(summary.chunks);
    return summary;
}
