#ifndef REPLAY_SESSION_H
#define REPLAY_SESSION_H

#include <QString>
#include <QVector>

#include "table_definition.h"
#include "telemetry_value.h"

struct CaptureRecord
{
    QString channelId;
    qint64 timestampNs = 0;
    TelemetryValue value;
};

struct ReplaySummary
{
    int pointsFed = 0;
    int chunks = 0;
    int rowsPersisted = 0;  // Rows dropped by pruneRows after "persisting"
    int rowsRemaining = 0;
    int failedCalls = 0;    // rebuild() calls that ended in an error outcome
    qint64 conversionFailures = 0;
    double coverage = 0.0;
};

// Feeds a recorded capture through a TelemetryStore and a VirtualTable the
// way a live session would: ingest a chunk, rebuild, persist, prune.
class ReplaySession
{
public:
    struct CaptureResult
    {
        bool success = false;
        QString errorMessage;
        QVector<CaptureRecord> records;
        int skippedLines = 0;
    };

    explicit ReplaySession(const TableDefinition& definition);

    // CSV lines "channel,timestamp_ns,value"; '#' starts a comment line
    static CaptureResult loadCapture(const QString& filePath);
    static CaptureResult parseCapture(const QByteArray& data);

    // Empty text is missing, numbers and true/false keep their kind
    static TelemetryValue parseValue(const QString& text);

    void setChunkSize(int chunkSize) { m_chunkSize = chunkSize > 0 ? chunkSize : 1; }
    void setKeepRows(int keepRows) { m_keepRows = keepRows; }

    ReplaySummary run(const QVector<CaptureRecord>& records);

private:
    TableDefinition m_definition;
    int m_chunkSize = 1000;
    int m_keepRows = 100;
};

#endif // REPLAY_SESSION_H
