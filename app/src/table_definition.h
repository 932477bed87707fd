#ifndef TABLE_DEFINITION_H
#define TABLE_DEFINITION_H

#include <QString>
#include <QStringList>
#include <QVector>

#include <cstdint>

#include "column_spec.h"
#include "diagnostics.h"

// ============================================================================
// Engine limits and heuristics
// ============================================================================

struct TableLimits
{
    int maxSnapshotPoints = 100000;    // Most recent points copied per channel
    int maxRowsPerRebuild = 10000;     // Rows appended by one rebuild() call
    int progressInterval = 10000;      // Rows between progress reports on large builds
    int lookbackRows = 4;              // Grid steps of history kept for rebuild lookups
    double maxPlausibleSpanSec = 86400.0;
    qint64 synchronizedToleranceNs = 1000;
};

// Lets rebuild() produce rows when reference points pile up at nearly the
// same elapsed time without the newest point reaching the next grid step.
struct BurstPolicy
{
    int minNewReferencePoints = 500;  // 0 disables the policy
    int extensionRows = 1;            // Grid steps added when it triggers
};

// ============================================================================
// Table definition (one per device model / logging session)
// ============================================================================

struct TableDefinition
{
    int version = 1;
    QString name;
    QString description;
    QString filePath;  // Source file (empty for builtin)
    QString referenceChannel;
    double samplingRate = 0.0;  // Rows per second
    QVector<ColumnSpec> columns;
    TableLimits limits;
    BurstPolicy burstPolicy;
    DiagnosticSettings diagnostics;

    QStringList headers() const;
};

// Builtin definitions for the supported devices
QVector<TableDefinition> builtinTableDefinitions();

#endif // TABLE_DEFINITION_H
