#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>

#include "replay_session.h"
#include "table_definition_loader.h"

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("gridsync-replay"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Replay a telemetry capture through a virtual table"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("capture"),
                                 QStringLiteral("CSV capture, one 'channel,timestamp_ns,value' per line"));

    QCommandLineOption definitionOption(QStringList{QStringLiteral("d"), QStringLiteral("definition")},
                                        QStringLiteral("Table definition JSON file"),
                                        QStringLiteral("file"));
    QCommandLineOption builtinOption(QStringList{QStringLiteral("b"), QStringLiteral("builtin")},
                                     QStringLiteral("Builtin definition by name"),
                                     QStringLiteral("name"));
    QCommandLineOption chunkOption(QStringLiteral("chunk"),
                                   QStringLiteral("Points ingested between rebuilds"),
                                   QStringLiteral("count"),
                                   QStringLiteral("1000"));
    QCommandLineOption keepOption(QStringLiteral("keep"),
                                  QStringLiteral("Rows kept after each persistence step"),
                                  QStringLiteral("count"),
                                  QStringLiteral("100"));
    parser.addOption(definitionOption);
    parser.addOption(builtinOption);
    parser.addOption(chunkOption);
    parser.addOption(keepOption);
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        parser.showHelp(1);
    }

    TableDefinition definition = TableDefinitionLoader::builtinDefault();
    if (parser.isSet(definitionOption)) {
        TableDefinitionLoader::LoadResult loaded =
            TableDefinitionLoader::loadFromFile(parser.value(definitionOption));
        if (!loaded.success) {
            err << "Failed to load definition: " << loaded.errorMessage << "\n";
            return 1;
        }
        definition = loaded.definition;
    } else if (parser.isSet(builtinOption)) {
        const QString name = parser.value(builtinOption);
        bool found = false;
        for (const TableDefinition& candidate : TableDefinitionLoader::builtinDefinitions()) {
            if (candidate.name.startsWith(name, Qt::CaseInsensitive)) {
                definition = candidate;
                found = true;
                break;
            }
        }
        if (!found) {
            err << "Unknown builtin definition: " << name << "\n";
            return 1;
        }
    }

    TableDefinitionLoader::ValidationResult validation = TableDefinitionLoader::validate(definition);
    for (const QString& warning : validation.warnings) {
        err << "warning: " << warning << "\n";
    }
    if (!validation.valid) {
        for (const QString& error : validation.errors) {
            err << "error: " << error << "\n";
        }
        return 1;
    }

    ReplaySession::CaptureResult capture = ReplaySession::loadCapture(positional.first());
    if (!capture.success) {
        err << "Failed to load capture: " << capture.errorMessage << "\n";
        return 1;
    }
    if (capture.skippedLines > 0) {
        err << "warning: skipped " << capture.skippedLines << " malformed lines\n";
    }

    ReplaySession session(definition);
    session.setChunkSize(parser.value(chunkOption).toInt());
    session.setKeepRows(parser.value(keepOption).toInt());
    const ReplaySummary summary = session.run(capture.records);

    out << "Definition:          " << definition.name << "\n";
    out << "Points fed:          " << summary.pointsFed << "\n";
    out << "Chunks:              " << summary.chunks << "\n";
    out << "Rows persisted:      " << summary.rowsPersisted << "\n";
    out << "Rows remaining:      " << summary.rowsRemaining << "\n";
    out << "Failed rebuilds:     " << summary.failedCalls << "\n";
    out << "Conversion failures: " << summary.conversionFailures << "\n";
    out << "Coverage:            " << QString::number(summary.coverage * 100.0, 'f', 1) << "%\n";

    return summary.failedCalls > 0 ? 2 : 0;
}
