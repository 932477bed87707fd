#ifndef TABLE_DEFINITION_LOADER_H
#define TABLE_DEFINITION_LOADER_H

#include "table_definition.h"

#include <QString>
#include <QStringList>
#include <QJsonObject>
#include <QJsonArray>

class TableDefinitionLoader
{
public:
    struct LoadResult
    {
        bool success = false;
        QString errorMessage;
        TableDefinition definition;
    };

    struct ValidationResult
    {
        bool valid = true;
        QStringList warnings;
        QStringList errors;
    };

    // Load from JSON file
    static LoadResult loadFromFile(const QString& filePath);

    // Load from JSON data
    static LoadResult loadFromJson(const QByteArray& jsonData,
                                   const QString& sourceName = QString());

    // Save definition to JSON file
    static bool saveToFile(const TableDefinition& definition, const QString& filePath);

    // Validate a loaded definition
    static ValidationResult validate(const TableDefinition& definition);

    static QVector<TableDefinition> builtinDefinitions();
    static TableDefinition builtinDefault();

    static QJsonObject definitionToJson(const TableDefinition& definition);

private:
    static ColumnSpec parseColumn(const QJsonObject& obj, QString& error);
    static ConverterDefinition parseConverter(const QJsonValue& value, QString& error);
    static TableLimits parseLimits(const QJsonObject& obj);
    static BurstPolicy parseBurstPolicy(const QJsonObject& obj);
    static DiagnosticSettings parseDiagnostics(const QJsonObject& obj);

    static QJsonObject columnToJson(const ColumnSpec& column);
    static QJsonObject limitsToJson(const TableLimits& limits);
};

#endif // TABLE_DEFINITION_LOADER_H
