#include "table_definition_loader.h"

#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>
#include <QSet>

static constexpr int CURRENT_SCHEMA_VERSION = 1;

ConverterDefinition TableDefinitionLoader::parseConverter(const QJsonValue& value, QString& error)
{
    ConverterDefinition converter;
    if (value.isUndefined() || value.isNull()) {
        return converter;
    }

    // Either "linear" or { "type": "linear", "scale": ..., "offset": ... }
    QJsonObject obj;
    if (value.isString()) {
        obj[QStringLiteral("type")] = value.toString();
    } else {
        obj = value.toObject();
    }

    QString typeName = obj.value(QStringLiteral("type")).toString();
    std::optional<ConverterDefinition::Type> type = converterTypeFromName(typeName);
    if (!type) {
        error = QStringLiteral("Unknown converter type: %1").arg(typeName);
        return converter;
    }

    converter.type = *type;
    converter.scale = obj.value(QStringLiteral("scale")).toDouble(1.0);
    converter.offset = obj.value(QStringLiteral("offset")).toDouble(0.0);
    return converter;
}

ColumnSpec TableDefinitionLoader::parseColumn(const QJsonObject& obj, QString& error)
{
    const QString name = obj.value(QStringLiteral("name")).toString();

    // A column without a channel is filled by the persistence side
    if (!obj.contains(QStringLiteral("channel"))) {
        return ColumnSpec::computed(name);
    }

    const QString channel = obj.value(QStringLiteral("channel")).toString();
    if (channel.isEmpty()) {
        error = QStringLiteral("Column '%1': 'channel' must be a non-empty string").arg(name);
        return ColumnSpec::computed(name);
    }

    QString policyName = obj.value(QStringLiteral("policy")).toString(QStringLiteral("interpolated"));
    std::optional<ColumnPolicy> policy = columnPolicyFromName(policyName);
    if (!policy) {
        error = QStringLiteral("Column '%1': unknown policy '%2'").arg(name, policyName);
        return ColumnSpec::computed(name);
    }

    QString converterError;
    ConverterDefinition converter = parseConverter(obj.value(QStringLiteral("converter")), converterError);
    if (!converterError.isEmpty()) {
        error = QStringLiteral("Column '%1': %2").arg(name, converterError);
        return ColumnSpec::computed(name);
    }

    return ColumnSpec::forChannel(name, channel, *policy, converter);
}

TableLimits TableDefinitionLoader::parseLimits(const QJsonObject& obj)
{
    TableLimits limits;
    limits.maxSnapshotPoints = obj.value(QStringLiteral("maxSnapshotPoints")).toInt(limits.maxSnapshotPoints);
    limits.maxRowsPerRebuild = obj.value(QStringLiteral("maxRowsPerRebuild")).toInt(limits.maxRowsPerRebuild);
    limits.progressInterval = obj.value(QStringLiteral("progressInterval")).toInt(limits.progressInterval);
    limits.lookbackRows = obj.value(QStringLiteral("lookbackRows")).toInt(limits.lookbackRows);
    limits.maxPlausibleSpanSec = obj.value(QStringLiteral("maxPlausibleSpanSec")).toDouble(limits.maxPlausibleSpanSec);
    limits.synchronizedToleranceNs = static_cast<qint64>(
        obj.value(QStringLiteral("synchronizedToleranceNs"))
            .toDouble(static_cast<double>(limits.synchronizedToleranceNs)));
    return limits;
}

BurstPolicy TableDefinitionLoader::parseBurstPolicy(const QJsonObject& obj)
{
    BurstPolicy policy;
    policy.minNewReferencePoints = obj.value(QStringLiteral("minNewReferencePoints")).toInt(policy.minNewReferencePoints);
    policy.extensionRows = obj.value(QStringLiteral("extensionRows")).toInt(policy.extensionRows);
    return policy;
}

DiagnosticSettings TableDefinitionLoader::parseDiagnostics(const QJsonObject& obj)
{
    DiagnosticSettings settings;
    settings.logEvery = obj.value(QStringLiteral("logEvery")).toInt(settings.logEvery);
    settings.escalateAfter = obj.value(QStringLiteral("escalateAfter")).toInt(settings.escalateAfter);
    return settings;
}

TableDefinitionLoader::LoadResult TableDefinitionLoader::loadFromFile(const QString& filePath)
{
    LoadResult result;

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        result.errorMessage = QStringLiteral("Cannot open file: %1").arg(file.errorString());
        return result;
    }

    QByteArray data = file.readAll();
    file.close();

    result = loadFromJson(data, filePath);
    if (result.success) {
        result.definition.filePath = filePath;
    }
    return result;
}

TableDefinitionLoader::LoadResult TableDefinitionLoader::loadFromJson(const QByteArray& jsonData,
                                                                      const QString& sourceName)
{
    LoadResult result;

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(jsonData, &parseError);

    if (parseError.error != QJsonParseError::NoError) {
        result.errorMessage = QStringLiteral("JSON parse error at offset %1: %2")
                                  .arg(parseError.offset)
                                  .arg(parseError.errorString());
        return result;
    }

    if (!doc.isObject()) {
        result.errorMessage = QStringLiteral("JSON root must be an object");
        return result;
    }

    QJsonObject root = doc.object();
    TableDefinition& definition = result.definition;

    definition.version = root.value(QStringLiteral("version")).toInt(1);
    definition.name = root.value(QStringLiteral("name")).toString(sourceName);
    definition.description = root.value(QStringLiteral("description")).toString();

    definition.referenceChannel = root.value(QStringLiteral("referenceChannel")).toString();
    if (definition.referenceChannel.isEmpty()) {
        result.errorMessage = QStringLiteral("Definition missing required 'referenceChannel'");
        return result;
    }
    definition.samplingRate = root.value(QStringLiteral("samplingRate")).toDouble(0.0);

    QString columnError;
    QJsonArray columnsArray = root.value(QStringLiteral("columns")).toArray();
    for (const QJsonValue& v : columnsArray) {
        ColumnSpec column = parseColumn(v.toObject(), columnError);
        if (!columnError.isEmpty()) {
            result.errorMessage = columnError;
            return result;
        }
        definition.columns.push_back(column);
    }

    definition.limits = parseLimits(root.value(QStringLiteral("limits")).toObject());
    definition.burstPolicy = parseBurstPolicy(root.value(QStringLiteral("burstPolicy")).toObject());
    definition.diagnostics = parseDiagnostics(root.value(QStringLiteral("diagnostics")).toObject());

    result.success = true;
    return result;
}

QJsonObject TableDefinitionLoader::columnToJson(const ColumnSpec& column)
{
    QJsonObject obj;
    obj[QStringLiteral("name")] = column.name;
    if (column.isComputed()) {
        return obj;
    }

    obj[QStringLiteral("channel")] = *column.channelId;
    obj[QStringLiteral("policy")] = columnPolicyName(column.policy);

    // Identity is the default; leave it out
    const ConverterDefinition& converter = column.converterDefinition;
    if (converter.type != ConverterDefinition::Type::Identity) {
        QJsonObject converterObj;
        converterObj[QStringLiteral("type")] = converterTypeName(converter.type);
        if (converter.type == ConverterDefinition::Type::Linear) {
            converterObj[QStringLiteral("scale")] = converter.scale;
            converterObj[QStringLiteral("offset")] = converter.offset;
        }
        obj[QStringLiteral("converter")] = converterObj;
    }
    return obj;
}

QJsonObject TableDefinitionLoader::limitsToJson(const TableLimits& limits)
{
    QJsonObject obj;
    obj[QStringLiteral("maxSnapshotPoints")] = limits.maxSnapshotPoints;
    obj[QStringLiteral("maxRowsPerRebuild")] = limits.maxRowsPerRebuild;
    obj[QStringLiteral("progressInterval")] = limits.progressInterval;
    obj[QStringLiteral("lookbackRows")] = limits.lookbackRows;
    obj[QStringLiteral("maxPlausibleSpanSec")] = limits.maxPlausibleSpanSec;
    obj[QStringLiteral("synchronizedToleranceNs")] = static_cast<double>(limits.synchronizedToleranceNs);
    return obj;
}

QJsonObject TableDefinitionLoader::definitionToJson(const TableDefinition& definition)
{
    QJsonObject root;
    root[QStringLiteral("version")] = definition.version;
    root[QStringLiteral("name")] = definition.name;
    root[QStringLiteral("description")] = definition.description;
    root[QStringLiteral("referenceChannel")] = definition.referenceChannel;
    root[QStringLiteral("samplingRate")] = definition.samplingRate;

    QJsonArray columns;
    for (const ColumnSpec& column : definition.columns) {
        columns.append(columnToJson(column));
    }
    root[QStringLiteral("columns")] = columns;

    root[QStringLiteral("limits")] = limitsToJson(definition.limits);

    QJsonObject burst;
    burst[QStringLiteral("minNewReferencePoints")] = definition.burstPolicy.minNewReferencePoints;
    burst[QStringLiteral("extensionRows")] = definition.burstPolicy.extensionRows;
    root[QStringLiteral("burstPolicy")] = burst;

    QJsonObject diagnostics;
    diagnostics[QStringLiteral("logEvery")] = definition.diagnostics.logEvery;
    diagnostics[QStringLiteral("escalateAfter")] = definition.diagnostics.escalateAfter;
    root[QStringLiteral("diagnostics")] = diagnostics;

    return root;
}

bool TableDefinitionLoader::saveToFile(const TableDefinition& definition, const QString& filePath)
{
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        return false;
    }

    QJsonDocument doc(definitionToJson(definition));
    const QByteArray data = doc.toJson(QJsonDocument::Indented);
    const bool written = file.write(data) == data.size();
    file.close();
    return written;
}

TableDefinitionLoader::ValidationResult TableDefinitionLoader::validate(const TableDefinition& definition)
{
    ValidationResult result;

    // Version check
    if (definition.version > CURRENT_SCHEMA_VERSION) {
        result.warnings << QStringLiteral("Definition version %1 is newer than supported %2")
                               .arg(definition.version)
                               .arg(CURRENT_SCHEMA_VERSION);
    }

    if (!(definition.samplingRate > 0.0)) {
        result.errors << QStringLiteral("Sampling rate must be positive, got %1").arg(definition.samplingRate);
        result.valid = false;
    }

    if (definition.referenceChannel.isEmpty()) {
        result.errors << QStringLiteral("Reference channel is empty");
        result.valid = false;
    }

    // Column validation
    QSet<QString> names;
    bool referenceUsed = false;
    for (int i = 0; i < definition.columns.size(); ++i) {
        const ColumnSpec& column = definition.columns[i];
        if (column.name.isEmpty()) {
            result.errors << QStringLiteral("Column %1 has no name").arg(i);
            result.valid = false;
        } else if (names.contains(column.name)) {
            result.errors << QStringLiteral("Duplicate column name: %1").arg(column.name);
            result.valid = false;
        }
        names.insert(column.name);

        if (!column.isComputed() && *column.channelId == definition.referenceChannel) {
            referenceUsed = true;
        }
    }

    if (definition.columns.isEmpty()) {
        result.warnings << QStringLiteral("Definition has no columns");
    }
    if (!referenceUsed && !definition.referenceChannel.isEmpty()) {
        result.warnings << QStringLiteral("Reference channel %1 is not read by any column")
                               .arg(definition.referenceChannel);
    }

    // Limits
    const TableLimits& limits = definition.limits;
    const struct { const char* key; double value; } numeric[] = {
        {"maxSnapshotPoints", static_cast<double>(limits.maxSnapshotPoints)},
        {"maxRowsPerRebuild", static_cast<double>(limits.maxRowsPerRebuild)},
        {"progressInterval", static_cast<double>(limits.progressInterval)},
        {"lookbackRows", static_cast<double>(limits.lookbackRows)},
        {"maxPlausibleSpanSec", limits.maxPlausibleSpanSec},
        {"synchronizedToleranceNs", static_cast<double>(limits.synchronizedToleranceNs)},
        {"minNewReferencePoints", static_cast<double>(definition.burstPolicy.minNewReferencePoints)},
        {"extensionRows", static_cast<double>(definition.burstPolicy.extensionRows)},
        {"logEvery", static_cast<double>(definition.diagnostics.logEvery)},
        {"escalateAfter", static_cast<double>(definition.diagnostics.escalateAfter)},
    };
    for (const auto& entry : numeric) {
        if (entry.value < 0.0) {
            result.errors << QStringLiteral("%1 must not be negative").arg(QLatin1String(entry.key));
            result.valid = false;
        }
    }

    return result;
}

QVector<TableDefinition> TableDefinitionLoader::builtinDefinitions()
{
    return builtinTableDefinitions();
}

TableDefinition TableDefinitionLoader::builtinDefault()
{
    return builtinTableDefinitions().first();
}
