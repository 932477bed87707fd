#include "table_definition_loader.h"
#include <QTemporaryDir>
#include <gtest/gtest.h>
namespace {
const QByteArray kDefinition = R"({
    "version": 1,
    "name": "bench",
    "referenceChannel": "/adc/channel_5",
    "samplingRate": 3000,
    "columns": [
        { "name": "Timestamp (s)" },
        { "name": "Probe A", "channel": "/adc/channel_5", "policy": "interpolated" },
        { "name": "X mean", "channel": "/gauss/x", "policy": "synchronized",
          "converter": { "type": "linear", "scale": 0.5, "offset": -1.0 } },
        { "name": "Gate", "channel": "/gate", "policy": "asynchronous", "converter": "boolean" }
    ],
    "limits": { "maxRowsPerRebuild": 250, "lookbackRows": 6 },
    "burstPolicy": { "minNewReferencePoints": 0 },
    "diagnostics": { "logEvery": 5 }
})";
}
TEST(TableDefinitionLoaderTest, LoadsColumnsAndOverrides) {
    TableDefinitionLoader::LoadResult result = TableDefinitionLoader::loadFromJson(kDefinition);
    ASSERT_TRUE(result.success) << result.errorMessage.toStdString();
    const TableDefinition& definition = result.definition;
    EXPECT_EQ(definition.name, QStringLiteral("bench"));
    EXPECT_DOUBLE_EQ(definition.samplingRate, 3000.0);
    ASSERT_EQ(definition.columns.size(), 4);
    EXPECT_TRUE(definition.columns[0].isComputed());
    EXPECT_EQ(definition.columns[1].policy, ColumnPolicy::Interpolated);
    EXPECT_EQ(definition.columns[2].policy, ColumnPolicy::Synchronized);
    EXPECT_DOUBLE_EQ(definition.columns[2].converter(TelemetryValue::number(4.0)).value.toNumber(), 1.0);
    EXPECT_EQ(definition.columns[3].converterDefinition.type, ConverterDefinition::Type::Boolean);
    EXPECT_EQ(definition.limits.maxRowsPerRebuild, 250);
    EXPECT_EQ(definition.limits.lookbackRows, 6);
    // Keys left out keep their defaults
    EXPECT_EQ(definition.limits.maxSnapshotPoints, 100000);
    EXPECT_EQ(definition.limits.synchronizedToleranceNs, 1000);
    EXPECT_EQ(definition.burstPolicy.minNewReferencePoints, 0);
    EXPECT_EQ(definition.burstPolicy.extensionRows, 1);
    EXPECT_EQ(definition.diagnostics.logEvery, 5);
    EXPECT_EQ(definition.diagnostics.escalateAfter, 50);
    EXPECT_TRUE(TableDefinitionLoader::validate(definition).valid);
}
TEST(TableDefinitionLoaderTest, RejectsMalformedDocuments) {
    EXPECT_FALSE(TableDefinitionLoader::loadFromJson("{ not json").success);
    EXPECT_FALSE(TableDefinitionLoader::loadFromJson("[1, 2]").success);
    EXPECT_FALSE(TableDefinitionLoader::loadFromJson(R"({"samplingRate": 10})").success);
    TableDefinitionLoader::LoadResult policy = TableDefinitionLoader::loadFromJson(
        R"({"referenceChannel": "/a", "samplingRate": 10,
            "columns": [{"name": "A", "channel": "/a", "policy": "whenever"}]})");
    EXPECT_FALSE(policy.success);
    EXPECT_TRUE(policy.errorMessage.contains(QStringLiteral("whenever")));
    TableDefinitionLoader::LoadResult converter = TableDefinitionLoader::loadFromJson(
        R"({"referenceChannel": "/a", "samplingRate": 10,
            "columns": [{"name": "A", "channel": "/a", "converter": {"type": "cubic"}}]})");
    EXPECT_FALSE(converter.success);
}
TEST(TableDefinitionLoaderTest, ValidationFindsErrorsAndWarnings) {
    TableDefinition definition;
    definition.version = 7;
    definition.referenceChannel = QStringLiteral("/ref");
    definition.samplingRate = 0.0;
    definition.columns = {
        ColumnSpec::forChannel(QStringLiteral("A"), QStringLiteral("/a"), ColumnPolicy::Interpolated),
        ColumnSpec::forChannel(QStringLiteral("A"), QStringLiteral("/b"), ColumnPolicy::Interpolated),
        ColumnSpec::computed(QString()),
    };
    definition.limits.maxRowsPerRebuild = -1;
    TableDefinitionLoader::ValidationResult result = TableDefinitionLoader::validate(definition);
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.errors.size(), 4);
    // Newer version and unused reference channel
    EXPECT_EQ(result.warnings.size(), 2);
}
TEST(TableDefinitionLoaderTest, SaveAndReload) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("ic256.json"));
    TableDefinition original = TableDefinitionLoader::builtinDefault();
    ASSERT_TRUE(TableDefinitionLoader::saveToFile(original, path));
    TableDefinitionLoader::LoadResult loaded = TableDefinitionLoader::loadFromFile(path);
    ASSERT_TRUE(loaded.success) << loaded.errorMessage.toStdString();
    EXPECT_EQ(loaded.definition.filePath, path);
    EXPECT_EQ(loaded.definition.headers(), original.headers());
    EXPECT_EQ(loaded.definition.referenceChannel, original.referenceChannel);
    // X centroid: (130.5 - 128.5) * 1.65
    ConversionResult x = loaded.definition.columns[1].converter(TelemetryValue::number(130.5));
    ASSERT_TRUE(x.success);
    EXPECT_NEAR(x.value.toNumber(), 3.3, 1e-9);
}
TEST(TableDefinitionLoaderTest, MissingFileFails) {
    TableDefinitionLoader::LoadResult result =
        TableDefinitionLoader::loadFromFile(QStringLiteral("/nonexistent/table.json"));
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.errorMessage.isEmpty());
}
TEST(TableDefinitionLoaderTest, BuiltinDefinitionsAreValid) {
    const QVector<TableDefinition> builtins = TableDefinitionLoader::builtinDefinitions();
    ASSERT_EQ(builtins.size(), 2);
    for (const TableDefinition& definition : builtins) {
        TableDefinitionLoader::ValidationResult result = TableDefinitionLoader::validate(definition);
        EXPECT_TRUE(result.valid) << definition.name.toStdString();
        EXPECT_TRUE(result.warnings.isEmpty()) << definition.name.toStdString();
    }
    EXPECT_EQ(builtins[0].referenceChannel, QStringLiteral("/ic256/adc/channel_sum/value"));
}
