#include "column_spec.h"
#include "telemetry_value.h"
#include <gtest/gtest.h>
TEST(TelemetryValueTest, KindsAreExplicit) {
    EXPECT_TRUE(TelemetryValue::number(1.5).isNumber());
    EXPECT_TRUE(TelemetryValue::text(QStringLiteral("on")).isText());
    EXPECT_TRUE(TelemetryValue::boolean(true).isBoolean());
    EXPECT_TRUE(TelemetryValue().isMissing());
    // A boolean is never treated as a number
    EXPECT_FALSE(TelemetryValue::boolean(true).isNumber());
    EXPECT_DOUBLE_EQ(TelemetryValue::boolean(true).toNumber(), 0.0);
}
TEST(TelemetryValueTest, EqualityComparesKindAndPayload) {
    EXPECT_EQ(TelemetryValue::number(2.0), TelemetryValue::number(2.0));
    EXPECT_NE(TelemetryValue::number(1.0), TelemetryValue::boolean(true));
    EXPECT_NE(TelemetryValue::text(QStringLiteral("a")), TelemetryValue::text(QStringLiteral("b")));
    EXPECT_EQ(TelemetryValue::missing(), TelemetryValue());
}
TEST(TelemetryValueTest, TextForm) {
    EXPECT_EQ(TelemetryValue::number(0.25).toText(), QStringLiteral("0.25"));
    EXPECT_EQ(TelemetryValue::boolean(false).toText(), QStringLiteral("false"));
    EXPECT_TRUE(TelemetryValue().toText().isEmpty());
}
TEST(ConverterTest, LinearScalesNumbers) {
    Converter convert = Converters::linear(1.65, -128.5 * 1.65);
    ConversionResult result = convert(TelemetryValue::number(130.5));
    ASSERT_TRUE(result.success);
    EXPECT_NEAR(result.value.toNumber(), 3.3, 1e-9);
}
TEST(ConverterTest, LinearRejectsNonNumbers) {
    Converter convert = Converters::linear(2.0);
    ConversionResult result = convert(TelemetryValue::text(QStringLiteral("12")));
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.errorMessage.isEmpty());
    EXPECT_FALSE(convert(TelemetryValue::boolean(true)).success);
}
TEST(ConverterTest, BooleanAcceptsNumbersAndText) {
    Converter convert = Converters::toBoolean();
    EXPECT_EQ(convert(TelemetryValue::number(3.0)).value, TelemetryValue::boolean(true));
    EXPECT_EQ(convert(TelemetryValue::number(0.0)).value, TelemetryValue::boolean(false));
    EXPECT_EQ(convert(TelemetryValue::text(QStringLiteral("TRUE"))).value, TelemetryValue::boolean(true));
    EXPECT_EQ(convert(TelemetryValue::text(QStringLiteral("0"))).value, TelemetryValue::boolean(false));
    EXPECT_FALSE(convert(TelemetryValue::text(QStringLiteral("maybe"))).success);
}
TEST(ConverterTest, TextConvertsAnyPresentValue) {
    Converter convert = Converters::toText();
    EXPECT_EQ(convert(TelemetryValue::number(4.0)).value, TelemetryValue::text(QStringLiteral("4")));
    EXPECT_FALSE(convert(TelemetryValue()).success);
}
TEST(ConverterTest, ColumnSpecBuildsConverterFromDefinition) {
    ConverterDefinition definition;
    definition.type = ConverterDefinition::Type::Linear;
    definition.scale = 10.0;
    definition.offset = 1.0;
    ColumnSpec column = ColumnSpec::forChannel(QStringLiteral("Scaled"), QStringLiteral("/a"),
                                               ColumnPolicy::Interpolated, definition);
    EXPECT_FALSE(column.isComputed());
    EXPECT_DOUBLE_EQ(column.converter(TelemetryValue::number(2.0)).value.toNumber(), 21.0);
    EXPECT_TRUE(ColumnSpec::computed(QStringLiteral("Note")).isComputed());
}
TEST(ConverterTest, PolicyAndTypeNames) {
    EXPECT_EQ(columnPolicyFromName(QStringLiteral("synchronized")), ColumnPolicy::Synchronized);
    EXPECT_EQ(columnPolicyName(ColumnPolicy::Asynchronous), QStringLiteral("asynchronous"));
    EXPECT_FALSE(columnPolicyFromName(QStringLiteral("sometimes")).has_value());
    EXPECT_EQ(converterTypeFromName(QString()), ConverterDefinition::Type::Identity);
    EXPECT_FALSE(converterTypeFromName(QStringLiteral("cubic")).has_value());
}
