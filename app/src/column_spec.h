#ifndef COLUMN_SPEC_H
#define COLUMN_SPEC_H

#include <QString>
#include <QVector>

#include <functional>
#include <optional>

#include "telemetry_value.h"

// How a column's channel is matched to the row grid
enum class ColumnPolicy {
    Synchronized,  // Same absolute timestamp as the reference anchor
    Interpolated,  // Linear between the bracketing points
    Asynchronous   // Nearest point, no interpolation
};

struct ConversionResult
{
    bool success = false;
    TelemetryValue value;
    QString errorMessage;

    static ConversionResult ok(const TelemetryValue& value);
    static ConversionResult failure(const QString& message);
};

using Converter = std::function<ConversionResult(const TelemetryValue&)>;

struct ConverterDefinition
{
    enum class Type { Identity, Linear, Boolean, Text };
    Type type = Type::Identity;
    double scale = 1.0;   // Linear only
    double offset = 0.0;  // Linear only
};

namespace Converters {

ConversionResult identity(const TelemetryValue& value);

// v * scale + offset; non-numeric input is a conversion error
Converter linear(double scale, double offset = 0.0);

// Numbers map to value != 0, text accepts true/false/1/0
Converter toBoolean();

// Any present value to its text form
Converter toText();

Converter fromDefinition(const ConverterDefinition& definition);

} // namespace Converters

struct ColumnSpec
{
    QString name;
    std::optional<QString> channelId;  // Empty for computed columns
    ColumnPolicy policy = ColumnPolicy::Interpolated;
    Converter converter = &Converters::identity;
    ConverterDefinition converterDefinition;  // Kept for saving definitions

    bool isComputed() const { return !channelId.has_value(); }

    static ColumnSpec computed(const QString& name);
    static ColumnSpec forChannel(const QString& name,
                                 const QString& channelId,
                                 ColumnPolicy policy,
                                 const ConverterDefinition& converter = ConverterDefinition());
};

QString columnPolicyName(ColumnPolicy policy);
std::optional<ColumnPolicy> columnPolicyFromName(const QString& name);

QString converterTypeName(ConverterDefinition::Type type);
std::optional<ConverterDefinition::Type> converterTypeFromName(const QString& name);

#endif // COLUMN_SPEC_H
