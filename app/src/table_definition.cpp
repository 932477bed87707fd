#include "table_definition.h"

#include <QStringList>

namespace {

// IC256 strip geometry
constexpr double kMeanOffset = 128.5;
constexpr double kXStripPitchMm = 1.65;
constexpr double kYStripPitchMm = 1.38;

ConverterDefinition linearConverter(double scale, double offset)
{
    ConverterDefinition converter;
    converter.type = ConverterDefinition::Type::Linear;
    converter.scale = scale;
    converter.offset = offset;
    return converter;
}

TableDefinition ic256Definition()
{
    const QString root = QStringLiteral("/ic256");

    TableDefinition table;
    table.version = 1;
    table.name = QStringLiteral("IC256 (default)");
    table.description = QStringLiteral("IC256 gaussian fit, dose and environment channels");
    table.referenceChannel = root + QStringLiteral("/adc/channel_sum/value");
    table.samplingRate = 3000.0;

    // (mean - 128.5) * pitch, folded into scale and offset
    ConverterDefinition xMean = linearConverter(kXStripPitchMm, -kMeanOffset * kXStripPitchMm);
    ConverterDefinition xSigma = linearConverter(kXStripPitchMm, 0.0);
    ConverterDefinition yMean = linearConverter(kYStripPitchMm, -kMeanOffset * kYStripPitchMm);
    ConverterDefinition ySigma = linearConverter(kYStripPitchMm, 0.0);

    table.columns = {
        ColumnSpec::computed(QStringLiteral("Timestamp (s)")),
        ColumnSpec::forChannel(QStringLiteral("X centroid (mm)"),
                               root + QStringLiteral("/adc/gaussian_fit_a/mean/value"),
                               ColumnPolicy::Synchronized, xMean),
        ColumnSpec::forChannel(QStringLiteral("X sigma (mm)"),
                               root + QStringLiteral("/adc/gaussian_fit_a/standard_deviation/value"),
                               ColumnPolicy::Synchronized, xSigma),
        ColumnSpec::forChannel(QStringLiteral("Y centroid (mm)"),
                               root + QStringLiteral("/adc/gaussian_fit_b/mean/value"),
                               ColumnPolicy::Synchronized, yMean),
        ColumnSpec::forChannel(QStringLiteral("Y sigma (mm)"),
                               root + QStringLiteral("/adc/gaussian_fit_b/standard_deviation/value"),
                               ColumnPolicy::Synchronized, ySigma),
        ColumnSpec::forChannel(QStringLiteral("Dose"),
                               root + QStringLiteral("/dose_adc/channel/value"),
                               ColumnPolicy::Interpolated),
        ColumnSpec::forChannel(QStringLiteral("Channel Sum"),
                               root + QStringLiteral("/adc/channel_sum/value"),
                               ColumnPolicy::Synchronized),
        ColumnSpec::forChannel(QStringLiteral("External trigger"),
                               root + QStringLiteral("/gate_signal/value"),
                               ColumnPolicy::Asynchronous),
        ColumnSpec::forChannel(QStringLiteral("Temperature (C)"),
                               root + QStringLiteral("/i2c2/environmental_sensor/temperature/value"),
                               ColumnPolicy::Interpolated),
        ColumnSpec::forChannel(QStringLiteral("Humidity (%rH)"),
                               root + QStringLiteral("/i2c2/environmental_sensor/humidity/value"),
                               ColumnPolicy::Interpolated),
        ColumnSpec::forChannel(QStringLiteral("Pressure (hPa)"),
                               root + QStringLiteral("/i2c2/environmental_sensor/pressure/value"),
                               ColumnPolicy::Interpolated),
        ColumnSpec::computed(QStringLiteral("Note")),
    };
    return table;
}

TableDefinition tx2Definition()
{
    const QString root = QStringLiteral("/tx2");

    TableDefinition table;
    table.version = 1;
    table.name = QStringLiteral("TX2 (default)");
    table.description = QStringLiteral("TX2 probe ADC channels");
    table.referenceChannel = root + QStringLiteral("/adc/channel_5/value");
    table.samplingRate = 3000.0;

    table.columns = {
        ColumnSpec::computed(QStringLiteral("Timestamp (s)")),
        ColumnSpec::forChannel(QStringLiteral("Probe A"),
                               root + QStringLiteral("/adc/channel_5/value"),
                               ColumnPolicy::Interpolated),
        ColumnSpec::forChannel(QStringLiteral("Probe B"),
                               root + QStringLiteral("/adc/channel_1/value"),
                               ColumnPolicy::Interpolated),
        ColumnSpec::forChannel(QStringLiteral("FR2"),
                               root + QStringLiteral("/adc/fr2/value"),
                               ColumnPolicy::Interpolated),
        ColumnSpec::computed(QStringLiteral("Note")),
    };
    return table;
}

} // namespace

QStringList TableDefinition::headers() const
{
    QStringList names;
    names.reserve(columns.size());
    for (const ColumnSpec& column : columns) {
        names << column.name;
    }
    return names;
}

QVector<TableDefinition> builtinTableDefinitions()
{
    QVector<TableDefinition> definitions;
    definitions.push_back(ic256Definition());
    definitions.push_back(tx2Definition());
    return definitions;
}
