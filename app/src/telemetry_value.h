#ifndef TELEMETRY_VALUE_H
#define TELEMETRY_VALUE_H

#include <QString>
#include <QMetaType>

#include <cstdint>

// ============================================================================
// Tagged telemetry value
// ============================================================================

class TelemetryValue
{
public:
    enum class Kind {
        Missing,
        Number,
        Text,
        Boolean
    };

    TelemetryValue() = default;

    static TelemetryValue number(double value);
    static TelemetryValue text(const QString& value);
    static TelemetryValue boolean(bool value);
    static TelemetryValue missing() { return TelemetryValue(); }

    Kind kind() const { return m_kind; }
    bool isNumber() const { return m_kind == Kind::Number; }
    bool isText() const { return m_kind == Kind::Text; }
    bool isBoolean() const { return m_kind == Kind::Boolean; }
    bool isMissing() const { return m_kind == Kind::Missing; }

    // Accessors return a neutral value when the kind does not match
    double toNumber() const { return m_kind == Kind::Number ? m_number : 0.0; }
    QString toText() const;
    bool toBoolean() const { return m_kind == Kind::Boolean && m_boolean; }

    bool operator==(const TelemetryValue& other) const;
    bool operator!=(const TelemetryValue& other) const { return !(*this == other); }

    static QString kindName(Kind kind);

private:
    Kind m_kind = Kind::Missing;
    double m_number = 0.0;
    bool m_boolean = false;
    QString m_text;
};

Q_DECLARE_METATYPE(TelemetryValue)

// ============================================================================
// One observation of a channel
// ============================================================================

struct DataPoint
{
    TelemetryValue value;
    qint64 timestampNs = 0;  // Absolute, nanoseconds since epoch
    double elapsed = 0.0;    // Seconds relative to the store reference
};

#endif // TELEMETRY_VALUE_H
