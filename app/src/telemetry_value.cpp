#include "telemetry_value.h"

TelemetryValue TelemetryValue::number(double value)
{
    TelemetryValue v;
    v.m_kind = Kind::Number;
    v.m_number = value;
    return v;
}

TelemetryValue TelemetryValue::text(const QString& value)
{
    TelemetryValue v;
    v.m_kind = Kind::Text;
    v.m_text = value;
    return v;
}

TelemetryValue TelemetryValue::boolean(bool value)
{
    TelemetryValue v;
    v.m_kind = Kind::Boolean;
    v.m_boolean = value;
    return v;
}

QString TelemetryValue::toText() const
{
    switch (m_kind) {
    case Kind::Number:
        return QString::number(m_number, 'g', 17);
    case Kind::Text:
        return m_text;
    case Kind::Boolean:
        return m_boolean ? QStringLiteral("true") : QStringLiteral("false");
    case Kind::Missing:
        break;
    }
    return QString();
}

bool TelemetryValue::operator==(const TelemetryValue& other) const
{
    if (m_kind != other.m_kind) {
        return false;
    }
    switch (m_kind) {
    case Kind::Number:
        return m_number == other.m_number;
    case Kind::Text:
        return m_text == other.m_text;
    case Kind::Boolean:
        return m_boolean == other.m_boolean;
    case Kind::Missing:
        return true;
    }
    return false;
}

QString TelemetryValue::kindName(Kind kind)
{
    switch (kind) {
    case Kind::Number:
        return QStringLiteral("number");
    case Kind::Text:
        return QStringLiteral("text");
    case Kind::Boolean:
        return QStringLiteral("boolean");
    case Kind::Missing:
        break;
    }
    return QStringLiteral("missing");
}
