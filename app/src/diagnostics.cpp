#include "diagnostics.h"

#include <exception>

Q_LOGGING_CATEGORY(lcGridSyncEngine, "gridsync.engine")

QString failureKindName(FailureKind kind)
{
    switch (kind) {
    case FailureKind::None:
        return QStringLiteral("none");
    case FailureKind::MissingReference:
        return QStringLiteral("missing reference");
    case FailureKind::StructuralError:
        return QStringLiteral("structural error");
    case FailureKind::TimingAnomaly:
        return QStringLiteral("timing anomaly");
    case FailureKind::ConfigurationError:
        return QStringLiteral("configuration error");
    }
    return QString();
}

DiagnosticThrottle::DiagnosticThrottle(const DiagnosticSettings& settings)
    : m_settings(settings)
{
    if (m_settings.logEvery < 1) {
        m_settings.logEvery = 1;
    }
}

void DiagnosticThrottle::report(const QString& message, DiagnosticLevel level)
{
    if (!m_sink) {
        return;
    }
    // A failing sink must not abort the build that is reporting
    try {
        m_sink(message, level);
    } catch (const std::exception&) {
        ++m_sinkFailures;
    } catch (...) {
        ++m_sinkFailures;
    }
}

bool DiagnosticThrottle::shouldReport() const
{
    return m_consecutiveFailures == 1 || m_consecutiveFailures % m_settings.logEvery == 0;
}

void DiagnosticThrottle::recordFailure(FailureKind kind, const QString& message, DiagnosticLevel level)
{
    ++m_consecutiveFailures;
    ++m_totalFailures;
    m_lastFailure = kind;

    if (shouldReport()) {
        report(QStringLiteral("%1 (consecutive failures: %2)").arg(message).arg(m_consecutiveFailures),
               level);
    }
}

void DiagnosticThrottle::recordSoftFailure(FailureKind kind, const QString& message)
{
    DiagnosticLevel level = (m_consecutiveFailures + 1 > m_settings.escalateAfter)
                                ? DiagnosticLevel::Error
                                : DiagnosticLevel::Warning;
    recordFailure(kind, message, level);
}

void DiagnosticThrottle::recordSuccess(const QString& context)
{
    if (m_consecutiveFailures > 0) {
        report(QStringLiteral("%1 recovered after %2 consecutive failures (last: %3)")
                   .arg(context)
                   .arg(m_consecutiveFailures)
                   .arg(failureKindName(m_lastFailure)),
               DiagnosticLevel::Info);
    }
    m_consecutiveFailures = 0;
}

void DiagnosticThrottle::reset()
{
    m_consecutiveFailures = 0;
    m_totalFailures = 0;
    m_lastFailure = FailureKind::None;
}

namespace Diagnostics {

DiagnosticSink loggingCategorySink()
{
    return [](const QString& message, DiagnosticLevel level) {
        switch (level) {
        case DiagnosticLevel::Info:
            qCInfo(lcGridSyncEngine).noquote() << message;
            break;
        case DiagnosticLevel::Warning:
            qCWarning(lcGridSyncEngine).noquote() << message;
            break;
        case DiagnosticLevel::Error:
            qCCritical(lcGridSyncEngine).noquote() << message;
            break;
        }
    };
}

} // namespace Diagnostics
