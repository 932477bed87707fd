#ifndef DIAGNOSTICS_H
#define DIAGNOSTICS_H

#include <QLoggingCategory>
#include <QString>

#include <functional>

Q_DECLARE_LOGGING_CATEGORY(lcGridSyncEngine)

enum class DiagnosticLevel {
    Info,
    Warning,
    Error
};

using DiagnosticSink = std::function<void(const QString& message, DiagnosticLevel level)>;

enum class FailureKind {
    None,
    MissingReference,
    StructuralError,
    TimingAnomaly,
    ConfigurationError
};

QString failureKindName(FailureKind kind);

struct DiagnosticSettings
{
    int logEvery = 100;       // After the first failure, report every Nth
    int escalateAfter = 50;   // Consecutive soft failures before Warning becomes Error
};

// Tracks consecutive build failures and decides which ones get reported.
// The first failure of a run is always reported, then every logEvery-th.
class DiagnosticThrottle
{
public:
    explicit DiagnosticThrottle(const DiagnosticSettings& settings = DiagnosticSettings());

    void setSink(const DiagnosticSink& sink) { m_sink = sink; }
    bool hasSink() const { return static_cast<bool>(m_sink); }

    // Unthrottled
    void report(const QString& message, DiagnosticLevel level);

    // Counts a failure and reports it when the rate limit allows
    void recordFailure(FailureKind kind, const QString& message, DiagnosticLevel level);

    // Soft failures escalate to Error after a sustained run
    void recordSoftFailure(FailureKind kind, const QString& message);

    // Resets the run and reports the recovery if there was one
    void recordSuccess(const QString& context);

    int consecutiveFailures() const { return m_consecutiveFailures; }
    qint64 totalFailures() const { return m_totalFailures; }
    FailureKind lastFailure() const { return m_lastFailure; }
    int sinkFailureCount() const { return m_sinkFailures; }

    void reset();

private:
    bool shouldReport() const;

    DiagnosticSettings m_settings;
    DiagnosticSink m_sink;
    int m_consecutiveFailures = 0;
    qint64 m_totalFailures = 0;
    FailureKind m_lastFailure = FailureKind::None;
    int m_sinkFailures = 0;
};

namespace Diagnostics {

// Sink forwarding to the gridsync.engine logging category
DiagnosticSink loggingCategorySink();

} // namespace Diagnostics

#endif // DIAGNOSTICS_H
