#pragma once
/**
 * @file models.h
 * @brief Core result types shared by the supervisor, the readiness gate and the window.
 */

#include <QMetaType>
#include <QString>

/**
 * @brief Outcome of trying to locate and spawn the companion server.
 */
enum class LaunchStatus
{
    Started = 0,
    NotFound,     ///< No candidate root holds the entry-point file
    SpawnFailed   ///< Entry point found, but the OS refused to start the runtime
};

/**
 * @brief Result of ServerSupervisor::start().
 */
struct LaunchResult
{
    LaunchStatus status = LaunchStatus::NotFound;
    QString root;              ///< Candidate root that matched (empty if NotFound)
    QString entryPoint;        ///< Absolute path of the entry-point file
    QString workingDirectory;  ///< Directory the runtime was started in
    QString error;             ///< Human readable reason when status != Started
    qint64 pid = 0;

    bool ok() const { return status == LaunchStatus::Started; }
};

/**
 * @brief Outcome of a single health probe.
 *
 * Only transport-level failures count as "not ready". HTTP status and body
 * are never inspected.
 */
enum class ProbeStatus
{
    Ready = 0,
    TransportError
};

struct ProbeResult
{
    ProbeStatus status = ProbeStatus::TransportError;
    QString error;

    bool ok() const { return status == ProbeStatus::Ready; }
};

/**
 * @brief Terminal state of the readiness gate.
 */
enum class GateOutcome
{
    Ready = 0,   ///< A probe succeeded
    TimedOut,    ///< Retry ceiling reached; window is shown anyway
    Cancelled    ///< Shell is shutting down
};

Q_DECLARE_METATYPE(GateOutcome)

inline QString launchStatusToString(LaunchStatus s)
{
    switch (s)
    {
    case LaunchStatus::Started:     return QStringLiteral("started");
    case LaunchStatus::NotFound:    return QStringLiteral("not-found");
    case LaunchStatus::SpawnFailed: return QStringLiteral("spawn-failed");
    }
    return QStringLiteral("?");
}

inline QString probeStatusToString(ProbeStatus s)
{
    switch (s)
    {
    case ProbeStatus::Ready:          return QStringLiteral("ready");
    case ProbeStatus::TransportError: return QStringLiteral("transport-error");
    }
    return QStringLiteral("?");
}

inline QString gateOutcomeToString(GateOutcome o)
{
    switch (o)
    {
    case GateOutcome::Ready:     return QStringLiteral("ready");
    case GateOutcome::TimedOut:  return QStringLiteral("timed-out");
    case GateOutcome::Cancelled: return QStringLiteral("cancelled");
    }
    return QStringLiteral("?");
}
