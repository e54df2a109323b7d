#include "revealcontroller.h"

#include "shelllog.h"

RevealController::RevealController(const QUrl& serverRoot,
                                   bool interceptLinks,
                                   bool recoverAfterTimeout,
                                   QObject* parent)
    : QObject(parent)
    , m_serverRoot(serverRoot)
    , m_interceptLinks(interceptLinks)
    , m_recoverAfterTimeout(recoverAfterTimeout)
{
}

void RevealController::onGateFinished(GateOutcome outcome, int attempts)
{
    if (m_revealed || outcome == GateOutcome::Cancelled)
        return;

    m_revealed = true;
    m_outcome = outcome;
    qCInfo(lcShell).noquote() << "Readiness gate" << gateOutcomeToString(outcome)
                              << QStringLiteral("after %1 attempt(s)").arg(attempts);

    if (outcome == GateOutcome::Ready)
        loadServer();

    emit revealRequested(outcome);

    if (outcome == GateOutcome::TimedOut && m_recoverAfterTimeout)
        emit recoveryRequested();
}

void RevealController::onRecoveryFinished(GateOutcome outcome, int attempts)
{
    if (!m_revealed || m_serverLoaded)
        return;

    if (outcome != GateOutcome::Ready)
    {
        qCWarning(lcShell).noquote() << "Server still unreachable, recovery polling"
                                     << gateOutcomeToString(outcome)
                                     << QStringLiteral("after %1 attempt(s)").arg(attempts);
        return;
    }

    qCInfo(lcShell).noquote() << "Server answered late, after" << attempts << "recovery attempt(s)";
    m_outcome = GateOutcome::Ready;
    loadServer();
}

void RevealController::loadServer()
{
    m_serverLoaded = true;

    // Registered before navigating so the new document already carries the handler.
    if (m_interceptLinks)
        emit linkInterceptionRequested();
    emit navigateRequested(m_serverRoot);
}
