#pragma once
/**
 * @file revealcontroller.h
 * @brief Turns the readiness gate outcome into window actions, revealing the window exactly once.
 *
 * Ready:     linkInterceptionRequested() (if enabled) -> navigateRequested(root) -> revealRequested()
 * TimedOut:  revealRequested() -> recoveryRequested() (if enabled)
 * Cancelled: nothing
 *
 * After a timed-out reveal, a Ready from the recovery gate loads the server
 * (injection, then navigation) without revealing again.
 */

#include <QObject>
#include <QUrl>

#include "models.h"

class RevealController : public QObject
{
    Q_OBJECT
public:
    RevealController(const QUrl& serverRoot,
                     bool interceptLinks,
                     bool recoverAfterTimeout = true,
                     QObject* parent = nullptr);

    bool revealed() const { return m_revealed; }
    bool serverLoaded() const { return m_serverLoaded; }
    GateOutcome outcome() const { return m_outcome; }

public slots:
    void onGateFinished(GateOutcome outcome, int attempts);
    void onRecoveryFinished(GateOutcome outcome, int attempts);

signals:
    void navigateRequested(const QUrl& url);
    void linkInterceptionRequested();
    void revealRequested(GateOutcome outcome);
    void recoveryRequested();

private:
    void loadServer();

private:
    QUrl m_serverRoot;
    bool m_interceptLinks = true;
    bool m_recoverAfterTimeout = true;
    bool m_revealed = false;
    bool m_serverLoaded = false;
    GateOutcome m_outcome = GateOutcome::Cancelled;
};
