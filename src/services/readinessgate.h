#pragma once
/**
 * @file readinessgate.h
 * @brief Polls the server health endpoint until it answers or the retry ceiling is reached.
 *
 * Waiting -> Ready      (a probe completed without a transport error)
 * Waiting -> TimedOut   (retry.maxAttempts() probes failed)
 * Waiting -> Cancelled  (cancel() during shutdown)
 *
 * Meant to be moved to its own QThread; every wait is a timer in that
 * thread's event loop. finished() is emitted exactly once per start().
 */

#include <QObject>
#include <QPointer>
#include <QUrl>
#include <QNetworkReply>

#include "../core/models.h"
#include "../core/retrypolicy.h"

class QNetworkAccessManager;
class QTimer;

class ReadinessGate : public QObject
{
    Q_OBJECT
public:
    ReadinessGate(const QUrl& healthUrl,
                  const RetryPolicy& policy,
                  int probeTimeoutMs,
                  QObject* parent = nullptr);

    int attempts() const { return m_attempts; }
    bool isWaiting() const { return m_waiting; }

    /**
     * @brief Only transport-level failures mean "not ready"; HTTP errors still prove the server is up.
     */
    static ProbeResult classify(QNetworkReply::NetworkError error, const QString& errorString);

public slots:
    void start();
    void cancel();

signals:
    void probeStarted(int attempt);
    void probeFinished(int attempt, bool ready, const QString& error);
    void finished(GateOutcome outcome, int attempts);

private slots:
    void onTimeout();
    void onReplyFinished();

private:
    void scheduleNext();
    void finish(GateOutcome outcome);

private:
    QUrl m_healthUrl;
    RetryPolicy m_policy;
    int m_probeTimeoutMs = 0;

    QNetworkAccessManager* m_nam = nullptr;
    QTimer* m_timer = nullptr;
    QPointer<QNetworkReply> m_reply;

    int m_attempts = 0;
    bool m_waiting = false;
};
