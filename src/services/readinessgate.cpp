/**
 * @file readinessgate.cpp
 * @brief Health polling loop driven by a single-shot timer and one in-flight GET at a time.
 */

#include "readinessgate.h"

#include <QMetaType>
#include <QNetworkAccessManager>
#include <QNetworkProxy>
#include <QNetworkRequest>
#include <QTimer>

#include "../core/shelllog.h"

ReadinessGate::ReadinessGate(const QUrl& healthUrl,
                             const RetryPolicy& policy,
                             int probeTimeoutMs,
                             QObject* parent)
    : QObject(parent)
    , m_healthUrl(healthUrl)
    , m_policy(policy.normalized())
    , m_probeTimeoutMs(probeTimeoutMs)
{
    qRegisterMetaType<GateOutcome>("GateOutcome");

    // Children follow the gate when it is moved to its worker thread.
    m_nam = new QNetworkAccessManager(this);
    m_nam->setProxy(QNetworkProxy::NoProxy);

    m_timer = new QTimer(this);
    m_timer->setSingleShot(true);
    connect(m_timer, &QTimer::timeout, this, &ReadinessGate::onTimeout);
}

ProbeResult ReadinessGate::classify(QNetworkReply::NetworkError error, const QString& errorString)
{
    ProbeResult r;

    // 1..199: connection/proxy layer, 301..399: unparsable HTTP exchange.
    // 201..299 and 401..499 are HTTP status errors: the server answered.
    const int code = static_cast<int>(error);
    const bool transport = (code >= 1 && code <= 199) || (code >= 301 && code <= 399);
    if (transport)
    {
        r.status = ProbeStatus::TransportError;
        r.error = errorString;
    }
    else
    {
        r.status = ProbeStatus::Ready;
    }
    return r;
}

void ReadinessGate::start()
{
    if (m_waiting)
        return;

    m_attempts = 0;
    m_waiting = true;

    qCInfo(lcGate).noquote() << "Waiting for" << m_healthUrl.toString()
                             << QStringLiteral("(every %1 ms, up to %2 attempts)")
                                    .arg(m_policy.intervalMs)
                                    .arg(m_policy.maxAttempts());
    scheduleNext();
}

void ReadinessGate::cancel()
{
    if (!m_waiting)
        return;

    m_timer->stop();
    if (m_reply)
    {
        QNetworkReply* reply = m_reply;
        m_reply = nullptr;
        reply->disconnect(this);
        reply->abort();
        reply->deleteLater();
    }

    finish(GateOutcome::Cancelled);
}

void ReadinessGate::scheduleNext()
{
    m_timer->start(m_policy.delayBeforeAttempt(m_attempts + 1));
}

void ReadinessGate::onTimeout()
{
    if (!m_waiting)
        return;

    ++m_attempts;
    emit probeStarted(m_attempts);

    QNetworkRequest request(m_healthUrl);
    request.setAttribute(QNetworkRequest::CacheLoadControlAttribute, QNetworkRequest::AlwaysNetwork);
#if (QT_VERSION >= QT_VERSION_CHECK(5, 15, 0))
    if (m_probeTimeoutMs > 0)
        request.setTransferTimeout(m_probeTimeoutMs);
#endif

    m_reply = m_nam->get(request);
    connect(m_reply, &QNetworkReply::finished, this, &ReadinessGate::onReplyFinished);
}

void ReadinessGate::onReplyFinished()
{
    QNetworkReply* reply = m_reply;
    m_reply = nullptr;
    if (!reply)
        return;
    reply->deleteLater();

    if (!m_waiting)
        return;

    const ProbeResult result = classify(reply->error(), reply->errorString());
    emit probeFinished(m_attempts, result.ok(), result.error);

    if (result.ok())
    {
        qCInfo(lcGate) << "Server ready after" << m_attempts << "attempt(s)";
        finish(GateOutcome::Ready);
        return;
    }

    qCDebug(lcGate).noquote() << QStringLiteral("Attempt %1/%2: %3 %4")
                                     .arg(m_attempts)
                                     .arg(m_policy.maxAttempts())
                                     .arg(probeStatusToString(result.status), result.error);

    if (m_policy.exhausted(m_attempts))
    {
        qCWarning(lcGate) << "Server not ready after" << m_attempts << "attempts, showing window anyway";
        finish(GateOutcome::TimedOut);
        return;
    }

    scheduleNext();
}

void ReadinessGate::finish(GateOutcome outcome)
{
    m_waiting = false;
    emit finished(outcome, m_attempts);
}
