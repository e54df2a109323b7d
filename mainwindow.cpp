#include "mainwindow.h"

#include <QMetaObject>
#include <QStatusBar>
#include <QThread>
#include <QTimer>
#include <QWebEngineView>

#include "src/core/revealcontroller.h"
#include "src/core/shelllog.h"
#include "src/services/readinessgate.h"
#include "src/services/serversupervisor.h"
#include "src/ui/shellbridge.h"
#include "src/ui/shellpage.h"

MainWindow::MainWindow(const SettingsData& settings, ServerSupervisor* supervisor, QWidget* parent)
    : QMainWindow(parent)
    , m_settings(settings)
    , m_serverRoot(AppSettings::serverRootUrl(settings.readiness))
    , m_healthUrl(AppSettings::healthUrl(settings.readiness))
    , m_supervisor(supervisor)
{
    m_bridge = new ShellBridge(this);
    m_reveal = new RevealController(m_serverRoot,
                                    m_settings.links.intercept,
                                    m_settings.readiness.recovery.intervalMs > 0,
                                    this);

    m_reinjectTimer = new QTimer(this);
    m_reinjectTimer->setInterval(m_settings.links.reinjectMs);

    buildUi();
    wireSignals();

    showPlaceholder(tr("Starting %1...").arg(m_settings.window.title),
                    tr("Waiting for the server at %1").arg(m_serverRoot.toString()));
}

MainWindow::~MainWindow()
{
    m_reinjectTimer->stop();
    stopReadinessGate();
}

void MainWindow::buildUi()
{
    setWindowTitle(m_settings.window.title);
    resize(m_settings.window.width, m_settings.window.height);

    m_view = new QWebEngineView(this);
    m_page = new ShellPage(m_bridge, m_settings.readiness.host, m_view);
    m_view->setPage(m_page);
    setCentralWidget(m_view);
}

void MainWindow::wireSignals()
{
    connect(m_reveal, &RevealController::navigateRequested, this, &MainWindow::onNavigateRequested);
    connect(m_reveal, &RevealController::linkInterceptionRequested, this, &MainWindow::onLinkInterceptionRequested);
    connect(m_reveal, &RevealController::revealRequested, this, &MainWindow::onRevealRequested);
    connect(m_reveal, &RevealController::recoveryRequested, this, &MainWindow::onRecoveryRequested);

    connect(m_reinjectTimer, &QTimer::timeout, this, &MainWindow::onReinjectTimer);

    // Keep the handler on documents loaded after the first injection.
    connect(m_page, &QWebEnginePage::loadFinished, this, [this](bool ok) {
        if (ok && m_page->linkInterceptionInstalled())
            m_page->reinjectLinkInterception();
    });

    if (m_supervisor)
        connect(m_supervisor, &ServerSupervisor::exited, this, &MainWindow::onServerExited);
}

void MainWindow::startReadinessGate()
{
    if (m_gateThread)
        return;

    launchGate(m_settings.readiness.retry, false);
}

void MainWindow::onRecoveryRequested()
{
    // The first gate has finished; join its thread before starting the slow one.
    stopReadinessGate();
    delete m_gateThread;
    m_gateThread = nullptr;

    launchGate(m_settings.readiness.recovery, true);
}

void MainWindow::launchGate(const RetryPolicy& policy, bool recovery)
{
    m_recovering = recovery;

    m_gateThread = new QThread(this);
    m_gateThread->setObjectName(recovery ? QStringLiteral("readiness-recovery")
                                         : QStringLiteral("readiness-gate"));

    m_gate = new ReadinessGate(m_healthUrl, policy, m_settings.readiness.probeTimeoutMs);
    m_gate->moveToThread(m_gateThread);

    connect(m_gateThread, &QThread::started, m_gate, &ReadinessGate::start);
    connect(m_gateThread, &QThread::finished, m_gate, &QObject::deleteLater);
    connect(m_gate, &ReadinessGate::finished, this, &MainWindow::onGateFinished);

    m_gateRunning = true;
    m_gateThread->start();
}

void MainWindow::stopReadinessGate()
{
    if (!m_gateThread)
        return;

    if (m_gateRunning && m_gate)
    {
        QMetaObject::invokeMethod(m_gate, &ReadinessGate::cancel, Qt::BlockingQueuedConnection);
        m_gateRunning = false;
    }

    m_gateThread->quit();
    m_gateThread->wait();
    m_gate = nullptr;
}

void MainWindow::onGateFinished(GateOutcome outcome, int attempts)
{
    m_gateRunning = false;
    m_gateThread->quit();

    if (m_recovering)
        m_reveal->onRecoveryFinished(outcome, attempts);
    else
        m_reveal->onGateFinished(outcome, attempts);
}

void MainWindow::onNavigateRequested(const QUrl& url)
{
    qCInfo(lcShell).noquote() << "Loading" << url.toString();
    m_view->setUrl(url);
}

void MainWindow::onLinkInterceptionRequested()
{
    m_page->installLinkInterception();

    if (m_settings.links.reinjectMs > 0)
        m_reinjectTimer->start();
}

void MainWindow::onRevealRequested(GateOutcome outcome)
{
    if (outcome == GateOutcome::TimedOut)
    {
        QString detail = tr("No answer from %1.").arg(m_healthUrl.toString());
        if (m_supervisor)
        {
            const LaunchResult launch = m_supervisor->lastLaunch();
            if (!launch.ok() && !launch.error.isEmpty())
                detail += QStringLiteral(" ") + launch.error;
        }
        if (m_settings.readiness.recovery.intervalMs > 0)
            detail += QStringLiteral(" ") + tr("It will be loaded here as soon as it answers.");
        showPlaceholder(tr("%1 server is not responding").arg(m_settings.window.title), detail);
    }

    show();
    raise();
    activateWindow();
}

void MainWindow::onReinjectTimer()
{
    m_page->reinjectLinkInterception();
}

void MainWindow::onServerExited(int exitCode, bool crashed)
{
    if (!m_reveal->revealed())
        return;

    statusBar()->showMessage(crashed ? tr("Server crashed")
                                     : tr("Server exited with code %1").arg(exitCode));
}

void MainWindow::showPlaceholder(const QString& headline, const QString& detail)
{
    const QString html = QStringLiteral(
        "<!DOCTYPE html><html><head><meta charset=\"utf-8\"><style>"
        "body{font-family:sans-serif;background:#1e1f24;color:#d8d8de;"
        "display:flex;flex-direction:column;align-items:center;justify-content:center;height:100vh;margin:0}"
        "h1{font-weight:500;font-size:22px}p{color:#9a9aa5;font-size:14px}"
        "</style></head><body><h1>%1</h1><p>%2</p></body></html>")
        .arg(headline.toHtmlEscaped(), detail.toHtmlEscaped());
    m_view->setHtml(html);
}
