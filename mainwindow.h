#pragma once
/**
 * @brief 主窗口：QWebEngineView 承载服务端页面
 *
 * ✅ 需求对齐：
 * - 轮询结束前保持隐藏；结果到达后只显示一次
 * - 超时也显示（占位页），并继续低频轮询，服务就绪后自动加载
 * - 析构时取消轮询并 join 子线程
 */

#include <QMainWindow>
#include <QPointer>
#include <QUrl>

#include "src/config/appsettings.h"
#include "src/core/models.h"

class QThread;
class QTimer;
class QWebEngineView;

class ReadinessGate;
class RevealController;
class ServerSupervisor;
class ShellBridge;
class ShellPage;

class MainWindow : public QMainWindow
{
    Q_OBJECT
public:
    MainWindow(const SettingsData& settings, ServerSupervisor* supervisor, QWidget* parent = nullptr);
    ~MainWindow() override;

    /**
     * @brief Start polling the health endpoint on a worker thread.
     */
    void startReadinessGate();

private slots:
    // Gate / reveal
    void onGateFinished(GateOutcome outcome, int attempts);
    void onNavigateRequested(const QUrl& url);
    void onLinkInterceptionRequested();
    void onRevealRequested(GateOutcome outcome);
    void onRecoveryRequested();
    void onReinjectTimer();

    // Server
    void onServerExited(int exitCode, bool crashed);

private:
    void buildUi();
    void wireSignals();
    void launchGate(const RetryPolicy& policy, bool recovery);
    void stopReadinessGate();
    void showPlaceholder(const QString& headline, const QString& detail);

private:
    SettingsData m_settings;
    QUrl m_serverRoot;
    QUrl m_healthUrl;

    QPointer<ServerSupervisor> m_supervisor;

    QWebEngineView* m_view = nullptr;
    ShellPage* m_page = nullptr;
    ShellBridge* m_bridge = nullptr;
    RevealController* m_reveal = nullptr;
    QTimer* m_reinjectTimer = nullptr;

    QThread* m_gateThread = nullptr;
    ReadinessGate* m_gate = nullptr;
    bool m_gateRunning = false;
    bool m_recovering = false;
};
