#pragma once
/**
 * @file serversupervisor.h
 * @brief 伴随服务进程管理：定位、启动、读取输出、退出时停止
 *
 * ✅ 需求对齐：
 * - 继承当前环境并追加 NODE_ENV=production
 * - 工作目录由 ServerLocator 决定；stdout/stderr 走管道，按行写入 debug 日志
 * - 找不到入口 / 启动失败 通过 LaunchResult 返回，不中断壳程序
 * - 析构时 terminate()，超时后 kill()
 */

#include <QObject>
#include <QByteArray>
#include <QMutex>
#include <QProcess>
#include <QString>
#include <QStringList>

#include "../config/appsettings.h"
#include "../core/models.h"

class ServerSupervisor : public QObject
{
    Q_OBJECT
public:
    explicit ServerSupervisor(const ServerSettings& settings, QObject* parent = nullptr);
    ~ServerSupervisor() override;

    /**
     * @brief Find the entry point among @p roots and start the runtime.
     *
     * Only the first call spawns; later calls fail with SpawnFailed.
     */
    LaunchResult start(const QStringList& roots);

    /**
     * @brief terminate(), then kill() after the grace period. No-op if not running.
     */
    void stop();

    bool isRunning() const;
    qint64 processId() const;
    LaunchResult lastLaunch() const;

signals:
    void outputLine(const QString& line);
    void exited(int exitCode, bool crashed);

private slots:
    void onReadyReadStdout();
    void onReadyReadStderr();
    void onFinished(int exitCode, QProcess::ExitStatus status);
    void onErrorOccurred(QProcess::ProcessError error);

private:
    void drainLines(QByteArray& buffer, const QByteArray& chunk, const char* stream);
    LaunchResult record(const LaunchResult& r);

private:
    ServerSettings m_settings;

    mutable QMutex m_mutex;
    QProcess* m_process = nullptr;
    bool m_running = false;
    qint64 m_pid = 0;
    LaunchResult m_last;

    // Line framing buffers (byte stream -> lines)
    QByteArray m_stdoutBuffer;
    QByteArray m_stderrBuffer;
};
