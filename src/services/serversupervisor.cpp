/**
 * @file serversupervisor.cpp
 * @brief Server supervisor: locate the entry point, spawn the runtime, frame its output.
 */

#include "serversupervisor.h"

#include <QMutexLocker>
#include <QProcessEnvironment>

#include "../core/serverlocator.h"
#include "../core/shelllog.h"

namespace
{
    const int kStartTimeoutMs = 5000;
    const int kKillWaitMs = 1000;
    const int kMaxPendingLine = 64 * 1024;
}

ServerSupervisor::ServerSupervisor(const ServerSettings& settings, QObject* parent)
    : QObject(parent)
    , m_settings(settings)
{
}

ServerSupervisor::~ServerSupervisor()
{
    stop();
}

LaunchResult ServerSupervisor::record(const LaunchResult& r)
{
    QMutexLocker lock(&m_mutex);
    m_last = r;
    return r;
}

LaunchResult ServerSupervisor::start(const QStringList& roots)
{
    {
        QMutexLocker lock(&m_mutex);
        if (m_process)
        {
            LaunchResult busy = m_last;
            busy.status = LaunchStatus::SpawnFailed;
            busy.error = QStringLiteral("server already started (pid %1)").arg(m_pid);
            return busy;
        }
    }

    LaunchResult r;

    const auto match = ServerLocator::locateEntryPoint(roots, m_settings.entryPoint);
    if (!match.found)
    {
        r.status = LaunchStatus::NotFound;
        r.error = QStringLiteral("%1 not found under any of: %2")
                      .arg(m_settings.entryPoint, roots.join(QStringLiteral(", ")));
        qCWarning(lcSupervisor).noquote() << launchStatusToString(r.status) << r.error;
        return record(r);
    }

    r.root = match.root;
    r.entryPoint = match.entryPoint;
    r.workingDirectory = ServerLocator::chooseWorkingDirectory(match.root, match.entryPoint,
                                                               m_settings.dependencyDir);

    qCInfo(lcSupervisor).noquote() << "Starting server:" << m_settings.runtime << r.entryPoint;
    qCInfo(lcSupervisor).noquote() << "Working directory:" << r.workingDirectory;

    auto* proc = new QProcess(this);
    proc->setProgram(m_settings.runtime);
    proc->setArguments(QStringList{r.entryPoint});
    proc->setWorkingDirectory(r.workingDirectory);
    proc->setProcessChannelMode(QProcess::SeparateChannels);

    QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    if (!m_settings.envName.isEmpty())
        env.insert(m_settings.envName, m_settings.envValue);
    proc->setProcessEnvironment(env);

    connect(proc, &QProcess::readyReadStandardOutput, this, &ServerSupervisor::onReadyReadStdout);
    connect(proc, &QProcess::readyReadStandardError, this, &ServerSupervisor::onReadyReadStderr);
    connect(proc, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished),
            this, &ServerSupervisor::onFinished);
    connect(proc, &QProcess::errorOccurred, this, &ServerSupervisor::onErrorOccurred);

    {
        QMutexLocker lock(&m_mutex);
        m_process = proc;
        m_stdoutBuffer.clear();
        m_stderrBuffer.clear();
    }

    proc->start();
    if (!proc->waitForStarted(kStartTimeoutMs))
    {
        r.status = LaunchStatus::SpawnFailed;
        r.error = QStringLiteral("cannot start %1: %2").arg(m_settings.runtime, proc->errorString());
        qCWarning(lcSupervisor).noquote() << launchStatusToString(r.status) << r.error;

        {
            QMutexLocker lock(&m_mutex);
            m_process = nullptr;
        }
        proc->disconnect(this);
        proc->deleteLater();
        return record(r);
    }

    r.status = LaunchStatus::Started;
    r.pid = proc->processId();
    {
        QMutexLocker lock(&m_mutex);
        m_running = true;
        m_pid = r.pid;
    }

    qCInfo(lcSupervisor) << "Server started, pid" << r.pid;
    return record(r);
}

void ServerSupervisor::stop()
{
    QProcess* proc = nullptr;
    {
        QMutexLocker lock(&m_mutex);
        proc = m_process;
    }

    if (!proc || proc->state() == QProcess::NotRunning)
        return;

    qCInfo(lcSupervisor) << "Stopping server, pid" << proc->processId();
    proc->terminate();
    if (!proc->waitForFinished(m_settings.stopGraceMs))
    {
        qCWarning(lcSupervisor) << "Server ignored terminate after" << m_settings.stopGraceMs << "ms, killing";
        proc->kill();
        if (!proc->waitForFinished(kKillWaitMs))
            qCWarning(lcSupervisor) << "Server still running after kill";
    }
}

bool ServerSupervisor::isRunning() const
{
    QMutexLocker lock(&m_mutex);
    return m_running;
}

qint64 ServerSupervisor::processId() const
{
    QMutexLocker lock(&m_mutex);
    return m_running ? m_pid : 0;
}

LaunchResult ServerSupervisor::lastLaunch() const
{
    QMutexLocker lock(&m_mutex);
    return m_last;
}

void ServerSupervisor::onReadyReadStdout()
{
    if (!m_process)
        return;
    drainLines(m_stdoutBuffer, m_process->readAllStandardOutput(), "stdout");
}

void ServerSupervisor::onReadyReadStderr()
{
    if (!m_process)
        return;
    drainLines(m_stderrBuffer, m_process->readAllStandardError(), "stderr");
}

void ServerSupervisor::drainLines(QByteArray& buffer, const QByteArray& chunk, const char* stream)
{
    buffer.append(chunk);

    // LF framing; CR is trimmed with the rest of the whitespace
    while (true)
    {
        const int end = buffer.indexOf('\n');
        if (end < 0)
        {
            if (buffer.size() > kMaxPendingLine)
            {
                const QString partial = QString::fromUtf8(buffer).trimmed();
                buffer.clear();
                qCDebug(lcSupervisor).noquote() << QStringLiteral("[%1]").arg(QLatin1String(stream)) << partial;
                emit outputLine(partial);
            }
            return;
        }

        const QByteArray raw = buffer.left(end + 1);
        buffer.remove(0, end + 1);

        const QString line = QString::fromUtf8(raw).trimmed();
        if (line.isEmpty())
            continue;

        qCDebug(lcSupervisor).noquote() << QStringLiteral("[%1]").arg(QLatin1String(stream)) << line;
        emit outputLine(line);
    }
}

void ServerSupervisor::onFinished(int exitCode, QProcess::ExitStatus status)
{
    {
        QMutexLocker lock(&m_mutex);
        m_running = false;
    }

    // Flush whatever the child wrote without a trailing newline.
    if (m_process)
    {
        drainLines(m_stdoutBuffer, m_process->readAllStandardOutput() + '\n', "stdout");
        drainLines(m_stderrBuffer, m_process->readAllStandardError() + '\n', "stderr");
    }

    const bool crashed = status == QProcess::CrashExit;
    qCWarning(lcSupervisor) << "Server exited, code" << exitCode << (crashed ? "(crashed)" : "");
    emit exited(exitCode, crashed);
}

void ServerSupervisor::onErrorOccurred(QProcess::ProcessError error)
{
    // FailedToStart is reported by start() itself.
    if (error == QProcess::FailedToStart || !m_process)
        return;

    qCWarning(lcSupervisor).noquote() << "Server process error:" << m_process->errorString();
}
