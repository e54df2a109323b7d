#pragma once
/**
 * @file shelllog.h
 * @brief Logging categories and the per-run log file sink.
 *
 * Every qDebug/qCInfo/... message is written to stderr and appended to
 * logs/<yyyyMMdd_HHmmss_zzz>.log as:
 *   [<timestamp>] [<level>] [<category>] <message>
 */

#include <QDateTime>
#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(lcShell)
Q_DECLARE_LOGGING_CATEGORY(lcSupervisor)
Q_DECLARE_LOGGING_CATEGORY(lcGate)
Q_DECLARE_LOGGING_CATEGORY(lcBridge)

namespace ShellLog
{
    QString levelName(QtMsgType type);

    QString formatLine(QtMsgType type,
                       const QString& category,
                       const QString& message,
                       const QDateTime& when);

    /**
     * @brief Open a fresh log file under @p logDir and install the message handler.
     *
     * The handler is installed even if the file cannot be opened (stderr only).
     * @return false with @p err set when the file is unavailable
     */
    bool install(const QString& logDir, QString& err);

    /**
     * @brief Restore the previous handler and close the file.
     */
    void uninstall();

    QString currentLogFile();
}
