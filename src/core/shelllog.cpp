#include "shelllog.h"

#include <cstdio>

#include <QDir>
#include <QFile>
#include <QMutex>
#include <QMutexLocker>
#include <QTextStream>

#if (QT_VERSION >= QT_VERSION_CHECK(6, 0, 0))
    #include <QStringConverter>
#endif

Q_LOGGING_CATEGORY(lcShell,      "mc.shell")
Q_LOGGING_CATEGORY(lcSupervisor, "mc.supervisor")
Q_LOGGING_CATEGORY(lcGate,       "mc.gate")
Q_LOGGING_CATEGORY(lcBridge,     "mc.bridge")

namespace
{
    QMutex g_mutex;
    QFile g_file;
    QTextStream g_stream;
    bool g_fileReady = false;
    QtMessageHandler g_previous = nullptr;
    bool g_installed = false;

    void messageHandler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg)
    {
        const QString category = ctx.category ? QString::fromLatin1(ctx.category) : QStringLiteral("default");
        const QString line = ShellLog::formatLine(type, category, msg, QDateTime::currentDateTime());

        QMutexLocker lock(&g_mutex);

        const QByteArray local = line.toLocal8Bit();
        std::fprintf(stderr, "%s\n", local.constData());
        std::fflush(stderr);

        if (g_fileReady)
        {
            g_stream << line << "\n";
            g_stream.flush();
        }
    }
}

namespace ShellLog
{

QString levelName(QtMsgType type)
{
    switch (type)
    {
    case QtDebugMsg:    return QStringLiteral("DEBUG");
    case QtInfoMsg:     return QStringLiteral("INFO");
    case QtWarningMsg:  return QStringLiteral("WARN");
    case QtCriticalMsg: return QStringLiteral("ERROR");
    case QtFatalMsg:    return QStringLiteral("FATAL");
    }
    return QStringLiteral("?");
}

QString formatLine(QtMsgType type,
                   const QString& category,
                   const QString& message,
                   const QDateTime& when)
{
    return QStringLiteral("[%1] [%2] [%3] %4")
        .arg(when.toString(Qt::ISODateWithMs), levelName(type), category, message);
}

bool install(const QString& logDir, QString& err)
{
    QMutexLocker lock(&g_mutex);

    if (g_file.isOpen())
        g_file.close();
    g_fileReady = false;

    bool ok = true;
    QDir d(logDir);
    if (!d.exists() && !d.mkpath(QStringLiteral(".")))
    {
        err = QStringLiteral("cannot create log directory %1").arg(logDir);
        ok = false;
    }

    if (ok)
    {
        const QString ts = QDateTime::currentDateTime().toString(QStringLiteral("yyyyMMdd_HHmmss_zzz"));
        g_file.setFileName(d.filePath(QStringLiteral("%1.log").arg(ts)));
        if (!g_file.open(QIODevice::WriteOnly | QIODevice::Text))
        {
            err = QStringLiteral("cannot open log file %1: %2").arg(g_file.fileName(), g_file.errorString());
            ok = false;
        }
    }

    if (ok)
    {
        g_stream.setDevice(&g_file);
#if (QT_VERSION >= QT_VERSION_CHECK(6, 0, 0))
        g_stream.setEncoding(QStringConverter::Utf8);
#else
        g_stream.setCodec("UTF-8");
#endif
        g_fileReady = true;
    }

    if (!g_installed)
    {
        g_previous = qInstallMessageHandler(messageHandler);
        g_installed = true;
    }
    return ok;
}

void uninstall()
{
    QMutexLocker lock(&g_mutex);

    if (g_installed)
    {
        qInstallMessageHandler(g_previous);
        g_previous = nullptr;
        g_installed = false;
    }

    g_fileReady = false;
    g_stream.setDevice(nullptr);
    if (g_file.isOpen())
        g_file.close();
}

QString currentLogFile()
{
    QMutexLocker lock(&g_mutex);
    return g_fileReady ? g_file.fileName() : QString();
}

} // namespace ShellLog
