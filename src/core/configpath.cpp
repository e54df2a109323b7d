#include "configpath.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QtGlobal>

namespace ConfigPath
{

const char* const kEnvName = "MISSION_CONTROL_CONFIG";

static const char* kConfigDirName  = ".mission-control";
static const char* kConfigFileName = "config.json";

QString defaultConfigFile(bool perUserHome, const QString& homeDir, const QString& currentDir)
{
    const QDir base(perUserHome ? homeDir : currentDir);
    return QDir::cleanPath(base.absoluteFilePath(
        QStringLiteral("%1/%2").arg(QLatin1String(kConfigDirName), QLatin1String(kConfigFileName))));
}

QString platformConfigFile()
{
#if defined(Q_OS_MACOS)
    const bool perUserHome = true;
#else
    const bool perUserHome = false;
#endif
    return defaultConfigFile(perUserHome, QDir::homePath(), QDir::currentPath());
}

bool ensureDirectory(const QString& configFile, QString& err)
{
    const QString dirPath = QFileInfo(configFile).absolutePath();
    QDir dir(dirPath);
    if (dir.exists())
        return true;

    if (!dir.mkpath(QStringLiteral(".")))
    {
        err = QStringLiteral("cannot create config directory %1").arg(dirPath);
        return false;
    }
    return true;
}

QString exportToEnvironment(QString& err)
{
    QString path = qEnvironmentVariable(kEnvName);
    if (path.isEmpty())
        path = platformConfigFile();

    if (!ensureDirectory(path, err))
        return QString();

    if (!qputenv(kEnvName, QFile::encodeName(path)))
    {
        err = QStringLiteral("cannot set %1").arg(QLatin1String(kEnvName));
        return QString();
    }
    return path;
}

} // namespace ConfigPath
