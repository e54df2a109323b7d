/**
 * @file main.cpp
 * @brief 程序入口（Mission Control 桌面壳）
 *
 * ✅ 需求对齐：
 * - 日志落盘（logs/<时间戳>.log）+ 本地配置 shell.ini（程序目录下）
 * - 导出服务端配置路径 MISSION_CONTROL_CONFIG
 * - 定位并启动 node 服务；失败只记日志，不退出
 * - 预热等待 -> 隐藏主窗口 -> 子线程轮询 /health，就绪后再显示
 */

#include <QApplication>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QThread>

#include "mainwindow.h"
#include "src/config/appsettings.h"
#include "src/core/configpath.h"
#include "src/core/serverlocator.h"
#include "src/core/shelllog.h"
#include "src/services/serversupervisor.h"

int main(int argc, char *argv[])
{
    QCoreApplication::setAttribute(Qt::AA_ShareOpenGLContexts);
    QApplication app(argc, argv);

    // 组织/应用名用于 QSettings 默认作用域（ini 路径另行指定）
    QCoreApplication::setOrganizationName("MissionControl");
    QCoreApplication::setApplicationName("MissionControlShell");

    QString err;
    const QString appDir = QCoreApplication::applicationDirPath();
    if (!ShellLog::install(QDir(appDir).filePath("logs"), err))
        qCWarning(lcShell).noquote() << "File logging disabled:" << err;

    const SettingsData settings = AppSettings::load();
    if (!QFileInfo::exists(AppSettings::defaultPath()) && !AppSettings::save(settings, err))
        qCWarning(lcShell).noquote() << "Cannot write default settings:" << err;

    const QString configFile = ConfigPath::exportToEnvironment(err);
    if (configFile.isEmpty())
        qCWarning(lcShell).noquote() << "Server config path not exported:" << err;
    else
        qCInfo(lcShell).noquote() << ConfigPath::kEnvName << "=" << configFile;

    int rc = 0;
    // 作用域结束时先析构窗口（回收轮询线程），再析构 supervisor（停止子进程）
    {
        ServerSupervisor supervisor(settings.server);

        const QStringList roots = ServerLocator::candidateRoots(QDir::currentPath(), appDir);
        const LaunchResult launch = supervisor.start(roots);
        if (!launch.ok())
            qCWarning(lcShell).noquote() << "Continuing without a started server:"
                                         << launchStatusToString(launch.status);

        if (settings.warmupMs > 0)
            QThread::msleep(static_cast<unsigned long>(settings.warmupMs));

        MainWindow w(settings, &supervisor);
        w.startReadinessGate();

        rc = app.exec();
    }

    ShellLog::uninstall();
    return rc;
}
