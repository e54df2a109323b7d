#pragma once
/**
 * @file appsettings.h
 * @brief 本地配置（QSettings/ini）数据结构与读写接口声明
 *
 * ✅ 需求对齐：
 * 1) 服务端定位/启动、/health 轮询策略、链接拦截、窗口参数全部走 shell.ini
 *    - 路径：<applicationDirPath>/shell.ini（便于随程序拷贝部署）
 *    - 缺失的键使用下方默认值；首次运行写回完整 ini
 *
 * 2) 读取时做归一化：负数/越界值回退或截断，保证轮询一定会结束
 */

#include <QString>

#include "../core/retrypolicy.h"

/**
 * @brief 服务端启动参数
 */
struct ServerSettings
{
    QString runtime = "node";              ///< 运行时，可执行文件名或绝对路径
    QString entryPoint = "src/server.js";  ///< 相对每个候选根目录
    QString dependencyDir = "node_modules";
    QString envName = "NODE_ENV";          ///< 生产模式环境变量名
    QString envValue = "production";
    int stopGraceMs = 3000;                ///< 退出时 terminate() 等待多久再 kill()
};

/**
 * @brief /health 地址与轮询策略
 */
struct ReadinessSettings
{
    QString host = "localhost";
    int port = 1337;
    QString healthPath = "/health";
    RetryPolicy retry;
    RetryPolicy recovery{5000, 720, 0};    ///< 超时显示后的低频轮询；intervalMs=0 关闭
    int probeTimeoutMs = 30000;            ///< 单次请求超时，始终 > 0
};

struct LinkSettings
{
    bool intercept = true;
    int reinjectMs = 0;                    ///< 0 = 不定时重注入
};

struct WindowSettings
{
    QString title = "Mission Control";
    int width = 1280;
    int height = 800;
};

/**
 * @brief Settings root.
 */
struct SettingsData
{
    ServerSettings server;
    ReadinessSettings readiness;
    LinkSettings links;
    WindowSettings window;
    int warmupMs = 2000;                   ///< Pause between spawn and window creation
};

/**
 * @brief AppSettings: QSettings/ini read/write wrapper.
 */
class AppSettings
{
public:
    static QString defaultPath();

    static SettingsData load();
    static SettingsData load(const QString& iniFile);

    static bool save(const SettingsData& data, QString& err);
    static bool save(const SettingsData& data, const QString& iniFile, QString& err);

public:
    static QString serverRootUrl(const ReadinessSettings& r);
    static QString healthUrl(const ReadinessSettings& r);
};
