/**
 * @file appsettings.cpp
 * @brief AppSettings implementation: QSettings(ini) persistence next to the executable.
 */

#include "appsettings.h"

#include <algorithm>
#include <QSettings>
#include <QCoreApplication>
#include <QDir>

// ==============================
// ini path: <app dir>/shell.ini
// ==============================
QString AppSettings::defaultPath()
{
    const QString dir = QCoreApplication::applicationDirPath();
    return QDir(dir).filePath("shell.ini");
}

// ==============================
// Keys
// ==============================
namespace Keys
{
    // server
    static const char* kRuntime       = "server/runtime";
    static const char* kEntryPoint    = "server/entryPoint";
    static const char* kDependencyDir = "server/dependencyDir";
    static const char* kEnvName       = "server/envName";
    static const char* kEnvValue      = "server/envValue";
    static const char* kStopGraceMs   = "server/stopGraceMs";

    // startup
    static const char* kWarmupMs      = "startup/warmupMs";

    // readiness
    static const char* kHost          = "readiness/host";
    static const char* kPort          = "readiness/port";
    static const char* kHealthPath    = "readiness/healthPath";
    static const char* kIntervalMs    = "readiness/intervalMs";
    static const char* kCeiling       = "readiness/ceiling";
    static const char* kJitterMs      = "readiness/jitterMs";
    static const char* kProbeTimeout  = "readiness/probeTimeoutMs";
    static const char* kRecoveryMs    = "readiness/recoveryIntervalMs";
    static const char* kRecoveryCeil  = "readiness/recoveryCeiling";

    // links
    static const char* kIntercept     = "links/intercept";
    static const char* kReinjectMs    = "links/reinjectMs";

    // window
    static const char* kTitle         = "window/title";
    static const char* kWidth         = "window/width";
    static const char* kHeight        = "window/height";
}

// ==============================
// Normalisation
// ==============================
static void normalize(SettingsData& d)
{
    const SettingsData defaults;

    if (d.server.runtime.trimmed().isEmpty())
        d.server.runtime = defaults.server.runtime;
    if (d.server.entryPoint.trimmed().isEmpty())
        d.server.entryPoint = defaults.server.entryPoint;
    d.server.stopGraceMs = std::max(0, d.server.stopGraceMs);

    d.warmupMs = std::max(0, d.warmupMs);

    if (d.readiness.host.trimmed().isEmpty())
        d.readiness.host = defaults.readiness.host;
    if (d.readiness.port < 1 || d.readiness.port > 65535)
        d.readiness.port = defaults.readiness.port;
    if (!d.readiness.healthPath.startsWith('/'))
        d.readiness.healthPath.prepend('/');
    d.readiness.retry = d.readiness.retry.normalized();
    d.readiness.recovery = d.readiness.recovery.normalized();
    if (d.readiness.probeTimeoutMs <= 0)
        d.readiness.probeTimeoutMs = defaults.readiness.probeTimeoutMs;

    d.links.reinjectMs = std::max(0, d.links.reinjectMs);

    if (d.window.width < 200)  d.window.width = defaults.window.width;
    if (d.window.height < 150) d.window.height = defaults.window.height;
}

// ==============================
// Load
// ==============================
SettingsData AppSettings::load()
{
    return load(defaultPath());
}

SettingsData AppSettings::load(const QString& iniFile)
{
    QSettings s(iniFile, QSettings::IniFormat);
    const SettingsData def;
    SettingsData d;

    // server
    d.server.runtime       = s.value(Keys::kRuntime, def.server.runtime).toString();
    d.server.entryPoint    = s.value(Keys::kEntryPoint, def.server.entryPoint).toString();
    d.server.dependencyDir = s.value(Keys::kDependencyDir, def.server.dependencyDir).toString();
    d.server.envName       = s.value(Keys::kEnvName, def.server.envName).toString();
    d.server.envValue      = s.value(Keys::kEnvValue, def.server.envValue).toString();
    d.server.stopGraceMs   = s.value(Keys::kStopGraceMs, def.server.stopGraceMs).toInt();

    // startup
    d.warmupMs = s.value(Keys::kWarmupMs, def.warmupMs).toInt();

    // readiness
    d.readiness.host             = s.value(Keys::kHost, def.readiness.host).toString();
    d.readiness.port             = s.value(Keys::kPort, def.readiness.port).toInt();
    d.readiness.healthPath       = s.value(Keys::kHealthPath, def.readiness.healthPath).toString();
    d.readiness.retry.intervalMs = s.value(Keys::kIntervalMs, def.readiness.retry.intervalMs).toInt();
    d.readiness.retry.ceiling    = s.value(Keys::kCeiling, def.readiness.retry.ceiling).toInt();
    d.readiness.retry.jitterMs   = s.value(Keys::kJitterMs, def.readiness.retry.jitterMs).toInt();
    d.readiness.probeTimeoutMs   = s.value(Keys::kProbeTimeout, def.readiness.probeTimeoutMs).toInt();
    d.readiness.recovery.intervalMs = s.value(Keys::kRecoveryMs, def.readiness.recovery.intervalMs).toInt();
    d.readiness.recovery.ceiling    = s.value(Keys::kRecoveryCeil, def.readiness.recovery.ceiling).toInt();

    // links
    d.links.intercept  = s.value(Keys::kIntercept, def.links.intercept).toBool();
    d.links.reinjectMs = s.value(Keys::kReinjectMs, def.links.reinjectMs).toInt();

    // window
    d.window.title  = s.value(Keys::kTitle, def.window.title).toString();
    d.window.width  = s.value(Keys::kWidth, def.window.width).toInt();
    d.window.height = s.value(Keys::kHeight, def.window.height).toInt();

    normalize(d);
    return d;
}

// ==============================
// Save (overwrite)
// ==============================
bool AppSettings::save(const SettingsData& data, QString& err)
{
    return save(data, defaultPath(), err);
}

bool AppSettings::save(const SettingsData& data, const QString& iniFile, QString& err)
{
    QSettings s(iniFile, QSettings::IniFormat);

    s.setValue(Keys::kRuntime, data.server.runtime);
    s.setValue(Keys::kEntryPoint, data.server.entryPoint);
    s.setValue(Keys::kDependencyDir, data.server.dependencyDir);
    s.setValue(Keys::kEnvName, data.server.envName);
    s.setValue(Keys::kEnvValue, data.server.envValue);
    s.setValue(Keys::kStopGraceMs, data.server.stopGraceMs);

    s.setValue(Keys::kWarmupMs, data.warmupMs);

    s.setValue(Keys::kHost, data.readiness.host);
    s.setValue(Keys::kPort, data.readiness.port);
    s.setValue(Keys::kHealthPath, data.readiness.healthPath);
    s.setValue(Keys::kIntervalMs, data.readiness.retry.intervalMs);
    s.setValue(Keys::kCeiling, data.readiness.retry.ceiling);
    s.setValue(Keys::kJitterMs, data.readiness.retry.jitterMs);
    s.setValue(Keys::kProbeTimeout, data.readiness.probeTimeoutMs);
    s.setValue(Keys::kRecoveryMs, data.readiness.recovery.intervalMs);
    s.setValue(Keys::kRecoveryCeil, data.readiness.recovery.ceiling);

    s.setValue(Keys::kIntercept, data.links.intercept);
    s.setValue(Keys::kReinjectMs, data.links.reinjectMs);

    s.setValue(Keys::kTitle, data.window.title);
    s.setValue(Keys::kWidth, data.window.width);
    s.setValue(Keys::kHeight, data.window.height);

    s.sync();
    if (s.status() != QSettings::NoError)
    {
        err = QStringLiteral("cannot write settings to %1").arg(iniFile);
        return false;
    }
    return true;
}

// ==============================
// URLs
// ==============================
QString AppSettings::serverRootUrl(const ReadinessSettings& r)
{
    return QStringLiteral("http://%1:%2").arg(r.host).arg(r.port);
}

QString AppSettings::healthUrl(const ReadinessSettings& r)
{
    return serverRootUrl(r) + r.healthPath;
}
