#include "shellbridge.h"

#include <utility>

#include <QDesktopServices>

#include "../core/shelllog.h"

ShellBridge::ShellBridge(QObject* parent)
    : QObject(parent)
    , m_opener([](const QUrl& url) { return QDesktopServices::openUrl(url); })
{
}

void ShellBridge::setOpener(Opener opener)
{
    m_opener = std::move(opener);
}

bool ShellBridge::isOpenable(const QUrl& url)
{
    if (!url.isValid() || url.isRelative())
        return false;

    const QString scheme = url.scheme().toLower();
    if (scheme == QLatin1String("mailto"))
        return !url.path().isEmpty();
    if (scheme == QLatin1String("http") || scheme == QLatin1String("https"))
        return !url.host().isEmpty();
    return false;
}

bool ShellBridge::openExternal(const QString& url)
{
    const QUrl parsed(url.trimmed(), QUrl::StrictMode);
    if (!isOpenable(parsed))
    {
        const QString reason = QStringLiteral("not an absolute http/https/mailto URL");
        qCWarning(lcBridge).noquote() << "Refusing to open" << url << "-" << reason;
        emit externalRejected(url, reason);
        return false;
    }

    if (!m_opener || !m_opener(parsed))
    {
        const QString reason = QStringLiteral("no handler accepted the URL");
        qCWarning(lcBridge).noquote() << "Cannot open" << parsed.toString() << "-" << reason;
        emit externalRejected(url, reason);
        return false;
    }

    qCInfo(lcBridge).noquote() << "Opened externally:" << parsed.toString();
    emit externalOpened(parsed);
    return true;
}
