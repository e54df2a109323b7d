#pragma once
/**
 * @file shellbridge.h
 * @brief Object published to the page over QWebChannel as "shell".
 *
 * openExternal(url) hands absolute http/https/mailto URLs to the OS default
 * handler. Anything else is rejected and logged.
 */

#include <functional>

#include <QObject>
#include <QString>
#include <QUrl>

class ShellBridge : public QObject
{
    Q_OBJECT
public:
    using Opener = std::function<bool(const QUrl&)>;

    explicit ShellBridge(QObject* parent = nullptr);

    /**
     * @brief Replace QDesktopServices::openUrl (tests).
     */
    void setOpener(Opener opener);

    static bool isOpenable(const QUrl& url);

    static QString channelName() { return QStringLiteral("shell"); }

public slots:
    bool openExternal(const QString& url);

signals:
    void externalOpened(const QUrl& url);
    void externalRejected(const QString& url, const QString& reason);

private:
    Opener m_opener;
};
