#pragma once
/**
 * @file shellpage.h
 * @brief Web page hosting the server UI: link interception scripts and new-window routing.
 */

#include <QString>
#include <QWebEnginePage>

class QWebChannel;
class ShellBridge;

class ShellPage : public QWebEnginePage
{
    Q_OBJECT
public:
    ShellPage(ShellBridge* bridge, const QString& localHost, QObject* parent = nullptr);

    /**
     * @brief Register the click-capture script for every document and run it on the current one.
     */
    void installLinkInterception();

    /**
     * @brief Run the script again on the current document; the marker makes it a no-op if present.
     */
    void reinjectLinkInterception();

    bool linkInterceptionInstalled() const { return m_linksInstalled; }

protected:
    QWebEnginePage* createWindow(WebWindowType type) override;

private slots:
    void onPopupNavigation(const QUrl& url);

private:
    ShellBridge* m_bridge = nullptr;
    QWebChannel* m_channel = nullptr;
    QString m_localHost;
    QString m_script;
    bool m_linksInstalled = false;
};
