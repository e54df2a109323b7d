#include "shellpage.h"

#include <QFile>
#include <QWebChannel>
#include <QWebEngineScript>
#include <QWebEngineScriptCollection>

#include "shellbridge.h"
#include "../core/linkpolicy.h"
#include "../core/shelllog.h"

namespace
{
    const char* kChannelScriptName = "mission-control-webchannel";
    const char* kLinkScriptName    = "mission-control-links";

    /**
     * @brief Throwaway page that only reports the first URL a popup tries to load.
     */
    class PopupCatcher : public QWebEnginePage
    {
        Q_OBJECT
    public:
        explicit PopupCatcher(QObject* parent) : QWebEnginePage(parent) {}

    signals:
        void navigationCaptured(const QUrl& url);

    protected:
        bool acceptNavigationRequest(const QUrl& url, NavigationType, bool isMainFrame) override
        {
            if (isMainFrame && !m_done)
            {
                m_done = true;
                emit navigationCaptured(url);
                deleteLater();
            }
            return false;
        }

    private:
        bool m_done = false;
    };

    QString readChannelLibrary()
    {
        QFile f(QStringLiteral(":/qtwebchannel/qwebchannel.js"));
        if (!f.open(QIODevice::ReadOnly))
        {
            qCWarning(lcBridge) << "qwebchannel.js resource unavailable, external links cannot be bridged";
            return QString();
        }
        return QString::fromUtf8(f.readAll());
    }
}

ShellPage::ShellPage(ShellBridge* bridge, const QString& localHost, QObject* parent)
    : QWebEnginePage(parent)
    , m_bridge(bridge)
    , m_localHost(localHost)
{
    m_channel = new QWebChannel(this);
    m_channel->registerObject(ShellBridge::channelName(), m_bridge);
    setWebChannel(m_channel);

    m_script = LinkPolicy::interceptionScript(m_localHost, ShellBridge::channelName());
}

void ShellPage::installLinkInterception()
{
    if (m_linksInstalled)
    {
        reinjectLinkInterception();
        return;
    }
    m_linksInstalled = true;

    const QString channelLib = readChannelLibrary();
    if (!channelLib.isEmpty())
    {
        QWebEngineScript channelScript;
        channelScript.setName(QLatin1String(kChannelScriptName));
        channelScript.setSourceCode(channelLib);
        channelScript.setInjectionPoint(QWebEngineScript::DocumentCreation);
        channelScript.setWorldId(QWebEngineScript::MainWorld);
        channelScript.setRunsOnSubFrames(false);
        scripts().insert(channelScript);
    }

    QWebEngineScript linkScript;
    linkScript.setName(QLatin1String(kLinkScriptName));
    linkScript.setSourceCode(m_script);
    linkScript.setInjectionPoint(QWebEngineScript::DocumentReady);
    linkScript.setWorldId(QWebEngineScript::MainWorld);
    linkScript.setRunsOnSubFrames(false);
    scripts().insert(linkScript);

    qCInfo(lcBridge) << "Link interception installed";
    reinjectLinkInterception();
}

void ShellPage::reinjectLinkInterception()
{
    runJavaScript(m_script);
}

QWebEnginePage* ShellPage::createWindow(WebWindowType type)
{
    Q_UNUSED(type);

    // target=_blank / window.open: decide once the popup reveals its URL.
    auto* catcher = new PopupCatcher(this);
    connect(catcher, &PopupCatcher::navigationCaptured, this, &ShellPage::onPopupNavigation);
    return catcher;
}

void ShellPage::onPopupNavigation(const QUrl& url)
{
    if (LinkPolicy::isExternal(url, m_localHost))
    {
        m_bridge->openExternal(url.toString());
        return;
    }

    if (url.isValid() && !url.isEmpty())
        setUrl(url);
}

#include "shellpage.moc"
