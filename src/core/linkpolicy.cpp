#include "linkpolicy.h"

#include <QJsonArray>
#include <QJsonDocument>

namespace
{
    const char* kMarker = "__missionControlLinks";

    bool isInterceptableScheme(const QString& scheme)
    {
        const QString s = scheme.toLower();
        return s == QLatin1String("http")
            || s == QLatin1String("https")
            || s == QLatin1String("mailto");
    }

    // %1 marker, %2 JSON array of local hosts, %3 bridge object name
    const char* kScriptTemplate = R"JS(
(function () {
  if (window.%1) { return; }
  window.%1 = true;

  var localHosts = %2;
  var bridge = null;
  var pending = [];

  function connectBridge() {
    if (bridge || typeof QWebChannel === 'undefined' || !window.qt || !qt.webChannelTransport) { return; }
    new QWebChannel(qt.webChannelTransport, function (channel) {
      bridge = channel.objects.%3;
      while (bridge && pending.length) { bridge.openExternal(pending.shift()); }
    });
  }

  function openExternal(href) {
    if (bridge) { bridge.openExternal(href); return; }
    pending.push(href);
    connectBridge();
  }

  connectBridge();

  document.addEventListener('click', function (event) {
    var node = event.target;
    var anchor = node && node.closest ? node.closest('a') : null;
    if (!anchor) { return; }

    var href = anchor.getAttribute('href');
    if (!href || href.charAt(0) === '#') { return; }

    var url;
    try {
      url = new URL(href, window.location.href);
    } catch (e) {
      return;
    }

    if (!/^(https?|mailto):$/.test(url.protocol)) { return; }
    if (localHosts.indexOf(url.hostname.toLowerCase()) !== -1) { return; }

    event.preventDefault();
    event.stopPropagation();
    openExternal(url.href);
  }, true);
})();
)JS";
}

namespace LinkPolicy
{

QStringList localHosts(const QString& configuredHost)
{
    QStringList hosts{
        QStringLiteral("localhost"),
        QStringLiteral("127.0.0.1"),
        QStringLiteral("::1"),
        QStringLiteral("[::1]"),
    };

    const QString extra = configuredHost.trimmed().toLower();
    if (!extra.isEmpty() && !hosts.contains(extra))
        hosts << extra;
    return hosts;
}

bool isLocalHost(const QString& host, const QString& configuredHost)
{
    return localHosts(configuredHost).contains(host.trimmed().toLower());
}

bool isExternal(const QUrl& url, const QString& configuredHost)
{
    if (!url.isValid() || url.isRelative())
        return false;
    if (!isInterceptableScheme(url.scheme()))
        return false;
    return !isLocalHost(url.host(), configuredHost);
}

bool shouldOpenExternally(const QString& href,
                          const QUrl& pageUrl,
                          const QString& configuredHost,
                          QUrl* resolved)
{
    const QString h = href.trimmed();
    if (h.isEmpty() || h.startsWith(QLatin1Char('#')))
        return false;

    const QUrl ref(h, QUrl::StrictMode);
    if (!ref.isValid())
        return false;

    const QUrl abs = pageUrl.resolved(ref);
    if (!isExternal(abs, configuredHost))
        return false;

    if (resolved)
        *resolved = abs;
    return true;
}

QString interceptionScript(const QString& configuredHost, const QString& bridgeObject)
{
    const QJsonArray hosts = QJsonArray::fromStringList(localHosts(configuredHost));
    const QString hostsJson = QString::fromUtf8(QJsonDocument(hosts).toJson(QJsonDocument::Compact));

    return QString::fromUtf8(kScriptTemplate)
        .arg(QLatin1String(kMarker), hostsJson, bridgeObject);
}

QString installedMarker()
{
    return QLatin1String(kMarker);
}

} // namespace LinkPolicy
