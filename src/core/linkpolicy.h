#pragma once
/**
 * @file linkpolicy.h
 * @brief Decides which anchors leave the embedded view, and builds the page script that enforces it.
 *
 * Rule (shared by the script and the C++ side):
 * - no href, or a same-page fragment ("#...")      -> stay in the view
 * - href that cannot be resolved against the page  -> stay in the view
 * - resolved scheme other than http/https/mailto   -> stay in the view
 * - resolved hostname is a local host              -> stay in the view
 * - anything else                                  -> open with the OS default handler
 */

#include <QString>
#include <QStringList>
#include <QUrl>

namespace LinkPolicy
{
    /**
     * @brief Loopback names plus @p configuredHost, lower-cased, without duplicates.
     */
    QStringList localHosts(const QString& configuredHost);

    bool isLocalHost(const QString& host, const QString& configuredHost);

    /**
     * @brief Decide whether clicking @p href on @p pageUrl should open externally.
     * @param resolved receives the absolute URL when the answer is true
     */
    bool shouldOpenExternally(const QString& href,
                              const QUrl& pageUrl,
                              const QString& configuredHost,
                              QUrl* resolved = nullptr);

    /**
     * @brief Same rule for a URL that is already absolute (new-window requests).
     */
    bool isExternal(const QUrl& url, const QString& configuredHost);

    /**
     * @brief Idempotent click-capture script; calls @p bridgeObject.openExternal(url) over QWebChannel.
     */
    QString interceptionScript(const QString& configuredHost, const QString& bridgeObject);

    /**
     * @brief Global flag the script sets once installed.
     */
    QString installedMarker();
}
