#include "serverlocator.h"

#include <QDir>
#include <QFileInfo>

namespace
{
    QString normalizedDir(const QString& path)
    {
        return QDir::cleanPath(QDir(path).absolutePath());
    }
}

namespace ServerLocator
{

QString resourcesDirFor(const QString& executableDir)
{
    const QDir exe(executableDir);
#if defined(Q_OS_MACOS)
    return QDir::cleanPath(exe.absoluteFilePath(QStringLiteral("../Resources")));
#else
    return QDir::cleanPath(exe.absoluteFilePath(QStringLiteral("resources")));
#endif
}

QStringList candidateRoots(const QString& currentDir, const QString& executableDir)
{
    QStringList ordered;
    ordered << normalizedDir(currentDir)
            << resourcesDirFor(executableDir)
            << normalizedDir(executableDir)
            << QDir::cleanPath(QDir(currentDir).absoluteFilePath(QStringLiteral("..")));

    // Same directory reached two ways is only checked once, at its first position.
    QStringList roots;
    for (const auto& r : ordered)
    {
        if (!r.isEmpty() && !roots.contains(r))
            roots << r;
    }
    return roots;
}

Match locateEntryPoint(const QStringList& roots, const QString& relativeEntry)
{
    Match m;
    if (relativeEntry.isEmpty())
        return m;

    for (int i = 0; i < roots.size(); ++i)
    {
        const QString candidate = QDir::cleanPath(QDir(roots[i]).absoluteFilePath(relativeEntry));
        const QFileInfo info(candidate);
        if (info.exists() && info.isFile())
        {
            m.found = true;
            m.index = i;
            m.root = normalizedDir(roots[i]);
            m.entryPoint = candidate;
            return m;
        }
    }
    return m;
}

QString chooseWorkingDirectory(const QString& root,
                               const QString& entryPoint,
                               const QString& dependencyDir)
{
    if (!dependencyDir.isEmpty())
    {
        const QFileInfo deps(QDir(root).absoluteFilePath(dependencyDir));
        if (deps.exists() && deps.isDir())
            return normalizedDir(root);
    }

    // <grandparent>/<parent>/<entry>: entry point lives one level below the project root.
    const QFileInfo entry(entryPoint);
    return QDir::cleanPath(QFileInfo(entry.absolutePath()).absolutePath());
}

} // namespace ServerLocator
