#pragma once
/**
 * @file serverlocator.h
 * @brief Finds the server entry-point file among candidate roots and picks its working directory.
 *
 * Candidate roots, in priority order:
 * 1. current working directory
 * 2. resources directory next to the executable (<exe>/../Resources in a macOS bundle, <exe>/resources elsewhere)
 * 3. executable directory
 * 4. parent of the current working directory
 *
 * The first root holding the entry point wins; later roots are never checked.
 */

#include <QString>
#include <QStringList>

namespace ServerLocator
{
    struct Match
    {
        bool found = false;
        int index = -1;      ///< Position of the matching root in the candidate list
        QString root;
        QString entryPoint;  ///< Absolute, cleaned path
    };

    QString resourcesDirFor(const QString& executableDir);

    QStringList candidateRoots(const QString& currentDir, const QString& executableDir);

    /**
     * @brief Return the first root whose @p relativeEntry exists as a regular file.
     */
    Match locateEntryPoint(const QStringList& roots, const QString& relativeEntry);

    /**
     * @brief @p root if it contains @p dependencyDir, otherwise the entry point's grandparent.
     */
    QString chooseWorkingDirectory(const QString& root,
                                   const QString& entryPoint,
                                   const QString& dependencyDir);
}
