#pragma once
/**
 * @file configpath.h
 * @brief Location of the server's config.json, handed to the child through an environment variable.
 *
 * macOS: ~/.mission-control/config.json
 * other: ./.mission-control/config.json (relative to the working directory)
 *
 * The shell never reads the file; it only makes sure its directory exists.
 */

#include <QString>

namespace ConfigPath
{
    extern const char* const kEnvName;   ///< MISSION_CONTROL_CONFIG

    QString defaultConfigFile(bool perUserHome, const QString& homeDir, const QString& currentDir);

    /**
     * @brief Platform default for this process.
     */
    QString platformConfigFile();

    bool ensureDirectory(const QString& configFile, QString& err);

    /**
     * @brief Resolve the path, create its directory and export it.
     *
     * A value already present in the environment is kept as-is.
     * @return the exported path; empty with @p err set on failure
     */
    QString exportToEnvironment(QString& err);
}
