/**
 * @file tests/unit/test_config_path.cpp
 * @brief Unit tests for the exported server configuration path.
 */
#include "../tests_common.h"

#include "src/core/configpath.h"

#include <QTemporaryDir>

namespace {

  class EnvGuard {
  public:
    explicit EnvGuard(const char *name):
        name(name),
        had(qEnvironmentVariableIsSet(name)),
        value(qgetenv(name)) {}

    ~EnvGuard() {
      if (had) {
        qputenv(name, value);
      } else {
        qunsetenv(name);
      }
    }

  private:
    const char *name;
    bool had;
    QByteArray value;
  };

}  // namespace

TEST(ConfigPath, PerUserHomeLayout) {
  EXPECT_EQ(ConfigPath::defaultConfigFile(true, QStringLiteral("/home/ada"), QStringLiteral("/opt/app")),
            QDir::cleanPath(QDir(QStringLiteral("/home/ada")).absoluteFilePath(".mission-control/config.json")));
}

TEST(ConfigPath, WorkingDirectoryLayout) {
  EXPECT_EQ(ConfigPath::defaultConfigFile(false, QStringLiteral("/home/ada"), QStringLiteral("/opt/app")),
            QDir::cleanPath(QDir(QStringLiteral("/opt/app")).absoluteFilePath(".mission-control/config.json")));
}

TEST(ConfigPath, EnsureDirectoryCreatesParent) {
  QTemporaryDir tmp;
  const QString file = tmp.filePath(QStringLiteral("a/b/config.json"));

  QString err;
  ASSERT_TRUE(ConfigPath::ensureDirectory(file, err)) << err.toStdString();
  EXPECT_TRUE(QFileInfo(tmp.filePath(QStringLiteral("a/b"))).isDir());
  EXPECT_FALSE(QFileInfo::exists(file));

  EXPECT_TRUE(ConfigPath::ensureDirectory(file, err));
}

TEST(ConfigPath, ExistingEnvironmentValueIsKept) {
  EnvGuard guard(ConfigPath::kEnvName);
  QTemporaryDir tmp;
  const QString preset = tmp.filePath(QStringLiteral("custom/config.json"));
  qputenv(ConfigPath::kEnvName, QFile::encodeName(preset));

  QString err;
  const QString exported = ConfigPath::exportToEnvironment(err);

  EXPECT_EQ(exported, preset);
  EXPECT_EQ(qEnvironmentVariable(ConfigPath::kEnvName), preset);
  EXPECT_TRUE(QFileInfo(tmp.filePath(QStringLiteral("custom"))).isDir());
}

TEST(ConfigPath, ExportsPlatformDefaultWhenUnset) {
  EnvGuard guard(ConfigPath::kEnvName);
  qunsetenv(ConfigPath::kEnvName);

  QTemporaryDir tmp;
  const QString previousDir = QDir::currentPath();
  ASSERT_TRUE(QDir::setCurrent(tmp.path()));

  QString err;
  const QString exported = ConfigPath::exportToEnvironment(err);

  ASSERT_FALSE(exported.isEmpty()) << err.toStdString();
  EXPECT_EQ(exported, ConfigPath::platformConfigFile());
  EXPECT_EQ(qEnvironmentVariable(ConfigPath::kEnvName), exported);
  EXPECT_TRUE(exported.endsWith(QStringLiteral(".mission-control/config.json")));

  QDir::setCurrent(previousDir);
}
