/**
 * @file tests/unit/test_server_locator.cpp
 * @brief Unit tests for entry-point discovery and working directory selection.
 */
#include "../tests_common.h"

#include "src/core/serverlocator.h"

#include <QTemporaryDir>

namespace {

  const QString kEntry = QStringLiteral("src/server.js");

  struct RootTree {
    QTemporaryDir tmp;
    QStringList roots;

    explicit RootTree(int count) {
      for (int i = 0; i < count; ++i) {
        const QString root = tmp.path() + QStringLiteral("/root%1").arg(i);
        test_util::makeDir(root);
        roots << QDir::cleanPath(root);
      }
    }

    QString entryIn(int index) const {
      return QDir::cleanPath(roots[index] + QLatin1Char('/') + kEntry);
    }
  };

}  // namespace

TEST(ServerLocator, CandidateRootsFollowPriorityOrder) {
  QTemporaryDir tmp;
  const QString cwd = tmp.path() + QStringLiteral("/work/build");
  const QString exe = tmp.path() + QStringLiteral("/opt/bin");

  const QStringList roots = ServerLocator::candidateRoots(cwd, exe);

  ASSERT_EQ(roots.size(), 4);
  EXPECT_EQ(roots[0], QDir::cleanPath(cwd));
  EXPECT_EQ(roots[1], ServerLocator::resourcesDirFor(exe));
  EXPECT_EQ(roots[2], QDir::cleanPath(exe));
  EXPECT_EQ(roots[3], QDir::cleanPath(tmp.path() + QStringLiteral("/work")));
}

TEST(ServerLocator, SameDirectoryIsOnlyCheckedOnce) {
  QTemporaryDir tmp;
  const QString dir = tmp.path() + QStringLiteral("/app");

  const QStringList roots = ServerLocator::candidateRoots(dir, dir);

  ASSERT_EQ(roots.size(), 3);
  EXPECT_EQ(roots[0], QDir::cleanPath(dir));
  EXPECT_EQ(roots[1], ServerLocator::resourcesDirFor(dir));
  EXPECT_EQ(roots[2], QDir::cleanPath(tmp.path()));
}

TEST(ServerLocator, FirstMatchingRootWins) {
  RootTree tree(4);
  ASSERT_TRUE(test_util::makeFile(tree.entryIn(1)));
  ASSERT_TRUE(test_util::makeFile(tree.entryIn(3)));

  const auto match = ServerLocator::locateEntryPoint(tree.roots, kEntry);

  ASSERT_TRUE(match.found);
  EXPECT_EQ(match.index, 1);
  EXPECT_EQ(match.root, tree.roots[1]);
  EXPECT_EQ(match.entryPoint, tree.entryIn(1));
}

TEST(ServerLocator, EntryOnlyAtThirdCandidate) {
  RootTree tree(4);
  ASSERT_TRUE(test_util::makeFile(tree.entryIn(2)));
  ASSERT_TRUE(test_util::makeDir(tree.roots[2] + QStringLiteral("/node_modules")));

  const auto match = ServerLocator::locateEntryPoint(tree.roots, kEntry);

  ASSERT_TRUE(match.found);
  EXPECT_EQ(match.index, 2);
  EXPECT_EQ(ServerLocator::chooseWorkingDirectory(match.root, match.entryPoint, QStringLiteral("node_modules")),
            tree.roots[2]);
}

TEST(ServerLocator, NoMatchWhenEntryMissingEverywhere) {
  RootTree tree(4);

  const auto match = ServerLocator::locateEntryPoint(tree.roots, kEntry);

  EXPECT_FALSE(match.found);
  EXPECT_EQ(match.index, -1);
  EXPECT_TRUE(match.entryPoint.isEmpty());
}

TEST(ServerLocator, DirectoryWithEntryNameIsNotAMatch) {
  RootTree tree(2);
  ASSERT_TRUE(test_util::makeDir(tree.entryIn(0)));
  ASSERT_TRUE(test_util::makeFile(tree.entryIn(1)));

  const auto match = ServerLocator::locateEntryPoint(tree.roots, kEntry);

  ASSERT_TRUE(match.found);
  EXPECT_EQ(match.index, 1);
}

TEST(ServerLocator, MissingRootsAreSkipped) {
  RootTree tree(1);
  ASSERT_TRUE(test_util::makeFile(tree.entryIn(0)));
  const QStringList roots{tree.tmp.path() + QStringLiteral("/does-not-exist"), tree.roots[0]};

  const auto match = ServerLocator::locateEntryPoint(roots, kEntry);

  ASSERT_TRUE(match.found);
  EXPECT_EQ(match.index, 1);
}

TEST(ServerLocator, WorkingDirectoryIsRootWithDependencies) {
  RootTree tree(1);
  const QString entry = tree.roots[0] + QStringLiteral("/app/src/server.js");
  ASSERT_TRUE(test_util::makeFile(entry));
  ASSERT_TRUE(test_util::makeDir(tree.roots[0] + QStringLiteral("/node_modules")));

  EXPECT_EQ(ServerLocator::chooseWorkingDirectory(tree.roots[0], entry, QStringLiteral("node_modules")),
            tree.roots[0]);
}

TEST(ServerLocator, WorkingDirectoryFallsBackToEntryGrandparent) {
  RootTree tree(1);
  const QString entry = tree.roots[0] + QStringLiteral("/app/src/server.js");
  ASSERT_TRUE(test_util::makeFile(entry));

  EXPECT_EQ(ServerLocator::chooseWorkingDirectory(tree.roots[0], entry, QStringLiteral("node_modules")),
            tree.roots[0] + QStringLiteral("/app"));
}

TEST(ServerLocator, DependencyFileIsNotADependencyDirectory) {
  RootTree tree(1);
  const QString entry = tree.roots[0] + QStringLiteral("/app/src/server.js");
  ASSERT_TRUE(test_util::makeFile(entry));
  ASSERT_TRUE(test_util::makeFile(tree.roots[0] + QStringLiteral("/node_modules")));

  EXPECT_EQ(ServerLocator::chooseWorkingDirectory(tree.roots[0], entry, QStringLiteral("node_modules")),
            tree.roots[0] + QStringLiteral("/app"));
}
