/**
 * @file tests/main.cpp
 * @brief Test entry point; a QCoreApplication provides the event loop for signal and network tests.
 */
#include <gtest/gtest.h>

#include <QCoreApplication>

int main(int argc, char **argv) {
  QCoreApplication app(argc, argv);
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
