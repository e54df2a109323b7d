/**
 * @file tests/unit/test_reveal_controller.cpp
 * @brief Unit tests for turning gate outcomes into window actions.
 */
#include "../tests_common.h"

#include "src/core/revealcontroller.h"

namespace {

  const QUrl kRoot(QStringLiteral("http://localhost:1337"));

  struct RevealHarness {
    RevealController controller;
    QStringList events;
    QUrl navigated;

    explicit RevealHarness(bool intercept, bool recover = true):
        controller(kRoot, intercept, recover) {
      QObject::connect(&controller, &RevealController::navigateRequested, [this](const QUrl &url) {
        events << QStringLiteral("navigate");
        navigated = url;
      });
      QObject::connect(&controller, &RevealController::linkInterceptionRequested, [this]() {
        events << QStringLiteral("inject");
      });
      QObject::connect(&controller, &RevealController::revealRequested, [this](GateOutcome outcome) {
        events << QStringLiteral("reveal:%1").arg(gateOutcomeToString(outcome));
      });
      QObject::connect(&controller, &RevealController::recoveryRequested, [this]() {
        events << QStringLiteral("recover");
      });
    }
  };

}  // namespace

TEST(RevealController, ReadyInjectsNavigatesThenReveals) {
  RevealHarness h(true);

  h.controller.onGateFinished(GateOutcome::Ready, 3);

  EXPECT_EQ(h.events, (QStringList{"inject", "navigate", "reveal:ready"}));
  EXPECT_EQ(h.navigated, kRoot);
  EXPECT_TRUE(h.controller.revealed());
  EXPECT_EQ(h.controller.outcome(), GateOutcome::Ready);
}

TEST(RevealController, ReadyWithoutInterceptionSkipsInjection) {
  RevealHarness h(false);

  h.controller.onGateFinished(GateOutcome::Ready, 1);

  EXPECT_EQ(h.events, (QStringList{"navigate", "reveal:ready"}));
}

TEST(RevealController, TimeoutRevealsWithoutInjection) {
  RevealHarness h(true);

  h.controller.onGateFinished(GateOutcome::TimedOut, 31);

  EXPECT_EQ(h.events, (QStringList{"reveal:timed-out", "recover"}));
  EXPECT_TRUE(h.navigated.isEmpty());
  EXPECT_TRUE(h.controller.revealed());
  EXPECT_FALSE(h.controller.serverLoaded());
}

TEST(RevealController, RevealsExactlyOnce) {
  RevealHarness h(true);

  h.controller.onGateFinished(GateOutcome::TimedOut, 31);
  h.controller.onGateFinished(GateOutcome::Ready, 1);
  h.controller.onGateFinished(GateOutcome::TimedOut, 31);

  EXPECT_EQ(h.events, (QStringList{"reveal:timed-out", "recover"}));
  EXPECT_EQ(h.controller.outcome(), GateOutcome::TimedOut);
}

TEST(RevealController, CancelledDoesNotReveal) {
  RevealHarness h(true);

  h.controller.onGateFinished(GateOutcome::Cancelled, 0);

  EXPECT_TRUE(h.events.isEmpty());
  EXPECT_FALSE(h.controller.revealed());
}

TEST(RevealController, LateServerIsLoadedAfterTimedOutReveal) {
  RevealHarness h(true);
  h.controller.onGateFinished(GateOutcome::TimedOut, 31);
  h.events.clear();

  h.controller.onRecoveryFinished(GateOutcome::Ready, 4);

  EXPECT_EQ(h.events, (QStringList{"inject", "navigate"}));
  EXPECT_EQ(h.navigated, kRoot);
  EXPECT_TRUE(h.controller.serverLoaded());
  EXPECT_EQ(h.controller.outcome(), GateOutcome::Ready);

  h.controller.onRecoveryFinished(GateOutcome::Ready, 5);
  EXPECT_EQ(h.events.size(), 2);
}

TEST(RevealController, RecoveryGivingUpLeavesPlaceholder) {
  RevealHarness h(true);
  h.controller.onGateFinished(GateOutcome::TimedOut, 31);
  h.events.clear();

  h.controller.onRecoveryFinished(GateOutcome::TimedOut, 721);
  h.controller.onRecoveryFinished(GateOutcome::Cancelled, 3);

  EXPECT_TRUE(h.events.isEmpty());
  EXPECT_FALSE(h.controller.serverLoaded());
}

TEST(RevealController, RecoveryIgnoredBeforeRevealOrAfterLoad) {
  RevealHarness early(true);
  early.controller.onRecoveryFinished(GateOutcome::Ready, 1);
  EXPECT_TRUE(early.events.isEmpty());
  EXPECT_FALSE(early.controller.revealed());

  RevealHarness ready(true);
  ready.controller.onGateFinished(GateOutcome::Ready, 1);
  ready.events.clear();
  ready.controller.onRecoveryFinished(GateOutcome::Ready, 1);
  EXPECT_TRUE(ready.events.isEmpty());
}

TEST(RevealController, NoRecoveryWhenDisabled) {
  RevealHarness h(true, false);

  h.controller.onGateFinished(GateOutcome::TimedOut, 31);

  EXPECT_EQ(h.events, (QStringList{"reveal:timed-out"}));
}
