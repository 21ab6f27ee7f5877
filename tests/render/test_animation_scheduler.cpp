/*
Kline — ChartAnimationScheduler Tests
Role: Verify tween progression, completion semantics and re-entrant callbacks
Testing Strategy: Frames driven manually through tick(nowMs); the QTimer loop is only observed, never waited on
Coverage: Interpolation, single completion, reduced motion, replacement, stop from callbacks, duration scale, easing
*/
#include <gtest/gtest.h>
#include "render/AnimationScheduler.hpp"

#include <vector>

namespace fixtures {
AnimationConfig linearTween(double from, double to, double durationMs = 100.0) {
    AnimationConfig config;
    config.durationMs = durationMs;
    config.easing = Easing::linear;
    config.from = {{"x", from}};
    config.to = {{"x", to}};
    return config;
}
}

namespace {
class AnimationSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override { scheduler.setReducedMotion(false); }

    ChartAnimationScheduler scheduler;
};
}

// =============================================================================
// Progression
// =============================================================================

TEST_F(AnimationSchedulerTest, InterpolatesAndCompletesOnce) {
    std::vector<std::pair<double, double>> updates;
    int completions = 0;
    std::vector<QString> finished;
    QObject::connect(&scheduler, &ChartAnimationScheduler::animationFinished,
                     [&](const QString& id) { finished.push_back(id); });

    auto config = fixtures::linearTween(0.0, 10.0);
    config.onUpdate = [&](const AnimationValues& v, double progress) { updates.emplace_back(v.at("x"), progress); };
    config.onComplete = [&] { ++completions; };
    scheduler.createAnimation("pan", std::move(config));
    EXPECT_TRUE(scheduler.isRunning());

    scheduler.tick(1000.0);
    scheduler.tick(1050.0);
    scheduler.tick(1100.0);
    scheduler.tick(1200.0);

    ASSERT_EQ(updates.size(), 3u);
    EXPECT_DOUBLE_EQ(updates[0].first, 0.0);
    EXPECT_DOUBLE_EQ(updates[1].first, 5.0);
    EXPECT_DOUBLE_EQ(updates[1].second, 0.5);
    EXPECT_DOUBLE_EQ(updates[2].first, 10.0);
    EXPECT_DOUBLE_EQ(updates[2].second, 1.0);
    EXPECT_EQ(completions, 1);
    ASSERT_EQ(finished.size(), 1u);
    EXPECT_EQ(finished[0], "pan");
    EXPECT_FALSE(scheduler.hasAnimation("pan"));
}

TEST_F(AnimationSchedulerTest, LoopStopsWhenIdle) {
    int stops = 0;
    QObject::connect(&scheduler, &ChartAnimationScheduler::loopStopped, [&] { ++stops; });

    scheduler.createAnimation("a", fixtures::linearTween(0.0, 1.0, 10.0));
    scheduler.tick(0.0);
    EXPECT_TRUE(scheduler.isRunning());
    scheduler.tick(10.0);
    EXPECT_FALSE(scheduler.isRunning());
    EXPECT_EQ(scheduler.activeCount(), 0u);
    EXPECT_EQ(stops, 1);
}

TEST_F(AnimationSchedulerTest, ZeroDurationCompletesOnFirstTick) {
    double last = -1.0;
    auto config = fixtures::linearTween(2.0, 4.0, 0.0);
    config.onUpdate = [&](const AnimationValues& v, double) { last = v.at("x"); };
    scheduler.createAnimation("instant", std::move(config));

    scheduler.tick(500.0);
    EXPECT_DOUBLE_EQ(last, 4.0);
    EXPECT_FALSE(scheduler.hasAnimation("instant"));
}

TEST_F(AnimationSchedulerTest, KeysMissingFromTargetHoldTheirStart) {
    AnimationValues seen;
    auto config = fixtures::linearTween(0.0, 8.0);
    config.from["y"] = 3.0;
    config.onUpdate = [&](const AnimationValues& v, double) { seen = v; };
    scheduler.createAnimation("partial", std::move(config));

    scheduler.tick(0.0);
    scheduler.tick(50.0);
    EXPECT_DOUBLE_EQ(seen.at("x"), 4.0);
    EXPECT_DOUBLE_EQ(seen.at("y"), 3.0);
}

// =============================================================================
// Replacement and re-entrancy
// =============================================================================

TEST_F(AnimationSchedulerTest, SameIdReplacesWithoutCompleting) {
    int firstCompletions = 0;
    auto first = fixtures::linearTween(0.0, 1.0);
    first.onComplete = [&] { ++firstCompletions; };
    scheduler.createAnimation("zoom", std::move(first));
    scheduler.tick(0.0);

    double last = 0.0;
    auto second = fixtures::linearTween(100.0, 200.0);
    second.onUpdate = [&](const AnimationValues& v, double) { last = v.at("x"); };
    scheduler.createAnimation("zoom", std::move(second));
    EXPECT_EQ(scheduler.activeCount(), 1u);

    scheduler.tick(10.0);
    scheduler.tick(110.0);
    EXPECT_DOUBLE_EQ(last, 200.0);
    EXPECT_EQ(firstCompletions, 0);
}

TEST_F(AnimationSchedulerTest, StoppingFromUpdateSkipsCompletion) {
    int completions = 0;
    auto config = fixtures::linearTween(0.0, 1.0, 0.0);
    config.onUpdate = [&](const AnimationValues&, double) { scheduler.stopAnimation("self"); };
    config.onComplete = [&] { ++completions; };
    scheduler.createAnimation("self", std::move(config));

    scheduler.tick(0.0);
    EXPECT_EQ(completions, 0);
    EXPECT_FALSE(scheduler.hasAnimation("self"));
    EXPECT_FALSE(scheduler.isRunning());
}

TEST_F(AnimationSchedulerTest, StopAllFromUpdateHaltsOtherTweens) {
    int otherUpdates = 0;
    auto a = fixtures::linearTween(0.0, 1.0);
    a.onUpdate = [&](const AnimationValues&, double) { scheduler.stopAllAnimations(); };
    auto b = fixtures::linearTween(0.0, 1.0);
    b.onUpdate = [&](const AnimationValues&, double) { ++otherUpdates; };
    scheduler.createAnimation("a", std::move(a));
    scheduler.createAnimation("b", std::move(b));

    scheduler.tick(0.0);
    EXPECT_EQ(otherUpdates, 0);
    EXPECT_EQ(scheduler.activeCount(), 0u);
}

TEST_F(AnimationSchedulerTest, CompletionMayChainANewTween) {
    bool chained = false;
    auto config = fixtures::linearTween(0.0, 1.0, 0.0);
    config.onComplete = [&] {
        scheduler.createAnimation("next", fixtures::linearTween(1.0, 2.0));
        chained = true;
    };
    scheduler.createAnimation("first", std::move(config));

    scheduler.tick(0.0);
    EXPECT_TRUE(chained);
    EXPECT_TRUE(scheduler.hasAnimation("next"));
    EXPECT_TRUE(scheduler.isRunning());
    scheduler.stopAllAnimations();
}

// =============================================================================
// Reduced motion and scaling
// =============================================================================

TEST_F(AnimationSchedulerTest, ReducedMotionJumpsToTargetSynchronously) {
    scheduler.setReducedMotion(true);

    double value = 0.0;
    double progress = 0.0;
    int completions = 0;
    auto config = fixtures::linearTween(0.0, 42.0);
    config.onUpdate = [&](const AnimationValues& v, double p) { value = v.at("x"); progress = p; };
    config.onComplete = [&] { ++completions; };

    EXPECT_FALSE(scheduler.createReducedMotionAnimation("zoom", std::move(config)));
    EXPECT_DOUBLE_EQ(value, 42.0);
    EXPECT_DOUBLE_EQ(progress, 1.0);
    EXPECT_EQ(completions, 1);
    EXPECT_EQ(scheduler.activeCount(), 0u);
    EXPECT_FALSE(scheduler.isRunning());
}

TEST_F(AnimationSchedulerTest, ReducedMotionOffRegistersTween) {
    EXPECT_TRUE(scheduler.createReducedMotionAnimation("zoom", fixtures::linearTween(0.0, 1.0)));
    EXPECT_TRUE(scheduler.hasAnimation("zoom"));
    scheduler.stopAnimation("zoom");
    EXPECT_FALSE(scheduler.isRunning());
}

TEST_F(AnimationSchedulerTest, DurationScaleShortensNewTweens) {
    scheduler.setDurationScale(0.5);
    double progress = 0.0;
    auto config = fixtures::linearTween(0.0, 1.0, 100.0);
    config.onUpdate = [&](const AnimationValues&, double p) { progress = p; };
    scheduler.createAnimation("half", std::move(config));

    scheduler.tick(0.0);
    scheduler.tick(25.0);
    EXPECT_DOUBLE_EQ(progress, 0.5);

    scheduler.setDurationScale(7.0);
    EXPECT_DOUBLE_EQ(scheduler.durationScale(), 1.0);
    scheduler.setDurationScale(-1.0);
    EXPECT_DOUBLE_EQ(scheduler.durationScale(), 0.0);
}

TEST(Easing, EndpointsAreFixed) {
    for (auto fn : {Easing::linear, Easing::easeInOutCubic, Easing::easeOutQuart, Easing::easeInOutQuart}) {
        EXPECT_DOUBLE_EQ(fn(0.0), 0.0);
        EXPECT_DOUBLE_EQ(fn(1.0), 1.0);
        EXPECT_DOUBLE_EQ(fn(2.0), 1.0);
        EXPECT_DOUBLE_EQ(fn(-1.0), 0.0);
    }
    EXPECT_DOUBLE_EQ(Easing::easeInOutCubic(0.5), 0.5);
    EXPECT_GT(Easing::easeOutQuart(0.5), 0.5);
}
