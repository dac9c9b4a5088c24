#include "KinetiCam/Rig/ViewportRig.h"

#include "RigTestHelpers.h"

#include <gtest/gtest.h>

using namespace KinetiCam;
using namespace KinetiCam::Test;

namespace {

constexpr double kTickStep = 0.01;
constexpr float kDefaultFrictionFactor = 0.98f - 0.08f * 0.12f;

/**
 * @brief Plays the host: shows a pose, ticks the rig, shows what it wrote
 */
struct RigDriver {
    ViewportRig rig{1};
    ViewPose pose = obliquePose();
    RigConfig config = quietConfig();
    const SelectionSource* selection = nullptr;
    double time = 0.0;

    TickResult tick() {
        TickResult result = rig.tick(pose, config, selection, time);
        if (result.poseChanged) {
            pose = result.pose;
        }
        time += kTickStep;
        return result;
    }

    // User pans the focus point by `step` on each of `ticks` ticks
    void dragPan(const glm::vec3& step, int ticks) {
        for (int i = 0; i < ticks; ++i) {
            pose.location += step;
            tick();
        }
    }
};

} // namespace

TEST(ViewportRigTest, FirstTickHasNoDelta) {
    RigDriver driver;
    TickResult result = driver.tick();

    EXPECT_FALSE(result.poseChanged);
    EXPECT_FALSE(result.reset);
    EXPECT_TRUE(result.idle);
    EXPECT_EQ(result.pose, obliquePose());
    EXPECT_EQ(driver.rig.mode(), RigMode::Manual);
    ASSERT_TRUE(driver.rig.state().history.has_value());
    EXPECT_EQ(driver.rig.state().history->pose, obliquePose());
}

TEST(ViewportRigTest, StillPoseStaysBitIdentical) {
    RigDriver driver;
    for (int i = 0; i < 200; ++i) {
        TickResult result = driver.tick();
        EXPECT_FALSE(result.poseChanged);
        EXPECT_EQ(result.pose, obliquePose());
    }
    EXPECT_FALSE(driver.rig.state().isCoasting);
}

TEST(ViewportRigTest, DragFillsBufferWithoutMovingCamera) {
    RigDriver driver;
    driver.tick();

    for (int i = 0; i < 5; ++i) {
        driver.pose.location.x += 0.1f;
        ViewPose shown = driver.pose;
        TickResult result = driver.tick();
        EXPECT_FALSE(result.poseChanged);
        EXPECT_EQ(result.pose, shown);
    }

    const RigState& state = driver.rig.state();
    EXPECT_EQ(state.manualBuffer.size(), MotionBuffer::capacity());
    EXPECT_FALSE(state.isCoasting);
    EXPECT_TRUE(state.shakeSuppressed);
}

TEST(ViewportRigTest, ReleaseStartsCoasting) {
    RigDriver driver;
    driver.tick();
    driver.dragPan(glm::vec3(0.1f, 0.0f, 0.0f), 3);

    const double releaseTime = driver.time;
    TickResult result = driver.tick();

    const RigState& state = driver.rig.state();
    ASSERT_TRUE(state.isCoasting);
    EXPECT_DOUBLE_EQ(state.coastingStartTime, releaseTime);
    EXPECT_TRUE(state.manualBuffer.empty());

    // Velocity already took one step of friction
    expectVecNear(state.velocity.pan, glm::vec3(0.1f * kDefaultFrictionFactor, 0.0f, 0.0f), 1e-4f);
    EXPECT_TRUE(result.poseChanged);
    EXPECT_NEAR(result.pose.location.x, 0.3f + 0.1f * kDefaultFrictionFactor, 1e-4f);
    EXPECT_FALSE(result.idle);
}

TEST(ViewportRigTest, CoastingDecaysAndStops) {
    RigDriver driver;
    driver.tick();
    driver.dragPan(glm::vec3(0.1f, 0.0f, 0.0f), 3);
    driver.tick();
    ASSERT_TRUE(driver.rig.state().isCoasting);

    int coastTicks = 1;
    float previous = driver.rig.state().velocity.pan.x;
    while (driver.rig.state().isCoasting && coastTicks < 400) {
        driver.tick();
        float current = driver.rig.state().velocity.pan.x;
        EXPECT_NEAR(current, previous * kDefaultFrictionFactor, 1e-6f);
        previous = current;
        ++coastTicks;
    }

    EXPECT_FALSE(driver.rig.state().isCoasting);
    EXPECT_GT(coastTicks, 100);
    EXPECT_LT(coastTicks, 200);
    EXPECT_GT(driver.pose.location.x, 3.3f);
    EXPECT_LT(driver.pose.location.x, 3.7f);

    // Comes to rest
    const ViewPose rest = driver.pose;
    TickResult result = driver.tick();
    EXPECT_FALSE(result.poseChanged);
    EXPECT_TRUE(result.idle);
    EXPECT_EQ(driver.pose, rest);
}

struct FrictionCase {
    float friction;
    int minTicks;  // Coast length bounds for a 0.2 zoom throw
    int maxTicks;
};

class CoastingFrictionTest : public ::testing::TestWithParam<FrictionCase> {};

TEST_P(CoastingFrictionTest, VelocityNeverGrowsAndCoastEnds) {
    const FrictionCase& param = GetParam();

    RigDriver driver;
    driver.config.friction = param.friction;
    driver.tick();

    // Pan, zoom out and a turn too slow to count as a flick
    const glm::quat spin = glm::angleAxis(0.002f, glm::vec3(0.0f, 0.0f, 1.0f));
    for (int i = 0; i < 3; ++i) {
        driver.pose.location.x += 0.1f;
        driver.pose.distance += 0.2f;
        driver.pose.rotation = glm::normalize(spin * driver.pose.rotation);
        driver.tick();
    }
    driver.tick();
    ASSERT_TRUE(driver.rig.state().isCoasting);

    const MotionSample& velocity = driver.rig.state().velocity;
    EXPECT_GT(glm::length(velocity.pan), 0.0f);
    EXPECT_GT(std::abs(velocity.zoom), 0.0f);
    EXPECT_GT(RigMath::rotationAngle(velocity.rotation), 0.0f);

    float pan = glm::length(velocity.pan);
    float zoom = std::abs(velocity.zoom);
    float rotation = RigMath::rotationAngle(velocity.rotation);

    int coastTicks = 1;
    while (driver.rig.state().isCoasting && coastTicks < 1000) {
        driver.tick();
        const MotionSample& next = driver.rig.state().velocity;
        EXPECT_LE(glm::length(next.pan), pan + 1e-7f) << "tick " << coastTicks;
        EXPECT_LE(std::abs(next.zoom), zoom + 1e-7f) << "tick " << coastTicks;
        EXPECT_LE(RigMath::rotationAngle(next.rotation), rotation + 1e-7f) << "tick " << coastTicks;
        pan = glm::length(next.pan);
        zoom = std::abs(next.zoom);
        rotation = RigMath::rotationAngle(next.rotation);
        ++coastTicks;
    }

    EXPECT_FALSE(driver.rig.state().isCoasting);
    EXPECT_GE(coastTicks, param.minTicks);
    EXPECT_LE(coastTicks, param.maxTicks);
}

// Factors 0.98, 0.9704, 0.9 and 0.82
INSTANTIATE_TEST_SUITE_P(FrictionRange, CoastingFrictionTest,
                         ::testing::Values(FrictionCase{0.0f, 245, 280}, FrictionCase{0.12f, 160, 190},
                                           FrictionCase{1.0f, 45, 60}, FrictionCase{2.0f, 22, 30}));

TEST(ViewportRigTest, SmallDragDoesNotCoast) {
    RigDriver driver;
    driver.tick();
    driver.dragPan(glm::vec3(0.0008f, 0.0f, 0.0f), 3);

    TickResult result = driver.tick();
    EXPECT_FALSE(driver.rig.state().isCoasting);
    EXPECT_TRUE(driver.rig.state().manualBuffer.empty());
    EXPECT_FALSE(result.poseChanged);
}

TEST(ViewportRigTest, RotationalFlickCancelsPan) {
    RigDriver driver;
    driver.tick();

    const glm::quat spin = glm::angleAxis(0.01f, glm::vec3(0.0f, 0.0f, 1.0f));
    for (int i = 0; i < 3; ++i) {
        driver.pose.rotation = glm::normalize(spin * driver.pose.rotation);
        driver.pose.location.x += 0.1f;
        driver.tick();
    }
    driver.tick();

    const RigState& state = driver.rig.state();
    ASSERT_TRUE(state.isCoasting);
    EXPECT_EQ(state.velocity.pan, glm::vec3(0.0f));
    EXPECT_NEAR(RigMath::rotationAngle(state.velocity.rotation), 0.01f * kDefaultFrictionFactor, 1e-4f);
}

TEST(ViewportRigTest, SlowRotationKeepsPan) {
    RigDriver driver;
    driver.tick();

    const glm::quat spin = glm::angleAxis(0.002f, glm::vec3(0.0f, 0.0f, 1.0f));
    for (int i = 0; i < 3; ++i) {
        driver.pose.rotation = glm::normalize(spin * driver.pose.rotation);
        driver.pose.location.x += 0.1f;
        driver.tick();
    }
    driver.tick();

    const RigState& state = driver.rig.state();
    ASSERT_TRUE(state.isCoasting);
    EXPECT_NEAR(state.velocity.pan.x, 0.1f * kDefaultFrictionFactor, 1e-4f);
}

TEST(ViewportRigTest, ZoomCoastingStopsAtMinimumDistance) {
    RigDriver driver;
    driver.pose.distance = 2.0f;
    driver.tick();

    for (int i = 0; i < 3; ++i) {
        driver.pose.distance -= 0.5f;
        driver.tick();
    }

    for (int i = 0; i < 10; ++i) {
        TickResult result = driver.tick();
        EXPECT_GE(result.pose.distance, ViewportRig::kMinDistance);
    }

    EXPECT_FLOAT_EQ(driver.pose.distance, ViewportRig::kMinDistance);
    EXPECT_EQ(driver.rig.state().velocity.zoom, 0.0f);
    EXPECT_FALSE(driver.rig.state().isCoasting);
}

TEST(ViewportRigTest, CoastingLevelsHorizon) {
    RigDriver driver;
    driver.pose.rotation = RigMath::eulerXYZ(1.1f, 0.3f, 0.8f);
    driver.tick();
    driver.dragPan(glm::vec3(0.1f, 0.0f, 0.0f), 3);

    const float rollBefore = std::abs((driver.pose.rotation * glm::vec3(1.0f, 0.0f, 0.0f)).z);
    for (int i = 0; i < 100; ++i) {
        driver.tick();
    }
    ASSERT_TRUE(driver.rig.state().isCoasting);

    const float rollAfter = std::abs((driver.pose.rotation * glm::vec3(1.0f, 0.0f, 0.0f)).z);
    EXPECT_LT(rollAfter, rollBefore * 0.5f);
}

TEST(ViewportRigTest, SwayStartsWhenLeftAlone) {
    RigDriver driver;
    driver.config.driftEnabled = true;

    TickResult result;
    for (int i = 0; i < 50; ++i) {
        result = driver.tick();
        EXPECT_FALSE(result.idle);
    }
    EXPECT_TRUE(result.poseChanged);
    EXPECT_GT(driver.rig.drift().ramp(), 0.3f);
    EXPECT_FALSE(driver.rig.state().isCoasting);
}

TEST(ViewportRigTest, SwayResumesAfterIdleDelay) {
    RigDriver driver;
    driver.config.driftEnabled = true;
    driver.tick();

    // Too slow to coast, so sway stays held back after the release
    driver.dragPan(glm::vec3(0.0008f, 0.0f, 0.0f), 3);
    ASSERT_TRUE(driver.rig.state().shakeSuppressed);

    for (int i = 0; i < 30; ++i) {
        driver.tick();
    }
    EXPECT_FALSE(driver.rig.state().isCoasting);
    EXPECT_TRUE(driver.rig.state().shakeSuppressed);

    for (int i = 0; i < 30; ++i) {
        driver.tick();
    }
    EXPECT_FALSE(driver.rig.state().shakeSuppressed);
}

TEST(ViewportRigTest, SelectionEntersAutoPilot) {
    FakeSelection selection;
    selection.add(glm::vec3(1.0f, 2.0f, 0.0f), glm::vec3(0.0f, 0.0f, 1.0f), 0);
    selection.add(glm::vec3(3.0f, 2.0f, 0.0f), glm::vec3(0.0f, 0.0f, 1.0f), 1);

    RigDriver driver;
    driver.config.autoPilotEnabled = true;
    driver.selection = &selection;

    TickResult result = driver.tick();
    EXPECT_EQ(driver.rig.mode(), RigMode::Auto);
    EXPECT_TRUE(result.poseChanged);
    EXPECT_FALSE(result.idle);

    const float speed = driver.config.speed / 10.0f;
    const float targetDistance = (1.0f + 0.5f) * driver.config.distanceMultiplier;
    expectVecNear(result.pose.location, glm::vec3(2.0f, 2.0f, 0.0f) * speed, 1e-5f);
    EXPECT_NEAR(result.pose.distance, 10.0f + (targetDistance - 10.0f) * speed, 1e-4f);

    for (int i = 0; i < 3000; ++i) {
        driver.tick();
    }
    EXPECT_EQ(driver.rig.mode(), RigMode::Auto);
    expectVecNear(driver.pose.location, glm::vec3(2.0f, 2.0f, 0.0f), 0.01f);
    EXPECT_NEAR(driver.pose.distance, targetDistance, 0.01f);
}

TEST(ViewportRigTest, AutoPilotCancelsCoasting) {
    FakeSelection selection;
    selection.editing = false;
    selection.add(glm::vec3(1.0f, 2.0f, 0.0f), glm::vec3(0.0f, 0.0f, 1.0f), 4);

    RigDriver driver;
    driver.config.autoPilotEnabled = true;
    driver.selection = &selection;
    driver.tick();
    driver.dragPan(glm::vec3(0.1f, 0.0f, 0.0f), 3);
    driver.tick();
    ASSERT_TRUE(driver.rig.state().isCoasting);

    selection.editing = true;
    driver.tick();

    const RigState& state = driver.rig.state();
    EXPECT_EQ(state.mode, RigMode::Auto);
    EXPECT_FALSE(state.isCoasting);
    EXPECT_TRUE(state.manualBuffer.empty());
    EXPECT_EQ(state.velocity.pan, glm::vec3(0.0f));
    EXPECT_EQ(state.velocity.zoom, 0.0f);
}

class AutoPilotOverrideTest : public ::testing::Test {
  protected:
    void SetUp() override {
        selection.add(glm::vec3(1.0f, 2.0f, 0.0f), glm::vec3(0.0f, 0.0f, 1.0f), 0);
        selection.add(glm::vec3(3.0f, 2.0f, 0.0f), glm::vec3(0.0f, 0.0f, 1.0f), 1);
        driver.config.autoPilotEnabled = true;
        driver.config.driftIntensity = 0.0f;
        driver.selection = &selection;
    }

    void enterAuto() {
        driver.tick();
        ASSERT_EQ(driver.rig.mode(), RigMode::Auto);
    }

    FakeSelection selection;
    RigDriver driver;
};

TEST_F(AutoPilotOverrideTest, ManualMoveBreaksAutoPilot) {
    enterAuto();

    driver.pose.location += glm::vec3(0.02f, 0.0f, 0.0f);
    const ViewPose userPose = driver.pose;
    TickResult result = driver.tick();

    EXPECT_EQ(driver.rig.mode(), RigMode::Manual);
    EXPECT_FALSE(driver.rig.state().isCoasting);
    EXPECT_EQ(result.pose, userPose);

    // Same selection does not pull the camera back
    for (int i = 0; i < 50; ++i) {
        driver.tick();
    }
    EXPECT_EQ(driver.rig.mode(), RigMode::Manual);
}

TEST_F(AutoPilotOverrideTest, SwayIntensityWidensTolerance) {
    driver.config.driftIntensity = 0.2f;
    enterAuto();

    driver.pose.location += glm::vec3(0.02f, 0.0f, 0.0f);
    driver.tick();
    EXPECT_EQ(driver.rig.mode(), RigMode::Auto);
}

TEST_F(AutoPilotOverrideTest, BreakOnManualDisabledKeepsAuto) {
    driver.config.breakOnManual = false;
    enterAuto();

    driver.pose.location += glm::vec3(0.5f, 0.0f, 0.0f);
    driver.tick();
    EXPECT_EQ(driver.rig.mode(), RigMode::Auto);
}

TEST_F(AutoPilotOverrideTest, DisablingAutoPilotReturnsToManual) {
    enterAuto();

    driver.config.autoPilotEnabled = false;
    const ViewPose shown = driver.pose;
    TickResult result = driver.tick();

    EXPECT_EQ(driver.rig.mode(), RigMode::Manual);
    EXPECT_FALSE(result.poseChanged);
    EXPECT_EQ(result.pose, shown);
}

TEST(ViewportRigTest, ProjectionFlipResetsPhysics) {
    RigDriver driver;
    driver.tick();
    driver.dragPan(glm::vec3(0.1f, 0.0f, 0.0f), 3);
    driver.tick();
    ASSERT_TRUE(driver.rig.state().isCoasting);

    driver.pose.perspective = false;
    const ViewPose shown = driver.pose;
    TickResult result = driver.tick();

    EXPECT_TRUE(result.reset);
    EXPECT_FALSE(result.poseChanged);
    EXPECT_EQ(result.pose, shown);
    EXPECT_FALSE(driver.rig.state().isCoasting);
    EXPECT_TRUE(driver.rig.state().manualBuffer.empty());
    EXPECT_EQ(driver.rig.state().velocity.pan, glm::vec3(0.0f));

    // Next tick sees no jump
    result = driver.tick();
    EXPECT_FALSE(result.reset);
    EXPECT_FALSE(result.poseChanged);
}

TEST(ViewportRigTest, AxisAlignedViewResetsPhysics) {
    RigDriver driver;
    driver.config.driftEnabled = true;
    for (int i = 0; i < 20; ++i) {
        driver.tick();
    }
    driver.dragPan(glm::vec3(0.1f, 0.0f, 0.0f), 2);

    driver.pose.rotation = glm::quat(1.0f, 0.0f, 0.0f, 0.0f);
    const ViewPose shown = driver.pose;
    for (int i = 0; i < 3; ++i) {
        TickResult result = driver.tick();
        EXPECT_TRUE(result.reset);
        EXPECT_EQ(result.pose, shown);
    }

    EXPECT_TRUE(driver.rig.state().manualBuffer.empty());
    EXPECT_FALSE(driver.rig.state().isCoasting);
    EXPECT_EQ(driver.rig.drift().lastOffset().location, glm::vec3(0.0f));
}
