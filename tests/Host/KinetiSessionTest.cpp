/*
 *  KinetiCam - Session Tests
 */

#include "Core/SettingsStore.hpp"
#include "Scene/DemoViewport.hpp"
#include "Selection/SelectionSystem.hpp"
#include "Session/KinetiSession.hpp"

#include <KinetiCam/Rig/RigMath.h>

#include <gtest/gtest.h>

#include <QTemporaryDir>

#include <memory>

using namespace KinetiCam;

namespace
{
    class ManualClock : public Clock
    {
    public:
        double time = 0.0;
        double now() const override { return time; }
    };

    ViewPose obliquePose()
    {
        ViewPose pose;
        pose.rotation = RigMath::eulerXYZ(1.1f, 0.0f, 0.8f);
        pose.distance = 10.0f;
        return pose;
    }
}

class KinetiSessionTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_dir.isValid());
        m_settings = std::make_unique<SettingsStore>(m_dir.filePath("rig.ini"));

        RigConfig config;
        config.driftEnabled = false;
        m_settings->setConfig(config);

        m_viewportId = m_viewport.addViewport(obliquePose());
        m_session = std::make_unique<KinetiSession>(m_viewport, &m_selection, *m_settings);

        auto clock = std::make_unique<ManualClock>();
        m_clock = clock.get();
        m_session->setClock(std::move(clock));
    }

    TickSummary advance()
    {
        TickSummary summary = m_session->tickOnce();
        m_clock->time += 0.01;
        return summary;
    }

    QTemporaryDir m_dir;
    std::unique_ptr<SettingsStore> m_settings;
    DemoViewport m_viewport;
    SelectionSystem m_selection;
    ViewportId m_viewportId = 0;
    std::unique_ptr<KinetiSession> m_session;
    ManualClock* m_clock = nullptr;
};

TEST_F(KinetiSessionTest, ToggleSwitchesActiveState)
{
    std::vector<bool> states;
    QObject::connect(m_session.get(), &KinetiSession::activeChanged, [&states](bool active) {
        states.push_back(active);
    });

    EXPECT_FALSE(m_session->isActive());
    m_session->toggle();
    EXPECT_TRUE(m_session->isActive());
    m_session->start();
    m_session->toggle();
    EXPECT_FALSE(m_session->isActive());
    m_session->stop();

    EXPECT_EQ(states, (std::vector<bool>{true, false}));
}

TEST_F(KinetiSessionTest, StartDiscardsPreviousRigs)
{
    advance();
    EXPECT_EQ(m_session->registry().size(), 1u);

    m_session->start();
    EXPECT_TRUE(m_session->registry().empty());

    advance();
    EXPECT_EQ(m_session->registry().size(), 1u);

    m_session->stop();
    EXPECT_TRUE(m_session->registry().empty());
}

TEST_F(KinetiSessionTest, StillSceneRunsAtIdleRate)
{
    TickSummary summary = advance();
    EXPECT_EQ(summary.ticked, 1u);
    EXPECT_EQ(summary.redraws, 0u);
    EXPECT_DOUBLE_EQ(summary.nextDelay, RigRegistry::kIdleDelay);
    EXPECT_EQ(m_viewport.redrawCount(m_viewportId), 0);
}

TEST_F(KinetiSessionTest, SettingsChangesApplyOnNextPass)
{
    advance();

    int redrawSignals = 0;
    QObject::connect(&m_viewport, &DemoViewport::redrawRequested, [&](quint32 viewport) {
        EXPECT_EQ(viewport, m_viewportId);
        ++redrawSignals;
    });

    RigConfig config = m_settings->config();
    config.driftEnabled = true;
    m_settings->setConfig(config);

    TickSummary summary = advance();
    EXPECT_EQ(summary.redraws, 1u);
    EXPECT_DOUBLE_EQ(summary.nextDelay, RigRegistry::kActiveDelay);
    EXPECT_EQ(m_viewport.redrawCount(m_viewportId), 1);
    EXPECT_EQ(redrawSignals, 1);
}

TEST_F(KinetiSessionTest, SelectionFliesCameraToTarget)
{
    std::vector<EditVertex> vertices = {
        {glm::vec3(2.0f, 0.0f, 0.0f), glm::vec3(0.0f, 0.0f, 1.0f)},
        {glm::vec3(4.0f, 0.0f, 0.0f), glm::vec3(0.0f, 0.0f, 1.0f)},
    };
    m_selection.setMesh(vertices);
    m_selection.setEditMode(true);
    m_selection.setSelection({0, 1});

    advance();
    const ViewportRig* rig = m_session->registry().find(m_viewportId);
    ASSERT_NE(rig, nullptr);
    EXPECT_EQ(rig->mode(), RigMode::Auto);

    for (int i = 0; i < 200; ++i)
    {
        advance();
    }

    std::optional<ViewPose> pose = m_viewport.readPose(m_viewportId);
    ASSERT_TRUE(pose.has_value());
    EXPECT_GT(pose->location.x, 0.5f);
    EXPECT_LT(pose->distance, 10.0f);
}

TEST_F(KinetiSessionTest, ClosedViewportLosesItsRig)
{
    advance();
    m_viewport.removeViewport(m_viewportId);

    TickSummary summary = advance();
    EXPECT_EQ(summary.ticked, 0u);
    EXPECT_TRUE(m_session->registry().empty());
}
