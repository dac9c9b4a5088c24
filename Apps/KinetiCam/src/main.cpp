/*
 *  KinetiCam - Kinetic viewport camera rig
 *  Main entry point: headless demo host with logging and settings
 */

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTimer>

#include "Core/SettingsStore.hpp"
#include "Scene/DemoScenario.hpp"
#include "Scene/DemoViewport.hpp"
#include "Selection/SelectionSystem.hpp"
#include "Session/KinetiSession.hpp"

#include <KinetiCam/Core/Logger.h>
#include <KinetiCam/Rig/RigMath.h>

#include <glm/glm.hpp>

#include <cstdio>
#include <memory>
#include <vector>

namespace
{

// Unit cube, bottom face 0-3, top face 4-7, normals pointing out of the corners
std::vector<KinetiCam::EditVertex> makeCube()
{
    std::vector<KinetiCam::EditVertex> vertices;
    for (int i = 0; i < 8; ++i)
    {
        glm::vec3 corner((i & 1) ? 1.0f : -1.0f, (i & 2) ? 1.0f : -1.0f, (i & 4) ? 1.0f : -1.0f);
        vertices.push_back({corner, glm::normalize(corner)});
    }
    return vertices;
}

} // namespace

int main(int argc, char* argv[])
{
    // Without a file sink we still log to the console
    if (!KinetiCam::Logger::instance().initialize("KinetiCam", true))
    {
        std::fprintf(stderr, "KinetiCam: file logging unavailable\n");
    }

    KC_LOG_INFO("Application starting...");
    KC_LOG_DEBUG("Command line arguments: {}", argc);

    QCoreApplication app(argc, argv);

    QCoreApplication::setApplicationName("KinetiCam");
    QCoreApplication::setApplicationVersion("0.1-dev");
    QCoreApplication::setOrganizationName("KinetiCam");

    QCommandLineParser parser;
    parser.setApplicationDescription("Kinetic camera rig demo");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption durationOption("duration", "Demo run length in seconds.", "seconds", "8");
    QCommandLineOption settingsOption("settings", "INI file to read settings from.", "file");
    QCommandLineOption noDriftOption("no-drift", "Disable idle sway.");
    QCommandLineOption noAutoPilotOption("no-autopilot", "Disable fly-to-selection.");
    QCommandLineOption verboseOption("verbose", "Show rig mode changes and coasting on the console.");
    parser.addOption(durationOption);
    parser.addOption(settingsOption);
    parser.addOption(noDriftOption);
    parser.addOption(noAutoPilotOption);
    parser.addOption(verboseOption);
    parser.process(app);

    if (parser.isSet(verboseOption))
        KinetiCam::Logger::instance().setConsoleLevel(spdlog::level::debug);

    bool durationOk = false;
    double duration = parser.value(durationOption).toDouble(&durationOk);
    if (!durationOk || duration <= 0.0)
    {
        KC_LOG_WARN("Invalid --duration '{}', using 8 s", parser.value(durationOption).toStdString());
        duration = 8.0;
    }

    std::unique_ptr<KinetiCam::SettingsStore> settings;
    if (parser.isSet(settingsOption))
        settings = std::make_unique<KinetiCam::SettingsStore>(parser.value(settingsOption));
    else
        settings = std::make_unique<KinetiCam::SettingsStore>();
    settings->load();

    KinetiCam::RigConfig config = settings->config();
    if (parser.isSet(noDriftOption))
        config.driftEnabled = false;
    if (parser.isSet(noAutoPilotOption))
        config.autoPilotEnabled = false;
    settings->setConfig(config);

    KC_LOG_INFO("Settings: {}", settings->fileName().toStdString());
    KC_LOG_INFO("Auto-pilot {}, drift {} (intensity {:.2f}), friction {:.2f}",
                config.autoPilotEnabled ? "on" : "off", config.driftEnabled ? "on" : "off",
                config.driftIntensity, config.friction);

    KinetiCam::SelectionSystem selection;
    selection.setMesh(makeCube());

    KinetiCam::DemoViewport viewport;
    KinetiCam::ViewPose startPose;
    startPose.rotation = KinetiCam::RigMath::eulerXYZ(1.1f, 0.0f, 0.8f);
    startPose.distance = 10.0f;
    KinetiCam::ViewportId viewportId = viewport.addViewport(startPose);

    KinetiCam::KinetiSession session(viewport, &selection, *settings);
    KinetiCam::DemoScenario scenario(viewport, viewportId, selection);

    QObject::connect(&session, &KinetiCam::KinetiSession::activeChanged, [](bool active) {
        KC_LOG_INFO("Rig session {}", active ? "active" : "inactive");
    });

    session.start();
    scenario.start();

    QTimer::singleShot(static_cast<int>(duration * 1000.0), &app, [&]() {
        scenario.stop();
        session.stop();
        KC_LOG_INFO("Redraws requested: {}", viewport.redrawCount(viewportId));
        QCoreApplication::quit();
    });

    int result = app.exec();

    KC_LOG_INFO("Application exiting, return code: {}", result);

    KinetiCam::Logger::instance().shutdown();

    return result;
}
