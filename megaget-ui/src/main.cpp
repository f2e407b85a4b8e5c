#include <QGuiApplication>
#include <QQmlApplicationEngine>
#include <QQmlContext>
#include <QTimer>
#include <QDir>
#include <QDebug>
#include "appconfig.h"
#include "downloadmanager.h"
#include "sessionlog.h"

int main(int argc, char *argv[]) {
    // .env next to where we are started from, for desktop runs without a
    // shell profile. Real environment variables take precedence.
    int dotEnvVars = AppConfig::loadDotEnv(QDir::currentPath() + "/.env");

    AppConfig config = AppConfig::fromSystem();

    // Headless hosts and containers have no display: serve the window over
    // Qt's VNC platform plugin instead. Must happen before QGuiApplication.
    if (config.runMode != RunMode::Desktop && !qEnvironmentVariableIsSet("QT_QPA_PLATFORM")) {
        qputenv("QT_QPA_PLATFORM", QString("vnc:port=%1").arg(config.vncPort).toUtf8());
    }

    QGuiApplication app(argc, argv);
    app.setApplicationName("MEGA Get");
    app.setOrganizationName("mega-get-ui");

    if (!SessionLog::install(config.logFilePath())) {
        qWarning() << "Continuing without a session log file";
    }
    if (dotEnvVars > 0) {
        qInfo() << "Loaded" << dotEnvVars << "variables from .env";
    }
    qInfo() << "Run mode:" << AppConfig::runModeName(config.runMode)
            << "poll interval:" << config.pollIntervalMs() << "ms";

    DownloadManager downloadManager(config, DownloadManager::createBackend(config));

    QQmlApplicationEngine engine;
    engine.rootContext()->setContextProperty("Downloads", &downloadManager);

    // qt_add_qml_module(... URI MegaGet) in CMakeLists.txt
    engine.loadFromModule("MegaGet", "Main");

    if (engine.rootObjects().isEmpty()) {
        qCritical() << "Failed to load Main.qml";
        return -1;
    }

    // Let the window show before the MEGAcmd server check starts.
    QTimer::singleShot(0, &downloadManager, &DownloadManager::start);

    int rc = app.exec();
    SessionLog::uninstall();
    return rc;
}
