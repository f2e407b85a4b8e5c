#include "appconfig.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStandardPaths>
#include <QStringList>
#include <QTextStream>
#include <QtGlobal>
#include <QDebug>
#include <algorithm>

namespace {

int positiveIntFrom(const QProcessEnvironment& env, const QString& key, int fallback) {
    const QString value = env.value(key).trimmed();
    if (value.isEmpty()) return fallback;
    bool ok = false;
    int parsed = value.toInt(&ok);
    if (!ok || parsed <= 0) {
        qWarning() << "Ignoring invalid" << key << "value:" << value;
        return fallback;
    }
    return parsed;
}

} // namespace

bool AppConfig::isTruthy(const QString& value) {
    const QString v = value.trimmed().toLower();
    return v == "1" || v == "true" || v == "yes";
}

QString AppConfig::runModeName(RunMode mode) {
    switch (mode) {
    case RunMode::Desktop:   return "desktop";
    case RunMode::Headless:  return "headless";
    case RunMode::Container: return "container";
    }
    return "desktop";
}

AppConfig AppConfig::fromEnvironment(const QProcessEnvironment& env, bool containerMarker) {
    AppConfig config;
    config.baseEnvironment = env;
    config.inContainer = containerMarker || !env.value("container").isEmpty();

    const QString home = env.value("HOME", QDir::homePath());
    config.downloadDir = env.value("DOWNLOAD_DIR").trimmed();
    if (config.downloadDir.isEmpty()) {
        config.downloadDir = config.inContainer ? QStringLiteral("/data/") : home + "/Downloads";
    }

    config.transferListLimit = positiveIntFrom(env, "TRANSFER_LIST_LIMIT", DefaultTransferListLimit);
    config.pathDisplaySize = positiveIntFrom(env, "PATH_DISPLAY_SIZE", DefaultPathDisplaySize);
    config.vncPort = positiveIntFrom(env, "MEGAGET_VNC_PORT", DefaultVncPort);

    const QString timeout = env.value("INPUT_TIMEOUT").trimmed();
    if (!timeout.isEmpty()) {
        bool ok = false;
        double seconds = timeout.toDouble(&ok);
        if (ok && seconds >= 0.0) {
            config.inputTimeout = std::min(seconds, MaximumInputTimeout);
        } else {
            qWarning() << "Ignoring invalid INPUT_TIMEOUT value:" << timeout;
        }
    }

    config.simulate = isTruthy(env.value("MEGA_SIMULATE"));
    config.uiTestMode = isTruthy(env.value("UI_TEST_MODE"));

    // The macOS MEGAcmd bundle (https://github.com/meganz/MEGAcmd) keeps its
    // mega-* scripts inside the app rather than on PATH.
    config.megaCmdPath = env.value("MEGACMD_PATH").trimmed();
#ifdef Q_OS_MACOS
    if (config.megaCmdPath.isEmpty()) {
        const QString bundled = "/Applications/MEGAcmd.app/Contents/MacOS";
        if (QFileInfo(bundled).isDir()) config.megaCmdPath = bundled;
    }
#endif

    config.historyFileOverride = env.value("MEGAGET_HISTORY_FILE").trimmed();
    config.logFileOverride = env.value("MEGAGET_LOG_FILE").trimmed();

    bool headless = isTruthy(env.value("MEGAGET_FORCE_HEADLESS"));
#ifdef Q_OS_LINUX
    if (env.value("DISPLAY").isEmpty() && env.value("WAYLAND_DISPLAY").isEmpty()) {
        headless = true;
    }
#endif
    if (config.inContainer) {
        config.runMode = RunMode::Container;
    } else if (headless) {
        config.runMode = RunMode::Headless;
    } else {
        config.runMode = RunMode::Desktop;
    }
    return config;
}

AppConfig AppConfig::fromSystem() {
    return fromEnvironment(QProcessEnvironment::systemEnvironment(), QFile::exists("/.dockerenv"));
}

int AppConfig::loadDotEnv(const QString& filePath) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) return -1;

    int applied = 0;
    QTextStream in(&file);
    while (!in.atEnd()) {
        const QString line = in.readLine().trimmed();
        if (line.isEmpty() || line.startsWith('#')) continue;

        int eq = line.indexOf('=');
        if (eq <= 0) continue;
        const QString key = line.left(eq).trimmed();
        const QString value = line.mid(eq + 1).trimmed();
        if (key.isEmpty() || qEnvironmentVariableIsSet(key.toLocal8Bit().constData())) continue;

        qputenv(key.toLocal8Bit().constData(), value.toUtf8());
        ++applied;
    }
    return applied;
}

QString AppConfig::findExecutable(const QString& name, const QProcessEnvironment& env) {
    const QStringList paths = env.value("PATH").split(QDir::listSeparator(), Qt::SkipEmptyParts);
    if (paths.isEmpty()) return QString();
    return QStandardPaths::findExecutable(name, paths);
}

int AppConfig::pollIntervalMs() const {
    const double seconds = qBound(0.0, inputTimeout, MaximumInputTimeout);
    return std::max(MinimumPollIntervalMs, static_cast<int>(seconds * 1000.0));
}

QProcessEnvironment AppConfig::subprocessEnvironment() const {
    QProcessEnvironment env = baseEnvironment;
    if (!megaCmdPath.isEmpty()) {
        const QString path = env.value("PATH");
        env.insert("PATH", path.isEmpty() ? megaCmdPath
                                          : megaCmdPath + QDir::listSeparator() + path);
    }
    return env;
}

QString AppConfig::historyFilePath() const {
    if (!historyFileOverride.isEmpty()) return historyFileOverride;
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation) + "/url-history.json";
}

QString AppConfig::logFilePath() const {
    if (!logFileOverride.isEmpty()) return logFileOverride;
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation) + "/session.log";
}
