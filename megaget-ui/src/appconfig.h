#ifndef APPCONFIG_H
#define APPCONFIG_H

#include <QProcessEnvironment>
#include <QString>

// Runtime configuration resolved from environment variables (optionally
// seeded from a .env file) and a few OS probes.
//
//   DOWNLOAD_DIR            download target (default ~/Downloads, /data/ in a container)
//   TRANSFER_LIST_LIMIT     rows requested from mega-transfers (default 50)
//   PATH_DISPLAY_SIZE       path width requested from mega-transfers (default 80)
//   INPUT_TIMEOUT           poll interval in seconds, kept within 0.5 .. 86400
//   MEGA_SIMULATE           run without MEGAcmd, canned responses
//   UI_TEST_MODE            run without MEGAcmd, sample native-format listing
//   MEGACMD_PATH            directory prepended to PATH for mega-* commands
//   MEGAGET_FORCE_HEADLESS  serve the UI over Qt's VNC platform
//   MEGAGET_VNC_PORT        port for the VNC platform (default 8080)
//   MEGAGET_HISTORY_FILE    URL history location override
//   MEGAGET_LOG_FILE        session log location override

enum class RunMode { Desktop, Headless, Container };

struct AppConfig {
    static constexpr int DefaultTransferListLimit = 50;
    static constexpr int DefaultPathDisplaySize = 80;
    static constexpr double DefaultInputTimeout = 0.0166;
    static constexpr int MinimumPollIntervalMs = 500;
    static constexpr double MaximumInputTimeout = 86400.0;
    static constexpr int DefaultVncPort = 8080;

    QString downloadDir;
    int transferListLimit = DefaultTransferListLimit;
    int pathDisplaySize = DefaultPathDisplaySize;
    double inputTimeout = DefaultInputTimeout;
    bool simulate = false;
    bool uiTestMode = false;
    QString megaCmdPath;
    bool inContainer = false;
    RunMode runMode = RunMode::Desktop;
    int vncPort = DefaultVncPort;
    QString historyFileOverride;
    QString logFileOverride;
    QProcessEnvironment baseEnvironment;

    // containerMarker: whether /.dockerenv exists (passed in so tests can
    // resolve container configs on any host)
    static AppConfig fromEnvironment(const QProcessEnvironment& env, bool containerMarker);
    static AppConfig fromSystem();

    // Reads KEY=VALUE lines into the process environment. Keys that are
    // already set win. Returns the number of variables applied, -1 if the
    // file could not be read.
    static int loadDotEnv(const QString& filePath);

    static bool isTruthy(const QString& value);
    static QString runModeName(RunMode mode);

    // Searches the PATH of the given environment.
    static QString findExecutable(const QString& name, const QProcessEnvironment& env);

    int pollIntervalMs() const;

    // Environment for mega-* subprocesses: MEGACMD_PATH ahead of PATH.
    QProcessEnvironment subprocessEnvironment() const;

    // These use QStandardPaths and need the application name set.
    QString historyFilePath() const;
    QString logFilePath() const;
};

#endif
