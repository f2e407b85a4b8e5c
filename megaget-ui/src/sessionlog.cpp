#include "sessionlog.h"
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>
#include <QDebug>
#include <cstdio>

namespace {

QFile g_logFile;
QMutex g_logMutex;
QtMessageHandler g_previousHandler = nullptr;

const char *levelName(QtMsgType type) {
    switch (type) {
    case QtDebugMsg:    return "debug";
    case QtInfoMsg:     return "info";
    case QtWarningMsg:  return "warning";
    case QtCriticalMsg: return "critical";
    case QtFatalMsg:    return "fatal";
    }
    return "debug";
}

} // namespace

QString SessionLog::formatLine(QtMsgType type, const QString& message) {
    return QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz") +
           "  [" + levelName(type) + "]  " + message + "\n";
}

bool SessionLog::install(const QString& filePath) {
    {
        QMutexLocker lock(&g_logMutex);
        if (g_logFile.isOpen()) g_logFile.close();
        QDir().mkpath(QFileInfo(filePath).absolutePath());
        g_logFile.setFileName(filePath);
        g_logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text);
    }

    QtMessageHandler previous = qInstallMessageHandler(&SessionLog::handler);
    if (previous != &SessionLog::handler) g_previousHandler = previous;

    if (!g_logFile.isOpen()) {
        qWarning() << "Could not open session log" << filePath;
        return false;
    }
    qInfo() << "=== session started, logging to" << filePath << "===";
    return true;
}

void SessionLog::uninstall() {
    qInstallMessageHandler(g_previousHandler);
    g_previousHandler = nullptr;
    QMutexLocker lock(&g_logMutex);
    g_logFile.close();
}

void SessionLog::handler(QtMsgType type, const QMessageLogContext& context, const QString& message) {
    Q_UNUSED(context);
    const QByteArray line = formatLine(type, message).toUtf8();

    QMutexLocker lock(&g_logMutex);
    std::fputs(line.constData(), stderr);
    if (g_logFile.isOpen()) {
        g_logFile.write(line);
        g_logFile.flush();
    }
}
