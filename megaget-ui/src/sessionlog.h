#ifndef SESSIONLOG_H
#define SESSIONLOG_H

#include <QString>
#include <QtGlobal>

// Routes qDebug/qInfo/qWarning/qCritical to stderr and to a session log
// file, one timestamped line per message.

class SessionLog {
public:
    // Returns false if the file could not be opened; stderr output still works.
    static bool install(const QString& filePath);
    static void uninstall();

    static QString formatLine(QtMsgType type, const QString& message);

private:
    static void handler(QtMsgType type, const QMessageLogContext& context, const QString& message);
};

#endif
