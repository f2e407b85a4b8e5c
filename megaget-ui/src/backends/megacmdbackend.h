#ifndef MEGACMDBACKEND_H
#define MEGACMDBACKEND_H

#include "../transferbackend.h"
#include <QObject>
#include <QProcessEnvironment>
#include <QStringList>

// Drives the MEGAcmd command-line tools:
//   mega-get -q --ignore-quota-warn <url> <dir>     start a download
//   mega-transfers -c|-p|-r <tag>|-a                cancel / pause / resume
//   mega-transfers --limit=N --path-display-size=N  listing
//
// Every command runs as its own QProcess parented to the backend, with the
// augmented PATH so a local MEGAcmd install is found.

class MegaCmdBackend : public QObject, public TransferBackend {
    Q_OBJECT
public:
    static constexpr int DefaultResumeDelayMs = 2000;

    explicit MegaCmdBackend(const QProcessEnvironment& env, QObject *parent = nullptr);
    ~MegaCmdBackend() override;

    QString name() const override { return "megacmd"; }
    bool isSimulated() const override { return false; }

    void startDownload(const QString& url, const QString& downloadDir, Callback done) override;
    void transferAction(TransferAction action, const QString& tag, Callback done) override;
    void listTransfers(int limit, int pathDisplaySize, Callback done) override;

    // Delay before the "resume all" nudge that follows a successful mega-get.
    void setResumeDelay(int ms) { m_resumeDelayMs = ms; }

    void runCommand(const QString& program, const QStringList& args, Callback done);

private:
    void scheduleResumeAll();

    QProcessEnvironment m_env;
    int m_resumeDelayMs = DefaultResumeDelayMs;
};

#endif
