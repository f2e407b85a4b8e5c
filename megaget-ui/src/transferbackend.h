#ifndef TRANSFERBACKEND_H
#define TRANSFERBACKEND_H

#include <QString>
#include <functional>

// Outcome of one external command.
struct CommandResult {
    bool started = false;       // false: binary missing or spawn failed
    int exitCode = -1;
    QString stdOut;
    QString stdErr;
    QString errorString;        // OS-level launch/crash error, if any

    bool succeeded() const { return started && exitCode == 0; }
};

enum class TransferAction { Cancel, Pause, Resume };

QString transferActionName(TransferAction action);   // "cancel", "pause", "resume"
QString transferActionTitle(TransferAction action);  // "Cancel", "Pause", "Resume"

// Where transfer commands go. The real implementation drives MEGAcmd;
// the simulated ones answer with canned output so the UI runs without it.
// Callbacks are always invoked later from the event loop, never inline.
class TransferBackend {
public:
    using Callback = std::function<void(const CommandResult&)>;

    virtual ~TransferBackend() = default;
    virtual QString name() const = 0;
    virtual bool isSimulated() const = 0;

    virtual void startDownload(const QString& url, const QString& downloadDir, Callback done) = 0;
    // Empty tag targets all transfers.
    virtual void transferAction(TransferAction action, const QString& tag, Callback done) = 0;
    virtual void listTransfers(int limit, int pathDisplaySize, Callback done) = 0;
};

#endif
