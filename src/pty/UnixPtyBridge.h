/*
    SPDX-FileCopyrightText: 2025 Tabmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef UNIXPTYBRIDGE_H
#define UNIXPTYBRIDGE_H

#include <QHash>
#include <QString>
#include <QStringList>

#include <sys/types.h>

#include "PtyBridge.h"

class QSocketNotifier;

namespace Tabmux
{

/**
 * PtyBridge backed by forkpty(): each process runs the configured shell
 * on its own pseudo-terminal.  The master side is non-blocking and read
 * from the event loop through a QSocketNotifier.
 */
class TABMUXPRIVATE_EXPORT UnixPtyBridge : public PtyBridge
{
    Q_OBJECT
public:
    explicit UnixPtyBridge(const QString &shell, QObject *parent = nullptr);
    ~UnixPtyBridge() override;

    SpawnResult createProcess(int columns, int lines) override;
    void write(ProcessHandle handle, const QByteArray &data) override;
    void resize(ProcessHandle handle, int columns, int lines) override;
    void terminate(ProcessHandle handle) override;

    void setArguments(const QStringList &arguments);

    bool isRunning(ProcessHandle handle) const;
    int processCount() const;

    // Children that were closed or terminated but not collected yet
    int pendingReapCount() const;

private:
    struct Process {
        pid_t pid = -1;
        int masterFd = -1;
        QSocketNotifier *notifier = nullptr;
    };

    struct Reaping {
        ProcessHandle handle = 0;
        bool reportExit = false;
        int attempts = 0;
    };

    void readAvailable(ProcessHandle handle);
    void finishProcess(ProcessHandle handle);
    void reapLater(pid_t pid, ProcessHandle handle, bool reportExit);
    void retryReap(pid_t pid);
    static void closeProcess(Process &process);
    static bool tryReap(pid_t pid, int &exitCode);
    static int exitCodeFromStatus(int status);

    QString _shell;
    QStringList _arguments;
    ProcessHandle _nextHandle = 1;
    QHash<ProcessHandle, Process> _processes;
    QHash<pid_t, Reaping> _reaping;
};

} // namespace Tabmux

#endif // UNIXPTYBRIDGE_H
