/*
    SPDX-FileCopyrightText: 2025 Tabmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PANEPROCESSROUTER_H
#define PANEPROCESSROUTER_H

#include <QByteArray>
#include <QHash>
#include <QObject>

#include "TabmuxSettings.h"
#include "pty/ProcessHandle.h"
#include "tabmuxprivate_export.h"

class QTimer;

namespace Tabmux
{

class PtyBridge;
class SessionManager;

/**
 * Connects panes to the processes running in them.
 *
 * Starts and stops processes on request, forwards input and (debounced)
 * size changes to the bridge and routes the bridge's output and exit
 * events back to the pane currently bound to the handle.  Events for
 * handles no pane is bound to any more are dropped.
 */
class TABMUXPRIVATE_EXPORT PaneProcessRouter : public QObject
{
    Q_OBJECT
public:
    PaneProcessRouter(SessionManager *manager, PtyBridge *bridge, const TabmuxSettings &settings, QObject *parent = nullptr);
    ~PaneProcessRouter() override;

    // A size of zero starts the process with the configured default size
    bool startProcess(int paneId, int columns, int lines);
    void stopProcess(int paneId);
    void sendInput(int paneId, const QByteArray &data);

    // Only the last request of a burst reaches the process
    void requestResize(int paneId, int columns, int lines);
    bool hasPendingResize(int paneId) const;

    static QByteArray processCompletedMarker();
    static QByteArray spawnFailedMarker();

Q_SIGNALS:
    void paneOutput(int paneId, const QByteArray &data);
    void paneProcessFinished(int paneId, int exitCode);

private:
    struct PendingResize {
        QTimer *timer = nullptr;
        int columns = 0;
        int lines = 0;
    };

    void onOutputReceived(ProcessHandle handle, const QByteArray &data);
    void onProcessExited(ProcessHandle handle, int exitCode);
    void onPaneProcessChanged(int paneId);
    void flushResize(int paneId);
    void cancelResize(int paneId);

    SessionManager *_manager;
    PtyBridge *_bridge;
    TabmuxSettings _settings;

    QHash<int, PendingResize> _pendingResizes;
};

} // namespace Tabmux

#endif // PANEPROCESSROUTER_H
