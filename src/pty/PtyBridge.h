/*
    SPDX-FileCopyrightText: 2025 Tabmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PTYBRIDGE_H
#define PTYBRIDGE_H

#include <QByteArray>
#include <QObject>

#include "ProcessHandle.h"
#include "tabmuxprivate_export.h"

namespace Tabmux
{

/**
 * Host side of the pane processes: spawns one pseudo-terminal child per
 * request and reports its output and termination, keyed by handle.
 *
 * Output for a handle is emitted in the order it was read.  processExited()
 * is emitted at most once per handle and never after terminate() was
 * requested for it.  write() and resize() ignore stale handles and
 * terminate() is idempotent.
 */
class TABMUXPRIVATE_EXPORT PtyBridge : public QObject
{
    Q_OBJECT
public:
    explicit PtyBridge(QObject *parent = nullptr);
    ~PtyBridge() override;

    virtual SpawnResult createProcess(int columns, int lines) = 0;
    virtual void write(ProcessHandle handle, const QByteArray &data) = 0;
    virtual void resize(ProcessHandle handle, int columns, int lines) = 0;
    virtual void terminate(ProcessHandle handle) = 0;

Q_SIGNALS:
    void outputReceived(Tabmux::ProcessHandle handle, const QByteArray &data);
    void processExited(Tabmux::ProcessHandle handle, int exitCode);
};

} // namespace Tabmux

#endif // PTYBRIDGE_H
