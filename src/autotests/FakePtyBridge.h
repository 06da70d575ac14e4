/*
    SPDX-FileCopyrightText: 2025 Tabmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef FAKEPTYBRIDGE_H
#define FAKEPTYBRIDGE_H

#include <QList>
#include <QSet>
#include <QSize>

#include "pty/PtyBridge.h"

namespace Tabmux
{

/**
 * In-memory PtyBridge for tests: records every request and lets the
 * test play the role of the processes through emitOutput()/emitExit().
 */
class FakePtyBridge : public PtyBridge
{
    Q_OBJECT
public:
    struct Write {
        ProcessHandle handle;
        QByteArray data;
    };

    struct Resize {
        ProcessHandle handle;
        int columns;
        int lines;
    };

    explicit FakePtyBridge(QObject *parent = nullptr);

    SpawnResult createProcess(int columns, int lines) override;
    void write(ProcessHandle handle, const QByteArray &data) override;
    void resize(ProcessHandle handle, int columns, int lines) override;
    void terminate(ProcessHandle handle) override;

    void emitOutput(ProcessHandle handle, const QByteArray &data);
    void emitExit(ProcessHandle handle, int exitCode = 0);

    bool failNextSpawn = false;

    QList<QSize> spawned;
    QList<Write> writes;
    QList<Resize> resizes;
    QList<ProcessHandle> terminated;
    QSet<ProcessHandle> live;

private:
    ProcessHandle _nextHandle = 100;
};

} // namespace Tabmux

#endif // FAKEPTYBRIDGE_H
