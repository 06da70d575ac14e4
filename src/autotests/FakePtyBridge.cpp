/*
    SPDX-FileCopyrightText: 2025 Tabmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "FakePtyBridge.h"

namespace Tabmux
{

FakePtyBridge::FakePtyBridge(QObject *parent)
    : PtyBridge(parent)
{
}

SpawnResult FakePtyBridge::createProcess(int columns, int lines)
{
    if (failNextSpawn) {
        failNextSpawn = false;
        return SpawnError{QStringLiteral("spawn refused by test")};
    }
    spawned.append(QSize(columns, lines));
    const ProcessHandle handle = _nextHandle++;
    live.insert(handle);
    return handle;
}

void FakePtyBridge::write(ProcessHandle handle, const QByteArray &data)
{
    if (live.contains(handle)) {
        writes.append(Write{handle, data});
    }
}

void FakePtyBridge::resize(ProcessHandle handle, int columns, int lines)
{
    if (live.contains(handle)) {
        resizes.append(Resize{handle, columns, lines});
    }
}

void FakePtyBridge::terminate(ProcessHandle handle)
{
    if (live.remove(handle)) {
        terminated.append(handle);
    }
}

void FakePtyBridge::emitOutput(ProcessHandle handle, const QByteArray &data)
{
    Q_EMIT outputReceived(handle, data);
}

void FakePtyBridge::emitExit(ProcessHandle handle, int exitCode)
{
    live.remove(handle);
    Q_EMIT processExited(handle, exitCode);
}

} // namespace Tabmux

#include "moc_FakePtyBridge.cpp"
