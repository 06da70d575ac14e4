/*
    SPDX-FileCopyrightText: 2025 Tabmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "PaneProcessRouter.h"

#include "SessionManager.h"
#include "pty/PtyBridge.h"

#include <QLoggingCategory>
#include <QTimer>

Q_DECLARE_LOGGING_CATEGORY(lcSession)

namespace Tabmux
{

PaneProcessRouter::PaneProcessRouter(SessionManager *manager, PtyBridge *bridge, const TabmuxSettings &settings, QObject *parent)
    : QObject(parent)
    , _manager(manager)
    , _bridge(bridge)
    , _settings(settings)
{
    connect(_bridge, &PtyBridge::outputReceived, this, &PaneProcessRouter::onOutputReceived);
    connect(_bridge, &PtyBridge::processExited, this, &PaneProcessRouter::onProcessExited);
    connect(_manager, &SessionManager::paneRemoved, this, &PaneProcessRouter::cancelResize);
    connect(_manager, &SessionManager::paneProcessChanged, this, &PaneProcessRouter::onPaneProcessChanged);
}

PaneProcessRouter::~PaneProcessRouter()
{
    const auto paneIds = _pendingResizes.keys();
    for (int paneId : paneIds) {
        cancelResize(paneId);
    }
}

QByteArray PaneProcessRouter::processCompletedMarker()
{
    return QByteArrayLiteral("\r\n\x1b[33m[Process Completed]\x1b[0m\r\n");
}

QByteArray PaneProcessRouter::spawnFailedMarker()
{
    return QByteArrayLiteral("\r\n\x1b[31m[System Error] Failed to initialize PTY engine.\x1b[0m\r\n");
}

bool PaneProcessRouter::startProcess(int paneId, int columns, int lines)
{
    const std::optional<Pane> pane = _manager->findPane(paneId);
    if (!pane.has_value()) {
        qCDebug(lcSession) << "startProcess: unknown pane" << paneId;
        return false;
    }
    if (pane->isBound()) {
        return false;
    }

    // Panes started before they are laid out have no size yet
    if (columns <= 0 || lines <= 0) {
        columns = _settings.defaultColumns;
        lines = _settings.defaultLines;
    }

    const SpawnResult result = _bridge->createProcess(columns, lines);
    if (const auto *error = std::get_if<SpawnError>(&result)) {
        qCWarning(lcSession) << "pane" << paneId << "failed to start a process:" << error->reason;
        _manager->markSpawnFailed(paneId);
        Q_EMIT paneOutput(paneId, spawnFailedMarker());
        return false;
    }

    const ProcessHandle handle = std::get<ProcessHandle>(result);
    _manager->bindProcess(paneId, handle);
    if (_manager->paneForProcess(handle) != paneId) {
        // Someone removed the pane from a slot connected to the manager
        _bridge->terminate(handle);
        return false;
    }

    if (!_settings.initialCommand.isEmpty()) {
        _bridge->write(handle, _settings.initialCommand.toUtf8() + '\r');
    }
    return true;
}

void PaneProcessRouter::stopProcess(int paneId)
{
    const std::optional<Pane> pane = _manager->findPane(paneId);
    if (!pane.has_value() || !pane->isBound()) {
        return;
    }

    const ProcessHandle handle = pane->process.value();
    cancelResize(paneId);
    _manager->bindProcess(paneId, std::nullopt);
    _bridge->terminate(handle);
}

void PaneProcessRouter::sendInput(int paneId, const QByteArray &data)
{
    const std::optional<Pane> pane = _manager->findPane(paneId);
    if (!pane.has_value() || !pane->isBound()) {
        qCDebug(lcSession) << "sendInput: pane" << paneId << "has no process";
        return;
    }
    _bridge->write(pane->process.value(), data);
}

void PaneProcessRouter::requestResize(int paneId, int columns, int lines)
{
    const std::optional<Pane> pane = _manager->findPane(paneId);
    if (!pane.has_value() || !pane->isBound()) {
        return;
    }

    auto it = _pendingResizes.find(paneId);
    if (it == _pendingResizes.end()) {
        PendingResize pending;
        pending.timer = new QTimer(this);
        pending.timer->setSingleShot(true);
        pending.timer->setInterval(_settings.resizeDebounceMs);
        connect(pending.timer, &QTimer::timeout, this, [this, paneId]() {
            flushResize(paneId);
        });
        it = _pendingResizes.insert(paneId, pending);
    }

    it->columns = columns;
    it->lines = lines;
    it->timer->start(); // restarts a running timer
}

bool PaneProcessRouter::hasPendingResize(int paneId) const
{
    return _pendingResizes.contains(paneId);
}

void PaneProcessRouter::flushResize(int paneId)
{
    const PendingResize pending = _pendingResizes.take(paneId);
    if (!pending.timer) {
        return;
    }
    pending.timer->deleteLater();

    const std::optional<Pane> pane = _manager->findPane(paneId);
    if (!pane.has_value() || !pane->isBound()) {
        return;
    }
    _bridge->resize(pane->process.value(), pending.columns, pending.lines);
}

void PaneProcessRouter::cancelResize(int paneId)
{
    const PendingResize pending = _pendingResizes.take(paneId);
    if (pending.timer) {
        pending.timer->stop();
        pending.timer->deleteLater();
    }
}

void PaneProcessRouter::onPaneProcessChanged(int paneId)
{
    const std::optional<Pane> pane = _manager->findPane(paneId);
    if (!pane.has_value() || !pane->isBound()) {
        cancelResize(paneId);
    }
}

void PaneProcessRouter::onOutputReceived(ProcessHandle handle, const QByteArray &data)
{
    const int paneId = _manager->paneForProcess(handle);
    if (paneId < 0) {
        return;
    }
    Q_EMIT paneOutput(paneId, data);
}

void PaneProcessRouter::onProcessExited(ProcessHandle handle, int exitCode)
{
    const int paneId = _manager->paneForProcess(handle);
    if (paneId < 0) {
        qCDebug(lcSession) << "exit of stale handle" << handle << "ignored";
        return;
    }

    _manager->markProcessExited(handle);
    Q_EMIT paneOutput(paneId, processCompletedMarker());
    Q_EMIT paneProcessFinished(paneId, exitCode);
}

} // namespace Tabmux

#include "moc_PaneProcessRouter.cpp"
