/*
    SPDX-FileCopyrightText: 2025 Tabmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionManager.h"

#include "pty/PtyBridge.h"

#include <QLoggingCategory>
#include <QSet>

#include <algorithm>

Q_LOGGING_CATEGORY(lcSession, "tabmux.session")

namespace Tabmux
{

SessionManager::SessionManager(PtyBridge *bridge, QObject *parent)
    : QObject(parent)
    , _bridge(bridge)
{
}

int SessionManager::createTab()
{
    const int tabNumber = _nextTabNumber++;
    const int paneNumber = _nextPaneNumber++;

    Pane pane;
    pane.id = paneNumber;
    pane.title = QStringLiteral("Pane %1").arg(paneNumber);

    Tab tab;
    tab.id = tabNumber;
    tab.title = QStringLiteral("Terminal %1").arg(tabNumber);
    tab.root = LayoutTree::leaf(pane.id);
    tab.panes.insert(pane);
    tab.activePaneId = pane.id;

    _tabs.append(tab);
    qCDebug(lcSession) << "created tab" << tab.id << "with pane" << pane.id;

    Q_EMIT tabAdded(tab.id);
    setActiveTabId(tab.id);
    return tab.id;
}

void SessionManager::closeTab(int tabId)
{
    const int index = tabIndex(tabId);
    if (index < 0) {
        qCDebug(lcSession) << "closeTab: unknown tab" << tabId;
        return;
    }

    const Tab closed = _tabs.takeAt(index);
    const auto handles = closed.panes.boundProcesses();
    for (ProcessHandle handle : handles) {
        _processToPane.remove(handle);
        terminateProcess(handle);
    }

    // Reassignment only looks at the list after removal
    int nextActive = _activeTabId;
    if (_activeTabId == tabId) {
        if (_tabs.isEmpty()) {
            nextActive = -1;
        } else if (index < _tabs.size()) {
            nextActive = _tabs.at(index).id;
        } else {
            nextActive = _tabs.constLast().id;
        }
    }

    qCDebug(lcSession) << "closed tab" << tabId << "terminating" << handles.size() << "processes";

    const auto paneIds = closed.panes.ids();
    for (int paneId : paneIds) {
        Q_EMIT paneRemoved(paneId);
    }
    Q_EMIT tabClosed(tabId);
    setActiveTabId(nextActive);
}

void SessionManager::setActiveTab(int tabId)
{
    if (tabIndex(tabId) < 0) {
        qCDebug(lcSession) << "setActiveTab: unknown tab" << tabId;
        return;
    }
    setActiveTabId(tabId);
}

void SessionManager::setActiveTabId(int tabId)
{
    if (_activeTabId == tabId) {
        return;
    }
    _activeTabId = tabId;
    Q_EMIT activeTabChanged(tabId);
}

void SessionManager::renameTab(int tabId, const QString &title)
{
    const int index = tabIndex(tabId);
    if (index < 0) {
        return;
    }
    Tab tab = _tabs.at(index);
    tab.title = title;
    _tabs[index] = tab;
    Q_EMIT tabChanged(tabId);
}

void SessionManager::ensureDefaultTab()
{
    if (_tabs.isEmpty()) {
        createTab();
    }
}

int SessionManager::splitPane(int tabId, int paneId, SplitDirection direction)
{
    const int index = tabIndex(tabId);
    if (index < 0) {
        qCDebug(lcSession) << "splitPane: unknown tab" << tabId;
        return -1;
    }

    Tab tab = _tabs.at(index);
    if (!tab.panes.contains(paneId)) {
        qCDebug(lcSession) << "splitPane: pane" << paneId << "is not in tab" << tabId;
        return -1;
    }

    const int newPaneId = _nextPaneNumber;
    LayoutNodePtr newRoot = LayoutTree::split(tab.root, paneId, newPaneId, direction);
    if (newRoot == tab.root) {
        qCWarning(lcSession) << "splitPane: pane" << paneId << "has no leaf in tab" << tabId;
        return -1;
    }
    _nextPaneNumber++;

    Pane pane;
    pane.id = newPaneId;
    pane.title = QStringLiteral("Pane %1").arg(newPaneId);

    tab.root = newRoot;
    tab.panes.insert(pane);
    tab.activePaneId = newPaneId;
    _tabs[index] = tab;

    qCDebug(lcSession) << "split pane" << paneId << "of tab" << tabId << "into" << newPaneId;
    Q_EMIT tabChanged(tabId);
    return newPaneId;
}

void SessionManager::closePane(int tabId, int paneId)
{
    const int index = tabIndex(tabId);
    if (index < 0) {
        return;
    }

    Tab tab = _tabs.at(index);
    const Pane *pane = tab.panes.find(paneId);
    if (!pane) {
        qCDebug(lcSession) << "closePane: pane" << paneId << "is not in tab" << tabId;
        return;
    }
    if (LayoutTree::countLeaves(tab.root) <= 1) {
        qCDebug(lcSession) << "closePane: refusing to close the last pane of tab" << tabId;
        return;
    }

    LayoutNodePtr newRoot = LayoutTree::removeLeaf(tab.root, paneId);
    if (!newRoot) {
        return;
    }

    const std::optional<ProcessHandle> process = pane->process;
    tab.panes.remove(paneId);
    tab.root = newRoot;
    if (tab.activePaneId == paneId) {
        tab.activePaneId = LayoutTree::firstLeaf(newRoot);
    }
    _tabs[index] = tab;

    if (process.has_value()) {
        _processToPane.remove(process.value());
        terminateProcess(process.value());
    }

    qCDebug(lcSession) << "closed pane" << paneId << "of tab" << tabId;
    Q_EMIT paneRemoved(paneId);
    Q_EMIT tabChanged(tabId);
}

void SessionManager::setActivePaneInTab(int tabId, int paneId)
{
    const int index = tabIndex(tabId);
    if (index < 0) {
        return;
    }

    const Tab &current = _tabs.at(index);
    if (current.activePaneId == paneId || !LayoutTree::containsLeaf(current.root, paneId)) {
        return;
    }

    Tab tab = current;
    tab.activePaneId = paneId;
    _tabs[index] = tab;
    Q_EMIT tabChanged(tabId);
}

void SessionManager::renamePane(int tabId, int paneId, const QString &title)
{
    if (tabIdForPane(paneId) != tabId) {
        return;
    }
    updatePane(paneId, [&title](Pane &pane) {
        pane.title = title;
    });
    Q_EMIT tabChanged(tabId);
}

void SessionManager::bindProcess(int paneId, std::optional<ProcessHandle> handle)
{
    const std::optional<Pane> current = findPane(paneId);
    if (!current.has_value()) {
        // The pane was closed while its process was being created
        qCDebug(lcSession) << "bindProcess: pane" << paneId << "no longer exists";
        return;
    }
    if (current->process == handle) {
        return;
    }

    if (current->process.has_value()) {
        _processToPane.remove(current->process.value());
    }
    updatePane(paneId, [&handle](Pane &pane) {
        pane.process = handle;
        if (handle.has_value()) {
            pane.marker = PaneMarker::None;
        }
    });
    if (handle.has_value()) {
        _processToPane.insert(handle.value(), paneId);
    }

    Q_EMIT paneProcessChanged(paneId);
}

void SessionManager::markProcessExited(ProcessHandle handle)
{
    const int paneId = _processToPane.value(handle, -1);
    if (paneId < 0) {
        return;
    }
    _processToPane.remove(handle);

    updatePane(paneId, [](Pane &pane) {
        pane.process.reset();
        pane.marker = PaneMarker::ProcessCompleted;
    });
    qCDebug(lcSession) << "process of pane" << paneId << "completed";
    Q_EMIT paneProcessChanged(paneId);
}

void SessionManager::markSpawnFailed(int paneId)
{
    const std::optional<Pane> current = findPane(paneId);
    if (!current.has_value()) {
        return;
    }
    if (current->process.has_value()) {
        _processToPane.remove(current->process.value());
    }

    updatePane(paneId, [](Pane &pane) {
        pane.process.reset();
        pane.marker = PaneMarker::SpawnFailed;
    });
    Q_EMIT paneProcessChanged(paneId);
}

bool SessionManager::updatePane(int paneId, const std::function<void(Pane &)> &change)
{
    for (int i = 0; i < _tabs.size(); ++i) {
        if (!_tabs.at(i).panes.contains(paneId)) {
            continue;
        }
        Tab tab = _tabs.at(i);
        change(*tab.panes.find(paneId));
        _tabs[i] = tab;
        return true;
    }
    return false;
}

void SessionManager::terminateProcess(ProcessHandle handle)
{
    if (_bridge) {
        _bridge->terminate(handle);
    }
}

void SessionManager::restore(const QList<Tab> &tabs, int activeTabId, int nextTabNumber, int nextPaneNumber)
{
    const QList<Tab> replaced = _tabs;
    _tabs.clear();
    _processToPane.clear();
    for (const Tab &tab : replaced) {
        const auto handles = tab.panes.boundProcesses();
        for (ProcessHandle handle : handles) {
            terminateProcess(handle);
        }
        const auto paneIds = tab.panes.ids();
        for (int paneId : paneIds) {
            Q_EMIT paneRemoved(paneId);
        }
    }

    QList<Tab> restored;
    QSet<int> tabIds;
    QSet<int> paneIds;
    int maxTabId = 0;
    int maxPaneId = 0;
    for (Tab tab : tabs) {
        if (!isConsistent(tab) || tabIds.contains(tab.id)) {
            qCWarning(lcSession) << "restore: skipping inconsistent tab" << tab.id;
            continue;
        }
        const auto ids = tab.panes.ids();
        const bool clash = std::any_of(ids.cbegin(), ids.cend(), [&paneIds](int id) {
            return paneIds.contains(id);
        });
        if (clash) {
            qCWarning(lcSession) << "restore: skipping tab" << tab.id << "reusing pane ids of another tab";
            continue;
        }

        tab.panes.unbindAll();
        tabIds.insert(tab.id);
        for (int id : ids) {
            paneIds.insert(id);
            maxPaneId = qMax(maxPaneId, id);
        }
        maxTabId = qMax(maxTabId, tab.id);
        restored.append(tab);
    }

    _tabs = restored;
    _nextTabNumber = qMax(qMax(_nextTabNumber, qBound(1, nextTabNumber, MaxId + 1)), maxTabId + 1);
    _nextPaneNumber = qMax(qMax(_nextPaneNumber, qBound(1, nextPaneNumber, MaxId + 1)), maxPaneId + 1);

    int active = -1;
    if (tabIndex(activeTabId) >= 0) {
        active = activeTabId;
    } else if (!_tabs.isEmpty()) {
        active = _tabs.constFirst().id;
    }
    _activeTabId = active;

    qCDebug(lcSession) << "restored" << _tabs.size() << "tabs, active" << _activeTabId;
    Q_EMIT sessionRestored();
    Q_EMIT activeTabChanged(_activeTabId);
}

bool SessionManager::isConsistent(const Tab &tab)
{
    if (tab.id <= 0 || tab.id > MaxId || !tab.root) {
        return false;
    }

    QList<int> leaves = LayoutTree::leafIds(tab.root);
    std::sort(leaves.begin(), leaves.end());
    if (std::adjacent_find(leaves.cbegin(), leaves.cend()) != leaves.cend()) {
        return false;
    }
    // QMap keys come back sorted
    if (leaves != tab.panes.ids()) {
        return false;
    }

    const auto panes = tab.panes.panes();
    for (const Pane &pane : panes) {
        if (pane.id <= 0 || pane.id > MaxId) {
            return false;
        }
    }
    return tab.panes.contains(tab.activePaneId);
}

const QList<Tab> &SessionManager::tabs() const
{
    return _tabs;
}

std::optional<Tab> SessionManager::tab(int tabId) const
{
    const int index = tabIndex(tabId);
    if (index < 0) {
        return std::nullopt;
    }
    return _tabs.at(index);
}

int SessionManager::tabIndex(int tabId) const
{
    for (int i = 0; i < _tabs.size(); ++i) {
        if (_tabs.at(i).id == tabId) {
            return i;
        }
    }
    return -1;
}

int SessionManager::activeTabId() const
{
    return _activeTabId;
}

std::optional<Tab> SessionManager::activeTab() const
{
    return tab(_activeTabId);
}

std::optional<Pane> SessionManager::findPane(int paneId) const
{
    for (const Tab &tab : _tabs) {
        if (const Pane *pane = tab.panes.find(paneId)) {
            return *pane;
        }
    }
    return std::nullopt;
}

int SessionManager::tabIdForPane(int paneId) const
{
    for (const Tab &tab : _tabs) {
        if (tab.panes.contains(paneId)) {
            return tab.id;
        }
    }
    return -1;
}

int SessionManager::paneForProcess(ProcessHandle handle) const
{
    return _processToPane.value(handle, -1);
}

int SessionManager::nextTabNumber() const
{
    return _nextTabNumber;
}

int SessionManager::nextPaneNumber() const
{
    return _nextPaneNumber;
}

PtyBridge *SessionManager::bridge() const
{
    return _bridge;
}

} // namespace Tabmux

#include "moc_SessionManager.cpp"
