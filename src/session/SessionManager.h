/*
    SPDX-FileCopyrightText: 2025 Tabmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONMANAGER_H
#define SESSIONMANAGER_H

#include <QHash>
#include <QList>
#include <QObject>

#include <functional>
#include <limits>
#include <optional>

#include "Tab.h"
#include "tabmuxprivate_export.h"

namespace Tabmux
{

class PtyBridge;

/**
 * Owns the tabs of one multiplexer session and every operation that
 * changes them.
 *
 * Operations on unknown tabs or panes are ignored.  A tab is always
 * replaced as a whole, so readers see it either before or after an
 * operation.  Tab and pane ids come from two counters that only ever
 * grow; the same numbers are used for the default titles.
 *
 * Not thread safe: every call is expected on the thread that owns it.
 */
class TABMUXPRIVATE_EXPORT SessionManager : public QObject
{
    Q_OBJECT
public:
    // Largest tab or pane id accepted from outside, far enough below INT_MAX
    // that the counters cannot wrap
    static constexpr int MaxId = std::numeric_limits<int>::max() / 2;

    explicit SessionManager(PtyBridge *bridge = nullptr, QObject *parent = nullptr);

    int createTab();
    void closeTab(int tabId);
    void setActiveTab(int tabId);
    void renameTab(int tabId, const QString &title);
    void ensureDefaultTab();

    int splitPane(int tabId, int paneId, SplitDirection direction);
    void closePane(int tabId, int paneId);
    void setActivePaneInTab(int tabId, int paneId);
    void renamePane(int tabId, int paneId, const QString &title);

    void bindProcess(int paneId, std::optional<ProcessHandle> handle);
    void markProcessExited(ProcessHandle handle);
    void markSpawnFailed(int paneId);

    /**
     * Replaces the whole session, e.g. with one read back from disk.
     * Processes of the current session are terminated, restored panes
     * start unbound and inconsistent tabs are skipped.  The counters never
     * move backwards and end up above every restored id.
     */
    void restore(const QList<Tab> &tabs, int activeTabId, int nextTabNumber, int nextPaneNumber);

    const QList<Tab> &tabs() const;
    std::optional<Tab> tab(int tabId) const;
    int tabIndex(int tabId) const;
    int activeTabId() const;
    std::optional<Tab> activeTab() const;

    std::optional<Pane> findPane(int paneId) const;
    int tabIdForPane(int paneId) const;
    int paneForProcess(ProcessHandle handle) const;

    int nextTabNumber() const;
    int nextPaneNumber() const;

    PtyBridge *bridge() const;

    static bool isConsistent(const Tab &tab);

Q_SIGNALS:
    void tabAdded(int tabId);
    void tabClosed(int tabId);
    void tabChanged(int tabId);
    void activeTabChanged(int tabId);
    void paneRemoved(int paneId);
    void paneProcessChanged(int paneId);
    void sessionRestored();

private:
    bool updatePane(int paneId, const std::function<void(Pane &)> &change);
    void terminateProcess(ProcessHandle handle);
    void setActiveTabId(int tabId);

    PtyBridge *_bridge; // non-owning, may be null

    QList<Tab> _tabs;
    int _activeTabId = -1;
    int _nextTabNumber = 1;
    int _nextPaneNumber = 1;

    QHash<ProcessHandle, int> _processToPane;
};

} // namespace Tabmux

#endif // SESSIONMANAGER_H
