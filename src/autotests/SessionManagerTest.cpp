/*
    SPDX-FileCopyrightText: 2025 Tabmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionManagerTest.h"

#include <QSet>
#include <QSignalSpy>
#include <QTest>

#include "../session/SessionManager.h"
#include "FakePtyBridge.h"

using namespace Tabmux;

namespace
{
ProcessHandle spawn(FakePtyBridge &bridge)
{
    return std::get<ProcessHandle>(bridge.createProcess(80, 24));
}

bool invariantsHold(const SessionManager &manager)
{
    if (manager.tabs().isEmpty()) {
        return manager.activeTabId() == -1;
    }
    if (manager.tabIndex(manager.activeTabId()) < 0) {
        return false;
    }
    for (const Tab &tab : manager.tabs()) {
        if (!SessionManager::isConsistent(tab) || LayoutTree::countLeaves(tab.root) < 1) {
            return false;
        }
    }
    return true;
}
}

void SessionManagerTest::testCreateTabOnEmptyManager()
{
    SessionManager manager;
    QSignalSpy added(&manager, &SessionManager::tabAdded);
    QSignalSpy activeChanged(&manager, &SessionManager::activeTabChanged);

    QVERIFY(manager.tabs().isEmpty());
    QCOMPARE(manager.activeTabId(), -1);

    const int tabId = manager.createTab();
    QCOMPARE(manager.tabs().size(), 1);
    QCOMPARE(manager.activeTabId(), tabId);

    const auto tab = manager.activeTab();
    QVERIFY(tab.has_value());
    QCOMPARE(tab->title, QStringLiteral("Terminal 1"));
    QVERIFY(tab->root->isLeaf());
    QCOMPARE(tab->panes.size(), 1);
    QCOMPARE(tab->activePaneId, tab->root->paneId);

    const Pane *pane = tab->panes.find(tab->activePaneId);
    QVERIFY(pane);
    QCOMPARE(pane->title, QStringLiteral("Pane 1"));
    QVERIFY(!pane->isBound());

    QCOMPARE(added.count(), 1);
    QCOMPARE(activeChanged.count(), 1);
    QVERIFY(invariantsHold(manager));
}

void SessionManagerTest::testCreateTabNumbering()
{
    SessionManager manager;
    const int first = manager.createTab();
    manager.splitPane(first, manager.tab(first)->activePaneId, SplitDirection::Vertical);
    manager.closeTab(first);

    // Numbers are never handed out twice, even after a close
    const int second = manager.createTab();
    QVERIFY(second != first);
    QCOMPARE(manager.tab(second)->title, QStringLiteral("Terminal 2"));
    QCOMPARE(manager.tab(second)->activePaneId, 3);
    QCOMPARE(manager.nextTabNumber(), 3);
    QCOMPARE(manager.nextPaneNumber(), 4);
}

void SessionManagerTest::testEnsureDefaultTab()
{
    SessionManager manager;
    manager.ensureDefaultTab();
    QCOMPARE(manager.tabs().size(), 1);

    manager.ensureDefaultTab();
    QCOMPARE(manager.tabs().size(), 1);
}

void SessionManagerTest::testSplitPane()
{
    SessionManager manager;
    QSignalSpy changed(&manager, &SessionManager::tabChanged);

    const int tabId = manager.createTab();
    const int p1 = manager.tab(tabId)->activePaneId;
    const int p2 = manager.splitPane(tabId, p1, SplitDirection::Vertical);

    QVERIFY(p2 > p1);
    const auto tab = manager.tab(tabId);
    QCOMPARE(tab->root->type, LayoutNodeType::Split);
    QCOMPARE(tab->root->direction, SplitDirection::Vertical);
    QCOMPARE(tab->root->ratio, 0.5);
    QCOMPARE(tab->root->a->paneId, p1);
    QCOMPARE(tab->root->b->paneId, p2);
    QCOMPARE(tab->activePaneId, p2);
    QCOMPARE(tab->panes.ids(), QList<int>({p1, p2}));
    QCOMPARE(tab->panes.find(p2)->title, QStringLiteral("Pane %1").arg(p2));
    QCOMPARE(changed.count(), 1);
    QVERIFY(invariantsHold(manager));
}

void SessionManagerTest::testSplitPaneUnknownIds()
{
    SessionManager manager;
    const int tabId = manager.createTab();
    const int p1 = manager.tab(tabId)->activePaneId;
    const int counter = manager.nextPaneNumber();

    QCOMPARE(manager.splitPane(tabId + 10, p1, SplitDirection::Vertical), -1);
    QCOMPARE(manager.splitPane(tabId, p1 + 10, SplitDirection::Vertical), -1);

    QCOMPARE(manager.nextPaneNumber(), counter);
    QVERIFY(manager.tab(tabId)->root->isLeaf());
}

void SessionManagerTest::testClosePane()
{
    SessionManager manager;
    QSignalSpy removed(&manager, &SessionManager::paneRemoved);

    const int tabId = manager.createTab();
    const int p1 = manager.tab(tabId)->activePaneId;
    const int p2 = manager.splitPane(tabId, p1, SplitDirection::Vertical);

    manager.closePane(tabId, p2);

    const auto tab = manager.tab(tabId);
    QVERIFY(tab->root->isLeaf());
    QCOMPARE(tab->root->paneId, p1);
    QCOMPARE(tab->activePaneId, p1);
    QVERIFY(!tab->panes.contains(p2));
    QCOMPARE(removed.count(), 1);
    QCOMPARE(removed.at(0).at(0).toInt(), p2);
    QVERIFY(invariantsHold(manager));
}

void SessionManagerTest::testCloseLastPaneIsNoop()
{
    FakePtyBridge bridge;
    SessionManager manager(&bridge);
    QSignalSpy changed(&manager, &SessionManager::tabChanged);

    const int tabId = manager.createTab();
    const int p1 = manager.tab(tabId)->activePaneId;
    const ProcessHandle handle = spawn(bridge);
    manager.bindProcess(p1, handle);

    manager.closePane(tabId, p1);

    QVERIFY(manager.tab(tabId)->root->isLeaf());
    QVERIFY(manager.findPane(p1).has_value());
    QCOMPARE(manager.paneForProcess(handle), p1);
    QVERIFY(bridge.terminated.isEmpty());
    QCOMPARE(changed.count(), 0);
}

void SessionManagerTest::testClosePaneReassignsActive()
{
    SessionManager manager;
    const int tabId = manager.createTab();
    const int p1 = manager.tab(tabId)->activePaneId;
    const int p2 = manager.splitPane(tabId, p1, SplitDirection::Horizontal);
    const int p3 = manager.splitPane(tabId, p2, SplitDirection::Vertical);

    manager.setActivePaneInTab(tabId, p1);
    manager.closePane(tabId, p1);
    QCOMPARE(manager.tab(tabId)->activePaneId, p2);

    // Closing an inactive pane keeps the active one
    manager.setActivePaneInTab(tabId, p3);
    manager.closePane(tabId, p2);
    QCOMPARE(manager.tab(tabId)->activePaneId, p3);
    QVERIFY(invariantsHold(manager));
}

void SessionManagerTest::testClosePaneTerminatesProcess()
{
    FakePtyBridge bridge;
    SessionManager manager(&bridge);

    const int tabId = manager.createTab();
    const int p1 = manager.tab(tabId)->activePaneId;
    const int p2 = manager.splitPane(tabId, p1, SplitDirection::Vertical);
    const ProcessHandle h1 = spawn(bridge);
    const ProcessHandle h2 = spawn(bridge);
    manager.bindProcess(p1, h1);
    manager.bindProcess(p2, h2);

    manager.closePane(tabId, p2);

    QCOMPARE(bridge.terminated, QList<ProcessHandle>({h2}));
    QCOMPARE(manager.paneForProcess(h2), -1);
    QCOMPARE(manager.paneForProcess(h1), p1);
}

void SessionManagerTest::testCloseTabReassignsActive_data()
{
    QTest::addColumn<int>("tabCount");
    QTest::addColumn<int>("active");
    QTest::addColumn<int>("closed");
    QTest::addColumn<int>("expected");

    QTest::newRow("middle of three") << 3 << 2 << 2 << 3;
    QTest::newRow("last of three") << 3 << 3 << 3 << 2;
    QTest::newRow("first of three") << 3 << 1 << 1 << 2;
    QTest::newRow("inactive tab") << 3 << 3 << 1 << 3;
    QTest::newRow("only tab") << 1 << 1 << 1 << -1;
}

void SessionManagerTest::testCloseTabReassignsActive()
{
    QFETCH(int, tabCount);
    QFETCH(int, active);
    QFETCH(int, closed);
    QFETCH(int, expected);

    SessionManager manager;
    for (int i = 0; i < tabCount; ++i) {
        manager.createTab();
    }
    manager.setActiveTab(active);
    QSignalSpy closedSpy(&manager, &SessionManager::tabClosed);

    manager.closeTab(closed);

    QCOMPARE(manager.tabs().size(), tabCount - 1);
    QCOMPARE(manager.tabIndex(closed), -1);
    QCOMPARE(manager.activeTabId(), expected);
    QCOMPARE(closedSpy.count(), 1);
    QVERIFY(invariantsHold(manager));
}

void SessionManagerTest::testCloseTabTerminatesProcesses()
{
    FakePtyBridge bridge;
    SessionManager manager(&bridge);
    QSignalSpy removed(&manager, &SessionManager::paneRemoved);

    const int tabId = manager.createTab();
    const int p1 = manager.tab(tabId)->activePaneId;
    const int p2 = manager.splitPane(tabId, p1, SplitDirection::Vertical);
    manager.splitPane(tabId, p2, SplitDirection::Horizontal); // left unbound
    const ProcessHandle h1 = spawn(bridge);
    const ProcessHandle h2 = spawn(bridge);
    manager.bindProcess(p1, h1);
    manager.bindProcess(p2, h2);

    manager.closeTab(tabId);

    QCOMPARE(bridge.terminated.size(), 2);
    QVERIFY(bridge.terminated.contains(h1));
    QVERIFY(bridge.terminated.contains(h2));
    QCOMPARE(manager.paneForProcess(h1), -1);
    QCOMPARE(manager.paneForProcess(h2), -1);
    QCOMPARE(removed.count(), 3);
}

void SessionManagerTest::testCloseUnknownTab()
{
    SessionManager manager;
    const int tabId = manager.createTab();
    QSignalSpy closedSpy(&manager, &SessionManager::tabClosed);

    manager.closeTab(tabId + 1);

    QCOMPARE(manager.tabs().size(), 1);
    QCOMPARE(manager.activeTabId(), tabId);
    QCOMPARE(closedSpy.count(), 0);
}

void SessionManagerTest::testSetActiveTab()
{
    SessionManager manager;
    const int first = manager.createTab();
    const int second = manager.createTab();
    QCOMPARE(manager.activeTabId(), second);

    manager.setActiveTab(first);
    QCOMPARE(manager.activeTabId(), first);

    manager.setActiveTab(99);
    QCOMPARE(manager.activeTabId(), first);
}

void SessionManagerTest::testSetActivePaneInTab()
{
    SessionManager manager;
    const int first = manager.createTab();
    const int p1 = manager.tab(first)->activePaneId;
    const int p2 = manager.splitPane(first, p1, SplitDirection::Vertical);
    const int second = manager.createTab();
    const int foreign = manager.tab(second)->activePaneId;

    manager.setActivePaneInTab(first, p1);
    QCOMPARE(manager.tab(first)->activePaneId, p1);

    // A pane of another tab is not a leaf of this one
    manager.setActivePaneInTab(first, foreign);
    QCOMPARE(manager.tab(first)->activePaneId, p1);

    manager.setActivePaneInTab(first, p2 + 100);
    QCOMPARE(manager.tab(first)->activePaneId, p1);
}

void SessionManagerTest::testRenameTabAndPane()
{
    SessionManager manager;
    const int tabId = manager.createTab();
    const int paneId = manager.tab(tabId)->activePaneId;

    manager.renameTab(tabId, QStringLiteral("build"));
    manager.renamePane(tabId, paneId, QStringLiteral("make"));
    manager.renameTab(tabId + 1, QStringLiteral("ignored"));
    manager.renamePane(tabId + 1, paneId, QStringLiteral("ignored"));

    QCOMPARE(manager.tab(tabId)->title, QStringLiteral("build"));
    QCOMPARE(manager.findPane(paneId)->title, QStringLiteral("make"));
    QVERIFY(manager.tab(tabId)->root->isLeaf());
}

void SessionManagerTest::testBindProcess()
{
    SessionManager manager;
    QSignalSpy processChanged(&manager, &SessionManager::paneProcessChanged);

    const int tabId = manager.createTab();
    const int paneId = manager.tab(tabId)->activePaneId;

    manager.bindProcess(paneId, ProcessHandle(7));
    QVERIFY(manager.findPane(paneId)->process == std::optional<ProcessHandle>(7));
    QCOMPARE(manager.paneForProcess(7), paneId);

    manager.bindProcess(paneId, ProcessHandle(8));
    QCOMPARE(manager.paneForProcess(7), -1);
    QCOMPARE(manager.paneForProcess(8), paneId);

    manager.bindProcess(paneId, std::nullopt);
    QVERIFY(!manager.findPane(paneId)->isBound());
    QCOMPARE(manager.paneForProcess(8), -1);

    QCOMPARE(processChanged.count(), 3);
}

void SessionManagerTest::testBindProcessToRemovedPane()
{
    SessionManager manager;
    const int tabId = manager.createTab();
    const int p1 = manager.tab(tabId)->activePaneId;
    const int p2 = manager.splitPane(tabId, p1, SplitDirection::Vertical);
    manager.closePane(tabId, p2);

    manager.bindProcess(p2, ProcessHandle(7));

    QVERIFY(!manager.findPane(p2).has_value());
    QCOMPARE(manager.paneForProcess(7), -1);
    QVERIFY(invariantsHold(manager));
}

void SessionManagerTest::testMarkProcessExited()
{
    SessionManager manager;
    const int tabId = manager.createTab();
    const int paneId = manager.tab(tabId)->activePaneId;
    manager.bindProcess(paneId, ProcessHandle(7));

    manager.markProcessExited(7);

    const auto pane = manager.findPane(paneId);
    QVERIFY(pane.has_value());
    QVERIFY(!pane->isBound());
    QCOMPARE(pane->marker, PaneMarker::ProcessCompleted);
    QCOMPARE(manager.paneForProcess(7), -1);
    QCOMPARE(LayoutTree::countLeaves(manager.tab(tabId)->root), 1);

    // A second exit for the same handle is stale
    QSignalSpy processChanged(&manager, &SessionManager::paneProcessChanged);
    manager.markProcessExited(7);
    QCOMPARE(processChanged.count(), 0);

    // A new process clears the marker
    manager.bindProcess(paneId, ProcessHandle(9));
    QCOMPARE(manager.findPane(paneId)->marker, PaneMarker::None);
}

void SessionManagerTest::testMarkSpawnFailed()
{
    SessionManager manager;
    const int tabId = manager.createTab();
    const int paneId = manager.tab(tabId)->activePaneId;

    manager.markSpawnFailed(paneId);

    const auto pane = manager.findPane(paneId);
    QVERIFY(pane.has_value());
    QVERIFY(!pane->isBound());
    QCOMPARE(pane->marker, PaneMarker::SpawnFailed);
}

void SessionManagerTest::testRestoreRaisesCounters()
{
    FakePtyBridge bridge;
    SessionManager manager(&bridge);
    const int oldTab = manager.createTab();
    const ProcessHandle handle = spawn(bridge);
    manager.bindProcess(manager.tab(oldTab)->activePaneId, handle);

    Tab tab;
    tab.id = 5;
    tab.title = QStringLiteral("restored");
    tab.root = LayoutTree::split(LayoutTree::leaf(8), 8, 12, SplitDirection::Horizontal);
    Pane first;
    first.id = 8;
    first.process = 77; // never trusted from the outside
    Pane second;
    second.id = 12;
    tab.panes.insert(first);
    tab.panes.insert(second);
    tab.activePaneId = 12;

    QSignalSpy restored(&manager, &SessionManager::sessionRestored);
    manager.restore({tab}, 5, 2, 3);

    QCOMPARE(restored.count(), 1);
    QCOMPARE(bridge.terminated, QList<ProcessHandle>({handle}));
    QCOMPARE(manager.tabs().size(), 1);
    QCOMPARE(manager.activeTabId(), 5);
    QVERIFY(!manager.findPane(8)->isBound());
    QCOMPARE(manager.paneForProcess(77), -1);
    QCOMPARE(manager.nextTabNumber(), 6);
    QCOMPARE(manager.nextPaneNumber(), 13);

    const int created = manager.createTab();
    QCOMPARE(created, 6);
    QCOMPARE(manager.tab(created)->activePaneId, 13);
}

void SessionManagerTest::testRestoreSkipsInconsistentTabs()
{
    Tab good;
    good.id = 1;
    good.root = LayoutTree::leaf(1);
    good.panes.insert(Pane{1, QStringLiteral("Pane 1"), std::nullopt, PaneMarker::None});
    good.activePaneId = 1;

    Tab missingPane = good;
    missingPane.id = 2;
    missingPane.root = LayoutTree::split(LayoutTree::leaf(2), 2, 3, SplitDirection::Vertical);
    missingPane.panes = PaneRegistry();
    missingPane.panes.insert(Pane{2, QString(), std::nullopt, PaneMarker::None});
    missingPane.activePaneId = 2;

    Tab sharedPane = good;
    sharedPane.id = 3;

    Tab badActive = good;
    badActive.id = 4;
    badActive.root = LayoutTree::leaf(4);
    badActive.panes = PaneRegistry();
    badActive.panes.insert(Pane{4, QString(), std::nullopt, PaneMarker::None});
    badActive.activePaneId = 5;

    SessionManager manager;
    manager.restore({good, missingPane, sharedPane, badActive}, 4, 1, 1);

    QCOMPARE(manager.tabs().size(), 1);
    QCOMPARE(manager.tabs().constFirst().id, 1);
    QCOMPARE(manager.activeTabId(), 1);
    QVERIFY(invariantsHold(manager));
}

void SessionManagerTest::testRestoreRemovesReplacedPanes()
{
    SessionManager manager;
    const int tabId = manager.createTab();
    const int p1 = manager.tab(tabId)->activePaneId;
    const int p2 = manager.splitPane(tabId, p1, SplitDirection::Vertical);
    const int p3 = manager.tab(manager.createTab())->activePaneId;
    manager.bindProcess(p2, ProcessHandle(7));
    QSignalSpy removed(&manager, &SessionManager::paneRemoved);

    manager.restore({}, -1, 1, 1);

    QCOMPARE(removed.count(), 3);
    QSet<int> removedIds;
    for (const auto &arguments : std::as_const(removed)) {
        removedIds.insert(arguments.at(0).toInt());
    }
    QVERIFY(removedIds == QSet<int>({p1, p2, p3}));
    QCOMPARE(manager.paneForProcess(7), -1);
    QVERIFY(manager.tabs().isEmpty());
    QCOMPARE(manager.activeTabId(), -1);
}

void SessionManagerTest::testInvariantsAfterMixedOperations()
{
    SessionManager manager;
    const int t1 = manager.createTab();
    const int t2 = manager.createTab();
    int p = manager.tab(t1)->activePaneId;

    for (int i = 0; i < 6; ++i) {
        p = manager.splitPane(t1, p, i % 2 ? SplitDirection::Horizontal : SplitDirection::Vertical);
        QVERIFY(p > 0);
        QVERIFY(invariantsHold(manager));
    }
    QCOMPARE(LayoutTree::countLeaves(manager.tab(t1)->root), 7);

    const QList<int> ids = manager.tab(t1)->panes.ids();
    for (int id : ids) {
        manager.closePane(t1, id);
        QVERIFY(invariantsHold(manager));
    }
    QCOMPARE(LayoutTree::countLeaves(manager.tab(t1)->root), 1);

    manager.closeTab(t2);
    manager.closeTab(t1);
    QVERIFY(invariantsHold(manager));
    QCOMPARE(manager.activeTabId(), -1);
}

QTEST_GUILESS_MAIN(SessionManagerTest)
