/*
    SPDX-FileCopyrightText: 2025 Tabmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QEventLoop>
#include <QFile>
#include <QFileInfo>
#include <QHash>
#include <QSettings>
#include <QTextStream>

#include <memory>

#include "TabmuxSettings.h"
#include "layout/LayoutTree.h"
#include "persistence/SessionStore.h"
#include "pty/UnixPtyBridge.h"
#include "session/PaneProcessRouter.h"
#include "session/SessionManager.h"

using namespace Tabmux;

namespace
{

enum ExitCode {
    Success = 0,
    StateError = 1,
    InvocationError = 2,
    ProcessError = 3,
};

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

void printNode(const LayoutNodePtr &node, const Tab &tab, int depth)
{
    const QString indent(depth * 2, QLatin1Char(' '));
    if (node->isLeaf()) {
        const Pane *pane = tab.panes.find(node->paneId);
        out() << indent << "pane " << node->paneId;
        if (pane) {
            out() << " \"" << pane->title << '"';
        }
        if (node->paneId == tab.activePaneId) {
            out() << " (active)";
        }
        out() << '\n';
        return;
    }

    const bool vertical = node->direction == SplitDirection::Vertical;
    out() << indent << (vertical ? "vertical " : "horizontal ") << node->ratio << '\n';
    printNode(node->a, tab, depth + 1);
    printNode(node->b, tab, depth + 1);
}

void printSession(const SessionManager &manager)
{
    for (const Tab &tab : manager.tabs()) {
        out() << "tab " << tab.id << " \"" << tab.title << '"';
        if (tab.id == manager.activeTabId()) {
            out() << " (active)";
        }
        out() << '\n';
        printNode(tab.root, tab, 1);
    }
    out().flush();
}

bool toId(const QString &text, int &id)
{
    bool ok = false;
    id = text.toInt(&ok);
    return ok && id > 0;
}

// Applies one edit, false when its argument cannot be understood
bool applyEdit(SessionManager &manager, const QString &option, const QString &value)
{
    if (option == QLatin1String("new-tab")) {
        manager.createTab();
        return true;
    }

    if (option == QLatin1String("close-tab")) {
        int tabId = 0;
        if (!toId(value, tabId)) {
            return false;
        }
        manager.closeTab(tabId);
        return true;
    }

    if (option == QLatin1String("rename-tab")) {
        const int separator = value.indexOf(QLatin1Char(':'));
        int tabId = 0;
        if (separator < 0 || !toId(value.left(separator), tabId)) {
            return false;
        }
        manager.renameTab(tabId, value.mid(separator + 1));
        return true;
    }

    const QStringList parts = value.split(QLatin1Char(':'));
    int tabId = 0;
    int paneId = 0;
    if (parts.size() < 2 || !toId(parts.at(0), tabId) || !toId(parts.at(1), paneId)) {
        return false;
    }

    if (option == QLatin1String("close-pane") && parts.size() == 2) {
        manager.closePane(tabId, paneId);
        return true;
    }

    if (option == QLatin1String("split") && parts.size() == 3) {
        SplitDirection direction;
        if (parts.at(2) == QLatin1String("h")) {
            direction = SplitDirection::Horizontal;
        } else if (parts.at(2) == QLatin1String("v")) {
            direction = SplitDirection::Vertical;
        } else {
            return false;
        }
        if (manager.splitPane(tabId, paneId, direction) < 0) {
            err() << "tabmux: cannot split pane " << paneId << " of tab " << tabId << '\n';
        }
        return true;
    }

    return false;
}

// Runs one command line in the pane's shell and copies the pane's output
// to stdout until the shell exits.
bool runInPane(PaneProcessRouter &router, int paneId, const QString &command)
{
    QFile output;
    if (!output.open(stdout, QIODevice::WriteOnly | QIODevice::Unbuffered)) {
        return false;
    }

    QEventLoop loop;
    QObject::connect(&router, &PaneProcessRouter::paneOutput, &loop, [&output, paneId](int pane, const QByteArray &data) {
        if (pane == paneId) {
            output.write(data);
        }
    });
    QObject::connect(&router, &PaneProcessRouter::paneProcessFinished, &loop, [&loop, paneId](int pane) {
        if (pane == paneId) {
            loop.quit();
        }
    });

    if (!router.startProcess(paneId, 0, 0)) {
        return false;
    }
    router.sendInput(paneId, command.toUtf8() + QByteArrayLiteral("\rexit\r"));
    loop.exec();
    return true;
}

}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("tabmux"));
    QCoreApplication::setApplicationName(QStringLiteral("tabmux"));
    QCoreApplication::setApplicationVersion(QStringLiteral("0.1"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Inspect and edit a saved terminal multiplexer session"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addOptions({
        {QStringLiteral("config"), QStringLiteral("Read settings from <file>."), QStringLiteral("file")},
        {QStringLiteral("state"), QStringLiteral("Use <file> as the session state file."), QStringLiteral("file")},
        {QStringLiteral("new-tab"), QStringLiteral("Append a new tab.")},
        {QStringLiteral("split"), QStringLiteral("Split a pane, h or v."), QStringLiteral("tab:pane:h|v")},
        {QStringLiteral("close-pane"), QStringLiteral("Close a pane."), QStringLiteral("tab:pane")},
        {QStringLiteral("close-tab"), QStringLiteral("Close a tab."), QStringLiteral("tab")},
        {QStringLiteral("rename-tab"), QStringLiteral("Rename a tab."), QStringLiteral("tab:title")},
        {QStringLiteral("list"), QStringLiteral("Print the tabs and their panes.")},
        {QStringLiteral("exec"), QStringLiteral("Run a command line in the shell of a pane."), QStringLiteral("pane:command")},
    });
    parser.process(app);

    std::unique_ptr<QSettings> settingsFile;
    if (parser.isSet(QStringLiteral("config"))) {
        settingsFile = std::make_unique<QSettings>(parser.value(QStringLiteral("config")), QSettings::IniFormat);
    } else {
        settingsFile = std::make_unique<QSettings>();
    }
    TabmuxSettings settings = TabmuxSettings::load(*settingsFile);
    if (parser.isSet(QStringLiteral("state"))) {
        settings.stateFile = parser.value(QStringLiteral("state"));
    }

    UnixPtyBridge bridge(settings.shell);
    SessionManager manager(&bridge);
    PaneProcessRouter router(&manager, &bridge, settings);
    if (QFileInfo::exists(settings.stateFile)) {
        QString error;
        if (!SessionStore::load(settings.stateFile, manager, &error)) {
            err() << "tabmux: cannot read " << settings.stateFile << ": " << error << '\n';
            return StateError;
        }
    }
    manager.ensureDefaultTab();

    // Edits run in command line order, repeated options included
    const QStringList editOptions = {
        QStringLiteral("new-tab"),
        QStringLiteral("split"),
        QStringLiteral("close-pane"),
        QStringLiteral("close-tab"),
        QStringLiteral("rename-tab"),
    };
    QHash<QString, int> consumed;
    const QStringList names = parser.optionNames();
    for (const QString &name : names) {
        if (!editOptions.contains(name)) {
            continue;
        }
        const QStringList values = parser.values(name);
        const int index = consumed.value(name, 0);
        consumed[name] = index + 1;
        const QString value = index < values.size() ? values.at(index) : QString();
        if (!applyEdit(manager, name, value)) {
            err() << "tabmux: invalid argument for --" << name << ": " << value << '\n';
            return InvocationError;
        }
    }
    manager.ensureDefaultTab();

    if (parser.isSet(QStringLiteral("exec"))) {
        const QString value = parser.value(QStringLiteral("exec"));
        const int separator = value.indexOf(QLatin1Char(':'));
        int paneId = 0;
        if (separator < 0 || !toId(value.left(separator), paneId) || !manager.findPane(paneId).has_value()) {
            err() << "tabmux: invalid argument for --exec: " << value << '\n';
            return InvocationError;
        }
        if (!runInPane(router, paneId, value.mid(separator + 1))) {
            err() << "tabmux: cannot start " << settings.shell << " in pane " << paneId << '\n';
            return ProcessError;
        }
    }

    if (parser.isSet(QStringLiteral("list"))) {
        printSession(manager);
    }

    QString error;
    if (!SessionStore::save(settings.stateFile, manager, &error)) {
        err() << "tabmux: cannot write " << settings.stateFile << ": " << error << '\n';
        return StateError;
    }
    return Success;
}
