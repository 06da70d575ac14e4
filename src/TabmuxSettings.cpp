/*
    SPDX-FileCopyrightText: 2025 Tabmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TabmuxSettings.h"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>

namespace Tabmux
{

namespace
{
const QString Group = QStringLiteral("Terminal");

constexpr int MaxColumns = 1023;
constexpr int MaxLines = 1023;
constexpr int MaxDebounceMs = 5000;
}

TabmuxSettings TabmuxSettings::defaults()
{
    TabmuxSettings settings;

    settings.shell = qEnvironmentVariable("SHELL");
    if (settings.shell.isEmpty()) {
        settings.shell = QStringLiteral("/bin/sh");
    }

    QString dataDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (dataDir.isEmpty()) {
        dataDir = QDir::currentPath();
    }
    settings.stateFile = dataDir + QStringLiteral("/session.json");

    return settings;
}

TabmuxSettings TabmuxSettings::load(QSettings &settings)
{
    TabmuxSettings result = defaults();

    settings.beginGroup(Group);
    result.shell = settings.value(QStringLiteral("Shell"), result.shell).toString().trimmed();
    result.initialCommand = settings.value(QStringLiteral("InitialCommand"), result.initialCommand).toString();
    result.defaultColumns = qBound(1, settings.value(QStringLiteral("DefaultColumns"), result.defaultColumns).toInt(), MaxColumns);
    result.defaultLines = qBound(1, settings.value(QStringLiteral("DefaultLines"), result.defaultLines).toInt(), MaxLines);
    result.resizeDebounceMs = qBound(0, settings.value(QStringLiteral("ResizeDebounceMs"), result.resizeDebounceMs).toInt(), MaxDebounceMs);
    result.stateFile = settings.value(QStringLiteral("StateFile"), result.stateFile).toString();
    settings.endGroup();

    if (result.shell.isEmpty()) {
        result.shell = defaults().shell;
    }
    return result;
}

void TabmuxSettings::save(QSettings &settings) const
{
    settings.beginGroup(Group);
    settings.setValue(QStringLiteral("Shell"), shell);
    settings.setValue(QStringLiteral("InitialCommand"), initialCommand);
    settings.setValue(QStringLiteral("DefaultColumns"), defaultColumns);
    settings.setValue(QStringLiteral("DefaultLines"), defaultLines);
    settings.setValue(QStringLiteral("ResizeDebounceMs"), resizeDebounceMs);
    settings.setValue(QStringLiteral("StateFile"), stateFile);
    settings.endGroup();
}

} // namespace Tabmux
