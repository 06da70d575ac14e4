/*
    SPDX-FileCopyrightText: 2025 Tabmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PROCESSHANDLE_H
#define PROCESSHANDLE_H

#include <QString>
#include <QtGlobal>

#include <variant>

namespace Tabmux
{

// Opaque identifier handed out by a PtyBridge for one running process.
// Only meaningful for the bridge instance that created it.
using ProcessHandle = quint32;

struct SpawnError {
    QString reason;
};

using SpawnResult = std::variant<ProcessHandle, SpawnError>;

} // namespace Tabmux

#endif // PROCESSHANDLE_H
