/*
    SPDX-FileCopyrightText: 2025 Tabmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PANE_H
#define PANE_H

#include <QString>

#include <optional>

#include "pty/ProcessHandle.h"

namespace Tabmux
{

// Visible record of what last happened to a pane's process
enum class PaneMarker { None, ProcessCompleted, SpawnFailed };

struct Pane {
    int id = -1;
    QString title;
    std::optional<ProcessHandle> process; // unset until the bridge has spawned one
    PaneMarker marker = PaneMarker::None;

    bool isBound() const
    {
        return process.has_value();
    }
};

} // namespace Tabmux

#endif // PANE_H
