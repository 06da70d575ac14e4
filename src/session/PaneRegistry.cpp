/*
    SPDX-FileCopyrightText: 2025 Tabmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "PaneRegistry.h"

namespace Tabmux
{

bool PaneRegistry::contains(int paneId) const
{
    return _panes.contains(paneId);
}

bool PaneRegistry::isEmpty() const
{
    return _panes.isEmpty();
}

int PaneRegistry::size() const
{
    return _panes.size();
}

const Pane *PaneRegistry::find(int paneId) const
{
    auto it = _panes.constFind(paneId);
    return it != _panes.constEnd() ? &it.value() : nullptr;
}

Pane *PaneRegistry::find(int paneId)
{
    auto it = _panes.find(paneId);
    return it != _panes.end() ? &it.value() : nullptr;
}

void PaneRegistry::insert(const Pane &pane)
{
    _panes.insert(pane.id, pane);
}

bool PaneRegistry::remove(int paneId)
{
    return _panes.remove(paneId) > 0;
}

QList<int> PaneRegistry::ids() const
{
    return _panes.keys();
}

QList<Pane> PaneRegistry::panes() const
{
    return _panes.values();
}

QList<ProcessHandle> PaneRegistry::boundProcesses() const
{
    QList<ProcessHandle> handles;
    for (const Pane &pane : _panes) {
        if (pane.process.has_value()) {
            handles.append(pane.process.value());
        }
    }
    return handles;
}

void PaneRegistry::unbindAll()
{
    for (auto it = _panes.begin(); it != _panes.end(); ++it) {
        it->process.reset();
    }
}

} // namespace Tabmux
