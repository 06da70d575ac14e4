/*
    SPDX-FileCopyrightText: 2025 Tabmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PANEREGISTRY_H
#define PANEREGISTRY_H

#include <QList>
#include <QMap>

#include "Pane.h"
#include "tabmuxprivate_export.h"

namespace Tabmux
{

/**
 * The panes of one tab, keyed by pane id.  Copies are cheap and detach on
 * the first write, so a tab can be copied, edited and swapped in as a whole.
 */
class TABMUXPRIVATE_EXPORT PaneRegistry
{
public:
    bool contains(int paneId) const;
    bool isEmpty() const;
    int size() const;

    const Pane *find(int paneId) const;
    Pane *find(int paneId);

    void insert(const Pane &pane);
    bool remove(int paneId);

    QList<int> ids() const;
    QList<Pane> panes() const;
    QList<ProcessHandle> boundProcesses() const;

    void unbindAll();

private:
    QMap<int, Pane> _panes;
};

} // namespace Tabmux

#endif // PANEREGISTRY_H
