/*
    SPDX-FileCopyrightText: 2025 Tabmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TAB_H
#define TAB_H

#include <QString>

#include "PaneRegistry.h"
#include "layout/LayoutTree.h"

namespace Tabmux
{

/**
 * A tab is a split tree plus the panes its leaves refer to.  The leaf ids
 * of root are always exactly the ids in panes, and activePaneId is one of
 * them.
 */
struct Tab {
    int id = -1;
    QString title;
    LayoutNodePtr root;
    PaneRegistry panes;
    int activePaneId = -1;
};

} // namespace Tabmux

#endif // TAB_H
